#include <string>

#include "clashgen.h"
#include "endpoint.h"
#include "linegen.h"
#include "linkgen.h"
#include "singboxgen.h"
#include "string_hash.h"
#include "subformat.h"

targetFormat parseTargetFormat(const std::string &name) {
  switch (hash_(toLower(trim(name)))) {
  case "v2ray"_hash:
    return targetFormat::V2Ray;
  case "clash"_hash:
    return targetFormat::Clash;
  case "quantumultx"_hash:
    return targetFormat::QuantumultX;
  case "shadowrocket"_hash:
    return targetFormat::Shadowrocket;
  case "surge"_hash:
    return targetFormat::Surge;
  case "singbox"_hash:
    return targetFormat::Singbox;
  default:
    return targetFormat::Unknown;
  }
}

std::string getFormatName(targetFormat format) {
  switch (format) {
  case targetFormat::V2Ray:
    return "v2ray";
  case targetFormat::Clash:
    return "clash";
  case targetFormat::QuantumultX:
    return "quantumultx";
  case targetFormat::Shadowrocket:
    return "shadowrocket";
  case targetFormat::Surge:
    return "surge";
  case targetFormat::Singbox:
    return "singbox";
  default:
    return "unknown";
  }
}

static encoderEntry lineEntry(lineEncoder line, bool skip_grpc = false) {
  encoderEntry entry;
  entry.line = line;
  entry.skipGrpc = skip_grpc;
  return entry;
}

static encoderEntry recordEntry(recordEncoder record) {
  encoderEntry entry;
  entry.record = record;
  return entry;
}

static const encoderEntry unsupported;

// columns: vmess, vless, trojan, ss, ssr, hysteria2, anytls
static const encoderEntry encoder_table[6][7] = {
    // v2ray
    {lineEntry(vmessLinkConstruct), lineEntry(vlessLinkConstruct),
     lineEntry(trojanLinkConstruct), lineEntry(ssLinkConstruct), unsupported,
     lineEntry(hysteriaLinkConstruct), unsupported},
    // clash
    {recordEntry(vmessClashConstruct), recordEntry(vlessClashConstruct),
     recordEntry(trojanClashConstruct), recordEntry(ssClashConstruct),
     recordEntry(ssrClashConstruct), recordEntry(hysteria2ClashConstruct),
     recordEntry(anytlsClashConstruct)},
    // quantumultx
    {lineEntry(vmessQuanXConstruct, true), lineEntry(vlessQuanXConstruct, true),
     lineEntry(trojanQuanXConstruct, true), lineEntry(ssQuanXConstruct),
     unsupported, unsupported, unsupported},
    // shadowrocket
    {lineEntry(vmessLinkConstruct, true), lineEntry(vlessLinkConstruct, true),
     lineEntry(trojanLinkConstruct, true), lineEntry(ssLinkConstruct),
     unsupported, lineEntry(hysteriaLinkConstruct), unsupported},
    // surge
    {lineEntry(vmessSurgeConstruct), unsupported,
     lineEntry(trojanSurgeConstruct), lineEntry(ssSurgeConstruct), unsupported,
     lineEntry(hysteria2SurgeConstruct), unsupported},
    // singbox
    {recordEntry(vmessSingboxConstruct), recordEntry(vlessSingboxConstruct),
     recordEntry(trojanSingboxConstruct), recordEntry(ssSingboxConstruct),
     unsupported, recordEntry(hysteria2SingboxConstruct),
     recordEntry(anytlsSingboxConstruct)},
};

static int formatIndex(targetFormat format) {
  switch (format) {
  case targetFormat::V2Ray:
    return 0;
  case targetFormat::Clash:
    return 1;
  case targetFormat::QuantumultX:
    return 2;
  case targetFormat::Shadowrocket:
    return 3;
  case targetFormat::Surge:
    return 4;
  case targetFormat::Singbox:
    return 5;
  default:
    return -1;
  }
}

static int protocolIndex(protocolType type) {
  switch (type) {
  case protocolType::VMess:
    return 0;
  case protocolType::VLESS:
    return 1;
  case protocolType::Trojan:
    return 2;
  case protocolType::Shadowsocks:
    return 3;
  case protocolType::ShadowsocksR:
    return 4;
  case protocolType::Hysteria2:
    return 5;
  case protocolType::AnyTLS:
    return 6;
  default:
    return -1;
  }
}

encoderEntry getEncoder(targetFormat format, protocolType type) {
  int row = formatIndex(format), column = protocolIndex(type);
  if (row < 0 || column < 0)
    return unsupported;
  return encoder_table[row][column];
}

bool acceptsEndpoint(const encoderEntry &entry, const nodeEndpoint &endpoint) {
  if (!entry.supported())
    return false;
  return !(entry.skipGrpc && getStreamType(endpoint) == "grpc");
}
