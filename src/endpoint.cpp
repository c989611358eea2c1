#include <memory>
#include <string>

#include "derivation.h"
#include "endpoint.h"
#include "logger.h"
#include "rapidjson_extra.h"
#include "string_hash.h"

protocolType parseProtocolType(const std::string &type) {
  switch (hash_(toLower(trim(type)))) {
  case "vmess"_hash:
  case "v2ray"_hash:
    return protocolType::VMess;
  case "vless"_hash:
    return protocolType::VLESS;
  case "trojan"_hash:
    return protocolType::Trojan;
  case "shadowsocks"_hash:
  case "ss"_hash:
    return protocolType::Shadowsocks;
  case "shadowsocksr"_hash:
  case "ssr"_hash:
    return protocolType::ShadowsocksR;
  case "hysteria2"_hash:
  case "hysteria"_hash:
  case "hy2"_hash:
    return protocolType::Hysteria2;
  case "anytls"_hash:
    return protocolType::AnyTLS;
  default:
    return protocolType::Unknown;
  }
}

std::string getProtocolName(protocolType type) {
  switch (type) {
  case protocolType::VMess:
    return "vmess";
  case protocolType::VLESS:
    return "vless";
  case protocolType::Trojan:
    return "trojan";
  case protocolType::Shadowsocks:
    return "shadowsocks";
  case protocolType::ShadowsocksR:
    return "shadowsocksr";
  case protocolType::Hysteria2:
    return "hysteria2";
  case protocolType::AnyTLS:
    return "anytls";
  default:
    return "unknown";
  }
}

static std::string getOrDefault(const rapidjson::Value &json, const char *name,
                                const std::string &def_value) {
  std::string value = GetMember(json, name);
  return value.empty() ? def_value : value;
}

static transportInfo parseTransport(const rapidjson::Value &config) {
  transportInfo transport;
  transport.streamType = toLower(getOrDefault(config, "stream_type", "tcp"));
  transport.tlsType = toLower(GetMember(config, "tls_type"));
  transport.sni = GetMember(config, "sni");
  transport.host = GetMember(config, "host");
  transport.server = GetMember(config, "server");
  transport.path = GetMember(config, "path");
  const rapidjson::Value *alpn = FindMember(config, "alpn");
  if (alpn) {
    transport.alpn = ValueToString(*alpn);
    transport.alpnList = normalizeStringList(*alpn);
  }
  transport.serviceName = GetMember(config, "service_name");
  transport.fingerprint = GetMember(config, "fingerprint");
  transport.network = getOrDefault(config, "network", "tcp");
  return transport;
}

static tribool parseTribool(const rapidjson::Value *value) {
  if (!value)
    return tribool();
  if (value->IsBool())
    return value->GetBool();
  if (value->IsNumber())
    return ValueToInt(*value, 0) != 0;
  if (value->IsString()) {
    switch (hash_(toLower(trim(value->GetString())))) {
    case "true"_hash:
    case "1"_hash:
      return true;
    case "false"_hash:
    case "0"_hash:
      return false;
    }
  }
  return tribool();
}

static string_array getStringList(const rapidjson::Value &json,
                                  const char *name) {
  const rapidjson::Value *value = FindMember(json, name);
  return value ? normalizeStringList(*value) : string_array();
}

nodeConfig parseNodeConfig(protocolType type, const rapidjson::Value &config,
                           const rapidjson::Value &client) {
  switch (type) {
  case protocolType::VMess: {
    vmessConfig vmess;
    vmess.transport = parseTransport(config);
    vmess.alterId = GetMemberInt32(config, "aid", 0);
    vmess.security = getOrDefault(config, "security", "auto");
    vmess.aead = parseTribool(FindMember(config, "aead"));
    return vmess;
  }
  case protocolType::VLESS: {
    vlessConfig vless;
    vless.transport = parseTransport(config);
    vless.flow = GetMember(config, "flow");
    vless.publicKey = resolveRealityPublicKey(config, client);
    vless.shortIds = getStringList(config, "short_ids");
    vless.serverNames = getStringList(config, "server_names");
    return vless;
  }
  case protocolType::Trojan: {
    trojanConfig trojan;
    trojan.transport = parseTransport(config);
    return trojan;
  }
  case protocolType::Shadowsocks: {
    ssConfig ss;
    std::string cipher = GetFirstMember(config, {"cipher", "method"});
    if (!cipher.empty())
      ss.cipher = cipher;
    ss.password = GetMember(config, "password");
    ss.obfs = GetMember(config, "obfs");
    ss.sni = GetMember(config, "sni");
    ss.host = GetMember(config, "host");
    ss.server = GetMember(config, "server");
    ss.path = GetMember(config, "path");
    ss.network = getOrDefault(config, "network", "tcp");
    return ss;
  }
  case protocolType::ShadowsocksR: {
    ssrConfig ssr;
    std::string method = GetFirstMember(config, {"method", "cipher"});
    if (!method.empty())
      ssr.method = method;
    ssr.password = GetMember(config, "password");
    ssr.protocol = getOrDefault(config, "protocol", "origin");
    ssr.protocolParam = GetFirstMember(
        config, {"protocol_param", "protocol-param", "protocolparam"});
    ssr.obfs = getOrDefault(config, "obfs", "plain");
    ssr.obfsParam =
        GetFirstMember(config, {"obfs_param", "obfs-param", "obfsparam"});
    ssr.server = GetMember(config, "server");
    return ssr;
  }
  case protocolType::Hysteria2: {
    hysteria2Config hysteria;
    hysteria.sni = GetMember(config, "sni");
    hysteria.obfs = GetMember(config, "obfs");
    hysteria.obfsPassword = GetMember(config, "obfs_password");
    hysteria.upMbps = GetMember(config, "up_mbps");
    hysteria.downMbps = GetMember(config, "down_mbps");
    hysteria.alpnList = getStringList(config, "alpn");
    hysteria.network = getOrDefault(config, "network", "tcp");
    return hysteria;
  }
  case protocolType::AnyTLS: {
    anytlsConfig anytls;
    anytls.password = GetMember(config, "password");
    anytls.fingerprint = getOrDefault(config, "fingerprint", "chrome");
    anytls.sni = GetMember(config, "sni");
    anytls.alpnList = getStringList(config, "alpn");
    anytls.idleSessionCheckInterval =
        GetMemberInt32(config, "idle_session_check_interval", 30);
    anytls.idleSessionTimeout =
        GetMemberInt32(config, "idle_session_timeout", 30);
    anytls.minIdleSession = GetMemberInt32(config, "min_idle_session", 0);
    anytls.network = getOrDefault(config, "network", "tcp");
    return anytls;
  }
  default:
    return std::monostate();
  }
}

static int parsePort(const rapidjson::Value &json) {
  long long port = GetMemberInt(json, "port", 0);
  return port > 0 && port < 65536 ? static_cast<int>(port) : 0;
}

nodeEndpoint resolveEndpoint(const proxyNode &node) {
  static const rapidjson::Value empty_object(rapidjson::kObjectType);
  nodeEndpoint endpoint;
  endpoint.type = parseProtocolType(node.type);
  endpoint.document = std::make_shared<rapidjson::Document>();
  endpoint.basic = endpoint.config = endpoint.client = &empty_object;

  rapidjson::Document &json = *endpoint.document;
  json.Parse(node.config.c_str());
  if (json.HasParseError() || !json.IsObject()) {
    writeLog(LOG_TYPE_NODE,
             "Node " + std::to_string(node.id) +
                 " has no usable configuration object, using defaults.",
             LOG_LEVEL_DEBUG);
  } else {
    const rapidjson::Value *section = FindMember(json, "basic");
    if (section)
      endpoint.basic = section;
    section = FindMember(json, "config");
    endpoint.config = section ? section : &json;
    section = FindMember(json, "client");
    if (section)
      endpoint.client = section;
  }

  const rapidjson::Value &config = *endpoint.config,
                         &client = *endpoint.client;
  endpoint.server = GetMember(client, "server");
  endpoint.port = parsePort(client);
  if (!endpoint.port)
    endpoint.port = parsePort(config);
  if (!endpoint.port)
    endpoint.port = 443;
  endpoint.tlsHost = GetMember(client, "tls_host");
  if (endpoint.tlsHost.empty())
    endpoint.tlsHost = GetMember(config, "host");
  if (endpoint.tlsHost.empty())
    endpoint.tlsHost = endpoint.server;

  endpoint.settings = parseNodeConfig(endpoint.type, config, client);
  return endpoint;
}

static std::string fallbackHost(const nodeEndpoint &endpoint) {
  return endpoint.tlsHost.empty() ? endpoint.server : endpoint.tlsHost;
}

std::string getHostCandidate(const nodeEndpoint &endpoint,
                             const transportInfo &transport) {
  if (!transport.server.empty())
    return transport.server;
  if (!transport.host.empty())
    return transport.host;
  if (!transport.sni.empty())
    return transport.sni;
  return fallbackHost(endpoint);
}

std::string getLinkSni(const nodeEndpoint &endpoint,
                       const transportInfo &transport) {
  if (!transport.sni.empty())
    return transport.sni;
  if (!transport.host.empty())
    return transport.host;
  if (!transport.server.empty())
    return transport.server;
  return fallbackHost(endpoint);
}

std::string getTlsServerName(const nodeEndpoint &endpoint,
                             const std::string &sni) {
  return sni.empty() ? fallbackHost(endpoint) : sni;
}

bool isHostedStream(const std::string &streamType) {
  return streamType == "ws" || streamType == "http" || streamType == "h2";
}

std::string getStreamType(const nodeEndpoint &endpoint) {
  if (const vmessConfig *vmess = std::get_if<vmessConfig>(&endpoint.settings))
    return vmess->transport.streamType;
  if (const vlessConfig *vless = std::get_if<vlessConfig>(&endpoint.settings))
    return vless->transport.streamType;
  if (const trojanConfig *trojan =
          std::get_if<trojanConfig>(&endpoint.settings))
    return trojan->transport.streamType;
  return "tcp";
}
