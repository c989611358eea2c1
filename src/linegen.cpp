#include <string>
#include <vector>

#include "derivation.h"
#include "endpoint.h"
#include "linegen.h"
#include "logger.h"
#include "misc.h"
#include "string_hash.h"

static std::string surgeLineBase(const encodeContext &ctx, const char *type) {
  return ctx.node.name + " = " + type + ", " + ctx.endpoint.server + ", " +
         std::to_string(ctx.endpoint.port);
}

std::string vmessSurgeConstruct(const encodeContext &ctx) {
  const transportInfo &transport =
      std::get<vmessConfig>(ctx.endpoint.settings).transport;
  std::string proxy =
      surgeLineBase(ctx, "vmess") + ", username=" + ctx.user.uuid;
  if (transport.tlsType == "tls") {
    proxy += ", tls=true, skip-cert-verify=true";
    if (!transport.sni.empty())
      proxy += ", sni=" + transport.sni;
  }
  if (transport.streamType == "ws") {
    proxy += ", ws=true, ws-path=" +
             (transport.path.empty() ? std::string("/") : transport.path);
    if (!transport.server.empty())
      proxy += ", ws-headers=Host:" + transport.server;
  }
  return proxy;
}

std::string trojanSurgeConstruct(const encodeContext &ctx) {
  const transportInfo &transport =
      std::get<trojanConfig>(ctx.endpoint.settings).transport;
  std::string proxy = surgeLineBase(ctx, "trojan") +
                      ", password=" + ctx.user.passwd +
                      ", tls=true, skip-cert-verify=true";
  if (!transport.sni.empty())
    proxy += ", sni=" + transport.sni;
  return proxy;
}

std::string ssSurgeConstruct(const encodeContext &ctx) {
  const ssConfig &ss = std::get<ssConfig>(ctx.endpoint.settings);
  std::string proxy =
      surgeLineBase(ctx, "ss") + ", encrypt-method=" + ss.cipher +
      ", password=" +
      buildSS2022Password(ss.cipher, ss.password, ctx.user.passwd);
  if (!ss.obfs.empty() && ss.obfs != "plain") {
    std::string obfs = toLower(ss.obfs);
    proxy += (obfs == "simple_obfs_http" || obfs == "http") ? ", obfs=http"
                                                             : ", obfs=tls";
    if (!ss.server.empty())
      proxy += ", obfs-host=" + ss.server;
  }
  return proxy;
}

std::string hysteria2SurgeConstruct(const encodeContext &ctx) {
  const hysteria2Config &hysteria =
      std::get<hysteria2Config>(ctx.endpoint.settings);
  std::string proxy = surgeLineBase(ctx, "hysteria2") +
                      ", password=" + ctx.user.passwd +
                      ", skip-cert-verify=true";
  if (!hysteria.sni.empty())
    proxy += ", sni=" + hysteria.sni;
  return proxy;
}

std::string surgeConfigConstruct(const std::vector<outboundFragment> &fragments) {
  string_array proxies, names;
  for (auto &x : fragments) {
    proxies.emplace_back(x.line);
    names.emplace_back(x.name);
  }
  names = uniqueNames(names);
  std::string members = names.empty() ? "DIRECT" : join(names, ", ");

  std::string config = "#!MANAGED-CONFIG\n\n";
  config += "[General]\n"
            "loglevel = notify\n"
            "skip-proxy = 127.0.0.1, 192.168.0.0/16, 10.0.0.0/8, "
            "172.16.0.0/12, 100.64.0.0/10, localhost, *.local\n"
            "dns-server = 114.114.114.114, 223.5.5.5\n\n";
  config += "[Proxy]\nDIRECT = direct\n";
  for (auto &x : proxies)
    config += x + "\n";
  config += "\n[Proxy Group]\n";
  config += "🚀 节点选择 = select, " + members + "\n";
  config += "♻️ 自动选择 = url-test, " + members +
            ", url = http://www.gstatic.com/generate_204, interval = 300\n\n";
  config += "[Rule]\n"
            "DOMAIN-SUFFIX,cn,DIRECT\n"
            "GEOIP,CN,DIRECT\n"
            "FINAL,🚀 节点选择";
  writeLog(LOG_TYPE_RENDER,
           "Surge config built with " + std::to_string(proxies.size()) +
               " proxies.");
  return config;
}

static void pushOption(string_array &options, const std::string &key,
                       const std::string &value) {
  if (!value.empty())
    options.emplace_back(key + "=" + value);
}

static std::string quanXEntry(const char *protocol, const nodeEndpoint &endpoint,
                              const string_array &options) {
  std::string entry = std::string(protocol) + "=" +
                      formatHostForUrl(endpoint.server) + ":" +
                      std::to_string(endpoint.port);
  if (!options.empty())
    entry += ", " + join(options, ", ");
  return entry;
}

static void applyQuanXStream(string_array &options, const nodeEndpoint &endpoint,
                             const transportInfo &transport) {
  bool is_tls = transport.tlsType == "tls";
  std::string host = getLinkSni(endpoint, transport);
  switch (hash_(transport.streamType)) {
  case "ws"_hash:
    options.emplace_back(is_tls ? "obfs=wss" : "obfs=ws");
    options.emplace_back("obfs-host=" + host);
    options.emplace_back("obfs-uri=" + normalizePath(transport.path));
    break;
  case "http"_hash:
    options.emplace_back("obfs=http");
    options.emplace_back("obfs-host=" + host);
    options.emplace_back("obfs-uri=" + normalizePath(transport.path));
    break;
  default:
    if (is_tls) {
      options.emplace_back("obfs=over-tls");
      options.emplace_back("obfs-host=" + host);
    }
    break;
  }
}

std::string ssQuanXConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const ssConfig &ss = std::get<ssConfig>(endpoint.settings);
  string_array options;
  options.emplace_back("method=" + ss.cipher);
  options.emplace_back(
      "password=" +
      buildSS2022Password(ss.cipher, ss.password, ctx.user.passwd));
  options.emplace_back("fast-open=false");
  options.emplace_back("udp-relay=true");

  std::string obfs = ss.obfs;
  switch (hash_(toLower(obfs))) {
  case "simple_obfs_http"_hash:
    obfs = "http";
    break;
  case "simple_obfs_tls"_hash:
    obfs = "tls";
    break;
  default:
    break;
  }
  if (!obfs.empty() && obfs != "plain") {
    std::string host = ss.sni;
    if (host.empty())
      host = ss.host;
    if (host.empty())
      host = ss.server;
    if (host.empty())
      host = endpoint.tlsHost.empty() ? endpoint.server : endpoint.tlsHost;
    options.emplace_back("obfs=" + obfs);
    options.emplace_back("obfs-host=" + host);
    options.emplace_back("obfs-uri=" + normalizePath(ss.path));
  }
  options.emplace_back("tag=" + ctx.node.name);
  return quanXEntry("shadowsocks", endpoint, options);
}

std::string vmessQuanXConstruct(const encodeContext &ctx) {
  const vmessConfig &vmess = std::get<vmessConfig>(ctx.endpoint.settings);
  string_array options;
  options.emplace_back("method=" + vmess.security);
  options.emplace_back("password=" + ctx.user.uuid);
  options.emplace_back("fast-open=false");
  options.emplace_back("udp-relay=false");
  if (!vmess.aead.is_undef())
    options.emplace_back(vmess.aead.get() ? "aead=true" : "aead=false");
  applyQuanXStream(options, ctx.endpoint, vmess.transport);
  options.emplace_back("tag=" + ctx.node.name);
  return quanXEntry("vmess", ctx.endpoint, options);
}

std::string vlessQuanXConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const vlessConfig &vless = std::get<vlessConfig>(endpoint.settings);
  string_array options;
  options.emplace_back("method=none");
  options.emplace_back("password=" + ctx.user.uuid);
  options.emplace_back("fast-open=false");
  options.emplace_back("udp-relay=true");
  if (vless.transport.tlsType == "reality") {
    options.emplace_back("obfs=over-tls");
    options.emplace_back("obfs-host=" + getLinkSni(endpoint, vless.transport));
    options.emplace_back("reality-base64-pubkey=" + vless.publicKey);
    pushOption(options, "reality-hex-shortid",
               pickShortId(vless.shortIds, ctx.rng));
    pushOption(options, "vless-flow", vless.flow);
  } else {
    applyQuanXStream(options, endpoint, vless.transport);
  }
  options.emplace_back("tag=" + ctx.node.name);
  return quanXEntry("vless", endpoint, options);
}

std::string trojanQuanXConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const transportInfo &transport =
      std::get<trojanConfig>(endpoint.settings).transport;
  std::string host = getLinkSni(endpoint, transport);
  string_array options;
  options.emplace_back("password=" + ctx.user.passwd);
  options.emplace_back("fast-open=false");
  options.emplace_back("tls-verification=false");
  if (transport.streamType == "ws") {
    options.emplace_back("obfs=wss");
    options.emplace_back("obfs-host=" + host);
    options.emplace_back("obfs-uri=" + normalizePath(transport.path));
    options.emplace_back("udp-relay=true");
  } else {
    options.emplace_back("over-tls=true");
    options.emplace_back("tls-host=" + host);
    options.emplace_back("udp-relay=false");
  }
  options.emplace_back("tag=" + ctx.node.name);
  return quanXEntry("trojan", endpoint, options);
}
