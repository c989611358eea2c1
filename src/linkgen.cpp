#include <string>

#include "derivation.h"
#include "endpoint.h"
#include "linkgen.h"
#include "misc.h"
#include "rapidjson_extra.h"

void applyQueryParam(query_params &params, const std::string &key,
                     const std::string &value) {
  if (value.empty())
    return;
  params.emplace_back(key, value);
}

std::string buildQueryString(const query_params &params) {
  string_array items;
  for (auto &x : params)
    items.emplace_back(x.first + "=" + UrlEncode(x.second));
  return join(items, "&");
}

static std::string getLinkAuthority(const nodeEndpoint &endpoint) {
  return formatHostForUrl(endpoint.server) + ":" +
         std::to_string(endpoint.port);
}

// ws/http/h2 header host, config server wins
static void applyHostParam(query_params &params, const nodeEndpoint &endpoint,
                           const transportInfo &transport) {
  if (!transport.server.empty())
    applyQueryParam(params, "host", transport.server);
  else if (isHostedStream(transport.streamType))
    applyQueryParam(params, "host", getHostCandidate(endpoint, transport));
}

std::string vmessLinkConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const vmessConfig &vmess = std::get<vmessConfig>(endpoint.settings);
  const transportInfo &transport = vmess.transport;

  rapidjson::Document json(rapidjson::kObjectType);
  json_allocator &allocator = json.GetAllocator();
  AddMember(json, "v", "2", allocator);
  AddMember(json, "ps", ctx.node.name, allocator);
  AddMember(json, "add", endpoint.server, allocator);
  AddMember(json, "port", endpoint.port, allocator);
  AddMember(json, "id", ctx.user.uuid, allocator);
  AddMember(json, "aid", vmess.alterId, allocator);
  AddMember(json, "net", transport.streamType, allocator);
  AddMember(json, "type", "none", allocator);
  AddMember(json, "host",
            isHostedStream(transport.streamType)
                ? getHostCandidate(endpoint, transport)
                : transport.server,
            allocator);
  AddMember(json, "path", transport.path, allocator);
  AddMember(json, "tls", transport.tlsType == "tls" ? "tls" : "", allocator);
  AddMember(json, "sni", getLinkSni(endpoint, transport), allocator);
  AddMember(json, "alpn", transport.alpn, allocator);
  return "vmess://" + base64_encode(SerializeObject(json));
}

std::string vlessLinkConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const vlessConfig &vless = std::get<vlessConfig>(endpoint.settings);
  const transportInfo &transport = vless.transport;
  std::string sni = getLinkSni(endpoint, transport);

  query_params params;
  params.emplace_back("encryption", "none");
  params.emplace_back("type", transport.streamType);
  if (transport.tlsType == "tls") {
    params.emplace_back("security", "tls");
    applyQueryParam(params, "sni", sni);
    applyQueryParam(params, "alpn", transport.alpn);
  } else if (transport.tlsType == "reality") {
    params.emplace_back("security", "reality");
    applyQueryParam(params, "pbk", vless.publicKey);
    applyQueryParam(params, "fp",
                    transport.fingerprint.empty() ? "chrome"
                                                  : transport.fingerprint);
    applyQueryParam(params, "sni", sni);
    applyQueryParam(params, "sid", pickShortId(vless.shortIds, ctx.rng));
  }
  applyQueryParam(params, "flow", vless.flow);
  applyQueryParam(params, "path", transport.path);
  applyHostParam(params, endpoint, transport);
  applyQueryParam(params, "serviceName", transport.serviceName);

  return "vless://" + ctx.user.uuid + "@" + getLinkAuthority(endpoint) + "?" +
         buildQueryString(params) + "#" + UrlEncode(ctx.node.name);
}

std::string trojanLinkConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const transportInfo &transport =
      std::get<trojanConfig>(endpoint.settings).transport;

  query_params params;
  applyQueryParam(params, "sni", getLinkSni(endpoint, transport));
  applyQueryParam(params, "alpn", transport.alpn);
  applyQueryParam(params, "path", transport.path);
  applyHostParam(params, endpoint, transport);

  std::string link = "trojan://" + UrlEncode(ctx.user.passwd) + "@" +
                     getLinkAuthority(endpoint);
  if (!params.empty())
    link += "?" + buildQueryString(params);
  return link + "#" + UrlEncode(ctx.node.name);
}

std::string ssLinkConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const ssConfig &ss = std::get<ssConfig>(endpoint.settings);
  std::string password =
      buildSS2022Password(ss.cipher, ss.password, ctx.user.passwd);

  std::string link = "ss://" + base64_encode(ss.cipher + ":" + password) +
                     "@" + getLinkAuthority(endpoint);
  if (!ss.obfs.empty() && ss.obfs != "plain") {
    std::string plugin_opts = "obfs=" + ss.obfs;
    if (!ss.server.empty())
      plugin_opts += ";obfs-host=" + ss.server;
    if (!ss.path.empty())
      plugin_opts += ";obfs-uri=" + ss.path;
    query_params params = {{"plugin", "obfs-local"},
                           {"plugin-opts", plugin_opts}};
    link += "?" + buildQueryString(params);
  }
  return link + "#" + UrlEncode(ctx.node.name);
}

std::string hysteriaLinkConstruct(const encodeContext &ctx) {
  const nodeEndpoint &endpoint = ctx.endpoint;
  const hysteria2Config &hysteria =
      std::get<hysteria2Config>(endpoint.settings);

  query_params params;
  params.emplace_back("protocol", "udp");
  params.emplace_back("auth", ctx.user.passwd);
  params.emplace_back("peer", endpoint.tlsHost.empty() ? endpoint.server
                                                       : endpoint.tlsHost);
  params.emplace_back("insecure", "1");
  params.emplace_back("upmbps",
                      hysteria.upMbps.empty() ? "100" : hysteria.upMbps);
  params.emplace_back("downmbps",
                      hysteria.downMbps.empty() ? "100" : hysteria.downMbps);
  if (!hysteria.obfs.empty() && hysteria.obfs != "plain") {
    params.emplace_back("obfs", hysteria.obfs);
    applyQueryParam(params, "obfsParam", hysteria.obfsPassword);
  }
  return "hysteria://" + getLinkAuthority(endpoint) + "?" +
         buildQueryString(params) + "#" + UrlEncode(ctx.node.name);
}
