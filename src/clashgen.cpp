#include <string>
#include <vector>

#include "clashgen.h"
#include "derivation.h"
#include "endpoint.h"
#include "logger.h"
#include "string_hash.h"
#include "templates.h"

static std::string scalarToYaml(const rapidjson::Value &value) {
  if (value.IsNull())
    return "null";
  return ValueToString(value);
}

// nested containers inside an inline map are written as compact JSON
static std::string inlineToYaml(const rapidjson::Value &value) {
  if (value.IsObject()) {
    string_array parts;
    for (auto &x : value.GetObject()) {
      std::string key(x.name.GetString(), x.name.GetStringLength());
      if (x.value.IsObject() || x.value.IsArray())
        parts.emplace_back(key + ": " + SerializeObject(x.value));
      else
        parts.emplace_back(key + ": " + scalarToYaml(x.value));
    }
    return "{ " + join(parts, ", ") + " }";
  }
  if (value.IsArray())
    return SerializeObject(value);
  return scalarToYaml(value);
}

static void stringifyYaml(const rapidjson::Value &value, size_t indent,
                          std::string &output) {
  std::string spaces(indent * 2, ' ');
  if (value.IsArray()) {
    for (auto &x : value.GetArray()) {
      if (x.IsObject() || x.IsArray())
        output += spaces + "- " + inlineToYaml(x) + "\n";
      else
        output += spaces + "- " + scalarToYaml(x) + "\n";
    }
  } else if (value.IsObject()) {
    for (auto &x : value.GetObject()) {
      std::string key(x.name.GetString(), x.name.GetStringLength());
      if (x.value.IsObject() || x.value.IsArray()) {
        output += spaces + key + ":\n";
        stringifyYaml(x.value, indent + 1, output);
      } else {
        output += spaces + key + ": " + scalarToYaml(x.value) + "\n";
      }
    }
  } else {
    output += spaces + scalarToYaml(value) + "\n";
  }
}

std::string dumpYaml(const rapidjson::Value &value) {
  std::string output;
  stringifyYaml(value, 0, output);
  return output;
}

static rapidjson::Value clashRecordBase(const encodeContext &ctx,
                                        const char *type,
                                        json_allocator &allocator) {
  rapidjson::Value proxy(rapidjson::kObjectType);
  AddMember(proxy, "name", ctx.node.name, allocator);
  AddMember(proxy, "type", type, allocator);
  AddMember(proxy, "server", ctx.endpoint.server, allocator);
  AddMember(proxy, "port", ctx.endpoint.port, allocator);
  return proxy;
}

static void applyClashTls(rapidjson::Value &proxy, const nodeEndpoint &endpoint,
                          const transportInfo &transport,
                          json_allocator &allocator) {
  std::string servername =
      transport.sni.empty() ? endpoint.tlsHost : transport.sni;
  if (!servername.empty())
    AddMember(proxy, "servername", servername, allocator);
  if (!transport.alpnList.empty())
    AddMember(proxy, "alpn", BuildStringArray(transport.alpnList, allocator),
              allocator);
}

static void applyClashTransport(rapidjson::Value &proxy,
                                const nodeEndpoint &endpoint,
                                const transportInfo &transport,
                                const std::string &host,
                                json_allocator &allocator) {
  if (transport.streamType == "ws") {
    rapidjson::Value ws_opts(rapidjson::kObjectType), headers(rapidjson::kObjectType);
    AddMember(ws_opts, "path", normalizePath(transport.path), allocator);
    AddMember(headers, "Host", host.empty() ? endpoint.server : host,
              allocator);
    AddMember(ws_opts, "headers", headers, allocator);
    AddMember(proxy, "ws-opts", ws_opts, allocator);
  } else if (transport.streamType == "grpc") {
    rapidjson::Value grpc_opts(rapidjson::kObjectType);
    AddMember(grpc_opts, "grpc-service-name",
              transport.serviceName.empty() ? "grpc" : transport.serviceName,
              allocator);
    AddMember(proxy, "grpc-opts", grpc_opts, allocator);
  }
}

static std::string firstNonEmpty(std::initializer_list<std::string> values) {
  for (const std::string &value : values) {
    if (!value.empty())
      return value;
  }
  return "";
}

rapidjson::Value vmessClashConstruct(const encodeContext &ctx,
                                     json_allocator &allocator) {
  const vmessConfig &vmess = std::get<vmessConfig>(ctx.endpoint.settings);
  const transportInfo &transport = vmess.transport;
  bool tls = transport.tlsType == "tls";

  rapidjson::Value proxy = clashRecordBase(ctx, "vmess", allocator);
  AddMember(proxy, "uuid", ctx.user.uuid, allocator);
  AddMember(proxy, "alterId", vmess.alterId, allocator);
  AddMember(proxy, "cipher", "auto", allocator);
  AddMember(proxy, "tls", tls, allocator);
  AddMember(proxy, "skip-cert-verify", true, allocator);
  AddMember(proxy, "network", transport.streamType, allocator);
  if (tls)
    applyClashTls(proxy, ctx.endpoint, transport, allocator);
  applyClashTransport(
      proxy, ctx.endpoint, transport,
      firstNonEmpty({transport.server, transport.host, transport.sni}),
      allocator);
  return proxy;
}

rapidjson::Value vlessClashConstruct(const encodeContext &ctx,
                                     json_allocator &allocator) {
  const vlessConfig &vless = std::get<vlessConfig>(ctx.endpoint.settings);
  const transportInfo &transport = vless.transport;

  rapidjson::Value proxy = clashRecordBase(ctx, "vless", allocator);
  AddMember(proxy, "uuid", ctx.user.uuid, allocator);
  AddMember(proxy, "tls",
            transport.tlsType == "tls" || transport.tlsType == "reality",
            allocator);
  AddMember(proxy, "skip-cert-verify", true, allocator);
  AddMember(proxy, "network", transport.streamType, allocator);
  if (transport.tlsType == "tls") {
    applyClashTls(proxy, ctx.endpoint, transport, allocator);
  } else if (transport.tlsType == "reality") {
    rapidjson::Value reality_opts(rapidjson::kObjectType);
    AddMember(reality_opts, "public-key", vless.publicKey, allocator);
    std::string short_id = pickShortId(vless.shortIds, ctx.rng);
    if (!short_id.empty())
      AddMember(reality_opts, "short-id", short_id, allocator);
    AddMember(proxy, "reality-opts", reality_opts, allocator);
    AddMember(proxy, "client-fingerprint",
              transport.fingerprint.empty() ? "chrome" : transport.fingerprint,
              allocator);
    if (!ctx.endpoint.tlsHost.empty())
      AddMember(proxy, "servername", ctx.endpoint.tlsHost, allocator);
  }
  if (!vless.flow.empty())
    AddMember(proxy, "flow", vless.flow, allocator);
  applyClashTransport(
      proxy, ctx.endpoint, transport,
      firstNonEmpty({transport.server, transport.host, transport.sni}),
      allocator);
  return proxy;
}

rapidjson::Value trojanClashConstruct(const encodeContext &ctx,
                                      json_allocator &allocator) {
  const transportInfo &transport =
      std::get<trojanConfig>(ctx.endpoint.settings).transport;

  rapidjson::Value proxy = clashRecordBase(ctx, "trojan", allocator);
  AddMember(proxy, "password", ctx.user.passwd, allocator);
  AddMember(proxy, "skip-cert-verify", true, allocator);
  AddMember(proxy, "sni", getTlsServerName(ctx.endpoint, transport.sni),
            allocator);
  if (transport.streamType == "ws" || transport.streamType == "grpc")
    AddMember(proxy, "network", transport.streamType, allocator);
  applyClashTransport(proxy, ctx.endpoint, transport,
                      firstNonEmpty({transport.server, transport.sni}),
                      allocator);
  return proxy;
}

rapidjson::Value ssClashConstruct(const encodeContext &ctx,
                                  json_allocator &allocator) {
  const ssConfig &ss = std::get<ssConfig>(ctx.endpoint.settings);

  rapidjson::Value proxy = clashRecordBase(ctx, "ss", allocator);
  AddMember(proxy, "cipher", ss.cipher, allocator);
  AddMember(proxy, "password",
            buildSS2022Password(ss.cipher, ss.password, ctx.user.passwd),
            allocator);
  AddMember(proxy, "udp", true, allocator);
  if (!ss.obfs.empty() && ss.obfs != "plain") {
    rapidjson::Value plugin_opts(rapidjson::kObjectType);
    AddMember(plugin_opts, "mode",
              ss.obfs == "simple_obfs_http" || ss.obfs == "http" ? "http"
                                                                 : "tls",
              allocator);
    AddMember(plugin_opts, "host", ss.server.empty() ? "bing.com" : ss.server,
              allocator);
    AddMember(proxy, "plugin", "obfs", allocator);
    AddMember(proxy, "plugin-opts", plugin_opts, allocator);
  }
  return proxy;
}

static bool ssrObfsNeedsParam(const std::string &obfs) {
  switch (hash_(toLower(obfs))) {
  case "http_simple"_hash:
  case "http_post"_hash:
  case "tls1.2_ticket_auth"_hash:
  case "simple_obfs_http"_hash:
  case "simple_obfs_tls"_hash:
    return true;
  default:
    return false;
  }
}

rapidjson::Value ssrClashConstruct(const encodeContext &ctx,
                                   json_allocator &allocator) {
  const ssrConfig &ssr = std::get<ssrConfig>(ctx.endpoint.settings);

  rapidjson::Value proxy = clashRecordBase(ctx, "ssr", allocator);
  AddMember(proxy, "cipher", ssr.method, allocator);
  AddMember(proxy, "password", ssr.password, allocator);
  AddMember(proxy, "protocol", ssr.protocol, allocator);
  AddMember(proxy, "obfs", ssr.obfs, allocator);
  AddMember(proxy, "udp", true, allocator);

  std::string protocol_param = ssr.protocolParam;
  if (protocol_param.empty() && ctx.user.id > 0)
    protocol_param = std::to_string(ctx.user.id) + ":" + ctx.user.passwd;
  if (!protocol_param.empty())
    AddMember(proxy, "protocol-param", protocol_param, allocator);

  std::string obfs_param = ssr.obfsParam.empty() ? ssr.server : ssr.obfsParam;
  if (ssrObfsNeedsParam(ssr.obfs) && !obfs_param.empty())
    AddMember(proxy, "obfs-param", obfs_param, allocator);
  return proxy;
}

rapidjson::Value anytlsClashConstruct(const encodeContext &ctx,
                                      json_allocator &allocator) {
  const anytlsConfig &anytls = std::get<anytlsConfig>(ctx.endpoint.settings);

  rapidjson::Value proxy = clashRecordBase(ctx, "anytls", allocator);
  AddMember(proxy, "password",
            anytls.password.empty() ? ctx.user.passwd : anytls.password,
            allocator);
  AddMember(proxy, "client-fingerprint", anytls.fingerprint, allocator);
  AddMember(proxy, "udp", true, allocator);
  AddMember(proxy, "idle-session-check-interval",
            anytls.idleSessionCheckInterval, allocator);
  AddMember(proxy, "idle-session-timeout", anytls.idleSessionTimeout,
            allocator);
  AddMember(proxy, "min-idle-session", anytls.minIdleSession, allocator);
  AddMember(proxy, "skip-cert-verify", true, allocator);
  std::string sni = anytls.sni.empty() ? ctx.endpoint.tlsHost : anytls.sni;
  if (!sni.empty())
    AddMember(proxy, "sni", sni, allocator);
  if (!anytls.alpnList.empty())
    AddMember(proxy, "alpn", BuildStringArray(anytls.alpnList, allocator),
              allocator);
  return proxy;
}

rapidjson::Value hysteria2ClashConstruct(const encodeContext &ctx,
                                         json_allocator &allocator) {
  const hysteria2Config &hysteria =
      std::get<hysteria2Config>(ctx.endpoint.settings);

  rapidjson::Value proxy = clashRecordBase(ctx, "hysteria2", allocator);
  AddMember(proxy, "password", ctx.user.passwd, allocator);
  AddMember(proxy, "skip-cert-verify", true, allocator);
  std::string sni = hysteria.sni.empty() ? ctx.endpoint.tlsHost : hysteria.sni;
  if (!sni.empty())
    AddMember(proxy, "sni", sni, allocator);
  if (!hysteria.obfs.empty() && hysteria.obfs != "plain") {
    AddMember(proxy, "obfs", hysteria.obfs, allocator);
    if (!hysteria.obfsPassword.empty())
      AddMember(proxy, "obfs-password", hysteria.obfsPassword, allocator);
  }
  if (!hysteria.upMbps.empty())
    AddMember(proxy, "up", hysteria.upMbps + " Mbps", allocator);
  if (!hysteria.downMbps.empty())
    AddMember(proxy, "down", hysteria.downMbps + " Mbps", allocator);
  if (!hysteria.alpnList.empty())
    AddMember(proxy, "alpn", BuildStringArray(hysteria.alpnList, allocator),
              allocator);
  return proxy;
}

static string_array getGroupMembers(const rapidjson::Value &group) {
  string_array members;
  const rapidjson::Value *list = FindMember(group, "proxies");
  if (list && list->IsArray()) {
    for (auto &x : list->GetArray())
      members.emplace_back(ValueToString(x));
  }
  return members;
}

static void setGroupMembers(rapidjson::Value &group, const string_array &members,
                            json_allocator &allocator) {
  rapidjson::Value list = BuildStringArray(members, allocator);
  rapidjson::Value::MemberIterator iter = group.FindMember("proxies");
  if (iter != group.MemberEnd())
    iter->value = list;
  else
    AddMember(group, "proxies", list, allocator);
}

// main selector gets the node names appended, latency groups are replaced
static void fillProxyGroups(rapidjson::Value &groups, const string_array &names,
                            json_allocator &allocator) {
  bool main_selector_done = false;
  for (auto &group : groups.GetArray()) {
    if (!group.IsObject())
      continue;
    switch (hash_(GetMember(group, "type"))) {
    case "select"_hash:
      if (!main_selector_done) {
        string_array members = getGroupMembers(group);
        members.insert(members.end(), names.begin(), names.end());
        setGroupMembers(group, uniqueNames(members), allocator);
        main_selector_done = true;
      }
      break;
    case "url-test"_hash:
    case "fallback"_hash:
    case "load-balance"_hash:
      setGroupMembers(group, names.empty() ? string_array{"DIRECT"} : names,
                      allocator);
      break;
    default:
      break;
    }
  }
}

void mergeClashTemplate(rapidjson::Document &clash, rapidjson::Value &proxies,
                        const string_array &names) {
  json_allocator &allocator = clash.GetAllocator();
  string_array safe_names = uniqueNames(names);
  rapidjson::Value merged(rapidjson::kObjectType);
  bool proxies_placed = false;

  if (clash.IsObject()) {
    for (auto &x : clash.GetObject()) {
      std::string key(x.name.GetString(), x.name.GetStringLength());
      if (key == "proxies")
        continue;
      if (key == "proxy-groups") {
        if (x.value.IsArray())
          fillProxyGroups(x.value, safe_names, allocator);
        if (!proxies_placed) {
          AddMember(merged, "proxies", proxies, allocator);
          proxies_placed = true;
        }
      }
      merged.AddMember(x.name, x.value, allocator);
    }
  }
  if (!proxies_placed)
    AddMember(merged, "proxies", proxies, allocator);
  static_cast<rapidjson::Value &>(clash) = merged;
}

std::string clashConfigConstruct(std::vector<outboundFragment> &fragments) {
  rapidjson::Document clash;
  clash.CopyFrom(*getClashTemplate(), clash.GetAllocator());
  json_allocator &allocator = clash.GetAllocator();

  rapidjson::Value proxies(rapidjson::kArrayType);
  string_array names;
  for (auto &x : fragments) {
    proxies.PushBack(rapidjson::Value(x.record, allocator), allocator);
    names.emplace_back(x.name);
  }
  mergeClashTemplate(clash, proxies, names);
  writeLog(LOG_TYPE_RENDER,
           "Clash config built with " + std::to_string(names.size()) +
               " proxies.");
  return dumpYaml(clash);
}
