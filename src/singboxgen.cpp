#include <cmath>
#include <string>
#include <vector>

#include "derivation.h"
#include "endpoint.h"
#include "logger.h"
#include "region.h"
#include "singboxgen.h"
#include "string_hash.h"
#include "templates.h"

#define SINGBOX_MANUAL_SELECTOR "🚀 手动切换"
#define SINGBOX_GLOBAL_SELECTOR "GLOBAL"

std::string resolveOutboundTag(const std::string &name,
                               std::set<std::string> &used_tags,
                               const std::string &fallback) {
  std::string base = trim(name);
  if (base.empty())
    base = fallback;
  std::string tag = base;
  int index = 2;
  while (used_tags.count(tag))
    tag = base + "-" + std::to_string(index++);
  used_tags.insert(tag);
  return tag;
}

static rapidjson::Value singboxOutboundBase(const encodeContext &ctx,
                                            const char *type,
                                            json_allocator &allocator) {
  rapidjson::Value outbound(rapidjson::kObjectType);
  AddMember(outbound, "type", type, allocator);
  AddMember(outbound, "tag", ctx.tag, allocator);
  AddMember(outbound, "server", ctx.endpoint.server, allocator);
  AddMember(outbound, "server_port", ctx.endpoint.port, allocator);
  return outbound;
}

static void applyNetwork(rapidjson::Value &outbound, const std::string &network,
                         json_allocator &allocator) {
  AddMember(outbound, "network", network, allocator);
  AddMember(outbound, "tcp_fast_open", false, allocator);
}

static rapidjson::Value buildSingboxTls(const nodeEndpoint &endpoint,
                                        const std::string &server_name,
                                        const string_array &alpn,
                                        json_allocator &allocator) {
  rapidjson::Value tls(rapidjson::kObjectType);
  AddMember(tls, "enabled", true, allocator);
  AddMember(tls, "server_name", server_name, allocator);
  AddMember(tls, "insecure", false, allocator);
  if (!alpn.empty())
    AddMember(tls, "alpn", BuildStringArray(alpn, allocator), allocator);
  return tls;
}

static void applySingboxTransport(rapidjson::Value &outbound,
                                  const nodeEndpoint &endpoint,
                                  const transportInfo &transport,
                                  json_allocator &allocator) {
  switch (hash_(transport.streamType)) {
  case "ws"_hash: {
    rapidjson::Value ws(rapidjson::kObjectType);
    AddMember(ws, "type", "ws", allocator);
    AddMember(ws, "path", normalizePath(transport.path), allocator);
    std::string host = transport.server.empty()
                           ? getTlsServerName(endpoint, "")
                           : transport.server;
    if (!host.empty()) {
      rapidjson::Value headers(rapidjson::kObjectType);
      AddMember(headers, "Host", host, allocator);
      AddMember(ws, "headers", headers, allocator);
    }
    AddMember(outbound, "transport", ws, allocator);
    break;
  }
  case "grpc"_hash: {
    rapidjson::Value grpc(rapidjson::kObjectType);
    AddMember(grpc, "type", "grpc", allocator);
    AddMember(grpc, "service_name",
              transport.serviceName.empty() ? "grpc" : transport.serviceName,
              allocator);
    AddMember(outbound, "transport", grpc, allocator);
    break;
  }
  default:
    break;
  }
}

// integral bandwidth stays an integer for the client's schema
static void applyBandwidth(rapidjson::Value &outbound, const std::string &name,
                           const std::string &value, json_allocator &allocator) {
  double mbps = 100.0;
  if (!trim(value).empty()) {
    try {
      size_t consumed = 0;
      std::string text = trim(value);
      double parsed = std::stod(text, &consumed);
      if (consumed == text.size() && std::isfinite(parsed))
        mbps = parsed;
      else
        writeLog(LOG_TYPE_NODE,
                 "Bandwidth '" + value + "' is not a finite number, using 100.",
                 LOG_LEVEL_DEBUG);
    } catch (std::exception &e) {
      writeLog(LOG_TYPE_NODE,
               "Bandwidth '" + value + "' is not a number (" + e.what() +
                   "), using 100.",
               LOG_LEVEL_DEBUG);
    }
  }
  if (std::floor(mbps) == mbps && std::fabs(mbps) < 9.2e18) {
    AddMember(outbound, name, static_cast<long long>(mbps), allocator);
  } else {
    rapidjson::Value number(mbps);
    AddMember(outbound, name, number, allocator);
  }
}

rapidjson::Value ssSingboxConstruct(const encodeContext &ctx,
                                    json_allocator &allocator) {
  const ssConfig &ss = std::get<ssConfig>(ctx.endpoint.settings);
  rapidjson::Value outbound =
      singboxOutboundBase(ctx, "shadowsocks", allocator);
  AddMember(outbound, "method", ss.cipher, allocator);
  AddMember(outbound, "password",
            buildSS2022Password(ss.cipher, ss.password, ctx.user.passwd),
            allocator);
  applyNetwork(outbound, ss.network, allocator);
  return outbound;
}

rapidjson::Value vmessSingboxConstruct(const encodeContext &ctx,
                                       json_allocator &allocator) {
  const vmessConfig &vmess = std::get<vmessConfig>(ctx.endpoint.settings);
  const transportInfo &transport = vmess.transport;
  rapidjson::Value outbound = singboxOutboundBase(ctx, "vmess", allocator);
  AddMember(outbound, "uuid", ctx.user.uuid, allocator);
  AddMember(outbound, "alter_id", vmess.alterId, allocator);
  AddMember(outbound, "security", vmess.security, allocator);
  applyNetwork(outbound, transport.network, allocator);
  if (transport.tlsType == "tls")
    AddMember(outbound, "tls",
              buildSingboxTls(ctx.endpoint,
                              getTlsServerName(ctx.endpoint, transport.sni),
                              transport.alpnList, allocator),
              allocator);
  applySingboxTransport(outbound, ctx.endpoint, transport, allocator);
  return outbound;
}

rapidjson::Value vlessSingboxConstruct(const encodeContext &ctx,
                                       json_allocator &allocator) {
  const vlessConfig &vless = std::get<vlessConfig>(ctx.endpoint.settings);
  const transportInfo &transport = vless.transport;
  const nodeEndpoint &endpoint = ctx.endpoint;
  rapidjson::Value outbound = singboxOutboundBase(ctx, "vless", allocator);
  AddMember(outbound, "uuid", ctx.user.uuid, allocator);
  applyNetwork(outbound, transport.network, allocator);
  if (!vless.flow.empty())
    AddMember(outbound, "flow", vless.flow, allocator);

  if (transport.tlsType == "reality") {
    std::string server_name = endpoint.tlsHost;
    if (server_name.empty() && !vless.serverNames.empty())
      server_name = vless.serverNames.front();
    if (server_name.empty())
      server_name = endpoint.server;
    rapidjson::Value tls =
        buildSingboxTls(endpoint, server_name, transport.alpnList, allocator);
    rapidjson::Value utls(rapidjson::kObjectType),
        reality(rapidjson::kObjectType);
    AddMember(utls, "enabled", true, allocator);
    AddMember(utls, "fingerprint",
              transport.fingerprint.empty() ? "chrome" : transport.fingerprint,
              allocator);
    AddMember(tls, "utls", utls, allocator);
    AddMember(reality, "enabled", true, allocator);
    AddMember(reality, "public_key", vless.publicKey, allocator);
    std::string short_id = pickShortId(vless.shortIds, ctx.rng);
    if (!short_id.empty())
      AddMember(reality, "short_id", short_id, allocator);
    AddMember(tls, "reality", reality, allocator);
    AddMember(outbound, "tls", tls, allocator);
  } else if (transport.tlsType == "tls") {
    AddMember(outbound, "tls",
              buildSingboxTls(endpoint,
                              getTlsServerName(endpoint, transport.sni),
                              transport.alpnList, allocator),
              allocator);
  }
  applySingboxTransport(outbound, endpoint, transport, allocator);
  return outbound;
}

rapidjson::Value trojanSingboxConstruct(const encodeContext &ctx,
                                        json_allocator &allocator) {
  const transportInfo &transport =
      std::get<trojanConfig>(ctx.endpoint.settings).transport;
  rapidjson::Value outbound = singboxOutboundBase(ctx, "trojan", allocator);
  AddMember(outbound, "password", ctx.user.passwd, allocator);
  applyNetwork(outbound, transport.network, allocator);
  AddMember(outbound, "tls",
            buildSingboxTls(ctx.endpoint,
                            getTlsServerName(ctx.endpoint, transport.sni),
                            transport.alpnList, allocator),
            allocator);
  applySingboxTransport(outbound, ctx.endpoint, transport, allocator);
  return outbound;
}

rapidjson::Value hysteria2SingboxConstruct(const encodeContext &ctx,
                                           json_allocator &allocator) {
  const hysteria2Config &hysteria =
      std::get<hysteria2Config>(ctx.endpoint.settings);
  rapidjson::Value outbound = singboxOutboundBase(ctx, "hysteria2", allocator);
  AddMember(outbound, "password", ctx.user.passwd, allocator);
  applyBandwidth(outbound, "up_mbps", hysteria.upMbps, allocator);
  applyBandwidth(outbound, "down_mbps", hysteria.downMbps, allocator);
  applyNetwork(outbound, hysteria.network, allocator);
  AddMember(outbound, "tls",
            buildSingboxTls(ctx.endpoint,
                            getTlsServerName(ctx.endpoint, hysteria.sni),
                            hysteria.alpnList, allocator),
            allocator);
  if (!hysteria.obfs.empty() && hysteria.obfs != "plain") {
    rapidjson::Value obfs(rapidjson::kObjectType);
    AddMember(obfs, "type", hysteria.obfs, allocator);
    if (!hysteria.obfsPassword.empty())
      AddMember(obfs, "password", hysteria.obfsPassword, allocator);
    AddMember(outbound, "obfs", obfs, allocator);
  }
  return outbound;
}

rapidjson::Value anytlsSingboxConstruct(const encodeContext &ctx,
                                        json_allocator &allocator) {
  const anytlsConfig &anytls = std::get<anytlsConfig>(ctx.endpoint.settings);
  rapidjson::Value outbound = singboxOutboundBase(ctx, "anytls", allocator);
  AddMember(outbound, "password",
            anytls.password.empty() ? ctx.user.passwd : anytls.password,
            allocator);
  applyNetwork(outbound, anytls.network, allocator);
  AddMember(outbound, "tls",
            buildSingboxTls(ctx.endpoint,
                            getTlsServerName(ctx.endpoint, anytls.sni),
                            anytls.alpnList, allocator),
            allocator);
  return outbound;
}

void mergeSingboxTemplate(rapidjson::Document &singbox,
                          rapidjson::Value &node_outbounds,
                          const group_overrides &overrides) {
  json_allocator &allocator = singbox.GetAllocator();
  rapidjson::Value combined(rapidjson::kArrayType),
      selectors(rapidjson::kArrayType);

  rapidjson::Value::MemberIterator outbounds = singbox.FindMember("outbounds");
  if (outbounds != singbox.MemberEnd() && outbounds->value.IsArray()) {
    for (auto &x : outbounds->value.GetArray()) {
      switch (hash_(GetMember(x, "type"))) {
      case "direct"_hash:
      case "block"_hash:
      case "dns"_hash:
        combined.PushBack(x, allocator);
        break;
      case "selector"_hash:
        selectors.PushBack(x, allocator);
        break;
      default:
        break;
      }
    }
  }

  for (auto &x : node_outbounds.GetArray())
    combined.PushBack(x, allocator);

  for (auto &x : selectors.GetArray()) {
    std::string tag = GetMember(x, "tag");
    group_overrides::const_iterator override_iter = overrides.find(tag);
    if (isRegionTag(tag) && override_iter == overrides.end()) {
      writeLog(LOG_TYPE_RENDER,
               "Region selector '" + tag + "' has no nodes, dropped.",
               LOG_LEVEL_DEBUG);
      continue;
    }

    string_array members;
    if (override_iter != overrides.end()) {
      members = override_iter->second;
    } else {
      const rapidjson::Value *list = FindMember(x, "outbounds");
      if (list && list->IsArray()) {
        for (auto &item : list->GetArray())
          members.emplace_back(ValueToString(item));
      }
    }
    string_array kept;
    for (std::string &member : members) {
      if (isRegionTag(member) && !overrides.count(member))
        continue;
      kept.emplace_back(std::move(member));
    }
    kept = uniqueNames(kept);
    if (kept.empty())
      kept.emplace_back("DIRECT");

    rapidjson::Value list = BuildStringArray(kept, allocator);
    rapidjson::Value::MemberIterator iter = x.FindMember("outbounds");
    if (iter != x.MemberEnd())
      iter->value = list;
    else
      AddMember(x, "outbounds", list, allocator);
    combined.PushBack(x, allocator);
  }

  if (outbounds != singbox.MemberEnd())
    outbounds->value = combined;
  else
    AddMember(singbox, "outbounds", combined, allocator);
}

std::string singboxConfigConstruct(std::vector<outboundFragment> &fragments) {
  rapidjson::Document singbox;
  singbox.CopyFrom(*getSingboxTemplate(), singbox.GetAllocator());
  json_allocator &allocator = singbox.GetAllocator();

  rapidjson::Value node_outbounds(rapidjson::kArrayType);
  string_array node_tags;
  group_overrides overrides;
  for (auto &x : fragments) {
    node_outbounds.PushBack(rapidjson::Value(x.record, allocator), allocator);
    node_tags.emplace_back(x.tag);
    for (const std::string &region : matchRegions(x.name.empty() ? x.tag : x.name))
      overrides[region].emplace_back(x.tag);
  }

  overrides[SINGBOX_MANUAL_SELECTOR] = node_tags;
  string_array global = {"DIRECT"};
  global.insert(global.end(), node_tags.begin(), node_tags.end());
  overrides[SINGBOX_GLOBAL_SELECTOR] = global;

  mergeSingboxTemplate(singbox, node_outbounds, overrides);
  writeLog(LOG_TYPE_RENDER, "Sing-box config built with " +
                                std::to_string(node_tags.size()) +
                                " outbounds.");
  return SerializeObjectPretty(singbox);
}
