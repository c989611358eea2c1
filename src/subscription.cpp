#include <set>
#include <string>
#include <vector>

#include "clashgen.h"
#include "endpoint.h"
#include "linegen.h"
#include "logger.h"
#include "singboxgen.h"
#include "subformat.h"
#include "subscription.h"

static void setContentInfo(targetFormat format, subscriptionResult &out) {
  switch (format) {
  case targetFormat::Clash:
    out.contentType = "text/yaml";
    out.extension = "yaml";
    break;
  case targetFormat::Surge:
    out.contentType = "text/plain";
    out.extension = "conf";
    break;
  case targetFormat::Singbox:
    out.contentType = "application/json";
    out.extension = "json";
    break;
  default:
    out.contentType = "text/plain";
    out.extension = "txt";
    break;
  }
}

static std::string joinLines(const std::vector<outboundFragment> &fragments) {
  string_array lines;
  for (auto &x : fragments)
    lines.emplace_back(x.line);
  return join(lines, "\n");
}

static std::string assembleBody(targetFormat format,
                                std::vector<outboundFragment> &fragments) {
  switch (format) {
  case targetFormat::V2Ray:
    return base64_encode(joinLines(fragments));
  case targetFormat::Clash:
    return clashConfigConstruct(fragments);
  case targetFormat::Singbox:
    return singboxConfigConstruct(fragments);
  case targetFormat::Surge:
    return surgeConfigConstruct(fragments);
  default:
    return joinLines(fragments);
  }
}

int renderSubscription(const std::vector<proxyNode> &nodes, const subUser &user,
                       const std::string &format, std::mt19937 &rng,
                       subscriptionResult &out) {
  targetFormat target = parseTargetFormat(format);
  if (target == targetFormat::Unknown) {
    writeLog(LOG_TYPE_WARN, "Unknown subscription format '" + format + "'.");
    return SUBSCRIPTION_ERROR_UNKNOWN_FORMAT;
  }
  if (nodes.empty()) {
    writeLog(LOG_TYPE_WARN, "No nodes to render for user " +
                                std::to_string(user.id) + ".");
    return SUBSCRIPTION_ERROR_NO_NODES;
  }

  rapidjson::Document storage;
  std::vector<outboundFragment> fragments;
  std::set<std::string> used_tags;
  for (const proxyNode &node : nodes) {
    nodeEndpoint endpoint = resolveEndpoint(node);
    encoderEntry entry = getEncoder(target, endpoint.type);
    if (!acceptsEndpoint(entry, endpoint)) {
      writeLog(LOG_TYPE_NODE,
               "Node " + std::to_string(node.id) + " (" +
                   getProtocolName(endpoint.type) + ") skipped for " +
                   getFormatName(target) + ".",
               LOG_LEVEL_DEBUG);
      continue;
    }

    std::string tag;
    if (target == targetFormat::Singbox) {
      tag = resolveOutboundTag(node.name, used_tags,
                               getProtocolName(endpoint.type) + "-" +
                                   std::to_string(node.id));
    }
    encodeContext ctx{node, endpoint, user, rng, tag};
    outboundFragment fragment;
    try {
      if (entry.record)
        fragment.record = entry.record(ctx, storage.GetAllocator());
      else
        fragment.line = entry.line(ctx);
    } catch (std::exception &e) {
      writeLog(LOG_TYPE_ERROR, "Failed to encode node " +
                                   std::to_string(node.id) + ": " + e.what());
      continue;
    }
    fragment.name = node.name;
    fragment.tag = tag.empty() ? node.name : tag;
    fragments.emplace_back(std::move(fragment));
  }

  out.body = assembleBody(target, fragments);
  setContentInfo(target, out);
  writeLog(LOG_TYPE_RENDER, "Rendered " + std::to_string(fragments.size()) +
                                " of " + std::to_string(nodes.size()) +
                                " nodes as " + getFormatName(target) + ".");
  return SUBSCRIPTION_OK;
}

int renderSubscription(const std::vector<proxyNode> &nodes, const subUser &user,
                       const std::string &format, subscriptionResult &out) {
  std::random_device device;
  std::mt19937 rng(device());
  return renderSubscription(nodes, user, format, rng, out);
}

std::string subscriptionUserInfo(const subUser &user) {
  return "upload=" + std::to_string(user.upload) +
         "; download=" + std::to_string(user.download) +
         "; total=" + std::to_string(user.transferEnable) +
         "; expire=" + std::to_string(user.expireTime);
}
