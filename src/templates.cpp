#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

#include "logger.h"
#include "misc.h"
#include "templates.h"

const char *default_clash_template = R"(mixed-port: 7890
allow-lan: true
mode: rule
log-level: info
dns:
  enable: true
  ipv6: false
  enhanced-mode: fake-ip
  fake-ip-range: 198.18.0.1/16
  nameserver:
    - 114.114.114.114
    - 223.5.5.5
proxy-groups:
  - name: 🚀 节点选择
    type: select
    proxies:
      - ♻️ 自动选择
      - 🎯 全球直连
  - name: ♻️ 自动选择
    type: url-test
    proxies: []
    url: http://www.gstatic.com/generate_204
    interval: 300
  - name: 🎯 全球直连
    type: select
    proxies:
      - DIRECT
rules:
  - DOMAIN-SUFFIX,cn,🎯 全球直连
  - GEOIP,CN,🎯 全球直连
  - MATCH,🚀 节点选择
)";

const char *default_singbox_template = R"({
  "log": {
    "level": "info",
    "timestamp": true
  },
  "dns": {
    "servers": [
      {"tag": "dns-remote", "address": "tls://8.8.8.8", "detour": "🚀 节点选择"},
      {"tag": "dns-direct", "address": "223.5.5.5", "detour": "DIRECT"},
      {"tag": "dns-block", "address": "rcode://success"}
    ],
    "rules": [
      {"outbound": "any", "server": "dns-direct"},
      {"rule_set": "geosite-cn", "server": "dns-direct"}
    ],
    "final": "dns-remote",
    "strategy": "ipv4_only"
  },
  "inbounds": [
    {
      "type": "tun",
      "tag": "tun-in",
      "inet4_address": "172.19.0.1/30",
      "auto_route": true,
      "strict_route": true,
      "sniff": true
    },
    {
      "type": "mixed",
      "tag": "mixed-in",
      "listen": "127.0.0.1",
      "listen_port": 2080,
      "sniff": true
    }
  ],
  "outbounds": [
    {"type": "selector", "tag": "🚀 节点选择", "outbounds": ["🚀 手动切换", "🇭🇰 香港节点", "🇨🇳 台湾节点", "🇸🇬 狮城节点", "🇯🇵 日本节点", "🇺🇲 美国节点", "🇰🇷 韩国节点", "DIRECT"]},
    {"type": "selector", "tag": "🚀 手动切换", "outbounds": []},
    {"type": "selector", "tag": "🎥 奈飞视频", "outbounds": ["🎥 奈飞节点", "🚀 节点选择", "🇭🇰 香港节点", "🇸🇬 狮城节点", "🇺🇲 美国节点"]},
    {"type": "selector", "tag": "🐟 漏网之鱼", "outbounds": ["🚀 节点选择", "DIRECT"]},
    {"type": "selector", "tag": "🇭🇰 香港节点", "outbounds": []},
    {"type": "selector", "tag": "🇨🇳 台湾节点", "outbounds": []},
    {"type": "selector", "tag": "🇸🇬 狮城节点", "outbounds": []},
    {"type": "selector", "tag": "🇯🇵 日本节点", "outbounds": []},
    {"type": "selector", "tag": "🇺🇲 美国节点", "outbounds": []},
    {"type": "selector", "tag": "🇰🇷 韩国节点", "outbounds": []},
    {"type": "selector", "tag": "🎥 奈飞节点", "outbounds": []},
    {"type": "selector", "tag": "GLOBAL", "outbounds": []},
    {"type": "direct", "tag": "DIRECT"},
    {"type": "block", "tag": "REJECT"},
    {"type": "dns", "tag": "dns-out"}
  ],
  "route": {
    "rules": [
      {"protocol": "dns", "outbound": "dns-out"},
      {"ip_is_private": true, "outbound": "DIRECT"},
      {"rule_set": "geosite-netflix", "outbound": "🎥 奈飞视频"},
      {"rule_set": ["geosite-cn", "geoip-cn"], "outbound": "DIRECT"}
    ],
    "rule_set": [
      {"tag": "geosite-netflix", "type": "remote", "format": "binary", "url": "https://raw.githubusercontent.com/SagerNet/sing-geosite/rule-set/geosite-netflix.srs", "download_detour": "DIRECT"},
      {"tag": "geosite-cn", "type": "remote", "format": "binary", "url": "https://raw.githubusercontent.com/SagerNet/sing-geosite/rule-set/geosite-cn.srs", "download_detour": "DIRECT"},
      {"tag": "geoip-cn", "type": "remote", "format": "binary", "url": "https://raw.githubusercontent.com/SagerNet/sing-geoip/rule-set/geoip-cn.srs", "download_detour": "DIRECT"}
    ],
    "final": "🐟 漏网之鱼",
    "auto_detect_interface": true
  }
})";

typedef std::lock_guard<std::mutex> guarded_mutex;
static std::mutex template_mutex;
static std::once_flag template_once;
static template_ptr clash_template, singbox_template;

void yamlToJson(const YAML::Node &node, rapidjson::Value &json,
                json_allocator &allocator) {
  switch (node.Type()) {
  case YAML::NodeType::Map:
    json.SetObject();
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
      rapidjson::Value child;
      yamlToJson(it->second, child, allocator);
      AddMember(json, it->first.as<std::string>(), child, allocator);
    }
    break;
  case YAML::NodeType::Sequence:
    json.SetArray();
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
      rapidjson::Value child;
      yamlToJson(*it, child, allocator);
      json.PushBack(child, allocator);
    }
    break;
  case YAML::NodeType::Scalar: {
    const std::string &scalar = node.Scalar();
    // quoted scalars carry the "!" tag and always stay strings
    if (node.Tag() != "!") {
      if (scalar == "true" || scalar == "false") {
        json.SetBool(scalar == "true");
        break;
      }
      if (scalar == "null" || scalar == "~") {
        json.SetNull();
        break;
      }
      if (isNumeric(scalar)) {
        errno = 0;
        long long number = strtoll(scalar.c_str(), nullptr, 10);
        if (errno != ERANGE) {
          json.SetInt64(number);
          break;
        }
      }
    }
    json.SetString(scalar.c_str(),
                   static_cast<rapidjson::SizeType>(scalar.size()), allocator);
    break;
  }
  default:
    json.SetNull();
    break;
  }
}

static template_ptr parseClashTemplate(const std::string &content) {
  YAML::Node node = YAML::Load(content);
  if (!node.IsMap())
    throw std::runtime_error("top level is not a mapping");
  std::shared_ptr<rapidjson::Document> json =
      std::make_shared<rapidjson::Document>();
  yamlToJson(node, *json, json->GetAllocator());
  return json;
}

static template_ptr parseSingboxTemplate(const std::string &content) {
  std::shared_ptr<rapidjson::Document> json =
      std::make_shared<rapidjson::Document>();
  json->Parse(content.data(), content.size());
  if (json->HasParseError())
    throw std::runtime_error("JSON parse error at offset " +
                             std::to_string(json->GetErrorOffset()));
  if (!json->IsObject())
    throw std::runtime_error("top level is not an object");
  return json;
}

static void initDefaultTemplates() {
  template_ptr clash = parseClashTemplate(default_clash_template);
  template_ptr singbox = parseSingboxTemplate(default_singbox_template);
  guarded_mutex guard(template_mutex);
  if (!clash_template)
    clash_template = clash;
  if (!singbox_template)
    singbox_template = singbox;
}

template_ptr getClashTemplate() {
  std::call_once(template_once, initDefaultTemplates);
  guarded_mutex guard(template_mutex);
  return clash_template;
}

template_ptr getSingboxTemplate() {
  std::call_once(template_once, initDefaultTemplates);
  guarded_mutex guard(template_mutex);
  return singbox_template;
}

int loadClashTemplate(const std::string &content) {
  template_ptr parsed;
  try {
    parsed = parseClashTemplate(content);
  } catch (std::exception &e) {
    writeLog(LOG_TYPE_TEMPLATE,
             std::string("Invalid Clash base template: ") + e.what(),
             LOG_LEVEL_ERROR);
    return -1;
  }
  std::call_once(template_once, initDefaultTemplates);
  guarded_mutex guard(template_mutex);
  clash_template = parsed;
  return 0;
}

int loadSingboxTemplate(const std::string &content) {
  template_ptr parsed;
  try {
    parsed = parseSingboxTemplate(content);
  } catch (std::exception &e) {
    writeLog(LOG_TYPE_TEMPLATE,
             std::string("Invalid Sing-box base template: ") + e.what(),
             LOG_LEVEL_ERROR);
    return -1;
  }
  std::call_once(template_once, initDefaultTemplates);
  guarded_mutex guard(template_mutex);
  singbox_template = parsed;
  return 0;
}

static void loadTemplateFile(const std::string &path, const char *kind,
                             int (*loader)(const std::string &)) {
  if (path.empty())
    return;
  if (!fileExist(path)) {
    writeLog(LOG_TYPE_TEMPLATE,
             std::string(kind) + " template '" + path +
                 "' not found, keeping built-in template.",
             LOG_LEVEL_ERROR);
    return;
  }
  if (loader(fileGet(path)) == 0)
    writeLog(LOG_TYPE_TEMPLATE,
             std::string(kind) + " template loaded from '" + path + "'.");
  else
    writeLog(LOG_TYPE_TEMPLATE,
             std::string(kind) + " template '" + path +
                 "' rejected, keeping built-in template.",
             LOG_LEVEL_ERROR);
}

void loadTemplateFiles(const std::string &clash_path,
                       const std::string &singbox_path) {
  loadTemplateFile(clash_path, "Clash", loadClashTemplate);
  loadTemplateFile(singbox_path, "Sing-box", loadSingboxTemplate);
}
