#include <string>
#include <vector>

#include "logger.h"
#include "rapidjson_extra.h"
#include "records.h"

static bool parseDocument(const std::string &content, const char *kind,
                          rapidjson::Document &json) {
  json.Parse(content.data(), content.size());
  if (json.HasParseError()) {
    writeLog(LOG_TYPE_ERROR, std::string(kind) +
                                 " file is not valid JSON (offset " +
                                 std::to_string(json.GetErrorOffset()) + ").");
    return false;
  }
  return true;
}

static unsigned long long getUnsigned(const rapidjson::Value &json,
                                      std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    if (FindMember(json, key)) {
      long long value = GetMemberInt(json, key, 0);
      return value > 0 ? static_cast<unsigned long long>(value) : 0;
    }
  }
  return 0;
}

static proxyNode parseNode(const rapidjson::Value &item) {
  proxyNode node;
  node.id = GetMemberInt32(item, "id", 0);
  node.name = GetMember(item, "name");
  node.type = GetMember(item, "type");
  node.nodeClass = GetMemberInt32(item, "node_class", 0);
  const rapidjson::Value *status = FindMember(item, "status");
  if (status)
    node.active = ValueToInt(*status, 1) != 0;

  const rapidjson::Value *config = FindMember(item, "node_config");
  if (!config)
    config = FindMember(item, "config");
  if (config)
    node.config = config->IsString() ? ValueToString(*config)
                                     : SerializeObject(*config);
  return node;
}

int parseNodeList(const std::string &content, std::vector<proxyNode> &nodes) {
  rapidjson::Document json;
  if (!parseDocument(content, "Node", json))
    return -1;

  const rapidjson::Value *list = &json;
  if (json.IsObject())
    list = FindMember(json, "nodes");
  if (!list || !list->IsArray()) {
    writeLog(LOG_TYPE_ERROR, "Node file holds no node array.");
    return -1;
  }
  for (auto &item : list->GetArray()) {
    if (!item.IsObject()) {
      writeLog(LOG_TYPE_NODE, "Skipping non-object node entry.",
               LOG_LEVEL_DEBUG);
      continue;
    }
    nodes.emplace_back(parseNode(item));
  }
  return 0;
}

int parseUserRecord(const std::string &content, subUser &user) {
  rapidjson::Document json;
  if (!parseDocument(content, "User", json))
    return -1;
  if (!json.IsObject()) {
    writeLog(LOG_TYPE_ERROR, "User file is not a JSON object.");
    return -1;
  }
  user.id = GetMemberInt(json, "id", 0);
  user.uuid = GetMember(json, "uuid");
  user.passwd = GetMember(json, "passwd");
  user.upload = getUnsigned(json, {"upload", "u"});
  user.download = getUnsigned(json, {"download", "d"});
  user.transferEnable = getUnsigned(json, {"transfer_enable"});
  user.transferTotal = getUnsigned(json, {"transfer_total"});
  user.expireTime = GetMemberInt(json, "expire_time", 0);
  return 0;
}
