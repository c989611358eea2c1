#ifndef RAPIDJSON_EXTRA_H_INCLUDED
#define RAPIDJSON_EXTRA_H_INCLUDED

#include <climits>
#include <cmath>
#include <initializer_list>
#include <string>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "misc.h"

typedef rapidjson::Document::AllocatorType json_allocator;

inline std::string SerializeObject(const rapidjson::Value &value) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  value.Accept(writer);
  return std::string(sb.GetString(), sb.GetSize());
}

inline std::string SerializeObjectPretty(const rapidjson::Value &value) {
  rapidjson::StringBuffer sb;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(sb);
  writer.SetIndent(' ', 2);
  value.Accept(writer);
  return std::string(sb.GetString(), sb.GetSize());
}

inline const rapidjson::Value *FindMember(const rapidjson::Value &json,
                                          const char *name) {
  if (!json.IsObject())
    return nullptr;
  rapidjson::Value::ConstMemberIterator iter = json.FindMember(name);
  if (iter == json.MemberEnd() || iter->value.IsNull())
    return nullptr;
  return &iter->value;
}

// strings pass through, numbers and booleans are printed, anything else is
// empty
inline std::string ValueToString(const rapidjson::Value &value) {
  if (value.IsString())
    return std::string(value.GetString(), value.GetStringLength());
  if (value.IsBool())
    return value.GetBool() ? "true" : "false";
  if (value.IsInt64())
    return std::to_string(value.GetInt64());
  if (value.IsUint64())
    return std::to_string(value.GetUint64());
  if (value.IsNumber())
    return SerializeObject(value);
  return "";
}

inline long long ValueToInt(const rapidjson::Value &value,
                            long long def_value) {
  if (value.IsInt64())
    return value.GetInt64();
  if (value.IsBool())
    return value.GetBool() ? 1 : 0;
  if (value.IsNumber()) {
    double number = value.GetDouble();
    if (!std::isfinite(number) || number < -9.2e18 || number >= 9.2e18)
      return def_value;
    return static_cast<long long>(number);
  }
  if (value.IsString()) {
    std::string str = trim(value.GetString());
    if (str.empty())
      return def_value;
    try {
      size_t consumed = 0;
      long long result = std::stoll(str, &consumed);
      return consumed == str.size() ? result : def_value;
    } catch (std::exception &) {
      return def_value;
    }
  }
  return def_value;
}

inline std::string GetMember(const rapidjson::Value &json, const char *name) {
  const rapidjson::Value *value = FindMember(json, name);
  return value ? ValueToString(*value) : "";
}

inline void GetMember(const rapidjson::Value &json, const char *name,
                      std::string &target) {
  const rapidjson::Value *value = FindMember(json, name);
  if (value)
    target = ValueToString(*value);
}

inline long long GetMemberInt(const rapidjson::Value &json, const char *name,
                              long long def_value) {
  const rapidjson::Value *value = FindMember(json, name);
  return value ? ValueToInt(*value, def_value) : def_value;
}

// out of int range falls back to the default
inline int GetMemberInt32(const rapidjson::Value &json, const char *name,
                          int def_value) {
  long long value = GetMemberInt(json, name, def_value);
  return value < INT_MIN || value > INT_MAX ? def_value
                                            : static_cast<int>(value);
}

// first key holding a non-empty value wins
inline std::string GetFirstMember(const rapidjson::Value &json,
                                  std::initializer_list<const char *> names) {
  for (const char *name : names) {
    std::string value = GetMember(json, name);
    if (!value.empty())
      return value;
  }
  return "";
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      rapidjson::Value &value, json_allocator &allocator) {
  json.AddMember(rapidjson::Value(name.c_str(), allocator), value, allocator);
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      rapidjson::Value &&value, json_allocator &allocator) {
  json.AddMember(rapidjson::Value(name.c_str(), allocator), value, allocator);
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      const std::string &value, json_allocator &allocator) {
  rapidjson::Value str(value.c_str(), allocator);
  AddMember(json, name, str, allocator);
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      const char *value, json_allocator &allocator) {
  AddMember(json, name, std::string(value), allocator);
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      long long value, json_allocator &allocator) {
  rapidjson::Value num(static_cast<int64_t>(value));
  AddMember(json, name, num, allocator);
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      int value, json_allocator &allocator) {
  AddMember(json, name, static_cast<long long>(value), allocator);
}

inline void AddMember(rapidjson::Value &json, const std::string &name,
                      bool value, json_allocator &allocator) {
  rapidjson::Value flag(value);
  AddMember(json, name, flag, allocator);
}

template <typename Container>
inline rapidjson::Value BuildStringArray(const Container &items,
                                         json_allocator &allocator) {
  rapidjson::Value array(rapidjson::kArrayType);
  for (const std::string &item : items)
    array.PushBack(rapidjson::Value(item.c_str(), allocator), allocator);
  return array;
}

#endif // RAPIDJSON_EXTRA_H_INCLUDED
