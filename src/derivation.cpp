#include <set>
#include <string>

#include "derivation.h"
#include "rapidjson_extra.h"

std::string formatHostForUrl(const std::string &host) {
  if (strFind(host, ":") && !startsWith(host, "[") && !endsWith(host, "]"))
    return "[" + host + "]";
  return host;
}

std::string normalizePath(const std::string &path) {
  if (path.empty())
    return "/";
  if (path[0] == '/')
    return path;
  return "/" + path;
}

string_array normalizeStringList(const std::string &value) {
  string_array result;
  for (const std::string &item : split(value, ",")) {
    std::string entry = trim(item);
    if (!entry.empty())
      result.emplace_back(std::move(entry));
  }
  return result;
}

string_array normalizeStringList(const rapidjson::Value &value) {
  string_array result;
  if (value.IsArray()) {
    for (const rapidjson::Value &item : value.GetArray()) {
      std::string entry = trim(ValueToString(item));
      if (!entry.empty())
        result.emplace_back(std::move(entry));
    }
  } else if (value.IsString()) {
    result = normalizeStringList(std::string(value.GetString()));
  }
  return result;
}

string_array uniqueNames(const string_array &names) {
  string_array result;
  std::set<std::string> seen;
  for (const std::string &item : names) {
    std::string name = trim(item);
    if (name.empty() || !seen.insert(name).second)
      continue;
    result.emplace_back(std::move(name));
  }
  return result;
}

std::string pickShortId(const string_array &ids, std::mt19937 &rng) {
  if (ids.empty())
    return "";
  std::uniform_int_distribution<size_t> dist(0, ids.size() - 1);
  return ids[dist(rng)];
}

std::string resolveRealityPublicKey(const rapidjson::Value &config,
                                    const rapidjson::Value &client) {
  std::string key = GetFirstMember(client, {"publickey", "public_key"});
  if (key.empty())
    key = GetMember(config, "public_key");
  return key;
}

// trimmed, charset-checked and re-padded; empty when not Base64 shaped
static std::string normalizeBase64(const std::string &input) {
  std::string value = trim(input);
  if (value.empty())
    return "";
  for (char c : value) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/' &&
        c != '=')
      return "";
  }
  size_t remainder = value.size() % 4;
  if (remainder == 1)
    return "";
  if (remainder)
    value.append(4 - remainder, '=');
  return value;
}

std::string deriveSS2022UserKey(const std::string &method,
                                const std::string &secret) {
  size_t keyLength = strFind(toLower(method), "aes-128") ? 16 : 32;
  std::string source, normalized = normalizeBase64(secret);
  if (normalized.empty() || !base64_decode(normalized, source))
    source = secret;
  if (source.empty())
    source.assign(1, '\0');

  std::string key;
  key.reserve(keyLength);
  while (key.size() < keyLength)
    key += source.substr(0, keyLength - key.size());
  return base64_encode(key);
}

std::string buildSS2022Password(const std::string &method,
                                const std::string &serverPassword,
                                const std::string &userSecret) {
  if (!strFind(toLower(method), "2022-blake3"))
    return userSecret.empty() ? serverPassword : userSecret;

  std::string userKey = deriveSS2022UserKey(
      method, userSecret.empty() ? serverPassword : userSecret);
  if (serverPassword.empty())
    return userKey;
  return serverPassword + ":" + userKey;
}

std::string buildSS2022Password(const rapidjson::Value &config,
                                const std::string &userSecret) {
  return buildSS2022Password(GetFirstMember(config, {"cipher", "method"}),
                             GetMember(config, "password"), userSecret);
}
