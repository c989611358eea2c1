#ifndef NODEINFO_H_INCLUDED
#define NODEINFO_H_INCLUDED

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

#include "misc.h"

enum class protocolType {
  Unknown,
  VMess,
  VLESS,
  Trojan,
  Shadowsocks,
  ShadowsocksR,
  Hysteria2,
  AnyTLS
};

// node record as stored by the panel
struct proxyNode {
  int id = 0;
  std::string name;
  std::string type;
  int nodeClass = 0;
  bool active = true;
  std::string config;
};

struct subUser {
  long long id = 0;
  std::string uuid;
  std::string passwd;
  unsigned long long upload = 0;
  unsigned long long download = 0;
  unsigned long long transferEnable = 0;
  unsigned long long transferTotal = 0;
  long long expireTime = 0;
};

// stream settings shared by vmess, vless and trojan
struct transportInfo {
  std::string streamType = "tcp";
  std::string tlsType;
  std::string sni;
  std::string host;
  std::string server;
  std::string path;
  std::string alpn;
  string_array alpnList;
  std::string serviceName;
  std::string fingerprint;
  std::string network = "tcp";
};

struct vmessConfig {
  transportInfo transport;
  int alterId = 0;
  std::string security = "auto";
  tribool aead;
};

struct vlessConfig {
  transportInfo transport;
  std::string flow;
  std::string publicKey;
  string_array shortIds;
  string_array serverNames;
};

struct trojanConfig {
  transportInfo transport;
};

struct ssConfig {
  std::string cipher = "aes-128-gcm";
  std::string password;
  std::string obfs;
  std::string sni;
  std::string host;
  std::string server;
  std::string path;
  std::string network = "tcp";
};

struct ssrConfig {
  std::string method = "aes-256-cfb";
  std::string password;
  std::string protocol = "origin";
  std::string protocolParam;
  std::string obfs = "plain";
  std::string obfsParam;
  std::string server;
};

struct hysteria2Config {
  std::string sni;
  std::string obfs;
  std::string obfsPassword;
  std::string upMbps;
  std::string downMbps;
  string_array alpnList;
  std::string network = "tcp";
};

struct anytlsConfig {
  std::string password;
  std::string fingerprint = "chrome";
  std::string sni;
  string_array alpnList;
  int idleSessionCheckInterval = 30;
  int idleSessionTimeout = 30;
  int minIdleSession = 0;
  std::string network = "tcp";
};

typedef std::variant<std::monostate, vmessConfig, vlessConfig, trojanConfig,
                     ssConfig, ssrConfig, hysteria2Config, anytlsConfig>
    nodeConfig;

// canonical view of one node, built per encode call
struct nodeEndpoint {
  protocolType type = protocolType::Unknown;
  std::string server;
  int port = 443;
  std::string tlsHost;
  std::shared_ptr<rapidjson::Document> document;
  const rapidjson::Value *basic = nullptr;
  const rapidjson::Value *config = nullptr;
  const rapidjson::Value *client = nullptr;
  nodeConfig settings;
};

#endif // NODEINFO_H_INCLUDED
