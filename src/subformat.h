#ifndef SUBFORMAT_H_INCLUDED
#define SUBFORMAT_H_INCLUDED

#include <random>
#include <string>

#include "nodeinfo.h"
#include "rapidjson_extra.h"

enum class targetFormat {
  Unknown,
  V2Ray,
  Clash,
  QuantumultX,
  Shadowrocket,
  Surge,
  Singbox
};

// everything one encoder call may look at
struct encodeContext {
  const proxyNode &node;
  const nodeEndpoint &endpoint;
  const subUser &user;
  std::mt19937 &rng;
  std::string tag;
};

// one encoded node, owned by the render call
struct outboundFragment {
  std::string name;
  std::string tag;
  std::string line;
  rapidjson::Value record;
};

typedef std::string (*lineEncoder)(const encodeContext &ctx);
typedef rapidjson::Value (*recordEncoder)(const encodeContext &ctx,
                                          json_allocator &allocator);

struct encoderEntry {
  lineEncoder line = nullptr;
  recordEncoder record = nullptr;
  // client has no grpc transport, such nodes are left out
  bool skipGrpc = false;

  bool supported() const { return line || record; }
};

targetFormat parseTargetFormat(const std::string &name);
std::string getFormatName(targetFormat format);

encoderEntry getEncoder(targetFormat format, protocolType type);
bool acceptsEndpoint(const encoderEntry &entry, const nodeEndpoint &endpoint);

#endif // SUBFORMAT_H_INCLUDED
