#ifndef SINGBOXGEN_H_INCLUDED
#define SINGBOXGEN_H_INCLUDED

#include <map>
#include <set>
#include <string>
#include <vector>

#include "subformat.h"

typedef std::map<std::string, string_array> group_overrides;

rapidjson::Value ssSingboxConstruct(const encodeContext &ctx,
                                    json_allocator &allocator);
rapidjson::Value vmessSingboxConstruct(const encodeContext &ctx,
                                       json_allocator &allocator);
rapidjson::Value vlessSingboxConstruct(const encodeContext &ctx,
                                       json_allocator &allocator);
rapidjson::Value trojanSingboxConstruct(const encodeContext &ctx,
                                        json_allocator &allocator);
rapidjson::Value hysteria2SingboxConstruct(const encodeContext &ctx,
                                           json_allocator &allocator);
rapidjson::Value anytlsSingboxConstruct(const encodeContext &ctx,
                                        json_allocator &allocator);

// trimmed name, or fallback when blank; repeats get -2, -3, ...
std::string resolveOutboundTag(const std::string &name,
                               std::set<std::string> &used_tags,
                               const std::string &fallback);

void mergeSingboxTemplate(rapidjson::Document &singbox,
                          rapidjson::Value &node_outbounds,
                          const group_overrides &overrides);
std::string singboxConfigConstruct(std::vector<outboundFragment> &fragments);

#endif // SINGBOXGEN_H_INCLUDED
