#ifndef CLASHGEN_H_INCLUDED
#define CLASHGEN_H_INCLUDED

#include <string>
#include <vector>

#include "subformat.h"

std::string dumpYaml(const rapidjson::Value &value);

rapidjson::Value vmessClashConstruct(const encodeContext &ctx,
                                     json_allocator &allocator);
rapidjson::Value vlessClashConstruct(const encodeContext &ctx,
                                     json_allocator &allocator);
rapidjson::Value trojanClashConstruct(const encodeContext &ctx,
                                      json_allocator &allocator);
rapidjson::Value ssClashConstruct(const encodeContext &ctx,
                                  json_allocator &allocator);
rapidjson::Value ssrClashConstruct(const encodeContext &ctx,
                                   json_allocator &allocator);
rapidjson::Value anytlsClashConstruct(const encodeContext &ctx,
                                      json_allocator &allocator);
rapidjson::Value hysteria2ClashConstruct(const encodeContext &ctx,
                                         json_allocator &allocator);

void mergeClashTemplate(rapidjson::Document &clash, rapidjson::Value &proxies,
                        const string_array &names);
std::string clashConfigConstruct(std::vector<outboundFragment> &fragments);

#endif // CLASHGEN_H_INCLUDED
