#ifndef LINKGEN_H_INCLUDED
#define LINKGEN_H_INCLUDED

#include <string>
#include <utility>
#include <vector>

#include "subformat.h"

typedef std::vector<std::pair<std::string, std::string>> query_params;

void applyQueryParam(query_params &params, const std::string &key,
                     const std::string &value);
std::string buildQueryString(const query_params &params);

std::string vmessLinkConstruct(const encodeContext &ctx);
std::string vlessLinkConstruct(const encodeContext &ctx);
std::string trojanLinkConstruct(const encodeContext &ctx);
std::string ssLinkConstruct(const encodeContext &ctx);
std::string hysteriaLinkConstruct(const encodeContext &ctx);

#endif // LINKGEN_H_INCLUDED
