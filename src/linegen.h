#ifndef LINEGEN_H_INCLUDED
#define LINEGEN_H_INCLUDED

#include <string>
#include <vector>

#include "subformat.h"

std::string vmessSurgeConstruct(const encodeContext &ctx);
std::string trojanSurgeConstruct(const encodeContext &ctx);
std::string ssSurgeConstruct(const encodeContext &ctx);
std::string hysteria2SurgeConstruct(const encodeContext &ctx);
std::string surgeConfigConstruct(const std::vector<outboundFragment> &fragments);

std::string ssQuanXConstruct(const encodeContext &ctx);
std::string vmessQuanXConstruct(const encodeContext &ctx);
std::string vlessQuanXConstruct(const encodeContext &ctx);
std::string trojanQuanXConstruct(const encodeContext &ctx);

#endif // LINEGEN_H_INCLUDED
