#ifndef ENDPOINT_H_INCLUDED
#define ENDPOINT_H_INCLUDED

#include <string>

#include <rapidjson/document.h>

#include "nodeinfo.h"

protocolType parseProtocolType(const std::string &type);
std::string getProtocolName(protocolType type);

nodeEndpoint resolveEndpoint(const proxyNode &node);
nodeConfig parseNodeConfig(protocolType type, const rapidjson::Value &config,
                           const rapidjson::Value &client);

// first non-empty of config server/host/sni, then tlsHost, then server
std::string getHostCandidate(const nodeEndpoint &endpoint,
                             const transportInfo &transport);
// first non-empty of config sni/host/server, then tlsHost, then server
std::string getLinkSni(const nodeEndpoint &endpoint,
                       const transportInfo &transport);
// sni chain used by TLS records: config sni, then tlsHost, then server
std::string getTlsServerName(const nodeEndpoint &endpoint,
                             const std::string &sni);

bool isHostedStream(const std::string &streamType);
std::string getStreamType(const nodeEndpoint &endpoint);

#endif // ENDPOINT_H_INCLUDED
