#ifndef RECORDS_H_INCLUDED
#define RECORDS_H_INCLUDED

#include <string>
#include <vector>

#include "nodeinfo.h"

// node list as exported by the panel: a JSON array, or an object with "nodes"
int parseNodeList(const std::string &content, std::vector<proxyNode> &nodes);
int parseUserRecord(const std::string &content, subUser &user);

#endif // RECORDS_H_INCLUDED
