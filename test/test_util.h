#ifndef TEST_UTIL_H_INCLUDED
#define TEST_UTIL_H_INCLUDED

#include <string>

#include "nodeinfo.h"

inline proxyNode makeNode(int id, const std::string &name,
                          const std::string &type, const std::string &config) {
  proxyNode node;
  node.id = id;
  node.name = name;
  node.type = type;
  node.config = config;
  return node;
}

inline subUser makeUser() {
  subUser user;
  user.id = 7;
  user.uuid = "7f3c1a2e-0000-4000-8000-000000000001";
  user.passwd = "user-pass";
  user.upload = 1024;
  user.download = 2048;
  user.transferEnable = 10737418240ULL;
  user.expireTime = 1893456000;
  return user;
}

#endif // TEST_UTIL_H_INCLUDED
