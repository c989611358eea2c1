#ifndef SUBSCRIPTION_H_INCLUDED
#define SUBSCRIPTION_H_INCLUDED

#include <random>
#include <string>
#include <vector>

#include "nodeinfo.h"

enum {
  SUBSCRIPTION_OK = 0,
  SUBSCRIPTION_ERROR_NO_NODES = -1,
  SUBSCRIPTION_ERROR_UNKNOWN_FORMAT = -2
};

struct subscriptionResult {
  std::string body;
  std::string contentType;
  std::string extension;
};

int renderSubscription(const std::vector<proxyNode> &nodes, const subUser &user,
                       const std::string &format, subscriptionResult &out);
int renderSubscription(const std::vector<proxyNode> &nodes, const subUser &user,
                       const std::string &format, std::mt19937 &rng,
                       subscriptionResult &out);

// value for a subscription-userinfo style header
std::string subscriptionUserInfo(const subUser &user);

#endif // SUBSCRIPTION_H_INCLUDED
