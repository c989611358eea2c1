#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "logger.h"
#include "misc.h"
#include "nodeinfo.h"
#include "prefs.h"
#include "records.h"
#include "subscription.h"
#include "version.h"

// use for command argument
std::string pref_path = "pref.yml";
std::string nodes_path;
std::string user_path;
std::string target_format = "v2ray";
std::string output_path;
bool show_userinfo = false;
bool include_inactive = false;

void printUsage(const char *program) {
  std::cerr << "subcodec " VERSION "\n"
            << "Usage: " << program
            << " -n <nodes.json> -u <user.json> [-f <format>] [-c <pref.yml>]"
               " [-o <output>] [--userinfo] [--all]\n"
            << "Formats: v2ray clash quantumultx shadowrocket surge singbox\n";
}

int chkArg(int argc, char *argv[]) {
  for (int i = 1; i < argc; i++) {
    if (!strcmp(argv[i], "-n") && argc > i + 1)
      nodes_path.assign(argv[++i]);
    else if (!strcmp(argv[i], "-u") && argc > i + 1)
      user_path.assign(argv[++i]);
    else if (!strcmp(argv[i], "-f") && argc > i + 1)
      target_format.assign(argv[++i]);
    else if (!strcmp(argv[i], "-c") && argc > i + 1)
      pref_path.assign(argv[++i]);
    else if (!strcmp(argv[i], "-o") && argc > i + 1)
      output_path.assign(argv[++i]);
    else if (!strcmp(argv[i], "--userinfo"))
      show_userinfo = true;
    else if (!strcmp(argv[i], "--all"))
      include_inactive = true;
    else
      return -1;
  }
  return nodes_path.empty() || user_path.empty() ? -1 : 0;
}

static int readRecordFile(const std::string &path, const char *kind,
                          std::string &content) {
  if (!fileExist(path)) {
    writeLog(LOG_TYPE_ERROR, std::string(kind) + " file '" + path +
                                 "' not found.");
    return -1;
  }
  content = fileGet(path);
  return 0;
}

int main(int argc, char *argv[]) {
  if (chkArg(argc, argv) != 0) {
    printUsage(argv[0]);
    return 1;
  }

  subPrefs prefs;
  if (readPrefs(pref_path, prefs) != 0)
    writeLog(LOG_TYPE_WARN, "Falling back to default preferences.");
  applyPrefs(prefs);

  std::string content;
  std::vector<proxyNode> all_nodes, nodes;
  subUser user;
  if (readRecordFile(nodes_path, "Node", content) != 0 ||
      parseNodeList(content, all_nodes) != 0) {
    logEOF();
    return 1;
  }
  if (readRecordFile(user_path, "User", content) != 0 ||
      parseUserRecord(content, user) != 0) {
    logEOF();
    return 1;
  }
  for (proxyNode &x : all_nodes) {
    if (x.active || include_inactive)
      nodes.emplace_back(std::move(x));
  }
  writeLog(LOG_TYPE_INFO, "Loaded " + std::to_string(nodes.size()) +
                              " nodes for user " + std::to_string(user.id) +
                              ".");

  subscriptionResult result;
  switch (renderSubscription(nodes, user, target_format, result)) {
  case SUBSCRIPTION_ERROR_NO_NODES:
    std::cerr << "No usable nodes.\n";
    logEOF();
    return 2;
  case SUBSCRIPTION_ERROR_UNKNOWN_FORMAT:
    std::cerr << "Unknown format: " << target_format << "\n";
    printUsage(argv[0]);
    logEOF();
    return 1;
  default:
    break;
  }

  if (show_userinfo)
    std::cerr << "subscription-userinfo: " << subscriptionUserInfo(user)
              << "\ncontent-type: " << result.contentType
              << "\nextension: " << result.extension << "\n";
  if (output_path.empty()) {
    std::cout << result.body << std::endl;
  } else if (fileWrite(output_path, result.body, true) != 0) {
    writeLog(LOG_TYPE_ERROR, "Cannot write output to '" + output_path + "'.");
    logEOF();
    return 1;
  }
  logEOF();
  return 0;
}
