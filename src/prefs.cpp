#include <string>

#include <yaml-cpp/yaml.h>

#include "logger.h"
#include "misc.h"
#include "prefs.h"
#include "templates.h"

static void getIfExist(const YAML::Node &section, const char *key,
                       std::string &target) {
  if (section[key] && section[key].IsScalar())
    target = section[key].as<std::string>();
}

int parsePrefs(const std::string &content, subPrefs &prefs) {
  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (YAML::Exception &e) {
    writeLog(LOG_TYPE_ERROR,
             std::string("Invalid preference file: ") + e.what());
    return -1;
  }
  if (root.IsNull())
    return 0;
  if (!root.IsMap()) {
    writeLog(LOG_TYPE_ERROR, "Preference file is not a mapping, ignored.");
    return -1;
  }

  subPrefs parsed = prefs;
  try {
    const YAML::Node common = root["common"];
    if (common && common.IsMap()) {
      getIfExist(common, "log_level", parsed.logLevel);
      getIfExist(common, "log_path", parsed.logPath);
    }
    const YAML::Node base = root["template"];
    if (base && base.IsMap()) {
      getIfExist(base, "clash_base", parsed.clashBase);
      getIfExist(base, "singbox_base", parsed.singboxBase);
    }
  } catch (YAML::Exception &e) {
    writeLog(LOG_TYPE_ERROR,
             std::string("Invalid preference value: ") + e.what());
    return -1;
  }
  prefs = parsed;
  return 0;
}

int readPrefs(const std::string &path, subPrefs &prefs) {
  if (!fileExist(path)) {
    writeLog(LOG_TYPE_INFO,
             "Preference file '" + path + "' not found, using defaults.");
    return 0;
  }
  return parsePrefs(fileGet(path), prefs);
}

void applyPrefs(const subPrefs &prefs) {
  logInit(prefs.logPath, prefs.logLevel);
  loadTemplateFiles(prefs.clashBase, prefs.singboxBase);
}
