#ifndef PREFS_H_INCLUDED
#define PREFS_H_INCLUDED

#include <string>

struct subPrefs {
  std::string logLevel = "info";
  std::string logPath;
  std::string clashBase;
  std::string singboxBase;
};

// missing file or keys keep the defaults; returns -1 on unreadable YAML
int readPrefs(const std::string &path, subPrefs &prefs);
int parsePrefs(const std::string &content, subPrefs &prefs);
void applyPrefs(const subPrefs &prefs);

#endif // PREFS_H_INCLUDED
