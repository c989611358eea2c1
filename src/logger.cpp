#include <cstdio>
#include <ctime>
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include "logger.h"
#include "misc.h"
#include "version.h"

#include <sys/time.h>

typedef std::lock_guard<std::mutex> guarded_mutex;
static std::mutex logger_mutex;
static std::string logPath;

static std::atomic<int> g_log_level_threshold{LOG_LEVEL_INFO};

int parseLogLevel(const std::string &level) {
  std::string v = toLower(trim(level));
  if (v == "fatal") return LOG_LEVEL_FATAL;
  if (v == "error") return LOG_LEVEL_ERROR;
  if (v == "warn" || v == "warning") return LOG_LEVEL_WARNING;
  if (v == "debug") return LOG_LEVEL_DEBUG;
  if (v == "verbose") return LOG_LEVEL_VERBOSE;
  return LOG_LEVEL_INFO;
}

void setLogLevel(int level) {
  g_log_level_threshold.store(level, std::memory_order_relaxed);
}

int getLogLevel() {
  return g_log_level_threshold.load(std::memory_order_relaxed);
}

struct logTypeInfo {
  const char *tag;
  int level;
};

// indexed by LOG_TYPE_*
static const logTypeInfo log_types[] = {
    {"[ERROR]", LOG_LEVEL_ERROR},      {"[INFO]", LOG_LEVEL_INFO},
    {"[WARNING]", LOG_LEVEL_WARNING},  {"[DEBUG]", LOG_LEVEL_DEBUG},
    {"[RENDER]", LOG_LEVEL_INFO},      {"[NODE]", LOG_LEVEL_DEBUG},
    {"[TEMPLATE]", LOG_LEVEL_INFO},
};

static const logTypeInfo &getLogType(int type) {
  static const logTypeInfo unknown = {"[UNKNOWN]", LOG_LEVEL_INFO};
  if (type < 0 || type >= static_cast<int>(sizeof(log_types) / sizeof(log_types[0])))
    return unknown;
  return log_types[type];
}

std::string getTime() {
  timeval tv;
  gettimeofday(&tv, NULL);
  time_t lt = tv.tv_sec;
  struct tm local;
  localtime_r(&lt, &local);
  char tmpbuf[32], millis[8];
  strftime(tmpbuf, sizeof(tmpbuf), "%Y/%m/%d %H:%M:%S", &local);
  snprintf(millis, sizeof(millis), ".%03ld", (long)tv.tv_usec / 1000);
  return std::string(tmpbuf) + millis;
}

void logInit(const std::string &path, const std::string &level) {
  {
    guarded_mutex guard(logger_mutex);
    logPath = path;
  }
  setLogLevel(parseLogLevel(level));
  writeLog(LOG_TYPE_INFO, "subcodec " VERSION " started.");
}

void writeLog(int type, std::string content, int level) {
  const logTypeInfo &info = getLogType(type);
  // an explicit level overrides the default level of the type
  if ((level == LOG_LEVEL_VERBOSE ? info.level : level) > getLogLevel())
    return;

  content = "[" + getTime() + "]" + info.tag + content + "\n";
  guarded_mutex guard(logger_mutex);
  if (logPath.empty() || fileWrite(logPath, content, false) != 0)
    std::cerr << content;
}

void logEOF() {
  writeLog(LOG_TYPE_INFO, "Program terminated.");
  guarded_mutex guard(logger_mutex);
  if (!logPath.empty() && fileWrite(logPath, "--EOF--\n", false) != 0)
    std::cerr << "--EOF--\n";
}
