#pragma once

#include <string>

// Log types
#define LOG_TYPE_ERROR 0
#define LOG_TYPE_INFO  1
#define LOG_TYPE_WARN  2
#define LOG_TYPE_DEBUG 3
#define LOG_TYPE_RENDER 4
#define LOG_TYPE_NODE 5
#define LOG_TYPE_TEMPLATE 6

// Log levels
#define LOG_LEVEL_FATAL   10
#define LOG_LEVEL_ERROR   20
#define LOG_LEVEL_WARNING 30
#define LOG_LEVEL_INFO    40
#define LOG_LEVEL_DEBUG   50
#define LOG_LEVEL_VERBOSE 60

// empty path writes to stderr
void logInit(const std::string &path, const std::string &level);
void logEOF();

void writeLog(int type, std::string content, int level = LOG_LEVEL_VERBOSE);

int parseLogLevel(const std::string &level);
void setLogLevel(int level);
int getLogLevel();

std::string getTime();
