#ifndef DERIVATION_H_INCLUDED
#define DERIVATION_H_INCLUDED

#include <random>
#include <string>

#include <rapidjson/document.h>

#include "misc.h"

std::string formatHostForUrl(const std::string &host);
std::string normalizePath(const std::string &path);
string_array normalizeStringList(const rapidjson::Value &value);
string_array normalizeStringList(const std::string &value);
// trimmed, blanks dropped, first occurrence kept
string_array uniqueNames(const string_array &names);
std::string pickShortId(const string_array &ids, std::mt19937 &rng);
std::string resolveRealityPublicKey(const rapidjson::Value &config,
                                    const rapidjson::Value &client);

std::string deriveSS2022UserKey(const std::string &method,
                                const std::string &secret);
std::string buildSS2022Password(const std::string &method,
                                const std::string &serverPassword,
                                const std::string &userSecret);
std::string buildSS2022Password(const rapidjson::Value &config,
                                const std::string &userSecret);

#endif // DERIVATION_H_INCLUDED
