#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <sys/stat.h>

#include "misc.h"

static const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string trim(const std::string &str) {
  string_size pos = str.find_first_not_of(" \t\r\n");
  if (pos == std::string::npos)
    return "";
  string_size pos2 = str.find_last_not_of(" \t\r\n");
  return str.substr(pos, pos2 - pos + 1);
}

std::string toLower(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

string_array split(const std::string &s, const std::string &seperator) {
  string_array result;
  string_size bpos = 0, epos = s.find(seperator);
  if (seperator.empty()) {
    result.push_back(s);
    return result;
  }
  while (epos != std::string::npos) {
    result.emplace_back(s.substr(bpos, epos - bpos));
    bpos = epos + seperator.size();
    epos = s.find(seperator, bpos);
  }
  result.emplace_back(s.substr(bpos));
  return result;
}

std::string join(const string_array &arr, const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < arr.size(); i++) {
    if (i)
      result += delimiter;
    result += arr[i];
  }
  return result;
}

bool startsWith(const std::string &hay, const std::string &needle) {
  return hay.compare(0, needle.size(), needle) == 0;
}

bool endsWith(const std::string &hay, const std::string &needle) {
  return hay.size() >= needle.size() &&
         hay.compare(hay.size() - needle.size(), needle.size(), needle) == 0;
}

bool strFind(const std::string &str, const std::string &target) {
  return str.find(target) != std::string::npos;
}

int to_int(const std::string &str, int def_value) {
  if (!isNumeric(str))
    return def_value;
  try {
    return std::stoi(trim(str));
  } catch (std::exception &) {
    return def_value;
  }
}

bool isNumeric(const std::string &str) {
  return regMatch(trim(str), "[+-]?[0-9]+");
}

std::string base64_encode(const std::string &string_to_encode) {
  std::string ret;
  const unsigned char *bytes =
      reinterpret_cast<const unsigned char *>(string_to_encode.data());
  size_t len = string_to_encode.size(), i = 0;
  ret.reserve((len + 2) / 3 * 4);
  while (i + 3 <= len) {
    unsigned int triple = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
    ret += base64_chars[(triple >> 18) & 0x3f];
    ret += base64_chars[(triple >> 12) & 0x3f];
    ret += base64_chars[(triple >> 6) & 0x3f];
    ret += base64_chars[triple & 0x3f];
    i += 3;
  }
  switch (len - i) {
  case 1: {
    unsigned int triple = bytes[i] << 16;
    ret += base64_chars[(triple >> 18) & 0x3f];
    ret += base64_chars[(triple >> 12) & 0x3f];
    ret += "==";
    break;
  }
  case 2: {
    unsigned int triple = (bytes[i] << 16) | (bytes[i + 1] << 8);
    ret += base64_chars[(triple >> 18) & 0x3f];
    ret += base64_chars[(triple >> 12) & 0x3f];
    ret += base64_chars[(triple >> 6) & 0x3f];
    ret += '=';
    break;
  }
  }
  return ret;
}

// strict decoder: padded input only, canonical trailing bits
bool base64_decode(const std::string &encoded_string, std::string &out) {
  out.clear();
  size_t len = encoded_string.size();
  if (len % 4 != 0)
    return false;
  size_t padding = 0;
  if (len && encoded_string[len - 1] == '=')
    padding++;
  if (len > 1 && encoded_string[len - 2] == '=')
    padding++;
  unsigned int buffer = 0;
  int bits = 0;
  for (size_t i = 0; i < len - padding; i++) {
    string_size pos = base64_chars.find(encoded_string[i]);
    if (pos == std::string::npos)
      return false;
    buffer = (buffer << 6) | static_cast<unsigned int>(pos);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out += static_cast<char>((buffer >> bits) & 0xff);
    }
  }
  if (bits && (buffer & ((1u << bits) - 1)) != 0)
    return false;
  return true;
}

std::string UrlEncode(const std::string &str) {
  static const char hex[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(str.size() * 3);
  for (unsigned char c : str) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      result += static_cast<char>(c);
    } else {
      result += '%';
      result += hex[c >> 4];
      result += hex[c & 0x0f];
    }
  }
  return result;
}

bool regMatch(const std::string &src, const std::string &match) {
  int errornumber;
  PCRE2_SIZE erroroffset;
  std::unique_ptr<pcre2_code, decltype(&pcre2_code_free)> re(
      pcre2_compile(reinterpret_cast<PCRE2_SPTR>(match.c_str()), match.size(),
                    PCRE2_UTF | PCRE2_ANCHORED | PCRE2_ENDANCHORED,
                    &errornumber, &erroroffset, NULL),
      &pcre2_code_free);
  if (!re)
    return false;
  std::unique_ptr<pcre2_match_data, decltype(&pcre2_match_data_free)> md(
      pcre2_match_data_create_from_pattern(re.get(), NULL),
      &pcre2_match_data_free);
  int rc = pcre2_match(re.get(), reinterpret_cast<PCRE2_SPTR>(src.c_str()),
                       src.size(), 0, 0, md.get(), NULL);
  return rc > 0;
}

bool fileExist(const std::string &path) {
  struct stat st;
  return stat(path.data(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string fileGet(const std::string &path) {
  std::ifstream infile(path, std::ios::binary);
  if (!infile)
    return "";
  std::stringstream sstream;
  sstream << infile.rdbuf();
  return sstream.str();
}

int fileWrite(const std::string &path, const std::string &content,
              bool overwrite) {
  std::ofstream outfile(path, overwrite ? std::ios::out | std::ios::binary
                                        : std::ios::app | std::ios::binary);
  if (!outfile)
    return -1;
  outfile << content;
  return outfile ? 0 : -1;
}
