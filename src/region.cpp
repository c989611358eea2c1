#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "logger.h"
#include "region.h"

struct regionRule {
  std::string tag;
  string_array patterns;
};

// a country code only counts between non-alphanumerics, "HK_01" included
static std::string regionCode(const char *code) {
  return std::string("(?i)(?<![A-Za-z0-9])") + code + "(?![A-Za-z0-9])";
}

static const std::vector<regionRule> region_rules = {
    {"🇭🇰 香港节点", {"香港", "(?i)hong\\s*kong", regionCode("HK"), "🇭🇰"}},
    {"🇨🇳 台湾节点",
     {"台湾", "台北", "(?i)taiwan", "(?i)taipei", regionCode("TW"), "🇹🇼"}},
    {"🇸🇬 狮城节点",
     {"狮城", "新加坡", "(?i)singapore", regionCode("SG"), "🇸🇬"}},
    {"🇯🇵 日本节点",
     {"日本", "东京", "大阪", "(?i)japan", regionCode("JP"), "🇯🇵"}},
    {"🇺🇲 美国节点",
     {"美国", "洛杉矶", "纽约", "硅谷", "(?i)united\\s*states",
      regionCode("USA?"), "🇺🇸", "🇺🇲"}},
    {"🇰🇷 韩国节点", {"韩国", "首尔", "(?i)korea", regionCode("KR"), "🇰🇷"}},
    {"🎥 奈飞节点", {"奈飞", "(?i)netflix", regionCode("NF")}},
};

typedef std::unique_ptr<pcre2_code, decltype(&pcre2_code_free)> pcre2_ptr;

struct compiledRegion {
  const regionRule *rule;
  std::vector<pcre2_ptr> patterns;
};

static std::vector<compiledRegion> compileRegions() {
  std::vector<compiledRegion> compiled;
  int errornumber;
  PCRE2_SIZE erroroffset;
  for (const regionRule &rule : region_rules) {
    compiledRegion region{&rule, {}};
    for (const std::string &source : rule.patterns) {
      pcre2_ptr pattern(
          pcre2_compile(reinterpret_cast<PCRE2_SPTR>(source.c_str()),
                        source.size(), PCRE2_UTF, &errornumber, &erroroffset,
                        NULL),
          &pcre2_code_free);
      if (!pattern) {
        writeLog(LOG_TYPE_ERROR, "Region pattern '" + source +
                                     "' failed to compile at offset " +
                                     std::to_string(erroroffset) + ".");
        continue;
      }
      pcre2_jit_compile(pattern.get(), PCRE2_JIT_COMPLETE);
      region.patterns.emplace_back(std::move(pattern));
    }
    compiled.emplace_back(std::move(region));
  }
  return compiled;
}

static const std::vector<compiledRegion> &getCompiledRegions() {
  static const std::vector<compiledRegion> compiled = compileRegions();
  return compiled;
}

static bool patternHit(const pcre2_code *pattern, const std::string &name) {
  std::unique_ptr<pcre2_match_data, decltype(&pcre2_match_data_free)> md(
      pcre2_match_data_create_from_pattern(pattern, NULL),
      &pcre2_match_data_free);
  if (!md)
    return false;
  int rc = pcre2_match(pattern, reinterpret_cast<PCRE2_SPTR>(name.c_str()),
                       name.size(), 0, 0, md.get(), NULL);
  return rc > 0;
}

const string_array &getRegionTags() {
  static const string_array tags = [] {
    string_array result;
    for (const regionRule &rule : region_rules)
      result.push_back(rule.tag);
    return result;
  }();
  return tags;
}

bool isRegionTag(const std::string &tag) {
  const string_array &tags = getRegionTags();
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

string_array matchRegions(const std::string &name) {
  string_array result;
  for (const compiledRegion &region : getCompiledRegions()) {
    for (const pcre2_ptr &pattern : region.patterns) {
      if (patternHit(pattern.get(), name)) {
        result.push_back(region.rule->tag);
        break;
      }
    }
  }
  return result;
}
