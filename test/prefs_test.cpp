#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include "prefs.h"
#include "templates.h"

TEST(PrefsTest, ParsesSections) {
  subPrefs prefs;
  ASSERT_EQ(parsePrefs("common:\n"
                       "  log_level: debug\n"
                       "  log_path: sub.log\n"
                       "template:\n"
                       "  clash_base: base/clash.yml\n",
                       prefs),
            0);
  EXPECT_EQ(prefs.logLevel, "debug");
  EXPECT_EQ(prefs.logPath, "sub.log");
  EXPECT_EQ(prefs.clashBase, "base/clash.yml");
  EXPECT_TRUE(prefs.singboxBase.empty());
}

TEST(PrefsTest, InvalidInputKeepsDefaults) {
  subPrefs prefs;
  EXPECT_EQ(parsePrefs("common: [unclosed", prefs), -1);
  EXPECT_EQ(parsePrefs("- just\n- a list\n", prefs), -1);
  EXPECT_EQ(prefs.logLevel, "info");
  EXPECT_EQ(parsePrefs("", prefs), 0);
  EXPECT_EQ(readPrefs("no/such/pref.yml", prefs), 0);
  EXPECT_EQ(prefs.logLevel, "info");
}

TEST(TemplatesTest, RejectedTemplateKeepsCurrent) {
  template_ptr clash = getClashTemplate();
  ASSERT_NE(clash, nullptr);
  EXPECT_EQ(loadClashTemplate("- not\n- a mapping\n"), -1);
  EXPECT_EQ(getClashTemplate(), clash);

  template_ptr singbox = getSingboxTemplate();
  ASSERT_NE(singbox, nullptr);
  EXPECT_EQ(loadSingboxTemplate("{\"outbounds\": ["), -1);
  EXPECT_EQ(loadSingboxTemplate("[]"), -1);
  EXPECT_EQ(getSingboxTemplate(), singbox);
}

TEST(TemplatesTest, ReloadReplacesDocument) {
  template_ptr before = getClashTemplate();
  ASSERT_EQ(loadClashTemplate("mode: global\nproxy-groups: []\n"), 0);
  template_ptr custom = getClashTemplate();
  EXPECT_NE(custom, before);
  EXPECT_EQ(GetMember(*custom, "mode"), "global");
  EXPECT_EQ(GetMember(*before, "mode"), "rule");

  ASSERT_EQ(loadClashTemplate(default_clash_template), 0);
  EXPECT_EQ(GetMember(*getClashTemplate(), "mode"), "rule");
}

TEST(TemplatesTest, YamlScalarTyping) {
  rapidjson::Document json;
  yamlToJson(YAML::Load("port: 7890\n"
                        "quoted: \"123\"\n"
                        "lan: true\n"
                        "empty: ~\n"
                        "name: proxy\n"),
             json, json.GetAllocator());
  ASSERT_TRUE(json.IsObject());
  EXPECT_TRUE(json["port"].IsInt64());
  EXPECT_EQ(json["port"].GetInt64(), 7890);
  EXPECT_TRUE(json["quoted"].IsString());
  EXPECT_TRUE(json["lan"].IsBool());
  EXPECT_TRUE(json["empty"].IsNull());
  EXPECT_EQ(GetMember(json, "name"), "proxy");
}
