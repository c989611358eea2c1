#include <random>

#include <gtest/gtest.h>

#include "records.h"
#include "subformat.h"
#include "subscription.h"
#include "test_util.h"

static std::vector<proxyNode> mixedNodes() {
  return {
      makeNode(1, "VM gRPC", "v2ray",
               R"({"client":{"server":"g.example.com"},
                   "config":{"stream_type":"grpc","tls_type":"tls"}})"),
      makeNode(2, "VL", "vless",
               R"({"client":{"server":"l.example.com"},"config":{}})"),
      makeNode(3, "SS", "ss",
               R"({"client":{"server":"s.example.com","port":8388}})"),
      makeNode(4, "SSR", "ssr", R"({"client":{"server":"r.example.com"}})"),
      makeNode(5, "AT", "anytls", R"({"client":{"server":"a.example.com"}})"),
      makeNode(6, "HY", "hysteria2", R"({"client":{"server":"h.example.com"}})"),
      makeNode(7, "broken", "trojan", "{oops"),
  };
}

static subscriptionResult render(const std::string &format) {
  std::mt19937 rng(11);
  subscriptionResult result;
  EXPECT_EQ(renderSubscription(mixedNodes(), makeUser(), format, rng, result),
            SUBSCRIPTION_OK);
  return result;
}

static string_array lines(const std::string &body) {
  return body.empty() ? string_array() : split(body, "\n");
}

TEST(SubformatTest, ParseFormatNames) {
  EXPECT_EQ(parseTargetFormat("Clash"), targetFormat::Clash);
  EXPECT_EQ(parseTargetFormat(" SINGBOX "), targetFormat::Singbox);
  EXPECT_EQ(parseTargetFormat("quantumultx"), targetFormat::QuantumultX);
  EXPECT_EQ(parseTargetFormat("loon"), targetFormat::Unknown);
  EXPECT_EQ(getFormatName(targetFormat::Shadowrocket), "shadowrocket");
}

TEST(SubformatTest, EncoderTableCoverage) {
  EXPECT_TRUE(getEncoder(targetFormat::Clash, protocolType::ShadowsocksR)
                  .supported());
  EXPECT_TRUE(getEncoder(targetFormat::Clash, protocolType::AnyTLS).supported());
  EXPECT_FALSE(getEncoder(targetFormat::V2Ray, protocolType::ShadowsocksR)
                   .supported());
  EXPECT_FALSE(getEncoder(targetFormat::Singbox, protocolType::ShadowsocksR)
                   .supported());
  EXPECT_FALSE(getEncoder(targetFormat::Surge, protocolType::VLESS).supported());
  EXPECT_FALSE(getEncoder(targetFormat::QuantumultX, protocolType::Hysteria2)
                   .supported());
  EXPECT_FALSE(getEncoder(targetFormat::Clash, protocolType::Unknown)
                   .supported());

  encoderEntry entry =
      getEncoder(targetFormat::QuantumultX, protocolType::Trojan);
  EXPECT_TRUE(entry.skipGrpc);
  EXPECT_TRUE(entry.line != nullptr);
  EXPECT_TRUE(
      getEncoder(targetFormat::Shadowrocket, protocolType::VLESS).skipGrpc);
  EXPECT_FALSE(getEncoder(targetFormat::V2Ray, protocolType::VMess).skipGrpc);
  EXPECT_TRUE(getEncoder(targetFormat::Singbox, protocolType::VMess).record !=
              nullptr);
}

TEST(SubscriptionTest, EmptyNodeSet) {
  subscriptionResult result;
  EXPECT_EQ(renderSubscription({}, makeUser(), "clash", result),
            SUBSCRIPTION_ERROR_NO_NODES);
  EXPECT_TRUE(result.body.empty());
}

TEST(SubscriptionTest, UnknownFormat) {
  subscriptionResult result;
  EXPECT_EQ(renderSubscription(mixedNodes(), makeUser(), "loon", result),
            SUBSCRIPTION_ERROR_UNKNOWN_FORMAT);
}

TEST(SubscriptionTest, V2RayBodyIsBase64Links) {
  subscriptionResult result = render("v2ray");
  EXPECT_EQ(result.contentType, "text/plain");
  EXPECT_EQ(result.extension, "txt");
  std::string decoded;
  ASSERT_TRUE(base64_decode(result.body, decoded));
  string_array links = lines(decoded);
  // ssr and anytls have no link form
  ASSERT_EQ(links.size(), 5u);
  EXPECT_EQ(links[0].substr(0, 8), "vmess://");
  EXPECT_EQ(links[1].substr(0, 8), "vless://");
  EXPECT_EQ(links[2].substr(0, 5), "ss://");
  EXPECT_EQ(links[3].substr(0, 11), "hysteria://");
  EXPECT_EQ(links[4].substr(0, 9), "trojan://");
}

TEST(SubscriptionTest, QuantumultXSkipsGrpc) {
  subscriptionResult result = render("quantumultx");
  string_array entries = lines(result.body);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].substr(0, 6), "vless=");
  EXPECT_EQ(entries[1].substr(0, 12), "shadowsocks=");
  EXPECT_EQ(entries[2].substr(0, 7), "trojan=");
  EXPECT_EQ(result.body.find("VM gRPC"), std::string::npos);
}

TEST(SubscriptionTest, ShadowrocketLinksUnwrapped) {
  subscriptionResult result = render("shadowrocket");
  string_array entries = lines(result.body);
  ASSERT_EQ(entries.size(), 4u);
  EXPECT_EQ(entries[0].substr(0, 8), "vless://");
  EXPECT_EQ(entries[1].substr(0, 5), "ss://");
  EXPECT_EQ(entries[2].substr(0, 11), "hysteria://");
  EXPECT_EQ(entries[3].substr(0, 9), "trojan://");
}

TEST(SubscriptionTest, ContentTypes) {
  subscriptionResult result = render("clash");
  EXPECT_EQ(result.contentType, "text/yaml");
  EXPECT_EQ(result.extension, "yaml");
  EXPECT_NE(result.body.find("type: ssr"), std::string::npos);
  EXPECT_NE(result.body.find("type: anytls"), std::string::npos);

  result = render("surge");
  EXPECT_EQ(result.extension, "conf");
  EXPECT_NE(result.body.find("VM gRPC = vmess"), std::string::npos);
  EXPECT_EQ(result.body.find("VL = "), std::string::npos);
}

TEST(SubscriptionTest, UserInfo) {
  EXPECT_EQ(subscriptionUserInfo(makeUser()),
            "upload=1024; download=2048; total=10737418240; expire=1893456000");
}

TEST(RecordsTest, ParseNodeList) {
  std::vector<proxyNode> nodes;
  ASSERT_EQ(parseNodeList(R"({"nodes":[
      {"id":1,"name":"A","type":"vmess","node_class":"2","status":0,
       "node_config":{"client":{"server":"a.example.com"}}},
      {"id":"2","name":"B","type":"ss","node_config":"{\"config\":{}}"},
      "junk"]})",
                          nodes),
            0);
  ASSERT_EQ(nodes.size(), 2u);
  EXPECT_EQ(nodes[0].nodeClass, 2);
  EXPECT_FALSE(nodes[0].active);
  EXPECT_EQ(nodes[0].config, R"({"client":{"server":"a.example.com"}})");
  EXPECT_EQ(nodes[1].id, 2);
  EXPECT_TRUE(nodes[1].active);
  EXPECT_EQ(nodes[1].config, R"({"config":{}})");

  EXPECT_EQ(parseNodeList("{}", nodes), -1);
  EXPECT_EQ(parseNodeList("not json", nodes), -1);
}

TEST(RecordsTest, ParseUserRecord) {
  subUser user;
  ASSERT_EQ(parseUserRecord(R"({"id":9,"uuid":"u-1","passwd":"pw","u":10,
                               "d":"20","transfer_enable":300,
                               "expire_time":1700000000})",
                            user),
            0);
  EXPECT_EQ(user.id, 9);
  EXPECT_EQ(user.uuid, "u-1");
  EXPECT_EQ(user.upload, 10u);
  EXPECT_EQ(user.download, 20u);
  EXPECT_EQ(user.transferEnable, 300u);
  EXPECT_EQ(user.expireTime, 1700000000);
  EXPECT_EQ(parseUserRecord("[]", user), -1);
}
