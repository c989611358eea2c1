#include <random>

#include <gtest/gtest.h>

#include "clashgen.h"
#include "derivation.h"
#include "endpoint.h"
#include "linegen.h"
#include "linkgen.h"
#include "test_util.h"

static std::string encodeLink(std::string (*encoder)(const encodeContext &),
                              const proxyNode &node, unsigned seed = 42) {
  subUser user = makeUser();
  user.passwd = "p@ss";
  nodeEndpoint endpoint = resolveEndpoint(node);
  std::mt19937 rng(seed);
  encodeContext ctx{node, endpoint, user, rng, ""};
  return encoder(ctx);
}

TEST(LinkgenTest, QueryString) {
  query_params params;
  applyQueryParam(params, "sni", "a.example.com");
  applyQueryParam(params, "alpn", "");
  applyQueryParam(params, "path", "/ws?ed=2048");
  EXPECT_EQ(buildQueryString(params), "sni=a.example.com&path=%2Fws%3Fed%3D2048");
}

TEST(LinkgenTest, VmessJsonOrder) {
  proxyNode node = makeNode(
      1, "VM", "vmess",
      R"({"client":{"server":"v.example.com","port":8443},
          "config":{"stream_type":"ws","tls_type":"tls","path":"/ray",
                    "host":"h.example.com"}})");
  std::string link = encodeLink(vmessLinkConstruct, node);
  ASSERT_EQ(link.substr(0, 8), "vmess://");
  std::string decoded;
  ASSERT_TRUE(base64_decode(link.substr(8), decoded));
  EXPECT_EQ(decoded,
            "{\"v\":\"2\",\"ps\":\"VM\",\"add\":\"v.example.com\",\"port\":8443,"
            "\"id\":\"7f3c1a2e-0000-4000-8000-000000000001\",\"aid\":0,"
            "\"net\":\"ws\",\"type\":\"none\",\"host\":\"h.example.com\","
            "\"path\":\"/ray\",\"tls\":\"tls\",\"sni\":\"h.example.com\","
            "\"alpn\":\"\"}");
}

TEST(LinkgenTest, VlessRealityShortIdFromSet) {
  proxyNode node = makeNode(
      2, "Reality", "vless",
      R"({"client":{"server":"r.example.com","port":443,"publickey":"PBK"},
          "config":{"tls_type":"reality","flow":"xtls-rprx-vision",
                    "short_ids":["ab","cd"],"sni":"www.microsoft.com"}})");
  for (unsigned seed = 0; seed < 8; seed++) {
    std::string link = encodeLink(vlessLinkConstruct, node, seed);
    std::string prefix =
        "vless://7f3c1a2e-0000-4000-8000-000000000001@r.example.com:443?"
        "encryption=none&type=tcp&security=reality&pbk=PBK&fp=chrome&"
        "sni=www.microsoft.com&sid=";
    ASSERT_EQ(link.substr(0, prefix.size()), prefix);
    std::string rest = link.substr(prefix.size());
    EXPECT_TRUE(rest == "ab&flow=xtls-rprx-vision#Reality" ||
                rest == "cd&flow=xtls-rprx-vision#Reality")
        << rest;
  }
}

TEST(LinkgenTest, VlessHostParamForHostedStream) {
  proxyNode node = makeNode(
      3, "WS", "vless",
      R"({"client":{"server":"w.example.com","tls_host":"t.example.com"},
          "config":{"stream_type":"ws","tls_type":"tls","path":"/v"}})");
  EXPECT_EQ(encodeLink(vlessLinkConstruct, node),
            "vless://7f3c1a2e-0000-4000-8000-000000000001@w.example.com:443?"
            "encryption=none&type=ws&security=tls&sni=t.example.com&"
            "path=%2Fv&host=t.example.com#WS");
}

TEST(LinkgenTest, TrojanBracketsIPv6) {
  proxyNode node = makeNode(
      4, "Node A", "trojan",
      R"({"client":{"server":"2001:db8::1"},"config":{"sni":"t.example.com"}})");
  EXPECT_EQ(encodeLink(trojanLinkConstruct, node),
            "trojan://p%40ss@[2001:db8::1]:443?sni=t.example.com#Node%20A");
}

TEST(LinkgenTest, ShadowsocksWithObfs) {
  proxyNode node = makeNode(
      5, "SS", "ss",
      R"({"client":{"server":"s.example.com","port":8388},
          "config":{"cipher":"aes-128-gcm","obfs":"simple_obfs_http",
                    "server":"obfs.example.com"}})");
  subUser user = makeUser();
  user.passwd = "secret";
  nodeEndpoint endpoint = resolveEndpoint(node);
  std::mt19937 rng(1);
  encodeContext ctx{node, endpoint, user, rng, ""};
  EXPECT_EQ(ssLinkConstruct(ctx),
            "ss://YWVzLTEyOC1nY206c2VjcmV0@s.example.com:8388?"
            "plugin=obfs-local&plugin-opts=obfs%3Dsimple_obfs_http%3B"
            "obfs-host%3Dobfs.example.com#SS");
}

TEST(LinkgenTest, HysteriaDefaults) {
  proxyNode node = makeNode(6, "HY", "hysteria2",
                            R"({"client":{"server":"h.example.com"}})");
  EXPECT_EQ(encodeLink(hysteriaLinkConstruct, node),
            "hysteria://h.example.com:443?protocol=udp&auth=p%40ss&"
            "peer=h.example.com&insecure=1&upmbps=100&downmbps=100#HY");
}

TEST(LinkgenTest, VlessRealityFallsBackToTlsHost) {
  proxyNode node = makeNode(
      7, "Reality", "vless",
      R"({"client":{"server":"203.0.113.7","port":443,"tls_host":"example.com",
                    "public_key":"PBK"},
          "config":{"tls_type":"reality","short_ids":["abcd","ef01"]}})");
  for (unsigned seed = 0; seed < 16; seed++) {
    std::string link = encodeLink(vlessLinkConstruct, node, seed);
    EXPECT_NE(link.find("security=reality"), std::string::npos) << link;
    EXPECT_NE(link.find("&pbk=PBK&"), std::string::npos) << link;
    EXPECT_NE(link.find("&sni=example.com&"), std::string::npos) << link;
    size_t sid = link.find("&sid=");
    ASSERT_NE(sid, std::string::npos) << link;
    std::string value = link.substr(sid + 5, 4);
    EXPECT_TRUE(value == "abcd" || value == "ef01") << link;
  }
}

TEST(LinkgenTest, Shadowsocks2022WithoutUserSecret) {
  proxyNode node = makeNode(
      8, "SS22", "ss",
      R"({"client":{"server":"s.example.com","port":8388},
          "config":{"cipher":"2022-blake3-aes-256-gcm",
                    "password":"serverSecret"}})");
  subUser user = makeUser();
  user.uuid.clear();
  user.passwd.clear();
  nodeEndpoint endpoint = resolveEndpoint(node);
  std::mt19937 rng(1);
  encodeContext ctx{node, endpoint, user, rng, ""};

  std::string password =
      "serverSecret:" +
      deriveSS2022UserKey("2022-blake3-aes-256-gcm", "serverSecret");
  EXPECT_EQ(ssLinkConstruct(ctx),
            "ss://" + base64_encode("2022-blake3-aes-256-gcm:" + password) +
                "@s.example.com:8388#SS22");

  rapidjson::Document storage;
  rapidjson::Value record = ssClashConstruct(ctx, storage.GetAllocator());
  EXPECT_EQ(GetMember(record, "password"), password);
}

struct ipv6Case {
  const char *type;
  std::string (*encoder)(const encodeContext &);
  const char *expected;
};

class LinkgenIPv6Test : public ::testing::TestWithParam<ipv6Case> {};

TEST_P(LinkgenIPv6Test, HostIsBracketed) {
  const ipv6Case &param = GetParam();
  proxyNode node = makeNode(
      9, "V6", param.type,
      R"({"client":{"server":"2001:db8::1","port":443,"tls_host":"t.example.com"},
          "config":{"cipher":"aes-128-gcm"}})");
  std::string line = encodeLink(param.encoder, node);
  EXPECT_NE(line.find(param.expected), std::string::npos) << line;
  EXPECT_EQ(line.find("@2001:db8::1"), std::string::npos) << line;
}

INSTANTIATE_TEST_SUITE_P(
    AllBuilders, LinkgenIPv6Test,
    ::testing::Values(
        ipv6Case{"vless", vlessLinkConstruct, "@[2001:db8::1]:443?"},
        ipv6Case{"trojan", trojanLinkConstruct, "@[2001:db8::1]:443?"},
        ipv6Case{"ss", ssLinkConstruct, "@[2001:db8::1]:443#"},
        ipv6Case{"hysteria2", hysteriaLinkConstruct,
                 "hysteria://[2001:db8::1]:443?"},
        ipv6Case{"vmess", vmessQuanXConstruct, "vmess=[2001:db8::1]:443, "},
        ipv6Case{"vless", vlessQuanXConstruct, "vless=[2001:db8::1]:443, "},
        ipv6Case{"trojan", trojanQuanXConstruct, "trojan=[2001:db8::1]:443, "},
        ipv6Case{"ss", ssQuanXConstruct, "shadowsocks=[2001:db8::1]:443, "}));

// surge fields are comma separated, the literal stays bare
TEST(LinkgenTest, SurgeKeepsBareIPv6) {
  proxyNode node = makeNode(10, "V6", "trojan",
                            R"({"client":{"server":"2001:db8::1"}})");
  EXPECT_EQ(encodeLink(trojanSurgeConstruct, node).substr(0, 32),
            "V6 = trojan, 2001:db8::1, 443, p");
}
