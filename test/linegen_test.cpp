#include <random>

#include <gtest/gtest.h>

#include "derivation.h"
#include "endpoint.h"
#include "linegen.h"
#include "test_util.h"

static std::string encodeLine(std::string (*encoder)(const encodeContext &),
                              const proxyNode &node) {
  subUser user = makeUser();
  nodeEndpoint endpoint = resolveEndpoint(node);
  std::mt19937 rng(5);
  encodeContext ctx{node, endpoint, user, rng, ""};
  return encoder(ctx);
}

static const char *vmess_ws_tls =
    R"({"client":{"server":"v.example.com","port":443},
        "config":{"stream_type":"ws","tls_type":"tls","path":"ray","aead":true,
                  "host":"h.example.com","sni":"sni.example.com",
                  "server":"cdn.example.com"}})";

TEST(LinegenTest, QuantumultXVmess) {
  EXPECT_EQ(encodeLine(vmessQuanXConstruct,
                       makeNode(1, "VM", "vmess", vmess_ws_tls)),
            "vmess=v.example.com:443, method=auto, "
            "password=7f3c1a2e-0000-4000-8000-000000000001, fast-open=false, "
            "udp-relay=false, aead=true, obfs=wss, obfs-host=sni.example.com, "
            "obfs-uri=/ray, tag=VM");
}

TEST(LinegenTest, QuantumultXVlessReality) {
  proxyNode node = makeNode(
      2, "JP Reality", "vless",
      R"({"client":{"server":"r.example.com","port":443,"public_key":"PBK"},
          "config":{"tls_type":"reality","short_ids":["0a1b"],
                    "flow":"xtls-rprx-vision","sni":"www.microsoft.com"}})");
  EXPECT_EQ(encodeLine(vlessQuanXConstruct, node),
            "vless=r.example.com:443, method=none, "
            "password=7f3c1a2e-0000-4000-8000-000000000001, fast-open=false, "
            "udp-relay=true, obfs=over-tls, obfs-host=www.microsoft.com, "
            "reality-base64-pubkey=PBK, reality-hex-shortid=0a1b, "
            "vless-flow=xtls-rprx-vision, tag=JP Reality");
}

TEST(LinegenTest, QuantumultXTrojanAndShadowsocks) {
  EXPECT_EQ(encodeLine(trojanQuanXConstruct,
                       makeNode(3, "TJ", "trojan",
                                R"({"client":{"server":"t.example.com"}})")),
            "trojan=t.example.com:443, password=user-pass, fast-open=false, "
            "tls-verification=false, over-tls=true, tls-host=t.example.com, "
            "udp-relay=false, tag=TJ");

  EXPECT_EQ(
      encodeLine(ssQuanXConstruct,
                 makeNode(4, "SS", "ss",
                          R"({"client":{"server":"s.example.com","port":8388},
                              "config":{"obfs":"simple_obfs_http",
                                        "server":"obfs.example.com"}})")),
      "shadowsocks=s.example.com:8388, method=aes-128-gcm, password=user-pass, "
      "fast-open=false, udp-relay=true, obfs=http, "
      "obfs-host=obfs.example.com, obfs-uri=/, tag=SS");
}

TEST(LinegenTest, SurgeLines) {
  EXPECT_EQ(encodeLine(vmessSurgeConstruct,
                       makeNode(1, "VM", "vmess", vmess_ws_tls)),
            "VM = vmess, v.example.com, 443, "
            "username=7f3c1a2e-0000-4000-8000-000000000001, tls=true, "
            "skip-cert-verify=true, sni=sni.example.com, ws=true, "
            "ws-path=ray, ws-headers=Host:cdn.example.com");

  EXPECT_EQ(encodeLine(ssSurgeConstruct,
                       makeNode(2, "SS", "ss",
                                R"({"client":{"server":"s.example.com"},
                                    "config":{"cipher":"2022-blake3-aes-128-gcm",
                                              "password":"srv","obfs":"tls"}})")),
            "SS = ss, s.example.com, 443, "
            "encrypt-method=2022-blake3-aes-128-gcm, password=srv:" +
                deriveSS2022UserKey("2022-blake3-aes-128-gcm", "user-pass") +
                ", obfs=tls");

  EXPECT_EQ(encodeLine(hysteria2SurgeConstruct,
                       makeNode(3, "HY", "hy2",
                                R"({"client":{"server":"h.example.com"},
                                    "config":{"sni":"sni.example.com"}})")),
            "HY = hysteria2, h.example.com, 443, password=user-pass, "
            "skip-cert-verify=true, sni=sni.example.com");
}

TEST(LinegenTest, SurgeManagedConfig) {
  std::vector<outboundFragment> fragments(2);
  fragments[0].name = fragments[0].tag = "A";
  fragments[0].line = "A = trojan, a.example.com, 443, password=x";
  fragments[1].name = fragments[1].tag = "B";
  fragments[1].line = "B = trojan, b.example.com, 443, password=x";

  std::string config = surgeConfigConstruct(fragments);
  EXPECT_EQ(config.rfind("#!MANAGED-CONFIG", 0), 0u);
  size_t general = config.find("[General]"), proxy = config.find("[Proxy]\n"),
         group = config.find("[Proxy Group]"), rule = config.find("[Rule]");
  ASSERT_NE(general, std::string::npos);
  ASSERT_NE(proxy, std::string::npos);
  ASSERT_NE(group, std::string::npos);
  ASSERT_NE(rule, std::string::npos);
  EXPECT_LT(general, proxy);
  EXPECT_LT(proxy, group);
  EXPECT_LT(group, rule);
  EXPECT_NE(config.find("[Proxy]\nDIRECT = direct\nA = trojan"),
            std::string::npos);
  EXPECT_NE(config.find("🚀 节点选择 = select, A, B\n"), std::string::npos);
  EXPECT_NE(config.find("♻️ 自动选择 = url-test, A, B, url = "),
            std::string::npos);
  EXPECT_NE(config.find("FINAL,🚀 节点选择"), std::string::npos);
}
