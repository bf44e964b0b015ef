/**
 * @file test_version_gate.cpp
 * @brief Tests for numeric firmware version comparison and the DNS-routing gate.
 */

#include <gtest/gtest.h>
#include <compare>

#include "dnsroute/routing/version_gate.hpp"

using dnsroute::ErrorKind;
using dnsroute::routing::Version;
using dnsroute::routing::VersionParts;
using dnsroute::routing::check_dns_routing_support;
using dnsroute::routing::compare_versions;
using dnsroute::routing::parse_version;

static std::strong_ordering cmp(const char* a, const char* b) {
  return compare_versions(*parse_version(a), *parse_version(b));
}

TEST(VersionGate, Parse) {
  EXPECT_EQ(*parse_version("4.3.6.3"), (Version{VersionParts{4, 3, 6, 3}, ""}));
  EXPECT_EQ(*parse_version("5.0.1-beta"), (Version{VersionParts{5, 0, 1}, "beta"}));
  EXPECT_EQ(*parse_version("5.0-rc.2+77"), (Version{VersionParts{5, 0}, "rc.2"}));
  EXPECT_EQ(*parse_version("5.0.1+77"), (Version{VersionParts{5, 0, 1}, ""}));
  EXPECT_EQ(*parse_version("5"), (Version{VersionParts{5}, ""}));
  EXPECT_FALSE(parse_version("").has_value());
  EXPECT_FALSE(parse_version("v5.0").has_value());
  EXPECT_FALSE(parse_version("5..1").has_value());
}

/**
 * @test NumericNotLexical
 * @brief "5.10" sorts after "5.9"; missing components are zero.
 */
TEST(VersionGate, NumericNotLexical) {
  EXPECT_EQ(cmp("5.10", "5.9"), std::strong_ordering::greater);
  EXPECT_EQ(cmp("5.0", "5.0.0"), std::strong_ordering::equal);
  EXPECT_EQ(cmp("4.3.6.3", "5.0.1"), std::strong_ordering::less);
  EXPECT_EQ(cmp("10.0", "9.9.9"), std::strong_ordering::greater);
}

/**
 * @test PrereleaseRanksBelowRelease
 * @brief Equal numbers: "-beta" < release; tags compare per dot-separated identifier.
 */
TEST(VersionGate, PrereleaseRanksBelowRelease) {
  EXPECT_EQ(cmp("5.0.1-beta", "5.0.1"), std::strong_ordering::less);
  EXPECT_EQ(cmp("5.0.1", "5.0.1-beta"), std::strong_ordering::greater);
  EXPECT_EQ(cmp("5.0.1-alpha", "5.0.1-beta"), std::strong_ordering::less);
  EXPECT_EQ(cmp("5.0.1-rc.2", "5.0.1-rc.10"), std::strong_ordering::less);
  EXPECT_EQ(cmp("5.0.1-rc", "5.0.1-rc.1"), std::strong_ordering::less);
  EXPECT_EQ(cmp("5.0.2-beta", "5.0.1"), std::strong_ordering::greater);
  EXPECT_EQ(cmp("5.0.1+77", "5.0.1"), std::strong_ordering::equal);
}

TEST(VersionGate, PrereleaseOfMinimumIsRejected) {
  auto beta = check_dns_routing_support("5.0.1-beta");
  ASSERT_FALSE(beta.has_value());
  EXPECT_EQ(beta.error().kind, ErrorKind::VersionGate);
  EXPECT_NE(beta.error().message.find("5.0.1-beta"), std::string::npos);

  EXPECT_TRUE(check_dns_routing_support("5.0.2-beta").has_value());
}

TEST(VersionGate, Gate) {
  EXPECT_TRUE(check_dns_routing_support("5.0.1").has_value());
  EXPECT_TRUE(check_dns_routing_support("5.0.2").has_value());
  EXPECT_TRUE(check_dns_routing_support("5.1").has_value());

  auto old = check_dns_routing_support("4.3.6.3");
  ASSERT_FALSE(old.has_value());
  EXPECT_EQ(old.error().kind, ErrorKind::VersionGate);
  EXPECT_NE(old.error().message.find("5.0.1"), std::string::npos);

  auto empty = check_dns_routing_support("");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().kind, ErrorKind::VersionGate);

  auto junk = check_dns_routing_support("unknown");
  ASSERT_FALSE(junk.has_value());
  EXPECT_EQ(junk.error().kind, ErrorKind::VersionGate);
}

TEST(VersionGate, CustomMinimum) {
  EXPECT_TRUE(check_dns_routing_support("4.3", "4.2.9").has_value());
  EXPECT_FALSE(check_dns_routing_support("4.2", "4.2.9").has_value());
}
