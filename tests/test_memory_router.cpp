/**
 * @file test_memory_router.cpp
 * @brief Tests for the in-memory device model and its YAML snapshot format.
 *
 * Validates:
 *  - per-command status with no rollback
 *  - device rules: route needs a group and a known interface, routed group cannot be deleted, entry limit
 *  - failure injection for reads, batches and single commands
 *  - snapshot parse/emit
 */

#include <gtest/gtest.h>
#include <string>

#include "dnsroute/routing/memory_router.hpp"
#include "dnsroute/routing/state_file.hpp"
#include "test_support.hpp"

using dnsroute::ErrorKind;
using dnsroute::testing::TempDir;
using namespace dnsroute::routing;

static std::vector<CommandStatus> statuses(const std::vector<CommandResult>& rs) {
  std::vector<CommandStatus> out;
  for (const auto& r : rs) out.push_back(r.status);
  return out;
}

constexpr auto OK = CommandStatus::Ok;
constexpr auto ERR = CommandStatus::Error;

// ------------------------------ Commands -----------------------------------

TEST(MemoryRouter, CreateAddRouteSave) {
  MemoryRouter dev(RouterState{"5.0.2", {}, {}, {"ISP"}});
  auto rs = dev.execute({cmd::create_group("g"), cmd::add_domain("g", "a.com"),
                         cmd::set_route("g", "ISP"), cmd::save_config()});
  ASSERT_TRUE(rs.has_value());
  EXPECT_EQ(statuses(*rs), (std::vector<CommandStatus>{OK, OK, OK, OK}));
  EXPECT_EQ(dev.state().groups.at("g"), (std::set<std::string>{"a.com"}));
  EXPECT_EQ(dev.state().routes.at("g"), "ISP");
  EXPECT_EQ(dev.saves(), 1u);
  EXPECT_EQ(dev.batches(), 1u);
}

/**
 * @test FailuresDoNotRollBack
 * @brief A failing command in the middle leaves earlier and later effects applied.
 */
TEST(MemoryRouter, FailuresDoNotRollBack) {
  MemoryRouter dev(RouterState{"5.0.2", {}, {}});
  auto rs = dev.execute({cmd::create_group("g"), cmd::add_domain("missing", "a.com"),
                         cmd::add_domain("g", "b.com"), cmd::save_config()});
  ASSERT_TRUE(rs.has_value());
  EXPECT_EQ(statuses(*rs), (std::vector<CommandStatus>{OK, ERR, OK, OK}));
  EXPECT_TRUE(dev.state().groups.at("g").contains("b.com"));
  EXPECT_FALSE(dev.state().groups.contains("missing"));
}

TEST(MemoryRouter, DeviceRules) {
  MemoryRouter dev(RouterState{"5.0.2", {{"g", {"a.com"}}}, {{"g", "ISP"}}, {"ISP"}});
  auto rs = dev.execute({
    cmd::set_route("nogroup", "ISP"),      // route needs a group
    cmd::set_route("g", "Wireguard9"),     // unknown interface
    cmd::delete_group("g"),                // routed group
    cmd::remove_domain("g", "x.com"),      // not present
    cmd::delete_route("g", "Wireguard0"),  // interface mismatch
    cmd::delete_route("g", "ISP"),
    cmd::delete_group("g"),
  });
  ASSERT_TRUE(rs.has_value());
  EXPECT_EQ(statuses(*rs), (std::vector<CommandStatus>{ERR, ERR, ERR, ERR, ERR, OK, OK}));
  EXPECT_TRUE(dev.state().groups.empty());
  EXPECT_TRUE(dev.state().routes.empty());
}

TEST(MemoryRouter, SetRouteReplacesInterface) {
  MemoryRouter dev(RouterState{"5.0.2", {{"g", {}}}, {{"g", "Wireguard0"}}, {"ISP", "Wireguard0"}});
  ASSERT_TRUE(dev.execute({cmd::set_route("g", "ISP")}).has_value());
  EXPECT_EQ(dev.state().routes.at("g"), "ISP");
}

TEST(MemoryRouter, EntryLimit) {
  MemoryRouter dev(RouterState{"5.0.2", {{"g", {"a.com", "b.com"}}}, {}}, 2);
  auto rs = dev.execute({cmd::add_domain("g", "c.com"), cmd::remove_domain("g", "a.com"),
                         cmd::add_domain("g", "c.com")});
  ASSERT_TRUE(rs.has_value());
  EXPECT_EQ(statuses(*rs), (std::vector<CommandStatus>{ERR, OK, OK}));
  EXPECT_EQ(dev.state().groups.at("g"), (std::set<std::string>{"b.com", "c.com"}));
}

// ------------------------------ Injection ----------------------------------

TEST(MemoryRouter, InjectedFailures) {
  MemoryRouter dev(RouterState{"5.0.2", {}, {}});

  dev.fail_state_reads("connection reset");
  EXPECT_FALSE(dev.existing_groups().has_value());
  EXPECT_FALSE(dev.existing_routes().has_value());
  EXPECT_FALSE(dev.existing_interfaces().has_value());
  dev.fail_state_reads(std::nullopt);
  EXPECT_TRUE(dev.existing_groups().has_value());

  dev.fail_batches("HTTP 502");
  auto rs = dev.execute({cmd::create_group("g")});
  ASSERT_FALSE(rs.has_value());
  EXPECT_EQ(rs.error(), "HTTP 502");
  EXPECT_TRUE(dev.state().groups.empty());
  dev.fail_batches(std::nullopt);

  dev.fail_command("object-group fqdn g include bad.com");
  rs = dev.execute({cmd::create_group("g"), cmd::add_domain("g", "bad.com"),
                    cmd::add_domain("g", "ok.com")});
  ASSERT_TRUE(rs.has_value());
  EXPECT_EQ(statuses(*rs), (std::vector<CommandStatus>{OK, ERR, OK}));
  EXPECT_EQ(dev.state().groups.at("g"), (std::set<std::string>{"ok.com"}));
}

// ------------------------------ Snapshot file ------------------------------

TEST(StateFile, ParseSnapshot) {
  auto st = parse_state(
    "firmware: \"5.0.2\"\n"
    "object-groups:\n"
    "  social: [facebook.com, instagram.com]\n"
    "  empty:\n"
    "routes:\n"
    "  social: Wireguard0\n"
    "interfaces: [ISP, Wireguard0]\n");
  ASSERT_TRUE(st.has_value()) << st.error().describe();
  EXPECT_EQ(st->firmware, "5.0.2");
  EXPECT_EQ(st->groups.at("social"), (std::set<std::string>{"facebook.com", "instagram.com"}));
  EXPECT_TRUE(st->groups.at("empty").empty());
  EXPECT_EQ(st->routes.at("social"), "Wireguard0");
  EXPECT_EQ(st->interfaces, (InterfaceIds{"ISP", "Wireguard0"}));
}

TEST(StateFile, MalformedSnapshotIsStateFetchError) {
  auto st = parse_state("object-groups: [a, b]\n");
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error().kind, ErrorKind::StateFetch);

  auto ifaces = parse_state("interfaces: {ISP: up}\n");
  ASSERT_FALSE(ifaces.has_value());
  EXPECT_EQ(ifaces.error().kind, ErrorKind::StateFetch);

  auto missing = load_state_file("/nonexistent/state.yaml");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::StateFetch);
}

TEST(StateFile, SaveThenLoad) {
  TempDir tmp;
  const RouterState st{"5.0.2", {{"g", {"a.com", "b.com"}}, {"h", {}}}, {{"g", "ISP"}}, {"ISP", "Wireguard0"}};
  const auto path = (tmp.path() / "state.yaml").string();
  ASSERT_TRUE(save_state_file(path, st).has_value());
  auto back = load_state_file(path);
  ASSERT_TRUE(back.has_value()) << back.error().describe();
  EXPECT_EQ(*back, st);
}
