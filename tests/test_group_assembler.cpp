/**
 * @file test_group_assembler.cpp
 * @brief Tests for per-group merge/dedup/limit and cross-group conflicts.
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "dnsroute/routing/group_assembler.hpp"
#include "test_support.hpp"

using dnsroute::obs::Severity;
using dnsroute::routing::AssemblyStatus;
using dnsroute::routing::DomainConflict;
using dnsroute::routing::GroupAssembler;
using dnsroute::routing::ResolvedDomains;
using dnsroute::testing::RecordingObserver;

static std::vector<std::string> numbered(std::size_t n) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < n; ++i) out.push_back("d" + std::to_string(i) + ".example.com");
  return out;
}

TEST(GroupAssembler, MergesSortsAndDedups) {
  RecordingObserver obs;
  GroupAssembler asm_(obs);
  auto out = asm_.assemble("g", {{"b.com", "a.com", "b.com"}, {"c.com", "a.com"}});
  EXPECT_EQ(out.status, AssemblyStatus::Ok);
  EXPECT_EQ(out.domains, (std::vector<std::string>{"a.com", "b.com", "c.com"}));
  EXPECT_EQ(out.duplicates_removed, 2u);
  EXPECT_TRUE(obs.saw("Removed 2 duplicate domain(s) from group g"));
}

TEST(GroupAssembler, EmptyGroupIsSkipped) {
  RecordingObserver obs;
  GroupAssembler asm_(obs);
  auto out = asm_.assemble("empty", {{}, {}});
  EXPECT_EQ(out.status, AssemblyStatus::Empty);
  EXPECT_TRUE(obs.saw("Skipping group 'empty': no domains loaded"));
}

/**
 * @test LimitIsOnUniqueCount
 * @brief 300 unique entries pass (even with duplicates on top); 301 do not.
 */
TEST(GroupAssembler, LimitIsOnUniqueCount) {
  RecordingObserver obs;
  GroupAssembler asm_(obs);
  EXPECT_EQ(asm_.limit(), 300u);

  auto exact = numbered(300);
  auto with_dups = exact;
  with_dups.insert(with_dups.end(), exact.begin(), exact.begin() + 50);
  EXPECT_EQ(asm_.assemble("g", {with_dups}).status, AssemblyStatus::Ok);

  auto over = asm_.assemble("g", {numbered(301)});
  EXPECT_EQ(over.status, AssemblyStatus::OverLimit);
  EXPECT_EQ(over.domains.size(), 301u);
}

TEST(GroupAssembler, CustomLimit) {
  RecordingObserver obs;
  GroupAssembler asm_(obs, 2);
  EXPECT_EQ(asm_.assemble("g", {{"a.com", "b.com"}}).status, AssemblyStatus::Ok);
  EXPECT_EQ(asm_.assemble("g", {{"a.com", "b.com", "c.com"}}).status, AssemblyStatus::OverLimit);
}

TEST(GroupAssembler, ConflictsAreReportedNotRemoved) {
  RecordingObserver obs;
  GroupAssembler asm_(obs);
  ResolvedDomains resolved{
    {"video", {"shared.com", "youtube.com"}},
    {"social", {"facebook.com", "shared.com"}},
    {"misc", {"other.com", "shared.com", "youtube.com"}},
  };

  auto conflicts = asm_.find_conflicts(resolved);
  ASSERT_EQ(conflicts.size(), 2u);
  EXPECT_EQ(conflicts[0], (DomainConflict{"shared.com", {"misc", "social", "video"}}));
  EXPECT_EQ(conflicts[1], (DomainConflict{"youtube.com", {"misc", "video"}}));

  asm_.report_conflicts(conflicts);
  EXPECT_EQ(obs.snapshot().errors, 0u);
  EXPECT_TRUE(obs.saw("shared.com appears in groups: misc, social, video", Severity::Warning));
  EXPECT_EQ(resolved.at("video").size(), 2u);
}

TEST(GroupAssembler, NoConflictsNoNotices) {
  RecordingObserver obs;
  GroupAssembler asm_(obs);
  auto conflicts = asm_.find_conflicts({{"a", {"a.com"}}, {"b", {"b.com"}}});
  EXPECT_TRUE(conflicts.empty());
  asm_.report_conflicts(conflicts);
  EXPECT_TRUE(obs.notices.empty());
}
