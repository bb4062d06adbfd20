#include <gtest/gtest.h>

#include "kernel/diagnostics.hpp"

namespace {

ks::Diagnostic diag(int line, int col, ks::Severity s, const std::string& msg) {
  ks::Diagnostic d;
  d.line = line;
  d.col = col;
  d.severity = s;
  d.message = msg;
  return d;
}

}  // namespace

TEST(DiagnosticsTest, SeveritySortOrdersLineItems) {
  ks::DiagnosticStore store;
  store.add(1, diag(5, 1, ks::Severity::Hint, "hint"));
  store.add(1, diag(5, 2, ks::Severity::Error, "error"));

  auto unsorted = store.at_line(1, 5);
  ASSERT_EQ(unsorted.size(), 2u);
  EXPECT_EQ(unsorted[0].message, "hint");

  ks::DiagnosticsConfig cfg;
  cfg.severity_sort = true;
  store.configure(cfg);
  auto sorted = store.at_line(1, 5);
  EXPECT_EQ(sorted[0].message, "error");
}

TEST(DiagnosticsTest, VirtualTextFollowsPresentation) {
  ks::DiagnosticStore store;
  ks::DiagnosticsConfig cfg;
  cfg.virtual_text_prefix = ">";
  cfg.virtual_text_spacing = 2;
  store.configure(cfg);
  auto d = diag(1, 1, ks::Severity::Warning, "unused");
  EXPECT_EQ(store.virtual_text(d), ">  unused");

  cfg.virtual_text = false;
  store.configure(cfg);
  EXPECT_EQ(store.virtual_text(d), "");
}

TEST(DiagnosticsTest, NavigationByLine) {
  ks::DiagnosticStore store;
  store.add(2, diag(10, 1, ks::Severity::Error, "b"));
  store.add(2, diag(3, 4, ks::Severity::Warning, "a"));
  store.add(2, diag(20, 1, ks::Severity::Info, "c"));

  auto next = store.next_after(2, 3);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->message, "b");
  auto prev = store.prev_before(2, 10);
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(prev->message, "a");
  EXPECT_FALSE(store.next_after(2, 20).has_value());
  EXPECT_FALSE(store.prev_before(2, 3).has_value());

  auto all = store.list(2);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all.front().message, "a");
  store.clear(2);
  EXPECT_TRUE(store.list(2).empty());
}

TEST(DiagnosticsTest, SeverityNames) {
  EXPECT_EQ(ks::severity_from_name("warn"), ks::Severity::Warning);
  EXPECT_EQ(ks::severity_from_name("h"), ks::Severity::Hint);
  EXPECT_FALSE(ks::severity_from_name("fatal").has_value());
  EXPECT_STREQ(ks::severity_name(ks::Severity::Info), "info");
}
