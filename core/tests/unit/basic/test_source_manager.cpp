#include <gtest/gtest.h>

#include <string>

#include "pddl/basic/source_manager.hpp"

using pddl::SourceManager;
using pddl::SourceRange;

TEST(SourceManager, LineColumnIsOneBased)
{
  const SourceManager sm("(define\n  (domain d)\n)");

  const auto start = sm.get_line_column(0);
  EXPECT_EQ(start.line, 1U);
  EXPECT_EQ(start.column, 1U);

  const auto domain = sm.get_line_column(10);  // '(' of (domain
  EXPECT_EQ(domain.line, 2U);
  EXPECT_EQ(domain.column, 3U);

  EXPECT_EQ(sm.get_line_count(), 3U);
}

TEST(SourceManager, OffsetsPastTheEndClamp)
{
  const SourceManager sm("ab\ncd");
  const auto lc = sm.get_line_column(100);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 3U);
}

TEST(SourceManager, LinesDropTerminators)
{
  const SourceManager sm("first\r\nsecond\nthird");
  EXPECT_EQ(sm.get_line(0), "first");
  EXPECT_EQ(sm.get_line(1), "second");
  EXPECT_EQ(sm.get_line(2), "third");
  EXPECT_EQ(sm.get_line(3), "");
  EXPECT_EQ(sm.get_line_offset(1), 7U);
  EXPECT_EQ(sm.get_line_offset(9), sm.size());
}

TEST(SourceManager, LinePrefix)
{
  const SourceManager sm("(define\n  (:action a :parameters (?x -");
  EXPECT_EQ(sm.get_line_prefix(static_cast<uint32_t>(sm.size())), "  (:action a :parameters (?x -");
  EXPECT_EQ(sm.get_line_prefix(8), "");
  EXPECT_EQ(sm.get_line_prefix(3), "(de");
}

TEST(SourceManager, FullRangeAndSlice)
{
  const SourceManager sm("(define\n(domain d))");
  const SourceRange range(8, 15);

  EXPECT_EQ(sm.get_source_slice(range), "(domain");

  const auto full = sm.get_full_range(range);
  EXPECT_TRUE(full.is_valid());
  EXPECT_EQ(full.start_line, 2U);
  EXPECT_EQ(full.start_column, 1U);
  EXPECT_EQ(full.end_line, 2U);
  EXPECT_EQ(full.end_column, 8U);
  EXPECT_EQ(full.to_source_range(), range);

  EXPECT_FALSE(sm.get_full_range(SourceRange{}).is_valid());
  EXPECT_EQ(sm.get_source_slice(SourceRange(40, 50)), "");
}

TEST(SourceManager, SetSourceRebuildsLines)
{
  SourceManager sm("one line");
  EXPECT_EQ(sm.get_line_count(), 1U);

  sm.set_source("a\nb\nc");
  EXPECT_EQ(sm.get_line_count(), 3U);
  EXPECT_EQ(sm.get_line(2), "c");
}

TEST(SourceManager, FilePath)
{
  SourceManager sm;
  EXPECT_FALSE(sm.has_file_path());
  sm.set_file_path("domain.pddl");
  EXPECT_TRUE(sm.has_file_path());
  EXPECT_EQ(sm.get_file_path().filename(), "domain.pddl");
}
