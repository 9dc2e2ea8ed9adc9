#include <gtest/gtest.h>

#include "modelspec/basic/source_manager.hpp"

namespace modelspec
{

TEST(BasicSourceManager, SingleLine)
{
  const SourceManager sm("y ~ x1 + x2");

  EXPECT_EQ(sm.get_name(), "<spec>");
  EXPECT_EQ(sm.get_line_count(), 1u);
  EXPECT_EQ(sm.get_line(0), "y ~ x1 + x2");

  const LineColumn lc = sm.get_line_column(4u);
  EXPECT_EQ(lc.line, 1u);
  EXPECT_EQ(lc.column, 5u);
}

TEST(BasicSourceManager, MultipleLines)
{
  const SourceManager sm("y\r\n  ~ x\n+ z", "model.spec");

  EXPECT_EQ(sm.get_name(), "model.spec");
  EXPECT_EQ(sm.get_line_count(), 3u);
  EXPECT_EQ(sm.get_line(0), "y");
  EXPECT_EQ(sm.get_line(1), "  ~ x");
  EXPECT_EQ(sm.get_line(2), "+ z");
  EXPECT_EQ(sm.get_line(3), "");

  const LineColumn tilde = sm.get_line_column(5u);
  EXPECT_EQ(tilde.line, 2u);
  EXPECT_EQ(tilde.column, 3u);
}

TEST(BasicSourceManager, EndOfInputIsALocation)
{
  const SourceManager sm("y ~");
  const LineColumn lc = sm.get_line_column(3u);
  EXPECT_TRUE(lc.is_valid());
  EXPECT_EQ(lc.column, 4u);

  EXPECT_FALSE(sm.get_line_column(SourceLocation()).is_valid());
}

TEST(BasicSourceManager, Slices)
{
  const SourceManager sm("y ~ factor(x) as z");

  EXPECT_EQ(sm.get_slice(SourceRange(4, 13)), "factor(x)");
  EXPECT_EQ(sm.get_slice(SourceRange(17, 99)), "z");
  EXPECT_EQ(sm.get_slice(SourceRange()), "");
  EXPECT_EQ(sm.get_slice(SourceRange(40, 41)), "");
}

TEST(BasicSourceManager, FullRange)
{
  const SourceManager sm("y\n~ factor(x)");
  const FullSourceRange fr = sm.get_full_range(SourceRange(4, 13));

  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2u);
  EXPECT_EQ(fr.start_column, 3u);
  EXPECT_EQ(fr.end_line, 2u);
  EXPECT_EQ(fr.end_column, 12u);
  EXPECT_EQ(fr.to_source_range(), SourceRange(4, 13));

  EXPECT_FALSE(sm.get_full_range(SourceRange()).is_valid());
}

TEST(BasicSourceRange, JoinAndContains)
{
  const SourceRange a(2, 5);
  const SourceRange b(8, 10);
  const SourceRange joined = join_ranges(a, b);

  EXPECT_EQ(joined, SourceRange(2, 10));
  EXPECT_EQ(joined.size(), 8u);
  EXPECT_TRUE(joined.contains(SourceLocation(9)));
  EXPECT_FALSE(joined.contains(SourceLocation(10)));

  EXPECT_EQ(join_ranges(SourceRange(), b), b);
  EXPECT_EQ(join_ranges(a, SourceRange()), a);
  EXPECT_EQ(SourceRange().size(), 0u);
}

}  // namespace modelspec
