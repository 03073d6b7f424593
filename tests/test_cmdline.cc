/********************************************************************************
 *                               Splice Project                                 *
 *                  Fragmented Stream Reconstruction Toolkit                    *
 *                                                                              *
 *  Copyright (c) 2025 Oinkognito                                               *
 *  All rights reserved.                                                        *
 *                                                                              *
 *  License:                                                                    *
 *  This software is licensed under the BSD-3-Clause License. You may use,      *
 *  modify, and distribute this software under the conditions stated in the     *
 *  LICENSE file provided in the project root.                                  *
 *                                                                              *
 *  Warranty Disclaimer:                                                        *
 *  This software is provided "AS IS", without any warranties or guarantees,    *
 *  either expressed or implied, including but not limited to fitness for a     *
 *  particular purpose.                                                         *
 *                                                                              *
 *  Contributions:                                                              *
 *  Contributions are welcome. By submitting code, you agree to license your    *
 *  contributions under the same BSD-3-Clause terms.                            *
 *                                                                              *
 *  See LICENSE file for full legal details.                                    *
 ********************************************************************************/

#include <gtest/gtest.h>

#include <support/Argv.hpp>

using splice_test::Argv;

TEST(CmdLineParserTest, LongOptionsAndFlags)
{
  const auto parser = Argv{"splice", "--quality=800000", "--verbose_libav"}.parser();

  EXPECT_EQ(parser.get<int>("quality"), 800000);
  EXPECT_TRUE(parser.has("verbose_libav"));
  EXPECT_EQ(parser.get<bool>("verbose_libav"), true);
  EXPECT_FALSE(parser.has("limit"));
  EXPECT_EQ(parser.get_or<int>("limit", 7), 7);
}

TEST(CmdLineParserTest, ShortOptionsTakeTheNextWord)
{
  const auto parser = Argv{"splice", "-q", "1600000", "-l=12.5", "in", "out.mp4"}.parser();

  EXPECT_EQ(parser.get<int>({"quality", "q"}), 1600000);
  EXPECT_DOUBLE_EQ(*parser.get<double>({"limit", "l"}), 12.5);
  EXPECT_EQ(parser.positionals(), (std::vector<std::string>{"in", "out.mp4"}));
}

TEST(CmdLineParserTest, FirstAliasWins)
{
  const auto parser = Argv{"splice", "--wait=3", "-w", "9"}.parser();

  EXPECT_EQ(parser.get<int>({"wait", "w"}), 3);
}

TEST(CmdLineParserTest, PositionalsKeepTheirOrder)
{
  const auto parser = Argv{"splice", "https://example.com/video/42", "-m", "2", "video.mp4"}.parser();

  EXPECT_EQ(parser.positional(0), "https://example.com/video/42");
  EXPECT_EQ(parser.positional(1), "video.mp4");
  EXPECT_EQ(parser.positional(2), std::nullopt);
  EXPECT_NO_THROW(parser.require_positionals(2));
  EXPECT_THROW(parser.require_positionals(3), std::invalid_argument);
}

TEST(CmdLineParserTest, UnparsableValueThrows)
{
  const auto parser = Argv{"splice", "--max_attempts=ten", "-l", "1.5s"}.parser();

  EXPECT_THROW(parser.get<int>("max_attempts"), std::invalid_argument);
  EXPECT_THROW(parser.get<double>({"limit", "l"}), std::invalid_argument);
}

TEST(CmdLineParserTest, ShortOptionWithoutValueThrows)
{
  EXPECT_THROW(Argv({"splice", "in", "-q"}).parser(), std::invalid_argument);
}

TEST(CmdLineParserTest, UnknownArgumentsAreReported)
{
  const auto parser = Argv{"splice", "--quality=1", "--qualtiy=2"}.parser();

  (void)parser.get<int>("quality");
  EXPECT_TRUE(parser.warn_unknown_args());
}

TEST(CmdLineParserTest, NothingToReportWhenEveryOptionWasRead)
{
  const auto parser = Argv{"splice", "--help", "-m", "3"}.parser();

  EXPECT_TRUE(parser.has("help"));
  (void)parser.get<int>({"max_attempts", "m"});
  EXPECT_FALSE(parser.warn_unknown_args());
}
