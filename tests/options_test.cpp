#include <gtest/gtest.h>

#include <limits>
#include <string.h>

#include "lossypng.h"

TEST(Options_test, Defaults)
{
	lossypng_options options;
	lossypng_options_init(&options);
	EXPECT_EQ(2, options.level);
	EXPECT_EQ(0.0, options.lossy);
	EXPECT_EQ(LOSSY_SEARCH, options.mode);
	EXPECT_EQ(OPTIMIZER_KMEANS, options.optimizer);
	EXPECT_EQ(DITHERER_ORDERED, options.ditherer);
	EXPECT_EQ(STRIP_ALL, options.strip);
	EXPECT_FALSE(options.interlace_keep);
	EXPECT_FALSE(options.alpha);
	EXPECT_TRUE(options.preserve);
	EXPECT_TRUE(options.tight_bound);
	EXPECT_EQ(SUCCESS, lossypng_options_validate(&options));
}

TEST(Options_test, Validation)
{
	lossypng_options options;
	lossypng_options_init(&options);

	options.level = -1;
	EXPECT_EQ(INVALID_ARGUMENT, lossypng_options_validate(&options));
	options.level = 7;
	EXPECT_EQ(INVALID_ARGUMENT, lossypng_options_validate(&options));
	options.level = 6;
	EXPECT_EQ(SUCCESS, lossypng_options_validate(&options));

	options.lossy = std::numeric_limits<double>::quiet_NaN();
	EXPECT_EQ(INVALID_ARGUMENT, lossypng_options_validate(&options));

	// lossless when not positive
	options.lossy = -3;
	EXPECT_EQ(SUCCESS, lossypng_options_validate(&options));

	options.mode = LOSSY_COVERAGE;
	options.lossy = 1.5;
	EXPECT_EQ(INVALID_ARGUMENT, lossypng_options_validate(&options));
	options.mode = LOSSY_PRUNE;
	EXPECT_EQ(SUCCESS, lossypng_options_validate(&options));
}

TEST(Options_test, ParseMode)
{
	lossy_mode mode;
	EXPECT_EQ(SUCCESS, parse_mode("coverage", &mode));
	EXPECT_EQ(LOSSY_COVERAGE, mode);
	EXPECT_EQ(SUCCESS, parse_mode("prune", &mode));
	EXPECT_EQ(LOSSY_PRUNE, mode);
	EXPECT_EQ(SUCCESS, parse_mode("search", &mode));
	EXPECT_EQ(LOSSY_SEARCH, mode);
	EXPECT_EQ(UNKNOWN_OPTION, parse_mode("linear", &mode));
	EXPECT_STREQ("coverage", mode_name(LOSSY_COVERAGE));
}

TEST(Options_test, ErrorMessages)
{
	EXPECT_STREQ("success", lossypng_strerror(SUCCESS));
	EXPECT_STREQ("unknown option", lossypng_strerror(UNKNOWN_OPTION));
	EXPECT_GT(strlen(lossypng_strerror(LIBPNG_FATAL_ERROR)), 0u);
	EXPECT_STREQ("unknown error", lossypng_strerror((lossypng_error)999));
}

TEST(Options_test, VerboseSwitch)
{
	set_verbose(true);
	EXPECT_TRUE(is_verbose());
	set_verbose(false);
	EXPECT_FALSE(is_verbose());
}

TEST(Options_test, ParseIntRejectsOverflow)
{
	int value = 7;
	EXPECT_TRUE(parse_int("4", &value));
	EXPECT_EQ(4, value);
	EXPECT_TRUE(parse_int("-2", &value));
	EXPECT_EQ(-2, value);

	value = 7;
	EXPECT_FALSE(parse_int("4294967298", &value));
	EXPECT_FALSE(parse_int("-4294967298", &value));
	EXPECT_FALSE(parse_int("99999999999999999999999", &value));
	EXPECT_FALSE(parse_int("3x", &value));
	EXPECT_FALSE(parse_int("", &value));
	EXPECT_EQ(7, value);
}

TEST(Options_test, ParseDouble)
{
	double value = 0;
	EXPECT_TRUE(parse_double("2.5", &value));
	EXPECT_EQ(2.5, value);
	EXPECT_FALSE(parse_double("2.5.1", &value));
	EXPECT_FALSE(parse_double("", &value));
	EXPECT_FALSE(parse_double("1e999", &value));
}
