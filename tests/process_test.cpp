#include <gtest/gtest.h>

#include "process.h"
#include "test_images.h"

class Process_test : public ::testing::Test {
protected:
	void SetUp()
	{
		lossypng_options_init(&options_);
	}

	/* an RGBA PNG of pixels, stored uncompressed so any re-encoding beats it */
	std::vector<unsigned char> encode(const std::vector<rgb_pixel>& pixels, size_t width, size_t height)
	{
		write_info info;
		write_info_init(&info);
		info.width = width;
		info.height = height;
		info.rgba_data = &pixels[0];
		info.compression_level = 0;
		std::vector<unsigned char> png;
		EXPECT_EQ(SUCCESS, rwpng_write_image24_memory(&png, info));
		return png;
	}

	std::vector<rgb_pixel> decode(const std::vector<unsigned char>& png)
	{
		read_info decoded;
		EXPECT_EQ(SUCCESS, rwpng_read_image_memory(&png[0], png.size(), &decoded));
		return decoded.rgba_data;
	}

	lossypng_options options_;
};

TEST_F(Process_test, LosslessKeepsPixels)
{
	std::vector<rgb_pixel> pixels = gradient_image(50, 40);
	std::vector<unsigned char> input = encode(pixels, 50, 40);

	std::vector<unsigned char> output;
	process_result result;
	ASSERT_EQ(SUCCESS, process_image(input, options_, &output, &result));
	EXPECT_FALSE(result.lossy);
	EXPECT_TRUE(decode(output) == pixels);
	EXPECT_LE(output.size(), input.size());
}

TEST_F(Process_test, LosslessUsesPaletteForFewColors)
{
	std::vector<rgb_pixel> pixels = palette_image(64 * 64, primary_colors(), 5);
	std::vector<unsigned char> input = encode(pixels, 64, 64);

	std::vector<unsigned char> output;
	process_result result;
	ASSERT_EQ(SUCCESS, process_image(input, options_, &output, &result));
	EXPECT_FALSE(result.kept_input);
	EXPECT_TRUE(decode(output) == pixels);

	// color type 3 in IHDR
	ASSERT_GT(output.size(), 26u);
	EXPECT_EQ(3, output[25]);
}

TEST_F(Process_test, LossySearchShrinksPalette)
{
	std::vector<rgb_pixel> pixels = gradient_image(64, 64);
	std::vector<unsigned char> input = encode(pixels, 64, 64);

	options_.lossy = 30;
	std::vector<unsigned char> output;
	process_result result;
	ASSERT_EQ(SUCCESS, process_image(input, options_, &output, &result));
	EXPECT_TRUE(result.lossy);
	EXPECT_GE(result.search.colors, 1u);
	EXPECT_LT(result.search.colors, 256u);
	EXPECT_EQ(pixels.size(), decode(output).size());
}

TEST_F(Process_test, EveryModeRuns)
{
	std::vector<rgb_pixel> pixels = gradient_image(32, 32);
	std::vector<unsigned char> input = encode(pixels, 32, 32);

	const lossy_mode modes[] = {LOSSY_SEARCH, LOSSY_COVERAGE, LOSSY_PRUNE};
	for (size_t m=0; m<sizeof(modes)/sizeof(modes[0]); ++m) {
		options_.mode = modes[m];
		options_.lossy = 0.5;
		std::vector<unsigned char> output;
		process_result result;
		ASSERT_EQ(SUCCESS, process_image(input, options_, &output, &result)) << mode_name(modes[m]);
		EXPECT_TRUE(result.lossy);
		EXPECT_EQ(pixels.size(), decode(output).size());
	}
}

TEST_F(Process_test, AlphaOptimizationBlackensTransparentPixels)
{
	std::vector<rgb_pixel> pixels = gradient_image(8, 8);
	pixels[3] = rgb_pixel(200, 100, 50, 0);
	std::vector<unsigned char> input = encode(pixels, 8, 8);

	options_.alpha = true;
	std::vector<unsigned char> output;
	process_result result;
	ASSERT_EQ(SUCCESS, process_image(input, options_, &output, &result));
	EXPECT_EQ(rgb_pixel(0, 0, 0, 0), decode(output)[3]);
}

TEST_F(Process_test, RejectsBadInput)
{
	std::vector<unsigned char> output;
	process_result result;

	std::vector<unsigned char> garbage(100, 7);
	EXPECT_NE(SUCCESS, process_image(garbage, options_, &output, &result));

	std::vector<rgb_pixel> pixels = gradient_image(8, 8);
	std::vector<unsigned char> input = encode(pixels, 8, 8);
	options_.level = 9;
	EXPECT_EQ(INVALID_ARGUMENT, process_image(input, options_, &output, &result));
}

TEST(ZlibLevel_test, Mapping)
{
	EXPECT_EQ(1, zlib_level(0));
	EXPECT_EQ(6, zlib_level(3));
	EXPECT_EQ(9, zlib_level(6));
	EXPECT_EQ(9, zlib_level(100));
}
