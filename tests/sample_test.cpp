#include <gtest/gtest.h>

#include "sample.h"

TEST(Sampler_test, SmallImageSamplesEveryPixel)
{
	std::vector<size_t> indices = sample_indices(10, MAX_SAMPLES);
	ASSERT_EQ(10u, indices.size());
	for (size_t i=0; i<indices.size(); ++i) {
		EXPECT_EQ(i, indices[i]);
	}
}

TEST(Sampler_test, EmptyImage)
{
	EXPECT_TRUE(sample_indices(0, MAX_SAMPLES).empty());
}

TEST(Sampler_test, StrideIsFloorOfRatio)
{
	std::vector<size_t> indices = sample_indices(100000, 50000);
	ASSERT_EQ(50000u, indices.size());
	EXPECT_EQ(0u, indices[0]);
	EXPECT_EQ(2u, indices[1]);

	// stride 2 again, so more samples than the cap
	indices = sample_indices(120000, 50000);
	EXPECT_EQ(60000u, indices.size());
	EXPECT_EQ(119998u, indices.back());
}

TEST(Sampler_test, SampleSetPrecomputesColors)
{
	std::vector<rgb_pixel> pixels;
	pixels.push_back(rgb_pixel(255, 0, 0, 255));
	pixels.push_back(rgb_pixel(0, 0, 255, 128));

	sample_set samples;
	sample_set_init(&samples, &pixels[0], pixels.size());
	ASSERT_EQ(2u, samples.index.size());
	EXPECT_EQ(color_key(pixels[1]), samples.key[1]);
	EXPECT_DOUBLE_EQ(rgb2lab(pixels[0]).l, samples.lab[0].l);
}
