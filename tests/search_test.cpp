#include <gtest/gtest.h>

#include <limits>

#include "search.h"
#include "test_images.h"

/* passes for sizes >= threshold; records every size it was asked about */
class step_metric : public palette_metric {
public:
	step_metric(unsigned int threshold) : threshold_(threshold) {}

	virtual lossypng_error evaluate(unsigned int colors, double* metric)
	{
		asked.push_back(colors);
		*metric = colors >= threshold_ ? 1.0 : 10.0;
		return SUCCESS;
	}

	std::vector<unsigned int> asked;

private:
	unsigned int threshold_;
};

class failing_metric : public palette_metric {
public:
	virtual lossypng_error evaluate(unsigned int colors, double* metric)
	{
		return QUANTIZATION_ERROR;
	}
};

TEST(Bisection_test, FindsSmallestPassingSize)
{
	for (unsigned int threshold=1; threshold<=40; ++threshold) {
		step_metric metric(threshold);
		search_result result;
		ASSERT_EQ(SUCCESS, bisect_palette_size(metric, 1, 40, 5.0, &result));
		EXPECT_EQ(threshold, result.colors);
		EXPECT_EQ(metric.asked.size(), result.steps);
		for (size_t i=0; i<metric.asked.size(); ++i) {
			EXPECT_GE(metric.asked[i], 1u);
			EXPECT_LT(metric.asked[i], 40u) << "upper bound should never be scored";
		}
	}
}

TEST(Bisection_test, FallsBackToUpperBound)
{
	step_metric metric(1000);
	search_result result;
	ASSERT_EQ(SUCCESS, bisect_palette_size(metric, 1, 256, 5.0, &result));
	EXPECT_EQ(256u, result.colors);
	EXPECT_EQ(-1.0, result.metric);
	EXPECT_EQ(8u, result.steps);
}

TEST(Bisection_test, SingleCandidateNeedsNoSteps)
{
	step_metric metric(1);
	search_result result;
	ASSERT_EQ(SUCCESS, bisect_palette_size(metric, 1, 1, 0.0, &result));
	EXPECT_EQ(1u, result.colors);
	EXPECT_EQ(0u, result.steps);
	EXPECT_TRUE(metric.asked.empty());
}

TEST(Bisection_test, PropagatesErrors)
{
	failing_metric metric;
	search_result result;
	EXPECT_EQ(QUANTIZATION_ERROR, bisect_palette_size(metric, 1, 256, 1.0, &result));
	EXPECT_EQ(INVALID_ARGUMENT, bisect_palette_size(metric, 0, 256, 1.0, &result));
	EXPECT_EQ(INVALID_ARGUMENT, bisect_palette_size(metric, 10, 5, 1.0, &result));
}

TEST(Budget_test, RejectsInvalidBudgets)
{
	EXPECT_EQ(SUCCESS, validate_budget(0.0));
	EXPECT_EQ(SUCCESS, validate_budget(2.5));
	EXPECT_EQ(INVALID_ARGUMENT, validate_budget(-0.1));
	EXPECT_EQ(INVALID_ARGUMENT, validate_budget(std::numeric_limits<double>::quiet_NaN()));
	EXPECT_EQ(INVALID_ARGUMENT, validate_budget(std::numeric_limits<double>::infinity()));
}

class LossySearch_test : public ::testing::Test {
protected:
	search_result search(const std::vector<rgb_pixel>& pixels, size_t width, size_t height, double budget, ditherer_kind ditherer = DITHERER_ORDERED)
	{
		search_result result;
		EXPECT_EQ(SUCCESS, lossy_search(&pixels[0], width, height, budget, OPTIMIZER_KMEANS, ditherer, true, &output_, &result));
		return result;
	}

	double measure(const std::vector<rgb_pixel>& pixels)
	{
		sample_set samples;
		sample_set_init(&samples, &pixels[0], pixels.size());
		std::vector<rgb_pixel> expanded;
		expand_indexed(output_, &expanded);
		color_error_map scratch;
		return palette_p95_delta_e(samples, &expanded[0], scratch);
	}

	quantized_image output_;
};

TEST_F(LossySearch_test, FourColorsAtZeroBudget)
{
	std::vector<rgb_pixel> pixels = primary_colors();
	search_result result = search(pixels, 2, 2, 0.0);
	EXPECT_EQ(4u, result.colors);
	EXPECT_EQ(4u, output_.palette.size());
	EXPECT_EQ(0.0, measure(pixels));
}

TEST_F(LossySearch_test, SingleColorImage)
{
	std::vector<rgb_pixel> pixels = solid_image(100 * 100, rgb_pixel(12, 34, 56, 255));
	const double budgets[] = {0.0, 1.0, 50.0};
	for (size_t i=0; i<sizeof(budgets)/sizeof(budgets[0]); ++i) {
		search_result result = search(pixels, 100, 100, budgets[i]);
		EXPECT_EQ(1u, result.colors);
		EXPECT_EQ(1u, output_.palette.size());
		EXPECT_EQ(rgb_pixel(12, 34, 56, 255), output_.palette[0]);
	}
}

TEST_F(LossySearch_test, RareColorKeepsItsEntry)
{
	const rgb_pixel white(255, 255, 255, 255);
	const rgb_pixel red(255, 0, 0, 255);
	std::vector<rgb_pixel> pixels = solid_image(100 * 100, white);
	for (size_t i=0; i<100; ++i) pixels[i * 100 + 50] = red;

	// one entry costs the red pixels far more than 1 Delta E
	search_result result = search(pixels, 100, 100, 1.0, DITHERER_NONE);
	EXPECT_EQ(2u, result.colors);
	EXPECT_LE(result.metric, 1.0);
	EXPECT_EQ(0.0, measure(pixels));
}

TEST_F(LossySearch_test, ConvergesToDistinctCount)
{
	std::vector<rgb_pixel> colors;
	for (int i=0; i<12; ++i) {
		colors.push_back(rgb_pixel(i * 20, 255 - i * 15, (i * 53) & 0xFF, 255));
	}
	std::vector<rgb_pixel> pixels = palette_image(30 * 20, colors, 7);
	search_result result = search(pixels, 30, 20, 0.0);
	EXPECT_EQ(12u, result.colors);
	EXPECT_EQ(0.0, result.metric);
}

TEST_F(LossySearch_test, ZeroBudgetKeepsEveryColorOfLargePalettes)
{
	// 150 colors: the 5% p95 tolerance alone would let several of them merge
	std::vector<rgb_pixel> colors;
	for (int i=0; i<150; ++i) {
		colors.push_back(rgb_pixel((i * 37) & 0xFF, (i * 91 + 13) & 0xFF, i, i % 3 ? 255 : 128));
	}
	std::vector<rgb_pixel> pixels = palette_image(64 * 64, colors, 3);

	const optimizer_kind optimizers[] = {OPTIMIZER_NONE, OPTIMIZER_KMEANS, OPTIMIZER_WEIGHTED_KMEANS};
	for (size_t o=0; o<sizeof(optimizers)/sizeof(optimizers[0]); ++o) {
		search_result result;
		ASSERT_EQ(SUCCESS, lossy_search(&pixels[0], 64, 64, 0.0, optimizers[o], DITHERER_FLOYD, true, &output_, &result));
		EXPECT_EQ(150u, result.colors) << optimizer_name(optimizers[o]);
		EXPECT_EQ(0.0, result.metric);

		std::vector<rgb_pixel> expanded;
		expand_indexed(output_, &expanded);
		EXPECT_TRUE(expanded == pixels) << optimizer_name(optimizers[o]);
	}
}

TEST_F(LossySearch_test, ResultStaysWithinBounds)
{
	std::vector<rgb_pixel> pixels = gradient_image(48, 48);
	const double budgets[] = {0.0, 2.0, 10.0, 1000.0};
	for (size_t i=0; i<sizeof(budgets)/sizeof(budgets[0]); ++i) {
		search_result result = search(pixels, 48, 48, budgets[i]);
		EXPECT_GE(result.colors, 1u);
		EXPECT_LE(result.colors, 256u);
		EXPECT_LE(output_.palette.size(), result.colors);
		if (result.metric >= 0 && result.colors < 256) {
			EXPECT_LE(result.metric, budgets[i]);
		}
	}
}

TEST_F(LossySearch_test, OverBudgetAt256KeepsAll)
{
	// 4096 distinct colors cannot fit 256 entries exactly
	std::vector<rgb_pixel> pixels = gradient_image(64, 64);
	search_result result = search(pixels, 64, 64, 0.0);
	EXPECT_EQ(256u, result.colors);
	EXPECT_EQ(1u, result.steps);
	EXPECT_GT(result.metric, 0.0);
}

TEST_F(LossySearch_test, LargeBudgetGivesOneColor)
{
	std::vector<rgb_pixel> pixels = gradient_image(32, 32);
	search_result result = search(pixels, 32, 32, 1000.0);
	EXPECT_EQ(1u, result.colors);
}

TEST_F(LossySearch_test, RejectsNegativeBudget)
{
	std::vector<rgb_pixel> pixels = primary_colors();
	search_result result;
	EXPECT_EQ(INVALID_ARGUMENT, lossy_search(&pixels[0], 2, 2, -1.0, OPTIMIZER_KMEANS, DITHERER_NONE, true, &output_, &result));
}
