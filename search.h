#pragma once

#include <vector>

#include "lossypng.h"
#include "pam.h"
#include "sample.h"
#include "metric.h"
#include "quantizer.h"

/**
 Scores a candidate palette size. Lower is better; the search assumes
 the score does not grow as the size grows.
 */
class palette_metric {
public:
	virtual ~palette_metric() {}
	virtual lossypng_error evaluate(unsigned int colors, double* metric) = 0;
};

struct search_result {
	unsigned int colors;	/* chosen palette size */
	unsigned int steps;		/* metric evaluations */
	double metric;			/* score of the chosen size, -1 if it was never scored */
};

lossypng_error validate_budget(double budget);

/**
 Smallest size in [lo, hi] whose metric is within budget, or hi when none is.
 hi itself is never scored.
 */
lossypng_error bisect_palette_size(
	palette_metric& metric,
	unsigned int lo, unsigned int hi,
	double budget,
	search_result* result
	);

/* no-dither re-quantization at each candidate size, scored by palette_p95_delta_e */
class requantize_metric : public palette_metric {
public:
	requantize_metric(
		const rgb_pixel* pixels, size_t width, size_t height,
		optimizer_kind optimizer,
		const sample_set& samples
		);

	virtual lossypng_error evaluate(unsigned int colors, double* metric);

	/* image produced by the last evaluate() */
	const quantized_image& last_image() const { return quantized_; }

private:
	const rgb_pixel* pixels_;
	size_t width_, height_;
	optimizer_kind optimizer_;
	const sample_set& samples_;
	color_error_map color_max_de_;
	quantized_image quantized_;
	std::vector<rgb_pixel> expanded_;
};

/**
 Quantizes to the fewest colors whose no-dither result stays within budget (Delta E),
 then re-quantizes at that size with the requested ditherer.
 When the search ends on its unscored upper bound, result->metric is the 256-color score.
 A zero budget skips the search when the distinct colors fit: the palette holds exactly those.
 */
lossypng_error lossy_search(
	const rgb_pixel* pixels, size_t width, size_t height,
	double budget,
	optimizer_kind optimizer, ditherer_kind ditherer,
	bool tight_bound,
	quantized_image* output,
	search_result* result
	);
