#pragma once

#include <vector>

#include "lossypng.h"
#include "quantizer.h"
#include "search.h"

lossypng_error validate_fraction(double lossy_fraction);

/* used palette entries, most frequent first; ties keep palette order */
std::vector<unsigned int> frequency_order(const std::vector<size_t>& frequency);

/**
 Length of the shortest prefix of sorted_frequency whose sum reaches (1 - lossy_fraction) * total,
 at least 1.
 */
size_t coverage_count(const std::vector<size_t>& sorted_frequency, size_t total, double lossy_fraction);

/**
 Keeps the most frequent entries of source covering 1 - lossy_fraction of its pixels.
 Each dropped entry takes the kept color nearest in RGBA (first one on ties).
 */
lossypng_error coverage_remap(const quantized_image& source, double lossy_fraction, quantized_image* output);

/**
 Keeps the fewest most frequent entries of source such that no dropped entry is more than
 budget Delta E from its nearest kept one.
 */
lossypng_error prune_remap(const quantized_image& source, double budget, quantized_image* output, search_result* result);

/* quantize once at 256, then coverage_remap */
lossypng_error lossy_coverage(
	const rgb_pixel* pixels, size_t width, size_t height,
	double lossy_fraction,
	optimizer_kind optimizer, ditherer_kind ditherer,
	quantized_image* output,
	search_result* result
	);

/* quantize once at 256, then prune_remap */
lossypng_error lossy_prune(
	const rgb_pixel* pixels, size_t width, size_t height,
	double budget,
	optimizer_kind optimizer, ditherer_kind ditherer,
	quantized_image* output,
	search_result* result
	);
