#include "search.h"

#include <stdio.h>
#include <new>

lossypng_error validate_budget(double budget)
{
	if (!isfinite(budget) || budget < 0) {
		fprintf(stderr, "  error:  Delta E threshold must be a finite number >= 0, got %g\n", budget);
		return INVALID_ARGUMENT;
	}
	return SUCCESS;
}

lossypng_error bisect_palette_size(
	palette_metric& metric,
	unsigned int lo, unsigned int hi,
	double budget,
	search_result* result
	)
{
	if (lo < 1 || lo > hi) {
		fprintf(stderr, "  error:  invalid palette size range %u-%u\n", lo, hi);
		return INVALID_ARGUMENT;
	}

	result->steps = 0;
	result->metric = -1;

	while (lo < hi) {
		const unsigned int mid = (lo + hi) / 2;
		double value;
		lossypng_error retval = metric.evaluate(mid, &value);
		++result->steps;
		if (retval) {
			return retval;
		}

		if (value <= budget) {
			verbose_printf("    %3u colors: dE=%.3f, within %.3f\n", mid, value, budget);
			hi = mid;
			result->metric = value;
		}else {
			verbose_printf("    %3u colors: dE=%.3f, over %.3f\n", mid, value, budget);
			lo = mid + 1;
		}
	}

	// the last size that passed is where lo and hi meet; if none passed, the upper bound was never scored
	result->colors = lo;
	return SUCCESS;
}

requantize_metric::requantize_metric(
	const rgb_pixel* pixels, size_t width, size_t height,
	optimizer_kind optimizer,
	const sample_set& samples
	)
	:
	pixels_(pixels),
	width_(width),
	height_(height),
	optimizer_(optimizer),
	samples_(samples)
{
	color_max_de_.reserve(samples.index.size());
}

lossypng_error requantize_metric::evaluate(unsigned int colors, double* metric)
{
	// dithering would break the one original color to one quantized color grouping
	lossypng_error retval = quantize_image(pixels_, width_, height_, colors, optimizer_, DITHERER_NONE, &quantized_);
	if (retval) {
		fprintf(stderr, "  error:  quantizing to %u colors failed: %s\n", colors, lossypng_strerror(retval));
		return retval;
	}

	expand_indexed(quantized_, &expanded_);
	*metric = palette_p95_delta_e(samples_, expanded_.empty() ? NULL : &expanded_[0], color_max_de_);
	return SUCCESS;
}

lossypng_error lossy_search(
	const rgb_pixel* pixels, size_t width, size_t height,
	double budget,
	optimizer_kind optimizer, ditherer_kind ditherer,
	bool tight_bound,
	quantized_image* output,
	search_result* result
	)
{
	lossypng_error retval = validate_budget(budget);
	if (retval) {
		return retval;
	}

	// zero means an exact palette whenever the distinct colors fit; p95 alone would merge up to 5% of them
	if (budget == 0) {
		size_t unique;
		try {
			unique = count_unique_colors(pixels, width * height);
		} catch (std::bad_alloc&) {
			fputs("  error:  out of memory counting colors\n", stderr);
			return OUT_OF_MEMORY_ERROR;
		}
		if (unique <= MAX_PALETTE_SIZE) {
			result->colors = max<size_t>(1, unique);
			result->steps = 0;
			result->metric = 0;
			verbose_printf("  %zu distinct colors fit the palette exactly\n", unique);
			retval = quantize_image(pixels, width, height, result->colors, optimizer, ditherer, output);
			if (retval) {
				fprintf(stderr, "  error:  exact quantization to %u colors failed: %s\n", result->colors, lossypng_strerror(retval));
			}
			return retval;
		}
	}

	sample_set samples;
	sample_set_init(&samples, pixels, width * height);
	verbose_printf("  sampling %zu of %zu pixels\n", samples.index.size(), width * height);

	requantize_metric metric(pixels, width, height, optimizer, samples);

	// 256 colors bound the search: if even they exceed the threshold, use them.
	// Otherwise the colors the 256-color result actually uses are a tighter bound.
	double metric256;
	retval = metric.evaluate(MAX_PALETTE_SIZE, &metric256);
	if (retval) {
		return retval;
	}

	unsigned int colors;
	if (metric256 > budget) {
		verbose_printf("  256 colors give dE=%.3f, over %.3f; keeping 256\n", metric256, budget);
		colors = MAX_PALETTE_SIZE;
		result->steps = 1;
		result->metric = metric256;
	}else {
		unsigned int hi = MAX_PALETTE_SIZE;
		if (tight_bound) {
			hi = max(1u, min<unsigned int>(MAX_PALETTE_SIZE, count_used_colors(metric.last_image())));
		}
		verbose_printf("  searching 1-%u colors for dE <= %.3f\n", hi, budget);

		retval = bisect_palette_size(metric, 1, hi, budget, result);
		if (retval) {
			return retval;
		}
		++result->steps;
		colors = result->colors;
		// the bound itself was not scored; the 256-color score stands in for it
		if (result->metric < 0) {
			result->metric = metric256;
		}
	}
	result->colors = colors;

	// the no-dither measurement above is the controlling bound; this one is not re-measured
	retval = quantize_image(pixels, width, height, colors, optimizer, ditherer, output);
	if (retval) {
		fprintf(stderr, "  error:  final quantization to %u colors failed: %s\n", colors, lossypng_strerror(retval));
		return retval;
	}

	verbose_printf("  selected %u colors after %u steps\n", colors, result->steps);
	return SUCCESS;
}
