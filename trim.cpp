#include "trim.h"

#include <stdio.h>
#include <math.h>
#include <algorithm>

#include "metric.h"

lossypng_error validate_fraction(double lossy_fraction)
{
	if (!isfinite(lossy_fraction) || lossy_fraction < 0 || lossy_fraction > 1) {
		fprintf(stderr, "  error:  lossy fraction must be between 0 and 1, got %g\n", lossy_fraction);
		return INVALID_ARGUMENT;
	}
	return SUCCESS;
}

struct compare_frequency {
	compare_frequency(const std::vector<size_t>& frequency) : frequency(frequency) {}

	bool operator()(unsigned int a, unsigned int b) const
	{
		return frequency[a] > frequency[b];
	}

	const std::vector<size_t>& frequency;
};

std::vector<unsigned int> frequency_order(const std::vector<size_t>& frequency)
{
	std::vector<unsigned int> order;
	for (size_t i=0; i<frequency.size(); ++i) {
		if (frequency[i]) order.push_back(i);
	}
	std::stable_sort(order.begin(), order.end(), compare_frequency(frequency));
	return order;
}

size_t coverage_count(const std::vector<size_t>& sorted_frequency, size_t total, double lossy_fraction)
{
	// counted in whole pixels so fractions like 0.7 do not overshoot by one entry
	const double allowed = lossy_fraction * total;
	const size_t dropped = min<size_t>(total, (size_t)floor(allowed + allowed * 1e-12));
	const size_t target = total - dropped;
	size_t covered = 0;
	size_t count = 0;
	while (count < sorted_frequency.size()) {
		covered += sorted_frequency[count++];
		if (covered >= target) {
			break;
		}
	}
	return max<size_t>(1, count);
}

static inline
int rgba_distance(const rgb_pixel& p, const rgb_pixel& q)
{
	const int dr = p.r - q.r;
	const int dg = p.g - q.g;
	const int db = p.b - q.b;
	const int da = p.a - q.a;
	return dr*dr + dg*dg + db*db + da*da;
}

/**
 Writes the kept entries (order[0..kept)) as the new palette and
 sends every pixel through mapping, which is indexed by order position.
 */
static
void apply_mapping(
	const quantized_image& source,
	const std::vector<unsigned int>& order, size_t kept,
	const std::vector<unsigned int>& mapping,
	quantized_image* output
	)
{
	std::vector<unsigned char> remap(source.palette.size(), 0);
	for (size_t i=0; i<order.size(); ++i) {
		remap[order[i]] = mapping[i];
	}

	output->width = source.width;
	output->height = source.height;
	output->palette.resize(kept);
	for (size_t i=0; i<kept; ++i) {
		output->palette[i] = source.palette[order[i]];
	}
	output->indexed.resize(source.indexed.size());
	for (size_t i=0; i<source.indexed.size(); ++i) {
		output->indexed[i] = remap[source.indexed[i]];
	}
}

/* an image without pixels keeps its first entry */
static
void copy_first_entry(const quantized_image& source, quantized_image* output)
{
	output->width = source.width;
	output->height = source.height;
	output->palette.assign(1, source.palette.empty() ? rgb_pixel(0,0,0,0) : source.palette[0]);
	output->indexed.clear();
}

lossypng_error coverage_remap(const quantized_image& source, double lossy_fraction, quantized_image* output)
{
	lossypng_error retval = validate_fraction(lossy_fraction);
	if (retval) {
		return retval;
	}

	const std::vector<size_t> frequency = palette_frequency(source);
	const std::vector<unsigned int> order = frequency_order(frequency);
	if (order.empty()) {
		copy_first_entry(source, output);
		return SUCCESS;
	}

	std::vector<size_t> sorted_frequency(order.size());
	for (size_t i=0; i<order.size(); ++i) {
		sorted_frequency[i] = frequency[order[i]];
	}
	const size_t kept = coverage_count(sorted_frequency, source.indexed.size(), lossy_fraction);

	std::vector<unsigned int> mapping(order.size());
	for (size_t i=0; i<kept; ++i) {
		mapping[i] = i;
	}
	for (size_t i=kept; i<order.size(); ++i) {
		const rgb_pixel& px = source.palette[order[i]];
		unsigned int best = 0;
		int best_dist = rgba_distance(px, source.palette[order[0]]);
		for (size_t k=1; k<kept; ++k) {
			int dist = rgba_distance(px, source.palette[order[k]]);
			if (dist < best_dist) {
				best_dist = dist;
				best = k;
			}
		}
		mapping[i] = best;
	}

	apply_mapping(source, order, kept, mapping, output);
	verbose_printf("  kept %zu of %zu colors covering %.1f%% of pixels\n",
		kept, order.size(), 100.0 * (1.0 - lossy_fraction));
	return SUCCESS;
}

/* worst Delta E of the dropped entries when the first `colors` of a frequency ordering are kept */
class prune_metric : public palette_metric {
public:
	prune_metric(const std::vector<lab_color>& entries) : entries_(entries) {}

	virtual lossypng_error evaluate(unsigned int colors, double* metric)
	{
		*metric = worst_pruned_delta_e(entries_, colors, NULL);
		return SUCCESS;
	}

private:
	const std::vector<lab_color>& entries_;
};

lossypng_error prune_remap(const quantized_image& source, double budget, quantized_image* output, search_result* result)
{
	lossypng_error retval = validate_budget(budget);
	if (retval) {
		return retval;
	}

	const std::vector<unsigned int> order = frequency_order(palette_frequency(source));
	if (order.empty()) {
		copy_first_entry(source, output);
		result->colors = 1;
		result->steps = 0;
		result->metric = 0;
		return SUCCESS;
	}

	std::vector<lab_color> entries(order.size());
	for (size_t i=0; i<order.size(); ++i) {
		entries[i] = rgb2lab(source.palette[order[i]]);
	}

	// keeping every used entry is always exact
	prune_metric metric(entries);
	retval = bisect_palette_size(metric, 1, order.size(), budget, result);
	if (retval) {
		return retval;
	}
	if (result->metric < 0) {
		result->metric = 0;
	}

	std::vector<unsigned int> mapping;
	worst_pruned_delta_e(entries, result->colors, &mapping);
	apply_mapping(source, order, result->colors, mapping, output);
	verbose_printf("  kept %u of %zu colors, worst dE=%.3f\n", result->colors, order.size(), result->metric);
	return SUCCESS;
}

lossypng_error lossy_coverage(
	const rgb_pixel* pixels, size_t width, size_t height,
	double lossy_fraction,
	optimizer_kind optimizer, ditherer_kind ditherer,
	quantized_image* output,
	search_result* result
	)
{
	lossypng_error retval = validate_fraction(lossy_fraction);
	if (retval) {
		return retval;
	}

	quantized_image full;
	retval = quantize_image(pixels, width, height, MAX_PALETTE_SIZE, optimizer, ditherer, &full);
	if (retval) {
		fprintf(stderr, "  error:  quantizing to %d colors failed: %s\n", MAX_PALETTE_SIZE, lossypng_strerror(retval));
		return retval;
	}

	retval = coverage_remap(full, lossy_fraction, output);
	if (retval) {
		return retval;
	}
	result->colors = output->palette.size();
	result->steps = 0;
	result->metric = -1;
	return SUCCESS;
}

lossypng_error lossy_prune(
	const rgb_pixel* pixels, size_t width, size_t height,
	double budget,
	optimizer_kind optimizer, ditherer_kind ditherer,
	quantized_image* output,
	search_result* result
	)
{
	lossypng_error retval = validate_budget(budget);
	if (retval) {
		return retval;
	}

	quantized_image full;
	retval = quantize_image(pixels, width, height, MAX_PALETTE_SIZE, optimizer, ditherer, &full);
	if (retval) {
		fprintf(stderr, "  error:  quantizing to %d colors failed: %s\n", MAX_PALETTE_SIZE, lossypng_strerror(retval));
		return retval;
	}

	return prune_remap(full, budget, output, result);
}
