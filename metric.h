#pragma once

#include <vector>
#include <unordered_map>

#include "pam.h"
#include "sample.h"

#define METRIC_PERCENTILE 0.95

/* worst Delta E seen per original color; scratch reused across search steps */
typedef std::unordered_map<uint32_t, double> color_error_map;

/**
 95th percentile, over distinct original colors, of each color's worst Delta E against candidate.
 A large uniform area counts as one color no matter how many pixels it covers.
 color_max_de is cleared on entry. 0 when there are no samples.
 */
double palette_p95_delta_e(
	const sample_set& samples,
	const rgb_pixel* candidate,
	color_error_map& color_max_de
	);

/* value at rank ceil(percentile*count)-1 of the ascending order; 0 for no values */
double percentile(std::vector<double>& values, double fraction);

/**
 Worst Delta E any of entries[retained..] suffers when replaced by its nearest entry in entries[0..retained).
 Fills nearest (one index per entry, identity for retained ones) when not NULL.
 */
double worst_pruned_delta_e(
	const std::vector<lab_color>& entries,
	size_t retained,
	std::vector<unsigned int>* nearest
	);
