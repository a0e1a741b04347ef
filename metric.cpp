#include "metric.h"

#include <algorithm>

double percentile(std::vector<double>& values, double fraction)
{
	if (values.empty()) {
		return 0;
	}
	std::sort(values.begin(), values.end());
	size_t rank = (size_t)ceil(values.size() * fraction);
	rank = rank ? rank - 1 : 0;
	return values[min(rank, values.size() - 1)];
}

double palette_p95_delta_e(
	const sample_set& samples,
	const rgb_pixel* candidate,
	color_error_map& color_max_de
	)
{
	color_max_de.clear();

	// candidates are palette colors, so most lookups repeat the previous one
	uint32_t last_key = 0;
	lab_color last_lab = rgb2lab(rgb_pixel(0,0,0,0));

	for (size_t j=0; j<samples.index.size(); ++j) {
		const rgb_pixel px = candidate[samples.index[j]];
		const uint32_t key = color_key(px);
		if (key != last_key) {
			last_key = key;
			last_lab = rgb2lab(px);
		}

		const double de = delta_e(samples.lab[j], last_lab);
		std::pair<color_error_map::iterator, bool> entry = color_max_de.insert(std::make_pair(samples.key[j], de));
		if (!entry.second && de > entry.first->second) {
			entry.first->second = de;
		}
	}

	std::vector<double> des;
	des.reserve(color_max_de.size());
	for (color_error_map::const_iterator it = color_max_de.begin(); it != color_max_de.end(); ++it) {
		des.push_back(it->second);
	}
	return percentile(des, METRIC_PERCENTILE);
}

double worst_pruned_delta_e(
	const std::vector<lab_color>& entries,
	size_t retained,
	std::vector<unsigned int>* nearest
	)
{
	assert(retained >= 1 || entries.empty());
	retained = min(retained, entries.size());

	if (nearest) {
		nearest->resize(entries.size());
		for (size_t i=0; i<retained; ++i) {
			(*nearest)[i] = i;
		}
	}

	double worst = 0;
	for (size_t i=retained; i<entries.size(); ++i) {
		unsigned int best = 0;
		double best_de = delta_e(entries[i], entries[0]);
		for (size_t k=1; k<retained; ++k) {
			double de = delta_e(entries[i], entries[k]);
			if (de < best_de) {
				best_de = de;
				best = k;
			}
		}
		if (nearest) (*nearest)[i] = best;
		worst = max(worst, best_de);
	}
	return worst;
}
