#include "pam.h"
#include "viter.h"
#include <assert.h>

/*
 * Voronoi iteration: new palette color is computed from weighted average of colors that map to that palette entry.
 */
void viter_init(
	const std::vector<colormap_item>& map,
	viter_state state[]
	)
{
	for (size_t i=0; i<map.size(); ++i) {
		state[i].color = f_pixel(0,0,0,0);
		state[i].total = 0;
	}
}

void viter_update_color(
	const f_pixel acolor,
	const double value,
	const std::vector<colormap_item>& map,
	int match,
	viter_state state[]
	)
{
	assert(match >= 0 && (size_t)match < map.size());
	state[match].color += acolor * value;
	state[match].total += value;
}

void viter_finalize(
	std::vector<colormap_item>& map,
	const viter_state state[]
	)
{
	for (size_t i=0; i<map.size(); i++) {
		colormap_item& pal = map[i];
		const viter_state& s = state[i];
		if (s.total) {
			pal.acolor = s.color / s.total;
		}
		pal.popularity = s.total;
	}
}

/**
 * Moves every palette entry to the centroid of histogram colors nearest to it, weighted by adjusted_weight.
 * Returns mean error weighted by perceptual_weight, measured against the palette before the move.
 */
double viter_do_iteration(
	std::vector<hist_item>& hist,
	std::vector<colormap_item>& map,
	viter_callback callback
	)
{
	std::vector<viter_state> average_color(map.size());
	viter_init(map, &average_color[0]);

	double total_diff = 0;
	double total_perceptual_weight = 0;
	for (size_t j=0; j<hist.size(); ++j) {
		hist_item& hi = hist[j];
		double diff;
		int match = best_color_index(map, hi.acolor, &diff);
		total_diff += diff * hi.perceptual_weight;
		total_perceptual_weight += hi.perceptual_weight;

		viter_update_color(hi.acolor, hi.adjusted_weight, map, match, &average_color[0]);

		if (callback) callback(&hi, diff);
	}
	viter_finalize(map, &average_color[0]);

	if (!total_perceptual_weight) return 0;
	return total_diff / total_perceptual_weight;
}
