#pragma once

#include <vector>
#include "pam.h"

struct viter_state {
	f_pixel color;
	double total;
};

typedef void (*viter_callback)(hist_item* item, double diff);

void viter_init(
	const std::vector<colormap_item>& map,
	viter_state state[]
);

void viter_update_color(
	const f_pixel acolor,
	const double value,
	const std::vector<colormap_item>& map,
	int match,
	viter_state state[]
);

void viter_finalize(
	std::vector<colormap_item>& map,
	const viter_state state[]
);

double viter_do_iteration(
	std::vector<hist_item>& hist,
	std::vector<colormap_item>& map,
	viter_callback callback
);
