#pragma once

#include <vector>
#include "pam.h"

enum floyd_kernel {
	FLOYD_EDGE_AWARE,	/* serpentine, strength from edge map */
	FLOYD_VANILLA,		/* classic 7/3/5/1, full strength */
	FLOYD_CHECKERED,	/* kernel alternates on a checkerboard */
};

double remap_to_palette(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map
	);

void remap_to_palette_ordered(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map
	);

void remap_to_palette_floyd(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map,
	const double* edge_map,
	floyd_kernel kernel
	);

void update_dither_map(
	const unsigned char* indexed, size_t width, size_t height,
	double* edges
	);
