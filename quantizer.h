#pragma once

#include <vector>

#include "lossypng.h"
#include "pam.h"

struct quantized_image {
	std::vector<rgb_pixel> palette;
	std::vector<unsigned char> indexed;
	size_t width, height;
};

lossypng_error parse_optimizer(const char* name, optimizer_kind* optimizer);
lossypng_error parse_ditherer(const char* name, ditherer_kind* ditherer);
const char* optimizer_name(optimizer_kind optimizer);
const char* ditherer_name(ditherer_kind ditherer);

/**
 Builds a palette of at most reqcolors (1..256) entries for width*height RGBA pixels
 and maps every pixel to it. Deterministic for equal inputs.
 */
lossypng_error quantize_image(
	const rgb_pixel* pixels, size_t width, size_t height,
	unsigned int reqcolors,
	optimizer_kind optimizer, ditherer_kind ditherer,
	quantized_image* output
	);

/* palette lookup of every index */
void expand_indexed(const quantized_image& image, std::vector<rgb_pixel>* pixels);

/* number of distinct palette entries actually referenced */
size_t count_used_colors(const quantized_image& image);

/* pixel count per palette entry */
std::vector<size_t> palette_frequency(const quantized_image& image);
