#pragma once

#include <vector>
#include <stdint.h>

#include "pam.h"

/* solid image */
static inline
std::vector<rgb_pixel> solid_image(size_t count, rgb_pixel color)
{
	return std::vector<rgb_pixel>(count, color);
}

/* each pixel a different color, as long as count stays below 2^24 */
static inline
std::vector<rgb_pixel> gradient_image(size_t width, size_t height)
{
	std::vector<rgb_pixel> pixels(width * height);
	for (size_t y=0; y<height; ++y) {
		for (size_t x=0; x<width; ++x) {
			const size_t i = y * width + x;
			pixels[i] = rgb_pixel((x * 255) / max<size_t>(1, width - 1), (y * 255) / max<size_t>(1, height - 1), (i * 37) & 0xFF, 255);
		}
	}
	return pixels;
}

/* colors repeated in stripes of stripe pixels */
static inline
std::vector<rgb_pixel> palette_image(size_t count, const std::vector<rgb_pixel>& colors, size_t stripe)
{
	std::vector<rgb_pixel> pixels(count);
	for (size_t i=0; i<count; ++i) {
		pixels[i] = colors[(i / stripe) % colors.size()];
	}
	return pixels;
}

static inline
std::vector<rgb_pixel> primary_colors()
{
	std::vector<rgb_pixel> colors;
	colors.push_back(rgb_pixel(255, 0, 0, 255));
	colors.push_back(rgb_pixel(0, 255, 0, 255));
	colors.push_back(rgb_pixel(0, 0, 255, 255));
	colors.push_back(rgb_pixel(255, 255, 255, 255));
	return colors;
}
