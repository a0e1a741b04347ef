#include "remap.h"

#include <stddef.h>
#include <string.h>
#include <algorithm>

double remap_to_palette(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map
	)
{
	const size_t pixel_count = width * height;
	double remapping_error = 0;

	for (size_t i=0; i<pixel_count; ++i) {
		double diff;
		indexed[i] = best_color_index(map, input[i], &diff);
		remapping_error += diff;
	}
	return remapping_error / max<size_t>(1, pixel_count);
}

static const int bayer4x4[4][4] = {
	{ 0,  8,  2, 10},
	{12,  4, 14,  6},
	{ 3, 11,  1,  9},
	{15,  7, 13,  5},
};

static inline
double colordot(const f_pixel& p, const f_pixel& q)
{
	return p.alpha * q.alpha * 3.0 + p.r * q.r + p.g * q.g + p.b * q.b;
}

/**
 Mixes the nearest entry with the entry on the far side of the pixel's error,
 in proportion to where the pixel lies between them. Exact matches never move.
 */
void remap_to_palette_ordered(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map
	)
{
	for (size_t y=0; y<height; ++y) {
		const f_pixel* pLine = &input[y*width];
		unsigned char* output_row = &indexed[y*width];
		for (size_t x=0; x<width; ++x) {
			const f_pixel px = pLine[x];
			double diff;
			int nearest = best_color_index(map, px, &diff);
			output_row[x] = nearest;
			if (diff == 0) {
				continue;
			}

			const f_pixel err = px - map[nearest].acolor;
			int other = best_color_index(map, px + err, NULL);
			if (other == nearest) {
				continue;
			}

			const f_pixel span = map[other].acolor - map[nearest].acolor;
			const double len = colordot(span, span);
			if (len <= 0) {
				continue;
			}
			const double mix = limitValue(colordot(err, span) / len, 0.0, 1.0);
			const double threshold = (bayer4x4[y & 3][x & 3] + 0.5) / 16.0;
			if (threshold < mix) {
				output_row[x] = other;
			}
		}
	}
}

static inline
f_pixel clamp_pixel(f_pixel px)
{
	px.r = limitValue(px.r, 0.0, 1.0);
	px.g = limitValue(px.g, 0.0, 1.0);
	px.b = limitValue(px.b, 0.0, 1.0);
	px.alpha = limitValue(px.alpha, 0.0, 1.0);
	return px;
}

/**
  Uses edge/noise map to apply dithering only to flat areas. Dithering on edges creates jagged lines, and noisy areas are "naturally" dithered.
 */
static
void remap_floyd_edge_aware(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map,
	const double* edge_map
	)
{
	std::vector<f_pixel> thiserrVec(width + 2);
	std::vector<f_pixel> nexterrVec(width + 2);
	f_pixel* thiserr = &thiserrVec[0];
	f_pixel* nexterr = &nexterrVec[0];
	bool fs_direction = true;

	const f_pixel* pInputLine = input;
	for (size_t y=0; y<height; ++y) {
		std::fill(nexterr, nexterr + width + 2, f_pixel(0,0,0,0));

		ptrdiff_t x = fs_direction ? 0 : (ptrdiff_t)width - 1;
		unsigned char* output_row = &indexed[y*width];
		const double* pEdge = &edge_map[y*width];
		do {
			f_pixel px = pInputLine[x];
			if (px.alpha == 0) {
				// nothing to diffuse into or out of a fully transparent pixel
				output_row[x] = best_color_index(map, px, NULL);
			}else {
				double dither_level = min(0.9, 0.4 + pEdge[x]);

				/* Use Floyd-Steinberg errors to adjust actual color. */
				f_pixel tmp = clamp_pixel(px + thiserr[x + 1] * dither_level);
				int ind = best_color_index(map, tmp, NULL);
				output_row[x] = ind;

				f_pixel err = tmp - map[ind].acolor;

				// If dithering error is crazy high, don't propagate it that much
				// This prevents crazy geen pixels popping out of the blue (or red or black! ;)
				if (err.r*err.r + err.g*err.g + err.b*err.b + err.alpha*err.alpha > 8.0/256.0) {
					dither_level *= 0.5;
				}
				double colorimp = (3.0 + map[ind].acolor.alpha)/4.0 * dither_level;
				err.r *= colorimp;
				err.g *= colorimp;
				err.b *= colorimp;
				err.alpha *= dither_level;

				// changed kernel after reading the paper : Reinstating FloydSteinberg: Improved Metrics for Quality Assessment of Error Diffusion Algorithms (Sam Hocevar, Gary Niger)
				/* Propagate Floyd-Steinberg error terms. */
				if (fs_direction) {
					thiserr[x + 2] += err * 7.0 / 16.0;
					nexterr[x + 0] += err * 4.0 / 16.0;
					nexterr[x + 1] += err * 5.0 / 16.0;
				}else {
					thiserr[x + 0] += err * 7.0 / 16.0;
					nexterr[x + 1] += err * 5.0 / 16.0;
					nexterr[x + 2] += err * 4.0 / 16.0;
				}
			}

			if (fs_direction) {
				++x;
				if (x >= (ptrdiff_t)width) break;
			}else {
				--x;
				if (x < 0) break;
			}
		}while (1);
		std::swap(thiserr, nexterr);
		fs_direction = !fs_direction;

		pInputLine += width;
	}
}

/* right, below-left, below, below-right; sixteenths */
static const double vanilla_kernel[4] = {7.0, 3.0, 5.0, 1.0};
static const double vertical_kernel[4] = {3.0, 5.0, 7.0, 1.0};

static
void remap_floyd_classic(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map,
	bool checkered
	)
{
	std::vector<f_pixel> thiserrVec(width + 2);
	std::vector<f_pixel> nexterrVec(width + 2);
	f_pixel* thiserr = &thiserrVec[0];
	f_pixel* nexterr = &nexterrVec[0];

	for (size_t y=0; y<height; ++y) {
		std::fill(nexterr, nexterr + width + 2, f_pixel(0,0,0,0));

		const f_pixel* pInputLine = &input[y*width];
		unsigned char* output_row = &indexed[y*width];
		for (size_t x=0; x<width; ++x) {
			const f_pixel px = pInputLine[x];
			if (px.alpha == 0) {
				output_row[x] = best_color_index(map, px, NULL);
				continue;
			}

			f_pixel tmp = clamp_pixel(px + thiserr[x + 1]);
			int ind = best_color_index(map, tmp, NULL);
			output_row[x] = ind;

			const f_pixel err = tmp - map[ind].acolor;
			const double* k = (checkered && ((x + y) & 1)) ? vertical_kernel : vanilla_kernel;
			thiserr[x + 2] += err * k[0] / 16.0;
			nexterr[x + 0] += err * k[1] / 16.0;
			nexterr[x + 1] += err * k[2] / 16.0;
			nexterr[x + 2] += err * k[3] / 16.0;
		}
		std::swap(thiserr, nexterr);
	}
}

void remap_to_palette_floyd(
	const f_pixel* input, size_t width, size_t height,
	unsigned char* indexed,
	const std::vector<colormap_item>& map,
	const double* edge_map,
	floyd_kernel kernel
	)
{
	if (!width || !height) return;

	switch (kernel) {
	case FLOYD_EDGE_AWARE:
		assert(edge_map);
		remap_floyd_edge_aware(input, width, height, indexed, map, edge_map);
		break;
	case FLOYD_VANILLA:
		remap_floyd_classic(input, width, height, indexed, map, false);
		break;
	case FLOYD_CHECKERED:
		remap_floyd_classic(input, width, height, indexed, map, true);
		break;
	}
}

/**
 * Builds map of neighbor pixels mapped to the same palette entry
 *
 * For efficiency/simplicity it mainly looks for same consecutive pixels horizontally
 * and peeks 1 pixel above/below. Full 2d algorithm doesn't improve it significantly.
 * Correct flood fill doesn't have visually good properties.
 */
void update_dither_map(const unsigned char* pixels, size_t width, size_t height, double* edges)
{
	for (size_t row=0; row<height; ++row) {
		unsigned char lastpixel = pixels[row*width];
		size_t lastcol = 0;
		double* pEdge = &edges[row*width];
		const unsigned char* pLine = &pixels[row*width];
		const unsigned char* pPrevLine = row > 0 ? &pixels[(row-1)*width] : NULL;
		const unsigned char* pNextLine = row < height-1 ? &pixels[(row+1)*width] : NULL;
		for (size_t col=1; col<width; ++col) {
			unsigned char px = pLine[col];
			if (px != lastpixel || col == width-1) {
				double neighbor_count = 3.0 + col - lastcol;
				for (size_t i=lastcol; i<col; ++i) {
					if (pPrevLine && pPrevLine[i] == lastpixel) neighbor_count += 1.0;
					if (pNextLine && pNextLine[i] == lastpixel) neighbor_count += 1.0;
				}
				while (lastcol < col) {
					pEdge[lastcol++] *= 1.0 - 3.0/neighbor_count;
				}
				lastpixel = px;
			}
		}
	}
}
