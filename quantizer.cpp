#include "quantizer.h"

#include <stdio.h>
#include <string.h>
#include <algorithm>
#include <new>
#include <set>

#include "mediancut.h"
#include "viter.h"
#include "remap.h"
#include "blur.h"

#define KMEANS_MAX_ITERATIONS 10

static const struct { const char* name; optimizer_kind kind; } optimizer_names[] = {
	{"none", OPTIMIZER_NONE},
	{"kmeans", OPTIMIZER_KMEANS},
	{"k-means", OPTIMIZER_KMEANS},
	{"weighted-kmeans", OPTIMIZER_WEIGHTED_KMEANS},
	{"weighted-k-means", OPTIMIZER_WEIGHTED_KMEANS},
};

static const struct { const char* name; ditherer_kind kind; } ditherer_names[] = {
	{"none", DITHERER_NONE},
	{"ordered", DITHERER_ORDERED},
	{"floyd-steinberg", DITHERER_FLOYD},
	{"floyd", DITHERER_FLOYD},
	{"fs", DITHERER_FLOYD},
	{"floyd-steinberg-vanilla", DITHERER_FLOYD_VANILLA},
	{"vanilla", DITHERER_FLOYD_VANILLA},
	{"floyd-steinberg-checkered", DITHERER_FLOYD_CHECKERED},
	{"checkered", DITHERER_FLOYD_CHECKERED},
};

lossypng_error parse_optimizer(const char* name, optimizer_kind* optimizer)
{
	for (size_t i=0; i<sizeof(optimizer_names)/sizeof(optimizer_names[0]); ++i) {
		if (0 == strcmp(name, optimizer_names[i].name)) {
			*optimizer = optimizer_names[i].kind;
			return SUCCESS;
		}
	}
	return UNKNOWN_OPTION;
}

lossypng_error parse_ditherer(const char* name, ditherer_kind* ditherer)
{
	for (size_t i=0; i<sizeof(ditherer_names)/sizeof(ditherer_names[0]); ++i) {
		if (0 == strcmp(name, ditherer_names[i].name)) {
			*ditherer = ditherer_names[i].kind;
			return SUCCESS;
		}
	}
	return UNKNOWN_OPTION;
}

const char* optimizer_name(optimizer_kind optimizer)
{
	switch (optimizer) {
	case OPTIMIZER_NONE: return "none";
	case OPTIMIZER_KMEANS: return "k-means";
	case OPTIMIZER_WEIGHTED_KMEANS: return "weighted-k-means";
	}
	return "unknown";
}

const char* ditherer_name(ditherer_kind ditherer)
{
	switch (ditherer) {
	case DITHERER_NONE: return "none";
	case DITHERER_ORDERED: return "ordered";
	case DITHERER_FLOYD: return "floyd-steinberg";
	case DITHERER_FLOYD_VANILLA: return "floyd-steinberg-vanilla";
	case DITHERER_FLOYD_CHECKERED: return "floyd-steinberg-checkered";
	}
	return "unknown";
}

/* colors that are badly represented get more weight in the next iteration */
static
void adjust_weight(hist_item* item, double diff)
{
	item->adjusted_weight = item->perceptual_weight * (1.0 + sqrt(diff));
}

static
void optimize_palette(optimizer_kind optimizer, std::vector<hist_item>& hist, std::vector<colormap_item>& map)
{
	if (optimizer == OPTIMIZER_NONE) {
		return;
	}

	viter_callback callback = optimizer == OPTIMIZER_WEIGHTED_KMEANS ? adjust_weight : NULL;
	double previous_error = -1;
	for (int i=0; i<KMEANS_MAX_ITERATIONS; ++i) {
		double error = viter_do_iteration(hist, map, callback);
		if (previous_error >= 0 && error >= previous_error * (1.0 - 1e-6)) {
			break;
		}
		previous_error = error;
	}
}

static inline
bool compare_popularity(const colormap_item& v1, const colormap_item& v2)
{
	return v1.popularity > v2.popularity;
}

static inline
bool is_transparent(const colormap_item& pal)
{
	return pal.acolor.alpha < 255.0/256.0;
}

static
void sort_palette(std::vector<colormap_item>& map)
{
	/* move transparent colors to the beginning to shrink trns chunk */
	std::vector<colormap_item>::iterator first_opaque = std::stable_partition(map.begin(), map.end(), is_transparent);

	/* colors sorted by popularity make pngs slightly more compressible
	 * opaque and transparent are sorted separately
	 */
	std::stable_sort(map.begin(), first_opaque, compare_popularity);
	std::stable_sort(first_opaque, map.end(), compare_popularity);
}

static
void dither_image(
	ditherer_kind ditherer,
	const std::vector<f_pixel>& input, size_t width, size_t height,
	const std::vector<colormap_item>& map,
	unsigned char* indexed
	)
{
	switch (ditherer) {
	case DITHERER_NONE:
		remap_to_palette(&input[0], width, height, indexed, map);
		break;
	case DITHERER_ORDERED:
		remap_to_palette_ordered(&input[0], width, height, indexed, map);
		break;
	case DITHERER_FLOYD: {
		std::vector<double> noise(width * height);
		std::vector<double> edges(width * height);
		contrast_maps(&input[0], width, height, &noise[0], &edges[0]);

		// If dithering (with dither map) is required, this image is used to find areas that require dithering
		remap_to_palette(&input[0], width, height, indexed, map);
		update_dither_map(indexed, width, height, &edges[0]);
		remap_to_palette_floyd(&input[0], width, height, indexed, map, &edges[0], FLOYD_EDGE_AWARE);
		break;
	}
	case DITHERER_FLOYD_VANILLA:
		remap_to_palette_floyd(&input[0], width, height, indexed, map, NULL, FLOYD_VANILLA);
		break;
	case DITHERER_FLOYD_CHECKERED:
		remap_to_palette_floyd(&input[0], width, height, indexed, map, NULL, FLOYD_CHECKERED);
		break;
	}
}

lossypng_error quantize_image(
	const rgb_pixel* pixels, size_t width, size_t height,
	unsigned int reqcolors,
	optimizer_kind optimizer, ditherer_kind ditherer,
	quantized_image* output
	)
{
	if (reqcolors < 1 || reqcolors > MAX_PALETTE_SIZE) {
		fprintf(stderr, "  error:  cannot quantize to %u colors (must be 1-%d)\n", reqcolors, MAX_PALETTE_SIZE);
		return INVALID_ARGUMENT;
	}
	if (!pixels && width * height) {
		fputs("  error:  quantize_image() called without pixels\n", stderr);
		return QUANTIZATION_ERROR;
	}

	try {
		const size_t pixel_count = width * height;
		std::vector<hist_item> hist = pam_computeacolorhist(pixels, pixel_count);

		std::vector<colormap_item> acolormap = mediancut(hist, reqcolors);
		optimize_palette(optimizer, hist, acolormap);
		sort_palette(acolormap);

		output->width = width;
		output->height = height;
		output->palette.resize(acolormap.size());
		for (size_t i=0; i<acolormap.size(); ++i) {
			output->palette[i] = to_rgb(acolormap[i].acolor);
			// remap against the 8-bit colors that will actually be written
			acolormap[i].acolor = to_f(output->palette[i]);
		}

		output->indexed.assign(pixel_count, 0);
		if (!pixel_count) {
			return SUCCESS;
		}

		std::vector<f_pixel> input(pixel_count);
		for (size_t i=0; i<pixel_count; ++i) {
			input[i] = to_f(pixels[i]);
		}
		dither_image(ditherer, input, width, height, acolormap, &output->indexed[0]);
	}catch (const std::bad_alloc&) {
		fprintf(stderr, "  error:  insufficient memory to quantize %zux%zu image\n", width, height);
		return OUT_OF_MEMORY_ERROR;
	}

	return SUCCESS;
}

void expand_indexed(const quantized_image& image, std::vector<rgb_pixel>* pixels)
{
	pixels->resize(image.indexed.size());
	for (size_t i=0; i<image.indexed.size(); ++i) {
		(*pixels)[i] = image.palette[image.indexed[i]];
	}
}

std::vector<size_t> palette_frequency(const quantized_image& image)
{
	std::vector<size_t> frequency(image.palette.size());
	for (size_t i=0; i<image.indexed.size(); ++i) {
		++frequency[image.indexed[i]];
	}
	return frequency;
}

size_t count_used_colors(const quantized_image& image)
{
	std::vector<size_t> frequency = palette_frequency(image);
	std::set<uint32_t> used;
	for (size_t i=0; i<frequency.size(); ++i) {
		if (frequency[i]) used.insert(color_key(image.palette[i]));
	}
	return used.size();
}
