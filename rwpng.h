#pragma once

#include <stdio.h>
#include <vector>

#include "lossypng.h"
#include "pam.h"

/* decoded image, always 8-bit RGBA */
struct read_info {
	size_t width;
	size_t height;
	std::vector<rgb_pixel> rgba_data;
	int interlace_type;		/* PNG_INTERLACE_NONE or PNG_INTERLACE_ADAM7 */
	bool has_gamma;
	double gamma;
	int srgb_intent;		/* -1 when the file has no sRGB chunk */
	size_t file_size;
};

struct write_info {
	size_t width;
	size_t height;

	/* indexed output: palette and one index per pixel */
	std::vector<rgb_pixel> palette;
	const unsigned char* indexed_data;

	/* truecolor output */
	const rgb_pixel* rgba_data;

	int compression_level;	/* zlib 0-9 */
	bool interlace;
	bool emit_color_chunks;	/* gAMA / sRGB */
	bool has_gamma;
	double gamma;
	int srgb_intent;
};

void write_info_init(write_info* info);

/* copies interlace and color rendering metadata of a decoded image */
void write_info_set_metadata(write_info* info, const read_info& source);

void rwpng_version_info(FILE* fp);

lossypng_error rwpng_read_image(FILE* infile, read_info* image);
lossypng_error rwpng_read_image_memory(const unsigned char* data, size_t size, read_info* image);

/* PLTE (+ tRNS up to the last entry that is not opaque), bit depth 1/2/4/8 from the palette size */
lossypng_error rwpng_write_image8(FILE* outfile, const write_info& image);
lossypng_error rwpng_write_image8_memory(std::vector<unsigned char>* out, const write_info& image);

/* RGBA, 8 bits per channel */
lossypng_error rwpng_write_image24(FILE* outfile, const write_info& image);
lossypng_error rwpng_write_image24_memory(std::vector<unsigned char>* out, const write_info& image);
