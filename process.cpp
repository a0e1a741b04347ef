#include "process.h"

#include <stdio.h>
#include <new>

#include "trim.h"

int zlib_level(int level)
{
	static const int levels[] = {1, 3, 5, 6, 7, 8, 9};
	return levels[limitValue(level, 0, 6)];
}

void optimize_alpha(rgb_pixel* pixels, size_t count)
{
	for (size_t i=0; i<count; ++i) {
		if (!pixels[i].a) {
			pixels[i] = rgb_pixel(0,0,0,0);
		}
	}
}

lossypng_error lossy_quantize(
	const rgb_pixel* pixels, size_t width, size_t height,
	const lossypng_options& options,
	quantized_image* output,
	search_result* result
	)
{
	switch (options.mode) {
	case LOSSY_SEARCH:
		return lossy_search(pixels, width, height, options.lossy, options.optimizer, options.ditherer,
			options.tight_bound, output, result);
	case LOSSY_COVERAGE:
		return lossy_coverage(pixels, width, height, options.lossy, options.optimizer, options.ditherer,
			output, result);
	case LOSSY_PRUNE:
		return lossy_prune(pixels, width, height, options.lossy, options.optimizer, options.ditherer,
			output, result);
	}
	fprintf(stderr, "  error:  unknown lossy mode %d\n", (int)options.mode);
	return INVALID_ARGUMENT;
}

static
void setup_output(const read_info& input_image, const lossypng_options& options, write_info* output_image)
{
	write_info_init(output_image);
	write_info_set_metadata(output_image, input_image);
	output_image->width = input_image.width;
	output_image->height = input_image.height;
	output_image->compression_level = zlib_level(options.level);
	output_image->emit_color_chunks = options.strip == STRIP_SAFE;
	if (!options.interlace_keep) {
		output_image->interlace = false;
	}
}

/* palette encoding when the image has few enough colors, otherwise RGBA; the smaller wins */
static
lossypng_error encode_lossless(const read_info& input_image, write_info* output_image, std::vector<unsigned char>* encoded)
{
	const rgb_pixel* pixels = &input_image.rgba_data[0];
	const size_t pixel_count = input_image.width * input_image.height;

	output_image->rgba_data = pixels;
	lossypng_error retval = rwpng_write_image24_memory(encoded, *output_image);
	if (retval) {
		return retval;
	}

	size_t colors;
	try {
		colors = count_unique_colors(pixels, pixel_count);
	}catch (const std::bad_alloc&) {
		fputs("  error:  insufficient memory to count colors\n", stderr);
		return OUT_OF_MEMORY_ERROR;
	}
	if (colors > MAX_PALETTE_SIZE) {
		return SUCCESS;
	}

	// every color gets its own entry, so this is exact
	quantized_image exact;
	retval = quantize_image(pixels, input_image.width, input_image.height, max<size_t>(1, colors), OPTIMIZER_NONE, DITHERER_NONE, &exact);
	if (retval) {
		return retval;
	}

	std::vector<unsigned char> indexed;
	output_image->palette = exact.palette;
	output_image->indexed_data = &exact.indexed[0];
	retval = rwpng_write_image8_memory(&indexed, *output_image);
	if (retval) {
		return retval;
	}
	verbose_printf("  RGBA %zu bytes, %zu-color palette %zu bytes\n", encoded->size(), colors, indexed.size());
	if (indexed.size() < encoded->size()) {
		encoded->swap(indexed);
	}
	return SUCCESS;
}

lossypng_error process_image(
	const std::vector<unsigned char>& input,
	const lossypng_options& options,
	std::vector<unsigned char>* encoded,
	process_result* result
	)
{
	result->lossy = false;
	result->kept_input = false;
	result->search.colors = 0;
	result->search.steps = 0;
	result->search.metric = -1;

	lossypng_error retval = lossypng_options_validate(&options);
	if (retval) {
		return retval;
	}

	read_info input_image;
	retval = rwpng_read_image_memory(input.empty() ? NULL : &input[0], input.size(), &input_image);
	if (retval) {
		fprintf(stderr, "  error:  cannot decode PNG: %s\n", lossypng_strerror(retval));
		return retval;
	}
	verbose_printf("  %zux%zu, %s\n", input_image.width, input_image.height,
		input_image.interlace_type ? "interlaced" : "not interlaced");

	if (options.alpha) {
		optimize_alpha(&input_image.rgba_data[0], input_image.rgba_data.size());
	}

	write_info output_image;
	setup_output(input_image, options, &output_image);

	if (options.lossy > 0) {
		quantized_image quantized;
		retval = lossy_quantize(&input_image.rgba_data[0], input_image.width, input_image.height, options, &quantized, &result->search);
		if (retval) {
			return retval;
		}
		result->lossy = true;
		verbose_printf("  writing %zu-color image\n", quantized.palette.size());

		output_image.palette = quantized.palette;
		output_image.indexed_data = &quantized.indexed[0];
		return rwpng_write_image8_memory(encoded, output_image);
	}

	retval = encode_lossless(input_image, &output_image, encoded);
	if (retval) {
		return retval;
	}
	if (encoded->size() >= input.size()) {
		verbose_printf("  re-encoding saves nothing; keeping input\n");
		*encoded = input;
		result->kept_input = true;
	}
	return SUCCESS;
}
