#pragma once

#include <vector>

#include "lossypng.h"
#include "pam.h"
#include "quantizer.h"
#include "search.h"
#include "rwpng.h"

/* what happened to one image */
struct process_result {
	bool lossy;				/* palette reduction ran */
	bool kept_input;		/* re-encoding did not beat the input; its bytes are returned as-is */
	search_result search;
};

/* zlib level for an optimization level 0-6 */
int zlib_level(int level);

/* fully transparent pixels become transparent black */
void optimize_alpha(rgb_pixel* pixels, size_t count);

/* runs the configured lossy mode */
lossypng_error lossy_quantize(
	const rgb_pixel* pixels, size_t width, size_t height,
	const lossypng_options& options,
	quantized_image* output,
	search_result* result
	);

/**
 Decodes one PNG held in memory, applies the configured preprocessing and
 re-encodes it into encoded.
 */
lossypng_error process_image(
	const std::vector<unsigned char>& input,
	const lossypng_options& options,
	std::vector<unsigned char>* encoded,
	process_result* result
	);
