#pragma once

#include <vector>
#include "pam.h"

#define MAX_SAMPLES 50000

/* 0, stride, 2*stride, ... below pixel_count, with stride = max(1, pixel_count / max_samples) */
std::vector<size_t> sample_indices(size_t pixel_count, size_t max_samples);

/**
 Sampled positions of one image with their original colors precomputed.
 Built once per image, shared by every search step.
 */
struct sample_set {
	std::vector<size_t> index;
	std::vector<lab_color> lab;
	std::vector<uint32_t> key;
};

void sample_set_init(sample_set* samples, const rgb_pixel* pixels, size_t pixel_count, size_t max_samples = MAX_SAMPLES);
