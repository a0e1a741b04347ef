#include "sample.h"

std::vector<size_t> sample_indices(size_t pixel_count, size_t max_samples)
{
	std::vector<size_t> indices;
	if (!pixel_count) {
		return indices;
	}

	const size_t step = max<size_t>(1, max_samples ? pixel_count / max_samples : pixel_count);
	indices.reserve((pixel_count + step - 1) / step);
	for (size_t i=0; i<pixel_count; i+=step) {
		indices.push_back(i);
	}
	return indices;
}

void sample_set_init(sample_set* samples, const rgb_pixel* pixels, size_t pixel_count, size_t max_samples)
{
	samples->index = sample_indices(pixel_count, max_samples);
	samples->lab.resize(samples->index.size());
	samples->key.resize(samples->index.size());
	for (size_t j=0; j<samples->index.size(); ++j) {
		const rgb_pixel px = pixels[samples->index[j]];
		samples->lab[j] = rgb2lab(px);
		samples->key[j] = color_key(px);
	}
}
