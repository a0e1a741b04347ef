#pragma once

//
//  blur.h
//  box blur and 3x3 min/max filters over single-channel double maps

#include <stddef.h>

struct f_pixel;

void blur(
	const double* src,
	double* tmp,
	double* dst,
	size_t width,
	size_t height,
	size_t size
);

void max3(
	const double* src,
	double* dst,
	size_t width,
	size_t height
);

void min3(
	const double* src,
	double* dst,
	size_t width,
	size_t height
);

/**
 Builds two maps:
	noise - approximation of areas with high-frequency noise, except straight edges. 1=flat, 0=noisy.
	edges - noise map including all edges
 */
void contrast_maps(
	const f_pixel* pixels,
	size_t width,
	size_t height,
	double* noise,
	double* edges
);
