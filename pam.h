#pragma once

/**
 ** Copyright (C) 1989, 1991 by Jef Poskanzer.
 ** Copyright (C) 1997, 2000, 2002 by Greg Roelofs; based on an idea by
 **								   Stefan Schneider.
 ** (C) 2011 by Kornel Lesinski.
 **
 ** Permission to use, copy, modify, and distribute this software and its
 ** documentation for any purpose and without fee is hereby granted, provided
 ** that the above copyright notice appear in all copies and that both that
 ** copyright notice and this permission notice appear in supporting
 ** documentation.	This software is provided "as is" without express or
 ** implied warranty.
 */

#include <vector>
#include <math.h>
#include <assert.h>
#include <stdint.h>
#include <stddef.h>

template <typename T>
T min(T a, T b)
{
	if (a < b) {
		return a;
	}else {
		return b;
	}
}

template <typename T>
T min(T a, T b, T c)
{
	return min(min(a,b), c);
}

template <typename T>
T min(T a, T b, T c, T d)
{
	return min(min(a,b), min(c, d));
}

template <typename T>
T min(T a, T b, T c, T d, T e)
{
	return min(min(a,b,c,d), e);
}

template <typename T>
T max(T a, T b)
{
	if (a < b) {
		return b;
	}else {
		return a;
	}
}

template <typename T>
T max(T a, T b, T c)
{
	return max(max(a,b), c);
}

template <typename T>
T max(T a, T b, T c, T d)
{
	return max(max(a, b), max(c, d));
}

template <typename T>
T max(T a, T b, T c, T d, T e)
{
	return max(max(a, b, c, d), e);
}

template <typename T>
T limitValue(T val, T min, T max)
{
	if (val < min) return min;
	if (max < val) return max;
	return val;
}

#define MAX_PALETTE_SIZE 256

/* from pam.h */

struct rgb_pixel {
	rgb_pixel(unsigned char r, unsigned char g, unsigned char b, unsigned char a)
		:
		r(r),
		g(g),
		b(b),
		a(a)
	{
	}

	rgb_pixel() {}

	unsigned char r, g, b, a;
};

static inline
bool operator == (const rgb_pixel& l, const rgb_pixel& r)
{
	return l.r == r.r && l.g == r.g && l.b == r.b && l.a == r.a;
}

static inline
bool operator != (const rgb_pixel& l, const rgb_pixel& r)
{
	return !(l == r);
}

/**
 Packs all four channels losslessly. Equal pixels give equal keys and vice versa.
 */
static inline
uint32_t color_key(rgb_pixel px)
{
	return ((uint32_t)px.r << 24) | ((uint32_t)px.g << 16) | ((uint32_t)px.b << 8) | px.a;
}

struct f_pixel {
	f_pixel(double alpha, double r, double g, double b)
		:
		alpha(alpha),
		r(r),
		g(g),
		b(b)
	{
	}

	f_pixel& operator += (const f_pixel& p)
	{
		alpha += p.alpha;
		r += p.r;
		g += p.g;
		b += p.b;
		return *this;
	}

	f_pixel& operator -= (const f_pixel& p)
	{
		alpha -= p.alpha;
		r -= p.r;
		g -= p.g;
		b -= p.b;
		return *this;
	}

	f_pixel& operator *= (double v)
	{
		alpha *= v;
		r *= v;
		g *= v;
		b *= v;
		return *this;
	}

	f_pixel& operator /= (double v)
	{
		alpha /= v;
		r /= v;
		g /= v;
		b /= v;
		return *this;
	}

	f_pixel& square()
	{
		alpha *= alpha;
		r *= r;
		g *= g;
		b *= b;
		return *this;
	}

	f_pixel& abs()
	{
		alpha = fabs(alpha);
		r = fabs(r);
		g = fabs(g);
		b = fabs(b);
		return *this;
	}

	f_pixel() : alpha(0), r(0), g(0), b(0) {}
	double alpha;
	double r, g, b;
};

static inline
f_pixel operator + (const f_pixel& l, const f_pixel& r)
{
	f_pixel ret = l;
	ret += r;
	return ret;
}

static inline
f_pixel operator - (const f_pixel& l, const f_pixel& r)
{
	f_pixel ret = l;
	ret -= r;
	return ret;
}

static inline
f_pixel operator * (const f_pixel& l, double v)
{
	f_pixel ret = l;
	ret *= v;
	return ret;
}

static inline
f_pixel operator / (const f_pixel& l, double v)
{
	f_pixel ret = l;
	ret /= v;
	return ret;
}

static inline
bool operator == (const f_pixel& l, const f_pixel& r)
{
	return 1
		&& l.alpha == r.alpha
		&& l.r == r.r
		&& l.g == r.g
		&& l.b == r.b
		;
}

/**
  Converts 8-bit RGBA to scalar RGBA in 0..1, straight (not premultiplied) alpha,
  so that every 8-bit color survives to_f/to_rgb unchanged.
 */
static inline
f_pixel to_f(rgb_pixel px)
{
	return f_pixel(px.a / 255.0, px.r / 255.0, px.g / 255.0, px.b / 255.0);
}

static inline
unsigned char to_channel(double v)
{
	v = v * 255.0 + 0.5;
	return v >= 255 ? 255 : (v <= 0 ? 0 : (unsigned char)v);
}

static inline
rgb_pixel to_rgb(f_pixel px)
{
	return rgb_pixel(to_channel(px.r), to_channel(px.g), to_channel(px.b), to_channel(px.alpha));
}

static inline
double colordifference(f_pixel px, f_pixel py)
{
	f_pixel diff = px - py;

	diff.square();
	return
		diff.alpha * 3.0
		+ diff.r
		+ diff.g
		+ diff.b
		;
}

/* CIE L*a*b*, D65 white point. Alpha is not part of it. */
struct lab_color {
	lab_color(double l, double a, double b)
		:
		l(l),
		a(a),
		b(b)
	{
	}

	lab_color() : l(0), a(0), b(0) {}
	double l, a, b;
};

/* inverse sRGB transfer function (IEC 61966-2-1) */
static inline
double srgb_to_linear(double u)
{
	if (u > 0.04045) {
		return pow((u + 0.055) / 1.055, 2.4);
	}else {
		return u / 12.92;
	}
}

static inline
double lab_f(double t)
{
	if (t > 0.008856) {
		return pow(t, 1.0 / 3.0);
	}else {
		return (903.3 * t + 16.0) / 116.0;
	}
}

static inline
lab_color rgb2lab(rgb_pixel px)
{
	const double r = srgb_to_linear(px.r / 255.0);
	const double g = srgb_to_linear(px.g / 255.0);
	const double b = srgb_to_linear(px.b / 255.0);

	// http://www.brucelindbloom.com/index.html?Eqn_RGB_XYZ_Matrix.html
	// normalized by D65 white (0.95047, 1.0, 1.08883)
	const double x = (0.4124564 * r + 0.3575761 * g + 0.1804375 * b) / 0.95047;
	const double y =  0.2126729 * r + 0.7151522 * g + 0.0721750 * b;
	const double z = (0.0193339 * r + 0.1191920 * g + 0.9503041 * b) / 1.08883;

	const double fx = lab_f(x);
	const double fy = lab_f(y);
	const double fz = lab_f(z);
	return lab_color(116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz));
}

/**
 CIE76 Delta E
 */
static inline
double delta_e(const lab_color& p, const lab_color& q)
{
	const double dl = p.l - q.l;
	const double da = p.a - q.a;
	const double db = p.b - q.b;
	return sqrt(dl * dl + da * da + db * db);
}

/* from pamcmap.h */

struct hist_item {
	f_pixel acolor;
	double adjusted_weight;
	double perceptual_weight;
};

struct colormap_item {
	f_pixel acolor;
	double popularity;
};

struct acolorhist_list_item {
	uint32_t key;
	acolorhist_list_item* next;
	double perceptual_weight;
};

struct acolorhash_table {
	struct mempool* mempool;
	acolorhist_list_item** buckets;
};

int best_color_index(
	const std::vector<colormap_item>& map,
	f_pixel px,
	double* dist_out
	);

std::vector<hist_item> pam_computeacolorhist(
	const rgb_pixel* input, size_t pixel_count
	);

size_t count_unique_colors(const rgb_pixel* pixels, size_t pixel_count);
