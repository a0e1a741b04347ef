/*
 **
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

#include <stdlib.h>
#include <assert.h>
#include <stddef.h>

#include "pam.h"
#include "mediancut.h"

#include <vector>
#include <algorithm>

enum channel { CHANNEL_A, CHANNEL_R, CHANNEL_G, CHANNEL_B };

static inline
double channel_value(const f_pixel& px, int ch)
{
	switch (ch) {
	case CHANNEL_A: return px.alpha;
	case CHANNEL_R: return px.r;
	case CHANNEL_G: return px.g;
	default:		return px.b;
	}
}

static
f_pixel averagepixels(size_t indx, size_t clrs, const hist_item achv[])
{
	f_pixel csum(0,0,0,0);
	double sum = 0;

	for (size_t i=0; i<clrs; ++i) {
		double weight = 1.0;
		const hist_item& hist = achv[indx + i];
		f_pixel px = hist.acolor;
		/* give more weight to colors that are further away from average
		 this is intended to prevent desaturation of images and fading of whites
		 */
		f_pixel tmp = f_pixel(0.5, 0.5, 0.5, 0.5) - px;
		tmp.square();
		weight += tmp.r + tmp.g + tmp.b;
		weight *= hist.adjusted_weight;
		csum += px * weight;
		sum += weight;
	}

	if (!sum) sum=1;
	csum /= sum;

	return csum;
}

struct box {
	double variance;
	double sum;
	size_t ind;
	size_t colors;
};

struct channelvariance {
	channelvariance(int ch, double var)
		:
		chan(ch),
		variance(var)
	{
	}

	channelvariance() {}
	int chan;
	double variance;
};

static inline
bool operator < (const channelvariance& ch1, const channelvariance& ch2)
{
	return ch1.variance > ch2.variance;
}

/**
 Orders colors by the channel with highest variance first, the remaining channels break ties.
 */
struct weightedcompare {
	weightedcompare(const channelvariance order[4])
	{
		for (int i=0; i<4; ++i) chan[i] = order[i].chan;
	}

	bool operator()(const hist_item& lhs, const hist_item& rhs) const
	{
		for (int i=0; i<4; ++i) {
			double c1 = channel_value(lhs.acolor, chan[i]);
			double c2 = channel_value(rhs.acolor, chan[i]);
			if (c1 < c2) return true;
			if (c1 > c2) return false;
		}
		return false;
	}

	int chan[4];
};

static
f_pixel channel_variance(const hist_item* achv, size_t indx, size_t clrs)
{
	f_pixel mean = averagepixels(indx, clrs, achv);
	f_pixel variance(0,0,0,0);

	for (size_t i=0; i<clrs; ++i) {
		variance += (mean - achv[indx + i].acolor).square() * achv[indx + i].adjusted_weight;
	}
	return variance;
}

static
void sort_colors_by_variance(f_pixel variance, hist_item* achv, size_t indx, size_t clrs)
{
	/*
	 ** Sort dimensions by their variance, and then sort colors first by dimension with highest variance
	 */
	channelvariance channel_sort_order[4];
	channel_sort_order[0] = channelvariance(CHANNEL_R, variance.r);
	channel_sort_order[1] = channelvariance(CHANNEL_G, variance.g);
	channel_sort_order[2] = channelvariance(CHANNEL_B, variance.b);
	channel_sort_order[3] = channelvariance(CHANNEL_A, variance.alpha);

	std::stable_sort(channel_sort_order, channel_sort_order+4);
	std::sort(achv+indx, achv+indx+clrs, weightedcompare(channel_sort_order));
}

static
double box_variance(const hist_item* achv, size_t indx, size_t clrs)
{
	f_pixel var = channel_variance(achv, indx, clrs);
	return var.alpha + var.r + var.g + var.b;
}

/*
 ** Find the best splittable box. -1 if no boxes are splittable.
 */
static
int best_splittable_box(const box* bv, int boxes)
{
	int bi = -1;
	double maxsum = 0;
	for (int i=0; i<boxes; i++) {
		const box& b = bv[i];
		if (b.colors < 2) continue;

		double thissum = sqrt(b.sum) * b.variance;
		if (thissum > maxsum || bi < 0) {
			maxsum = thissum;
			bi = i;
		}
	}
	return bi;
}

static inline
double color_weight(f_pixel median, const hist_item& h)
{
	double diff = colordifference(median, h.acolor);
	// if color is "good enough", don't split further
	if (diff < 1.0/256.0) diff /= 2.0;
	return sqrt(diff) * sqrt(h.adjusted_weight);
}

static
std::vector<colormap_item> colormap_from_boxes(const box* bv, int boxes, const hist_item* achv)
{
	/*
	 ** Ok, we've got enough boxes.	 Now choose a representative color for
	 ** each box.  There are a number of possible ways to make this choice.
	 ** One would be to choose the center of the box; this ignores any structure
	 ** within the boxes.  Another method would be to average all the colors in
	 ** the box - this is the method specified in Heckbert's paper.
	 */

	std::vector<colormap_item> map(boxes);

	for (int bi=0; bi<boxes; ++bi) {
		colormap_item& cm = map[bi];
		const box& bx = bv[bi];
		cm.acolor = averagepixels(bx.ind, bx.colors, achv);

		/* store total color popularity (perceptual_weight is approximation of it) */
		cm.popularity = 0;
		for (size_t i=bx.ind; i<bx.ind+bx.colors; i++) {
			cm.popularity += achv[i].perceptual_weight;
		}
	}

	return map;
}

/*
 ** Here is the fun part, the median-cut colormap generator.  This is based
 ** on Paul Heckbert's paper, "Color Image Quantization for Frame Buffer
 ** Display," SIGGRAPH 1982 Proceedings, page 297.
 */
std::vector<colormap_item> mediancut(
	std::vector<hist_item>& hist, unsigned int newcolors
	)
{
	assert(newcolors >= 1);
	std::vector<box> bv(newcolors);

	if (hist.empty()) {
		std::vector<colormap_item> map(1);
		map[0].acolor = f_pixel(0,0,0,0);
		map[0].popularity = 0;
		return map;
	}

	/*
	 ** Set up the initial box.
	 */
	bv[0].ind = 0;
	bv[0].colors = hist.size();
	bv[0].sum = 0;
	for (size_t i=0; i<bv[0].colors; i++)
		bv[0].sum += hist[i].adjusted_weight;
	bv[0].variance = box_variance(&hist[0], 0, bv[0].colors);

	int boxes = 1;

	/*
	 ** Main loop: split boxes until we have enough.
	 */
	while ((unsigned int)boxes < newcolors) {

		int bi = best_splittable_box(&bv[0], boxes);
		if (bi < 0)
			break;		  /* ran out of colors! */

		box& bx = bv[bi];
		size_t indx = bx.ind;
		size_t clrs = bx.colors;

		sort_colors_by_variance(channel_variance(&hist[0], indx, clrs), &hist[0], indx, clrs);

		/*
		 Classic implementation tries to get even number of colors or pixels in each subdivision.

		 Here, instead of popularity I use (sqrt(popularity)*variance) metric.
		 Each subdivision balances number of pixels (popular colors) and low variance -
		 boxes can be large if they have similar colors. Later boxes with high variance
		 will be more likely to be split.

		 Median used as expected value gives much better results than mean.
		 */

		f_pixel median = averagepixels(indx+(clrs-1)/2, clrs&1 ? 1 : 2, &hist[0]);

		double halfvar = 0;
		for (size_t i=0; i<clrs; i++) {
			halfvar += color_weight(median, hist[indx+i]);
		}
		halfvar /= 2.0;

		// both halves keep at least one color
		double lowervar = 0;
		size_t break_at;
		for (break_at=1; break_at<clrs-1; ++break_at) {
			lowervar += color_weight(median, hist[indx+break_at-1]);
			if (lowervar >= halfvar)
				break;
		}

		double lowersum = 0;
		for (size_t i=0; i<break_at; i++) {
			lowersum += hist[indx+i].adjusted_weight;
		}

		/*
		 ** Split the box. Sum*variance is then used to find "largest" box to split.
		 */
		double sm = bx.sum;
		bx.colors = break_at;
		bx.sum = lowersum;
		bx.variance = box_variance(&hist[0], indx, break_at);
		box& bx2 = bv[boxes];
		bx2.ind = indx + break_at;
		bx2.colors = clrs - break_at;
		bx2.sum = sm - lowersum;
		bx2.variance = box_variance(&hist[0], bx2.ind, bx2.colors);
		++boxes;
	}

	return colormap_from_boxes(&bv[0], boxes, &hist[0]);
}
