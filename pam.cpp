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

#include <stdlib.h>
#include <new>

#include "pam.h"

#include "mempool.h"

static std::vector<hist_item> pam_acolorhashtoacolorhist(const acolorhash_table* acht, size_t hist_size);
static void pam_freeacolorhash(acolorhash_table* acht);
static acolorhash_table* pam_allocacolorhash(void);

int best_color_index(
	const std::vector<colormap_item>& map,
	f_pixel px,
	double* dist_out
	)
{
	int ind = 0;
	double dist = colordifference(px, map[0].acolor);

	for (size_t i=1; i<map.size(); ++i) {
		double newdist = colordifference(px, map[i].acolor);
		if (newdist < dist) {
			ind = i;
			dist = newdist;
		}
	}

	if (dist_out) *dist_out = dist;
	return ind;
}

/* libpam3.c - pam (portable alpha map) utility library part 3
 **
 ** Colormap routines.
 **
 ** Copyright (C) 1989, 1991 by Jef Poskanzer.
 ** Copyright (C) 1997 by Greg Roelofs.
 **
 ** Permission to use, copy, modify, and distribute this software and its
 ** documentation for any purpose and without fee is hereby granted, provided
 ** that the above copyright notice appear in all copies and that both that
 ** copyright notice and this permission notice appear in supporting
 ** documentation.	This software is provided "as is" without express or
 ** implied warranty.
 */

#define HASH_SIZE 30029

static inline
unsigned long pam_hashapixel(uint32_t key)
{
	rgb_pixel px((key >> 24) & 0xFF, (key >> 16) & 0xFF, (key >> 8) & 0xFF, key & 0xFF);
	unsigned long hash = px.a * 5UL + px.r * 179UL + px.g * 17UL + px.b * 30047UL;
	return hash % HASH_SIZE;
}

/**
 * Exact color histogram: every distinct RGBA value gets one entry whose weight is its pixel count.
 * NULL when memory runs out.
 */
static
acolorhash_table* pam_computeacolorhash(
	const rgb_pixel* input, size_t pixel_count, size_t* acolorsP
	)
{
	acolorhash_table* acht = pam_allocacolorhash();
	if (!acht) {
		return NULL;
	}
	acolorhist_list_item** buckets = acht->buckets;
	size_t colors = 0;

	/* Go through the entire image, building a hash table of colors. */
	for (size_t i=0; i<pixel_count; ++i) {
		const uint32_t key = color_key(input[i]);
		const unsigned long hash = pam_hashapixel(key);
		acolorhist_list_item* achl;
		for (achl=buckets[hash]; achl!=NULL; achl=achl->next) {
			if (achl->key == key) {
				break;
			}
		}
		if (achl != NULL) {
			achl->perceptual_weight += 1.0;
		}else {
			achl = (acolorhist_list_item*) mempool_new(acht->mempool, sizeof(acolorhist_list_item));
			if (!achl) {
				pam_freeacolorhash(acht);
				return NULL;
			}
			achl->key = key;
			achl->perceptual_weight = 1.0;
			achl->next = buckets[hash];
			buckets[hash] = achl;
			++colors;
		}
	}
	*acolorsP = colors;
	return acht;
}

std::vector<hist_item> pam_computeacolorhist(
	const rgb_pixel* input, size_t pixel_count
	)
{
	size_t hist_size = 0;
	acolorhash_table* acht = pam_computeacolorhash(input, pixel_count, &hist_size);
	if (!acht) throw std::bad_alloc();

	std::vector<hist_item> ret;
	try {
		ret = pam_acolorhashtoacolorhist(acht, hist_size);
	}catch (const std::bad_alloc&) {
		pam_freeacolorhash(acht);
		throw;
	}
	pam_freeacolorhash(acht);
	return ret;
}

size_t count_unique_colors(const rgb_pixel* pixels, size_t pixel_count)
{
	size_t colors = 0;
	acolorhash_table* acht = pam_computeacolorhash(pixels, pixel_count, &colors);
	if (!acht) throw std::bad_alloc();
	pam_freeacolorhash(acht);
	return colors;
}

static
acolorhash_table* pam_allocacolorhash()
{
	mempool* m = NULL;
	acolorhash_table* t = (acolorhash_table*) mempool_new(m, sizeof(*t));
	if (!t) {
		return NULL;
	}
	t->buckets = (acolorhist_list_item**) mempool_new(m, HASH_SIZE * sizeof(t->buckets[0]));
	if (!t->buckets) {
		mempool_free(m);
		return NULL;
	}
	t->mempool = m;
	return t;
}

static
std::vector<hist_item> pam_acolorhashtoacolorhist(
	const acolorhash_table* acht, size_t hist_size
	)
{
	std::vector<hist_item> ret(hist_size);
	size_t j = 0;
	/* Loop through the hash table. */
	for (size_t i=0; i<HASH_SIZE; ++i) {
		for (const acolorhist_list_item* achl=acht->buckets[i]; achl!=NULL; achl=achl->next) {
			const uint32_t key = achl->key;
			hist_item& hist = ret[j];
			hist.acolor = to_f(rgb_pixel((key >> 24) & 0xFF, (key >> 16) & 0xFF, (key >> 8) & 0xFF, key & 0xFF));
			hist.adjusted_weight = hist.perceptual_weight = achl->perceptual_weight;
			++j;
		}
	}

	/* All done. */
	return ret;
}

static
void pam_freeacolorhash(acolorhash_table* acht)
{
	mempool_free(acht->mempool);
}
