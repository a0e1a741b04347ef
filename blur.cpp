#include "pam.h"
#include "blur.h"

#include <string.h>

/*
 Blurs image horizontally (width 2*size+1) and writes it transposed to dst (called twice gives 2d blur)
 */
static
void transposing_1d_blur(
	const double* src,
	double* dst,
	size_t width,
	size_t height,
	const size_t size
	)
{
	const double sizef = size;
	const double sizef2 = 1.0 / (sizef*2.0);
	for (size_t j=0; j<height; ++j) {
		const double* row = src + j*width;
		double* dstLine = dst + j;

		// accumulate sum for pixels outside line
		double sum = row[0] * sizef;
		for (size_t i=0; i<size; ++i) {
			sum += row[i];
		}

		// blur with left side outside line
		for (size_t i=0; i<size; ++i) {
			sum -= row[0];
			sum += row[i+size];
			dstLine[i*height] = sum * sizef2;
		}

		for (size_t i=size; i<width-size; ++i) {
			sum -= row[i-size];
			sum += row[i+size];
			dstLine[i*height] = sum * sizef2;
		}

		// blur with right side outside line
		for (size_t i=width-size; i<width; ++i) {
			sum -= row[i-size];
			sum += row[width-1];
			dstLine[i*height] = sum * sizef2;
		}
	}
}

struct pick_max {
	double operator()(double a, double b, double c, double d, double e) const { return max(a, b, c, d, e); }
};

struct pick_min {
	double operator()(double a, double b, double c, double d, double e) const { return min(a, b, c, d, e); }
};

/**
 * Picks maximum (or minimum) of pixel and its 4 neighbors
 */
template <typename Pick>
static
void filter3(
	const double* src,
	double* dst,
	size_t width,
	size_t height,
	Pick pick
	)
{
	for (size_t j=0; j<height; ++j) {
		const double* row = src + j*width;
		const double* prevrow = src + (j>0 ? j-1 : 0)*width;
		const double* nextrow = src + min(height-1, j+1)*width;

		for (size_t i=0; i<width; ++i) {
			const double prev = row[i>0 ? i-1 : 0];
			const double next = row[min(width-1, i+1)];
			*dst++ = pick(row[i], prev, next, nextrow[i], prevrow[i]);
		}
	}
}

void max3(const double* src, double* dst, size_t width, size_t height)
{
	filter3(src, dst, width, height, pick_max());
}

void min3(const double* src, double* dst, size_t width, size_t height)
{
	filter3(src, dst, width, height, pick_min());
}

/*
 Filters src image and saves it to dst, overwriting tmp in the process.
 Image must be width*height pixels high. Size controls radius of box blur.
 Images too small for the radius are copied unchanged.
 */
void blur(
	const double* src,
	double* tmp,
	double* dst,
	size_t width,
	size_t height,
	size_t size
	)
{
	if (width<2*size+1 || height<2*size+1) {
		if (src != dst) memcpy(dst, src, width*height*sizeof(dst[0]));
		return;
	}
	transposing_1d_blur(src, tmp, width, height, size);
	transposing_1d_blur(tmp, dst, height, width, size);
}

void contrast_maps(const f_pixel* pixels, size_t cols, size_t rows, double* noise, double* edges)
{
	if (!cols || !rows) return;

	std::vector<double> tmpVec(cols*rows);
	double* tmp = &tmpVec[0];

	const f_pixel* pSrc = pixels;
	double* pNoise = noise;
	double* pEdges = edges;
	for (size_t y=0; y<rows; ++y) {
		f_pixel prev, curr = pSrc[0], next=curr;
		const f_pixel* prevLine = (y == 0) ? pSrc : (pSrc - cols);
		const f_pixel* nextLine = (y == rows-1) ? pSrc : (pSrc + cols);
		for (size_t x=0; x<cols; ++x) {
			prev = curr;
			curr = next;
			next = pSrc[min(cols-1,x+1)];

			f_pixel hd = (prev + next - curr * 2.0).abs();
			f_pixel vd = (prevLine[x] + nextLine[x] - curr * 2.0).abs();
			double horiz = max(hd.alpha, hd.r, hd.g, hd.b);
			double vert = max(vd.alpha, vd.r, vd.g, vd.b);
			double edge = max(horiz, vert);
			double z = edge - fabs(horiz-vert)*.5;
			z = 1.0 - max(z,min(horiz,vert));
			z *= z;
			z *= z;

			pNoise[x] = z;
			pEdges[x] = 1.0 - edge;
		}
		pSrc += cols;
		pNoise += cols;
		pEdges += cols;
	}

	max3(noise, tmp, cols, rows);
	max3(tmp, noise, cols, rows);

	blur(noise, tmp, noise, cols, rows, 3);

	max3(noise, tmp, cols, rows);

	min3(tmp, noise, cols, rows);
	min3(noise, tmp, cols, rows);
	min3(tmp, noise, cols, rows);

	min3(edges, tmp, cols, rows);
	max3(tmp, edges, cols, rows);

	for (size_t i=0; i<cols*rows; ++i) {
		edges[i] = min(noise[i], edges[i]);
	}
}
