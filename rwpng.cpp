/*
** PNG reading and writing through libpng.
**
** Errors inside libpng come back through rwpng_error_handler, which
** longjmps to the setjmp of the function that started the operation.
*/

#include "rwpng.h"

#include <setjmp.h>
#include <string.h>
#include <new>

#include <png.h>
#include <zlib.h>

struct rwpng_stream {
	jmp_buf jmpbuf;
	lossypng_error retval;

	/* exactly one of these is the source or destination */
	FILE* fp;
	const unsigned char* data;
	size_t size;
	std::vector<unsigned char>* out;

	size_t position;
	std::vector<png_bytep> row_pointers;
};

static
void rwpng_stream_init(rwpng_stream* stream)
{
	stream->retval = SUCCESS;
	stream->fp = NULL;
	stream->data = NULL;
	stream->size = 0;
	stream->out = NULL;
	stream->position = 0;
}

void write_info_init(write_info* info)
{
	info->width = 0;
	info->height = 0;
	info->palette.clear();
	info->indexed_data = NULL;
	info->rgba_data = NULL;
	info->compression_level = Z_DEFAULT_COMPRESSION;
	info->interlace = false;
	info->emit_color_chunks = false;
	info->has_gamma = false;
	info->gamma = 0.45455;
	info->srgb_intent = -1;
}

void write_info_set_metadata(write_info* info, const read_info& source)
{
	info->interlace = source.interlace_type == PNG_INTERLACE_ADAM7;
	info->has_gamma = source.has_gamma;
	info->gamma = source.gamma;
	info->srgb_intent = source.srgb_intent;
}

void rwpng_version_info(FILE* fp)
{
	fprintf(fp, "   Compiled with libpng %s; using libpng %s.\n",
		PNG_LIBPNG_VER_STRING, png_get_libpng_ver(NULL));
	fprintf(fp, "   Compiled with zlib %s; using zlib %s.\n",
		ZLIB_VERSION, zlibVersion());
}

static
void rwpng_error_handler(png_structp png_ptr, png_const_charp msg)
{
	rwpng_stream* stream = (rwpng_stream*) png_get_error_ptr(png_ptr);
	if (stream->retval == SUCCESS) {
		stream->retval = strstr(msg, "memory") ? PNG_OUT_OF_MEMORY_ERROR : LIBPNG_FATAL_ERROR;
	}
	fprintf(stderr, "  error:  libpng: %s\n", msg);
	longjmp(stream->jmpbuf, 1);
}

static
void rwpng_warning_handler(png_structp png_ptr, png_const_charp msg)
{
	verbose_printf("  libpng warning: %s\n", msg);
}

static
void rwpng_read_data(png_structp png_ptr, png_bytep data, png_size_t length)
{
	rwpng_stream* stream = (rwpng_stream*) png_get_io_ptr(png_ptr);
	size_t read;
	if (stream->fp) {
		read = fread(data, 1, length, stream->fp);
	}else {
		read = min<size_t>(length, stream->size - stream->position);
		if (read) memcpy(data, stream->data + stream->position, read);
	}
	stream->position += read;
	if (read != length) {
		stream->retval = READ_ERROR;
		png_error(png_ptr, "unexpected end of data");
	}
}

static
void rwpng_write_data(png_structp png_ptr, png_bytep data, png_size_t length)
{
	rwpng_stream* stream = (rwpng_stream*) png_get_io_ptr(png_ptr);
	if (stream->fp) {
		if (fwrite(data, 1, length, stream->fp) != length) {
			stream->retval = CANT_WRITE_ERROR;
			png_error(png_ptr, "write failed");
		}
	}else {
		bool grown = true;
		try {
			stream->out->insert(stream->out->end(), data, data + length);
		}catch (const std::bad_alloc&) {
			grown = false;
		}
		if (!grown) {
			stream->retval = PNG_OUT_OF_MEMORY_ERROR;
			png_error(png_ptr, "out of memory for output buffer");
		}
	}
	stream->position += length;
}

static
void rwpng_flush_data(png_structp png_ptr)
{
	rwpng_stream* stream = (rwpng_stream*) png_get_io_ptr(png_ptr);
	if (stream->fp) {
		fflush(stream->fp);
	}
}

static
lossypng_error read_image(rwpng_stream* stream, read_info* image)
{
	png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, stream, rwpng_error_handler, rwpng_warning_handler);
	if (!png_ptr) {
		fputs("  error:  cannot create libpng read struct\n", stderr);
		return LIBPNG_INIT_ERROR;
	}
	png_infop info_ptr = png_create_info_struct(png_ptr);
	if (!info_ptr) {
		png_destroy_read_struct(&png_ptr, NULL, NULL);
		fputs("  error:  cannot create libpng info struct\n", stderr);
		return LIBPNG_INIT_ERROR;
	}

	if (setjmp(stream->jmpbuf)) {
		png_destroy_read_struct(&png_ptr, &info_ptr, NULL);
		return stream->retval;
	}

	png_set_read_fn(png_ptr, stream, rwpng_read_data);
	png_read_info(png_ptr, info_ptr);

	png_uint_32 width, height;
	int bit_depth, color_type, interlace_type;
	png_get_IHDR(png_ptr, info_ptr, &width, &height, &bit_depth, &color_type, &interlace_type, NULL, NULL);

	/* expand everything to RGBA8 */
	const bool has_trns = png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS) != 0;
	if (color_type == PNG_COLOR_TYPE_PALETTE) {
		png_set_palette_to_rgb(png_ptr);
	}
	if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
		png_set_expand_gray_1_2_4_to_8(png_ptr);
	}
	if (has_trns) {
		png_set_tRNS_to_alpha(png_ptr);
	}
	if (bit_depth == 16) {
		png_set_strip_16(png_ptr);
	}
	if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
		png_set_gray_to_rgb(png_ptr);
	}
	if (!(color_type & PNG_COLOR_MASK_ALPHA) && !has_trns) {
		png_set_filler(png_ptr, 0xff, PNG_FILLER_AFTER);
	}
	png_set_interlace_handling(png_ptr);
	png_read_update_info(png_ptr, info_ptr);

	if (png_get_rowbytes(png_ptr, info_ptr) != (png_size_t)width * 4) {
		png_error(png_ptr, "unsupported pixel layout after expansion");
	}

	image->width = width;
	image->height = height;
	image->interlace_type = interlace_type;

	double gamma;
	image->has_gamma = png_get_gAMA(png_ptr, info_ptr, &gamma) != 0;
	image->gamma = image->has_gamma ? gamma : 0.45455;

	int intent;
	image->srgb_intent = png_get_sRGB(png_ptr, info_ptr, &intent) ? intent : -1;

	bool allocated = true;
	try {
		image->rgba_data.resize((size_t)width * height);
		stream->row_pointers.resize(height);
	}catch (const std::bad_alloc&) {
		allocated = false;
	}
	if (!allocated) {
		stream->retval = PNG_OUT_OF_MEMORY_ERROR;
		png_error(png_ptr, "insufficient memory for image data");
	}
	for (size_t row=0; row<height; ++row) {
		stream->row_pointers[row] = (png_bytep) &image->rgba_data[row * width];
	}

	png_read_image(png_ptr, &stream->row_pointers[0]);
	png_read_end(png_ptr, NULL);
	png_destroy_read_struct(&png_ptr, &info_ptr, NULL);

	image->file_size = stream->position;
	return SUCCESS;
}

lossypng_error rwpng_read_image(FILE* infile, read_info* image)
{
	rwpng_stream stream;
	rwpng_stream_init(&stream);
	stream.fp = infile;
	lossypng_error retval = read_image(&stream, image);
	if (retval) {
		return retval;
	}

	// bytes after IEND still count towards the size on disk
	if (fseek(infile, 0, SEEK_END) == 0) {
		long end = ftell(infile);
		if (end > 0) {
			image->file_size = end;
		}
	}
	return SUCCESS;
}

lossypng_error rwpng_read_image_memory(const unsigned char* data, size_t size, read_info* image)
{
	rwpng_stream stream;
	rwpng_stream_init(&stream);
	stream.data = data;
	stream.size = size;
	lossypng_error retval = read_image(&stream, image);
	if (!retval) {
		image->file_size = size;
	}
	return retval;
}

static
int palette_bit_depth(size_t num_palette)
{
	if (num_palette <= 2) return 1;
	if (num_palette <= 4) return 2;
	if (num_palette <= 16) return 4;
	return 8;
}

static
lossypng_error write_image(rwpng_stream* stream, const write_info& image, bool indexed)
{
	const size_t num_palette = image.palette.size();
	if (indexed && (num_palette < 1 || num_palette > MAX_PALETTE_SIZE || !image.indexed_data)) {
		fprintf(stderr, "  error:  cannot write %zu-color palette image\n", num_palette);
		return INVALID_ARGUMENT;
	}
	if (!indexed && !image.rgba_data) {
		fputs("  error:  no pixels to write\n", stderr);
		return INVALID_ARGUMENT;
	}

	png_color palette[MAX_PALETTE_SIZE];
	png_byte trans[MAX_PALETTE_SIZE];
	int num_trans = 0;
	const int bit_depth = indexed ? palette_bit_depth(num_palette) : 8;

	png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, stream, rwpng_error_handler, rwpng_warning_handler);
	if (!png_ptr) {
		fputs("  error:  cannot create libpng write struct\n", stderr);
		return LIBPNG_INIT_ERROR;
	}
	png_infop info_ptr = png_create_info_struct(png_ptr);
	if (!info_ptr) {
		png_destroy_write_struct(&png_ptr, NULL);
		fputs("  error:  cannot create libpng info struct\n", stderr);
		return LIBPNG_INIT_ERROR;
	}

	if (setjmp(stream->jmpbuf)) {
		png_destroy_write_struct(&png_ptr, &info_ptr);
		return stream->retval;
	}

	png_set_write_fn(png_ptr, stream, rwpng_write_data, rwpng_flush_data);
	png_set_compression_level(png_ptr, image.compression_level);

	const int interlace_type = image.interlace ? PNG_INTERLACE_ADAM7 : PNG_INTERLACE_NONE;
	if (indexed) {
		png_set_IHDR(png_ptr, info_ptr, image.width, image.height, bit_depth, PNG_COLOR_TYPE_PALETTE,
			interlace_type, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

		for (size_t i=0; i<num_palette; ++i) {
			const rgb_pixel& px = image.palette[i];
			palette[i].red = px.r;
			palette[i].green = px.g;
			palette[i].blue = px.b;
			trans[i] = px.a;
			if (px.a != 255) {
				num_trans = i + 1;
			}
		}
		png_set_PLTE(png_ptr, info_ptr, palette, num_palette);
		if (num_trans) {
			png_set_tRNS(png_ptr, info_ptr, trans, num_trans, NULL);
		}
	}else {
		png_set_IHDR(png_ptr, info_ptr, image.width, image.height, 8, PNG_COLOR_TYPE_RGB_ALPHA,
			interlace_type, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
	}

	if (image.emit_color_chunks) {
		if (image.srgb_intent >= 0) {
			png_set_sRGB(png_ptr, info_ptr, image.srgb_intent);
		}else if (image.has_gamma) {
			png_set_gAMA(png_ptr, info_ptr, image.gamma);
		}
	}

	png_write_info(png_ptr, info_ptr);
	if (bit_depth < 8) {
		png_set_packing(png_ptr);
	}

	bool allocated = true;
	try {
		stream->row_pointers.resize(image.height);
	}catch (const std::bad_alloc&) {
		allocated = false;
	}
	if (!allocated) {
		stream->retval = PNG_OUT_OF_MEMORY_ERROR;
		png_error(png_ptr, "insufficient memory for row pointers");
	}
	for (size_t row=0; row<image.height; ++row) {
		stream->row_pointers[row] = indexed ?
			(png_bytep) image.indexed_data + row * image.width :
			(png_bytep) (image.rgba_data + row * image.width);
	}

	png_write_image(png_ptr, &stream->row_pointers[0]);
	png_write_end(png_ptr, NULL);
	png_destroy_write_struct(&png_ptr, &info_ptr);
	return SUCCESS;
}

lossypng_error rwpng_write_image8(FILE* outfile, const write_info& image)
{
	rwpng_stream stream;
	rwpng_stream_init(&stream);
	stream.fp = outfile;
	return write_image(&stream, image, true);
}

lossypng_error rwpng_write_image8_memory(std::vector<unsigned char>* out, const write_info& image)
{
	rwpng_stream stream;
	rwpng_stream_init(&stream);
	stream.out = out;
	out->clear();
	return write_image(&stream, image, true);
}

lossypng_error rwpng_write_image24(FILE* outfile, const write_info& image)
{
	rwpng_stream stream;
	rwpng_stream_init(&stream);
	stream.fp = outfile;
	return write_image(&stream, image, false);
}

lossypng_error rwpng_write_image24_memory(std::vector<unsigned char>* out, const write_info& image)
{
	rwpng_stream stream;
	rwpng_stream_init(&stream);
	stream.out = out;
	out->clear();
	return write_image(&stream, image, false);
}
