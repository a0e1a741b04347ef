#include "lossypng.h"

#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <math.h>
#include <stdlib.h>
#include <errno.h>
#include <limits.h>

static bool verbose = false;

void verbose_printf(const char* fmt, ...)
{
	va_list va;
	va_start(va, fmt);
	if (verbose) vfprintf(stderr, fmt, va);
	va_end(va);
}

void set_verbose(bool enabled)
{
	verbose = enabled;
}

bool is_verbose()
{
	return verbose;
}

const char* lossypng_strerror(lossypng_error error)
{
	switch (error) {
	case SUCCESS: return "success";
	case MISSING_ARGUMENT: return "missing argument";
	case READ_ERROR: return "cannot read input";
	case INVALID_ARGUMENT: return "invalid argument";
	case UNKNOWN_OPTION: return "unknown option";
	case NOT_OVERWRITING_ERROR: return "output exists; not overwriting";
	case CANT_WRITE_ERROR: return "cannot write output";
	case OUT_OF_MEMORY_ERROR: return "out of memory";
	case PNG_OUT_OF_MEMORY_ERROR: return "libpng ran out of memory";
	case LIBPNG_FATAL_ERROR: return "libpng error";
	case LIBPNG_INIT_ERROR: return "libpng initialization failed";
	case QUANTIZATION_ERROR: return "quantization failed";
	}
	return "unknown error";
}

void lossypng_options_init(lossypng_options* options)
{
	options->level = 2;
	options->lossy = 0;
	options->mode = LOSSY_SEARCH;
	options->optimizer = OPTIMIZER_KMEANS;
	options->ditherer = DITHERER_ORDERED;
	options->strip = STRIP_ALL;
	options->interlace_keep = false;
	options->alpha = false;
	options->preserve = true;
	options->tight_bound = true;
}

lossypng_error lossypng_options_validate(const lossypng_options* options)
{
	if (options->level < 0 || options->level > 6) {
		fprintf(stderr, "  error:  level should be between 0 and 6, got %d\n", options->level);
		return INVALID_ARGUMENT;
	}
	if (!isfinite(options->lossy)) {
		fputs("  error:  lossy must be a finite number\n", stderr);
		return INVALID_ARGUMENT;
	}
	if (options->mode == LOSSY_COVERAGE && options->lossy > 1) {
		fprintf(stderr, "  error:  lossy fraction for coverage mode should be at most 1, got %g\n", options->lossy);
		return INVALID_ARGUMENT;
	}
	return SUCCESS;
}

static const struct { const char* name; lossy_mode mode; } mode_names[] = {
	{"search", LOSSY_SEARCH},
	{"bisect", LOSSY_SEARCH},
	{"coverage", LOSSY_COVERAGE},
	{"prune", LOSSY_PRUNE},
};

lossypng_error parse_mode(const char* name, lossy_mode* mode)
{
	for (size_t i=0; i<sizeof(mode_names)/sizeof(mode_names[0]); ++i) {
		if (0 == strcmp(name, mode_names[i].name)) {
			*mode = mode_names[i].mode;
			return SUCCESS;
		}
	}
	return UNKNOWN_OPTION;
}

const char* mode_name(lossy_mode mode)
{
	switch (mode) {
	case LOSSY_SEARCH: return "search";
	case LOSSY_COVERAGE: return "coverage";
	case LOSSY_PRUNE: return "prune";
	}
	return "unknown";
}

bool parse_int(const char* s, int* value)
{
	char* end;
	errno = 0;
	long v = strtol(s, &end, 10);
	if (end == s || *end != '\0' || errno || v < INT_MIN || v > INT_MAX) {
		return false;
	}
	*value = (int)v;
	return true;
}

bool parse_double(const char* s, double* value)
{
	char* end;
	errno = 0;
	*value = strtod(s, &end);
	return end != s && *end == '\0' && errno == 0;
}
