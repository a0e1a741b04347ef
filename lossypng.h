#pragma once

#include <stddef.h>

#define LOSSYPNG_VERSION "0.3.0 (October 2026)"

typedef enum {
	SUCCESS = 0,
	MISSING_ARGUMENT = 1,
	READ_ERROR = 2,
	INVALID_ARGUMENT = 4,
	UNKNOWN_OPTION = 5,
	NOT_OVERWRITING_ERROR = 15,
	CANT_WRITE_ERROR = 16,
	OUT_OF_MEMORY_ERROR = 17,
	PNG_OUT_OF_MEMORY_ERROR = 24,
	LIBPNG_FATAL_ERROR = 25,
	LIBPNG_INIT_ERROR = 35,
	QUANTIZATION_ERROR = 40,
} lossypng_error;

const char* lossypng_strerror(lossypng_error error);

/* prints only when verbose flag is set */
void verbose_printf(const char* fmt, ...);
void set_verbose(bool enabled);
bool is_verbose();

enum lossy_mode {
	LOSSY_SEARCH,		/* bisection over re-clustering */
	LOSSY_COVERAGE,		/* keep the most frequent entries covering 1-lossy of pixels */
	LOSSY_PRUNE,		/* keep the most frequent entries within a Delta E bound */
};

enum optimizer_kind {
	OPTIMIZER_NONE,
	OPTIMIZER_KMEANS,
	OPTIMIZER_WEIGHTED_KMEANS,
};

enum ditherer_kind {
	DITHERER_NONE,
	DITHERER_ORDERED,
	DITHERER_FLOYD,
	DITHERER_FLOYD_VANILLA,
	DITHERER_FLOYD_CHECKERED,
};

enum strip_policy {
	STRIP_SAFE,		/* keep color rendering chunks (gAMA, sRGB) */
	STRIP_ALL,
};

struct lossypng_options {
	int level;				/* 0-6 */
	double lossy;			/* Delta E budget, or lossy fraction in coverage mode; 0 = lossless */
	lossy_mode mode;
	optimizer_kind optimizer;
	ditherer_kind ditherer;
	strip_policy strip;
	bool interlace_keep;
	bool alpha;				/* blacken fully transparent pixels */
	bool preserve;			/* lossless outputs keep the input's permissions and timestamps */
	bool tight_bound;		/* bound the search by colors used at 256 */
};

void lossypng_options_init(lossypng_options* options);
lossypng_error lossypng_options_validate(const lossypng_options* options);
lossypng_error parse_mode(const char* name, lossy_mode* mode);
const char* mode_name(lossy_mode mode);

/* whole-string numeric parsing for option values; false on junk or overflow */
bool parse_int(const char* s, int* value);
bool parse_double(const char* s, double* value);
