/* lossypng - shrink PNG files by reducing them to the smallest palette
** that stays within a perceptual color error budget.
**
** Copyright (C) 1989, 1991 by Jef Poskanzer.
** Copyright (C) 1997, 2000, 2002 by Greg Roelofs; based on an idea by
**								  Stefan Schneider.
** (C) 2011 by Kornel Lesinski.
**
** Permission to use, copy, modify, and distribute this software and its
** documentation for any purpose and without fee is hereby granted, provided
** that the above copyright notice appear in all copies and that both that
** copyright notice and this permission notice appear in supporting
** documentation.  This software is provided "as is" without express or
** implied warranty.
*/

#define LOSSYPNG_USAGE "\
   usage:  lossypng [options] file.png|dir [file.png|dir ...]\n\n\
   options:\n\
	  -level N		compression effort 0-6 (default 2)\n\
	  -lossy X		Delta E budget (fraction of pixels for -mode coverage);\n\
					0 or less re-encodes losslessly (default 0)\n\
	  -mode M		search, coverage or prune (default search)\n\
	  -optimizer O	none, k-means or weighted-k-means (default k-means)\n\
	  -ditherer D	none, ordered, floyd-steinberg, floyd-steinberg-vanilla\n\
					or floyd-steinberg-checkered (default ordered)\n\
	  -alpha		make fully transparent pixels transparent black\n\
	  -nopreserve	lossless outputs get fresh permissions and timestamps\n\
					(default keeps the input's)\n\
	  -strip S		safe keeps gAMA/sRGB, all drops them (default all)\n\
	  -interlace I	off or keep (default off)\n\
	  -o path		output file, or directory for several inputs\n\
	  -ext new.png	write beside the input with a new suffix\n\
	  -recursive	descend into subdirectories of directory inputs\n\
	  -force		overwrite existing -ext outputs (synonym: -f)\n\
	  -verbose		print status messages (synonym: -v)\n\
	  -quiet		no status messages\n\
	  -version		print version and exit\n\
\n\
   Files are replaced in place unless -o or -ext is given.\n\
   Directories are expanded to the *.png and *.apng files inside them.\n"

#include <stdio.h>
#include <string.h>
#include <math.h>
#include <sys/stat.h>

#include <string>
#include <vector>

#include "lossypng.h"
#include "rwpng.h"
#include "quantizer.h"
#include "process.h"
#include "batch.h"

static
void print_full_version(FILE* fd)
{
	fprintf(fd, "lossypng, version %s.\n", LOSSYPNG_VERSION);
	fprintf(fd, "palette code based on pngquant, by Greg Roelofs, Kornel Lesinski.\n");
	rwpng_version_info(fd);
	fputs("\n", fd);
}

static
void print_usage(FILE* fd)
{
	fputs(LOSSYPNG_USAGE, fd);
}

static
unsigned long long file_size(const std::string& path)
{
	struct stat st;
	return stat(path.c_str(), &st) == 0 ? (unsigned long long)st.st_size : 0;
}

static
lossypng_error process_file(const batch_item& item, const lossypng_options& options, bool check_existing)
{
	if (check_existing && path_exists(item.output)) {
		fprintf(stderr, "  error:  %s exists; not overwriting\n", item.output.c_str());
		return NOT_OVERWRITING_ERROR;
	}

	// taken before an in-place write replaces the input
	struct stat input_stat;
	const bool preserve = options.preserve && options.lossy <= 0 && stat(item.input.c_str(), &input_stat) == 0;

	std::vector<unsigned char> input;
	lossypng_error retval = read_file(item.input, &input);
	if (retval) {
		return retval;
	}

	std::vector<unsigned char> encoded;
	process_result result;
	retval = process_image(input, options, &encoded, &result);
	if (retval) {
		fprintf(stderr, "  error:  %s: %s\n", item.input.c_str(), lossypng_strerror(retval));
		return retval;
	}
	if (result.lossy) {
		verbose_printf("  %u colors, %u steps\n", result.search.colors, result.search.steps);
	}

	retval = make_parent_dirs(item.output);
	if (retval) {
		return retval;
	}
	retval = write_file(item.output, encoded);
	if (retval || !preserve) {
		return retval;
	}
	return copy_file_attributes(input_stat, item.output);
}

int main(int argc, char* argv[])
{
	lossypng_options options;
	lossypng_options_init(&options);

	batch_options batch;
	batch.output_path = NULL;
	batch.newext = NULL;
	batch.recursive = false;

	bool force = false;
	int latest_error=0, error_count=0, file_count=0;

	int argn = 1;

	while (argn < argc && argv[argn][0] == '-' && argv[argn][1] != '\0') {
		if (0 == strcmp(argv[argn], "--")) { ++argn;break; }

		const char* option = argv[argn];

		if (0 == strcmp(option, "-force") || 0 == strcmp(option, "-f"))
			force = true;
		else if (0 == strcmp(option, "-noforce"))
			force = false;
		else if (0 == strcmp(option, "-verbose") || 0 == strcmp(option, "-v"))
			set_verbose(true);
		else if (0 == strcmp(option, "-quiet") || 0 == strcmp(option, "-q"))
			set_verbose(false);
		else if (0 == strcmp(option, "-alpha"))
			options.alpha = true;
		else if (0 == strcmp(option, "-preserve"))
			options.preserve = true;
		else if (0 == strcmp(option, "-nopreserve"))
			options.preserve = false;
		else if (0 == strcmp(option, "-recursive") || 0 == strcmp(option, "-r"))
			batch.recursive = true;
		else if (0 == strcmp(option, "-version")) {
			puts(LOSSYPNG_VERSION);
			return SUCCESS;
		}else if (0 == strcmp(option, "-h") || 0 == strcmp(option, "--help")) {
			print_full_version(stdout);
			print_usage(stdout);
			return SUCCESS;
		}else {
			// everything below takes a value
			++argn;
			if (argn == argc) {
				fprintf(stderr, "  error:  %s needs a value\n", option);
				print_usage(stderr);
				return MISSING_ARGUMENT;
			}
			const char* value = argv[argn];
			lossypng_error retval = SUCCESS;

			if (0 == strcmp(option, "-ext")) {
				batch.newext = value;
			}else if (0 == strcmp(option, "-o")) {
				batch.output_path = value;
			}else if (0 == strcmp(option, "-level")) {
				if (!parse_int(value, &options.level)) retval = INVALID_ARGUMENT;
			}else if (0 == strcmp(option, "-lossy")) {
				if (!parse_double(value, &options.lossy)) retval = INVALID_ARGUMENT;
			}else if (0 == strcmp(option, "-mode")) {
				retval = parse_mode(value, &options.mode);
			}else if (0 == strcmp(option, "-optimizer")) {
				retval = parse_optimizer(value, &options.optimizer);
			}else if (0 == strcmp(option, "-ditherer")) {
				retval = parse_ditherer(value, &options.ditherer);
			}else if (0 == strcmp(option, "-strip")) {
				if (0 == strcmp(value, "safe")) options.strip = STRIP_SAFE;
				else if (0 == strcmp(value, "all")) options.strip = STRIP_ALL;
				else retval = UNKNOWN_OPTION;
			}else if (0 == strcmp(option, "-interlace")) {
				if (0 == strcmp(value, "keep")) options.interlace_keep = true;
				else if (0 == strcmp(value, "off")) options.interlace_keep = false;
				else retval = UNKNOWN_OPTION;
			}else {
				fprintf(stderr, "  error:  unknown option %s\n", option);
				print_usage(stderr);
				return UNKNOWN_OPTION;
			}

			if (retval) {
				fprintf(stderr, "  error:  %s for %s: %s\n", lossypng_strerror(retval), option, value);
				return retval;
			}
		}
		++argn;
	}

	if (argn == argc) {
		print_full_version(stderr);
		print_usage(stderr);
		return MISSING_ARGUMENT;
	}

	lossypng_error retval = lossypng_options_validate(&options);
	if (retval) {
		return retval;
	}

	std::vector<std::string> inputs(argv + argn, argv + argc);
	std::vector<batch_item> items;
	retval = plan_batch(inputs, batch, &items);
	if (retval) {
		return retval;
	}

	std::vector<std::string> input_paths, output_paths;
	for (size_t i=0; i<items.size(); ++i) {
		input_paths.push_back(items[i].input);
		output_paths.push_back(items[i].output);
	}
	const size_t input_truncate = is_verbose() ? find_truncate_index(input_paths) : 0;
	const size_t output_truncate = is_verbose() ? find_truncate_index(output_paths) : 0;

	if (options.lossy > 0) {
		verbose_printf("lossy %s, budget %g, optimizer %s, ditherer %s\n",
			mode_name(options.mode), options.lossy, optimizer_name(options.optimizer), ditherer_name(options.ditherer));
	}

	/*=============================	 MAIN LOOP	=============================*/

	for (size_t i=0; i<items.size(); ++i) {
		const batch_item& item = items[i];
		verbose_printf("%s:\n", item.input.c_str());

		const unsigned long long input_size = file_size(item.input);
		retval = process_file(item, options, batch.newext && !batch.output_path && !force);

		if (retval) {
			latest_error = retval;
			++error_count;
		}else if (input_size) {
			const unsigned long long output_size = file_size(item.output);
			const double reduction = ((double)input_size - (double)output_size) / input_size * 100.0;

			std::string path_display = truncate_path(item.output, output_truncate);
			if (item.input != item.output) {
				path_display = truncate_path(item.input, input_truncate) + " -> " + path_display;
			}
			verbose_printf("%s | %s -> %s (%s%.1f%%)\n",
				path_display.c_str(),
				format_bytes(input_size).c_str(),
				format_bytes(output_size).c_str(),
				output_size < input_size ? "-" : "+",
				fabs(reduction));
		}
		++file_count;
	}

	/*=======================================================================*/

	if (error_count)
		fprintf(stderr, "There were errors processing %d file%s out of a"
		  " total of %d file%s.\n",
		  error_count, (error_count == 1)? "" : "s",
		  file_count, (file_count == 1)? "" : "s");
	else
		verbose_printf("No errors detected while processing %d image%s.\n",
		  file_count, (file_count == 1)? "" : "s");

	return latest_error;
}
