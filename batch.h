#pragma once

#include <sys/stat.h>

#include <string>
#include <vector>

#include "lossypng.h"

struct batch_item {
	std::string input;
	std::string output;
};

struct batch_options {
	const char* output_path;	/* -o, NULL for none */
	const char* newext;			/* -ext, NULL for none */
	bool recursive;
};

/* "12.3 KB"; B, KB, MB, GB, TB, PB at one decimal */
std::string format_bytes(unsigned long long bytes);

/* length of the longest common prefix of paths that ends with a separator (the directory part for one path) */
size_t find_truncate_index(const std::vector<std::string>& paths);
std::string truncate_path(const std::string& path, size_t index);

/* foo.png with "-lossy.png" gives foo-lossy.png */
std::string add_filename_extension(const std::string& filename, const char* newext);

bool is_png_name(const std::string& name);
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

/* PNG files below dir, relative to it, sorted */
lossypng_error list_png_files(const std::string& dir, bool recursive, std::vector<std::string>* files);

/* creates every missing directory above path */
lossypng_error make_parent_dirs(const std::string& path);

lossypng_error read_file(const std::string& path, std::vector<unsigned char>* data);
lossypng_error write_file(const std::string& path, const std::vector<unsigned char>& data);

/* gives path the permission bits and access/modification times recorded in source */
lossypng_error copy_file_attributes(const struct stat& source, const std::string& path);

/**
 Expands the command line inputs into (input, output) pairs.
 Every input must exist; nothing is planned otherwise.
 */
lossypng_error plan_batch(const std::vector<std::string>& inputs, const batch_options& options, std::vector<batch_item>* items);
