#include "batch.h"

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <math.h>
#include <algorithm>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <utime.h>

static inline
bool is_separator(char c)
{
	return c == '/' || c == '\\';
}

std::string format_bytes(unsigned long long bytes)
{
	static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
	if (!bytes) {
		return "0 B";
	}

	int i = (int)floor(log((double)bytes) / log(1024.0));
	if (i < 0) i = 0;
	if (i > 5) i = 5;

	char buf[32];
	snprintf(buf, sizeof(buf), "%.1f %s", bytes / pow(1024.0, i), units[i]);
	return buf;
}

size_t find_truncate_index(const std::vector<std::string>& paths)
{
	if (paths.empty()) {
		return 0;
	}

	const std::string& first = paths[0];
	size_t last_separator = std::string::npos;
	for (size_t i=0; i<first.size(); ++i) {
		if (is_separator(first[i])) last_separator = i;
	}
	if (last_separator == std::string::npos) {
		return 0;
	}
	if (paths.size() == 1) {
		return last_separator + 1;
	}

	size_t index = 0;
	for (size_t pos=0; pos<=last_separator; ++pos) {
		const char c = first[pos];
		for (size_t j=1; j<paths.size(); ++j) {
			if (pos >= paths[j].size() || paths[j][pos] != c) {
				return index;
			}
		}
		if (is_separator(c)) {
			index = pos + 1;
		}
	}
	return index;
}

std::string truncate_path(const std::string& path, size_t index)
{
	if (index == 0 || index >= path.size()) {
		return path;
	}
	return path.substr(index);
}

std::string add_filename_extension(const std::string& filename, const char* newext)
{
	const size_t x = filename.size();
	if (x >= 4 && filename.compare(x - 4, 4, ".png") == 0) {
		return filename.substr(0, x - 4) + newext;
	}
	return filename + newext;
}

static
bool ends_with(const std::string& s, const char* suffix)
{
	const size_t n = strlen(suffix);
	return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

bool is_png_name(const std::string& name)
{
	return ends_with(name, ".png") || ends_with(name, ".apng");
}

bool path_exists(const std::string& path)
{
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path)
{
	struct stat st;
	return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

static
std::string join_path(const std::string& dir, const std::string& name)
{
	if (dir.empty()) {
		return name;
	}
	if (is_separator(dir[dir.size() - 1])) {
		return dir + name;
	}
	return dir + "/" + name;
}

static
std::string base_name(const std::string& path)
{
	size_t i = path.size();
	while (i > 0 && !is_separator(path[i - 1])) {
		--i;
	}
	return path.substr(i);
}

static
lossypng_error list_dir(const std::string& root, const std::string& relative, bool recursive, std::vector<std::string>* files)
{
	const std::string dir = join_path(root, relative);
	DIR* dp = opendir(dir.c_str());
	if (!dp) {
		fprintf(stderr, "  error:  cannot open directory %s: %s\n", dir.c_str(), strerror(errno));
		return READ_ERROR;
	}

	lossypng_error retval = SUCCESS;
	struct dirent* entry;
	while (!retval && (entry = readdir(dp)) != NULL) {
		if (0 == strcmp(entry->d_name, ".") || 0 == strcmp(entry->d_name, "..")) {
			continue;
		}
		const std::string name = relative.empty() ? std::string(entry->d_name) : join_path(relative, entry->d_name);
		const std::string full = join_path(root, name);
		if (is_directory(full)) {
			if (recursive) {
				retval = list_dir(root, name, recursive, files);
			}
		}else if (is_png_name(name)) {
			files->push_back(name);
		}
	}
	closedir(dp);
	return retval;
}

lossypng_error list_png_files(const std::string& dir, bool recursive, std::vector<std::string>* files)
{
	files->clear();
	lossypng_error retval = list_dir(dir, "", recursive, files);
	std::sort(files->begin(), files->end());
	return retval;
}

lossypng_error make_parent_dirs(const std::string& path)
{
	for (size_t i=1; i<path.size(); ++i) {
		if (!is_separator(path[i])) {
			continue;
		}
		const std::string dir = path.substr(0, i);
		if (is_directory(dir)) {
			continue;
		}
		if (mkdir(dir.c_str(), 0777) != 0 && errno != EEXIST) {
			fprintf(stderr, "  error:  cannot create directory %s: %s\n", dir.c_str(), strerror(errno));
			return CANT_WRITE_ERROR;
		}
	}
	return SUCCESS;
}

lossypng_error read_file(const std::string& path, std::vector<unsigned char>* data)
{
	FILE* infile = fopen(path.c_str(), "rb");
	if (!infile) {
		fprintf(stderr, "  error:  cannot open %s for reading\n", path.c_str());
		return READ_ERROR;
	}

	data->clear();
	unsigned char buf[65536];
	size_t n;
	while ((n = fread(buf, 1, sizeof(buf), infile)) > 0) {
		data->insert(data->end(), buf, buf + n);
	}
	const bool failed = ferror(infile) != 0;
	fclose(infile);
	if (failed) {
		fprintf(stderr, "  error:  cannot read %s\n", path.c_str());
		return READ_ERROR;
	}
	return SUCCESS;
}

lossypng_error write_file(const std::string& path, const std::vector<unsigned char>& data)
{
	FILE* outfile = fopen(path.c_str(), "wb");
	if (!outfile) {
		fprintf(stderr, "  error:  cannot open %s for writing\n", path.c_str());
		return CANT_WRITE_ERROR;
	}
	bool failed = !data.empty() && fwrite(&data[0], 1, data.size(), outfile) != data.size();
	if (fclose(outfile) != 0) {
		failed = true;
	}
	if (failed) {
		fprintf(stderr, "  error:  cannot write %s\n", path.c_str());
		return CANT_WRITE_ERROR;
	}
	return SUCCESS;
}

lossypng_error copy_file_attributes(const struct stat& source, const std::string& path)
{
	if (chmod(path.c_str(), source.st_mode & 07777) != 0) {
		fprintf(stderr, "  error:  cannot set permissions of %s: %s\n", path.c_str(), strerror(errno));
		return CANT_WRITE_ERROR;
	}
	struct utimbuf times;
	times.actime = source.st_atime;
	times.modtime = source.st_mtime;
	if (utime(path.c_str(), &times) != 0) {
		fprintf(stderr, "  error:  cannot set timestamps of %s: %s\n", path.c_str(), strerror(errno));
		return CANT_WRITE_ERROR;
	}
	return SUCCESS;
}

lossypng_error plan_batch(const std::vector<std::string>& inputs, const batch_options& options, std::vector<batch_item>* items)
{
	items->clear();

	// check every input before planning anything
	for (size_t i=0; i<inputs.size(); ++i) {
		if (!path_exists(inputs[i])) {
			fprintf(stderr, "  error:  input file does not exist: %s\n", inputs[i].c_str());
			return READ_ERROR;
		}
	}

	/* input path, and the name it gets below an output directory */
	std::vector<std::pair<std::string, std::string> > files;
	bool any_directory = false;
	for (size_t i=0; i<inputs.size(); ++i) {
		if (is_directory(inputs[i])) {
			any_directory = true;
			std::vector<std::string> found;
			lossypng_error retval = list_png_files(inputs[i], options.recursive, &found);
			if (retval) {
				return retval;
			}
			for (size_t j=0; j<found.size(); ++j) {
				files.push_back(std::make_pair(join_path(inputs[i], found[j]), found[j]));
			}
		}else {
			files.push_back(std::make_pair(inputs[i], base_name(inputs[i])));
		}
	}

	bool output_is_dir = false;
	if (options.output_path) {
		const std::string out = options.output_path;
		output_is_dir = any_directory || files.size() > 1 || is_directory(out)
			|| (!out.empty() && is_separator(out[out.size() - 1]));
	}

	for (size_t i=0; i<files.size(); ++i) {
		batch_item item;
		item.input = files[i].first;
		if (options.output_path) {
			item.output = output_is_dir ? join_path(options.output_path, files[i].second) : std::string(options.output_path);
		}else if (options.newext) {
			item.output = add_filename_extension(item.input, options.newext);
		}else {
			item.output = item.input;
		}
		items->push_back(item);
	}
	return SUCCESS;
}
