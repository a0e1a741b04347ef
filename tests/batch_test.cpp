#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <utime.h>
#include <sys/stat.h>

#include "batch.h"

TEST(FormatBytes_test, Units)
{
	EXPECT_EQ("0 B", format_bytes(0));
	EXPECT_EQ("512.0 B", format_bytes(512));
	EXPECT_EQ("1.0 KB", format_bytes(1024));
	EXPECT_EQ("12.3 KB", format_bytes(12595));
	EXPECT_EQ("1.5 MB", format_bytes(1572864));
	EXPECT_EQ("2.0 GB", format_bytes(2ULL << 30));
}

TEST(TruncatePath_test, CommonDirectory)
{
	std::vector<std::string> paths;
	paths.push_back("images/a/one.png");
	paths.push_back("images/a/two.png");
	paths.push_back("images/b/three.png");
	const size_t index = find_truncate_index(paths);
	EXPECT_EQ(7u, index);
	EXPECT_EQ("a/one.png", truncate_path(paths[0], index));
	EXPECT_EQ("b/three.png", truncate_path(paths[2], index));
}

TEST(TruncatePath_test, SinglePathKeepsFileName)
{
	std::vector<std::string> paths(1, "/tmp/x/file.png");
	EXPECT_EQ("file.png", truncate_path(paths[0], find_truncate_index(paths)));
}

TEST(TruncatePath_test, NothingInCommon)
{
	std::vector<std::string> paths;
	paths.push_back("a.png");
	paths.push_back("dir/b.png");
	EXPECT_EQ(0u, find_truncate_index(paths));
	EXPECT_EQ("a.png", truncate_path("a.png", 0));
}

TEST(FileNames_test, AddExtension)
{
	EXPECT_EQ("photo-lossy.png", add_filename_extension("photo.png", "-lossy.png"));
	EXPECT_EQ("photo.bmp-lossy.png", add_filename_extension("photo.bmp", "-lossy.png"));
}

TEST(FileNames_test, PngNames)
{
	EXPECT_TRUE(is_png_name("a.png"));
	EXPECT_TRUE(is_png_name("dir/b.apng"));
	EXPECT_FALSE(is_png_name("c.jpg"));
	EXPECT_FALSE(is_png_name("png"));
}

class Batch_test : public ::testing::Test {
protected:
	void SetUp()
	{
		char templ[] = "/tmp/lossypng_test_XXXXXX";
		ASSERT_TRUE(mkdtemp(templ) != NULL);
		root_ = templ;
	}

	void TearDown()
	{
		std::string command = "rm -rf '" + root_ + "'";
		ASSERT_EQ(0, system(command.c_str()));
	}

	void touch(const std::string& relative)
	{
		const std::string path = root_ + "/" + relative;
		ASSERT_EQ(SUCCESS, make_parent_dirs(path));
		std::vector<unsigned char> data(3, 'x');
		ASSERT_EQ(SUCCESS, write_file(path, data));
	}

	std::string root_;
};

TEST_F(Batch_test, ListsPngFiles)
{
	touch("a.png");
	touch("b.apng");
	touch("notes.txt");
	touch("sub/c.png");

	std::vector<std::string> files;
	ASSERT_EQ(SUCCESS, list_png_files(root_, false, &files));
	ASSERT_EQ(2u, files.size());
	EXPECT_EQ("a.png", files[0]);
	EXPECT_EQ("b.apng", files[1]);

	ASSERT_EQ(SUCCESS, list_png_files(root_, true, &files));
	ASSERT_EQ(3u, files.size());
	EXPECT_EQ("sub/c.png", files[2]);
}

TEST_F(Batch_test, MissingInputPlansNothing)
{
	touch("a.png");
	std::vector<std::string> inputs;
	inputs.push_back(root_ + "/a.png");
	inputs.push_back(root_ + "/missing.png");

	batch_options options = {NULL, NULL, false};
	std::vector<batch_item> items;
	EXPECT_EQ(READ_ERROR, plan_batch(inputs, options, &items));
	EXPECT_TRUE(items.empty());
}

TEST_F(Batch_test, OutputPlacement)
{
	touch("in/a.png");
	touch("in/deep/b.png");
	std::vector<std::string> inputs(1, root_ + "/in/a.png");
	std::vector<batch_item> items;

	batch_options in_place = {NULL, NULL, false};
	ASSERT_EQ(SUCCESS, plan_batch(inputs, in_place, &items));
	ASSERT_EQ(1u, items.size());
	EXPECT_EQ(items[0].input, items[0].output);

	batch_options with_ext = {NULL, "-small.png", false};
	ASSERT_EQ(SUCCESS, plan_batch(inputs, with_ext, &items));
	EXPECT_EQ(root_ + "/in/a-small.png", items[0].output);

	const std::string out_file = root_ + "/out/single.png";
	batch_options to_file = {out_file.c_str(), NULL, false};
	ASSERT_EQ(SUCCESS, plan_batch(inputs, to_file, &items));
	EXPECT_EQ(out_file, items[0].output);

	// a directory input mirrors its layout below the output directory
	inputs.assign(1, root_ + "/in");
	const std::string out_dir = root_ + "/out";
	batch_options to_dir = {out_dir.c_str(), NULL, true};
	ASSERT_EQ(SUCCESS, plan_batch(inputs, to_dir, &items));
	ASSERT_EQ(2u, items.size());
	EXPECT_EQ(out_dir + "/a.png", items[0].output);
	EXPECT_EQ(out_dir + "/deep/b.png", items[1].output);
}

TEST_F(Batch_test, CreatesParentDirectories)
{
	const std::string path = root_ + "/x/y/z/file.png";
	ASSERT_EQ(SUCCESS, make_parent_dirs(path));
	EXPECT_TRUE(is_directory(root_ + "/x/y/z"));

	std::vector<unsigned char> data(10, 42), back;
	ASSERT_EQ(SUCCESS, write_file(path, data));
	ASSERT_EQ(SUCCESS, read_file(path, &back));
	EXPECT_TRUE(data == back);
}

TEST_F(Batch_test, CopiesPermissionsAndTimestamps)
{
	touch("in.png");
	touch("out.png");
	const std::string input = root_ + "/in.png";
	const std::string output = root_ + "/out.png";

	ASSERT_EQ(0, chmod(input.c_str(), 0640));
	struct utimbuf times;
	times.actime = 1000000000;
	times.modtime = 1200000000;
	ASSERT_EQ(0, utime(input.c_str(), &times));

	struct stat source;
	ASSERT_EQ(0, stat(input.c_str(), &source));
	ASSERT_EQ(SUCCESS, copy_file_attributes(source, output));

	struct stat copied;
	ASSERT_EQ(0, stat(output.c_str(), &copied));
	EXPECT_EQ(0640u, (unsigned int)(copied.st_mode & 07777));
	EXPECT_EQ(1200000000, (long long)copied.st_mtime);
	EXPECT_EQ(1000000000, (long long)copied.st_atime);
}

TEST_F(Batch_test, CopyAttributesToMissingFileFails)
{
	touch("in.png");
	struct stat source;
	ASSERT_EQ(0, stat((root_ + "/in.png").c_str(), &source));
	EXPECT_EQ(CANT_WRITE_ERROR, copy_file_attributes(source, root_ + "/absent.png"));
}
