/* archive_test.cpp - archive tests.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub.hpp"
#include "epub_error.hpp"
#include "test_support.hpp"
#include "zip_archive.hpp"
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <vector>

using namespace epubmeta;
using namespace epubmeta::test_support;

namespace {
io_error_code open_error(const std::string& path) {
	try {
		zip_archive archive(path);
	} catch (const io_error& e) {
		return e.code();
	}
	ADD_FAILURE() << "opened " << path;
	return io_error_code::unknown;
}
} // namespace

TEST(ZipArchiveTest, ReadsMembersInArchiveOrder) {
	temp_dir dir;
	const std::string path = dir.file("plain.zip");
	write_zip(path, {{"mimetype", "application/epub+zip"}, {"b/second.txt", "two"}, {"a/first.txt", "one!"}, {"c/my cover.jpg", "jpg"}});
	zip_archive archive(path);
	const auto members = archive.members();
	ASSERT_EQ(members.size(), 4U);
	EXPECT_EQ(members[0].path, "mimetype");
	EXPECT_EQ(members[1].path, "b/second.txt");
	EXPECT_EQ(members[2].path, "a/first.txt");
	EXPECT_EQ(members[2].size, 4U);
	EXPECT_EQ(archive.read("b/second.txt"), "two");
	EXPECT_EQ(archive.read("c/my%20cover.jpg"), "jpg");
	EXPECT_FALSE(archive.read("missing.txt").has_value());
	EXPECT_TRUE(archive.contains("a/first.txt"));
	EXPECT_FALSE(archive.contains("a"));
	EXPECT_EQ(archive.size("missing.txt"), 0U);
}

TEST(ZipArchiveTest, StagedChangesAreVisibleBeforeCommit) {
	temp_dir dir;
	const std::string path = dir.file("staged.zip");
	write_zip(path, {{"mimetype", "application/epub+zip"}, {"keep.txt", "keep"}, {"drop.txt", "drop"}});
	zip_archive archive(path);
	archive.write("new.txt", "fresh");
	archive.write("keep.txt", "changed");
	archive.remove("drop.txt");
	EXPECT_TRUE(archive.has_pending_changes());
	EXPECT_EQ(archive.read("new.txt"), "fresh");
	EXPECT_EQ(archive.read("keep.txt"), "changed");
	EXPECT_FALSE(archive.contains("drop.txt"));
	EXPECT_EQ(zip_member_names(path), (std::vector<std::string>{"mimetype", "keep.txt", "drop.txt"}));
}

TEST(ZipArchiveTest, CommitRewritesTheFile) {
	temp_dir dir;
	const std::string path = dir.file("commit.zip");
	write_zip(path, {{"mimetype", "application/epub+zip"}, {"keep.txt", "keep"}, {"drop.txt", "drop"}, {"edit.txt", "old"}});
	{
		zip_archive archive(path);
		archive.write("edit.txt", "new");
		archive.write("added.txt", "added");
		archive.remove("drop.txt");
		archive.commit();
		EXPECT_FALSE(archive.has_pending_changes());
		EXPECT_EQ(archive.read("edit.txt"), "new");
	}
	EXPECT_EQ(zip_member_names(path), (std::vector<std::string>{"mimetype", "keep.txt", "edit.txt", "added.txt"}));
	zip_archive reopened(path);
	EXPECT_EQ(reopened.read("mimetype"), "application/epub+zip");
	EXPECT_EQ(reopened.read("keep.txt"), "keep");
	EXPECT_EQ(reopened.read("edit.txt"), "new");
	EXPECT_EQ(reopened.read("added.txt"), "added");
}

TEST(ZipArchiveTest, WriteFileReadsLocalData) {
	temp_dir dir;
	const std::string path = dir.file("files.zip");
	write_zip(path, {{"mimetype", "application/epub+zip"}});
	const std::string image = dir.file("cover.jpg");
	write_file(image, fake_jpeg());
	zip_archive archive(path);
	archive.write_file("OPS/cover.img", image);
	EXPECT_EQ(archive.read("OPS/cover.img"), fake_jpeg());
	try {
		archive.write_file("OPS/missing.img", dir.file("missing.jpg"));
		FAIL() << "missing local file was accepted";
	} catch (const io_error& e) {
		EXPECT_EQ(e.code(), io_error_code::read_failed);
	}
}

TEST(ZipArchiveTest, OpenErrorsCarryACode) {
	temp_dir dir;
	const std::string text = dir.file("notes.txt");
	write_file(text, "This is not a zip archive at all.");
	EXPECT_EQ(open_error(text), io_error_code::not_a_zip);
	EXPECT_EQ(open_error(dir.file("missing.epub")), io_error_code::no_such_file);
	EXPECT_EQ(open_error(dir.file("")), io_error_code::unknown);
}

TEST(ZipArchiveTest, NotAZipMessage) {
	temp_dir dir;
	const std::string text = dir.file("notes.epub");
	write_file(text, "plain text");
	try {
		epub book(text);
		FAIL() << "plain text opened as EPUB";
	} catch (const io_error& e) {
		EXPECT_NE(std::string(e.what()).find("Not a zip archive"), std::string::npos);
	}
}

TEST(ZipArchiveTest, EmptyArchiveLacksTheContainer) {
	temp_dir dir;
	const std::string path = dir.file("empty.epub");
	write_file(path, std::string("PK\x05\x06", 4) + std::string(18, '\0'));
	try {
		epub book(path);
		FAIL() << "empty archive opened as EPUB";
	} catch (const structure_error& e) {
		EXPECT_STREQ(e.what(), "Failed to access EPUB container data: META-INF/container.xml");
	}
}

TEST(ZipArchiveTest, TruncatedArchiveIsRejected) {
	temp_dir dir;
	const std::string path = dir.file("truncated.epub");
	write_file(path, std::string("PK\x03\x04", 4) + "garbage that is not a local header");
	try {
		epub book(path);
		FAIL() << "truncated archive opened";
	} catch (const io_error& e) {
		EXPECT_EQ(e.code(), io_error_code::inconsistent);
		EXPECT_STREQ(e.what(), "Failed to read EPUB file. Zip archive inconsistent.");
	}
}

TEST(ZipArchiveTest, ArchiveCutBeforeItsCentralDirectoryIsInconsistent) {
	temp_dir dir;
	const std::string whole = dir.file("whole.epub");
	write_zip(whole, {{"mimetype", "application/epub+zip"}, {"OPS/text.xhtml", std::string(256, 'x')}});
	std::ifstream in(whole, std::ios::binary);
	const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	const std::string cut = dir.file("cut.epub");
	write_file(cut, bytes.substr(0, bytes.size() / 2));
	try {
		zip_archive archive(cut);
		FAIL() << "cut archive opened";
	} catch (const io_error& e) {
		EXPECT_EQ(e.code(), io_error_code::inconsistent);
	}
}
