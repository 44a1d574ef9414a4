/* cover_test.cpp - cover tests.
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
#include "utils.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace epubmeta;
using namespace epubmeta::test_support;

namespace {
const std::string PNG_DATA = std::string("\x89PNG\r\n\x1a\n", 8) + "not really an image";

bool has_member(const std::string& archive, const std::string& member) {
	const auto names = zip_member_names(archive);
	return std::ranges::find(names, member) != names.end();
}

class CoverTest : public ::testing::Test {
protected:
	void SetUp() override {
		path = write_fixture(dir);
		image = dir.file("new-cover.png");
		write_file(image, PNG_DATA);
		book = std::make_unique<epub>(path);
	}

	epub& save_and_reopen() {
		book->save();
		book = std::make_unique<epub>(path);
		return *book;
	}

	temp_dir dir;
	std::string path;
	std::string image;
	std::unique_ptr<epub> book;
};
} // namespace

TEST_F(CoverTest, ReadsTheExistingCover) {
	const auto cover = book->cover();
	ASSERT_TRUE(cover.has_value());
	EXPECT_EQ(cover->mime_type, "image/jpeg");
	EXPECT_EQ(cover->path, "OPS/images/cover.jpg");
	EXPECT_EQ(cover->data, fake_jpeg());
	EXPECT_EQ(book->cover_path(), "images/cover.jpg");
}

TEST_F(CoverTest, SetCoverSurvivesSave) {
	book->set_cover(image, "image/png");
	EXPECT_EQ(book->cover_path(), "epubmeta-cover.img");
	auto& reopened = save_and_reopen();
	const auto cover = reopened.cover();
	ASSERT_TRUE(cover.has_value());
	EXPECT_EQ(cover->mime_type, "image/png");
	EXPECT_EQ(cover->data, PNG_DATA);
	EXPECT_EQ(cover->path, "OPS/epubmeta-cover.img");
	const auto* item = reopened.manifest().find("epubmeta-cover");
	ASSERT_NE(item, nullptr);
	EXPECT_EQ(item->media_type(), "image/png");
	EXPECT_NE(reopened.manifest().find("cover-image"), nullptr);
	EXPECT_TRUE(has_member(path, "OPS/images/cover.jpg"));
}

TEST_F(CoverTest, ClearCoverRemovesOwnedImage) {
	book->set_cover(image, "image/png");
	auto& reopened = save_and_reopen();
	reopened.clear_cover();
	EXPECT_FALSE(reopened.cover().has_value());
	EXPECT_EQ(reopened.cover_path(), "");
	EXPECT_EQ(reopened.manifest().find("epubmeta-cover"), nullptr);
	auto& cleared = save_and_reopen();
	EXPECT_FALSE(cleared.cover().has_value());
	EXPECT_FALSE(has_member(path, "OPS/epubmeta-cover.img"));
}

TEST_F(CoverTest, ClearCoverKeepsForeignImages) {
	book->clear_cover();
	EXPECT_FALSE(book->cover().has_value());
	EXPECT_NE(book->manifest().find("cover-image"), nullptr);
	save_and_reopen();
	EXPECT_TRUE(has_member(path, "OPS/images/cover.jpg"));
}

TEST_F(CoverTest, ReplacingTheCoverTwiceKeepsOneItem) {
	book->set_cover(image, "image/png");
	book->set_cover(image, "image/png");
	const auto& items = book->manifest();
	EXPECT_EQ(std::ranges::count_if(items, [](const manifest_item& item) { return item.id() == "epubmeta-cover"; }), 1);
	EXPECT_EQ(items.size(), 34U);
}

TEST_F(CoverTest, UnreadableCoverIsRejected) {
	EXPECT_THROW(book->set_cover(dir.file("missing.png"), "image/png"), invalid_input_error);
	EXPECT_THROW(book->set_cover("", "image/png"), invalid_input_error);
	EXPECT_EQ(book->cover_path(), "images/cover.jpg");
}

TEST(CoverReservedIdTest, ForeignItemWithTheReservedIdIsReplaced) {
	temp_dir dir;
	std::string package = fixture_package();
	const std::string foreign = "    <item id=\"epubmeta-cover\" href=\"about.xml\" media-type=\"application/xhtml+xml\"/>\n";
	package.insert(package.find("  </manifest>"), foreign);
	const std::string path = write_fixture_with_package(dir, package);
	const std::string image = dir.file("cover.png");
	write_file(image, PNG_DATA);
	epub book(path);
	ASSERT_EQ(book.manifest().size(), 34U);
	book.set_cover(image, "image/png");
	const auto& items = book.manifest();
	EXPECT_EQ(items.size(), 34U);
	const auto* item = items.find("epubmeta-cover");
	ASSERT_NE(item, nullptr);
	EXPECT_EQ(item->href(), "epubmeta-cover.img");
	EXPECT_EQ(item->data(), PNG_DATA);
}

TEST_F(CoverTest, TitlePageIsFirstInReadingOrder) {
	book->add_cover_image_title_page();
	const auto& reading_order = book->spine();
	ASSERT_EQ(reading_order.size(), 32U);
	const auto& page = reading_order.first();
	EXPECT_EQ(page.id(), "epubmeta-titlepage");
	EXPECT_EQ(page.href(), "epubmeta-titlepage.xhtml");
	EXPECT_EQ(page.media_type(), "application/xhtml+xml");
	EXPECT_EQ(trim_string(page.contents()), "");
	EXPECT_NE(page.data().find("<img src=\"images/cover.jpg\" alt=\"Romeo and Juliet\"/>"), std::string::npos);
	EXPECT_EQ(reading_order[1].id(), "cover");

	auto& reopened = save_and_reopen();
	EXPECT_EQ(reopened.spine().first().id(), "epubmeta-titlepage");
	EXPECT_TRUE(has_member(path, "OPS/epubmeta-titlepage.xhtml"));
}

TEST_F(CoverTest, TitlePageIsAddedOnlyOnce) {
	book->add_cover_image_title_page();
	book->add_cover_image_title_page();
	EXPECT_EQ(book->spine().size(), 32U);
	EXPECT_EQ(book->manifest().size(), 34U);
}

TEST_F(CoverTest, TitlePageFromCustomTemplate) {
	book->set_title("Romeo & Juliet");
	book->add_cover_image_title_page("<html xmlns=\"http://www.w3.org/1999/xhtml\"><body><p>{{ title }}</p><p>{{ coverPath }}</p></body></html>");
	EXPECT_EQ(trim_string(book->spine().first().contents()), "Romeo & Juliet\nimages/cover.jpg");
}

TEST_F(CoverTest, RemoveTitlePage) {
	book->add_cover_image_title_page();
	auto& reopened = save_and_reopen();
	reopened.remove_title_page();
	EXPECT_EQ(reopened.spine().size(), 31U);
	EXPECT_EQ(reopened.spine().first().id(), "cover");
	EXPECT_EQ(reopened.manifest().find("epubmeta-titlepage"), nullptr);
	save_and_reopen();
	EXPECT_FALSE(has_member(path, "OPS/epubmeta-titlepage.xhtml"));
	EXPECT_TRUE(has_member(path, "OPS/title.xml"));
}

TEST_F(CoverTest, RemovingAMissingTitlePageIsHarmless) {
	book->remove_title_page();
	EXPECT_EQ(book->spine().size(), 31U);
}
