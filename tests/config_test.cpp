/* config_test.cpp - config tests.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "epub.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include "test_support.hpp"
#include <Poco/Message.h>
#include <gtest/gtest.h>
#include <string>
#include <wx/sstream.h>

using namespace epubmeta;
using namespace epubmeta::test_support;

namespace {
epub_config config_from(const std::string& ini) {
	wxStringInputStream stream(wxString::FromUTF8(ini));
	return epub_config(stream);
}

class ConfigTest : public ::testing::Test {
protected:
	void TearDown() override {
		set_log_level("warning");
	}

	temp_dir dir;
};
} // namespace

TEST_F(ConfigTest, Defaults) {
	const epub_config config;
	EXPECT_EQ(config.get_string(epub_config::cover_id), "epubmeta-cover");
	EXPECT_EQ(config.get_string(epub_config::title_page_id), "epubmeta-titlepage");
	EXPECT_EQ(config.get_string(epub_config::log_level), "warning");
	EXPECT_TRUE(config.get(epub_config::case_insensitive_schemes));
	EXPECT_NE(config.load_title_page_template().find("{{ coverPath }}"), std::string::npos);
}

TEST_F(ConfigTest, ReadsTheEpubmetaSection) {
	const auto config = config_from("[epubmeta]\ncover_id=my-cover\ncase_insensitive_schemes=false\nlog_level=debug\n");
	EXPECT_EQ(config.get_string(epub_config::cover_id), "my-cover");
	EXPECT_EQ(config.get_string(epub_config::title_page_id), "epubmeta-titlepage");
	EXPECT_FALSE(config.get(epub_config::case_insensitive_schemes));
	config.apply_log_level();
	EXPECT_EQ(logger().getLevel(), Poco::Message::PRIO_DEBUG);
}

TEST_F(ConfigTest, SetOverridesTheFile) {
	auto config = config_from("[epubmeta]\ncover_id=my-cover\n");
	config.set(epub_config::cover_id, wxString("other-cover"));
	config.set(epub_config::case_insensitive_schemes, false);
	EXPECT_EQ(config.get_string(epub_config::cover_id), "other-cover");
	EXPECT_FALSE(config.get(epub_config::case_insensitive_schemes));
}

TEST_F(ConfigTest, ReadsAnIniFile) {
	const std::string ini = dir.file("epubmeta.ini");
	write_file(ini, "[epubmeta]\ntitle_page_id=front\n");
	const epub_config config(wxString::FromUTF8(ini));
	EXPECT_EQ(config.get_string(epub_config::title_page_id), "front");
	EXPECT_THROW((void)epub_config(wxString::FromUTF8(dir.file("missing.ini"))), configuration_error);
}

TEST_F(ConfigTest, TitlePageTemplateFile) {
	const std::string page = dir.file("page.xhtml");
	write_file(page, "<html xmlns=\"http://www.w3.org/1999/xhtml\"><body><h1>{{ title }}</h1></body></html>");
	const auto config = config_from("[epubmeta]\ntitle_page_template=" + page + "\n");
	EXPECT_EQ(config.load_title_page_template(), "<html xmlns=\"http://www.w3.org/1999/xhtml\"><body><h1>{{ title }}</h1></body></html>");

	epub book(write_fixture(dir), config);
	book.add_cover_image_title_page();
	EXPECT_EQ(book.spine().first().contents(), "Romeo and Juliet\n");

	const auto broken = config_from("[epubmeta]\ntitle_page_template=" + dir.file("missing.xhtml") + "\n");
	EXPECT_THROW((void)broken.load_title_page_template(), configuration_error);
}

TEST_F(ConfigTest, ReservedIdsAreConfigurable) {
	const auto config = config_from("[epubmeta]\ncover_id=front-image\ntitle_page_id=front-page\n");
	epub book(write_fixture(dir), config);
	const std::string image = dir.file("cover.jpg");
	write_file(image, fake_jpeg());
	book.set_cover(image, "image/jpeg");
	book.add_cover_image_title_page();
	EXPECT_EQ(book.cover_path(), "front-image.img");
	EXPECT_EQ(book.spine().first().id(), "front-page");
	EXPECT_EQ(book.spine().first().href(), "front-page.xhtml");
}

TEST_F(ConfigTest, InvalidSettingsAreRejected) {
	const std::string path = write_fixture(dir);
	EXPECT_THROW((void)epub(path, config_from("[epubmeta]\nlog_level=chatty\n")), configuration_error);
	EXPECT_THROW((void)epub(path, config_from("[epubmeta]\ncover_id=same\ntitle_page_id=same\n")), configuration_error);
	EXPECT_THROW((void)epub(path, config_from("[epubmeta]\ncover_id=\n")), configuration_error);
	EXPECT_THROW(set_log_level("chatty"), configuration_error);
}

TEST_F(ConfigTest, SchemeMatchingCaseFolding) {
	std::string package = fixture_package();
	package.replace(package.find("opf:scheme=\"uuid\""), 17, "opf:scheme=\"Uuid\"");
	const std::string path = write_fixture_with_package(dir, package);
	{
		epub book(path);
		EXPECT_EQ(book.uuid(), "urn:uuid:7d38d098-4234-11e1-97b6-001cc0a62c0b");
	}
	epub compat(path, config_from("[epubmeta]\ncase_insensitive_schemes=false\n"));
	EXPECT_EQ(compat.uuid(), "");
	EXPECT_EQ(compat.uri(), "http://www.feedbooks.com/book/2936");
}
