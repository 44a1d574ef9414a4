/* utils_test.cpp - utils tests.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace epubmeta;

TEST(UtilsTest, TrimStringRemovesWhitespaceAndNonBreakingSpaces) {
	EXPECT_EQ(trim_string("  \n\tRomeo\n "), "Romeo");
	EXPECT_EQ(trim_string("\xC2\xA0Juliet\xC2\xA0"), "Juliet");
	EXPECT_EQ(trim_string("   "), "");
	EXPECT_EQ(trim_string(""), "");
}

TEST(UtilsTest, SplitListTrimsPieces) {
	EXPECT_EQ(split_list("John Doe, Jane Smith"), (std::vector<std::string>{"John Doe", "Jane Smith"}));
	EXPECT_EQ(split_list("single"), (std::vector<std::string>{"single"}));
	EXPECT_TRUE(split_list("").empty());
}

TEST(UtilsTest, CaseHelpers) {
	EXPECT_EQ(to_lower("UuId"), "uuid");
	EXPECT_TRUE(iequals("UuId", "UUID"));
	EXPECT_FALSE(iequals("UUID", "URN"));
	EXPECT_FALSE(iequals("UUID", "UUIDs"));
}

TEST(UtilsTest, EscapeAndUnescape) {
	EXPECT_EQ(xml_escape("Tom & \"Jerry\" <it's>"), "Tom &amp; &quot;Jerry&quot; &lt;it&apos;s&gt;");
	EXPECT_EQ(html_escape("it's"), "it&#039;s");
	EXPECT_EQ(xml_unescape("Tom &amp; Jerry &lt;3 &#65;&#x42;"), "Tom & Jerry <3 AB");
	EXPECT_EQ(xml_unescape("&#xA0;"), "\xC2\xA0");
	EXPECT_EQ(xml_unescape("&nbsp; stays"), "&nbsp; stays");
	EXPECT_EQ(xml_unescape("AT&T"), "AT&T");
}

TEST(UtilsTest, UnescapeLeavesUnencodableReferences) {
	EXPECT_EQ(xml_unescape("a&#0;b"), "a&#0;b");
	EXPECT_EQ(xml_unescape("&#xD800;"), "&#xD800;");
	EXPECT_EQ(xml_unescape("&#xDFFF;"), "&#xDFFF;");
	EXPECT_EQ(xml_unescape("&#x110000;"), "&#x110000;");
	EXPECT_EQ(xml_unescape("&#x10FFFF;"), "\xF4\x8F\xBF\xBF");
	EXPECT_EQ(xml_unescape("&#x1F600;&amp;"), "\xF0\x9F\x98\x80&");
}

TEST(UtilsTest, UrlDecode) {
	EXPECT_EQ(url_decode("images/my%20cover.jpg"), "images/my cover.jpg");
	EXPECT_EQ(url_decode("100%"), "100%");
	EXPECT_EQ(url_decode("%zz"), "%zz");
}

TEST(UtilsTest, ParentPathKeepsTrailingSlash) {
	EXPECT_EQ(parent_path("OPS/fb.opf"), "OPS/");
	EXPECT_EQ(parent_path("a/b/content.opf"), "a/b/");
	EXPECT_EQ(parent_path("content.opf"), "");
}

TEST(UtilsTest, ResolvePathCollapsesDotSegments) {
	EXPECT_EQ(resolve_path("OPS/", "main0.xml"), "OPS/main0.xml");
	EXPECT_EQ(resolve_path("OPS/text/", "../images/cover.jpg"), "OPS/images/cover.jpg");
	EXPECT_EQ(resolve_path("OPS/", "./a//b.xml"), "OPS/a/b.xml");
	EXPECT_EQ(resolve_path("", "../up.xml"), "up.xml");
}
