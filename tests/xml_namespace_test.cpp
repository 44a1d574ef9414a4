/* xml_namespace_test.cpp - xml namespace tests.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_error.hpp"
#include "xml_namespace.hpp"
#include <gtest/gtest.h>

using namespace epubmeta;

TEST(XmlNamespaceTest, ResolvesFixedPrefixes) {
	EXPECT_EQ(namespace_uri("ocf"), "urn:oasis:names:tc:opendocument:xmlns:container");
	EXPECT_EQ(namespace_uri("opf"), "http://www.idpf.org/2007/opf");
	EXPECT_EQ(namespace_uri("dc"), "http://purl.org/dc/elements/1.1/");
	EXPECT_EQ(namespace_uri("ncx"), "http://www.daisy.org/z3986/2005/ncx/");
	EXPECT_EQ(namespace_uri("xhtml"), "http://www.w3.org/1999/xhtml");
}

TEST(XmlNamespaceTest, UnknownPrefixIsAConfigurationError) {
	EXPECT_THROW((void)namespace_uri("calibre"), configuration_error);
	EXPECT_THROW((void)namespace_uri(""), configuration_error);
	EXPECT_FALSE(is_known_prefix("calibre"));
	EXPECT_TRUE(is_known_prefix("dc"));
}

TEST(XmlNamespaceTest, SplitsQualifiedNames) {
	const auto creator = split_qualified_name("dc:creator");
	EXPECT_EQ(creator.prefix, "dc");
	EXPECT_EQ(creator.local, "creator");
	const auto plain = split_qualified_name("navPoint");
	EXPECT_TRUE(plain.prefix.empty());
	EXPECT_EQ(plain.local, "navPoint");
	EXPECT_EQ(split_qualified_name("a:b:c").local, "b:c");
}
