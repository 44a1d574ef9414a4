/* html_entities_test.cpp - html entities tests.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_entities.hpp"
#include <gtest/gtest.h>

using namespace epubmeta;

TEST(HtmlEntitiesTest, LooksUpCodePoints) {
	EXPECT_EQ(html_entity_code_point("nbsp"), U'\u00A0');
	EXPECT_EQ(html_entity_code_point("yuml"), U'\u00FF');
	EXPECT_EQ(html_entity_code_point("Yuml"), U'\u0178');
	EXPECT_EQ(html_entity_code_point("mdash"), U'\u2014');
	EXPECT_EQ(html_entity_code_point("hearts"), U'\u2665');
	EXPECT_EQ(html_entity_code_point("amp"), 0U);
	EXPECT_EQ(html_entity_code_point("bogus"), 0U);
}

TEST(HtmlEntitiesTest, ConvertsNamedEntitiesToNumericReferences) {
	EXPECT_EQ(convert_named_entities_to_numeric("a&nbsp;b&mdash;c"), "a&#160;b&#8212;c");
	EXPECT_EQ(convert_named_entities_to_numeric("&eacute;t&eacute;"), "&#233;t&#233;");
}

TEST(HtmlEntitiesTest, LeavesXmlEntitiesAndUnknownNamesAlone) {
	EXPECT_EQ(convert_named_entities_to_numeric("&amp;&lt;&gt;&quot;&apos;"), "&amp;&lt;&gt;&quot;&apos;");
	EXPECT_EQ(convert_named_entities_to_numeric("&bogus; &#160; AT&T"), "&bogus; &#160; AT&T");
	EXPECT_EQ(convert_named_entities_to_numeric("&nbsp"), "&nbsp");
}
