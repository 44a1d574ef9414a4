/* content_extractor.hpp - XHTML to text extraction.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <pugixml.hpp>
#include <string>
#include <string_view>

namespace epubmeta {
// Linearises an XHTML document into text. Extraction starts at the element with id
// fragment_begin (or the body, or the document element) and stops before the element
// with id fragment_end; empty ids mean no bound. With keep_markup, a small set of
// formatting tags is kept and text is HTML-escaped.
[[nodiscard]] std::string extract_contents(const pugi::xml_document& doc, const std::string& fragment_begin = {}, const std::string& fragment_end = {}, bool keep_markup = false);

[[nodiscard]] bool is_block_element(std::string_view tag_name) noexcept;
[[nodiscard]] bool is_kept_markup_element(std::string_view tag_name) noexcept;
} // namespace epubmeta
