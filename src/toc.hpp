/* toc.hpp - NCX table of contents.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "dom_element.hpp"
#include "manifest.hpp"
#include "package_document.hpp"
#include "zip_archive.hpp"
#include <set>
#include <string>
#include <vector>

namespace epubmeta {
struct nav_point {
	std::string id;
	std::string nav_class;
	int play_order{0};
	std::string label;
	// content/@src split at the first '#'.
	std::string content_source;
	std::string content_fragment;
	std::vector<nav_point> children;
};

// Table of contents read from the NCX navigation document. The nav point tree mirrors the
// nesting of the document exactly.
class toc {
public:
	toc() = default;
	// Throws structure_error when a nav point refers to a file the manifest does not declare.
	toc(const zip_archive& archive, const package_document& package, const manifest& items, const manifest_item& ncx);

	[[nodiscard]] const std::string& doc_title() const noexcept {
		return title;
	}

	[[nodiscard]] const std::string& doc_author() const noexcept {
		return author;
	}

	[[nodiscard]] const std::vector<nav_point>& nav_map() const noexcept {
		return points;
	}

	// Every nav point, at any depth, whose content source is file; in document order.
	[[nodiscard]] std::vector<const nav_point*> find_nav_points_for_file(const std::string& file) const;

private:
	static nav_point parse_nav_point(const epub_element& element);
	static void check_references(const std::vector<nav_point>& level, const std::string& base, const std::set<std::string>& declared);

	std::string title;
	std::string author;
	std::vector<nav_point> points;
};
} // namespace epubmeta
