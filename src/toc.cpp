/* toc.cpp - NCX table of contents.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "toc.hpp"
#include "document_loader.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <charconv>
#include <functional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace epubmeta {
namespace {
int parse_play_order(const std::string& value) {
	int result{0};
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
	if (ec != std::errc{}) {
		return 0;
	}
	return result;
}
} // namespace

toc::toc(const zip_archive& archive, const package_document& package, const manifest& items, const manifest_item& ncx) {
	const std::string ncx_path = package.directory() + ncx.href();
	const auto doc = load_xml_member(archive, ncx_path);
	const epub_element root(doc->documentElement());
	title = root.first_child("docTitle").first_child("text").unescaped_text();
	author = root.first_child("docAuthor").first_child("text").unescaped_text();
	for (const auto& child : root.first_child("navMap").children("navPoint")) {
		points.push_back(parse_nav_point(child));
	}
	std::set<std::string> declared;
	for (const auto& item : items) {
		declared.insert(resolve_path(package.directory(), url_decode(item.href())));
	}
	check_references(points, parent_path(ncx_path), declared);
	logger().debug("Built table of contents with " + std::to_string(points.size()) + " top level entries");
}

nav_point toc::parse_nav_point(const epub_element& element) {
	nav_point point;
	point.id = element.get_attribute("id");
	point.nav_class = element.get_attribute("class");
	point.play_order = parse_play_order(element.get_attribute("playOrder"));
	point.label = element.first_child("navLabel").first_child("text").unescaped_text();
	const std::string src = element.first_child("content").get_attribute("src");
	const auto hash = src.find('#');
	point.content_source = src.substr(0, hash);
	if (hash != std::string::npos) {
		point.content_fragment = src.substr(hash + 1);
	}
	for (const auto& child : element.children("navPoint")) {
		point.children.push_back(parse_nav_point(child));
	}
	return point;
}

void toc::check_references(const std::vector<nav_point>& level, const std::string& base, const std::set<std::string>& declared) {
	for (const auto& point : level) {
		if (!point.content_source.empty() && !declared.contains(resolve_path(base, url_decode(point.content_source)))) {
			throw structure_error("TOC entry " + point.id + " references " + point.content_source + " missing in manifest!");
		}
		check_references(point.children, base, declared);
	}
}

std::vector<const nav_point*> toc::find_nav_points_for_file(const std::string& file) const {
	std::vector<const nav_point*> result;
	std::function<void(const std::vector<nav_point>&)> collect = [&](const std::vector<nav_point>& level) {
		for (const auto& point : level) {
			if (point.content_source == file) {
				result.push_back(&point);
			}
			collect(point.children);
		}
	};
	collect(points);
	return result;
}
} // namespace epubmeta
