/* content_extractor.cpp - XHTML to text extraction.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "content_extractor.hpp"
#include "epub_error.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace epubmeta {
namespace {
std::string local_tag_name(const pugi::xml_node& node) {
	const std::string_view name = node.name();
	const auto pos = name.find(':');
	return to_lower(pos == std::string_view::npos ? name : name.substr(pos + 1));
}

bool has_id(const pugi::xml_node& node, const std::string& id) {
	return node.type() == pugi::node_element && id == node.attribute("id").value();
}

pugi::xml_node find_start_node(const pugi::xml_document& doc, const std::string& fragment_begin) {
	if (!fragment_begin.empty()) {
		auto node = doc.find_node([&](const pugi::xml_node& n) {
			return has_id(n, fragment_begin);
		});
		if (!node) {
			throw not_found_error("Begin of fragment not found: No element with ID " + fragment_begin + "!");
		}
		return node;
	}
	auto body = doc.find_node([](const pugi::xml_node& n) {
		return n.type() == pugi::node_element && local_tag_name(n) == "body";
	});
	return body ? body : doc.document_element();
}
} // namespace

bool is_block_element(std::string_view tag_name) noexcept {
	constexpr std::array<std::string_view, 36> block_elements = {
		"address",
		"article",
		"aside",
		"blockquote",
		"canvas",
		"dd",
		"div",
		"dl",
		"dt",
		"fieldset",
		"figcaption",
		"figure",
		"footer",
		"form",
		"h1",
		"h2",
		"h3",
		"h4",
		"h5",
		"h6",
		"header",
		"hgroup",
		"hr",
		"li",
		"main",
		"nav",
		"noscript",
		"ol",
		"output",
		"p",
		"pre",
		"section",
		"table",
		"tfoot",
		"ul",
		"video",
	};
	return !tag_name.empty() && std::ranges::find(block_elements, tag_name) != block_elements.end();
}

bool is_kept_markup_element(std::string_view tag_name) noexcept {
	constexpr std::array<std::string_view, 16> kept = {"br", "p", "h1", "h2", "h3", "h4", "h5", "span", "div", "i", "strong", "b", "table", "td", "th", "tr"};
	return std::ranges::find(kept, tag_name) != kept.end();
}

std::string extract_contents(const pugi::xml_document& doc, const std::string& fragment_begin, const std::string& fragment_end, bool keep_markup) {
	pugi::xml_node node = find_start_node(doc, fragment_begin);
	std::string contents;
	// Closing markers of the elements entered so far, emitted when their subtree is left.
	std::vector<std::string> end_tags;
	auto reached_end = [&](const pugi::xml_node& n) {
		return !fragment_end.empty() && has_id(n, fragment_end);
	};
	while (node && !reached_end(node)) {
		const auto type = node.type();
		if (type == pugi::node_pcdata || type == pugi::node_cdata) {
			contents += keep_markup ? html_escape(node.value()) : std::string(node.value());
		} else if (type == pugi::node_element) {
			const std::string tag = local_tag_name(node);
			if (keep_markup && is_kept_markup_element(tag)) {
				contents += "<" + tag + ">";
				end_tags.push_back("</" + tag + ">");
			} else if (is_block_element(tag)) {
				end_tags.emplace_back("\n");
			} else {
				end_tags.emplace_back();
			}
			if (node.first_child()) {
				node = node.first_child();
				continue;
			}
		}
		while (node) {
			if (node.type() == pugi::node_element && !end_tags.empty()) {
				contents += end_tags.back();
				end_tags.pop_back();
			}
			if (node.next_sibling()) {
				node = node.next_sibling();
				break;
			}
			node = node.parent();
			if (!node && !fragment_end.empty()) {
				throw not_found_error("End of fragment not found: No element with ID " + fragment_end + "!");
			}
		}
	}
	while (!end_tags.empty()) {
		contents += end_tags.back();
		end_tags.pop_back();
	}
	return contents;
}
} // namespace epubmeta
