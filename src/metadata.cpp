/* metadata.cpp - Dublin Core metadata access.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "metadata.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace epubmeta {
namespace {
const std::string UNIQUE_IDENTIFIER_ATTRIBUTE = "unique-identifier";
const std::string DEFAULT_UNIQUE_IDENTIFIER_ID = "uid";

std::string to_upper(std::string_view input) {
	std::string out(input);
	std::ranges::transform(out, out.begin(), [](unsigned char c) {
		return static_cast<char>(std::toupper(c));
	});
	return out;
}
} // namespace

attribute_filter scheme_filter(std::vector<std::string> schemes) {
	return {.name = "opf:scheme", .values = std::move(schemes), .case_insensitive = true};
}

bool metadata::matches(const epub_element& element, const attribute_filter& filter) const {
	if (filter.empty()) {
		return true;
	}
	if (!element.has_attribute(filter.name)) {
		return false;
	}
	const std::string actual = element.get_attribute(filter.name);
	return std::ranges::any_of(filter.values, [&](const std::string& value) {
		if (!filter.case_insensitive) {
			return actual == value;
		}
		if (full_case_folding) {
			return iequals(actual, value);
		}
		return actual == to_lower(value) || actual == to_upper(value);
	});
}

epub_element metadata::require_metadata() const {
	auto section = package.section("opf:metadata");
	if (!section) {
		throw structure_error("No metadata element found in EPUB!");
	}
	return section;
}

std::vector<epub_element> metadata::find(std::string_view element, const attribute_filter& filter) const {
	std::vector<epub_element> result;
	for (const auto& child : package.section_children("opf:metadata", element)) {
		if (matches(child, filter)) {
			result.push_back(child);
		}
	}
	return result;
}

std::string metadata::get_singleton(std::string_view element, const attribute_filter& filter) const {
	const auto nodes = find(element, filter);
	return nodes.empty() ? std::string() : nodes.front().unescaped_text();
}

void metadata::set_singleton(std::string_view element, const std::string& value, const attribute_filter& filter) {
	auto parent = require_metadata();
	auto nodes = find(element, filter);
	if (nodes.size() == 1) {
		if (value.empty()) {
			nodes.front().remove();
		} else {
			nodes.front().set_unescaped_text(value);
		}
	} else {
		for (auto& node : nodes) {
			node.remove();
		}
		if (!value.empty()) {
			auto node = parent.new_child(element, value);
			if (!filter.empty() && !filter.values.empty()) {
				node.set_attribute(filter.name, filter.values.front());
			}
		}
	}
	package.resync();
}

void metadata::remove_all(std::string_view element, const attribute_filter& filter) {
	for (auto& node : find(element, filter)) {
		node.remove();
	}
}

std::vector<epub_element> metadata::author_nodes() const {
	auto nodes = find("dc:creator", {.name = "opf:role", .values = {"aut"}});
	if (nodes.empty()) {
		nodes = find("dc:creator");
		if (!nodes.empty()) {
			logger().debug("No creator has the aut role; using all creators as authors");
		}
	}
	return nodes;
}

author_list metadata::authors() const {
	author_list result;
	for (const auto& node : author_nodes()) {
		std::string name = node.unescaped_text();
		std::string file_as = node.get_attribute("opf:file-as");
		if (file_as.empty()) {
			file_as = name;
		}
		// A repeated file-as keeps its first position and takes the later name.
		const auto existing = std::ranges::find(result, file_as, &author_list::value_type::first);
		if (existing != result.end()) {
			existing->second = std::move(name);
		} else {
			result.emplace_back(std::move(file_as), std::move(name));
		}
	}
	return result;
}

void metadata::set_authors(const author_list& authors) {
	auto parent = require_metadata();
	for (auto& node : author_nodes()) {
		node.remove();
	}
	for (const auto& [file_as, name] : authors) {
		auto node = parent.new_child("dc:creator", name);
		node.set_attribute("opf:role", "aut");
		node.set_attribute("opf:file-as", file_as.empty() ? name : file_as);
	}
	package.resync();
}

void metadata::set_authors(const std::vector<std::string>& names) {
	author_list authors;
	for (const auto& name : names) {
		if (!name.empty()) {
			authors.emplace_back(name, name);
		}
	}
	set_authors(authors);
}

void metadata::set_authors(const std::string& names) {
	set_authors(split_list(names));
}

std::vector<std::string> metadata::subjects() const {
	std::vector<std::string> result;
	for (const auto& node : find("dc:subject")) {
		result.push_back(node.unescaped_text());
	}
	return result;
}

void metadata::set_subjects(const std::vector<std::string>& subjects) {
	auto parent = require_metadata();
	remove_all("dc:subject");
	for (const auto& subject : subjects) {
		if (!subject.empty()) {
			parent.new_child("dc:subject", subject);
		}
	}
	package.resync();
}

void metadata::set_subjects(const std::string& subjects) {
	set_subjects(split_list(subjects));
}

std::string metadata::unique_identifier() const {
	const std::string id = package.root().get_attribute(UNIQUE_IDENTIFIER_ATTRIBUTE);
	if (id.empty()) {
		return {};
	}
	return get_singleton("dc:identifier", {.name = "id", .values = {id}});
}

void metadata::set_unique_identifier(const std::string& value) {
	std::string id = package.root().get_attribute(UNIQUE_IDENTIFIER_ATTRIBUTE);
	if (id.empty()) {
		id = DEFAULT_UNIQUE_IDENTIFIER_ID;
		package.root().set_attribute(UNIQUE_IDENTIFIER_ATTRIBUTE, id);
		package.resync();
	}
	set_singleton("dc:identifier", value, {.name = "id", .values = {id}});
}
} // namespace epubmeta
