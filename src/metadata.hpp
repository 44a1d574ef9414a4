/* metadata.hpp - Dublin Core metadata access.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "dom_element.hpp"
#include "package_document.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace epubmeta {
// Restricts a metadata query to elements whose attribute carries one of the given values.
struct attribute_filter {
	std::string name;
	std::vector<std::string> values;
	bool case_insensitive{false};

	[[nodiscard]] bool empty() const noexcept {
		return name.empty();
	}
};

// (file_as, name) pairs in document order, unique by file_as.
using author_list = std::vector<std::pair<std::string, std::string>>;

class metadata {
public:
	// With full_case_folding off, case-insensitive filters only accept the all-lowercase
	// and all-uppercase spellings of each value.
	metadata(package_document& package, bool full_case_folding) : package{package}, full_case_folding{full_case_folding} {
	}

	[[nodiscard]] std::vector<epub_element> find(std::string_view element, const attribute_filter& filter = {}) const;
	// Unescaped text of the first match, or an empty string.
	[[nodiscard]] std::string get_singleton(std::string_view element, const attribute_filter& filter = {}) const;
	// Updates a single match in place; otherwise replaces all matches with one new element.
	// An empty value removes the field.
	void set_singleton(std::string_view element, const std::string& value, const attribute_filter& filter = {});

	[[nodiscard]] author_list authors() const;
	void set_authors(const author_list& authors);
	void set_authors(const std::vector<std::string>& names);
	void set_authors(const std::string& names);
	[[nodiscard]] std::vector<std::string> subjects() const;
	void set_subjects(const std::vector<std::string>& subjects);
	void set_subjects(const std::string& subjects);

	[[nodiscard]] std::string unique_identifier() const;
	void set_unique_identifier(const std::string& value);

private:
	[[nodiscard]] bool matches(const epub_element& element, const attribute_filter& filter) const;
	[[nodiscard]] epub_element require_metadata() const;
	void remove_all(std::string_view element, const attribute_filter& filter = {});
	// Creators with the aut role, or every creator when none has it.
	[[nodiscard]] std::vector<epub_element> author_nodes() const;

	package_document& package;
	bool full_case_folding;
};

[[nodiscard]] attribute_filter scheme_filter(std::vector<std::string> schemes);
} // namespace epubmeta
