/* xml_namespace.cpp - fixed EPUB XML namespaces.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "xml_namespace.hpp"
#include "epub_error.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace epubmeta {
namespace {
struct namespace_entry {
	std::string_view prefix;
	std::string uri;
};

const std::array<namespace_entry, 5>& namespace_table() {
	static const std::array<namespace_entry, 5> table = {{
		{"ocf", OCF_NAMESPACE},
		{"opf", OPF_NAMESPACE},
		{"dc", DC_NAMESPACE},
		{"ncx", NCX_NAMESPACE},
		{"xhtml", XHTML_NAMESPACE},
	}};
	return table;
}

const namespace_entry* find_entry(std::string_view prefix) noexcept {
	const auto& table = namespace_table();
	const auto it = std::ranges::find(table, prefix, &namespace_entry::prefix);
	return it == table.end() ? nullptr : &*it;
}
} // namespace

const std::string& namespace_uri(std::string_view prefix) {
	const auto* entry = find_entry(prefix);
	if (entry == nullptr) {
		throw configuration_error("Unknown XML namespace: " + std::string(prefix));
	}
	return entry->uri;
}

bool is_known_prefix(std::string_view prefix) noexcept {
	return find_entry(prefix) != nullptr;
}

qualified_name split_qualified_name(std::string_view name) {
	const auto pos = name.find(':');
	if (pos == std::string_view::npos) {
		return {.prefix = {}, .local = std::string(name)};
	}
	return {.prefix = std::string(name.substr(0, pos)), .local = std::string(name.substr(pos + 1))};
}
} // namespace epubmeta
