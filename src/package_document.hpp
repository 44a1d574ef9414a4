/* package_document.hpp - OPF package document.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "dom_element.hpp"
#include "zip_archive.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/DOM/Document.h>
#include <string>
#include <string_view>
#include <vector>

namespace epubmeta {
// The OPF package document of an open archive. Every mutation must be followed by resync(),
// which round-trips the DOM through its serialized form and bumps revision() so that
// structures derived from the previous tree can be discarded.
class package_document {
public:
	package_document(const zip_archive& archive, const std::string& path);
	~package_document() = default;
	package_document(const package_document&) = delete;
	package_document& operator=(const package_document&) = delete;
	package_document(package_document&&) = default;
	package_document& operator=(package_document&&) = default;

	[[nodiscard]] const std::string& path() const noexcept {
		return file_path;
	}

	// Directory of the package document inside the archive, with a trailing slash, or empty.
	[[nodiscard]] const std::string& directory() const noexcept {
		return dir;
	}

	[[nodiscard]] unsigned revision() const noexcept {
		return rev;
	}

	[[nodiscard]] epub_element root() const;
	// Direct child of the package element ("opf:metadata", "opf:manifest", ...); invalid when absent.
	[[nodiscard]] epub_element section(std::string_view name) const;
	// Children of a section matching name, in document order. Empty when the section is absent.
	[[nodiscard]] std::vector<epub_element> section_children(std::string_view section_name, std::string_view name) const;
	// First manifest item with the given id; invalid when absent.
	[[nodiscard]] epub_element manifest_item(const std::string& id) const;
	[[nodiscard]] std::string serialize() const;
	void resync();

private:
	std::string file_path;
	std::string dir;
	Poco::AutoPtr<Poco::XML::Document> document;
	unsigned rev{0};
};
} // namespace epubmeta
