/* manifest.cpp - manifest items.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "manifest.hpp"
#include "content_extractor.hpp"
#include "document_loader.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include <cstddef>
#include <string>

namespace epubmeta {
const std::string& manifest_item::data() const {
	if (!cached_data) {
		cached_data = loader();
	}
	return *cached_data;
}

std::string manifest_item::contents(const std::string& fragment_begin, const std::string& fragment_end, bool keep_markup) const {
	const auto doc = load_xhtml(data(), item_href);
	return extract_contents(*doc, fragment_begin, fragment_end, keep_markup);
}

manifest::manifest(const package_document& package, const zip_archive& archive) {
	const auto section = package.section("opf:manifest");
	if (!section) {
		throw structure_error("No manifest element found in EPUB!");
	}
	const zip_archive* source = &archive;
	for (const auto& element : section.children("opf:item")) {
		std::string id = element.get_attribute("id");
		if (index_by_id.contains(id)) {
			throw structure_error("Duplicate manifest item id: " + id);
		}
		std::string href = element.get_attribute("href");
		std::string member = package.directory() + href;
		const size_t size = archive.size(member);
		index_by_id.emplace(id, items.size());
		items.emplace_back(std::move(id), std::move(href), element.get_attribute("media-type"), size, [source, member] {
			auto data = source->read(member);
			if (!data) {
				throw structure_error("Failed to access EPUB container data: " + member);
			}
			return std::move(*data);
		});
	}
	logger().debug("Built manifest with " + std::to_string(items.size()) + " items");
}

const manifest_item* manifest::find(const std::string& id) const {
	const auto it = index_by_id.find(id);
	return it == index_by_id.end() ? nullptr : &items[it->second];
}
} // namespace epubmeta
