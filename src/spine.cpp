/* spine.cpp - reading order.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "spine.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include <string>

namespace epubmeta {
spine::spine(const package_document& package, const manifest& catalog) {
	const auto section = package.section("opf:spine");
	if (!section) {
		throw structure_error("No spine element found in EPUB!");
	}
	const std::string toc_id = section.get_attribute("toc");
	if (toc_id.empty()) {
		throw structure_error("No toc ID given in spine!");
	}
	toc = catalog.find(toc_id);
	if (toc == nullptr) {
		throw structure_error("TOC item referenced in spine missing in manifest!");
	}
	for (const auto& itemref : section.children("opf:itemref")) {
		const std::string id = itemref.get_attribute("idref");
		const manifest_item* item = catalog.find(id);
		if (item == nullptr) {
			throw structure_error("Spine item " + id + " referenced in spine missing in manifest!");
		}
		items.push_back(item);
	}
	logger().debug("Built spine with " + std::to_string(items.size()) + " items");
}
} // namespace epubmeta
