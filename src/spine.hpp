/* spine.hpp - reading order.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "manifest.hpp"
#include "package_document.hpp"
#include <cstddef>
#include <vector>

namespace epubmeta {
// The linear reading order: references into a manifest, plus the navigation document item.
class spine {
public:
	spine(const package_document& package, const manifest& catalog);

	[[nodiscard]] size_t size() const noexcept {
		return items.size();
	}

	[[nodiscard]] bool empty() const noexcept {
		return items.empty();
	}

	[[nodiscard]] const manifest_item& operator[](size_t index) const {
		return *items[index];
	}

	[[nodiscard]] const manifest_item& at(size_t index) const {
		return *items.at(index);
	}

	[[nodiscard]] const manifest_item& first() const {
		return at(0);
	}

	[[nodiscard]] const manifest_item& last() const {
		return at(items.size() - 1);
	}

	[[nodiscard]] const std::vector<const manifest_item*>& item_refs() const noexcept {
		return items;
	}

	[[nodiscard]] const manifest_item& toc_item() const noexcept {
		return *toc;
	}

private:
	std::vector<const manifest_item*> items;
	const manifest_item* toc{nullptr};
};
} // namespace epubmeta
