/* manifest.hpp - manifest items.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "package_document.hpp"
#include "zip_archive.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace epubmeta {
class manifest_item {
public:
	using data_loader = std::function<std::string()>;

	manifest_item(std::string id, std::string href, std::string media_type, size_t size, data_loader loader) : item_id{std::move(id)}, item_href{std::move(href)}, type{std::move(media_type)}, item_size{size}, loader{std::move(loader)} {
	}

	[[nodiscard]] const std::string& id() const noexcept {
		return item_id;
	}

	// Path relative to the package document's directory, as written in the manifest.
	[[nodiscard]] const std::string& href() const noexcept {
		return item_href;
	}

	[[nodiscard]] const std::string& media_type() const noexcept {
		return type;
	}

	// Uncompressed size according to the archive index, 0 when unknown.
	[[nodiscard]] size_t size() const noexcept {
		return item_size;
	}

	// Raw member data, read on first access and cached.
	[[nodiscard]] const std::string& data() const;
	// Text of the XHTML document, optionally limited to the range between two element ids.
	[[nodiscard]] std::string contents(const std::string& fragment_begin = {}, const std::string& fragment_end = {}, bool keep_markup = false) const;

private:
	std::string item_id;
	std::string item_href;
	std::string type;
	size_t item_size{0};
	data_loader loader;
	mutable std::optional<std::string> cached_data;
};

// All resources declared by the package document, in declaration order.
class manifest {
public:
	manifest(const package_document& package, const zip_archive& archive);
	~manifest() = default;
	manifest(const manifest&) = delete;
	manifest& operator=(const manifest&) = delete;
	manifest(manifest&&) = delete;
	manifest& operator=(manifest&&) = delete;

	[[nodiscard]] size_t size() const noexcept {
		return items.size();
	}

	[[nodiscard]] bool empty() const noexcept {
		return items.empty();
	}

	[[nodiscard]] const manifest_item& operator[](size_t index) const {
		return items[index];
	}

	[[nodiscard]] const manifest_item& at(size_t index) const {
		return items.at(index);
	}

	[[nodiscard]] auto begin() const noexcept {
		return items.begin();
	}

	[[nodiscard]] auto end() const noexcept {
		return items.end();
	}

	[[nodiscard]] const manifest_item* find(const std::string& id) const;

private:
	std::vector<manifest_item> items;
	std::map<std::string, size_t> index_by_id;
};
} // namespace epubmeta
