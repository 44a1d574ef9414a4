/* epub.hpp - EPUB book facade.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "manifest.hpp"
#include "metadata.hpp"
#include "package_document.hpp"
#include "spine.hpp"
#include "toc.hpp"
#include "zip_archive.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epubmeta {
struct cover_image {
	std::string mime_type;
	std::string data;
	// Archive member path.
	std::string path;
};

// An EPUB file opened for reading and metadata editing. Changes are kept in memory and
// written back to the file by save().
class epub {
public:
	explicit epub(const std::string& path, const epub_config& config = epub_config{});
	~epub() = default;
	epub(const epub&) = delete;
	epub& operator=(const epub&) = delete;
	epub(epub&&) noexcept = default;
	epub& operator=(epub&&) noexcept = default;

	[[nodiscard]] const std::string& filename() const noexcept {
		return archive->path();
	}

	void save();

	[[nodiscard]] std::string title() const;
	void set_title(const std::string& title);
	[[nodiscard]] std::string language() const;
	void set_language(const std::string& language);
	[[nodiscard]] std::string publisher() const;
	void set_publisher(const std::string& publisher);
	[[nodiscard]] std::string copyright() const;
	void set_copyright(const std::string& copyright);
	[[nodiscard]] std::string description() const;
	void set_description(const std::string& description);
	[[nodiscard]] std::string unique_identifier() const;
	void set_unique_identifier(const std::string& identifier);
	[[nodiscard]] std::string uuid() const;
	void set_uuid(const std::string& uuid);
	[[nodiscard]] std::string uri() const;
	void set_uri(const std::string& uri);
	[[nodiscard]] std::string isbn() const;
	void set_isbn(const std::string& isbn);
	[[nodiscard]] std::string google() const;
	void set_google(const std::string& google);
	[[nodiscard]] std::string amazon() const;
	void set_amazon(const std::string& amazon);
	[[nodiscard]] std::string identifier(const std::string& scheme) const;
	void set_identifier(const std::string& scheme, const std::string& value);

	[[nodiscard]] author_list authors() const;
	void set_authors(const author_list& authors);
	void set_authors(const std::vector<std::string>& names);
	void set_authors(const std::string& names);
	[[nodiscard]] std::vector<std::string> subjects() const;
	void set_subjects(const std::vector<std::string>& subjects);
	void set_subjects(const std::string& subjects);

	[[nodiscard]] std::optional<cover_image> cover() const;
	// href of the cover image relative to the package document, or empty.
	[[nodiscard]] std::string cover_path() const;
	void set_cover(const std::string& path, const std::string& mime_type);
	void clear_cover();
	// Uses the configured title page template.
	void add_cover_image_title_page();
	void add_cover_image_title_page(const std::string& page_template);
	void remove_title_page();

	[[nodiscard]] const epubmeta::manifest& manifest() const;
	[[nodiscard]] const epubmeta::spine& spine() const;
	[[nodiscard]] const epubmeta::toc& toc() const;
	// Concatenated contents of the spine items. With fraction below 1, only the leading items
	// whose cumulative size stays within that share of the total are included.
	[[nodiscard]] std::string contents(bool keep_markup = false, double fraction = 1.0) const;

private:
	[[nodiscard]] epubmeta::metadata meta() const {
		return epubmeta::metadata(*package, full_case_folding);
	}

	[[nodiscard]] epub_element require_section(std::string_view name) const;
	void drop_stale_caches() const;
	void drop_caches() const;

	std::unique_ptr<zip_archive> archive;
	std::unique_ptr<package_document> package;
	std::string cover_id;
	std::string title_page_id;
	std::string title_page_template;
	bool full_case_folding{true};
	unsigned saved_revision{0};
	mutable unsigned cache_revision{0};
	mutable std::unique_ptr<epubmeta::manifest> manifest_cache;
	mutable std::unique_ptr<epubmeta::spine> spine_cache;
	mutable std::unique_ptr<epubmeta::toc> toc_cache;
};
} // namespace epubmeta
