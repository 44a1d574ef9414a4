/* epub.cpp - EPUB book facade.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub.hpp"
#include "constants.hpp"
#include "document_loader.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "xml_namespace.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/filename.h>
#include <wx/string.h>

namespace epubmeta {
namespace {
const attribute_filter COVER_POINTER{.name = "name", .values = {"cover"}};

std::string replace_all(std::string text, const std::string& placeholder, const std::string& value) {
	size_t pos = 0;
	while ((pos = text.find(placeholder, pos)) != std::string::npos) {
		text.replace(pos, placeholder.size(), value);
		pos += value.size();
	}
	return text;
}
} // namespace

epub::epub(const std::string& path, const epub_config& config) : archive{std::make_unique<zip_archive>(path)} {
	config.apply_log_level();
	cover_id = config.get_string(epub_config::cover_id);
	title_page_id = config.get_string(epub_config::title_page_id);
	title_page_template = config.load_title_page_template();
	full_case_folding = config.get(epub_config::case_insensitive_schemes);
	if (cover_id.empty() || title_page_id.empty() || cover_id == title_page_id) {
		throw configuration_error("Reserved cover and title page ids must be distinct and non-empty");
	}
	package = std::make_unique<package_document>(*archive, find_package_path(*archive));
	logger().debug("Loaded package document " + package->path());
}

void epub::save() {
	if (package->revision() != saved_revision) {
		archive->write(package->path(), package->serialize());
	}
	archive->commit();
	saved_revision = package->revision();
	drop_caches();
}

std::string epub::title() const {
	return meta().get_singleton("dc:title");
}

void epub::set_title(const std::string& title) {
	meta().set_singleton("dc:title", title);
}

std::string epub::language() const {
	return meta().get_singleton("dc:language");
}

void epub::set_language(const std::string& language) {
	meta().set_singleton("dc:language", language);
}

std::string epub::publisher() const {
	return meta().get_singleton("dc:publisher");
}

void epub::set_publisher(const std::string& publisher) {
	meta().set_singleton("dc:publisher", publisher);
}

std::string epub::copyright() const {
	return meta().get_singleton("dc:rights");
}

void epub::set_copyright(const std::string& copyright) {
	meta().set_singleton("dc:rights", copyright);
}

std::string epub::description() const {
	return meta().get_singleton("dc:description");
}

void epub::set_description(const std::string& description) {
	meta().set_singleton("dc:description", description);
}

std::string epub::unique_identifier() const {
	return meta().unique_identifier();
}

void epub::set_unique_identifier(const std::string& identifier) {
	meta().set_unique_identifier(identifier);
}

std::string epub::uuid() const {
	return meta().get_singleton("dc:identifier", scheme_filter({"UUID", "URN"}));
}

void epub::set_uuid(const std::string& uuid) {
	meta().set_singleton("dc:identifier", uuid, scheme_filter({"UUID", "URN"}));
}

std::string epub::uri() const {
	return identifier("URI");
}

void epub::set_uri(const std::string& uri) {
	set_identifier("URI", uri);
}

std::string epub::isbn() const {
	return identifier("ISBN");
}

void epub::set_isbn(const std::string& isbn) {
	set_identifier("ISBN", isbn);
}

std::string epub::google() const {
	return identifier("GOOGLE");
}

void epub::set_google(const std::string& google) {
	set_identifier("GOOGLE", google);
}

std::string epub::amazon() const {
	return identifier("AMAZON");
}

void epub::set_amazon(const std::string& amazon) {
	set_identifier("AMAZON", amazon);
}

std::string epub::identifier(const std::string& scheme) const {
	return meta().get_singleton("dc:identifier", scheme_filter({scheme}));
}

void epub::set_identifier(const std::string& scheme, const std::string& value) {
	if (scheme.empty()) {
		throw invalid_input_error("Identifier scheme must not be empty");
	}
	meta().set_singleton("dc:identifier", value, scheme_filter({scheme}));
}

author_list epub::authors() const {
	return meta().authors();
}

void epub::set_authors(const author_list& authors) {
	meta().set_authors(authors);
}

void epub::set_authors(const std::vector<std::string>& names) {
	meta().set_authors(names);
}

void epub::set_authors(const std::string& names) {
	meta().set_authors(names);
}

std::vector<std::string> epub::subjects() const {
	return meta().subjects();
}

void epub::set_subjects(const std::vector<std::string>& subjects) {
	meta().set_subjects(subjects);
}

void epub::set_subjects(const std::string& subjects) {
	meta().set_subjects(subjects);
}

std::optional<cover_image> epub::cover() const {
	const auto pointers = meta().find("opf:meta", COVER_POINTER);
	if (pointers.empty()) {
		return std::nullopt;
	}
	const auto item = package->manifest_item(pointers.front().get_attribute("content"));
	if (!item) {
		return std::nullopt;
	}
	const std::string path = package->directory() + item.get_attribute("href");
	auto data = archive->read(path);
	if (!data) {
		logger().warning("Cover image " + path + " is missing from the archive");
		return std::nullopt;
	}
	return cover_image{.mime_type = item.get_attribute("media-type"), .data = std::move(*data), .path = path};
}

std::string epub::cover_path() const {
	const auto pointers = meta().find("opf:meta", COVER_POINTER);
	if (pointers.empty()) {
		return {};
	}
	return package->manifest_item(pointers.front().get_attribute("content")).get_attribute("href");
}

void epub::set_cover(const std::string& path, const std::string& mime_type) {
	if (path.empty() || !wxFileName::IsFileReadable(wxString::FromUTF8(path))) {
		throw invalid_input_error("Cover image is not a readable file: " + path);
	}
	clear_cover();
	auto metadata_section = require_section("opf:metadata");
	auto manifest_section = require_section("opf:manifest");
	const std::string href = cover_id + COVER_MEMBER_EXTENSION;
	archive->write_file(package->directory() + href, path);
	if (auto existing = package->manifest_item(cover_id)) {
		logger().warning("Replacing manifest item " + cover_id + " that is not referenced as cover");
		existing.remove();
	}
	auto pointer = metadata_section.new_child("opf:meta");
	pointer.set_attribute("name", "cover");
	pointer.set_attribute("content", cover_id);
	auto item = manifest_section.new_child("opf:item");
	item.set_attribute("id", cover_id);
	item.set_attribute("href", href);
	item.set_attribute("media-type", mime_type);
	package->resync();
	logger().debug("Set cover image from " + path);
}

void epub::clear_cover() {
	const auto pointers = meta().find("opf:meta", COVER_POINTER);
	if (pointers.empty()) {
		return;
	}
	std::vector<epub_element> owned_items;
	for (const auto& pointer : pointers) {
		const std::string id = pointer.get_attribute("content");
		if (id != cover_id) {
			continue;
		}
		if (auto item = package->manifest_item(id)) {
			owned_items.push_back(item);
		}
	}
	for (auto pointer : pointers) {
		pointer.remove();
	}
	for (auto& item : owned_items) {
		archive->remove(package->directory() + item.get_attribute("href"));
		item.remove();
	}
	package->resync();
	logger().debug("Cleared cover image");
}

void epub::add_cover_image_title_page() {
	add_cover_image_title_page(title_page_template);
}

void epub::add_cover_image_title_page(const std::string& page_template) {
	require_section("opf:manifest");
	require_section("opf:spine");
	remove_title_page();
	const std::string image = cover_path();
	if (image.empty()) {
		logger().warning("Adding a title page to a book without cover image");
	}
	std::string page = replace_all(page_template, TITLE_PLACEHOLDER, xml_escape(title()));
	page = replace_all(page, COVER_PATH_PLACEHOLDER, xml_escape(image));
	const std::string href = title_page_id + TITLE_PAGE_MEMBER_EXTENSION;

	auto item = require_section("opf:manifest").insert_child_first("opf:item");
	item.set_attribute("id", title_page_id);
	item.set_attribute("href", href);
	item.set_attribute("media-type", XHTML_MEDIA_TYPE);
	auto itemref = require_section("opf:spine").insert_child_first("opf:itemref");
	itemref.set_attribute("idref", title_page_id);
	auto guide = package->section("opf:guide");
	if (!guide) {
		guide = package->root().new_child("opf:guide");
	}
	auto reference = guide.insert_child_first("opf:reference");
	reference.set_attribute("type", TITLE_PAGE_GUIDE_TYPE);
	reference.set_attribute("title", TITLE_PAGE_GUIDE_TITLE);
	reference.set_attribute("href", href);
	package->resync();
	archive->write(package->directory() + href, std::move(page));
	logger().debug("Added title page " + href);
}

void epub::remove_title_page() {
	auto item = package->manifest_item(title_page_id);
	const std::string href = item ? item.get_attribute("href") : title_page_id + TITLE_PAGE_MEMBER_EXTENSION;
	std::vector<epub_element> doomed;
	if (item) {
		doomed.push_back(item);
	}
	for (const auto& itemref : package->section_children("opf:spine", "opf:itemref")) {
		if (itemref.get_attribute("idref") == title_page_id) {
			doomed.push_back(itemref);
		}
	}
	for (const auto& reference : package->section_children("opf:guide", "opf:reference")) {
		if (reference.get_attribute("href") == href) {
			doomed.push_back(reference);
		}
	}
	archive->remove(package->directory() + href);
	if (doomed.empty()) {
		return;
	}
	for (auto& element : doomed) {
		element.remove();
	}
	package->resync();
	logger().debug("Removed title page " + href);
}

const manifest& epub::manifest() const {
	drop_stale_caches();
	if (!manifest_cache) {
		manifest_cache = std::make_unique<epubmeta::manifest>(*package, *archive);
	}
	return *manifest_cache;
}

const spine& epub::spine() const {
	const auto& items = manifest();
	if (!spine_cache) {
		spine_cache = std::make_unique<epubmeta::spine>(*package, items);
	}
	return *spine_cache;
}

const toc& epub::toc() const {
	const auto& reading_order = spine();
	if (!toc_cache) {
		toc_cache = std::make_unique<epubmeta::toc>(*archive, *package, manifest(), reading_order.toc_item());
	}
	return *toc_cache;
}

std::string epub::contents(bool keep_markup, double fraction) const {
	const auto& reading_order = spine();
	size_t total = 0;
	for (const auto* item : reading_order.item_refs()) {
		total += item->size();
	}
	const double limit = fraction * static_cast<double>(total);
	std::string result;
	size_t cumulative = 0;
	for (const auto* item : reading_order.item_refs()) {
		cumulative += item->size();
		if (fraction < 1.0 && static_cast<double>(cumulative) > limit) {
			break;
		}
		result += item->contents({}, {}, keep_markup);
	}
	return result;
}

epub_element epub::require_section(std::string_view name) const {
	auto section = package->section(name);
	if (!section) {
		throw structure_error("No " + split_qualified_name(name).local + " element found in EPUB!");
	}
	return section;
}

void epub::drop_stale_caches() const {
	if (cache_revision != package->revision()) {
		drop_caches();
		cache_revision = package->revision();
	}
}

void epub::drop_caches() const {
	toc_cache.reset();
	spine_cache.reset();
	manifest_cache.reset();
}
} // namespace epubmeta
