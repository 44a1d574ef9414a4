/* zip_archive.hpp - EPUB zip container with staged writes.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace epubmeta {
struct archive_member {
	std::string path;
	size_t size{0};
};

// An EPUB zip container. Reads come from the archive index plus any staged writes;
// staged writes and removals reach the file on disk only when commit() is called.
class zip_archive {
public:
	explicit zip_archive(const std::string& path);
	~zip_archive() = default;
	zip_archive(const zip_archive&) = delete;
	zip_archive& operator=(const zip_archive&) = delete;
	zip_archive(zip_archive&&) = delete;
	zip_archive& operator=(zip_archive&&) = delete;

	[[nodiscard]] const std::string& path() const noexcept {
		return file_path;
	}

	[[nodiscard]] bool contains(const std::string& member) const;
	[[nodiscard]] std::optional<std::string> read(const std::string& member) const;
	[[nodiscard]] size_t size(const std::string& member) const;
	[[nodiscard]] std::vector<archive_member> members() const;
	void write(const std::string& member, std::string data);
	// Stages the contents of a local file; the file is read immediately.
	void write_file(const std::string& member, const std::string& local_path);
	void remove(const std::string& member);

	[[nodiscard]] bool has_pending_changes() const noexcept {
		return !staged.empty() || !removed.empty();
	}

	// Rewrites the archive with all staged changes applied, then reloads the index.
	void commit();

private:
	void open();
	void close() noexcept;

	std::string file_path;
	std::unique_ptr<wxFileInputStream> file_stream;
	std::map<std::string, std::unique_ptr<wxZipEntry>> entries;
	std::vector<std::string> entry_order;
	std::map<std::string, std::string> staged;
	std::set<std::string> removed;
};
} // namespace epubmeta
