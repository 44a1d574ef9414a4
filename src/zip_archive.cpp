/* zip_archive.cpp - EPUB zip container with staged writes.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "zip_archive.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/file.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace epubmeta {
namespace {
std::string to_utf8(const wxString& value) {
	const auto buf = value.ToUTF8();
	return std::string(buf.data(), buf.length());
}

bool has_zip_signature(wxInputStream& stream) {
	std::array<unsigned char, 4> signature{};
	if (stream.Read(signature.data(), signature.size()).LastRead() != signature.size()) {
		return false;
	}
	if (signature[0] != 'P' || signature[1] != 'K') {
		return false;
	}
	// Local file header, end of central directory (empty archive) or spanned archive marker.
	return (signature[2] == 3 && signature[3] == 4) || (signature[2] == 5 && signature[3] == 6) || (signature[2] == 7 && signature[3] == 8);
}

// Archives written to a file always end with an end of central directory record, possibly
// followed by a comment of up to 64 KiB.
bool has_end_record(wxInputStream& stream) {
	constexpr wxFileOffset end_record_size = 22;
	constexpr wxFileOffset max_comment_size = 0xFFFF;
	const wxFileOffset length = stream.GetLength();
	if (length < end_record_size) {
		return false;
	}
	const wxFileOffset tail = std::min(length, end_record_size + max_comment_size);
	if (stream.SeekI(length - tail) == wxInvalidOffset) {
		return false;
	}
	std::string buffer(static_cast<std::size_t>(tail), '\0');
	if (stream.Read(buffer.data(), buffer.size()).LastRead() != buffer.size()) {
		return false;
	}
	const auto pos = buffer.rfind(std::string_view("PK\x05\x06", 4));
	return pos != std::string::npos && buffer.size() - pos >= static_cast<std::size_t>(end_record_size);
}

void put_entry(wxZipOutputStream& zip, const std::string& name, const std::string& data) {
	if (!zip.PutNextEntry(wxString::FromUTF8(name)) || !zip.WriteAll(data.data(), data.size())) {
		throw io_error("Failed to write EPUB file: " + name, io_error_code::write_failed);
	}
}
} // namespace

zip_archive::zip_archive(const std::string& path) : file_path{path} {
	open();
}

void zip_archive::open() {
	wxLogNull no_log;
	const wxString path = wxString::FromUTF8(file_path);
	if (wxFileName::DirExists(path)) {
		throw io_error("Failed to read EPUB file.", io_error_code::unknown);
	}
	if (!wxFileName::FileExists(path)) {
		throw io_error("Failed to read EPUB file. No such file.", io_error_code::no_such_file);
	}
	auto stream = std::make_unique<wxFileInputStream>(path);
	if (!stream->IsOk()) {
		throw io_error("Failed to read EPUB file. Read error.", io_error_code::read_failed);
	}
	if (!has_zip_signature(*stream)) {
		throw io_error("Failed to read EPUB file. Not a zip archive.", io_error_code::not_a_zip);
	}
	if (!has_end_record(*stream)) {
		throw io_error("Failed to read EPUB file. Zip archive inconsistent.", io_error_code::inconsistent);
	}
	stream->SeekI(0);
	std::map<std::string, std::unique_ptr<wxZipEntry>> index;
	std::vector<std::string> order;
	wxZipInputStream zip_index(*stream);
	while (wxZipEntry* entry = zip_index.GetNextEntry()) {
		std::unique_ptr<wxZipEntry> owned(entry);
		if (owned->IsDir()) {
			continue;
		}
		std::string name = to_utf8(owned->GetName(wxPATH_UNIX));
		order.push_back(name);
		index[name] = std::move(owned);
	}
	if (zip_index.GetLastError() == wxSTREAM_READ_ERROR) {
		throw io_error("Failed to read EPUB file. Zip archive inconsistent.", io_error_code::inconsistent);
	}
	stream->SeekI(0);
	file_stream = std::move(stream);
	entries = std::move(index);
	entry_order = std::move(order);
	logger().debug("Opened " + file_path + " with " + std::to_string(entry_order.size()) + " members");
}

void zip_archive::close() noexcept {
	entries.clear();
	entry_order.clear();
	file_stream.reset();
}

bool zip_archive::contains(const std::string& member) const {
	if (removed.contains(member)) {
		return false;
	}
	return staged.contains(member) || find_zip_entry(member, entries) != nullptr;
}

std::optional<std::string> zip_archive::read(const std::string& member) const {
	if (removed.contains(member)) {
		return std::nullopt;
	}
	if (auto it = staged.find(member); it != staged.end()) {
		return it->second;
	}
	wxZipEntry* entry = find_zip_entry(member, entries);
	if (entry == nullptr) {
		return std::nullopt;
	}
	file_stream->SeekI(0);
	wxZipInputStream zis(*file_stream);
	if (!zis.OpenEntry(*entry)) {
		throw io_error("Failed to read EPUB file. Read error.", io_error_code::read_failed);
	}
	return read_zip_entry(zis);
}

size_t zip_archive::size(const std::string& member) const {
	if (removed.contains(member)) {
		return 0;
	}
	if (auto it = staged.find(member); it != staged.end()) {
		return it->second.size();
	}
	const wxZipEntry* entry = find_zip_entry(member, entries);
	if (entry == nullptr || entry->GetSize() < 0) {
		return 0;
	}
	return static_cast<size_t>(entry->GetSize());
}

std::vector<archive_member> zip_archive::members() const {
	std::vector<archive_member> result;
	for (const auto& name : entry_order) {
		if (!removed.contains(name)) {
			result.push_back({.path = name, .size = size(name)});
		}
	}
	for (const auto& [name, data] : staged) {
		if (!entries.contains(name)) {
			result.push_back({.path = name, .size = data.size()});
		}
	}
	return result;
}

void zip_archive::write(const std::string& member, std::string data) {
	removed.erase(member);
	staged[member] = std::move(data);
}

void zip_archive::write_file(const std::string& member, const std::string& local_path) {
	wxLogNull no_log;
	wxFile file;
	if (!file.Open(wxString::FromUTF8(local_path))) {
		throw io_error("Failed to read " + local_path, io_error_code::read_failed);
	}
	const wxFileOffset length = file.Length();
	std::string data(length > 0 ? static_cast<size_t>(length) : 0, '\0');
	if (!data.empty() && file.Read(data.data(), data.size()) != static_cast<ssize_t>(data.size())) {
		throw io_error("Failed to read " + local_path, io_error_code::read_failed);
	}
	write(member, std::move(data));
}

void zip_archive::remove(const std::string& member) {
	staged.erase(member);
	if (entries.contains(member)) {
		removed.insert(member);
	}
}

void zip_archive::commit() {
	if (!has_pending_changes()) {
		return;
	}
	logger().debug("Writing " + std::to_string(staged.size()) + " staged and " + std::to_string(removed.size()) + " removed members to " + file_path);
	close();
	try {
		wxLogNull no_log;
		const wxString path = wxString::FromUTF8(file_path);
		wxTempFileOutputStream out(path);
		if (!out.IsOk()) {
			throw io_error("Failed to write EPUB file.", io_error_code::write_failed);
		}
		wxZipOutputStream zip_out(out);
		std::set<std::string> written;
		{
			wxFileInputStream in(path);
			if (!in.IsOk()) {
				throw io_error("Failed to read EPUB file. Read error.", io_error_code::read_failed);
			}
			wxZipInputStream zip_in(in);
			zip_out.CopyArchiveMetaData(zip_in);
			std::unique_ptr<wxZipEntry> entry;
			while (entry.reset(zip_in.GetNextEntry()), entry != nullptr) {
				const std::string name = to_utf8(entry->GetName(wxPATH_UNIX));
				if (removed.contains(name)) {
					continue;
				}
				if (auto it = staged.find(name); it != staged.end()) {
					put_entry(zip_out, name, it->second);
					written.insert(name);
					continue;
				}
				if (!zip_out.CopyEntry(entry.release(), zip_in)) {
					throw io_error("Failed to write EPUB file: " + name, io_error_code::write_failed);
				}
			}
			if (zip_in.GetLastError() == wxSTREAM_READ_ERROR) {
				throw io_error("Failed to read EPUB file. Zip archive inconsistent.", io_error_code::inconsistent);
			}
		}
		for (const auto& [name, data] : staged) {
			if (!written.contains(name)) {
				put_entry(zip_out, name, data);
			}
		}
		if (!zip_out.Close() || !out.Commit()) {
			throw io_error("Failed to write EPUB file.", io_error_code::write_failed);
		}
	} catch (const io_error&) {
		open();
		throw;
	}
	staged.clear();
	removed.clear();
	open();
}
} // namespace epubmeta
