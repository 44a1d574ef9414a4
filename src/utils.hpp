/* utils.hpp - string, XML and zip helpers.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <wx/zipstrm.h>

namespace epubmeta {
[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string to_lower(std::string_view input);
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;
// Splits a comma separated list, trimming each piece. An empty input yields no pieces.
[[nodiscard]] std::vector<std::string> split_list(const std::string& input);
[[nodiscard]] std::string xml_escape(std::string_view input);
[[nodiscard]] std::string xml_unescape(std::string_view input);
// Escapes like xml_escape but writes the apostrophe as a numeric reference so the result is safe in HTML too.
[[nodiscard]] std::string html_escape(std::string_view input);
[[nodiscard]] std::string url_decode(std::string_view encoded);
[[nodiscard]] std::string parent_path(const std::string& path);
// Joins a relative archive path onto a directory ending in '/', collapsing "." and ".." segments.
[[nodiscard]] std::string resolve_path(const std::string& directory, const std::string& relative);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries);
} // namespace epubmeta
