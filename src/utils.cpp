/* utils.cpp - string, XML and zip helpers.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/zipstrm.h>

namespace epubmeta {
namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;

std::string url_encode(std::string_view in) {
	static const char hex[] = "0123456789ABCDEF";
	std::string out;
	out.reserve(in.size());
	for (unsigned char ch : in) {
		const bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/' || ch == ':';
		if (unreserved) {
			out.push_back(static_cast<char>(ch));
		} else {
			out.push_back('%');
			out.push_back(hex[(ch >> 4) & 0xF]);
			out.push_back(hex[ch & 0xF]);
		}
	}
	return out;
}

void append_utf8(std::string& out, unsigned long cp) {
	if (cp < 0x80) {
		out.push_back(static_cast<char>(cp));
	} else if (cp < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
}

std::string escape(std::string_view input, const char* apostrophe) {
	std::string out;
	out.reserve(input.size());
	for (const char ch : input) {
		switch (ch) {
			case '&':
				out += "&amp;";
				break;
			case '<':
				out += "&lt;";
				break;
			case '>':
				out += "&gt;";
				break;
			case '"':
				out += "&quot;";
				break;
			case '\'':
				out += apostrophe;
				break;
			default:
				out.push_back(ch);
		}
	}
	return out;
}
} // namespace

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && std::prev(prev) != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string to_lower(std::string_view input) {
	std::string out(input);
	std::ranges::transform(out, out.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
	return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
		return std::tolower(x) == std::tolower(y);
	});
}

std::vector<std::string> split_list(const std::string& input) {
	std::vector<std::string> pieces;
	if (input.empty()) {
		return pieces;
	}
	std::istringstream stream(input);
	std::string piece;
	while (std::getline(stream, piece, ',')) {
		pieces.push_back(trim_string(piece));
	}
	if (input.back() == ',') {
		pieces.emplace_back();
	}
	return pieces;
}

std::string xml_escape(std::string_view input) {
	return escape(input, "&apos;");
}

std::string html_escape(std::string_view input) {
	return escape(input, "&#039;");
}

std::string xml_unescape(std::string_view input) {
	std::string out;
	out.reserve(input.size());
	for (size_t i = 0; i < input.size(); ++i) {
		if (input[i] != '&') {
			out.push_back(input[i]);
			continue;
		}
		const auto semi = input.find(';', i);
		if (semi == std::string_view::npos) {
			out.push_back('&');
			continue;
		}
		const auto entity = input.substr(i + 1, semi - i - 1);
		if (entity == "amp") {
			out.push_back('&');
		} else if (entity == "lt") {
			out.push_back('<');
		} else if (entity == "gt") {
			out.push_back('>');
		} else if (entity == "quot") {
			out.push_back('"');
		} else if (entity == "apos") {
			out.push_back('\'');
		} else if (entity.size() > 1 && entity[0] == '#') {
			const bool hex = entity[1] == 'x' || entity[1] == 'X';
			const std::string digits(entity.substr(hex ? 2 : 1));
			if (digits.empty() || digits.size() > 6 || !std::ranges::all_of(digits, [hex](unsigned char c) { return hex ? std::isxdigit(c) != 0 : std::isdigit(c) != 0; })) {
				out.push_back('&');
				continue;
			}
			const unsigned long code_point = std::stoul(digits, nullptr, hex ? 16 : 10);
			// NUL, surrogates and values past the Unicode range have no UTF-8 form.
			if (code_point == 0 || (code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
				out.push_back('&');
				continue;
			}
			append_utf8(out, code_point);
		} else {
			out.push_back('&');
			continue;
		}
		i = semi;
	}
	return out;
}

std::string url_decode(std::string_view encoded) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9') {
			return c - '0';
		}
		if (c >= 'a' && c <= 'f') {
			return c - 'a' + 10;
		}
		if (c >= 'A' && c <= 'F') {
			return c - 'A' + 10;
		}
		return -1;
	};
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		char c = encoded[i];
		if (c == '%' && i + 2 < encoded.size()) {
			int hi = hex(encoded[i + 1]);
			int lo = hex(encoded[i + 2]);
			if (hi >= 0 && lo >= 0) {
				out.push_back(static_cast<char>((hi << 4) | lo));
				i += 2;
				continue;
			}
		}
		out.push_back(c);
	}
	return out;
}

std::string parent_path(const std::string& path) {
	const auto slashpos = path.find_last_of('/');
	return slashpos == std::string::npos ? std::string() : path.substr(0, slashpos + 1);
}

std::string resolve_path(const std::string& directory, const std::string& relative) {
	std::vector<std::string> segments;
	std::istringstream parts(directory + relative);
	std::string segment;
	while (std::getline(parts, segment, '/')) {
		if (segment.empty() || segment == ".") {
			continue;
		}
		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
			continue;
		}
		segments.push_back(std::move(segment));
	}
	std::string result;
	for (const auto& part : segments) {
		if (!result.empty()) {
			result += '/';
		}
		result += part;
	}
	return result;
}

std::string read_zip_entry(wxZipInputStream& zip) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (zip.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(zip.LastRead()));
	}
	return buffer.str();
}

wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries) {
	auto it = entries.find(filename);
	if (it != entries.end()) {
		return it->second.get();
	}
	auto decoded = url_decode(filename);
	if (decoded != filename) {
		it = entries.find(decoded);
		if (it != entries.end()) {
			return it->second.get();
		}
	}
	std::string encoded = url_encode(filename);
	if (encoded != filename) {
		it = entries.find(encoded);
		if (it != entries.end()) {
			return it->second.get();
		}
	}
	return nullptr;
}
} // namespace epubmeta
