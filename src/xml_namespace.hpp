/* xml_namespace.hpp - fixed EPUB XML namespaces.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace epubmeta {
inline constexpr const char* OCF_NAMESPACE = "urn:oasis:names:tc:opendocument:xmlns:container";
inline constexpr const char* OPF_NAMESPACE = "http://www.idpf.org/2007/opf";
inline constexpr const char* DC_NAMESPACE = "http://purl.org/dc/elements/1.1/";
inline constexpr const char* NCX_NAMESPACE = "http://www.daisy.org/z3986/2005/ncx/";
inline constexpr const char* XHTML_NAMESPACE = "http://www.w3.org/1999/xhtml";

struct qualified_name {
	std::string prefix;
	std::string local;
};

// Resolves one of the fixed EPUB prefixes (ocf, opf, dc, ncx, xhtml) to its URI.
// Throws configuration_error for anything else.
[[nodiscard]] const std::string& namespace_uri(std::string_view prefix);
[[nodiscard]] bool is_known_prefix(std::string_view prefix) noexcept;
// Splits "prefix:local" at the first colon; names without a colon get an empty prefix.
[[nodiscard]] qualified_name split_qualified_name(std::string_view name);
} // namespace epubmeta
