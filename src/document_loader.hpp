/* document_loader.hpp - container, OPF and XHTML loading.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "zip_archive.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/DOM/Document.h>
#include <memory>
#include <pugixml.hpp>
#include <string>

namespace epubmeta {
// Follows META-INF/container.xml to the package document's archive path.
[[nodiscard]] std::string find_package_path(const zip_archive& archive);
// Parses XML text into a namespace-aware Poco DOM; source names the member in error messages.
[[nodiscard]] Poco::AutoPtr<Poco::XML::Document> parse_xml(const std::string& data, const std::string& source);
// Throws structure_error when the member is missing, empty or not well-formed XML.
[[nodiscard]] Poco::AutoPtr<Poco::XML::Document> load_xml_member(const zip_archive& archive, const std::string& member);
// Parses an XHTML document after rewriting named HTML entities as numeric references.
[[nodiscard]] std::unique_ptr<pugi::xml_document> load_xhtml(const std::string& data, const std::string& source);
} // namespace epubmeta
