/* document_loader.cpp - container, OPF and XHTML loading.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document_loader.hpp"
#include "constants.hpp"
#include "epub_error.hpp"
#include "html_entities.hpp"
#include "log.hpp"
#include "xml_namespace.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <Poco/DOM/NodeList.h>
#include <Poco/Exception.h>
#include <Poco/SAX/NamespaceSupport.h>
#include <Poco/SAX/XMLReader.h>
#include <memory>
#include <pugixml.hpp>
#include <string>

using Poco::AutoPtr;
using Poco::XML::Document;
using Poco::XML::DOMParser;
using Poco::XML::Element;
using Poco::XML::NamespaceSupport;
using Poco::XML::NodeList;

namespace epubmeta {
std::string find_package_path(const zip_archive& archive) {
	auto doc = load_xml_member(archive, CONTAINER_PATH);
	NamespaceSupport nsmap;
	nsmap.declarePrefix("ocf", namespace_uri("ocf"));
	auto* rootfile = static_cast<Element*>(doc->getNodeByPathNS("//ocf:rootfile[@media-type='" + PACKAGE_MEDIA_TYPE + "']", nsmap));
	if (rootfile == nullptr) {
		// Fall back to the first rootfile, whatever its media type or namespace.
		AutoPtr<NodeList> rootfiles = doc->getElementsByTagNameNS("*", "rootfile");
		if (rootfiles->length() > 0) {
			rootfile = static_cast<Element*>(rootfiles->item(0));
		}
	}
	const std::string full_path = rootfile == nullptr ? std::string() : rootfile->getAttribute("full-path");
	if (full_path.empty()) {
		throw structure_error("No package document referenced in " + CONTAINER_PATH);
	}
	return full_path;
}

AutoPtr<Document> parse_xml(const std::string& data, const std::string& source) {
	DOMParser parser;
	parser.setFeature(Poco::XML::XMLReader::FEATURE_NAMESPACES, true);
	parser.setFeature(Poco::XML::XMLReader::FEATURE_NAMESPACE_PREFIXES, false);
	parser.setFeature(DOMParser::FEATURE_FILTER_WHITESPACE, false);
	try {
		AutoPtr<Document> doc = parser.parseString(data);
		return doc;
	} catch (const Poco::Exception& e) {
		logger().debug("XML parse error in " + source + ": " + e.displayText());
		throw structure_error("Invalid XML in " + source);
	}
}

AutoPtr<Document> load_xml_member(const zip_archive& archive, const std::string& member) {
	const auto data = archive.read(member);
	if (!data || data->empty()) {
		throw structure_error("Failed to access EPUB container data: " + member);
	}
	return parse_xml(*data, member);
}

std::unique_ptr<pugi::xml_document> load_xhtml(const std::string& data, const std::string& source) {
	const std::string normalized = convert_named_entities_to_numeric(data);
	auto doc = std::make_unique<pugi::xml_document>();
	const auto result = doc->load_buffer(normalized.data(), normalized.size(), pugi::parse_default | pugi::parse_ws_pcdata);
	if (!result) {
		logger().debug("XHTML parse error in " + source + ": " + result.description());
		throw structure_error("Invalid XML in " + source);
	}
	return doc;
}
} // namespace epubmeta
