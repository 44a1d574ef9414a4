/* package_document.cpp - OPF package document.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "package_document.hpp"
#include "document_loader.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "xml_namespace.hpp"
#include <Poco/DOM/DOMSerializer.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <Poco/XML/XMLWriter.h>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace epubmeta {
package_document::package_document(const zip_archive& archive, const std::string& path) : file_path{path}, dir{parent_path(path)}, document{load_xml_member(archive, path)} {
}

epub_element package_document::root() const {
	return epub_element(document->documentElement());
}

epub_element package_document::section(std::string_view name) const {
	return root().first_child(name);
}

std::vector<epub_element> package_document::section_children(std::string_view section_name, std::string_view name) const {
	return section(section_name).children(name);
}

epub_element package_document::manifest_item(const std::string& id) const {
	for (const auto& item : section_children("opf:manifest", "opf:item")) {
		if (item.get_attribute("id") == id) {
			return item;
		}
	}
	return {};
}

std::string package_document::serialize() const {
	std::ostringstream out;
	out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
	Poco::XML::XMLWriter writer(out, 0);
	writer.setNewLine("\n");
	writer.startFragment();
	// The package namespace stays the default one. opf is left for the writer to declare on
	// the elements carrying opf attributes, since attributes cannot use the default namespace.
	const std::string root_uri = document->documentElement()->namespaceURI();
	if (!root_uri.empty()) {
		writer.startPrefixMapping("", root_uri);
	}
	writer.startPrefixMapping("dc", namespace_uri("dc"));
	Poco::XML::DOMSerializer serializer;
	serializer.setContentHandler(&writer);
	serializer.serialize(document->documentElement());
	writer.endFragment();
	return out.str();
}

void package_document::resync() {
	document = parse_xml(serialize(), file_path);
	++rev;
	logger().debug("Resynced " + file_path + " (revision " + std::to_string(rev) + ")");
}
} // namespace epubmeta
