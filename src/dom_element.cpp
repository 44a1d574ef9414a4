/* dom_element.cpp - namespace-aware handle to a DOM element.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "dom_element.hpp"
#include "utils.hpp"
#include "xml_namespace.hpp"
#include <Poco/AutoPtr.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Node.h>
#include <Poco/DOM/Text.h>
#include <string>
#include <string_view>
#include <vector>

using Poco::AutoPtr;
using Poco::XML::Element;
using Poco::XML::Node;
using Poco::XML::Text;

namespace epubmeta {
std::string epub_element::local_name() const {
	return element == nullptr ? std::string() : element->localName();
}

std::string epub_element::namespace_uri() const {
	return element == nullptr ? std::string() : element->namespaceURI();
}

bool epub_element::matches(std::string_view name) const {
	if (element == nullptr) {
		return false;
	}
	const auto qname = split_qualified_name(name);
	if (element->localName() != qname.local) {
		return false;
	}
	return qname.prefix.empty() || element->namespaceURI() == namespace_uri(qname.prefix);
}

std::string epub_element::get_attribute(std::string_view name) const {
	if (element == nullptr) {
		return {};
	}
	const auto ctx = resolve(name);
	if (ctx.uri.empty()) {
		return element->getAttribute(ctx.local);
	}
	return element->getAttributeNS(ctx.uri, ctx.local);
}

bool epub_element::has_attribute(std::string_view name) const {
	if (element == nullptr) {
		return false;
	}
	const auto ctx = resolve(name);
	if (ctx.uri.empty()) {
		return element->hasAttribute(ctx.local);
	}
	return element->hasAttributeNS(ctx.uri, ctx.local);
}

void epub_element::set_attribute(std::string_view name, const std::string& value) {
	const auto ctx = resolve(name);
	if (ctx.uri.empty()) {
		element->setAttribute(ctx.local, value);
	} else {
		element->setAttributeNS(ctx.uri, ctx.qualified, value);
	}
}

void epub_element::remove_attribute(std::string_view name) {
	const auto ctx = resolve(name);
	if (ctx.uri.empty()) {
		element->removeAttribute(ctx.local);
	} else {
		element->removeAttributeNS(ctx.uri, ctx.local);
	}
}

epub_element epub_element::new_child(std::string_view name, const std::string& value) {
	AutoPtr<Element> child = create_element(name, value);
	element->appendChild(child);
	return epub_element(child.get());
}

epub_element epub_element::insert_child_first(std::string_view name, const std::string& value) {
	AutoPtr<Element> child = create_element(name, value);
	element->insertBefore(child, element->firstChild());
	return epub_element(child.get());
}

std::vector<epub_element> epub_element::children(std::string_view name) const {
	std::vector<epub_element> result;
	if (element == nullptr) {
		return result;
	}
	for (Node* node = element->firstChild(); node != nullptr; node = node->nextSibling()) {
		if (node->nodeType() != Node::ELEMENT_NODE) {
			continue;
		}
		epub_element child(static_cast<Element*>(node));
		if (name.empty() || child.matches(name)) {
			result.push_back(child);
		}
	}
	return result;
}

epub_element epub_element::first_child(std::string_view name) const {
	if (element == nullptr) {
		return {};
	}
	for (Node* node = element->firstChild(); node != nullptr; node = node->nextSibling()) {
		if (node->nodeType() != Node::ELEMENT_NODE) {
			continue;
		}
		epub_element child(static_cast<Element*>(node));
		if (child.matches(name)) {
			return child;
		}
	}
	return {};
}

std::string epub_element::unescaped_text() const {
	return element == nullptr ? std::string() : element->innerText();
}

void epub_element::set_unescaped_text(const std::string& value) {
	while (Node* child = element->firstChild()) {
		AutoPtr<Node> removed = element->removeChild(child);
	}
	if (!value.empty()) {
		AutoPtr<Text> text = element->ownerDocument()->createTextNode(value);
		element->appendChild(text);
	}
}

std::string epub_element::escaped_text() const {
	return xml_escape(unescaped_text());
}

void epub_element::set_escaped_text(const std::string& value) {
	set_unescaped_text(xml_unescape(value));
}

void epub_element::remove() {
	Node* parent = element->parentNode();
	if (parent != nullptr) {
		AutoPtr<Node> removed = parent->removeChild(element);
	}
	element = nullptr;
}

epub_element::name_context epub_element::resolve(std::string_view name) const {
	auto qname = split_qualified_name(name);
	name_context ctx{.local = qname.local, .uri = {}, .qualified = std::string(name)};
	if (qname.prefix.empty()) {
		return ctx;
	}
	ctx.uri = namespace_uri(qname.prefix);
	const auto& own_uri = element->namespaceURI();
	if ((own_uri.empty() && default_namespace() == ctx.uri) || own_uri == ctx.uri) {
		ctx.uri.clear();
		ctx.qualified = ctx.local;
	}
	return ctx;
}

std::string epub_element::default_namespace() const {
	for (Node* node = element; node != nullptr && node->nodeType() == Node::ELEMENT_NODE; node = node->parentNode()) {
		const auto* e = static_cast<Element*>(node);
		if (e->hasAttribute("xmlns")) {
			return e->getAttribute("xmlns");
		}
		if (e->prefix().empty() && !e->namespaceURI().empty()) {
			return e->namespaceURI();
		}
	}
	return {};
}

Element* epub_element::create_element(std::string_view name, const std::string& value) const {
	auto* document = element->ownerDocument();
	const auto qname = split_qualified_name(name);
	std::string uri;
	std::string tag = qname.local;
	if (qname.prefix.empty()) {
		uri = default_namespace();
	} else {
		uri = namespace_uri(qname.prefix);
		const auto& own_uri = element->namespaceURI();
		const bool implied = (own_uri.empty() && default_namespace() == uri) || own_uri == uri;
		if (!implied) {
			tag = std::string(name);
		}
	}
	Element* child = uri.empty() ? document->createElement(tag) : document->createElementNS(uri, tag);
	if (!value.empty()) {
		AutoPtr<Text> text = document->createTextNode(value);
		child->appendChild(text);
	}
	return child;
}
} // namespace epubmeta
