/* dom_element.hpp - namespace-aware handle to a DOM element.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <Poco/DOM/Element.h>
#include <string>
#include <string_view>
#include <vector>

namespace epubmeta {
// Non-owning handle to an element of a Poco DOM document with EPUB namespace awareness.
// Names are given as "prefix:local" using the prefixes known to xml_namespace. A prefixed
// name that resolves to the element's own namespace (or to the default namespace in scope
// when the element has none) is handled as an unqualified name, so no redundant namespace
// declarations end up in the serialized document.
class epub_element {
public:
	epub_element() = default;

	explicit epub_element(Poco::XML::Element* e) noexcept : element{e} {
	}

	[[nodiscard]] bool valid() const noexcept {
		return element != nullptr;
	}

	explicit operator bool() const noexcept {
		return valid();
	}

	[[nodiscard]] Poco::XML::Element* get() const noexcept {
		return element;
	}

	[[nodiscard]] std::string local_name() const;
	[[nodiscard]] std::string namespace_uri() const;
	[[nodiscard]] bool matches(std::string_view name) const;
	[[nodiscard]] std::string get_attribute(std::string_view name) const;
	[[nodiscard]] bool has_attribute(std::string_view name) const;
	void set_attribute(std::string_view name, const std::string& value);
	void remove_attribute(std::string_view name);
	epub_element new_child(std::string_view name, const std::string& value = {});
	epub_element insert_child_first(std::string_view name, const std::string& value = {});
	[[nodiscard]] std::vector<epub_element> children(std::string_view name = {}) const;
	[[nodiscard]] epub_element first_child(std::string_view name) const;
	[[nodiscard]] std::string unescaped_text() const;
	void set_unescaped_text(const std::string& value);
	[[nodiscard]] std::string escaped_text() const;
	void set_escaped_text(const std::string& value);
	// Detaches the element from its parent. The handle is invalid afterwards.
	void remove();

private:
	struct name_context {
		std::string local;
		std::string uri;
		std::string qualified;
	};

	[[nodiscard]] name_context resolve(std::string_view name) const;
	[[nodiscard]] std::string default_namespace() const;
	[[nodiscard]] Poco::XML::Element* create_element(std::string_view name, const std::string& value) const;

	Poco::XML::Element* element{nullptr};
};
} // namespace epubmeta
