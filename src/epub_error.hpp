/* epub_error.hpp - exception types raised by epubmeta.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace epubmeta {
enum class io_error_code {
	no_such_file,
	not_a_zip,
	inconsistent,
	read_failed,
	write_failed,
	unknown
};

class epub_error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// The archive itself could not be opened, read or written.
class io_error : public epub_error {
public:
	io_error(const std::string& msg, io_error_code code) : epub_error(msg), error_code{code} {
	}

	[[nodiscard]] io_error_code code() const noexcept {
		return error_code;
	}

private:
	io_error_code error_code;
};

// A required archive member or XML element is missing, empty or malformed.
class structure_error : public epub_error {
public:
	using epub_error::epub_error;
};

// A fragment anchor was not found in the document being extracted.
class not_found_error : public epub_error {
public:
	using epub_error::epub_error;
};

class invalid_input_error : public epub_error {
public:
	using epub_error::epub_error;
};

class configuration_error : public epub_error {
public:
	using epub_error::epub_error;
};
} // namespace epubmeta
