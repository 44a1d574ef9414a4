/* constants.hpp - shared constants.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>

namespace epubmeta {
inline const std::string CONTAINER_PATH = "META-INF/container.xml";
inline const std::string PACKAGE_MEDIA_TYPE = "application/oebps-package+xml";
inline const std::string XHTML_MEDIA_TYPE = "application/xhtml+xml";
inline const std::string DEFAULT_COVER_ID = "epubmeta-cover";
inline const std::string DEFAULT_TITLE_PAGE_ID = "epubmeta-titlepage";
inline const std::string COVER_MEMBER_EXTENSION = ".img";
inline const std::string TITLE_PAGE_MEMBER_EXTENSION = ".xhtml";
inline const std::string TITLE_PAGE_GUIDE_TYPE = "cover";
inline const std::string TITLE_PAGE_GUIDE_TITLE = "Title Page";
inline const std::string TITLE_PLACEHOLDER = "{{ title }}";
inline const std::string COVER_PATH_PLACEHOLDER = "{{ coverPath }}";

inline const std::string DEFAULT_TITLE_PAGE_TEMPLATE = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE html>
<html xmlns="http://www.w3.org/1999/xhtml">
<head>
<title>{{ title }}</title>
<style type="text/css">
body { margin: 0; padding: 0; text-align: center; }
img { max-width: 100%; max-height: 100%; }
</style>
</head>
<body>
<div><img src="{{ coverPath }}" alt="{{ title }}"/></div>
</body>
</html>
)";
} // namespace epubmeta
