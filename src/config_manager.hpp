/* config_manager.hpp - library configuration.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include <memory>
#include <string>
#include <wx/fileconf.h>
#include <wx/stream.h>
#include <wx/string.h>

namespace epubmeta {
template <typename T>
struct app_setting {
	const char* key;
	T default_value;

	constexpr app_setting(const char* k, const T& def) : key{k}, default_value{def} {
	}
};

// Library settings, read from the [epubmeta] section of an INI file.
class epub_config {
public:
	static inline const app_setting<wxString> cover_id{"cover_id", wxString::FromUTF8(DEFAULT_COVER_ID)};
	static inline const app_setting<wxString> title_page_id{"title_page_id", wxString::FromUTF8(DEFAULT_TITLE_PAGE_ID)};
	static inline const app_setting<wxString> title_page_template{"title_page_template", wxString("")};
	static constexpr app_setting<bool> case_insensitive_schemes{"case_insensitive_schemes", true};
	static inline const app_setting<wxString> log_level{"log_level", wxString("warning")};

	epub_config();
	explicit epub_config(const wxString& path);
	explicit epub_config(wxInputStream& stream);
	~epub_config() = default;
	epub_config(const epub_config&) = delete;
	epub_config& operator=(const epub_config&) = delete;
	epub_config(epub_config&&) = default;
	epub_config& operator=(epub_config&&) = default;

	template <typename T>
	T get(const app_setting<T>& setting) const {
		return get_app_setting(wxString(setting.key), setting.default_value);
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		set_app_setting(wxString(setting.key), value);
	}

	[[nodiscard]] std::string get_string(const app_setting<wxString>& setting) const;
	// The configured template file's contents, or the built-in title page template when none is set.
	[[nodiscard]] std::string load_title_page_template() const;
	// Validates and applies log_level to the library logger.
	void apply_log_level() const;

private:
	std::unique_ptr<wxFileConfig> config;

	template <typename T>
	T get_app_setting(const wxString& key, const T& default_value) const;
	template <typename T>
	void set_app_setting(const wxString& key, const T& value);
	void load(wxInputStream& stream);
};
} // namespace epubmeta
