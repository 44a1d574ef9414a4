/* config_manager.cpp - library configuration.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include "epub_error.hpp"
#include "log.hpp"
#include <memory>
#include <string>
#include <wx/file.h>
#include <wx/fileconf.h>
#include <wx/log.h>
#include <wx/sstream.h>
#include <wx/string.h>
#include <wx/wfstream.h>

namespace epubmeta {
namespace {
const wxString SECTION = "/epubmeta/";

inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}

std::string to_utf8(const wxString& value) {
	const auto buf = value.ToUTF8();
	return std::string(buf.data(), buf.length());
}
} // namespace

epub_config::epub_config() {
	wxStringInputStream empty(wxEmptyString);
	load(empty);
}

epub_config::epub_config(const wxString& path) {
	wxLogNull no_log;
	wxFileInputStream stream(path);
	if (!stream.IsOk()) {
		throw configuration_error("Failed to read configuration file: " + to_utf8(path));
	}
	load(stream);
}

epub_config::epub_config(wxInputStream& stream) {
	load(stream);
}

void epub_config::load(wxInputStream& stream) {
	config = std::make_unique<wxFileConfig>(stream, wxConvUTF8);
}

template <typename T>
T epub_config::get_app_setting(const wxString& key, const T& default_value) const {
	return read_config_value(config.get(), SECTION + key, default_value);
}

template <typename T>
void epub_config::set_app_setting(const wxString& key, const T& value) {
	config->Write(SECTION + key, value);
}

template bool epub_config::get_app_setting<bool>(const wxString&, const bool&) const;
template wxString epub_config::get_app_setting<wxString>(const wxString&, const wxString&) const;
template void epub_config::set_app_setting<bool>(const wxString&, const bool&);
template void epub_config::set_app_setting<wxString>(const wxString&, const wxString&);

std::string epub_config::get_string(const app_setting<wxString>& setting) const {
	return to_utf8(get(setting));
}

std::string epub_config::load_title_page_template() const {
	const wxString path = get(title_page_template);
	if (path.empty()) {
		return DEFAULT_TITLE_PAGE_TEMPLATE;
	}
	wxLogNull no_log;
	wxFile file;
	wxString contents;
	if (!file.Open(path) || !file.ReadAll(&contents, wxConvUTF8)) {
		throw configuration_error("Failed to read title page template: " + to_utf8(path));
	}
	return to_utf8(contents);
}

void epub_config::apply_log_level() const {
	set_log_level(get_string(log_level));
}
} // namespace epubmeta
