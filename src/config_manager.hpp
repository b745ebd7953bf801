/* config_manager.hpp - configuration management header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include <functional>
#include <memory>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* key;
	T default_value;

	constexpr app_setting(const char* k, const T& def) : key{k}, default_value{def} {
	}
};

class config_manager {
public:
	static constexpr app_setting<int> cache_capacity{"cache_capacity", static_cast<int>(DEFAULT_CACHE_CAPACITY)};
	static constexpr app_setting<bool> verbose_logging{"verbose_logging", false};
	static constexpr app_setting<int> config_version{"version", 0};
	static inline const app_setting<wxString> books_dir{"books_dir", wxString(".")};
	static inline const app_setting<wxString> book_suffix{"book_suffix", wxString("_data")};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;
	// An empty path picks lectern.ini next to the executable, or in the user data directory if that isn't writable.
	bool initialize(const wxString& path = wxEmptyString);
	void shutdown();
	wxString get_string(const wxString& key, const wxString& default_value = "") const;
	void set_string(const wxString& key, const wxString& value);

	bool is_initialized() const {
		return config != nullptr;
	}

	const wxString& get_path() const {
		return config_path;
	}

	template <typename T>
	T get(const app_setting<T>& setting) const {
		return get_app_setting(wxString(setting.key), setting.default_value);
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		set_app_setting(wxString(setting.key), value);
	}

	static wxString get_default_config_path();

private:
	std::unique_ptr<wxFileConfig> config;
	wxString config_path;

	template <typename T>
	T get_app_setting(const wxString& key, const T& default_value) const;
	template <typename T>
	void set_app_setting(const wxString& key, const T& value);
	static bool is_directory_writable(const wxString& dir);
	void load_defaults();
	void with_app_section(const std::function<void()>& func) const;
};
