/* app.cpp - main application implementation.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "commands.hpp"
#include "config_manager.hpp"
#include "constants.hpp"
#include "reader_service.hpp"
#include <cstddef>
#include <iostream>
#include <memory>
#include <wx/cmdline.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
const wxCmdLineEntryDesc cmd_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_SWITCH, "v", "verbose", "enable verbose logging", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_OPTION, "b", "books-dir", "directory containing book folders", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "c", "config", "configuration file to use", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "a", "anchor", "narrow the chapter to the section owning this anchor", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "o", "output", "directory to write imported books to", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "library | read <book> [chapter] | toc <book> | image <book> <name> | import <file.epub> (put -- before a negative chapter)", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_MULTIPLE | wxCMD_LINE_PARAM_OPTIONAL},
	wxCMD_LINE_DESC_END,
};
} // namespace

bool app::OnInit() {
	if (!wxAppConsole::OnInit()) {
		return false;
	}
	if (usage_error) {
		return true;
	}
	if (!config_mgr.initialize(config_path)) {
		wxLogError(_("Failed to initialize configuration"));
		return false;
	}
	wxLog::SetVerbose(verbose || config_mgr.get(config_manager::verbose_logging));
	const wxString books_dir = books_dir_override.IsEmpty() ? config_mgr.get(config_manager::books_dir) : books_dir_override;
	const int capacity = config_mgr.get(config_manager::cache_capacity);
	reader = std::make_unique<reader_service>(books_dir, config_mgr.get(config_manager::book_suffix), capacity > 0 ? static_cast<size_t>(capacity) : DEFAULT_CACHE_CAPACITY);
	wxLogVerbose("Serving books from %s", books_dir);
	return true;
}

int app::OnRun() {
	if (usage_error) {
		return static_cast<int>(exit_status::usage);
	}
	const command_options options{anchor, output_dir, config_mgr.get(config_manager::book_suffix)};
	return static_cast<int>(run_command(params, options, *reader, std::cout));
}

int app::OnExit() {
	reader.reset();
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	parser.SetDesc(cmd_line_desc);
	parser.SetLogo(APP_NAME + " " + APP_VERSION + "\n" + APP_COPYRIGHT);
	parser.SetSwitchChars("-");
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	verbose = parser.Found("verbose");
	parser.Found("books-dir", &books_dir_override);
	parser.Found("config", &config_path);
	parser.Found("anchor", &anchor);
	parser.Found("output", &output_dir);
	for (size_t i = 0; i < parser.GetParamCount(); ++i) {
		params.Add(parser.GetParam(i));
	}
	return true;
}

// Parse errors still reach OnRun so they can exit with the usage status.
bool app::OnCmdLineError(wxCmdLineParser& parser) {
	parser.Usage();
	usage_error = true;
	return true;
}

wxIMPLEMENT_APP_CONSOLE(app);
