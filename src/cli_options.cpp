// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "cli_options.h"

#include <charconv>
#include <string>
#include <system_error>

// ============================================================================
// Command Line Options
// ============================================================================

namespace {

[[nodiscard]] std::optional<size_t> parse_rows(const std::string_view text)
{
	size_t value     = 0;
	const auto* end  = text.data() + text.size();
	const auto [ptr, ec] = std::from_chars(text.data(), end, value);

	if (ec != std::errc() || ptr != end || value == 0) {
		return std::nullopt;
	}
	return value;
}

} // namespace

[[nodiscard]] std::optional<CliOptions> CliOptions::parse(const int argc,
                                                          const char* const argv[],
                                                          std::ostream& err)
{
	CliOptions options   = {};
	options.config.title = std::string(DefaultTitle);

	const std::string_view program = argc > 0 ? argv[0] : DefaultTitle;

	const auto usage_error = [&](const std::string& message) {
		err << "Error: " << message << '\n'
		    << "Run '" << program << " --help' for usage\n";
		return std::nullopt;
	};

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];

		const auto value = [&]() -> std::optional<std::string_view> {
			if (i + 1 >= argc) {
				return std::nullopt;
			}
			return std::string_view(argv[++i]);
		};

		if (arg == "-h" || arg == "--help") {
			options.show_help = true;
		} else if (arg == "-v" || arg == "--version") {
			options.show_version = true;
		} else if (arg == "-m" || arg == "--multi") {
			options.config.multi_select = true;
		} else if (arg == "-V" || arg == "--verbose") {
			options.verbose = true;
		} else if (arg == "-t" || arg == "--title") {
			const auto title = value();
			if (!title) {
				return usage_error("missing value for " + std::string(arg));
			}
			options.config.title = std::string(*title);
		} else if (arg == "-f" || arg == "--text") {
			const auto text = value();
			if (!text) {
				return usage_error("missing value for " + std::string(arg));
			}
			options.config.footer_text = std::string(*text);
		} else if (arg == "-r" || arg == "--rows") {
			const auto text = value();
			if (!text) {
				return usage_error("missing value for " + std::string(arg));
			}
			const auto rows = parse_rows(*text);
			if (!rows) {
				return usage_error("invalid row count '" + std::string(*text) + "'");
			}
			options.config.visible_window_size = *rows;
		} else {
			return usage_error("unknown option '" + std::string(arg) + "'");
		}
	}

	return options;
}

void CliOptions::print_help(std::ostream& out, const std::string_view program)
{
	out << "fzpick - Interactive fuzzy list picker\n\n"
	    << "Usage: " << program << " [OPTIONS] < choices\n\n"
	    << "Choices are read from standard input, one per line, in the format\n"
	    << "'ID @ NAME'. A line without ' @ ' is used as both id and name.\n"
	    << "Selected ids are written to standard output, one per line.\n\n"
	    << "Options:\n"
	    << "  -t, --title <text>   Title shown above the search line\n"
	    << "  -f, --text <text>    Text shown below the list\n"
	    << "  -m, --multi          Allow picking several choices\n"
	    << "  -r, --rows <n>       Number of visible rows (default "
	    << Display::DefaultVisibleRows << ")\n"
	    << "  -V, --verbose        Print diagnostics on standard error\n"
	    << "  -h, --help           Show this help message\n"
	    << "  -v, --version        Show version\n\n"
	    << "Controls:\n"
	    << "  Type               Filter the list\n"
	    << "  Up/Down            Move the cursor\n"
	    << "  PgUp/PgDn          Move by a page\n"
	    << "  Space or Right     Mark the current choice (--multi)\n"
	    << "  Left               Mark or unmark every visible choice (--multi)\n"
	    << "  Enter              Confirm\n"
	    << "  Esc or Ctrl+C      Cancel\n\n"
	    << "Exit status: 0 on confirmation, 1 on cancellation, 2 on error.\n";
}

void CliOptions::print_version(std::ostream& out)
{
	out << "fzpick version " << Version << '\n';
}
