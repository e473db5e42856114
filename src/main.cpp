// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "application.h"
#include "cli_options.h"
#include "exit_codes_t.h"
#include "input_handler.h"
#include "line_parser.h"

#include <exception>
#include <iostream>
#include <utility>

// ============================================================================
// Main
// ============================================================================

int main(const int argc, char* const argv[])
{
	try {
		const auto options = CliOptions::parse(argc, argv, std::cerr);
		if (!options) {
			return ExitError;
		}
		if (options->show_help) {
			CliOptions::print_help(std::cout, argv[0]);
			return ExitSuccess;
		}
		if (options->show_version) {
			CliOptions::print_version(std::cout);
			return ExitSuccess;
		}

		auto entries = LineParser::parse(std::cin);
		if (!entries) {
			return ExitError;
		}
		if (options->verbose) {
			std::cerr << "Loaded " << entries->size() << " entries.\n";
		}

		PickResult result = {};
		{
			InputHandler terminal;
			Application app(std::move(*entries), options->config);
			result = app.run(terminal);
		}

		if (!result.confirmed()) {
			if (options->verbose) {
				std::cerr << "Selection cancelled.\n";
			}
			return ExitCancelled;
		}

		if (options->verbose) {
			std::cerr << "Selected " << result.ids.size() << " entries.\n";
		}
		for (const auto& id : result.ids) {
			std::cout << id << '\n';
		}
		std::cout << std::flush;
		return ExitSuccess;
	} catch (const TerminalError& e) {
		std::cerr << "Error: " << e.what() << '\n';
		return ExitError;
	} catch (const std::exception& e) {
		std::cerr << "Fatal error: " << e.what() << '\n';
		return ExitError;
	}
}
