// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include <gtest/gtest.h>
#include "input_handler.h"

#include <algorithm>
#include <iostream>
#include <memory>

#include <csignal>

namespace {

// Null when the test runs without a controlling terminal
std::unique_ptr<InputHandler> open_terminal()
{
	try {
		return std::make_unique<InputHandler>();
	} catch (const TerminalError& e) {
		std::cerr << "skipping: " << e.what() << '\n';
		return nullptr;
	}
}

bool winch_blocked()
{
	sigset_t mask = {};
	sigprocmask(SIG_BLOCK, nullptr, &mask);
	return sigismember(&mask, SIGWINCH) == 1;
}

} // namespace

TEST(InputHandlerTest, InterruptAndTerminationRestoreTheTerminal) {
	const auto& signals = InputHandler::ExitSignals;
	for (const int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
		EXPECT_NE(std::ranges::find(signals, sig), signals.end()) << sig;
	}
}

TEST(InputHandlerTest, MissingDeviceIsATerminalError) {
	EXPECT_THROW(InputHandler("/nonexistent/fzpick-tty"), TerminalError);
	EXPECT_FALSE(winch_blocked());
}

TEST(InputHandlerTest, ResizeBeforeWaitingIsReported) {
	auto terminal = open_terminal();
	if (!terminal) {
		GTEST_SKIP() << "no controlling terminal";
	}

	// Held pending until read_key waits, then reported instead of a key
	EXPECT_TRUE(winch_blocked());
	std::raise(SIGWINCH);
	EXPECT_EQ(terminal->read_key(), Key{Key::Kind::Resize});

	terminal.reset();
	EXPECT_FALSE(winch_blocked());
}
