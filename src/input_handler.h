// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#ifndef INPUT_HANDLER_H
#define INPUT_HANDLER_H

#include "terminal_io.h"

#include <array>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

#include <csignal>
#include <termios.h>

// ============================================================================
// Input Handler
// ============================================================================

class TerminalError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Raw-mode session on the controlling terminal. The constructor acquires raw
// mode and throws TerminalError when that is impossible; the destructor puts
// the terminal back the way it was found.
class InputHandler : public TerminalIO {
public:
	// Signals that restore the terminal before ending the process
	static constexpr std::array<int, 4> ExitSignals = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

private:
	int fd_                            = -1;
	termios old_term_                  = {};
	struct sigaction old_winch_action_ = {};

	std::array<struct sigaction, ExitSignals.size()> old_exit_actions_ = {};

	// SIGWINCH stays blocked except while waiting for input
	sigset_t old_mask_  = {};
	sigset_t wait_mask_ = {};
	bool mask_saved_    = false;

	// Returns -1 when nothing arrives within `timeout`
	[[nodiscard]] int read_timeout(const std::chrono::milliseconds timeout) const;

	[[nodiscard]] bool write_all(const std::string_view text) const;

	void install_signal_handlers();

	void restore_signal_handlers();

public:
	// Returns the next byte, or -1 when none arrives within the timeout
	using ByteReader = std::function<int(std::chrono::milliseconds)>;

	explicit InputHandler(const std::string& device = "/dev/tty");

	~InputHandler() override;

	InputHandler(const InputHandler&)            = delete;
	InputHandler& operator=(const InputHandler&) = delete;

	[[nodiscard]] Key read_key() override;

	void write(const std::string_view text) override;

	[[nodiscard]] size_t rows() const override;

	[[nodiscard]] size_t cols() const override;

	// Decodes one key starting with byte `first`, pulling the rest of an
	// escape sequence from `next`
	[[nodiscard]] static Key decode(const int first, const ByteReader& next);
};

#endif
