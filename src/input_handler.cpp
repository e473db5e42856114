// Interactive fuzzy list picker for the terminal
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "input_handler.h"
#include "config_t.h"
#include "timing_t.h"
#include "utilities.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <unistd.h>

// ============================================================================
// Input Handler
// ============================================================================

namespace {

// Shared with the signal handlers, so restricted to what they may touch
volatile std::sig_atomic_t resize_pending = 0;
int active_fd                             = -1;
termios active_saved_term                 = {};

extern "C" void on_resize(int)
{
	resize_pending = 1;
}

extern "C" void on_exit_signal(const int sig)
{
	if (active_fd >= 0) {
		tcsetattr(active_fd, TCSANOW, &active_saved_term);
		constexpr char show_cursor[] = "\033[?25h";
		[[maybe_unused]] const auto n = ::write(active_fd, show_cursor, sizeof(show_cursor) - 1);
	}
	std::signal(sig, SIG_DFL);
	std::raise(sig);
}

[[nodiscard]] std::string errno_message(const std::string& what)
{
	return what + ": " + std::strerror(errno);
}

} // namespace

[[nodiscard]] int InputHandler::read_timeout(const std::chrono::milliseconds timeout) const
{
	fd_set fds = {};
	FD_ZERO(&fds);
	FD_SET(fd_, &fds);

	const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
	timeval tv{static_cast<time_t>(usec / 1000000), static_cast<suseconds_t>(usec % 1000000)};

	if (select(fd_ + 1, &fds, nullptr, nullptr, &tv) > 0) {
		unsigned char c = {};
		if (::read(fd_, &c, 1) == 1) {
			return c;
		}
	}
	return -1;
}

[[nodiscard]] bool InputHandler::write_all(const std::string_view text) const
{
	size_t written = 0;
	while (written < text.size()) {
		const ssize_t n = ::write(fd_, text.data() + written, text.size() - written);
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			return false;
		}
		written += static_cast<size_t>(n);
	}
	return true;
}

void InputHandler::install_signal_handlers()
{
	active_fd         = fd_;
	active_saved_term = old_term_;
	resize_pending    = 0;

	sigset_t winch_only = {};
	sigemptyset(&winch_only);
	sigaddset(&winch_only, SIGWINCH);
	if (sigprocmask(SIG_BLOCK, &winch_only, &old_mask_) != 0) {
		throw TerminalError(errno_message("cannot block resize signal"));
	}
	mask_saved_ = true;
	wait_mask_  = old_mask_;
	sigdelset(&wait_mask_, SIGWINCH);

	struct sigaction winch = {};
	winch.sa_handler       = on_resize;
	sigemptyset(&winch.sa_mask);
	if (sigaction(SIGWINCH, &winch, &old_winch_action_) != 0) {
		throw TerminalError(errno_message("cannot watch terminal size"));
	}

	struct sigaction quit = {};
	quit.sa_handler       = on_exit_signal;
	sigemptyset(&quit.sa_mask);
	for (size_t i = 0; i < ExitSignals.size(); ++i) {
		if (sigaction(ExitSignals[i], &quit, &old_exit_actions_[i]) != 0) {
			throw TerminalError(errno_message("cannot install signal handler"));
		}
	}
}

void InputHandler::restore_signal_handlers()
{
	active_fd = -1;
	static_cast<void>(sigaction(SIGWINCH, &old_winch_action_, nullptr));
	for (size_t i = 0; i < ExitSignals.size(); ++i) {
		static_cast<void>(sigaction(ExitSignals[i], &old_exit_actions_[i], nullptr));
	}
	if (mask_saved_) {
		static_cast<void>(sigprocmask(SIG_SETMASK, &old_mask_, nullptr));
		mask_saved_ = false;
	}
}

InputHandler::InputHandler(const std::string& device)
{
	fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
	if (fd_ < 0) {
		throw TerminalError(errno_message("cannot open " + device));
	}

	if (!isatty(fd_)) {
		::close(fd_);
		throw TerminalError(device + " is not a terminal");
	}

	if (tcgetattr(fd_, &old_term_) != 0) {
		const auto message = errno_message("cannot read terminal attributes");
		::close(fd_);
		throw TerminalError(message);
	}

	termios raw = old_term_;
	raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
	raw.c_oflag &= ~static_cast<tcflag_t>(OPOST);
	raw.c_cflag |= static_cast<tcflag_t>(CS8);
	raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
	raw.c_cc[VMIN]  = 1;
	raw.c_cc[VTIME] = 0;

	if (tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
		const auto message = errno_message("cannot enable raw mode");
		::close(fd_);
		throw TerminalError(message);
	}

	try {
		install_signal_handlers();
	} catch (const TerminalError&) {
		restore_signal_handlers();
		static_cast<void>(tcsetattr(fd_, TCSAFLUSH, &old_term_));
		::close(fd_);
		throw;
	}
}

InputHandler::~InputHandler()
{
	restore_signal_handlers();

	// Best effort, there is nobody left to report a failure to
	static_cast<void>(tcsetattr(fd_, TCSAFLUSH, &old_term_));
	static_cast<void>(write_all(Util::show_cursor()));
	::close(fd_);
}

[[nodiscard]] Key InputHandler::read_key()
{
	for (;;) {
		if (resize_pending) {
			resize_pending = 0;
			return {Key::Kind::Resize};
		}

		fd_set fds = {};
		FD_ZERO(&fds);
		FD_SET(fd_, &fds);

		// SIGWINCH is only delivered inside pselect, so a resize arriving
		// after the check above still wakes the wait
		if (pselect(fd_ + 1, &fds, nullptr, nullptr, nullptr, &wait_mask_) < 0) {
			if (errno != EINTR) {
				throw TerminalError(errno_message("cannot wait for terminal input"));
			}
			continue;
		}

		unsigned char c = {};
		const ssize_t n = ::read(fd_, &c, 1);

		if (n == 1) {
			return decode(c, [this](const std::chrono::milliseconds timeout) {
				return read_timeout(timeout);
			});
		}
		if (n == 0) {
			throw TerminalError("terminal closed");
		}
		if (errno != EINTR) {
			throw TerminalError(errno_message("cannot read from terminal"));
		}
	}
}

void InputHandler::write(const std::string_view text)
{
	if (!write_all(text)) {
		throw TerminalError(errno_message("cannot write to terminal"));
	}
}

[[nodiscard]] size_t InputHandler::rows() const
{
	winsize w = {};
	if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_row > 0) {
		return w.ws_row;
	}
	return Display::DefaultHeight;
}

[[nodiscard]] size_t InputHandler::cols() const
{
	winsize w = {};
	if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
		return w.ws_col;
	}
	return Display::DefaultWidth;
}

[[nodiscard]] Key InputHandler::decode(const int first, const ByteReader& next)
{
	using Kind = Key::Kind;

	if (first == 0x03) { // Ctrl+C
		return {Kind::CtrlC};
	}

	if (first == '\r' || first == '\n') {
		return {Kind::Enter};
	}

	if (first == 127 || first == 8) {
		return {Kind::Backspace};
	}

	if (first == 0x1B) { // Escape sequence
		const int c1 = next(Timing::EscapeTimeout);
		if (c1 == -1) {
			return {Kind::Escape};
		}
		if (c1 != '[' && c1 != 'O') {
			return {Kind::None};
		}

		int c = next(Timing::EscapeTimeout);
		switch (c) {
		case 'A': return {Kind::Up};
		case 'B': return {Kind::Down};
		case 'C': return {Kind::Right};
		case 'D': return {Kind::Left};
		case '5':
		case '6': {
			const int c3 = next(Timing::EscapeTimeout);
			if (c3 == '~') {
				return {c == '5' ? Kind::PageUp : Kind::PageDown};
			}
			c = c3;
			break;
		}
		case -1: return {Kind::None};
		}

		// Swallow the rest of an unsupported sequence up to its final byte
		while (c != -1 && !(c >= 0x40 && c <= 0x7E)) {
			c = next(Timing::EscapeTimeout);
		}
		return {Kind::None};
	}

	if (first >= 32 && first != 127) { // Printable characters and UTF-8 bytes
		return {Kind::Char, static_cast<char>(first)};
	}

	return {Kind::None};
}
