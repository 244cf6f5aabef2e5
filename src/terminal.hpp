#pragma once
/*
 * TerminalSession
 *
 * Owns the ncurses screen for the lifetime of the editor loop. The tty is put
 * in raw mode so Ctrl-S/Ctrl-Q/Ctrl-Z reach the editor instead of flow control
 * and job control; the destructor hands the tty back even when the loop throws.
 * Construction throws std::runtime_error when no usable terminal is attached.
 */
struct screen;

class TerminalSession {
public:
  TerminalSession();
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

private:
  struct screen* screen_ = nullptr;
};
