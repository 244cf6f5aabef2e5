#include "terminal.hpp"
#include <clocale>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <ncurses.h>

TerminalSession::TerminalSession() {
  if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) throw std::runtime_error("not a terminal");
  std::setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    const char* term = std::getenv("TERM");
    throw std::runtime_error(std::string("can not initialize terminal: ") + (term ? term : "(TERM unset)"));
  }
  set_term(screen_);
  raw();
  noecho();
  nonl();
  intrflush(stdscr, FALSE);
  keypad(stdscr, TRUE);
  set_escdelay(25);
}

TerminalSession::~TerminalSession() {
  endwin();
  delscreen(screen_);
}
