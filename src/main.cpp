#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "editor.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"

static std::filesystem::path rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return {};
  return std::filesystem::path(home) / SCRIBE_RC_NAME;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <file>\n", argv[0]);
    return 2;
  }
  Config cfg;
  cfg.data_dir = default_data_dir();
  std::filesystem::path rc = rc_path();
  if (!rc.empty()) {
    std::vector<std::string> warnings;
    if (load_rc(rc, cfg, warnings) != Status::Ok) {
      for (const auto& w : warnings) std::fprintf(stderr, "scribe: %s\n", w.c_str());
    }
  }

  Editor ed(cfg, std::filesystem::path(argv[1]));
  std::string msg;
  if (ed.open(msg) != Status::Ok) {
    std::fprintf(stderr, "scribe: %s\n", msg.c_str());
    return 1;
  }
  try {
    TerminalSession session;
    NcursesTerminal term;
    ed.run(term);
  } catch (const std::runtime_error& e) {
    std::fprintf(stderr, "scribe: %s\n", e.what());
    return 1;
  }
  return 0;
}
