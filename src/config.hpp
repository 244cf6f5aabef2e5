#pragma once
/*
 * Config
 *
 * Purpose: resolved editor settings with defaults, plus the ~/.scriberc loader.
 * Format: one `set name=value` per line; `#`, `"` and `//` start comments.
 * The engine only ever sees a validated Config; bad values keep the default.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

#define SCRIBE_ROPE_LEAF_MAX 512
#define SCRIBE_WRITE_CHUNK_SIZE (1 << 16)
#define SCRIBE_BACKUP_SUFFIX ".scribe-backup"
#define SCRIBE_UNDO_GROUP_WINDOW_MS 2000
#define SCRIBE_EVENT_POLL_MS 250
#define SCRIBE_MIN_COLS 40
#define SCRIBE_MIN_ROWS 10
#define SCRIBE_RC_NAME ".scriberc"

struct Config {
  int text_width = 80;
  int tab_width = 4;
  int autosave_seconds = 30;   /* 0 disables autosave */
  int status_timeout_seconds = 3;
  bool show_status = false;
  int daily_goal = 0;          /* 0 disables goals and streaks */
  bool show_progress = true;
  bool show_streak = true;
  bool versions_enabled = true;
  int max_versions = 100;
  bool version_on_autosave = false;
  std::filesystem::path data_dir; /* empty disables version and stats persistence */
};

/* $XDG_DATA_HOME/scribe, else ~/.local/share/scribe, else empty */
std::filesystem::path default_data_dir();

Status apply_setting(Config& cfg, const std::string& name, const std::string& value, std::string& msg);

/* parse one rc line (`set name=value`, `set name value`, optional leading ':') */
Status apply_rc_line(Config& cfg, const std::string& line, std::string& msg);

/* missing file is Ok; each bad line adds a warning and yields ConfigInvalid */
Status load_rc(const std::filesystem::path& path, Config& cfg, std::vector<std::string>& warnings);
