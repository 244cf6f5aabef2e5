#include "config.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include "cmd_registry.hpp"
#include "file_io.hpp"

std::filesystem::path default_data_dir() {
  const char* xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && *xdg) return std::filesystem::path(xdg) / "scribe";
  const char* home = std::getenv("HOME");
  if (home && *home) return std::filesystem::path(home) / ".local" / "share" / "scribe";
  return {};
}

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

static bool parse_bool(const std::string& s, bool& out) {
  if (s == "on" || s == "true" || s == "yes" || s == "1") { out = true; return true; }
  if (s == "off" || s == "false" || s == "no" || s == "0") { out = false; return true; }
  return false;
}

static CommandRegistry::Handler int_setting(const std::string& name, int& field, int lo, int hi) {
  return [name, &field, lo, hi](const std::vector<std::string>& args, std::string& msg) {
    int v = 0;
    if (args.empty() || !parse_int(args[0], v)) { msg = "set " + name + ": value must be a number"; return Status::ConfigInvalid; }
    if (v < lo || v > hi) {
      msg = "set " + name + ": value must be in " + std::to_string(lo) + ".." + std::to_string(hi);
      return Status::ConfigInvalid;
    }
    field = v;
    msg = name + "=" + std::to_string(v);
    return Status::Ok;
  };
}

static CommandRegistry::Handler bool_setting(const std::string& name, bool& field) {
  return [name, &field](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { field = !field; msg = name + (field ? " on" : " off"); return Status::Ok; }
    bool v = false;
    if (!parse_bool(args[0], v)) { msg = "set " + name + ": use on|off"; return Status::ConfigInvalid; }
    field = v;
    msg = name + (field ? " on" : " off");
    return Status::Ok;
  };
}

static void register_settings(CommandRegistry& registry, Config& cfg) {
  registry.register_command("set text_width", int_setting("text_width", cfg.text_width, 20, 1000));
  registry.register_command("set tab_width", int_setting("tab_width", cfg.tab_width, 1, 16));
  registry.register_command("set autosave_seconds", int_setting("autosave_seconds", cfg.autosave_seconds, 0, 86400));
  registry.register_command("set status_timeout", int_setting("status_timeout", cfg.status_timeout_seconds, 0, 3600));
  registry.register_command("set daily_goal", int_setting("daily_goal", cfg.daily_goal, 0, 1000000));
  registry.register_command("set max_versions", int_setting("max_versions", cfg.max_versions, 1, 100000));
  registry.register_command("set show_status", bool_setting("show_status", cfg.show_status));
  registry.register_command("set show_progress", bool_setting("show_progress", cfg.show_progress));
  registry.register_command("set show_streak", bool_setting("show_streak", cfg.show_streak));
  registry.register_command("set versions", bool_setting("versions", cfg.versions_enabled));
  registry.register_command("set version_on_autosave", bool_setting("version_on_autosave", cfg.version_on_autosave));
  registry.register_command("set data_dir", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    cfg.data_dir = args.empty() ? std::filesystem::path() : std::filesystem::path(args[0]);
    msg = "data_dir=" + cfg.data_dir.string();
    return Status::Ok;
  });
}

Status apply_setting(Config& cfg, const std::string& name, const std::string& value, std::string& msg) {
  CommandRegistry registry;
  register_settings(registry, cfg);
  std::vector<std::string> args;
  if (!value.empty()) args.push_back(value);
  return registry.execute("set " + name, args, msg);
}

Status apply_rc_line(Config& cfg, const std::string& line, std::string& msg) {
  std::string s = line;
  if (!s.empty() && s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown command: " + s; return Status::ConfigInvalid; }
  std::string opt = args[0];
  std::string name = opt;
  std::string value;
  size_t eq = opt.find('=');
  if (eq != std::string::npos) {
    name = opt.substr(0, eq);
    value = opt.substr(eq + 1);
  } else if (args.size() > 1) {
    value = args[1];
  }
  return apply_setting(cfg, name, value, msg);
}

Status load_rc(const std::filesystem::path& path, Config& cfg, std::vector<std::string>& warnings) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return Status::Ok;
  std::string data, msg;
  if (read_file(path, data, msg) != Status::Ok) { warnings.push_back(msg); return Status::IoError; }
  Status result = Status::Ok;
  size_t lineno = 0;
  for (std::string s : split_lines(data)) {
    ++lineno;
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string m;
    if (apply_rc_line(cfg, s, m) != Status::Ok) {
      warnings.push_back(path.filename().string() + ":" + std::to_string(lineno) + ": " + m);
      result = Status::ConfigInvalid;
    }
  }
  return result;
}
