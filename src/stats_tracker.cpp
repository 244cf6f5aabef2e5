#include "stats_tracker.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>
#include "file_io.hpp"

Date local_today(std::chrono::system_clock::time_point now) {
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  return Date{std::chrono::year{tm.tm_year + 1900}, std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
              std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
}

std::string format_date(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()), static_cast<unsigned>(d.month()),
                static_cast<unsigned>(d.day()));
  return buf;
}

static bool parse_field(const std::string& s, size_t pos, size_t len, int& out) {
  if (pos + len > s.size()) return false;
  auto [p, ec] = std::from_chars(s.data() + pos, s.data() + pos + len, out);
  return ec == std::errc() && p == s.data() + pos + len;
}

bool parse_date(const std::string& s, Date& out) {
  int y = 0, m = 0, d = 0;
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
  if (!parse_field(s, 0, 4, y) || !parse_field(s, 5, 2, m) || !parse_field(s, 8, 2, d)) return false;
  Date date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) return false;
  out = date;
  return true;
}

std::string format_elapsed(std::chrono::seconds s) {
  long long total = std::max<long long>(s.count(), 0);
  long long h = total / 3600;
  long long m = (total % 3600) / 60;
  if (h > 0) return std::to_string(h) + "h " + std::to_string(m) + "m";
  return std::to_string(m) + "m";
}

Status StatsTracker::load(const std::filesystem::path& file, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) return Status::Ok;
  std::string data;
  if (read_file(file, data, msg) != Status::Ok) return Status::IoError;
  size_t lineno = 0;
  for (const std::string& line : split_lines(data)) {
    ++lineno;
    if (line.empty()) continue;
    size_t sp = line.find(' ');
    Date d;
    unsigned long long words = 0;
    bool ok = sp != std::string::npos && parse_date(line.substr(0, sp), d);
    if (ok) {
      auto [p, e] = std::from_chars(line.data() + sp + 1, line.data() + line.size(), words);
      ok = e == std::errc() && p == line.data() + line.size();
    }
    if (!ok) {
      warnings_.push_back("stats " + file.filename().string() + ":" + std::to_string(lineno) + ": skipped bad line");
      continue;
    }
    days_[d] = static_cast<size_t>(words);
  }
  return Status::Ok;
}

Status StatsTracker::save(const std::filesystem::path& file, std::string& msg) const {
  std::error_code ec;
  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) { msg = "can not create stats dir: " + file.parent_path().string(); return Status::IoError; }
  std::string out;
  for (const auto& [d, words] : days_) out += format_date(d) + " " + std::to_string(words) + "\n";
  return write_file_atomic(file, out, msg);
}

void StatsTracker::begin_session(size_t word_count, Clock::time_point now) {
  baseline_ = word_count;
  session_start_words_ = word_count;
  current_words_ = word_count;
  session_start_ = now;
}

void StatsTracker::observe(size_t word_count, const Date& day) {
  if (word_count > baseline_) days_[day] += word_count - baseline_;
  baseline_ = word_count;
  current_words_ = word_count;
}

size_t StatsTracker::total_for(const Date& day) const {
  auto it = days_.find(day);
  return it == days_.end() ? 0 : it->second;
}

void StatsTracker::set_total(const Date& day, size_t words) { days_[day] = words; }

size_t StatsTracker::streak(const Date& today) const {
  if (goal_ <= 0) return 0;
  size_t goal = static_cast<size_t>(goal_);
  std::chrono::sys_days d{today};
  /* today still counts as in progress until its goal is met */
  if (total_for(Date{d}) < goal) d -= std::chrono::days{1};
  size_t n = 0;
  while (total_for(Date{d}) >= goal) {
    ++n;
    d -= std::chrono::days{1};
  }
  return n;
}

GoalProgress StatsTracker::progress(const Date& today) const {
  GoalProgress p;
  if (goal_ <= 0) return p;
  size_t total = total_for(today);
  p.enabled = true;
  p.raw_ratio = static_cast<double>(total) / static_cast<double>(goal_);
  p.ratio = std::clamp(p.raw_ratio, 0.0, 1.0);
  p.exceeded = total > static_cast<size_t>(goal_);
  return p;
}

size_t StatsTracker::session_words_written() const {
  return current_words_ > session_start_words_ ? current_words_ - session_start_words_ : 0;
}

std::chrono::seconds StatsTracker::session_elapsed(Clock::time_point now) const {
  if (now < session_start_) return std::chrono::seconds{0};
  return std::chrono::duration_cast<std::chrono::seconds>(now - session_start_);
}

std::vector<std::string> StatsTracker::take_warnings() {
  std::vector<std::string> out;
  out.swap(warnings_);
  return out;
}
