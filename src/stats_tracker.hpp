#pragma once
/*
 * StatsTracker
 *
 * Purpose: per-day word totals (persisted), daily goal progress, streaks and
 * per-session counters.
 * Store: text file, one "YYYY-MM-DD N" per line; bad lines are skipped.
 */
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "types.hpp"

using Date = std::chrono::year_month_day;

Date local_today(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
std::string format_date(const Date& d);
bool parse_date(const std::string& s, Date& out);
/* "Xh Ym" from one hour up, else "Ym" */
std::string format_elapsed(std::chrono::seconds s);

struct GoalProgress {
  bool enabled = false;   /* false when daily goal is 0 */
  double ratio = 0.0;     /* clamped to [0, 1] for display */
  double raw_ratio = 0.0;
  bool exceeded = false;  /* today's total is above the goal */
};

class StatsTracker {
public:
  using Clock = std::chrono::steady_clock;

  explicit StatsTracker(int daily_goal = 0) : goal_(daily_goal) {}

  void set_goal(int goal) { goal_ = goal; }
  int goal() const { return goal_; }

  /* missing file is Ok and leaves the tracker empty */
  Status load(const std::filesystem::path& file, std::string& msg);
  Status save(const std::filesystem::path& file, std::string& msg) const;

  void begin_session(size_t word_count, Clock::time_point now);
  /* attribute a word-count increase to `day`; decreases only move the baseline */
  void observe(size_t word_count, const Date& day);
  /* move the baseline without attributing anything (undo, redo, restore) */
  void rebase(size_t word_count) { baseline_ = word_count; current_words_ = word_count; }

  size_t total_for(const Date& day) const;
  void set_total(const Date& day, size_t words);
  size_t streak(const Date& today) const;
  GoalProgress progress(const Date& today) const;

  size_t session_words_written() const;
  std::chrono::seconds session_elapsed(Clock::time_point now) const;

  std::vector<std::string> take_warnings();

private:
  int goal_;
  std::map<Date, size_t> days_;
  size_t baseline_ = 0;
  size_t session_start_words_ = 0;
  size_t current_words_ = 0;
  Clock::time_point session_start_{};
  std::vector<std::string> warnings_;
};
