#include "editor.hpp"
#include <cassert>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include "tmp_dir.hpp"
#include "utf8.hpp"

using namespace std::chrono_literals;

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void spit(const std::filesystem::path& p, const std::string& data) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << data;
}

/* one editor session with fake clocks and its own data dir */
struct Session {
  TempDir dir;
  Editor::Clock::time_point now{};
  std::chrono::system_clock::time_point wall = std::chrono::system_clock::time_point{} + 20000 * 24h + 12h;
  std::filesystem::path file;
  std::unique_ptr<Editor> ed;

  explicit Session(const std::string* content, Config cfg = Config{}) {
    file = dir / "doc.txt";
    if (content) spit(file, *content);
    cfg.data_dir = dir / "data";
    ed = std::make_unique<Editor>(cfg, file, [this] { return now; }, [this] { return wall; });
    std::string msg;
    Status st = ed->open(msg);
    assert(st == Status::Ok);
  }
  Editor& e() { return *ed; }
  void key(const KeyEvent& k) { ed->handle_key(k); }
  void keys(const std::string& s) {
    for (char32_t c : utf8_decode(s)) key(c == U'\n' ? KeyEvent::key(Key::Enter) : KeyEvent::chr(c));
  }
  void esc() { key(KeyEvent::key(Key::Escape)); }
  void ctrl(char32_t c) { key(KeyEvent::ctrl_chr(c)); }
  std::string text() const { return ed->buffer().text(); }
  size_t cursor() const { return ed->cursor().offset; }
  Date today() const { return local_today(wall); }
};

static const std::string* str(const std::string& s) {
  static std::string keep;
  keep = s;
  return &keep;
}

int main() {
  {
    /* dd on the middle line; cursor lands on the line that took its place */
    Session s(str("a\nb\nc"));
    s.esc();
    assert(s.e().mode() == ModeKind::Navigate);
    s.keys("j");
    assert(s.cursor() == 2);
    s.keys("dd");
    assert(s.text() == "a\nc");
    assert(s.cursor() == 2);
    assert(*s.e().register_content() == "b");
    assert(s.e().modified());
    s.keys("u");
    assert(s.text() == "a\nb\nc");
    s.ctrl(U'r');
    assert(s.text() == "a\nc");
  }
  {
    /* yy then p duplicates the line below */
    Session s(str("a\nb"));
    s.esc();
    s.keys("yy");
    assert(*s.e().register_content() == "a");
    assert(!s.e().modified());
    assert(!s.e().undo_manager().can_undo());
    s.keys("p");
    assert(s.text() == "a\na\nb");
    assert(s.cursor() == 2);
    s.keys("u");
    assert(s.text() == "a\nb");
  }
  {
    /* dd on the last line empties it and keeps the line */
    Session s(str("a\nb"));
    s.esc();
    s.keys("jdd");
    assert(s.text() == "a\n");
    assert(s.e().buffer().line_count() == 2);
    assert(s.cursor() == 2);
    assert(*s.e().register_content() == "b");
    s.keys("dd");
    assert(s.text() == "a\n");
    assert(*s.e().register_content() == "");
    s.keys("kdd");
    assert(s.text().empty());
    assert(*s.e().register_content() == "a");
    s.keys("u");
    assert(s.text() == "a\n");
    s.keys("u");
    assert(s.text() == "a\nb");
  }
  {
    Session s(str("a\nb\nc"));
    s.esc();
    s.keys("Gdd");
    assert(s.text() == "a\nb\n");
    assert(s.cursor() == 4);
  }
  {
    Session s(str("x"));
    s.esc();
    s.keys("dd");
    assert(s.text().empty());
    assert(s.cursor() == 0);
  }
  {
    /* p with nothing yanked changes nothing */
    Session s(str("a"));
    s.esc();
    s.keys("p");
    assert(s.text() == "a");
    assert(!s.e().modified());
  }
  {
    /* undo grouping follows the two second window */
    Session s(nullptr);
    s.keys("ab");
    s.now += 3s;
    s.keys("c");
    assert(s.text() == "abc");
    s.ctrl(U'z');
    assert(s.text() == "ab");
    s.ctrl(U'z');
    assert(s.text().empty());
    s.ctrl(U'z');
    assert(s.e().status() == "Nothing to undo");
    s.ctrl(U'y');
    assert(s.text() == "ab");
    s.ctrl(U'y');
    s.ctrl(U'y');
    assert(s.e().status() == "Nothing to redo");
    assert(s.text() == "abc");
  }
  {
    /* a mode change closes the open group */
    Session s(nullptr);
    s.keys("ab");
    s.esc();
    s.keys("i");
    s.keys("c");
    s.ctrl(U'z');
    assert(s.text() == "ab");
  }
  {
    /* write mode keys */
    Config cfg;
    cfg.tab_width = 2;
    Session s(nullptr, cfg);
    s.keys("ab\ncd");
    assert(s.text() == "ab\ncd");
    s.key(KeyEvent::key(Key::Home));
    assert(s.cursor() == 3);
    s.key(KeyEvent::key(Key::Backspace));
    assert(s.text() == "abcd");
    assert(s.cursor() == 2);
    s.key(KeyEvent::key(Key::Tab));
    assert(s.text() == "ab  cd");
    s.key(KeyEvent::key(Key::Delete));
    assert(s.text() == "ab  d");
    s.key(KeyEvent::key(Key::End, true));
    assert(s.cursor() == 5);
    s.key(KeyEvent::key(Key::Left, true));
    assert(s.cursor() == 4);
    s.key(KeyEvent::key(Key::Home, true));
    s.key(KeyEvent::key(Key::Backspace));
    assert(s.text() == "ab  d");
    s.keys("é");
    assert(s.text() == "éab  d");
    /* control characters are not inserted */
    s.ctrl(U'k');
    assert(s.text() == "éab  d");
  }
  {
    /* navigate keys that mean nothing are ignored */
    Session s(str("one two\nthree"));
    s.esc();
    s.keys("xQz#");
    assert(s.text() == "one two\nthree");
    assert(s.e().mode() == ModeKind::Navigate);
    s.keys("w");
    assert(s.cursor() == 4);
    s.keys("$");
    assert(s.cursor() == 6);
    s.keys("G");
    assert(s.cursor() == 12);
    s.keys("gg");
    assert(s.cursor() == 0);
    s.keys("gx");
    assert(s.cursor() == 0);
  }
  {
    /* a universal key drops a pending prefix */
    Session s(str("one\ntwo\nthree"));
    s.esc();
    s.keys("d");
    s.ctrl(U'g');
    s.keys("d");
    assert(s.text() == "one\ntwo\nthree");
    s.ctrl(U's');
    s.keys("d");
    assert(s.text() == "one\ntwo\nthree");
    s.ctrl(U'z');
    s.keys("y");
    s.ctrl(U'g');
    s.keys("y");
    assert(!s.e().register_content());
    s.ctrl(U'g');
    s.keys("dd");
    assert(s.text() == "two\nthree");
  }
  {
    /* save writes the file and a version; backup is taken once */
    Session s(str("orig"));
    s.keys("X");
    assert(slurp(s.e().backup_path()) == "orig");
    s.ctrl(U's');
    assert(s.e().status() == "Saved");
    assert(!s.e().modified());
    assert(slurp(s.file) == "Xorig");
    s.keys("Y");
    s.ctrl(U's');
    assert(slurp(s.file) == "XYorig");
    assert(slurp(s.e().backup_path()) == "orig");
    std::vector<VersionRecord> recs;
    std::string msg;
    assert(s.e().versions()->records(s.file, recs, msg) == Status::Ok);
    assert(recs.size() == 2);
    assert(recs[1].word_count == 1);
    /* transient status expires */
    s.now += 3s;
    s.e().tick();
    assert(s.e().status().empty());
  }
  {
    Session s(nullptr);
    s.keys("new");
    assert(!std::filesystem::exists(s.e().backup_path()));
  }
  {
    /* a failed backup is attempted again on the next edit */
    Session s(str("orig"));
    std::filesystem::path blocker = s.e().backup_path();
    blocker += ".tmp";
    std::filesystem::create_directory(blocker);
    s.keys("X");
    assert(!std::filesystem::exists(s.e().backup_path()));
    std::filesystem::remove(blocker);
    s.keys("Y");
    assert(slurp(s.e().backup_path()) == "orig");
  }
  {
    /* autosave neither records a version nor closes the undo group */
    Config cfg;
    cfg.autosave_seconds = 1;
    Session s(nullptr, cfg);
    s.keys("a");
    s.now += 500ms;
    s.e().tick();
    assert(!std::filesystem::exists(s.file));
    s.now += 500ms;
    s.e().tick();
    assert(slurp(s.file) == "a");
    assert(s.e().status() == "Autosaved");
    assert(!s.e().modified());
    assert(s.e().undo_manager().has_open_group());
    std::vector<VersionRecord> recs;
    std::string msg;
    assert(s.e().versions()->records(s.file, recs, msg) == Status::Ok);
    assert(recs.empty());
    s.now += 500ms;
    s.keys("b");
    s.ctrl(U'z');
    assert(s.text().empty());
  }
  {
    /* version_on_autosave records only when the text changed */
    Config cfg;
    cfg.autosave_seconds = 1;
    cfg.version_on_autosave = true;
    Session s(nullptr, cfg);
    s.keys("a");
    s.now += 1s;
    s.e().tick();
    std::vector<VersionRecord> recs;
    std::string msg;
    assert(s.e().versions()->records(s.file, recs, msg) == Status::Ok);
    assert(recs.size() == 1);
    s.keys("b");
    s.key(KeyEvent::key(Key::Backspace));
    assert(s.e().modified());
    s.now += 1s;
    s.e().tick();
    assert(!s.e().modified());
    assert(s.e().versions()->records(s.file, recs, msg) == Status::Ok);
    assert(recs.size() == 1);
  }
  {
    /* history overlay: view, diff, restore */
    Session s(str("v1 text"));
    s.ctrl(U's');
    s.wall += 1min;
    s.keys("new ");
    s.ctrl(U's');
    s.esc();
    s.keys("v");
    assert(s.e().mode() == ModeKind::History);
    RenderView v = s.e().view(20);
    assert(v.overlay && v.overlay->title == "Version History");
    assert(v.overlay->lines.size() == 2);
    assert(v.overlay->lines[0].find("new v1 text") != std::string::npos);
    assert(v.overlay->lines[0].find("2 words") == std::string::npos);
    assert(v.overlay->lines[0].find("3 words") != std::string::npos);
    assert(v.overlay->selected == 0);
    s.keys("j");
    assert(s.e().view(20).overlay->selected == 1);
    s.key(KeyEvent::key(Key::Enter));
    v = s.e().view(20);
    assert(v.overlay->title == "Version");
    assert((v.overlay->lines == std::vector<std::string>{"v1 text"}));
    s.keys("q");
    s.keys("d");
    v = s.e().view(20);
    assert(v.overlay->diff);
    assert((v.overlay->lines == std::vector<std::string>{"- v1 text", "+ new v1 text"}));
    s.esc();
    assert(s.e().mode() == ModeKind::History);
    /* universal keys still work inside the overlay */
    s.ctrl(U'g');
    assert(s.e().mode() == ModeKind::History);
    assert(s.e().view(20).show_status_bar);
    s.keys("r");
    assert(s.e().mode() == ModeKind::Navigate);
    assert(s.text() == "v1 text");
    assert(s.e().modified());
    assert(!s.e().undo_manager().can_undo());
    std::vector<VersionRecord> recs;
    std::string msg;
    assert(s.e().versions()->records(s.file, recs, msg) == Status::Ok);
    assert(recs.size() == 3);
    s.keys("v");
    assert(s.e().view(20).overlay->lines.size() == 3);
    s.keys("q");
    assert(s.e().mode() == ModeKind::Navigate);
  }
  {
    /* help and stats overlays close on any key */
    Session s(nullptr);
    s.esc();
    s.keys("?");
    assert(s.e().mode() == ModeKind::Help);
    assert(s.e().view(20).overlay->title == "Help");
    s.keys("z");
    assert(s.e().mode() == ModeKind::Navigate);
    s.keys("s");
    assert(s.e().mode() == ModeKind::Stats);
    s.esc();
    assert(s.e().mode() == ModeKind::Navigate);
  }
  {
    /* word totals: undo and redo never count twice */
    Config cfg;
    cfg.daily_goal = 2;
    Session s(nullptr, cfg);
    s.keys("one two");
    assert(s.e().stats().total_for(s.today()) == 2);
    s.ctrl(U'z');
    assert(s.text().empty());
    s.ctrl(U'y');
    assert(s.text() == "one two");
    assert(s.e().stats().total_for(s.today()) == 2);
    s.keys(" three");
    assert(s.e().stats().total_for(s.today()) == 3);
    assert(s.e().stats().session_words_written() == 3);
    RenderView v = s.e().view(10);
    assert(v.status_bar.find("Words: 3") == 0);
    assert(v.status_bar.find("WRITE [+]") != std::string::npos);
    assert(v.status_bar.find("Goal 100%+") != std::string::npos);
    assert(v.status_bar.find("Streak 1") != std::string::npos);
    s.esc();
    s.keys("s");
    v = s.e().view(10);
    bool today_line = false;
    for (const auto& l : v.overlay->lines) today_line = today_line || l == "Today:     3 words";
    assert(today_line);
    s.keys("q");
    /* stats persist at shutdown */
    s.e().shutdown();
    StatsTracker reread;
    std::string msg;
    assert(reread.load(s.dir / "data" / "stats.txt", msg) == Status::Ok);
    assert(reread.total_for(s.today()) == 3);
  }
  {
    /* the view scrolls to keep the cursor visible */
    std::string many;
    for (int i = 0; i < 30; ++i) many += "line " + std::to_string(i) + "\n";
    Session s(str(many));
    s.esc();
    for (int i = 0; i < 12; ++i) s.keys("j");
    RenderView v = s.e().view(5);
    assert(v.lines[0].text == "line 8");
    assert(v.cursor_row == 4);
    assert(v.lines.size() == 5);
    assert(v.lines[4].text == "line 12");
    s.keys("gg");
    assert(s.e().view(5).lines[0].text == "line 0");
  }
  {
    /* a file that can not be read fails to open */
    TempDir dir;
    Config cfg;
    cfg.data_dir = dir / "data";
    Editor ed(cfg, dir.path());
    std::string msg;
    assert(ed.open(msg) == Status::IoError);
    assert(!msg.empty());
  }
  {
    /* a failed save is reported and the document stays modified */
    Session s(nullptr);
    s.keys("x");
    std::filesystem::create_directory(s.file.string() + ".tmp");
    s.ctrl(U's');
    assert(s.e().status().find("Save failed") == 0);
    assert(s.e().modified());
  }
  return 0;
}
