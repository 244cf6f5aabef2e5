#include "renderer.hpp"
#include <cassert>
#include <fstream>
#include <sstream>
#include <string>
#include "editor.hpp"
#include "headless_terminal.hpp"
#include "tmp_dir.hpp"
#include "utf8.hpp"

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static RenderView basic_view() {
  RenderView v;
  v.text_width = 40;
  v.file_name = "doc.txt";
  ViewLine a;
  a.text = "hello world";
  a.highlights.push_back(ViewSpan{6, 5, false});
  ViewLine b;
  b.text = "second";
  b.highlights.push_back(ViewSpan{0, 3, true});
  v.lines = {a, b};
  v.cursor_row = 1;
  v.cursor_col = 2;
  v.status = "Saved";
  return v;
}

int main() {
  Renderer r;
  {
    HeadlessTerminal term(8, 30);
    r.render(term, basic_view());
    assert(term.screen_contains("Terminal too small"));
    assert(!term.screen_contains("hello"));
  }
  {
    HeadlessTerminal term(12, 60);
    r.render(term, basic_view());
    /* column of width 40 centered in 60 */
    assert(term.row_text(0) == std::string(10, ' ') + "hello world");
    assert(term.row_attrs(0).substr(16, 5) == "RRRRR");
    assert(term.row_attrs(0)[15] == ' ');
    assert(term.row_attrs(1).substr(10, 3) == "CCC");
    assert(term.last_color() == PairMatch);
    assert(term.cursor_row() == 1 && term.cursor_col() == 12);
    assert(term.row_text(11) == "Saved");
    assert(term.refreshes() == 1);
  }
  {
    HeadlessTerminal term(12, 60);
    RenderView v = basic_view();
    v.show_status_bar = true;
    v.status_bar = "Words: 3  |  0m  |  NAV";
    r.render(term, v);
    assert(term.row_text(11).rfind("doc.txt  |  Words: 3", 0) == 0);
    assert(term.row_text(11).find("Saved") != std::string::npos);
    assert(term.row_attrs(11)[0] == 'R');
  }
  {
    HeadlessTerminal term(12, 60);
    RenderView v = basic_view();
    v.search_prompt = "/abc";
    r.render(term, v);
    assert(term.row_text(11) == "/abc");
    assert(term.cursor_row() == 11 && term.cursor_col() == 4);
  }
  {
    /* long lines scroll horizontally with the cursor */
    HeadlessTerminal term(12, 40);
    RenderView v;
    v.text_width = 20;
    ViewLine l;
    l.text = "abcdefghijklmnopqrstuvwxyz0123";
    v.lines = {l};
    v.cursor_col = 25;
    r.render(term, v);
    assert(term.row_text(0) == std::string(10, ' ') + "ghijklmnopqrstuvwxyz");
    assert(term.cursor_col() == 29);
  }
  {
    HeadlessTerminal term(20, 70);
    RenderView v = basic_view();
    OverlayView ov;
    ov.title = "Version History";
    ov.lines = {"first entry", "second entry"};
    ov.selected = 1;
    ov.footer = "q back";
    v.overlay = ov;
    r.render(term, v);
    assert(term.screen_contains("Version History"));
    assert(term.screen_contains("q back"));
    int row = -1;
    for (int i = 0; i < 20; ++i) if (term.row_text(i).find("second entry") != std::string::npos) row = i;
    assert(row >= 0);
    size_t col = term.row_text(row).find("second entry");
    assert(term.row_attrs(row)[col] == 'R');
    assert(term.cursor_row() == 19 && term.cursor_col() == 0);

    ov.title = "Diff (version -> current)";
    ov.lines = {"  same", "+ added", "- removed"};
    ov.selected = -1;
    ov.diff = true;
    v.overlay = ov;
    r.render(term, v);
    assert(term.screen_contains("+ added"));
    assert(term.last_color() == PairRemoved);
  }
  {
    HeadlessTerminal term(12, 60);
    RenderView v = basic_view();
    v.quit_prompt = true;
    r.render(term, v);
    assert(term.screen_contains("Save changes before quitting?"));
    assert(term.screen_contains("(y)es  (n)o  (c)ancel"));
    assert(term.cursor_row() == 11);
  }
  {
    assert(utf8_columns("héllo", 1, 3) == "éll");
    assert(utf8_columns("abc", 5, 2).empty());
    assert(char_width(U'a') == 1);
    assert(char_width(U'日') == 2);
    assert(char_width(U'\u0301') == 0);
    assert(display_width(U"日本x") == 5);
    /* a wide character cut by the left edge leaves a blank cell */
    assert(utf8_columns("日本語", 1, 4) == " 本");
  }
  {
    /* the cursor sits after wide characters in screen cells */
    HeadlessTerminal term(12, 60);
    RenderView v;
    v.text_width = 40;
    ViewLine l;
    l.text = "日本語abc";
    l.highlights.push_back(ViewSpan{3, 3, false});
    v.lines = {l};
    v.cursor_col = 3;
    r.render(term, v);
    assert(term.row_text(0) == std::string(10, ' ') + "日本語abc");
    assert(term.cursor_row() == 0 && term.cursor_col() == 16);
    assert(term.row_attrs(0).substr(16, 3) == "RRR");
    assert(term.row_attrs(0)[15] == ' ');
  }
  {
    /* horizontal scroll counts cells, not code points */
    HeadlessTerminal term(12, 60);
    RenderView v;
    v.text_width = 4;
    ViewLine l;
    l.text = "日本語x";
    v.lines = {l};
    v.cursor_col = 3;
    r.render(term, v);
    assert(term.row_text(0) == std::string(29, ' ') + "語x");
    assert(term.cursor_col() == 31);
  }
  {
    /* the event loop against a scripted terminal */
    TempDir dir;
    Config cfg;
    cfg.data_dir = dir / "data";
    Editor ed(cfg, dir / "run.txt");
    std::string msg;
    assert(ed.open(msg) == Status::Ok);
    HeadlessTerminal term(12, 60);
    term.push_text("hello");
    term.push_key(KeyEvent::ctrl_chr(U's'));
    ed.run(term);
    assert(ed.should_quit());
    assert(slurp(dir / "run.txt") == "hello");
    assert(term.screen_contains("hello"));
    assert(term.refreshes() >= 7);
    assert(std::filesystem::exists(dir / "data" / "stats.txt"));
  }
  {
    /* unsaved text is discarded when the script ends */
    TempDir dir;
    Config cfg;
    cfg.data_dir = dir / "data";
    Editor ed(cfg, dir / "scratch.txt");
    std::string msg;
    assert(ed.open(msg) == Status::Ok);
    HeadlessTerminal term(12, 60);
    term.push_text("draft");
    ed.run(term);
    assert(ed.should_quit());
    assert(!std::filesystem::exists(dir / "scratch.txt"));
  }
  return 0;
}
