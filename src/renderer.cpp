#include "renderer.hpp"
#include <algorithm>
#include "config.hpp"
#include "utf8.hpp"

/* code points [from, to) lie wholly inside cells [left, left + width); a wide
   character cut by `left` is dropped and leaves `pad` blank cells */
struct CellSpan {
  size_t from;
  size_t to;
  int pad;
};

static CellSpan cell_span(const std::u32string& u, size_t left, size_t width) {
  size_t x = 0, i = 0;
  while (i < u.size() && x < left) x += (size_t)char_width(u[i++]);
  if (x < left) return {u.size(), u.size(), 0};
  CellSpan sp{i, i, (int)(x - left)};
  size_t end = left + width;
  while (i < u.size() && x + (size_t)char_width(u[i]) <= end) x += (size_t)char_width(u[i++]);
  sp.to = i;
  return sp;
}

std::string utf8_columns(const std::string& s, size_t from, size_t n) {
  std::u32string u = utf8_decode(s);
  CellSpan sp = cell_span(u, from, n);
  return std::string((size_t)sp.pad, ' ') + utf8_encode(std::u32string_view(u).substr(sp.from, sp.to - sp.from));
}

static int text_cols(const std::string& s) { return (int)display_width(utf8_decode(s)); }

static void draw_box(ITerminal& term, int top, int left, int height, int width, const std::string& title) {
  std::string edge = "+" + std::string((size_t)std::max(0, width - 2), '-') + "+";
  term.draw_text(top, left, edge);
  term.draw_text(top + height - 1, left, edge);
  std::string blank = "|" + std::string((size_t)std::max(0, width - 2), ' ') + "|";
  for (int r = top + 1; r < top + height - 1; ++r) term.draw_text(r, left, blank);
  if (!title.empty()) term.draw_text(top, left + 2, " " + utf8_columns(title, 0, (size_t)std::max(0, width - 6)) + " ");
}

void Renderer::render(ITerminal& term, const RenderView& view) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows < SCRIBE_MIN_ROWS || cols < SCRIBE_MIN_COLS) {
    std::string msg = "Terminal too small";
    std::string need = "need " + std::to_string(SCRIBE_MIN_COLS) + "x" + std::to_string(SCRIBE_MIN_ROWS);
    int r = std::max(0, rows / 2 - 1);
    term.draw_text(r, std::max(0, (cols - text_cols(msg)) / 2), msg);
    if (r + 1 < rows) term.draw_text(r + 1, std::max(0, (cols - text_cols(need)) / 2), need);
    term.move_cursor(0, 0);
    term.refresh();
    return;
  }
  draw_document(term, view, rows - 1, cols);
  draw_status(term, view, rows - 1, cols);
  if (view.overlay) draw_overlay(term, *view.overlay, rows - 1, cols);
  if (view.quit_prompt) draw_quit_prompt(term, rows - 1, cols);
  if (view.overlay || view.quit_prompt) term.move_cursor(rows - 1, 0);
  term.refresh();
}

void Renderer::draw_document(ITerminal& term, const RenderView& view, int rows, int cols) {
  int width = std::clamp(view.text_width, 1, cols);
  int margin = (cols - width) / 2;

  /* lines longer than the column scroll horizontally with the cursor */
  size_t cursor_cell = 0, cursor_w = 1;
  if (view.cursor_row < view.lines.size()) {
    std::u32string u = utf8_decode(view.lines[view.cursor_row].text);
    size_t col = std::min(view.cursor_col, u.size());
    cursor_cell = display_width(std::u32string_view(u).substr(0, col));
    if (col < u.size()) cursor_w = std::max(1, char_width(u[col]));
  }
  size_t left = cursor_cell + cursor_w > (size_t)width ? cursor_cell + cursor_w - (size_t)width : 0;

  for (int i = 0; i < rows && (size_t)i < view.lines.size(); ++i) {
    const ViewLine& line = view.lines[(size_t)i];
    std::u32string u = utf8_decode(line.text);
    CellSpan sp = cell_span(u, left, (size_t)width);
    std::u32string_view uv(u);
    term.draw_text(i, margin + sp.pad, utf8_encode(uv.substr(sp.from, sp.to - sp.from)));
    for (const ViewSpan& h : line.highlights) {
      size_t s = std::max(h.col, sp.from);
      size_t e = std::min(h.col + h.len, sp.to);
      if (e <= s) continue;
      std::string seg = utf8_encode(uv.substr(s, e - s));
      int col = margin + sp.pad + (int)display_width(uv.substr(sp.from, s - sp.from));
      if (h.current) term.draw_colored(i, col, seg, PairMatch);
      else term.draw_highlighted(i, col, seg, 0, (int)(e - s));
    }
  }
  if (view.cursor_row < (size_t)rows) {
    term.move_cursor((int)view.cursor_row, margin + (int)(cursor_cell - left));
  }
}

void Renderer::draw_status(ITerminal& term, const RenderView& view, int row, int cols) {
  if (view.search_prompt) {
    std::string p = utf8_columns(*view.search_prompt, 0, (size_t)cols - 1);
    term.draw_text(row, 0, p);
    term.clear_to_eol(row, text_cols(p));
    term.move_cursor(row, text_cols(p));
    return;
  }
  std::string line;
  if (view.show_status_bar) {
    line = view.file_name + "  |  " + view.status_bar;
    if (!view.status.empty()) line += "  |  " + view.status;
  } else {
    line = view.status;
  }
  line = utf8_columns(line, 0, (size_t)cols);
  if (view.show_status_bar) term.draw_highlighted(row, 0, line, 0, text_cols(line));
  else term.draw_text(row, 0, line);
  term.clear_to_eol(row, text_cols(line));
}

void Renderer::draw_overlay(ITerminal& term, const OverlayView& ov, int rows, int cols) {
  int longest = text_cols(ov.footer);
  for (const auto& l : ov.lines) longest = std::max(longest, text_cols(l));
  int width = std::min(cols - 2, std::max(50, longest + 4));
  int body = std::max(1, std::min((int)ov.lines.size(), rows - 5));
  int height = body + 4;
  int top = std::max(0, (rows - height) / 2);
  int left = std::max(0, (cols - width) / 2);
  draw_box(term, top, left, height, width, ov.title);

  /* keep the selected entry inside the box */
  int first = 0;
  if (ov.selected >= body) first = ov.selected - body + 1;
  for (int i = 0; i < body && (size_t)(first + i) < ov.lines.size(); ++i) {
    int idx = first + i;
    const std::string& text = ov.lines[(size_t)idx];
    std::string vis = utf8_columns(text, 0, (size_t)(width - 4));
    int r = top + 1 + i;
    if (idx == ov.selected) {
      term.draw_highlighted(r, left + 2, vis, 0, text_cols(vis));
    } else if (ov.diff && text.rfind("+ ", 0) == 0) {
      term.draw_colored(r, left + 2, vis, PairAdded);
    } else if (ov.diff && text.rfind("- ", 0) == 0) {
      term.draw_colored(r, left + 2, vis, PairRemoved);
    } else {
      term.draw_text(r, left + 2, vis);
    }
  }
  term.draw_text(top + height - 2, left + 2, utf8_columns(ov.footer, 0, (size_t)(width - 4)));
}

void Renderer::draw_quit_prompt(ITerminal& term, int rows, int cols) {
  const std::string q = "Save changes before quitting?";
  const std::string a = "(y)es  (n)o  (c)ancel";
  int width = std::min(cols - 2, text_cols(q) + 6);
  int top = std::max(0, (rows - 5) / 2);
  int left = std::max(0, (cols - width) / 2);
  draw_box(term, top, left, 5, width, "Unsaved changes");
  term.draw_text(top + 1, left + 3, q);
  term.draw_text(top + 3, left + std::max(1, (width - text_cols(a)) / 2), a);
}
