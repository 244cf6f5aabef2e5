#pragma once
/*
 * RenderView
 *
 * Purpose: read-only snapshot the Editor hands to the Renderer after each event.
 * Columns are in code points (the Renderer maps them to terminal cells); rows
 * are relative to the first visible line.
 */
#include <optional>
#include <string>
#include <vector>

struct ViewSpan {
  size_t col = 0;
  size_t len = 0;
  bool current = false; /* the active search match */
};

struct ViewLine {
  std::string text;
  std::vector<ViewSpan> highlights;
};

struct OverlayView {
  std::string title;
  std::vector<std::string> lines;
  int selected = -1;   /* highlighted line, -1 for none */
  bool diff = false;   /* lines carry "+ " / "- " markers */
  std::string footer;
};

struct RenderView {
  std::vector<ViewLine> lines;
  size_t cursor_row = 0;
  size_t cursor_col = 0;
  int text_width = 80;
  std::string file_name;
  std::string status;      /* transient message, empty when expired */
  bool show_status_bar = false;
  std::string status_bar;
  std::optional<std::string> search_prompt;
  bool quit_prompt = false;
  std::optional<OverlayView> overlay;
};
