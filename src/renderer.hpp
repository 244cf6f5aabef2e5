#pragma once
/*
 * Renderer
 *
 * Purpose: paint a RenderView: centered document column, search highlights,
 * status line, overlay box and quit prompt.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; vertical scrolling is already resolved by Editor::view.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "render_view.hpp"

class Renderer {
public:
  void render(ITerminal& term, const RenderView& view);

private:
  void draw_document(ITerminal& term, const RenderView& view, int rows, int cols);
  void draw_status(ITerminal& term, const RenderView& view, int row, int cols);
  void draw_overlay(ITerminal& term, const OverlayView& ov, int rows, int cols);
  void draw_quit_prompt(ITerminal& term, int rows, int cols);
};

/* the part of a UTF-8 string shown in terminal cells [from, from + n) */
std::string utf8_columns(const std::string& s, size_t from, size_t n);
