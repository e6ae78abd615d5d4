#include "ncurses_surface.hpp"
#include "terminal.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

static bool is_dark(const Color& c) {
  return 0.299f * c.r + 0.587f * c.g + 0.114f * c.b < 0.5f;
}

struct CellMap {
  int rows = 0, cols = 0;
  float sx = 1.0f, row_pt = 10.0f, page_h = 0.0f;
  int col_of(float x) const { return static_cast<int>(std::floor(x * sx)); }
  int row_of(float y) const { return static_cast<int>(std::floor((page_h - y) / row_pt)); }
};

void NcursesSurface::draw_page(int page, int rows, int cols, bool colors) const {
  CellMap m{rows, cols, cols / geometry_.width, row_points_, geometry_.height};
  std::vector<chtype> attrs(static_cast<size_t>(rows) * static_cast<size_t>(cols), A_NORMAL);
  auto at = [&](int r, int c) -> chtype& { return attrs[static_cast<size_t>(r) * cols + c]; };
  auto in = [&](int r, int c) { return r >= 0 && r < rows && c >= 0 && c < cols; };

  for (const auto& op : ops_) {
    if (op.page != page) continue;
    if (op.kind == DrawOp::Kind::Rect && op.fill && is_dark(op.color)) {
      int r0 = m.row_of(op.y + op.h), r1 = m.row_of(op.y);
      int c0 = m.col_of(op.x), c1 = m.col_of(op.x + op.w);
      for (int r = r0; r < r1; ++r)
        for (int c = c0; c < c1; ++c)
          if (in(r, c)) { at(r, c) |= A_REVERSE; mvaddch(r, c, ' ' | A_REVERSE); }
    } else if (op.kind == DrawOp::Kind::Link) {
      int r0 = m.row_of(op.y + op.h), r1 = m.row_of(op.y);
      for (int r = r0; r <= r1; ++r)
        for (int c = m.col_of(op.x); c <= m.col_of(op.x + op.w); ++c)
          if (in(r, c)) at(r, c) |= A_UNDERLINE;
    }
  }
  for (const auto& op : ops_) {
    if (op.page != page || op.kind != DrawOp::Kind::Text) continue;
    int r = m.row_of(op.y), c = m.col_of(op.x);
    if (!in(r, c)) continue;
    chtype a = at(r, c);
    if (op.font == Font::Bold) a |= A_BOLD;
    if (op.font == Font::Italic) a |= A_DIM;
    if ((a & A_UNDERLINE) && colors) a |= COLOR_PAIR(1);
    attron(static_cast<int>(a));
    mvaddnstr(r, c, op.text.c_str(), std::max(0, cols - c));
    attroff(static_cast<int>(a));
  }
}

void NcursesSurface::show(const std::string& title) {
  Terminal term;
  int current = 1;
  bool quit = false;
  while (!quit) {
    erase();
    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    draw_page(current, std::max(0, rows - 1), cols, term.colors());
    std::string status = title + "  page " + std::to_string(current) + "/" + std::to_string(page_count())
                       + "  [n]ext [p]rev [q]uit";
    attron(A_REVERSE);
    mvaddnstr(rows - 1, 0, status.c_str(), cols);
    attroff(A_REVERSE);
    ::refresh();
    int ch = getch();
    switch (ch) {
      case 'n': case ' ': case KEY_RIGHT: case KEY_NPAGE:
        current = std::min(page_count(), current + 1); break;
      case 'p': case 'b': case KEY_LEFT: case KEY_PPAGE:
        current = std::max(1, current - 1); break;
      case 'g': current = 1; break;
      case 'G': current = page_count(); break;
      case 'q': case 27: quit = true; break;
      default: break;
    }
  }
}
