#include "table_renderer.hpp"
#include "hyperlink.hpp"
#include "pagination.hpp"
#include "row_layout.hpp"
#include "table_columns.hpp"
#include "word_wrap.hpp"
#include <algorithm>
#include <optional>

namespace {

struct TablePlan {
  std::vector<float> widths;
  float width = 0.0f;
  std::vector<bool> numeric_column;
  RowLayout header;
};

struct TextRun {
  Font font = Font::Regular;
  float size = 0.0f;
  float line_spacing = 0.0f;
  float padding_x = 0.0f;
  bool centered = false;
};

// Baseline of line i when n lines are centered inside a row box starting at row_top.
float line_baseline(float row_top, float row_h, int n, int i, float ls, float asc, float desc) {
  float top_offset = (row_h - static_cast<float>(n) * ls) / 2.0f;
  float line_top = row_top - top_offset - static_cast<float>(i) * ls;
  return line_top - (ls + asc - desc) / 2.0f;
}

LinkZone draw_cell_lines(RenderSession& s, const WrappedLines& lines, float cell_x, float cell_w,
                         float row_top, float row_h, const TextRun& run) {
  float asc = 0.0f, desc = 0.0f;
  font_extents(s.metrics, run.font, run.size, asc, desc);
  LinkZone zone;
  bool degraded = false;
  int n = static_cast<int>(lines.size());
  for (int i = 0; i < n; ++i) {
    const auto& line = lines[i];
    float baseline = line_baseline(row_top, row_h, n, i, run.line_spacing, asc, desc);
    if (line.empty()) continue;
    float w = measure_or_estimate(s.metrics, line, run.font, run.size, degraded);
    float x = cell_x + run.padding_x;
    if (run.centered) x = std::max(x, cell_x + (cell_w - w) / 2.0f);
    s.surface.draw_text(x, baseline, line, run.font, run.size);
    zone = union_zone(zone, text_hot_zone(s.metrics, run.font, run.size, x, baseline, w));
  }
  if (degraded) note(s, "font metrics failed, text position estimated");
  return zone;
}

void draw_borders(RenderSession& s, const TablePlan& plan, float x, float row_top, float row_h) {
  float cx = x;
  for (float w : plan.widths) {
    s.surface.draw_rect(cx, row_top - row_h, w, row_h, false, true);
    cx += w;
  }
}

void draw_title(RenderSession& s, const TableSpec& spec, const TablePlan& plan, float x, bool continuation) {
  const auto& st = spec.style;
  float top = s.cursor.y;
  s.surface.set_fill_color(st.title_bg);
  s.surface.draw_rect(x, top - st.title_height, plan.width, st.title_height, true, false);
  std::string text = *spec.title;
  if (continuation) text += st.continued_title_suffix;
  s.surface.set_fill_color(st.title_text);
  TextRun run{Font::Bold, st.title_font_size, st.title_height, st.cell_padding_x, false};
  draw_cell_lines(s, WrappedLines{text}, x, plan.width, top, st.title_height, run);
  s.cursor.y -= st.title_height;
}

void draw_header(RenderSession& s, const TableSpec& spec, const TablePlan& plan, float x) {
  const auto& st = spec.style;
  float top = s.cursor.y, h = plan.header.height;
  s.surface.set_fill_color(st.header_bg);
  s.surface.draw_rect(x, top - h, plan.width, h, true, false);
  s.surface.set_stroke_color(st.border);
  draw_borders(s, plan, x, top, h);
  s.surface.set_fill_color(st.header_text);
  float cx = x;
  for (size_t c = 0; c < plan.widths.size(); ++c) {
    TextRun run{Font::Bold, st.header_font_size, st.header_line_spacing, st.cell_padding_x, plan.numeric_column[c]};
    draw_cell_lines(s, plan.header.cells[c], cx, plan.widths[c], top, h, run);
    cx += plan.widths[c];
  }
  s.cursor.y -= h;
}

void draw_body_row(RenderSession& s, const TableSpec& spec, const TablePlan& plan, float x,
                   const Row& row, const RowLayout& layout, int row_index) {
  const auto& st = spec.style;
  float top = s.cursor.y, h = layout.height;
  bool alt = st.zebra && (row_index % 2 == 1);
  s.surface.set_fill_color(alt ? st.alt_row_bg : st.row_bg);
  s.surface.draw_rect(x, top - h, plan.width, h, true, false);
  s.surface.set_stroke_color(st.border);
  draw_borders(s, plan, x, top, h);
  float cx = x;
  for (size_t c = 0; c < plan.widths.size(); ++c) {
    const Cell& cell = row[c];
    TextRun run{Font::Regular, st.font_size, st.line_spacing, st.cell_padding_x, is_numeric(cell)};
    s.surface.set_fill_color(is_link(cell) ? st.link_color : st.text_color);
    LinkZone zone = draw_cell_lines(s, layout.cells[c], cx, plan.widths[c], top, h, run);
    if (const auto* link = std::get_if<LinkCell>(&cell)) register_link(s, link->url, zone);
    cx += plan.widths[c];
  }
  s.cursor.y -= h;
}

void draw_continued_note(RenderSession& s, const TableSpec& spec, float x) {
  const auto& st = spec.style;
  if (st.continued_note.empty()) return;
  s.surface.set_fill_color(st.note_color);
  s.surface.draw_text(x, s.geometry.bottom() - st.continued_note_offset, st.continued_note, Font::Italic, st.font_size);
}

TablePlan plan_table(RenderSession& s, const TableSpec& spec, float start_x) {
  TablePlan plan;
  std::string msg;
  if (!validate_table(spec, msg)) note(s, msg);
  msg.clear();
  plan.widths = resolve_column_widths(spec, s.geometry.width - s.geometry.margin_right - start_x, msg);
  note(s, msg);
  plan.width = table_width(plan.widths);
  if (start_x + plan.width > s.geometry.width) note(s, "table wider than page");
  plan.numeric_column.assign(plan.widths.size(), false);
  if (!spec.rows.empty()) {
    const Row& first = spec.rows.front();
    for (size_t c = 0; c < plan.widths.size() && c < first.size(); ++c) plan.numeric_column[c] = is_numeric(first[c]);
  }
  plan.header = layout_header(spec.headers, plan.widths, s.metrics, spec.style);
  note(s, plan.header.msg);
  return plan;
}

} // namespace

float render_table(RenderSession& session, const TableSpec& spec, float start_x, float start_y) {
  session.cursor.y = start_y;
  if (spec.headers.empty()) {
    note(session, "table has no headers, nothing drawn");
    return session.cursor.y;
  }
  TablePlan plan = plan_table(session, spec, start_x);
  RowMetricsParams body = body_params(spec.style);
  RenderState st;
  start_table(st, static_cast<int>(spec.rows.size()));

  bool title_drawn = false;
  Row pending_row;
  std::optional<RowLayout> pending;
  auto next_layout = [&]() -> const RowLayout& {
    if (!pending) {
      pending_row = normalize_row(spec.rows[st.next_row_index], plan.widths.size());
      pending = layout_row(pending_row, plan.widths, session.metrics, body);
      note(session, pending->msg);
    }
    return *pending;
  };

  while (st.state != PageState::Done) {
    switch (st.state) {
      case PageState::HeaderPending: {
        bool with_title = spec.title && !spec.title->empty() && (!title_drawn || spec.style.repeat_title);
        float block = plan.header.height + (with_title ? spec.style.title_height : 0.0f);
        if (st.rows_remaining()) block += next_layout().height;
        bool at_top = cursor_at_page_top(session.geometry, session.cursor.y);
        if (classify_fit(session.geometry, session.cursor.y, block, at_top) == Fit::Break) {
          begin_page_break(st);
          break;
        }
        if (with_title) {
          draw_title(session, spec, plan, start_x, title_drawn);
          title_drawn = true;
        }
        draw_header(session, spec, plan, start_x);
        finish_headers(st);
        break;
      }
      case PageState::BodyRendering: {
        const RowLayout& layout = next_layout();
        Fit fit = classify_fit(session.geometry, session.cursor.y, layout.height, st.rows_on_current_page == 0);
        if (fit == Fit::Break) {
          begin_page_break(st);
          break;
        }
        if (fit == Fit::Forced) note(session, "row " + std::to_string(st.next_row_index + 1) + " taller than the page");
        draw_body_row(session, spec, plan, start_x, pending_row, layout, st.next_row_index);
        pending.reset();
        advance_row(st);
        break;
      }
      case PageState::PageBreak:
        if (st.rows_rendered_so_far > 0 && st.rows_remaining()) draw_continued_note(session, spec, start_x);
        new_page(session);
        finish_page_break(st);
        break;
      case PageState::Idle:
      case PageState::Done:
        break;
    }
  }
  return session.cursor.y;
}

float render_table(IDrawingSurface& surface, const TableSpec& spec, float start_x, float start_y) {
  RenderSession session(surface, PageGeometry{});
  session.cursor.page = std::max(1, surface.page_count());
  return render_table(session, spec, start_x, start_y);
}

float draw_paragraph(RenderSession& session,
                     const std::string& text,
                     float x,
                     float width,
                     Font font,
                     float size,
                     float line_spacing,
                     const Color& color) {
  std::string msg;
  WrappedLines lines = wrap_text(text, session.metrics, font, size, width, msg);
  note(session, msg);
  float asc = 0.0f, desc = 0.0f;
  font_extents(session.metrics, font, size, asc, desc);
  for (const auto& line : lines) {
    ensure_space(session, line_spacing);
    session.surface.set_fill_color(color);
    float baseline = line_baseline(session.cursor.y, line_spacing, 1, 0, line_spacing, asc, desc);
    if (!line.empty()) session.surface.draw_text(x, baseline, line, font, size);
    session.cursor.y -= line_spacing;
  }
  return session.cursor.y;
}
