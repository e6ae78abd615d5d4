#include "pagination.hpp"
#include <stdexcept>
#include <string>

static constexpr float TOP_EPSILON = 0.01f;

const char* state_name(PageState s) {
  switch (s) {
    case PageState::Idle: return "Idle";
    case PageState::HeaderPending: return "HeaderPending";
    case PageState::BodyRendering: return "BodyRendering";
    case PageState::PageBreak: return "PageBreak";
    case PageState::Done: return "Done";
  }
  return "?";
}

static void expect(const RenderState& st, PageState want, const char* op) {
  if (st.state != want) {
    throw std::logic_error(std::string(op) + ": state is " + state_name(st.state) + ", expected " + state_name(want));
  }
}

void start_table(RenderState& st, int row_count) {
  expect(st, PageState::Idle, "start_table");
  st.row_count = row_count < 0 ? 0 : row_count;
  st.next_row_index = 0;
  st.rows_rendered_so_far = 0;
  st.rows_on_current_page = 0;
  st.headers_emitted_on_current_page = false;
  st.state = PageState::HeaderPending;
}

void finish_headers(RenderState& st) {
  expect(st, PageState::HeaderPending, "finish_headers");
  st.headers_emitted_on_current_page = true;
  st.state = st.rows_remaining() ? PageState::BodyRendering : PageState::Done;
}

void advance_row(RenderState& st) {
  expect(st, PageState::BodyRendering, "advance_row");
  st.next_row_index++;
  st.rows_rendered_so_far++;
  st.rows_on_current_page++;
  if (!st.rows_remaining()) st.state = PageState::Done;
}

void begin_page_break(RenderState& st) {
  if (st.state != PageState::BodyRendering && st.state != PageState::HeaderPending) {
    throw std::logic_error(std::string("begin_page_break: state is ") + state_name(st.state));
  }
  if (st.state == PageState::HeaderPending && st.headers_emitted_on_current_page) {
    throw std::logic_error("begin_page_break: headers already on this page");
  }
  st.state = PageState::PageBreak;
}

void finish_page_break(RenderState& st) {
  expect(st, PageState::PageBreak, "finish_page_break");
  st.pages_started++;
  st.rows_on_current_page = 0;
  st.headers_emitted_on_current_page = false;
  st.state = PageState::HeaderPending;
}

bool cursor_at_page_top(const PageGeometry& g, float cursor_y) {
  return cursor_y >= g.top() - TOP_EPSILON;
}

Fit classify_fit(const PageGeometry& g, float cursor_y, float block_height, bool at_page_top) {
  if (cursor_y - block_height >= g.bottom()) return Fit::Fits;
  return at_page_top ? Fit::Forced : Fit::Break;
}
