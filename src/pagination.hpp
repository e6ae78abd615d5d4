#pragma once
/*
 * Pagination
 *
 * Purpose: table render state machine and page-fit decisions.
 * States: Idle -> HeaderPending -> BodyRendering -> PageBreak -> HeaderPending ... -> Done.
 * Invariant: fit is decided before a row draws anything, so rows never split.
 */
#include "types.hpp"

enum class PageState { Idle, HeaderPending, BodyRendering, PageBreak, Done };

struct RenderState {
  PageState state = PageState::Idle;
  bool headers_emitted_on_current_page = false;
  int next_row_index = 0;
  int rows_rendered_so_far = 0;
  int rows_on_current_page = 0;
  int pages_started = 0; // continuation pages begun by this table
  int row_count = 0;
  bool rows_remaining() const { return next_row_index < row_count; }
};

enum class Fit { Fits, Break, Forced };

const char* state_name(PageState s);

void start_table(RenderState& st, int row_count);
void finish_headers(RenderState& st);
void advance_row(RenderState& st);
void begin_page_break(RenderState& st);
void finish_page_break(RenderState& st);

// at_page_top: nothing else can be gained by breaking first (fresh page).
Fit classify_fit(const PageGeometry& g, float cursor_y, float block_height, bool at_page_top);

bool cursor_at_page_top(const PageGeometry& g, float cursor_y);
