#include "render_session.hpp"
#include "pagination.hpp"

void note(RenderSession& session, const std::string& msg) {
  if (msg.empty()) return;
  session.messages.push_back("page " + std::to_string(session.cursor.page) + ": " + msg);
}

void new_page(RenderSession& session) {
  session.surface.start_new_page();
  session.cursor.page++;
  session.cursor.y = session.geometry.top();
}

bool ensure_space(RenderSession& session, float height) {
  bool at_top = cursor_at_page_top(session.geometry, session.cursor.y);
  if (classify_fit(session.geometry, session.cursor.y, height, at_top) != Fit::Break) return false;
  new_page(session);
  return true;
}
