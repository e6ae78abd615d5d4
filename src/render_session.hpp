#pragma once
/*
 * RenderSession
 *
 * Purpose: explicit render context (surface, metrics, geometry, cursor, diagnostics).
 * Ownership: borrows surface and metrics; one session per document, one thread.
 */
#include <string>
#include <vector>
#include "i_drawing_surface.hpp"
#include "types.hpp"

struct RenderOptions {
  bool continue_on_error = true; // surface failures become diagnostics
};

struct RenderSession {
  RenderSession(IDrawingSurface& s, const IFontMetrics& m, const PageGeometry& g)
    : surface(s), metrics(m), geometry(g) { cursor.y = g.top(); }
  RenderSession(IDrawingSurface& s, const PageGeometry& g) : RenderSession(s, s, g) {}

  IDrawingSurface& surface;
  const IFontMetrics& metrics;
  PageGeometry geometry;
  Cursor cursor;
  RenderOptions options;
  std::vector<std::string> messages;
};

void note(RenderSession& session, const std::string& msg);
void new_page(RenderSession& session);
bool ensure_space(RenderSession& session, float height);
