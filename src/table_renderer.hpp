#pragma once
/*
 * TableRenderer
 *
 * Purpose: draw a TableSpec (title bar, header row, body rows) onto a surface,
 * flowing rows across pages and repeating headers on every continuation page.
 * Returns the cursor y below the table so callers can keep composing.
 */
#include <string>
#include "render_session.hpp"
#include "table_spec.hpp"

float render_table(RenderSession& session, const TableSpec& spec, float start_x, float start_y);

// Diagnostics are dropped; geometry is the default page.
float render_table(IDrawingSurface& surface, const TableSpec& spec, float start_x, float start_y);

float draw_paragraph(RenderSession& session,
                     const std::string& text,
                     float x,
                     float width,
                     Font font,
                     float size,
                     float line_spacing,
                     const Color& color = Color{});
