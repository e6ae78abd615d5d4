#pragma once
/*
 * WordWrap
 *
 * Purpose: greedy, word-atomic line breaking against a column width.
 * Policy: a token wider than max_width sits alone on its line, unsplit.
 * Failure: if metrics throw, wrap by an estimated characters-per-line count.
 */
#include <string>
#include <vector>
#include "i_font_metrics.hpp"

using WrappedLines = std::vector<std::string>;

WrappedLines wrap_text(const std::string& text,
                       const IFontMetrics& metrics,
                       Font font,
                       float size,
                       float max_width);

// Same as above; msg is set when the estimate fallback was used.
WrappedLines wrap_text(const std::string& text,
                       const IFontMetrics& metrics,
                       Font font,
                       float size,
                       float max_width,
                       std::string& msg);

// Whitespace split used by the wrapper; exposed for callers that re-flow text.
std::vector<std::string> split_tokens(const std::string& text);

float estimate_width(const std::string& text, float size);

float measure_or_estimate(const IFontMetrics& metrics,
                          const std::string& text,
                          Font font,
                          float size,
                          bool& degraded);

// Ascent/descent with a nominal 0.8/0.2 split when metrics throw.
void font_extents(const IFontMetrics& metrics, Font font, float size, float& ascent, float& descent);
