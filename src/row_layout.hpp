#pragma once
/*
 * RowLayout
 *
 * Purpose: wrap every cell of one row and derive the row height.
 * Lifetime: computed per row render and dropped once the row is drawn.
 */
#include <string>
#include <vector>
#include "word_wrap.hpp"
#include "table_spec.hpp"

struct RowLayout {
  std::vector<WrappedLines> cells;
  int max_lines = 1;
  float height = 0.0f;
  std::string msg; // non-empty when metrics fell back to estimates
};

struct RowMetricsParams {
  Font font = Font::Regular;
  float size = 8.0f;
  float line_spacing = 10.0f;
  float padding = 6.0f;
  float cell_padding_x = 4.0f;
  float min_row_height = 16.0f;
};

RowMetricsParams body_params(const TableStyle& style);
RowMetricsParams header_params(const TableStyle& style);

float text_width_for_column(float column_width, float cell_padding_x);

RowLayout layout_row(const std::vector<std::string>& cell_texts,
                     const std::vector<float>& widths,
                     const IFontMetrics& metrics,
                     const RowMetricsParams& p);

RowLayout layout_row(const Row& row,
                     const std::vector<float>& widths,
                     const IFontMetrics& metrics,
                     const RowMetricsParams& p);

RowLayout layout_header(const std::vector<std::string>& headers,
                        const std::vector<float>& widths,
                        const IFontMetrics& metrics,
                        const TableStyle& style);

float row_height(const Row& row,
                 const std::vector<float>& widths,
                 const IFontMetrics& metrics,
                 const RowMetricsParams& p);
