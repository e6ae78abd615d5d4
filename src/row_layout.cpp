#include "row_layout.hpp"
#include <algorithm>

static constexpr float MIN_TEXT_WIDTH = 1.0f;

RowMetricsParams body_params(const TableStyle& style) {
  return RowMetricsParams{Font::Regular, style.font_size, style.line_spacing, style.padding,
                          style.cell_padding_x, style.min_row_height};
}

RowMetricsParams header_params(const TableStyle& style) {
  return RowMetricsParams{Font::Bold, style.header_font_size, style.header_line_spacing, style.padding,
                          style.cell_padding_x, style.header_min_height};
}

float text_width_for_column(float column_width, float cell_padding_x) {
  return std::max(MIN_TEXT_WIDTH, column_width - 2.0f * cell_padding_x);
}

RowLayout layout_row(const std::vector<std::string>& cell_texts,
                     const std::vector<float>& widths,
                     const IFontMetrics& metrics,
                     const RowMetricsParams& p) {
  RowLayout out;
  out.cells.reserve(cell_texts.size());
  for (size_t i = 0; i < cell_texts.size(); ++i) {
    float w = i < widths.size() ? widths[i] : 0.0f;
    std::string m;
    out.cells.push_back(wrap_text(cell_texts[i], metrics, p.font, p.size, text_width_for_column(w, p.cell_padding_x), m));
    if (!m.empty() && out.msg.empty()) out.msg = m;
    out.max_lines = std::max(out.max_lines, static_cast<int>(out.cells.back().size()));
  }
  out.height = std::max(p.min_row_height, static_cast<float>(out.max_lines) * p.line_spacing + p.padding);
  return out;
}

RowLayout layout_row(const Row& row,
                     const std::vector<float>& widths,
                     const IFontMetrics& metrics,
                     const RowMetricsParams& p) {
  std::vector<std::string> texts;
  texts.reserve(row.size());
  for (const auto& c : row) texts.push_back(cell_text(c));
  return layout_row(texts, widths, metrics, p);
}

RowLayout layout_header(const std::vector<std::string>& headers,
                        const std::vector<float>& widths,
                        const IFontMetrics& metrics,
                        const TableStyle& style) {
  return layout_row(headers, widths, metrics, header_params(style));
}

float row_height(const Row& row,
                 const std::vector<float>& widths,
                 const IFontMetrics& metrics,
                 const RowMetricsParams& p) {
  return layout_row(row, widths, metrics, p).height;
}
