#include "table_columns.hpp"
#include <algorithm>
#include <cstddef>

static constexpr float MIN_COLUMN_WIDTH = 1.0f;

std::vector<float> resolve_column_widths(const TableSpec& spec, float available_width, std::string& msg) {
  size_t cols = spec.headers.size();
  std::vector<float> out(cols, 0.0f);
  if (cols == 0) return out;
  float used = 0.0f;
  size_t missing = 0;
  for (size_t i = 0; i < cols; ++i) {
    float w = i < spec.column_widths.size() ? spec.column_widths[i] : 0.0f;
    if (w > 0.0f) { out[i] = w; used += w; }
    else missing++;
  }
  if (spec.column_widths.size() > cols) {
    msg = "ignoring " + std::to_string(spec.column_widths.size() - cols) + " extra column widths";
  }
  if (missing == 0) return out;
  float share = std::max(MIN_COLUMN_WIDTH, (available_width - used) / static_cast<float>(missing));
  for (auto& w : out) if (w <= 0.0f) w = share;
  msg = std::to_string(missing) + " column widths missing, using " + std::to_string(static_cast<int>(share)) + " each";
  return out;
}

Row normalize_row(const Row& row, size_t column_count) {
  Row out(row.begin(), row.begin() + static_cast<std::ptrdiff_t>(std::min(row.size(), column_count)));
  while (out.size() < column_count) out.push_back(TextCell{});
  return out;
}

float table_width(const std::vector<float>& widths) {
  float sum = 0.0f;
  for (float w : widths) sum += w;
  return sum;
}
