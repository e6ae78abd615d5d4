#pragma once
/*
 * TableColumns
 *
 * Purpose: settle the column widths a render uses and fit rows to the column count.
 * Constraint: valid widths pass through untouched; sum(widths) is the table width.
 */
#include <string>
#include <vector>
#include "table_spec.hpp"

std::vector<float> resolve_column_widths(const TableSpec& spec, float available_width, std::string& msg);
Row normalize_row(const Row& row, size_t column_count);
float table_width(const std::vector<float>& widths);
