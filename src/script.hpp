#pragma once
/*
 * Script
 *
 * Purpose: line-oriented table script -> document blocks -> rendered pages.
 * Syntax: "set <key> <value>", "text", "heading", "space", "newpage",
 *         "table [title]" / "columns a:w | b" / "row x | [view](url) | num:3" / "end".
 * Errors: bad lines become "line N: ..." messages and are skipped.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "cmd_registry.hpp"
#include "render_session.hpp"
#include "table_spec.hpp"

struct ParagraphBlock {
  std::string text;
  Font font = Font::Regular;
  float size = 10.0f;
  float line_spacing = 13.0f;
  Color color{};
};
struct SpaceBlock { float height = 0.0f; };
struct PageBreakBlock {};
struct TableBlock { TableSpec spec; };

using Block = std::variant<ParagraphBlock, SpaceBlock, PageBreakBlock, TableBlock>;

struct ScriptDocument {
  std::string title;
  PageGeometry geometry;
  RenderOptions options;
  float table_gap = 12.0f;
  std::vector<Block> blocks;
};

class ScriptParser {
public:
  ScriptParser();
  ScriptParser(const ScriptParser&) = delete;
  ScriptParser& operator=(const ScriptParser&) = delete;
  void parse_line(const std::string& line, int line_no);
  void parse_lines(const std::vector<std::string>& lines);
  bool parse_file(const std::filesystem::path& path, std::string& msg);
  bool load_rc(std::string& msg);
  void finish();

  ScriptDocument& document() { return doc_; }
  const ScriptDocument& document() const { return doc_; }
  const TableStyle& style() const { return style_; }
  const std::vector<std::string>& messages() const { return messages_; }

private:
  void register_commands();
  void close_table();

  CommandRegistry registry_;
  ScriptDocument doc_;
  TableStyle style_;
  ParagraphBlock text_style_;
  float heading_size_ = 14.0f;
  std::optional<TableSpec> table_;
  int table_line_ = 0;
  int line_no_ = 0;
  std::vector<std::string> messages_;
};

std::vector<std::string> split_cells(const std::string& s);
Cell parse_cell(const std::string& s);

// Renders every block; returns the final cursor y.
float compose(RenderSession& session, const ScriptDocument& doc);
