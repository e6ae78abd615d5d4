#include "script.hpp"
#include "file_reader.hpp"
#include "table_renderer.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <unordered_map>

static std::string trim(const std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

static std::string join(const std::vector<std::string>& args, size_t from = 0) {
  std::string out;
  for (size_t i = from; i < args.size(); ++i) { if (i > from) out += ' '; out += args[i]; }
  return out;
}

static bool parse_float(const std::string& s, float& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  float v = std::strtof(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return false;
  out = v;
  return true;
}

static bool parse_switch(const std::string& s, bool& out) {
  if (s == "on" || s == "1" || s == "true") { out = true; return true; }
  if (s == "off" || s == "0" || s == "false") { out = false; return true; }
  return false;
}

std::vector<std::string> split_cells(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == '|') { cur += '|'; i++; continue; }
    if (s[i] == '|') { out.push_back(trim(cur)); cur.clear(); continue; }
    cur += s[i];
  }
  out.push_back(trim(cur));
  return out;
}

Cell parse_cell(const std::string& s) {
  if (s.size() >= 4 && s.front() == '[' && s.back() == ')') {
    size_t mid = s.find("](");
    if (mid != std::string::npos) return link_cell(s.substr(1, mid - 1), s.substr(mid + 2, s.size() - mid - 3));
  }
  if (s.rfind("num:", 0) == 0) return numeric_cell(trim(s.substr(4)));
  return text_cell(s);
}

ScriptParser::ScriptParser() {
  register_commands();
}

void ScriptParser::register_commands() {
  static const std::unordered_map<std::string, float PageGeometry::*> geometry_keys = {
    {"page_width", &PageGeometry::width}, {"page_height", &PageGeometry::height},
    {"margin_top", &PageGeometry::margin_top}, {"margin_bottom", &PageGeometry::margin_bottom},
    {"margin_left", &PageGeometry::margin_left}, {"margin_right", &PageGeometry::margin_right},
  };
  static const std::unordered_map<std::string, float TableStyle::*> style_keys = {
    {"font_size", &TableStyle::font_size}, {"header_font_size", &TableStyle::header_font_size},
    {"title_font_size", &TableStyle::title_font_size}, {"line_spacing", &TableStyle::line_spacing},
    {"header_line_spacing", &TableStyle::header_line_spacing}, {"padding", &TableStyle::padding},
    {"cell_padding", &TableStyle::cell_padding_x}, {"min_row_height", &TableStyle::min_row_height},
    {"header_min_height", &TableStyle::header_min_height}, {"title_height", &TableStyle::title_height},
    {"continued_note_offset", &TableStyle::continued_note_offset},
  };
  static const std::unordered_map<std::string, Color TableStyle::*> color_keys = {
    {"header_bg", &TableStyle::header_bg}, {"header_text", &TableStyle::header_text},
    {"title_bg", &TableStyle::title_bg}, {"title_text", &TableStyle::title_text},
    {"text_color", &TableStyle::text_color}, {"row_bg", &TableStyle::row_bg},
    {"alt_row_bg", &TableStyle::alt_row_bg}, {"border_color", &TableStyle::border},
    {"link_color", &TableStyle::link_color}, {"note_color", &TableStyle::note_color},
  };
  static const std::unordered_map<std::string, bool TableStyle::*> switch_keys = {
    {"zebra", &TableStyle::zebra}, {"repeat_title", &TableStyle::repeat_title},
  };

  for (const auto& kv : geometry_keys) {
    const std::string key = kv.first;
    auto member = kv.second;
    registry_.register_command("set " + key, [this, key, member](const std::vector<std::string>& args, std::string& msg){
      float v = 0.0f;
      if (args.empty() || !parse_float(args[0], v) || v < 0.0f) { msg = "set " + key + ": expects a number >= 0"; return false; }
      if (!doc_.blocks.empty() || table_) { msg = "set " + key + ": page geometry must be set before content"; return false; }
      doc_.geometry.*member = v;
      return true;
    });
  }
  for (const auto& kv : style_keys) {
    const std::string key = kv.first;
    auto member = kv.second;
    registry_.register_command("set " + key, [this, key, member](const std::vector<std::string>& args, std::string& msg){
      float v = 0.0f;
      if (args.empty() || !parse_float(args[0], v) || v < 0.0f) { msg = "set " + key + ": expects a number >= 0"; return false; }
      style_.*member = v;
      if (table_) table_->style.*member = v;
      return true;
    });
  }
  for (const auto& kv : color_keys) {
    const std::string key = kv.first;
    auto member = kv.second;
    registry_.register_command("set " + key, [this, key, member](const std::vector<std::string>& args, std::string& msg){
      bool ok = false;
      Color c = args.empty() ? Color{} : Color::from_hex(args[0], ok);
      if (!ok) { msg = "set " + key + ": expects a color like #1f3864"; return false; }
      style_.*member = c;
      if (table_) table_->style.*member = c;
      return true;
    });
  }
  for (const auto& kv : switch_keys) {
    const std::string key = kv.first;
    auto member = kv.second;
    registry_.register_command("set " + key, [this, key, member](const std::vector<std::string>& args, std::string& msg){
      bool v = !(style_.*member);
      if (!args.empty() && !parse_switch(args[0], v)) { msg = "set " + key + ": use on|off"; return false; }
      style_.*member = v;
      if (table_) table_->style.*member = v;
      return true;
    });
  }
  registry_.register_command("set continue_on_error", [this](const std::vector<std::string>& args, std::string& msg){
    bool v = !doc_.options.continue_on_error;
    if (!args.empty() && !parse_switch(args[0], v)) { msg = "set continue_on_error: use on|off"; return false; }
    doc_.options.continue_on_error = v;
    return true;
  });
  registry_.register_command("set continued_note", [this](const std::vector<std::string>& args, std::string&){
    style_.continued_note = join(args);
    if (table_) table_->style.continued_note = style_.continued_note;
    return true;
  });
  registry_.register_command("set text_size", [this](const std::vector<std::string>& args, std::string& msg){
    float v = 0.0f;
    if (args.empty() || !parse_float(args[0], v) || v <= 0.0f) { msg = "set text_size: expects a number > 0"; return false; }
    text_style_.size = v;
    return true;
  });
  registry_.register_command("set text_line_spacing", [this](const std::vector<std::string>& args, std::string& msg){
    float v = 0.0f;
    if (args.empty() || !parse_float(args[0], v) || v <= 0.0f) { msg = "set text_line_spacing: expects a number > 0"; return false; }
    text_style_.line_spacing = v;
    return true;
  });
  registry_.register_command("set table_gap", [this](const std::vector<std::string>& args, std::string& msg){
    float v = 0.0f;
    if (args.empty() || !parse_float(args[0], v) || v < 0.0f) { msg = "set table_gap: expects a number >= 0"; return false; }
    doc_.table_gap = v;
    return true;
  });

  registry_.register_command("title", [this](const std::vector<std::string>& args, std::string&){
    doc_.title = join(args);
    return true;
  });
  registry_.register_command("text", [this](const std::vector<std::string>& args, std::string&){
    ParagraphBlock p = text_style_;
    p.text = join(args);
    doc_.blocks.emplace_back(std::move(p));
    return true;
  });
  registry_.register_command("heading", [this](const std::vector<std::string>& args, std::string&){
    ParagraphBlock p = text_style_;
    p.text = join(args);
    p.font = Font::Bold;
    p.size = heading_size_;
    p.line_spacing = heading_size_ * 1.4f;
    doc_.blocks.emplace_back(std::move(p));
    return true;
  });
  registry_.register_command("space", [this](const std::vector<std::string>& args, std::string& msg){
    float v = 0.0f;
    if (args.empty() || !parse_float(args[0], v) || v < 0.0f) { msg = "space: expects a number >= 0"; return false; }
    doc_.blocks.emplace_back(SpaceBlock{v});
    return true;
  });
  registry_.register_command("newpage", [this](const std::vector<std::string>&, std::string&){
    doc_.blocks.emplace_back(PageBreakBlock{});
    return true;
  });
  registry_.register_command("table", [this](const std::vector<std::string>& args, std::string& msg){
    if (table_) { msg = "table: previous table (line " + std::to_string(table_line_) + ") was not ended"; close_table(); }
    table_.emplace();
    table_->style = style_;
    if (!args.empty()) table_->title = join(args);
    table_line_ = line_no_;
    return msg.empty();
  });
  registry_.register_command("columns", [this](const std::vector<std::string>& args, std::string& msg){
    if (!table_) { msg = "columns: no open table"; return false; }
    table_->headers.clear();
    table_->column_widths.clear();
    for (const auto& col : split_cells(join(args))) {
      std::string label = col;
      float w = 0.0f;
      size_t colon = col.rfind(':');
      if (colon != std::string::npos && parse_float(trim(col.substr(colon + 1)), w)) label = trim(col.substr(0, colon));
      else w = 0.0f;
      table_->headers.push_back(label);
      table_->column_widths.push_back(w);
    }
    return true;
  });
  registry_.register_command("row", [this](const std::vector<std::string>& args, std::string& msg){
    if (!table_) { msg = "row: no open table"; return false; }
    Row row;
    for (const auto& c : split_cells(join(args))) row.push_back(parse_cell(c));
    if (!table_->headers.empty() && row.size() != table_->headers.size()) {
      msg = "row: " + std::to_string(row.size()) + " cells for " + std::to_string(table_->headers.size()) + " columns";
      table_->rows.push_back(std::move(row));
      return false;
    }
    table_->rows.push_back(std::move(row));
    return true;
  });
  registry_.register_command("end", [this](const std::vector<std::string>&, std::string& msg){
    if (!table_) { msg = "end: no open table"; return false; }
    close_table();
    return true;
  });
}

void ScriptParser::close_table() {
  if (!table_) return;
  doc_.blocks.emplace_back(TableBlock{std::move(*table_)});
  table_.reset();
}

void ScriptParser::parse_line(const std::string& raw, int line_no) {
  line_no_ = line_no;
  std::string s = trim(raw);
  if (s.empty()) return;
  if (s[0] == '#') return;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return;
  if (s[0] == ':') s = trim(s.substr(1));
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  std::string name = cmd;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) { value = opt.substr(eq + 1); opt = opt.substr(0, eq); }
    name = "set " + opt;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    args = std::move(subargs);
  }
  std::string msg;
  bool ok = registry_.execute(name, args, msg);
  if (!ok || !msg.empty()) messages_.push_back("line " + std::to_string(line_no) + ": " + msg);
}

void ScriptParser::parse_lines(const std::vector<std::string>& lines) {
  for (size_t i = 0; i < lines.size(); ++i) parse_line(lines[i], static_cast<int>(i + 1));
}

bool ScriptParser::parse_file(const std::filesystem::path& path, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  parse_lines(lines);
  finish();
  return true;
}

bool ScriptParser::load_rc(std::string& msg) {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return true;
  auto p = std::filesystem::path(home) / PT_RC_FILE;
  if (!std::filesystem::exists(p, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(p, lines, msg)) return false;
  parse_lines(lines);
  return true;
}

void ScriptParser::finish() {
  if (!table_) return;
  messages_.push_back("line " + std::to_string(table_line_) + ": table not ended, rendering it anyway");
  close_table();
}

float compose(RenderSession& session, const ScriptDocument& doc) {
  session.options = doc.options;
  const PageGeometry& g = session.geometry;
  for (const auto& block : doc.blocks) {
    if (const auto* p = std::get_if<ParagraphBlock>(&block)) {
      draw_paragraph(session, p->text, g.margin_left, g.content_width(), p->font, p->size, p->line_spacing, p->color);
    } else if (const auto* sp = std::get_if<SpaceBlock>(&block)) {
      if (!ensure_space(session, sp->height)) session.cursor.y -= sp->height;
    } else if (std::holds_alternative<PageBreakBlock>(block)) {
      new_page(session);
    } else if (const auto* t = std::get_if<TableBlock>(&block)) {
      render_table(session, t->spec, g.margin_left, session.cursor.y);
      session.cursor.y -= doc.table_gap;
    }
  }
  return session.cursor.y;
}
