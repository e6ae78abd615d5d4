#include "table_renderer.hpp"
#include "recording_surface.hpp"
#include "monospace_metrics.hpp"
#include "row_layout.hpp"
#include "test_helpers.hpp"
#include <cassert>
#include <cstdio>
#include <set>
#include <string>

static bool has_message(const RenderSession& s, const std::string& part) {
  for (const auto& m : s.messages) if (m.find(part) != std::string::npos) return true;
  return false;
}

static PageGeometry small_page() {
  PageGeometry g;
  g.height = 168.0f; // top 118, bottom 60: header 18 + two 16pt rows
  g.margin_top = 50.0f;
  g.margin_bottom = 60.0f;
  return g;
}

static TableSpec depot_table() {
  TableSpec spec;
  spec.headers = {"Depot", "Map"};
  spec.column_widths = {100.0f, 100.0f};
  for (int i = 1; i <= 5; ++i) {
    std::string name = "Depot " + std::to_string(i);
    if (i == 3) spec.rows.push_back(Row{text_cell(name), link_cell("view", "https://maps.example/route/3")});
    else spec.rows.push_back(Row{text_cell(name), text_cell("-")});
  }
  return spec;
}

static std::string notes_for(int r) {
  std::string s;
  char buf[16];
  for (int k = 0; s.size() < 300; ++k) {
    std::snprintf(buf, sizeof(buf), "r%02dw%02d", r, k);
    if (!s.empty()) s += ' ';
    s += buf;
  }
  return s;
}

static void single_row_single_page() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  RenderSession s(surf, m, PageGeometry{});
  TableSpec spec;
  spec.headers = {"A", "B"};
  spec.column_widths = {100.0f, 100.0f};
  spec.rows = {Row{text_cell("x"), text_cell("y")}};
  float y = render_table(s, spec, 40.0f, 700.0f);
  assert(near(y, 700.0f - 18.0f - 16.0f));
  assert(surf.page_count() == 1);
  assert(surf.ops_of(DrawOp::Kind::NewPage).empty());
  assert(surf.count_text("A") == 1 && surf.count_text("B") == 1);
  assert(surf.count_text("x") == 1 && surf.count_text("y") == 1);
  assert(s.messages.empty());

  RecordingSurface plain(m);
  assert(near(render_table(plain, spec, 40.0f, 700.0f), 666.0f));
}

static void long_table_repeats_headers() {
  MonospaceMetrics m;
  TableSpec spec;
  spec.headers = {"Name", "Notes"};
  spec.column_widths = {100.0f, 150.0f};
  for (int r = 0; r < 50; ++r) spec.rows.push_back(Row{text_cell("Row " + std::to_string(r)), text_cell(notes_for(r))});
  float h = row_height(spec.rows[0], spec.column_widths, m, body_params(spec.style));
  assert(near(h, 116.0f));

  PageGeometry g;
  g.margin_top = 50.0f;
  g.margin_bottom = 60.0f;
  g.height = g.margin_top + g.margin_bottom + 18.0f + 15.0f * h + h / 2.0f;
  RecordingSurface surf(m);
  RenderSession s(surf, m, g);
  float y = render_table(s, spec, 40.0f, g.top());

  assert(surf.page_count() == 4);
  assert(s.cursor.page == 4);
  assert(near(y, g.top() - 18.0f - 5.0f * h));
  for (int p = 1; p <= 4; ++p) {
    assert(surf.count_text("Name", p) == 1);
    assert(surf.count_text("Notes", p) == 1);
    assert(surf.count_text(spec.style.continued_note, p) == (p < 4 ? 1 : 0));
  }

  int rows_seen = 0;
  int per_page[5] = {0, 0, 0, 0, 0};
  for (int r = 0; r < 50; ++r) {
    char prefix[8];
    std::snprintf(prefix, sizeof(prefix), "r%02d", r);
    std::set<int> pages;
    int name_page = 0;
    for (const auto& op : surf.ops_of(DrawOp::Kind::Text)) {
      if (op.text == "Row " + std::to_string(r)) { name_page = op.page; rows_seen++; }
      if (op.text.rfind(prefix, 0) == 0) pages.insert(op.page);
    }
    assert(name_page != 0);
    assert(pages.size() == 1 && *pages.begin() == name_page);
    per_page[name_page]++;
  }
  assert(rows_seen == 50);
  assert(per_page[1] == 15 && per_page[2] == 15 && per_page[3] == 15 && per_page[4] == 5);
}

static void overwide_token() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  RenderSession s(surf, m, PageGeometry{});
  TableSpec spec;
  spec.headers = {"Id"};
  spec.column_widths = {100.0f};
  std::string token(104, 'x');
  spec.rows = {Row{text_cell(token)}};
  float y = render_table(s, spec, 40.0f, 700.0f);
  assert(near(y, 700.0f - 18.0f - 16.0f));
  auto texts = surf.ops_of(DrawOp::Kind::Text);
  bool found = false;
  for (const auto& op : texts) {
    if (op.text == token) { found = true; assert(op.w > 100.0f); }
  }
  assert(found);
}

static void link_on_second_page() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  PageGeometry g = small_page();
  RenderSession s(surf, m, g);
  render_table(s, depot_table(), 40.0f, g.top());
  assert(surf.page_count() == 3);
  assert(surf.count_text("Depot 3", 2) == 1);

  auto links = surf.ops_of(DrawOp::Kind::Link);
  assert(links.size() == 1);
  const DrawOp& link = links[0];
  assert(link.page == 2);
  assert(link.text == "https://maps.example/route/3");

  auto texts = surf.ops_of(DrawOp::Kind::Text, 2);
  const DrawOp* view = nullptr;
  for (const auto& op : texts) if (op.text == "view") view = &op;
  assert(view != nullptr);
  assert(near(view->x, 144.0f));
  assert(near(view->y, 89.6f));
  assert(link.x >= view->x - 0.01f);
  assert(link.x + link.w <= view->x + view->w + 0.01f);
  assert(link.y >= view->y - m.descent(Font::Regular, 8.0f) - 0.01f);
  assert(link.y + link.h <= view->y + m.ascent(Font::Regular, 8.0f) + 0.01f);
  assert(link.w < 100.0f);
  // row 3 sits under the repeated header: 100 .. 84
  assert(link.y >= 84.0f && link.y + link.h <= 100.0f);
}

static void oversized_row_gets_own_page() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  PageGeometry g = small_page();
  RenderSession s(surf, m, g);
  TableSpec spec;
  spec.headers = {"H"};
  spec.column_widths = {200.0f};
  std::string tall;
  for (int i = 0; i < 20; ++i) tall += "line" + std::to_string(i) + "\n";
  spec.rows = {Row{text_cell("a")}, Row{text_cell(tall)}, Row{text_cell("b")}};
  render_table(s, spec, 40.0f, g.top());
  assert(surf.page_count() == 3);
  assert(surf.count_text("a", 1) == 1);
  assert(surf.count_text("line0", 2) == 1);
  assert(surf.count_text("line19", 2) == 1);
  assert(surf.count_text("b", 3) == 1);
  assert(surf.count_text("H") == 3);
  assert(has_message(s, "taller than the page"));
}

static void title_repeat() {
  MonospaceMetrics m;
  PageGeometry g = small_page();
  TableSpec spec = depot_table();
  spec.title = "Contacts";
  {
    RecordingSurface surf(m);
    RenderSession s(surf, m, g);
    render_table(s, spec, 40.0f, g.top());
    assert(surf.count_text("Contacts") == 1);
    assert(surf.count_text("Contacts", 1) == 1);
    assert(surf.count_text("Contacts (continued)") == 0);
    assert(surf.page_count() == 3);
  }
  spec.style.repeat_title = true;
  {
    RecordingSurface surf(m);
    RenderSession s(surf, m, g);
    render_table(s, spec, 40.0f, g.top());
    assert(surf.page_count() == 5);
    assert(surf.count_text("Contacts", 1) == 1);
    for (int p = 2; p <= 5; ++p) assert(surf.count_text("Contacts (continued)", p) == 1);
  }
}

static void header_kept_with_first_row() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  RenderSession s(surf, m, PageGeometry{});
  TableSpec spec;
  spec.headers = {"A"};
  spec.column_widths = {100.0f};
  spec.rows = {Row{text_cell("x")}};
  float y = render_table(s, spec, 40.0f, 80.0f);
  assert(surf.page_count() == 2);
  assert(surf.texts_on_page(1).empty());
  assert(surf.count_text("A", 2) == 1);
  assert(surf.count_text(spec.style.continued_note) == 0);
  assert(near(y, s.geometry.top() - 34.0f));
}

static void link_failure_policy() {
  MonospaceMetrics m;
  PageGeometry g = small_page();
  {
    RecordingSurface surf(m);
    surf.set_fail_links(true);
    RenderSession s(surf, m, g);
    render_table(s, depot_table(), 40.0f, g.top());
    assert(surf.ops_of(DrawOp::Kind::Link).empty());
    assert(surf.count_text("Depot 5") == 1);
    assert(has_message(s, "link registration failed"));
  }
  {
    RecordingSurface surf(m);
    surf.set_fail_links(true);
    RenderSession s(surf, m, g);
    s.options.continue_on_error = false;
    bool threw = false;
    try { render_table(s, depot_table(), 40.0f, g.top()); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
  }
}

static void alignment_and_centering() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  RenderSession s(surf, m, PageGeometry{});
  TableSpec spec;
  spec.headers = {"N", "T", "Z"};
  spec.column_widths = {100.0f, 20.0f, 100.0f};
  spec.rows = {Row{numeric_cell("42"), text_cell("a b c"), text_cell("z")}};
  render_table(s, spec, 40.0f, 700.0f);
  const DrawOp* num = nullptr; const DrawOp* a = nullptr; const DrawOp* c = nullptr; const DrawOp* z = nullptr;
  auto texts = surf.ops_of(DrawOp::Kind::Text);
  for (const auto& op : texts) {
    if (op.text == "42") num = &op;
    if (op.text == "a") a = &op;
    if (op.text == "c") c = &op;
    if (op.text == "z") z = &op;
  }
  assert(num && a && c && z);
  assert(near(num->x, 40.0f + (100.0f - 9.6f) / 2.0f));
  assert(near(a->x, 144.0f));
  assert(near(z->x, 164.0f));
  // row top 682, height 36: three lines and a single centered line
  assert(near(a->y, 671.6f));
  assert(near(c->y, 651.6f));
  assert(near(z->y, (a->y + c->y) / 2.0f));
}

static void empty_body_and_zebra() {
  MonospaceMetrics m;
  {
    RecordingSurface surf(m);
    RenderSession s(surf, m, PageGeometry{});
    TableSpec spec;
    spec.title = "T";
    spec.headers = {"A"};
    spec.column_widths = {100.0f};
    float y = render_table(s, spec, 40.0f, 700.0f);
    assert(near(y, 700.0f - 20.0f - 18.0f));
    assert(surf.count_text("T") == 1 && surf.count_text("A") == 1);
  }
  {
    RecordingSurface surf(m);
    RenderSession s(surf, m, PageGeometry{});
    TableSpec spec;
    spec.title = "";
    spec.headers = {"A", "B"};
    spec.column_widths = {100.0f, 100.0f};
    spec.rows = {Row{text_cell("x"), text_cell("y")}};
    float y = render_table(s, spec, 40.0f, 700.0f);
    assert(near(y, 666.0f));
    assert(surf.count_text("") == 0);
  }
  {
    RecordingSurface surf(m);
    RenderSession s(surf, m, PageGeometry{});
    TableSpec spec;
    spec.headers = {"A"};
    spec.column_widths = {100.0f};
    spec.rows = {Row{text_cell("1")}, Row{text_cell("2")}};
    render_table(s, spec, 40.0f, 700.0f);
    bool plain = false, alt = false;
    for (const auto& op : surf.ops_of(DrawOp::Kind::Rect)) {
      if (!op.fill) continue;
      if (near(op.y, 666.0f) && op.color == spec.style.row_bg) plain = true;
      if (near(op.y, 650.0f) && op.color == spec.style.alt_row_bg) alt = true;
    }
    assert(plain && alt);
  }
  {
    RecordingSurface surf(m);
    RenderSession s(surf, m, PageGeometry{});
    TableSpec spec;
    float y = render_table(s, spec, 40.0f, 500.0f);
    assert(near(y, 500.0f));
    assert(has_message(s, "no headers"));
  }
}

static void ragged_rows_are_fitted() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  RenderSession s(surf, m, PageGeometry{});
  TableSpec spec;
  spec.headers = {"A", "B"};
  spec.column_widths = {100.0f};
  spec.rows = {Row{text_cell("only")}, Row{text_cell("1"), text_cell("2"), text_cell("3")}};
  render_table(s, spec, 40.0f, 700.0f);
  assert(surf.count_text("only") == 1);
  assert(surf.count_text("2") == 1);
  assert(surf.count_text("3") == 0);
  assert(!s.messages.empty());
}

static void paragraph_flows() {
  MonospaceMetrics m;
  RecordingSurface surf(m);
  PageGeometry g = small_page();
  RenderSession s(surf, m, g);
  std::string text;
  for (int i = 0; i < 10; ++i) text += "l" + std::to_string(i) + (i < 9 ? "\n" : "");
  float y = draw_paragraph(s, text, 40.0f, 200.0f, Font::Regular, 8.0f, 10.0f);
  assert(surf.page_count() == 2);
  assert(surf.texts_on_page(1).size() == 5);
  assert(surf.texts_on_page(2).size() == 5);
  assert(near(y, g.top() - 50.0f));
  assert(!ensure_space(s, 8.0f));
  assert(ensure_space(s, 10.0f));
  assert(surf.page_count() == 3 && near(s.cursor.y, g.top()));
}

static void metrics_failure_still_renders() {
  ThrowingMetrics bad;
  RecordingSurface surf(bad);
  RenderSession s(surf, bad, PageGeometry{});
  TableSpec spec = depot_table();
  float y = render_table(s, spec, 40.0f, 700.0f);
  assert(y < 700.0f);
  assert(surf.count_text("Depot 5") == 1);
  assert(has_message(s, "font metrics failed"));
}

int main() {
  single_row_single_page();
  long_table_repeats_headers();
  overwide_token();
  link_on_second_page();
  oversized_row_gets_own_page();
  title_repeat();
  header_kept_with_first_row();
  link_failure_policy();
  alignment_and_centering();
  empty_body_and_zebra();
  ragged_rows_are_fitted();
  paragraph_flows();
  metrics_failure_still_renders();
  return 0;
}
