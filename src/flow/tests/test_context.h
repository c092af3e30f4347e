#pragma once

// Shared check context and host collaborators for the flow tests.

#include <folio/flow.h>
#include <folio/log.h>
#include <cmath>
#include <deque>
#include <iostream>
#include <string>
#include <vector>

#ifndef IS
#define IS ==
#endif

struct TestContext {
   int total_checks{0};
   int failed_checks{0};

   void expect_true(bool Condition, char const *Message) {
      total_checks += 1;
      if (not Condition) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << '\n';
      }
   }

   template<typename T, typename U>
   void expect_equal(T const &Actual, U const &Expected, char const *Message) {
      total_checks += 1;
      if (not (Actual IS Expected)) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << " (actual=" << Actual << ", expected=" << Expected << ")\n";
      }
   }

   void expect_near(double Actual, double Expected, char const *Message, double Tolerance = 1e-6) {
      total_checks += 1;
      if (not (std::fabs(Actual - Expected) <= Tolerance)) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << " (actual=" << Actual << ", expected=" << Expected << ")\n";
      }
   }

   void summary() const {
      if (failed_checks IS 0) {
         std::cout << "All " << total_checks << " checks passed." << '\n';
      } else {
         std::cout << failed_checks << " of " << total_checks << " checks failed." << '\n';
      }
   }
};

//********************************************************************************************************************
// A single column cursor with fixed content bounds.  Every advance opens a new page unless more than one column is
// configured.

class test_cursor : public folio::page_cursor {
public:
   std::deque<folio::page> pages;
   folio::page_state state;
   double top = 50;
   double bottom = 750;
   int columns = 1;
   double column_width = 400;
   double column_gap = 0;
   int advances = 0;

   test_cursor() = default;
   test_cursor(double Top, double Bottom) : top(Top), bottom(Bottom) { }

   folio::page_state & ensure_page() override {
      if (pages.empty()) open_page();
      return state;
   }

   folio::page_state & advance_column(folio::page_state &State) override {
      advances++;
      if (state.column_index + 1 < columns) {
         state.column_index++;
         state.cursor_y = top;
         state.trailing_spacing = 0;
         return state;
      }
      open_page();
      return state;
   }

   double column_x(int ColumnIndex) const override {
      return ColumnIndex * (column_width + column_gap);
   }

   // Places the cursor at Y on the current page, optionally marking the page as having content.

   folio::page_state & seek(double Y, bool WithContent = false) {
      ensure_page();
      state.cursor_y = Y;
      if (WithContent) {
         folio::fragment filler;
         filler.block_id = "filler";
         state.pg->fragments.push_back(filler);
      }
      return state;
   }

   std::vector<folio::fragment> fragments_for(const std::string &BlockID) const {
      std::vector<folio::fragment> result;
      for (auto &pg : pages) {
         for (auto &frag : pg.fragments) {
            if (frag.block_id IS BlockID) result.push_back(frag);
         }
      }
      return result;
   }

   int page_of(const std::string &BlockID) const {
      for (auto &pg : pages) {
         for (auto &frag : pg.fragments) {
            if (frag.block_id IS BlockID) return pg.number;
         }
      }
      return 0;
   }

private:
   void open_page() {
      auto last_style = state.last_paragraph_style_id;
      auto &pg = pages.emplace_back();
      pg.number = int(pages.size());
      state = folio::page_state();
      state.pg = &pg;
      state.top_margin = top;
      state.cursor_y = top;
      state.content_bottom = bottom;
      state.last_paragraph_style_id = last_style;
   }
};

//********************************************************************************************************************
// Float service that reports a fixed narrowing for any band overlapping [Top, Bottom).

class scripted_floats : public folio::float_query {
public:
   double top = 0, bottom = 0;
   double width = 0, offset_x = 0;
   bool active = false;
   int registered = 0;
   mutable int queries = 0;

   folio::available_width compute_available_width(double Y, double LineHeight, double ColumnWidth, int ColumnIndex, int PageNumber) const override {
      queries++;
      if ((active) and (Y < bottom) and (Y + LineHeight > top)) return { width, offset_x };
      return { ColumnWidth, 0 };
   }

   void register_drawing(const folio::object_block &, const folio::object_measure &, double, int, int) override {
      registered++;
   }

   std::vector<folio::exclusion> get_exclusions_for_line(double, double, int, int) const override {
      return { };
   }
};

//********************************************************************************************************************
// Remeasure service that records its calls and returns Lines lines of LineHeight, measured at the requested width.

class recording_remeasure : public folio::remeasure_service {
public:
   struct call {
      double max_width;
      double first_line_indent;
   };

   std::vector<call> calls;
   int lines = 3;
   double line_height = 20;
   std::optional<folio::marker_measure> marker;

   folio::paragraph_measure remeasure(const folio::paragraph_block &, double MaxWidth, double FirstLineIndent) override {
      calls.push_back({ MaxWidth, FirstLineIndent });
      folio::paragraph_measure result;
      for (int i=0; i < lines; i++) {
         folio::line ln;
         ln.width = MaxWidth * 0.9;
         ln.line_height = line_height;
         ln.max_width = MaxWidth;
         result.lines.push_back(ln);
      }
      result.total_height = lines * line_height;
      result.marker = marker;
      return result;
   }
};

//********************************************************************************************************************
// Builders

inline folio::paragraph_block make_paragraph(const std::string &ID, const std::string &Text = "Text")
{
   folio::paragraph_block para;
   para.id = ID;
   folio::run r;
   r.text = Text;
   para.runs.push_back(r);
   return para;
}

inline folio::paragraph_measure make_measure(int Lines, double LineHeight, std::optional<double> MaxWidth = std::nullopt)
{
   folio::paragraph_measure measure;
   for (int i=0; i < Lines; i++) {
      folio::line ln;
      ln.from_run = 0;
      ln.to_run = 0;
      ln.from_char = i * 10;
      ln.to_char = i * 10 + 10;
      ln.width = 100;
      ln.line_height = LineHeight;
      ln.max_width = MaxWidth;
      measure.lines.push_back(ln);
   }
   measure.total_height = Lines * LineHeight;
   return measure;
}

inline folio::paragraph_context make_context(const folio::paragraph_block &Block, const folio::paragraph_measure &Measure,
   folio::page_cursor &Cursor, folio::float_query &Floats, folio::remeasure_service *Remeasure = nullptr)
{
   folio::paragraph_context ctx;
   ctx.block        = &Block;
   ctx.measure      = &Measure;
   ctx.column_width = 400;
   ctx.cursor       = &Cursor;
   ctx.floats       = &Floats;
   ctx.remeasure    = Remeasure;
   return ctx;
}
