// Spacing collapse, contextual spacing and trailing carry.

#include "test_context.h"
#include <limits>

using namespace folio;

static paragraph_block styled(const std::string &ID, const char *Style, bool Contextual)
{
   auto para = make_paragraph(ID);
   if (Style) para.attrs.style_id = Style;
   para.attrs.contextual_spacing = Contextual;
   return para;
}

//********************************************************************************************************************
// Cursor deltas for a paragraph that follows one whose 20px spacing after is still carried.

void test_collapse_cursor_delta(TestContext &Context) {
   for (auto style : { "Body", "Heading" }) {
      test_cursor cursor;
      scripted_floats floats;
      auto &state = cursor.seek(100);
      state.trailing_spacing = 20;
      state.last_paragraph_style_id = "Body";

      auto b = styled("b", style, true);
      b.attrs.spacing.before = 30;
      b.attrs.spacing.after = 20;
      auto measure = make_measure(1, 20);
      layout_paragraph(make_context(b, measure, cursor, floats));

      if (std::string(style) IS "Body") {
         Context.expect_near(cursor.state.cursor_y, 120, "Same style advances by line height and spacing after only");
      }
      else Context.expect_near(cursor.state.cursor_y, 150, "Different style adds the collapsed gap of 10");
      Context.expect_near(cursor.state.trailing_spacing, 20, "Spacing after is carried");
   }
}

void test_empty_style_ids(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(100);

   auto a = styled("a", "", true);
   a.attrs.spacing.after = 10;
   auto b = styled("b", "", true);
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(a, measure, cursor, floats));
   layout_paragraph(make_context(b, measure, cursor, floats));
   Context.expect_near(cursor.fragments_for("b")[0].y, 130, "Empty style ids never match for contextual spacing");
}

void test_empty_paragraph_spacing(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(100);

   auto empty = make_paragraph("e", "");
   empty.attrs.spacing.before = 20;
   empty.attrs.spacing.after = 10;
   auto measure = make_measure(1, 20);
   layout_paragraph(make_context(empty, measure, cursor, floats));

   Context.expect_near(cursor.fragments_for("e")[0].y, 120, "Spacing before applies to an empty paragraph");
   Context.expect_near(cursor.state.cursor_y, 150, "Spacing after applies to an empty paragraph");
   Context.expect_near(cursor.state.trailing_spacing, 10, "Spacing after is carried from an empty paragraph");

   test_cursor suppressed;
   suppressed.seek(100);
   empty.attrs.explicit_spacing = spacing_explicit { false, false, false };
   layout_paragraph(make_context(empty, measure, suppressed, floats));
   Context.expect_near(suppressed.fragments_for("e")[0].y, 100, "Inherited spacing before is suppressed");
   Context.expect_near(suppressed.state.cursor_y, 120, "Inherited spacing after is suppressed");
}

// Keeps a snapshot of every state that an advance moves away from.

class forking_cursor : public test_cursor {
public:
   std::deque<page_state> retired;

   page_state & advance_column(page_state &State) override {
      retired.push_back(State);
      return test_cursor::advance_column(State);
   }
};

void test_style_recorded_before_advance(TestContext &Context) {
   forking_cursor cursor;
   scripted_floats floats;
   cursor.seek(700);

   auto a = styled("a", "Body", false);
   a.attrs.spacing.after = 40;
   auto measure = make_measure(1, 20);
   layout_paragraph(make_context(a, measure, cursor, floats));

   Context.expect_equal(cursor.retired.size(), size_t(1), "Spacing after advances once");
   if (!cursor.retired.empty()) {
      Context.expect_true(cursor.retired[0].last_paragraph_style_id IS std::optional<std::string>("Body"),
         "Style id is recorded on the state that holds the paragraph");
   }
}

//********************************************************************************************************************

void test_contextual_same_style(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(100);

   auto a = styled("a", "Body", true);
   a.attrs.spacing.after = 30;
   auto b = styled("b", "Body", true);
   b.attrs.spacing.before = 10;
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(a, measure, cursor, floats));
   Context.expect_near(cursor.state.cursor_y, 150, "Spacing after is added to the cursor");
   Context.expect_near(cursor.state.trailing_spacing, 30, "Spacing after is carried as trailing spacing");

   layout_paragraph(make_context(b, measure, cursor, floats));
   auto frags = cursor.fragments_for("b");
   Context.expect_equal(frags.size(), size_t(1), "One fragment for b");
   Context.expect_near(frags[0].y, 120, "Contextual spacing removes the gap between same-style paragraphs");
}

void test_different_style_collapses(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(100);

   auto a = styled("a", "Body", true);
   a.attrs.spacing.after = 30;
   auto b = styled("b", "Heading", true);
   b.attrs.spacing.before = 10;
   auto c = styled("c", "Body", false);
   c.attrs.spacing.before = 50;
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(a, measure, cursor, floats));
   layout_paragraph(make_context(b, measure, cursor, floats));
   Context.expect_near(cursor.fragments_for("b")[0].y, 150, "Smaller spacing before is absorbed by trailing spacing");

   // b has no spacing after, so c receives its full spacing before

   layout_paragraph(make_context(c, measure, cursor, floats));
   Context.expect_near(cursor.fragments_for("c")[0].y, 220, "Spacing before applies in full without a carry");
}

void test_larger_spacing_before_wins(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(100);

   auto a = styled("a", "Body", false);
   a.attrs.spacing.after = 30;
   auto b = styled("b", "Body", false);
   b.attrs.spacing.before = 50;
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(a, measure, cursor, floats));
   layout_paragraph(make_context(b, measure, cursor, floats));
   Context.expect_near(cursor.fragments_for("b")[0].y, 170, "Gap is the maximum of spacing after and before");
}

void test_bad_trailing_spacing(TestContext &Context) {
   const double values[] = {
      std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity(), -10
   };

   for (auto trailing : values) {
      test_cursor cursor;
      scripted_floats floats;
      cursor.seek(100).trailing_spacing = trailing;

      auto b = styled("b", "Body", false);
      b.attrs.spacing.before = 10;
      auto measure = make_measure(1, 20);
      layout_paragraph(make_context(b, measure, cursor, floats));

      Context.expect_near(cursor.fragments_for("b")[0].y, 110, "Non-finite or negative trailing spacing reads as zero");
      Context.expect_true(std::isfinite(cursor.state.trailing_spacing), "Trailing spacing is finite after layout");
   }
}

void test_spacing_after_overflow(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(700);

   auto a = styled("a", nullptr, false);
   a.attrs.spacing.after = 40;
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(a, measure, cursor, floats));
   Context.expect_equal(cursor.advances, 1, "Spacing after that does not fit advances the column");
   Context.expect_near(cursor.state.cursor_y, 50, "Cursor is at the top of the new page");
   Context.expect_near(cursor.state.trailing_spacing, 0, "No spacing is carried across the advance");
}

void test_spacing_before_retry(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(740, true);

   auto b = styled("b", nullptr, false);
   b.attrs.spacing.before = 20;
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(b, measure, cursor, floats));
   Context.expect_equal(cursor.page_of("b"), 2, "Paragraph moves to the next page");
   Context.expect_near(cursor.fragments_for("b")[0].y, 70, "Spacing before is retried at the top of the new page");
}

void test_oversized_spacing_before(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(50);

   auto b = styled("b", nullptr, false);
   b.attrs.spacing.before = 800;
   auto measure = make_measure(1, 20);

   layout_paragraph(make_context(b, measure, cursor, floats));
   Context.expect_equal(cursor.advances, 0, "Spacing taller than the page does not advance");
   Context.expect_near(cursor.fragments_for("b")[0].y, 50, "Oversized spacing is skipped");
}

void test_override_spacing_after(TestContext &Context) {
   test_cursor cursor;
   scripted_floats floats;
   cursor.seek(100);

   auto a = styled("a", "Body", true);
   a.attrs.spacing.after = 30;
   auto measure = make_measure(1, 20);

   auto ctx = make_context(a, measure, cursor, floats);
   ctx.override_spacing_after = 0;
   layout_paragraph(ctx);

   Context.expect_near(cursor.state.cursor_y, 120, "Overridden spacing after is not applied");
   Context.expect_near(cursor.state.trailing_spacing, 0, "No trailing spacing after an override of zero");
   Context.expect_true(cursor.state.last_paragraph_style_id IS std::optional<std::string>("Body"), "Last style id is recorded");
}

void test_resolve_spacing(TestContext &Context) {
   auto para = make_paragraph("p");
   para.attrs.spacing.line_space_before = 15;
   para.attrs.spacing.line_space_after = 12;
   Context.expect_near(resolve_spacing_before(para), 15, "Legacy spacing before is used when before is absent");
   Context.expect_near(resolve_spacing_after(para), 12, "Legacy spacing after is used when after is absent");

   para.attrs.spacing.before = 8;
   Context.expect_near(resolve_spacing_before(para), 8, "Spacing before takes precedence over the legacy alias");

   para.attrs.spacing.after = -4;
   Context.expect_near(resolve_spacing_after(para), 0, "Negative spacing is read as zero");

   auto empty = make_paragraph("e", "");
   empty.attrs.spacing.before = 20;
   empty.attrs.spacing.after = 20;
   Context.expect_true(is_empty_text_paragraph(empty), "A single empty text run is an empty paragraph");
   Context.expect_near(resolve_spacing_before(empty), 20, "Empty paragraphs keep spacing without a provenance record");
   Context.expect_near(resolve_spacing_after(empty), 20, "Spacing after is kept without a provenance record");

   empty.attrs.explicit_spacing = spacing_explicit { true, false, false };
   Context.expect_near(resolve_spacing_before(empty), 20, "Explicit spacing before survives on empty paragraphs");
   Context.expect_near(resolve_spacing_after(empty), 0, "Spacing after remains suppressed");

   paragraph_block no_runs;
   Context.expect_true(is_empty_text_paragraph(no_runs), "A paragraph without runs is empty");

   auto tab = make_paragraph("t", "");
   tab.runs[0].kind = RUN::TAB;
   Context.expect_true(!is_empty_text_paragraph(tab), "A tab run is content");
}

void test_safe_number(TestContext &Context) {
   Context.expect_near(safe_number(12.5), 12.5, "Finite positive values pass through");
   Context.expect_near(safe_number(-1), 0, "Negative values are zero");
   Context.expect_near(safe_number(std::numeric_limits<double>::quiet_NaN()), 0, "NaN is zero");
   Context.expect_near(safe_number(-std::numeric_limits<double>::infinity()), 0, "Infinity is zero");
}

int main() {
   TestContext test_context;
   test_collapse_cursor_delta(test_context);
   test_empty_style_ids(test_context);
   test_empty_paragraph_spacing(test_context);
   test_style_recorded_before_advance(test_context);
   test_contextual_same_style(test_context);
   test_different_style_collapses(test_context);
   test_larger_spacing_before_wins(test_context);
   test_bad_trailing_spacing(test_context);
   test_spacing_after_overflow(test_context);
   test_spacing_before_retry(test_context);
   test_oversized_spacing_before(test_context);
   test_override_spacing_after(test_context);
   test_resolve_spacing(test_context);
   test_safe_number(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
