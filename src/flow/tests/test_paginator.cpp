// Reference page/column cursor.

#include "test_context.h"

using namespace folio;

//********************************************************************************************************************

void test_first_page(TestContext &Context) {
   layout_options options;
   paginator pages(options);

   auto &state = pages.ensure_page();
   Context.expect_equal(pages.pages().size(), size_t(1), "The first page is created on demand");
   Context.expect_equal(state.pg->number, 1, "Pages are numbered from one");
   Context.expect_near(state.cursor_y, 96, "Cursor starts at the top margin");
   Context.expect_near(state.content_bottom, 960, "Content ends at the bottom margin");
   Context.expect_near(pages.columns().width, 624, "A single column spans the content width");
   Context.expect_near(pages.column_x(0), 96, "The first column starts at the left margin");

   auto &again = pages.ensure_page();
   Context.expect_true(&again IS &state, "ensure_page() returns the current state");
   Context.expect_equal(pages.pages().size(), size_t(1), "No further pages are created");
}

void test_columns(TestContext &Context) {
   layout_options options;
   options.column_count = 2;
   paginator pages(options);

   Context.expect_near(pages.columns().width, 288, "Column width accounts for the gap");
   Context.expect_near(pages.column_x(1), 432, "Second column position");

   auto *state = &pages.ensure_page();
   state->cursor_y = 500;
   state->trailing_spacing = 12;
   state->last_paragraph_style_id = "Body";

   state = &pages.advance_column(*state);
   Context.expect_equal(state->column_index, 1, "Advance moves to the next column");
   Context.expect_equal(state->pg->number, 1, "The page is unchanged");
   Context.expect_near(state->cursor_y, 96, "Cursor returns to the top margin");
   Context.expect_near(state->trailing_spacing, 0, "Trailing spacing is reset");

   state = &pages.advance_column(*state);
   Context.expect_equal(state->column_index, 0, "Advance from the last column opens a new page");
   Context.expect_equal(state->pg->number, 2, "Second page");
   Context.expect_true(state->last_paragraph_style_id IS std::optional<std::string>("Body"), "Last style survives advances");
   Context.expect_equal(pages.advances(), 2, "Advances are counted");
}

void test_page_breaks(TestContext &Context) {
   layout_options options;
   options.column_count = 3;
   paginator pages(options);

   pages.ensure_page().pg->fragments.push_back(fragment());
   auto &state = pages.force_page_break();
   Context.expect_equal(state.pg->number, 2, "Page break opens a new page");
   Context.expect_equal(state.column_index, 0, "Page break returns to the first column");

   pages.force_page_break();
   pages.prune_empty_pages();
   Context.expect_equal(pages.pages().size(), size_t(1), "Trailing empty pages are removed");

   auto &next = pages.ensure_page();
   Context.expect_equal(next.pg->number, 2, "Layout resumes after the pruned pages");
}

void test_options_columns(TestContext &Context) {
   layout_options options;
   options.column_count = 0;
   options.column_gap = -5;
   auto cols = options.columns();
   Context.expect_equal(cols.count, 1, "Column count is at least one");
   Context.expect_near(cols.gap, 0, "Negative gaps are ignored");
   Context.expect_near(options.content_width(), 624, "Content width");
   Context.expect_near(options.content_height(), 864, "Content height");
}

int main() {
   TestContext test_context;
   test_first_page(test_context);
   test_columns(test_context);
   test_page_breaks(test_context);
   test_options_columns(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
