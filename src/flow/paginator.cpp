
#include "flow.h"

namespace folio {

//********************************************************************************************************************

paginator::paginator(const layout_options &Options) : m_options(Options), m_columns(Options.columns())
{
}

//********************************************************************************************************************
// Opens a new page at column zero.  The last paragraph style survives so that contextual spacing can be evaluated
// across the break; trailing spacing does not.

page_state & paginator::new_page()
{
   Log log(__FUNCTION__);

   std::optional<std::string> last_style;
   if (m_state) last_style = m_state->last_paragraph_style_id;

   auto &pg = m_pages.emplace_back();
   pg.number = int(m_pages.size());

   page_state state;
   state.pg             = &pg;
   state.column_index   = 0;
   state.top_margin     = m_options.margins.top;
   state.cursor_y       = m_options.margins.top;
   state.content_bottom = m_options.page_height - m_options.margins.bottom;
   state.trailing_spacing = 0;
   state.last_paragraph_style_id = last_style;
   m_state = state;

   log.trace("Page %d, content %g - %g", pg.number, state.top_margin, state.content_bottom);
   return *m_state;
}

//********************************************************************************************************************

page_state & paginator::ensure_page()
{
   if (!m_state) return new_page();
   return *m_state;
}

//********************************************************************************************************************
// Moves to the next column of the current page, or to a new page from the last column.

page_state & paginator::advance_column(page_state &State)
{
   m_advances++;

   if (!m_state) return new_page();

   if (&State != &*m_state) m_state->last_paragraph_style_id = State.last_paragraph_style_id;

   if (m_state->column_index + 1 < m_columns.count) {
      m_state->column_index++;
      m_state->cursor_y = m_state->top_margin;
      m_state->trailing_spacing = 0;
      return *m_state;
   }

   return new_page();
}

//********************************************************************************************************************

page_state & paginator::force_page_break()
{
   ensure_page();
   return new_page();
}

//********************************************************************************************************************

double paginator::column_x(int ColumnIndex) const
{
   return m_options.margins.left + ColumnIndex * (m_columns.width + m_columns.gap);
}

//********************************************************************************************************************
// Removes trailing pages that received no content, e.g. those opened by a break at the end of the document.

void paginator::prune_empty_pages()
{
   bool removed = false;
   while ((!m_pages.empty()) and (m_pages.back().fragments.empty())) {
      m_pages.pop_back();
      removed = true;
   }
   if (removed) m_state.reset();
}

} // namespace folio
