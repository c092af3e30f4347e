/*

Paragraph flow places one paragraph's pre-measured lines onto the current page and column, mutating the cursor state
that is shared with the paragraphs before and after it.  The order of operations is significant:

  1. Anchored objects associated with the paragraph are positioned and registered as exclusions.
  2. Lines measured wider than the column are re-broken once at the column width.
  3. Spacing before/after is resolved, including the suppression rules for empty paragraphs.
  4. Positioned frames (frame wrap 'none') are emitted as a single fragment and the call ends.
  5. The vertical extent of the paragraph is scanned for floats and the narrowest band triggers a single re-break.
  6. Lines are sliced into fragments, advancing columns as required.
  7. Spacing after is carried into the cursor's trailing spacing.

SPACING
-------
Spacing collapses in the manner of CSS margins: the gap between paragraphs is the larger of the previous
paragraph's carried trailing spacing and the current paragraph's spacing before, never their sum.  Contextual
spacing removes the gap entirely between paragraphs that share a style id, which requires the previously applied
trailing spacing to be subtracted from the cursor.

*/

#include "flow.h"

namespace folio {

// State for a single flow call.  Discarded when the call returns.

struct paragraph_flow {
   const paragraph_context &m_ctx;
   const paragraph_block   &m_block;
   const paragraph_measure &m_measure;
   page_cursor &m_cursor;
   float_query &m_floats;

   std::vector<line> m_lines;
   std::optional<marker_measure> m_remeasured_marker;
   std::optional<std::string> m_style_id;

   double m_indent_left  = 0;
   double m_indent_right = 0;
   double m_remeasure_width = 1;   // Usable column width after paragraph indents
   double m_spacing_before = 0;
   double m_spacing_after  = 0;
   double m_base_spacing_before = 0; // Uncollapsed spacing before, used for blank page checks
   double m_narrowest_width  = 0;
   double m_narrowest_offset = 0;
   int  m_break_loop = MAXLOOP;
   bool m_applied_spacing_before = false;
   bool m_remeasured_for_column = false;
   bool m_remeasured_for_floats = false;

   paragraph_flow(const paragraph_context &Context) :
      m_ctx(Context), m_block(*Context.block), m_measure(*Context.measure), m_cursor(*Context.cursor),
      m_floats(*Context.floats) { }

   void place_anchors(anchors_context &);
   void remeasure_for_column();
   void resolve_spacing();
   bool place_frame();
   void scan_floats();
   void place_lines();

private:
   bool advance(page_state *&);
   void apply_marker(fragment &, bool) const;
   bool apply_spacing_before(page_state *&);
   bool keep_lines_advance(page_state *&);
};

//********************************************************************************************************************
// Moves to the next column or page.  Returns false without moving if the loop guard has tripped, in which case the
// caller continues at the current position.

bool paragraph_flow::advance(page_state *&State)
{
   Log log(__FUNCTION__);

   if (--m_break_loop <= 0) {
      if (!m_break_loop) {
         log.warning("Paragraph '%s' exceeded %d column advances; placing remaining lines in place.", m_block.id.c_str(), MAXLOOP);
         if (m_ctx.loop_tripped) *m_ctx.loop_tripped = true;
      }
      return false;
   }

   State = &m_cursor.advance_column(*State);
   log.detail("Advanced to page %d, column %d, y: %g", State->pg ? State->pg->number : 0, State->column_index, State->cursor_y);
   return true;
}

//********************************************************************************************************************
// Positions each anchored object that has not been placed yet.  The vertical position combines vRelativeFrom with
// alignV; horizontal placement is delegated to compute_anchor_x().  Each object is registered with the float service
// before its fragment is emitted so that the lines that follow are narrowed by it.

void place_anchored_objects(page_cursor &Cursor, float_query &Floats, anchors_context &Anchors, double FirstLineHeight)
{
   Log log(__FUNCTION__);

   for (auto &entry : Anchors.drawings) {
      if ((!entry.block) or (!entry.measure)) continue;
      auto &obj = *entry.block;
      auto &om  = *entry.measure;

      if ((Anchors.placed_ids) and (Anchors.placed_ids->contains(obj.id))) continue;

      auto &state = Cursor.ensure_page();

      const double content_top    = state.top_margin;
      const double content_bottom = state.content_bottom;
      const double content_height = std::max(0.0, content_bottom - content_top);
      const double obj_height     = om.height;

      VREL vrel = VREL::NIL;
      VALIGN valign = VALIGN::NIL;
      double offset_v = 0;
      if (obj.anchor) {
         vrel     = obj.anchor->v_relative_from;
         valign   = obj.anchor->align_v;
         offset_v = finite_or(obj.anchor->offset_v);
      }

      double anchor_y;
      switch (vrel) {
         case VREL::MARGIN:
            if (valign IS VALIGN::BOTTOM) anchor_y = content_bottom - obj_height + offset_v;
            else if (valign IS VALIGN::CENTER) anchor_y = content_top + (content_height - obj_height) * 0.5 + offset_v;
            else anchor_y = content_top + offset_v;
            break;

         case VREL::PAGE: {
            double page_height = (Anchors.page_height > 0) ? Anchors.page_height : content_bottom + Anchors.margins.bottom;
            if (valign IS VALIGN::BOTTOM) anchor_y = page_height - obj_height + offset_v;
            else if (valign IS VALIGN::CENTER) anchor_y = (page_height - obj_height) * 0.5 + offset_v;
            else anchor_y = offset_v;
            break;
         }

         case VREL::PARAGRAPH: {
            if (valign IS VALIGN::BOTTOM) anchor_y = state.cursor_y + FirstLineHeight - obj_height + offset_v;
            else if (valign IS VALIGN::CENTER) anchor_y = state.cursor_y + (FirstLineHeight - obj_height) * 0.5 + offset_v;
            else anchor_y = state.cursor_y + offset_v;
            break;
         }

         default: // No relative base; legacy offset from the cursor
            anchor_y = state.cursor_y + offset_v;
            break;
      }

      int page_number = state.pg ? state.pg->number : 1;
      Floats.register_drawing(obj, om, anchor_y, state.column_index, page_number);

      double anchor_x;
      if (obj.anchor) {
         anchor_x = compute_anchor_x(*obj.anchor, state.column_index, Anchors.columns, om.width, Anchors.margins, Anchors.page_width);
      }
      else anchor_x = Cursor.column_x(state.column_index);

      fragment frag;
      frag.block_id    = obj.id;
      frag.x           = anchor_x;
      frag.y           = anchor_y;
      frag.width       = om.width;
      frag.height      = om.height;
      frag.is_anchored = true;
      frag.behind_doc  = obj.anchor and obj.anchor->behind_doc;
      frag.z_index     = frag.behind_doc ? 0 : 1;

      auto range = extract_block_pm_range(obj.pm_start, obj.pm_end);
      frag.pm_start = range.start;
      frag.pm_end   = range.end;

      if (obj.kind IS OBJECT::IMAGE) {
         frag.kind = FRAG::IMAGE;

         HREL hrel = obj.anchor ? obj.anchor->h_relative_from : HREL::COLUMN;
         const double margin_width = Anchors.page_width - Anchors.margins.left - Anchors.margins.right;

         image_metadata meta;
         if (hrel IS HREL::PAGE) meta.max_width = (Anchors.columns.count IS 1) ? margin_width : Anchors.page_width;
         else if (hrel IS HREL::MARGIN) meta.max_width = margin_width;
         else meta.max_width = Anchors.columns.width;

         meta.original_width  = om.width;
         meta.original_height = om.height;
         meta.max_height      = content_height;
         meta.aspect_ratio    = ((om.width > 0) and (om.height > 0)) ? om.width / om.height : 1.0;
         meta.min_width       = MIN_OBJECT_WIDTH;
         meta.min_height      = MIN_OBJECT_WIDTH / meta.aspect_ratio;
         frag.metadata = meta;
      }
      else {
         frag.kind               = FRAG::DRAWING;
         frag.drawing_kind       = obj.drawing_kind;
         frag.drawing_content_id = obj.drawing_content_id;
         frag.scale              = om.scale;
      }

      DLAYOUT("Anchored %s '%s' at %gx%g, %gx%g", (frag.kind IS FRAG::IMAGE) ? "image" : "drawing", obj.id.c_str(), frag.x, frag.y, frag.width, frag.height);

      if (state.pg) state.pg->fragments.push_back(std::move(frag));
      if (Anchors.placed_ids) Anchors.placed_ids->insert(obj.id);
   }
}

//********************************************************************************************************************

void paragraph_flow::place_anchors(anchors_context &Anchors)
{
   double first_line_height = m_measure.lines.empty() ? 0 : safe_number(m_measure.lines[0].line_height);
   place_anchored_objects(m_cursor, m_floats, Anchors, first_line_height);
}

//********************************************************************************************************************
// Re-breaks the paragraph once if it was measured against a width wider than the usable column.  The measurer
// subtracts the paragraph indents itself, so the full column width is passed.

void paragraph_flow::remeasure_for_column()
{
   Log log(__FUNCTION__);

   m_lines = normalize_lines(m_measure);

   m_indent_left  = finite_or(m_block.attrs.indent.left);
   m_indent_right = finite_or(m_block.attrs.indent.right);
   m_remeasure_width = std::max(1.0, m_ctx.column_width - m_indent_left - m_indent_right);

   if (!m_ctx.remeasure) return;

   auto &measured_width = m_lines[0].max_width;
   if ((!measured_width) or (!(*measured_width > m_remeasure_width))) return;

   DLAYOUT("Measured width %g exceeds usable column width %g", *measured_width, m_remeasure_width);

   auto result = m_ctx.remeasure->remeasure(m_block, m_ctx.column_width, calc_first_line_indent(m_block, m_measure));
   m_lines = normalize_lines(result);
   m_remeasured_for_column = true;
   if (result.marker) m_remeasured_marker = result.marker;
}

//********************************************************************************************************************

void paragraph_flow::resolve_spacing()
{
   m_style_id       = m_block.attrs.style_id;
   m_spacing_before = resolve_spacing_before(m_block);
   m_spacing_after  = resolve_spacing_after(m_block);

   if (m_ctx.override_spacing_after) m_spacing_after = safe_number(*m_ctx.override_spacing_after);

   m_base_spacing_before    = m_spacing_before;
   m_applied_spacing_before = (m_spacing_before IS 0);
}

//********************************************************************************************************************
// List marker geometry is attached to the first fragment only.  Remeasured marker data takes precedence.

void paragraph_flow::apply_marker(fragment &Frag, bool Gutter) const
{
   if ((!m_measure.marker) and (!m_remeasured_marker)) return;

   auto &effective = m_remeasured_marker ? m_remeasured_marker : m_measure.marker;

   if (effective->marker_width) Frag.marker_width = *effective->marker_width;
   else if ((m_measure.marker) and (m_measure.marker->marker_width)) Frag.marker_width = *m_measure.marker->marker_width;
   else Frag.marker_width = 0;

   if ((m_remeasured_marker) and (m_remeasured_marker->marker_text_width)) Frag.marker_text_width = m_remeasured_marker->marker_text_width;
   else if (m_measure.marker) Frag.marker_text_width = m_measure.marker->marker_text_width;

   if (Gutter) {
      if ((m_remeasured_marker) and (m_remeasured_marker->gutter_width)) Frag.marker_gutter = m_remeasured_marker->gutter_width;
      else if (m_measure.marker) Frag.marker_gutter = m_measure.marker->gutter_width;
   }
}

//********************************************************************************************************************
// A positioned frame is emitted as one fragment spanning all lines.  It takes no part in spacing collapse.  Returns
// true if the paragraph was handled.

bool paragraph_flow::place_frame()
{
   auto &frame = m_block.attrs.frame;
   if ((!frame) or (frame->wrap != FRAME_WRAP::NONE)) return false;

   auto state = &m_cursor.ensure_page();
   if (state->cursor_y >= state->content_bottom) advance(state);

   double max_line_width = 0;
   for (auto &ln : m_lines) max_line_width = std::max(max_line_width, finite_or(ln.width));
   double width = (max_line_width > 0) ? max_line_width : m_ctx.column_width;

   double x = m_cursor.column_x(state->column_index);
   if (frame->x_align IS ALIGN::RIGHT) x += m_ctx.column_width - width;
   else if (frame->x_align IS ALIGN::CENTER) x += (m_ctx.column_width - width) * 0.5;

   if ((frame->x) and (std::isfinite(*frame->x))) x += *frame->x;
   double y_offset = ((frame->y) and (std::isfinite(*frame->y))) ? *frame->y : 0;

   fragment frag;
   frag.kind      = FRAG::PARA;
   frag.block_id  = m_block.id;
   frag.from_line = 0;
   frag.to_line   = int(m_lines.size());
   frag.x         = x;
   frag.y         = state->cursor_y + y_offset;
   frag.width     = width;

   auto range = compute_fragment_pm_range(m_block, m_lines, 0, int(m_lines.size()));
   frag.pm_start = range.start;
   frag.pm_end   = range.end;
   apply_marker(frag, false);

   if (state->pg) state->pg->fragments.push_back(std::move(frag));
   state->trailing_spacing = 0;
   state->last_paragraph_style_id = m_style_id;
   return true;
}

//********************************************************************************************************************
// Scans the vertical band of every line for float exclusions without committing the cursor, and re-breaks the whole
// paragraph once at the narrowest width found.  The scratch position only accounts for the uncollapsed spacing
// before; contextual suppression is resolved later in place_lines().

void paragraph_flow::scan_floats()
{
   Log log(__FUNCTION__);

   m_narrowest_width  = m_ctx.column_width;
   m_narrowest_offset = 0;

   if (!m_ctx.remeasure) return;

   auto &state = m_cursor.ensure_page();
   double temp_y = state.cursor_y;
   if ((!m_applied_spacing_before) and (m_spacing_before > 0)) {
      temp_y += std::max(m_spacing_before - safe_number(state.trailing_spacing), 0.0);
   }

   int page_number = state.pg ? state.pg->number : 1;
   for (auto &ln : m_lines) {
      auto lh = safe_number(ln.line_height);
      auto avail = m_floats.compute_available_width(temp_y, lh, m_ctx.column_width, state.column_index, page_number);
      if (avail.width < m_narrowest_width) {
         m_narrowest_width  = avail.width;
         m_narrowest_offset = avail.offset_x;
      }
      temp_y += lh;
   }

   double narrow_remeasure = std::max(1.0, m_narrowest_width - m_indent_left - m_indent_right);
   if (narrow_remeasure < m_remeasure_width) {
      DLAYOUT("Float narrowing from %g to %g at offset %g", m_remeasure_width, narrow_remeasure, m_narrowest_offset);
      auto result = m_ctx.remeasure->remeasure(m_block, narrow_remeasure, calc_first_line_indent(m_block, m_measure));
      m_lines = normalize_lines(result);
      m_remeasured_for_floats = true;
      if (result.marker) m_remeasured_marker = result.marker;
   }
}

//********************************************************************************************************************
// Keep-lines: if the whole paragraph would fit on a blank page but not in the space remaining, and the page already
// has content, advance before placing anything.  Returns true if an advance occurred.

bool paragraph_flow::keep_lines_advance(page_state *&State)
{
   double needed = std::max(m_spacing_before - safe_number(State->trailing_spacing), 0.0);
   double page_content_height = State->content_bottom - State->top_margin;

   double full_height = 0;
   for (auto &ln : m_lines) full_height += safe_number(ln.line_height);

   bool fits_blank_page = full_height + m_base_spacing_before <= page_content_height;
   double remaining = State->content_bottom - (State->cursor_y + needed);
   bool has_content = (State->pg) and (!State->pg->fragments.empty());

   if ((fits_blank_page) and (has_content) and (full_height > remaining)) {
      return advance(State);
   }
   return false;
}

//********************************************************************************************************************
// Applies the collapsed spacing before.  If the spacing does not fit, the column is advanced and the spacing retried
// at the top of the next column.  Spacing that cannot fit even at the top of a fresh column is skipped.  Returns
// false if the loop guard prevented an advance.

bool paragraph_flow::apply_spacing_before(page_state *&State)
{
   Log log(__FUNCTION__);

   while (!m_applied_spacing_before) {
      auto prev_trailing = safe_number(State->trailing_spacing);
      auto needed = std::max(m_spacing_before - prev_trailing, 0.0);

      DSPACING("Spacing before %g, trailing %g, needed %g at y %g", m_spacing_before, prev_trailing, needed, State->cursor_y);

      if (State->cursor_y + needed > State->content_bottom) {
         if (State->cursor_y <= State->top_margin) {
            log.warning("Spacing before of %g exceeds the content height of %g for '%s'; skipped.",
               needed, State->content_bottom - State->top_margin, m_block.id.c_str());
            State->trailing_spacing = 0;
            m_applied_spacing_before = true;
            break;
         }

         if (!advance(State)) {
            State->trailing_spacing = 0;
            m_applied_spacing_before = true;
            return false;
         }
         continue;
      }

      State->cursor_y += needed;
      State->trailing_spacing = 0;
      m_applied_spacing_before = true;
   }
   return true;
}

//********************************************************************************************************************
// Main placement loop.  Each iteration emits one fragment for as many lines as fit in the remaining column height.

void paragraph_flow::place_lines()
{
   Log log(__FUNCTION__);

   const bool contextual = m_block.attrs.contextual_spacing;
   page_state *last_state = nullptr;
   int from_line = 0;
   const int total_lines = int(m_lines.size());

   while (from_line < total_lines) {
      auto state = &m_cursor.ensure_page();
      if (!std::isfinite(state->trailing_spacing)) state->trailing_spacing = 0;

      if ((contextual) and (m_style_id) and (!m_style_id->empty()) and (state->last_paragraph_style_id) and
          (*state->last_paragraph_style_id IS *m_style_id)) {
         m_spacing_before = 0;
         auto prev_trailing = safe_number(state->trailing_spacing);
         if (prev_trailing > 0) {
            DSPACING("Contextual spacing reclaims %g", prev_trailing);
            state->cursor_y -= prev_trailing;
            state->trailing_spacing = 0;
         }
      }

      if ((m_block.attrs.keep_lines) and (from_line IS 0)) {
         if (keep_lines_advance(state)) {
            m_spacing_before = m_base_spacing_before;
            m_applied_spacing_before = (m_spacing_before IS 0);
            continue;
         }
      }

      if ((!m_applied_spacing_before) and (m_spacing_before > 0)) apply_spacing_before(state);
      else state->trailing_spacing = 0;

      if (state->cursor_y >= state->content_bottom) advance(state);
      if (state->content_bottom - state->cursor_y <= 0) advance(state);

      auto next_line_height = safe_number(m_lines[from_line].line_height);
      bool has_content = (state->pg) and (!state->pg->fragments.empty());
      if ((has_content) and (state->content_bottom - state->cursor_y < next_line_height)) advance(state);

      double effective_width = m_ctx.column_width;
      double offset_x = 0;
      if (m_remeasured_for_floats) {
         effective_width = m_narrowest_width;
         offset_x = m_narrowest_offset;
      }

      auto slice = slice_lines(m_lines, from_line, state->content_bottom - state->cursor_y);

      const double neg_left  = (m_indent_left < 0) ? m_indent_left : 0;
      const double neg_right = (m_indent_right < 0) ? m_indent_right : 0;
      const double col_x = m_cursor.column_x(state->column_index);

      fragment frag;
      frag.kind      = FRAG::PARA;
      frag.block_id  = m_block.id;
      frag.from_line = from_line;
      frag.to_line   = slice.to_line;
      frag.x         = col_x + offset_x + neg_left;
      frag.y         = state->cursor_y;
      frag.width     = effective_width - neg_left - neg_right;

      auto range = compute_fragment_pm_range(m_block, m_lines, from_line, slice.to_line);
      frag.pm_start = range.start;
      frag.pm_end   = range.end;

      if (m_remeasured_for_column) {
         frag.lines = std::vector<line>(m_lines.begin() + from_line, m_lines.begin() + slice.to_line);
      }

      if (from_line IS 0) apply_marker(frag, true);

      frag.continues_from_prev = (from_line > 0);
      frag.continues_on_next   = (slice.to_line < total_lines);

      auto float_align = m_block.attrs.float_alignment;
      if ((float_align IS ALIGN::RIGHT) or (float_align IS ALIGN::CENTER)) {
         double max_line_width = 0;
         for (int i=from_line; i < slice.to_line; i++) max_line_width = std::max(max_line_width, m_lines[i].width);

         if (float_align IS ALIGN::RIGHT) frag.x = col_x + offset_x + (effective_width - max_line_width);
         else frag.x = col_x + offset_x + (effective_width - max_line_width) * 0.5;
      }

      DLAYOUT("Lines %d-%d of '%s' at %gx%g, width %g", from_line, slice.to_line, m_block.id.c_str(), frag.x, frag.y, frag.width);

      if (state->pg) state->pg->fragments.push_back(std::move(frag));
      state->cursor_y += slice.height;
      last_state = state;
      from_line = slice.to_line;
   }

   if (!last_state) return;

   // Recorded on the state that holds the last fragment, before any advance for spacing after

   last_state->last_paragraph_style_id = m_style_id;

   if (m_spacing_after > 0) {
      auto target = last_state;
      if (target->cursor_y + m_spacing_after > target->content_bottom) {
         DSPACING("Spacing after %g absorbed by column advance", m_spacing_after);
         advance(target);
         target->trailing_spacing = 0;
      }
      else {
         target->cursor_y += m_spacing_after;
         target->trailing_spacing = m_spacing_after;
      }
   }
   else last_state->trailing_spacing = 0;
}

/*********************************************************************************************************************

-FUNCTION-
layout_paragraph: Flows a single paragraph onto the page/column cursor.

Appends one or more fragments to the current page(s) and updates the cursor's vertical position, trailing spacing
and last style id.  The function is total: malformed numeric input is sanitised and a cursor that fails to make
progress trips a loop guard rather than hanging.

If Anchors is provided, any of its objects that are not yet in the placed set are positioned first and registered
with the float service.

*********************************************************************************************************************/

void layout_paragraph(const paragraph_context &Context, anchors_context *Anchors)
{
   Log log(__FUNCTION__);

   if ((!Context.block) or (!Context.measure) or (!Context.cursor) or (!Context.floats)) {
      log.warning(ERR::NullArgs);
      return;
   }

   log.traceBranch("Paragraph '%s', %d lines, column width %g", Context.block->id.c_str(),
      int(Context.measure->lines.size()), Context.column_width);

   paragraph_flow flow(Context);

   if ((Anchors) and (!Anchors->drawings.empty())) flow.place_anchors(*Anchors);

   flow.remeasure_for_column();
   flow.resolve_spacing();

   if (flow.place_frame()) return;

   flow.scan_floats();
   flow.place_lines();
}

} // namespace folio
