/*

The document driver folds an ordered list of blocks through the paragraph flow engine using the reference paginator
and float manager.  It is responsible for the decisions that need to look beyond a single paragraph:

  * Anchored images and drawings are attached to a host paragraph and positioned when that paragraph is flowed.
  * Chains of keep-with-next paragraphs are moved to the next column as a group when they would otherwise be split.
  * Contextual spacing between a paragraph and the next one of the same style is suppressed at the source.
  * Inline objects and explicit page/column breaks are placed directly.

*/

#include "flow.h"

namespace folio {

// A run of consecutive keepNext paragraphs, plus the block that they must stay with.

struct keep_chain {
   int start = 0;
   int end = 0;
   std::vector<int> members;
   int anchor = -1; // Block that follows the chain, or -1 if there is none
};

//********************************************************************************************************************

static bool is_break(const flow_block &Block)
{
   return std::holds_alternative<page_break>(Block) or std::holds_alternative<column_break>(Block);
}

static const paragraph_block * get_paragraph(const flow_block &Block)
{
   return std::get_if<paragraph_block>(&Block);
}

static bool has_keep_next(const flow_block &Block)
{
   auto para = get_paragraph(Block);
   return (para) and (para->attrs.keep_next);
}

static bool same_style(const std::optional<std::string> &A, const std::optional<std::string> &B)
{
   return (A) and (B) and (!A->empty()) and (*A IS *B);
}

//********************************************************************************************************************
// Content height of a block for keep-together calculations.

static double block_height(const flow_measure &Measure)
{
   if (auto pm = std::get_if<paragraph_measure>(&Measure)) return safe_number(pm->total_height);
   if (auto om = std::get_if<object_measure>(&Measure)) return safe_number(om->height);
   return 0;
}

//********************************************************************************************************************
// Identifies the keep-with-next chains in the document, keyed by the index of their first member.  Explicit breaks
// and non-paragraph blocks terminate a chain.  A single member chain followed by a break has nothing to keep with
// and is not recorded.

static ankerl::unordered_dense::map<int, keep_chain> compute_keep_chains(const std::vector<flow_block> &Blocks)
{
   ankerl::unordered_dense::map<int, keep_chain> chains;
   ankerl::unordered_dense::set<int> processed;

   const int total = int(Blocks.size());
   for (int i=0; i < total; i++) {
      if (processed.contains(i)) continue;
      if (!has_keep_next(Blocks[i])) continue;

      keep_chain chain;
      chain.start = i;
      chain.end   = i;
      chain.members.push_back(i);

      for (int j=i+1; j < total; j++) {
         if (!get_paragraph(Blocks[j])) break;
         if (!has_keep_next(Blocks[j])) break;
         chain.members.push_back(j);
         chain.end = j;
         processed.insert(j);
      }

      chain.anchor = (chain.end + 1 < total) ? chain.end + 1 : -1;

      if ((chain.anchor != -1) and (is_break(Blocks[chain.anchor]))) {
         if (chain.members.size() < 2) continue;
         chain.anchor = -1;
      }

      chains.emplace(i, std::move(chain));
   }

   return chains;
}

//********************************************************************************************************************
// Total height needed to keep a chain together: every member with collapsed inter-paragraph spacing, plus the first
// line of the anchoring paragraph (or the full height of a non-paragraph anchor).

static double chain_height(const keep_chain &Chain, const flow_document &Doc, const page_state &State)
{
   double total = 0;
   std::optional<std::string> prev_style;
   double prev_after = 0;
   bool prev_contextual = false;
   bool first = true;

   for (auto index : Chain.members) {
      auto &para = *get_paragraph(Doc.blocks[index]);
      const double before = resolve_spacing_before(para);
      const double after  = resolve_spacing_after(para);
      auto &style = para.attrs.style_id;
      const bool contextual = para.attrs.contextual_spacing;

      if (first) {
         if ((!contextual) or (!same_style(style, State.last_paragraph_style_id))) {
            total += std::max(before - safe_number(State.trailing_spacing), 0.0);
         }
         first = false;
      }
      else {
         bool matched = same_style(style, prev_style);
         double eff_after  = ((prev_contextual) and (matched)) ? 0 : prev_after;
         double eff_before = ((contextual) and (matched)) ? 0 : before;
         total += std::max(eff_after, eff_before);
      }

      total += block_height(Doc.measures[index]);

      prev_style      = style;
      prev_after      = after;
      prev_contextual = contextual;
   }

   if (Chain.anchor != -1) {
      auto &anchor_block   = Doc.blocks[Chain.anchor];
      auto &anchor_measure = Doc.measures[Chain.anchor];

      if (auto para = get_paragraph(anchor_block)) {
         auto &pm = std::get<paragraph_measure>(anchor_measure);
         bool matched = same_style(para->attrs.style_id, prev_style);
         double eff_after  = ((prev_contextual) and (matched)) ? 0 : prev_after;
         double eff_before = ((para->attrs.contextual_spacing) and (matched)) ? 0 : resolve_spacing_before(*para);

         double first_line = 0;
         if (!pm.lines.empty()) first_line = pm.lines[0].line_height;
         if ((!std::isfinite(first_line)) or (first_line <= 0)) first_line = block_height(anchor_measure);

         total += std::max(eff_after, eff_before) + first_line;
      }
      else if (auto obj = std::get_if<object_block>(&anchor_block)) {
         if (!obj->anchored()) total += prev_after + block_height(anchor_measure);
      }
   }

   return total;
}

//********************************************************************************************************************
// Places an inline image or drawing at the cursor.  The object moves to the next column if it does not fit and the
// current page already has content; an object taller than the column is placed regardless.

static void place_inline_object(paginator &Pages, const object_block &Block, const object_measure &Measure, const layout_options &Options)
{
   Log log(__FUNCTION__);

   auto *state = &Pages.ensure_page();
   const double height = safe_number(Measure.height);

   if ((state->cursor_y + height > state->content_bottom) and (state->pg) and (!state->pg->fragments.empty())) {
      state = &Pages.advance_column(*state);
   }

   fragment frag;
   frag.block_id = Block.id;
   frag.x        = Pages.column_x(state->column_index);
   frag.y        = state->cursor_y;
   frag.width    = safe_number(Measure.width);
   frag.height   = height;

   auto range = extract_block_pm_range(Block.pm_start, Block.pm_end);
   frag.pm_start = range.start;
   frag.pm_end   = range.end;

   if (Block.kind IS OBJECT::IMAGE) {
      frag.kind = FRAG::IMAGE;

      image_metadata meta;
      meta.original_width  = frag.width;
      meta.original_height = frag.height;
      meta.max_width       = Pages.columns().width;
      meta.max_height      = Options.content_height();
      meta.aspect_ratio    = ((frag.width > 0) and (frag.height > 0)) ? frag.width / frag.height : 1.0;
      meta.min_width       = MIN_OBJECT_WIDTH;
      meta.min_height      = MIN_OBJECT_WIDTH / meta.aspect_ratio;
      frag.metadata = meta;
   }
   else {
      frag.kind               = FRAG::DRAWING;
      frag.drawing_kind       = Block.drawing_kind;
      frag.drawing_content_id = Block.drawing_content_id;
      frag.scale              = Measure.scale;
   }

   log.trace("Inline object '%s' at %gx%g, page %d", Block.id.c_str(), frag.x, frag.y, state->pg ? state->pg->number : 0);

   if (state->pg) state->pg->fragments.push_back(std::move(frag));
   state->cursor_y += height;
   state->trailing_spacing = 0;
}

//********************************************************************************************************************
// Checks that every block is paired with a measure of the matching kind.

static ERR validate_document(const flow_document &Doc)
{
   Log log(__FUNCTION__);

   if (Doc.blocks.size() != Doc.measures.size()) {
      log.warning("Block count %d does not match measure count %d.", int(Doc.blocks.size()), int(Doc.measures.size()));
      return ERR::Args;
   }

   for (size_t i=0; i < Doc.blocks.size(); i++) {
      bool valid;
      auto &block   = Doc.blocks[i];
      auto &measure = Doc.measures[i];
      if (std::holds_alternative<paragraph_block>(block)) valid = std::holds_alternative<paragraph_measure>(measure);
      else if (std::holds_alternative<object_block>(block)) valid = std::holds_alternative<object_measure>(measure);
      else valid = std::holds_alternative<std::monostate>(measure);

      if (!valid) {
         log.warning("Block %d is paired with a measure of the wrong kind.", int(i));
         return ERR::InvalidData;
      }
   }

   return ERR::Okay;
}

/*********************************************************************************************************************

-FUNCTION-
layout_document: Paginates a sequence of measured blocks.

Each block in the Document must be paired with a measure of the same kind: a paragraph_measure for paragraphs, an
object_measure for images and drawings, and std::monostate for page and column breaks.

Anchored images and drawings are attached to the nearest preceding paragraph, or to the following paragraph if
none precede them, and are positioned when their host is flowed.  Anchored objects in a document without any
paragraphs are positioned at the cursor when they are reached.

If a Remeasure service is provided, paragraphs measured against a width that does not fit their column, or that
are narrowed by floats, are re-broken through it.

Trailing pages without content are removed before the result is returned in Pages.

-ERRORS-
Okay
Args: The number of blocks and measures differ.
InvalidData: A block is paired with a measure of the wrong kind.
Loop: A paragraph failed to make progress and was placed in its current position.  The Pages are still valid.

*********************************************************************************************************************/

ERR layout_document(const flow_document &Document, const layout_options &Options, remeasure_service *Remeasure,
   std::deque<page> &Pages)
{
   Log log(__FUNCTION__);

   Pages.clear();

   if (auto error = validate_document(Document); error != ERR::Okay) return error;

   log.branch("%d blocks, page %gx%g, %d column(s)", int(Document.blocks.size()), Options.page_width, Options.page_height, Options.column_count);

   paginator pages(Options);
   const auto columns = pages.columns();

   float_manager floats;
   floats.set_layout_context(columns, Options.margins, Options.page_width);

   const auto &blocks   = Document.blocks;
   const auto &measures = Document.measures;
   const int total = int(blocks.size());

   // Attach anchored objects to their host paragraphs

   ankerl::unordered_dense::map<int, std::vector<anchored_object>> anchored_by_para;
   ankerl::unordered_dense::set<int> hosted;
   int last_para = -1;
   for (int i=0; i < total; i++) {
      if (get_paragraph(blocks[i])) { last_para = i; continue; }

      auto obj = std::get_if<object_block>(&blocks[i]);
      if ((!obj) or (!obj->anchored())) continue;

      int host = last_para;
      if (host IS -1) {
         for (int j=i+1; j < total; j++) {
            if (get_paragraph(blocks[j])) { host = j; break; }
         }
      }

      if (host != -1) {
         anchored_by_para[host].push_back(anchored_object { obj, &std::get<object_measure>(measures[i]) });
         hosted.insert(i);
      }
   }

   auto chains = compute_keep_chains(blocks);
   ankerl::unordered_dense::set<int> mid_chain;
   for (auto & [ start, chain ] : chains) {
      for (auto index : chain.members) {
         if (index != start) mid_chain.insert(index);
      }
   }

   ankerl::unordered_dense::set<std::string> placed_ids;
   bool loop_tripped = false;

   for (int index=0; index < total; index++) {
      auto &block = blocks[index];

      if (auto para = get_paragraph(block)) {
         auto &measure = std::get<paragraph_measure>(measures[index]);

         if (!mid_chain.contains(index)) {
            if (auto it = chains.find(index); it != chains.end()) {
               auto *state = &pages.ensure_page();
               double available = state->content_bottom - state->cursor_y;

               if ((para->attrs.contextual_spacing) and (same_style(para->attrs.style_id, state->last_paragraph_style_id))) {
                  available += safe_number(state->trailing_spacing);
               }

               double height = chain_height(it->second, Document, *state);
               bool fits_blank_page = height <= state->content_bottom - state->top_margin;

               if ((fits_blank_page) and (height > available) and (state->pg) and (!state->pg->fragments.empty())) {
                  log.detail("Chain from '%s' needs %g, %g available; advancing.", para->id.c_str(), height, available);
                  pages.advance_column(*state);
               }
            }
         }

         paragraph_context ctx;
         ctx.block        = para;
         ctx.measure      = &measure;
         ctx.column_width = columns.width;
         ctx.cursor       = &pages;
         ctx.floats       = &floats;
         ctx.remeasure    = Remeasure;
         ctx.loop_tripped = &loop_tripped;

         if ((para->attrs.contextual_spacing) and (index + 1 < total)) {
            if (auto next = get_paragraph(blocks[index + 1])) {
               if (same_style(next->attrs.style_id, para->attrs.style_id)) ctx.override_spacing_after = 0;
            }
         }

         if (auto it = anchored_by_para.find(index); it != anchored_by_para.end()) {
            anchors_context anchors;
            anchors.drawings    = it->second;
            anchors.page_width  = Options.page_width;
            anchors.page_height = Options.page_height;
            anchors.margins     = Options.margins;
            anchors.columns     = columns;
            anchors.placed_ids  = &placed_ids;
            layout_paragraph(ctx, &anchors);
         }
         else layout_paragraph(ctx);
      }
      else if (auto obj = std::get_if<object_block>(&block)) {
         auto &om = std::get<object_measure>(measures[index]);

         if (obj->anchored()) {
            if ((hosted.contains(index)) or (placed_ids.contains(obj->id))) continue;

            anchors_context anchors;
            anchors.drawings.push_back(anchored_object { obj, &om });
            anchors.page_width  = Options.page_width;
            anchors.page_height = Options.page_height;
            anchors.margins     = Options.margins;
            anchors.columns     = columns;
            anchors.placed_ids  = &placed_ids;
            place_anchored_objects(pages, floats, anchors, 0);
         }
         else place_inline_object(pages, *obj, om, Options);
      }
      else if (std::holds_alternative<page_break>(block)) {
         log.trace("Page break '%s'", std::get<page_break>(block).id.c_str());
         pages.force_page_break();
      }
      else if (std::holds_alternative<column_break>(block)) {
         log.trace("Column break '%s'", std::get<column_break>(block).id.c_str());
         pages.advance_column(pages.ensure_page());
      }
   }

   pages.prune_empty_pages();

#ifdef FOLIO_DBG_FRAGMENTS
   for (auto &pg : pages.pages()) print_fragments(pg);
#endif

   log.detail("Produced %d page(s) with %d column advance(s).", int(pages.pages().size()), pages.advances());

   Pages = std::move(pages.pages());

   if (loop_tripped) return log.warning(ERR::Loop);
   return ERR::Okay;
}

} // namespace folio
