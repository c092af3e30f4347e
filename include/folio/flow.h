#pragma once

// Paragraph flow and pagination.  The engine places pre-measured paragraph lines onto pages and columns, collapsing
// inter-paragraph spacing, narrowing lines around anchored objects and honouring keep-together rules.  Measurement
// of text, rendering and the conversion of source documents are the responsibility of the host.

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <ankerl/unordered_dense.h>

#include <folio/main.hpp>

namespace folio {

//********************************************************************************************************************

enum class RUN : uint8_t {
   TEXT = 0,
   TAB,
   IMAGE,
   BREAK,
   FIELD
};

enum class ALIGN : uint8_t { // Horizontal alignment for floats, frames and anchors
   NIL = 0,
   LEFT,
   CENTER,
   RIGHT
};

enum class VALIGN : uint8_t {
   NIL = 0,
   TOP,
   CENTER,
   BOTTOM
};

enum class HREL : uint8_t { // Horizontal anchor base (hRelativeFrom)
   COLUMN = 0,
   PAGE,
   MARGIN
};

enum class VREL : uint8_t { // Vertical anchor base (vRelativeFrom); NIL offsets from the cursor
   NIL = 0,
   PARAGRAPH,
   PAGE,
   MARGIN
};

enum class FRAME_WRAP : uint8_t {
   NIL = 0,
   NONE,       // Positioned frame, placed as one fragment outside of normal flow
   AROUND,
   NOT_BESIDE,
   TIGHT
};

enum class WRAP : uint8_t { // Text wrapping around anchored objects
   NONE = 0,
   SQUARE,
   TIGHT,
   THROUGH,
   TOP_AND_BOTTOM,
   INLINE
};

enum class WRAP_TEXT : uint8_t {
   BOTH_SIDES = 0,
   LEFT,
   RIGHT,
   LARGEST
};

enum class OBJECT : uint8_t {
   IMAGE = 0,
   DRAWING
};

enum class FRAG : uint8_t {
   PARA = 0,
   IMAGE,
   DRAWING
};

//********************************************************************************************************************
// Line geometry, as produced by the host's measurer.  Immutable once produced.

struct line_segment {
   int run = 0;
   int from_char = 0, to_char = 0;
   std::optional<double> x;  // Explicit offset, e.g. from a tab stop.  Never re-offset by indent logic.
   double width = 0;
};

struct line {
   int from_run = 0, from_char = 0, to_run = 0, to_char = 0;
   double width = 0;
   double ascent = 0, descent = 0;
   double line_height = 0;
   std::optional<double> max_width; // The width that the line was measured against
   std::vector<line_segment> segments;
};

struct marker_measure {
   std::optional<double> marker_width;
   std::optional<double> marker_text_width;
   std::optional<double> gutter_width;
   double indent_left = 0;
};

struct paragraph_measure {
   std::vector<line> lines;
   double total_height = 0;
   std::optional<marker_measure> marker;
};

//********************************************************************************************************************
// The semantic paragraph.  Attributes are typed and validated once at ingestion, see read_paragraph_attrs().

struct run {
   RUN kind = RUN::TEXT;
   std::string text;
   std::optional<int> pm_start, pm_end;
};

struct spacing_attrs {
   std::optional<double> before, after;
   std::optional<double> line_space_before, line_space_after; // Legacy aliases, used when before/after are absent
};

struct spacing_explicit {
   bool before = false, after = false, line = false;
};

struct indent_attrs {
   double left = 0, right = 0;
};

struct frame_attrs {
   FRAME_WRAP wrap = FRAME_WRAP::NIL;
   std::optional<double> x, y;
   ALIGN x_align = ALIGN::NIL;
};

struct word_marker {
   std::optional<double> marker_box_width;
};

struct word_layout {
   std::optional<word_marker> marker;
   bool first_line_indent_mode = false; // Marker is inline on the first line rather than hanging
};

struct paragraph_attrs {
   spacing_attrs spacing;
   std::optional<spacing_explicit> explicit_spacing;
   std::optional<std::string> style_id;
   bool contextual_spacing = false;
   bool keep_lines = false;
   bool keep_next = false;
   indent_attrs indent;
   ALIGN float_alignment = ALIGN::NIL;
   std::optional<frame_attrs> frame;
   std::optional<word_layout> layout;
   std::optional<int> pm_start, pm_end;
};

struct paragraph_block {
   std::string id;
   std::vector<run> runs;
   paragraph_attrs attrs;
};

//********************************************************************************************************************
// Images and drawings.  Anchored objects are positioned relative to the page, margin, column or paragraph and may
// register an exclusion zone that narrows the lines flowing beside them.

struct object_anchor {
   bool is_anchored = true;
   HREL h_relative_from = HREL::COLUMN;
   VREL v_relative_from = VREL::NIL;
   ALIGN align_h = ALIGN::NIL;
   VALIGN align_v = VALIGN::NIL;
   double offset_h = 0, offset_v = 0;
   bool behind_doc = false;
};

struct object_wrap {
   WRAP type = WRAP::NONE;
   WRAP_TEXT wrap_text = WRAP_TEXT::BOTH_SIDES;
   double dist_top = 0, dist_bottom = 0, dist_left = 0, dist_right = 0;
   bool behind_doc = false;
};

struct object_block {
   std::string id;
   OBJECT kind = OBJECT::IMAGE;
   std::optional<object_anchor> anchor;
   std::optional<object_wrap> wrap;
   std::string drawing_kind;       // Drawings only, e.g. "shape" or "group"
   std::string drawing_content_id;
   std::optional<int> pm_start, pm_end;

   [[nodiscard]] bool anchored() const { return anchor.has_value() and anchor->is_anchored; }
};

struct object_measure {
   double width = 0, height = 0;
   double scale = 1.0;
};

struct anchored_object {
   const object_block *block = nullptr;
   const object_measure *measure = nullptr;
};

//********************************************************************************************************************
// Output fragments.  A paragraph emits one or more PARA fragments whose line ranges partition its lines.

struct image_metadata {
   double original_width = 0, original_height = 0;
   double max_width = 0, max_height = 0;
   double aspect_ratio = 1.0;
   double min_width = 0, min_height = 0;
};

struct fragment {
   FRAG kind = FRAG::PARA;
   std::string block_id;
   int from_line = 0, to_line = 0;
   double x = 0, y = 0, width = 0;
   double height = 0;                   // Objects only; paragraph height derives from the lines
   bool continues_from_prev = false;
   bool continues_on_next = false;
   std::optional<double> marker_width, marker_text_width, marker_gutter;
   std::optional<int> pm_start, pm_end;
   std::optional<std::vector<line>> lines; // Set when the paragraph was re-broken for the column width
   bool is_anchored = false;
   bool behind_doc = false;
   int z_index = 1;
   std::optional<image_metadata> metadata;
   std::string drawing_kind, drawing_content_id;
   double scale = 1.0;
};

struct page {
   int number = 1;
   std::vector<fragment> fragments;
};

// Page/column cursor state.  Lives for the duration of a document layout and advances monotonically.  A
// trailing_spacing that is NaN, infinite or negative is read as zero.

struct page_state {
   page  *pg = nullptr;
   int    column_index = 0;
   double cursor_y = 0;
   double top_margin = 0;
   double content_bottom = 0;
   double trailing_spacing = 0;
   std::optional<std::string> last_paragraph_style_id;
};

struct page_margins {
   double top = 0, right = 0, bottom = 0, left = 0;
};

struct column_layout {
   double width = 0;
   double gap = 0;
   int count = 1;
};

struct available_width {
   double width = 0;
   double offset_x = 0; // Relative to the column's left edge
};

struct exclusion {
   double left = 0, right = 0, top = 0, bottom = 0;
   WRAP_TEXT wrap_text = WRAP_TEXT::BOTH_SIDES;
};

//********************************************************************************************************************
// Collaborators.  The engine calls these synchronously and expects consistent answers for repeated queries.

class page_cursor {
public:
   virtual ~page_cursor() = default;

   // Returns the current state, creating the first page if necessary.
   virtual page_state & ensure_page() = 0;

   // Commits a move to the next column or page.  Callers must use the returned state.
   virtual page_state & advance_column(page_state &State) = 0;

   virtual double column_x(int ColumnIndex) const = 0;
};

class float_query {
public:
   virtual ~float_query() = default;
   virtual available_width compute_available_width(double Y, double LineHeight, double ColumnWidth, int ColumnIndex, int PageNumber) const = 0;
   virtual void register_drawing(const object_block &Block, const object_measure &Measure, double Y, int ColumnIndex, int PageNumber) = 0;
   virtual std::vector<exclusion> get_exclusions_for_line(double Y, double LineHeight, int ColumnIndex, int PageNumber) const = 0;
};

class remeasure_service {
public:
   virtual ~remeasure_service() = default;
   virtual paragraph_measure remeasure(const paragraph_block &Block, double MaxWidth, double FirstLineIndent) = 0;
};

//********************************************************************************************************************
// Inputs for a single paragraph flow call.

struct paragraph_context {
   const paragraph_block   *block = nullptr;
   const paragraph_measure *measure = nullptr;
   double column_width = 0;
   page_cursor *cursor = nullptr;
   float_query *floats = nullptr;
   remeasure_service *remeasure = nullptr;      // Optional; stale geometry is used when absent
   std::optional<double> override_spacing_after; // Set by the driver, e.g. for contextual spacing with the next block
   bool *loop_tripped = nullptr;                 // Optional; set to true if the cursor failed to make progress
};

struct anchors_context {
   std::vector<anchored_object> drawings;
   double page_width = 0;
   double page_height = 0; // Zero if unknown, in which case it is approximated as content bottom + bottom margin
   page_margins margins;
   column_layout columns;
   ankerl::unordered_dense::set<std::string> *placed_ids = nullptr;
};

extern void layout_paragraph(const paragraph_context &Context, anchors_context *Anchors = nullptr);

// Helpers exposed for hosts and drivers.

[[nodiscard]] extern double calc_first_line_indent(const paragraph_block &Block, const paragraph_measure &Measure);
[[nodiscard]] extern std::vector<line> normalize_lines(const paragraph_measure &Measure);
[[nodiscard]] extern bool is_empty_text_paragraph(const paragraph_block &Block);
[[nodiscard]] extern double safe_number(double Value);
[[nodiscard]] extern double resolve_spacing_before(const paragraph_block &Block);
[[nodiscard]] extern double resolve_spacing_after(const paragraph_block &Block);

struct slice_result {
   int to_line = 0;
   double height = 0;
};

[[nodiscard]] extern slice_result slice_lines(const std::vector<line> &Lines, int Start, double AvailableHeight);

struct pm_range {
   std::optional<int> start, end;
};

[[nodiscard]] extern pm_range compute_fragment_pm_range(const paragraph_block &Block, const std::vector<line> &Lines, int FromLine, int ToLine);
[[nodiscard]] extern pm_range extract_block_pm_range(std::optional<int> Start, std::optional<int> End);

[[nodiscard]] extern double compute_anchor_x(const object_anchor &Anchor, int ColumnIndex, const column_layout &Columns,
   double ObjectWidth, const page_margins &Margins, double PageWidth);

//********************************************************************************************************************
// Configuration

struct layout_options {
   double page_width  = 816;  // US Letter at 96 DPI
   double page_height = 1056;
   page_margins margins = { 96, 96, 96, 96 };
   int    column_count = 1;
   double column_gap   = 48;
   int    log_level    = 1;

   [[nodiscard]] double content_width() const { return page_width - margins.left - margins.right; }
   [[nodiscard]] double content_height() const { return page_height - margins.top - margins.bottom; }
   [[nodiscard]] column_layout columns() const;
};

using attr_map = std::map<std::string, std::string, std::less<>>;

[[nodiscard]] extern ERR load_layout_options(std::string_view Text, layout_options &Options);
[[nodiscard]] extern ERR read_layout_options(const std::string &Path, layout_options &Options);
[[nodiscard]] extern ERR read_paragraph_attrs(const attr_map &Attribs, paragraph_attrs &Attrs);
[[nodiscard]] extern bool read_bool(std::string_view Value);

//********************************************************************************************************************
// Reference page/column cursor, driven by layout_options.

class paginator : public page_cursor {
public:
   explicit paginator(const layout_options &Options);

   page_state & ensure_page() override;
   page_state & advance_column(page_state &State) override;
   double column_x(int ColumnIndex) const override;

   page_state & force_page_break();
   void prune_empty_pages();

   [[nodiscard]] const column_layout & columns() const { return m_columns; }
   [[nodiscard]] const std::deque<page> & pages() const { return m_pages; }
   [[nodiscard]] std::deque<page> & pages() { return m_pages; }
   [[nodiscard]] int advances() const { return m_advances; }

private:
   page_state & new_page();

   layout_options m_options;
   column_layout  m_columns;
   std::deque<page> m_pages;  // Deque so that page pointers in page_state remain valid
   std::optional<page_state> m_state;
   int m_advances = 0;
};

//********************************************************************************************************************
// Reference float manager.  Tracks exclusion zones per page for anchored objects that wrap text at their sides.

class float_manager : public float_query {
public:
   struct zone {
      std::string block_id;
      int    page_number = 1;
      int    column_index = 0;
      double left = 0, top = 0, right = 0, bottom = 0; // Includes the wrap distances
      WRAP_TEXT wrap_text = WRAP_TEXT::BOTH_SIDES;
   };

   void set_layout_context(const column_layout &Columns, const page_margins &Margins, double PageWidth);

   available_width compute_available_width(double Y, double LineHeight, double ColumnWidth, int ColumnIndex, int PageNumber) const override;
   void register_drawing(const object_block &Block, const object_measure &Measure, double Y, int ColumnIndex, int PageNumber) override;
   std::vector<exclusion> get_exclusions_for_line(double Y, double LineHeight, int ColumnIndex, int PageNumber) const override;

   [[nodiscard]] std::vector<zone> all_floats_for_page(int PageNumber) const;
   void clear();

private:
   [[nodiscard]] double column_left(int ColumnIndex) const;

   column_layout m_columns;
   page_margins  m_margins;
   double m_page_width = 0;
   ankerl::unordered_dense::map<int, std::vector<zone>> m_zones; // Keyed by page number
};

//********************************************************************************************************************
// Document driver.  Folds an ordered list of blocks through the flow engine.

struct page_break { std::string id; };
struct column_break { std::string id; };

using flow_block = std::variant<paragraph_block, object_block, page_break, column_break>;
using flow_measure = std::variant<paragraph_measure, object_measure, std::monostate>;

struct flow_document {
   std::vector<flow_block> blocks;
   std::vector<flow_measure> measures; // One entry per block; breaks use std::monostate
};

[[nodiscard]] extern ERR layout_document(const flow_document &Document, const layout_options &Options,
   remeasure_service *Remeasure, std::deque<page> &Pages);

extern void print_fragments(const page &Page);

} // namespace folio
