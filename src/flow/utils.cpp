
#include "flow.h"

namespace folio {

//********************************************************************************************************************
// Untrusted numeric input (spacing, trailing carry, marker sizes) is sanitised here.  NaN, infinite and negative
// values are read as zero.

double safe_number(double Value)
{
   if ((!std::isfinite(Value)) or (Value < 0)) return 0;
   return Value;
}

//********************************************************************************************************************
// A measure with no lines is given a single synthetic zero-width line so that every paragraph occupies at least one
// line slot.

std::vector<line> normalize_lines(const paragraph_measure &Measure)
{
   if (!Measure.lines.empty()) return Measure.lines;

   line synthetic;
   synthetic.line_height = safe_number(Measure.total_height);
   return { synthetic };
}

//********************************************************************************************************************
// Greedily accumulates lines from Start until the next line would exceed AvailableHeight.  The first line is always
// included, so the result is never empty.

slice_result slice_lines(const std::vector<line> &Lines, int Start, double AvailableHeight)
{
   slice_result result;
   int index = Start;
   double height = 0;

   while (index < int(Lines.size())) {
      auto lh = safe_number(Lines[index].line_height);
      if ((height > 0) and (height + lh > AvailableHeight)) break;
      height += lh;
      index++;
   }

   if ((index IS Start) and (Start < int(Lines.size()))) {
      height = safe_number(Lines[Start].line_height);
      index++;
   }

   result.to_line = index;
   result.height  = height;
   return result;
}

//********************************************************************************************************************
// Empty text: no runs at all, or a single text run holding an empty string.

bool is_empty_text_paragraph(const paragraph_block &Block)
{
   if (Block.runs.empty()) return true;
   if (Block.runs.size() != 1) return false;
   auto &run = Block.runs[0];
   return (run.kind IS RUN::TEXT) and run.text.empty();
}

//********************************************************************************************************************
// Authored spacing with legacy fallbacks.  When the host records spacing provenance, inherited spacing on an empty
// paragraph is suppressed and only the sides marked as explicit survive.  Without a provenance record the spacing is
// kept as authored.

double resolve_spacing_before(const paragraph_block &Block)
{
   auto &sp = Block.attrs.spacing;
   double value = sp.before ? *sp.before : (sp.line_space_before ? *sp.line_space_before : 0);
   value = safe_number(value);

   if ((value > 0) and is_empty_text_paragraph(Block)) {
      auto &xp = Block.attrs.explicit_spacing;
      if ((xp) and (!xp->before)) value = 0;
   }
   return value;
}

double resolve_spacing_after(const paragraph_block &Block)
{
   auto &sp = Block.attrs.spacing;
   double value = sp.after ? *sp.after : (sp.line_space_after ? *sp.line_space_after : 0);
   value = safe_number(value);

   if ((value > 0) and is_empty_text_paragraph(Block)) {
      auto &xp = Block.attrs.explicit_spacing;
      if ((xp) and (!xp->after)) value = 0;
   }
   return value;
}

//********************************************************************************************************************
// First-line indent for re-breaking a list paragraph.  In the standard hanging layout the marker sits outside of the
// text flow and the indent is zero.  In first-line-indent mode the marker and its gutter consume space on line 1.

double calc_first_line_indent(const paragraph_block &Block, const paragraph_measure &Measure)
{
   auto &wl = Block.attrs.layout;
   if ((!wl) or (!wl->first_line_indent_mode)) return 0;
   if ((!wl->marker) or (!Measure.marker)) return 0;

   double marker_width = 0;
   if (Measure.marker->marker_width) marker_width = *Measure.marker->marker_width;
   else if (wl->marker->marker_box_width) marker_width = *wl->marker->marker_box_width;

   double gutter = Measure.marker->gutter_width ? *Measure.marker->gutter_width : 0;

   return safe_number(marker_width) + safe_number(gutter);
}

//********************************************************************************************************************
// Position range for objects and paragraphs whose runs carry no positions.  An end is implied one past the start
// when only the start is known.

pm_range extract_block_pm_range(std::optional<int> Start, std::optional<int> End)
{
   pm_range result;
   result.start = Start;
   if (End) result.end = End;
   else if (Start) result.end = *Start + 1;
   return result;
}

//********************************************************************************************************************

static std::optional<int> line_pm_start(const paragraph_block &Block, const line &Line)
{
   if ((Line.from_run < 0) or (Line.from_run >= int(Block.runs.size()))) return std::nullopt;
   auto &run = Block.runs[Line.from_run];
   if (run.pm_start) return *run.pm_start + Line.from_char;
   return std::nullopt;
}

static std::optional<int> line_pm_end(const paragraph_block &Block, const line &Line)
{
   if ((Line.to_run < 0) or (Line.to_run >= int(Block.runs.size()))) return std::nullopt;
   auto &run = Block.runs[Line.to_run];
   if (run.pm_start) return *run.pm_start + Line.to_char;
   if (run.pm_end) return run.pm_end;
   return std::nullopt;
}

//********************************************************************************************************************
// Document position range covered by lines [FromLine, ToLine).  Falls back to the block's own range for any end that
// cannot be resolved from the runs.

pm_range compute_fragment_pm_range(const paragraph_block &Block, const std::vector<line> &Lines, int FromLine, int ToLine)
{
   pm_range result;

   if ((FromLine >= 0) and (FromLine < ToLine) and (ToLine <= int(Lines.size()))) {
      result.start = line_pm_start(Block, Lines[FromLine]);
      result.end   = line_pm_end(Block, Lines[ToLine-1]);
   }

   if ((!result.start) or (!result.end)) {
      auto fallback = extract_block_pm_range(Block.attrs.pm_start, Block.attrs.pm_end);
      if (!result.start) result.start = fallback.start;
      if (!result.end) result.end = fallback.end;
   }

   return result;
}

} // namespace folio
