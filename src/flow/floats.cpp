/*

The float manager tracks exclusion zones created by anchored images and drawings.  Each zone is the object's
rectangle grown by its wrap distances, and is only visible to lines on the same page and column whose vertical
band overlaps it.

Only objects that wrap at their sides (Square, Tight, Through) narrow the available width.  TopAndBottom objects are
expected to be flowed around vertically by the host, and objects that are behind the text or unwrapped do not
interact with text at all.

*/

#include "flow.h"

namespace folio {

//********************************************************************************************************************

void float_manager::set_layout_context(const column_layout &Columns, const page_margins &Margins, double PageWidth)
{
   m_columns    = Columns;
   m_margins    = Margins;
   m_page_width = PageWidth;
}

//********************************************************************************************************************

double float_manager::column_left(int ColumnIndex) const
{
   return m_margins.left + ColumnIndex * (m_columns.width + m_columns.gap);
}

//********************************************************************************************************************

void float_manager::clear()
{
   m_zones.clear();
}

//********************************************************************************************************************
// Registers an exclusion for an anchored object, if its wrap type calls for one.

void float_manager::register_drawing(const object_block &Block, const object_measure &Measure, double Y, int ColumnIndex, int PageNumber)
{
   Log log(__FUNCTION__);

   if (!Block.wrap) return;
   auto &wrap = *Block.wrap;

   if ((wrap.type != WRAP::SQUARE) and (wrap.type != WRAP::TIGHT) and (wrap.type != WRAP::THROUGH)) return;
   if ((wrap.behind_doc) or ((Block.anchor) and (Block.anchor->behind_doc))) return;

   double x;
   if (Block.anchor) x = compute_anchor_x(*Block.anchor, ColumnIndex, m_columns, Measure.width, m_margins, m_page_width);
   else x = column_left(ColumnIndex);

   zone z;
   z.block_id     = Block.id;
   z.page_number  = PageNumber;
   z.column_index = ColumnIndex;
   z.left         = x - safe_number(wrap.dist_left);
   z.right        = x + Measure.width + safe_number(wrap.dist_right);
   z.top          = Y - safe_number(wrap.dist_top);
   z.bottom       = Y + Measure.height + safe_number(wrap.dist_bottom);
   z.wrap_text    = wrap.wrap_text;

   if ((!std::isfinite(z.left)) or (!std::isfinite(z.right)) or (!std::isfinite(z.top)) or (!std::isfinite(z.bottom)) or
       (z.right < z.left) or (z.bottom < z.top)) {
      log.warning("%s set invalid exclusion dimensions: %.0f,%.0f,%.0f,%.0f", Block.id.c_str(), z.left, z.top, z.right, z.bottom);
      return;
   }

   log.trace("Exclusion '%s' on page %d: %gx%g - %gx%g", Block.id.c_str(), PageNumber, z.left, z.top, z.right, z.bottom);

   m_zones[PageNumber].push_back(std::move(z));
}

//********************************************************************************************************************
// Returns the width available to a line band [Y, Y+LineHeight) in the given column, and the offset of that space from
// the column's left edge.  Zones that only touch the band's edges do not intersect it.

available_width float_manager::compute_available_width(double Y, double LineHeight, double ColumnWidth, int ColumnIndex, int PageNumber) const
{
   const double col_left  = column_left(ColumnIndex);
   const double col_right = col_left + ColumnWidth;

   double left = col_left, right = col_right;

   auto it = m_zones.find(PageNumber);
   if (it != m_zones.end()) {
      for (auto &z : it->second) {
         if (z.column_index != ColumnIndex) continue;
         if ((Y + LineHeight <= z.top) or (Y >= z.bottom)) continue;
         if ((z.right <= col_left) or (z.left >= col_right)) continue;

         switch (z.wrap_text) {
            case WRAP_TEXT::LEFT: // Text keeps to the left of the object
               right = std::min(right, z.left);
               break;

            case WRAP_TEXT::RIGHT:
               left = std::max(left, z.right);
               break;

            default: { // Both sides or largest: the text takes the side with more room
               double room_left  = z.left - col_left;
               double room_right = col_right - z.right;
               if (room_left >= room_right) right = std::min(right, z.left);
               else left = std::max(left, z.right);
               break;
            }
         }
      }
   }

   available_width result;
   result.width    = std::max(0.0, right - left);
   result.offset_x = left - col_left;
   return result;
}

//********************************************************************************************************************

std::vector<exclusion> float_manager::get_exclusions_for_line(double Y, double LineHeight, int ColumnIndex, int PageNumber) const
{
   std::vector<exclusion> result;

   auto it = m_zones.find(PageNumber);
   if (it IS m_zones.end()) return result;

   for (auto &z : it->second) {
      if (z.column_index != ColumnIndex) continue;
      if ((Y + LineHeight <= z.top) or (Y >= z.bottom)) continue;
      result.push_back(exclusion { z.left, z.right, z.top, z.bottom, z.wrap_text });
   }
   return result;
}

//********************************************************************************************************************

std::vector<float_manager::zone> float_manager::all_floats_for_page(int PageNumber) const
{
   auto it = m_zones.find(PageNumber);
   if (it IS m_zones.end()) return { };
   return it->second;
}

} // namespace folio
