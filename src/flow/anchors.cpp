
#include "flow.h"

namespace folio {

//********************************************************************************************************************
// Resolves the left edge of an anchored object.  The base box is selected by hRelativeFrom:
//
//   PAGE:   The full page width.
//   MARGIN: The area between the left and right page margins.
//   COLUMN: The column identified by ColumnIndex (default).
//
// The object is aligned within the base box by alignH, then offset by offsetH.  Without an alignment the offset is
// applied from the left edge of the box.

double compute_anchor_x(const object_anchor &Anchor, int ColumnIndex, const column_layout &Columns,
   double ObjectWidth, const page_margins &Margins, double PageWidth)
{
   double base_x, base_width;

   switch (Anchor.h_relative_from) {
      case HREL::PAGE:
         base_x = 0;
         base_width = PageWidth;
         break;

      case HREL::MARGIN:
         base_x = Margins.left;
         base_width = PageWidth - Margins.left - Margins.right;
         break;

      default: {
         int col = std::clamp(ColumnIndex, 0, std::max(Columns.count, 1) - 1);
         base_x = Margins.left + col * (Columns.width + Columns.gap);
         base_width = Columns.width;
         break;
      }
   }

   const double offset = finite_or(Anchor.offset_h);

   switch (Anchor.align_h) {
      case ALIGN::CENTER: return base_x + (base_width - ObjectWidth) * 0.5 + offset;
      case ALIGN::RIGHT:  return base_x + base_width - ObjectWidth + offset;
      default:            return base_x + offset;
   }
}

} // namespace folio
