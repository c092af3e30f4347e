
#include <charconv>

#include "flow.h"
#include "defs/dunit.h"

namespace folio {

//********************************************************************************************************************
// Parses a length such as "12pt", "1.5in" or "50%".  A bare number takes the default type.  Unrecognised suffixes and
// unparseable input result in a DU::NIL type, which the caller must treat as invalid.

DUNIT::DUNIT(const std::string_view pValue, DU pDefaultType, double pMin)
{
   const double dpi = 96.0;
   value = 0;
   type  = DU::NIL;

   auto str = pValue;
   trim(str);
   if (str.empty()) return;

   double fv;
   auto [ ptr, error ] = std::from_chars(str.data(), str.data() + str.size(), fv);
   if (error != std::errc()) return;

   auto end = str.data() + str.size();
   std::string_view suffix(ptr, end - ptr);
   trim(suffix);

   if (suffix.empty()) { value = fv; type = pDefaultType; }
   else if (suffix IS "%") { value = fv * 0.01; type = DU::SCALED; }
   else if (iequals(suffix, "px")) { value = fv; type = DU::PIXEL; }
   else if (iequals(suffix, "in")) { value = fv * dpi; type = DU::PIXEL; } // Inches -> Pixels
   else if (iequals(suffix, "cm")) { value = fv * (dpi / 2.54); type = DU::PIXEL; } // Centimetres -> Pixels
   else if (iequals(suffix, "mm")) { value = fv * (dpi / 25.4); type = DU::PIXEL; } // Millimetres -> Pixels
   else if (iequals(suffix, "pt")) { value = fv * (4.0 / 3.0); type = DU::PIXEL; } // A point is 4/3 of a pixel
   else if (iequals(suffix, "pc")) { value = fv * (4.0 / 3.0) * 12.0; type = DU::PIXEL; } // 1 Pica is equal to 12 Points
   else if (iequals(suffix, "twip")) { value = fv * (4.0 / 3.0) / 20.0; type = DU::PIXEL; } // 20 twips to the point
   else return;

   if (value < pMin) value = pMin;
}

//********************************************************************************************************************

double DUNIT::px(double Reference) const
{
   switch (type) {
      case DU::PIXEL:  return value;
      case DU::SCALED: return value * Reference;
      default:         return 0;
   }
}

} // namespace folio
