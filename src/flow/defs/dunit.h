#pragma once

//********************************************************************************************************************
// Display Unit class.  Reads length values from configuration text and converts them to 96 DPI pixels.

#include <cstdint>
#include <limits>
#include <string_view>
#include <folio/main.hpp>

namespace folio {

enum class DU : uint8_t {
   NIL = 0,
   PIXEL,   // px, and all absolute units after conversion
   SCALED   // %: Relative to a reference length supplied at conversion time
};

struct DUNIT {
   double value;
   DU type;

   DUNIT() : value(0), type(DU::NIL) { }

   DUNIT(double pValue, DU pType = DU::PIXEL) : value(pValue), type(pType) { }

   DUNIT(const std::string_view pValue, DU pDefaultType = DU::PIXEL, double pMin = std::numeric_limits<double>::lowest());

   [[nodiscard]] double px(double Reference = 0) const;

   constexpr bool empty() const { return (type IS DU::NIL) or (!value); }
   constexpr bool valid() const { return type != DU::NIL; }

   bool operator!=(DUNIT const &rhs) const { return !(*this == rhs); }

   bool operator==(DUNIT const &rhs) const {
      return (value == rhs.value) and (type == rhs.type);
   }
};

} // namespace folio
