#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string_view>
#include <folio/main.hpp>

namespace folio {

inline void ltrim(std::string_view &String, std::string_view Whitespace = " \n\r\t") noexcept
{
   const auto start = String.find_first_not_of(Whitespace);
   if (start != std::string_view::npos) String.remove_prefix(start);
   else String = std::string_view();
}

inline void rtrim(std::string_view &String, std::string_view Whitespace = " \n\r\t") noexcept
{
   const auto end = String.find_last_not_of(Whitespace);
   if (end != std::string_view::npos) String.remove_suffix(String.size() - end - 1);
   else String = std::string_view();
}

inline void trim(std::string_view &String, std::string_view Whitespace = " \n\r\t") noexcept
{
   ltrim(String, Whitespace);
   rtrim(String, Whitespace);
}

// Case-insensitive string comparison, both of which must be the same length.

[[nodiscard]] inline bool iequals(const std::string_view lhs, const std::string_view rhs) noexcept
{
   if (lhs.size() != rhs.size()) return false;
   return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
       return std::tolower((uint8_t)(a)) IS std::tolower((uint8_t)(b));
   });
}

// Case insensitive hash, suitable for switch statements on keywords.

[[nodiscard]] constexpr inline uint32_t strihash(const std::string_view String) noexcept
{
   uint32_t hash = 5381;
   std::for_each(String.begin(), String.end(), [&hash](char c) {
      if ((c >= 'A') and (c <= 'Z')) c = c - 'A' + 'a';
      hash = (hash<<5) + hash + c;
   });
   return hash;
}

} // namespace folio
