#pragma once

// Base definitions shared by all Folio modules: primitive types, the error code table, log levels and the C-style
// logging entry points that back the folio::Log class.

#include <cstdarg>
#include <cstdint>
#include <type_traits>

#ifndef IS
#define IS ==
#endif

#ifndef DEFINE_ENUM_FLAG_OPERATORS
#define DEFINE_ENUM_FLAG_OPERATORS(ENUMTYPE) \
inline constexpr ENUMTYPE operator | (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) | std::underlying_type_t<ENUMTYPE>(b)); } \
inline constexpr ENUMTYPE operator & (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) & std::underlying_type_t<ENUMTYPE>(b)); } \
inline constexpr ENUMTYPE operator ~ (ENUMTYPE a) { return ENUMTYPE(~std::underlying_type_t<ENUMTYPE>(a)); } \
inline ENUMTYPE &operator |= (ENUMTYPE &a, ENUMTYPE b) { return a = a | b; } \
inline ENUMTYPE &operator &= (ENUMTYPE &a, ENUMTYPE b) { return a = a & b; }
#endif

namespace folio {

typedef const char * CSTRING;

//********************************************************************************************************************
// Error codes.  Keep in sync with the message table in src/core/lib_errors.cpp

enum class ERR : int {
   Okay = 0,
   False,
   Failed,
   NullArgs,
   Args,
   NoData,
   InvalidData,
   InvalidDimension,
   OutOfRange,
   Loop,
   File,
   Read,
   Syntax,
   Search,
   NoSupport,
   END
};

//********************************************************************************************************************
// Log message flags.  The level table in lib_log.cpp maps the user's log level to a mask of these values.

enum class VLF : uint32_t {
   NIL      = 0,
   BRANCH   = 0x00000001,
   ERROR    = 0x00000002,
   WARNING  = 0x00000004,
   CRITICAL = 0x00000008,
   INFO     = 0x00000010,
   API      = 0x00000020,
   DETAIL   = 0x00000040,
   TRACE    = 0x00000080,
   FUNCTION = 0x00000100
};

DEFINE_ENUM_FLAG_OPERATORS(VLF)

extern void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args);
extern ERR FuncError(CSTRING Header, ERR Code);
extern void LogReturn();
extern void SetLogLevel(int Level);
extern int GetLogLevel();
extern CSTRING GetErrorMsg(ERR Code);

} // namespace folio
