/*********************************************************************************************************************

The source code of Folio is made publicly available under the terms described in the LICENSE.TXT file that is
distributed with this package.  Please refer to it for further information on licensing.

This file contains all logging functions.

Log levels are:

0  CRITICAL Display the message irrespective of the log level.
1  ERROR Major errors that should be displayed to the user (default).
2  WARN Any error suitable for display to a developer or technically minded user.
3  Application log message, level 1
4  INFO Application log message, level 2
5  API Top-level API messages, e.g. function entry points
6  DETAIL Detailed API messages.  For messages within functions, and entry-points for minor functions.
8  TRACE Extremely detailed API messages suitable for intensive debugging only.
9  Noisy debug messages that will appear frequently, e.g. being used in inner loops.

*********************************************************************************************************************/

#include <stdio.h>
#include <array>
#include <atomic>
#include <mutex>
#include <string>

#include "defs.h"

namespace folio {

static const int COLUMN1 = 30;

enum { MS_NONE, MS_FUNCTION, MS_MSG };

static std::atomic<int> glLogLevel { 1 };
static std::mutex glmPrint;
static thread_local int tlDepth = 0;

static constexpr std::array<VLF, 10> LOG_LEVELS = {
   VLF::CRITICAL,
   VLF::ERROR|VLF::CRITICAL,
   VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL
};

//********************************************************************************************************************
// Formats the header column.  Nested branches are indented by one space per level when the log level permits it.

static void fmsg(CSTRING Header, char *Buffer, int8_t Colon) // Buffer must be COLUMN1+1 in size
{
   if ((!Header) or (!*Header)) Header = "Folio";

   int pos = 0;
   int col = COLUMN1;
   auto level = glLogLevel.load(std::memory_order_relaxed);
   int depth = (level < 3) ? 0 : ((tlDepth > col) ? col : tlDepth);

   while ((depth > 0) and (pos < col)) {
      Buffer[pos++] = ' ';
      depth--;
   }

   int len;
   for (len=0; (Header[len]) and (pos < col); len++) Buffer[pos++] = Header[len];

   if ((len > 0) and (Header[len-1] != ':') and (Header[len-1] != ')')) {
      if (Colon IS MS_MSG) {
         if (pos < col) Buffer[pos++] = ':';
      }
      else if (Colon IS MS_FUNCTION) {
         if (pos < col-1) {
            Buffer[pos++] = '(';
            Buffer[pos++] = ')';
         }
      }
   }

   if (level >= 3) while (pos < col) Buffer[pos++] = ' ';
   else if (pos < col) Buffer[pos++] = ' ';

   Buffer[pos] = 0;
}

//********************************************************************************************************************

static std::string format_message(CSTRING Message, va_list Args)
{
   if ((!Message) or (!*Message)) return std::string();

   va_list copy;
   va_copy(copy, Args);
   int required = vsnprintf(nullptr, 0, Message, copy);
   va_end(copy);

   if (required <= 0) return std::string();

   std::string buffer;
   buffer.resize(required);
   va_copy(copy, Args);
   vsnprintf(buffer.data(), buffer.size()+1, Message, copy);
   va_end(copy);
   return buffer;
}

/*********************************************************************************************************************

-FUNCTION-
SetLogLevel: Sets the maximum level of log messages that will be printed to stderr.

Values are clamped to the range 0 - 9.

*********************************************************************************************************************/

void SetLogLevel(int Level)
{
   if (Level < 0) Level = 0;
   else if (Level > 9) Level = 9;
   glLogLevel.store(Level, std::memory_order_relaxed);
}

int GetLogLevel()
{
   return glLogLevel.load(std::memory_order_relaxed);
}

/*********************************************************************************************************************

-FUNCTION-
VLogF: Sends formatted messages to the standard log.

Messages are filtered against the active log level.  Branch messages increase the indentation depth of the messages
that follow them, until LogReturn() is called.

*********************************************************************************************************************/

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args)
{
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);

   bool should_log;
   if ((Flags & VLF::CRITICAL) != VLF::NIL) should_log = true;
   else {
      int level = log_setting;
      if (level > 9) level = 9;
      else if (level < 0) level = 0;

      should_log = ((LOG_LEVELS[level] & Flags) != VLF::NIL);
      if ((!should_log) and (log_setting > 1) and ((Flags & (VLF::WARNING|VLF::ERROR)) != VLF::NIL)) should_log = true;
   }

   if (should_log) {
      char header[COLUMN1+1];
      auto msgstate = ((Flags & (VLF::BRANCH|VLF::FUNCTION)) != VLF::NIL) ? MS_FUNCTION : MS_MSG;
      auto text = format_message(Message, Args);

      std::lock_guard lock(glmPrint);
      fmsg(Header, header, msgstate);
      bool highlight = (log_setting > 2) and ((Flags & (VLF::ERROR|VLF::WARNING|VLF::CRITICAL)) != VLF::NIL);
      if (highlight) fprintf(stderr, "\033[1m%s%s\033[0m\n", header, text.c_str());
      else fprintf(stderr, "%s%s\n", header, text.c_str());
   }

   if ((Flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
}

/*********************************************************************************************************************

-FUNCTION-
FuncError: Sends basic error messages to the application log.

Prints the message that is associated with the error Code.  The error level is 'warning', so nothing is printed
unless the log level is 2 or above.

-RESULT-
error: Returns the same code that was specified in the Code parameter.

*********************************************************************************************************************/

ERR FuncError(CSTRING Header, ERR Code)
{
   if (glLogLevel.load(std::memory_order_relaxed) < 2) return Code;

   char header[COLUMN1+1];
   std::lock_guard lock(glmPrint);
   fmsg(Header, header, MS_MSG);
   if (glLogLevel.load(std::memory_order_relaxed) > 2) fprintf(stderr, "\033[1m%s%s\033[0m\n", header, GetErrorMsg(Code));
   else fprintf(stderr, "%s%s\n", header, GetErrorMsg(Code));
   return Code;
}

/*********************************************************************************************************************

-FUNCTION-
LogReturn: Revert to the previous branch in the logging tree.

Clients should use the scope-managed Log class rather than calling this function directly.

*********************************************************************************************************************/

void LogReturn()
{
   if ((--tlDepth) < 0) tlDepth = 0;
}

} // namespace folio
