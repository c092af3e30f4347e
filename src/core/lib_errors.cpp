/*********************************************************************************************************************

The source code of Folio is made publicly available under the terms described in the LICENSE.TXT file that is
distributed with this package.  Please refer to it for further information on licensing.

Error message table.  Entries are indexed by ERR value and must be kept in the same order as the enum.

*********************************************************************************************************************/

#include "defs.h"

namespace folio {

static const CSTRING glMessages[int(ERR::END)+1] = {
   "Operation successful.",
   "The result is false.",
   "The operation failed.",
   "Required arguments were null or not specified.",
   "Invalid arguments were specified.",
   "There is no data to process.",
   "The data is invalid.",
   "Invalid dimension values were specified.",
   "A value is out of the permitted range.",
   "The process entered an infinite loop and was aborted.",
   "A file error occurred.",
   "Error reading data from the source.",
   "Syntax error.",
   "The search did not return a result.",
   "This feature is not supported.",
   "Unknown error code."
};

/*********************************************************************************************************************

-FUNCTION-
GetErrorMsg: Translates error codes into human readable strings.

Out of range codes return a generic message rather than failing.

*********************************************************************************************************************/

CSTRING GetErrorMsg(ERR Code)
{
   if ((int(Code) < 0) or (int(Code) >= int(ERR::END))) return glMessages[int(ERR::END)];
   return glMessages[int(Code)];
}

} // namespace folio
