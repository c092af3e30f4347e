
#include "flow.h"

namespace folio {

static CSTRING frag_kind(FRAG Kind)
{
   switch (Kind) {
      case FRAG::PARA:    return "para";
      case FRAG::IMAGE:   return "image";
      case FRAG::DRAWING: return "drawing";
   }
   return "?";
}

//********************************************************************************************************************
// Prints the fragments of a page to the log, one per line.

void print_fragments(const page &Page)
{
   Log log(__FUNCTION__);

   log.branch("Page %d: %d fragments", Page.number, int(Page.fragments.size()));

   for (auto &frag : Page.fragments) {
      if (frag.kind IS FRAG::PARA) {
         log.msg("%-7s %-12s lines %d-%d @ %.1f,%.1f w:%.1f%s%s%s", frag_kind(frag.kind), frag.block_id.c_str(),
            frag.from_line, frag.to_line, frag.x, frag.y, frag.width,
            frag.continues_from_prev ? " <prev" : "", frag.continues_on_next ? " next>" : "",
            frag.lines ? " remeasured" : "");
      }
      else {
         log.msg("%-7s %-12s @ %.1f,%.1f %.1fx%.1f z:%d%s", frag_kind(frag.kind), frag.block_id.c_str(),
            frag.x, frag.y, frag.width, frag.height, frag.z_index, frag.is_anchored ? " anchored" : "");
      }
   }
}

} // namespace folio
