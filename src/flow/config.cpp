/*

Configuration ingestion.  Page geometry is read from INI-style text:

  [Page]
  Width  = 8.5in
  Height = 11in

  [Margins]
  Top = 1in
  Left = 2.54cm

  [Columns]
  Count = 2
  Gap   = 0.5in

  [Log]
  Level = 3

Paragraph attributes arrive from the host as a loose key/value bag and are converted to the typed paragraph_attrs
structure here, so that the flow engine never has to interpret strings.

*/

#include <charconv>
#include <fstream>
#include <sstream>

#include "flow.h"
#include "defs/dunit.h"

namespace folio {

using config_groups = std::map<std::string, std::map<std::string, std::string>>;

//********************************************************************************************************************

template <class T>
T next_line(T Data, T End)
{
   while ((Data < End) and (*Data != '\n')) Data++;
   while ((Data < End) and (unsigned(*Data) <= 0x20)) Data++; // Skip empty lines and any leading whitespace
   return Data;
}

//********************************************************************************************************************
// Searches for the next group in a text buffer, returns its name and the start of the first key value.

template <class T>
T next_group(T Data, T End, std::string &GroupName)
{
   while (Data < End) {
      if (*Data IS '[') {
         int len;
         for (len=1; (Data + len < End) and (Data[len] != '\n'); len++) {
            if (Data[len] IS '[') break; // Invalid character check
            if (Data[len] IS ']') {
               GroupName.assign(Data + 1, len - 1);
               return next_line(Data + len, End); // Skip all trailing characters to reach the next line
            }
         }
         Data += len;
      }
      Data = next_line(Data, End);
   }
   return Data;
}

//********************************************************************************************************************
// Parses INI text into groups of key/value pairs.  Keys outside of a group are ignored.

static ERR parse_config(std::string_view Text, config_groups &Groups)
{
   Log log(__FUNCTION__);

   if (Text.empty()) return ERR::NoData;

   log.traceBranch("%.20s", Text.data());

   auto data = Text.data();
   auto end  = Text.data() + Text.size();

   std::string group_name;
   data = next_group(data, end, group_name);

   while (data < end) {
      while ((data < end) and (*data != '[')) {
         while ((data < end) and (unsigned(*data) <= 0x20)) data++;
         if (data IS end) break;
         if ((*data IS '#') or (*data IS ';')) { data = next_line(data, end); continue; }
         if (*data IS '[') break;

         auto eol = data;
         while ((eol < end) and (*eol != '\n')) eol++;
         std::string_view kv(data, eol - data);

         auto eq = kv.find('=');
         if (eq IS std::string_view::npos) {
            log.warning("Ignoring malformed line in [%s]: %.*s", group_name.c_str(), int(kv.size()), kv.data());
            data = next_line(data, end);
            continue;
         }

         auto key = kv.substr(0, eq);
         auto value = kv.substr(eq + 1);
         trim(key);
         trim(value);
         if (!key.empty()) Groups[group_name][std::string(key)] = std::string(value);

         data = next_line(data, end);
      }
      data = next_group(data, end, group_name);
   }

   return ERR::Okay;
}

//********************************************************************************************************************

static ERR read_length(const std::string &Value, double Reference, double &Result)
{
   DUNIT unit(Value);
   if (!unit.valid()) return ERR::InvalidData;
   Result = unit.px(Reference);
   if (!std::isfinite(Result)) return ERR::InvalidData;
   return ERR::Okay;
}

static ERR read_int(std::string_view Value, int &Result)
{
   trim(Value);
   auto [ ptr, error ] = std::from_chars(Value.data(), Value.data() + Value.size(), Result);
   if ((error != std::errc()) or (ptr != Value.data() + Value.size())) return ERR::InvalidData;
   return ERR::Okay;
}

//********************************************************************************************************************

column_layout layout_options::columns() const
{
   column_layout cols;
   cols.count = std::max(column_count, 1);
   cols.gap   = std::max(column_gap, 0.0);
   cols.width = (content_width() - cols.gap * (cols.count - 1)) / cols.count;
   return cols;
}

/*********************************************************************************************************************

-FUNCTION-
load_layout_options: Reads page geometry from INI formatted text.

Values not present in the text retain their existing values in Options.  Percentage margins are relative to the page
width (left/right) or height (top/bottom) and percentage gaps to the content width.

-ERRORS-
Okay
NoData: The text is empty.
InvalidData: A value could not be parsed.
InvalidDimension: The resulting content area or column width is not positive.

*********************************************************************************************************************/

ERR load_layout_options(std::string_view Text, layout_options &Options)
{
   Log log(__FUNCTION__);

   config_groups groups;
   if (auto error = parse_config(Text, groups); error != ERR::Okay) return log.warning(error);

   layout_options opt = Options;

   // Page dimensions are read first as other values may be relative to them.

   for (auto & [ group, keys ] : groups) {
      if (!iequals(group, "Page")) continue;
      for (auto & [ key, value ] : keys) {
         switch (strihash(key)) {
            case strihash("Width"):
               if (read_length(value, 0, opt.page_width) != ERR::Okay) return log.warning(ERR::InvalidData);
               break;
            case strihash("Height"):
               if (read_length(value, 0, opt.page_height) != ERR::Okay) return log.warning(ERR::InvalidData);
               break;
            default:
               log.detail("Unrecognised key [Page] %s", key.c_str());
         }
      }
   }

   for (auto & [ group, keys ] : groups) {
      if (iequals(group, "Margins")) {
         for (auto & [ key, value ] : keys) {
            ERR error = ERR::Okay;
            switch (strihash(key)) {
               case strihash("Top"):    error = read_length(value, opt.page_height, opt.margins.top); break;
               case strihash("Bottom"): error = read_length(value, opt.page_height, opt.margins.bottom); break;
               case strihash("Left"):   error = read_length(value, opt.page_width, opt.margins.left); break;
               case strihash("Right"):  error = read_length(value, opt.page_width, opt.margins.right); break;
               default: log.detail("Unrecognised key [Margins] %s", key.c_str());
            }
            if (error != ERR::Okay) {
               log.warning("Invalid margin %s = %s", key.c_str(), value.c_str());
               return ERR::InvalidData;
            }
         }
      }
      else if (iequals(group, "Columns")) {
         for (auto & [ key, value ] : keys) {
            ERR error = ERR::Okay;
            switch (strihash(key)) {
               case strihash("Count"): error = read_int(value, opt.column_count); break;
               case strihash("Gap"):   error = read_length(value, opt.content_width(), opt.column_gap); break;
               default: log.detail("Unrecognised key [Columns] %s", key.c_str());
            }
            if (error != ERR::Okay) {
               log.warning("Invalid column setting %s = %s", key.c_str(), value.c_str());
               return ERR::InvalidData;
            }
         }
      }
      else if (iequals(group, "Log")) {
         for (auto & [ key, value ] : keys) {
            if (iequals(key, "Level")) {
               if (read_int(value, opt.log_level) != ERR::Okay) return log.warning(ERR::InvalidData);
            }
            else log.detail("Unrecognised key [Log] %s", key.c_str());
         }
      }
      else if (!iequals(group, "Page")) log.detail("Unrecognised group [%s]", group.c_str());
   }

   if ((opt.page_width <= 0) or (opt.page_height <= 0)) return log.warning(ERR::InvalidDimension);
   if ((opt.margins.top < 0) or (opt.margins.bottom < 0) or (opt.margins.left < 0) or (opt.margins.right < 0)) {
      return log.warning(ERR::InvalidDimension);
   }
   if ((opt.column_count < 1) or (opt.column_gap < 0)) return log.warning(ERR::OutOfRange);
   if ((opt.content_width() <= 0) or (opt.content_height() <= 0)) return log.warning(ERR::InvalidDimension);
   if (opt.columns().width <= 0) return log.warning(ERR::InvalidDimension);

   Options = opt;
   SetLogLevel(Options.log_level);

   log.detail("Page %gx%g, margins %g,%g,%g,%g, %d column(s)", opt.page_width, opt.page_height,
      opt.margins.top, opt.margins.right, opt.margins.bottom, opt.margins.left, opt.column_count);
   return ERR::Okay;
}

//********************************************************************************************************************

ERR read_layout_options(const std::string &Path, layout_options &Options)
{
   Log log(__FUNCTION__);

   std::ifstream file(Path, std::ios::in | std::ios::binary);
   if (!file) {
      log.warning("Failed to open '%s'", Path.c_str());
      return ERR::File;
   }

   std::ostringstream buffer;
   buffer << file.rdbuf();
   if (file.bad()) return log.warning(ERR::Read);

   auto text = buffer.str();
   return load_layout_options(text, Options);
}

//********************************************************************************************************************
// OOXML boolean coercion.  "true", "1" and "on" are true regardless of case; everything else is false.

bool read_bool(std::string_view Value)
{
   trim(Value);
   return iequals(Value, "true") or (Value IS "1") or iequals(Value, "on");
}

//********************************************************************************************************************

static ALIGN read_align(std::string_view Value)
{
   if (iequals(Value, "left")) return ALIGN::LEFT;
   if (iequals(Value, "right")) return ALIGN::RIGHT;
   if (iequals(Value, "center")) return ALIGN::CENTER;
   return ALIGN::NIL;
}

static FRAME_WRAP read_frame_wrap(std::string_view Value)
{
   if (iequals(Value, "none")) return FRAME_WRAP::NONE;
   if (iequals(Value, "around")) return FRAME_WRAP::AROUND;
   if (iequals(Value, "notBeside")) return FRAME_WRAP::NOT_BESIDE;
   if (iequals(Value, "tight")) return FRAME_WRAP::TIGHT;
   return FRAME_WRAP::NIL;
}

/*********************************************************************************************************************

-FUNCTION-
read_paragraph_attrs: Converts a key/value attribute bag into typed paragraph attributes.

Keys use dotted paths, e.g. "spacing.before", "frame.xAlign" or "wordLayout.marker.markerBoxWidthPx".  Lengths accept
the same units as the configuration file.  Boolean values are coerced with read_bool().  Unrecognised keys are
ignored.  All keys are processed even if one of them is invalid.

-ERRORS-
Okay
InvalidData: At least one value could not be parsed.

*********************************************************************************************************************/

ERR read_paragraph_attrs(const attr_map &Attribs, paragraph_attrs &Attrs)
{
   Log log(__FUNCTION__);

   ERR result = ERR::Okay;

   auto length = [&](const std::string &Key, const std::string &Value) -> std::optional<double> {
      DUNIT unit(Value);
      if (unit.type IS DU::PIXEL) return unit.value;
      log.warning("Invalid length for %s: '%s'", Key.c_str(), Value.c_str());
      result = ERR::InvalidData;
      return std::nullopt;
   };

   auto integer = [&](const std::string &Key, const std::string &Value) -> std::optional<int> {
      int v;
      if (read_int(Value, v) IS ERR::Okay) return v;
      log.warning("Invalid integer for %s: '%s'", Key.c_str(), Value.c_str());
      result = ERR::InvalidData;
      return std::nullopt;
   };

   auto explicit_spacing = [&]() -> spacing_explicit & {
      if (!Attrs.explicit_spacing) Attrs.explicit_spacing.emplace();
      return *Attrs.explicit_spacing;
   };

   auto frame = [&]() -> frame_attrs & {
      if (!Attrs.frame) Attrs.frame.emplace();
      return *Attrs.frame;
   };

   auto layout = [&]() -> word_layout & {
      if (!Attrs.layout) Attrs.layout.emplace();
      return *Attrs.layout;
   };

   for (auto & [ key, value ] : Attribs) {
      switch (strihash(key)) {
         case strihash("spacing.before"):          Attrs.spacing.before = length(key, value); break;
         case strihash("spacing.after"):           Attrs.spacing.after = length(key, value); break;
         case strihash("spacing.lineSpaceBefore"): Attrs.spacing.line_space_before = length(key, value); break;
         case strihash("spacing.lineSpaceAfter"):  Attrs.spacing.line_space_after = length(key, value); break;
         case strihash("spacingExplicit.before"):  explicit_spacing().before = read_bool(value); break;
         case strihash("spacingExplicit.after"):   explicit_spacing().after = read_bool(value); break;
         case strihash("spacingExplicit.line"):    explicit_spacing().line = read_bool(value); break;
         case strihash("styleId"):
            if (value.empty()) Attrs.style_id.reset();
            else Attrs.style_id = value;
            break;
         case strihash("contextualSpacing"): Attrs.contextual_spacing = read_bool(value); break;
         case strihash("keepLines"):         Attrs.keep_lines = read_bool(value); break;
         case strihash("keepNext"):          Attrs.keep_next = read_bool(value); break;
         case strihash("indent.left"):
            if (auto v = length(key, value)) Attrs.indent.left = *v;
            break;
         case strihash("indent.right"):
            if (auto v = length(key, value)) Attrs.indent.right = *v;
            break;
         case strihash("floatAlignment"): Attrs.float_alignment = read_align(value); break;
         case strihash("frame.wrap"):     frame().wrap = read_frame_wrap(value); break;
         case strihash("frame.x"):        frame().x = length(key, value); break;
         case strihash("frame.y"):        frame().y = length(key, value); break;
         case strihash("frame.xAlign"):   frame().x_align = read_align(value); break;
         case strihash("wordLayout.firstLineIndentMode"): layout().first_line_indent_mode = read_bool(value); break;
         case strihash("wordLayout.marker.markerBoxWidthPx"): {
            auto &wl = layout();
            if (!wl.marker) wl.marker.emplace();
            wl.marker->marker_box_width = length(key, value);
            break;
         }
         case strihash("pmStart"): Attrs.pm_start = integer(key, value); break;
         case strihash("pmEnd"):   Attrs.pm_end = integer(key, value); break;
         default:
            log.detail("Ignoring unrecognised attribute '%s'", key.c_str());
      }
   }

   return result;
}

} // namespace folio
