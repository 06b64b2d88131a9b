/******************************************************************************\
* Copyright (c) 2016, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      unicode.cpp
@brief     Unicode character classes and their 7-bit fallbacks
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/unicode.h>

namespace recompose {

namespace Unicode {

// indexed by category
static const Class classes[categories] = {
  { letter,           "L",  "Letter",               "\\p{L}",  "[a-zA-Z]" },
  { uppercase_letter, "Lu", "Uppercase_Letter",     "\\p{Lu}", "[A-Z]" },
  { lowercase_letter, "Ll", "Lowercase_Letter",     "\\p{Ll}", "[a-z]" },
  { titlecase_letter, "Lt", "Titlecase_Letter",     "\\p{Lt}", NULL },
  { modifier_letter,  "Lm", "Modifier_Letter",      "\\p{Lm}", NULL },
  { other_letter,     "Lo", "Other_Letter",         "\\p{Lo}", NULL },
  { decimal_digit,    "Nd", "Decimal_Digit_Number", "\\p{Nd}", "[0-9]" },
  { number,           "N",  "Number",               "\\p{N}",  "[0-9]" },
  { mark,             "M",  "Mark",                 "\\p{M}",  NULL },
  { punctuation,      "P",  "Punctuation",          "\\p{P}",  NULL },
  { symbol,           "S",  "Symbol",               "\\p{S}",  NULL },
  { separator,        "Z",  "Separator",            "\\p{Z}",  NULL },
  { space_separator,  "Zs", "Space_Separator",      "\\p{Zs}", "[ ]" },
  { word,             "w",  "Word",                 "[\\p{L}\\p{Mn}\\p{Nd}\\p{Pc}]", "\\w" },
  { line_terminator,  "R",  "Line_Terminator",      "(?:\\r\\n?|[\\n\\x0B\\f\\x{85}\\x{2028}\\x{2029}])", "(?:\\r\\n?|[\\n\\x0B\\f])" },
};

Tables::Tables()
{
  for (int c = 0; c < categories; ++c)
  {
    names[classes[c].name]  = classes[c].category;
    names[classes[c].alias] = classes[c].category;
  }
  // common aliases of the long names
  names["Digit"]        = decimal_digit;
  names["Space"]        = space_separator;
  names["Newline"]      = line_terminator;
}

static const Tables tables;

const Class *lookup(int c)
{
  if (c < 0 || c >= categories)
    return NULL;
  return &classes[c];
}

const Class *lookup(const char *s)
{
  if (s == NULL)
    return NULL;
  Tables::Names::const_iterator i = tables.names.find(s);
  if (i != tables.names.end())
    return &classes[i->second];
  return NULL;
}

} // namespace Unicode

} // namespace recompose
