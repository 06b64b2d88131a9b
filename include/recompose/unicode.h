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
@file      unicode.h
@brief     Unicode character classes and their 7-bit fallbacks
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef RECOMPOSE_UNICODE_H
#define RECOMPOSE_UNICODE_H

#include <map>
#include <string>

namespace recompose {

namespace Unicode {

/// Unicode class categories, a closed set.
enum Category {
  letter,
  uppercase_letter,
  lowercase_letter,
  titlecase_letter,
  modifier_letter,
  other_letter,
  decimal_digit,
  number,
  mark,
  punctuation,
  symbol,
  separator,
  space_separator,
  word,
  line_terminator,
  categories ///< number of categories
};

/// A Unicode class with its pattern text and its optional 7-bit fallback text.
struct Class {
  Category    category; ///< category of this class
  const char *name;     ///< short name, e.g. "Lu"
  const char *alias;    ///< long name, e.g. "Uppercase_Letter"
  const char *unicode;  ///< pattern text in a Unicode-capable dialect
  const char *ascii;    ///< 7-bit fallback pattern text or NULL when the class has no fallback
};

class Tables {
 public:
  Tables();
  typedef std::map<std::string,Category> Names;
  Names names;
};

/// Returns the class of category `c`, or NULL when `c` is not a category.
const Class *lookup(int c);

/// Returns the class with short name or long alias `s`, or NULL when unknown.
const Class *lookup(const char *s);

} // namespace Unicode

} // namespace recompose

#endif
