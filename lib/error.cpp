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
@file      error.cpp
@brief     recompose tree construction errors and flavor feature errors
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/error.h>

namespace recompose {

const tree_error_type tree_error::invalid_handle;
const tree_error_type tree_error::invalid_repeat;
const tree_error_type tree_error::invalid_name;
const tree_error_type tree_error::duplicate_name;
const tree_error_type tree_error::duplicate_group;
const tree_error_type tree_error::empty_alternation;
const tree_error_type tree_error::invalid_backreference;
const tree_error_type tree_error::forward_backreference;
const tree_error_type tree_error::invalid_category;
const tree_error_type tree_error::unresolved_backreference;

const feature_error_type feature_error::lookbehind;
const feature_error_type feature_error::unicode_class;
const feature_error_type feature_error::atomic_group;
const feature_error_type feature_error::possessive_quantifier;

std::string tree_error::tree_error_message(tree_error_type code, size_t node, const char *detail)
{
  static const char *messages[] = {
    "invalid node handle",
    "invalid repeat",
    "invalid group name",
    "duplicate group name",
    "group occurs more than once",
    "empty alternation",
    "back-reference target is not a group",
    "back-reference precedes the end of its group",
    "invalid Unicode category",
    "unresolved back-reference",
  };
  std::string what("error at node ");
  what.append(ztoa(node)).append(": ").append(messages[code]);
  if (detail != NULL && *detail != '\0')
    what.append(" ").append(detail);
  return what;
}

std::string feature_error::feature_error_message(feature_error_type code, const std::string& flavor, size_t node, const std::string& construct)
{
  static const char *messages[] = {
    "lookbehind",
    "Unicode class",
    "atomic group",
    "possessive quantifier",
  };
  std::string what("error at node ");
  what.append(ztoa(node)).append("\n").append(construct).append("\n");
  what.append("\\___").append(messages[code]).append(" not supported by ").append(flavor).append("\n");
  return what;
}

} // namespace recompose
