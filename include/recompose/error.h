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
@file      error.h
@brief     recompose tree construction errors and flavor feature errors
@copyright (c) BSD-3 License - see LICENSE.txt

Two disjoint kinds of errors are reported:

- recompose::tree_error is thrown when a tree violates a construction
  invariant, for example a back-reference to a group that is not completed
  before the back-reference.  These are programming errors in the code that
  builds the tree.

- recompose::feature_error is raised when a flavor cannot express a construct
  of a tree, for example a lookbehind in a dialect without lookbehind.  The
  caller may recover by choosing another flavor or by restructuring the tree.
*/

#ifndef RECOMPOSE_ERROR_H
#define RECOMPOSE_ERROR_H

#include <cstdio>
#include <stdexcept>
#include <string>

namespace recompose {

inline std::string ztoa(size_t n)
{
  char buf[24];
  snprintf(buf, sizeof(buf), "%zu", n);
  return std::string(buf);
}

/// Tree error exception error code.
typedef int tree_error_type;

/// Tree construction and tree invariant violation exceptions.
class tree_error : public std::runtime_error {
 public:
  static const tree_error_type invalid_handle          = 0; ///< node handle does not refer to a node of the tree
  static const tree_error_type invalid_repeat          = 1; ///< invalid repeat range, e.g. `{10,1}`
  static const tree_error_type invalid_name            = 2; ///< group name is not an identifier
  static const tree_error_type duplicate_name          = 3; ///< group name is used by more than one group
  static const tree_error_type duplicate_group         = 4; ///< group node occurs more than once in the tree
  static const tree_error_type empty_alternation       = 5; ///< alternation without alternatives
  static const tree_error_type invalid_backreference   = 6; ///< back-reference target is not a group
  static const tree_error_type forward_backreference   = 7; ///< back-reference target is not completed before the back-reference
  static const tree_error_type invalid_category        = 8; ///< unknown Unicode category or ASCII variant without fallback
  static const tree_error_type unresolved_backreference = 9; ///< back-reference target has no group index when rendered
  /// Construct tree error info.
  tree_error(
      tree_error_type code,
      size_t          node,
      const char     *detail = NULL)
    :
      std::runtime_error(tree_error_message(code, node, detail)),
      code_(code),
      node_(node)
  { }
  /// Returns error code, a recompose::tree_error_type constant.
  tree_error_type code()
    const
  {
    return code_;
  }
  /// Returns the handle of the offending node.
  size_t node()
    const
  {
    return node_;
  }
 private:
  static std::string tree_error_message(
      tree_error_type code,
      size_t          node,
      const char     *detail);
  tree_error_type code_;
  size_t          node_;
};

/// Feature error exception error code.
typedef int feature_error_type;

/// Flavor feature-support failures.
class feature_error : public std::runtime_error {
 public:
  static const feature_error_type lookbehind            = 0; ///< lookbehind `(?<=...)` or `(?<!...)` not supported
  static const feature_error_type unicode_class         = 1; ///< Unicode class without 7-bit fallback not supported
  static const feature_error_type atomic_group          = 2; ///< atomic group `(?>...)` not supported
  static const feature_error_type possessive_quantifier = 3; ///< possessive quantifier not supported
  /// Construct feature error info.
  feature_error(
      feature_error_type code,
      const std::string& flavor,
      size_t             node,
      const std::string& construct)
    :
      std::runtime_error(feature_error_message(code, flavor, node, construct)),
      code_(code),
      flavor_(flavor),
      node_(node),
      construct_(construct)
  { }
  /// Returns error code, a recompose::feature_error_type constant.
  feature_error_type code()
    const
  {
    return code_;
  }
  /// Returns the name of the flavor that rejected the construct.
  const std::string& flavor()
    const
  {
    return flavor_;
  }
  /// Returns the handle of the offending node in the tree given to the flavor.
  size_t node()
    const
  {
    return node_;
  }
  /// Returns the construct as it would be written in a capable dialect.
  const std::string& construct()
    const
  {
    return construct_;
  }
 private:
  static std::string feature_error_message(
      feature_error_type code,
      const std::string& flavor,
      size_t             node,
      const std::string& construct);
  feature_error_type code_;
  std::string        flavor_;
  size_t             node_;
  std::string        construct_;
};

} // namespace recompose

#endif
