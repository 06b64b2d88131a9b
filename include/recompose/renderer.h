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
@file      renderer.h
@brief     recompose renderer of trees to pattern strings with group index maps
@copyright (c) BSD-3 License - see LICENSE.txt

The renderer walks a tree once, left to right, emitting the pattern and
numbering each capturing group by the position of its opening parenthesis,
which is how regex engines number their groups.  Named groups are added to
the group map under their name.  Literal text is emitted as is and is never
scanned for groups, so groups written inside literals are not numbered.

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    recompose::Builder b;
    recompose::Tree tree = b.build(b.group(b.literal("[- /.]"), "sep"));
    recompose::Rendered r = recompose::Renderer().render(tree);
    // r.pattern() == "([- /.])" and r.index("sep") == 1
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/

#ifndef RECOMPOSE_RENDERER_H
#define RECOMPOSE_RENDERER_H

#include <recompose/expr.h>
#include <map>
#include <string>

namespace recompose {

/// Dialect syntax of the constructs that differ between flavors.
struct Syntax {
  /// Construct the syntax of a dialect, `named` opens a named group before its name, e.g. `"(?<"`, or is NULL to keep names in the group map only.
  explicit Syntax(
      const char *named      = NULL,
      bool        underscore = true,
      bool        braces     = true)
    :
      named(named),
      underscore(underscore),
      braces(braces)
  { }
  /// Returns true if a group named `name` can be opened with the `named` syntax.
  bool inline_name(const std::string& name) const
  {
    return named != NULL && (underscore || name.find('_') == std::string::npos);
  }
  const char *named;      ///< named group opening, closed by `>` after the name, or NULL
  bool        underscore; ///< group names may contain `_`, otherwise these groups are opened with a plain `(`
  bool        braces;     ///< hex escapes `\x{H..H}` are accepted, otherwise they are written as `\uHHHH`
};

/// The pattern string of a rendered tree with its group index map.
class Rendered {
  friend class Renderer;
 public:
  typedef std::map<std::string,size_t> Groups; ///< group name to 1-based group index
  Rendered()
    :
      captures_(0)
  { }
  /// Returns the pattern string.
  const std::string& pattern() const
  {
    return pattern_;
  }
  /// Returns the group index map.
  const Groups& groups() const
  {
    return groups_;
  }
  /// Returns the number of capturing groups, named and unnamed.
  size_t captures() const
  {
    return captures_;
  }
  /// Returns the index of the group named `name`, or 0 when no group has this name.
  size_t index(const std::string& name) const
  {
    Groups::const_iterator i = groups_.find(name);
    return i != groups_.end() ? i->second : 0;
  }
 private:
  std::string pattern_;
  Groups      groups_;
  size_t      captures_;
};

/// Renderer produces the pattern string and group index map of a tree.
class Renderer {
 public:
  typedef Node::Index Index;
  /// Construct a renderer for the given dialect syntax.
  explicit Renderer(const Syntax& syntax = Syntax())
    :
      syntax_(syntax)
  { }
  /// Render a tree, throws tree_error when a back-reference has no resolved target.
  Rendered render(const Tree& tree) const;
 private:
  /// Group numbers assigned so far, by group handle.
  typedef std::map<Index,size_t> Numbers;
  std::string render(
      const Tree& tree,
      Index       i,
      Numbers&    numbers,
      Rendered&   out) const;
  Syntax syntax_;
};

/// Returns the quantifier of a repeat of `min` to `max` times in `mode`, e.g. `*`, `{2,}?` or `{1,3}+`.
std::string quantifier(
    size_t     min,
    size_t     max,
    Node::Mode mode);

/// Returns true if `regex` is a single character, escape, bracket list or parenthesized group, so it can be quantified as is.
bool atomic_unit(const std::string& regex);

} // namespace recompose

#endif
