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
@file      expr.h
@brief     recompose expression trees and the node builder
@copyright (c) BSD-3 License - see LICENSE.txt

An expression tree is stored in an arena of nodes.  Nodes refer to their
children and back-references refer to their target group by index handles
into the arena, so two textually identical groups remain distinct.  Children
are always created before their parent, which rules out cycles.

A recompose::Builder creates the nodes and validates the tree when
recompose::Builder::build is called.  The resulting recompose::Tree is an
immutable value that shares its arena with its copies.

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    recompose::Builder b;
    recompose::Builder::Index sep = b.group(b.literal("[- /.]"), "sep");
    recompose::Builder::Index day = b.repeat(b.literal("\\d"), 2);
    recompose::Tree tree = b.build(b.concat(day, b.concat(sep, b.concat(day, b.backreference(sep)))));
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/

#ifndef RECOMPOSE_EXPR_H
#define RECOMPOSE_EXPR_H

#include <recompose/error.h>
#include <recompose/unicode.h>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace recompose {

/// Expression node, a tagged union over a closed set of variants.
struct Node {
  typedef uint32_t Index; ///< handle of a node in its arena
  /// Node variants.
  enum Kind {
    LITERAL,       ///< opaque pattern fragment `text`
    CONCAT,        ///< sequence of `sub`, each child in `(?:...)` when `protect`
    ALTERNATION,   ///< alternatives `sub`
    REPEAT,        ///< `sub[0]` repeated `min` to `max` times in `mode`
    GROUP,         ///< capturing group of `sub[0]`, named `text` when `named`
    NONCAPTURING,  ///< non-capturing group `(?:...)` of `sub[0]`
    ATOMIC,        ///< atomic group `(?>...)` of `sub[0]`
    LOOKAROUND,    ///< lookahead or lookbehind of `sub[0]`, `negated` or not
    BACKREFERENCE, ///< back-reference to group `target`
    UCLASS         ///< Unicode class `category`, the 7-bit fallback when `ascii`
  };
  /// Repeat modes.
  enum Mode {
    GREEDY,
    RELUCTANT,
    POSSESSIVE
  };
  /// Lookaround directions.
  enum Direction {
    AHEAD,
    BEHIND
  };
  static const Index  NONE = 0xffffffff;            ///< no node
  static const size_t UNBOUNDED = static_cast<size_t>(-1); ///< repeat without upper bound
  /// Construct a node of the given kind with default attributes.
  explicit Node(Kind k)
    :
      kind(k),
      min(0),
      max(0),
      mode(GREEDY),
      direction(AHEAD),
      protect(false),
      negated(false),
      named(false),
      ascii(false),
      target(NONE),
      category(Unicode::letter),
      origin(NONE)
  { }
  /// Returns a printable name of the variant of this node.
  const char *name() const;
  Kind               kind;
  std::string        text;      ///< LITERAL text or GROUP name
  std::vector<Index> sub;       ///< children
  size_t             min;       ///< REPEAT lower bound
  size_t             max;       ///< REPEAT upper bound or UNBOUNDED
  Mode               mode;      ///< REPEAT mode
  Direction          direction; ///< LOOKAROUND direction
  bool               protect;   ///< CONCAT protects its children
  bool               negated;   ///< LOOKAROUND is negative
  bool               named;     ///< GROUP is named
  bool               ascii;     ///< UCLASS is the 7-bit fallback variant
  Index              target;    ///< BACKREFERENCE target group
  Unicode::Category  category;  ///< UCLASS category
  Index              origin;    ///< handle of the node in the tree built by the user, kept by rewriting
};

/// Immutable expression tree, a root handle into a shared arena of nodes.
class Tree {
  friend class Builder;
 public:
  typedef Node::Index       Index; ///< handle of a node
  typedef std::vector<Node> Nodes; ///< arena of nodes
  /// Construct an empty tree.
  Tree()
    :
      root_(Node::NONE)
  { }
  /// Returns the root handle of this tree or Node::NONE when empty.
  Index root() const
  {
    return root_;
  }
  /// Returns true if this tree is empty.
  bool empty() const
  {
    return root_ == Node::NONE;
  }
  /// Returns the number of nodes in the arena of this tree, nodes not reachable from the root included.
  size_t size() const
  {
    return nodes_ ? nodes_->size() : 0;
  }
  /// Returns the node with handle `i`, throws tree_error when `i` is not a node of this tree.
  const Node& operator[](Index i) const;
 private:
  Tree(
      const std::shared_ptr<const Nodes>& nodes,
      Index                               root)
    :
      nodes_(nodes),
      root_(root)
  { }
  std::shared_ptr<const Nodes> nodes_;
  Index                        root_;
};

/// Builder creates the nodes of a tree and validates the tree.
class Builder {
  friend class Rewriter;
 public:
  typedef Node::Index Index; ///< handle of a node
  /// Create a literal pattern fragment, the text is not parsed and contributes no groups.
  Index literal(const std::string& text);
  /// Create a concatenation, each child wrapped in a non-capturing group when `protect` is true.
  Index concat(
      const std::vector<Index>& children,
      bool                      protect = true);
  /// Create a concatenation of two expressions.
  Index concat(
      Index a,
      Index b,
      bool  protect = true)
  {
    std::vector<Index> children;
    children.push_back(a);
    children.push_back(b);
    return concat(children, protect);
  }
  /// Create an alternation, throws tree_error when there are no alternatives.
  Index alternation(const std::vector<Index>& children);
  /// Create an alternation of two expressions.
  Index alternation(
      Index a,
      Index b)
  {
    std::vector<Index> children;
    children.push_back(a);
    children.push_back(b);
    return alternation(children);
  }
  /// Create a repeat of `min` to `max` times, throws tree_error when `min > max`.
  Index repeat(
      Index        child,
      size_t       min,
      size_t       max,
      Node::Mode   mode = Node::GREEDY);
  /// Create a repeat of at least `min` times.
  Index at_least(
      Index      child,
      size_t     min,
      Node::Mode mode = Node::GREEDY)
  {
    return repeat(child, min, Node::UNBOUNDED, mode);
  }
  /// Create a repeat of exactly `n` times.
  Index repeat(
      Index  child,
      size_t n)
  {
    return repeat(child, n, n);
  }
  /// Create a capturing group, named when `name` is not empty, throws tree_error when the name is not an identifier.
  Index group(
      Index              child,
      const std::string& name = std::string());
  /// Create a non-capturing group.
  Index noncapturing(Index child);
  /// Create an atomic group.
  Index atomic(Index child);
  /// Create a lookahead or lookbehind.
  Index lookaround(
      Index           child,
      Node::Direction direction,
      bool            negated = false);
  /// Create a lookahead.
  Index lookahead(
      Index child,
      bool  negated = false)
  {
    return lookaround(child, Node::AHEAD, negated);
  }
  /// Create a lookbehind.
  Index lookbehind(
      Index child,
      bool  negated = false)
  {
    return lookaround(child, Node::BEHIND, negated);
  }
  /// Create a back-reference to a group, throws tree_error when `group` is not a group.
  Index backreference(Index group);
  /// Create a Unicode class, throws tree_error when `ascii` is requested for a class without 7-bit fallback.
  Index unicode(
      Unicode::Category category,
      bool              ascii = false);
  /// Returns the node with handle `i`, throws tree_error when `i` is not a node of this builder.
  const Node& operator[](Index i) const;
  /// Returns the number of nodes created so far.
  size_t size() const
  {
    return nodes_.size();
  }
  /// Validate the tree rooted at `root` and return it, throws tree_error when an invariant is violated.
  Tree build(Index root) const;
 private:
  /// Validation state of a tree walk.
  struct Walk {
    std::set<Index>       groups; ///< groups entered
    std::set<Index>       closed; ///< groups completed
    std::set<std::string> names;  ///< group names used
  };
  Index add(const Node& node);
  Index add_unary(
      Node::Kind kind,
      Index      child);
  void check(Index i) const;
  void validate(
      Index i,
      Walk& walk) const;
  Tree freeze(Index root) const;
  std::vector<Node> nodes_;
};

} // namespace recompose

#endif
