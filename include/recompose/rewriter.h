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
@file      rewriter.h
@brief     recompose tree rewriter driven by a rewrite rule
@copyright (c) BSD-3 License - see LICENSE.txt

A recompose::Rule is a partial function from nodes to nodes.  A
recompose::Rewriter applies a rule to every node of a tree, bottom-up: each
node is rebuilt with its children already rewritten and then offered to the
rule, which returns its replacement image or the node itself when the rule is
not defined for the node.  A rule may instead throw recompose::feature_error
to reject a construct.

Rewriting never modifies the given tree.  Applying rewriter A and then
rewriter B applies A everywhere before B is applied anywhere.
*/

#ifndef RECOMPOSE_REWRITER_H
#define RECOMPOSE_REWRITER_H

#include <recompose/expr.h>
#include <map>
#include <string>

namespace recompose {

/// The node of the input tree that is offered to a rule.
struct Site {
  const Tree&        tree;   ///< tree being rewritten
  Node::Index        origin; ///< handle of the node in the tree built by the user
  const std::string& flavor; ///< name of the flavor applying the rule
};

/// Rewrite rule interface.
class Rule {
 public:
  typedef Node::Index Index;
  virtual ~Rule()
  { }
  /// Returns the name of this rule.
  virtual const char *name() const = 0;
  /// Returns the image of node `i` of `b`, or `i` when the rule is not defined for the node.
  virtual Index rewrite(
      Builder&    b,    ///< builder of the rewritten tree, the image is added to it
      Index       i,    ///< rebuilt node with rewritten children
      const Site& site) ///< the node in the tree being rewritten
    const
    /// @throws feature_error when the construct cannot be expressed
    = 0;
};

/// Rewriter applies a rule structurally to all nodes of a tree.
class Rewriter {
 public:
  typedef Node::Index Index;
  /// Construct a rewriter for `rule` applied on behalf of flavor `flavor`.
  explicit Rewriter(
      const Rule&        rule,
      const std::string& flavor = std::string())
    :
      rule_(rule),
      flavor_(flavor)
  { }
  /// A rewriter keeps a reference to its rule, so a temporary rule cannot be given.
  explicit Rewriter(
      const Rule&&       rule,
      const std::string& flavor = std::string()) = delete;
  /// Returns the rewritten tree, throws feature_error when the rule rejects a construct.
  Tree operator()(const Tree& tree) const;
 private:
  /// Maps groups of the input tree to groups of the rewritten tree.
  typedef std::map<Index,Index> Groups;
  Index rewrite(
      const Tree& tree,
      Index       i,
      Builder&    b,
      Groups&     groups) const;
  const Rule& rule_;
  std::string flavor_;
};

} // namespace recompose

#endif
