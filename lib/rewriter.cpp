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
@file      rewriter.cpp
@brief     recompose tree rewriter driven by a rewrite rule
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/rewriter.h>
#include <recompose/debug.h>

namespace recompose {

Tree Rewriter::operator()(const Tree& tree) const
{
  if (tree.empty())
    return tree;
  Builder b;
  Groups groups;
  Index root = rewrite(tree, tree.root(), b, groups);
  DBGLOG("Rewriter %s: %zu nodes to %zu nodes", rule_.name(), tree.size(), b.size());
  return b.freeze(root);
}

Rewriter::Index Rewriter::rewrite(const Tree& tree, Index i, Builder& b, Groups& groups) const
{
  Node node(tree[i]);
  for (std::vector<Index>::iterator j = node.sub.begin(); j != node.sub.end(); ++j)
    *j = rewrite(tree, *j, b, groups);
  if (node.kind == Node::BACKREFERENCE)
  {
    // the target group precedes the back-reference, so it is mapped already
    Groups::const_iterator g = groups.find(node.target);
    node.target = g != groups.end() ? g->second : Node::NONE;
  }
  Index k = b.add(node);
  Site site = { tree, node.origin, flavor_ };
  Index image = rule_.rewrite(b, k, site);
  // nodes added by the rule stand for the node they replace
  for (size_t j = k + 1; j < b.size(); ++j)
    b.nodes_[j].origin = node.origin;
  if (node.kind == Node::GROUP)
    groups[i] = b[image].kind == Node::GROUP ? image : k;
  return image;
}

} // namespace recompose
