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
@file      expr.cpp
@brief     recompose expression trees and the node builder
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/expr.h>
#include <recompose/debug.h>
#include <cctype>

namespace recompose {

const Node::Index Node::NONE;
const size_t      Node::UNBOUNDED;

const char *Node::name() const
{
  switch (kind)
  {
    case LITERAL:       return "literal";
    case CONCAT:        return "concat";
    case ALTERNATION:   return "alternation";
    case REPEAT:        return "repeat";
    case GROUP:         return "group";
    case NONCAPTURING:  return "non-capturing group";
    case ATOMIC:        return "atomic group";
    case LOOKAROUND:    return direction == AHEAD ? "lookahead" : "lookbehind";
    case BACKREFERENCE: return "back-reference";
    case UCLASS:        return "Unicode class";
  }
  return "?";
}

const Node& Tree::operator[](Index i) const
{
  if (!nodes_ || i >= nodes_->size())
    throw tree_error(tree_error::invalid_handle, i);
  return (*nodes_)[i];
}

// group names are identifiers, as required by (?<name>...) and (?P<name>...)
static bool is_identifier(const std::string& name)
{
  if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
    return false;
  for (std::string::const_iterator i = name.begin() + 1; i != name.end(); ++i)
    if (!std::isalnum(static_cast<unsigned char>(*i)) && *i != '_')
      return false;
  return true;
}

Builder::Index Builder::literal(const std::string& text)
{
  Node node(Node::LITERAL);
  node.text = text;
  return add(node);
}

Builder::Index Builder::concat(const std::vector<Index>& children, bool protect)
{
  Node node(Node::CONCAT);
  node.sub = children;
  node.protect = protect;
  return add(node);
}

Builder::Index Builder::alternation(const std::vector<Index>& children)
{
  if (children.empty())
    throw tree_error(tree_error::empty_alternation, nodes_.size());
  Node node(Node::ALTERNATION);
  node.sub = children;
  return add(node);
}

Builder::Index Builder::repeat(Index child, size_t min, size_t max, Node::Mode mode)
{
  if (min > max)
    throw tree_error(tree_error::invalid_repeat, nodes_.size(), ("{" + ztoa(min) + "," + ztoa(max) + "}").c_str());
  Node node(Node::REPEAT);
  node.sub.push_back(child);
  node.min = min;
  node.max = max;
  node.mode = mode;
  return add(node);
}

Builder::Index Builder::group(Index child, const std::string& name)
{
  Node node(Node::GROUP);
  if (!name.empty())
  {
    if (!is_identifier(name))
      throw tree_error(tree_error::invalid_name, nodes_.size(), name.c_str());
    node.text = name;
    node.named = true;
  }
  node.sub.push_back(child);
  return add(node);
}

Builder::Index Builder::noncapturing(Index child)
{
  return add_unary(Node::NONCAPTURING, child);
}

Builder::Index Builder::atomic(Index child)
{
  return add_unary(Node::ATOMIC, child);
}

Builder::Index Builder::lookaround(Index child, Node::Direction direction, bool negated)
{
  Node node(Node::LOOKAROUND);
  node.sub.push_back(child);
  node.direction = direction;
  node.negated = negated;
  return add(node);
}

Builder::Index Builder::backreference(Index group)
{
  check(group);
  if (nodes_[group].kind != Node::GROUP)
    throw tree_error(tree_error::invalid_backreference, nodes_.size());
  Node node(Node::BACKREFERENCE);
  node.target = group;
  return add(node);
}

Builder::Index Builder::unicode(Unicode::Category category, bool ascii)
{
  const Unicode::Class *cls = Unicode::lookup(category);
  if (cls == NULL || (ascii && cls->ascii == NULL))
    throw tree_error(tree_error::invalid_category, nodes_.size(), cls != NULL ? cls->name : NULL);
  Node node(Node::UCLASS);
  node.category = category;
  node.ascii = ascii;
  return add(node);
}

const Node& Builder::operator[](Index i) const
{
  check(i);
  return nodes_[i];
}

Tree Builder::build(Index root) const
{
  check(root);
  Walk walk;
  validate(root, walk);
  DBGLOG("Builder::build(%u) %zu nodes %zu groups", root, nodes_.size(), walk.groups.size());
  return freeze(root);
}

Builder::Index Builder::add(const Node& node)
{
  for (std::vector<Index>::const_iterator i = node.sub.begin(); i != node.sub.end(); ++i)
    check(*i);
  if (nodes_.size() >= Node::NONE)
    throw tree_error(tree_error::invalid_handle, nodes_.size());
  Index i = static_cast<Index>(nodes_.size());
  nodes_.push_back(node);
  if (node.origin == Node::NONE)
    nodes_.back().origin = i;
  return i;
}

Builder::Index Builder::add_unary(Node::Kind kind, Index child)
{
  Node node(kind);
  node.sub.push_back(child);
  return add(node);
}

void Builder::check(Index i) const
{
  if (i >= nodes_.size())
    throw tree_error(tree_error::invalid_handle, i);
}

void Builder::validate(Index i, Walk& walk) const
{
  const Node& node = nodes_[i];
  switch (node.kind)
  {
    case Node::GROUP:
      if (!walk.groups.insert(i).second)
        throw tree_error(tree_error::duplicate_group, i);
      if (node.named && !walk.names.insert(node.text).second)
        throw tree_error(tree_error::duplicate_name, i, node.text.c_str());
      validate(node.sub[0], walk);
      walk.closed.insert(i);
      break;
    case Node::BACKREFERENCE:
      if (node.target >= nodes_.size() || nodes_[node.target].kind != Node::GROUP)
        throw tree_error(tree_error::invalid_backreference, i);
      if (walk.closed.find(node.target) == walk.closed.end())
        throw tree_error(tree_error::forward_backreference, i);
      break;
    default:
      for (std::vector<Index>::const_iterator j = node.sub.begin(); j != node.sub.end(); ++j)
        validate(*j, walk);
  }
}

Tree Builder::freeze(Index root) const
{
  return Tree(std::shared_ptr<const Tree::Nodes>(new Tree::Nodes(nodes_)), root);
}

} // namespace recompose
