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
@file      rules.cpp
@brief     recompose feature rewrite rules, one per dialect limitation
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/rules.h>
#include <recompose/renderer.h>
#include <recompose/debug.h>

namespace recompose {

Rule::Index StripGroupNames::rewrite(Builder& b, Index i, const Site&) const
{
  if (b[i].kind != Node::GROUP || !b[i].named)
    return i;
  return b.group(b[i].sub[0]);
}

Rule::Index PossessiveToAtomic::rewrite(Builder& b, Index i, const Site&) const
{
  if (b[i].kind != Node::REPEAT || b[i].mode != Node::POSSESSIVE)
    return i;
  // copy, adding nodes invalidates references into the builder
  Node node(b[i]);
  return b.atomic(b.repeat(node.sub[0], node.min, node.max, Node::GREEDY));
}

Rule::Index NoPossessiveSupport::rewrite(Builder& b, Index i, const Site& site) const
{
  const Node& node = b[i];
  if (node.kind == Node::REPEAT && node.mode == Node::POSSESSIVE)
    throw feature_error(feature_error::possessive_quantifier, site.flavor, site.origin, quantifier(node.min, node.max, node.mode));
  return i;
}

Rule::Index NoAtomicSupport::rewrite(Builder& b, Index i, const Site& site) const
{
  if (b[i].kind == Node::ATOMIC)
    throw feature_error(feature_error::atomic_group, site.flavor, site.origin, "(?>...)");
  return i;
}

Rule::Index NoUnicodeSupport::rewrite(Builder& b, Index i, const Site& site) const
{
  const Node& node = b[i];
  if (node.kind != Node::UCLASS || node.ascii)
    return i;
  const Unicode::Class *cls = Unicode::lookup(node.category);
  if (cls->ascii == NULL)
    throw feature_error(feature_error::unicode_class, site.flavor, site.origin, cls->unicode);
  DBGLOG("%s: \\p{%s} to %s", site.flavor.c_str(), cls->name, cls->ascii);
  return b.unicode(cls->category, true);
}

Rule::Index NoLookBehindSupport::rewrite(Builder& b, Index i, const Site& site) const
{
  const Node& node = b[i];
  if (node.kind == Node::LOOKAROUND && node.direction == Node::BEHIND)
    throw feature_error(feature_error::lookbehind, site.flavor, site.origin, node.negated ? "(?<!...)" : "(?<=...)");
  return i;
}

const Rule& strip_group_names()
{
  static const StripGroupNames rule = StripGroupNames();
  return rule;
}

const Rule& possessive_to_atomic()
{
  static const PossessiveToAtomic rule = PossessiveToAtomic();
  return rule;
}

const Rule& no_possessive_support()
{
  static const NoPossessiveSupport rule = NoPossessiveSupport();
  return rule;
}

const Rule& no_atomic_support()
{
  static const NoAtomicSupport rule = NoAtomicSupport();
  return rule;
}

const Rule& no_unicode_support()
{
  static const NoUnicodeSupport rule = NoUnicodeSupport();
  return rule;
}

const Rule& no_lookbehind_support()
{
  static const NoLookBehindSupport rule = NoLookBehindSupport();
  return rule;
}

} // namespace recompose
