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
@file      flavor.cpp
@brief     recompose flavors, named dialect profiles composed of rewrite rules
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/flavor.h>
#include <recompose/debug.h>
#include <cstring>

namespace recompose {

////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Signature checks                                                          //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

inline bool supports_decl(const char *signature, int c)
{
  const char *escapes = std::strchr(signature, ':');
  if (escapes == NULL)
    return false;
  const char *s = std::strchr(signature, c);
  return s && s < escapes;
}

inline bool supports_escape(const char *signature, int escape)
{
  const char *escapes = std::strchr(signature, ':');
  return std::strchr(escapes != NULL ? escapes + 1 : signature, escape) != NULL;
}

////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Flavor                                                                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

Rewrite Flavor::apply(const Tree& tree) const
{
  Tree rewritten(tree);
  for (Rules::const_iterator rule = rules_.begin(); rule != rules_.end(); ++rule)
  {
    try
    {
      rewritten = Rewriter(**rule, name_)(rewritten);
    }
    catch (const feature_error& error)
    {
      DBGLOG("Flavor %s rule %s failed at node %zu", name_.c_str(), (*rule)->name(), error.node());
      return Rewrite(error);
    }
  }
  DBGLOG("Flavor %s applied %zu rules", name_.c_str(), rules_.size());
  return Rewrite(rewritten);
}

Rendered Flavor::render(const Tree& tree) const
{
  return Renderer(syntax_).render(apply(tree).tree());
}

Flavor Flavor::signature(const std::string& name, const char *signature)
{
  if (signature == NULL)
    signature = "";
  bool lookbehind = supports_decl(signature, '<');
  bool python     = supports_decl(signature, 'P');
  bool atomic     = supports_decl(signature, '>');
  bool unicode    = supports_escape(signature, 'p');
  bool possessive = supports_escape(signature, '+');
  bool braces     = !supports_escape(signature, 'u');
  DBGLOG("Flavor::signature(%s, %s) lookbehind=%d python=%d atomic=%d unicode=%d possessive=%d braces=%d", name.c_str(), signature, lookbehind, python, atomic, unicode, possessive, braces);
  Flavor flavor(name, Syntax(python ? "(?P<" : lookbehind ? "(?<" : static_cast<const char*>(NULL), true, braces));
  if (!lookbehind && !python)
    flavor.with(strip_group_names());
  if (!possessive)
    flavor.with(atomic ? possessive_to_atomic() : no_possessive_support());
  if (!atomic)
    flavor.with(no_atomic_support());
  if (!unicode)
    flavor.with(no_unicode_support());
  if (!lookbehind)
    flavor.with(no_lookbehind_support());
  return flavor;
}

// the predefined flavors, NULL past the last
static const Flavor *predefined(size_t i)
{
  static const Flavor *const flavors[] = {
    &Flavor::standard(),
    &Flavor::pcre(),
    &Flavor::java6(),
    &Flavor::java7(),
    &Flavor::dotnet(),
    &Flavor::javascript(),
    &Flavor::legacy_ruby(),
    &Flavor::python(),
  };
  return i < sizeof(flavors)/sizeof(*flavors) ? flavors[i] : NULL;
}

const Flavor *Flavor::find(const std::string& name)
{
  const Flavor *flavor;
  for (size_t i = 0; (flavor = predefined(i)) != NULL; ++i)
    if (flavor->name() == name)
      return flavor;
  return NULL;
}

std::vector<std::string> Flavor::names()
{
  std::vector<std::string> names;
  const Flavor *flavor;
  for (size_t i = 0; (flavor = predefined(i)) != NULL; ++i)
    names.push_back(flavor->name());
  return names;
}

const Flavor& Flavor::standard()
{
  static const Flavor flavor("Default");
  return flavor;
}

const Flavor& Flavor::pcre()
{
  static const Flavor flavor("PCRE", Syntax("(?<"));
  return flavor;
}

const Flavor& Flavor::java6()
{
  static const Flavor flavor = Flavor("Java 6", Syntax(NULL, true, false))
    .with(strip_group_names());
  return flavor;
}

const Flavor& Flavor::java7()
{
  static const Flavor flavor("Java 7", Syntax("(?<", false));
  return flavor;
}

const Flavor& Flavor::dotnet()
{
  static const Flavor flavor = Flavor(".NET", Syntax(NULL, true, false))
    .with(possessive_to_atomic());
  return flavor;
}

const Flavor& Flavor::javascript()
{
  static const Flavor flavor = Flavor("JavaScript")
    .with(strip_group_names())
    .with(no_possessive_support())
    .with(no_atomic_support())
    .with(no_unicode_support())
    .with(no_lookbehind_support());
  return flavor;
}

const Flavor& Flavor::legacy_ruby()
{
  static const Flavor flavor = Flavor("Legacy Ruby")
    .with(strip_group_names())
    .with(possessive_to_atomic())
    .with(no_unicode_support())
    .with(no_lookbehind_support());
  return flavor;
}

const Flavor& Flavor::python()
{
  static const Flavor flavor = Flavor("Python", Syntax("(?P<"))
    .with(no_possessive_support())
    .with(no_atomic_support())
    .with(no_unicode_support());
  return flavor;
}

} // namespace recompose
