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
@file      flavor.h
@brief     recompose flavors, named dialect profiles composed of rewrite rules
@copyright (c) BSD-3 License - see LICENSE.txt

A flavor is a display name, the syntax of the dialect's named groups, and an
ordered list of rewrite rules.  recompose::Flavor::apply rewrites a tree with
each rule in turn and stops at the first rule that rejects a construct.

Flavors are assembled by selecting rules:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    recompose::Flavor ruby = recompose::Flavor("Legacy Ruby")
      .with(recompose::strip_group_names())
      .with(recompose::possessive_to_atomic())
      .with(recompose::no_unicode_support())
      .with(recompose::no_lookbehind_support());
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

or from a regex library signature, see recompose::Flavor::signature.
*/

#ifndef RECOMPOSE_FLAVOR_H
#define RECOMPOSE_FLAVOR_H

#include <recompose/renderer.h>
#include <recompose/rules.h>
#include <memory>
#include <string>
#include <vector>

namespace recompose {

/// The result of applying a flavor to a tree, the rewritten tree or the feature error that stopped the rewrite.
class Rewrite {
 public:
  /// Construct a successful rewrite.
  explicit Rewrite(const Tree& tree)
    :
      tree_(tree)
  { }
  /// Construct a failed rewrite.
  explicit Rewrite(const feature_error& error)
    :
      error_(new feature_error(error))
  { }
  /// Returns true if the rewrite succeeded.
  bool ok() const
  {
    return !error_;
  }
  /// Returns the rewritten tree, throws the feature error when the rewrite failed.
  const Tree& tree() const
  {
    if (error_)
      throw *error_;
    return tree_;
  }
  /// Returns the feature error of a failed rewrite or NULL.
  const feature_error *error() const
  {
    return error_.get();
  }
 private:
  Tree                                 tree_;
  std::shared_ptr<const feature_error> error_;
};

/// Flavor of a regex dialect.
class Flavor {
 public:
  typedef std::vector<const Rule*> Rules; ///< rules in order of application
  /// Construct a flavor without rules.
  explicit Flavor(
      const std::string& name,
      const Syntax&      syntax = Syntax())
    :
      name_(name),
      syntax_(syntax)
  { }
  /// Append a rule, rules are applied in the order they are added.
  Flavor& with(const Rule& rule)
  {
    rules_.push_back(&rule);
    return *this;
  }
  /// A flavor keeps the address of its rules, so a temporary rule cannot be added.
  Flavor& with(const Rule&& rule) = delete;
  /// Returns the name of this flavor.
  const std::string& name() const
  {
    return name_;
  }
  /// Returns the syntax of this flavor.
  const Syntax& syntax() const
  {
    return syntax_;
  }
  /// Returns the rules of this flavor.
  const Rules& rules() const
  {
    return rules_;
  }
  /// Rewrite a tree with the rules of this flavor, the given tree is not modified.
  Rewrite apply(const Tree& tree) const;
  /// Rewrite and render a tree.
  Rendered render(const Tree& tree) const
    /// @throws feature_error when the flavor cannot express a construct
    /// @throws tree_error when a back-reference cannot be resolved
    ;
  /// @brief Returns a flavor for a regex library signature `"decls:escapes?+"`.
  ///
  /// The signature lists the regex constructs `(?...)` the dialect accepts in
  /// decls, and the escapes it accepts after the colon, of which the
  /// following characters select the capabilities of the dialect:
  /// - decl `<` lookbehind and `(?<name>...)` named groups are supported
  /// - decl `P` `(?P<name>...)` named groups are supported
  /// - decl `>` atomic groups `(?>...)` are supported
  /// - escape `p` Unicode classes `\p{C}` are supported
  /// - escape `u` hex escapes are written `\uHHHH` instead of `\x{H..H}`
  /// - trailing `+` possessive quantifiers are supported
  ///
  /// The rules for the capabilities missing are selected in this order:
  /// strip group names, possessive to atomic or no possessive, no atomic,
  /// no Unicode, no lookbehind.
  static Flavor signature(
      const std::string& name,
      const char        *signature);
  /// Returns the predefined flavor with the given name or NULL.
  static const Flavor *find(const std::string& name);
  /// Returns the names of the predefined flavors.
  static std::vector<std::string> names();
  /// Default flavor, no rules, group names are kept in the group map only.
  static const Flavor& standard();
  /// PCRE flavor, `(?<name>...)` groups.
  static const Flavor& pcre();
  /// Java 6 flavor, no named groups, `\uHHHH` hex escapes.
  static const Flavor& java6();
  /// Java 7 and later flavor, `(?<name>...)` groups, names with a `_` are kept in the group map only.
  static const Flavor& java7();
  /// .NET flavor, which numbers named groups after unnamed groups, so names are kept in the group map only, `\uHHHH` hex escapes.
  static const Flavor& dotnet();
  /// JavaScript flavor, no named groups, possessive quantifiers, atomic groups, Unicode classes and lookbehind.
  static const Flavor& javascript();
  /// Legacy Ruby 1.8 flavor, no named groups, possessive quantifiers, Unicode classes and lookbehind.
  static const Flavor& legacy_ruby();
  /// Python flavor, `(?P<name>...)` groups, no possessive quantifiers, atomic groups and Unicode classes.
  static const Flavor& python();
 private:
  std::string name_;
  Syntax      syntax_;
  Rules       rules_;
};

} // namespace recompose

#endif
