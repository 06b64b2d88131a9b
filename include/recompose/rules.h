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
@file      rules.h
@brief     recompose feature rewrite rules, one per dialect limitation
@copyright (c) BSD-3 License - see LICENSE.txt

Each rule encodes one limitation of a regex dialect.  It either transforms the
constructs the dialect lacks into equivalent constructs it has, or rejects them
with a recompose::feature_error.  Rules are stateless, the shared instances
returned by the functions below are composed into flavors.

| Rule                    | Rewrites                                                       |
| ----------------------- | -------------------------------------------------------------- |
| strip_group_names()     | `Group(c, name)` to `Group(c)`                                 |
| possessive_to_atomic()  | `Repeat(c, n, m, possessive)` to `Atomic(Repeat(c, n, m, greedy))` |
| no_possessive_support() | rejects possessive repeats                                     |
| no_atomic_support()     | rejects atomic groups, apply after possessive_to_atomic()      |
| no_unicode_support()    | Unicode classes to their 7-bit fallback, rejects those without |
| no_lookbehind_support() | rejects lookbehind                                             |
*/

#ifndef RECOMPOSE_RULES_H
#define RECOMPOSE_RULES_H

#include <recompose/rewriter.h>

namespace recompose {

/// Removes the names of named groups, leaving them capturing.
class StripGroupNames : public Rule {
 public:
  virtual const char *name() const
  {
    return "strip-group-names";
  }
  virtual Index rewrite(Builder& b, Index i, const Site& site) const;
};

/// Emulates possessive repeats with atomic groups around greedy repeats.
class PossessiveToAtomic : public Rule {
 public:
  virtual const char *name() const
  {
    return "possessive-to-atomic";
  }
  virtual Index rewrite(Builder& b, Index i, const Site& site) const;
};

/// Rejects possessive repeats.
class NoPossessiveSupport : public Rule {
 public:
  virtual const char *name() const
  {
    return "no-possessive";
  }
  virtual Index rewrite(Builder& b, Index i, const Site& site) const;
};

/// Rejects atomic groups.
class NoAtomicSupport : public Rule {
 public:
  virtual const char *name() const
  {
    return "no-atomic";
  }
  virtual Index rewrite(Builder& b, Index i, const Site& site) const;
};

/// Replaces Unicode classes by their 7-bit fallback, rejects classes without one.
class NoUnicodeSupport : public Rule {
 public:
  virtual const char *name() const
  {
    return "no-unicode";
  }
  virtual Index rewrite(Builder& b, Index i, const Site& site) const;
};

/// Rejects lookbehind.
class NoLookBehindSupport : public Rule {
 public:
  virtual const char *name() const
  {
    return "no-lookbehind";
  }
  virtual Index rewrite(Builder& b, Index i, const Site& site) const;
};

const Rule& strip_group_names();
const Rule& possessive_to_atomic();
const Rule& no_possessive_support();
const Rule& no_atomic_support();
const Rule& no_unicode_support();
const Rule& no_lookbehind_support();

} // namespace recompose

#endif
