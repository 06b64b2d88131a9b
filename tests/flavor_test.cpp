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
@file      flavor_test.cpp
@brief     tests of flavors and their fail-fast rule application
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/flavor.h>
#include <gtest/gtest.h>
#include <type_traits>
#include <utility>

using namespace recompose;

namespace {

// 19 or 20 followed by two digits
Tree century(Builder& b)
{
  Builder::Index c = b.alternation(b.literal("19"), b.literal("20"));
  return b.build(b.concat(c, b.literal("\\d\\d")));
}

// true_type if a rule of type R can be added to a flavor
template<typename R>
auto addable(int) -> decltype(std::declval<Flavor&>().with(std::declval<R>()), std::true_type());

template<typename R>
std::false_type addable(...);

} // namespace

TEST(FlavorTest, ListsPredefinedFlavors)
{
  std::vector<std::string> names = Flavor::names();
  ASSERT_EQ(8u, names.size());
  EXPECT_EQ("Default", names[0]);
  EXPECT_EQ("PCRE", names[1]);
  EXPECT_EQ("Python", names[7]);
  for (std::vector<std::string>::const_iterator name = names.begin(); name != names.end(); ++name)
  {
    const Flavor *flavor = Flavor::find(*name);
    ASSERT_TRUE(flavor != NULL);
    EXPECT_EQ(*name, flavor->name());
  }
  EXPECT_EQ(&Flavor::dotnet(), Flavor::find(".NET"));
  EXPECT_TRUE(Flavor::find("Perl 4") == NULL);
}

TEST(FlavorTest, ComposesRulesInOrder)
{
  const Flavor::Rules& rules = Flavor::legacy_ruby().rules();
  ASSERT_EQ(4u, rules.size());
  EXPECT_EQ(&strip_group_names(), rules[0]);
  EXPECT_EQ(&possessive_to_atomic(), rules[1]);
  EXPECT_EQ(&no_unicode_support(), rules[2]);
  EXPECT_EQ(&no_lookbehind_support(), rules[3]);
  EXPECT_TRUE(Flavor::standard().rules().empty());
  EXPECT_EQ(5u, Flavor::javascript().rules().size());
}

TEST(FlavorTest, RendersWithoutRules)
{
  Builder b;
  Rendered r = Flavor::standard().render(century(b));
  EXPECT_EQ("(?:(?:19)|(?:20))(?:\\d\\d)", r.pattern());
  EXPECT_TRUE(r.groups().empty());
}

TEST(FlavorTest, RendersNamedGroupsInDialectSyntax)
{
  Builder b;
  Tree tree = b.build(b.group(b.literal("[- /.]"), "sep"));
  EXPECT_EQ("([- /.])", Flavor::standard().render(tree).pattern());
  EXPECT_EQ("(?<sep>[- /.])", Flavor::pcre().render(tree).pattern());
  EXPECT_EQ("(?<sep>[- /.])", Flavor::java7().render(tree).pattern());
  EXPECT_EQ("(?P<sep>[- /.])", Flavor::python().render(tree).pattern());
  EXPECT_EQ("([- /.])", Flavor::dotnet().render(tree).pattern());
  EXPECT_EQ(1u, Flavor::python().render(tree).index("sep"));
  EXPECT_EQ(1u, Flavor::dotnet().render(tree).index("sep"));
}

TEST(FlavorTest, StripsNamesFromGroupMap)
{
  Builder b;
  Tree tree = b.build(b.group(b.literal("[- /.]"), "sep"));
  Rendered r = Flavor::java6().render(tree);
  EXPECT_EQ("([- /.])", r.pattern());
  EXPECT_TRUE(r.groups().empty());
  EXPECT_EQ(1u, r.captures());
}

TEST(FlavorTest, DowngradesPossessiveRepeat)
{
  Builder b;
  Tree tree = b.build(b.at_least(b.literal("a"), 1, Node::POSSESSIVE));
  EXPECT_EQ("a++", Flavor::pcre().render(tree).pattern());
  EXPECT_EQ("(?>a+)", Flavor::dotnet().render(tree).pattern());
  EXPECT_EQ("(?>a+)", Flavor::legacy_ruby().render(tree).pattern());
}

TEST(FlavorTest, ReportsFailureWithoutThrowing)
{
  Builder b;
  Builder::Index l = b.lookbehind(b.literal("\\$"));
  Tree tree = b.build(b.concat(l, b.literal("\\d+")));
  Rewrite rewrite = Flavor::javascript().apply(tree);
  ASSERT_FALSE(rewrite.ok());
  ASSERT_TRUE(rewrite.error() != NULL);
  EXPECT_EQ(feature_error::lookbehind, rewrite.error()->code());
  EXPECT_EQ(l, rewrite.error()->node());
  EXPECT_EQ("JavaScript", rewrite.error()->flavor());
  EXPECT_THROW(rewrite.tree(), feature_error);
  EXPECT_THROW(Flavor::javascript().render(tree), feature_error);
}

TEST(FlavorTest, SucceedsWithRewrittenTree)
{
  Builder b;
  Tree tree = b.build(b.group(b.unicode(Unicode::uppercase_letter), "initial"));
  Rewrite rewrite = Flavor::legacy_ruby().apply(tree);
  ASSERT_TRUE(rewrite.ok());
  EXPECT_TRUE(rewrite.error() == NULL);
  EXPECT_EQ("([A-Z])", Renderer().render(rewrite.tree()).pattern());
  // the given tree is not modified
  EXPECT_EQ("(\\p{Lu})", Renderer().render(tree).pattern());
}

TEST(FlavorTest, StopsAtFirstFailingRule)
{
  Builder b;
  Builder::Index l = b.lookbehind(b.literal("a"));
  Builder::Index m = b.unicode(Unicode::mark);
  // the lookbehind precedes the mark, but no-unicode is applied before no-lookbehind
  Tree tree = b.build(b.concat(l, m));
  Rewrite rewrite = Flavor::legacy_ruby().apply(tree);
  ASSERT_FALSE(rewrite.ok());
  EXPECT_EQ(feature_error::unicode_class, rewrite.error()->code());
  EXPECT_EQ(m, rewrite.error()->node());
}

TEST(FlavorTest, RejectsPossessiveBeforeAtomic)
{
  Builder b;
  Builder::Index a = b.atomic(b.literal("a|ab"));
  Builder::Index r = b.at_least(b.literal("c"), 0, Node::POSSESSIVE);
  Tree tree = b.build(b.concat(a, r));
  Rewrite rewrite = Flavor::javascript().apply(tree);
  ASSERT_FALSE(rewrite.ok());
  EXPECT_EQ(feature_error::possessive_quantifier, rewrite.error()->code());
  EXPECT_EQ(r, rewrite.error()->node());
  rewrite = Flavor::python().apply(b.build(a));
  ASSERT_FALSE(rewrite.ok());
  EXPECT_EQ(feature_error::atomic_group, rewrite.error()->code());
}

TEST(FlavorTest, RendersIdenticallyWithoutUnicodeConstructs)
{
  Builder b;
  Builder::Index g = b.group(b.alternation(b.literal("[a-z]+"), b.literal("\\d+")), "token");
  Builder::Index ahead = b.lookahead(b.literal("[;,]"), true);
  Tree tree = b.build(b.concat(g, b.concat(ahead, b.backreference(g))));
  Flavor ascii = Flavor("ASCII")
    .with(no_unicode_support());
  Rendered expected = Flavor::standard().render(tree);
  Rendered actual = ascii.render(tree);
  EXPECT_EQ(expected.pattern(), actual.pattern());
  EXPECT_EQ(expected.groups(), actual.groups());
}

TEST(FlavorTest, BuildsFlavorFromSignature)
{
  Flavor full = Flavor::signature("Full", "imsx#=!<>:pdwsDWS+");
  EXPECT_EQ("Full", full.name());
  EXPECT_TRUE(full.rules().empty());
  EXPECT_STREQ("(?<", full.syntax().named);

  Flavor python = Flavor::signature("Python-like", "imsx#=!<P:pdws");
  ASSERT_EQ(2u, python.rules().size());
  EXPECT_EQ(&no_possessive_support(), python.rules()[0]);
  EXPECT_EQ(&no_atomic_support(), python.rules()[1]);
  EXPECT_STREQ("(?P<", python.syntax().named);

  Flavor atomic = Flavor::signature("Atomic", "imsx#=!>:dws");
  ASSERT_EQ(4u, atomic.rules().size());
  EXPECT_EQ(&strip_group_names(), atomic.rules()[0]);
  EXPECT_EQ(&possessive_to_atomic(), atomic.rules()[1]);
  EXPECT_EQ(&no_unicode_support(), atomic.rules()[2]);
  EXPECT_EQ(&no_lookbehind_support(), atomic.rules()[3]);
  EXPECT_TRUE(atomic.syntax().named == NULL);
}

TEST(FlavorTest, BuildsMinimalFlavorFromEmptySignature)
{
  Flavor minimal = Flavor::signature("Minimal", NULL);
  const Flavor::Rules& rules = minimal.rules();
  ASSERT_EQ(5u, rules.size());
  EXPECT_EQ(&strip_group_names(), rules[0]);
  EXPECT_EQ(&no_possessive_support(), rules[1]);
  EXPECT_EQ(&no_atomic_support(), rules[2]);
  EXPECT_EQ(&no_unicode_support(), rules[3]);
  EXPECT_EQ(&no_lookbehind_support(), rules[4]);
}

TEST(FlavorTest, RendersHexEscapesInDialectSyntax)
{
  Builder b;
  Tree tree = b.build(b.unicode(Unicode::line_terminator));
  EXPECT_EQ("(?:\\r\\n?|[\\n\\x0B\\f\\u0085\\u2028\\u2029])", Flavor::dotnet().render(tree).pattern());
  EXPECT_EQ("(?:\\r\\n?|[\\n\\x0B\\f\\u0085\\u2028\\u2029])", Flavor::java6().render(tree).pattern());
  EXPECT_EQ("(?:\\r\\n?|[\\n\\x0B\\f\\x{85}\\x{2028}\\x{2029}])", Flavor::java7().render(tree).pattern());
  EXPECT_EQ("(?:\\r\\n?|[\\n\\x0B\\f\\x{85}\\x{2028}\\x{2029}])", Flavor::pcre().render(tree).pattern());
  Flavor u = Flavor::signature("Hex", "imsx#=!<>:pdwsu+");
  EXPECT_FALSE(u.syntax().braces);
  EXPECT_TRUE(Flavor::signature("Braced", "imsx#=!<>:pdws+").syntax().braces);
}

TEST(FlavorTest, KeepsUnderscoreNamesInGroupMapForJava7)
{
  Builder b;
  Builder::Index first = b.group(b.literal("\\w+"), "first_name");
  Builder::Index last = b.group(b.literal("\\w+"), "lastName");
  Tree tree = b.build(b.concat(first, last, false));
  Rendered r = Flavor::java7().render(tree);
  EXPECT_EQ("(\\w+)(?<lastName>\\w+)", r.pattern());
  EXPECT_EQ(1u, r.index("first_name"));
  EXPECT_EQ(2u, r.index("lastName"));
  EXPECT_EQ("(?<first_name>\\w+)(?<lastName>\\w+)", Flavor::pcre().render(tree).pattern());
}

TEST(FlavorTest, RefusesTemporaryRules)
{
  EXPECT_TRUE((decltype(addable<const Rule&>(0))::value));
  EXPECT_FALSE((decltype(addable<NoUnicodeSupport>(0))::value));
  EXPECT_TRUE((std::is_constructible<Rewriter, const Rule&, std::string>::value));
  EXPECT_FALSE((std::is_constructible<Rewriter, NoUnicodeSupport>::value));
  EXPECT_FALSE((std::is_constructible<Rewriter, NoUnicodeSupport, std::string>::value));
}
