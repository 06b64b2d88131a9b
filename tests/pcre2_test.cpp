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
@file      pcre2_test.cpp
@brief     tests of rendered patterns compiled by PCRE2
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/flavor.h>
#include <pcre2.h>
#include <gtest/gtest.h>

using namespace recompose;

namespace {

// compiled PCRE2 pattern
class Compiled {
 public:
  explicit Compiled(const std::string& pattern)
    :
      opc_(NULL),
      dat_(NULL)
  {
    int err;
    PCRE2_SIZE pos;
    opc_ = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.c_str()), static_cast<PCRE2_SIZE>(pattern.size()), PCRE2_UTF, &err, &pos, NULL);
    if (opc_ == NULL)
    {
      PCRE2_UCHAR message[120];
      pcre2_get_error_message(err, message, sizeof(message));
      error_.assign(reinterpret_cast<char*>(message)).append(" at ").append(ztoa(pos));
    }
    else
    {
      dat_ = pcre2_match_data_create_from_pattern(opc_, NULL);
    }
  }
  ~Compiled()
  {
    if (dat_ != NULL)
      pcre2_match_data_free(dat_);
    if (opc_ != NULL)
      pcre2_code_free(opc_);
  }
  bool ok() const
  {
    return opc_ != NULL;
  }
  const std::string& error() const
  {
    return error_;
  }
  uint32_t captures() const
  {
    uint32_t count = 0;
    (void)pcre2_pattern_info(opc_, PCRE2_INFO_CAPTURECOUNT, &count);
    return count;
  }
  /// Returns the name table as a group map.
  Rendered::Groups names() const
  {
    Rendered::Groups groups;
    uint32_t name_count = 0;
    PCRE2_SPTR name_table = NULL;
    uint32_t name_entry_size = 0;
    (void)pcre2_pattern_info(opc_, PCRE2_INFO_NAMECOUNT, &name_count);
    (void)pcre2_pattern_info(opc_, PCRE2_INFO_NAMETABLE, &name_table);
    (void)pcre2_pattern_info(opc_, PCRE2_INFO_NAMEENTRYSIZE, &name_entry_size);
    for (uint32_t i = 0; name_table != NULL && i < name_count; ++i)
    {
      PCRE2_SPTR p = name_table + i * name_entry_size;
      size_t n = static_cast<size_t>(static_cast<uint8_t>(p[0]) << 8) | static_cast<uint8_t>(p[1]);
      groups[reinterpret_cast<const char*>(p + 2)] = n;
    }
    return groups;
  }
  /// Returns the text captured by group n of a match of subject or "" when the group did not participate.
  std::string match(const std::string& subject, size_t n) const
  {
    int rc = pcre2_match(opc_, reinterpret_cast<PCRE2_SPTR>(subject.c_str()), subject.size(), 0, 0, dat_, NULL);
    if (rc < 0 || static_cast<size_t>(rc) <= n)
      return "";
    PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(dat_);
    if (ovector[2*n] == PCRE2_UNSET)
      return "";
    return subject.substr(ovector[2*n], ovector[2*n + 1] - ovector[2*n]);
  }
 private:
  pcre2_code       *opc_;
  pcre2_match_data *dat_;
  std::string       error_;
};

// a key and its value, both named
Tree pair(Builder& b)
{
  Builder::Index key = b.group(b.at_least(b.unicode(Unicode::letter), 1), "key");
  Builder::Index value = b.group(b.alternation(b.group(b.literal("\\d+"), "number"), b.group(b.literal("\\w+"))), "value");
  Builder::Index end = b.repeat(b.unicode(Unicode::line_terminator), 0, 1);
  std::vector<Builder::Index> parts;
  parts.push_back(key);
  parts.push_back(b.literal("="));
  parts.push_back(value);
  parts.push_back(b.lookahead(b.backreference(key), true));
  parts.push_back(end);
  return b.build(b.concat(parts));
}

} // namespace

TEST(PCRE2Test, AgreesOnCapturesAndNames)
{
  Builder b;
  Tree tree = pair(b);
  const Flavor *flavors[] = { &Flavor::pcre(), &Flavor::python() };
  for (size_t i = 0; i < sizeof(flavors)/sizeof(*flavors); ++i)
  {
    Rendered r = flavors[i]->render(tree);
    Compiled c(r.pattern());
    ASSERT_TRUE(c.ok()) << r.pattern() << ": " << c.error();
    EXPECT_EQ(r.captures(), c.captures()) << r.pattern();
    EXPECT_EQ(r.groups(), c.names()) << r.pattern();
  }
}

TEST(PCRE2Test, CapturesByRenderedIndex)
{
  Builder b;
  Rendered r = Flavor::pcre().render(pair(b));
  Compiled c(r.pattern());
  ASSERT_TRUE(c.ok()) << c.error();
  std::string subject("size=42\n");
  EXPECT_EQ("size", c.match(subject, r.index("key")));
  EXPECT_EQ("42", c.match(subject, r.index("value")));
  EXPECT_EQ("42", c.match(subject, r.index("number")));
}

TEST(PCRE2Test, CompilesEveryPredefinedFlavor)
{
  Builder b;
  Builder::Index g = b.group(b.literal("[a-z]"), "letter");
  Builder::Index r = b.repeat(b.noncapturing(b.concat(b.literal("x"), b.backreference(g))), 1, 3, Node::POSSESSIVE);
  Tree tree = b.build(b.concat(g, r));
  std::vector<std::string> names = Flavor::names();
  for (std::vector<std::string>::const_iterator name = names.begin(); name != names.end(); ++name)
  {
    Rewrite rewrite = Flavor::find(*name)->apply(tree);
    if (!rewrite.ok())
      continue;
    Rendered rendered = Renderer(Flavor::find(*name)->syntax()).render(rewrite.tree());
    Compiled c(rendered.pattern());
    ASSERT_TRUE(c.ok()) << *name << ": " << rendered.pattern() << ": " << c.error();
    EXPECT_EQ(1u, c.captures()) << *name;
    EXPECT_EQ("axa", c.match("axa", 0)) << *name;
  }
}
