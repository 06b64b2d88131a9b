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
@file      renderer.cpp
@brief     recompose renderer of trees to pattern strings with group index maps
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/renderer.h>
#include <recompose/debug.h>
#include <cctype>
#include <cstring>

namespace recompose {

////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Atomic unit scanning                                                      //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

// escapes with a {...} argument, e.g. \p{L} and \x{2028}
static const char regex_braced[] = "pPxgkNou";

// length of the UTF-8 sequence with lead byte c
inline size_t utf8_length(int c)
{
  c &= 0xff;
  if (c < 0xc0)
    return 1;
  if (c < 0xe0)
    return 2;
  if (c < 0xf0)
    return 3;
  return 4;
}

// end of the escape sequence at pos, after the backslash
static size_t escape_end(const std::string& regex, size_t pos)
{
  size_t len = regex.size();
  if (pos >= len)
    return len + 1;
  int c = regex[pos];
  if (c != '\0' && std::strchr(regex_braced, c) != NULL && pos + 1 < len && regex[pos + 1] == '{')
  {
    size_t k = regex.find('}', pos + 2);
    return k == std::string::npos ? len + 1 : k + 1;
  }
  if (c == 'k' && pos + 1 < len && regex[pos + 1] == '<')
  {
    size_t k = regex.find('>', pos + 2);
    return k == std::string::npos ? len + 1 : k + 1;
  }
  if (c == 'x')
  {
    size_t k = pos + 1;
    while (k < len && k < pos + 3 && std::isxdigit(static_cast<unsigned char>(regex[k])))
      ++k;
    return k;
  }
  if (c >= '1' && c <= '9')
  {
    size_t k = pos + 1;
    while (k < len && std::isdigit(static_cast<unsigned char>(regex[k])))
      ++k;
    return k;
  }
  if (c == 'c' || c == 'p' || c == 'P')
    return pos + 2;
  return pos + utf8_length(c);
}

// end of the bracket list at pos, after the [
static size_t bracket_end(const std::string& regex, size_t pos)
{
  size_t len = regex.size();
  if (pos < len && regex[pos] == '^')
    ++pos;
  if (pos < len && regex[pos] == ']')
    ++pos;
  while (pos < len)
  {
    int c = regex[pos];
    if (c == '\\')
    {
      pos = escape_end(regex, pos + 1);
    }
    else if (c == '[' && pos + 1 < len && (regex[pos + 1] == ':' || regex[pos + 1] == '.' || regex[pos + 1] == '='))
    {
      // POSIX [:alpha:], collating [.a.] and equivalence [=a=] classes
      char delim[3] = { regex[pos + 1], ']', '\0' };
      size_t k = regex.find(delim, pos + 2);
      if (k == std::string::npos)
        return len + 1;
      pos = k + 2;
    }
    else if (c == ']')
    {
      return pos + 1;
    }
    else
    {
      ++pos;
    }
  }
  return len + 1;
}

// end of the parenthesized group at pos, after the (
static size_t group_end(const std::string& regex, size_t pos)
{
  size_t len = regex.size();
  size_t level = 1;
  while (pos < len)
  {
    int c = regex[pos];
    if (c == '\\')
    {
      pos = escape_end(regex, pos + 1);
    }
    else if (c == '[')
    {
      pos = bracket_end(regex, pos + 1);
    }
    else
    {
      if (c == '(')
        ++level;
      else if (c == ')' && --level == 0)
        return pos + 1;
      ++pos;
    }
  }
  return len + 1;
}

bool atomic_unit(const std::string& regex)
{
  if (regex.empty())
    return false;
  size_t end;
  int c = regex[0];
  switch (c)
  {
    case '\\':
      end = escape_end(regex, 1);
      break;
    case '[':
      end = bracket_end(regex, 1);
      break;
    case '(':
      end = group_end(regex, 1);
      break;
    case '|':
    case ')':
    case '*':
    case '+':
    case '?':
    case '{':
    case '^':
    case '$':
      return false;
    default:
      end = utf8_length(c);
  }
  return end == regex.size();
}

////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Quantifiers                                                               //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

std::string quantifier(size_t min, size_t max, Node::Mode mode)
{
  std::string q;
  if (min == 0 && max == 1)
    q.push_back('?');
  else if (min == 0 && max == Node::UNBOUNDED)
    q.push_back('*');
  else if (min == 1 && max == Node::UNBOUNDED)
    q.push_back('+');
  else if (min == max)
    q.append("{").append(ztoa(min)).append("}");
  else if (max == Node::UNBOUNDED)
    q.append("{").append(ztoa(min)).append(",}");
  else
    q.append("{").append(ztoa(min)).append(",").append(ztoa(max)).append("}");
  if (mode == Node::RELUCTANT)
    q.push_back('?');
  else if (mode == Node::POSSESSIVE)
    q.push_back('+');
  return q;
}

////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Hex escapes                                                               //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

// convert each \x{H..H} of at most four hex digits to \uHHHH
static std::string unbraced_hex(const std::string& regex)
{
  static const char xdigits[] = "0123456789ABCDEF";
  std::string out;
  size_t len = regex.size();
  size_t pos = 0;
  while (pos < len)
  {
    if (regex[pos] != '\\' || pos + 1 >= len)
    {
      out.push_back(regex[pos++]);
      continue;
    }
    if (regex[pos + 1] == 'x' && pos + 2 < len && regex[pos + 2] == '{')
    {
      size_t end = regex.find('}', pos + 3);
      size_t digits = end == std::string::npos ? 0 : end - pos - 3;
      if (digits > 0 && digits <= 4)
      {
        unsigned long wc = 0;
        size_t k;
        for (k = pos + 3; k < end && std::isxdigit(static_cast<unsigned char>(regex[k])); ++k)
          wc = 16 * wc + (std::isdigit(static_cast<unsigned char>(regex[k])) ? regex[k] - '0' : (std::toupper(static_cast<unsigned char>(regex[k])) - 'A' + 10));
        if (k == end)
        {
          out.append("\\u");
          for (int shift = 12; shift >= 0; shift -= 4)
            out.push_back(xdigits[(wc >> shift) & 0xf]);
          pos = end + 1;
          continue;
        }
      }
    }
    // copy the escape as is, including an escaped backslash
    out.push_back(regex[pos++]);
    out.push_back(regex[pos++]);
  }
  return out;
}

////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Renderer                                                                  //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

Rendered Renderer::render(const Tree& tree) const
{
  Rendered out;
  if (tree.empty())
    return out;
  Numbers numbers;
  out.pattern_ = render(tree, tree.root(), numbers, out);
  DBGLOG("Renderer::render() %s groups=%zu", out.pattern_.c_str(), out.captures_);
  return out;
}

std::string Renderer::render(const Tree& tree, Index i, Numbers& numbers, Rendered& out) const
{
  const Node& node = tree[i];
  std::string regex;
  switch (node.kind)
  {
    case Node::LITERAL:
      regex = node.text;
      break;
    case Node::CONCAT:
      for (std::vector<Index>::const_iterator j = node.sub.begin(); j != node.sub.end(); ++j)
      {
        if (node.protect)
          regex.append("(?:").append(render(tree, *j, numbers, out)).push_back(')');
        else
          regex.append(render(tree, *j, numbers, out));
      }
      break;
    case Node::ALTERNATION:
      for (std::vector<Index>::const_iterator j = node.sub.begin(); j != node.sub.end(); ++j)
      {
        if (j != node.sub.begin())
          regex.push_back('|');
        std::string alternative = render(tree, *j, numbers, out);
        if (atomic_unit(alternative))
          regex.append(alternative);
        else
          regex.append("(?:").append(alternative).push_back(')');
      }
      break;
    case Node::REPEAT:
      regex = render(tree, node.sub[0], numbers, out);
      if (!atomic_unit(regex))
        regex.insert(0, "(?:").push_back(')');
      regex.append(quantifier(node.min, node.max, node.mode));
      break;
    case Node::GROUP:
    {
      // number the group before its subgroups, by its opening parenthesis
      size_t n = ++out.captures_;
      numbers[i] = n;
      if (node.named)
        out.groups_[node.text] = n;
      if (node.named && syntax_.inline_name(node.text))
        regex.append(syntax_.named).append(node.text).push_back('>');
      else
        regex.push_back('(');
      regex.append(render(tree, node.sub[0], numbers, out)).push_back(')');
      break;
    }
    case Node::NONCAPTURING:
      regex.append("(?:").append(render(tree, node.sub[0], numbers, out)).push_back(')');
      break;
    case Node::ATOMIC:
      regex.append("(?>").append(render(tree, node.sub[0], numbers, out)).push_back(')');
      break;
    case Node::LOOKAROUND:
      if (node.direction == Node::AHEAD)
        regex.assign(node.negated ? "(?!" : "(?=");
      else
        regex.assign(node.negated ? "(?<!" : "(?<=");
      regex.append(render(tree, node.sub[0], numbers, out)).push_back(')');
      break;
    case Node::BACKREFERENCE:
    {
      Numbers::const_iterator n = numbers.find(node.target);
      if (n == numbers.end())
        throw tree_error(tree_error::unresolved_backreference, i);
      regex.assign("\\").append(ztoa(n->second));
      break;
    }
    case Node::UCLASS:
    {
      const Unicode::Class *cls = Unicode::lookup(node.category);
      if (cls == NULL || (node.ascii && cls->ascii == NULL))
        throw tree_error(tree_error::invalid_category, i);
      regex.assign(node.ascii ? cls->ascii : cls->unicode);
      if (!syntax_.braces)
        regex = unbraced_hex(regex);
      break;
    }
  }
  return regex;
}

} // namespace recompose
