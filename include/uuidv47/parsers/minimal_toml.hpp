// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of uuidv47, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace uuidv47
{
namespace parsers
{
/// \brief The TOML subset used by uuidv47 configuration files: [tables]
/// (dotted names allowed), key = value pairs with string, integer and
/// boolean values, and # comments.
namespace toml
{

/// \brief Syntax error, reported with the 1-based line it occurred on.
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class table;

using value_type = std::variant<std::monostate, int64_t, bool, std::string, std::shared_ptr<table>>;

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    static_assert(std::is_same_v<T, int64_t> || std::is_same_v<T, bool> ||
                    std::is_same_v<T, std::string>,
                  "unsupported TOML value type");
    if (auto *val = std::get_if<T>(&_value))
    {
      return *val;
    }
    return std::nullopt;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Look up "a.b.c". Returns an empty node if any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      const std::size_t dot = dottedPath.find('.', start);
      const std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
        return node();
      if (dot == std::string::npos)
        return it->second;
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    skipBlank();
    while (!isEnd())
    {
      if (peek() == '[')
      {
        current = ensureTable(root, parseHeader());
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        if (current->contains(key))
          fail("duplicate key '" + key + "'");
        current->insert(key, parseValue());
      }
      endOfLine();
      skipBlank();
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos = 0;
  size_t _line = 1;

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string &message) const { throw ParseError(message, _line); }

  void expect(char c)
  {
    if (peek() != c)
      fail(std::string("expected '") + c + "'");
    advance();
  }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  /// Skip whitespace, newlines and whole-line comments.
  void skipBlank()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  /// Only spaces and an optional comment may follow a value or header.
  void endOfLine()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      fail("unexpected trailing characters");
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::string parseKey()
  {
    std::string key;
    while (isBareKeyChar(peek()))
      key += advance();
    if (key.empty())
      fail("expected key");
    return key;
  }

  std::vector<std::string> parseHeader()
  {
    expect('[');
    std::vector<std::string> parts;
    while (true)
    {
      skipSpaces();
      parts.push_back(parseKey());
      skipSpaces();
      if (peek() == '.')
      {
        advance();
        continue;
      }
      break;
    }
    expect(']');
    return parts;
  }

  node parseValue()
  {
    const char c = peek();
    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return node(parseInteger());
    fail("invalid value");
  }

  std::string parseString()
  {
    const char quote = advance();
    const bool literal = quote == '\'';
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && !literal)
      {
        switch (advance())
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        case '\\':
          str += '\\';
          break;
        case '"':
          str += '"';
          break;
        default:
          fail("unsupported escape sequence");
        }
      }
      else
      {
        str += c;
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean '" + word + "'");
  }

  int64_t parseInteger()
  {
    std::string num;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')
    {
      char c = advance();
      if (c != '_')
        num += c;
    }
    try
    {
      std::size_t used = 0;
      int64_t value = std::stoll(num, &used);
      if (used != num.size())
        fail("invalid integer '" + num + "'");
      return value;
    }
    catch (const std::logic_error &)
    {
      fail("invalid integer '" + num + "'");
    }
  }

  table *ensureTable(table &root, const std::vector<std::string> &parts)
  {
    table *current = &root;
    for (const auto &key : parts)
    {
      if (!current->contains(key))
        current->insert(key, node(std::make_shared<table>()));
      current = (*current)[key].as_table();
      if (!current)
        fail("'" + key + "' is already defined as a value");
    }
    return current;
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

/// \throws std::runtime_error if the file cannot be opened
/// \throws ParseError on syntax errors
inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace uuidv47
