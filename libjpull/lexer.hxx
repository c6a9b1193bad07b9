// file      : libjpull/lexer.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <cstdint>   // uint*_t, int*_t
#include <istream>
#include <optional>
#include <stdexcept> // invalid_argument

#include <libjpull/token.hxx>
#include <libjpull/decimal.hxx>
#include <libjpull/char-scanner.hxx>

#include <libjpull/export.hxx>

namespace jpull
{
  // Source location. The line and column are 1-based while the position is
  // the 0-based character offset.
  //
  struct location
  {
    std::uint64_t line;
    std::uint64_t column;
    std::uint64_t position;
  };

  inline bool
  operator== (const location& x, const location& y)
  {
    return x.line == y.line && x.column == y.column && x.position == y.position;
  }

  inline bool
  operator!= (const location& x, const location& y)
  {
    return !(x == y);
  }

  // Base for all the invalid input exceptions. The what() string is in the
  // <name>:<line>:<column>: error: <description> form with the name part
  // omitted if empty.
  //
  class LIBJPULL_SYMEXPORT invalid_json_input: public std::invalid_argument
  {
  public:
    std::string name;
    std::uint64_t line;
    std::uint64_t column;
    std::uint64_t position;
    std::string description;

    invalid_json_input (std::string name,
                        std::uint64_t line,
                        std::uint64_t column,
                        std::uint64_t position,
                        const std::string& description);

    invalid_json_input (std::string name,
                        const location&,
                        const std::string& description);
  };

  // Malformed raw input: invalid character, escape sequence, number, or
  // literal, unterminated string, etc.
  //
  class LIBJPULL_SYMEXPORT invalid_json_lexeme: public invalid_json_input
  {
  public:
    using invalid_json_input::invalid_json_input;
  };

  // JSON lexer. Converts the character stream into tokens decoding strings
  // and keeping the literal representation of numbers.
  //
  class LIBJPULL_SYMEXPORT lexer: protected char_scanner
  {
  public:
    // The input name is used as the diagnostics prefix.
    //
    explicit
    lexer (std::istream&, const char* input_name = nullptr);

    // Return the next token or token::eof at the end of input (which can be
    // returned repeatedly). Throw invalid_json_lexeme on malformed input.
    //
    token
    next_token ();

    // Return true if there is non-whitespace input remaining.
    //
    bool
    has_next_token ();

    // Decoded value of the most recently returned string token or literal
    // representation of the most recently returned number token.
    //
    const std::string&
    value () const {return value_;}

    // Numeric interpretations of the most recently returned number token.
    //
    // The integral predicate is true if the number has no fraction or
    // exponent or its exact decimal representation has zero scale (so 1.0
    // is not integral but 10e0 is). The int and long values are truncated
    // toward zero and reduced to the corresponding width. None of these
    // fail for a valid number, including one whose exponent does not fit
    // the decimal scale.
    //
    bool
    integral () const;

    std::int32_t
    int_value () const;

    std::int64_t
    long_value () const;

    // Throw invalid_json_lexeme if the exponent does not fit the scale.
    //
    const decimal&
    decimal_value () const;

    // Location of the next character to be read.
    //
    location
    current_location () const {return location {line, column, position};}

    // Location of the last consumed character (start of input if none has
    // been consumed yet).
    //
    location
    last_char_location () const {return last_;}

    // If the underlying stream is file-based, close it. Throw
    // std::ios_base::failure if that fails.
    //
    void
    close ();

    const std::string&
    name () const {return name_;}

  private:
    xchar
    get ();

    void
    get (const xchar&);

    void
    skip_spaces ();

    void
    parse_string ();

    void
    parse_number (const xchar& first);

    void
    parse_literal (const xchar& first, const char* literal);

    std::uint32_t
    parse_hex4 ();

    // Return NULL if the exponent does not fit the scale.
    //
    const decimal*
    exact_value () const;

    [[noreturn]] void
    throw_invalid (const xchar&, const std::string& description) const;

  private:
    const std::string name_;

    std::string value_;
    location value_loc_ {1, 1, 0}; // Start of the last string/number token.
    bool frac_or_exp_ = false;

    mutable std::optional<decimal> decimal_;
    mutable bool unscaled_ = false; // Exponent does not fit the scale.

    location last_ {1, 1, 0};
  };
}

#include <libjpull/lexer.ixx>
