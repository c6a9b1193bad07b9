// file      : libjpull/token.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <cstdint>
#include <ostream>

#include <libjpull/event.hxx>

namespace jpull
{
  // Lexical token.
  //
  enum class token: std::uint8_t
  {
    curly_open,
    curly_close,
    square_open,
    square_close,
    colon,
    comma,
    string,
    number,
    true_literal,
    false_literal,
    null_literal,
    eof
  };

  // Return true if the token is a scalar value (string, number, or one of
  // the literals).
  //
  inline bool
  value_token (token t) noexcept
  {
    return t >= token::string && t <= token::null_literal;
  }

  // Return the event corresponding to a scalar value token.
  //
  inline event
  token_event (token t) noexcept
  {
    switch (t)
    {
    case token::string:        return event::string;
    case token::number:        return event::number;
    case token::true_literal:  return event::true_value;
    case token::false_literal: return event::false_value;
    default:                   break;
    }

    return event::null;
  }

  inline const char*
  to_string (token t) noexcept
  {
    switch (t)
    {
    case token::curly_open:    return "'{'";
    case token::curly_close:   return "'}'";
    case token::square_open:   return "'['";
    case token::square_close:  return "']'";
    case token::colon:         return "':'";
    case token::comma:         return "','";
    case token::string:        return "string";
    case token::number:        return "number";
    case token::true_literal:  return "true";
    case token::false_literal: return "false";
    case token::null_literal:  return "null";
    case token::eof:           return "end of input";
    }

    return "";
  }

  inline std::ostream&
  operator<< (std::ostream& o, token t)
  {
    return o << to_string (t);
  }
}
