// file      : libjpull/char-scanner.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>  // char_traits
#include <cstdint> // uint64_t
#include <istream>

#include <libjpull/export.hxx>

namespace jpull
{
  // Low-level character stream scanner. Normally used as a base for
  // higher-level lexers.
  //
  class LIBJPULL_SYMEXPORT char_scanner
  {
  public:
    // Windows newlines (0x0D 0x0A) are recognized and converted to just
    // '\n' (0x0A). Note that a standalone 0x0D is treated "as if" it was
    // followed by 0x0A and multiple 0x0D are treated as one.
    //
    explicit
    char_scanner (std::istream&);

    char_scanner (const char_scanner&) = delete;
    char_scanner& operator= (const char_scanner&) = delete;

    // Scanner interface.
    //
  public:

    // Extended character. It includes line/column/position information and
    // is capable of representing EOF.
    //
    // Note that implicit conversion of EOF to char_type results in NUL
    // character (which means in most cases it is safe to compare xchar to
    // char without checking for EOF).
    //
    class xchar
    {
    public:
      using traits_type = std::char_traits<char>;
      using int_type = traits_type::int_type;
      using char_type = traits_type::char_type;

      int_type value;

      std::uint64_t line;
      std::uint64_t column;
      std::uint64_t position; // Zero-based character offset.

      operator char_type () const
      {
        return value != traits_type::eof ()
          ? static_cast<char_type> (value)
          : char_type (0);
      }

      xchar (int_type v = 0,
             std::uint64_t l = 0,
             std::uint64_t c = 0,
             std::uint64_t p = 0)
          : value (v), line (l), column (c), position (p) {}
    };

    xchar
    get ();

    void
    get (const xchar& peeked); // Get previously peeked character (faster).

    xchar
    peek ();

    static bool
    eos (const xchar& c) {return c.value == xchar::traits_type::eof ();}

    // Line, column and position of the next character to be extracted from
    // the stream by peek() or get().
    //
    std::uint64_t line;
    std::uint64_t column;
    std::uint64_t position;

  protected:
    using int_type  = xchar::int_type;
    using char_type = xchar::char_type;

  protected:
    std::istream& is_;

    bool eos_ = false;

    bool unpeek_ = false;
    xchar unpeekc_;
  };
}

#include <libjpull/char-scanner.ixx>
