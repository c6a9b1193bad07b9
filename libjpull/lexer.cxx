// file      : libjpull/lexer.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libjpull/lexer.hxx>

#include <ios>       // ios_base::failure
#include <fstream>   // filebuf
#include <utility>   // move()
#include <stdexcept> // invalid_argument, out_of_range

using namespace std;

namespace jpull
{
  // invalid_json_input
  //
  static inline string
  format (const string& n, uint64_t l, uint64_t c, const string& d)
  {
    using std::to_string;

    string r;
    if (!n.empty ())
    {
      r += n;
      r += ':';
    }

    r += to_string (l);
    r += ':';
    r += to_string (c);
    r += ": error: ";
    r += d;
    return r;
  }

  invalid_json_input::
  invalid_json_input (string n,
                      uint64_t l,
                      uint64_t c,
                      uint64_t p,
                      const string& d)
      : invalid_argument (format (n, l, c, d)),
        name (move (n)), line (l), column (c), position (p), description (d)
  {
  }

  invalid_json_input::
  invalid_json_input (string n, const location& l, const string& d)
      : invalid_json_input (move (n), l.line, l.column, l.position, d)
  {
  }

  // lexer
  //
  static inline bool
  digit (char c)
  {
    return c >= '0' && c <= '9';
  }

  token lexer::
  next_token ()
  {
    skip_spaces ();

    xchar c (get ());

    if (eos (c))
      return token::eof;

    switch (c)
    {
    case '{': return token::curly_open;
    case '}': return token::curly_close;
    case '[': return token::square_open;
    case ']': return token::square_close;
    case ':': return token::colon;
    case ',': return token::comma;
    case '"':
      {
        value_loc_ = location {c.line, c.column, c.position};
        parse_string ();
        return token::string;
      }
    case 't': parse_literal (c, "true");  return token::true_literal;
    case 'f': parse_literal (c, "false"); return token::false_literal;
    case 'n': parse_literal (c, "null");  return token::null_literal;
    case '-':
    case '0': case '1': case '2': case '3': case '4':
    case '5': case '6': case '7': case '8': case '9':
      {
        value_loc_ = location {c.line, c.column, c.position};
        parse_number (c);
        return token::number;
      }
    }

    string d ("invalid character ");

    char ch (c);
    unsigned int u (static_cast<unsigned char> (ch));
    if (u < 0x20)
    {
      d += "code ";
      d += std::to_string (u);
    }
    else
    {
      d += '\'';
      d += ch;
      d += '\'';
    }

    throw_invalid (c, d);
  }

  void lexer::
  skip_spaces ()
  {
    for (xchar c (peek ()); !eos (c); c = peek ())
    {
      switch (c)
      {
      case ' ':
      case '\t':
      case '\n':
      case '\r':
        get (c);
        continue;
      }

      break;
    }
  }

  // Append the UTF-8 representation of a codepoint.
  //
  static void
  utf8 (string& s, uint32_t cp)
  {
    if (cp < 0x80)
      s += static_cast<char> (cp);
    else if (cp < 0x800)
    {
      s += static_cast<char> (0xC0 | (cp >> 6));
      s += static_cast<char> (0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
      s += static_cast<char> (0xE0 | (cp >> 12));
      s += static_cast<char> (0x80 | ((cp >> 6) & 0x3F));
      s += static_cast<char> (0x80 | (cp & 0x3F));
    }
    else
    {
      s += static_cast<char> (0xF0 | (cp >> 18));
      s += static_cast<char> (0x80 | ((cp >> 12) & 0x3F));
      s += static_cast<char> (0x80 | ((cp >> 6) & 0x3F));
      s += static_cast<char> (0x80 | (cp & 0x3F));
    }
  }

  void lexer::
  parse_string ()
  {
    value_.clear ();
    frac_or_exp_ = false;
    decimal_ = nullopt;
    unscaled_ = false;

    for (;;)
    {
      xchar c (get ());

      if (eos (c))
        throw_invalid (c, "unterminated string");

      if (c == '"')
        break;

      if (c == '\\')
      {
        xchar e (get ());

        switch (e)
        {
        case '"':  value_ += '"';  break;
        case '\\': value_ += '\\'; break;
        case '/':  value_ += '/';  break;
        case 'b':  value_ += '\b'; break;
        case 'f':  value_ += '\f'; break;
        case 'n':  value_ += '\n'; break;
        case 'r':  value_ += '\r'; break;
        case 't':  value_ += '\t'; break;
        case 'u':
          {
            uint32_t cp (parse_hex4 ());

            if (cp >= 0xDC00 && cp <= 0xDFFF)
              throw_invalid (e, "unpaired low surrogate in \\u escape "
                             "sequence");

            // High surrogate must be followed by an escaped low surrogate.
            //
            if (cp >= 0xD800 && cp <= 0xDBFF)
            {
              xchar b (get ());
              if (b != '\\' || get () != 'u')
                throw_invalid (b, "unpaired high surrogate in \\u escape "
                               "sequence");

              uint32_t lo (parse_hex4 ());
              if (lo < 0xDC00 || lo > 0xDFFF)
                throw_invalid (b, "invalid low surrogate in \\u escape "
                               "sequence");

              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            }

            utf8 (value_, cp);
            break;
          }
        default:
          {
            if (eos (e))
              throw_invalid (e, "unterminated string");

            throw_invalid (e, string ("invalid escape sequence '\\") +
                           static_cast<char> (e) + '\'');
          }
        }

        continue;
      }

      // Note that CR is delivered to us as newline which is a control
      // character as well.
      //
      if (static_cast<unsigned char> (static_cast<char> (c)) < 0x20)
        throw_invalid (c, "unescaped control character in string");

      value_ += c;
    }
  }

  uint32_t lexer::
  parse_hex4 ()
  {
    uint32_t r (0);

    for (size_t i (0); i != 4; ++i)
    {
      xchar c (get ());
      char h (c);

      uint32_t v;
      if (h >= '0' && h <= '9')      v = static_cast<uint32_t> (h - '0');
      else if (h >= 'a' && h <= 'f') v = static_cast<uint32_t> (h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v = static_cast<uint32_t> (h - 'A' + 10);
      else
        throw_invalid (c, "invalid \\u escape sequence");

      r = (r << 4) | v;
    }

    return r;
  }

  void lexer::
  parse_number (const xchar& first)
  {
    value_.assign (1, first);
    frac_or_exp_ = false;
    decimal_ = nullopt;
    unscaled_ = false;

    // Append a run of digits returning how many were appended.
    //
    auto digits = [this] () -> size_t
    {
      size_t n (0);
      for (xchar c (peek ()); !eos (c) && digit (c); c = peek ())
      {
        get (c);
        value_ += c;
        ++n;
      }
      return n;
    };

    // Integer part: a single zero or a non-zero digit followed by digits.
    //
    if (first == '-')
    {
      xchar c (peek ());

      if (eos (c) || !digit (c))
        throw_invalid (c, "expected digit after '-' in number");

      get (c);
      value_ += c;

      if (c != '0')
        digits ();
    }
    else if (first != '0')
      digits ();

    xchar c (peek ());

    if (c == '.')
    {
      get (c);
      value_ += c;
      frac_or_exp_ = true;

      if (digits () == 0)
        throw_invalid (peek (), "expected digit after '.' in number");

      c = peek ();
    }

    if (c == 'e' || c == 'E')
    {
      get (c);
      value_ += c;
      frac_or_exp_ = true;

      c = peek ();
      if (c == '+' || c == '-')
      {
        get (c);
        value_ += c;
      }

      if (digits () == 0)
        throw_invalid (peek (), "expected digit in number exponent");
    }
  }

  void lexer::
  parse_literal (const xchar& first, const char* l)
  {
    // The first character has already been matched.
    //
    for (const char* p (l + 1); *p != '\0'; ++p)
    {
      xchar c (peek ());

      if (eos (c) || c != *p)
        throw_invalid (eos (c) ? c : first,
                       string ("invalid literal, expected '") + l + '\'');

      get (c);
    }
  }

  // Return the integral part of a number literal whose scale (the number
  // of fraction digits minus the exponent) is outside the int32_t range,
  // reduced modulo 2^64.
  //
  // With such a negative scale the value is a multiple of 10^64 and
  // therefore of 2^64. With such a positive scale only the leading digits
  // that are not shifted out remain.
  //
  static int64_t
  wrap_unscaled (const string& s)
  {
    size_t n (s.size ()), i (0);

    bool neg (s[i] == '-');
    if (neg)
      ++i;

    // Significant digits (integral and fraction).
    //
    string ds;
    int64_t fn (0);

    for (; i != n && digit (s[i]); ++i)
      ds += s[i];

    if (i != n && s[i] == '.')
    {
      for (++i; i != n && digit (s[i]); ++i, ++fn)
        ds += s[i];
    }

    // Exponent (saturated).
    //
    int64_t e (0);
    if (i != n)
    {
      bool en (false);
      if (s[++i] == '+' || s[i] == '-')
        en = (s[i++] == '-');

      for (; i != n; ++i)
      {
        if (e < (int64_t (1) << 40))
          e = e * 10 + (s[i] - '0');
      }

      if (en)
        e = -e;
    }

    int64_t sc (fn - e);
    if (sc <= 0 || static_cast<uint64_t> (sc) >= ds.size ())
      return 0;

    uint64_t r (0);
    for (size_t j (0), m (ds.size () - static_cast<size_t> (sc)); j != m; ++j)
      r = r * 10 + static_cast<uint64_t> (ds[j] - '0');

    return static_cast<int64_t> (neg ? 0 - r : r);
  }

  int64_t lexer::
  long_value () const
  {
    // Fast path for integers that are guaranteed to fit.
    //
    if (!frac_or_exp_ && value_.size () < 19)
    {
      bool n (value_[0] == '-');
      int64_t r (0);

      for (size_t i (n ? 1 : 0); i != value_.size (); ++i)
        r = r * 10 + (value_[i] - '0');

      return n ? -r : r;
    }

    if (const decimal* d = exact_value ())
      return d->wrap64 ();

    return wrap_unscaled (value_);
  }

  const decimal* lexer::
  exact_value () const
  {
    if (!decimal_ && !unscaled_)
    {
      try
      {
        decimal_ = decimal (value_);
      }
      catch (const invalid_argument& e)
      {
        throw invalid_json_lexeme (name_, value_loc_, e.what ());
      }
      catch (const out_of_range&)
      {
        unscaled_ = true; // Diagnosed by decimal_value().
      }
    }

    return decimal_ ? &*decimal_ : nullptr;
  }

  const decimal& lexer::
  decimal_value () const
  {
    if (const decimal* d = exact_value ())
      return *d;

    throw invalid_json_lexeme (name_,
                               value_loc_,
                               "exponent out of range in number '" +
                               value_ + '\'');
  }

  void lexer::
  close ()
  {
    if (filebuf* b = dynamic_cast<filebuf*> (is_.rdbuf ()))
    {
      if (b->is_open () && b->close () == nullptr)
        throw ios_base::failure ("unable to close input");
    }
  }

  void lexer::
  throw_invalid (const xchar& c, const string& d) const
  {
    throw invalid_json_lexeme (name_,
                               c.line, c.column, c.position,
                               d);
  }
}
