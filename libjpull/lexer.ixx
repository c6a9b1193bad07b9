// file      : libjpull/lexer.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace jpull
{
  inline lexer::
  lexer (std::istream& is, const char* n)
      : char_scanner (is),
        name_ (n != nullptr ? n : "")
  {
  }

  inline auto lexer::
  get () -> xchar
  {
    xchar c (char_scanner::get ());

    if (!eos (c))
      last_ = location {c.line, c.column, c.position};

    return c;
  }

  inline void lexer::
  get (const xchar& c)
  {
    char_scanner::get (c);

    if (!eos (c))
      last_ = location {c.line, c.column, c.position};
  }

  inline bool lexer::
  has_next_token ()
  {
    skip_spaces ();
    return !eos (peek ());
  }

  inline bool lexer::
  integral () const
  {
    // If the scale is not representable, then it is not zero either.
    //
    if (!frac_or_exp_)
      return true;

    const decimal* d (exact_value ());
    return d != nullptr && d->scale == 0;
  }

  inline std::int32_t lexer::
  int_value () const
  {
    return static_cast<std::int32_t> (
      static_cast<std::uint32_t> (static_cast<std::uint64_t> (long_value ())));
  }
}
