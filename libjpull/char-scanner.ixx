// file      : libjpull/char-scanner.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace jpull
{
  inline char_scanner::
  char_scanner (std::istream& is)
      : line (1), column (1), position (0), is_ (is)
  {
  }

  inline auto char_scanner::
  get () -> xchar
  {
    xchar c (peek ());
    get (c);
    return c;
  }
}
