// file      : libjpull/char-scanner.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libjpull/char-scanner.hxx>

using namespace std;

namespace jpull
{
  auto char_scanner::
  peek () -> xchar
  {
    if (unpeek_)
      return unpeekc_;

    if (eos_)
      return xchar (xchar::traits_type::eof (), line, column, position);

    int_type v (is_.peek ());

    if (v == xchar::traits_type::eof ())
      eos_ = true;
    else if (v == '\r')
    {
      // Swallow the whole run of '\r' and, if it is not followed by '\n',
      // make sure subsequent calls to peek() return newline. Note that the
      // swallowed characters still count towards the position.
      //
      int_type v1;
      do
      {
        is_.get ();
        ++position;
        v1 = is_.peek ();
      }
      while (v1 == '\r');

      if (v1 != '\n')
      {
        unpeek_ = true;
        unpeekc_ = xchar ('\n', line, column, position - 1);

        if (v1 == xchar::traits_type::eof ())
          eos_ = true;

        return unpeekc_;
      }

      v = '\n';
    }

    return xchar (v, line, column, position);
  }

  void char_scanner::
  get (const xchar& c)
  {
    if (unpeek_)
    {
      unpeek_ = false;
    }
    // When is_.get () returns eof, the failbit is also set (stupid, isn't?)
    // which may trigger an exception. To work around this we will call
    // peek() first and only call get() if it is not eof. But we can only
    // call peek() on eof once; any subsequent calls will spoil the failbit
    // (even more stupid).
    //
    else if (!eos (c))
    {
      is_.get ();
      ++position;
    }

    if (!eos (c))
    {
      if (c == '\n')
      {
        line++;
        column = 1;
      }
      else
        column++;
    }
  }
}
