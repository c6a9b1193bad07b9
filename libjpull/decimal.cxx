// file      : libjpull/decimal.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libjpull/decimal.hxx>

#include <limits>
#include <ostream>
#include <stdexcept> // invalid_argument, out_of_range

using namespace std;

namespace jpull
{
  static inline bool
  digit (char c)
  {
    return c >= '0' && c <= '9';
  }

  decimal::
  decimal (const std::string& s)
  {
    size_t n (s.size ()), i (0);

    auto invalid = [&s] ()
    {
      throw invalid_argument ("invalid number '" + s + '\'');
    };

    negative = (i != n && s[i] == '-');
    if (negative)
      ++i;

    // Integer part: either a single zero or a non-zero digit followed by
    // any number of digits.
    //
    size_t b (i);
    if (i == n || !digit (s[i]))
      invalid ();

    if (s[i++] != '0')
      for (; i != n && digit (s[i]); ++i) ;

    digits.assign (s, b, i - b);

    // Fraction.
    //
    int64_t fn (0);
    if (i != n && s[i] == '.')
    {
      b = ++i;
      for (; i != n && digit (s[i]); ++i) ;

      if (i == b)
        invalid ();

      digits.append (s, b, i - b);
      fn = static_cast<int64_t> (i - b);
    }

    // Exponent. We only need to keep accumulating while the result can
    // still end up in the int32_t range.
    //
    int64_t e (0);
    if (i != n && (s[i] == 'e' || s[i] == 'E'))
    {
      bool en (false);
      if (++i != n && (s[i] == '+' || s[i] == '-'))
        en = (s[i++] == '-');

      b = i;
      for (; i != n && digit (s[i]); ++i)
      {
        if (e < (int64_t (1) << 40))
          e = e * 10 + (s[i] - '0');
      }

      if (i == b)
        invalid ();

      if (en)
        e = -e;
    }

    if (i != n)
      invalid ();

    int64_t sc (fn - e);
    if (sc < numeric_limits<int32_t>::min () ||
        sc > numeric_limits<int32_t>::max ())
      throw out_of_range ("exponent out of range in number '" + s + '\'');

    scale = static_cast<int32_t> (sc);
    normalize ();
  }

  void decimal::
  normalize ()
  {
    size_t p (digits.find_first_not_of ('0'));

    if (p == std::string::npos)
    {
      digits = "0";
      negative = false;
    }
    else if (p != 0)
      digits.erase (0, p);
  }

  int64_t decimal::
  wrap64 () const noexcept
  {
    // Number of digits in the integral part (which may need to be followed
    // by -scale zeros).
    //
    size_t n (digits.size ());
    uint64_t r (0);

    if (scale > 0)
    {
      if (n <= static_cast<size_t> (scale))
        return 0;

      n -= static_cast<size_t> (scale);
    }

    for (size_t i (0); i != n; ++i)
      r = r * 10 + static_cast<uint64_t> (digits[i] - '0');

    // Since 10^64 is divisible by 2^64, there is no need to multiply any
    // further than that.
    //
    if (scale < 0)
    {
      for (int64_t z (-static_cast<int64_t> (scale)), i (0);
           i != z && i != 64 && r != 0;
           ++i)
        r *= 10;
    }

    if (negative)
      r = 0 - r;

    return static_cast<int64_t> (r);
  }

  std::string decimal::
  string () const
  {
    // Adjusted exponent, that is, the exponent of the value if it were
    // written with a single digit before the decimal point.
    //
    int64_t a (static_cast<int64_t> (digits.size ()) - 1 - scale);

    if (scale >= 0 && a >= -6)
      return plain_string ();

    std::string r;

    if (negative)
      r += '-';

    r += digits[0];

    if (digits.size () > 1)
    {
      r += '.';
      r.append (digits, 1, std::string::npos);
    }

    r += 'E';
    if (a >= 0)
      r += '+';
    r += std::to_string (a);

    return r;
  }

  std::string decimal::
  plain_string () const
  {
    std::string r;

    if (negative)
      r += '-';

    if (scale <= 0)
    {
      r += digits;

      if (!zero ())
        r.append (static_cast<size_t> (-static_cast<int64_t> (scale)), '0');
    }
    else
    {
      size_t s (static_cast<size_t> (scale));

      if (digits.size () <= s)
      {
        r += "0.";
        r.append (s - digits.size (), '0');
        r += digits;
      }
      else
      {
        r.append (digits, 0, digits.size () - s);
        r += '.';
        r.append (digits, digits.size () - s, std::string::npos);
      }
    }

    return r;
  }

  ostream&
  operator<< (ostream& o, const decimal& d)
  {
    return o << d.string ();
  }
}
