// file      : libjpull/decimal.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <cstdint>  // int32_t, int64_t
#include <utility>  // move()
#include <iosfwd>

#include <libjpull/export.hxx>

namespace jpull
{
  // Exact decimal number represented as an unscaled magnitude (decimal
  // digits without leading zeros) and a scale. The value is:
  //
  // (negative ? -1 : 1) * digits * 10^-scale
  //
  // So, for example, 12.50 is {false, "1250", 2} while 1.2e3 is {false,
  // "12", -2}. Note that the scale is preserved as written (1.0 and 1.00 are
  // different representations of the same value) and that there is no
  // negative zero.
  //
  class LIBJPULL_SYMEXPORT decimal
  {
  public:
    bool negative = false;
    std::string digits = "0";
    std::int32_t scale = 0;

    decimal () = default;

    decimal (bool n, std::string d, std::int32_t s)
        : negative (n), digits (std::move (d)), scale (s)
    {
      normalize ();
    }

    // Parse a JSON number literal. Throw std::invalid_argument if it is not
    // a valid literal and std::out_of_range if the exponent makes the scale
    // unrepresentable.
    //
    explicit
    decimal (const std::string&);

    bool
    zero () const noexcept {return digits == "0";}

    // Return the integral part (truncated toward zero) reduced modulo 2^64
    // and interpreted as a two's complement value, similar to a narrowing
    // integer conversion.
    //
    std::int64_t
    wrap64 () const noexcept;

    std::int32_t
    wrap32 () const noexcept
    {
      return static_cast<std::int32_t> (
        static_cast<std::uint32_t> (static_cast<std::uint64_t> (wrap64 ())));
    }

    // Return the canonical string representation: plain notation if the
    // scale is not negative and the value is not too small, scientific
    // notation (1.23E+5, 4E-8) otherwise.
    //
    std::string
    string () const;

    // Return the plain (non-scientific) string representation. Note that
    // for large exponents this representation can be very long.
    //
    std::string
    plain_string () const;

  private:
    void
    normalize ();
  };

  // Compare representations (that is, 1.0 is not equal to 1.00).
  //
  inline bool
  operator== (const decimal& x, const decimal& y)
  {
    return x.negative == y.negative &&
           x.scale == y.scale       &&
           x.digits == y.digits;
  }

  inline bool
  operator!= (const decimal& x, const decimal& y)
  {
    return !(x == y);
  }

  LIBJPULL_SYMEXPORT std::ostream&
  operator<< (std::ostream&, const decimal&);
}
