// file      : tests/decimal/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <string>
#include <cstdint>
#include <sstream>
#include <stdexcept> // invalid_argument, out_of_range

#include <libjpull/decimal.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace jpull;

static bool
fail (const char* s)
{
  try
  {
    decimal d (s);
    return false;
  }
  catch (const invalid_argument&)
  {
    return true;
  }
}

static bool
out_of_range_fail (const char* s)
{
  try
  {
    decimal d (s);
    return false;
  }
  catch (const out_of_range&)
  {
    return true;
  }
}

int
main ()
{
  // Representation.
  //
  {
    decimal d ("-12.50e3");
    assert (d.negative && d.digits == "1250" && d.scale == -1);
  }

  assert (decimal ("0") == decimal ());
  assert (decimal ("-0") == decimal ());      // No negative zero.
  assert (decimal ("-0.0").scale == 1 && !decimal ("-0.0").negative);
  assert (decimal (false, "007", 0).digits == "7");
  assert (decimal ("1.0") != decimal ("1.00"));
  assert (decimal ("1E2") == decimal ("1e+2"));

  // String representations.
  //
  assert (decimal ("0").string () == "0");
  assert (decimal ("123").string () == "123");
  assert (decimal ("-1.50").string () == "-1.50");
  assert (decimal ("0.000001").string () == "0.000001");
  assert (decimal ("0.0000001").string () == "1E-7");
  assert (decimal ("1.23e5").string () == "1.23E+5");
  assert (decimal ("12e-1").string () == "1.2");
  assert (decimal ("0.001").plain_string () == "0.001");
  assert (decimal ("1.23e5").plain_string () == "123000");
  assert (decimal ("-4e-3").plain_string () == "-0.004");

  {
    ostringstream os;
    os << decimal ("5e10");
    assert (os.str () == "5E+10");
  }

  // Integer narrowing.
  //
  assert (decimal ("42").wrap64 () == 42);
  assert (decimal ("-42.9").wrap64 () == -42);
  assert (decimal ("0.99").wrap64 () == 0);
  assert (decimal ("1.5e1").wrap64 () == 15);
  assert (decimal ("9223372036854775807").wrap64 () == INT64_MAX);
  assert (decimal ("-9223372036854775808").wrap64 () == INT64_MIN);
  assert (decimal ("9223372036854775808").wrap64 () == INT64_MIN);
  assert (decimal ("18446744073709551616").wrap64 () == 0);
  assert (decimal ("1e100").wrap64 () == 0);
  assert (decimal ("2147483648").wrap32 () == INT32_MIN);
  assert (decimal ("4294967297").wrap32 () == 1);
  assert (decimal ("-1").wrap32 () == -1);

  // Invalid literals.
  //
  assert (fail (""));
  assert (fail ("-"));
  assert (fail ("+1"));
  assert (fail ("01"));
  assert (fail ("1."));
  assert (fail (".5"));
  assert (fail ("1e"));
  assert (fail ("1e+"));
  assert (fail ("1x"));

  assert (out_of_range_fail ("1e9999999999"));
  assert (out_of_range_fail ("1e-2147483649"));
}
