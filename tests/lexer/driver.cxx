// file      : tests/lexer/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <string>
#include <vector>
#include <cstdint>
#include <sstream>
#include <fstream>
#include <iostream>

#include <libjpull/lexer.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace jpull;

using tokens = vector<token>;

static tokens
lex (const string& s)
{
  istringstream is (s);
  lexer l (is, "test");

  tokens r;
  for (token t (l.next_token ()); t != token::eof; t = l.next_token ())
    r.push_back (t);

  return r;
}

// Return the decoded value of the single string or number token.
//
static string
value (const string& s)
{
  istringstream is (s);
  lexer l (is);

  token t (l.next_token ());
  assert (t == token::string || t == token::number);
  assert (l.next_token () == token::eof);

  return l.value ();
}

// Return true if lexing fails at the specified line and column.
//
static bool
fail (const string& s, uint64_t line = 0, uint64_t column = 0)
{
  istringstream is (s);
  lexer l (is, "test");

  try
  {
    while (l.next_token () != token::eof) ;
    return false;
  }
  catch (const invalid_json_lexeme& e)
  {
    if (line != 0 && (e.line != line || e.column != column))
    {
      cerr << e.what () << endl;
      return false;
    }

    return true;
  }
}

int
main ()
{
  // Structural tokens and whitespaces.
  //
  assert (lex ("").empty ());
  assert (lex (" \t\r\n ").empty ());
  assert (lex ("{}[]:,") == tokens ({token::curly_open,
                                     token::curly_close,
                                     token::square_open,
                                     token::square_close,
                                     token::colon,
                                     token::comma}));

  assert (lex (" { \"a\" : [ 1 , true , false , null ] } ") ==
          tokens ({token::curly_open,
                   token::string,
                   token::colon,
                   token::square_open,
                   token::number,
                   token::comma,
                   token::true_literal,
                   token::comma,
                   token::false_literal,
                   token::comma,
                   token::null_literal,
                   token::square_close,
                   token::curly_close}));

  // Leading zero is a separate number.
  //
  assert (lex ("01") == tokens ({token::number, token::number}));

  // Eof is returned repeatedly.
  //
  {
    istringstream is ("1");
    lexer l (is);
    assert (l.has_next_token ());
    assert (l.next_token () == token::number);
    assert (!l.has_next_token ());
    assert (l.next_token () == token::eof);
    assert (l.next_token () == token::eof);
  }

  // Strings.
  //
  assert (value ("\"\"") == "");
  assert (value ("\"abc\"") == "abc");
  assert (value ("\"a\\\"b\\\\c\\/d\"") == "a\"b\\c/d");
  assert (value ("\"\\b\\f\\n\\r\\t\"") == "\b\f\n\r\t");
  assert (value ("\"\\u0041\\u00e9\"") == "A\xC3\xA9");
  assert (value ("\"\\u20AC\"") == "\xE2\x82\xAC");
  assert (value ("\"\\uD83D\\uDE00\"") == "\xF0\x9F\x98\x80");
  assert (value ("\"\xC3\xA9\"") == "\xC3\xA9"); // Raw UTF-8 passed through.

  // Numbers (literal representation).
  //
  assert (value ("0") == "0");
  assert (value ("-0") == "-0");
  assert (value ("123") == "123");
  assert (value ("-1.5") == "-1.5");
  assert (value ("1e10") == "1e10");
  assert (value ("2.5E-3") == "2.5E-3");
  assert (value ("7e+2") == "7e+2");

  // Numeric interpretations.
  //
  {
    istringstream is ("42 1.0 10e0 -7.9 3000000000 1e2");
    lexer l (is);

    assert (l.next_token () == token::number);
    assert (l.integral () && l.int_value () == 42 && l.long_value () == 42);

    assert (l.next_token () == token::number);
    assert (!l.integral ());
    assert (l.decimal_value () == decimal (false, "10", 1));
    assert (l.int_value () == 1);

    assert (l.next_token () == token::number);
    assert (l.integral ());

    assert (l.next_token () == token::number);
    assert (!l.integral () && l.int_value () == -7 && l.long_value () == -7);

    assert (l.next_token () == token::number);
    assert (l.integral ());
    assert (l.long_value () == 3000000000);
    assert (l.int_value () == static_cast<int32_t> (3000000000 - 4294967296));

    assert (l.next_token () == token::number);
    assert (!l.integral ());
    assert (l.long_value () == 100);
  }

  // Value is kept across structural tokens.
  //
  {
    istringstream is ("\"a\" :");
    lexer l (is);
    assert (l.next_token () == token::string);
    assert (l.next_token () == token::colon);
    assert (l.value () == "a");
  }

  // Locations.
  //
  {
    istringstream is ("{\n  \"ab\"\r\n: 12");
    lexer l (is);

    location s (l.current_location ());
    assert (s.line == 1 && s.column == 1 && s.position == 0);

    assert (l.next_token () == token::curly_open);
    assert (l.last_char_location () == location ({1, 1, 0}));
    assert (l.current_location () == location ({1, 2, 1}));

    assert (l.next_token () == token::string);
    assert (l.last_char_location () == location ({2, 6, 7}));

    assert (l.next_token () == token::colon);
    assert (l.last_char_location () == location ({3, 1, 10}));

    assert (l.next_token () == token::number);
    assert (l.last_char_location () == location ({3, 4, 13}));
    assert (l.current_location () == location ({3, 5, 14}));
  }

  // Invalid input.
  //
  assert (fail ("@", 1, 1));
  assert (fail ("\x01", 1, 1));
  assert (fail ("[ x ]", 1, 3));
  assert (fail ("\"abc", 1, 5));         // Unterminated string.
  assert (fail ("\"a\nb\"", 1, 3));      // Unescaped newline.
  assert (fail ("\"a\tb\"", 1, 3));      // Unescaped tab.
  assert (fail ("\"\\x\"", 1, 3));       // Invalid escape.
  assert (fail ("\"\\", 1, 3));          // Unterminated escape.
  assert (fail ("\"\\u12G4\"", 1, 6));   // Invalid hex digit.
  assert (fail ("\"\\uDE00\"", 1, 3));   // Lone low surrogate.
  assert (fail ("\"\\uD83D\"", 1, 8));   // Lone high surrogate.
  assert (fail ("\"\\uD83D\\u0041\"", 1, 8));
  assert (fail ("-", 1, 2));
  assert (fail ("-a", 1, 2));
  assert (fail ("1.", 1, 3));
  assert (fail ("1.e5", 1, 3));
  assert (fail ("1e", 1, 3));
  assert (fail ("1e+x", 1, 4));
  assert (fail ("tru", 1, 4));
  assert (fail ("nul1", 1, 1));
  assert (fail ("falsy", 1, 1));

  // Diagnostics format.
  //
  {
    istringstream is ("  @");
    lexer l (is, "input.json");

    try
    {
      l.next_token ();
      assert (false);
    }
    catch (const invalid_json_lexeme& e)
    {
      assert (e.name == "input.json");
      assert (e.line == 1 && e.column == 3 && e.position == 2);
      assert (string (e.what ()) ==
              "input.json:1:3: error: invalid character '@'");
    }
  }

  // Exponent that does not fit the scale is only diagnosed when the exact
  // value is requested. The other numeric interpretations still work.
  //
  {
    istringstream is ("1e99999999999 -25.5e-99999999999 7e-3000000000");
    lexer l (is);
    assert (l.next_token () == token::number);

    assert (!l.integral ());
    assert (l.long_value () == 0);
    assert (l.int_value () == 0);

    try
    {
      l.decimal_value ();
      assert (false);
    }
    catch (const invalid_json_lexeme& e)
    {
      assert (e.column == 1);
    }

    assert (l.next_token () == token::number);
    assert (!l.integral ());
    assert (l.long_value () == 0);
    assert (l.int_value () == 0);

    assert (l.next_token () == token::number);
    assert (!l.integral ());
    assert (l.long_value () == 0);

    try
    {
      l.decimal_value ();
      assert (false);
    }
    catch (const invalid_json_lexeme& e)
    {
      assert (e.column == 34);
    }
  }

  // Closing a non-file stream is a no-op. Closing a file stream closes the
  // file.
  //
  {
    istringstream is ("1");
    lexer l (is);
    l.close ();
  }

  {
    ifstream ifs;
    lexer l (ifs);
    l.close (); // Not open.
  }
}
