// file      : libjpull/parser.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libjpull/parser.hxx>

#include <ios>     // ios_base::failure
#include <cassert>
#include <utility> // move()

using namespace std;

namespace jpull
{
  // Format the expected tokens set as, for example, "string or '}'" or
  // "',', ']', or end of input".
  //
  static string
  expected_list (const vector<token>& ts)
  {
    string r;

    for (size_t i (0), n (ts.size ()); i != n; ++i)
    {
      if (i != 0)
      {
        if (n > 2)
          r += ',';

        r += ' ';

        if (i == n - 1)
          r += "or ";
      }

      r += to_string (ts[i]);
    }

    return r;
  }

  invalid_json_token::
  invalid_json_token (string n, const location& l, token f, vector<token> e)
      : invalid_json_input (move (n),
                            l,
                            "expected " + expected_list (e) +
                            " instead of " + to_string (f)),
        found (f),
        expected (move (e))
  {
  }

  trailing_json_input::
  trailing_json_input (string n, const location& l, token f)
      : invalid_json_input (move (n),
                            l,
                            string ("expected end of input instead of ") +
                            to_string (f)),
        found (f)
  {
  }

  duplicate_json_name::
  duplicate_json_name (string n, const location& l, string m)
      : invalid_json_input (move (n),
                            l,
                            "duplicate object member '" + m + '\''),
        member (move (m))
  {
  }

  exhausted_json_input::
  exhausted_json_input ()
      : out_of_range ("no more JSON events")
  {
  }

  static inline string
  cursor_description (const string& a, const optional<event>& e)
  {
    string r (a);
    r += " called ";

    if (e)
    {
      r += "in state ";
      r += to_string (*e);
    }
    else
      r += "before first event";

    return r;
  }

  invalid_json_cursor::
  invalid_json_cursor (string a, optional<event> e)
      : logic_error (cursor_description (a, e)),
        accessor (move (a)),
        current (e)
  {
  }

  // parser
  //
  // Tokens that can start a value plus, if specified, the closing bracket
  // that is also valid in this position.
  //
  static vector<token>
  value_tokens (optional<token> close)
  {
    vector<token> r {token::curly_open,
                     token::square_open,
                     token::string,
                     token::number,
                     token::true_literal,
                     token::false_literal,
                     token::null_literal};
    if (close)
      r.push_back (*close);

    return r;
  }

  bool parser::
  has_next ()
  {
    if (stack_.empty ())
    {
      // Once the top-level value is complete, the only thing that may
      // follow is the end of input.
      //
      if (last_ && value_complete (*last_))
      {
        token t (lexer_.next_token ());

        if (t != token::eof)
          throw trailing_json_input (lexer_.name (),
                                     lexer_.last_char_location (),
                                     t);
        return false;
      }
    }
    else if (!lexer_.has_next_token ())
    {
      // Premature end of input inside an object or array. Given the end of
      // input every object/array branch of next_event() throws, so this
      // always throws with the expected set for the exact position.
      //
      next_event ();
      assert (false); // Unreachable.
      return false;
    }

    return true;
  }

  event parser::
  next_event ()
  {
    token t (lexer_.next_token ());

    if (stack_.empty ())
      return begin_value (t);

    frame& f (stack_.back ());

    switch (f.kind)
    {
    case context::object:
      {
        // Handle :value after the name.
        //
        if (*last_ == event::name)
        {
          if (t != token::colon)
            throw_invalid_token (t, {token::colon});

          return begin_value (lexer_.next_token ());
        }

        // Otherwise we are either right after the beginning of the object
        // or after a member value. Handle }, name, or ,name.
        //
        if (t == token::curly_close)
        {
          stack_.pop_back ();
          return event::end_object;
        }

        if (*last_ == event::begin_object)
        {
          if (t != token::string)
            throw_invalid_token (t, {token::string, token::curly_close});
        }
        else
        {
          if (t != token::comma)
            throw_invalid_token (t, {token::comma, token::curly_close});

          if ((t = lexer_.next_token ()) != token::string)
            throw_invalid_token (t, {token::string});
        }

        if (f.names && !f.names->insert (lexer_.value ()).second)
          throw duplicate_json_name (lexer_.name (),
                                     lexer_.last_char_location (),
                                     lexer_.value ());

        return event::name;
      }
    case context::array:
      {
        // Handle ], value, or ,value.
        //
        if (t == token::square_close)
        {
          stack_.pop_back ();
          return event::end_array;
        }

        if (*last_ == event::begin_array)
          return begin_value (t, token::square_close);

        if (t != token::comma)
          throw_invalid_token (t, {token::comma, token::square_close});

        return begin_value (lexer_.next_token ());
      }
    }

    assert (false); // Unhandled context.
    return event::null;
  }

  event parser::
  begin_value (token t, optional<token> close)
  {
    switch (t)
    {
    case token::curly_open:
      {
        frame f {context::object, nullopt};
        if (reject_duplicate_names_)
          f.names = set<string> ();

        stack_.push_back (move (f));
        return event::begin_object;
      }
    case token::square_open:
      {
        stack_.push_back (frame {context::array, nullopt});
        return event::begin_array;
      }
    default:
      {
        if (value_token (t))
          return token_event (t);

        break;
      }
    }

    throw_invalid_token (t, value_tokens (close));
  }

  void parser::
  skip (token open, token close)
  {
    // Only count the brackets of the type being skipped, everything else
    // (including the other bracket type) is opaque. Note that the lexer
    // still diagnoses malformed tokens.
    //
    for (int64_t d (1);; )
    {
      token t (lexer_.next_token ());

      if (t == close)
      {
        if (--d == 0)
          break;
      }
      else if (t == open)
        ++d;
      else if (t == token::eof)
        throw_invalid_token (t, {close});
    }

    stack_.pop_back ();
  }

  const string& parser::
  value () const
  {
    if (last_ != event::name   &&
        last_ != event::string &&
        last_ != event::number)
      throw_invalid_cursor ("value()");

    return lexer_.value ();
  }

  void parser::
  close ()
  {
    if (!closed_)
    {
      try
      {
        lexer_.close ();
      }
      catch (const ios_base::failure& e)
      {
        throw json_resource_failure (
          string ("unable to close JSON input: ") + e.what ());
      }

      closed_ = true;
    }
  }

  bool parser::
  next_expect (event p, optional<event> s)
  {
    optional<event> e;
    if (has_next ())
      e = next ();

    bool r;
    if (e && ((r = *e == p) || (s && *e == *s)))
      return r;

    string d ("expected ");
    d += to_string (p);

    if (s)
    {
      d += " or ";
      d += to_string (*s);
    }

    throw_unexpected_event (move (d), e);
  }

  void parser::
  next_expect_name (const char* n, bool su)
  {
    for (;;)
    {
      next_expect (event::name);

      if (name () == n)
        return;

      if (!su)
        break;

      next_expect_value_skip ();
    }

    string d ("expected object member name '");
    d += n;
    d += "' instead of '";
    d += name ();
    d += '\'';

    throw invalid_json_input (lexer_.name (), last_char_location (), d);
  }

  void parser::
  next_expect_value_skip ()
  {
    optional<event> e;
    if (has_next ())
      e = next ();

    if (e)
    {
      switch (*e)
      {
      case event::begin_object:
      case event::begin_array:
        {
          // Skip until the matching end_object/array without producing any
          // events for the content.
          //
          skip_children ();
          return;
        }
      case event::string:
      case event::number:
      case event::true_value:
      case event::false_value:
      case event::null:
        return;
      case event::name:
      case event::end_object:
      case event::end_array:
        break;
      }
    }

    throw_unexpected_event ("expected value", e);
  }

  void parser::
  throw_invalid_token (token t, vector<token> e) const
  {
    throw invalid_json_token (lexer_.name (),
                              lexer_.last_char_location (),
                              t,
                              move (e));
  }

  void parser::
  throw_invalid_cursor (const char* a) const
  {
    throw invalid_json_cursor (a, last_);
  }

  void parser::
  throw_unexpected_event (string d, optional<event> e) const
  {
    d += " instead of ";
    d += e ? to_string (*e) : "end of input";

    throw invalid_json_input (lexer_.name (), last_char_location (), d);
  }
}
