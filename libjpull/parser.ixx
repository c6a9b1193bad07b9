// file      : libjpull/parser.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace jpull
{
  inline parser::
  parser (std::istream& is, const char* n, bool rdn)
      : input_name (n),
        lexer_ (is, n),
        reject_duplicate_names_ (rdn)
  {
  }

  inline event parser::
  next ()
  {
    if (!has_next ())
      throw exhausted_json_input ();

    last_ = next_event ();
    return *last_;
  }

  inline const std::string& parser::
  name () const
  {
    if (last_ != event::name)
      throw_invalid_cursor ("name()");

    return lexer_.value ();
  }

  inline bool parser::
  integral_number () const
  {
    if (last_ != event::number)
      throw_invalid_cursor ("integral_number()");

    return lexer_.integral ();
  }

  inline std::int32_t parser::
  int_value () const
  {
    if (last_ != event::number)
      throw_invalid_cursor ("int_value()");

    return lexer_.int_value ();
  }

  inline std::int64_t parser::
  long_value () const
  {
    if (last_ != event::number)
      throw_invalid_cursor ("long_value()");

    return lexer_.long_value ();
  }

  inline const decimal& parser::
  decimal_value () const
  {
    if (last_ != event::number)
      throw_invalid_cursor ("decimal_value()");

    return lexer_.decimal_value ();
  }

  inline void parser::
  skip_object ()
  {
    if (last_ == event::begin_object)
    {
      skip (token::curly_open, token::curly_close);
      last_ = event::end_object;
    }
  }

  inline void parser::
  skip_array ()
  {
    if (last_ == event::begin_array)
    {
      skip (token::square_open, token::square_close);
      last_ = event::end_array;
    }
  }

  inline void parser::
  skip_children ()
  {
    if (last_ == event::begin_object)
      skip_object ();
    else if (last_ == event::begin_array)
      skip_array ();
  }

  inline void parser::
  next_expect_name (const std::string& n, bool su)
  {
    next_expect_name (n.c_str (), su);
  }
}
