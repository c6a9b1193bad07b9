// file      : libjpull/parser.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <set>
#include <string>
#include <vector>
#include <cstddef>   // size_t
#include <cstdint>   // uint8_t, int32_t, int64_t
#include <istream>
#include <optional>
#include <stdexcept> // out_of_range, logic_error, runtime_error

#include <libjpull/event.hxx>
#include <libjpull/token.hxx>
#include <libjpull/lexer.hxx>
#include <libjpull/decimal.hxx>

#include <libjpull/export.hxx>

namespace jpull
{
  // Token (or end of input) that is not valid at this grammar position.
  // The expected set is the exact list of tokens that would have been.
  //
  class LIBJPULL_SYMEXPORT invalid_json_token: public invalid_json_input
  {
  public:
    token found;
    std::vector<token> expected;

    invalid_json_token (std::string name,
                        const location&,
                        token found,
                        std::vector<token> expected);

    bool
    eof () const noexcept {return found == token::eof;}
  };

  // Non-whitespace content after a complete top-level value.
  //
  class LIBJPULL_SYMEXPORT trailing_json_input: public invalid_json_input
  {
  public:
    token found;

    trailing_json_input (std::string name, const location&, token found);
  };

  // Repeated object member name (only if rejection is enabled).
  //
  class LIBJPULL_SYMEXPORT duplicate_json_name: public invalid_json_input
  {
  public:
    std::string member;

    duplicate_json_name (std::string name, const location&, std::string member);
  };

  // next() called with no more events available.
  //
  class LIBJPULL_SYMEXPORT exhausted_json_input: public std::out_of_range
  {
  public:
    exhausted_json_input ();
  };

  // Accessor called while the current event does not support it.
  //
  class LIBJPULL_SYMEXPORT invalid_json_cursor: public std::logic_error
  {
  public:
    std::string accessor;
    std::optional<event> current;

    invalid_json_cursor (std::string accessor, std::optional<event> current);
  };

  // Failure to release the underlying input.
  //
  class LIBJPULL_SYMEXPORT json_resource_failure: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // JSON pull parser.
  //
  // The parser is driven by the caller with has_next()/next() and only
  // keeps the chain of enclosing objects/arrays needed to validate what
  // comes next. The input must contain exactly one JSON value optionally
  // surrounded by whitespaces.
  //
  // For example, for {"a":[1,true]} the sequence of events is:
  //
  // begin_object, name, begin_array, number, true_value, end_array,
  // end_object
  //
  // All the invalid input exceptions (invalid_json_input and derived) are
  // fatal and the parser should not be used after one has been thrown.
  // Neither should it be used after close().
  //
  class LIBJPULL_SYMEXPORT parser
  {
  public:
    const char* input_name;

    // The input name is used as the diagnostics prefix. If the reject
    // duplicate names argument is true, then a repeated member name in the
    // same object is diagnosed with duplicate_json_name.
    //
    // Note that the stream is expected to be in the binary mode and its
    // exception mask is left untouched.
    //
    explicit
    parser (std::istream&,
            const char* input_name = nullptr,
            bool reject_duplicate_names = false);

    parser (const parser&) = delete;
    parser& operator= (const parser&) = delete;

    // Return true if there are more events. Return false once the complete
    // top-level value has been produced and the rest of the input is
    // verified to be empty (throw trailing_json_input otherwise).
    //
    // Note that this function may read input and therefore throw
    // invalid_json_input.
    //
    bool
    has_next ();

    // Return the next event. Throw exhausted_json_input if has_next()
    // returns false.
    //
    event
    next ();

    // Return the last event returned by next() or nullopt if next() has not
    // been called yet. Note that it is also updated by the skip_*()
    // functions.
    //
    std::optional<event>
    current_event () const noexcept {return last_;}

    // Nesting depth of the current position, zero being the top level.
    //
    std::size_t
    depth () const noexcept {return stack_.size ();}

    // Value accessors. Throw invalid_json_cursor if the current event does
    // not support the accessor.
    //
  public:
    // String value, member name, or number literal (name, string, and
    // number events).
    //
    const std::string&
    value () const;

    // Member name (name event).
    //
    const std::string&
    name () const;

    // Numeric accessors (number event). Note that int_value() and
    // long_value() truncate the fraction and reduce the result to the
    // corresponding width. Only decimal_value() can fail on a number event,
    // if its exponent does not fit the decimal scale.
    //
    bool
    integral_number () const;

    std::int32_t
    int_value () const;

    std::int64_t
    long_value () const;

    const decimal&
    decimal_value () const;

    // Location of the next character to be read.
    //
    location
    current_location () const {return lexer_.current_location ();}

    // Location of the last consumed character.
    //
    location
    last_char_location () const {return lexer_.last_char_location ();}

    // Skip the rest of the current object/array without validating its
    // content. After the call the current event is end_object/end_array,
    // the same as if the content were parsed with next(). Do nothing
    // unless the current event is begin_object/begin_array, respectively.
    //
  public:
    void
    skip_object ();

    void
    skip_array ();

    // Call skip_object() or skip_array() depending on the current event.
    //
    void
    skip_children ();

    // Release the underlying input (see lexer::close()). The second and
    // subsequent calls are no-ops. Throw json_resource_failure on failure.
    //
    void
    close ();

    // Higher-level helpers.
    //
  public:
    // Get the next event and make sure that it's what's expected: primary
    // or, if specified, secondary event. If it is not either, then throw
    // invalid_json_input with the appropriate description. Return true if
    // it is primary.
    //
    // Note that the end of input is also unexpected.
    //
    bool
    next_expect (event primary, std::optional<event> secondary = std::nullopt);

    // Get the next event and make sure it is the member name with the
    // specified value. If skip_unknown is true, then skip over members with
    // other names.
    //
    void
    next_expect_name (const char* name, bool skip_unknown = false);

    void
    next_expect_name (const std::string& name, bool skip_unknown = false);

    // Get the next event and make sure it's the beginning of a value. If
    // it's the beginning of an object or array, then skip it.
    //
    void
    next_expect_value_skip ();

  private:
    event
    next_event ();

    event
    begin_value (token, std::optional<token> close = std::nullopt);

    void
    skip (token open, token close);

    [[noreturn]] void
    throw_invalid_token (token, std::vector<token> expected) const;

    [[noreturn]] void
    throw_invalid_cursor (const char* accessor) const;

    [[noreturn]] void
    throw_unexpected_event (std::string description,
                            std::optional<event>) const;

  private:
    enum class context: std::uint8_t {object, array};

    // The names set is only present for objects and only if duplicate
    // names are rejected.
    //
    struct frame
    {
      context kind;
      std::optional<std::set<std::string>> names;
    };

    lexer lexer_;
    bool reject_duplicate_names_;

    // Enclosing objects/arrays, innermost last. Empty at the top level.
    //
    std::vector<frame> stack_;

    std::optional<event> last_;
    bool closed_ = false;
  };
}

#include <libjpull/parser.ixx>
