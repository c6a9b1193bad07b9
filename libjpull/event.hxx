// file      : libjpull/event.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace jpull
{
  // Parsing event.
  //
  // Note that the order is significant: everything after name either
  // completes a value (scalars) or closes a structure. The parser relies on
  // this to detect that a complete top-level value has been produced.
  //
  enum class event: std::uint8_t
  {
    begin_object = 1,
    begin_array,
    name,
    string,
    number,
    true_value,
    false_value,
    null,
    end_object,
    end_array
  };

  constexpr std::size_t event_count = 10;

  // Return true if the event completes a value (scalar or end of
  // object/array).
  //
  inline bool
  value_complete (event e) noexcept
  {
    return e > event::name;
  }

  // Return true if the event is a scalar value.
  //
  inline bool
  scalar_event (event e) noexcept
  {
    return e >= event::string && e <= event::null;
  }

  inline const char*
  to_string (event e) noexcept
  {
    switch (e)
    {
    case event::begin_object: return "beginning of object";
    case event::begin_array:  return "beginning of array";
    case event::name:         return "member name";
    case event::string:       return "string value";
    case event::number:       return "numeric value";
    case event::true_value:   return "true value";
    case event::false_value:  return "false value";
    case event::null:         return "null value";
    case event::end_object:   return "end of object";
    case event::end_array:    return "end of array";
    }

    return "";
  }

  inline std::ostream&
  operator<< (std::ostream& o, event e)
  {
    return o << to_string (e);
  }
}
