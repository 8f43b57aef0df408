#pragma once
#include <cmath>
#include <stdexcept>
#include <string>

// Parses a numeric query parameter. Anything that is not a finite number,
// including trailing junk and values outside double range, is a client error
// reported as std::invalid_argument.
inline double parse_number_param(const std::string &key,
                                 const std::string &text) {
  size_t used = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &used);
  } catch (const std::invalid_argument &) {
    throw std::invalid_argument("query parameter '" + key +
                                "' is not a number");
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("query parameter '" + key +
                                "' is out of range");
  }
  if (used != text.size() || !std::isfinite(value))
    throw std::invalid_argument("query parameter '" + key +
                                "' is not a finite number");
  return value;
}
