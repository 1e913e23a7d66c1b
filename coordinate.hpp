/*
 * This file is part of pcb2dxf.
 *
 * pcb2dxf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * pcb2dxf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with pcb2dxf.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef COORDINATE_H
#define COORDINATE_H

#include <exception>
#include <string>

#include <boost/optional.hpp>

// A coordinate or format declaration was used before it was declared.
struct format_exception : public std::exception {
  format_exception(const std::string& what) {
    what_string = what;
  }

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

// A number was required but the text isn't one.
struct parse_exception : public std::exception {
  parse_exception(const std::string& get_what, const std::string& from_what) {
    what_string = "Can't get " + get_what + " from: \"" + from_what + "\"";
  }

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

namespace InputUnit {
enum InputUnit {
  MM,
  INCH
};
}; // namespace InputUnit

namespace ZeroSuppression {
enum ZeroSuppression {
  LEADING,   // leading zeros omitted, pad on the left
  TRAILING,  // trailing zeros omitted, pad on the right
  NONE
};
}; // namespace ZeroSuppression

namespace Notation {
enum Notation {
  ABSOLUTE,
  INCREMENTAL
};
}; // namespace Notation

/******************************************************************************/
/*
 Converts the raw coordinate tokens of a Gerber or Excellon file to
 millimeters.  The units and the digit format are declared by the file
 header; until they are, only the tokens that don't need them can be
 converted.
 */
/******************************************************************************/
class CoordinateFormat {
public:
    CoordinateFormat();

    void set_units(InputUnit::InputUnit units);
    void set_digits(unsigned int integer_digits, unsigned int decimal_digits);
    void set_zero_suppression(ZeroSuppression::ZeroSuppression zero_suppression);
    void set_notation(Notation::Notation notation);

    bool has_units() const {
        return static_cast<bool>(units);
    }
    bool has_digits() const {
        return static_cast<bool>(decimal_digits);
    }
    InputUnit::InputUnit get_units() const;
    Notation::Notation get_notation() const {
        return notation;
    }

    // Converts one token to millimeters, ignoring the notation.
    double to_mm(const std::string& token) const;

    // Converts a coordinate, adding it to previous in incremental notation.
    double resolve(const std::string& token, double previous) const;

    // Converts a plain decimal value in the declared units, like a tool size.
    double length_to_mm(const std::string& token) const;

private:
    double unit_factor() const;

    boost::optional<InputUnit::InputUnit> units;
    boost::optional<unsigned int> integer_digits;
    boost::optional<unsigned int> decimal_digits;
    ZeroSuppression::ZeroSuppression zero_suppression;
    Notation::Notation notation;
};

// True iff token has the shape [+-]?digits[.digits] with at least one digit.
bool is_number_token(const std::string& token);

// Reads the number of a G, D, M or T code.  Throws parse_exception if it
// isn't a number that fits in an int.
int parse_code(const std::string& what, const std::string& token);

#endif // COORDINATE_H
