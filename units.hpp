#ifndef UNITS_HPP
#define UNITS_HPP

#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <string>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/units/quantity.hpp>
#include <boost/optional.hpp>
#include <boost/units/systems/si.hpp>
#include <boost/units/base_units/imperial/inch.hpp>
#include <boost/units/base_units/imperial/thou.hpp>
#include <boost/units/io.hpp>

struct units_parse_exception : public std::exception {
  units_parse_exception(const std::string& get_what, const std::string& from_what) {
    what_string = "Can't get " + get_what + " from: " + from_what;
  }
  units_parse_exception(const std::string& what) {
    what_string = what;
  }

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

// Given a string, provide methods to extract successive numbers,
// words, etc from it.
class Lexer {
 public:
  Lexer(const std::string& s) : pos(0), input(s) {}
  std::string get_whitespace() {
    return get_string<int>(std::isspace);
  }
  std::string get_word() {
    get_whitespace();
    return get_string<int>(std::isalpha);
  }
  double get_double() {
    get_whitespace();
    std::string text = get_string<bool>([](int c) {
        return std::isdigit(c) || c == '-' || c == '.' || c == '+';
      });
    try {
      return boost::lexical_cast<double>(text);
    } catch (boost::bad_lexical_cast& e) {
      throw units_parse_exception("double", text);
    }
  }

  bool at_end() {
    return pos == input.size();
  }
  size_t pos;
 private:
  // Gets all characters from current position until the first that
  // doesn't pass test_fn or end of input.
  template <typename test_return_type>
  std::string get_string(test_return_type (*test_fn)(int)) {
    size_t start = pos;
    while (pos < input.size() && test_fn(input[pos])) {
      pos++;
    }
    return input.substr(start, pos-start);
  }
  std::string input;
};

// Any non-SI base units that you want to use go here.
const boost::units::quantity<boost::units::si::length> inch(1*boost::units::imperial::inch_base_unit::unit_type());
const boost::units::quantity<boost::units::si::length> thou(1*boost::units::imperial::thou_base_unit::unit_type());
const boost::units::quantity<boost::units::si::length> millimeter(boost::units::si::meter/1000.0);

// A length as typed by the user: a number and maybe a unit.  Without
// a unit, the caller decides what the number means.
class Length {
 public:
  typedef boost::units::quantity<boost::units::si::length> quantity;
  Length(double value = 0, boost::optional<quantity> one = boost::none) : value(value), one(one) {}

  double asDouble() const {
    return value;
  }
  // factor converts a unitless value to millimeters.
  double asMillimeter(double factor) const {
    if (!one) {
      return value*factor;
    }
    return value*(*one)/millimeter;
  }
  bool operator<(const Length& other) const {
    return asMillimeter(1) < other.asMillimeter(1);
  }
  bool operator==(const Length& other) const {
    return asMillimeter(1) == other.asMillimeter(1);
  }
  friend std::ostream& operator<<(std::ostream& s, const Length& length) {
    if (length.one) {
      s << length.value * *length.one;
    } else {
      s << length.value;
    }
    return s;
  }
  static quantity get_unit(Lexer& lex) {
    std::string unit = lex.get_word();
    if (unit == "mm" ||
        unit == "millimeter" ||
        unit == "millimeters") {
      return millimeter;
    }
    if (unit == "in" ||
        unit == "inch" ||
        unit == "inches") {
      return inch;
    }
    if (unit == "thou" ||
        unit == "thous" ||
        unit == "mil" ||
        unit == "mils") {
      return thou;
    }
    throw units_parse_exception("length units", unit);
  }

 private:
  double value;
  boost::optional<quantity> one;
};

inline Length parse_length(const std::string& s) {
  Lexer lex(s);
  double value;
  boost::optional<Length::quantity> one;
  try {
    value = lex.get_double();
    lex.get_whitespace();
    if (!lex.at_end()) {
      one = Length::get_unit(lex);
    }
  } catch (units_parse_exception& e) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": " + e.what());
  }
  lex.get_whitespace();
  if (!lex.at_end()) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": Extra characters at end of option");
  }
  if (!std::isfinite(value)) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": Not a finite number");
  }
  return Length(value, one);
}

inline std::istream& operator>>(std::istream& in, Length& length) {
  std::string s(std::istreambuf_iterator<char>(in), {});
  length = parse_length(s);
  return in;
}

#endif // UNITS_HPP
