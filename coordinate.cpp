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

#include <cctype>
#include <cmath>

#include <string>
using std::string;

#include <boost/lexical_cast.hpp>

#include "coordinate.hpp"

bool is_number_token(const string& token) {
    size_t pos = 0;
    if (pos < token.size() && (token[pos] == '+' || token[pos] == '-')) {
        pos++;
    }
    unsigned int digits = 0;
    unsigned int points = 0;
    for (; pos < token.size(); pos++) {
        if (std::isdigit(static_cast<unsigned char>(token[pos]))) {
            digits++;
        } else if (token[pos] == '.') {
            points++;
        } else {
            return false;
        }
    }
    return digits > 0 && points <= 1;
}

int parse_code(const string& what, const string& token) {
    try {
        return boost::lexical_cast<int>(token);
    } catch (boost::bad_lexical_cast&) {
        throw parse_exception(what, token);
    }
}

CoordinateFormat::CoordinateFormat()
    : zero_suppression(ZeroSuppression::LEADING),
      notation(Notation::ABSOLUTE) {}

void CoordinateFormat::set_units(InputUnit::InputUnit units)
{
    this->units = units;
}

void CoordinateFormat::set_digits(unsigned int integer_digits, unsigned int decimal_digits)
{
    this->integer_digits = integer_digits;
    this->decimal_digits = decimal_digits;
}

void CoordinateFormat::set_zero_suppression(ZeroSuppression::ZeroSuppression zero_suppression)
{
    this->zero_suppression = zero_suppression;
}

void CoordinateFormat::set_notation(Notation::Notation notation)
{
    this->notation = notation;
}

InputUnit::InputUnit CoordinateFormat::get_units() const
{
    if (!units) {
        throw format_exception("Units used before they were declared");
    }
    return *units;
}

double CoordinateFormat::unit_factor() const
{
    return get_units() == InputUnit::INCH ? 25.4 : 1;
}

/******************************************************************************/
/*
 Converts a token to millimeters.  With a decimal point the number is
 read as is; without one it is a fixed point number whose rightmost
 decimal_digits digits are the fraction.
 */
/******************************************************************************/
double CoordinateFormat::to_mm(const string& token) const
{
    if (!is_number_token(token)) {
        throw parse_exception("coordinate", token);
    }

    const bool negative = token[0] == '-';
    string digits = (token[0] == '-' || token[0] == '+') ? token.substr(1) : token;

    if (digits.find('.') != string::npos) {
        if (!units) {
            throw format_exception("Units not declared before coordinate \"" + token + "\"");
        }
        if (digits.front() == '.') {
            digits = "0" + digits;
        }
        if (digits.back() == '.') {
            digits += "0";
        }
        const double value = boost::lexical_cast<double>(digits);
        return (negative ? -value : value) * unit_factor();
    }

    if (!decimal_digits || !integer_digits) {
        throw format_exception("Coordinate format not declared before coordinate \"" + token + "\"");
    }
    if (!units) {
        throw format_exception("Units not declared before coordinate \"" + token + "\"");
    }

    const size_t total = *integer_digits + *decimal_digits;
    if (digits.size() < total) {
        if (zero_suppression == ZeroSuppression::TRAILING) {
            digits.append(total - digits.size(), '0');
        } else {
            digits.insert(0, total - digits.size(), '0');
        }
    } else if (digits.size() > total) {
        digits = digits.substr(digits.size() - total);
    }

    const double value = boost::lexical_cast<double>(digits) / std::pow(10.0, *decimal_digits);
    return (negative ? -value : value) * unit_factor();
}

double CoordinateFormat::resolve(const string& token, double previous) const
{
    const double value = to_mm(token);
    if (notation == Notation::INCREMENTAL) {
        return previous + value;
    }
    return value;
}

double CoordinateFormat::length_to_mm(const string& token) const
{
    if (!is_number_token(token)) {
        throw parse_exception("length", token);
    }
    string text = token;
    if (text.back() == '.') {
        text += "0";
    }
    const size_t point = text.find('.');
    if (point != string::npos && (point == 0 || !std::isdigit(static_cast<unsigned char>(text[point - 1])))) {
        text.insert(point, "0");
    }
    if (text[0] == '+') {
        text = text.substr(1);
    }
    if (!units) {
        throw format_exception("Units not declared before length \"" + token + "\"");
    }
    return boost::lexical_cast<double>(text) * unit_factor();
}
