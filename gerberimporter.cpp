/*
 * This file is part of pcb2dxf.
 *
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net>
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

#include <fstream>
#include <iostream>
using std::cerr;
using std::endl;

#include <string>
using std::string;

#include <vector>
using std::vector;

#include <boost/optional.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "gerberimporter.hpp"

namespace {

namespace Interpolation {
enum Interpolation {
  LINEAR,
  CLOCKWISE,
  COUNTERCLOCKWISE
};
}; // namespace Interpolation

namespace QuadrantMode {
enum QuadrantMode {
  SINGLE,
  MULTI
};
}; // namespace QuadrantMode

// Everything the plotter remembers between blocks.  Lives for one parse.
struct PlotterState {
  PlotterState()
      : interpolation(Interpolation::LINEAR),
        quadrant_mode(QuadrantMode::MULTI),
        format_declared(false),
        aperture(0),
        last_operation(2),
        warned_units(false),
        warned_no_start(false),
        warned_no_aperture(false) {}

  boost::optional<double> x;
  boost::optional<double> y;
  Interpolation::Interpolation interpolation;
  QuadrantMode::QuadrantMode quadrant_mode;
  CoordinateFormat x_format;
  CoordinateFormat y_format;
  bool format_declared;
  int aperture;
  int last_operation;
  bool warned_units;
  bool warned_no_start;
  bool warned_no_aperture;
};

enum ExtendedCommand {
  FORMAT_SPECIFICATION,
  UNIT_MODE,
  OTHER_EXTENDED
};

ExtendedCommand classify_extended(const string& text) {
  if (boost::starts_with(text, "FS")) {
    return FORMAT_SPECIFICATION;
  }
  if (boost::starts_with(text, "MO")) {
    return UNIT_MODE;
  }
  // Apertures, macros, attributes, polarity, image parameters...
  return OTHER_EXTENDED;
}

// One data block, split into its words.  Only the letters that matter for
// the outline are kept.
struct DataBlock {
  vector<int> g_codes;
  boost::optional<int> d_code;
  boost::optional<int> m_code;
  boost::optional<string> x;
  boost::optional<string> y;
  boost::optional<string> i;
  boost::optional<string> j;
};

bool is_digits(const string& s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

// Returns false if the block isn't something that we understand.  A
// malformed number after a coordinate letter or code throws.
bool parse_data_block(const string& text, DataBlock& block) {
  size_t pos = 0;
  while (pos < text.size()) {
    const char letter = std::toupper(static_cast<unsigned char>(text[pos]));
    pos++;
    const size_t start = pos;
    while (pos < text.size() && !std::isalpha(static_cast<unsigned char>(text[pos]))) {
      pos++;
    }
    const string value = text.substr(start, pos - start);

    switch (letter) {
      case 'G':
      case 'D':
      case 'M':
        if (!is_digits(value)) {
          return false;
        }
        if (letter == 'G') {
          block.g_codes.push_back(parse_code("G code", value));
        } else if (letter == 'D') {
          block.d_code = parse_code("D code", value);
        } else {
          block.m_code = parse_code("M code", value);
        }
        break;
      case 'N':
      case 'F':
      case 'S':
        // Sequence numbers and feed or speed words of old RS-274 files.
        break;
      case 'X':
      case 'Y':
      case 'I':
      case 'J':
        if (!is_number_token(value)) {
          throw parse_exception(string("coordinate ") + letter, text);
        }
        if (letter == 'X') {
          block.x = value;
        } else if (letter == 'Y') {
          block.y = value;
        } else if (letter == 'I') {
          block.i = value;
        } else {
          block.j = value;
        }
        break;
      default:
        return false;
    }
  }
  return true;
}

unsigned int format_digit(const string& text, size_t pos) {
  if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
    throw format_exception("Malformed format specification: %" + text + "*%");
  }
  return text[pos] - '0';
}

// %FS[LTD][AI]X<int><dec>Y<int><dec>*%
void parse_format_specification(const string& text, PlotterState& state) {
  size_t pos = 2;
  ZeroSuppression::ZeroSuppression zero_suppression = ZeroSuppression::LEADING;
  Notation::Notation notation = Notation::ABSOLUTE;
  for (; pos < text.size() && text[pos] != 'X'; pos++) {
    switch (text[pos]) {
      case 'L': zero_suppression = ZeroSuppression::LEADING; break;
      case 'T': zero_suppression = ZeroSuppression::TRAILING; break;
      case 'D': zero_suppression = ZeroSuppression::NONE; break;
      case 'A': notation = Notation::ABSOLUTE; break;
      case 'I': notation = Notation::INCREMENTAL; break;
      default:
        // N and G words of the old standard; nothing we need.
        break;
    }
  }
  if (pos >= text.size()) {
    throw format_exception("Malformed format specification: %" + text + "*%");
  }
  const unsigned int x_integer = format_digit(text, pos + 1);
  const unsigned int x_decimal = format_digit(text, pos + 2);
  pos += 3;
  if (pos >= text.size() || text[pos] != 'Y') {
    throw format_exception("Malformed format specification: %" + text + "*%");
  }
  const unsigned int y_integer = format_digit(text, pos + 1);
  const unsigned int y_decimal = format_digit(text, pos + 2);

  for (CoordinateFormat* format : {&state.x_format, &state.y_format}) {
    format->set_zero_suppression(zero_suppression);
    format->set_notation(notation);
  }
  state.x_format.set_digits(x_integer, x_decimal);
  state.y_format.set_digits(y_integer, y_decimal);
  state.format_declared = true;
}

void set_units(PlotterState& state, InputUnit::InputUnit units) {
  state.x_format.set_units(units);
  state.y_format.set_units(units);
}

void set_notation(PlotterState& state, Notation::Notation notation) {
  state.x_format.set_notation(notation);
  state.y_format.set_notation(notation);
}

void parse_unit_mode(const string& text, PlotterState& state) {
  if (text == "MOMM") {
    set_units(state, InputUnit::MM);
  } else if (text == "MOIN") {
    set_units(state, InputUnit::INCH);
  } else {
    throw format_exception("Unknown unit mode: %" + text + "*%");
  }
}

/******************************************************************************/
/*
 In single quadrant mode the signs of I and J are not given.  Choose the
 center that is closest to equidistant from start and stop while
 sweeping no more than 90 degrees.
 */
/******************************************************************************/
point_type_fp single_quadrant_center(const point_type_fp& start, const point_type_fp& stop,
                                     double i, double j, bool clockwise) {
  const double quarter = bg::math::pi<double>() / 2 + 1e-9;
  boost::optional<point_type_fp> best;
  double best_error = 0;
  for (const double i_sign : {1.0, -1.0}) {
    for (const double j_sign : {1.0, -1.0}) {
      const point_type_fp center(start.x() + std::abs(i) * i_sign, start.y() + std::abs(j) * j_sign);
      if (std::abs(get_angle(start, center, stop, clockwise)) > quarter) {
        continue; // Wrong side.
      }
      const double error = std::abs(bg::distance(start, center) - bg::distance(stop, center));
      if (!best || error < best_error) {
        best = center;
        best_error = error;
      }
    }
  }
  if (!best) {
    return point_type_fp(start.x() + std::abs(i), start.y() + std::abs(j));
  }
  return *best;
}

void warn_missing_units(PlotterState& state) {
  if (!state.x_format.has_units()) {
    if (!state.warned_units) {
      cerr << "Warning: Gerber file declares no units (%MO); assuming millimeters." << endl;
      state.warned_units = true;
    }
    set_units(state, InputUnit::MM);
  }
}

void plot(const DataBlock& block, PlotterState& state, outline_segments& segments) {
  if (!state.format_declared) {
    throw format_exception("Coordinate data before the format specification (%FS)");
  }
  warn_missing_units(state);

  const int operation = block.d_code ? *block.d_code : state.last_operation;
  state.last_operation = operation;

  const boost::optional<double> x = block.x ?
      boost::make_optional(state.x_format.resolve(*block.x, state.x.value_or(0))) : state.x;
  const boost::optional<double> y = block.y ?
      boost::make_optional(state.y_format.resolve(*block.y, state.y.value_or(0))) : state.y;

  if (operation == 1) {
    if (!state.x || !state.y || !x || !y) {
      if (!state.warned_no_start) {
        cerr << "Warning: Draw without a known current point; treating it as a move." << endl;
        state.warned_no_start = true;
      }
    } else {
      if (state.aperture == 0 && !state.warned_no_aperture) {
        cerr << "Warning: Draw before any aperture was selected." << endl;
        state.warned_no_aperture = true;
      }
      const point_type_fp start(*state.x, *state.y);
      const point_type_fp stop(*x, *y);
      if (state.interpolation == Interpolation::LINEAR) {
        segments.push_back(line_segment{start, stop});
      } else {
        const bool clockwise = state.interpolation == Interpolation::CLOCKWISE;
        // Offsets are relative to the start, never incremental.
        const double i = block.i ? state.x_format.to_mm(*block.i) : 0;
        const double j = block.j ? state.y_format.to_mm(*block.j) : 0;
        point_type_fp center(start.x() + i, start.y() + j);
        if (state.quadrant_mode == QuadrantMode::SINGLE) {
          center = single_quadrant_center(start, stop, i, j, clockwise);
        }
        if (state.quadrant_mode == QuadrantMode::SINGLE && bg::equals(start, stop)) {
          // A zero length arc; there is no full circle in single quadrant mode.
        } else {
          segments.push_back(arc_segment{start, stop, center,
                                         clockwise ? ArcDirection::CLOCKWISE : ArcDirection::COUNTERCLOCKWISE});
        }
      }
    }
  }
  // D02 moves and D03 flashes only move the plotter.
  state.x = x;
  state.y = y;
}

} // namespace

double get_angle(const point_type_fp& start, const point_type_fp& center,
                 const point_type_fp& stop, bool clockwise) {
  double start_angle = atan2(start.y() - center.y(), start.x() - center.x());
  double  stop_angle = atan2( stop.y() - center.y(),  stop.x() - center.x());
  double delta_angle = stop_angle - start_angle;
  while (clockwise && delta_angle > 0) {
    delta_angle -= 2 * bg::math::pi<double>();
  }
  while (!clockwise && delta_angle < 0) {
    delta_angle += 2 * bg::math::pi<double>();
  }
  return delta_angle;
}

bool GerberBlockReader::next(block& result) {
  string text;
  char c;
  while (in.get(c)) {
    if (c == '\r' || c == '\n') {
      continue;
    }
    if (c == '%') {
      extended = !extended;
      continue;
    }
    if (c == '*') {
      if (text.empty()) {
        continue;
      }
      result.text = text;
      result.extended = extended;
      return true;
    }
    text.push_back(c);
  }
  return false;
}

GerberImporter::GerberImporter() {}

/* Returns true iff the file could be opened. */
bool GerberImporter::load_file(const string& path) {
  std::ifstream in(path.c_str());
  if (!in.good()) {
    return false;
  }
  load(in);
  return true;
}

void GerberImporter::load(std::istream& in) {
  PlotterState state;
  outline_segments result;
  GerberBlockReader reader(in);
  GerberBlockReader::block block;

  while (reader.next(block)) {
    if (block.extended) {
      switch (classify_extended(block.text)) {
        case FORMAT_SPECIFICATION:
          parse_format_specification(block.text, state);
          break;
        case UNIT_MODE:
          parse_unit_mode(block.text, state);
          break;
        default:
          break;
      }
      continue;
    }

    if (boost::starts_with(block.text, "G04")) {
      continue; // comment
    }

    DataBlock data;
    if (!parse_data_block(block.text, data)) {
      continue;
    }

    for (const int g : data.g_codes) {
      switch (g) {
        case 1: state.interpolation = Interpolation::LINEAR; break;
        case 2: state.interpolation = Interpolation::CLOCKWISE; break;
        case 3: state.interpolation = Interpolation::COUNTERCLOCKWISE; break;
        case 70: set_units(state, InputUnit::INCH); break;
        case 71: set_units(state, InputUnit::MM); break;
        case 74: state.quadrant_mode = QuadrantMode::SINGLE; break;
        case 75: state.quadrant_mode = QuadrantMode::MULTI; break;
        case 90: set_notation(state, Notation::ABSOLUTE); break;
        case 91: set_notation(state, Notation::INCREMENTAL); break;
        default:
          // G36/G37 regions, G54 tool prepare and the rest don't move the plotter.
          break;
      }
    }

    if (data.m_code && (*data.m_code == 0 || *data.m_code == 2 || *data.m_code == 30)) {
      break; // end of program
    }

    if (data.d_code && *data.d_code >= 10) {
      state.aperture = *data.d_code;
      continue;
    }

    if (data.x || data.y || data.i || data.j ||
        (data.d_code && *data.d_code >= 1 && *data.d_code <= 3)) {
      plot(data, state, result);
    }
  }

  segments.swap(result);
}
