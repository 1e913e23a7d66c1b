/*
 * This file is part of pcb2dxf.
 *
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net>
 * Copyright (C) 2010 Bernhard Kubicek <kubicek@gmx.at>
 * Copyright (C) 2013 Erik Schuster <erik@muenchen-ist-toll.de>
 * Copyright (C) 2014, 2015 Nicola Corna <nicola@corna.info>
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

#include <fstream>

#include <iostream>
using std::cerr;
using std::endl;

#include <vector>
using std::vector;

#include <string>
using std::string;

#include <map>
using std::map;

#include <set>

#include <boost/format.hpp>
using boost::format;

#include <boost/optional.hpp>
#include <boost/algorithm/string.hpp>

#include "drill.hpp"

string tool_name(int tool_code)
{
    return str(format("T%02d") % tool_code);
}

unknown_tool_exception::unknown_tool_exception(int tool_code)
    : code(tool_code)
{
    what_string = "Drill hit uses tool " + tool_name(code) + ", which the tool table doesn't define";
}

namespace {

struct DrillState {
    DrillState() : explicit_digits(false), warned_no_tool(false) {
        // Excellon files without a unit header are in inches.
        format.set_units(InputUnit::INCH);
        format.set_digits(2, 4);
    }

    CoordinateFormat format;
    bool explicit_digits;
    boost::optional<int> tool;
    boost::optional<double> x;
    boost::optional<double> y;
    bool warned_no_tool;
};

bool is_digits(const string& s)
{
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

string read_number(const string& line, size_t& pos)
{
    const size_t start = pos;
    while (pos < line.size() &&
           (std::isdigit(static_cast<unsigned char>(line[pos])) ||
            line[pos] == '.' || line[pos] == '-' || line[pos] == '+')) {
        pos++;
    }
    return line.substr(start, pos - start);
}

/******************************************************************************/
/*
 Reads "FORMAT={3:3/ absolute / metric / ...}" and "FILE_FORMAT=4:4"
 comments.  "-:-" means decimal coordinates and declares nothing.
 */
/******************************************************************************/
void parse_format_comment(const string& line, DrillState& state)
{
    size_t pos = line.find("FORMAT=");
    if (pos == string::npos) {
        return;
    }
    pos += 7;
    if (pos < line.size() && line[pos] == '{') {
        pos++;
    }
    const string integer = read_number(line, pos);
    if (pos >= line.size() || line[pos] != ':') {
        return;
    }
    pos++;
    const string decimal = read_number(line, pos);
    if (!is_digits(integer) || !is_digits(decimal)) {
        return;
    }
    state.format.set_digits(parse_code("integer digits", integer), parse_code("decimal digits", decimal));
    state.explicit_digits = true;
}

// METRIC|INCH[,LZ|TZ][,000.000]
void parse_units(const string& line, DrillState& state)
{
    vector<string> parts;
    boost::split(parts, line, boost::is_any_of(","));
    const bool metric = boost::starts_with(parts[0], "METRIC");
    state.format.set_units(metric ? InputUnit::MM : InputUnit::INCH);

    bool pattern = false;
    for (size_t i = 1; i < parts.size(); i++) {
        const string& part = parts[i];
        if (part == "LZ") {
            // Leading zeros are written, trailing ones are not.
            state.format.set_zero_suppression(ZeroSuppression::TRAILING);
        } else if (part == "TZ") {
            state.format.set_zero_suppression(ZeroSuppression::LEADING);
        } else if (part.find('.') != string::npos) {
            const size_t point = part.find('.');
            state.format.set_digits(point, part.size() - point - 1);
            state.explicit_digits = true;
            pattern = true;
        }
    }
    if (!pattern && !state.explicit_digits) {
        if (metric) {
            state.format.set_digits(3, 3);
        } else {
            state.format.set_digits(2, 4);
        }
    }
}

// Tnn[F..S..]C<diameter>[F..S..] defines a tool, Tnn selects one.
void parse_tool(const string& line, DrillState& state, map<int, double>& bits)
{
    size_t pos = 1;
    const size_t start = pos;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) {
        pos++;
    }
    if (pos == start) {
        return; // Not a tool number, like TCST.
    }
    const int code = parse_code("tool number", line.substr(start, pos - start));

    const size_t c = line.find('C', pos);
    if (c != string::npos) {
        pos = c + 1;
        const string diameter = read_number(line, pos);
        bits[code] = state.format.length_to_mm(diameter);
    } else if (code == 0) {
        state.tool = boost::none;
    } else {
        state.tool = code;
    }
}

void parse_hit(const string& line, DrillState& state, const map<int, double>& bits,
               bool plated, drill_hits& holes, std::set<int>& used)
{
    boost::optional<string> x;
    boost::optional<string> y;
    size_t pos = 0;
    while (pos < line.size() && (line[pos] == 'X' || line[pos] == 'Y')) {
        const char letter = line[pos];
        pos++;
        const string value = read_number(line, pos);
        if (!is_number_token(value)) {
            throw parse_exception(string("coordinate ") + letter, line);
        }
        if (letter == 'X') {
            x = value;
        } else {
            y = value;
        }
    }
    // Anything after the coordinates (G85 slots and such) is ignored.

    if (x) {
        state.x = state.format.resolve(*x, state.x.value_or(0));
    }
    if (y) {
        state.y = state.format.resolve(*y, state.y.value_or(0));
    }
    if (!state.x || !state.y) {
        return;
    }

    if (!state.tool) {
        if (!state.warned_no_tool) {
            cerr << "Warning: Drill hit before any tool was selected; skipping it." << endl;
            state.warned_no_tool = true;
        }
        return;
    }
    const auto bit = bits.find(*state.tool);
    if (bit == bits.end()) {
        throw unknown_tool_exception(*state.tool);
    }
    holes.push_back(drill_hit{point_type_fp(*state.x, *state.y), bit->second, plated});
    used.insert(bit->first);
}

} // namespace

ExcellonProcessor::ExcellonProcessor(bool plated)
    : plated(plated)
{
}

/* Returns true iff the file could be opened. */
bool ExcellonProcessor::load_file(const string& path)
{
    std::ifstream in(path.c_str());
    if (!in.good()) {
        return false;
    }
    load(in);
    return true;
}

/******************************************************************************/
/*
 Parses the whole program.  The tool table and the holes are only
 replaced if the file parses without errors.
 */
/******************************************************************************/
void ExcellonProcessor::load(std::istream& in)
{
    DrillState state;
    map<int, double> bits;
    drill_hits holes;
    std::set<int> used;

    string line;
    while (std::getline(in, line)) {
        boost::trim(line);
        if (line.empty()) {
            continue;
        }
        if (line[0] == ';') {
            parse_format_comment(line, state);
            continue;
        }
        boost::to_upper(line);

        if (line == "M30" || line == "M00") {
            break;
        } else if (boost::starts_with(line, "METRIC") || boost::starts_with(line, "INCH")) {
            parse_units(line, state);
        } else if (line == "G90") {
            state.format.set_notation(Notation::ABSOLUTE);
        } else if (line == "G91" || line == "ICI,ON") {
            state.format.set_notation(Notation::INCREMENTAL);
        } else if (line == "ICI,OFF") {
            state.format.set_notation(Notation::ABSOLUTE);
        } else if (line[0] == 'T') {
            parse_tool(line, state, bits);
        } else if (line[0] == 'X' || line[0] == 'Y') {
            parse_hit(line, state, bits, plated, holes, used);
        }
        // M48, %, M95, FMAT, G05, VER and the rest change nothing we keep.
    }

    // Report all bits that are unused as warnings.
    for (const auto& bit : bits) {
        if (used.count(bit.first) == 0) {
            cerr << format("Warning: bit %1% (%2% mm) has no associated holes.\n")
                    % tool_name(bit.first) % bit.second;
        }
    }

    parsed_bits.swap(bits);
    parsed_holes.swap(holes);
}
