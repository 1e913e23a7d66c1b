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

#ifndef DRILL_H
#define DRILL_H

#include <map>
#include <string>
#include <iostream>

#include "geometry.hpp"
#include "coordinate.hpp"

// The tool code the way drill files write it, like "T05".
std::string tool_name(int tool_code);

// A hit uses a tool that the tool table doesn't define.
class unknown_tool_exception : public std::exception {
public:
    unknown_tool_exception(int tool_code);

    virtual const char* what() const throw()
    {
        return what_string.c_str();
    }
    int tool_code() const {
        return code;
    }

private:
    int code;
    std::string what_string;
};

/******************************************************************************/
/*
 Reads Excellon drill files and extracts every drill hit with the
 diameter of the tool that drills it.  Whether the holes are plated
 isn't in the file; the caller knows it from which file it is (PTH or
 NPTH).
 */
/******************************************************************************/
class ExcellonProcessor
{
public:
    ExcellonProcessor(bool plated);
    // Returns false if the file can't be opened.  Throws on malformed input.
    bool load_file(const std::string& path);
    void load(std::istream& in);

    // Tool number to diameter in mm.
    const std::map<int, double>& get_bits() const {
        return parsed_bits;
    }
    const drill_hits& get_holes() const {
        return parsed_holes;
    }

private:
    const bool plated;
    std::map<int, double> parsed_bits;
    drill_hits parsed_holes;
};

#endif // DRILL_H
