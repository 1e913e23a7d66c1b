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

#ifndef GERBERIMPORTER_H
#define GERBERIMPORTER_H

#include <string>
#include <iostream>

#include "geometry.hpp"
#include "coordinate.hpp"

/******************************************************************************/
/*
 Splits an RS274-X stream into its '*' terminated blocks.  Blocks inside
 a %...% pair are extended (parameter) commands.  Line breaks carry no
 meaning and are dropped.
 */
/******************************************************************************/
class GerberBlockReader {
public:
  struct block {
    std::string text;
    bool extended;
  };

  GerberBlockReader(std::istream& in) : in(in), extended(false) {}
  // Returns false at the end of input.  An unterminated last block is dropped.
  bool next(block& result);

private:
  std::istream& in;
  bool extended;
};

/******************************************************************************/
/*
 Importer for the board outline layer of RS274-X Gerber files.

 Only the path of the plotter is kept: every D01 draw becomes one line or
 arc segment, in millimeters, in the order of the file.  Apertures,
 flashes, regions and attributes don't change the outline and are
 skipped.
 */
/******************************************************************************/
class GerberImporter {
public:
  GerberImporter();
  // Returns false if the file can't be opened.  Throws on malformed input.
  bool load_file(const std::string& path);
  void load(std::istream& in);

  const outline_segments& get_segments() const {
    return segments;
  }

private:
  outline_segments segments;
};

// Signed sweep from start to stop around center, in radians.  Clockwise
// sweeps are negative.
double get_angle(const point_type_fp& start, const point_type_fp& center,
                 const point_type_fp& stop, bool clockwise);

#endif // GERBERIMPORTER_H
