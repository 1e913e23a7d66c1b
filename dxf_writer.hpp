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

#ifndef DXF_WRITER_HPP
#define DXF_WRITER_HPP

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "geometry.hpp"

// The start and the end of an arc aren't on the same circle.
struct geometry_exception : public std::exception {
  geometry_exception(const std::string& what) {
    what_string = what;
  }

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

// How far apart the start and end radii of an arc may be, in mm.
const double ARC_RADIUS_TOLERANCE = 0.005;

// An arc the way DXF stores it: always counter-clockwise from
// start_angle to end_angle, in degrees within [0, 360).
struct dxf_arc_params {
  point_type_fp center;
  double radius;
  double start_angle;
  double end_angle;
};

// Throws geometry_exception if the arc isn't circular.
dxf_arc_params dxf_arc(const arc_segment& arc);

// Maps any angle in degrees into [0, 360).
double normalize_degrees(double degrees);

/******************************************************************************/
/*
 Collects the board outline on layer OUTLINE and the mounting holes on
 layer MOUNTING_HOLES, then writes them as one DXF R12 style document
 with millimeter units.
 */
/******************************************************************************/
class dxf_writer {
 public:
  static const std::string OUTLINE_LAYER;
  static const std::string HOLES_LAYER;

  dxf_writer() {}
  void add(const outline_segment& segment);
  void add(const outline_segments& segments);
  void add(const drill_hit& hole);
  void add(const drill_hits& holes);

  size_t outline_count() const {
    return outline.size();
  }
  size_t hole_count() const {
    return holes.size();
  }

  void write(std::ostream& out) const;
  // Returns false if the file can't be written.
  bool write(const std::string& filename) const;

 private:
  std::vector<std::string> outline;
  std::vector<std::string> holes;
};

#endif // DXF_WRITER_HPP
