/*
 * This file is part of pcb2dxf.
 *
 * Copyright (C) 2016 Nicola Corna <nicola@corna.info>
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

#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/geometries.hpp>
#include <boost/variant.hpp>

// All coordinates are in millimeters.
typedef double coordinate_type_fp;

typedef boost::geometry::model::d2::point_xy<coordinate_type_fp> point_type_fp;

namespace bg = boost::geometry;

namespace ArcDirection {
enum ArcDirection {
  CLOCKWISE,
  COUNTERCLOCKWISE
};
}; // namespace ArcDirection

struct line_segment {
  point_type_fp start;
  point_type_fp end;
};

struct arc_segment {
  point_type_fp start;
  point_type_fp end;
  point_type_fp center;
  ArcDirection::ArcDirection direction;
};

// One piece of the board outline, as drawn by the plotter.
typedef boost::variant<line_segment, arc_segment> outline_segment;
typedef std::vector<outline_segment> outline_segments;

inline const point_type_fp& segment_start(const outline_segment& segment) {
  if (const line_segment* line = boost::get<line_segment>(&segment)) {
    return line->start;
  }
  return boost::get<arc_segment>(segment).start;
}

inline const point_type_fp& segment_end(const outline_segment& segment) {
  if (const line_segment* line = boost::get<line_segment>(&segment)) {
    return line->end;
  }
  return boost::get<arc_segment>(segment).end;
}

struct drill_hit {
  point_type_fp position;
  double diameter;  // mm
  bool plated;
};
typedef std::vector<drill_hit> drill_hits;

#endif
