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

#include <cmath>
#include <fstream>
#include <utility>
#include <string>
#include <boost/format.hpp>
#include <boost/variant.hpp>

#include "dxf_writer.hpp"

using std::string;
using boost::format;

const string dxf_writer::OUTLINE_LAYER = "OUTLINE";
const string dxf_writer::HOLES_LAYER = "MOUNTING_HOLES";

double normalize_degrees(double degrees) {
  double result = std::fmod(degrees, 360.0);
  if (result < 0) {
    result += 360.0;
  }
  if (result >= 360.0) {
    result -= 360.0; // -1e-15 + 360 rounds to 360
  }
  return result + 0.0; // no negative zero
}

static double degrees_of(const point_type_fp& p, const point_type_fp& center) {
  return atan2(p.y() - center.y(), p.x() - center.x()) * 180 / bg::math::pi<double>();
}

dxf_arc_params dxf_arc(const arc_segment& arc) {
  const double start_radius = bg::distance(arc.start, arc.center);
  const double end_radius = bg::distance(arc.end, arc.center);
  if (std::abs(start_radius - end_radius) > ARC_RADIUS_TOLERANCE) {
    throw geometry_exception(str(
        format("Arc from (%.6f, %.6f) to (%.6f, %.6f) around (%.6f, %.6f) has radii %.6f and %.6f")
        % arc.start.x() % arc.start.y() % arc.end.x() % arc.end.y()
        % arc.center.x() % arc.center.y() % start_radius % end_radius));
  }

  dxf_arc_params result;
  result.center = arc.center;
  result.radius = end_radius;
  if (bg::equals(arc.start, arc.end)) {
    // Full circle.
    result.start_angle = 0;
    result.end_angle = 360;
    return result;
  }
  result.start_angle = normalize_degrees(degrees_of(arc.start, arc.center));
  result.end_angle = normalize_degrees(degrees_of(arc.end, arc.center));
  if (arc.direction == ArcDirection::CLOCKWISE) {
    // DXF arcs always run counter-clockwise.
    std::swap(result.start_angle, result.end_angle);
  }
  return result;
}

namespace {

class entity_visitor : public boost::static_visitor<string> {
 public:
  string operator()(const line_segment& line) const {
    return str(format("0\nLINE\n8\n%s\n10\n%.6f\n20\n%.6f\n30\n0.0\n11\n%.6f\n21\n%.6f\n31\n0.0\n")
               % dxf_writer::OUTLINE_LAYER
               % line.start.x() % line.start.y() % line.end.x() % line.end.y());
  }
  string operator()(const arc_segment& arc) const {
    const dxf_arc_params params = dxf_arc(arc);
    return str(format("0\nARC\n8\n%s\n10\n%.6f\n20\n%.6f\n30\n0.0\n40\n%.6f\n50\n%.6f\n51\n%.6f\n")
               % dxf_writer::OUTLINE_LAYER
               % params.center.x() % params.center.y()
               % params.radius % params.start_angle % params.end_angle);
  }
};

string layer_entry(const string& name, int color) {
  return str(format("0\nLAYER\n2\n%1%\n70\n0\n62\n%2%\n6\nCONTINUOUS\n") % name % color);
}

} // namespace

void dxf_writer::add(const outline_segment& segment) {
  outline.push_back(boost::apply_visitor(entity_visitor(), segment));
}

void dxf_writer::add(const outline_segments& segments) {
  for (const auto& segment : segments) {
    add(segment);
  }
}

void dxf_writer::add(const drill_hit& hole) {
  holes.push_back(str(format("0\nCIRCLE\n8\n%s\n10\n%.6f\n20\n%.6f\n30\n0.0\n40\n%.6f\n")
                      % HOLES_LAYER
                      % hole.position.x() % hole.position.y() % (hole.diameter / 2)));
}

void dxf_writer::add(const drill_hits& holes) {
  for (const auto& hole : holes) {
    add(hole);
  }
}

void dxf_writer::write(std::ostream& out) const {
  out << "0\nSECTION\n2\nHEADER\n"
      << "9\n$INSUNITS\n70\n4\n"
      << "0\nENDSEC\n";

  out << "0\nSECTION\n2\nTABLES\n"
      << "0\nTABLE\n2\nLAYER\n70\n2\n"
      << layer_entry(OUTLINE_LAYER, 7)
      << layer_entry(HOLES_LAYER, 1)
      << "0\nENDTAB\n"
      << "0\nENDSEC\n";

  out << "0\nSECTION\n2\nENTITIES\n";
  for (const auto& entity : outline) {
    out << entity;
  }
  for (const auto& entity : holes) {
    out << entity;
  }
  out << "0\nENDSEC\n"
      << "0\nEOF\n";
}

bool dxf_writer::write(const string& filename) const {
  std::ofstream out(filename.c_str());
  if (!out.good()) {
    return false;
  }
  write(out);
  out.close();
  return !out.fail();
}
