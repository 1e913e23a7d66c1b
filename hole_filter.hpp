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

#ifndef HOLE_FILTER_H
#define HOLE_FILTER_H

#include <boost/optional.hpp>

#include "geometry.hpp"

// The band of drill diameters that count as mounting holes, in mm.  Both
// ends are inclusive.
struct DiameterRange {
  DiameterRange(double min_mm = 3.0, boost::optional<double> max_mm = boost::none)
      : min_mm(min_mm), max_mm(max_mm) {}

  bool contains(double diameter) const;

  double min_mm;
  boost::optional<double> max_mm;  // unset means no upper limit
};

// Diameters and bounds are compared at micrometer resolution so that
// values converted from inches still land on the bound.
double round_to_micrometer(double mm);

// The hits whose diameter is inside range, in the order they were given.
drill_hits filter_holes(const drill_hits& hits, const DiameterRange& range);

#endif // HOLE_FILTER_H
