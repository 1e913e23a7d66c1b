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

#include "hole_filter.hpp"

double round_to_micrometer(double mm) {
  return std::round(mm * 1000) / 1000;
}

bool DiameterRange::contains(double diameter) const {
  const double rounded = round_to_micrometer(diameter);
  if (rounded < round_to_micrometer(min_mm)) {
    return false;
  }
  if (max_mm && rounded > round_to_micrometer(*max_mm)) {
    return false;
  }
  return true;
}

drill_hits filter_holes(const drill_hits& hits, const DiameterRange& range) {
  drill_hits result;
  for (const auto& hit : hits) {
    if (range.contains(hit.diameter)) {
      result.push_back(hit);
    }
  }
  return result;
}
