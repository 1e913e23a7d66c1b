/*
 * This file is part of pcb2dxf.
 *
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net>
 * Copyright (C) 2015 Nicola Corna <nicola@corna.info>
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

#ifndef BOARD_H
#define BOARD_H

#include <iostream>
#include <string>
#include <vector>

#include "geometry.hpp"
#include "hole_filter.hpp"

// What one run produced, for the report.
struct RunSummary {
    size_t outline_entities;
    size_t holes;
    size_t plated_holes;
    size_t non_plated_holes;
    std::vector<double> diameters;  // distinct, ascending, mm
};

/******************************************************************************/
/*
 Represents a printed circuit board: the outline of one Gerber file and
 the drill hits of any number of drill files, in the order they were
 added.  Only the holes inside the diameter range are exported.
 */
/******************************************************************************/
class Board
{
public:
    Board(const DiameterRange& range);

    void set_outline(const outline_segments& segments) {
        outline = segments;
    }
    void add_drill_hits(const drill_hits& hits);

    const drill_hits& get_drill_hits() const {
        return hits;
    }
    drill_hits mounting_holes() const;

    // Throws geometry_exception before anything is written.
    void write(std::ostream& out) const;
    // Returns false if the file can't be written.
    bool write(const std::string& filename) const;

    RunSummary summarize() const;

private:
    const DiameterRange range;
    outline_segments outline;
    drill_hits hits;
};

#endif // BOARD_H
