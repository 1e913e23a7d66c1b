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

#include <cmath>

#include <set>

#include <string>
using std::string;

#include <vector>
using std::vector;

#include "board.hpp"
#include "dxf_writer.hpp"

Board::Board(const DiameterRange& range) :
    range(range) {}

void Board::add_drill_hits(const drill_hits& more)
{
    hits.insert(hits.end(), more.begin(), more.end());
}

drill_hits Board::mounting_holes() const
{
    return filter_holes(hits, range);
}

/******************************************************************************/
/*
 All the entities are formatted before the first byte goes out so that
 a bad arc doesn't leave half a document behind.
 */
/******************************************************************************/
static dxf_writer make_writer(const outline_segments& outline, const drill_hits& holes)
{
    dxf_writer writer;
    writer.add(outline);
    writer.add(holes);
    return writer;
}

void Board::write(std::ostream& out) const
{
    make_writer(outline, mounting_holes()).write(out);
}

bool Board::write(const string& filename) const
{
    return make_writer(outline, mounting_holes()).write(filename);
}

RunSummary Board::summarize() const
{
    const drill_hits holes = mounting_holes();
    RunSummary summary;
    summary.outline_entities = outline.size();
    summary.holes = holes.size();
    summary.plated_holes = 0;
    summary.non_plated_holes = 0;

    std::set<double> diameters;
    for (const auto& hole : holes) {
        if (hole.plated) {
            summary.plated_holes++;
        } else {
            summary.non_plated_holes++;
        }
        diameters.insert(std::round(hole.diameter * 1e6) / 1e6);
    }
    summary.diameters = vector<double>(diameters.begin(), diameters.end());
    return summary;
}
