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

#ifndef INPUT_FILES_H
#define INPUT_FILES_H

#include <string>
#include <vector>
#include <boost/optional.hpp>

/******************************************************************************/
/*
 Finds the inputs of a KiCad style fabrication output directory by
 their file names:

   <project>-Edge_Cuts.gbr   board outline
   <project>-PTH.drl         plated holes
   <project>-NPTH.drl        non-plated holes

 When there is no *-Edge_Cuts.gbr, the first *.gbr that declares itself
 a profile layer through its attributes is the outline.
 */
/******************************************************************************/

// The regular files in directory whose names end in suffix, sorted by name.
std::vector<std::string> find_by_suffix(const std::string& directory, const std::string& suffix);

// True iff the Gerber file carries a Profile file or aperture function.
bool is_profile_gerber(const std::string& path);

boost::optional<std::string> find_outline(const std::string& directory);
boost::optional<std::string> find_plated_drill(const std::string& directory);
boost::optional<std::string> find_non_plated_drill(const std::string& directory);

// "board-Edge_Cuts.gbr" gives "board", anything else its stem.
std::string project_name(const std::string& outline_path);

// <project>-outline-mounting-holes.dxf
std::string default_output_name(const std::string& outline_path);

#endif // INPUT_FILES_H
