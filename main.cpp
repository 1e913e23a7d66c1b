/*
 * This file is part of pcb2dxf.
 *
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net> and others
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

#include <iostream>

#include <vector>
using std::vector;

using std::cout;
using std::cerr;
using std::endl;
using std::flush;

#include <string>
using std::string;

#include "config.h"
#include "gerberimporter.hpp"
#include "drill.hpp"
#include "dxf_writer.hpp"
#include "board.hpp"
#include "input_files.hpp"
#include "common.hpp"
#include "options.hpp"

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/version.hpp>

using boost::format;

/******************************************************************************/
/*
 Runs load on path and turns the parser errors into error codes that
 name the file.
 */
/******************************************************************************/
template <typename loader_t>
void import_file(const string& path, loader_t& loader)
{
    bool opened;
    try {
        opened = loader.load_file(path);
    } catch (const format_exception& e) {
        throw pcb2dxf_parse_exception("Error in \"" + path + "\": " + e.what(), ERR_FORMAT);
    } catch (const parse_exception& e) {
        throw pcb2dxf_parse_exception("Error in \"" + path + "\": " + e.what(), ERR_PARSE);
    } catch (const unknown_tool_exception& e) {
        throw pcb2dxf_parse_exception("Error in \"" + path + "\": " + e.what(), ERR_UNKNOWNTOOL);
    }
    if (!opened) {
        throw pcb2dxf_parse_exception("Error: Can't open \"" + path + "\".", ERR_IO);
    }
}

boost::optional<string> drill_file(const po::variables_map& vm, const string& option,
                                   boost::optional<string> (*find)(const string&))
{
    if (vm.count(option)) {
        return vm[option].as<string>();
    }
    return find(vm["input-dir"].as<string>());
}

void import_drill(const string& name, const boost::optional<string>& path, bool plated, Board& board)
{
    cout << "Importing " << name << " drill... " << flush;
    if (!path) {
        cout << "not specified.\n";
        return;
    }
    ExcellonProcessor processor(plated);
    import_file(*path, processor);
    board.add_drill_hits(processor.get_holes());
    cout << "DONE.\n";
}

void print_summary(const string& output, const RunSummary& summary, const DiameterRange& range)
{
    cout << "Output file: " << output << "\n";
    cout << "Outline entities: " << summary.outline_entities << "\n";
    if (range.max_mm) {
        cout << format("Hole count (%.4f to %.4f mm): %d\n") % range.min_mm % *range.max_mm % summary.holes;
    } else {
        cout << format("Hole count (>= %.4f mm): %d\n") % range.min_mm % summary.holes;
    }
    if (summary.holes > 0) {
        cout << format("  plated: %d, non-plated: %d\n") % summary.plated_holes % summary.non_plated_holes;
    }

    string diameters;
    for (const double diameter : summary.diameters) {
        if (!diameters.empty()) {
            diameters += ", ";
        }
        diameters += str(format("%.4f") % diameter);
    }
    cout << "Diameters used (mm): " << (diameters.empty() ? "none" : diameters) << endl;
}

void do_pcb2dxf(int argc, const char* argv[]) {
    options::parse(argc, argv);      //parse the command line parameters

    po::variables_map& vm = options::get_vm();      //get the cli parameters

    if (vm.count("version")) {       //return version and quit
      cout << PACKAGE_VERSION << endl;
      cout << "Boost: " << BOOST_VERSION << endl;
      return;
    }

    if (vm.count("help")) {       //return help and quit
      cout << options::help();
      return;
    }

    options::check_parameters();      //check the cli parameters

    const string input_dir = vm["input-dir"].as<string>();
    boost::optional<string> outline;
    if (vm.count("outline")) {
        outline = vm["outline"].as<string>();
    } else {
        outline = find_outline(input_dir);
    }
    if (!outline) {
        throw pcb2dxf_parse_exception("Error: No edge-cuts/profile Gerber found in \"" + input_dir + "\".",
                                      ERR_NOOUTLINE);
    }

    const DiameterRange range = options::diameter_range();
    Board board(range);

    cout << "Importing outline... " << flush;
    GerberImporter importer;
    import_file(*outline, importer);
    board.set_outline(importer.get_segments());
    cout << "DONE.\n";
    if (importer.get_segments().empty()) {
        cerr << "Warning: The outline file has no drawn segments.\n";
    }

    // Plated holes come first.
    import_drill("PTH", drill_file(vm, "pth", find_plated_drill), true, board);
    import_drill("NPTH", drill_file(vm, "npth", find_non_plated_drill), false, board);

    const string output_name = vm.count("output") ? vm["output"].as<string>() : default_output_name(*outline);
    const string output = build_filename(vm["output-dir"].as<string>(), output_name);

    cout << "Exporting DXF... " << flush;
    bool written;
    try {
        written = board.write(output);
    } catch (const geometry_exception& e) {
        throw pcb2dxf_parse_exception(string("Error: ") + e.what(), ERR_GEOMETRY);
    }
    if (!written) {
        throw pcb2dxf_parse_exception("Error: Can't write \"" + output + "\".", ERR_IO);
    }
    cout << "DONE.\n";

    print_summary(output, board.summarize(), range);
}

int main(int argc, const char* argv[]) {
  try {
    do_pcb2dxf(argc, argv);
  } catch (const pcb2dxf_parse_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return 0;
}
