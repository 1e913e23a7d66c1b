/*
 * This file is part of pcb2dxf.
 *
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net>
 * Copyright (C) 2010 Bernhard Kubicek <kubicek@gmx.at>
 * Copyright (C) 2013 Erik Schuster <erik@muenchen-ist-toll.de>
 * Copyright (C) 2014-2017 Nicola Corna <nicola@corna.info>
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

#include "options.hpp"
#include "config.h"

#include <fstream>
#include <sstream>
#include "units.hpp"

#include <iostream>
using std::cerr;
using std::endl;

using std::string;

/******************************************************************************/
/*
 */
/******************************************************************************/
options& options::instance() {
    static options singleton;
    return singleton;
}

void options::maybe_throw(const std::string& what, ErrorCodes error_code) {
  if (instance().vm["ignore-warnings"].as<bool>()) {
    cerr << "Ignoring error code " << error_code << ": " << what << endl;
  } else {
    throw pcb2dxf_parse_exception(what, error_code);
  }
}

/* parse options, both command line and from the dxfproject file if it exists.
 * Throws on error.
 */
void options::parse(int argc, const char** argv) {
    // guessing causes problems when one option is the start of another
    // (--output, --output-dir)
    int style = po::command_line_style::default_style
                & ~po::command_line_style::allow_guessing;

    po::options_description generic;
    generic.add(instance().cli_options).add(instance().cfg_options);

    try {
      po::store(po::parse_command_line(argc, argv, generic, style),
                instance().vm);
    } catch (std::logic_error& e) {
      throw pcb2dxf_parse_exception(std::string("Error: You've supplied an invalid parameter.\n"
                                                "Details: ")
                                    + e.what(), ERR_UNKNOWNPARAMETER);
    }

    po::notify(instance().vm);

    if( !instance().vm["noconfigfile"].as<bool>() )
        parse_files();

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
string options::help()
{
    std::stringstream msg;
    msg << PACKAGE_STRING << "\n\n";
    msg << instance().cli_options << instance().cfg_options;
    return msg.str();
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::parse_files()
{

    std::string file("dxfproject");

    std::ifstream stream(file.c_str());
    if (!stream.good()) {
        return;
    }
    try {
        po::store(po::parse_config_file(stream, instance().cfg_options),
                  instance().vm);
    } catch (std::exception& e) {
      maybe_throw("Error parsing configuration file \"" + file + "\": " +
                  e.what(), ERR_INVALIDPARAMETER);
    }

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
options::options()
         : cli_options("command line only options"), cfg_options("generic options (CLI and config files)") {

   cli_options.add_options()
       ("noconfigfile", po::value<bool>()->default_value(false)->implicit_value(true), "ignore any configuration file")
       ("help,?", "produce help message")
       ("version,V", "show the current software version");
   cfg_options.add_options()
       ("ignore-warnings", po::value<bool>()->default_value(false)->implicit_value(true), "Ignore warnings")
       ("outline", po::value<string>(), "board outline RS274-X .gbr (default: *-Edge_Cuts.gbr or a Profile layer in --input-dir)")
       ("pth", po::value<string>(), "plated through holes Excellon file (default: *-PTH.drl in --input-dir)")
       ("npth", po::value<string>(), "non-plated through holes Excellon file (default: *-NPTH.drl in --input-dir)")
       ("input-dir", po::value<string>()->default_value("."), "directory searched for the input files")
       ("min", po::value<Length>()->default_value(parse_length("3mm")),
        "minimum drill diameter to include as a mounting hole; millimeters if no unit is given")
       ("max", po::value<Length>(), "maximum drill diameter to include as a mounting hole (default: no maximum)")
       ("output-dir", po::value<string>()->default_value(""), "output directory")
       ("output", po::value<string>(), "output DXF file (default: <project>-outline-mounting-holes.dxf)");
}

/******************************************************************************/
/*
 */
/******************************************************************************/
static void check_hole_parameters(po::variables_map const& vm)
{
    const double min = vm["min"].as<Length>().asMillimeter(1);

    if (min < 0) {
      options::maybe_throw("Error: --min must be >= 0.", ERR_NEGATIVEMIN);
    }

    if (vm.count("max")) {
      const double max = vm["max"].as<Length>().asMillimeter(1);
      if (max < 0) {
        options::maybe_throw("Error: --max must be >= 0.", ERR_NEGATIVEMAX);
      }
      if (max < min) {
        options::maybe_throw("Error: --max must be >= --min.", ERR_MAXLOWERMIN);
      }
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::check_parameters()
{
  po::variables_map const& vm = instance().vm;

  try {
    check_hole_parameters(vm);
  } catch (std::runtime_error& re) {
    maybe_throw("Error: Invalid parameter. :-(", ERR_INVALIDPARAMETER);
  }
}

DiameterRange options::diameter_range()
{
  po::variables_map const& vm = instance().vm;
  DiameterRange range(vm["min"].as<Length>().asMillimeter(1));
  if (vm.count("max")) {
    range.max_mm = vm["max"].as<Length>().asMillimeter(1);
  }
  return range;
}
