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

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "input_files.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using boost::format;
namespace fs = boost::filesystem;

static const string EDGE_CUTS_SUFFIX = "-Edge_Cuts.gbr";

vector<string> find_by_suffix(const string& directory, const string& suffix) {
  vector<string> result;
  boost::system::error_code ec;
  fs::directory_iterator it(directory.empty() ? "." : directory, ec);
  if (ec) {
    return result;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!fs::is_regular_file(it->status())) {
      continue;
    }
    const string name = it->path().filename().string();
    if (name.size() > suffix.size() && boost::ends_with(name, suffix)) {
      result.push_back(it->path().string());
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

bool is_profile_gerber(const string& path) {
  std::ifstream in(path.c_str(), std::ios::binary);
  if (!in.good()) {
    return false;
  }
  const string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return text.find("FileFunction,Profile") != string::npos ||
         text.find("AperFunction,Profile") != string::npos;
}

boost::optional<string> find_outline(const string& directory) {
  const vector<string> edge_cuts = find_by_suffix(directory, EDGE_CUTS_SUFFIX);
  if (!edge_cuts.empty()) {
    if (edge_cuts.size() > 1) {
      cerr << format("Warning: Found %1% outline files, using %2%.\n")
              % edge_cuts.size() % edge_cuts.front();
    }
    return edge_cuts.front();
  }
  for (const auto& gerber : find_by_suffix(directory, ".gbr")) {
    if (is_profile_gerber(gerber)) {
      return gerber;
    }
  }
  return boost::none;
}

static boost::optional<string> find_first(const string& directory, const string& suffix) {
  const vector<string> found = find_by_suffix(directory, suffix);
  if (found.empty()) {
    return boost::none;
  }
  return found.front();
}

boost::optional<string> find_plated_drill(const string& directory) {
  return find_first(directory, "-PTH.drl");
}

boost::optional<string> find_non_plated_drill(const string& directory) {
  return find_first(directory, "-NPTH.drl");
}

string project_name(const string& outline_path) {
  const fs::path path(outline_path);
  const string name = path.filename().string();
  if (name.size() > EDGE_CUTS_SUFFIX.size() && boost::iends_with(name, EDGE_CUTS_SUFFIX)) {
    return name.substr(0, name.size() - EDGE_CUTS_SUFFIX.size());
  }
  return path.stem().string();
}

string default_output_name(const string& outline_path) {
  return project_name(outline_path) + "-outline-mounting-holes.dxf";
}
