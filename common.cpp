/*
 * This file is part of pcb2dxf.
 *
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

#include "common.hpp"

using std::string;

#include <boost/system/api_config.hpp>  // for BOOST_POSIX_API

// Based on the explanation here:
// https://www.geeksforgeeks.org/python-os-path-join-method/
string build_filename(const string& a, const string& b) {
#ifdef BOOST_WINDOWS_API
  static constexpr auto separator = '\\';
#endif

#ifdef BOOST_POSIX_API
  static constexpr auto separator = '/';
#endif

  if (a.size() == 0 || (b.size() > 0 && b.front() == separator)) {
    return b;
  }
  if (b.size() == 0) {
    if (a.back() != separator) {
      return a + separator;
    } else {
      return a;
    }
  }
  if (a.back() != separator) {
    return a + separator + b;
  } else {
    return a + b;
  }
}
