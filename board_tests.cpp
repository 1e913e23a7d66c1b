#define BOOST_TEST_MODULE board tests
#include <boost/test/included/unit_test.hpp>

#include <sstream>
#include <string>
using std::string;

#include "board.hpp"
#include "drill.hpp"
#include "dxf_writer.hpp"
#include "gerberimporter.hpp"

BOOST_AUTO_TEST_SUITE(board_tests)

const string OUTLINE =
    "%FSLAX46Y46*%\n"
    "%MOMM*%\n"
    "%ADD10C,0.100000*%\n"
    "D10*\n"
    "G01*\n"
    "X0Y0D02*\n"
    "X100000000Y0D01*\n"
    "X100000000Y50000000D01*\n"
    "X0Y50000000D01*\n"
    "X0Y0D01*\n"
    "M02*\n";

const string PTH =
    "M48\n"
    "METRIC\n"
    "T1C0.800\n"
    "T2C3.200\n"
    "%\n"
    "G90\n"
    "T1\n"
    "X50.0Y25.0\n"
    "T2\n"
    "X5.0Y5.0\n"
    "M30\n";

const string NPTH =
    "M48\n"
    "METRIC\n"
    "T1C6.000\n"
    "%\n"
    "T1\n"
    "X95.0Y45.0\n"
    "M30\n";

outline_segments import_outline(const string& gerber) {
  std::istringstream in(gerber);
  GerberImporter importer;
  importer.load(in);
  return importer.get_segments();
}

drill_hits import_drill(const string& excellon, bool plated) {
  std::istringstream in(excellon);
  ExcellonProcessor processor(plated);
  processor.load(in);
  return processor.get_holes();
}

Board make_board(const DiameterRange& range) {
  Board board(range);
  board.set_outline(import_outline(OUTLINE));
  board.add_drill_hits(import_drill(PTH, true));
  board.add_drill_hits(import_drill(NPTH, false));
  return board;
}

size_t count(const string& text, const string& needle) {
  size_t result = 0;
  for (size_t pos = text.find(needle); pos != string::npos; pos = text.find(needle, pos + 1)) {
    result++;
  }
  return result;
}

BOOST_AUTO_TEST_CASE(rectangle_with_two_mounting_holes) {
  const Board board = make_board(DiameterRange(3.0));
  std::ostringstream out;
  board.write(out);
  const string dxf = out.str();

  BOOST_CHECK_EQUAL(count(dxf, "0\nLINE\n8\nOUTLINE\n"), 4);
  BOOST_CHECK_EQUAL(count(dxf, "0\nCIRCLE\n8\nMOUNTING_HOLES\n"), 2);
  BOOST_CHECK_EQUAL(count(dxf, "0\nARC\n"), 0);
  BOOST_CHECK(dxf.find("10\n5.000000\n20\n5.000000\n30\n0.0\n40\n1.600000\n") != string::npos);
  BOOST_CHECK(dxf.find("10\n95.000000\n20\n45.000000\n30\n0.0\n40\n3.000000\n") != string::npos);
  // The 0.8 mm via isn't a mounting hole.
  BOOST_CHECK(dxf.find("40\n0.400000\n") == string::npos);
  // Plated holes are written first.
  BOOST_CHECK(dxf.find("40\n1.600000\n") < dxf.find("40\n3.000000\n"));

  const RunSummary summary = board.summarize();
  BOOST_CHECK_EQUAL(summary.outline_entities, 4);
  BOOST_CHECK_EQUAL(summary.holes, 2);
  BOOST_CHECK_EQUAL(summary.plated_holes, 1);
  BOOST_CHECK_EQUAL(summary.non_plated_holes, 1);
  BOOST_REQUIRE_EQUAL(summary.diameters.size(), 2);
  BOOST_CHECK_CLOSE(summary.diameters[0], 3.2, 1e-9);
  BOOST_CHECK_CLOSE(summary.diameters[1], 6.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(upper_bound) {
  const Board board = make_board(DiameterRange(3.0, 5.0));
  const drill_hits holes = board.mounting_holes();
  BOOST_REQUIRE_EQUAL(holes.size(), 1);
  BOOST_CHECK_CLOSE(holes[0].diameter, 3.2, 1e-9);
  BOOST_CHECK_EQUAL(board.get_drill_hits().size(), 3);

  const RunSummary summary = board.summarize();
  BOOST_CHECK_EQUAL(summary.holes, 1);
  BOOST_CHECK_EQUAL(summary.non_plated_holes, 0);
}

BOOST_AUTO_TEST_CASE(no_holes) {
  const Board board = make_board(DiameterRange(10.0));
  std::ostringstream out;
  board.write(out);
  BOOST_CHECK_EQUAL(count(out.str(), "CIRCLE"), 0);
  BOOST_CHECK(board.summarize().diameters.empty());
}

BOOST_AUTO_TEST_CASE(bad_arc_writes_nothing) {
  Board board((DiameterRange()));
  outline_segments outline;
  outline.push_back(line_segment{point_type_fp(0, 0), point_type_fp(10, 0)});
  outline.push_back(arc_segment{point_type_fp(10, 0), point_type_fp(0, 12), point_type_fp(0, 0),
                                ArcDirection::COUNTERCLOCKWISE});
  board.set_outline(outline);
  std::ostringstream out;
  BOOST_CHECK_THROW(board.write(out), geometry_exception);
  BOOST_CHECK(out.str().empty());
}

BOOST_AUTO_TEST_SUITE_END()
