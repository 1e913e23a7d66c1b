#define BOOST_TEST_MODULE gerberimporter tests
#include <boost/test/included/unit_test.hpp>

#include <sstream>
#include <string>
using std::string;


#include "gerberimporter.hpp"

BOOST_AUTO_TEST_SUITE(gerberimporter_tests)

outline_segments import(const string& gerber) {
  std::istringstream in(gerber);
  GerberImporter importer;
  importer.load(in);
  return importer.get_segments();
}

const string HEADER =
    "G04 test board*\n"
    "%FSLAX46Y46*%\n"
    "%MOMM*%\n"
    "%TF.FileFunction,Profile,NP*%\n"
    "%ADD10C,0.100000*%\n"
    "G01*\n"
    "D10*\n";

const string RECTANGLE =
    HEADER +
    "X0Y0D02*\n"
    "X100000000Y0D01*\n"
    "X100000000Y50000000D01*\n"
    "X0Y50000000D01*\n"
    "X0Y0D01*\n"
    "M02*\n";

void check_point(const point_type_fp& p, double x, double y) {
  BOOST_CHECK_SMALL(p.x() - x, 1e-9);
  BOOST_CHECK_SMALL(p.y() - y, 1e-9);
}

BOOST_AUTO_TEST_CASE(block_reader) {
  std::istringstream in("%FSLAX46Y46*%\r\nG01*X1\nY2D01*\n%ADD10C,0.1*%M02*");
  GerberBlockReader reader(in);
  GerberBlockReader::block block;
  BOOST_REQUIRE(reader.next(block));
  BOOST_CHECK_EQUAL(block.text, "FSLAX46Y46");
  BOOST_CHECK(block.extended);
  BOOST_REQUIRE(reader.next(block));
  BOOST_CHECK_EQUAL(block.text, "G01");
  BOOST_CHECK(!block.extended);
  BOOST_REQUIRE(reader.next(block));
  BOOST_CHECK_EQUAL(block.text, "X1Y2D01");
  BOOST_REQUIRE(reader.next(block));
  BOOST_CHECK_EQUAL(block.text, "ADD10C,0.1");
  BOOST_CHECK(block.extended);
  BOOST_REQUIRE(reader.next(block));
  BOOST_CHECK_EQUAL(block.text, "M02");
  BOOST_CHECK(!reader.next(block));
}

BOOST_AUTO_TEST_CASE(rectangle) {
  const outline_segments segments = import(RECTANGLE);
  BOOST_REQUIRE_EQUAL(segments.size(), 4);
  for (const auto& segment : segments) {
    BOOST_CHECK(boost::get<line_segment>(&segment) != nullptr);
  }
  check_point(segment_start(segments[0]), 0, 0);
  check_point(segment_end(segments[0]), 100, 0);
  check_point(segment_end(segments[1]), 100, 50);
  check_point(segment_end(segments[2]), 0, 50);
  check_point(segment_end(segments[3]), 0, 0);
}

BOOST_AUTO_TEST_CASE(consecutive_draws_share_endpoints) {
  const outline_segments segments = import(RECTANGLE);
  for (size_t i = 1; i < segments.size(); i++) {
    BOOST_CHECK(bg::equals(segment_end(segments[i - 1]), segment_start(segments[i])));
  }
}

BOOST_AUTO_TEST_CASE(gaps_are_kept) {
  const outline_segments segments = import(
      HEADER +
      "X0Y0D02*X10000000Y0D01*"
      "X20000000Y0D02*X30000000Y0D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 2);
  check_point(segment_end(segments[0]), 10, 0);
  check_point(segment_start(segments[1]), 20, 0);
}

BOOST_AUTO_TEST_CASE(inches) {
  const outline_segments segments = import(
      "%FSLAX24Y24*%%MOIN*%"
      "X0Y0D02*X10000Y5000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_end(segments[0]), 25.4, 12.7);
}

BOOST_AUTO_TEST_CASE(legacy_units_and_trailing_zeros) {
  const outline_segments segments = import(
      "%FSTAX33Y33*%G70*"
      "X0Y0D02*X001Y0005D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_end(segments[0]), 25.4, 12.7);
}

BOOST_AUTO_TEST_CASE(omitted_axis_keeps_its_value) {
  const outline_segments segments = import(
      HEADER + "X1000000Y2000000D02*X5000000D01*Y7000000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 2);
  check_point(segment_end(segments[0]), 5, 2);
  check_point(segment_end(segments[1]), 5, 7);
}

BOOST_AUTO_TEST_CASE(operation_code_is_modal) {
  const outline_segments segments = import(
      HEADER + "X0Y0D02*X1000000D01*X2000000*X3000000*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 3);
  check_point(segment_end(segments[2]), 3, 0);
}

BOOST_AUTO_TEST_CASE(flashes_only_move) {
  const outline_segments segments = import(
      HEADER + "X5000000Y5000000D03*X6000000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_start(segments[0]), 5, 5);
}

BOOST_AUTO_TEST_CASE(draw_without_current_point) {
  const outline_segments segments = import(
      HEADER + "X1000000Y1000000D01*X2000000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_start(segments[0]), 1, 1);
}

BOOST_AUTO_TEST_CASE(end_of_program_discards_the_rest) {
  const outline_segments segments = import(
      HEADER + "X0Y0D02*X1000000D01*M02*X5000000D01*");
  BOOST_CHECK_EQUAL(segments.size(), 1);
}

BOOST_AUTO_TEST_CASE(unknown_commands_are_skipped) {
  const outline_segments segments = import(
      HEADER +
      "%AMOC8*5,1,8,0,0,1.08239X$1,22.5*%"
      "%LPD*%"
      "%TA.AperFunction,Profile*%"
      "G36*G37*"
      "G54D10*"
      "X0Y0D02*X1000000D01*"
      "M02*");
  BOOST_CHECK_EQUAL(segments.size(), 1);
}

BOOST_AUTO_TEST_CASE(sequence_numbers_are_ignored) {
  const outline_segments segments = import(
      "%FSLAX46Y46*%%MOMM*%N1X0Y0D02*N2X1000000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_start(segments[0]), 0, 0);
  check_point(segment_end(segments[0]), 1, 0);
}

BOOST_AUTO_TEST_CASE(feed_and_speed_words_are_ignored) {
  const outline_segments segments = import(
      HEADER + "X0Y0D02*F100S2X2000000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_end(segments[0]), 2, 0);
}

BOOST_AUTO_TEST_CASE(draw_without_aperture) {
  const outline_segments segments = import(
      "%FSLAX46Y46*%%MOMM*%X0Y0D02*X1000000D01*M02*");
  BOOST_CHECK_EQUAL(segments.size(), 1);
}

BOOST_AUTO_TEST_CASE(counter_clockwise_arc) {
  const outline_segments segments = import(
      HEADER + "G75*X10000000Y0D02*G03X0Y10000000I-10000000J0D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  const arc_segment* arc = boost::get<arc_segment>(&segments[0]);
  BOOST_REQUIRE(arc != nullptr);
  BOOST_CHECK_EQUAL(arc->direction, ArcDirection::COUNTERCLOCKWISE);
  check_point(arc->start, 10, 0);
  check_point(arc->end, 0, 10);
  check_point(arc->center, 0, 0);
}

BOOST_AUTO_TEST_CASE(clockwise_arc_and_modal_interpolation) {
  const outline_segments segments = import(
      HEADER + "X0Y10000000D02*G02X10000000Y0I0J-10000000D01*X20000000Y0D01*G01X30000000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 3);
  const arc_segment* arc = boost::get<arc_segment>(&segments[0]);
  BOOST_REQUIRE(arc != nullptr);
  BOOST_CHECK_EQUAL(arc->direction, ArcDirection::CLOCKWISE);
  check_point(arc->center, 0, 0);
  // Still G02, without I and J.
  const arc_segment* second = boost::get<arc_segment>(&segments[1]);
  BOOST_REQUIRE(second != nullptr);
  check_point(second->center, 10, 0);
  BOOST_CHECK(boost::get<line_segment>(&segments[2]) != nullptr);
}

BOOST_AUTO_TEST_CASE(single_quadrant_arc) {
  // The signs of I and J are not given in G74 mode.
  const outline_segments segments = import(
      HEADER + "G74*X10000000Y0D02*G03X0Y10000000I10000000J0D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  const arc_segment* arc = boost::get<arc_segment>(&segments[0]);
  BOOST_REQUIRE(arc != nullptr);
  check_point(arc->center, 0, 0);
}

BOOST_AUTO_TEST_CASE(incremental_notation) {
  const outline_segments segments = import(
      "%FSLIX33Y33*%%MOMM*%"
      "X1000Y1000D02*X1000D01*Y1000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 2);
  check_point(segment_start(segments[0]), 1, 1);
  check_point(segment_end(segments[0]), 2, 1);
  check_point(segment_end(segments[1]), 2, 2);
}

BOOST_AUTO_TEST_CASE(missing_units_default_to_millimeters) {
  const outline_segments segments = import(
      "%FSLAX33Y33*%X0Y0D02*X1000D01*M02*");
  BOOST_REQUIRE_EQUAL(segments.size(), 1);
  check_point(segment_end(segments[0]), 1, 0);
}

BOOST_AUTO_TEST_CASE(coordinates_before_format) {
  BOOST_CHECK_THROW(import("%MOMM*%X0Y0D02*X1000D01*M02*"), format_exception);
}

BOOST_AUTO_TEST_CASE(malformed_coordinates) {
  BOOST_CHECK_THROW(import(HEADER + "X0Y0D02*X1.2.3D01*M02*"), parse_exception);
  BOOST_CHECK_THROW(import("%FSLAX46*%"), format_exception);
  BOOST_CHECK_THROW(import("%MOFT*%"), format_exception);
}

BOOST_AUTO_TEST_CASE(oversized_codes) {
  BOOST_CHECK_THROW(import(HEADER + "D99999999999*"), parse_exception);
  BOOST_CHECK_THROW(import(HEADER + "G99999999999*"), parse_exception);
  BOOST_CHECK_THROW(import(HEADER + "X0Y0D02*M99999999999*"), parse_exception);
}

BOOST_AUTO_TEST_CASE(failed_load_keeps_previous_result) {
  GerberImporter importer;
  std::istringstream good(RECTANGLE);
  importer.load(good);
  std::istringstream bad("%MOMM*%X0Y0D02*");
  BOOST_CHECK_THROW(importer.load(bad), format_exception);
  BOOST_CHECK_EQUAL(importer.get_segments().size(), 4);
}

BOOST_AUTO_TEST_CASE(missing_file) {
  GerberImporter importer;
  BOOST_CHECK(!importer.load_file("this_file_does_not_exist.gbr"));
}

BOOST_AUTO_TEST_CASE(angles) {
  const double pi = bg::math::pi<double>();
  const point_type_fp center(0, 0);
  BOOST_CHECK_CLOSE(get_angle(point_type_fp(10, 0), center, point_type_fp(0, 10), false), pi / 2, 1e-9);
  BOOST_CHECK_CLOSE(get_angle(point_type_fp(10, 0), center, point_type_fp(0, 10), true), -3 * pi / 2, 1e-9);
  BOOST_CHECK_CLOSE(get_angle(point_type_fp(0, 10), center, point_type_fp(10, 0), true), -pi / 2, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
