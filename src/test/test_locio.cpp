#include <boost/test/unit_test.hpp>

#include "../core/locio.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
using namespace std;
using namespace locio;

struct FixtureLocio {
  FixtureLocio() {
    BOOST_TEST_MESSAGE( "set up fixure" );
  }
  ~FixtureLocio() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  /** Parses a location that is expected to be invalid and returns the error. */
  LocationSyntaxError syntaxError(const string& raw) {
    try {
      parseLocation(raw);
    } catch (const LocationSyntaxError& e) {
      BOOST_TEST_MESSAGE( e.what() );
      return e;
    }
    BOOST_ERROR( "no syntax error for '" << raw << "'" );
    return LocationSyntaxError(raw, 0, "");
  }
};

BOOST_FIXTURE_TEST_SUITE( locio, FixtureLocio )

BOOST_AUTO_TEST_CASE( position )
{
  BOOST_CHECK( Position(5) == Position(5, Exact) );
  BOOST_CHECK( Position(5, Before) != Position(5, After) );
  BOOST_CHECK( Position(5, Before).isKnown() );
  BOOST_CHECK( !Position(5, Unknown).isKnown() );
  BOOST_CHECK( Position(5, Unknown).hasCoordinate() );
  BOOST_CHECK( !Position().hasCoordinate() );

  Location loc = parseLocation("5");
  const Single* single = boost::get<Single>(&loc);
  BOOST_REQUIRE( single != NULL );
  BOOST_CHECK_EQUAL( single->pos.coordinate, 5 );
  BOOST_CHECK( single->pos.fuzzy == Exact );
}

BOOST_AUTO_TEST_CASE( simple )
{
  BOOST_CHECK( parseLocation("5") == Location(Single(Position(5))) );
  BOOST_CHECK( parseLocation("2..4") == Location(Range(Position(2), Position(4))) );
  BOOST_CHECK( parseLocation("<1..>10") == Location(Range(Position(1, Before), Position(10, After))) );
  BOOST_CHECK( parseLocation(">3") == Location(Single(Position(3, After))) );
  BOOST_CHECK( parseLocation("complement(1..4)") ==
               Location(Complement(Range(Position(1), Position(4)))) );

  Location join = parseLocation("join(1..2,5..6)");
  const Join* p_join = boost::get<Join>(&join);
  BOOST_REQUIRE( p_join != NULL );
  BOOST_REQUIRE_EQUAL( p_join->parts.size(), 2 );
  BOOST_CHECK( p_join->parts[0] == Location(Range(Position(1), Position(2))) );
  BOOST_CHECK( p_join->parts[1] == Location(Range(Position(5), Position(6))) );
}

/* unknown positions with and without coordinate hint */
BOOST_AUTO_TEST_CASE( unknown )
{
  BOOST_CHECK( parseLocation("?") == Location(Single(Position(0, Unknown))) );
  BOOST_CHECK( parseLocation("?5..12") == Location(Range(Position(5, Unknown), Position(12))) );
  BOOST_CHECK( parseLocation("1..?") == Location(Range(Position(1), Position(0, Unknown))) );
}

BOOST_AUTO_TEST_CASE( nested )
{
  Location loc = parseLocation("join(complement(1..5),10..20,complement(join(30..40,50..60)))");
  const Join* p_join = boost::get<Join>(&loc);
  BOOST_REQUIRE( p_join != NULL );
  BOOST_REQUIRE_EQUAL( p_join->parts.size(), 3 );
  BOOST_CHECK( boost::get<Complement>(&p_join->parts[0]) != NULL );
  BOOST_CHECK( boost::get<Range>(&p_join->parts[1]) != NULL );
  const Complement* p_comp = boost::get<Complement>(&p_join->parts[2]);
  BOOST_REQUIRE( p_comp != NULL );
  const Join* p_inner = boost::get<Join>(&p_comp->inner);
  BOOST_REQUIRE( p_inner != NULL );
  BOOST_CHECK_EQUAL( p_inner->parts.size(), 2 );
}

/* directly nested joins are spliced into the outer join */
BOOST_AUTO_TEST_CASE( flatten )
{
  BOOST_CHECK( parseLocation("join(1..2,join(3..4,5..6))") == parseLocation("join(1..2,3..4,5..6)") );
  BOOST_CHECK( parseLocation("join(join(1..2,3..4),5..6)") == parseLocation("join(1..2,3..4,5..6)") );
  // joins below a complement stay separate
  BOOST_CHECK( !(parseLocation("join(1..2,complement(join(3..4,5..6)))") ==
                 parseLocation("join(1..2,complement(3..4),complement(5..6))")) );
}

BOOST_AUTO_TEST_CASE( whitespace )
{
  BOOST_CHECK( parseLocation(" join( 1..2 ,\n 5..6 ) ") == parseLocation("join(1..2,5..6)") );
  BOOST_CHECK( parseLocation("complement( 3 .. 7 )") == parseLocation("complement(3..7)") );
}

BOOST_AUTO_TEST_CASE( between )
{
  Location loc = parseLocation("5^6");
  const Between* site = boost::get<Between>(&loc);
  BOOST_REQUIRE( site != NULL );
  BOOST_CHECK_EQUAL( site->left, 5 );
  BOOST_CHECK_EQUAL( site->right, 6 );
  BOOST_CHECK( !site->isCircularWrap() );

  Location wrap = parseLocation("100^1");
  BOOST_REQUIRE( boost::get<Between>(&wrap) != NULL );
  BOOST_CHECK( boost::get<Between>(&wrap)->isCircularWrap() );

  BOOST_CHECK_THROW( parseLocation("5^7"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("6^5"), LocationSyntaxError );
}

BOOST_AUTO_TEST_CASE( order_remote )
{
  Location order = parseLocation("order(1..2,complement(5..6))");
  const Order* p_order = boost::get<Order>(&order);
  BOOST_REQUIRE( p_order != NULL );
  BOOST_CHECK_EQUAL( p_order->parts.size(), 2 );

  BOOST_CHECK( parseLocation("J00194.1:100..202") ==
               Location(Remote("J00194.1", Range(Position(100), Position(202)))) );
  Location mixed = parseLocation("join(1..10,AB000123.2:complement(5..8))");
  const Join* p_join = boost::get<Join>(&mixed);
  BOOST_REQUIRE( p_join != NULL );
  BOOST_REQUIRE_EQUAL( p_join->parts.size(), 2 );
  const Remote* p_remote = boost::get<Remote>(&p_join->parts[1]);
  BOOST_REQUIRE( p_remote != NULL );
  BOOST_CHECK_EQUAL( p_remote->accession, "AB000123.2" );
}

BOOST_AUTO_TEST_CASE( syntax_errors )
{
  BOOST_CHECK_THROW( parseLocation("join()"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation(""), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("complement(1..4"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("join(1..2,5..6))"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("1..2..3"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("<<5"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("abc"), LocationSyntaxError );
  BOOST_CHECK_THROW( parseLocation("join(1..2;5..6)"), LocationSyntaxError );

  // every location error derives from LocationError
  BOOST_CHECK_THROW( parseLocation("join(,)"), LocationError );
}

/* errors point at the offending text */
BOOST_AUTO_TEST_CASE( error_position )
{
  LocationSyntaxError e_empty = syntaxError("join()");
  BOOST_CHECK_EQUAL( e_empty.offset(), 5 );
  BOOST_CHECK_EQUAL( e_empty.fragment(), ")" );

  LocationSyntaxError e_open = syntaxError("complement(1..4");
  BOOST_CHECK_EQUAL( e_open.offset(), 15 );
  BOOST_CHECK_EQUAL( e_open.fragment(), "" );
  BOOST_CHECK_EQUAL( e_open.input(), "complement(1..4" );

  LocationSyntaxError e_tail = syntaxError("join(1..2,5..)");
  BOOST_CHECK_EQUAL( e_tail.offset(), 11 );
  BOOST_CHECK_EQUAL( e_tail.fragment(), "..)" );

  LocationSyntaxError e_trailing = syntaxError("1..5 junk");
  BOOST_CHECK_EQUAL( e_trailing.fragment(), "junk" );
}

/* value checks the grammar cannot express */
BOOST_AUTO_TEST_CASE( value_errors )
{
  LocationSyntaxError e_order = syntaxError("join(1..2,9..4)");
  BOOST_CHECK_EQUAL( e_order.offset(), 10 );
  BOOST_CHECK_EQUAL( e_order.fragment(), "9..4)" );

  LocationSyntaxError e_zero = syntaxError("0..5");
  BOOST_CHECK_EQUAL( e_zero.offset(), 0 );

  // fuzzy ends are still ordered
  BOOST_CHECK_THROW( parseLocation("<9..>4"), LocationSyntaxError );
  // no order check if one end is unknown
  BOOST_CHECK_NO_THROW( parseLocation("?9..4") );
}

BOOST_AUTO_TEST_CASE( to_string )
{
  vector<string> locations = {
    "5",
    "<1..>10",
    "?",
    "?5..12",
    "complement(1..4)",
    "join(1..2,5..6)",
    "join(complement(1..5),10..20)",
    "order(1..2,5^6)",
    "100^1",
    "J00194.1:100..202",
    "complement(join(1..3,AB000123.2:complement(5..8)))"
  };
  for (const string& s : locations) {
    BOOST_CHECK_EQUAL( toString(parseLocation(s)), s );
    BOOST_CHECK( parseLocation(toString(parseLocation(s))) == parseLocation(s) );
  }
  BOOST_CHECK_EQUAL( toString(parseLocation(" join( 1..2, 5..6 )")), "join(1..2,5..6)" );
}

BOOST_AUTO_TEST_CASE( measures )
{
  BOOST_CHECK( bounds(parseLocation("join(3..5,complement(8..9))")) == TSpan(3, 9) );
  BOOST_CHECK( bounds(parseLocation("<2..>7")) == TSpan(2, 7) );
  BOOST_CHECK( bounds(parseLocation("join(?..5,8..9)")) == TSpan(5, 9) );
  BOOST_CHECK_THROW( bounds(parseLocation("?")), FuzzyPositionError );

  BOOST_CHECK_EQUAL( length(parseLocation("join(3..5,8..9)")), 5 );
  BOOST_CHECK_EQUAL( length(parseLocation("complement(1..4)")), 4 );
  BOOST_CHECK_EQUAL( length(parseLocation("7")), 1 );
  BOOST_CHECK_EQUAL( length(parseLocation("5^6")), 0 );
  BOOST_CHECK_THROW( length(parseLocation("1..?")), FuzzyPositionError );

  vector<TSpan> spans = segments(parseLocation("join(8..9,complement(3..5),12^13)"));
  BOOST_REQUIRE_EQUAL( spans.size(), 2 );
  BOOST_CHECK( spans[0] == TSpan(8, 9) );
  BOOST_CHECK( spans[1] == TSpan(3, 5) );
}

/* lengths that do not fit into a coordinate are rejected, not wrapped */
BOOST_AUTO_TEST_CASE( length_overflow )
{
  const seqio::TCoord max_coord = numeric_limits<seqio::TCoord>::max();
  Location whole = Range(Position(1), Position(max_coord));
  BOOST_CHECK_EQUAL( length(whole), max_coord );
  BOOST_CHECK_EQUAL( length(Join(vector<Location>{ Range(Position(2), Position(max_coord)), Single(Position(7)) })), max_coord );
  BOOST_CHECK_THROW( length(Join(vector<Location>{ whole, Range(Position(1), Position(5)) })), overflow_error );
  BOOST_CHECK_THROW( length(Order(vector<Location>{ Range(Position(2), Position(max_coord)), Single(Position(7)), Single(Position(8)) })), overflow_error );
  BOOST_CHECK_THROW( length(complementOf(Join(vector<Location>{ Single(Position(3)), whole }))), overflow_error );
  BOOST_CHECK_EQUAL( length(parseLocation("1..18446744073709551615")), 18446744073709551615UL );
  BOOST_CHECK_THROW( length(parseLocation("join(1..18446744073709551615,1..5)")), overflow_error );
}

BOOST_AUTO_TEST_CASE( span_relations )
{
  TSpan a(3, 5);
  TSpan b(8, 9);
  BOOST_CHECK( contains(a, 3) );
  BOOST_CHECK( contains(a, 5) );
  BOOST_CHECK( !contains(a, 6) );
  BOOST_CHECK( contains(TSpan(1, 10), a) );
  BOOST_CHECK( contains(a, a) );
  BOOST_CHECK( !contains(a, TSpan(4, 6)) );

  BOOST_CHECK( isLeftOf(a, b) );
  BOOST_CHECK( !isLeftOf(b, a) );
  BOOST_CHECK( isRightOf(b, a) );
  BOOST_CHECK( !isLeftOf(a, TSpan(5, 6)) );
  BOOST_CHECK( !isRightOf(TSpan(5, 6), a) );

  BOOST_CHECK_EQUAL( spanDistance(a, b), 3 );
  BOOST_CHECK_EQUAL( spanDistance(b, a), 3 );
  BOOST_CHECK_EQUAL( spanDistance(a, TSpan(6, 7)), 1 );
  BOOST_CHECK_EQUAL( spanDistance(a, TSpan(4, 9)), 0 );

  // relations of the parts of a spliced feature
  vector<TSpan> exons = segments(parseLocation("join(3..5,8..9)"));
  BOOST_REQUIRE_EQUAL( exons.size(), 2 );
  BOOST_CHECK( isLeftOf(exons[0], exons[1]) );
  BOOST_CHECK( contains(bounds(parseLocation("join(3..5,8..9)")), exons[1]) );
}

BOOST_AUTO_TEST_CASE( uncovered )
{
  vector<TSpan> gaps = uncoveredRanges(parseLocation("join(3..5,8..9)"), 10);
  BOOST_REQUIRE_EQUAL( gaps.size(), 3 );
  BOOST_CHECK( gaps[0] == TSpan(1, 2) );
  BOOST_CHECK( gaps[1] == TSpan(6, 7) );
  BOOST_CHECK( gaps[2] == TSpan(10, 10) );

  BOOST_CHECK( uncoveredRanges(parseLocation("1..10"), 10).empty() );
  // overlapping parts, written out of order
  vector<TSpan> gaps_overlap = uncoveredRanges(parseLocation("join(4..8,2..5)"), 10);
  BOOST_REQUIRE_EQUAL( gaps_overlap.size(), 2 );
  BOOST_CHECK( gaps_overlap[0] == TSpan(1, 1) );
  BOOST_CHECK( gaps_overlap[1] == TSpan(9, 10) );

  BOOST_CHECK_THROW( uncoveredRanges(parseLocation("1..5"), 0), invalid_argument );

  // parts reaching the last possible coordinate
  const seqio::TCoord max_coord = numeric_limits<seqio::TCoord>::max();
  BOOST_CHECK( uncoveredRanges(Range(Position(1), Position(max_coord)), 10).empty() );
  BOOST_CHECK( uncoveredRanges(parseLocation("1..18446744073709551615"), 10).empty() );
  vector<TSpan> gaps_tail = uncoveredRanges(Range(Position(4), Position(max_coord)), 10);
  BOOST_REQUIRE_EQUAL( gaps_tail.size(), 1 );
  BOOST_CHECK( gaps_tail[0] == TSpan(1, 3) );
  vector<TSpan> gaps_max = uncoveredRanges(parseLocation("join(1..5,9..12)"), max_coord);
  BOOST_REQUIRE_EQUAL( gaps_max.size(), 2 );
  BOOST_CHECK( gaps_max[0] == TSpan(6, 8) );
  BOOST_CHECK( gaps_max[1] == TSpan(13, max_coord) );
  BOOST_CHECK( uncoveredRanges(Range(Position(1), Position(max_coord)), max_coord).empty() );
}

BOOST_AUTO_TEST_SUITE_END()
