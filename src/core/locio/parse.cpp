#include "parse.hpp"
#include "errors.hpp"
#include <boost/optional.hpp>
#include <boost/range/iterator_range.hpp>
#include <boost/spirit/include/phoenix_bind.hpp>
#include <boost/spirit/include/phoenix_core.hpp>
#include <boost/spirit/include/phoenix_operator.hpp>
#include <boost/spirit/include/qi.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

using namespace std;
using seqio::TCoord;

/*--------------------------------------*/
/*            parser logic              */
/*--------------------------------------*/

namespace locio {

namespace qi = boost::spirit::qi;
namespace ascii = boost::spirit::ascii;
namespace phx = boost::phoenix;

namespace {

Position exactPosition(TCoord c) { return Position(c, Exact); }
Position beforePosition(TCoord c) { return Position(c, Before); }
Position afterPosition(TCoord c) { return Position(c, After); }
Position unknownPosition(const boost::optional<TCoord>& c) {
  return Position(c ? *c : 0, Unknown);
}

Single makeSingle(const Position& pos) {
  return Single(pos);
}

Range makeRange(const Position& start, const Position& end) {
  return Range(start, end);
}

Between makeBetween(TCoord left, TCoord right) {
  return Between(left, right);
}

Complement makeComplement(const Location& inner) {
  return Complement(inner);
}

/** Builds a join, splicing the parts of directly nested joins in place. */
Join makeJoin(const vector<Location>& parts) {
  Join join;
  for (const Location& part : parts) {
    if (const Join* nested = boost::get<Join>(&part)) {
      join.parts.insert(join.parts.end(), nested->parts.begin(), nested->parts.end());
    } else {
      join.parts.push_back(part);
    }
  }
  return join;
}

Order makeOrder(const vector<Location>& parts) {
  return Order(parts);
}

Remote makeRemote(const string& accession, const Location& inner) {
  return Remote(accession, inner);
}

} // namespace

  /** Represents the GenBank location grammar.
    *
    * For details see https://www.insdc.org/submitting-standards/feature-table/
    * (section 3.4, location).
    * Value checks that the grammar cannot express (range order, coordinates
    * starting at 1, adjoining sites) raise a LocationSyntaxError pointing at
    * the offending text.
    */
  template <typename Iterator>
  struct location_grammar : qi::grammar<Iterator, Location(), ascii::space_type>
  {
    typedef boost::iterator_range<Iterator> text_range;

    location_grammar(const string& input, Iterator begin)
    : location_grammar::base_type(location),
      m_input(input),
      m_begin(begin)
    {
      using qi::lit;
      using qi::ulong_;
      using qi::_1;
      using qi::_2;
      using qi::_val;

      // position markers: '<' before, '>' after, '?' unknown (optional hint)
      position = qi::raw[
          ( '<' >> ulong_ )[ _val = phx::bind(&beforePosition, _1) ]
        | ( '>' >> ulong_ )[ _val = phx::bind(&afterPosition, _1) ]
        | ( '?' >> -ulong_ )[ _val = phx::bind(&unknownPosition, _1) ]
        | ulong_[ _val = phx::bind(&exactPosition, _1) ]
      ][ phx::bind(&location_grammar::checkPosition, this, _val, _1) ];

      single = position[ _val = phx::bind(&makeSingle, _1) ];

      range = qi::raw[
          ( position >> ".." >> position )[ _val = phx::bind(&makeRange, _1, _2) ]
      ][ phx::bind(&location_grammar::checkRange, this, _val, _1) ];

      between = qi::raw[
          ( ulong_ >> '^' >> ulong_ )[ _val = phx::bind(&makeBetween, _1, _2) ]
      ][ phx::bind(&location_grammar::checkBetween, this, _val, _1) ];

      // accession numbers contain no whitespace
      accession %= qi::lexeme[ ascii::alpha >> *( ascii::alnum | ascii::char_("_.") ) ];

      remote = ( accession >> ':' > location )[ _val = phx::bind(&makeRemote, _1, _2) ];

      // once an operator and its '(' are seen, the rest must follow
      complement = ( lit("complement") > '(' > location > ')' )
        [ _val = phx::bind(&makeComplement, _1) ];
      join = ( lit("join") > '(' > ( location % ',' ) > ')' )
        [ _val = phx::bind(&makeJoin, _1) ];
      order = ( lit("order") > '(' > ( location % ',' ) > ')' )
        [ _val = phx::bind(&makeOrder, _1) ];

      location =
          join[ _val = _1 ]
        | order[ _val = _1 ]
        | complement[ _val = _1 ]
        | remote[ _val = _1 ]
        | between[ _val = _1 ]
        | range[ _val = _1 ]
        | single[ _val = _1 ];

      // name rules (used in error messages), prepare parsers for debugging
      BOOST_SPIRIT_DEBUG_NODE(position);
      BOOST_SPIRIT_DEBUG_NODE(single);
      BOOST_SPIRIT_DEBUG_NODE(range);
      BOOST_SPIRIT_DEBUG_NODE(between);
      BOOST_SPIRIT_DEBUG_NODE(accession);
      BOOST_SPIRIT_DEBUG_NODE(remote);
      BOOST_SPIRIT_DEBUG_NODE(complement);
      BOOST_SPIRIT_DEBUG_NODE(join);
      BOOST_SPIRIT_DEBUG_NODE(order);
      BOOST_SPIRIT_DEBUG_NODE(location);
    }

    private:
      size_t offsetOf(const text_range& text) const {
        return static_cast<size_t>(text.begin() - m_begin);
      }

      void checkPosition(const Position& pos, const text_range& text) const {
        bool has_digits = find_if(text.begin(), text.end(),
          [](char c) { return isdigit(static_cast<unsigned char>(c)) != 0; }) != text.end();
        if (pos.coordinate == 0 && (pos.fuzzy != Unknown || has_digits)) {
          throw LocationSyntaxError(m_input, offsetOf(text), "coordinates start at 1");
        }
      }

      void checkRange(const Range& loc, const text_range& text) const {
        if (loc.start.isKnown() && loc.end.isKnown() &&
            loc.start.coordinate > loc.end.coordinate) {
          throw LocationSyntaxError(m_input, offsetOf(text), "range start lies after range end");
        }
      }

      void checkBetween(const Between& site, const text_range& text) const {
        bool adjacent = ( site.left >= 1 && site.right == site.left + 1 );
        bool wraps = ( site.left > 1 && site.right == 1 );
        if (!adjacent && !wraps) {
          throw LocationSyntaxError(m_input, offsetOf(text), "a site must lie between adjacent bases");
        }
      }

      /* grammar rules, typed by element they create */
      qi::rule<Iterator, Location(), ascii::space_type> location;
      qi::rule<Iterator, Join(), ascii::space_type> join;
      qi::rule<Iterator, Order(), ascii::space_type> order;
      qi::rule<Iterator, Complement(), ascii::space_type> complement;
      qi::rule<Iterator, Remote(), ascii::space_type> remote;
      qi::rule<Iterator, string(), ascii::space_type> accession;
      qi::rule<Iterator, Between(), ascii::space_type> between;
      qi::rule<Iterator, Range(), ascii::space_type> range;
      qi::rule<Iterator, Single(), ascii::space_type> single;
      qi::rule<Iterator, Position(), ascii::space_type> position;

      const string& m_input;
      Iterator m_begin;
  };

  /****************************** parseLocation ******************************/
  /** Parses a GenBank location expression */
  Location parseLocation(const string& raw) {
    typedef string::const_iterator iterator_type;
    iterator_type first = raw.begin();
    iterator_type last = raw.end();
    location_grammar<iterator_type> grammar(raw, first);

    Location result;
    bool ok = false;
    try {
      ok = qi::phrase_parse(first, last, grammar, ascii::space, result);
    } catch (const qi::expectation_failure<iterator_type>& e) {
      ostringstream expected;
      expected << e.what_;
      throw LocationSyntaxError(raw, static_cast<size_t>(e.first - raw.begin()),
                                "expected " + expected.str());
    }
    if (!ok) {
      throw LocationSyntaxError(raw, static_cast<size_t>(first - raw.begin()), "not a location");
    }
    if (first != last) {
      throw LocationSyntaxError(raw, static_cast<size_t>(first - raw.begin()), "unexpected text after location");
    }

    return result;
  }

} // namespace locio
