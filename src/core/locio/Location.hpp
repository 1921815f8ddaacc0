#ifndef LOCIO_LOCATION_H
#define LOCIO_LOCATION_H

#include "Position.hpp"
#include "../seqio/types.hpp"
#include <boost/variant.hpp>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace locio {

/** A single base: "n" */
struct Single
{
  Position pos;

  Single();
  explicit Single(const Position& pos);
};

/** A span of bases including both ends: "n..m" */
struct Range
{
  Position start;
  Position end;

  Range();
  Range(const Position& start, const Position& end);
};

/**
 * The site between two bases: "n^n+1"
 * On circular molecules the site between the last and the first base
 * is written "n^1".
 */
struct Between
{
  seqio::TCoord left;
  seqio::TCoord right;

  Between();
  Between(seqio::TCoord left, seqio::TCoord right);
  /** True for a site spanning the origin of a circular molecule. */
  bool isCircularWrap() const;
};

// forward declarations of the compound locations
struct Complement;
struct Join;
struct Order;
struct Remote;

/** GenBank location expression. */
typedef boost::variant<
  Single,
  Range,
  Between,
  boost::recursive_wrapper<Complement>,
  boost::recursive_wrapper<Join>,
  boost::recursive_wrapper<Order>,
  boost::recursive_wrapper<Remote>
> Location;

/**
 * The reverse complement strand of a location: "complement(...)"
 * Note that Complement(c) with a Complement c is the copy constructor;
 * use complementOf() to wrap a location that may already be a complement.
 */
struct Complement
{
  Location inner;

  Complement();
  explicit Complement(const Location& inner);
};

/** Parts assembled 5' to 3' in the given order: "join(a,b,...)" */
struct Join
{
  std::vector<Location> parts;

  Join();
  explicit Join(const std::vector<Location>& parts);
};

/** Parts in the given order, without a claim that they are joined: "order(a,b,...)" */
struct Order
{
  std::vector<Location> parts;

  Order();
  explicit Order(const std::vector<Location>& parts);
};

/** A location on another entry: "ACCESSION.V:location" */
struct Remote
{
  std::string accession;
  Location inner;

  Remote();
  Remote(const std::string& accession, const Location& inner);
};

/** Wraps a location in complement(); complementOf(complementOf(x)) nests twice. */
Location complementOf(const Location& inner);

bool operator==(const Single&, const Single&);
bool operator==(const Range&, const Range&);
bool operator==(const Between&, const Between&);
bool operator==(const Complement&, const Complement&);
bool operator==(const Join&, const Join&);
bool operator==(const Order&, const Order&);
bool operator==(const Remote&, const Remote&);

std::ostream& operator<<(std::ostream&, const Single&);
std::ostream& operator<<(std::ostream&, const Range&);
std::ostream& operator<<(std::ostream&, const Between&);
std::ostream& operator<<(std::ostream&, const Complement&);
std::ostream& operator<<(std::ostream&, const Join&);
std::ostream& operator<<(std::ostream&, const Order&);
std::ostream& operator<<(std::ostream&, const Remote&);

/** A closed interval of coordinates (first <= second). */
typedef std::pair<seqio::TCoord, seqio::TCoord> TSpan;

/** True if pos lies within span. */
bool contains(const TSpan& span, seqio::TCoord pos);
/** True if inner lies completely within outer. */
bool contains(const TSpan& outer, const TSpan& inner);
/** True if a ends before b starts. */
bool isLeftOf(const TSpan& a, const TSpan& b);
/** True if a starts after b ends. */
bool isRightOf(const TSpan& a, const TSpan& b);
/** Number of coordinates between the closest ends of two spans (0 if they overlap). */
seqio::TCoord spanDistance(const TSpan& a, const TSpan& b);

/** Writes a location in canonical GenBank notation. */
std::string toString(const Location& loc);

/**
 * Smallest and largest known coordinate of the local parts of a location.
 * \throws FuzzyPositionError if no part carries a known coordinate
 */
TSpan bounds(const Location& loc);

/**
 * Number of bases that resolving this location yields.
 * \throws std::overflow_error if the count does not fit into TCoord
 */
seqio::TCoord length(const Location& loc);

/**
 * Spans covered by the local parts of a location, in declared order.
 * Sites between bases and remote parts cover nothing on this sequence.
 */
std::vector<TSpan> segments(const Location& loc);

/**
 * Spans of [1, seq_length] that the location does not cover, sorted
 * (for a spliced feature these are the introns and flanks).
 */
std::vector<TSpan> uncoveredRanges(const Location& loc, seqio::TCoord seq_length);

} // namespace locio

#endif // LOCIO_LOCATION_H
