#ifndef LOCIO_POSITION_H
#define LOCIO_POSITION_H

#include "../seqio/types.hpp"
#include <ostream>

namespace locio {

/** Certainty of a position. */
enum Fuzzy {
  Exact,   // n
  Before,  // <n : the feature extends beyond n towards the 5' end
  After,   // >n : the feature extends beyond n towards the 3' end
  Unknown  // ?  : no usable coordinate (an optional hint may follow)
};

/** One coordinate on a sequence (1-based), possibly fuzzy. */
struct Position
{
  seqio::TCoord coordinate; /** 1-based coordinate (0: none given) */
  Fuzzy fuzzy;

  Position();
  Position(seqio::TCoord coordinate, Fuzzy fuzzy = Exact);

  /** True if the coordinate can be used as an exact bound. */
  bool isKnown() const;
  /** True if a coordinate (possibly only a hint) was given. */
  bool hasCoordinate() const;
};

bool operator==(const Position&, const Position&);
bool operator!=(const Position&, const Position&);
/** Writes the position in GenBank notation ("5", "<5", ">5", "?", "?5"). */
std::ostream& operator<<(std::ostream&, const Position&);

} // namespace locio

#endif // LOCIO_POSITION_H
