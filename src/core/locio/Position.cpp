#include "Position.hpp"

using namespace std;

namespace locio {

Position::Position() : coordinate(0), fuzzy(Unknown) {}

Position::Position(seqio::TCoord coordinate, Fuzzy fuzzy)
: coordinate(coordinate), fuzzy(fuzzy) {}

bool Position::isKnown() const {
  return fuzzy != Unknown && coordinate >= 1;
}

bool Position::hasCoordinate() const {
  return coordinate >= 1;
}

bool operator==(const Position& a, const Position& b) {
  return a.coordinate == b.coordinate && a.fuzzy == b.fuzzy;
}

bool operator!=(const Position& a, const Position& b) {
  return !(a == b);
}

ostream& operator<<(ostream& out, const Position& pos) {
  switch (pos.fuzzy) {
    case Exact:
      out << pos.coordinate;
      break;
    case Before:
      out << '<' << pos.coordinate;
      break;
    case After:
      out << '>' << pos.coordinate;
      break;
    case Unknown:
      out << '?';
      if (pos.hasCoordinate())
        out << pos.coordinate;
      break;
  }
  return out;
}

} // namespace locio
