#include "Location.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace std;
using seqio::TCoord;

namespace locio {

Single::Single() {}
Single::Single(const Position& pos) : pos(pos) {}

Range::Range() {}
Range::Range(const Position& start, const Position& end)
: start(start), end(end) {}

Between::Between() : left(0), right(0) {}
Between::Between(TCoord left, TCoord right)
: left(left), right(right) {}

bool Between::isCircularWrap() const {
  return right == 1 && left != 0;
}

Complement::Complement() {}
Complement::Complement(const Location& inner) : inner(inner) {}

Join::Join() {}
Join::Join(const vector<Location>& parts) : parts(parts) {}

Order::Order() {}
Order::Order(const vector<Location>& parts) : parts(parts) {}

Location complementOf(const Location& inner) {
  return Location(Complement(inner));
}

Remote::Remote() {}
Remote::Remote(const string& accession, const Location& inner)
: accession(accession), inner(inner) {}

/*------------------------------------*/
/*           Comparison               */
/*------------------------------------*/

bool operator==(const Single& a, const Single& b) {
  return a.pos == b.pos;
}

bool operator==(const Range& a, const Range& b) {
  return a.start == b.start && a.end == b.end;
}

bool operator==(const Between& a, const Between& b) {
  return a.left == b.left && a.right == b.right;
}

bool operator==(const Complement& a, const Complement& b) {
  return a.inner == b.inner;
}

bool operator==(const Join& a, const Join& b) {
  return a.parts == b.parts;
}

bool operator==(const Order& a, const Order& b) {
  return a.parts == b.parts;
}

bool operator==(const Remote& a, const Remote& b) {
  return a.accession == b.accession && a.inner == b.inner;
}

/*------------------------------------*/
/*           Output                   */
/*------------------------------------*/

namespace {

/** Writes a location in GenBank notation. */
class printer : public boost::static_visitor<void>
{
public:
  explicit printer(ostream& out) : m_out(out) {}

  template <typename T>
  void operator()(const T& loc) const {
    m_out << loc;
  }

private:
  ostream& m_out;
};

void printParts(ostream& out, const char* op, const vector<Location>& parts) {
  out << op << '(';
  for (size_t i=0; i<parts.size(); i++) {
    if (i>0) out << ',';
    boost::apply_visitor(printer(out), parts[i]);
  }
  out << ')';
}

} // namespace

ostream& operator<<(ostream& out, const Single& loc) {
  return out << loc.pos;
}

ostream& operator<<(ostream& out, const Range& loc) {
  return out << loc.start << ".." << loc.end;
}

ostream& operator<<(ostream& out, const Between& loc) {
  return out << loc.left << '^' << loc.right;
}

ostream& operator<<(ostream& out, const Complement& loc) {
  out << "complement(";
  boost::apply_visitor(printer(out), loc.inner);
  return out << ')';
}

ostream& operator<<(ostream& out, const Join& loc) {
  printParts(out, "join", loc.parts);
  return out;
}

ostream& operator<<(ostream& out, const Order& loc) {
  printParts(out, "order", loc.parts);
  return out;
}

ostream& operator<<(ostream& out, const Remote& loc) {
  out << loc.accession << ':';
  boost::apply_visitor(printer(out), loc.inner);
  return out;
}

string toString(const Location& loc) {
  ostringstream ss;
  boost::apply_visitor(printer(ss), loc);
  return ss.str();
}

/*------------------------------------*/
/*           Measures                 */
/*------------------------------------*/

namespace {

/** Collects the spans covered by local location parts. */
class segment_collector : public boost::static_visitor<void>
{
public:
  explicit segment_collector(vector<TSpan>& spans) : m_spans(spans) {}

  void operator()(const Single& loc) const {
    if (loc.pos.isKnown())
      m_spans.push_back(TSpan(loc.pos.coordinate, loc.pos.coordinate));
  }
  void operator()(const Range& loc) const {
    if (loc.start.isKnown() && loc.end.isKnown() && loc.start.coordinate <= loc.end.coordinate)
      m_spans.push_back(TSpan(loc.start.coordinate, loc.end.coordinate));
  }
  void operator()(const Between&) const {}
  void operator()(const Complement& loc) const {
    boost::apply_visitor(*this, loc.inner);
  }
  void operator()(const Join& loc) const {
    for (const Location& part : loc.parts)
      boost::apply_visitor(*this, part);
  }
  void operator()(const Order& loc) const {
    for (const Location& part : loc.parts)
      boost::apply_visitor(*this, part);
  }
  void operator()(const Remote&) const {}

private:
  vector<TSpan>& m_spans;
};

/** Tracks smallest and largest known coordinate. */
class bounds_finder : public boost::static_visitor<void>
{
public:
  bounds_finder() : m_found(false), m_min(0), m_max(0) {}

  void operator()(const Single& loc) {
    add(loc.pos);
  }
  void operator()(const Range& loc) {
    add(loc.start);
    add(loc.end);
  }
  void operator()(const Between& loc) {
    add(Position(loc.left));
    add(Position(loc.right));
  }
  void operator()(const Complement& loc) {
    boost::apply_visitor(*this, loc.inner);
  }
  void operator()(const Join& loc) {
    for (const Location& part : loc.parts)
      boost::apply_visitor(*this, part);
  }
  void operator()(const Order& loc) {
    for (const Location& part : loc.parts)
      boost::apply_visitor(*this, part);
  }
  void operator()(const Remote&) {}

  bool found() const { return m_found; }
  TSpan span() const { return TSpan(m_min, m_max); }

private:
  void add(const Position& pos) {
    if (!pos.isKnown()) return;
    if (!m_found || pos.coordinate < m_min) m_min = pos.coordinate;
    if (!m_found || pos.coordinate > m_max) m_max = pos.coordinate;
    m_found = true;
  }

  bool m_found;
  TCoord m_min;
  TCoord m_max;
};

/** Counts the bases a location resolves to. */
class length_counter : public boost::static_visitor<TCoord>
{
public:
  TCoord operator()(const Single& loc) const {
    requireCoordinate(loc.pos);
    return 1;
  }
  TCoord operator()(const Range& loc) const {
    requireCoordinate(loc.start);
    requireCoordinate(loc.end);
    if (loc.start.coordinate > loc.end.coordinate) return 0;
    return loc.end.coordinate - loc.start.coordinate + 1;
  }
  TCoord operator()(const Between&) const {
    return 0;
  }
  TCoord operator()(const Complement& loc) const {
    return boost::apply_visitor(*this, loc.inner);
  }
  TCoord operator()(const Join& loc) const {
    return sum(loc.parts);
  }
  TCoord operator()(const Order& loc) const {
    return sum(loc.parts);
  }
  TCoord operator()(const Remote& loc) const {
    return boost::apply_visitor(*this, loc.inner);
  }

private:
  void requireCoordinate(const Position& pos) const {
    if (!pos.hasCoordinate()) throw FuzzyPositionError(pos);
  }
  TCoord sum(const vector<Location>& parts) const {
    TCoord total = 0;
    for (const Location& part : parts) {
      TCoord part_len = boost::apply_visitor(*this, part);
      if (part_len > numeric_limits<TCoord>::max() - total) {
        throw overflow_error("Location length exceeds coordinate range.");
      }
      total += part_len;
    }
    return total;
  }
};

} // namespace

bool contains(const TSpan& span, TCoord pos) {
  return span.first <= pos && pos <= span.second;
}

bool contains(const TSpan& outer, const TSpan& inner) {
  return outer.first <= inner.first && inner.second <= outer.second;
}

bool isLeftOf(const TSpan& a, const TSpan& b) {
  return a.second < b.first;
}

bool isRightOf(const TSpan& a, const TSpan& b) {
  return a.first > b.second;
}

TCoord spanDistance(const TSpan& a, const TSpan& b) {
  if (isLeftOf(a, b)) return b.first - a.second;
  if (isRightOf(a, b)) return a.first - b.second;
  return 0;
}

TSpan bounds(const Location& loc) {
  bounds_finder finder;
  boost::apply_visitor(finder, loc);
  if (!finder.found()) {
    throw FuzzyPositionError(Position());
  }
  return finder.span();
}

TCoord length(const Location& loc) {
  return boost::apply_visitor(length_counter(), loc);
}

vector<TSpan> segments(const Location& loc) {
  vector<TSpan> spans;
  boost::apply_visitor(segment_collector(spans), loc);
  return spans;
}

vector<TSpan> uncoveredRanges(const Location& loc, TCoord seq_length) {
  if (seq_length < 1) {
    throw invalid_argument("Sequence length must be positive.");
  }
  vector<TSpan> covered = segments(loc);
  sort(covered.begin(), covered.end());

  vector<TSpan> gaps;
  TCoord next_free = 1; // first position not yet known to be covered
  bool covered_to_end = false;
  for (const TSpan& span : covered) {
    if (span.first > seq_length) break;
    if (span.first > next_free)
      gaps.push_back(TSpan(next_free, span.first-1));
    if (span.second >= seq_length) {
      covered_to_end = true;
      break;
    }
    if (span.second >= next_free)
      next_free = span.second + 1;
  }
  if (!covered_to_end && next_free <= seq_length)
    gaps.push_back(TSpan(next_free, seq_length));

  return gaps;
}

} // namespace locio
