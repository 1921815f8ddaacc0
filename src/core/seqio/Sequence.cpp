#include "Sequence.hpp"
#include <boost/format.hpp>

using namespace std;
using boost::format;
using boost::str;

namespace seqio {

Sequence::Sequence() {}

Sequence::Sequence(const string& id, const string& bases)
: m_id(id), m_bases(bases) {}

const string& Sequence::id() const {
  return m_id;
}

const string& Sequence::bases() const {
  return m_bases;
}

TCoord Sequence::length() const {
  return m_bases.size();
}

bool Sequence::empty() const {
  return m_bases.empty();
}

char Sequence::at(TCoord pos) const {
  if (pos < 1 || pos > length()) {
    throw OutOfBoundsError(pos, pos, length());
  }
  return m_bases[pos-1];
}

string Sequence::slice(TCoord start, TCoord end) const {
  if (start < 1 || end > length() || start > end) {
    throw OutOfBoundsError(start, end, length());
  }
  return m_bases.substr(start-1, end-start+1);
}

OutOfBoundsError::OutOfBoundsError(TCoord start, TCoord end, TCoord length)
: out_of_range(str(format("range %lu..%lu is outside of sequence 1..%lu") % start % end % length)),
  m_start(start),
  m_end(end),
  m_length(length)
{}

UnmappedBaseError::UnmappedBaseError(char base)
: runtime_error(str(format("no complement defined for base '%c'") % base)),
  m_base(base)
{}

} // namespace seqio
