#include "errors.hpp"
#include <boost/format.hpp>
#include <sstream>

using namespace std;
using boost::format;
using boost::str;

namespace locio {

namespace {

const size_t MAX_FRAGMENT_LEN = 20;

string syntaxMessage(const string& input, size_t offset, const string& reason) {
  if (offset >= input.size()) {
    return str(format("invalid location '%s' at end of input: %s") % input % reason);
  }
  return str(format("invalid location '%s' at offset %lu ('%s'): %s")
    % input % offset % input.substr(offset, MAX_FRAGMENT_LEN) % reason);
}

string pathString(const vector<size_t>& path) {
  ostringstream ss;
  for (size_t i=0; i<path.size(); i++) {
    if (i>0) ss << '.';
    ss << path[i];
  }
  return ss.str();
}

} // namespace

LocationError::LocationError(const string& msg)
: runtime_error(msg) {}

LocationSyntaxError::LocationSyntaxError(const string& input, size_t offset, const string& reason)
: LocationError(syntaxMessage(input, offset, reason)),
  m_input(input),
  m_offset(offset < input.size() ? offset : input.size()),
  m_fragment(offset < input.size() ? input.substr(offset, MAX_FRAGMENT_LEN) : ""),
  m_reason(reason)
{}

FuzzyPositionError::FuzzyPositionError(const Position& pos)
: LocationError(str(format("position '%s' has no usable coordinate") % pos)),
  m_pos(pos)
{}

MissingSequenceError::MissingSequenceError(const string& accession)
: LocationError(str(format("sequence '%s' is not available") % accession)),
  m_accession(accession)
{}

ResolutionError::ResolutionError(Cause cause, const vector<size_t>& path, const string& detail)
: LocationError(path.empty()
    ? str(format("cannot resolve location: %s") % detail)
    : str(format("cannot resolve location part %s: %s") % pathString(path) % detail)),
  m_cause(cause),
  m_path(path)
{}

} // namespace locio
