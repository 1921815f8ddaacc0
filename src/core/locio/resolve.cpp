#include "resolve.hpp"
#include "errors.hpp"
#include "../seqio.hpp"
#include <exception>
#include <vector>

using namespace std;
using seqio::Sequence;
using seqio::TCoord;

namespace locio {

ResolveOptions::ResolveOptions()
: accept_approximate(false),
  complement_policy(seqio::PassThrough)
{}

namespace {

/** Accession without its ".N" version suffix. */
string stripVersion(const string& accession) {
  return accession.substr(0, accession.find('.'));
}

/**
 * True if two accessions name the same entry. A missing version matches
 * any version; two different versions never match.
 */
bool sameAccession(const string& a, const string& b) {
  if (a.empty() || b.empty()) return false;
  if (a == b) return true;
  bool versioned_a = a.find('.') != string::npos;
  bool versioned_b = b.find('.') != string::npos;
  if (versioned_a && versioned_b) return false;
  return stripVersion(a) == stripVersion(b);
}

/** Returns the sequence with the given accession, trying the primary sequence first. */
const Sequence* findSequence(const string& accession, const Sequence& primary, const ResolveOptions& opts) {
  if (!primary.id().empty() && primary.id() == accession)
    return &primary;
  seqio::TSequenceMap::const_iterator it = opts.remote_sequences.find(accession);
  if (it != opts.remote_sequences.end())
    return it->second.get();
  // versioned and unversioned forms of the accession
  if (sameAccession(primary.id(), accession))
    return &primary;
  for (it = opts.remote_sequences.begin(); it != opts.remote_sequences.end(); ++it) {
    if (sameAccession(it->first, accession))
      return it->second.get();
  }
  return NULL;
}

/**
 * Evaluates a location tree against a sequence.
 *
 * m_path holds the indices of the join/order parts currently being
 * resolved; it is left untouched when an error propagates, so it points to
 * the failing part afterwards.
 */
class resolver : public boost::static_visitor<string>
{
public:
  resolver(const Sequence& seq, const ResolveOptions& opts)
  : m_seq(&seq), m_opts(opts) {}

  string operator()(const Single& loc) {
    return string(1, m_seq->at(coordinate(loc.pos)));
  }

  string operator()(const Range& loc) {
    return m_seq->slice(coordinate(loc.start), coordinate(loc.end));
  }

  string operator()(const Between& loc) {
    // a site between two bases covers no nucleotides, but must lie on the sequence
    TCoord len = m_seq->length();
    if (loc.left < 1 || loc.right < 1 || loc.left > len || loc.right > len) {
      throw seqio::OutOfBoundsError(loc.left, loc.right, len);
    }
    return string();
  }

  string operator()(const Complement& loc) {
    string inner = boost::apply_visitor(*this, loc.inner);
    return seqio::rev_comp(inner, m_opts.complement_policy);
  }

  string operator()(const Join& loc) {
    return concatenate(loc.parts);
  }

  string operator()(const Order& loc) {
    return concatenate(loc.parts);
  }

  string operator()(const Remote& loc) {
    const Sequence* target = findSequence(loc.accession, *m_seq, m_opts);
    if (target == NULL) {
      throw MissingSequenceError(loc.accession);
    }
    const Sequence* saved = m_seq;
    m_seq = target;
    string result = boost::apply_visitor(*this, loc.inner);
    m_seq = saved;
    return result;
  }

  const vector<size_t>& path() const { return m_path; }

private:
  TCoord coordinate(const Position& pos) const {
    if (pos.fuzzy == Unknown && !(m_opts.accept_approximate && pos.hasCoordinate())) {
      throw FuzzyPositionError(pos);
    }
    return pos.coordinate;
  }

  string concatenate(const vector<Location>& parts) {
    string result;
    for (size_t i=0; i<parts.size(); i++) {
      m_path.push_back(i);
      result += boost::apply_visitor(*this, parts[i]);
      m_path.pop_back();
    }
    return result;
  }

  const Sequence* m_seq;
  const ResolveOptions& m_opts;
  vector<size_t> m_path;
};

} // namespace

string resolve(const Location& loc, const Sequence& seq, const ResolveOptions& opts) {
  resolver visitor(seq, opts);
  try {
    return boost::apply_visitor(visitor, loc);
  } catch (const seqio::OutOfBoundsError& e) {
    throw_with_nested(ResolutionError(ResolutionError::OutOfBounds, visitor.path(), e.what()));
  } catch (const FuzzyPositionError& e) {
    throw_with_nested(ResolutionError(ResolutionError::FuzzyPosition, visitor.path(), e.what()));
  } catch (const seqio::UnmappedBaseError& e) {
    throw_with_nested(ResolutionError(ResolutionError::UnmappedBase, visitor.path(), e.what()));
  } catch (const MissingSequenceError& e) {
    throw_with_nested(ResolutionError(ResolutionError::MissingSequence, visitor.path(), e.what()));
  }
}

} // namespace locio
