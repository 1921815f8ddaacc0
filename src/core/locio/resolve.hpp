#ifndef LOCIO_RESOLVE_H
#define LOCIO_RESOLVE_H

#include "Location.hpp"
#include "../seqio/Sequence.hpp"
#include "../seqio/types.hpp"
#include <string>

namespace locio {

/** Settings for resolving locations against sequences. */
struct ResolveOptions
{
  /** Use the coordinate hint of unknown positions ("?12") instead of failing. */
  bool accept_approximate;
  /** Treatment of non-ACGT characters on the complementary strand. */
  seqio::ComplementPolicy complement_policy;
  /** Sequences of other entries, by accession (used for remote locations). */
  seqio::TSequenceMap remote_sequences;

  ResolveOptions();
};

/**
 * Extracts the bases a location describes from a sequence.
 *
 * Parts of join() and order() are concatenated in the order they are
 * written; complement() yields the reverse complement of its content.
 * Fuzzy markers ('<', '>') do not change the bounds used.
 *
 * \throws ResolutionError wrapping the OutOfBoundsError, FuzzyPositionError,
 *         UnmappedBaseError or MissingSequenceError that stopped resolution
 */
std::string resolve(
  const Location& loc,
  const seqio::Sequence& seq,
  const ResolveOptions& opts = ResolveOptions()
);

} // namespace locio

#endif // LOCIO_RESOLVE_H
