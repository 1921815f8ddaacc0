#ifndef SEQIO_TYPES_H
#define SEQIO_TYPES_H

#include <map>
#include <memory>
#include <string>

namespace seqio {

/** Represents genomic coordinates (1-based where used on a Sequence). */
typedef
unsigned long
TCoord;

class Sequence;

/** Sequences indexed by accession (used to resolve remote locations). */
typedef
std::map<
  std::string,
  std::shared_ptr<const Sequence>
>
TSequenceMap;

/** Treatment of characters other than A, C, G, T when complementing. */
enum ComplementPolicy {
  PassThrough, // map to itself
  Strict       // reject with UnmappedBaseError
};

} // namespace seqio

#endif // SEQIO_TYPES_H
