#ifndef GBIO_GENBANKRECORD_H
#define GBIO_GENBANKRECORD_H

#include "Metadata.hpp"
#include "../locio/FeatureTable.hpp"
#include "../seqio/Sequence.hpp"

namespace gbio {

/** One entry of a GenBank flat file (LOCUS ... //). */
struct GenbankRecord
{
  Metadata metadata;
  locio::FeatureTable features;
  seqio::Sequence sequence;  /** empty if the record has no ORIGIN section */
};

} // namespace gbio

#endif // GBIO_GENBANKRECORD_H
