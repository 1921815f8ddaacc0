#ifndef SEQRECORD_H
#define SEQRECORD_H

#include <string>

namespace seqio {

/** A named sequence as written to FASTA output. */
struct SeqRecord
{
  std::string id;          /** identifier */
  std::string description; /** sequence description (everything after first space in ID line) */
  std::string seq;         /** actual sequence */
  SeqRecord(const std::string, const std::string, const std::string&);
  ~SeqRecord();
};

} // namespace seqio

#endif // SEQRECORD_H
