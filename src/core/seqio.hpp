#ifndef SEQIO_H
#define SEQIO_H

#include "seqio/SeqRecord.hpp"
#include "seqio/Sequence.hpp"
#include "seqio/types.hpp"
#include <iostream>
#include <memory> // unique_ptr, shared_ptr, weak_ptr
#include <string>
#include <vector>

/** Handles sequence data (access, complement, write). */
namespace seqio {

/**
 * Get the complement of a nucleotide (case is preserved).
 *
 * \param nuc     nucleotide character
 * \param policy  treatment of characters other than A, C, G, T
 * \returns complementary nucleotide; `nuc` itself for unmapped characters
 *          under ComplementPolicy::PassThrough
 * \throws UnmappedBaseError for unmapped characters under ComplementPolicy::Strict
 */
inline char complement (char nuc, ComplementPolicy policy = PassThrough) {
   switch (nuc) {
     case 'A': return 'T';
     case 'a': return 't';
     case 'C': return 'G';
     case 'c': return 'g';
     case 'G': return 'C';
     case 'g': return 'c';
     case 'T': return 'A';
     case 't': return 'a';
   }
   if (policy == Strict) {
     throw UnmappedBaseError(nuc);
   }
   return nuc;
}

/**
 * Get reverse complement of a DNA sequence.
 */
std::string rev_comp (const std::string& dna, ComplementPolicy policy = PassThrough);

/** Writes sequences to file. */
int writeFasta(const std::vector<std::shared_ptr<SeqRecord>>&, const std::string fn, int len_line = 60);
/** Writes sequences to ostream. */
int writeFasta(const std::vector<std::shared_ptr<SeqRecord>>&, std::ostream& os, int len_line = 60);

} /* namespace seqio */

#endif /* SEQIO_H */
