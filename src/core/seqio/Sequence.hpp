#ifndef SEQUENCE_H
#define SEQUENCE_H

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace seqio {

/**
 * Read-only nucleotide sequence with GenBank coordinates.
 *
 * All positions are 1-based and ranges are inclusive at both ends. The
 * translation to string offsets happens only inside this class.
 */
class Sequence
{
public:
  /** default c'tor (empty sequence) */
  Sequence();
  /** Initialize from a flat nucleotide string. */
  Sequence(const std::string& id, const std::string& bases);

  /** Identifier (accession.version) of this sequence, may be empty. */
  const std::string& id() const;
  /** The flat nucleotide string. */
  const std::string& bases() const;
  /** Number of nucleotides. */
  TCoord length() const;
  bool empty() const;

  /** Returns the nucleotide at position `pos` (1-based). */
  char at(TCoord pos) const;
  /** Returns the nucleotides in [start, end] (1-based, inclusive). */
  std::string slice(TCoord start, TCoord end) const;

private:
  std::string m_id;
  std::string m_bases;
};

/** Requested coordinates do not lie within the sequence. */
class OutOfBoundsError : public std::out_of_range
{
public:
  OutOfBoundsError(TCoord start, TCoord end, TCoord length);
  TCoord start() const { return m_start; }
  TCoord end() const { return m_end; }
  TCoord length() const { return m_length; }

private:
  TCoord m_start;
  TCoord m_end;
  TCoord m_length;
};

/** A character without a complement was met under ComplementPolicy::Strict. */
class UnmappedBaseError : public std::runtime_error
{
public:
  explicit UnmappedBaseError(char base);
  char base() const { return m_base; }

private:
  char m_base;
};

} // namespace seqio

#endif // SEQUENCE_H
