#ifndef GBIO_METADATA_H
#define GBIO_METADATA_H

#include "../seqio/types.hpp"
#include <string>
#include <vector>

namespace gbio {

/** A REFERENCE block of a GenBank record. */
struct Reference
{
  std::string number;     /** reference number and covered bases ("1  (bases 1 to 5028)") */
  std::string authors;
  std::string consortium;
  std::string title;
  std::string journal;
  std::string pubmed;
  std::string remark;
};

/** Header data of a GenBank record (everything before FEATURES). */
struct Metadata
{
  std::string locus_name;
  seqio::TCoord length;           /** sequence length declared on the LOCUS line */
  std::string molecule_type;      /** e.g. "DNA", "mRNA", "ss-RNA" */
  std::string topology;           /** "linear", "circular" or empty */
  std::string division;           /** GenBank division, e.g. "PLN" */
  std::string modification_date;  /** e.g. "21-JUN-1999" */
  std::string definition;
  std::vector<std::string> accessions;
  std::string version;            /** accession.version */
  std::string dblink;
  std::string keywords;
  std::string source;
  std::string organism;           /** organism name and lineage, one per line */
  std::vector<Reference> references;
  std::string comment;

  Metadata();

  /** Identifier for the record's sequence: version, first accession or locus name. */
  std::string sequenceId() const;
  /** True if the LOCUS line declares a circular molecule. */
  bool isCircular() const;
};

/**
 * Fills the LOCUS fields of `meta` from the text after the LOCUS keyword.
 * \returns false if the line has no name or an unreadable length
 */
bool parseLocusLine(const std::string& value, Metadata& meta);

} // namespace gbio

#endif // GBIO_METADATA_H
