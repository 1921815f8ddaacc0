#ifndef GBIO_GENBANKREADER_H
#define GBIO_GENBANKREADER_H

#include "GenbankRecord.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace gbio {

/** The input does not follow the GenBank flat file layout. */
class GenbankFormatError : public std::runtime_error
{
public:
  GenbankFormatError(const std::string& msg, unsigned line_no);
  /** Line of the input where the problem was detected (0 if unknown). */
  unsigned lineNumber() const { return m_line_no; }

private:
  unsigned m_line_no;
};

/**
 * Reads GenBank flat file records from a stream.
 *
 * Only the layout is checked; feature locations are kept as raw text and
 * parsed when first requested from the feature table.
 */
class GenbankReader
{
public:
  explicit GenbankReader(std::istream& input);

  /**
   * Reads the next record.
   * \returns false if the input holds no further record
   * \throws GenbankFormatError on malformed or truncated records
   */
  bool readRecord(GenbankRecord& record);
  /** Number of input lines consumed so far. */
  unsigned lineNumber() const { return m_line_no; }

private:
  bool nextLine(std::string& line);
  void pushBack(const std::string& line);
  std::string readContinuation(const std::string& value, const std::string& sep);
  void parseFeatures(locio::FeatureTable& features);
  std::string parseOrigin();

  std::istream& m_input;
  unsigned m_line_no;
  bool m_has_pushback;
  std::string m_pushback;
};

/** Reads the first record of a GenBank stream. */
std::shared_ptr<GenbankRecord> readGenbank(std::istream& input);
/** Reads the first record of a GenBank file. */
std::shared_ptr<GenbankRecord> readGenbank(const std::string& filename);
/** Reads all records of a GenBank stream. */
std::vector<std::shared_ptr<GenbankRecord>> readGenbankRecords(std::istream& input);

} // namespace gbio

#endif // GBIO_GENBANKREADER_H
