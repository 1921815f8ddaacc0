#ifndef LOCIO_ERRORS_H
#define LOCIO_ERRORS_H

#include "Position.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace locio {

/** Base class of errors raised while parsing or resolving locations. */
class LocationError : public std::runtime_error
{
public:
  explicit LocationError(const std::string& msg);
};

/** Location text does not follow the GenBank location grammar. */
class LocationSyntaxError : public LocationError
{
public:
  /**
   * \param input   complete location text
   * \param offset  offset of the offending text within `input`
   * \param reason  what was wrong
   */
  LocationSyntaxError(const std::string& input, std::size_t offset, const std::string& reason);

  const std::string& input() const { return m_input; }
  std::size_t offset() const { return m_offset; }
  /** Offending substring (starting at offset()). */
  const std::string& fragment() const { return m_fragment; }
  const std::string& reason() const { return m_reason; }

private:
  std::string m_input;
  std::size_t m_offset;
  std::string m_fragment;
  std::string m_reason;
};

/** A position without a usable coordinate was used as a bound. */
class FuzzyPositionError : public LocationError
{
public:
  explicit FuzzyPositionError(const Position& pos);
  const Position& position() const { return m_pos; }

private:
  Position m_pos;
};

/** A remote location refers to a sequence that is not available. */
class MissingSequenceError : public LocationError
{
public:
  explicit MissingSequenceError(const std::string& accession);
  const std::string& accession() const { return m_accession; }

private:
  std::string m_accession;
};

/**
 * Resolution of a location failed.
 *
 * The underlying error is nested (see std::rethrow_if_nested); path() gives
 * the indices of the failing part through the enclosing join/order lists,
 * outermost first.
 */
class ResolutionError : public LocationError
{
public:
  enum Cause {
    OutOfBounds,
    FuzzyPosition,
    UnmappedBase,
    MissingSequence
  };

  ResolutionError(Cause cause, const std::vector<std::size_t>& path, const std::string& detail);

  Cause cause() const { return m_cause; }
  const std::vector<std::size_t>& path() const { return m_path; }

private:
  Cause m_cause;
  std::vector<std::size_t> m_path;
};

} // namespace locio

#endif // LOCIO_ERRORS_H
