#ifndef LOCIO_FEATURETABLE_H
#define LOCIO_FEATURETABLE_H

#include "Location.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace locio {

/** Qualifiers of a feature ("/name=value"), in file order. */
typedef std::vector<std::pair<std::string, std::string>> TQualifiers;

/**
 * An annotated region of a sequence (gene, CDS, ...).
 *
 * The location text is parsed on first access; the parsed tree is kept and
 * returned on every later access.
 */
class Feature
{
public:
  Feature(
    const std::string& key,
    const std::string& raw_location,
    const TQualifiers& qualifiers = TQualifiers()
  );

  const std::string& key() const { return m_key; }
  const std::string& rawLocation() const { return m_raw_location; }
  const TQualifiers& qualifiers() const { return m_qualifiers; }

  /** True if at least one qualifier with this name exists. */
  bool hasQualifier(const std::string& name) const;
  /**
   * Returns the value of the first qualifier with this name.
   * \throws std::out_of_range if there is none
   */
  const std::string& getQualifier(const std::string& name) const;
  /** Returns the values of all qualifiers with this name. */
  std::vector<std::string> getQualifiers(const std::string& name) const;

  /**
   * Returns the parsed location.
   * \throws LocationSyntaxError if the location text is invalid
   */
  const Location& location() const;
  /** True once the location has been parsed. */
  bool isParsed() const;

private:
  std::string m_key;
  std::string m_raw_location;
  TQualifiers m_qualifiers;
  mutable std::mutex m_mtx_location;
  mutable std::unique_ptr<const Location> m_location;
};

/** Features of a record in file order. */
class FeatureTable
{
public:
  typedef std::vector<std::shared_ptr<Feature>>::const_iterator const_iterator;

  FeatureTable();

  /** Appends a feature. */
  std::shared_ptr<Feature> add(
    const std::string& key,
    const std::string& raw_location,
    const TQualifiers& qualifiers = TQualifiers()
  );

  std::size_t size() const;
  bool empty() const;
  const_iterator begin() const;
  const_iterator end() const;
  /** Feature at table position `idx` (0-based). */
  const Feature& at(std::size_t idx) const;

  /** Table positions of all features with the given key. */
  std::vector<std::size_t> indicesOf(const std::string& key) const;

  /**
   * Location of the `occurrence`-th (0-based) feature with the given key.
   * \throws std::out_of_range if there is no such feature
   * \throws LocationSyntaxError if its location text is invalid
   */
  const Location& getLocation(const std::string& key, std::size_t occurrence = 0) const;
  /** Location of the feature at table position `idx`. */
  const Location& getLocation(std::size_t idx) const;

private:
  std::vector<std::shared_ptr<Feature>> m_features;
};

} // namespace locio

#endif // LOCIO_FEATURETABLE_H
