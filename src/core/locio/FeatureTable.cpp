#include "FeatureTable.hpp"
#include "parse.hpp"
#include <boost/format.hpp>
#include <stdexcept>

using namespace std;
using boost::format;
using boost::str;

namespace locio {

/* Feature *
 *---------*/

Feature::Feature(const string& key, const string& raw_location, const TQualifiers& qualifiers)
: m_key(key),
  m_raw_location(raw_location),
  m_qualifiers(qualifiers)
{}

bool Feature::hasQualifier(const string& name) const {
  for (auto const & q : m_qualifiers) {
    if (q.first == name) return true;
  }
  return false;
}

const string& Feature::getQualifier(const string& name) const {
  for (auto const & q : m_qualifiers) {
    if (q.first == name) return q.second;
  }
  throw out_of_range(str(format("Feature '%s' has no qualifier '%s'.") % m_key % name));
}

vector<string> Feature::getQualifiers(const string& name) const {
  vector<string> values;
  for (auto const & q : m_qualifiers) {
    if (q.first == name) values.push_back(q.second);
  }
  return values;
}

const Location& Feature::location() const {
  lock_guard<mutex> lock(m_mtx_location);
  if (!m_location) {
    m_location.reset(new Location(parseLocation(m_raw_location)));
  }
  return *m_location;
}

bool Feature::isParsed() const {
  lock_guard<mutex> lock(m_mtx_location);
  return m_location != nullptr;
}

/* FeatureTable *
 *--------------*/

FeatureTable::FeatureTable() {}

shared_ptr<Feature> FeatureTable::add(const string& key, const string& raw_location, const TQualifiers& qualifiers) {
  shared_ptr<Feature> sp_feat(new Feature(key, raw_location, qualifiers));
  m_features.push_back(sp_feat);
  return sp_feat;
}

size_t FeatureTable::size() const {
  return m_features.size();
}

bool FeatureTable::empty() const {
  return m_features.empty();
}

FeatureTable::const_iterator FeatureTable::begin() const {
  return m_features.begin();
}

FeatureTable::const_iterator FeatureTable::end() const {
  return m_features.end();
}

const Feature& FeatureTable::at(size_t idx) const {
  if (idx >= m_features.size()) {
    throw out_of_range(str(format("Feature index %lu exceeds table size (%lu).") % idx % m_features.size()));
  }
  return *m_features[idx];
}

vector<size_t> FeatureTable::indicesOf(const string& key) const {
  vector<size_t> indices;
  for (size_t i=0; i<m_features.size(); i++) {
    if (m_features[i]->key() == key) indices.push_back(i);
  }
  return indices;
}

const Location& FeatureTable::getLocation(const string& key, size_t occurrence) const {
  vector<size_t> indices = indicesOf(key);
  if (occurrence >= indices.size()) {
    throw out_of_range(str(format("No feature '%s' #%lu (%lu found).") % key % occurrence % indices.size()));
  }
  return m_features[indices[occurrence]]->location();
}

const Location& FeatureTable::getLocation(size_t idx) const {
  return at(idx).location();
}

} // namespace locio
