#pragma once

#include "../stringio.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <map>
#include <sys/stat.h>
#include <gbloc/version.h>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "GbLoc"

namespace config {

/**
 * Program settings: command line options merged over an optional YAML
 * config file. After a successful parseArgs() every setting has a value.
 */
class ConfigStore
{
public:
  ConfigStore();
  /** Parse command line arguments.
   * @return true: program can run normally, false: indication to stop
   */
  bool parseArgs(int ac, char* av[]);
  template<typename T>
    T getValue(const char* key);
  template<typename T>
    T getValue(const std::string key);
  template<typename T>
    std::map<std::string, T> getMap(const char* key);

private:
  YAML::Node _config;
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

/** Looks up a value; nested keys are separated by ':' ("remote:NC_001416"). */
template<typename T>
T ConfigStore::getValue(const char* key) {
  std::vector<std::string> keys = stringio::split(std::string(key), ':');
  YAML::Node node = _config;
  for (const std::string& k : keys) {
    if (!node.IsMap() || !node[k]) {
      fprintf(stderr, "[WARN] ConfigStore: unknown parameter: '%s'\n", key);
      return T();
    }
    node.reset(node[k]); // rebind, do not overwrite
  }
  return node.as<T>();
}

template<typename T>
T
ConfigStore::getValue(const std::string key) {
  return getValue<T>(key.c_str());
}

template<typename T>
std::map<std::string, T>
ConfigStore::getMap(const char* key) {
  std::map<std::string, T> m;
  if (!_config[key]) {
    fprintf(stderr, "[ERROR] (ConfigStore::getMap) No element found with name '%s'.\n", key);
    return m;
  }
  YAML::Node node = _config[key];
  if (node.Type() != YAML::NodeType::Map) {
    fprintf(stderr, "[ERROR] (ConfigStore::getMap) Element '%s' is not a map.\n", key);
    return m;
  }
  for (auto kv : node) {
    std::string k = kv.first.as<std::string>();
    T v = kv.second.as<T>();
    m[k] = v;
  }
  return m;
}

} /* namespace config */
