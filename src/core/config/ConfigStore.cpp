#include "ConfigStore.hpp"
#include <cstdio>
#include <sstream>

using namespace std;
namespace fs = boost::filesystem;
namespace po = boost::program_options;

namespace config {

namespace {

/** True if the option was given on the command line (not just defaulted). */
bool given(const po::variables_map& var_map, const char* name) {
  return var_map.count(name) && !var_map[name].defaulted();
}

/** Makes a relative path absolute with respect to `dir`. */
string resolvePath(const string& fn, const fs::path& dir) {
  if (fn.length() == 0) return fn;
  fs::path p( fn );
  if ( p.is_relative() ) {
    p = dir / p;
  }
  return p.string();
}

} // namespace

// default constructor
ConfigStore::ConfigStore()
{
  _config = YAML::Node();
}

bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  string fn_config = "";
  string fn_input = "";
  string feature_key = "";
  int occurrence = -1;
  string location = "";
  string fn_output = "";
  int line_width = 60;
  bool do_list = false;
  bool strict_complement = false;
  bool accept_approximate = false;
  bool fail_fast = false;
  int verb = 1;

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::TAG_NAME << endl << endl;
  ss << "Extracts the sequences of GenBank features." << endl << endl;
  ss << "Available options";

  po::options_description desc(ss.str());
  desc.add_options()
    ("version,v", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(), "config file (YAML)")
    ("input,i", po::value<string>(&fn_input), "GenBank file")
    ("feature,f", po::value<string>(&feature_key), "feature key to extract (e.g. 'CDS'; default: all features)")
    ("occurrence,n", po::value<int>(&occurrence)->default_value(-1), "extract only this occurrence (0-based) of the feature key")
    ("location,l", po::value<string>(&location), "resolve this location instead of the feature table")
    ("output,o", po::value<string>(&fn_output), "output FASTA file (default: stdout)")
    ("line-width,w", po::value<int>(&line_width)->default_value(60), "FASTA line width")
    ("list", po::bool_switch(&do_list), "list the feature table")
    ("strict-complement", po::bool_switch(&strict_complement), "fail on bases without a complement")
    ("accept-approximate", po::bool_switch(&accept_approximate), "use coordinate hints of unknown positions ('?12')")
    ("fail-fast", po::bool_switch(&fail_fast), "stop at the first feature that cannot be resolved")
    ("verbosity,V", po::value<int>(&verb)->default_value(1), "detail level of console output")
  ;

  po::variables_map var_map;

  try {
    po::store(po::parse_command_line(ac, av, desc), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << version::TAG_NAME << endl;
      return false;
    }

    if (var_map.count("help") || ac == 1) {
      std::cerr << desc << std::endl;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (const po::error &e) {
    fprintf(stderr, "\nArgumentError: %s\n", e.what());
    std::cerr << desc << std::endl;
    return false;
  }

  // Manage paths / filenames
  //---------------------------------------------------------------------------

  // get working directory
  fs::path path_work( fs::current_path() );
  // get config file's absolute directory
  fs::path path_conf( path_work );

  // check: config file exists
  if (var_map.count("config")) {
    fn_config = var_map["config"].as<string>();
    if (!fileExists(fn_config)) {
      fprintf(stderr, "\nArgumentError: File '%s' does not exist.\n", fn_config.c_str());
      return false;
    }
    // initialize global configuration from config file
    try {
      _config = YAML::LoadFile(fn_config);
    } catch (const YAML::Exception& e) {
      fprintf(stderr, "\nArgumentError: Could not read config file '%s': %s\n", fn_config.c_str(), e.what());
      return false;
    }
    if (_config.IsNull()) { // empty file
      _config = YAML::Node(YAML::NodeType::Map);
    } else if (!_config.IsMap()) {
      fprintf(stderr, "\nArgumentError: Config file '%s' must contain key-value pairs.\n", fn_config.c_str());
      return false;
    }
    // find files relative to config directory
    path_conf = fs::path( fn_config );
    if ( path_conf.is_relative() ) {
      path_conf = fs::system_complete( path_conf );
    }
    path_conf = path_conf.parent_path();
  }

  // overwrite/set config params
  // (making sure parameters are set)
  try {
    // GenBank input file (relative paths in config file: find from config location)
    if (given(var_map, "input") || !_config["input"]) {
      _config["input"] = fn_input;
    } else {
      _config["input"] = resolvePath(_config["input"].as<string>(), path_conf);
    }
    fn_input = _config["input"].as<string>();
    // output file
    if (given(var_map, "output") || !_config["output"]) {
      _config["output"] = fn_output;
    } else {
      _config["output"] = resolvePath(_config["output"].as<string>(), path_conf);
    }
    fn_output = _config["output"].as<string>();
    // feature key
    if (given(var_map, "feature") || !_config["feature"]) {
      _config["feature"] = feature_key;
    }
    feature_key = _config["feature"].as<string>();
    // occurrence of feature key
    if (given(var_map, "occurrence") || !_config["occurrence"]) {
      _config["occurrence"] = occurrence;
    }
    occurrence = _config["occurrence"].as<int>();
    // ad-hoc location
    if (given(var_map, "location") || !_config["location"]) {
      _config["location"] = location;
    }
    location = _config["location"].as<string>();
    // FASTA line width
    if (given(var_map, "line-width") || !_config["line-width"]) {
      _config["line-width"] = line_width;
    }
    line_width = _config["line-width"].as<int>();
    // switches
    if (given(var_map, "list") || !_config["list"]) {
      _config["list"] = do_list;
    }
    do_list = _config["list"].as<bool>();
    if (given(var_map, "strict-complement") || !_config["strict-complement"]) {
      _config["strict-complement"] = strict_complement;
    }
    strict_complement = _config["strict-complement"].as<bool>();
    if (given(var_map, "accept-approximate") || !_config["accept-approximate"]) {
      _config["accept-approximate"] = accept_approximate;
    }
    accept_approximate = _config["accept-approximate"].as<bool>();
    if (given(var_map, "fail-fast") || !_config["fail-fast"]) {
      _config["fail-fast"] = fail_fast;
    }
    fail_fast = _config["fail-fast"].as<bool>();
    // how chatty should status messages be?
    if (given(var_map, "verbosity") || !_config["verbosity"]) {
      _config["verbosity"] = verb;
    }
    verb = _config["verbosity"].as<int>();
    // sequences of other entries (remote locations), only from config file
    if (!_config["remote"] || _config["remote"].IsNull()) {
      _config["remote"] = YAML::Node(YAML::NodeType::Map);
    } else if (!_config["remote"].IsMap()) {
      fprintf(stderr, "\nArgumentError: Parameter 'remote' must map accessions to GenBank files.\n");
      return false;
    } else {
      for (auto kv : _config["remote"]) {
        kv.second = resolvePath(kv.second.as<string>(), path_conf);
      }
    }
  } catch (const YAML::Exception& e) {
    fprintf(stderr, "\nArgumentError: Invalid parameter value in config file: %s\n", e.what());
    return false;
  }

  //---------------------------------------------------------------------------
  // perform sanity checks
  //---------------------------------------------------------------------------

  // input file given and exists?
  if (fn_input.length() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'input' is required.\n");
    return false;
  }
  if (!fileExists(fn_input)) {
    fprintf(stderr, "\nArgumentError: Input file '%s' does not exist.\n", fn_input.c_str());
    return false;
  }
  // remote files exist?
  for (auto kv : getMap<string>("remote")) {
    if (!fileExists(kv.second)) {
      fprintf(stderr, "\nArgumentError: GenBank file '%s' for accession '%s' does not exist.\n",
              kv.second.c_str(), kv.first.c_str());
      return false;
    }
  }
  if (line_width < 1) {
    fprintf(stderr, "\nArgumentError: Line width must be positive (got %d).\n", line_width);
    return false;
  }
  if (occurrence < -1) {
    fprintf(stderr, "\nArgumentError: Occurrence must be >= 0 (got %d).\n", occurrence);
    return false;
  }
  if (occurrence >= 0 && feature_key.length() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'occurrence' requires a feature key.\n");
    return false;
  }
  if (do_list && location.length() > 0) {
    fprintf(stderr, "\nArgumentError: Options 'list' and 'location' are mutually exclusive.\n");
    return false;
  }

  if (verb > 1) {
    fprintf(stderr, "################################################################################\n");
    fprintf(stderr, "%s %s\n", PROGRAM_NAME, version::TAG_NAME);
    fprintf(stderr, "================================================================================\n");
    fprintf(stderr, "Running with the following options:\n");
    fprintf(stderr, "================================================================================\n");
    if (fn_config.length() > 0) {
      fprintf(stderr, "  config file:\t\t%s\n", fn_config.c_str());
    }
    fprintf(stderr, "  input file:\t\t%s\n", fn_input.c_str());
    if (location.length() > 0) {
      fprintf(stderr, "  location:\t\t%s\n", location.c_str());
    } else {
      fprintf(stderr, "  feature key:\t\t%s\n", feature_key.length() > 0 ? feature_key.c_str() : "(all)");
      if (occurrence >= 0) {
        fprintf(stderr, "  occurrence:\t\t%d\n", occurrence);
      }
    }
    fprintf(stderr, "  output file:\t\t%s\n", fn_output.length() > 0 ? fn_output.c_str() : "(stdout)");
    fprintf(stderr, "  line width:\t\t%d\n", line_width);
    fprintf(stderr, "  strict complement:\t%s\n", strict_complement ? "yes" : "no");
    fprintf(stderr, "  approximate coords:\t%s\n", accept_approximate ? "yes" : "no");
    fprintf(stderr, "  fail fast:\t\t%s\n", fail_fast ? "yes" : "no");
    for (auto kv : getMap<string>("remote")) {
      fprintf(stderr, "  remote entry:\t\t%s -> %s\n", kv.first.c_str(), kv.second.c_str());
    }
    fprintf(stderr, "################################################################################\n");
  }

  return true;
}

bool fileExists(string filename) {
  struct stat buffer;
  if (stat(filename.c_str(), &buffer)!=0) {
    return false;
  }
  return true;
}

} /* namespace config */
