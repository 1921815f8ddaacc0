/**
 * Extraction of feature sequences from GenBank records.
 *
 * Reads one GenBank record, resolves the locations of its features (or of
 * a location given by the user) and writes the resulting sequences in
 * FASTA format.
 */
#include "core/config/ConfigStore.hpp"
#include "core/gbio.hpp"
#include "core/locio.hpp"
#include "core/seqio.hpp"

#include <boost/format.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace std;
using boost::format;
using boost::str;
using config::ConfigStore;
using gbio::GenbankRecord;
using locio::Feature;
using locio::FeatureTable;
using locio::Location;
using locio::ResolveOptions;
using seqio::SeqRecord;
using seqio::Sequence;

namespace {

/** Short label for a feature: first /gene, /locus_tag or /product value. */
string featureLabel(const Feature& feat) {
  const char* names[] = { "gene", "locus_tag", "product" };
  for (const char* name : names) {
    if (feat.hasQualifier(name)) return feat.getQualifier(name);
  }
  return "";
}

void listFeatures(const FeatureTable& table) {
  size_t idx = 0;
  for (auto const & sp_feat : table) {
    fprintf(stdout, "%lu\t%s\t%s\t%s\n", idx++, sp_feat->key().c_str(),
            sp_feat->rawLocation().c_str(), featureLabel(*sp_feat).c_str());
  }
}

/** Table positions of the features to extract. */
vector<size_t> selectFeatures(const FeatureTable& table, const string& key, int occurrence) {
  vector<size_t> indices;
  if (key.length() == 0) {
    for (size_t i=0; i<table.size(); i++) indices.push_back(i);
    return indices;
  }
  indices = table.indicesOf(key);
  if (occurrence >= 0) {
    size_t occ = static_cast<size_t>(occurrence);
    if (occ >= indices.size()) return vector<size_t>();
    return vector<size_t>(1, indices[occ]);
  }
  return indices;
}

} // namespace

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  bool args_ok = config.parseArgs(argc, argv);
  if (!args_ok) { return EXIT_FAILURE; }

  string fn_input = config.getValue<string>("input");
  string fn_output = config.getValue<string>("output");
  string feature_key = config.getValue<string>("feature");
  int occurrence = config.getValue<int>("occurrence");
  string str_location = config.getValue<string>("location");
  int line_width = config.getValue<int>("line-width");
  bool do_list = config.getValue<bool>("list");
  bool fail_fast = config.getValue<bool>("fail-fast");
  int verbosity = config.getValue<int>("verbosity");

  ResolveOptions opts;
  opts.accept_approximate = config.getValue<bool>("accept-approximate");
  opts.complement_policy = config.getValue<bool>("strict-complement") ? seqio::Strict : seqio::PassThrough;

  // read input record
  shared_ptr<GenbankRecord> sp_rec;
  try {
    sp_rec = gbio::readGenbank(fn_input);
  } catch (const gbio::GenbankFormatError& e) {
    fprintf(stderr, "[ERROR] Could not read GenBank file '%s': %s\n", fn_input.c_str(), e.what());
    return EXIT_FAILURE;
  }
  const Sequence& sequence = sp_rec->sequence;
  if (verbosity > 0) {
    fprintf(stderr, "[INFO] Read record '%s' (%lu bp, %lu features).\n",
            sp_rec->metadata.sequenceId().c_str(), sequence.length(), sp_rec->features.size());
  }

  // read entries referenced by remote locations
  map<string, string> remote_files = config.getMap<string>("remote");
  for (auto const & kv : remote_files) {
    try {
      shared_ptr<GenbankRecord> sp_remote = gbio::readGenbank(kv.second);
      opts.remote_sequences[kv.first] = make_shared<const Sequence>(kv.first, sp_remote->sequence.bases());
    } catch (const gbio::GenbankFormatError& e) {
      fprintf(stderr, "[ERROR] Could not read GenBank file '%s' for '%s': %s\n",
              kv.second.c_str(), kv.first.c_str(), e.what());
      return EXIT_FAILURE;
    }
    if (verbosity > 1) {
      fprintf(stderr, "[INFO] Loaded remote entry '%s' from '%s'.\n", kv.first.c_str(), kv.second.c_str());
    }
  }

  if (do_list) {
    listFeatures(sp_rec->features);
    return EXIT_SUCCESS;
  }

  string seq_id = sp_rec->metadata.sequenceId();
  vector<shared_ptr<SeqRecord>> out_records;

  if (str_location.length() > 0) {
    // ad-hoc location
    try {
      Location loc = locio::parseLocation(str_location);
      string bases = locio::resolve(loc, sequence, opts);
      out_records.push_back(make_shared<SeqRecord>(seq_id, locio::toString(loc), bases));
    } catch (const locio::LocationError& e) {
      fprintf(stderr, "[ERROR] %s\n", e.what());
      return EXIT_FAILURE;
    }
  } else {
    vector<size_t> indices = selectFeatures(sp_rec->features, feature_key, occurrence);
    if (indices.empty()) {
      fprintf(stderr, "[WARN] No matching features found in '%s'.\n", fn_input.c_str());
    }
    int num_failed = 0;
    for (size_t idx : indices) {
      const Feature& feat = sp_rec->features.at(idx);
      try {
        string bases = locio::resolve(feat.location(), sequence, opts);
        string id = str(format("%s|%s|%lu") % seq_id % feat.key() % idx);
        out_records.push_back(make_shared<SeqRecord>(id, feat.rawLocation(), bases));
      } catch (const locio::LocationError& e) {
        if (fail_fast) {
          fprintf(stderr, "[ERROR] Feature #%lu (%s): %s\n", idx, feat.key().c_str(), e.what());
          return EXIT_FAILURE;
        }
        fprintf(stderr, "[WARN] Skipping feature #%lu (%s): %s\n", idx, feat.key().c_str(), e.what());
        num_failed++;
      }
    }
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] Resolved %lu of %lu features.\n", out_records.size(), indices.size());
      if (num_failed > 0) {
        fprintf(stderr, "[INFO] %d features could not be resolved.\n", num_failed);
      }
    }
  }

  // write sequences
  try {
    if (fn_output.length() > 0) {
      seqio::writeFasta(out_records, fn_output, line_width);
      if (verbosity > 0) {
        fprintf(stderr, "[INFO] Wrote %lu sequences to '%s'.\n", out_records.size(), fn_output.c_str());
      }
    } else {
      seqio::writeFasta(out_records, cout, line_width);
    }
  } catch (const exception& e) {
    fprintf(stderr, "[ERROR] %s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
