#include "Metadata.hpp"
#include "../stringio.hpp"
#include <cctype>
#include <cstdlib>

using namespace std;

namespace gbio {

Metadata::Metadata() : length(0) {}

string Metadata::sequenceId() const {
  if (!version.empty()) return version;
  if (!accessions.empty()) return accessions[0];
  return locus_name;
}

bool Metadata::isCircular() const {
  return topology == "circular";
}

namespace {

bool isDate(const string& token) {
  // DD-MMM-YYYY
  return token.size() == 11 && token[2] == '-' && token[6] == '-';
}

bool isDivision(const string& token) {
  if (token.size() != 3) return false;
  for (char c : token)
    if (!isupper(static_cast<unsigned char>(c))) return false;
  return true;
}

bool isNumber(const string& token) {
  if (token.empty()) return false;
  for (char c : token)
    if (!isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

} // namespace

/* Examples:
 *   LOCUS       SCU49845     5028 bp    DNA             PLN       21-JUN-1999
 *   LOCUS       NC_001416              48502 bp    DNA     linear   PHG 28-NOV-2018
 */
bool parseLocusLine(const string& value, Metadata& meta) {
  vector<string> tokens = stringio::splitWhitespace(value);
  if (tokens.empty()) return false;
  meta.locus_name = tokens[0];

  size_t idx = 1;
  if (tokens.size() > 2 && (tokens[2] == "bp" || tokens[2] == "aa")) {
    if (!isNumber(tokens[1])) return false;
    meta.length = strtoul(tokens[1].c_str(), NULL, 10);
    idx = 3;
  }

  vector<string> rest(tokens.begin()+idx, tokens.end());
  if (!rest.empty() && isDate(rest.back())) {
    meta.modification_date = rest.back();
    rest.pop_back();
  }
  if (!rest.empty() && isDivision(rest.back())) {
    meta.division = rest.back();
    rest.pop_back();
  }
  for (const string& token : rest) {
    if (token == "linear" || token == "circular")
      meta.topology = token;
    else if (meta.molecule_type.empty())
      meta.molecule_type = token;
  }

  return true;
}

} // namespace gbio
