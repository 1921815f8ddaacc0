#include "GenbankReader.hpp"
#include "../stringio.hpp"
#include <boost/format.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>

using namespace std;
using boost::format;
using boost::str;
using stringio::startsWith;
using stringio::trim;

namespace gbio {

namespace {

/** Column where header values start (keywords occupy columns 0-11). */
const size_t KEYWORD_WIDTH = 12;
/** Column where feature locations and qualifiers start. */
const size_t FEATURE_VALUE_COL = 21;

bool isContinuation(const string& line) {
  return line.find_first_not_of(' ') >= KEYWORD_WIDTH;
}

/** True if a quoted value ends on this text (odd run of trailing quotes). */
bool closesQuote(const string& text) {
  size_t n = 0;
  for (string::const_reverse_iterator it = text.rbegin(); it != text.rend() && *it == '"'; ++it)
    n++;
  return n % 2 == 1;
}

/** Strips the closing quote and collapses doubled quotes. */
string unquote(const string& text) {
  string body = text.substr(0, text.size()-1);
  string value;
  for (size_t i=0; i<body.size(); i++) {
    value += body[i];
    if (body[i] == '"' && i+1 < body.size() && body[i+1] == '"') i++;
  }
  return value;
}

} // namespace

GenbankFormatError::GenbankFormatError(const string& msg, unsigned line_no)
: runtime_error(line_no > 0 ? str(format("line %u: %s") % line_no % msg) : msg),
  m_line_no(line_no)
{}

GenbankReader::GenbankReader(istream& input)
: m_input(input),
  m_line_no(0),
  m_has_pushback(false)
{}

/** Returns the next non-blank line. */
bool GenbankReader::nextLine(string& line) {
  if (m_has_pushback) {
    line = m_pushback;
    m_has_pushback = false;
    return true;
  }
  while (true) {
    stringio::safeGetline(m_input, line);
    if (m_input.fail() || (m_input.eof() && line.empty()))
      return false;
    m_line_no++;
    if (line.find_first_not_of(" \t") != string::npos)
      return true;
  }
}

void GenbankReader::pushBack(const string& line) {
  m_pushback = line;
  m_has_pushback = true;
}

/** Appends the indented lines following a keyword line to its value. */
string GenbankReader::readContinuation(const string& value, const string& sep) {
  string result = value;
  string line;
  while (nextLine(line)) {
    if (!isContinuation(line)) {
      pushBack(line);
      break;
    }
    if (!result.empty()) result += sep;
    result += trim(line);
  }
  return result;
}

bool GenbankReader::readRecord(GenbankRecord& record) {
  string line;
  if (!nextLine(line))
    return false;
  if (!startsWith(line, "LOCUS"))
    throw GenbankFormatError("expected LOCUS line at start of record", m_line_no);

  record = GenbankRecord();
  Metadata& meta = record.metadata;
  if (!parseLocusLine(trim(line.substr(5)), meta))
    throw GenbankFormatError("malformed LOCUS line", m_line_no);

  string bases;
  string section;
  bool terminated = false;
  while (nextLine(line)) {
    if (trim(line) == "//") {
      terminated = true;
      break;
    }
    if (isContinuation(line))
      continue; // belongs to a section we do not keep
    if (line[0] != ' ')
      section = trim(line.substr(0, min(line.size(), KEYWORD_WIDTH)));
    string keyword = trim(line.substr(0, min(line.size(), KEYWORD_WIDTH)));
    string value = line.size() > KEYWORD_WIDTH ? trim(line.substr(KEYWORD_WIDTH)) : "";

    if (keyword == "FEATURES") {
      parseFeatures(record.features);
    } else if (keyword == "ORIGIN") {
      bases = parseOrigin();
      terminated = true;
      break;
    } else if (keyword == "DEFINITION") {
      meta.definition = readContinuation(value, " ");
    } else if (keyword == "ACCESSION") {
      meta.accessions = stringio::splitWhitespace(readContinuation(value, " "));
    } else if (keyword == "VERSION") {
      vector<string> tokens = stringio::splitWhitespace(value);
      if (!tokens.empty()) meta.version = tokens[0];
    } else if (keyword == "DBLINK") {
      meta.dblink = readContinuation(value, "\n");
    } else if (keyword == "KEYWORDS") {
      meta.keywords = readContinuation(value, " ");
    } else if (keyword == "SOURCE") {
      meta.source = readContinuation(value, " ");
    } else if (keyword == "ORGANISM" && section == "SOURCE") {
      meta.organism = readContinuation(value, "\n");
    } else if (keyword == "REFERENCE") {
      meta.references.push_back(Reference());
      meta.references.back().number = readContinuation(value, " ");
    } else if (section == "REFERENCE" && !meta.references.empty()) {
      Reference& ref = meta.references.back();
      if (keyword == "AUTHORS")
        ref.authors = readContinuation(value, " ");
      else if (keyword == "CONSRTM")
        ref.consortium = readContinuation(value, " ");
      else if (keyword == "TITLE")
        ref.title = readContinuation(value, " ");
      else if (keyword == "JOURNAL")
        ref.journal = readContinuation(value, " ");
      else if (keyword == "PUBMED")
        ref.pubmed = readContinuation(value, " ");
      else if (keyword == "REMARK")
        ref.remark = readContinuation(value, " ");
    } else if (keyword == "COMMENT") {
      meta.comment = readContinuation(value, "\n");
    }
  }
  if (!terminated)
    throw GenbankFormatError(str(format("record '%s' is not terminated by '//'") % meta.locus_name), m_line_no);

  if (!bases.empty() && meta.length > 0 && bases.size() != meta.length) {
    fprintf(stderr, "[WARN] record '%s': LOCUS declares %lu bases, ORIGIN holds %lu.\n",
            meta.locus_name.c_str(), meta.length, bases.size());
  }
  record.sequence = seqio::Sequence(meta.sequenceId(), bases);

  return true;
}

/*
 *      gene            complement(<1..>172)
 *                      /locus_tag="LOC_1"
 *                      /note="spans two
 *                      lines"
 */
void GenbankReader::parseFeatures(locio::FeatureTable& features) {
  bool in_feature = false;
  bool open_quote = false;
  string key;
  string location;
  string pending;
  locio::TQualifiers qualifiers;

  string line;
  while (nextLine(line)) {
    if (line[0] != ' ') {
      pushBack(line);
      break;
    }
    size_t indent = line.find_first_not_of(' ');
    string content = trim(line);

    if (indent < FEATURE_VALUE_COL) {
      // new feature key
      if (open_quote)
        throw GenbankFormatError(str(format("unterminated value of qualifier '/%s'") % qualifiers.back().first), m_line_no);
      if (in_feature)
        features.add(key, location, qualifiers);
      size_t pos_space = content.find_first_of(" \t");
      key = content.substr(0, pos_space);
      location = (pos_space == string::npos) ? "" : trim(content.substr(pos_space));
      qualifiers.clear();
      in_feature = true;
      continue;
    }
    if (!in_feature)
      throw GenbankFormatError("feature data without a feature key", m_line_no);

    if (open_quote) {
      string sep = (qualifiers.back().first == "translation") ? "" : " ";
      pending += sep + content;
      if (closesQuote(pending)) {
        qualifiers.back().second = unquote(pending);
        open_quote = false;
      }
    } else if (content[0] == '/') {
      size_t pos_eq = content.find('=');
      string name = content.substr(1, pos_eq == string::npos ? string::npos : pos_eq-1);
      string value = (pos_eq == string::npos) ? "" : content.substr(pos_eq+1);
      qualifiers.push_back(make_pair(name, string()));
      if (!value.empty() && value[0] == '"') {
        pending = value.substr(1);
        if (closesQuote(pending))
          qualifiers.back().second = unquote(pending);
        else
          open_quote = true;
      } else {
        qualifiers.back().second = value;
      }
    } else if (qualifiers.empty()) {
      // location continues on this line
      location += content;
    } else {
      qualifiers.back().second += content;
    }
  }

  if (open_quote)
    throw GenbankFormatError(str(format("unterminated value of qualifier '/%s'") % qualifiers.back().first), m_line_no);
  if (in_feature)
    features.add(key, location, qualifiers);
}

/* Sequence lines hold a base count followed by blocks of ten bases:
 *       61 tcgacaaagc aacacatggt ...
 */
string GenbankReader::parseOrigin() {
  string bases;
  string line;
  while (true) {
    if (!nextLine(line))
      throw GenbankFormatError("ORIGIN section is not terminated by '//'", m_line_no);
    if (trim(line) == "//")
      break;
    for (char c : line) {
      if (isalpha(static_cast<unsigned char>(c)))
        bases += static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
  }
  return bases;
}

/*------------------------------*
 * convenience functions        *
 *------------------------------*/

shared_ptr<GenbankRecord> readGenbank(istream& input) {
  GenbankReader reader(input);
  shared_ptr<GenbankRecord> sp_rec(new GenbankRecord());
  if (!reader.readRecord(*sp_rec))
    throw GenbankFormatError("no GenBank record found", reader.lineNumber());
  return sp_rec;
}

shared_ptr<GenbankRecord> readGenbank(const string& filename) {
  ifstream f_in(filename.c_str());
  if (!f_in.good()) {
    throw GenbankFormatError(str(format("could not open file '%s'") % filename), 0);
  }
  return readGenbank(f_in);
}

vector<shared_ptr<GenbankRecord>> readGenbankRecords(istream& input) {
  vector<shared_ptr<GenbankRecord>> records;
  GenbankReader reader(input);
  while (true) {
    shared_ptr<GenbankRecord> sp_rec(new GenbankRecord());
    if (!reader.readRecord(*sp_rec)) break;
    records.push_back(sp_rec);
  }
  return records;
}

} // namespace gbio
