#include "seqio.hpp"
#include "stringio.hpp"
#include <fstream>
#include <stdexcept>

using namespace std;

namespace seqio {

string rev_comp (const string& dna, ComplementPolicy policy) {
  string rc(dna.rbegin(), dna.rend());
  for (string::iterator it = rc.begin(); it != rc.end(); ++it) {
    *it = complement(*it, policy);
  }
  return rc;
}

/** Write SeqRecords to FASTA file, using a defined line width. */
int writeFasta(
  const vector<shared_ptr<SeqRecord>>& sequences,
  const string filename,
  int line_width)
{
  int num_records = 0;
  ofstream ofs;
  ofs.open(filename);
  if (!ofs.good()) {
    throw runtime_error(stringio::format("Could not open file '%s' for writing.", filename.c_str()));
  }
  num_records = writeFasta(sequences, ofs, line_width);
  ofs.close();

  return num_records;
}

/** Write SeqRecords to FASTA file, using a defined line width. */
int writeFasta(
  const vector<shared_ptr<SeqRecord>>& seqs,
  ostream &output,
  int line_width)
{
  if (line_width < 1) {
    throw invalid_argument("FASTA line width must be positive.");
  }
  int recCount = 0;
  for (auto const & rec : seqs) {
    if (rec->description.empty())
      output << stringio::format(">%s\n", rec->id.c_str());
    else
      output << stringio::format(">%s %s\n", rec->id.c_str(), rec->description.c_str());
    string::const_iterator it_seq = rec->seq.begin();
    while (it_seq != rec->seq.end()) {
      for (int i=0; i<line_width && it_seq!=rec->seq.end(); ++i)
        output << *it_seq++;
      output << endl;
    }
    recCount++;
  }
  return recCount;
}

} /* namespace seqio */
