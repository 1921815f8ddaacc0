#include <boost/test/unit_test.hpp>

#include "../core/seqio.hpp"
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
using namespace std;
using namespace seqio;

struct FixtureSeqio {
  FixtureSeqio() : seq("TEST1.1", "ACGTACGT") {
    BOOST_TEST_MESSAGE( "set up fixure" );
  }
  ~FixtureSeqio() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  Sequence seq;
};

BOOST_FIXTURE_TEST_SUITE( seqio, FixtureSeqio )

/* 1-based, inclusive access */
BOOST_AUTO_TEST_CASE( access )
{
  BOOST_CHECK_EQUAL( seq.id(), "TEST1.1" );
  BOOST_CHECK_EQUAL( seq.length(), 8 );
  BOOST_CHECK( !seq.empty() );
  BOOST_CHECK_EQUAL( seq.at(1), 'A' );
  BOOST_CHECK_EQUAL( seq.at(8), 'T' );
  BOOST_CHECK_EQUAL( seq.slice(2, 4), "CGT" );
  BOOST_CHECK_EQUAL( seq.slice(1, 8), "ACGTACGT" );
  BOOST_CHECK_EQUAL( seq.slice(5, 5), "A" );
  BOOST_CHECK( Sequence().empty() );
}

/* coordinates are never clamped */
BOOST_AUTO_TEST_CASE( bounds )
{
  BOOST_CHECK_THROW( seq.at(0), OutOfBoundsError );
  BOOST_CHECK_THROW( seq.at(9), OutOfBoundsError );
  BOOST_CHECK_THROW( seq.slice(0, 3), OutOfBoundsError );
  BOOST_CHECK_THROW( seq.slice(5, 9), OutOfBoundsError );
  BOOST_CHECK_THROW( seq.slice(5, 4), OutOfBoundsError );

  Sequence seq10("", "ACGTACGTAC");
  try {
    seq10.slice(1, 100);
    BOOST_ERROR( "slice beyond sequence end did not throw" );
  } catch (const OutOfBoundsError& e) {
    BOOST_TEST_MESSAGE( e.what() );
    BOOST_CHECK_EQUAL( e.start(), 1 );
    BOOST_CHECK_EQUAL( e.end(), 100 );
    BOOST_CHECK_EQUAL( e.length(), 10 );
  }
}

BOOST_AUTO_TEST_CASE( revcomp )
{
  BOOST_CHECK_EQUAL( rev_comp("AAGT"), "ACTT" );
  BOOST_CHECK_EQUAL( rev_comp("ACGT"), "ACGT" );
  BOOST_CHECK_EQUAL( rev_comp("aaGt"), "aCtt" );
  BOOST_CHECK_EQUAL( rev_comp(""), "" );
  string dna = "GATTACAGGC";
  BOOST_CHECK_EQUAL( rev_comp(rev_comp(dna)), dna );

  // characters without complement
  BOOST_CHECK_EQUAL( rev_comp("AANT"), "ANTT" );
  BOOST_CHECK_EQUAL( rev_comp("AANT", PassThrough), "ANTT" );
  BOOST_CHECK_THROW( rev_comp("AANT", Strict), UnmappedBaseError );
  BOOST_CHECK_EQUAL( rev_comp("AAGT", Strict), "ACTT" );
  try {
    complement('R', Strict);
    BOOST_ERROR( "complement of 'R' did not throw" );
  } catch (const UnmappedBaseError& e) {
    BOOST_CHECK_EQUAL( e.base(), 'R' );
  }
}

BOOST_AUTO_TEST_CASE( fasta )
{
  vector<shared_ptr<SeqRecord>> records;
  records.push_back(make_shared<SeqRecord>("r1", "join(1..4,7..12)", "ACGTACGTAC"));
  records.push_back(make_shared<SeqRecord>("r2", "", "GG"));

  ostringstream out;
  int num_records = writeFasta(records, out, 4);
  BOOST_CHECK_EQUAL( num_records, 2 );
  BOOST_CHECK_EQUAL( out.str(), ">r1 join(1..4,7..12)\nACGT\nACGT\nAC\n>r2\nGG\n" );

  ostringstream out_wide;
  writeFasta(records, out_wide);
  BOOST_CHECK_EQUAL( out_wide.str(), ">r1 join(1..4,7..12)\nACGTACGTAC\n>r2\nGG\n" );

  ostringstream out_bad;
  BOOST_CHECK_THROW( writeFasta(records, out_bad, 0), invalid_argument );
  BOOST_CHECK_THROW( writeFasta(records, string("no/such/dir/out.fa")), runtime_error );
}

BOOST_AUTO_TEST_SUITE_END()
