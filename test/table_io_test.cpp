/*
    popsum - Population genetic summary statistics
    Copyright (C) 2024 Lucas Czech

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.

    Contact:
    Lucas Czech <lczech@carnegiescience.edu>
    Department of Plant Biology, Carnegie Institution For Science
    260 Panama Street, Stanford, CA 94305, USA
*/

#include "boost/test/unit_test.hpp"

#include "population/accumulator.hpp"
#include "population/aggregator.hpp"
#include "population/errors.hpp"
#include "population/pairwise_matrix.hpp"
#include "population/table_io.hpp"

#include "genesis/utils/io/input_source.hpp"

#include <map>
#include <sstream>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE( test_table_io )

static SiteStat make_stat(
    std::string const& pop1, std::string const& pop2, Statistic statistic,
    std::string const& locus, double numerator, double denominator, size_t sites
) {
    SiteStat stat;
    stat.population_pair = PopulationPair( pop1, pop2 );
    stat.statistic       = statistic;
    parse_locus( locus, stat.chromosome, stat.window );
    stat.numerator       = numerator;
    stat.denominator     = denominator;
    stat.sites_compared  = sites;
    return stat;
}

static RunningSums example_sums_()
{
    std::vector<SiteStat> const stats = {
        make_stat( "A", "",  Statistic::kPi,  "chr1:1-100",   1.0,  4.0, 40 ),
        make_stat( "A", "",  Statistic::kHet, "chr1:1-100",   0.0,  0.0, 0 ),
        make_stat( "A", "",  Statistic::kPi,  "chr1:101-200", 3.0,  8.0, 80 ),
        make_stat( "A", "B", Statistic::kDxy, "chr1:1-100",   1.5,  2.0, 20 ),
        make_stat( "A", "B", Statistic::kFst, "chr1:1-100",  -0.25, 2.0, 20 ),
        make_stat( "B", "",  Statistic::kPi,  "contig_7",     0.5,  1.0, 10 ),
    };
    return accumulate( stats );
}

// =================================================================================================
//      Summary Tables
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_SummaryTableWindow )
{
    using namespace genesis::utils;

    auto const aggs = aggregate( example_sums_(), AggregationLevel::kWindow );
    std::ostringstream os;
    write_summary_table( os, aggs, AggregationLevel::kWindow );

    std::string const expected =
        "population1\tpopulation2\tchrom\tstart\tend\tlocus"
        "\tpi\tpi.sites\tpi.weight\tdxy\tdxy.sites\tdxy.weight"
        "\tfst\tfst.sites\tfst.weight\thet\thet.sites\thet.weight\n"
        "A\tNA\tchr1\t1\t100\tchr1:1-100\t0.25\t40\t4\tNA\tNA\tNA\tNA\tNA\tNA\tNA\t0\t0\n"
        "A\tNA\tchr1\t101\t200\tchr1:101-200\t0.375\t80\t8\tNA\tNA\tNA\tNA\tNA\tNA\tNA\tNA\tNA\n"
        "A\tB\tchr1\t1\t100\tchr1:1-100\tNA\tNA\tNA\t0.75\t20\t2\t-0.125\t20\t2\tNA\tNA\tNA\n"
        "B\tNA\tcontig_7\tNA\tNA\tcontig_7\t0.5\t10\t1\tNA\tNA\tNA\tNA\tNA\tNA\tNA\tNA\tNA\n"
    ;
    BOOST_CHECK_EQUAL( os.str(), expected );

    auto const read = read_summary_table( from_string( os.str() ), AggregationLevel::kWindow );
    BOOST_REQUIRE_EQUAL( read.size(), aggs.size() );
    for( size_t i = 0; i < aggs.size(); ++i ) {
        BOOST_CHECK( read[i] == aggs[i] );
    }
}

BOOST_AUTO_TEST_CASE( test_SummaryTableGenome )
{
    using namespace genesis::utils;

    TableFormat format;
    format.separator = ',';
    format.na_entry  = "nan";

    auto const aggs = aggregate( example_sums_(), AggregationLevel::kGenome );
    std::ostringstream os;
    write_summary_table( os, aggs, AggregationLevel::kGenome, format );

    std::string const expected =
        "population1,population2,pi,pi.sites,pi.weight,dxy,dxy.sites,dxy.weight"
        ",fst,fst.sites,fst.weight,het,het.sites,het.weight\n"
        "A,nan,0.33333333333333331,120,12,nan,nan,nan,nan,nan,nan,nan,0,0\n"
        "A,B,nan,nan,nan,0.75,20,2,-0.125,20,2,nan,nan,nan\n"
        "B,nan,0.5,10,1,nan,nan,nan,nan,nan,nan,nan,nan,nan\n"
    ;
    BOOST_CHECK_EQUAL( os.str(), expected );

    auto const read = read_summary_table( from_string( os.str() ), AggregationLevel::kGenome, format );
    BOOST_REQUIRE_EQUAL( read.size(), aggs.size() );
    BOOST_CHECK( read[0].population_pair == PopulationPair( "A" ));
    BOOST_CHECK( read[0].statistic == Statistic::kPi );
    BOOST_CHECK( read[0].value == MaybeDouble( 1.0 / 3.0 ));
    BOOST_CHECK( read[1].statistic == Statistic::kHet );
    BOOST_CHECK( read[1].value.is_missing() );
    BOOST_CHECK_EQUAL( read[1].weight, 0.0 );
    for( size_t i = 0; i < aggs.size(); ++i ) {
        BOOST_CHECK( read[i] == aggs[i] );
    }
}

BOOST_AUTO_TEST_CASE( test_SummaryTableMalformed )
{
    using namespace genesis::utils;

    BOOST_CHECK_THROW(
        read_summary_table( from_string( "" ), AggregationLevel::kGenome ),
        MalformedInputError
    );
    BOOST_CHECK_THROW(
        read_summary_table( from_string(
            "population1\tpopulation2\tpi\tpi.sites\n"
        ), AggregationLevel::kGenome ),
        MalformedInputError
    );
    BOOST_CHECK_THROW(
        read_summary_table( from_string(
            "population1\tpopulation2\ttheta\ttheta.sites\ttheta.weight\n"
        ), AggregationLevel::kGenome ),
        MalformedInputError
    );
    BOOST_CHECK_THROW(
        read_summary_table( from_string(
            "population1\tpopulation2\tpi\tpi.sites\tpi.weight\n"
            "A\tNA\t0.5\t10\n"
        ), AggregationLevel::kGenome ),
        MalformedInputError
    );
    BOOST_CHECK_THROW(
        read_summary_table( from_string(
            "population1\tpopulation2\tpi\tpi.sites\tpi.weight\n"
            "A\tNA\tabc\t10\t1\n"
        ), AggregationLevel::kGenome ),
        MalformedInputError
    );
    BOOST_CHECK_THROW(
        read_summary_table( from_string(
            "population1\tpopulation2\tpi\tpi.sites\tpi.weight\n"
        ), AggregationLevel::kWindow ),
        MalformedInputError
    );
}

// =================================================================================================
//      Pairwise Matrix
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_PairwiseMatrixTable )
{
    using namespace genesis::utils;

    std::vector<SiteStat> const stats = {
        make_stat( "A", "B", Statistic::kDxy, "chr1:1-100", 1.0, 4.0, 10 ),
        make_stat( "B", "C", Statistic::kDxy, "chr1:1-100", 1.0, 2.0, 10 ),
    };
    auto const genome = aggregate( accumulate( stats ), AggregationLevel::kGenome );
    auto const matrix = build_matrix( genome, Statistic::kDxy );

    std::ostringstream os;
    write_pairwise_matrix( os, matrix );
    std::string const expected =
        "population\tA\tB\tC\n"
        "A\t0\t0.25\tNA\n"
        "B\t0.25\t0\t0.5\n"
        "C\tNA\t0.5\t0\n"
    ;
    BOOST_CHECK_EQUAL( os.str(), expected );

    auto const read = read_pairwise_matrix( from_string( os.str() ), Statistic::kDxy );
    BOOST_CHECK( read.statistic == Statistic::kDxy );
    BOOST_REQUIRE_EQUAL( read.populations.size(), 3 );
    BOOST_CHECK_EQUAL( read.populations[2], "C" );
    for( size_t r = 0; r < 3; ++r ) {
        for( size_t c = 0; c < 3; ++c ) {
            BOOST_CHECK( read.values( r, c ) == matrix.values( r, c ));
        }
    }

    // Rows need to follow the header order.
    BOOST_CHECK_THROW(
        read_pairwise_matrix( from_string(
            "population\tA\tB\n"
            "B\t0\t1\n"
            "A\t1\t0\n"
        ), Statistic::kDxy ),
        MalformedInputError
    );
    BOOST_CHECK_THROW(
        read_pairwise_matrix( from_string(
            "population\tA\tB\n"
            "A\t0\t1\n"
        ), Statistic::kDxy ),
        MalformedInputError
    );
}

// =================================================================================================
//      Sample Genotype Statistics
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_SampleStatsTable )
{
    using namespace genesis::utils;

    std::map<std::string, SampleGenoSummary> stats;
    SampleGenoStat s1;
    s1.sample_id          = "S1";
    s1.heterozygous_sites = 3;
    s1.homozygous_sites   = 1;
    s1.missing_sites      = 4;
    s1.total_sites        = 8;
    stats[ "S1" ] = finalize( s1 );
    SampleGenoStat s2;
    s2.sample_id     = "S2";
    s2.missing_sites = 2;
    s2.total_sites   = 2;
    stats[ "S2" ] = finalize( s2 );

    std::ostringstream os;
    write_sample_stats( os, stats );
    std::string const expected =
        "sample\thet\thom\tmissing\ttotal\theterozygosity\tcall_rate\n"
        "S1\t3\t1\t4\t8\t0.75\t0.5\n"
        "S2\t0\t0\t2\t2\tNA\t0\n"
    ;
    BOOST_CHECK_EQUAL( os.str(), expected );

    auto const read = read_sample_stats( from_string( os.str() ));
    BOOST_REQUIRE_EQUAL( read.size(), 2 );
    BOOST_CHECK_EQUAL( read.at( "S1" ).total_sites, 8 );
    BOOST_CHECK( read.at( "S1" ).heterozygosity == MaybeDouble( 0.75 ));
    BOOST_CHECK( read.at( "S2" ).heterozygosity.is_missing() );
    BOOST_CHECK( read.at( "S2" ).call_rate == MaybeDouble( 0.0 ));

    BOOST_CHECK_THROW( read_sample_stats( from_string( os.str() + "S1\t0\t0\t0\t0\tNA\tNA\n" )), MalformedInputError );
    BOOST_CHECK_THROW(
        read_sample_stats( from_string(
            "sample\thet\thom\tmissing\ttotal\theterozygosity\tcall_rate\n"
            "S1\tNA\t1\t4\t8\t0.75\t0.5\n"
        )),
        MalformedInputError
    );
}

// =================================================================================================
//      Derived Alleles
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_DerivedAllelesTable )
{
    using namespace genesis::utils;

    std::vector<std::string> const samples = { "S1", "S2" };
    std::vector<DerivedAlleleRecord> records( 2 );
    records[0].chromosome       = "chr1";
    records[0].position         = 10;
    records[0].ancestral_allele = "A";
    records[0].derived_allele   = "C,G";
    records[0].score            = 0.125;
    records[0].genotyped        = true;
    records[0].derived_counts   = { MaybeCount( 2 ), MaybeCount() };
    records[1].chromosome       = "chr2";
    records[1].position         = 5;
    records[1].ancestral_allele = "T";
    records[1].derived_counts   = { MaybeCount(), MaybeCount() };

    std::ostringstream os;
    write_derived_alleles( os, records, samples );
    std::string const expected =
        "chrom\tpos\tancestral\tderived\tscore\tS1.derived_count\tS2.derived_count\n"
        "chr1\t10\tA\tC,G\t0.125\t2\tNA\n"
        "chr2\t5\tT\tNA\tNA\tNA\tNA\n"
    ;
    BOOST_CHECK_EQUAL( os.str(), expected );

    std::vector<std::string> read_samples;
    auto const read = read_derived_alleles( from_string( os.str() ), read_samples );
    BOOST_CHECK( read_samples == samples );
    BOOST_REQUIRE_EQUAL( read.size(), 2 );
    BOOST_CHECK_EQUAL( read[0].derived_allele, "C,G" );
    BOOST_CHECK( read[0].score == MaybeDouble( 0.125 ));
    BOOST_CHECK( read[0].genotyped );
    BOOST_CHECK( read[0].derived_counts == records[0].derived_counts );
    BOOST_CHECK( ! read[1].genotyped );
    BOOST_CHECK( read[1].derived_allele.empty() );
    BOOST_CHECK( read[1].score.is_missing() );
    BOOST_CHECK( read[1].derived_counts == records[1].derived_counts );

    // Count columns have to match the samples.
    std::vector<std::string> const other = { "S1" };
    BOOST_CHECK_THROW( write_derived_alleles( os, records, other ), std::invalid_argument );
}

BOOST_AUTO_TEST_SUITE_END()
