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

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE( test_aggregator )

static SiteStat make_stat(
    std::string const& pop1, std::string const& pop2, Statistic statistic,
    std::string const& chrom, size_t start, size_t end,
    double numerator, double denominator
) {
    SiteStat stat;
    stat.population_pair = PopulationPair( pop1, pop2 );
    stat.statistic       = statistic;
    stat.chromosome      = chrom;
    stat.window.locus    = chrom + ":" + std::to_string( start ) + "-" + std::to_string( end );
    stat.window.start    = start;
    stat.window.end      = end;
    stat.numerator       = numerator;
    stat.denominator     = denominator;
    stat.sites_compared  = 5;
    return stat;
}

BOOST_AUTO_TEST_CASE( test_GenomeFstIsRatioOfSums )
{
    // Window values 0.5 and 0.125. Their mean is 0.3125,
    // but the ratio of the sums is 2 / 10 = 0.2.
    std::vector<SiteStat> stats = {
        make_stat( "A", "B", Statistic::kFst, "chr1", 1,   100, 1.0, 2.0 ),
        make_stat( "A", "B", Statistic::kFst, "chr2", 1,   100, 1.0, 8.0 ),
    };
    auto const sums = accumulate( stats );

    auto const windows = aggregate( sums, AggregationLevel::kWindow );
    BOOST_REQUIRE_EQUAL( windows.size(), 2 );
    BOOST_CHECK_CLOSE( windows[0].value.value(), 0.5, 1e-9 );
    BOOST_CHECK_CLOSE( windows[1].value.value(), 0.125, 1e-9 );
    auto const mean_of_ratios = ( windows[0].value.value() + windows[1].value.value() ) / 2.0;

    auto const genome = aggregate( sums, AggregationLevel::kGenome );
    BOOST_REQUIRE_EQUAL( genome.size(), 1 );
    BOOST_CHECK( genome[0].population_pair == PopulationPair( "A", "B" ));
    BOOST_CHECK( genome[0].chromosome.empty() );
    BOOST_CHECK_CLOSE( genome[0].value.value(), 0.2, 1e-9 );
    BOOST_CHECK_CLOSE( genome[0].weight, 10.0, 1e-9 );
    BOOST_CHECK_EQUAL( genome[0].sites_compared, 10 );
    BOOST_CHECK( std::abs( genome[0].value.value() - mean_of_ratios ) > 0.1 );
}

BOOST_AUTO_TEST_CASE( test_ZeroDenominatorIsMissing )
{
    std::vector<SiteStat> stats = {
        make_stat( "A", "", Statistic::kPi, "chr1", 1,   100, 0.0, 0.0 ),
        make_stat( "A", "", Statistic::kPi, "chr1", 101, 200, 1.0, 4.0 ),
        make_stat( "B", "", Statistic::kPi, "chr1", 1,   100, 0.0, 0.0 ),
    };
    auto const sums = accumulate( stats );

    auto const windows = aggregate( sums, AggregationLevel::kWindow );
    BOOST_REQUIRE_EQUAL( windows.size(), 3 );
    BOOST_CHECK( windows[0].value.is_missing() );
    BOOST_CHECK_EQUAL( windows[0].weight, 0.0 );
    BOOST_CHECK( windows[1].value == MaybeDouble( 0.25 ));
    BOOST_CHECK( windows[2].value.is_missing() );
    BOOST_CHECK_THROW( windows[2].value.value(), std::domain_error );

    // At chromosome level, the empty window does not make the sum missing,
    // but a population with only empty windows stays missing.
    auto const chroms = aggregate( sums, AggregationLevel::kChromosome );
    BOOST_REQUIRE_EQUAL( chroms.size(), 2 );
    BOOST_CHECK( chroms[0].value == MaybeDouble( 0.25 ));
    BOOST_CHECK( chroms[1].value.is_missing() );
}

BOOST_AUTO_TEST_CASE( test_ChromosomeLevelKeepsChromosomesApart )
{
    std::vector<SiteStat> stats = {
        make_stat( "A", "", Statistic::kPi, "chr2", 1,   100, 1.0, 2.0 ),
        make_stat( "A", "", Statistic::kPi, "chr1", 201, 300, 1.0, 4.0 ),
        make_stat( "A", "", Statistic::kPi, "chr1", 1,   100, 3.0, 4.0 ),
        make_stat( "A", "", Statistic::kPi, "chr1", 101, 200, 0.0, 0.0 ),
    };
    auto const chroms = aggregate( accumulate( stats ), AggregationLevel::kChromosome );
    BOOST_REQUIRE_EQUAL( chroms.size(), 2 );

    BOOST_CHECK_EQUAL( chroms[0].chromosome, "chr1" );
    BOOST_CHECK( chroms[0].value == MaybeDouble( 0.5 ));
    BOOST_CHECK_EQUAL( chroms[0].window.start, 1 );
    BOOST_CHECK_EQUAL( chroms[0].window.end, 300 );
    BOOST_CHECK( chroms[0].window.locus.empty() );

    BOOST_CHECK_EQUAL( chroms[1].chromosome, "chr2" );
    BOOST_CHECK( chroms[1].value == MaybeDouble( 0.5 ));
    BOOST_CHECK_EQUAL( chroms[1].window.end, 100 );
}

BOOST_AUTO_TEST_CASE( test_AggregateOrder )
{
    std::vector<SiteStat> stats = {
        make_stat( "B", "", Statistic::kPi,  "chr1", 101, 200, 1.0, 2.0 ),
        make_stat( "A", "", Statistic::kHet, "chr1", 101, 200, 1.0, 2.0 ),
        make_stat( "A", "", Statistic::kPi,  "chr1", 101, 200, 1.0, 2.0 ),
        make_stat( "A", "", Statistic::kPi,  "chr1", 1,   100, 1.0, 2.0 ),
    };
    auto const windows = aggregate( accumulate( stats ), AggregationLevel::kWindow );
    BOOST_REQUIRE_EQUAL( windows.size(), 4 );
    BOOST_CHECK_EQUAL( windows[0].population_pair.first, "A" );
    BOOST_CHECK_EQUAL( windows[0].window.start, 1 );
    BOOST_CHECK( windows[1].statistic == Statistic::kPi );
    BOOST_CHECK_EQUAL( windows[1].window.start, 101 );
    BOOST_CHECK( windows[2].statistic == Statistic::kHet );
    BOOST_CHECK_EQUAL( windows[3].population_pair.first, "B" );
}

// =================================================================================================
//      Pairwise Matrix
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_PairwiseMatrixSymmetric )
{
    std::vector<SiteStat> stats = {
        make_stat( "B", "C", Statistic::kDxy, "chr1", 1, 100, 3.0, 4.0 ),
        make_stat( "A", "B", Statistic::kDxy, "chr1", 1, 100, 1.0, 4.0 ),
        make_stat( "A", "B", Statistic::kDxy, "chr2", 1, 100, 1.0, 4.0 ),
        make_stat( "A", "",  Statistic::kPi,  "chr1", 1, 100, 1.0, 4.0 ),
        make_stat( "D", "",  Statistic::kPi,  "chr1", 1, 100, 1.0, 4.0 ),
    };
    auto const genome = aggregate( accumulate( stats ), AggregationLevel::kGenome );
    auto const matrix = build_matrix( genome, Statistic::kDxy );

    // Only populations with the statistic are in the matrix.
    BOOST_REQUIRE_EQUAL( matrix.populations.size(), 3 );
    BOOST_CHECK_EQUAL( matrix.populations[0], "A" );
    BOOST_CHECK_EQUAL( matrix.populations[1], "B" );
    BOOST_CHECK_EQUAL( matrix.populations[2], "C" );
    BOOST_REQUIRE_EQUAL( matrix.values.rows(), 3 );
    BOOST_REQUIRE_EQUAL( matrix.values.cols(), 3 );

    for( size_t r = 0; r < 3; ++r ) {
        BOOST_CHECK( matrix.values( r, r ) == MaybeDouble( 0.0 ));
        for( size_t c = 0; c < 3; ++c ) {
            BOOST_CHECK( matrix.values( r, c ) == matrix.values( c, r ));
        }
    }
    BOOST_CHECK( matrix.at( "A", "B" ) == MaybeDouble( 0.25 ));
    BOOST_CHECK( matrix.at( "C", "B" ) == MaybeDouble( 0.75 ));
    BOOST_CHECK( matrix.at( "A", "C" ).is_missing() );
    BOOST_CHECK_THROW( matrix.at( "A", "D" ), UnknownPopulationOrSampleError );
}

BOOST_AUTO_TEST_CASE( test_PairwiseMatrixErrors )
{
    std::vector<SiteStat> stats = {
        make_stat( "A", "B", Statistic::kFst, "chr1", 1,   100, 1.0, 4.0 ),
        make_stat( "A", "B", Statistic::kFst, "chr1", 101, 200, 1.0, 4.0 ),
        make_stat( "A", "",  Statistic::kPi,  "chr1", 1,   100, 1.0, 4.0 ),
    };
    auto const sums = accumulate( stats );

    // Within-population statistics do not have a matrix.
    auto const genome = aggregate( sums, AggregationLevel::kGenome );
    BOOST_CHECK_THROW( build_matrix( genome, Statistic::kPi ), std::invalid_argument );
    BOOST_CHECK_NO_THROW( build_matrix( genome, Statistic::kFst ));

    // Window level has the pair twice.
    auto const windows = aggregate( sums, AggregationLevel::kWindow );
    BOOST_CHECK_THROW( build_matrix( windows, Statistic::kFst ), std::invalid_argument );

    // So has a table with both directions of a pair.
    auto reversed = genome;
    for( auto const& agg : genome ) {
        if( agg.statistic == Statistic::kFst ) {
            auto copy = agg;
            copy.population_pair = PopulationPair( "B", "A" );
            reversed.push_back( copy );
        }
    }
    BOOST_CHECK_THROW( build_matrix( reversed, Statistic::kFst ), std::invalid_argument );

    // Without any data, the matrix is empty.
    auto const empty = build_matrix( genome, Statistic::kDxy );
    BOOST_CHECK( empty.populations.empty() );
}

BOOST_AUTO_TEST_SUITE_END()
