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

#include "population/pairwise_matrix.hpp"

#include "population/errors.hpp"

#include <algorithm>
#include <cassert>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

// =================================================================================================
//      Pairwise Matrix
// =================================================================================================

MaybeDouble const& PairwiseMatrix::at( std::string const& first, std::string const& second ) const
{
    auto index_of_ = [&]( std::string const& name ) -> size_t {
        auto const it = std::lower_bound( populations.begin(), populations.end(), name );
        if( it == populations.end() || *it != name ) {
            throw UnknownPopulationOrSampleError( name, statistic_name( statistic ) + " matrix" );
        }
        return static_cast<size_t>( std::distance( populations.begin(), it ));
    };
    return values( index_of_( first ), index_of_( second ));
}

// =================================================================================================
//      Build Matrix
// =================================================================================================

PairwiseMatrix build_matrix(
    std::vector<WindowAggregate> const& aggregates,
    Statistic statistic
) {
    using namespace genesis::utils;

    if( ! is_pairwise_statistic( statistic )) {
        throw std::invalid_argument(
            "Cannot build a pairwise matrix for within-population statistic " +
            statistic_name( statistic )
        );
    }

    // Collect all populations that occur in a pair for the statistic.
    PairwiseMatrix result;
    result.statistic = statistic;
    for( auto const& agg : aggregates ) {
        if( agg.statistic != statistic ) {
            continue;
        }
        result.populations.push_back( agg.population_pair.first );
        result.populations.push_back( agg.population_pair.second );
    }
    std::sort( result.populations.begin(), result.populations.end() );
    result.populations.erase(
        std::unique( result.populations.begin(), result.populations.end() ),
        result.populations.end()
    );

    std::unordered_map<std::string, size_t> indices;
    for( size_t i = 0; i < result.populations.size(); ++i ) {
        indices[ result.populations[i] ] = i;
    }

    // Fill the matrix. We use a second matrix to keep track of which cells have been set,
    // as a missing value is a valid entry that might come from the data.
    auto const size = result.populations.size();
    result.values = Matrix<MaybeDouble>( size, size, MaybeDouble::missing() );
    auto filled = Matrix<char>( size, size, 0 );
    for( auto const& agg : aggregates ) {
        if( agg.statistic != statistic ) {
            continue;
        }
        assert( indices.count( agg.population_pair.first ) > 0 );
        assert( indices.count( agg.population_pair.second ) > 0 );
        auto const r = indices.at( agg.population_pair.first );
        auto const c = indices.at( agg.population_pair.second );
        if( filled( r, c ) || filled( c, r )) {
            throw std::invalid_argument(
                "Population pair (" + agg.population_pair.first + ", " +
                agg.population_pair.second + ") occurs more than once for statistic " +
                statistic_name( statistic ) + ", which can only be used for a pairwise matrix "
                "when aggregated over the whole genome."
            );
        }
        result.values( r, c ) = agg.value;
        result.values( c, r ) = agg.value;
        filled( r, c ) = 1;
        filled( c, r ) = 1;
    }

    // Self comparisons are 0 by convention. A pair of a population with itself in the data
    // would have set the diagonal already, and does not change this.
    for( size_t i = 0; i < size; ++i ) {
        if( ! filled( i, i )) {
            result.values( i, i ) = MaybeDouble( 0.0 );
        }
    }
    return result;
}
