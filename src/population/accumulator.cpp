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

#include "population/accumulator.hpp"

#include <algorithm>
#include <cassert>

// =================================================================================================
//      Running Sum Key
// =================================================================================================

bool operator < ( RunningSumKey const& lhs, RunningSumKey const& rhs )
{
    if( lhs.population_pair != rhs.population_pair ) {
        return lhs.population_pair < rhs.population_pair;
    }
    if( lhs.chromosome != rhs.chromosome ) {
        return lhs.chromosome < rhs.chromosome;
    }
    if( lhs.window != rhs.window ) {
        return lhs.window < rhs.window;
    }
    return lhs.statistic < rhs.statistic;
}

// =================================================================================================
//      Running Sums
// =================================================================================================

void RunningSums::add( SiteStat const& stat )
{
    RunningSumKey key;
    key.population_pair = stat.population_pair;
    key.chromosome      = stat.chromosome;
    key.window          = stat.window;
    key.statistic       = stat.statistic;
    sums_[ key ].add( stat );
}

void RunningSums::merge( RunningSums const& other )
{
    for( auto const& entry : other.sums_ ) {
        sums_[ entry.first ] += entry.second;
    }
}

std::vector<Statistic> RunningSums::statistics() const
{
    std::vector<bool> found( all_statistics().size(), false );
    for( auto const& entry : sums_ ) {
        found[ static_cast<size_t>( entry.first.statistic ) ] = true;
    }

    std::vector<Statistic> result;
    for( auto const statistic : all_statistics() ) {
        if( found[ static_cast<size_t>( statistic ) ] ) {
            result.push_back( statistic );
        }
    }
    return result;
}

// =================================================================================================
//      Accumulate
// =================================================================================================

RunningSums accumulate_parallel(
    std::vector<SiteStat> const& stats,
    std::shared_ptr<genesis::utils::ThreadPool> thread_pool,
    size_t num_blocks
) {
    using namespace genesis::utils;

    // Without a pool, or without enough work, there is nothing to parallelize.
    if( ! thread_pool ) {
        return accumulate( stats );
    }
    if( num_blocks == 0 ) {
        num_blocks = thread_pool->size() + 1;
    }
    num_blocks = std::min( num_blocks, stats.size() );
    if( num_blocks < 2 ) {
        return accumulate( stats );
    }

    // Partition the rows into consecutive blocks, and accumulate each block into its own
    // partial sums. The blocks do not share any state, so no locking is needed.
    auto const block_size = stats.size() / num_blocks;
    auto const remainder  = stats.size() % num_blocks;
    std::vector<ProactiveFuture<RunningSums>> partials;
    partials.reserve( num_blocks );
    size_t begin = 0;
    for( size_t b = 0; b < num_blocks; ++b ) {
        auto const end = begin + block_size + ( b < remainder ? 1 : 0 );
        assert( end <= stats.size() );
        partials.emplace_back( thread_pool->enqueue_and_retrieve(
            [&stats, begin, end](){
                return accumulate( stats.begin() + begin, stats.begin() + end );
            }
        ));
        begin = end;
    }
    assert( begin == stats.size() );

    // Merge the partial sums. Their order does not matter for the result.
    RunningSums result;
    for( auto& partial : partials ) {
        result.merge( partial.get() );
    }
    return result;
}
