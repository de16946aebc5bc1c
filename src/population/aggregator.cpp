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

#include "population/aggregator.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

// =================================================================================================
//      Aggregation Level
// =================================================================================================

std::string aggregation_level_name( AggregationLevel level )
{
    switch( level ) {
        case AggregationLevel::kWindow:     return "window";
        case AggregationLevel::kChromosome: return "chromosome";
        case AggregationLevel::kGenome:     return "genome";
        default: {
            throw std::domain_error( "Internal error: Invalid aggregation level." );
        }
    }
}

// =================================================================================================
//      Window Aggregate
// =================================================================================================

bool operator == ( WindowAggregate const& lhs, WindowAggregate const& rhs )
{
    return lhs.population_pair == rhs.population_pair
        && lhs.chromosome      == rhs.chromosome
        && lhs.window          == rhs.window
        && lhs.statistic       == rhs.statistic
        && lhs.value           == rhs.value
        && lhs.weight          == rhs.weight
        && lhs.sites_compared  == rhs.sites_compared
    ;
}

// =================================================================================================
//      Aggregate
// =================================================================================================

std::vector<WindowAggregate> aggregate( RunningSums const& sums, AggregationLevel level )
{
    // We re-group the running sums by the key of the requested level. For window level,
    // this is the identity. For the other levels, we drop the window (and chromosome) from
    // the key, so that all windows of the scope are summed up before dividing.
    // As the sums are ordered by pair first, a std::map with the reduced key keeps that order.
    std::map<RunningSumKey, RunningSum> scoped;
    for( auto const& entry : sums ) {
        auto key = entry.first;
        switch( level ) {
            case AggregationLevel::kWindow: {
                break;
            }
            case AggregationLevel::kChromosome: {
                key.window = GenomeWindow();
                break;
            }
            case AggregationLevel::kGenome: {
                key.chromosome.clear();
                key.window = GenomeWindow();
                break;
            }
            default: {
                throw std::domain_error( "Internal error: Invalid aggregation level." );
            }
        }
        scoped[ key ] += entry.second;
    }

    // Span of each chromosome, from the windows with known coordinates.
    std::map<std::pair<PopulationPair, std::string>, GenomeWindow> spans;
    if( level == AggregationLevel::kChromosome ) {
        for( auto const& entry : sums ) {
            auto const& window = entry.first.window;
            if( ! window.has_coordinates() ) {
                continue;
            }
            auto& span = spans[ std::make_pair(
                entry.first.population_pair, entry.first.chromosome
            )];
            if( ! span.has_coordinates() ) {
                span.start = window.start;
                span.end   = window.end;
            } else {
                span.start = std::min( span.start, window.start );
                span.end   = std::max( span.end,   window.end );
            }
        }
    }

    // Now compute the ratio of sums for each scope.
    std::vector<WindowAggregate> result;
    result.reserve( scoped.size() );
    for( auto const& entry : scoped ) {
        WindowAggregate agg;
        agg.population_pair = entry.first.population_pair;
        agg.chromosome      = entry.first.chromosome;
        agg.window          = entry.first.window;
        agg.statistic       = entry.first.statistic;
        agg.value           = ratio_or_missing( entry.second.numerator, entry.second.denominator );
        agg.weight          = entry.second.denominator;
        agg.sites_compared  = entry.second.sites_compared;

        if( level == AggregationLevel::kChromosome ) {
            auto const span = spans.find( std::make_pair( agg.population_pair, agg.chromosome ));
            if( span != spans.end() ) {
                agg.window = span->second;
            }
        }
        result.push_back( std::move( agg ));
    }
    return result;
}
