#ifndef POPSUM_POPULATION_AGGREGATOR_H_
#define POPSUM_POPULATION_AGGREGATOR_H_

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
#include "population/missing_value.hpp"
#include "population/site_stat.hpp"

#include <string>
#include <vector>

// =================================================================================================
//      Aggregation Level
// =================================================================================================

enum class AggregationLevel
{
    kWindow,
    kChromosome,
    kGenome
};

std::string aggregation_level_name( AggregationLevel level );

// =================================================================================================
//      Window Aggregate
// =================================================================================================

/**
 * @brief Value of one statistic for one population pair in one scope (window, chromosome,
 * or whole genome).
 *
 * The `value` is the ratio of the summed numerators and denominators of all rows in the scope,
 * and is missing if the summed denominator is zero. The `weight` is the summed denominator,
 * which can be used for further weighted averaging.
 *
 * At chromosome level, the window spans the first to the last window of the chromosome, and has
 * an empty locus. At genome level, both chromosome and window are empty.
 */
struct WindowAggregate
{
    PopulationPair population_pair;
    std::string    chromosome;
    GenomeWindow   window;
    Statistic      statistic = Statistic::kPi;
    MaybeDouble    value;
    double         weight         = 0.0;
    size_t         sites_compared = 0;
};

bool operator == ( WindowAggregate const& lhs, WindowAggregate const& rhs );

inline bool operator != ( WindowAggregate const& lhs, WindowAggregate const& rhs )
{
    return !( lhs == rhs );
}

// =================================================================================================
//      Aggregate
// =================================================================================================

/**
 * @brief Compute the statistics at the given level from the running sums.
 *
 * For chromosome and genome level, the numerators and denominators of all windows in the scope
 * are summed up first, and divided afterwards. This is the ratio-of-sums estimator, which weights
 * each window by its denominator. In particular for Fst, this differs from the (biased) mean of
 * the per-window values.
 *
 * The result is sorted by population pair, chromosome, window, and statistic.
 */
std::vector<WindowAggregate> aggregate( RunningSums const& sums, AggregationLevel level );

#endif // include guard
