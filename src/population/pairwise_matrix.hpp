#ifndef POPSUM_POPULATION_PAIRWISE_MATRIX_H_
#define POPSUM_POPULATION_PAIRWISE_MATRIX_H_

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
#include "population/missing_value.hpp"
#include "population/site_stat.hpp"

#include "genesis/utils/containers/matrix.hpp"

#include <string>
#include <vector>

// =================================================================================================
//      Pairwise Matrix
// =================================================================================================

/**
 * @brief Symmetric matrix of a pairwise statistic between all populations.
 *
 * Rows and columns are in the order of `populations`, which is sorted lexicographically.
 * Cells of pairs without data are missing. The diagonal is 0, unless the data contains
 * self comparisons.
 */
struct PairwiseMatrix
{
    Statistic                               statistic = Statistic::kDxy;
    std::vector<std::string>                populations;
    genesis::utils::Matrix<MaybeDouble>     values;

    /**
     * @brief Get the value for a pair of populations by name.
     *
     * Throws an UnknownPopulationOrSampleError if one of the names is not in the matrix.
     */
    MaybeDouble const& at( std::string const& first, std::string const& second ) const;
};

/**
 * @brief Build the symmetric matrix of a pairwise statistic from its aggregates.
 *
 * Only aggregates of the given statistic are used. Each pair has to occur at most once
 * (in either direction), so this is meant for genome level aggregates. Throws an
 * `std::invalid_argument` for within-population statistics, and for pairs that occur
 * more than once.
 */
PairwiseMatrix build_matrix(
    std::vector<WindowAggregate> const& aggregates,
    Statistic statistic
);

#endif // include guard
