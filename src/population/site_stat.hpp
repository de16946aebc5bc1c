#ifndef POPSUM_POPULATION_SITE_STAT_H_
#define POPSUM_POPULATION_SITE_STAT_H_

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

#include <string>
#include <utility>
#include <vector>

// =================================================================================================
//      Statistic
// =================================================================================================

/**
 * @brief Statistics that we summarize from the per-site or per-window statistic table.
 *
 * The order of the enum is the order in which the statistics are written as table columns.
 */
enum class Statistic
{
    kPi,
    kDxy,
    kFst,
    kHet
};

/**
 * @brief All statistics, in column order.
 */
std::vector<Statistic> const& all_statistics();

/**
 * @brief Name of the statistic as used in table headers and output file names.
 */
std::string statistic_name( Statistic statistic );

/**
 * @brief Parse a statistic from its table header name, as produced by statistic_name().
 *
 * Throws `std::invalid_argument` for unknown names.
 */
Statistic statistic_from_name( std::string const& name );

/**
 * @brief Translate a metric name of the statistic table into one of our statistics.
 *
 * Returns `false` for metrics that we do not summarize, so that callers can skip these rows.
 */
bool statistic_from_metric( std::string const& metric, Statistic& statistic );

/**
 * @brief Return whether the statistic is computed between two populations (Dxy, Fst),
 * or within a single one (pi, heterozygosity).
 */
bool is_pairwise_statistic( Statistic statistic );

// =================================================================================================
//      Population Pair
// =================================================================================================

/**
 * @brief Populations that a statistic row belongs to.
 *
 * For within-population statistics, the `second` population is empty.
 */
struct PopulationPair
{
    PopulationPair() = default;

    PopulationPair( std::string first_population, std::string second_population = "" )
        : first( std::move( first_population ))
        , second( std::move( second_population ))
    {}

    bool is_pair() const
    {
        return ! second.empty();
    }

    std::string first;
    std::string second;
};

inline bool operator == ( PopulationPair const& lhs, PopulationPair const& rhs )
{
    return lhs.first == rhs.first && lhs.second == rhs.second;
}

inline bool operator != ( PopulationPair const& lhs, PopulationPair const& rhs )
{
    return !( lhs == rhs );
}

inline bool operator < ( PopulationPair const& lhs, PopulationPair const& rhs )
{
    if( lhs.first != rhs.first ) {
        return lhs.first < rhs.first;
    }
    return lhs.second < rhs.second;
}

// =================================================================================================
//      Genome Window
// =================================================================================================

/**
 * @brief Window on a chromosome that a statistic row was computed for.
 *
 * The `locus` is the identifier as given in the input. If it has the form `chrom:start-end`,
 * the coordinates are stored as well (1-based, inclusive). Otherwise, `start` and `end` are 0,
 * meaning that the window coordinates are not known.
 */
struct GenomeWindow
{
    std::string locus;
    size_t      start = 0;
    size_t      end   = 0;

    bool has_coordinates() const
    {
        return start > 0 && end >= start;
    }
};

inline bool operator == ( GenomeWindow const& lhs, GenomeWindow const& rhs )
{
    return lhs.start == rhs.start && lhs.end == rhs.end && lhs.locus == rhs.locus;
}

inline bool operator != ( GenomeWindow const& lhs, GenomeWindow const& rhs )
{
    return !( lhs == rhs );
}

/**
 * @brief Order windows by coordinates first, so that output is sorted along the chromosome.
 */
inline bool operator < ( GenomeWindow const& lhs, GenomeWindow const& rhs )
{
    if( lhs.start != rhs.start ) {
        return lhs.start < rhs.start;
    }
    if( lhs.end != rhs.end ) {
        return lhs.end < rhs.end;
    }
    return lhs.locus < rhs.locus;
}

// =================================================================================================
//      Site Stat
// =================================================================================================

/**
 * @brief One row of the statistic table: the components of a ratio estimator for one
 * statistic, population pair, and window.
 *
 * For pi and Dxy, the numerator is the sum of pairwise differences, and the denominator is the
 * number of comparisons. For Fst, both are variance components, and the numerator can be negative.
 */
struct SiteStat
{
    PopulationPair population_pair;
    Statistic      statistic = Statistic::kPi;
    std::string    chromosome;
    GenomeWindow   window;
    size_t         sites_compared = 0;
    double         numerator      = 0.0;
    double         denominator    = 0.0;
};

/**
 * @brief Split a locus of the form `chrom:start-end` into chromosome and window.
 *
 * If the locus does not have that form, the whole locus is used as the chromosome name,
 * and the window has no coordinates.
 */
void parse_locus( std::string const& locus, std::string& chromosome, GenomeWindow& window );

#endif // include guard
