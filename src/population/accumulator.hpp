#ifndef POPSUM_POPULATION_ACCUMULATOR_H_
#define POPSUM_POPULATION_ACCUMULATOR_H_

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

#include "population/site_stat.hpp"

#include "genesis/utils/core/thread_pool.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

// =================================================================================================
//      Running Sum
// =================================================================================================

/**
 * @brief Sums of the ratio estimator components of one group of statistic rows.
 *
 * Adding rows and merging sums are both plain additions, so that the order in which rows
 * are added, and the partitioning of rows into partial sums, does not change the result.
 */
struct RunningSum
{
    double numerator      = 0.0;
    double denominator    = 0.0;
    size_t sites_compared = 0;
    size_t row_count      = 0;

    void add( SiteStat const& stat )
    {
        numerator      += stat.numerator;
        denominator    += stat.denominator;
        sites_compared += stat.sites_compared;
        ++row_count;
    }

    RunningSum& operator += ( RunningSum const& other )
    {
        numerator      += other.numerator;
        denominator    += other.denominator;
        sites_compared += other.sites_compared;
        row_count      += other.row_count;
        return *this;
    }
};

inline bool operator == ( RunningSum const& lhs, RunningSum const& rhs )
{
    return lhs.numerator      == rhs.numerator
        && lhs.denominator    == rhs.denominator
        && lhs.sites_compared == rhs.sites_compared
        && lhs.row_count      == rhs.row_count
    ;
}

inline bool operator != ( RunningSum const& lhs, RunningSum const& rhs )
{
    return !( lhs == rhs );
}

// =================================================================================================
//      Running Sum Key
// =================================================================================================

/**
 * @brief Grouping key for the accumulation: population pair, chromosome, window, and statistic.
 *
 * The order of keys is the order of rows in the output tables: by pair, then along the genome,
 * with all statistics of a window next to each other.
 */
struct RunningSumKey
{
    PopulationPair population_pair;
    std::string    chromosome;
    GenomeWindow   window;
    Statistic      statistic = Statistic::kPi;
};

bool operator < ( RunningSumKey const& lhs, RunningSumKey const& rhs );

inline bool operator == ( RunningSumKey const& lhs, RunningSumKey const& rhs )
{
    return lhs.population_pair == rhs.population_pair
        && lhs.chromosome      == rhs.chromosome
        && lhs.window          == rhs.window
        && lhs.statistic       == rhs.statistic
    ;
}

// =================================================================================================
//      Running Sums
// =================================================================================================

/**
 * @brief Map from grouping key to the running sum of that group.
 */
class RunningSums
{
public:

    // -------------------------------------------------------------------------
    //     Typedefs and Enums
    // -------------------------------------------------------------------------

    using container      = std::map<RunningSumKey, RunningSum>;
    using const_iterator = container::const_iterator;

    // -------------------------------------------------------------------------
    //     Constructors and Rule of Five
    // -------------------------------------------------------------------------

    RunningSums()  = default;
    ~RunningSums() = default;

    RunningSums( RunningSums const& ) = default;
    RunningSums( RunningSums&& )      = default;

    RunningSums& operator= ( RunningSums const& ) = default;
    RunningSums& operator= ( RunningSums&& )      = default;

    // -------------------------------------------------------------------------
    //     Modifiers
    // -------------------------------------------------------------------------

    void add( SiteStat const& stat );

    /**
     * @brief Add all partial sums of @p other to the sums here.
     */
    void merge( RunningSums const& other );

    void clear()
    {
        sums_.clear();
    }

    // -------------------------------------------------------------------------
    //     Accessors
    // -------------------------------------------------------------------------

    const_iterator begin() const
    {
        return sums_.begin();
    }

    const_iterator end() const
    {
        return sums_.end();
    }

    size_t size() const
    {
        return sums_.size();
    }

    bool empty() const
    {
        return sums_.empty();
    }

    container const& data() const
    {
        return sums_;
    }

    /**
     * @brief Return the statistics that occur in any of the keys, in column order.
     */
    std::vector<Statistic> statistics() const;

    bool operator == ( RunningSums const& other ) const
    {
        return sums_ == other.sums_;
    }

    // -------------------------------------------------------------------------
    //     Data Members
    // -------------------------------------------------------------------------

private:

    container sums_;

};

// =================================================================================================
//      Accumulate
// =================================================================================================

/**
 * @brief Fold a range of statistic rows into running sums.
 */
template<class InputIterator>
RunningSums accumulate( InputIterator first, InputIterator last )
{
    RunningSums result;
    for( ; first != last; ++first ) {
        result.add( *first );
    }
    return result;
}

inline RunningSums accumulate( std::vector<SiteStat> const& stats )
{
    return accumulate( stats.begin(), stats.end() );
}

/**
 * @brief Accumulate the rows in blocks on the thread pool, and merge the partial sums.
 *
 * The result is the same as with accumulate(), as the partial sums are simply added up.
 * If @p num_blocks is 0, we use one block per thread of the pool, plus one for the calling thread.
 */
RunningSums accumulate_parallel(
    std::vector<SiteStat> const& stats,
    std::shared_ptr<genesis::utils::ThreadPool> thread_pool,
    size_t num_blocks = 0
);

#endif // include guard
