#ifndef POPSUM_POPULATION_SITE_STAT_READER_H_
#define POPSUM_POPULATION_SITE_STAT_READER_H_

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

#include "population/genome_region.hpp"
#include "population/site_stat.hpp"

#include "genesis/utils/io/input_source.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

// =================================================================================================
//      Site Stat Reader
// =================================================================================================

/**
 * @brief Reader for the per-window statistic table produced by piawka.
 *
 * The table is tab-separated without header, with the columns
 *
 *     locus  nSites  pop1  pop2  nUsed  metric  value  numerator  denominator
 *
 * Additional columns are ignored, as well as empty lines and lines starting with `#`.
 * We only keep the metrics that we summarize (see statistic_from_metric()), and recompute the
 * value from the numerator and denominator, so that the `value` column is not used.
 * Any row that does not follow this format throws a MalformedInputError.
 */
class SiteStatReader
{
public:

    // -------------------------------------------------------------------------
    //     Typedefs and Enums
    // -------------------------------------------------------------------------

    /**
     * @brief Counts of rows encountered while reading, for user output.
     */
    struct Report
    {
        size_t rows      = 0;
        size_t used      = 0;
        size_t filtered  = 0;
        size_t unknown_metric = 0;

        /**
         * @brief Row counts per metric name that was skipped.
         */
        std::map<std::string, size_t> unknown_metric_names;
    };

    using Callback = std::function<void( SiteStat const& )>;

    // -------------------------------------------------------------------------
    //     Constructors and Rule of Five
    // -------------------------------------------------------------------------

    SiteStatReader()  = default;
    ~SiteStatReader() = default;

    SiteStatReader( SiteStatReader const& ) = default;
    SiteStatReader( SiteStatReader&& )      = default;

    SiteStatReader& operator= ( SiteStatReader const& ) = default;
    SiteStatReader& operator= ( SiteStatReader&& )      = default;

    // -------------------------------------------------------------------------
    //     Reading
    // -------------------------------------------------------------------------

    /**
     * @brief Read the table, and call the @p callback for each row that is used.
     */
    Report read(
        std::shared_ptr<genesis::utils::BaseInputSource> source,
        Callback const& callback
    ) const;

    /**
     * @brief Read the whole table into memory.
     */
    std::vector<SiteStat> read(
        std::shared_ptr<genesis::utils::BaseInputSource> source
    ) const;

    /**
     * @brief Parse a single row, given as its tab-separated fields.
     *
     * Returns `false` if the row is of a metric that we do not summarize.
     */
    bool parse_row(
        std::vector<std::string> const& fields,
        std::string const& source_name,
        size_t line,
        SiteStat& stat
    ) const;

    // -------------------------------------------------------------------------
    //     Settings
    // -------------------------------------------------------------------------

    /**
     * @brief Set the populations that are declared for the run.
     *
     * If not empty, rows referencing any other population throw
     * an UnknownPopulationOrSampleError.
     */
    SiteStatReader& declared_populations( std::unordered_set<std::string> const& value )
    {
        declared_populations_ = value;
        return *this;
    }

    std::unordered_set<std::string> const& declared_populations() const
    {
        return declared_populations_;
    }

    /**
     * @brief Only use rows whose window overlaps the region.
     */
    SiteStatReader& region( GenomeRegion const& value )
    {
        region_ = value;
        return *this;
    }

    GenomeRegion const& region() const
    {
        return region_;
    }

    // -------------------------------------------------------------------------
    //     Internal Helpers
    // -------------------------------------------------------------------------

private:

    void check_population_(
        std::string const& population,
        std::string const& source_name,
        size_t line
    ) const;

    // -------------------------------------------------------------------------
    //     Data Members
    // -------------------------------------------------------------------------

private:

    std::unordered_set<std::string> declared_populations_;
    GenomeRegion region_;

};

#endif // include guard
