#ifndef POPSUM_OPTIONS_REGION_FILTER_H_
#define POPSUM_OPTIONS_REGION_FILTER_H_

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

#include "CLI/CLI.hpp"

#include "population/genome_region.hpp"
#include "tools/cli_option.hpp"

#include <string>

// =================================================================================================
//      Region Filter Options
// =================================================================================================

/**
 * @brief Restrict the input records to a single region of the genome.
 */
class RegionFilterOptions
{
public:

    // -------------------------------------------------------------------------
    //     Constructor and Rule of Five
    // -------------------------------------------------------------------------

    RegionFilterOptions()  = default;
    ~RegionFilterOptions() = default;

    RegionFilterOptions( RegionFilterOptions const& other ) = default;
    RegionFilterOptions( RegionFilterOptions&& )            = default;

    RegionFilterOptions& operator= ( RegionFilterOptions const& other ) = default;
    RegionFilterOptions& operator= ( RegionFilterOptions&& )            = default;

    // -------------------------------------------------------------------------
    //     Setup Functions
    // -------------------------------------------------------------------------

    CLI::Option* add_region_filter_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Region Filters"
    );

    // -------------------------------------------------------------------------
    //     Run Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Get the region, which accepts everything if the option was not given.
     */
    GenomeRegion get_region() const;

    // -------------------------------------------------------------------------
    //     Option Members
    // -------------------------------------------------------------------------

private:

    CliOption<std::string> filter_region_ = "";

};

#endif // include guard
