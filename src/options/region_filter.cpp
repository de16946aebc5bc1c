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

#include "options/region_filter.hpp"

#include "tools/misc.hpp"

#include "genesis/utils/core/logging.hpp"

#include <stdexcept>

// =================================================================================================
//      Setup Functions
// =================================================================================================

CLI::Option* RegionFilterOptions::add_region_filter_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    internal_check(
        filter_region_.option == nullptr,
        "Cannot use the same RegionFilterOptions object multiple times."
    );

    filter_region_.option = sub->add_option(
        "--filter-region",
        filter_region_.value,
        "Genomic region to restrict the input to, in the format \"chr\" (for whole chromosomes), "
        "\"chr:position\", or \"chr:start-end\". Positions are 1-based and inclusive. "
        "For the statistic table, windows that overlap the region are used."
    );
    filter_region_.option->group( group );
    return filter_region_.option;
}

// =================================================================================================
//      Run Functions
// =================================================================================================

GenomeRegion RegionFilterOptions::get_region() const
{
    if( ! filter_region_.is_set() ) {
        return GenomeRegion();
    }

    GenomeRegion region;
    try {
        region = parse_genome_region( filter_region_.value );
    } catch( std::invalid_argument const& ex ) {
        throw CLI::ValidationError( filter_region_.name(), ex.what() );
    }
    LOG_MSG2 << "Restricting input to region " << to_string( region );
    return region;
}
