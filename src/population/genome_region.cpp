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

#include "genesis/utils/text/convert.hpp"
#include "genesis/utils/text/string.hpp"

#include <stdexcept>

// =================================================================================================
//      Parsing and Printing
// =================================================================================================

GenomeRegion parse_genome_region( std::string const& text )
{
    using namespace genesis::utils;

    GenomeRegion result;
    auto const trimmed = trim( text );
    if( trimmed.empty() ) {
        throw std::invalid_argument( "Invalid empty genome region." );
    }

    // Only a chromosome name.
    auto const colon = trimmed.find_last_of( ':' );
    if( colon == std::string::npos ) {
        result.chromosome = trimmed;
        return result;
    }
    result.chromosome = trimmed.substr( 0, colon );
    if( result.chromosome.empty() ) {
        throw std::invalid_argument( "Invalid genome region \"" + text + "\" without chromosome." );
    }

    // Either a single position, or a start-end interval.
    auto const range = split( trimmed.substr( colon + 1 ), "-", false );
    try {
        if( range.size() == 1 ) {
            result.start = convert_from_string<size_t>( range[0], true );
            result.end   = result.start;
        } else if( range.size() == 2 ) {
            result.start = convert_from_string<size_t>( range[0], true );
            result.end   = convert_from_string<size_t>( range[1], true );
        } else {
            throw std::invalid_argument( "too many dashes" );
        }
    } catch( std::exception const& ex ) {
        throw std::invalid_argument(
            "Invalid genome region \"" + text + "\": " + ex.what()
        );
    }
    if( result.start == 0 || result.end < result.start ) {
        throw std::invalid_argument(
            "Invalid genome region \"" + text + "\" with positions not in 1-based "
            "start <= end order."
        );
    }
    return result;
}

std::string to_string( GenomeRegion const& region )
{
    if( region.is_everything() ) {
        return "";
    }
    if( region.start <= 1 && region.end == 0 ) {
        return region.chromosome;
    }
    return region.chromosome + ":" + std::to_string( region.start ) + "-" +
        ( region.end == 0 ? std::string() : std::to_string( region.end ));
}
