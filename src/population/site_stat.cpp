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

#include "genesis/utils/text/char.hpp"
#include "genesis/utils/text/convert.hpp"
#include "genesis/utils/text/string.hpp"

#include <algorithm>
#include <stdexcept>

// =================================================================================================
//      Statistic
// =================================================================================================

std::vector<Statistic> const& all_statistics()
{
    static std::vector<Statistic> const statistics = {
        Statistic::kPi, Statistic::kDxy, Statistic::kFst, Statistic::kHet
    };
    return statistics;
}

std::string statistic_name( Statistic statistic )
{
    switch( statistic ) {
        case Statistic::kPi:  return "pi";
        case Statistic::kDxy: return "dxy";
        case Statistic::kFst: return "fst";
        case Statistic::kHet: return "het";
        default: {
            throw std::domain_error( "Internal error: Invalid statistic." );
        }
    }
}

Statistic statistic_from_name( std::string const& name )
{
    auto const lower = genesis::utils::to_lower( name );
    for( auto const statistic : all_statistics() ) {
        if( statistic_name( statistic ) == lower ) {
            return statistic;
        }
    }
    throw std::invalid_argument( "Invalid statistic name \"" + name + "\"." );
}

bool statistic_from_metric( std::string const& metric, Statistic& statistic )
{
    // Metric names as written by piawka. Everything else (rho, watterson's theta, etc)
    // is not summarized here, and the caller skips these rows.
    auto const lower = genesis::utils::to_lower( metric );
    if( lower == "pi" ) {
        statistic = Statistic::kPi;
    } else if( lower == "dxy" ) {
        statistic = Statistic::kDxy;
    } else if( lower == "fst" ) {
        statistic = Statistic::kFst;
    } else if( lower == "het_pixy" || lower == "het" ) {
        statistic = Statistic::kHet;
    } else {
        return false;
    }
    return true;
}

bool is_pairwise_statistic( Statistic statistic )
{
    return statistic == Statistic::kDxy || statistic == Statistic::kFst;
}

// =================================================================================================
//      Locus
// =================================================================================================

static bool is_number_( std::string const& str )
{
    return ! str.empty() && std::all_of( str.begin(), str.end(), []( char c ){
        return genesis::utils::is_digit( c );
    });
}

void parse_locus( std::string const& locus, std::string& chromosome, GenomeWindow& window )
{
    using namespace genesis::utils;

    window = GenomeWindow();
    window.locus = locus;
    chromosome = locus;

    // Chromosome names can contain colons themselves (e.g., HLA contigs),
    // so we split at the last one.
    auto const colon = locus.find_last_of( ':' );
    if( colon == std::string::npos || colon == 0 ) {
        return;
    }
    auto const range = locus.substr( colon + 1 );
    auto const dash = range.find( '-' );
    if( dash == std::string::npos ) {
        return;
    }
    auto const start_str = range.substr( 0, dash );
    auto const end_str   = range.substr( dash + 1 );
    if( ! is_number_( start_str ) || ! is_number_( end_str )) {
        return;
    }

    auto const start = convert_from_string<size_t>( start_str );
    auto const end   = convert_from_string<size_t>( end_str );
    if( start == 0 || end < start ) {
        return;
    }
    chromosome   = locus.substr( 0, colon );
    window.start = start;
    window.end   = end;
}
