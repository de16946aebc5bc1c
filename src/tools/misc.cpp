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

#include "tools/misc.hpp"

#include "genesis/utils/core/fs.hpp"
#include "genesis/utils/core/logging.hpp"

#include <sstream>

// =================================================================================================
//      Formatting
// =================================================================================================

std::string format_columns(
    std::string const& left,
    std::string const& right,
    size_t left_width
) {
    std::stringstream ss;
    ss << left;
    if( left.size() < left_width ) {
        ss << std::string( left_width - left.size(), ' ' );
    } else {
        ss << "\n" << std::string( left_width, ' ' );
    }
    ss << right;
    return ss.str();
}

// =================================================================================================
//      Lists
// =================================================================================================

std::vector<std::string> read_name_list(
    std::string const& option_name,
    std::string const& list
) {
    using namespace genesis::utils;

    // Either a file with one name per line, or the names themselves.
    std::vector<std::string> entries;
    if( is_file( list ) ) {
        LOG_MSG2 << "Reading list for " << option_name << " from file " << list;
        entries = file_read_lines( list );
    } else {
        entries = split( list, ",\t", false );
    }

    std::vector<std::string> result;
    std::unordered_set<std::string> uniq;
    for( auto const& entry : entries ) {
        auto const name = trim( entry );
        if( name.empty() ) {
            continue;
        }
        if( uniq.count( name ) > 0 ) {
            throw CLI::ValidationError(
                option_name, "Invalid list with duplicate entry \"" + name + "\"."
            );
        }
        uniq.insert( name );
        result.push_back( name );
    }
    if( result.empty() ) {
        throw CLI::ValidationError( option_name, "Invalid empty list." );
    }
    return result;
}
