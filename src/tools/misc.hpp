#ifndef POPSUM_TOOLS_MISC_H_
#define POPSUM_TOOLS_MISC_H_

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

#include "tools/cli_option.hpp"

#include "CLI/CLI.hpp"

#include "genesis/utils/text/string.hpp"

#include <iosfwd>
#include <string>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

// =================================================================================================
//      Formatting
// =================================================================================================

/**
 * @brief Format two strings as a left column of fixed width, followed by the right column.
 * If the left string is longer than the width, the right column starts on the next line.
 */
std::string format_columns(
    std::string const& left,
    std::string const& right,
    size_t left_width
);

// =================================================================================================
//      Lists
// =================================================================================================

/**
 * @brief Read a list of names from an option value, which is either a file with one entry per
 * line, or a comma- or tab-separated list.
 *
 * Entries are trimmed, and empty entries are skipped. Throws a `CLI::ValidationError` naming
 * the @p option_name if the list is empty, or contains duplicates.
 */
std::vector<std::string> read_name_list(
    std::string const& option_name,
    std::string const& list
);

// =================================================================================================
//      Misc
// =================================================================================================

/**
 * @brief Alternative for normal `assert()` that allows to specify an error message,
 * throws an exception instead of terminating, and is always used, also in release mode.
 */
inline void internal_check(
    bool condition,
    std::string const& error_message
) {
    if( ! condition ) {
        throw std::domain_error(
            "Internal error: " + error_message
        );
    }
}

/**
 * @brief Get the keys of an ordered list of enum names, for restricting CLI11 options.
 */
template<class T>
std::vector<std::string> enum_map_keys( std::vector<std::pair<std::string, T>> const& map )
{
    std::vector<std::string> result;
    result.reserve( map.size() );
    for( auto const& kv : map ) {
        result.emplace_back( kv.first );
    }
    return result;
}

/**
 * @brief Translate an option value to its enum, case insensitively.
 */
template<class T>
T get_enum_map_value( std::vector<std::pair<std::string, T>> const& map, std::string const& key )
{
    auto const key_lower = genesis::utils::to_lower( key );
    for( auto const& kv : map ) {
        if( genesis::utils::to_lower( kv.first ) == key_lower ) {
            return kv.second;
        }
    }

    // CLI11 checks the values via enum_map_keys() already, so this is our mistake.
    throw std::domain_error(
        "Internal error: Key \"" + key + "\" not found in list of possible values."
    );
}

#endif // include guard
