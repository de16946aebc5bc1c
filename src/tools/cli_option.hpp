#ifndef POPSUM_TOOLS_CLI_OPTION_H_
#define POPSUM_TOOLS_CLI_OPTION_H_

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

#include <string>

// =================================================================================================
//      CLI11 Option Helper
// =================================================================================================

/**
 * @brief Value of a command line option, together with the CLI11 object that sets it.
 *
 * Keeping both lets the run functions use the value, and also name the option in error
 * messages and check whether the user provided it at all.
 */
template<typename T>
struct CliOption
{
    CliOption() = default;

    CliOption( T const& val )
        : value( val )
    {}

    CliOption& operator =( CLI::Option* opt )
    {
        option = opt;
        return *this;
    }

    /**
     * @brief Return whether the option was added to a command, and given on the command line.
     */
    bool is_set() const
    {
        return option && option->count() > 0;
    }

    /**
     * @brief Name of the option for user output, or an empty string if it was never added.
     */
    std::string name() const
    {
        return option ? option->get_name() : std::string();
    }

    T            value  = {};
    CLI::Option* option = nullptr;
};

/**
 * @brief String options, which can also be initialized from literals.
 */
template<>
struct CliOption<std::string>
{
    CliOption() = default;

    CliOption( std::string const& val )
        : value( val )
    {}

    CliOption( char const* val )
        : value( val )
    {}

    CliOption& operator =( CLI::Option* opt )
    {
        option = opt;
        return *this;
    }

    bool is_set() const
    {
        return option && option->count() > 0;
    }

    std::string name() const
    {
        return option ? option->get_name() : std::string();
    }

    std::string  value  = {};
    CLI::Option* option = nullptr;
};

#endif // include guard
