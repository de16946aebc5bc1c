#ifndef POPSUM_OPTIONS_TABLE_OUTPUT_H_
#define POPSUM_OPTIONS_TABLE_OUTPUT_H_

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

#include "population/table_io.hpp"
#include "tools/cli_option.hpp"

#include <limits>
#include <string>
#include <vector>

// =================================================================================================
//      Table Output Options
// =================================================================================================

/**
 * @brief Formatting of the output tables: separator char, n/a entry, and numerical precision.
 */
class TableOutputOptions
{
public:

    // -------------------------------------------------------------------------
    //     Constructor and Rule of Five
    // -------------------------------------------------------------------------

    TableOutputOptions()  = default;
    virtual ~TableOutputOptions() = default;

    TableOutputOptions( TableOutputOptions const& other ) = default;
    TableOutputOptions( TableOutputOptions&& )            = default;

    TableOutputOptions& operator= ( TableOutputOptions const& other ) = default;
    TableOutputOptions& operator= ( TableOutputOptions&& )            = default;

    // -------------------------------------------------------------------------
    //     Setup Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Add all three formatting options.
     */
    void add_table_output_opts_to_app(
        CLI::App* sub,
        std::string const& group = "Formatting"
    );

    CLI::Option* add_separator_char_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Formatting"
    );

    CLI::Option* add_na_entry_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Formatting"
    );

    CLI::Option* add_precision_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Formatting"
    );

    // -------------------------------------------------------------------------
    //     Run Functions
    // -------------------------------------------------------------------------

    char get_separator_char() const;

    std::string const& get_na_entry() const
    {
        return na_entry_.value;
    }

    /**
     * @brief Get the format to use for writing tables, with all of the above.
     */
    TableFormat get_table_format() const;

    // -------------------------------------------------------------------------
    //     Option Members
    // -------------------------------------------------------------------------

private:

    CliOption<std::string> separator_char_ = "tab";
    CliOption<std::string> na_entry_ = "NA";
    CliOption<int>         precision_ = std::numeric_limits<double>::max_digits10;

};

#endif // include guard
