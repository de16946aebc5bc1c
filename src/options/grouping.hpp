#ifndef POPSUM_OPTIONS_GROUPING_H_
#define POPSUM_OPTIONS_GROUPING_H_

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

#include "tools/cli_option.hpp"

#include <string>
#include <unordered_set>
#include <vector>

// =================================================================================================
//      Grouping Options
// =================================================================================================

/**
 * @brief Declared populations and samples of a run.
 *
 * If a list is given, every population of the statistic table, and every sample of the VCF file,
 * has to be in it, and any other identifier is an error. This catches typos and mixed up input
 * files, which would otherwise silently end up as additional rows in the output.
 * Without a list, all identifiers of the input are used.
 */
class GroupingOptions
{
public:

    // -------------------------------------------------------------------------
    //     Constructor and Rule of Five
    // -------------------------------------------------------------------------

    GroupingOptions()  = default;
    ~GroupingOptions() = default;

    GroupingOptions( GroupingOptions const& other ) = default;
    GroupingOptions( GroupingOptions&& )            = default;

    GroupingOptions& operator= ( GroupingOptions const& other ) = default;
    GroupingOptions& operator= ( GroupingOptions&& )            = default;

    // -------------------------------------------------------------------------
    //     Setup Functions
    // -------------------------------------------------------------------------

    CLI::Option* add_population_list_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Input"
    );

    CLI::Option* add_sample_list_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Input"
    );

    // -------------------------------------------------------------------------
    //     Run Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Get the declared populations, or an empty set if no list was given.
     */
    std::unordered_set<std::string> get_populations() const;

    /**
     * @brief Get the declared samples, or an empty set if no list was given.
     */
    std::unordered_set<std::string> get_samples() const;

    // -------------------------------------------------------------------------
    //     Option Members
    // -------------------------------------------------------------------------

private:

    CliOption<std::string> population_list_ = "";
    CliOption<std::string> sample_list_ = "";

};

#endif // include guard
