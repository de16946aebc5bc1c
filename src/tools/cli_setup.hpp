#ifndef POPSUM_TOOLS_CLI_SETUP_H_
#define POPSUM_TOOLS_CLI_SETUP_H_

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

#include <functional>
#include <string>
#include <vector>

// =================================================================================================
//      CLI11 Setup
// =================================================================================================

/**
 * @brief Callback wrapper function to use for popsum commands.
 *
 * The returned callback sets up the global environment (logging, threads, file overwriting),
 * prints the header and the option values that are used for the run, and then calls the
 * @p run_function. Every command uses this, so that no command can forget the global setup.
 */
std::function<void()> popsum_cli_callback(
    CLI::App const*       subcommand,
    std::function<void()> run_function
);

// =================================================================================================
//      Checks and Helpers
// =================================================================================================

/**
 * @brief Check recursively that all subcommands and options have names and descriptions set.
 *
 * Throws `std::domain_error` otherwise, as this is an error in the setup of the commands.
 */
void check_subcommand_names( CLI::App const& app );

/**
 * @brief Capture the current values of all option variables as their defaults, recursively.
 *
 * This has to be called after all commands are set up, so that the help messages show the
 * defaults, and so that we can print the option values that are in effect for a run.
 */
void fix_cli_default_values( CLI::App& app );

/**
 * @brief Set the help group name for all subcommands of an app.
 */
void set_module_help_group( CLI::App& module, std::string const& group_name = "Commands" );

#endif // include guard
