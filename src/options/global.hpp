#ifndef POPSUM_OPTIONS_GLOBAL_H_
#define POPSUM_OPTIONS_GLOBAL_H_

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

#include "genesis/utils/core/logging.hpp"
#include "genesis/utils/core/options.hpp"
#include "genesis/utils/core/thread_pool.hpp"

#include <memory>
#include <string>
#include <vector>

// =================================================================================================
//      Global Options
// =================================================================================================

class GlobalOptions
{
public:

    // -------------------------------------------------------------------------
    //     Setup Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Init the global options for usage in the main app.
     */
    void initialize( int const argc, char const* const* argv );

    /**
     * @brief Add the global options to all subcommands of the app.
     */
    void add_to_module( CLI::App& module );

    /**
     * @brief Add the global options to a specific subcommand.
     */
    void add_to_subcommand( CLI::App& subcommand );

    // -------------------------------------------------------------------------
    //     Run Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Apply the global options, before running the command.
     *
     * Called by popsum_cli_callback() before every command.
     */
    void run_global();

    // -------------------------------------------------------------------------
    //     Getters
    // -------------------------------------------------------------------------

    /**
     * @brief Get the command line that was used to call the program, with single spaces.
     */
    std::string command_line() const;

    /**
     * @brief Get the thread pool for block-parallel computations.
     *
     * The pool has one fewer thread than `--threads`, as the calling thread also does work
     * while waiting for the results.
     */
    std::shared_ptr<genesis::utils::ThreadPool> thread_pool() const
    {
        return genesis::utils::Options::get().global_thread_pool();
    }

    // -------------------------------------------------------------------------
    //     Option Members
    // -------------------------------------------------------------------------

    CliOption<bool>        opt_verbose = false;
    CliOption<bool>        opt_quiet   = false;
    CliOption<size_t>      opt_threads = 1;
    CliOption<std::string> opt_log_file = "";
    CliOption<bool>        opt_allow_file_overwriting = false;

private:

    void init_thread_pool_();
    void init_logging_();

    std::vector<std::string> command_line_;

};

// =================================================================================================
//      Global Instance
// =================================================================================================

/**
 * @brief Global options of the run, available to all commands.
 */
extern GlobalOptions global_options;

/**
 * @brief Name of the flag that allows to overwrite output files, for use in error messages.
 */
extern std::string const allow_file_overwriting_flag;

#endif // include guard
