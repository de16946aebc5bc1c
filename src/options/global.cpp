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

#include "options/global.hpp"

#include "genesis/utils/core/info.hpp"
#include "genesis/utils/text/string.hpp"

// =================================================================================================
//      Setup Functions
// =================================================================================================

void GlobalOptions::initialize( int const argc, char const* const* argv )
{
    // Everything is logged until the options are parsed, so that errors are visible.
    genesis::utils::Logging::max_level( genesis::utils::Logging::LoggingLevel::kDebug4 );
    command_line_.assign( argv, argv + argc );
}

void GlobalOptions::add_to_module( CLI::App& module )
{
    for( auto subcomm : module.get_subcommands({}) ) {
        add_to_subcommand( *subcomm );
    }
}

void GlobalOptions::add_to_subcommand( CLI::App& subcommand )
{
    std::string const group = "Global Options";

    opt_allow_file_overwriting = subcommand.add_flag(
        allow_file_overwriting_flag,
        opt_allow_file_overwriting.value,
        "Allow to overwrite existing output tables and log files, instead of aborting the "
        "command before any input is read."
    );
    opt_allow_file_overwriting.option->group( group );

    // Verbosity, in both directions.
    opt_verbose = subcommand.add_flag(
        "--verbose",
        opt_verbose.value,
        "Produce more verbose output, including the option values used for the run "
        "and the number of skipped rows per metric."
    );
    opt_verbose.option->group( group );
    opt_quiet = subcommand.add_flag(
        "--quiet",
        opt_quiet.value,
        "Only print warnings and errors."
    );
    opt_quiet.option->group( group );
    opt_quiet.option->excludes( opt_verbose.option );

    // Single threaded by default. Use 0 to guess from the environment and hardware.
    opt_threads = subcommand.add_option(
        "--threads",
        opt_threads.value,
        "Number of threads to use for accumulating the statistic table in blocks. "
        "If set to 0, we guess a reasonable number of threads, by looking at the environmental "
        "variables `OMP_NUM_THREADS` and `SLURM_CPUS_PER_TASK`, as well as the hardware "
        "concurrency, in that order of precedence."
    );
    opt_threads.option->group( group );

    opt_log_file = subcommand.add_option(
        "--log-file",
        opt_log_file.value,
        "Write all output to a log file, in addition to standard output to the terminal."
    );
    opt_log_file.option->group( group );
}

// =================================================================================================
//      Run Functions
// =================================================================================================

void GlobalOptions::run_global()
{
    init_thread_pool_();

    // Has to come before the log file, which might exist already.
    if( opt_allow_file_overwriting.value ) {
        genesis::utils::Options::get().allow_file_overwriting( true );
    }
    init_logging_();
}

void GlobalOptions::init_thread_pool_()
{
    if( opt_threads.value == 0 ) {
        opt_threads.value = genesis::utils::guess_number_of_threads();
    }
    if( opt_threads.value == 0 ) {
        opt_threads.value = 1;
    }

    // The calling thread works on the pool while waiting for results, so one fewer is needed.
    genesis::utils::Options::get().init_global_thread_pool( opt_threads.value - 1 );
}

void GlobalOptions::init_logging_()
{
    using genesis::utils::Logging;

    if( ! opt_log_file.value.empty() ) {
        Logging::log_to_file( opt_log_file.value );
    }

    if( opt_quiet.value ) {
        Logging::max_level( Logging::LoggingLevel::kWarning );
    } else if( opt_verbose.value ) {
        Logging::max_level( Logging::LoggingLevel::kMessage2 );
    } else {
        Logging::max_level( Logging::LoggingLevel::kMessage1 );
    }
}

// =================================================================================================
//      Getters
// =================================================================================================

std::string GlobalOptions::command_line() const
{
    return genesis::utils::join( command_line_, " " );
}

// =================================================================================================
//      Global Instance
// =================================================================================================

GlobalOptions global_options;

std::string const allow_file_overwriting_flag = "--allow-file-overwriting";
