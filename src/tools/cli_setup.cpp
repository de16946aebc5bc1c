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

#include "tools/cli_setup.hpp"

#include "options/global.hpp"
#include "tools/misc.hpp"
#include "tools/version.hpp"

#include "genesis/utils/core/logging.hpp"
#include "genesis/utils/text/string.hpp"
#include "genesis/utils/tools/date_time.hpp"

#include <chrono>
#include <map>
#include <stdexcept>

// =================================================================================================
//      Local Helpers
// =================================================================================================

/**
 * @brief Print the values of all options of the subcommand, in their help groups.
 */
static void print_option_values_( CLI::App const* subcommand )
{
    // Collect the options per group, keeping the order in which they were added.
    std::vector<std::string> group_order;
    std::map<std::string, std::vector<CLI::Option const*>> groups;
    for( auto const opt : subcommand->get_options() ) {
        if( opt->get_group().empty() || opt->get_name() == "--help" ) {
            continue;
        }
        if( groups.count( opt->get_group() ) == 0 ) {
            group_order.push_back( opt->get_group() );
        }
        groups[ opt->get_group() ].push_back( opt );
    }

    for( auto const& group : group_order ) {
        LOG_MSG2 << group << ":";
        for( auto const opt : groups[ group ] ) {
            std::string value;
            if( opt->count() > 0 ) {
                value = genesis::utils::join( opt->results(), " " );
            } else if( opt->get_type_size() == 0 ) {
                value = "false";
            } else {
                value = opt->get_default_str();
            }
            LOG_MSG2 << "  " << format_columns( opt->get_name(), value, 32 );
        }
        LOG_MSG2;
    }
}

// =================================================================================================
//      CLI11 Setup
// =================================================================================================

std::function<void()> popsum_cli_callback(
    CLI::App const*       subcommand,
    std::function<void()> run_function
) {
    return [ subcommand, run_function ](){

        // Set up the global options first, as they affect the logging below.
        global_options.run_global();

        LOG_MSG2 << popsum_header();
        LOG_MSG2 << "Invocation:           " << global_options.command_line();
        LOG_MSG2 << "Threads:              " << global_options.opt_threads.value;
        LOG_MSG2;
        print_option_values_( subcommand );

        auto const start = std::chrono::steady_clock::now();
        LOG_MSG << "Started " << genesis::utils::current_date() << " "
                << genesis::utils::current_time();
        LOG_MSG;

        run_function();

        auto const duration = std::chrono::duration_cast<std::chrono::duration<double>>(
            std::chrono::steady_clock::now() - start
        );
        LOG_MSG;
        LOG_MSG << "Finished " << genesis::utils::current_date() << " "
                << genesis::utils::current_time();
        LOG_MSG2 << "Run time: " << duration.count() << " s";
    };
}

// =================================================================================================
//      Checks and Helpers
// =================================================================================================

void check_subcommand_names( CLI::App const& app )
{
    for( auto const subcomm : app.get_subcommands( []( CLI::App const* ){ return true; }) ) {
        if( subcomm->get_name().empty() ) {
            throw std::domain_error( "Internal error: Subcommand without name." );
        }
        if( subcomm->get_description().empty() ) {
            throw std::domain_error(
                "Internal error: Subcommand " + subcomm->get_name() + " without description."
            );
        }
        for( auto const opt : subcomm->get_options() ) {
            if( opt->get_name().empty() || opt->get_description().empty() ) {
                throw std::domain_error(
                    "Internal error: Subcommand " + subcomm->get_name() +
                    " has an option without name or description."
                );
            }
        }
        check_subcommand_names( *subcomm );
    }
}

void fix_cli_default_values( CLI::App& app )
{
    for( auto opt : app.get_options() ) {
        opt->capture_default_str();
    }
    for( auto subcomm : app.get_subcommands( {} )) {
        fix_cli_default_values( *subcomm );
    }
}

void set_module_help_group( CLI::App& module, std::string const& group_name )
{
    for( auto subcomm : module.get_subcommands( {} )) {
        // Hidden commands keep their empty group.
        if( ! subcomm->get_group().empty() ) {
            subcomm->group( group_name );
        }
    }
}
