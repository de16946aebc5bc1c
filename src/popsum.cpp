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

#include "commands/commands.hpp"
#include "commands/tools.hpp"
#include "options/global.hpp"
#include "tools/cli_setup.hpp"
#include "tools/version.hpp"

#include "genesis/utils/core/logging.hpp"

#include <exception>

// =================================================================================================
//      Main
// =================================================================================================

int main( int argc, char** argv )
{
    // Activate logging.
    genesis::utils::Logging::log_to_stdout();
    genesis::utils::Logging::details.time = true;

    // Set up the app.
    CLI::App app{ popsum_title() };
    app.set_help_all_flag( "--help-all", "Expand help for all subcommands" );
    app.require_subcommand( 1 );
    app.footer( "\n" + popsum_header() );
    global_options.initialize( argc, argv );

    // Set up the commands.
    setup_commands( app );
    setup_tools( app );

    // Final checks and setup of the commands.
    check_subcommand_names( app );
    fix_cli_default_values( app );

    // Parse the command line, which also runs the callback of the chosen command.
    // Errors in the input files end the run with a message and a non-zero exit code.
    try {
        app.parse( argc, argv );
    } catch( CLI::ParseError const& ex ) {
        return app.exit( ex );
    } catch( std::exception const& ex ) {
        LOG_ERR << "Error: " << ex.what();
        return 1;
    }

    return 0;
}
