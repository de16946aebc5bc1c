#ifndef POPSUM_COMMANDS_COMMANDS_H_
#define POPSUM_COMMANDS_COMMANDS_H_

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

#include "commands/derived_alleles.hpp"
#include "commands/genotype_stats.hpp"
#include "commands/summary.hpp"

#include "options/global.hpp"
#include "tools/cli_setup.hpp"

#include <string>
#include <vector>

// =================================================================================================
//      Functions
// =================================================================================================

inline void setup_commands( CLI::App& app )
{
    // Pipeline commands.
    setup_summary( app );
    setup_genotype_stats( app );
    setup_derived_alleles( app );

    // Add the global options to each of the above subcommands.
    global_options.add_to_module( app );
    set_module_help_group( app );
}

#endif // include guard
