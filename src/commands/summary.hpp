#ifndef POPSUM_COMMANDS_SUMMARY_H_
#define POPSUM_COMMANDS_SUMMARY_H_

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

#include "options/file_output.hpp"
#include "options/grouping.hpp"
#include "options/region_filter.hpp"
#include "options/table_output.hpp"
#include "tools/cli_option.hpp"

#include <string>
#include <vector>

// =================================================================================================
//      Options
// =================================================================================================

class SummaryOptions
{
public:

    CliOption<std::string> stats_file;
    GroupingOptions        grouping;
    RegionFilterOptions    region_filter;

    CliOption<std::string> level = "all";
    CliOption<bool>        omit_na_windows = false;
    CliOption<bool>        no_matrices = false;
    CliOption<size_t>      block_size = 100000;

    TableOutputOptions table_output;
    FileOutputOptions  file_output;

};

// =================================================================================================
//      Functions
// =================================================================================================

void setup_summary( CLI::App& app );
void run_summary( SummaryOptions const& options );

#endif // include guard
