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

#include "options/grouping.hpp"

#include "tools/misc.hpp"

#include "genesis/utils/core/logging.hpp"

// =================================================================================================
//      Setup Functions
// =================================================================================================

CLI::Option* GroupingOptions::add_population_list_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    internal_check(
        population_list_.option == nullptr,
        "Cannot use the same GroupingOptions object multiple times."
    );

    population_list_.option = sub->add_option(
        "--population-list",
        population_list_.value,
        "Populations that are expected in the statistic table, either as (1) a comma- or "
        "tab-separated list, or (2) a file with one population name per line. If given, rows "
        "of any other population are an error. If not given, all populations are used."
    );
    population_list_.option->group( group );
    return population_list_.option;
}

CLI::Option* GroupingOptions::add_sample_list_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    internal_check(
        sample_list_.option == nullptr,
        "Cannot use the same GroupingOptions object multiple times."
    );

    sample_list_.option = sub->add_option(
        "--sample-list",
        sample_list_.value,
        "Samples that are expected in the VCF file, either as (1) a comma- or tab-separated "
        "list, or (2) a file with one sample name per line. If given, any other sample in the "
        "file is an error. If not given, all samples of the file are used."
    );
    sample_list_.option->group( group );
    return sample_list_.option;
}

// =================================================================================================
//      Run Functions
// =================================================================================================

std::unordered_set<std::string> GroupingOptions::get_populations() const
{
    std::unordered_set<std::string> result;
    if( population_list_.is_set() ) {
        auto const list = read_name_list( population_list_.name(), population_list_.value );
        result.insert( list.begin(), list.end() );
        LOG_MSG2 << "Using " << result.size() << " declared populations.";
    }
    return result;
}

std::unordered_set<std::string> GroupingOptions::get_samples() const
{
    std::unordered_set<std::string> result;
    if( sample_list_.is_set() ) {
        auto const list = read_name_list( sample_list_.name(), sample_list_.value );
        result.insert( list.begin(), list.end() );
        LOG_MSG2 << "Using " << result.size() << " declared samples.";
    }
    return result;
}
