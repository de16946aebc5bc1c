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

#include "boost/test/unit_test.hpp"

#include "commands/summary.hpp"

#include "CLI/CLI.hpp"
#include "genesis/utils/core/fs.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE( test_summary )

// =================================================================================================
//      Helpers
// =================================================================================================

static std::string const summary_out_dir_ = "popsum_test_summary_out/";

static std::vector<std::string> summary_output_files_()
{
    return std::vector<std::string>{
        summary_out_dir_ + "summary-window.csv",
        summary_out_dir_ + "summary-chromosome.csv",
        summary_out_dir_ + "summary-genome.csv",
        summary_out_dir_ + "matrix-dxy.csv",
    };
}

static void remove_summary_output_files_()
{
    for( auto const& file : summary_output_files_() ) {
        std::remove( file.c_str() );
    }
}

/**
 * @brief Run the summary command on a statistic table, writing to the test output directory.
 */
static void run_summary_on_( std::string const& table )
{
    using namespace genesis::utils;

    auto const stats_file = summary_out_dir_ + "stats.tsv";
    dir_create( summary_out_dir_, true );
    file_write( table, stats_file );
    remove_summary_output_files_();

    CLI::App app;
    SummaryOptions options;
    options.file_output.add_default_output_opts_to_app( &app );
    app.parse( "--out-dir " + summary_out_dir_ );
    options.stats_file.value = stats_file;

    run_summary( options );
}

// =================================================================================================
//      Run
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_SummaryWritesAllTables )
{
    using namespace genesis::utils;

    run_summary_on_(
        "chr1:1-100\t100\tA\t.\t90\tpi\t0.25\t22.5\t90\n"
        "chr1:1-100\t100\tA\tB\t80\tdxy\t0.5\t40\t80\n"
    );
    for( auto const& file : summary_output_files_() ) {
        BOOST_CHECK_MESSAGE( file_exists( file ), "missing output file " << file );
    }
    remove_summary_output_files_();
}

BOOST_AUTO_TEST_CASE( test_SummaryReversedPairWritesNothing )
{
    using namespace genesis::utils;

    // Both orders of the same pair cannot go into one matrix. The error comes after all rows
    // were read, and none of the tables may be written.
    BOOST_CHECK_THROW(
        run_summary_on_(
            "chr1:1-100\t100\tA\tB\t80\tdxy\t0.5\t40\t80\n"
            "chr1:1-100\t100\tB\tA\t80\tdxy\t0.25\t20\t80\n"
        ),
        std::invalid_argument
    );
    for( auto const& file : summary_output_files_() ) {
        BOOST_CHECK_MESSAGE( ! file_exists( file ), "unexpected output file " << file );
    }
}

BOOST_AUTO_TEST_SUITE_END()
