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

#include "commands/summary.hpp"
#include "options/global.hpp"
#include "population/accumulator.hpp"
#include "population/aggregator.hpp"
#include "population/pairwise_matrix.hpp"
#include "population/site_stat_reader.hpp"
#include "population/table_io.hpp"
#include "tools/cli_setup.hpp"
#include "tools/misc.hpp"

#include "genesis/utils/io/input_source.hpp"
#include "genesis/utils/text/string.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <utility>
#include <vector>

// =================================================================================================
//      Enum Mapping
// =================================================================================================

enum class SummaryLevel
{
    kAll,
    kWindow,
    kChromosome,
    kGenome
};

std::vector<std::pair<std::string, SummaryLevel>> const summary_level_map = {
    { "all",        SummaryLevel::kAll },
    { "window",     SummaryLevel::kWindow },
    { "chromosome", SummaryLevel::kChromosome },
    { "genome",     SummaryLevel::kGenome }
};

// =================================================================================================
//      Setup
// =================================================================================================

void setup_summary( CLI::App& app )
{
    // Create the options and subcommand objects.
    auto options = std::make_shared<SummaryOptions>();
    auto sub = app.add_subcommand(
        "summary",
        "Summarize a table of per-window population genetic statistics (pi, Dxy, Fst, and "
        "heterozygosity, as computed by piawka) per window, chromosome, and genome, "
        "using ratio-of-sums estimators, and write pairwise matrices of Dxy and Fst."
    );

    // -------------------------------------------------------------------------
    //     Input
    // -------------------------------------------------------------------------

    options->stats_file.option = sub->add_option(
        "--stats-file",
        options->stats_file.value,
        "Tab-separated statistic table with the columns `locus nSites pop1 pop2 nUsed metric "
        "value numerator denominator`, as produced by piawka. Can be gzipped."
    );
    options->stats_file.option->check( CLI::ExistingFile );
    options->stats_file.option->required();
    options->stats_file.option->group( "Input" );

    options->grouping.add_population_list_opt_to_app( sub );
    options->region_filter.add_region_filter_opt_to_app( sub );

    // -------------------------------------------------------------------------
    //     Settings
    // -------------------------------------------------------------------------

    options->level.option = sub->add_option(
        "--level",
        options->level.value,
        "Level at which to summarize the statistics. Chromosome and genome level sum up the "
        "numerators and denominators of all windows before dividing, instead of averaging "
        "the window values. With `all`, a table for each of the levels is written."
    );
    options->level.option->group( "Settings" );
    options->level.option->transform(
        CLI::IsMember( enum_map_keys( summary_level_map ), CLI::ignore_case )
    );

    options->omit_na_windows.option = sub->add_flag(
        "--omit-na-windows",
        options->omit_na_windows.value,
        "Do not write rows of the window level table where all statistics are n/a, "
        "which is the case for windows with zero denominators."
    );
    options->omit_na_windows.option->group( "Settings" );

    options->no_matrices.option = sub->add_flag(
        "--no-matrices",
        options->no_matrices.value,
        "Do not write the genome-wide pairwise matrices of Dxy and Fst."
    );
    options->no_matrices.option->group( "Settings" );

    options->block_size.option = sub->add_option(
        "--block-size",
        options->block_size.value,
        "Number of table rows to accumulate at a time. With more than one thread, each block "
        "is split among the threads, and the partial sums are merged."
    );
    options->block_size.option->check( CLI::PositiveNumber );
    options->block_size.option->group( "Settings" );

    // -------------------------------------------------------------------------
    //     Output
    // -------------------------------------------------------------------------

    options->table_output.add_table_output_opts_to_app( sub );
    options->file_output.add_default_output_opts_to_app( sub );
    options->file_output.add_file_compress_opt_to_app( sub );

    // Hand over the options by copy, so that their shared ptr stays alive in the lambda.
    sub->callback( popsum_cli_callback(
        sub,
        [ options ]() {
            run_summary( *options );
        }
    ));
}

// =================================================================================================
//      Helpers
// =================================================================================================

static std::string summary_table_name_( AggregationLevel level )
{
    return "summary-" + aggregation_level_name( level );
}

static std::string matrix_name_( Statistic statistic )
{
    return "matrix-" + statistic_name( statistic );
}

/**
 * @brief Remove the windows in which none of the statistics has a value.
 */
static std::vector<WindowAggregate> omit_missing_rows_(
    std::vector<WindowAggregate> const& aggregates
) {
    std::vector<WindowAggregate> result;
    size_t begin = 0;
    while( begin < aggregates.size() ) {
        auto const& first = aggregates[begin];
        auto end = begin;
        bool any_value = false;
        while(
            end < aggregates.size() &&
            aggregates[end].population_pair == first.population_pair &&
            aggregates[end].chromosome      == first.chromosome &&
            aggregates[end].window          == first.window
        ) {
            any_value |= aggregates[end].value.is_defined();
            ++end;
        }
        if( any_value ) {
            result.insert( result.end(), aggregates.begin() + begin, aggregates.begin() + end );
        }
        begin = end;
    }
    return result;
}

/**
 * @brief Read the statistic table block-wise into running sums.
 */
static RunningSums accumulate_stats_file_( SummaryOptions const& options )
{
    using namespace genesis::utils;

    SiteStatReader reader;
    reader.declared_populations( options.grouping.get_populations() );
    reader.region( options.region_filter.get_region() );

    // Use the pool only if there is more than the main thread to work with.
    bool const parallel = global_options.opt_threads.value > 1;
    auto const thread_pool = parallel
        ? global_options.thread_pool()
        : std::shared_ptr<ThreadPool>()
    ;
    internal_check( options.block_size.value > 0, "block size is zero" );

    RunningSums sums;
    std::vector<SiteStat> block;
    block.reserve( std::min<size_t>( options.block_size.value, 1000000 ));
    auto process_block_ = [&](){
        if( parallel ) {
            sums.merge( accumulate_parallel( block, thread_pool ));
        } else {
            sums.merge( accumulate( block ));
        }
        block.clear();
    };

    LOG_MSG << "Reading statistic table " << options.stats_file.value;
    auto const report = reader.read(
        from_file( options.stats_file.value ),
        [&]( SiteStat const& stat ){
            block.push_back( stat );
            if( block.size() >= options.block_size.value ) {
                process_block_();
            }
        }
    );
    process_block_();

    // User output about what we found.
    LOG_MSG << "Processed " << report.rows << " rows, of which " << report.used
            << " were used for the summary.";
    if( report.filtered > 0 ) {
        LOG_MSG << "Skipped " << report.filtered << " rows outside of the filter region.";
    }
    for( auto const& metric : report.unknown_metric_names ) {
        LOG_MSG2 << "Skipped " << metric.second << " rows of metric \"" << metric.first << "\".";
    }
    if( report.unknown_metric > 0 ) {
        LOG_MSG << "Skipped " << report.unknown_metric << " rows of metrics that are not "
                << "summarized.";
    }
    if( report.used == 0 ) {
        LOG_WARN << "No rows of the statistic table were used. "
                 << "The output tables will be empty.";
    }
    return sums;
}

// =================================================================================================
//      Run
// =================================================================================================

void run_summary( SummaryOptions const& options )
{
    using namespace genesis::utils;

    // Which levels do we want?
    auto const summary_level = get_enum_map_value( summary_level_map, options.level.value );
    std::vector<AggregationLevel> levels;
    if( summary_level == SummaryLevel::kAll || summary_level == SummaryLevel::kWindow ) {
        levels.push_back( AggregationLevel::kWindow );
    }
    if( summary_level == SummaryLevel::kAll || summary_level == SummaryLevel::kChromosome ) {
        levels.push_back( AggregationLevel::kChromosome );
    }
    if( summary_level == SummaryLevel::kAll || summary_level == SummaryLevel::kGenome ) {
        levels.push_back( AggregationLevel::kGenome );
    }
    assert( ! levels.empty() );

    // Output file checks, before doing any work.
    for( auto const level : levels ) {
        options.file_output.check_output_files_nonexistence( summary_table_name_( level ), "csv" );
    }
    if( ! options.no_matrices.value ) {
        for( auto const statistic : all_statistics() ) {
            if( is_pairwise_statistic( statistic )) {
                options.file_output.check_output_files_nonexistence(
                    matrix_name_( statistic ), "csv"
                );
            }
        }
    }
    auto const format = options.table_output.get_table_format();

    // Read and compute everything first. No output file is opened before all tables are complete.
    auto const sums = accumulate_stats_file_( options );

    std::vector<std::vector<WindowAggregate>> level_tables;
    for( auto const level : levels ) {
        auto aggregates = aggregate( sums, level );
        if( level == AggregationLevel::kWindow && options.omit_na_windows.value ) {
            aggregates = omit_missing_rows_( aggregates );
        }
        level_tables.push_back( std::move( aggregates ));
    }

    // Matrices of the pairwise statistics, from the genome-wide values.
    std::vector<PairwiseMatrix> matrices;
    if( ! options.no_matrices.value ) {
        auto const genome = aggregate( sums, AggregationLevel::kGenome );
        for( auto const statistic : sums.statistics() ) {
            if( is_pairwise_statistic( statistic )) {
                matrices.push_back( build_matrix( genome, statistic ));
            }
        }
    }

    // Now write all tables.
    assert( level_tables.size() == levels.size() );
    for( size_t i = 0; i < levels.size(); ++i ) {
        LOG_MSG << "Writing " << aggregation_level_name( levels[i] ) << " level summary with "
                << level_tables[i].size() << " values.";
        auto target = options.file_output.get_output_target(
            summary_table_name_( levels[i] ), "csv"
        );
        write_summary_table( target->ostream(), level_tables[i], levels[i], format );
    }
    for( auto const& matrix : matrices ) {
        LOG_MSG << "Writing " << statistic_name( matrix.statistic ) << " matrix of "
                << matrix.populations.size() << " populations.";
        auto target = options.file_output.get_output_target(
            matrix_name_( matrix.statistic ), "csv"
        );
        write_pairwise_matrix( target->ostream(), matrix, format );
    }
}
