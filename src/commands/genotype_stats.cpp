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

#include "commands/genotype_stats.hpp"
#include "options/global.hpp"
#include "population/sample_geno_stats.hpp"
#include "population/table_io.hpp"
#include "population/vcf_genotype_reader.hpp"
#include "tools/cli_setup.hpp"
#include "tools/misc.hpp"

#include "genesis/utils/io/input_source.hpp"

// =================================================================================================
//      Setup
// =================================================================================================

void setup_genotype_stats( CLI::App& app )
{
    auto options = std::make_shared<GenotypeStatsOptions>();
    auto sub = app.add_subcommand(
        "genotype-stats",
        "Count heterozygous, homozygous, and missing genotype calls per sample of a VCF file, "
        "and compute heterozygosity and call rate."
    );

    // -------------------------------------------------------------------------
    //     Input
    // -------------------------------------------------------------------------

    options->vcf_file.option = sub->add_option(
        "--vcf-file",
        options->vcf_file.value,
        "VCF file with genotype calls (GT field) of the samples. Can be gzipped."
    );
    options->vcf_file.option->check( CLI::ExistingFile );
    options->vcf_file.option->required();
    options->vcf_file.option->group( "Input" );

    options->grouping.add_sample_list_opt_to_app( sub );
    options->region_filter.add_region_filter_opt_to_app( sub );

    // -------------------------------------------------------------------------
    //     Output
    // -------------------------------------------------------------------------

    options->table_output.add_table_output_opts_to_app( sub );
    options->file_output.add_default_output_opts_to_app( sub );
    options->file_output.add_file_compress_opt_to_app( sub );

    sub->callback( popsum_cli_callback(
        sub,
        [ options ]() {
            run_genotype_stats( *options );
        }
    ));
}

// =================================================================================================
//      Run
// =================================================================================================

void run_genotype_stats( GenotypeStatsOptions const& options )
{
    using namespace genesis::utils;

    options.file_output.check_output_files_nonexistence( "genotype-stats", "csv" );
    auto const format = options.table_output.get_table_format();

    // Single pass over the file, keeping only the counters per sample.
    LOG_MSG << "Reading VCF file " << options.vcf_file.value;
    VcfGenotypeReader reader(
        from_file( options.vcf_file.value ),
        options.region_filter.get_region(),
        options.grouping.get_samples()
    );
    if( reader.sample_names().empty() ) {
        LOG_WARN << "VCF file does not contain any samples.";
    }
    auto const stats = extract_sample_stats( reader );

    LOG_MSG << "Processed " << reader.records_read() << " records of "
            << reader.sample_names().size() << " samples.";
    if( reader.records_filtered() > 0 ) {
        LOG_MSG << "Skipped " << reader.records_filtered() << " records outside of the filter region.";
    }
    for( auto const& stat : stats ) {
        if( stat.second.heterozygosity.is_missing() ) {
            LOG_MSG2 << "Sample " << stat.first << " has no called genotypes.";
        }
    }

    auto target = options.file_output.get_output_target( "genotype-stats", "csv" );
    write_sample_stats( target->ostream(), stats, format );
}
