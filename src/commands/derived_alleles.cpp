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

#include "commands/derived_alleles.hpp"
#include "options/global.hpp"
#include "population/conservation_reader.hpp"
#include "population/derived_alleles.hpp"
#include "population/table_io.hpp"
#include "population/vcf_genotype_reader.hpp"
#include "tools/cli_setup.hpp"
#include "tools/misc.hpp"

#include "genesis/utils/io/input_source.hpp"

// =================================================================================================
//      Setup
// =================================================================================================

void setup_derived_alleles( CLI::App& app )
{
    auto options = std::make_shared<DerivedAllelesOptions>();
    auto sub = app.add_subcommand(
        "derived-alleles",
        "Annotate conservation scored sites (GERP output with ancestral alleles) with the "
        "number of derived allele copies of each sample of a VCF file."
    );

    // -------------------------------------------------------------------------
    //     Input
    // -------------------------------------------------------------------------

    options->conservation_file.option = sub->add_option(
        "--conservation-file",
        options->conservation_file.value,
        "Tab-separated conservation table with the columns `chrom pos ancestral_state score`, "
        "without header. Can be gzipped."
    );
    options->conservation_file.option->check( CLI::ExistingFile );
    options->conservation_file.option->required();
    options->conservation_file.option->group( "Input" );

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
            run_derived_alleles( *options );
        }
    ));
}

// =================================================================================================
//      Run
// =================================================================================================

void run_derived_alleles( DerivedAllelesOptions const& options )
{
    using namespace genesis::utils;

    options.file_output.check_output_files_nonexistence( "derived-alleles", "csv" );
    auto const format = options.table_output.get_table_format();
    auto const region = options.region_filter.get_region();

    // The conservation sites are kept in memory for the join.
    LOG_MSG << "Reading conservation table " << options.conservation_file.value;
    ConservationReader::Report cons_report;
    auto const sites = ConservationReader().region( region ).read(
        from_file( options.conservation_file.value ), &cons_report
    );
    LOG_MSG << "Using " << cons_report.used << " of " << cons_report.rows << " conservation sites.";

    // The genotypes are streamed into the join.
    LOG_MSG << "Reading VCF file " << options.vcf_file.value;
    VcfGenotypeReader reader(
        from_file( options.vcf_file.value ), region, options.grouping.get_samples()
    );
    DerivedAlleleMerger merger( sites, reader.sample_names() );
    VcfGenotypeRecord record;
    size_t matched = 0;
    while( reader.next( record )) {
        if( merger.add_genotype_record( record )) {
            ++matched;
        }
    }

    // User output about the join.
    LOG_MSG << "Processed " << reader.records_read() << " records of "
            << reader.sample_names().size() << " samples, of which " << matched
            << " are at conservation sites.";
    if( merger.duplicate_records() > 0 ) {
        LOG_WARN << "Found " << merger.duplicate_records() << " VCF records at positions "
                 << "that already had a record. Only the first record per position was used.";
    }
    size_t unknown_ancestral = 0;
    for( auto const& site : sites ) {
        if( ! has_known_ancestral_allele( site )) {
            ++unknown_ancestral;
        }
    }
    if( unknown_ancestral > 0 ) {
        LOG_MSG << unknown_ancestral << " conservation sites have an unknown ancestral allele, "
                << "and get n/a counts.";
    }
    auto const unmatched = merger.unmatched_sites();
    if( unmatched > 0 ) {
        LOG_WARN << unmatched << " of " << sites.size() << " conservation sites have no VCF "
                 << "record, and get n/a counts.";
    }

    auto target = options.file_output.get_output_target( "derived-alleles", "csv" );
    write_derived_alleles( target->ostream(), merger.records(), merger.sample_names(), format );
}
