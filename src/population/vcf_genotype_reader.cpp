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

#include "population/vcf_genotype_reader.hpp"

#include "population/errors.hpp"

#include "genesis/utils/text/char.hpp"
#include "genesis/utils/text/convert.hpp"
#include "genesis/utils/text/string.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

// =================================================================================================
//      Constructor
// =================================================================================================

VcfGenotypeReader::VcfGenotypeReader(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    GenomeRegion const& region,
    std::unordered_set<std::string> const& declared_samples
)
    : input_( source )
    , source_name_( source->source_name() )
    , region_( region )
{
    read_header_( declared_samples );
}

// =================================================================================================
//      Reading
// =================================================================================================

bool VcfGenotypeReader::next( VcfGenotypeRecord& record )
{
    using namespace genesis::utils;

    while( input_ ) {
        auto const line_no = input_.line();
        auto const line = trim_right( input_.get_line(), "\r" );
        if( line.empty() ) {
            continue;
        }
        if( line[0] == '#' ) {
            throw MalformedInputError(
                source_name_, line_no, "Unexpected header line after the first record."
            );
        }
        ++records_read_;

        auto const fields = split( line, "\t", false );
        parse_record_( fields, line_no, record );
        if( ! region_.contains( record.chromosome, record.position )) {
            ++records_filtered_;
            continue;
        }
        return true;
    }
    return false;
}

// =================================================================================================
//      Internal Helpers
// =================================================================================================

void VcfGenotypeReader::read_header_( std::unordered_set<std::string> const& declared_samples )
{
    using namespace genesis::utils;

    // Skip all meta lines, until we find the header line with the sample names.
    bool found_header = false;
    while( input_ && *input_ == '#' ) {
        auto const line_no = input_.line();
        auto const line = trim_right( input_.get_line(), "\r" );
        if( starts_with( line, "##" )) {
            continue;
        }
        if( ! starts_with( line, "#CHROM" )) {
            throw MalformedInputError(
                source_name_, line_no, "Invalid header line, expecting \"#CHROM\"."
            );
        }

        // Fixed columns, then FORMAT, then the samples. A sites-only file has neither.
        auto const fields = split( line, "\t", false );
        if( fields.size() < 8 ) {
            throw MalformedInputError(
                source_name_, line_no, "Header line with fewer than the 8 fixed VCF columns."
            );
        }
        std::unordered_set<std::string> uniq;
        for( size_t i = 9; i < fields.size(); ++i ) {
            if( uniq.count( fields[i] ) > 0 ) {
                throw MalformedInputError(
                    source_name_, line_no, "Duplicate sample name \"" + fields[i] + "\"."
                );
            }
            if( ! declared_samples.empty() && declared_samples.count( fields[i] ) == 0 ) {
                throw UnknownPopulationOrSampleError(
                    fields[i], source_name_ + " at line " + std::to_string( line_no )
                );
            }
            uniq.insert( fields[i] );
            sample_names_.push_back( fields[i] );
        }
        found_header = true;
        break;
    }

    if( ! found_header ) {
        throw MalformedInputError(
            source_name_, input_.line(), "Missing \"#CHROM\" header line with sample names."
        );
    }
}

void VcfGenotypeReader::parse_record_(
    std::vector<std::string> const& fields,
    size_t line,
    VcfGenotypeRecord& record
) const {
    using namespace genesis::utils;

    // Without samples, the FORMAT column is optional.
    auto const expected = sample_names_.empty() ? 8 : 9 + sample_names_.size();
    if( fields.size() < expected || ( ! sample_names_.empty() && fields.size() != expected )) {
        throw MalformedInputError(
            source_name_, line,
            "Expecting " + std::to_string( expected ) + " tab-separated columns, but found " +
            std::to_string( fields.size() ) + "."
        );
    }

    // Site.
    if( fields[0].empty() ) {
        throw MalformedInputError( source_name_, line, "Empty chromosome." );
    }
    record.chromosome = fields[0];
    auto const& pos = fields[1];
    if( pos.empty() || ! std::all_of( pos.begin(), pos.end(), []( char c ){
        return is_digit( c );
    })) {
        throw MalformedInputError( source_name_, line, "Invalid position \"" + pos + "\"." );
    }
    record.position = convert_from_string<size_t>( pos );
    if( record.position == 0 ) {
        throw MalformedInputError( source_name_, line, "Invalid position 0." );
    }

    // Alleles.
    if( fields[3].empty() ) {
        throw MalformedInputError( source_name_, line, "Empty reference allele." );
    }
    record.reference = fields[3];
    record.alternatives.clear();
    if( fields[4] != "." ) {
        record.alternatives = split( fields[4], ",", false );
    }

    // Genotypes, if there are samples. GT has to be the first FORMAT key if present.
    record.calls.clear();
    if( sample_names_.empty() ) {
        return;
    }
    if( fields[8] != "GT" && ! starts_with( fields[8], "GT:" )) {
        throw MalformedInputError(
            source_name_, line, "FORMAT column \"" + fields[8] + "\" does not start with GT."
        );
    }
    record.calls.reserve( sample_names_.size() );
    for( size_t i = 9; i < fields.size(); ++i ) {
        GenotypeCall call;
        try {
            call = parse_genotype_call( fields[i] );
        } catch( std::invalid_argument const& ex ) {
            throw MalformedInputError(
                source_name_, line, "Sample " + sample_names_[ i - 9 ] + ": " + ex.what()
            );
        }
        if( ! call.is_missing() ) {
            for( auto const allele : call.alleles ) {
                if( allele > record.alternatives.size() ) {
                    throw MalformedInputError(
                        source_name_, line, "Sample " + sample_names_[ i - 9 ] +
                        " has genotype allele " + std::to_string( allele ) +
                        ", but the record only has " +
                        std::to_string( record.alternatives.size() ) + " alternative alleles."
                    );
                }
            }
        }
        record.calls.push_back( std::move( call ));
    }
}
