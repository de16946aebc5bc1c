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

#include "population/derived_alleles.hpp"

#include "population/errors.hpp"

#include "genesis/utils/text/string.hpp"

#include <stdexcept>

// =================================================================================================
//      Derived Allele Count
// =================================================================================================

MaybeCount derived_allele_count(
    GenotypeCall const& call,
    std::string const& ancestral_allele,
    std::string const& reference,
    std::vector<std::string> const& alternatives
) {
    using namespace genesis::utils;

    if( call.is_missing() || ! is_known_ancestral_allele( ancestral_allele )) {
        return MaybeCount::missing();
    }
    auto const ancestral = to_upper( ancestral_allele );

    // Find the allele index of the ancestral state. An ancestral state that is neither
    // the reference nor one of the alternatives makes the reference allele the derived one.
    bool ancestral_found = false;
    size_t ancestral_index = 0;
    if( to_upper( reference ) == ancestral ) {
        ancestral_found = true;
    } else {
        for( size_t i = 0; i < alternatives.size(); ++i ) {
            if( to_upper( alternatives[i] ) == ancestral ) {
                ancestral_found = true;
                ancestral_index = i + 1;
                break;
            }
        }
    }

    size_t count = 0;
    for( auto const allele : call.alleles ) {
        if( ancestral_found ? allele != ancestral_index : allele == 0 ) {
            ++count;
        }
    }
    return MaybeCount( count );
}

static std::string derived_alleles_of_(
    std::string const& ancestral_allele,
    VcfGenotypeRecord const& record
) {
    using namespace genesis::utils;

    auto const ancestral = to_upper( ancestral_allele );
    bool matches_alternative = false;
    for( auto const& alt : record.alternatives ) {
        matches_alternative |= ( to_upper( alt ) == ancestral );
    }
    if( to_upper( record.reference ) != ancestral && ! matches_alternative ) {
        return record.reference;
    }

    std::vector<std::string> derived;
    if( to_upper( record.reference ) != ancestral ) {
        derived.push_back( record.reference );
    }
    for( auto const& alt : record.alternatives ) {
        if( to_upper( alt ) != ancestral ) {
            derived.push_back( alt );
        }
    }
    return join( derived, "," );
}

// =================================================================================================
//      Derived Allele Merger
// =================================================================================================

DerivedAlleleMerger::DerivedAlleleMerger(
    std::vector<ConservationRecord> const& sites,
    std::vector<std::string> const& sample_names
)
    : sample_names_( sample_names )
{
    records_.reserve( sites.size() );
    for( auto const& site : sites ) {
        DerivedAlleleRecord record;
        record.chromosome       = site.chromosome;
        record.position         = site.position;
        record.ancestral_allele = site.ancestral_allele;
        record.score            = site.score;
        record.derived_counts.assign( sample_names_.size(), MaybeCount::missing() );

        index_[ site.chromosome ][ site.position ].push_back( records_.size() );
        records_.push_back( std::move( record ));
    }
}

bool DerivedAlleleMerger::add_genotype_record( VcfGenotypeRecord const& record )
{
    if( record.calls.size() != sample_names_.size() ) {
        throw MalformedInputError(
            "Record at " + record.chromosome + ":" + std::to_string( record.position ) +
            " has " + std::to_string( record.calls.size() ) + " genotype calls, but there are " +
            std::to_string( sample_names_.size() ) + " samples."
        );
    }

    // Find the conservation sites at the position, if any.
    auto const chr_it = index_.find( record.chromosome );
    if( chr_it == index_.end() ) {
        ++unused_records_;
        return false;
    }
    auto const pos_it = chr_it->second.find( record.position );
    if( pos_it == chr_it->second.end() ) {
        ++unused_records_;
        return false;
    }

    // All sites at one position get the same genotypes,
    // so checking the first of them suffices for detecting duplicate records.
    auto const& indices = pos_it->second;
    if( records_[ indices.front() ].genotyped ) {
        ++duplicate_records_;
        return true;
    }

    for( auto const idx : indices ) {
        auto& site = records_[ idx ];
        site.genotyped = true;
        if( ! is_known_ancestral_allele( site.ancestral_allele )) {
            continue;
        }
        site.derived_allele = derived_alleles_of_( site.ancestral_allele, record );
        for( size_t s = 0; s < record.calls.size(); ++s ) {
            site.derived_counts[s] = derived_allele_count(
                record.calls[s], site.ancestral_allele, record.reference, record.alternatives
            );
        }
    }
    return true;
}

size_t DerivedAlleleMerger::unmatched_sites() const
{
    size_t result = 0;
    for( auto const& record : records_ ) {
        if( ! record.genotyped ) {
            ++result;
        }
    }
    return result;
}

// =================================================================================================
//      Merge
// =================================================================================================

std::vector<DerivedAlleleRecord> merge_derived_alleles(
    std::vector<ConservationRecord> const& sites,
    VcfGenotypeReader& reader,
    size_t* unmatched
) {
    DerivedAlleleMerger merger( sites, reader.sample_names() );
    VcfGenotypeRecord record;
    while( reader.next( record )) {
        merger.add_genotype_record( record );
    }
    if( unmatched ) {
        *unmatched = merger.unmatched_sites();
    }
    return merger.records();
}

std::vector<DerivedAlleleRecord> merge_derived_alleles(
    std::vector<ConservationRecord> const& sites,
    std::vector<std::string> const& sample_names,
    std::vector<VcfGenotypeRecord> const& genotype_records,
    size_t* unmatched
) {
    DerivedAlleleMerger merger( sites, sample_names );
    for( auto const& record : genotype_records ) {
        merger.add_genotype_record( record );
    }
    if( unmatched ) {
        *unmatched = merger.unmatched_sites();
    }
    return merger.records();
}
