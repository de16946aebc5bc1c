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

#include "population/sample_geno_stats.hpp"

#include "population/errors.hpp"

#include <stdexcept>

// =================================================================================================
//      Sample Genotype Stat
// =================================================================================================

SampleGenoStat& SampleGenoStat::operator += ( SampleGenoStat const& other )
{
    if( sample_id != other.sample_id ) {
        throw std::invalid_argument(
            "Cannot merge genotype counts of different samples " + sample_id +
            " and " + other.sample_id
        );
    }
    heterozygous_sites += other.heterozygous_sites;
    homozygous_sites   += other.homozygous_sites;
    missing_sites      += other.missing_sites;
    total_sites        += other.total_sites;
    return *this;
}

SampleGenoSummary finalize( SampleGenoStat const& stat )
{
    SampleGenoSummary result;
    result.sample_id          = stat.sample_id;
    result.heterozygous_sites = stat.heterozygous_sites;
    result.homozygous_sites   = stat.homozygous_sites;
    result.missing_sites      = stat.missing_sites;
    result.total_sites        = stat.total_sites;

    auto const called = static_cast<double>( stat.total_sites - stat.missing_sites );
    result.heterozygosity = ratio_or_missing(
        static_cast<double>( stat.heterozygous_sites ), called
    );
    result.call_rate = ratio_or_missing( called, static_cast<double>( stat.total_sites ));
    return result;
}

// =================================================================================================
//      Extract
// =================================================================================================

static std::vector<SampleGenoStat> make_counters_( std::vector<std::string> const& sample_names )
{
    std::vector<SampleGenoStat> counters( sample_names.size() );
    for( size_t i = 0; i < sample_names.size(); ++i ) {
        counters[i].sample_id = sample_names[i];
    }
    return counters;
}

static void add_record_( std::vector<SampleGenoStat>& counters, VcfGenotypeRecord const& record )
{
    if( record.calls.size() != counters.size() ) {
        throw MalformedInputError(
            "Record at " + record.chromosome + ":" + std::to_string( record.position ) +
            " has " + std::to_string( record.calls.size() ) + " genotype calls, but there are " +
            std::to_string( counters.size() ) + " samples."
        );
    }
    for( size_t i = 0; i < counters.size(); ++i ) {
        counters[i].add( record.calls[i] );
    }
}

static std::map<std::string, SampleGenoSummary> finalize_all_(
    std::vector<SampleGenoStat> const& counters
) {
    std::map<std::string, SampleGenoSummary> result;
    for( auto const& counter : counters ) {
        result[ counter.sample_id ] = finalize( counter );
    }
    return result;
}

std::map<std::string, SampleGenoSummary> extract_sample_stats( VcfGenotypeReader& reader )
{
    auto counters = make_counters_( reader.sample_names() );
    VcfGenotypeRecord record;
    while( reader.next( record )) {
        add_record_( counters, record );
    }
    return finalize_all_( counters );
}

std::map<std::string, SampleGenoSummary> extract_sample_stats(
    std::vector<std::string> const& sample_names,
    std::vector<VcfGenotypeRecord> const& records
) {
    auto counters = make_counters_( sample_names );
    for( auto const& record : records ) {
        add_record_( counters, record );
    }
    return finalize_all_( counters );
}
