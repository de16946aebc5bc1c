#ifndef POPSUM_POPULATION_SAMPLE_GENO_STATS_H_
#define POPSUM_POPULATION_SAMPLE_GENO_STATS_H_

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

#include "population/genotype.hpp"
#include "population/missing_value.hpp"
#include "population/vcf_genotype_reader.hpp"

#include <map>
#include <string>
#include <vector>

// =================================================================================================
//      Sample Genotype Stat
// =================================================================================================

/**
 * @brief Running counts of the genotype calls of one sample.
 *
 * Every call increments the total, and exactly one of the heterozygous, homozygous,
 * or missing counts.
 */
struct SampleGenoStat
{
    std::string sample_id;
    size_t heterozygous_sites = 0;
    size_t homozygous_sites   = 0;
    size_t missing_sites      = 0;
    size_t total_sites        = 0;

    void add( GenotypeCall const& call )
    {
        if( call.is_missing() ) {
            ++missing_sites;
        } else if( call.is_heterozygous() ) {
            ++heterozygous_sites;
        } else {
            ++homozygous_sites;
        }
        ++total_sites;
    }

    /**
     * @brief Merge the counts of another part of the genome for the same sample.
     */
    SampleGenoStat& operator += ( SampleGenoStat const& other );
};

// =================================================================================================
//      Sample Genotype Summary
// =================================================================================================

/**
 * @brief Final counts and ratios of the genotype calls of one sample.
 *
 * The heterozygosity is the fraction of heterozygous calls among the non-missing calls,
 * and the call rate is the fraction of non-missing calls among all calls. Missing calls thus do
 * not count as homozygous. Both ratios are missing if their denominator is zero.
 */
struct SampleGenoSummary
{
    std::string sample_id;
    size_t      heterozygous_sites = 0;
    size_t      homozygous_sites   = 0;
    size_t      missing_sites      = 0;
    size_t      total_sites        = 0;
    MaybeDouble heterozygosity;
    MaybeDouble call_rate;
};

SampleGenoSummary finalize( SampleGenoStat const& stat );

// =================================================================================================
//      Extract
// =================================================================================================

/**
 * @brief Compute the per-sample statistics over all records of the VCF reader.
 *
 * This is a single pass over the records. Only the counters per sample are kept in memory.
 * The result contains all samples of the file, including those without any calls.
 */
std::map<std::string, SampleGenoSummary> extract_sample_stats( VcfGenotypeReader& reader );

/**
 * @brief Compute the per-sample statistics from records already in memory,
 * with the calls in the order of @p sample_names.
 */
std::map<std::string, SampleGenoSummary> extract_sample_stats(
    std::vector<std::string> const& sample_names,
    std::vector<VcfGenotypeRecord> const& records
);

#endif // include guard
