#ifndef POPSUM_POPULATION_DERIVED_ALLELES_H_
#define POPSUM_POPULATION_DERIVED_ALLELES_H_

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

#include "population/conservation_reader.hpp"
#include "population/genotype.hpp"
#include "population/missing_value.hpp"
#include "population/vcf_genotype_reader.hpp"

#include <string>
#include <unordered_map>
#include <vector>

// =================================================================================================
//      Derived Allele Record
// =================================================================================================

/**
 * @brief Conservation site, enriched with the number of derived allele copies per sample.
 *
 * The `derived_allele` lists the alleles of the genotype record that differ from the ancestral
 * allele, comma-separated. It is empty for sites without genotype record, or with unknown
 * ancestral state. The `derived_counts` are in the order of the sample names of the VCF file.
 */
struct DerivedAlleleRecord
{
    std::string             chromosome;
    size_t                  position = 0;
    std::string             ancestral_allele;
    std::string             derived_allele;
    MaybeDouble             score;
    bool                    genotyped = false;
    std::vector<MaybeCount> derived_counts;
};

/**
 * @brief Number of called alleles that differ from the ancestral allele.
 *
 * The ancestral allele is compared case-insensitively to the reference and alternative alleles
 * of the record, to find its allele index. If it matches none of them, all called alleles
 * are derived. For a biallelic site, this is the alternative allele dosage if the reference is
 * ancestral, and the ploidy minus that dosage if the alternative is ancestral.
 *
 * The result is missing if the call is missing, or if the ancestral allele is unknown
 * (`N`, `.`, or empty).
 */
MaybeCount derived_allele_count(
    GenotypeCall const& call,
    std::string const& ancestral_allele,
    std::string const& reference,
    std::vector<std::string> const& alternatives
);

// =================================================================================================
//      Derived Allele Merger
// =================================================================================================

/**
 * @brief Join of conservation sites with VCF genotype records by chromosome and position.
 *
 * The conservation sites are indexed first. Then, genotype records are added one at a time,
 * and only the ones at a conservation site are used, so that the VCF file is streamed.
 * If several genotype records fall on the same site, the first one is used, and the others are
 * counted as duplicates. Sites without any genotype record are kept, with all counts missing.
 */
class DerivedAlleleMerger
{
public:

    // -------------------------------------------------------------------------
    //     Constructors and Rule of Five
    // -------------------------------------------------------------------------

    DerivedAlleleMerger(
        std::vector<ConservationRecord> const& sites,
        std::vector<std::string> const& sample_names
    );

    ~DerivedAlleleMerger() = default;

    DerivedAlleleMerger( DerivedAlleleMerger const& ) = default;
    DerivedAlleleMerger( DerivedAlleleMerger&& )      = default;

    DerivedAlleleMerger& operator= ( DerivedAlleleMerger const& ) = default;
    DerivedAlleleMerger& operator= ( DerivedAlleleMerger&& )      = default;

    // -------------------------------------------------------------------------
    //     Merging
    // -------------------------------------------------------------------------

    /**
     * @brief Add a genotype record. Returns whether it was at a conservation site.
     */
    bool add_genotype_record( VcfGenotypeRecord const& record );

    /**
     * @brief Get the enriched sites, in the order in which they were given.
     */
    std::vector<DerivedAlleleRecord> const& records() const
    {
        return records_;
    }

    std::vector<std::string> const& sample_names() const
    {
        return sample_names_;
    }

    /**
     * @brief Number of conservation sites that did not get any genotype record (yet).
     */
    size_t unmatched_sites() const;

    size_t duplicate_records() const
    {
        return duplicate_records_;
    }

    size_t unused_records() const
    {
        return unused_records_;
    }

    // -------------------------------------------------------------------------
    //     Data Members
    // -------------------------------------------------------------------------

private:

    std::vector<std::string>         sample_names_;
    std::vector<DerivedAlleleRecord> records_;

    // Chromosome to position to the indices of the sites in records_.
    std::unordered_map<
        std::string, std::unordered_map<size_t, std::vector<size_t>>
    > index_;

    size_t duplicate_records_ = 0;
    size_t unused_records_    = 0;

};

// =================================================================================================
//      Merge
// =================================================================================================

/**
 * @brief Enrich the conservation sites with the derived allele counts of all VCF samples.
 *
 * Convenience function that reads all records of the @p reader into a DerivedAlleleMerger.
 * If @p unmatched is given, it is set to the number of sites without genotype record.
 */
std::vector<DerivedAlleleRecord> merge_derived_alleles(
    std::vector<ConservationRecord> const& sites,
    VcfGenotypeReader& reader,
    size_t* unmatched = nullptr
);

std::vector<DerivedAlleleRecord> merge_derived_alleles(
    std::vector<ConservationRecord> const& sites,
    std::vector<std::string> const& sample_names,
    std::vector<VcfGenotypeRecord> const& genotype_records,
    size_t* unmatched = nullptr
);

#endif // include guard
