#ifndef POPSUM_POPULATION_GENOTYPE_H_
#define POPSUM_POPULATION_GENOTYPE_H_

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

#include <string>
#include <vector>

// =================================================================================================
//      Genotype Call
// =================================================================================================

/**
 * @brief Genotype of one sample at one site, as the indices of its alleles.
 *
 * Index 0 is the reference allele, and indices 1 and up are the alternative alleles, in the
 * order of the ALT column of the VCF record. A call without alleles is missing, which is the
 * case if any of its alleles was not called (`.`). A missing call is neither heterozygous
 * nor homozygous.
 */
struct GenotypeCall
{
    std::vector<size_t> alleles;

    bool is_missing() const
    {
        return alleles.empty();
    }

    size_t ploidy() const
    {
        return alleles.size();
    }

    /**
     * @brief Number of alleles that are not the reference. For biallelic sites, this is the
     * dosage of the alternative allele.
     */
    size_t alt_count() const;

    /**
     * @brief Return whether the call has at least two different alleles.
     */
    bool is_heterozygous() const;

    /**
     * @brief Return whether the call is not missing, and all its alleles are the same.
     */
    bool is_homozygous() const
    {
        return ! is_missing() && ! is_heterozygous();
    }
};

/**
 * @brief Parse the genotype of a VCF sample column, such as `0/1`, `1|1`, or `./.`.
 *
 * Only the first `:`-separated subfield is used, so that the whole sample column can be passed.
 * Alleles are separated by `/` or `|`. Any allele `.` yields a missing call, as does an empty
 * field. Throws `std::invalid_argument` for any other text that is not an allele index.
 */
GenotypeCall parse_genotype_call( std::string const& field );

#endif // include guard
