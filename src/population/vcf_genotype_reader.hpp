#ifndef POPSUM_POPULATION_VCF_GENOTYPE_READER_H_
#define POPSUM_POPULATION_VCF_GENOTYPE_READER_H_

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

#include "population/genome_region.hpp"
#include "population/genotype.hpp"

#include "genesis/utils/io/input_source.hpp"
#include "genesis/utils/io/input_stream.hpp"

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

// =================================================================================================
//      VCF Genotype Record
// =================================================================================================

/**
 * @brief Site of a VCF file, with the genotype calls of all samples, in the order of
 * the sample names of the file.
 */
struct VcfGenotypeRecord
{
    std::string               chromosome;
    size_t                    position = 0;
    std::string               reference;
    std::vector<std::string>  alternatives;
    std::vector<GenotypeCall> calls;
};

// =================================================================================================
//      VCF Genotype Reader
// =================================================================================================

/**
 * @brief Minimal streaming reader for the genotypes of a VCF file.
 *
 * We only need the site coordinates, the alleles, and the GT field of the samples, so instead of
 * a full VCF parser, this reads the text line by line. Gzipped files are decompressed
 * transparently by the input source. Meta lines (`##`) are skipped, and the `#CHROM` header
 * line provides the sample names. Records are then read one at a time via next(), so that
 * memory stays bounded by the number of samples.
 *
 * Records outside of the region are skipped. Any record that does not follow the format throws
 * a MalformedInputError naming the file and line.
 */
class VcfGenotypeReader
{
public:

    // -------------------------------------------------------------------------
    //     Constructors and Rule of Five
    // -------------------------------------------------------------------------

    /**
     * @brief Open the source and read its header.
     *
     * If @p declared_samples is not empty, every sample of the file needs to be in it,
     * otherwise an UnknownPopulationOrSampleError is thrown.
     */
    VcfGenotypeReader(
        std::shared_ptr<genesis::utils::BaseInputSource> source,
        GenomeRegion const& region = GenomeRegion(),
        std::unordered_set<std::string> const& declared_samples = std::unordered_set<std::string>()
    );

    ~VcfGenotypeReader() = default;

    VcfGenotypeReader( VcfGenotypeReader const& ) = delete;
    VcfGenotypeReader( VcfGenotypeReader&& )      = default;

    VcfGenotypeReader& operator= ( VcfGenotypeReader const& ) = delete;
    VcfGenotypeReader& operator= ( VcfGenotypeReader&& )      = default;

    // -------------------------------------------------------------------------
    //     Reading
    // -------------------------------------------------------------------------

    /**
     * @brief Read the next record within the region into @p record.
     *
     * Returns `false` once the input is exhausted.
     */
    bool next( VcfGenotypeRecord& record );

    // -------------------------------------------------------------------------
    //     Accessors
    // -------------------------------------------------------------------------

    std::vector<std::string> const& sample_names() const
    {
        return sample_names_;
    }

    std::string const& source_name() const
    {
        return source_name_;
    }

    size_t records_read() const
    {
        return records_read_;
    }

    size_t records_filtered() const
    {
        return records_filtered_;
    }

    // -------------------------------------------------------------------------
    //     Internal Helpers
    // -------------------------------------------------------------------------

private:

    void read_header_( std::unordered_set<std::string> const& declared_samples );

    void parse_record_(
        std::vector<std::string> const& fields,
        size_t line,
        VcfGenotypeRecord& record
    ) const;

    // -------------------------------------------------------------------------
    //     Data Members
    // -------------------------------------------------------------------------

private:

    genesis::utils::InputStream input_;
    std::string  source_name_;
    GenomeRegion region_;

    std::vector<std::string> sample_names_;
    size_t records_read_     = 0;
    size_t records_filtered_ = 0;

};

#endif // include guard
