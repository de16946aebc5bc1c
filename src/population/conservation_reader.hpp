#ifndef POPSUM_POPULATION_CONSERVATION_READER_H_
#define POPSUM_POPULATION_CONSERVATION_READER_H_

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
#include "population/missing_value.hpp"

#include "genesis/utils/io/input_source.hpp"

#include <memory>
#include <string>
#include <vector>

// =================================================================================================
//      Conservation Record
// =================================================================================================

/**
 * @brief Site with its ancestral allele and conservation score, as annotated by GERP.
 */
struct ConservationRecord
{
    std::string chromosome;
    size_t      position = 0;
    std::string ancestral_allele;
    MaybeDouble score;
};

/**
 * @brief Return whether an ancestral allele is known, that is, not `N`, `.`, or empty.
 */
bool is_known_ancestral_allele( std::string const& allele );

inline bool has_known_ancestral_allele( ConservationRecord const& record )
{
    return is_known_ancestral_allele( record.ancestral_allele );
}

// =================================================================================================
//      Conservation Reader
// =================================================================================================

/**
 * @brief Reader for tab-separated conservation tables with the columns
 * `chrom pos ancestral_state score`, without header.
 *
 * Scores `nan`, `NA`, and `.` are missing. Empty lines and lines starting with `#` are skipped,
 * and records outside of the region are filtered.
 */
class ConservationReader
{
public:

    struct Report
    {
        size_t rows     = 0;
        size_t used     = 0;
        size_t filtered = 0;
    };

    ConservationReader()  = default;
    ~ConservationReader() = default;

    ConservationReader( ConservationReader const& ) = default;
    ConservationReader( ConservationReader&& )      = default;

    ConservationReader& operator= ( ConservationReader const& ) = default;
    ConservationReader& operator= ( ConservationReader&& )      = default;

    std::vector<ConservationRecord> read(
        std::shared_ptr<genesis::utils::BaseInputSource> source,
        Report* report = nullptr
    ) const;

    ConservationRecord parse_row(
        std::vector<std::string> const& fields,
        std::string const& source_name,
        size_t line
    ) const;

    ConservationReader& region( GenomeRegion const& value )
    {
        region_ = value;
        return *this;
    }

    GenomeRegion const& region() const
    {
        return region_;
    }

private:

    GenomeRegion region_;

};

#endif // include guard
