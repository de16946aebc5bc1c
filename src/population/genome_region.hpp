#ifndef POPSUM_POPULATION_GENOME_REGION_H_
#define POPSUM_POPULATION_GENOME_REGION_H_

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

// =================================================================================================
//      Genome Region
// =================================================================================================

/**
 * @brief Region of a chromosome that input records are restricted to.
 *
 * Positions are 1-based and inclusive. An `end` of 0 means until the end of the chromosome,
 * and an empty chromosome means that the region accepts everything.
 */
struct GenomeRegion
{
    std::string chromosome;
    size_t      start = 1;
    size_t      end   = 0;

    bool is_everything() const
    {
        return chromosome.empty();
    }

    bool contains( std::string const& chrom, size_t position ) const
    {
        if( is_everything() ) {
            return true;
        }
        return chrom == chromosome && position >= start && ( end == 0 || position <= end );
    }

    /**
     * @brief Return whether the interval `[first, last]` on the chromosome overlaps the region.
     * An interval with `first == 0` has unknown coordinates, and only the chromosome is tested.
     */
    bool overlaps( std::string const& chrom, size_t first, size_t last ) const
    {
        if( is_everything() ) {
            return true;
        }
        if( chrom != chromosome ) {
            return false;
        }
        if( first == 0 ) {
            return true;
        }
        return last >= start && ( end == 0 || first <= end );
    }
};

/**
 * @brief Parse a region from `chrom`, `chrom:position`, or `chrom:start-end`.
 *
 * Throws `std::invalid_argument` for invalid regions.
 */
GenomeRegion parse_genome_region( std::string const& text );

/**
 * @brief Print a region in the format accepted by parse_genome_region().
 */
std::string to_string( GenomeRegion const& region );

#endif // include guard
