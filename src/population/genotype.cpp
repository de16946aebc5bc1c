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

#include "genesis/utils/text/char.hpp"

#include <stdexcept>

// =================================================================================================
//      Genotype Call
// =================================================================================================

size_t GenotypeCall::alt_count() const
{
    size_t result = 0;
    for( auto const allele : alleles ) {
        if( allele != 0 ) {
            ++result;
        }
    }
    return result;
}

bool GenotypeCall::is_heterozygous() const
{
    for( size_t i = 1; i < alleles.size(); ++i ) {
        if( alleles[i] != alleles[0] ) {
            return true;
        }
    }
    return false;
}

// =================================================================================================
//      Parsing
// =================================================================================================

GenotypeCall parse_genotype_call( std::string const& field )
{
    using namespace genesis::utils;

    // Only the GT subfield, which by the VCF standard is always the first one.
    auto const gt_end = field.find( ':' );
    auto const gt = field.substr( 0, gt_end );

    GenotypeCall result;
    bool missing = gt.empty();
    size_t pos = 0;
    while( pos < gt.size() ) {
        auto end = pos;
        while( end < gt.size() && gt[end] != '/' && gt[end] != '|' ) {
            ++end;
        }
        if( end == pos ) {
            throw std::invalid_argument( "Invalid genotype \"" + gt + "\" with empty allele." );
        }

        if( end - pos == 1 && gt[pos] == '.' ) {
            missing = true;
        } else {
            size_t allele = 0;
            for( size_t i = pos; i < end; ++i ) {
                if( ! is_digit( gt[i] )) {
                    throw std::invalid_argument( "Invalid genotype \"" + gt + "\"." );
                }
                allele = 10 * allele + static_cast<size_t>( gt[i] - '0' );
            }
            result.alleles.push_back( allele );
        }

        // Skip the separator. A trailing separator leaves an empty allele, which is invalid.
        pos = end + 1;
        if( end + 1 == gt.size() ) {
            throw std::invalid_argument( "Invalid genotype \"" + gt + "\" with empty allele." );
        }
    }

    if( missing ) {
        result.alleles.clear();
    }
    return result;
}
