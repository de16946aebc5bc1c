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

#include "population/errors.hpp"

#include "genesis/utils/io/input_stream.hpp"
#include "genesis/utils/text/char.hpp"
#include "genesis/utils/text/convert.hpp"
#include "genesis/utils/text/string.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

// =================================================================================================
//      Conservation Record
// =================================================================================================

bool is_known_ancestral_allele( std::string const& allele )
{
    return ! allele.empty() && allele != "." && allele != "N" && allele != "n";
}

// =================================================================================================
//      Conservation Reader
// =================================================================================================

std::vector<ConservationRecord> ConservationReader::read(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    Report* report
) const {
    using namespace genesis::utils;

    Report counts;
    std::vector<ConservationRecord> result;
    InputStream it( source );
    while( it ) {
        auto const line_no = it.line();
        auto const line = trim_right( it.get_line(), "\r" );
        if( line.empty() || line[0] == '#' ) {
            continue;
        }
        ++counts.rows;

        auto record = parse_row( split( line, "\t", false ), it.source_name(), line_no );
        if( ! region_.contains( record.chromosome, record.position )) {
            ++counts.filtered;
            continue;
        }
        ++counts.used;
        result.push_back( std::move( record ));
    }

    if( report ) {
        *report = counts;
    }
    return result;
}

ConservationRecord ConservationReader::parse_row(
    std::vector<std::string> const& fields,
    std::string const& source_name,
    size_t line
) const {
    using namespace genesis::utils;

    if( fields.size() < 4 ) {
        throw MalformedInputError(
            source_name, line,
            "Expecting 4 tab-separated columns (chrom, pos, ancestral_state, score), but found " +
            std::to_string( fields.size() ) + "."
        );
    }

    ConservationRecord record;
    record.chromosome = fields[0];
    if( record.chromosome.empty() ) {
        throw MalformedInputError( source_name, line, "Empty chromosome." );
    }

    auto const& pos = fields[1];
    if( pos.empty() || ! std::all_of( pos.begin(), pos.end(), []( char c ){
        return is_digit( c );
    })) {
        throw MalformedInputError( source_name, line, "Invalid position \"" + pos + "\"." );
    }
    record.position = convert_from_string<size_t>( pos );
    if( record.position == 0 ) {
        throw MalformedInputError( source_name, line, "Invalid position 0." );
    }

    record.ancestral_allele = trim( fields[2] );

    // Missing scores are common for sites without alignment coverage.
    auto const score = to_lower( trim( fields[3] ));
    if( score == "nan" || score == "na" || score == "." || score.empty() ) {
        return record;
    }
    double value = 0.0;
    try {
        value = convert_from_string<double>( score, true );
    } catch( std::exception const& ) {
        throw MalformedInputError(
            source_name, line, "Invalid non-numeric score \"" + fields[3] + "\"."
        );
    }
    if( ! std::isfinite( value )) {
        throw MalformedInputError(
            source_name, line, "Invalid non-finite score \"" + fields[3] + "\"."
        );
    }
    record.score = value;
    return record;
}
