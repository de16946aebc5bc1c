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

#include "population/site_stat_reader.hpp"

#include "population/errors.hpp"

#include "genesis/utils/io/input_stream.hpp"
#include "genesis/utils/text/convert.hpp"
#include "genesis/utils/text/string.hpp"

#include <cmath>
#include <stdexcept>

// =================================================================================================
//      Reading
// =================================================================================================

SiteStatReader::Report SiteStatReader::read(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    Callback const& callback
) const {
    using namespace genesis::utils;

    Report report;
    InputStream it( source );
    SiteStat stat;
    while( it ) {
        auto const line_no = it.line();
        auto const line = trim_right( it.get_line(), "\r" );
        if( line.empty() || line[0] == '#' ) {
            continue;
        }
        ++report.rows;

        auto const fields = split( line, "\t", false );
        if( ! parse_row( fields, it.source_name(), line_no, stat )) {
            ++report.unknown_metric;
            ++report.unknown_metric_names[ fields[5] ];
            continue;
        }
        if( ! region_.overlaps( stat.chromosome, stat.window.start, stat.window.end )) {
            ++report.filtered;
            continue;
        }

        ++report.used;
        callback( stat );
    }
    return report;
}

std::vector<SiteStat> SiteStatReader::read(
    std::shared_ptr<genesis::utils::BaseInputSource> source
) const {
    std::vector<SiteStat> result;
    read( source, [&]( SiteStat const& stat ){
        result.push_back( stat );
    });
    return result;
}

// =================================================================================================
//      Parsing
// =================================================================================================

bool SiteStatReader::parse_row(
    std::vector<std::string> const& fields,
    std::string const& source_name,
    size_t line,
    SiteStat& stat
) const {
    using namespace genesis::utils;

    if( fields.size() < 9 ) {
        throw MalformedInputError(
            source_name, line,
            "Expecting at least 9 tab-separated columns "
            "(locus, nSites, pop1, pop2, nUsed, metric, value, numerator, denominator), "
            "but found " + std::to_string( fields.size() ) + "."
        );
    }

    // Skip the metrics that we do not summarize, before any further checks,
    // so that their value formats do not matter to us.
    if( ! statistic_from_metric( fields[5], stat.statistic )) {
        return false;
    }

    // Helper to convert a numerical field, with a nice error message.
    auto convert_field_ = [&]( size_t index, std::string const& name ) -> double {
        double value = 0.0;
        try {
            value = convert_from_string<double>( fields[index], true );
        } catch( std::exception const& ) {
            throw MalformedInputError(
                source_name, line,
                "Invalid non-numeric " + name + " \"" + fields[index] + "\"."
            );
        }
        if( ! std::isfinite( value )) {
            throw MalformedInputError(
                source_name, line,
                "Invalid non-finite " + name + " \"" + fields[index] + "\"."
            );
        }
        return value;
    };

    // Window and populations.
    if( fields[0].empty() ) {
        throw MalformedInputError( source_name, line, "Empty locus." );
    }
    parse_locus( fields[0], stat.chromosome, stat.window );
    if( fields[2].empty() || fields[2] == "." ) {
        throw MalformedInputError( source_name, line, "Empty first population." );
    }
    stat.population_pair.first = fields[2];
    check_population_( stat.population_pair.first, source_name, line );
    if( is_pairwise_statistic( stat.statistic )) {
        if( fields[3].empty() || fields[3] == "." ) {
            throw MalformedInputError(
                source_name, line,
                "Empty second population for pairwise metric \"" + fields[5] + "\"."
            );
        }
        stat.population_pair.second = fields[3];
        check_population_( stat.population_pair.second, source_name, line );
    } else {
        stat.population_pair.second.clear();
    }

    // Numbers. The count of used sites has to be a whole non-negative number.
    auto const used = convert_field_( 4, "number of used sites" );
    if( used < 0.0 || std::floor( used ) != used ) {
        throw MalformedInputError(
            source_name, line, "Invalid number of used sites \"" + fields[4] + "\"."
        );
    }
    stat.sites_compared = static_cast<size_t>( used );
    stat.numerator   = convert_field_( 7, "numerator" );
    stat.denominator = convert_field_( 8, "denominator" );

    if( stat.denominator < 0.0 ) {
        throw MalformedInputError(
            source_name, line, "Invalid negative denominator \"" + fields[8] + "\"."
        );
    }
    if( stat.statistic != Statistic::kFst && stat.numerator < 0.0 ) {
        throw MalformedInputError(
            source_name, line,
            "Invalid negative numerator \"" + fields[7] + "\" for metric \"" + fields[5] + "\"."
        );
    }
    return true;
}

void SiteStatReader::check_population_(
    std::string const& population,
    std::string const& source_name,
    size_t line
) const {
    if( declared_populations_.empty() ) {
        return;
    }
    if( declared_populations_.count( population ) == 0 ) {
        throw UnknownPopulationOrSampleError(
            population, source_name + " at line " + std::to_string( line )
        );
    }
}
