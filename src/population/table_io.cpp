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

#include "population/table_io.hpp"

#include "population/errors.hpp"

#include "genesis/utils/io/input_stream.hpp"
#include "genesis/utils/text/char.hpp"
#include "genesis/utils/text/convert.hpp"
#include "genesis/utils/text/string.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <stdexcept>

// =================================================================================================
//      Local Helpers
// =================================================================================================

static void write_value_( std::ostream& os, MaybeDouble const& value, TableFormat const& format )
{
    os << format.separator;
    if( value ) {
        os << std::defaultfloat << std::setprecision( format.precision ) << value.value();
    } else {
        os << format.na_entry;
    }
}

static void write_count_( std::ostream& os, MaybeCount const& value, TableFormat const& format )
{
    os << format.separator;
    if( value ) {
        os << value.value();
    } else {
        os << format.na_entry;
    }
}

static std::string const& text_or_na_( std::string const& text, TableFormat const& format )
{
    return text.empty() ? format.na_entry : text;
}

static std::string text_from_field_( std::string const& field, TableFormat const& format )
{
    return field == format.na_entry ? std::string() : field;
}

static MaybeDouble parse_double_(
    std::string const& field, TableFormat const& format,
    std::string const& source_name, size_t line
) {
    if( field == format.na_entry ) {
        return MaybeDouble::missing();
    }
    double value = 0.0;
    try {
        value = genesis::utils::convert_from_string<double>( field, true );
    } catch( std::exception const& ) {
        throw MalformedInputError( source_name, line, "Invalid number \"" + field + "\"." );
    }
    if( ! std::isfinite( value )) {
        throw MalformedInputError( source_name, line, "Invalid number \"" + field + "\"." );
    }
    return value;
}

static MaybeCount parse_count_(
    std::string const& field, TableFormat const& format,
    std::string const& source_name, size_t line
) {
    if( field == format.na_entry ) {
        return MaybeCount::missing();
    }
    if( field.empty() || ! std::all_of( field.begin(), field.end(), []( char c ){
        return genesis::utils::is_digit( c );
    })) {
        throw MalformedInputError( source_name, line, "Invalid count \"" + field + "\"." );
    }
    return genesis::utils::convert_from_string<size_t>( field );
}

/**
 * @brief Line based reading of our own tables, with the header split off first.
 */
class TableLineReader
{
public:

    TableLineReader(
        std::shared_ptr<genesis::utils::BaseInputSource> source,
        TableFormat const& format
    )
        : input_( source )
        , delimiter_( 1, format.separator )
    {
        std::vector<std::string> fields;
        if( ! next( fields )) {
            throw MalformedInputError( input_.source_name(), 1, "Missing header line." );
        }
        header_ = fields;
    }

    bool next( std::vector<std::string>& fields )
    {
        using namespace genesis::utils;
        while( input_ ) {
            line_ = input_.line();
            auto const line = trim_right( input_.get_line(), "\r" );
            if( line.empty() ) {
                continue;
            }
            fields = split( line, delimiter_, false );
            if( ! header_.empty() && fields.size() != header_.size() ) {
                throw MalformedInputError(
                    input_.source_name(), line_,
                    "Expecting " + std::to_string( header_.size() ) + " columns, but found " +
                    std::to_string( fields.size() ) + "."
                );
            }
            return true;
        }
        return false;
    }

    std::vector<std::string> const& header() const
    {
        return header_;
    }

    std::string source_name() const
    {
        return input_.source_name();
    }

    size_t line() const
    {
        return line_;
    }

private:

    genesis::utils::InputStream input_;
    std::string delimiter_;
    std::vector<std::string> header_;
    size_t line_ = 0;
};

static void check_header_(
    TableLineReader const& reader,
    std::vector<std::string> const& expected
) {
    auto const& header = reader.header();
    if(
        header.size() < expected.size() ||
        ! std::equal( expected.begin(), expected.end(), header.begin() )
    ) {
        throw MalformedInputError(
            reader.source_name(), 1,
            "Invalid header, expecting columns starting with \"" +
            genesis::utils::join( expected, "\", \"" ) + "\"."
        );
    }
}

// =================================================================================================
//      Summary Tables
// =================================================================================================

static std::vector<std::string> summary_id_columns_( AggregationLevel level )
{
    std::vector<std::string> result = { "population1", "population2" };
    switch( level ) {
        case AggregationLevel::kWindow: {
            result.insert( result.end(), { "chrom", "start", "end", "locus" });
            break;
        }
        case AggregationLevel::kChromosome: {
            result.insert( result.end(), { "chrom", "start", "end" });
            break;
        }
        case AggregationLevel::kGenome: {
            break;
        }
        default: {
            throw std::domain_error( "Internal error: Invalid aggregation level." );
        }
    }
    return result;
}

static bool same_row_( WindowAggregate const& lhs, WindowAggregate const& rhs )
{
    return lhs.population_pair == rhs.population_pair
        && lhs.chromosome      == rhs.chromosome
        && lhs.window          == rhs.window
    ;
}

void write_summary_table(
    std::ostream& os,
    std::vector<WindowAggregate> const& aggregates,
    AggregationLevel level,
    TableFormat const& format
) {
    auto const sep = format.separator;

    // Find the statistics that we have, in column order.
    std::vector<Statistic> statistics;
    for( auto const statistic : all_statistics() ) {
        auto const has = std::any_of(
            aggregates.begin(), aggregates.end(),
            [&]( WindowAggregate const& agg ){
                return agg.statistic == statistic;
            }
        );
        if( has ) {
            statistics.push_back( statistic );
        }
    }

    // Header
    auto const id_columns = summary_id_columns_( level );
    os << genesis::utils::join( id_columns, std::string( 1, sep ));
    for( auto const statistic : statistics ) {
        auto const name = statistic_name( statistic );
        os << sep << name << sep << name << ".sites" << sep << name << ".weight";
    }
    os << "\n";

    // Rows. All statistics of a row are consecutive, so we process groups of aggregates.
    size_t begin = 0;
    while( begin < aggregates.size() ) {
        auto end = begin + 1;
        while( end < aggregates.size() && same_row_( aggregates[begin], aggregates[end] )) {
            ++end;
        }
        auto const& first = aggregates[begin];

        os << first.population_pair.first;
        os << sep << text_or_na_( first.population_pair.second, format );
        if( level != AggregationLevel::kGenome ) {
            os << sep << first.chromosome;
            if( first.window.has_coordinates() ) {
                os << sep << first.window.start << sep << first.window.end;
            } else {
                os << sep << format.na_entry << sep << format.na_entry;
            }
        }
        if( level == AggregationLevel::kWindow ) {
            os << sep << text_or_na_( first.window.locus, format );
        }

        for( auto const statistic : statistics ) {
            auto const agg = std::find_if(
                aggregates.begin() + begin, aggregates.begin() + end,
                [&]( WindowAggregate const& a ){
                    return a.statistic == statistic;
                }
            );
            if( agg == aggregates.begin() + end ) {
                os << sep << format.na_entry << sep << format.na_entry << sep << format.na_entry;
                continue;
            }
            write_value_( os, agg->value, format );
            os << sep << agg->sites_compared;
            write_value_( os, agg->weight, format );
        }
        os << "\n";
        begin = end;
    }
}

std::vector<WindowAggregate> read_summary_table(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    AggregationLevel level,
    TableFormat const& format
) {
    using namespace genesis::utils;

    TableLineReader reader( source, format );
    auto const id_columns = summary_id_columns_( level );
    check_header_( reader, id_columns );

    // The statistic columns come in groups of three.
    auto const& header = reader.header();
    if(( header.size() - id_columns.size() ) % 3 != 0 ) {
        throw MalformedInputError( reader.source_name(), 1, "Invalid statistic columns." );
    }
    std::vector<Statistic> statistics;
    for( size_t i = id_columns.size(); i < header.size(); i += 3 ) {
        Statistic statistic;
        try {
            statistic = statistic_from_name( header[i] );
        } catch( std::invalid_argument const& ex ) {
            throw MalformedInputError( reader.source_name(), 1, ex.what() );
        }
        if( header[i+1] != header[i] + ".sites" || header[i+2] != header[i] + ".weight" ) {
            throw MalformedInputError(
                reader.source_name(), 1,
                "Invalid columns for statistic " + header[i] + "."
            );
        }
        statistics.push_back( statistic );
    }

    std::vector<WindowAggregate> result;
    std::vector<std::string> fields;
    while( reader.next( fields )) {
        auto const line = reader.line();
        WindowAggregate row;
        row.population_pair.first  = fields[0];
        row.population_pair.second = text_from_field_( fields[1], format );
        if( level != AggregationLevel::kGenome ) {
            row.chromosome   = fields[2];
            row.window.start = parse_count_( fields[3], format, reader.source_name(), line )
                .value_or( 0 );
            row.window.end   = parse_count_( fields[4], format, reader.source_name(), line )
                .value_or( 0 );
        }
        if( level == AggregationLevel::kWindow ) {
            row.window.locus = text_from_field_( fields[5], format );
        }

        for( size_t s = 0; s < statistics.size(); ++s ) {
            auto const col = id_columns.size() + 3 * s;
            auto const value  = parse_double_( fields[col],   format, reader.source_name(), line );
            auto const sites  = parse_count_(  fields[col+1], format, reader.source_name(), line );
            auto const weight = parse_double_( fields[col+2], format, reader.source_name(), line );
            if( ! value && ! sites && ! weight ) {
                continue;
            }

            auto agg = row;
            agg.statistic      = statistics[s];
            agg.value          = value;
            agg.sites_compared = sites.value_or( 0 );
            agg.weight         = weight.value_or( 0.0 );
            result.push_back( std::move( agg ));
        }
    }
    return result;
}

// =================================================================================================
//      Pairwise Matrix
// =================================================================================================

void write_pairwise_matrix(
    std::ostream& os,
    PairwiseMatrix const& matrix,
    TableFormat const& format
) {
    auto const sep = format.separator;

    os << "population";
    for( auto const& name : matrix.populations ) {
        os << sep << name;
    }
    os << "\n";

    for( size_t r = 0; r < matrix.populations.size(); ++r ) {
        os << matrix.populations[r];
        for( size_t c = 0; c < matrix.populations.size(); ++c ) {
            write_value_( os, matrix.values( r, c ), format );
        }
        os << "\n";
    }
}

PairwiseMatrix read_pairwise_matrix(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    Statistic statistic,
    TableFormat const& format
) {
    using namespace genesis::utils;

    TableLineReader reader( source, format );
    check_header_( reader, { "population" });

    PairwiseMatrix result;
    result.statistic = statistic;
    result.populations.assign( reader.header().begin() + 1, reader.header().end() );
    auto const size = result.populations.size();
    result.values = Matrix<MaybeDouble>( size, size );

    size_t r = 0;
    std::vector<std::string> fields;
    while( reader.next( fields )) {
        if( r >= size || fields[0] != result.populations[r] ) {
            throw MalformedInputError(
                reader.source_name(), reader.line(),
                "Row population \"" + fields[0] + "\" does not match the header order."
            );
        }
        for( size_t c = 0; c < size; ++c ) {
            result.values( r, c ) = parse_double_(
                fields[ c + 1 ], format, reader.source_name(), reader.line()
            );
        }
        ++r;
    }
    if( r != size ) {
        throw MalformedInputError(
            "Pairwise matrix in " + reader.source_name() + " has " + std::to_string( r ) +
            " rows, but " + std::to_string( size ) + " columns."
        );
    }
    return result;
}

// =================================================================================================
//      Sample Genotype Statistics
// =================================================================================================

static std::vector<std::string> const& sample_stats_columns_()
{
    static std::vector<std::string> const columns = {
        "sample", "het", "hom", "missing", "total", "heterozygosity", "call_rate"
    };
    return columns;
}

void write_sample_stats(
    std::ostream& os,
    std::map<std::string, SampleGenoSummary> const& stats,
    TableFormat const& format
) {
    auto const sep = format.separator;
    os << genesis::utils::join( sample_stats_columns_(), std::string( 1, sep )) << "\n";
    for( auto const& entry : stats ) {
        auto const& stat = entry.second;
        os << entry.first;
        os << sep << stat.heterozygous_sites;
        os << sep << stat.homozygous_sites;
        os << sep << stat.missing_sites;
        os << sep << stat.total_sites;
        write_value_( os, stat.heterozygosity, format );
        write_value_( os, stat.call_rate, format );
        os << "\n";
    }
}

std::map<std::string, SampleGenoSummary> read_sample_stats(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    TableFormat const& format
) {
    TableLineReader reader( source, format );
    check_header_( reader, sample_stats_columns_() );

    std::map<std::string, SampleGenoSummary> result;
    std::vector<std::string> fields;
    while( reader.next( fields )) {
        auto const name = reader.source_name();
        auto const line  = reader.line();
        auto count_ = [&]( size_t i ) -> size_t {
            auto const count = parse_count_( fields[i], format, name, line );
            if( ! count ) {
                throw MalformedInputError( name, line, "Missing count in " + fields[0] + "." );
            }
            return count.value();
        };

        SampleGenoSummary stat;
        stat.sample_id          = fields[0];
        stat.heterozygous_sites = count_( 1 );
        stat.homozygous_sites   = count_( 2 );
        stat.missing_sites      = count_( 3 );
        stat.total_sites        = count_( 4 );
        stat.heterozygosity     = parse_double_( fields[5], format, name, line );
        stat.call_rate          = parse_double_( fields[6], format, name, line );
        if( result.count( stat.sample_id ) > 0 ) {
            throw MalformedInputError( name, line, "Duplicate sample " + stat.sample_id + "." );
        }
        result[ stat.sample_id ] = stat;
    }
    return result;
}

// =================================================================================================
//      Derived Alleles
// =================================================================================================

static std::vector<std::string> const& derived_alleles_columns_()
{
    static std::vector<std::string> const columns = {
        "chrom", "pos", "ancestral", "derived", "score"
    };
    return columns;
}

static std::string const derived_count_suffix_ = ".derived_count";

void write_derived_alleles(
    std::ostream& os,
    std::vector<DerivedAlleleRecord> const& records,
    std::vector<std::string> const& sample_names,
    TableFormat const& format
) {
    auto const sep = format.separator;
    os << genesis::utils::join( derived_alleles_columns_(), std::string( 1, sep ));
    for( auto const& sample : sample_names ) {
        os << sep << sample << derived_count_suffix_;
    }
    os << "\n";

    for( auto const& record : records ) {
        if( record.derived_counts.size() != sample_names.size() ) {
            throw std::invalid_argument(
                "Derived allele record at " + record.chromosome + ":" +
                std::to_string( record.position ) + " has a different number of samples "
                "than given for the table."
            );
        }
        os << record.chromosome << sep << record.position;
        os << sep << text_or_na_( record.ancestral_allele, format );
        os << sep << text_or_na_( record.derived_allele, format );
        write_value_( os, record.score, format );
        for( auto const& count : record.derived_counts ) {
            write_count_( os, count, format );
        }
        os << "\n";
    }
}

std::vector<DerivedAlleleRecord> read_derived_alleles(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    std::vector<std::string>& sample_names,
    TableFormat const& format
) {
    using namespace genesis::utils;

    TableLineReader reader( source, format );
    auto const& fixed = derived_alleles_columns_();
    check_header_( reader, fixed );

    sample_names.clear();
    for( size_t i = fixed.size(); i < reader.header().size(); ++i ) {
        auto const& column = reader.header()[i];
        if( ! ends_with( column, derived_count_suffix_ )) {
            throw MalformedInputError(
                reader.source_name(), 1, "Invalid sample column \"" + column + "\"."
            );
        }
        sample_names.push_back( column.substr( 0, column.size() - derived_count_suffix_.size() ));
    }

    std::vector<DerivedAlleleRecord> result;
    std::vector<std::string> fields;
    while( reader.next( fields )) {
        auto const name = reader.source_name();
        auto const line  = reader.line();

        DerivedAlleleRecord record;
        record.chromosome       = fields[0];
        auto const position     = parse_count_( fields[1], format, name, line );
        if( ! position ) {
            throw MalformedInputError( name, line, "Missing position." );
        }
        record.position         = position.value();
        record.ancestral_allele = text_from_field_( fields[2], format );
        record.derived_allele   = text_from_field_( fields[3], format );
        record.score            = parse_double_( fields[4], format, name, line );
        for( size_t i = fixed.size(); i < fields.size(); ++i ) {
            record.derived_counts.push_back( parse_count_( fields[i], format, name, line ));
            record.genotyped |= record.derived_counts.back().is_defined();
        }
        result.push_back( std::move( record ));
    }
    return result;
}
