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

#include "options/table_output.hpp"

#include <stdexcept>

// =================================================================================================
//      Setup Functions
// =================================================================================================

void TableOutputOptions::add_table_output_opts_to_app(
    CLI::App* sub,
    std::string const& group
) {
    add_separator_char_opt_to_app( sub, group );
    add_na_entry_opt_to_app( sub, group );
    add_precision_opt_to_app( sub, group );
}

CLI::Option* TableOutputOptions::add_separator_char_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    separator_char_.option = sub->add_option(
        "--separator-char",
        separator_char_.value,
        "Separator char between fields of output tabular data."
    )->transform(
        CLI::IsMember({ "comma", "tab", "space", "semicolon" }, CLI::ignore_case )
    );
    separator_char_.option->group( group );
    return separator_char_.option;
}

CLI::Option* TableOutputOptions::add_na_entry_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    na_entry_.option = sub->add_option(
        "--na-entry",
        na_entry_.value,
        "Text to use in the output for values that cannot be computed, such as ratios "
        "with a zero denominator, or counts at sites with unknown ancestral state."
    );
    na_entry_.option->group( group );
    na_entry_.option->check( CLI::Validator(
        []( std::string const& value ){
            if( value.empty() ) {
                return std::string( "The n/a entry cannot be empty." );
            }
            return std::string();
        },
        "TEXT"
    ));
    return na_entry_.option;
}

CLI::Option* TableOutputOptions::add_precision_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    precision_.option = sub->add_option(
        "--precision",
        precision_.value,
        "Number of significant digits of the numbers in the output tables."
    );
    precision_.option->check( CLI::Range( 1, 17 ));
    precision_.option->group( group );
    return precision_.option;
}

// =================================================================================================
//      Run Functions
// =================================================================================================

char TableOutputOptions::get_separator_char() const
{
    auto const& sep = separator_char_.value;
    if( sep == "comma" || sep == "," ) {
        return ',';
    } else if( sep == "tab" || sep == "tabulator" || sep == "\t" ) {
        return '\t';
    } else if( sep == "space" || sep == " " ) {
        return ' ';
    } else if( sep == "semicolon" || sep == ";" ) {
        return ';';
    } else {
        throw CLI::ValidationError(
            "--separator-char",
            "Invalid separator char '" + sep + "'."
        );
    }
}

TableFormat TableOutputOptions::get_table_format() const
{
    TableFormat format;
    format.separator = get_separator_char();
    format.na_entry  = na_entry_.value;
    format.precision = precision_.value;
    if( format.na_entry.find( format.separator ) != std::string::npos ) {
        throw CLI::ValidationError(
            "--na-entry",
            "Invalid n/a entry \"" + format.na_entry + "\" containing the separator char."
        );
    }
    return format;
}
