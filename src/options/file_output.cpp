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

#include "options/file_output.hpp"

#include "options/global.hpp"
#include "tools/misc.hpp"

#include "genesis/utils/core/fs.hpp"
#include "genesis/utils/core/logging.hpp"
#include "genesis/utils/core/options.hpp"
#include "genesis/utils/io/gzip_stream.hpp"

#include <stdexcept>

// =================================================================================================
//      Setup Functions
// =================================================================================================

void FileOutputOptions::add_default_output_opts_to_app(
    CLI::App* sub,
    std::string const& group
) {
    internal_check(
        out_dir_.option == nullptr,
        "Cannot use the same FileOutputOptions object multiple times."
    );

    out_dir_.option = sub->add_option(
        "--out-dir",
        out_dir_.value,
        "Directory to write the output files to. Created if it does not exist."
    );
    out_dir_.option->group( group );

    file_prefix_.option = sub->add_option(
        "--file-prefix",
        file_prefix_.value,
        "File name prefix for the output files, to distinguish the results of different runs."
    );
    file_prefix_.option->group( group );
    file_prefix_.option->check( CLI::Validator(
        []( std::string const& value ){
            if( value.find_first_of( "/\\" ) != std::string::npos ) {
                return std::string( "File prefix cannot contain path separators." );
            }
            return std::string();
        },
        "FILENAME"
    ));

    file_suffix_.option = sub->add_option(
        "--file-suffix",
        file_suffix_.value,
        "File name suffix for the output files, added before the file extension."
    );
    file_suffix_.option->group( group );
    file_suffix_.option->check( CLI::Validator(
        []( std::string const& value ){
            if( value.find_first_of( "/\\" ) != std::string::npos ) {
                return std::string( "File suffix cannot contain path separators." );
            }
            return std::string();
        },
        "FILENAME"
    ));
}

CLI::Option* FileOutputOptions::add_file_compress_opt_to_app(
    CLI::App* sub,
    std::string const& group
) {
    compress_.option = sub->add_flag(
        "--compress",
        compress_.value,
        "If set, compress the output files using gzip. The `.gz` extension is added to the "
        "file names."
    );
    compress_.option->group( group );
    return compress_.option;
}

// =================================================================================================
//      Run Functions
// =================================================================================================

std::string FileOutputOptions::get_output_filename(
    std::string const& name,
    std::string const& extension,
    bool with_compression
) const {
    using namespace genesis::utils;

    auto result = dir_normalize_path( out_dir_.value ) + file_prefix_.value + name +
        file_suffix_.value + "." + extension;
    if( with_compression && compress_.value ) {
        result += ".gz";
    }
    return result;
}

void FileOutputOptions::check_output_files_nonexistence(
    std::string const& name,
    std::string const& extension
) const {
    using namespace genesis::utils;

    if( Options::get().allow_file_overwriting() ) {
        return;
    }
    auto const filename = get_output_filename( name, extension );
    if( path_exists( filename )) {
        throw CLI::ValidationError(
            out_dir_.option ? out_dir_.option->get_name() : "--out-dir",
            "Output file already exists: " + filename + "\nUse " + allow_file_overwriting_flag +
            " to allow overwriting existing files."
        );
    }
}

std::shared_ptr<genesis::utils::BaseOutputTarget> FileOutputOptions::get_output_target(
    std::string const& name,
    std::string const& extension
) const {
    using namespace genesis::utils;

    dir_create( out_dir_.value, true );
    auto const filename = get_output_filename( name, extension, false );
    LOG_MSG2 << "Writing " << get_output_filename( name, extension );

    // to_file() adds the .gz extension itself when compressing.
    if( compress_.value ) {
        return to_file( filename, GzipCompressionLevel::kDefaultCompression );
    }
    return to_file( filename );
}
