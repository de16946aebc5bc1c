#ifndef POPSUM_OPTIONS_FILE_OUTPUT_H_
#define POPSUM_OPTIONS_FILE_OUTPUT_H_

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

#include "CLI/CLI.hpp"

#include "tools/cli_option.hpp"

#include "genesis/utils/io/output_target.hpp"

#include <memory>
#include <string>

// =================================================================================================
//      File Output Options
// =================================================================================================

/**
 * @brief Output directory, file name prefix and suffix, and compression of the output files.
 *
 * All output files are named `<out-dir>/<prefix><name><suffix>.<extension>`, with an additional
 * `.gz` if compression is activated.
 */
class FileOutputOptions
{
public:

    // -------------------------------------------------------------------------
    //     Constructor and Rule of Five
    // -------------------------------------------------------------------------

    FileOutputOptions()  = default;
    ~FileOutputOptions() = default;

    FileOutputOptions( FileOutputOptions const& other ) = default;
    FileOutputOptions( FileOutputOptions&& )            = default;

    FileOutputOptions& operator= ( FileOutputOptions const& other ) = default;
    FileOutputOptions& operator= ( FileOutputOptions&& )            = default;

    // -------------------------------------------------------------------------
    //     Setup Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Add the `--out-dir`, `--file-prefix`, and `--file-suffix` options.
     */
    void add_default_output_opts_to_app(
        CLI::App* sub,
        std::string const& group = "Output"
    );

    CLI::Option* add_file_compress_opt_to_app(
        CLI::App* sub,
        std::string const& group = "Output"
    );

    // -------------------------------------------------------------------------
    //     Run Functions
    // -------------------------------------------------------------------------

    /**
     * @brief Get the full path of an output file.
     *
     * If @p with_compression is set and compression is activated, the `.gz` extension is added.
     */
    std::string get_output_filename(
        std::string const& name,
        std::string const& extension,
        bool with_compression = true
    ) const;

    /**
     * @brief Check that the output file does not exist yet, unless overwriting is allowed.
     *
     * Throws a `CLI::ValidationError` otherwise. Commands call this for all their files before
     * starting any work, so that a run does not fail after having done the computation.
     */
    void check_output_files_nonexistence(
        std::string const& name,
        std::string const& extension
    ) const;

    /**
     * @brief Create the output directory if needed, and open the output file for writing.
     */
    std::shared_ptr<genesis::utils::BaseOutputTarget> get_output_target(
        std::string const& name,
        std::string const& extension
    ) const;

    bool compress() const
    {
        return compress_.value;
    }

    std::string const& out_dir() const
    {
        return out_dir_.value;
    }

    // -------------------------------------------------------------------------
    //     Option Members
    // -------------------------------------------------------------------------

private:

    CliOption<std::string> out_dir_     = ".";
    CliOption<std::string> file_prefix_ = "";
    CliOption<std::string> file_suffix_ = "";
    CliOption<bool>        compress_    = false;

};

#endif // include guard
