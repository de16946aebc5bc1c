#ifndef POPSUM_POPULATION_ERRORS_H_
#define POPSUM_POPULATION_ERRORS_H_

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

#include <stdexcept>
#include <string>

// =================================================================================================
//      Malformed Input
// =================================================================================================

/**
 * @brief Exception thrown when a record of an input file does not follow the expected format.
 *
 * This is fatal for a run: we do not want to write tables that are silently truncated or that
 * contain values from a misread line. The message contains the source name and line number,
 * where known.
 */
class MalformedInputError : public std::runtime_error
{
public:

    MalformedInputError( std::string const& message )
        : std::runtime_error( message )
    {}

    MalformedInputError(
        std::string const& source_name,
        size_t line,
        std::string const& message
    )
        : std::runtime_error(
            "Malformed input in " + source_name + " at line " + std::to_string( line ) +
            ": " + message
        )
    {}
};

// =================================================================================================
//      Unknown Population or Sample
// =================================================================================================

/**
 * @brief Exception thrown when an input refers to a population or sample that was not declared
 * in the population or sample list given for the run.
 */
class UnknownPopulationOrSampleError : public std::runtime_error
{
public:

    UnknownPopulationOrSampleError( std::string const& identifier, std::string const& context )
        : std::runtime_error(
            "Unknown population or sample \"" + identifier + "\" in " + context +
            ", which is not declared in the provided list."
        )
        , identifier_( identifier )
    {}

    std::string const& identifier() const
    {
        return identifier_;
    }

private:

    std::string identifier_;
};

#endif // include guard
