#ifndef POPSUM_TOOLS_VERSION_H_
#define POPSUM_TOOLS_VERSION_H_

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
//      Popsum Version
// =================================================================================================

inline std::string popsum_version()
{
    return "v0.1.0"; // #POPSUM_VERSION#
}

inline std::string popsum_header()
{
    return "\
                                                          \n\
   ,----.  ,----.  ,----.  ,--. ,--. ,-----. ,--. ,--.,--.   ,--.\n\
   | .-. || .-. || .-. | |  | |  |(  .-'  |  | |  ||   `.'   |\n\
   | '-' '| | | || '-' ' |  | |  |.-'  `) |  | |  ||  |'.'|  |\n\
   | |--' ' '-' '| |--'  '  '-'  '`----'  '  '-'  '|  |   |  |\n\
   `--'    `---' `--'     `-----'          `-----' `--'   `--'\n\
                                                          \n\
       " + popsum_version() + " (c) 2024 by Lucas Czech\n";
}

inline std::string popsum_title()
{
    return "popsum: summaries of population genetic statistics in windows, chromosomes, and genomes";
}

#endif // include guard
