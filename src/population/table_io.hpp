#ifndef POPSUM_POPULATION_TABLE_IO_H_
#define POPSUM_POPULATION_TABLE_IO_H_

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

#include "population/aggregator.hpp"
#include "population/derived_alleles.hpp"
#include "population/missing_value.hpp"
#include "population/pairwise_matrix.hpp"
#include "population/sample_geno_stats.hpp"

#include "genesis/utils/io/input_source.hpp"

#include <iosfwd>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

// =================================================================================================
//      Table Format
// =================================================================================================

/**
 * @brief Formatting of the output tables.
 *
 * Missing values are written as the `na_entry`, and read back as missing. Numbers are written
 * with `precision` significant digits. The default is enough digits for reading back
 * the exact same value.
 */
struct TableFormat
{
    char        separator = '\t';
    std::string na_entry  = "NA";
    int         precision = std::numeric_limits<double>::max_digits10;
};

// =================================================================================================
//      Summary Tables
// =================================================================================================

/**
 * @brief Write aggregates as a table with one row per population pair and scope.
 *
 * The leading columns identify the row: `population1 population2`, then for window and
 * chromosome level `chrom start end`, and for window level also `locus`. Each statistic that
 * occurs in the aggregates then gets the three columns `<stat> <stat>.sites <stat>.weight`.
 * A statistic without aggregate for a row is written with all three columns as n/a.
 *
 * The aggregates are expected in the order produced by aggregate(), so that all statistics of
 * one row are consecutive.
 */
void write_summary_table(
    std::ostream& os,
    std::vector<WindowAggregate> const& aggregates,
    AggregationLevel level,
    TableFormat const& format = TableFormat()
);

/**
 * @brief Read a table as written by write_summary_table().
 */
std::vector<WindowAggregate> read_summary_table(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    AggregationLevel level,
    TableFormat const& format = TableFormat()
);

// =================================================================================================
//      Pairwise Matrix
// =================================================================================================

void write_pairwise_matrix(
    std::ostream& os,
    PairwiseMatrix const& matrix,
    TableFormat const& format = TableFormat()
);

PairwiseMatrix read_pairwise_matrix(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    Statistic statistic,
    TableFormat const& format = TableFormat()
);

// =================================================================================================
//      Sample Genotype Statistics
// =================================================================================================

void write_sample_stats(
    std::ostream& os,
    std::map<std::string, SampleGenoSummary> const& stats,
    TableFormat const& format = TableFormat()
);

std::map<std::string, SampleGenoSummary> read_sample_stats(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    TableFormat const& format = TableFormat()
);

// =================================================================================================
//      Derived Alleles
// =================================================================================================

void write_derived_alleles(
    std::ostream& os,
    std::vector<DerivedAlleleRecord> const& records,
    std::vector<std::string> const& sample_names,
    TableFormat const& format = TableFormat()
);

/**
 * @brief Read a table as written by write_derived_alleles(), and store the sample names
 * from its header in @p sample_names.
 *
 * As the table does not record it, sites count as genotyped if any of their counts is given.
 */
std::vector<DerivedAlleleRecord> read_derived_alleles(
    std::shared_ptr<genesis::utils::BaseInputSource> source,
    std::vector<std::string>& sample_names,
    TableFormat const& format = TableFormat()
);

#endif // include guard
