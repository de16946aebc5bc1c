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

#include "boost/test/unit_test.hpp"

#include "population/errors.hpp"
#include "population/genome_region.hpp"
#include "population/genotype.hpp"
#include "population/sample_geno_stats.hpp"
#include "population/vcf_genotype_reader.hpp"

#include "genesis/utils/io/input_source.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

BOOST_AUTO_TEST_SUITE( test_genotype )

// =================================================================================================
//      Genotype Calls
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_ParseGenotypeCall )
{
    auto const hom_ref = parse_genotype_call( "0/0" );
    BOOST_REQUIRE_EQUAL( hom_ref.ploidy(), 2 );
    BOOST_CHECK( hom_ref.is_homozygous() );
    BOOST_CHECK( ! hom_ref.is_heterozygous() );
    BOOST_CHECK_EQUAL( hom_ref.alt_count(), 0 );

    auto const het = parse_genotype_call( "0|1:35:12,4" );
    BOOST_REQUIRE_EQUAL( het.ploidy(), 2 );
    BOOST_CHECK( het.is_heterozygous() );
    BOOST_CHECK_EQUAL( het.alt_count(), 1 );

    auto const multi = parse_genotype_call( "1/12" );
    BOOST_REQUIRE_EQUAL( multi.ploidy(), 2 );
    BOOST_CHECK_EQUAL( multi.alleles[1], 12 );
    BOOST_CHECK( multi.is_heterozygous() );
    BOOST_CHECK_EQUAL( multi.alt_count(), 2 );

    auto const haploid = parse_genotype_call( "1" );
    BOOST_CHECK_EQUAL( haploid.ploidy(), 1 );
    BOOST_CHECK( haploid.is_homozygous() );

    auto const triploid = parse_genotype_call( "0/0/1" );
    BOOST_CHECK_EQUAL( triploid.ploidy(), 3 );
    BOOST_CHECK( triploid.is_heterozygous() );
}

BOOST_AUTO_TEST_CASE( test_ParseMissingGenotypeCall )
{
    BOOST_CHECK( parse_genotype_call( "./." ).is_missing() );
    BOOST_CHECK( parse_genotype_call( ".|." ).is_missing() );
    BOOST_CHECK( parse_genotype_call( "." ).is_missing() );
    BOOST_CHECK( parse_genotype_call( "" ).is_missing() );
    BOOST_CHECK( parse_genotype_call( ".:20" ).is_missing() );

    // A partially missing call does not count as called.
    auto const partial = parse_genotype_call( "0/." );
    BOOST_CHECK( partial.is_missing() );
    BOOST_CHECK( ! partial.is_homozygous() );
    BOOST_CHECK( ! partial.is_heterozygous() );
}

BOOST_AUTO_TEST_CASE( test_ParseInvalidGenotypeCall )
{
    BOOST_CHECK_THROW( parse_genotype_call( "A/T" ), std::invalid_argument );
    BOOST_CHECK_THROW( parse_genotype_call( "0/" ),  std::invalid_argument );
    BOOST_CHECK_THROW( parse_genotype_call( "/1" ),  std::invalid_argument );
    BOOST_CHECK_THROW( parse_genotype_call( "0//1" ), std::invalid_argument );
}

// =================================================================================================
//      Sample Genotype Stats
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_SampleGenoStatCounts )
{
    SampleGenoStat stat;
    stat.sample_id = "S1";
    for( size_t i = 0; i < 6; ++i ) {
        stat.add( parse_genotype_call( "0/1" ));
    }
    stat.add( parse_genotype_call( "0/0" ));
    stat.add( parse_genotype_call( "1/1" ));
    stat.add( parse_genotype_call( "2/2" ));
    stat.add( parse_genotype_call( "./." ));

    BOOST_CHECK_EQUAL( stat.heterozygous_sites, 6 );
    BOOST_CHECK_EQUAL( stat.homozygous_sites, 3 );
    BOOST_CHECK_EQUAL( stat.missing_sites, 1 );
    BOOST_CHECK_EQUAL( stat.total_sites, 10 );

    auto const summary = finalize( stat );
    BOOST_CHECK_EQUAL( summary.sample_id, "S1" );
    BOOST_CHECK_CLOSE( summary.heterozygosity.value(), 6.0 / 9.0, 1e-9 );
    BOOST_CHECK_CLOSE( summary.call_rate.value(), 0.9, 1e-9 );
}

BOOST_AUTO_TEST_CASE( test_SampleGenoStatAllMissing )
{
    SampleGenoStat stat;
    stat.sample_id = "S1";
    stat.add( parse_genotype_call( "./." ));
    stat.add( parse_genotype_call( "." ));

    auto const summary = finalize( stat );
    BOOST_CHECK( summary.heterozygosity.is_missing() );
    BOOST_CHECK( summary.call_rate == MaybeDouble( 0.0 ));

    // Without any site, neither is defined.
    SampleGenoStat empty;
    empty.sample_id = "S2";
    auto const empty_summary = finalize( empty );
    BOOST_CHECK( empty_summary.heterozygosity.is_missing() );
    BOOST_CHECK( empty_summary.call_rate.is_missing() );
}

BOOST_AUTO_TEST_CASE( test_SampleGenoStatMerge )
{
    SampleGenoStat first;
    first.sample_id = "S1";
    first.add( parse_genotype_call( "0/1" ));
    first.add( parse_genotype_call( "./." ));

    SampleGenoStat second;
    second.sample_id = "S1";
    second.add( parse_genotype_call( "1/1" ));

    first += second;
    BOOST_CHECK_EQUAL( first.heterozygous_sites, 1 );
    BOOST_CHECK_EQUAL( first.homozygous_sites, 1 );
    BOOST_CHECK_EQUAL( first.missing_sites, 1 );
    BOOST_CHECK_EQUAL( first.total_sites, 3 );

    SampleGenoStat other;
    other.sample_id = "S2";
    BOOST_CHECK_THROW( first += other, std::invalid_argument );
}

// =================================================================================================
//      VCF Reader
// =================================================================================================

static std::string const example_vcf_ =
    "##fileformat=VCFv4.2\n"
    "##contig=<ID=chr1>\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\tS3\n"
    "chr1\t100\t.\tA\tG\t50\tPASS\t.\tGT\t0/1\t0/0\t./.\n"
    "chr1\t200\t.\tC\tT,G\t50\tPASS\t.\tGT:DP\t1/2:10\t1/1:12\t0|1:8\n"
    "chr2\t50\t.\tT\t.\t50\tPASS\t.\tGT\t0/0\t0/0\t0/0\n"
;

BOOST_AUTO_TEST_CASE( test_VcfReaderRecords )
{
    using namespace genesis::utils;

    VcfGenotypeReader reader( from_string( example_vcf_ ));
    BOOST_REQUIRE_EQUAL( reader.sample_names().size(), 3 );
    BOOST_CHECK_EQUAL( reader.sample_names()[0], "S1" );
    BOOST_CHECK_EQUAL( reader.sample_names()[2], "S3" );

    VcfGenotypeRecord record;
    BOOST_REQUIRE( reader.next( record ));
    BOOST_CHECK_EQUAL( record.chromosome, "chr1" );
    BOOST_CHECK_EQUAL( record.position, 100 );
    BOOST_CHECK_EQUAL( record.reference, "A" );
    BOOST_REQUIRE_EQUAL( record.alternatives.size(), 1 );
    BOOST_CHECK_EQUAL( record.alternatives[0], "G" );
    BOOST_REQUIRE_EQUAL( record.calls.size(), 3 );
    BOOST_CHECK( record.calls[0].is_heterozygous() );
    BOOST_CHECK( record.calls[2].is_missing() );

    BOOST_REQUIRE( reader.next( record ));
    BOOST_CHECK_EQUAL( record.position, 200 );
    BOOST_CHECK_EQUAL( record.alternatives.size(), 2 );
    BOOST_CHECK_EQUAL( record.calls[0].alt_count(), 2 );

    BOOST_REQUIRE( reader.next( record ));
    BOOST_CHECK_EQUAL( record.chromosome, "chr2" );
    BOOST_CHECK( record.alternatives.empty() );

    BOOST_CHECK( ! reader.next( record ));
    BOOST_CHECK_EQUAL( reader.records_read(), 3 );
    BOOST_CHECK_EQUAL( reader.records_filtered(), 0 );
}

BOOST_AUTO_TEST_CASE( test_VcfReaderRegion )
{
    using namespace genesis::utils;

    VcfGenotypeReader reader( from_string( example_vcf_ ), parse_genome_region( "chr1:150-300" ));
    VcfGenotypeRecord record;
    BOOST_REQUIRE( reader.next( record ));
    BOOST_CHECK_EQUAL( record.position, 200 );
    BOOST_CHECK( ! reader.next( record ));
    BOOST_CHECK_EQUAL( reader.records_read(), 3 );
    BOOST_CHECK_EQUAL( reader.records_filtered(), 2 );
}

BOOST_AUTO_TEST_CASE( test_VcfReaderExtractSampleStats )
{
    using namespace genesis::utils;

    VcfGenotypeReader reader( from_string( example_vcf_ ));
    auto const stats = extract_sample_stats( reader );
    BOOST_REQUIRE_EQUAL( stats.size(), 3 );

    auto const& s1 = stats.at( "S1" );
    BOOST_CHECK_EQUAL( s1.heterozygous_sites, 2 );
    BOOST_CHECK_EQUAL( s1.homozygous_sites, 1 );
    BOOST_CHECK_EQUAL( s1.missing_sites, 0 );
    BOOST_CHECK_CLOSE( s1.heterozygosity.value(), 2.0 / 3.0, 1e-9 );
    BOOST_CHECK( s1.call_rate == MaybeDouble( 1.0 ));

    auto const& s3 = stats.at( "S3" );
    BOOST_CHECK_EQUAL( s3.missing_sites, 1 );
    BOOST_CHECK_EQUAL( s3.total_sites, 3 );
    BOOST_CHECK( s3.heterozygosity == MaybeDouble( 0.5 ));
    BOOST_CHECK_CLOSE( s3.call_rate.value(), 2.0 / 3.0, 1e-9 );
}

BOOST_AUTO_TEST_CASE( test_VcfReaderSamples )
{
    using namespace genesis::utils;

    // Declared samples cover the file.
    std::unordered_set<std::string> declared = { "S1", "S2", "S3", "S4" };
    BOOST_CHECK_NO_THROW( VcfGenotypeReader( from_string( example_vcf_ ), GenomeRegion(), declared ));

    // S3 is not declared.
    std::unordered_set<std::string> partial = { "S1", "S2" };
    BOOST_CHECK_THROW(
        VcfGenotypeReader( from_string( example_vcf_ ), GenomeRegion(), partial ),
        UnknownPopulationOrSampleError
    );

    std::string const duplicate =
        "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS1\n"
    ;
    BOOST_CHECK_THROW( VcfGenotypeReader reader( from_string( duplicate )), MalformedInputError );

    std::string const no_header = "chr1\t100\t.\tA\tG\t50\tPASS\t.\tGT\t0/1\n";
    BOOST_CHECK_THROW( VcfGenotypeReader reader( from_string( no_header )), MalformedInputError );
}

BOOST_AUTO_TEST_CASE( test_VcfReaderMalformed )
{
    using namespace genesis::utils;

    std::string const header =
        "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\n"
    ;
    std::vector<std::string> const bad_lines = {
        "chr1\t100\t.\tA\tG\t50\tPASS\t.\tGT\t0/1\n",
        "chr1\t100\t.\tA\tG\t50\tPASS\t.\tGT\t0/1\t0/0\t1/1\n",
        "chr1\tx100\t.\tA\tG\t50\tPASS\t.\tGT\t0/1\t0/0\n",
        "chr1\t0\t.\tA\tG\t50\tPASS\t.\tGT\t0/1\t0/0\n",
        "chr1\t100\t.\t\tG\t50\tPASS\t.\tGT\t0/1\t0/0\n",
        "chr1\t100\t.\tA\tG\t50\tPASS\t.\tDP:GT\t3:0/1\t4:0/0\n",
        "chr1\t100\t.\tA\tG\t50\tPASS\t.\tGT\t0/2\t0/0\n",
        "chr1\t100\t.\tA\tG\t50\tPASS\t.\tGT\t0/X\t0/0\n",
    };
    for( auto const& bad : bad_lines ) {
        VcfGenotypeReader reader( from_string( header + bad ));
        VcfGenotypeRecord record;
        BOOST_CHECK_THROW( reader.next( record ), MalformedInputError );
    }
}

BOOST_AUTO_TEST_SUITE_END()
