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

#include "population/conservation_reader.hpp"
#include "population/derived_alleles.hpp"
#include "population/errors.hpp"
#include "population/genotype.hpp"
#include "population/vcf_genotype_reader.hpp"

#include "genesis/utils/io/input_source.hpp"

#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE( test_derived_alleles )

static ConservationRecord make_site(
    std::string const& chrom, size_t pos, std::string const& ancestral, MaybeDouble score
) {
    ConservationRecord site;
    site.chromosome       = chrom;
    site.position         = pos;
    site.ancestral_allele = ancestral;
    site.score            = score;
    return site;
}

static VcfGenotypeRecord make_record(
    std::string const& chrom, size_t pos,
    std::string const& ref, std::vector<std::string> const& alts,
    std::vector<std::string> const& genotypes
) {
    VcfGenotypeRecord record;
    record.chromosome   = chrom;
    record.position     = pos;
    record.reference    = ref;
    record.alternatives = alts;
    for( auto const& gt : genotypes ) {
        record.calls.push_back( parse_genotype_call( gt ));
    }
    return record;
}

static std::vector<std::string> const samples_ = { "S1", "S2", "S3" };

// =================================================================================================
//      Derived Allele Count
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_DerivedCountReferenceAncestral )
{
    std::vector<std::string> const alts = { "G" };
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "1/1" ), "A", "A", alts ) == MaybeCount( 2 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/1" ), "A", "A", alts ) == MaybeCount( 1 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/0" ), "A", "A", alts ) == MaybeCount( 0 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "./." ), "A", "A", alts ).is_missing() );

    // Case does not matter.
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/1" ), "a", "A", alts ) == MaybeCount( 1 ));
}

BOOST_AUTO_TEST_CASE( test_DerivedCountAlternativeAncestral )
{
    std::vector<std::string> const alts = { "G", "T" };
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/0" ), "G", "A", alts ) == MaybeCount( 2 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "1/1" ), "G", "A", alts ) == MaybeCount( 0 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "1/2" ), "G", "A", alts ) == MaybeCount( 1 ));

}

BOOST_AUTO_TEST_CASE( test_DerivedCountAncestralNotInRecord )
{
    // Ancestral allele not among the alleles of the record: the reference copies are derived.
    std::vector<std::string> const alts = { "G" };
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/1" ), "C", "A", alts ) == MaybeCount( 1 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "1/1" ), "C", "A", alts ) == MaybeCount( 0 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/0" ), "C", "A", alts ) == MaybeCount( 2 ));
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "1" ),   "c", "A", alts ) == MaybeCount( 0 ));

    std::vector<ConservationRecord> const sites = {
        make_site( "chr1", 100, "C", 1.0 ),
    };
    std::vector<VcfGenotypeRecord> const records = {
        make_record( "chr1", 100, "A", { "G" }, { "0/1", "1/1", "0/0" }),
    };
    auto const merged = merge_derived_alleles( sites, samples_, records );
    BOOST_REQUIRE_EQUAL( merged.size(), 1 );
    BOOST_CHECK_EQUAL( merged[0].derived_allele, "A" );
    BOOST_CHECK( merged[0].derived_counts[0] == MaybeCount( 1 ));
    BOOST_CHECK( merged[0].derived_counts[1] == MaybeCount( 0 ));
    BOOST_CHECK( merged[0].derived_counts[2] == MaybeCount( 2 ));
}

BOOST_AUTO_TEST_CASE( test_DerivedCountUnknownAncestral )
{
    std::vector<std::string> const alts = { "G" };
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/1" ), "N", "A", alts ).is_missing() );
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/1" ), ".", "A", alts ).is_missing() );
    BOOST_CHECK( derived_allele_count( parse_genotype_call( "0/1" ), "",  "A", alts ).is_missing() );
}

// =================================================================================================
//      Merge
// =================================================================================================

BOOST_AUTO_TEST_CASE( test_MergeDerivedAlleles )
{
    std::vector<ConservationRecord> const sites = {
        make_site( "chr1", 100, "A", 0.5 ),
        make_site( "chr1", 200, "T", MaybeDouble() ),
        make_site( "chr1", 300, "N", 1.5 ),
        make_site( "chr2", 100, "C", 2.0 ),
    };
    std::vector<VcfGenotypeRecord> const records = {
        make_record( "chr1", 100, "A", { "G" },      { "1/1", "0/1", "./." }),
        make_record( "chr1", 150, "C", { "G" },      { "1/1", "0/1", "0/0" }),
        make_record( "chr1", 200, "C", { "T", "G" }, { "0/0", "1/2", "1|1" }),
        make_record( "chr1", 300, "G", { "A" },      { "0/1", "0/1", "0/1" }),
    };

    size_t unmatched = 0;
    auto const merged = merge_derived_alleles( sites, samples_, records, &unmatched );
    BOOST_REQUIRE_EQUAL( merged.size(), 4 );
    BOOST_CHECK_EQUAL( unmatched, 1 );

    // Reference is ancestral.
    BOOST_CHECK( merged[0].genotyped );
    BOOST_CHECK_EQUAL( merged[0].derived_allele, "G" );
    BOOST_CHECK( merged[0].score == MaybeDouble( 0.5 ));
    BOOST_REQUIRE_EQUAL( merged[0].derived_counts.size(), 3 );
    BOOST_CHECK( merged[0].derived_counts[0] == MaybeCount( 2 ));
    BOOST_CHECK( merged[0].derived_counts[1] == MaybeCount( 1 ));
    BOOST_CHECK( merged[0].derived_counts[2].is_missing() );

    // Alternative is ancestral.
    BOOST_CHECK( merged[1].genotyped );
    BOOST_CHECK_EQUAL( merged[1].derived_allele, "C,G" );
    BOOST_CHECK( merged[1].score.is_missing() );
    BOOST_CHECK( merged[1].derived_counts[0] == MaybeCount( 2 ));
    BOOST_CHECK( merged[1].derived_counts[1] == MaybeCount( 1 ));
    BOOST_CHECK( merged[1].derived_counts[2] == MaybeCount( 0 ));

    // Unknown ancestral state: genotyped, but no counts.
    BOOST_CHECK( merged[2].genotyped );
    BOOST_CHECK( merged[2].derived_allele.empty() );
    for( auto const& count : merged[2].derived_counts ) {
        BOOST_CHECK( count.is_missing() );
    }

    // Not in the genotypes at all.
    BOOST_CHECK( ! merged[3].genotyped );
    BOOST_CHECK_EQUAL( merged[3].chromosome, "chr2" );
    BOOST_CHECK( merged[3].score == MaybeDouble( 2.0 ));
    for( auto const& count : merged[3].derived_counts ) {
        BOOST_CHECK( count.is_missing() );
    }
}

BOOST_AUTO_TEST_CASE( test_DerivedAlleleMergerCounts )
{
    std::vector<ConservationRecord> const sites = {
        make_site( "chr1", 100, "A", 0.5 ),
        make_site( "chr1", 200, "A", 0.5 ),
    };
    DerivedAlleleMerger merger( sites, samples_ );
    BOOST_CHECK_EQUAL( merger.unmatched_sites(), 2 );

    BOOST_CHECK( merger.add_genotype_record(
        make_record( "chr1", 100, "A", { "G" }, { "0/1", "0/0", "1/1" })
    ));
    BOOST_CHECK( ! merger.add_genotype_record(
        make_record( "chr3", 100, "A", { "G" }, { "0/1", "0/0", "1/1" })
    ));

    // The second record at a position does not change the first one.
    BOOST_CHECK( merger.add_genotype_record(
        make_record( "chr1", 100, "A", { "G" }, { "1/1", "1/1", "1/1" })
    ));
    BOOST_CHECK_EQUAL( merger.duplicate_records(), 1 );
    BOOST_CHECK_EQUAL( merger.unused_records(), 1 );
    BOOST_CHECK_EQUAL( merger.unmatched_sites(), 1 );
    BOOST_CHECK( merger.records()[0].derived_counts[0] == MaybeCount( 1 ));

    // Wrong number of calls.
    BOOST_CHECK_THROW(
        merger.add_genotype_record( make_record( "chr1", 200, "A", { "G" }, { "0/1" })),
        MalformedInputError
    );
}

BOOST_AUTO_TEST_CASE( test_MergeDerivedAllelesFromFiles )
{
    using namespace genesis::utils;

    std::string const conservation =
        "chr1\t10\ta\t0.25\n"
        "chr1\t20\tT\tnan\n"
    ;
    std::string const vcf =
        "##fileformat=VCFv4.2\n"
        "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\n"
        "chr1\t10\t.\tA\tC\t50\tPASS\t.\tGT\t0/1\t1/1\n"
        "chr1\t20\t.\tG\tT\t50\tPASS\t.\tGT\t0/0\t./.\n"
    ;

    auto const sites = ConservationReader().read( from_string( conservation ));
    BOOST_REQUIRE_EQUAL( sites.size(), 2 );
    BOOST_CHECK_EQUAL( sites[0].ancestral_allele, "a" );

    VcfGenotypeReader reader( from_string( vcf ));
    size_t unmatched = 1;
    auto const merged = merge_derived_alleles( sites, reader, &unmatched );
    BOOST_CHECK_EQUAL( unmatched, 0 );
    BOOST_REQUIRE_EQUAL( merged.size(), 2 );
    BOOST_CHECK( merged[0].derived_counts[0] == MaybeCount( 1 ));
    BOOST_CHECK( merged[0].derived_counts[1] == MaybeCount( 2 ));
    BOOST_CHECK_EQUAL( merged[1].derived_allele, "G" );
    BOOST_CHECK( merged[1].derived_counts[0] == MaybeCount( 2 ));
    BOOST_CHECK( merged[1].derived_counts[1].is_missing() );
}

BOOST_AUTO_TEST_SUITE_END()
