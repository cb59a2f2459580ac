/**
 * @file IntegrityVerifierTests.cpp
 *
 * This module contains the unit tests of the
 * Retrieval::IntegrityVerifier class.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Retrieval/Digest.hpp>
#include <Retrieval/IntegrityVerifier.hpp>
#include <string>
#include <vector>

namespace {

    /**
     * This function builds a digest from its algorithm and
     * hexadecimal rendering.
     *
     * @param[in] algorithm
     *     This is the hash function the digest came from.
     *
     * @param[in] hex
     *     This is the hexadecimal rendering of the digest.
     *
     * @return
     *     The digest is returned.
     */
    Retrieval::Digest MakeDigest(
        Retrieval::Digest::Algorithm algorithm,
        const std::string& hex
    ) {
        Retrieval::Digest digest;
        (void)Retrieval::Digest::FromHex(algorithm, hex, digest);
        return digest;
    }

}

TEST(IntegrityVerifierTests, KnownAnswers) {
    struct TestVector {
        Retrieval::Digest::Algorithm algorithm;
        std::string hex;
    };
    const std::vector< TestVector > testVectors{
        {Retrieval::Digest::Algorithm::Sha2_256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
        {Retrieval::Digest::Algorithm::Sha2_512, "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f"},
        {Retrieval::Digest::Algorithm::Sha3_256, "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532"},
        {Retrieval::Digest::Algorithm::Sha3_512, "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0"},
    };
    for (const auto& testVector: testVectors) {
        const auto expected = MakeDigest(testVector.algorithm, testVector.hex);
        Retrieval::IntegrityVerifier verifier(expected);
        ASSERT_TRUE(verifier.IsSupported()) << testVector.hex;
        verifier.Update("a");
        verifier.Update("bc");
        EXPECT_TRUE(verifier.Finish()) << testVector.hex;
        EXPECT_EQ(expected, verifier.GetActual());
        EXPECT_EQ(3, verifier.GetByteCount());
    }
}

TEST(IntegrityVerifierTests, EmptyContent) {
    Retrieval::IntegrityVerifier verifier(
        MakeDigest(
            Retrieval::Digest::Algorithm::Sha2_256,
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
        )
    );
    EXPECT_TRUE(verifier.Finish());
    EXPECT_EQ(0, verifier.GetByteCount());
}

TEST(IntegrityVerifierTests, Mismatch) {
    const auto expected = MakeDigest(
        Retrieval::Digest::Algorithm::Sha2_256,
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"
    );
    Retrieval::IntegrityVerifier verifier(expected);
    verifier.Update("abd");
    EXPECT_FALSE(verifier.Finish());
    EXPECT_EQ(expected, verifier.GetExpected());
    EXPECT_NE(expected, verifier.GetActual());
    EXPECT_EQ(32, verifier.GetActual().bytes.size());
}

TEST(IntegrityVerifierTests, ExpectedDigestOfWrongLengthNeverMatches) {
    Retrieval::IntegrityVerifier verifier(
        MakeDigest(
            Retrieval::Digest::Algorithm::Sha2_256,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f200"
        )
    );
    ASSERT_TRUE(verifier.IsSupported());
    verifier.Update("abc");
    EXPECT_FALSE(verifier.Finish());
}

TEST(IntegrityVerifierTests, FinishIsIdempotent) {
    Retrieval::IntegrityVerifier verifier(
        MakeDigest(
            Retrieval::Digest::Algorithm::Sha2_256,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"
        )
    );
    verifier.Update("abc");
    EXPECT_TRUE(verifier.Finish());
    verifier.Update("more");
    EXPECT_TRUE(verifier.Finish());
    EXPECT_EQ(3, verifier.GetByteCount());
}

TEST(IntegrityVerifierTests, UnsupportedAlgorithm) {
    Retrieval::Digest expected;
    expected.algorithm = (Retrieval::Digest::Algorithm)0x99;
    Retrieval::IntegrityVerifier verifier(expected);
    EXPECT_FALSE(verifier.IsSupported());
    verifier.Update("abc");
    EXPECT_FALSE(verifier.Finish());
    EXPECT_TRUE(verifier.GetActual().bytes.empty());
}

TEST(IntegrityVerifierTests, Compute) {
    EXPECT_EQ(
        MakeDigest(
            Retrieval::Digest::Algorithm::Sha2_256,
            "d38b38a2dd476e045c299e8ee5d6466834456d97bd592a71746b423a6a05f386"
        ),
        Retrieval::IntegrityVerifier::Compute(
            Retrieval::Digest::Algorithm::Sha2_256,
            "Wikipedia"
        )
    );
}
