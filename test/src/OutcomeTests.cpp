/**
 * @file OutcomeTests.cpp
 *
 * This module contains the unit tests of the
 * Retrieval::Outcome structure.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Retrieval/Outcome.hpp>

TEST(OutcomeTests, DescribeVerified) {
    Retrieval::Digest digest;
    ASSERT_TRUE(Retrieval::Digest::FromHex(Retrieval::Digest::Algorithm::Sha2_256, "0102", digest));
    const auto outcome = Retrieval::Outcome::Verified(9, digest);
    EXPECT_EQ(Retrieval::Outcome::Kind::Verified, outcome.kind);
    EXPECT_EQ(digest, outcome.expected);
    EXPECT_EQ(digest, outcome.actual);
    EXPECT_EQ("Verified (9 bytes)", outcome.Describe());
}

TEST(OutcomeTests, DescribeMismatch) {
    Retrieval::Digest expected, actual;
    ASSERT_TRUE(Retrieval::Digest::FromHex(Retrieval::Digest::Algorithm::Sha2_256, "0102", expected));
    ASSERT_TRUE(Retrieval::Digest::FromHex(Retrieval::Digest::Algorithm::Sha2_256, "0304", actual));
    EXPECT_EQ(
        "MISMATCH (5 bytes, expected 0102, actual 0304)",
        Retrieval::Outcome::Mismatch(5, expected, actual).Describe()
    );
}

TEST(OutcomeTests, DescribeProtocolError) {
    EXPECT_EQ(
        "PROTOCOL ERROR (truncated at offset 16)",
        Retrieval::Outcome::ProtocolError(
            Retrieval::Outcome::ProtocolErrorKind::Truncated,
            16
        ).Describe()
    );
    EXPECT_EQ(
        "PROTOCOL ERROR (unsupported encoding at offset 0): content coding \"br\" not supported",
        Retrieval::Outcome::ProtocolError(
            Retrieval::Outcome::ProtocolErrorKind::UnsupportedEncoding,
            0,
            "content coding \"br\" not supported"
        ).Describe()
    );
}

TEST(OutcomeTests, DescribeConnectionError) {
    EXPECT_EQ(
        "CONNECTION ERROR (HTTP status 404): Not Found",
        Retrieval::Outcome::ConnectionError(
            Retrieval::Outcome::ConnectionErrorKind::HttpStatus,
            "Not Found",
            404
        ).Describe()
    );
    EXPECT_EQ(
        "CONNECTION ERROR (disconnected)",
        Retrieval::Outcome::ConnectionError(
            Retrieval::Outcome::ConnectionErrorKind::Disconnected
        ).Describe()
    );
}

TEST(OutcomeTests, DescribeOtherKinds) {
    EXPECT_EQ("TIMED OUT", Retrieval::Outcome::TimedOut().Describe());
    EXPECT_EQ("CANCELLED", Retrieval::Outcome::Cancelled().Describe());
    EXPECT_EQ(
        "INVALID REQUEST: URL has no host",
        Retrieval::Outcome::InvalidRequest("URL has no host").Describe()
    );
}
