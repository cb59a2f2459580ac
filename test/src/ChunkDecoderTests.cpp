/**
 * @file ChunkDecoderTests.cpp
 *
 * This module contains the unit tests of the
 * Retrieval::ChunkDecoder class.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <Retrieval/ChunkDecoder.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/StringExtensions.hpp>
#include <vector>

namespace {

    /**
     * This is the number of random chunked bodies generated
     * by the tests which use them.
     */
    constexpr size_t NUM_GENERATED_BODIES = 500;

    /**
     * This function builds a random, well-formed chunked body.
     *
     * @param[in,out] generator
     *     This is the source of randomness to use.
     *
     * @param[out] content
     *     This is where to store the concatenated chunk data.
     *
     * @return
     *     The chunked body is returned.
     */
    std::string MakeChunkedBody(
        std::mt19937& generator,
        std::string& content
    ) {
        std::uniform_int_distribution< int > byteDistribution(0, 255);
        std::uniform_int_distribution< size_t > numChunksDistribution(0, 5);
        std::uniform_int_distribution< size_t > chunkSizeDistribution(1, 64);
        std::uniform_int_distribution< int > coinDistribution(0, 1);
        content.clear();
        std::string body;
        const auto numChunks = numChunksDistribution(generator);
        for (size_t i = 0; i < numChunks; ++i) {
            const auto chunkSize = chunkSizeDistribution(generator);
            std::string chunk;
            for (size_t j = 0; j < chunkSize; ++j) {
                chunk.push_back((char)byteDistribution(generator));
            }
            if (coinDistribution(generator) == 0) {
                body += SystemAbstractions::sprintf("%zx", chunkSize);
            } else {
                body += SystemAbstractions::sprintf("%03zX", chunkSize);
            }
            if (coinDistribution(generator) == 0) {
                body += SystemAbstractions::sprintf(";n%zu=v%zu", i, chunkSize);
            }
            if (coinDistribution(generator) == 0) {
                body += ";q=\"a b\"";
            }
            body += "\r\n" + chunk + "\r\n";
            content += chunk;
        }
        body += "0";
        if (coinDistribution(generator) == 0) {
            body += ";last";
        }
        body += "\r\n";
        if (coinDistribution(generator) == 0) {
            body += "X-Checksum: none\r\nX-Note: generated\r\n";
        }
        body += "\r\n";
        return body;
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct ChunkDecoderTests
    : public ::testing::Test
{
    // Properties

    /**
     * This is the unit under test.
     */
    Retrieval::ChunkDecoder decoder;

    /**
     * This is where the unit under test puts decoded payload.
     */
    std::string payload;

    // Methods

    // ::testing::Test

    virtual void SetUp() override {
    }

    virtual void TearDown() override {
    }
};

TEST_F(ChunkDecoderTests, DecodeSimpleEmptyBodyOnePiece) {
    ASSERT_EQ(5, decoder.Decode("0\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("", payload);
    ASSERT_EQ(0, decoder.GetDecodedSize());
}

TEST_F(ChunkDecoderTests, DecodeEmptyBodyMultipleZeroes) {
    ASSERT_EQ(9, decoder.Decode("00000\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("", payload);
}

TEST_F(ChunkDecoderTests, DecodeEmptyBodyWithChunkExtensionNoValue) {
    ASSERT_EQ(12, decoder.Decode("000;dude\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ(";dude", decoder.GetLastFrame().extensions);
}

TEST_F(ChunkDecoderTests, DecodeEmptyBodyWithChunkExtensionWithUnquotedValue) {
    ASSERT_EQ(22, decoder.Decode("000;Kappa=PogChamp\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ(";Kappa=PogChamp", decoder.GetLastFrame().extensions);
}

TEST_F(ChunkDecoderTests, DecodeEmptyBodyWithChunkExtensionWithQuotedValue) {
    ASSERT_EQ(29, decoder.Decode("000;Kappa=\"Hello, World!\"\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ(";Kappa=\"Hello, World!\"", decoder.GetLastFrame().extensions);
}

TEST_F(ChunkDecoderTests, DecodeEmptyBodyWithMultipleChunkExtensions) {
    ASSERT_EQ(49, decoder.Decode("000;Foo=Bar;Kappa=\"Hello, World!\";Spam=12345!\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("", payload);
}

TEST_F(ChunkDecoderTests, DecodeQuotedExtensionValueWithQuotedPair) {
    ASSERT_EQ(17, decoder.Decode("3;x=\"a\\\"b\"\r\nabc\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingSizeLine, decoder.GetState());
    ASSERT_EQ("abc", payload);
    ASSERT_EQ(3, decoder.GetLastFrame().size);
}

TEST_F(ChunkDecoderTests, DecodeSimpleEmptyBodyOneCharacterAtATime) {
    const std::string input = "0\r\n\r\n";
    size_t accepted = 0;
    for (size_t i = 0; i < input.length(); ++i) {
        accepted += decoder.Decode(input, payload, accepted, i + 1 - accepted);
        ASSERT_EQ(i + 1, accepted);
        if (i < 2) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingSizeLine, decoder.GetState()) << i;
        } else if (i < 4) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingTrailerHeaders, decoder.GetState()) << i;
        } else {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState()) << i;
        }
    }
    ASSERT_EQ("", payload);
}

TEST_F(ChunkDecoderTests, DecodeSimpleEmptyBodyOnePieceWithExtraStuffAfter) {
    ASSERT_EQ(5, decoder.Decode("0\r\n\r\nHello!", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("", payload);
    ASSERT_EQ(0, decoder.Decode("Hello!", payload));
    ASSERT_EQ(5, decoder.GetStreamOffset());
}

TEST_F(ChunkDecoderTests, DecodeSimpleEmptyBodyTwoPiecesSubstring) {
    ASSERT_EQ(3, decoder.Decode("XYZ0\r\n\r\n123", payload, 3, 3));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingTrailerHeaders, decoder.GetState());
    ASSERT_EQ(2, decoder.Decode("XYZ0\r\n\r\n123", payload, 6, 3));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("", payload);
}

TEST_F(ChunkDecoderTests, DecodeSimpleNonEmptyBodyOnePiece) {
    ASSERT_EQ(15, decoder.Decode("5\r\nHello\r\n0\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("Hello", payload);
    ASSERT_EQ(5, decoder.GetDecodedSize());
}

TEST_F(ChunkDecoderTests, DecodeSimpleNonEmptyBodyOneCharacterAtATime) {
    const std::string input = "5\r\nHello\r\n0\r\n\r\n";
    for (size_t i = 0; i < input.length(); ++i) {
        ASSERT_EQ(1, decoder.Decode(input, payload, i, 1)) << i;
        if (i < 2) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingSizeLine, decoder.GetState()) << i;
        } else if (i < 7) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingChunkData, decoder.GetState()) << i;
        } else if (i < 9) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingChunkTerminator, decoder.GetState()) << i;
        } else if (i < 12) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingSizeLine, decoder.GetState()) << i;
        } else if (i < 14) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingTrailerHeaders, decoder.GetState()) << i;
        } else {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState()) << i;
        }
    }
    ASSERT_EQ("Hello", payload);
}

TEST_F(ChunkDecoderTests, DecodeTwoChunkBodyOnePiece) {
    ASSERT_EQ(28, decoder.Decode("6\r\nHello,\r\n7\r\n World!\r\n0\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ("Hello, World!", payload);
}

TEST_F(ChunkDecoderTests, DecodeWikipediaExampleEveryReadSize) {
    const std::string input = "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n";
    for (size_t readSize = 1; readSize <= input.length(); ++readSize) {
        Retrieval::ChunkDecoder eachDecoder;
        std::string eachPayload;
        for (size_t offset = 0; offset < input.length(); offset += readSize) {
            (void)eachDecoder.Decode(input, eachPayload, offset, readSize);
        }
        eachDecoder.Finish();
        EXPECT_EQ(Retrieval::ChunkDecoder::State::Done, eachDecoder.GetState()) << readSize;
        EXPECT_EQ("Wikipedia", eachPayload) << readSize;
        EXPECT_EQ(9, eachDecoder.GetDecodedSize()) << readSize;
        EXPECT_EQ(input.length(), eachDecoder.GetStreamOffset()) << readSize;
    }
}

TEST_F(ChunkDecoderTests, DecodeTrailersOnePiece) {
    EXPECT_EQ(41, decoder.Decode("0\r\nX-Foo: Bar\r\nX-Poggers: FeelsBadMan\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    EXPECT_EQ("", payload);
}

TEST_F(ChunkDecoderTests, DecodeTrailersOneCharacterAtATime) {
    const std::string input = "0\r\nX-Foo: Bar\r\nX-Poggers: FeelsBadMan\r\n\r\n";
    for (size_t i = 0; i < input.length(); ++i) {
        ASSERT_EQ(1, decoder.Decode(input, payload, i, 1)) << i;
        if (i < 2) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingSizeLine, decoder.GetState()) << i;
        } else if (i < 40) {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingTrailerHeaders, decoder.GetState()) << i;
        } else {
            ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState()) << i;
        }
    }
}

TEST_F(ChunkDecoderTests, TrailerFieldsAreNotInterpreted) {
    ASSERT_EQ(16, decoder.Decode("0\r\nX-Foo Bar\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineFirstCharacterNotHexdig) {
    ASSERT_EQ(1, decoder.Decode("g\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, decoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(0, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineNotHexdigInChunkSize) {
    ASSERT_EQ(2, decoder.Decode("0g\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, decoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(1, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineChunkSizeOverflow) {
    ASSERT_EQ(7, decoder.Decode("111111111111111111111111111111111111111111111111111111111111111\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, decoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::SizeExceeded, decoder.GetError());
    ASSERT_EQ(6, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, ChunkSizeAtLimitAccepted) {
    Retrieval::ChunkDecoder::Limits limits;
    limits.maxChunkSize = 16;
    Retrieval::ChunkDecoder limitedDecoder(limits);
    const std::string input = "10\r\n0123456789ABCDEF\r\n0\r\n\r\n";
    ASSERT_EQ(input.length(), limitedDecoder.Decode(input, payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, limitedDecoder.GetState());
    ASSERT_EQ("0123456789ABCDEF", payload);
}

TEST_F(ChunkDecoderTests, ChunkSizeOverLimitRejected) {
    Retrieval::ChunkDecoder::Limits limits;
    limits.maxChunkSize = 16;
    Retrieval::ChunkDecoder limitedDecoder(limits);
    ASSERT_EQ(2, limitedDecoder.Decode("11\r\n0123456789ABCDEFG\r\n0\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, limitedDecoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::SizeExceeded, limitedDecoder.GetError());
    ASSERT_EQ(1, limitedDecoder.GetErrorOffset());
    ASSERT_EQ("", payload);
}

TEST_F(ChunkDecoderTests, CumulativeDecodedSizeOverLimitRejected) {
    Retrieval::ChunkDecoder::Limits limits;
    limits.maxDecodedSize = 8;
    Retrieval::ChunkDecoder limitedDecoder(limits);
    ASSERT_EQ(
        12,
        limitedDecoder.Decode("4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n", payload)
    );
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, limitedDecoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::SizeExceeded, limitedDecoder.GetError());
    ASSERT_EQ(11, limitedDecoder.GetErrorOffset());
    ASSERT_EQ("Wiki", payload);
}

TEST_F(ChunkDecoderTests, SizeLineTooLongRejected) {
    Retrieval::ChunkDecoder::Limits limits;
    limits.maxSizeLineLength = 8;
    Retrieval::ChunkDecoder limitedDecoder(limits);
    ASSERT_EQ(9, limitedDecoder.Decode("0;abcdefgh\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, limitedDecoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::SizeExceeded, limitedDecoder.GetError());
    ASSERT_EQ(8, limitedDecoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, TrailerTooLargeRejected) {
    Retrieval::ChunkDecoder::Limits limits;
    limits.maxTrailerSize = 4;
    Retrieval::ChunkDecoder limitedDecoder(limits);
    ASSERT_EQ(8, limitedDecoder.Decode("0\r\nX-Foo: Bar\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, limitedDecoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::SizeExceeded, limitedDecoder.GetError());
    ASSERT_EQ(7, limitedDecoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineChunkExtensionNameFirstCharacterNotTchar) {
    const std::vector< std::string > inputs{
        "0;@\r\n\r\n",
        "0;;\r\n\r\n",
        "0;=\r\n\r\n",
    };
    for (const auto& input: inputs) {
        Retrieval::ChunkDecoder eachDecoder;
        ASSERT_EQ(3, eachDecoder.Decode(input, payload)) << input;
        ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, eachDecoder.GetState()) << input;
        ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, eachDecoder.GetError()) << input;
        ASSERT_EQ(2, eachDecoder.GetErrorOffset()) << input;
    }
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineChunkExtensionNameNotFirstCharacterNotTcharOrSemicolonOrEqual) {
    ASSERT_EQ(4, decoder.Decode("0;x@\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(3, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineChunkExtensionValueFirstCharacterNotQuoteOrTchar) {
    ASSERT_EQ(5, decoder.Decode("0;x=@\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(4, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineChunkExtensionValueQuotedStringIllegalCharacter) {
    ASSERT_EQ(6, decoder.Decode("0;x=\"\b\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(5, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineChunkExtensionValueQuotedStringBadQuotedCharacter) {
    ASSERT_EQ(7, decoder.Decode("0;x=\"\\\b\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(6, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineCharacterFollowingQuotedStringExtensionValueNotSemicolon) {
    ASSERT_EQ(8, decoder.Decode("0;x=\"y\"z\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(7, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineEndsExpectingExtensionName) {
    ASSERT_EQ(3, decoder.Decode("0;\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(2, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineEndsExpectingExtensionValue) {
    ASSERT_EQ(5, decoder.Decode("0;x=\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(4, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineBareLineFeed) {
    ASSERT_EQ(2, decoder.Decode("4\nWiki\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(1, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadChunkSizeLineCarriageReturnNotFollowedByLineFeed) {
    ASSERT_EQ(3, decoder.Decode("4\rWiki\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(2, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, DecodeBadJunkAfterChunk) {
    ASSERT_EQ(5, decoder.Decode("1\r\nXjunk\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, decoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(4, decoder.GetErrorOffset());
    ASSERT_EQ("X", payload);
}

TEST_F(ChunkDecoderTests, DecodeBadTrailerBareLineFeed) {
    ASSERT_EQ(9, decoder.Decode("0\r\nX-Foo\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Malformed, decoder.GetError());
    ASSERT_EQ(8, decoder.GetErrorOffset());
}

TEST_F(ChunkDecoderTests, NoInputAcceptedAfterFailure) {
    (void)decoder.Decode("g\r\n", payload);
    ASSERT_EQ(0, decoder.Decode("0\r\n\r\n", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, decoder.GetState());
}

TEST_F(ChunkDecoderTests, FinishInMiddleOfChunkDataIsTruncation) {
    ASSERT_EQ(16, decoder.Decode("4\r\nWiki\r\n5\r\npedi", payload));
    ASSERT_EQ(Retrieval::ChunkDecoder::State::AwaitingChunkData, decoder.GetState());
    decoder.Finish();
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, decoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::Truncated, decoder.GetError());
    ASSERT_EQ(16, decoder.GetErrorOffset());
    ASSERT_EQ("Wikipedi", payload);
}

TEST_F(ChunkDecoderTests, FinishAnywhereBeforeDoneIsTruncation) {
    const std::string input = "4;a=b\r\nWiki\r\n0\r\nX: y\r\n\r\n";
    for (size_t length = 0; length < input.length(); ++length) {
        Retrieval::ChunkDecoder eachDecoder;
        std::string eachPayload;
        (void)eachDecoder.Decode(input.substr(0, length), eachPayload);
        eachDecoder.Finish();
        EXPECT_EQ(Retrieval::ChunkDecoder::State::Failed, eachDecoder.GetState()) << length;
        EXPECT_EQ(Retrieval::ChunkDecoder::Error::Truncated, eachDecoder.GetError()) << length;
        EXPECT_EQ(length, eachDecoder.GetErrorOffset()) << length;
    }
}

TEST_F(ChunkDecoderTests, FinishAfterDoneHasNoEffect) {
    (void)decoder.Decode("0\r\n\r\n", payload);
    decoder.Finish();
    ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, decoder.GetState());
    ASSERT_EQ(Retrieval::ChunkDecoder::Error::None, decoder.GetError());
}

TEST_F(ChunkDecoderTests, GeneratedBodiesDecodeForAnyReadSizes) {
    std::mt19937 generator(1);
    std::uniform_int_distribution< size_t > readSizeDistribution(1, 7);
    for (size_t i = 0; i < NUM_GENERATED_BODIES; ++i) {
        std::string content;
        const auto body = MakeChunkedBody(generator, content);
        Retrieval::ChunkDecoder eachDecoder;
        std::string eachPayload;
        size_t offset = 0;
        while (offset < body.length()) {
            const auto readSize = std::min(
                readSizeDistribution(generator),
                body.length() - offset
            );
            ASSERT_EQ(readSize, eachDecoder.Decode(body, eachPayload, offset, readSize)) << i;
            offset += readSize;
        }
        eachDecoder.Finish();
        ASSERT_EQ(Retrieval::ChunkDecoder::State::Done, eachDecoder.GetState()) << i;
        EXPECT_EQ(content, eachPayload) << i;
        EXPECT_EQ(content.length(), eachDecoder.GetDecodedSize()) << i;
        EXPECT_EQ(body.length(), eachDecoder.GetStreamOffset()) << i;
    }
}

TEST_F(ChunkDecoderTests, GeneratedBodiesCutShortAreTruncated) {
    std::mt19937 generator(2);
    for (size_t i = 0; i < NUM_GENERATED_BODIES; ++i) {
        std::string content;
        const auto body = MakeChunkedBody(generator, content);
        for (size_t length = 0; length < body.length(); ++length) {
            Retrieval::ChunkDecoder eachDecoder;
            std::string eachPayload;
            (void)eachDecoder.Decode(body.substr(0, length), eachPayload);
            eachDecoder.Finish();
            ASSERT_EQ(Retrieval::ChunkDecoder::State::Failed, eachDecoder.GetState()) << i << ", " << length;
            ASSERT_EQ(Retrieval::ChunkDecoder::Error::Truncated, eachDecoder.GetError()) << i << ", " << length;
            EXPECT_EQ(length, eachDecoder.GetErrorOffset()) << i << ", " << length;
            EXPECT_EQ(0, content.compare(0, eachPayload.length(), eachPayload)) << i << ", " << length;
        }
    }
}
