/**
 * @file ResponseTests.cpp
 *
 * This module contains the unit tests of the
 * Retrieval::Response structure.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <Retrieval/Response.hpp>
#include <string>
#include <vector>

TEST(ResponseTests, ParseCompleteHeadWithBodyFollowing) {
    const std::string rawResponse = (
        "HTTP/1.1 200 OK\r\n"
        "Date: Mon, 27 Jul 2009 12:28:53 GMT\r\n"
        "Transfer-Encoding: chunked\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "4\r\nWiki\r\n"
    );
    Retrieval::Response response;
    size_t headEnd = 0;
    ASSERT_EQ(
        Retrieval::Response::HeadState::Complete,
        Retrieval::ParseResponseHead(rawResponse, response, headEnd)
    );
    EXPECT_EQ(200, response.statusCode);
    EXPECT_EQ("OK", response.reasonPhrase);
    EXPECT_EQ("chunked", response.headers.GetHeaderValue("Transfer-Encoding"));
    EXPECT_EQ("text/plain", response.headers.GetHeaderValue("Content-Type"));
    EXPECT_EQ("4\r\nWiki\r\n", rawResponse.substr(headEnd));
}

TEST(ResponseTests, ParseReasonPhraseWithSpaces) {
    Retrieval::Response response;
    size_t headEnd = 0;
    ASSERT_EQ(
        Retrieval::Response::HeadState::Complete,
        Retrieval::ParseResponseHead(
            "HTTP/1.1 404 Not Found\r\n\r\n",
            response,
            headEnd
        )
    );
    EXPECT_EQ(404, response.statusCode);
    EXPECT_EQ("Not Found", response.reasonPhrase);
    EXPECT_EQ(26, headEnd);
}

TEST(ResponseTests, ParseWithoutReasonPhrase) {
    Retrieval::Response response;
    size_t headEnd = 0;
    ASSERT_EQ(
        Retrieval::Response::HeadState::Complete,
        Retrieval::ParseResponseHead(
            "HTTP/1.1 204\r\n\r\n",
            response,
            headEnd
        )
    );
    EXPECT_EQ(204, response.statusCode);
    EXPECT_EQ("", response.reasonPhrase);
}

TEST(ResponseTests, ParseIncompleteHead) {
    const std::string rawResponse = (
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
    );
    for (size_t length = 0; length <= rawResponse.length(); ++length) {
        Retrieval::Response response;
        size_t headEnd = 0;
        EXPECT_EQ(
            Retrieval::Response::HeadState::Incomplete,
            Retrieval::ParseResponseHead(rawResponse.substr(0, length), response, headEnd)
        ) << length;
    }
}

TEST(ResponseTests, ParseBadStatusLines) {
    const std::vector< std::string > rawResponses{
        "HTTP/1.0 200 OK\r\n\r\n",
        "HTTP/1.1 20 OK\r\n\r\n",
        "HTTP/1.1 2000 OK\r\n\r\n",
        "HTTP/1.1 099 Too Low\r\n\r\n",
        "HTTP/1.1 abc OK\r\n\r\n",
        "HTTP/1.1\r\n\r\n",
        "Garbage\r\n\r\n",
    };
    for (const auto& rawResponse: rawResponses) {
        Retrieval::Response response;
        size_t headEnd = 0;
        EXPECT_EQ(
            Retrieval::Response::HeadState::Error,
            Retrieval::ParseResponseHead(rawResponse, response, headEnd)
        ) << rawResponse;
    }
}

TEST(ResponseTests, ParseBadHeaderLine) {
    Retrieval::Response response;
    size_t headEnd = 0;
    EXPECT_EQ(
        Retrieval::Response::HeadState::Error,
        Retrieval::ParseResponseHead(
            "HTTP/1.1 200 OK\r\n"
            "Transfer-Encoding chunked\r\n"
            "\r\n",
            response,
            headEnd
        )
    );
}
