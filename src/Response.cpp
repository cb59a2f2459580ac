/**
 * @file Response.cpp
 *
 * This module contains the implementation of the Retrieval::Response
 * structure and its parser.
 *
 * © 2018 by Richard Walters
 */

#include <Retrieval/Response.hpp>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/StringExtensions.hpp>

namespace {

    /**
     * This is the character sequence corresponding to a carriage return (CR)
     * followed by a line feed (LF), which officially delimits each
     * line of an HTTP response.
     */
    const std::string CRLF("\r\n");

    /**
     * This method parses the protocol identifier, status code,
     * and reason phrase from the given status line.
     *
     * @param[in] response
     *     This is the response in which to store the parsed
     *     status code and reason phrase.
     *
     * @param[in] statusLine
     *     This is the raw status line string to parse.
     *
     * @return
     *     An indication of whether or not the status line
     *     was successfully parsed is returned.
     */
    bool ParseStatusLine(
        Retrieval::Response& response,
        const std::string& statusLine
    ) {
        // Parse the protocol.
        const auto protocolDelimiter = statusLine.find(' ');
        if (protocolDelimiter == std::string::npos) {
            return false;
        }
        const auto protocol = statusLine.substr(0, protocolDelimiter);
        if (protocol != "HTTP/1.1") {
            return false;
        }

        // Parse the status code.
        auto statusCodeDelimiter = statusLine.find(' ', protocolDelimiter + 1);
        if (statusCodeDelimiter == std::string::npos) {
            statusCodeDelimiter = statusLine.length();
        }
        const auto statusCodeText = statusLine.substr(
            protocolDelimiter + 1,
            statusCodeDelimiter - protocolDelimiter - 1
        );
        if (statusCodeText.length() != 3) {
            return false;
        }
        intmax_t statusCodeAsInt;
        if (
            SystemAbstractions::ToInteger(
                statusCodeText,
                statusCodeAsInt
            ) != SystemAbstractions::ToIntegerResult::Success
        ) {
            return false;
        }
        if (
            (statusCodeAsInt < 100)
            || (statusCodeAsInt > 999)
        ) {
            return false;
        } else {
            response.statusCode = (unsigned int)statusCodeAsInt;
        }

        // Parse the reason phrase.
        if (statusCodeDelimiter < statusLine.length()) {
            response.reasonPhrase = statusLine.substr(statusCodeDelimiter + 1);
        }
        return true;
    }

}

namespace Retrieval {

    Response::HeadState ParseResponseHead(
        const std::string& rawResponse,
        Response& response,
        size_t& headEnd
    ) {
        response = Response();

        // First, extract and parse the status line.
        const auto statusLineEnd = rawResponse.find(CRLF);
        if (statusLineEnd == std::string::npos) {
            return Response::HeadState::Incomplete;
        }
        if (!ParseStatusLine(response, rawResponse.substr(0, statusLineEnd))) {
            return Response::HeadState::Error;
        }

        // Second, parse the message headers and identify where the body begins.
        const auto headersBegin = statusLineEnd + CRLF.length();
        size_t bodyOffset;
        const auto headersState = response.headers.ParseRawMessage(
            rawResponse.substr(headersBegin),
            bodyOffset
        );
        switch (headersState) {
            case MessageHeaders::MessageHeaders::State::Complete: {
                if (!response.headers.IsValid()) {
                    return Response::HeadState::Error;
                }
                headEnd = headersBegin + bodyOffset;
            } return Response::HeadState::Complete;

            case MessageHeaders::MessageHeaders::State::Incomplete: {
            } return Response::HeadState::Incomplete;

            case MessageHeaders::MessageHeaders::State::Error:
            default: {
            } return Response::HeadState::Error;
        }
    }

    void PrintTo(
        const Response::HeadState& state,
        std::ostream* os
    ) {
        switch (state) {
            case Response::HeadState::Incomplete: {
                *os << "Incomplete";
            } break;
            case Response::HeadState::Complete: {
                *os << "COMPLETE";
            } break;
            case Response::HeadState::Error: {
                *os << "ERROR";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
