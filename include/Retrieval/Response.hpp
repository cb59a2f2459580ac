#ifndef RETRIEVAL_RESPONSE_HPP
#define RETRIEVAL_RESPONSE_HPP

/**
 * @file Response.hpp
 *
 * This module declares the Retrieval::Response structure
 * and the function which parses it.
 *
 * © 2018 by Richard Walters
 */

#include <MessageHeaders/MessageHeaders.hpp>
#include <ostream>
#include <stddef.h>
#include <string>

namespace Retrieval {

    /**
     * This represents the status line and header of an HTTP response
     * received from a server, decomposed into its various elements.
     */
    struct Response {
        // Types

        /**
         * These are the possible results of parsing a response head.
         */
        enum class HeadState {
            /**
             * More characters are needed before the status line
             * and header are complete.
             */
            Incomplete,

            /**
             * The status line and header were completely parsed.
             */
            Complete,

            /**
             * The status line or header is not valid.
             */
            Error,
        };

        // Properties

        /**
         * This is a machine-readable number that describes
         * the overall status of the request.
         */
        unsigned int statusCode = 0;

        /**
         * This is the human-readable text that describes
         * the overall status of the request.
         */
        std::string reasonPhrase;

        /**
         * These are the headers of the response.
         */
        MessageHeaders::MessageHeaders headers;
    };

    /**
     * This function parses the status line and header of an HTTP response
     * from the beginning of the characters received from the server.
     * It may be called again with more characters appended, as long
     * as it returns Response::HeadState::Incomplete.
     *
     * @param[in] rawResponse
     *     These are the characters received from the server so far.
     *
     * @param[out] response
     *     This is where to store the parsed status line and header.
     *
     * @param[out] headEnd
     *     If the head is complete, this is where to store the number of
     *     characters it occupies.  The body begins right after them.
     *
     * @return
     *     The result of parsing the head is returned.
     */
    Response::HeadState ParseResponseHead(
        const std::string& rawResponse,
        Response& response,
        size_t& headEnd
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Response::HeadState class.
     *
     * @param[in] state
     *     This is the response head state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     response head state value.
     */
    void PrintTo(
        const Response::HeadState& state,
        std::ostream* os
    );

}

#endif /* RETRIEVAL_RESPONSE_HPP */
