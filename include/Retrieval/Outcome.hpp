#ifndef RETRIEVAL_OUTCOME_HPP
#define RETRIEVAL_OUTCOME_HPP

/**
 * @file Outcome.hpp
 *
 * This module declares the Retrieval::Outcome structure.
 *
 * © 2018 by Richard Walters
 */

#include "Digest.hpp"

#include <ostream>
#include <stdint.h>
#include <string>

namespace Retrieval {

    /**
     * This represents the single terminal result of retrieving
     * and verifying content.
     */
    struct Outcome {
        // Types

        /**
         * These are the different kinds of outcome.
         */
        enum class Kind {
            /**
             * The content was retrieved completely and its digest
             * is exactly the expected digest.
             */
            Verified,

            /**
             * The content was retrieved completely, but its digest
             * differs from the expected digest.
             */
            Mismatch,

            /**
             * The server violated the protocol, or the content could
             * not be decoded within the limits given.
             */
            ProtocolError,

            /**
             * The connection to the server could not be made or used.
             */
            ConnectionError,

            /**
             * The retrieval took longer than the time allowed.
             */
            TimedOut,

            /**
             * The retrieval was cancelled by its owner.
             */
            Cancelled,

            /**
             * The retrieval could not be attempted, because the request
             * itself could not be carried out.
             */
            InvalidRequest,
        };

        /**
         * These are the different kinds of protocol error.
         */
        enum class ProtocolErrorKind {
            /**
             * The body violates the chunked transfer coding.
             */
            Malformed,

            /**
             * The body ended before it was complete.
             */
            Truncated,

            /**
             * A size limit was exceeded.
             */
            SizeExceeded,

            /**
             * The response uses a transfer coding or content coding
             * which isn't supported.
             */
            UnsupportedEncoding,

            /**
             * The content coding applied to the content is invalid.
             */
            BadContentCoding,
        };

        /**
         * These are the different kinds of connection error.
         */
        enum class ConnectionErrorKind {
            /**
             * No connection to the server could be established.
             */
            UnableToConnect,

            /**
             * The connection was broken before the response
             * header was complete.
             */
            Disconnected,

            /**
             * The response status line or header could not be parsed.
             */
            BadResponse,

            /**
             * The server responded with a status other than 200.
             */
            HttpStatus,
        };

        // Properties

        /**
         * This indicates what kind of outcome this is.
         */
        Kind kind = Kind::Cancelled;

        /**
         * If the kind is Kind::ProtocolError, this
         * indicates what kind of protocol error it is.
         */
        ProtocolErrorKind protocolError = ProtocolErrorKind::Malformed;

        /**
         * If the kind is Kind::ConnectionError, this
         * indicates what kind of connection error it is.
         */
        ConnectionErrorKind connectionError = ConnectionErrorKind::UnableToConnect;

        /**
         * This is the number of content bytes verified.
         */
        uint64_t byteCount = 0;

        /**
         * If the kind is Kind::ProtocolError, this is the position
         * in the encoded body at which the error was detected.
         */
        uint64_t offset = 0;

        /**
         * This is the digest the content was expected to have.
         */
        Digest expected;

        /**
         * If the kind is Kind::Verified or Kind::Mismatch, this is the
         * digest computed from the content.
         */
        Digest actual;

        /**
         * If the connection error kind is ConnectionErrorKind::HttpStatus,
         * this is the status code the server responded with.
         */
        unsigned int statusCode = 0;

        /**
         * This is a human-readable explanation of the outcome.
         */
        std::string reason;

        // Methods

        /**
         * This function constructs an outcome of kind Kind::Verified.
         *
         * @param[in] byteCount
         *     This is the number of content bytes verified.
         *
         * @param[in] digest
         *     This is the digest of the content.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome Verified(
            uint64_t byteCount,
            const Digest& digest
        );

        /**
         * This function constructs an outcome of kind Kind::Mismatch.
         *
         * @param[in] byteCount
         *     This is the number of content bytes hashed.
         *
         * @param[in] expected
         *     This is the digest the content was expected to have.
         *
         * @param[in] actual
         *     This is the digest computed from the content.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome Mismatch(
            uint64_t byteCount,
            const Digest& expected,
            const Digest& actual
        );

        /**
         * This function constructs an outcome of kind Kind::ProtocolError.
         *
         * @param[in] protocolError
         *     This is the kind of protocol error.
         *
         * @param[in] offset
         *     This is the position in the encoded body at which
         *     the error was detected.
         *
         * @param[in] reason
         *     This is a human-readable explanation of the error.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome ProtocolError(
            ProtocolErrorKind protocolError,
            uint64_t offset,
            const std::string& reason = ""
        );

        /**
         * This function constructs an outcome of kind Kind::ConnectionError.
         *
         * @param[in] connectionError
         *     This is the kind of connection error.
         *
         * @param[in] reason
         *     This is a human-readable explanation of the error.
         *
         * @param[in] statusCode
         *     For ConnectionErrorKind::HttpStatus, this is the status code
         *     the server responded with.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome ConnectionError(
            ConnectionErrorKind connectionError,
            const std::string& reason = "",
            unsigned int statusCode = 0
        );

        /**
         * This function constructs an outcome of kind Kind::TimedOut.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome TimedOut();

        /**
         * This function constructs an outcome of kind Kind::Cancelled.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome Cancelled();

        /**
         * This function constructs an outcome of kind Kind::InvalidRequest.
         *
         * @param[in] reason
         *     This is a human-readable explanation of why the request
         *     could not be carried out.
         *
         * @return
         *     The outcome is returned.
         */
        static Outcome InvalidRequest(const std::string& reason);

        /**
         * This method renders the outcome as a one-line summary.
         *
         * @return
         *     A one-line summary of the outcome is returned.
         */
        std::string Describe() const;
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Outcome::Kind class.
     *
     * @param[in] kind
     *     This is the outcome kind value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     outcome kind value.
     */
    void PrintTo(
        const Outcome::Kind& kind,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Outcome::ProtocolErrorKind class.
     *
     * @param[in] kind
     *     This is the protocol error kind value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     protocol error kind value.
     */
    void PrintTo(
        const Outcome::ProtocolErrorKind& kind,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Outcome::ConnectionErrorKind class.
     *
     * @param[in] kind
     *     This is the connection error kind value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     connection error kind value.
     */
    void PrintTo(
        const Outcome::ConnectionErrorKind& kind,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Outcome structure.
     *
     * @param[in] outcome
     *     This is the outcome value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the outcome value.
     */
    void PrintTo(
        const Outcome& outcome,
        std::ostream* os
    );

}

#endif /* RETRIEVAL_OUTCOME_HPP */
