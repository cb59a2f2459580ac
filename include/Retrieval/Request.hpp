#ifndef RETRIEVAL_REQUEST_HPP
#define RETRIEVAL_REQUEST_HPP

/**
 * @file Request.hpp
 *
 * This module declares the Retrieval::Request structure.
 *
 * © 2018 by Richard Walters
 */

#include "Digest.hpp"

#include <stdint.h>
#include <string>

namespace Retrieval {

    /**
     * This describes a single piece of content to retrieve and verify.
     */
    struct Request {
        /**
         * This is the URL of the content, which must use
         * the "http" scheme.
         */
        std::string url;

        /**
         * This is the digest the content is expected to have.
         */
        Digest expected;

        /**
         * This flag indicates whether or not the number of content bytes
         * is known in advance.
         */
        bool hasLengthHint = false;

        /**
         * If hasLengthHint is set, this is the number of content bytes
         * expected.  It is advisory only.
         */
        uint64_t lengthHint = 0;

        /**
         * This is the time allowed for the retrieval, in seconds.
         * If zero, the configured default is used.
         */
        double timeoutSeconds = 0.0;

        /**
         * This is the time allowed between deliveries of data from
         * the server, in seconds.  If zero, the configured
         * default is used.
         */
        double inactivityTimeoutSeconds = 0.0;

        /**
         * This is the largest number of content bytes accepted.
         * If zero, the configured default is used.
         */
        uint64_t maxDecodedSize = 0;
    };

}

#endif /* RETRIEVAL_REQUEST_HPP */
