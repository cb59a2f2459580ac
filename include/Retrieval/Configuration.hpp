#ifndef RETRIEVAL_CONFIGURATION_HPP
#define RETRIEVAL_CONFIGURATION_HPP

/**
 * @file Configuration.hpp
 *
 * This module declares the Retrieval::Configuration structure.
 *
 * © 2018 by Richard Walters
 */

#include "ChunkDecoder.hpp"

#include <map>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace Retrieval {

    /**
     * This holds the settings shared by retrieval sessions.  Sessions only
     * ever read it, so a single instance may be shared by any number
     * of sessions running at the same time.
     */
    struct Configuration {
        // Properties

        /**
         * This is the largest chunk size accepted in a chunked body.
         */
        uint64_t maxChunkSize = 16 * 1024 * 1024;

        /**
         * This is the largest number of content bytes accepted,
         * unless a request sets its own limit.
         */
        uint64_t maxDecodedSize = 1024 * 1024 * 1024;

        /**
         * This is the longest chunk-size line accepted.
         */
        size_t maxSizeLineLength = 4096;

        /**
         * This is the largest chunked body trailer accepted.
         */
        size_t maxTrailerSize = 8192;

        /**
         * This is the largest response status line and header
         * accepted, in bytes.
         */
        size_t maxHeaderBytes = 65536;

        /**
         * This is the time allowed for a retrieval, in seconds,
         * unless a request sets its own limit.
         */
        double timeout = 30.0;

        /**
         * This is the time allowed between deliveries of data from
         * the server, in seconds, unless a request sets its own limit.
         * Zero means there is no such limit.
         */
        double inactivityTimeout = 0.0;

        /**
         * This is the number of milliseconds between checks made
         * by a session for timeout and cancellation.
         */
        unsigned int pollingPeriod = 50;

        /**
         * This flag indicates whether or not servers are invited to
         * apply the "gzip" or "deflate" content codings.
         */
        bool acceptContentCodings = false;

        /**
         * This is the value of the "User-Agent" header sent to servers.
         */
        std::string userAgent = "Retrieval/1.0";

        /**
         * This is the number of bytes to ask for in each read
         * from the network.
         */
        size_t receiveBufferSize = 65536;

        // Methods

        /**
         * This method sets the configuration item with the given key
         * from its text form.
         *
         * @param[in] key
         *     This is the name of the configuration item to set.
         *
         * @param[in] value
         *     This is the text form of the new value of the item.
         *
         * @return
         *     An indication of whether or not the key is known and
         *     the value could be parsed is returned.
         */
        bool Set(
            const std::string& key,
            const std::string& value
        );

        /**
         * This method returns the text form of every configuration item.
         *
         * @return
         *     The text form of every configuration item,
         *     keyed by item name, is returned.
         */
        std::map< std::string, std::string > GetItems() const;

        /**
         * This method returns the chunked body size limits to use
         * for a retrieval.
         *
         * @param[in] requestMaxDecodedSize
         *     This is the limit on content bytes set by the request,
         *     or zero to use the configured limit.
         *
         * @return
         *     The chunked body size limits to use are returned.
         */
        ChunkDecoder::Limits GetDecoderLimits(uint64_t requestMaxDecodedSize = 0) const;
    };

}

#endif /* RETRIEVAL_CONFIGURATION_HPP */
