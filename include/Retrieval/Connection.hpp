#ifndef RETRIEVAL_CONNECTION_HPP
#define RETRIEVAL_CONNECTION_HPP

/**
 * @file Connection.hpp
 *
 * This module declares the Retrieval::Connection interface.
 *
 * © 2018 by Richard Walters
 */

#include <functional>
#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

namespace Retrieval {

    /**
     * This represents a single connection between a retrieval session
     * and the server holding the content, on a transport layer.
     */
    class Connection {
    public:
        // Types

        /**
         * This is the type of delegate used to deliver received data
         * to the user of this interface.
         *
         * @param[in] data
         *     This is the data that was received from the remote peer.
         */
        typedef std::function< void(const std::vector< uint8_t >& data) > DataReceivedDelegate;

        /**
         * This is the type of delegate used to notify the user that
         * the connection has been broken.
         *
         * @param[in] graceful
         *     This indicates whether or not the peer of connection
         *     has closed the connection gracefully.
         */
        typedef std::function< void(bool graceful) > BrokenDelegate;

        // Methods

        virtual ~Connection() = default;

        /**
         * This method returns a string that uniquely identifies
         * the peer of this connection in the context of the transport.
         *
         * @return
         *     A string that uniquely identifies the peer of this connection
         *     in the context of the transport is returned.
         */
        virtual std::string GetPeerId() = 0;

        /**
         * This method sends the given data to the remote peer.
         *
         * @param[in] data
         *     This is the data to send to the remote peer.
         */
        virtual void SendData(const std::vector< uint8_t >& data) = 0;

        /**
         * This method breaks the connection to the remote peer.
         * Once broken, no more data is delivered, and any read
         * in progress is abandoned.
         *
         * @param[in] clean
         *     This flag indicates whether or not to attempt to complete
         *     any data transmission still in progress, before breaking
         *     the connection.
         */
        virtual void Break(bool clean) = 0;
    };

}

#endif /* RETRIEVAL_CONNECTION_HPP */
