#ifndef RETRIEVAL_CLIENT_TRANSPORT_HPP
#define RETRIEVAL_CLIENT_TRANSPORT_HPP

/**
 * @file ClientTransport.hpp
 *
 * This module declares the Retrieval::ClientTransport interface.
 *
 * © 2018 by Richard Walters
 */

#include "Connection.hpp"

#include <memory>
#include <stdint.h>
#include <string>

namespace Retrieval {

    /**
     * This represents the transport layer requirements of
     * Retrieval::Session.  To integrate Retrieval::Session into a larger
     * program, implement this interface in terms of the actual
     * transport layer.
     */
    class ClientTransport {
    public:
        // Methods

        virtual ~ClientTransport() = default;

        /**
         * This method establishes a new connection to a server with
         * the given address and port number.
         *
         * @param[in] hostNameOrAddress
         *     This is the host name or IP address of the
         *     server to which to connect.
         *
         * @param[in] port
         *     This is the port number of the server to which to connect.
         *
         * @param[in] timeout
         *     This is the longest time to spend establishing the
         *     connection, in seconds.  If zero, the transport
         *     chooses the limit.
         *
         * @param[in] dataReceivedDelegate
         *     This is the delegate to call whenever data is received
         *     from the remote peer.
         *
         * @param[in] brokenDelegate
         *     This is the delegate to call whenever the connection
         *     has been broken.
         *
         * @return
         *     An object representing the new connection is returned.
         *
         * @retval nullptr
         *     This is returned if a connection could not be established.
         */
        virtual std::shared_ptr< Connection > Connect(
            const std::string& hostNameOrAddress,
            uint16_t port,
            double timeout,
            Connection::DataReceivedDelegate dataReceivedDelegate,
            Connection::BrokenDelegate brokenDelegate
        ) = 0;
    };

}

#endif /* RETRIEVAL_CLIENT_TRANSPORT_HPP */
