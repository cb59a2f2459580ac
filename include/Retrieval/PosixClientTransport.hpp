#ifndef RETRIEVAL_POSIX_CLIENT_TRANSPORT_HPP
#define RETRIEVAL_POSIX_CLIENT_TRANSPORT_HPP

/**
 * @file PosixClientTransport.hpp
 *
 * This module declares the Retrieval::PosixClientTransport class.
 *
 * © 2018 by Richard Walters
 */

#include "ClientTransport.hpp"
#include "Connection.hpp"

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Retrieval {

    /**
     * This is the production implementation of Retrieval::ClientTransport,
     * using TCP sockets.  Each connection has a thread of its own which
     * waits for data from the server and delivers it.
     */
    class PosixClientTransport
        : public ClientTransport
    {
        // Lifecycle management
    public:
        ~PosixClientTransport() noexcept;
        PosixClientTransport(const PosixClientTransport&) = delete;
        PosixClientTransport(PosixClientTransport&&) noexcept = delete;
        PosixClientTransport& operator=(const PosixClientTransport&) = delete;
        PosixClientTransport& operator=(PosixClientTransport&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        PosixClientTransport();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the transport.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * This method sets the time allowed to establish a connection,
         * unless a shorter time is given to Connect.
         *
         * @param[in] connectTimeout
         *     This is the time allowed to establish a connection,
         *     in seconds.
         */
        void SetConnectTimeout(double connectTimeout);

        /**
         * This method sets the number of bytes to ask for in each read
         * from the network.
         *
         * @param[in] receiveBufferSize
         *     This is the number of bytes to ask for in each read
         *     from the network.
         */
        void SetReceiveBufferSize(size_t receiveBufferSize);

        // Retrieval::ClientTransport

        virtual std::shared_ptr< Connection > Connect(
            const std::string& hostNameOrAddress,
            uint16_t port,
            double timeout,
            Connection::DataReceivedDelegate dataReceivedDelegate,
            Connection::BrokenDelegate brokenDelegate
        ) override;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

}

#endif /* RETRIEVAL_POSIX_CLIENT_TRANSPORT_HPP */
