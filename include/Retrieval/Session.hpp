#ifndef RETRIEVAL_SESSION_HPP
#define RETRIEVAL_SESSION_HPP

/**
 * @file Session.hpp
 *
 * This module declares the Retrieval::Session class.
 *
 * © 2018 by Richard Walters
 */

#include "ClientTransport.hpp"
#include "Configuration.hpp"
#include "Outcome.hpp"
#include "Request.hpp"
#include "TimeKeeper.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Retrieval {

    /**
     * This class retrieves a single piece of content from a server
     * using HTTP, and verifies it against the digest it is expected
     * to have.  The work is done on a thread of the session's own,
     * and ends with exactly one outcome.
     */
    class Session {
        // Types
    public:
        /**
         * These are the different stages of a retrieval.
         */
        enum class State {
            /**
             * The request is being checked, the connection made,
             * and the response header received.
             */
            Connecting,

            /**
             * The response body is being received and decoded.
             */
            Streaming,

            /**
             * The response body is complete, and the content digest
             * is being checked.
             */
            Verifying,

            /**
             * The outcome is known.
             */
            Done,
        };

        /**
         * This holds everything the session needs from its owner.
         */
        struct Dependencies {
            /**
             * This is the transport layer to use to reach the server.
             */
            std::shared_ptr< ClientTransport > transport;

            /**
             * This is the object used to track time in the session.
             */
            std::shared_ptr< TimeKeeper > timeKeeper;

            /**
             * These are the settings to use.  They are only ever read.
             */
            std::shared_ptr< const Configuration > configuration;
        };

        /**
         * This is the type of delegate used to hand content bytes
         * to the owner of the session as they are verified.
         *
         * @param[in] content
         *     These are the next content bytes.
         */
        typedef std::function< void(const std::string& content) > ContentDelegate;

        // Lifecycle management
    public:
        ~Session() noexcept;
        Session(const Session&) = delete;
        Session(Session&&) noexcept = delete;
        Session& operator=(const Session&) = delete;
        Session& operator=(Session&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs the session.
         *
         * @param[in] request
         *     This describes the content to retrieve and verify.
         *
         * @param[in] deps
         *     This holds everything the session needs from its owner.
         */
        Session(
            const Request& request,
            const Dependencies& deps
        );

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the session.
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
         * This method sets the delegate to call with content bytes
         * as they are verified.  It must be called before Start.
         *
         * @note
         *     Content handed to this delegate is not trustworthy until
         *     the session ends with Outcome::Kind::Verified.
         *
         * @param[in] contentDelegate
         *     This is the delegate to call with content bytes
         *     as they are verified.
         */
        void SetContentDelegate(ContentDelegate contentDelegate);

        /**
         * This method starts the retrieval on the session's own thread.
         * The call has no effect if the session was already started.
         */
        void Start();

        /**
         * This method waits up to the given amount of time for
         * the session to end.
         *
         * @param[in] relativeTime
         *     This is the maximum amount of time, in milliseconds,
         *     to wait for the session to end.
         *
         * @return
         *     An indication of whether or not the session ended
         *     in the time given is returned.
         */
        bool AwaitOutcome(const std::chrono::milliseconds& relativeTime);

        /**
         * This method waits for the session to end.
         *
         * @return
         *     The outcome of the session is returned.
         */
        Outcome AwaitOutcome();

        /**
         * This method starts the session and waits for it to end.
         *
         * @return
         *     The outcome of the session is returned.
         */
        Outcome Run();

        /**
         * This method asks the session to stop.  It may be called from
         * any thread.  Once called, the outcome of the session
         * will be Outcome::Kind::Cancelled, unless it had already ended.
         */
        void Cancel();

        /**
         * This method returns the current stage of the retrieval.
         *
         * @return
         *     The current stage of the retrieval is returned.
         */
        State GetState() const;

        /**
         * This method returns the outcome of the session.
         *
         * @return
         *     The outcome of the session is returned.  It is only
         *     meaningful once the state is State::Done.
         */
        Outcome GetOutcome() const;

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

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Session::State class.
     *
     * @param[in] state
     *     This is the session state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     session state value.
     */
    void PrintTo(
        const Session::State& state,
        std::ostream* os
    );

}

#endif /* RETRIEVAL_SESSION_HPP */
