/**
 * @file Session.cpp
 *
 * This module contains the implementation of the Retrieval::Session class.
 *
 * © 2018 by Richard Walters
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <inttypes.h>
#include <memory>
#include <mutex>
#include <Retrieval/Connection.hpp>
#include <Retrieval/IntegrityVerifier.hpp>
#include <Retrieval/Pipeline.hpp>
#include <Retrieval/Response.hpp>
#include <Retrieval/Session.hpp>
#include <sstream>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <thread>
#include <Uri/Uri.hpp>
#include <utility>
#include <vector>

namespace {

    /**
     * This is the character sequence corresponding to a carriage return (CR)
     * followed by a line feed (LF), which officially delimits each
     * line of an HTTP request.
     */
    const std::string CRLF("\r\n");

    /**
     * This is the default port number associated with
     * the HTTP protocol and scheme.
     */
    constexpr uint16_t DEFAULT_HTTP_PORT_NUMBER = 80;

    /**
     * This function determines which content coding, if any, the server
     * applied to the content in its response.
     *
     * @param[in] response
     *     This is the response from the server.
     *
     * @param[out] contentCoding
     *     This is where to store the content coding applied.
     *
     * @return
     *     An indication of whether or not the content coding applied
     *     can be removed is returned.
     */
    bool SelectContentCoding(
        const Retrieval::Response& response,
        Retrieval::Pipeline::ContentCoding& contentCoding
    ) {
        contentCoding = Retrieval::Pipeline::ContentCoding::Identity;
        if (!response.headers.HasHeader("Content-Encoding")) {
            return true;
        }
        const auto codings = response.headers.GetHeaderTokens("Content-Encoding");
        if (codings.size() > 1) {
            return false;
        }
        if (codings.empty()) {
            return true;
        }
        const auto coding = SystemAbstractions::ToLower(codings[0]);
        if (coding == "identity") {
            contentCoding = Retrieval::Pipeline::ContentCoding::Identity;
        } else if (
            (coding == "gzip")
            || (coding == "x-gzip")
        ) {
            contentCoding = Retrieval::Pipeline::ContentCoding::Gzip;
        } else if (coding == "deflate") {
            contentCoding = Retrieval::Pipeline::ContentCoding::Deflate;
        } else {
            return false;
        }
        return true;
    }

    /**
     * This function determines whether or not the server used
     * the chunked transfer coding, and only that transfer coding,
     * for the body of its response.
     *
     * @param[in] response
     *     This is the response from the server.
     *
     * @return
     *     An indication of whether or not the body is chunked,
     *     and not otherwise transfer-encoded, is returned.
     */
    bool IsChunkedOnly(const Retrieval::Response& response) {
        const auto transferCodings = response.headers.GetHeaderTokens("Transfer-Encoding");
        return (
            (transferCodings.size() == 1)
            && (SystemAbstractions::ToLower(transferCodings[0]) == "chunked")
        );
    }

    /**
     * This holds everything about a session which is shared between
     * the session's thread and the delegates called by the transport.
     */
    struct SessionState {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * These are the settings to use.
         */
        std::shared_ptr< const Retrieval::Configuration > configuration;

        /**
         * This is the object used to track time in the session.
         */
        std::shared_ptr< Retrieval::TimeKeeper > timeKeeper;

        /**
         * These are the parameters of the pipeline which will process
         * the response body.  The content coding is filled in once
         * the response header is received.
         */
        Retrieval::Pipeline::Parameters pipelineParameters;

        /**
         * If set, this is the delegate to call with content bytes
         * as they are verified.
         */
        Retrieval::Session::ContentDelegate contentDelegate;

        /**
         * This is the current stage of the retrieval.
         */
        Retrieval::Session::State state = Retrieval::Session::State::Connecting;

        /**
         * This flag indicates whether or not the outcome is known.
         */
        bool complete = false;

        /**
         * This is the outcome of the session, once known.
         */
        Retrieval::Outcome outcome;

        /**
         * This flag indicates whether or not the owner of the session
         * asked for it to stop.
         */
        std::atomic< bool > cancelRequested;

        /**
         * This is the connection to the server.
         */
        std::shared_ptr< Retrieval::Connection > connection;

        /**
         * This is the time at which the session started.
         */
        double startTime = 0.0;

        /**
         * This is the time allowed for the session, in seconds.
         */
        double timeout = 0.0;

        /**
         * This is the time allowed between deliveries of data from the
         * server, in seconds, or zero if there is no such limit.
         */
        double inactivityTimeout = 0.0;

        /**
         * This is the time at which the connection was established,
         * or data was last received from the server.
         */
        double lastActivityTime = 0.0;

        /**
         * This buffer is used to reassemble the fragmented
         * response header received from the server.
         */
        std::string reassemblyBuffer;

        /**
         * This processes the response body, once the response
         * header is received.
         */
        std::unique_ptr< Retrieval::Pipeline > pipeline;

        /**
         * This is used to synchronize access to the object.
         */
        std::recursive_mutex mutex;

        /**
         * This is used to wait for various object state changes.
         */
        std::condition_variable_any stateChange;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        SessionState()
            : diagnosticsSender("Retrieval::Session")
            , cancelRequested(false)
        {
        }

        /**
         * This method is called whenever the session ends.  The call
         * has no effect if the session already ended.
         *
         * @param[in] newOutcome
         *     This is the outcome of the session.
         */
        void Complete(Retrieval::Outcome newOutcome) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (complete) {
                return;
            }
            if (
                cancelRequested
                && (newOutcome.kind != Retrieval::Outcome::Kind::Cancelled)
            ) {
                newOutcome = Retrieval::Outcome::Cancelled();
            }
            complete = true;
            state = Retrieval::Session::State::Done;
            outcome = std::move(newOutcome);
            diagnosticsSender.SendDiagnosticInformationFormatted(
                (outcome.kind == Retrieval::Outcome::Kind::Verified) ? 3 : 5,
                "Retrieval finished: %s",
                outcome.Describe().c_str()
            );
            if (connection != nullptr) {
                connection->Break(false);
            }
            stateChange.notify_all();
        }

        /**
         * This method ends the session if it was cancelled or has
         * run out of time.
         *
         * @return
         *     An indication of whether or not the session ended
         *     is returned.
         */
        bool CheckInterruptions() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (complete) {
                return true;
            }
            if (cancelRequested) {
                Complete(Retrieval::Outcome::Cancelled());
                return true;
            }
            const auto now = timeKeeper->GetCurrentTime();
            if (now - startTime >= timeout) {
                Complete(Retrieval::Outcome::TimedOut());
                return true;
            }
            if (
                (inactivityTimeout > 0.0)
                && (now - lastActivityTime >= inactivityTimeout)
            ) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    5,
                    "No data received for %lg seconds",
                    now - lastActivityTime
                );
                Complete(Retrieval::Outcome::TimedOut());
                return true;
            }
            return false;
        }

        /**
         * This method returns the time left before the session
         * runs out of time, either overall or waiting for the server.
         *
         * @return
         *     The time left before the session runs out of time,
         *     in seconds, is returned.
         */
        double GetRemainingTime() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            const auto now = timeKeeper->GetCurrentTime();
            auto remaining = timeout - (now - startTime);
            if (inactivityTimeout > 0.0) {
                const auto remainingUntilInactive = inactivityTimeout - (now - lastActivityTime);
                if (remainingUntilInactive < remaining) {
                    remaining = remainingUntilInactive;
                }
            }
            return (remaining > 0.0) ? remaining : 0.0;
        }

        /**
         * This method passes bytes of the response body to the pipeline,
         * ending the session if the pipeline has the outcome.
         *
         * @param[in] body
         *     These are the next bytes of the response body.
         */
        void FeedBody(const std::string& body) {
            if (body.empty()) {
                return;
            }
            (void)pipeline->Feed(body);
            if (pipeline->IsComplete()) {
                Complete(pipeline->GetOutcome());
            } else if (pipeline->GetContentBytesHashed() > 0) {
                state = Retrieval::Session::State::Verifying;
            }
        }

        /**
         * This method is called once the response header is received,
         * to check it and set up the processing of the response body.
         *
         * @param[in] response
         *     This is the status line and header of the response.
         *
         * @return
         *     An indication of whether or not the response body
         *     should be processed is returned.
         */
        bool StartBody(const Retrieval::Response& response) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Response: %u %s",
                response.statusCode,
                response.reasonPhrase.c_str()
            );
            if (response.statusCode != 200) {
                Complete(
                    Retrieval::Outcome::ConnectionError(
                        Retrieval::Outcome::ConnectionErrorKind::HttpStatus,
                        response.reasonPhrase,
                        response.statusCode
                    )
                );
                return false;
            }
            if (!IsChunkedOnly(response)) {
                Complete(
                    Retrieval::Outcome::ProtocolError(
                        Retrieval::Outcome::ProtocolErrorKind::UnsupportedEncoding,
                        0,
                        SystemAbstractions::sprintf(
                            "transfer coding \"%s\" not supported",
                            response.headers.GetHeaderValue("Transfer-Encoding").c_str()
                        )
                    )
                );
                return false;
            }
            if (!SelectContentCoding(response, pipelineParameters.contentCoding)) {
                Complete(
                    Retrieval::Outcome::ProtocolError(
                        Retrieval::Outcome::ProtocolErrorKind::UnsupportedEncoding,
                        0,
                        SystemAbstractions::sprintf(
                            "content coding \"%s\" not supported",
                            response.headers.GetHeaderValue("Content-Encoding").c_str()
                        )
                    )
                );
                return false;
            }
            pipeline.reset(new Retrieval::Pipeline(pipelineParameters));
            (void)pipeline->SubscribeToDiagnostics(
                [this](
                    std::string senderName,
                    size_t level,
                    std::string message
                ){
                    diagnosticsSender.SendDiagnosticInformationString(
                        level,
                        senderName + ": " + message
                    );
                },
                0
            );
            pipeline->SetContentDelegate(contentDelegate);
            pipeline->SetCancellationCheck(
                [this]{ return (bool)cancelRequested; }
            );
            if (pipeline->IsComplete()) {
                Complete(pipeline->GetOutcome());
                return false;
            }
            state = Retrieval::Session::State::Streaming;
            return true;
        }

        /**
         * This method is called when new data is received from the server.
         *
         * @param[in] data
         *     This is a copy of the data that was received from the server.
         */
        void DataReceived(const std::vector< uint8_t >& data) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            lastActivityTime = timeKeeper->GetCurrentTime();
            if (CheckInterruptions()) {
                return;
            }
            if (pipeline != nullptr) {
                FeedBody(std::string(data.begin(), data.end()));
                return;
            }
            reassemblyBuffer += std::string(data.begin(), data.end());
            Retrieval::Response response;
            size_t headEnd = 0;
            switch (Retrieval::ParseResponseHead(reassemblyBuffer, response, headEnd)) {
                case Retrieval::Response::HeadState::Incomplete: {
                    if (reassemblyBuffer.length() > configuration->maxHeaderBytes) {
                        Complete(
                            Retrieval::Outcome::ProtocolError(
                                Retrieval::Outcome::ProtocolErrorKind::SizeExceeded,
                                0,
                                "response header too large"
                            )
                        );
                    }
                } return;

                case Retrieval::Response::HeadState::Error: {
                    Complete(
                        Retrieval::Outcome::ConnectionError(
                            Retrieval::Outcome::ConnectionErrorKind::BadResponse,
                            "response status line or header could not be parsed"
                        )
                    );
                } return;

                case Retrieval::Response::HeadState::Complete:
                default: {
                } break;
            }
            if (headEnd > configuration->maxHeaderBytes) {
                Complete(
                    Retrieval::Outcome::ProtocolError(
                        Retrieval::Outcome::ProtocolErrorKind::SizeExceeded,
                        0,
                        "response header too large"
                    )
                );
                return;
            }
            const auto body = reassemblyBuffer.substr(headEnd);
            reassemblyBuffer.clear();
            if (StartBody(response)) {
                FeedBody(body);
            }
        }

        /**
         * This method is called if the connection to the server is broken.
         */
        void ConnectionBroken() {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (CheckInterruptions()) {
                return;
            }
            if (pipeline == nullptr) {
                Complete(
                    Retrieval::Outcome::ConnectionError(
                        Retrieval::Outcome::ConnectionErrorKind::Disconnected,
                        "connection broken before response header was received"
                    )
                );
            } else {
                pipeline->EndOfStream();
                Complete(pipeline->GetOutcome());
            }
        }
    };

}

namespace Retrieval {

    /**
     * This contains the private properties of a Session instance.
     */
    struct Session::Impl {
        // Properties

        /**
         * This describes the content to retrieve and verify.
         */
        Request request;

        /**
         * This is the transport layer to use to reach the server.
         */
        std::shared_ptr< ClientTransport > transport;

        /**
         * This holds everything about the session which is shared
         * with the delegates called by the transport.
         */
        std::shared_ptr< SessionState > state = std::make_shared< SessionState >();

        /**
         * This flag indicates whether or not the session was started.
         */
        bool started = false;

        /**
         * This thread carries out the retrieval.
         */
        std::thread worker;

        // Methods

        /**
         * This method checks the request, and determines where the
         * content is to be found.
         *
         * @param[out] host
         *     This is where to store the host name or address
         *     of the server.
         *
         * @param[out] port
         *     This is where to store the port number of the server.
         *
         * @param[out] target
         *     This is where to store the request target to send
         *     to the server.
         *
         * @return
         *     An indication of whether or not the request can be
         *     carried out is returned.
         */
        bool ValidateRequest(
            std::string& host,
            uint16_t& port,
            std::string& target
        ) {
            Uri::Uri uri;
            if (!uri.ParseFromString(request.url)) {
                state->Complete(
                    Outcome::InvalidRequest(
                        SystemAbstractions::sprintf(
                            "URL \"%s\" could not be parsed",
                            request.url.c_str()
                        )
                    )
                );
                return false;
            }
            if (SystemAbstractions::ToLower(uri.GetScheme()) != "http") {
                state->Complete(
                    Outcome::InvalidRequest(
                        SystemAbstractions::sprintf(
                            "scheme \"%s\" not supported",
                            uri.GetScheme().c_str()
                        )
                    )
                );
                return false;
            }
            host = uri.GetHost();
            if (host.empty()) {
                state->Complete(Outcome::InvalidRequest("URL has no host"));
                return false;
            }
            port = DEFAULT_HTTP_PORT_NUMBER;
            if (uri.HasPort()) {
                port = uri.GetPort();
            }
            IntegrityVerifier verifier(request.expected);
            if (!verifier.IsSupported()) {
                state->Complete(
                    Outcome::InvalidRequest(
                        SystemAbstractions::sprintf(
                            "unsupported digest algorithm 0x%" PRIx32,
                            (uint32_t)request.expected.algorithm
                        )
                    )
                );
                return false;
            }
            Uri::Uri targetUri;
            targetUri.SetPath(uri.GetPath());
            if (uri.HasQuery()) {
                targetUri.SetQuery(uri.GetQuery());
            }
            target = targetUri.GenerateString();
            if (
                target.empty()
                || (target[0] != '/')
            ) {
                target = "/" + target;
            }
            return true;
        }

        /**
         * This method generates the request to send to the server.
         *
         * @param[in] host
         *     This is the host name or address of the server.
         *
         * @param[in] port
         *     This is the port number of the server.
         *
         * @param[in] target
         *     This is the request target.
         *
         * @return
         *     The request to send to the server is returned.
         */
        std::string GenerateRequest(
            const std::string& host,
            uint16_t port,
            const std::string& target
        ) {
            MessageHeaders::MessageHeaders headers;
            if (port == DEFAULT_HTTP_PORT_NUMBER) {
                headers.SetHeader("Host", host);
            } else {
                headers.SetHeader(
                    "Host",
                    SystemAbstractions::sprintf("%s:%" PRIu16, host.c_str(), port)
                );
            }
            headers.SetHeader("User-Agent", state->configuration->userAgent);
            headers.SetHeader("Accept", "*/*");
            headers.SetHeader(
                "Accept-Encoding",
                (
                    state->configuration->acceptContentCodings
                    ? "gzip, deflate"
                    : "identity"
                )
            );
            headers.SetHeader("Connection", "close");
            std::ostringstream builder;
            builder << "GET " << target << " HTTP/1.1" << CRLF;
            builder << headers.GenerateRawHeaders();
            return builder.str();
        }

        /**
         * This method is the body of the worker thread, which
         * carries out the retrieval.
         */
        void Worker() {
            std::string host, target;
            uint16_t port;
            if (!ValidateRequest(host, port, target)) {
                return;
            }
            if (state->CheckInterruptions()) {
                return;
            }
            state->diagnosticsSender.SendDiagnosticInformationFormatted(
                1,
                "Connecting to %s:%" PRIu16,
                host.c_str(),
                port
            );
            std::weak_ptr< SessionState > stateWeak(state);
            const auto connection = transport->Connect(
                host,
                port,
                state->GetRemainingTime(),
                [stateWeak](const std::vector< uint8_t >& data){
                    const auto state = stateWeak.lock();
                    if (state == nullptr) {
                        return;
                    }
                    state->DataReceived(data);
                },
                [stateWeak](bool){
                    const auto state = stateWeak.lock();
                    if (state == nullptr) {
                        return;
                    }
                    state->ConnectionBroken();
                }
            );
            std::unique_lock< decltype(state->mutex) > lock(state->mutex);
            if (connection == nullptr) {
                if (state->CheckInterruptions()) {
                    return;
                }
                state->Complete(
                    Outcome::ConnectionError(
                        Outcome::ConnectionErrorKind::UnableToConnect,
                        SystemAbstractions::sprintf(
                            "unable to connect to %s:%" PRIu16,
                            host.c_str(),
                            port
                        )
                    )
                );
                return;
            }
            if (state->CheckInterruptions()) {
                connection->Break(false);
                return;
            }
            state->connection = connection;
            state->lastActivityTime = state->timeKeeper->GetCurrentTime();
            lock.unlock();
            const auto requestEncoding = GenerateRequest(host, port, target);
            state->diagnosticsSender.SendDiagnosticInformationFormatted(
                0,
                "Sending request: GET %s",
                target.c_str()
            );
            connection->SendData({requestEncoding.begin(), requestEncoding.end()});
            lock.lock();
            const auto pollingPeriod = std::chrono::milliseconds(state->configuration->pollingPeriod);
            while (!state->CheckInterruptions()) {
                (void)state->stateChange.wait_for(
                    lock,
                    pollingPeriod,
                    [this]{
                        return (
                            state->complete
                            || state->cancelRequested
                        );
                    }
                );
            }
        }
    };

    Session::~Session() noexcept {
        Cancel();
        if (impl_->worker.joinable()) {
            impl_->worker.join();
        }
    }

    Session::Session(
        const Request& request,
        const Dependencies& deps
    )
        : impl_(new Impl)
    {
        impl_->request = request;
        impl_->transport = deps.transport;
        impl_->state->timeKeeper = deps.timeKeeper;
        impl_->state->configuration = (
            (deps.configuration == nullptr)
            ? std::make_shared< Configuration >()
            : deps.configuration
        );
        const auto& configuration = *impl_->state->configuration;
        impl_->state->timeout = (
            (request.timeoutSeconds > 0.0)
            ? request.timeoutSeconds
            : configuration.timeout
        );
        impl_->state->inactivityTimeout = (
            (request.inactivityTimeoutSeconds > 0.0)
            ? request.inactivityTimeoutSeconds
            : configuration.inactivityTimeout
        );
        auto& pipelineParameters = impl_->state->pipelineParameters;
        pipelineParameters.limits = configuration.GetDecoderLimits(request.maxDecodedSize);
        pipelineParameters.expected = request.expected;
        pipelineParameters.maxContentSize = pipelineParameters.limits.maxDecodedSize;
        pipelineParameters.hasLengthHint = request.hasLengthHint;
        pipelineParameters.lengthHint = request.lengthHint;
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Session::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->state->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void Session::SetContentDelegate(ContentDelegate contentDelegate) {
        std::lock_guard< decltype(impl_->state->mutex) > lock(impl_->state->mutex);
        impl_->state->contentDelegate = contentDelegate;
    }

    void Session::Start() {
        if (impl_->started) {
            return;
        }
        impl_->started = true;
        impl_->state->startTime = impl_->state->timeKeeper->GetCurrentTime();
        impl_->state->lastActivityTime = impl_->state->startTime;
        impl_->worker = std::thread(&Impl::Worker, impl_.get());
    }

    bool Session::AwaitOutcome(const std::chrono::milliseconds& relativeTime) {
        std::unique_lock< decltype(impl_->state->mutex) > lock(impl_->state->mutex);
        return impl_->state->stateChange.wait_for(
            lock,
            relativeTime,
            [this]{ return impl_->state->complete; }
        );
    }

    Outcome Session::AwaitOutcome() {
        std::unique_lock< decltype(impl_->state->mutex) > lock(impl_->state->mutex);
        impl_->state->stateChange.wait(
            lock,
            [this]{ return impl_->state->complete; }
        );
        return impl_->state->outcome;
    }

    Outcome Session::Run() {
        Start();
        return AwaitOutcome();
    }

    void Session::Cancel() {
        impl_->state->cancelRequested = true;
        impl_->state->stateChange.notify_all();
    }

    auto Session::GetState() const -> State {
        std::lock_guard< decltype(impl_->state->mutex) > lock(impl_->state->mutex);
        return impl_->state->state;
    }

    Outcome Session::GetOutcome() const {
        std::lock_guard< decltype(impl_->state->mutex) > lock(impl_->state->mutex);
        return impl_->state->outcome;
    }

    void PrintTo(
        const Session::State& state,
        std::ostream* os
    ) {
        switch (state) {
            case Session::State::Connecting: {
                *os << "Connecting";
            } break;
            case Session::State::Streaming: {
                *os << "Streaming";
            } break;
            case Session::State::Verifying: {
                *os << "Verifying";
            } break;
            case Session::State::Done: {
                *os << "DONE";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
