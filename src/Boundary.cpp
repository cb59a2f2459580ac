/**
 * @file Boundary.cpp
 *
 * This module contains the implementation of the C interface of the
 * Retrieval library, and of the functions which translate between
 * that interface and the C++ types of the library.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <memory>
#include <new>
#include <Retrieval/Boundary.hpp>
#include <Retrieval/Pipeline.hpp>
#include <Retrieval/PosixClientTransport.hpp>
#include <Retrieval/Session.hpp>
#include <Retrieval/SteadyTimeKeeper.hpp>
#include <stdexcept>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <utility>
#include <vector>

/**
 * This is the structure behind the opaque session handle
 * given to the host.
 */
struct retrieval_session {
    /**
     * This flag indicates whether or not the content is to be
     * kept and handed back with the result.
     */
    bool retainContent = false;

    /**
     * If retainContent is set, this holds the content received so far.
     */
    std::string content;

    /**
     * This is the transport layer the session uses to reach the server.
     */
    std::shared_ptr< Retrieval::PosixClientTransport > transport;

    /**
     * This is the retrieval itself.
     */
    std::unique_ptr< Retrieval::Session > session;

    /**
     * These are the functions to call to end the subscriptions
     * made for the host's log callback.
     */
    std::vector< SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate > diagnosticsUnsubscribeDelegates;

    ~retrieval_session() {
        for (const auto& unsubscribeDelegate: diagnosticsUnsubscribeDelegates) {
            unsubscribeDelegate();
        }
    }
};

namespace {

    /**
     * This is the number of nanoseconds in a second.
     */
    constexpr double NANOSECONDS_PER_SECOND = 1000000000.0;

    /**
     * This function returns the integer code used at the C interface
     * for the given kind of protocol error.
     *
     * @param[in] kind
     *     This is the kind of protocol error.
     *
     * @return
     *     The integer code for the kind of protocol error is returned.
     */
    int32_t ProtocolErrorCode(Retrieval::Outcome::ProtocolErrorKind kind) {
        switch (kind) {
            case Retrieval::Outcome::ProtocolErrorKind::Malformed: return RETRIEVAL_PROTOCOL_MALFORMED;
            case Retrieval::Outcome::ProtocolErrorKind::Truncated: return RETRIEVAL_PROTOCOL_TRUNCATED;
            case Retrieval::Outcome::ProtocolErrorKind::SizeExceeded: return RETRIEVAL_PROTOCOL_SIZE_EXCEEDED;
            case Retrieval::Outcome::ProtocolErrorKind::UnsupportedEncoding: return RETRIEVAL_PROTOCOL_UNSUPPORTED_ENCODING;
            case Retrieval::Outcome::ProtocolErrorKind::BadContentCoding: return RETRIEVAL_PROTOCOL_BAD_CONTENT_CODING;
            default: return 0;
        }
    }

    /**
     * This function returns the integer code used at the C interface
     * for the given kind of connection error.
     *
     * @param[in] kind
     *     This is the kind of connection error.
     *
     * @return
     *     The integer code for the kind of connection error is returned.
     */
    int32_t ConnectionErrorCode(Retrieval::Outcome::ConnectionErrorKind kind) {
        switch (kind) {
            case Retrieval::Outcome::ConnectionErrorKind::UnableToConnect: return RETRIEVAL_CONNECTION_UNABLE_TO_CONNECT;
            case Retrieval::Outcome::ConnectionErrorKind::Disconnected: return RETRIEVAL_CONNECTION_DISCONNECTED;
            case Retrieval::Outcome::ConnectionErrorKind::BadResponse: return RETRIEVAL_CONNECTION_BAD_RESPONSE;
            case Retrieval::Outcome::ConnectionErrorKind::HttpStatus: return RETRIEVAL_CONNECTION_HTTP_STATUS;
            default: return 0;
        }
    }

    /**
     * This function puts a result into a known, empty state.
     *
     * @param[out] result
     *     This is the result to clear.
     */
    void ClearResult(retrieval_result_t* result) {
        (void)memset(result, 0, sizeof(*result));
        result->abi_version = RETRIEVAL_ABI_VERSION;
        result->tag = RETRIEVAL_RESULT_CANCELLED;
    }

    /**
     * This function carries out a function of the C interface, making
     * sure no exception escapes it.
     *
     * @param[in] body
     *     This is the function to carry out.
     *
     * @return
     *     The status code returned by the function is returned,
     *     or the status code for the exception it threw.
     */
    template< typename F > int Guard(F body) {
        try {
            return body();
        } catch (const std::bad_alloc&) {
            return RETRIEVAL_ERROR_OUT_OF_MEMORY;
        } catch (const std::exception&) {
            return RETRIEVAL_ERROR_INTERNAL;
        }
    }

}

namespace Retrieval {

    namespace Boundary {

        int ToDigest(
            const retrieval_digest_t& in,
            Digest& out
        ) {
            if (in.size > RETRIEVAL_DIGEST_MAX_SIZE) {
                return RETRIEVAL_ERROR_INVALID_ARGUMENT;
            }
            out.algorithm = (Digest::Algorithm)in.algorithm;
            out.bytes.assign(in.bytes, in.bytes + in.size);
            return RETRIEVAL_OK;
        }

        void FromDigest(
            const Digest& in,
            retrieval_digest_t& out
        ) {
            (void)memset(&out, 0, sizeof(out));
            out.algorithm = (uint32_t)in.algorithm;
            out.size = (uint32_t)std::min(
                in.bytes.size(),
                (size_t)RETRIEVAL_DIGEST_MAX_SIZE
            );
            if (out.size > 0) {
                (void)memcpy(out.bytes, in.bytes.data(), out.size);
            }
        }

        int ToConfiguration(
            const retrieval_config_t* in,
            Configuration& out
        ) {
            out = Configuration();
            if (in == nullptr) {
                return RETRIEVAL_OK;
            }
            if (in->abi_version != RETRIEVAL_ABI_VERSION) {
                return RETRIEVAL_ERROR_ABI_VERSION;
            }
            if (
                (in->default_timeout_ns < 0)
                || (in->default_inactivity_timeout_ns < 0)
            ) {
                return RETRIEVAL_ERROR_INVALID_ARGUMENT;
            }
            if (in->max_chunk_size != 0) {
                out.maxChunkSize = in->max_chunk_size;
            }
            if (in->max_decoded_size != 0) {
                out.maxDecodedSize = in->max_decoded_size;
            }
            if (in->default_timeout_ns != 0) {
                out.timeout = (double)in->default_timeout_ns / NANOSECONDS_PER_SECOND;
            }
            out.inactivityTimeout = (double)in->default_inactivity_timeout_ns / NANOSECONDS_PER_SECOND;
            out.acceptContentCodings = (in->accept_content_codings != 0);
            if (
                (in->user_agent != nullptr)
                && (in->user_agent[0] != '\0')
            ) {
                out.userAgent = in->user_agent;
            }
            return RETRIEVAL_OK;
        }

        int ToRequest(
            const retrieval_request_t* in,
            Request& out
        ) {
            if (
                (in == nullptr)
                || (in->url == nullptr)
                || (in->timeout_ns < 0)
                || (in->inactivity_timeout_ns < 0)
            ) {
                return RETRIEVAL_ERROR_INVALID_ARGUMENT;
            }
            if (in->abi_version != RETRIEVAL_ABI_VERSION) {
                return RETRIEVAL_ERROR_ABI_VERSION;
            }
            out = Request();
            out.url = in->url;
            const auto status = ToDigest(in->expected, out.expected);
            if (status != RETRIEVAL_OK) {
                return status;
            }
            out.maxDecodedSize = in->max_decoded_size;
            out.timeoutSeconds = (double)in->timeout_ns / NANOSECONDS_PER_SECOND;
            out.inactivityTimeoutSeconds = (double)in->inactivity_timeout_ns / NANOSECONDS_PER_SECOND;
            if ((in->flags & RETRIEVAL_FLAG_LENGTH_HINT) != 0) {
                out.hasLengthHint = true;
                out.lengthHint = in->length_hint;
            }
            return RETRIEVAL_OK;
        }

        int ToResult(
            const Outcome& outcome,
            const std::string* content,
            retrieval_result_t* out
        ) {
            if (out == nullptr) {
                return RETRIEVAL_ERROR_INVALID_ARGUMENT;
            }
            ClearResult(out);
            switch (outcome.kind) {
                case Outcome::Kind::Verified: {
                    out->tag = RETRIEVAL_RESULT_VERIFIED;
                } break;

                case Outcome::Kind::Mismatch: {
                    out->tag = RETRIEVAL_RESULT_MISMATCH;
                } break;

                case Outcome::Kind::ProtocolError: {
                    out->tag = RETRIEVAL_RESULT_PROTOCOL_ERROR;
                    out->error_kind = ProtocolErrorCode(outcome.protocolError);
                    out->offset = outcome.offset;
                } break;

                case Outcome::Kind::ConnectionError: {
                    out->tag = RETRIEVAL_RESULT_CONNECTION_ERROR;
                    out->error_kind = ConnectionErrorCode(outcome.connectionError);
                    out->status_code = outcome.statusCode;
                } break;

                case Outcome::Kind::TimedOut: {
                    out->tag = RETRIEVAL_RESULT_TIMED_OUT;
                } break;

                case Outcome::Kind::InvalidRequest: {
                    out->tag = RETRIEVAL_RESULT_INVALID_REQUEST;
                } break;

                case Outcome::Kind::Cancelled:
                default: {
                    out->tag = RETRIEVAL_RESULT_CANCELLED;
                } break;
            }
            out->byte_count = outcome.byteCount;
            FromDigest(outcome.expected, out->expected);
            FromDigest(outcome.actual, out->actual);
            const auto message = outcome.Describe();
            const auto messageLength = std::min(
                message.length(),
                (size_t)RETRIEVAL_MESSAGE_SIZE - 1
            );
            (void)memcpy(out->message, message.data(), messageLength);
            out->message[messageLength] = '\0';
            if (
                (content != nullptr)
                && (outcome.kind == Outcome::Kind::Verified)
                && !content->empty()
            ) {
                out->content = (uint8_t*)malloc(content->length());
                if (out->content == nullptr) {
                    return RETRIEVAL_ERROR_OUT_OF_MEMORY;
                }
                (void)memcpy(out->content, content->data(), content->length());
                out->content_size = content->length();
            }
            return RETRIEVAL_OK;
        }

        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate MakeLogForwarder(
            const retrieval_config_t* config
        ) {
            if (
                (config == nullptr)
                || (config->log_callback == nullptr)
            ) {
                return nullptr;
            }
            const auto logCallback = config->log_callback;
            const auto logContext = config->log_context;
            return [logCallback, logContext](
                std::string senderName,
                size_t level,
                std::string message
            ){
                logCallback(logContext, senderName.c_str(), level, message.c_str());
            };
        }

    }

}

extern "C" int retrieval_session_new(
    const retrieval_config_t* config,
    const retrieval_request_t* request,
    retrieval_session_t** session
) {
    if (session == nullptr) {
        return RETRIEVAL_ERROR_INVALID_ARGUMENT;
    }
    *session = nullptr;
    return Guard(
        [config, request, session]() -> int {
            Retrieval::Configuration configuration;
            auto status = Retrieval::Boundary::ToConfiguration(config, configuration);
            if (status != RETRIEVAL_OK) {
                return status;
            }
            Retrieval::Request sessionRequest;
            status = Retrieval::Boundary::ToRequest(request, sessionRequest);
            if (status != RETRIEVAL_OK) {
                return status;
            }
            std::unique_ptr< retrieval_session_t > newSession(new retrieval_session_t());
            newSession->retainContent = ((request->flags & RETRIEVAL_FLAG_RETAIN_CONTENT) != 0);
            newSession->transport = std::make_shared< Retrieval::PosixClientTransport >();
            newSession->transport->SetReceiveBufferSize(configuration.receiveBufferSize);
            Retrieval::Session::Dependencies deps;
            deps.transport = newSession->transport;
            deps.timeKeeper = std::make_shared< Retrieval::SteadyTimeKeeper >();
            deps.configuration = std::make_shared< Retrieval::Configuration >(std::move(configuration));
            newSession->session.reset(new Retrieval::Session(sessionRequest, deps));
            const auto logForwarder = Retrieval::Boundary::MakeLogForwarder(config);
            if (logForwarder != nullptr) {
                newSession->diagnosticsUnsubscribeDelegates.push_back(
                    newSession->session->SubscribeToDiagnostics(logForwarder, config->log_level)
                );
                newSession->diagnosticsUnsubscribeDelegates.push_back(
                    newSession->transport->SubscribeToDiagnostics(logForwarder, config->log_level)
                );
            }
            if (newSession->retainContent) {
                const auto sessionRaw = newSession.get();
                newSession->session->SetContentDelegate(
                    [sessionRaw](const std::string& content){
                        sessionRaw->content += content;
                    }
                );
            }
            *session = newSession.release();
            return RETRIEVAL_OK;
        }
    );
}

extern "C" int retrieval_session_run(
    retrieval_session_t* session,
    retrieval_result_t* result
) {
    if (
        (session == nullptr)
        || (result == nullptr)
    ) {
        return RETRIEVAL_ERROR_INVALID_ARGUMENT;
    }
    ClearResult(result);
    return Guard(
        [session, result]() -> int {
            const auto outcome = session->session->Run();
            return Retrieval::Boundary::ToResult(
                outcome,
                (session->retainContent ? &session->content : nullptr),
                result
            );
        }
    );
}

extern "C" int retrieval_session_cancel(retrieval_session_t* session) {
    if (session == nullptr) {
        return RETRIEVAL_ERROR_INVALID_ARGUMENT;
    }
    session->session->Cancel();
    return RETRIEVAL_OK;
}

extern "C" void retrieval_session_free(retrieval_session_t* session) {
    delete session;
}

extern "C" int retrieval_fetch(
    const retrieval_config_t* config,
    const retrieval_request_t* request,
    retrieval_result_t* result
) {
    if (result == nullptr) {
        return RETRIEVAL_ERROR_INVALID_ARGUMENT;
    }
    ClearResult(result);
    retrieval_session_t* session = nullptr;
    const auto status = retrieval_session_new(config, request, &session);
    if (status != RETRIEVAL_OK) {
        return status;
    }
    std::unique_ptr< retrieval_session_t, void(*)(retrieval_session_t*) > sessionHolder(
        session,
        retrieval_session_free
    );
    return retrieval_session_run(session, result);
}

extern "C" int retrieval_verify_body(
    const retrieval_config_t* config,
    const uint8_t* body,
    size_t body_size,
    size_t read_size,
    const retrieval_digest_t* expected,
    uint64_t max_decoded_size,
    retrieval_result_t* result
) {
    if (
        (result == nullptr)
        || (expected == nullptr)
        || (
            (body == nullptr)
            && (body_size > 0)
        )
    ) {
        return RETRIEVAL_ERROR_INVALID_ARGUMENT;
    }
    ClearResult(result);
    return Guard(
        [=]() -> int {
            Retrieval::Configuration configuration;
            auto status = Retrieval::Boundary::ToConfiguration(config, configuration);
            if (status != RETRIEVAL_OK) {
                return status;
            }
            Retrieval::Digest expectedDigest;
            status = Retrieval::Boundary::ToDigest(*expected, expectedDigest);
            if (status != RETRIEVAL_OK) {
                return status;
            }
            const std::string encodedBody(
                (body == nullptr) ? "" : (const char*)body,
                body_size
            );
            const auto outcome = Retrieval::DecodeAndVerify(
                encodedBody,
                expectedDigest,
                configuration.GetDecoderLimits(max_decoded_size),
                read_size,
                Retrieval::Boundary::MakeLogForwarder(config),
                ((config == nullptr) ? 0 : config->log_level)
            );
            return Retrieval::Boundary::ToResult(outcome, nullptr, result);
        }
    );
}

extern "C" void retrieval_result_release(retrieval_result_t* result) {
    if (result == nullptr) {
        return;
    }
    free(result->content);
    result->content = nullptr;
    result->content_size = 0;
}

extern "C" uint32_t retrieval_version(void) {
    return RETRIEVAL_ABI_VERSION;
}
