/**
 * @file Pipeline.cpp
 *
 * This module contains the implementation of the Retrieval::Pipeline class.
 *
 * © 2018 by Richard Walters
 */

#include "Inflate.hpp"

#include <algorithm>
#include <inttypes.h>
#include <memory>
#include <Retrieval/IntegrityVerifier.hpp>
#include <Retrieval/Pipeline.hpp>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <utility>

namespace {

    /**
     * This function maps the reason the chunked body decoder failed
     * to the corresponding kind of protocol error.
     *
     * @param[in] error
     *     This is the reason the chunked body decoder failed.
     *
     * @return
     *     The corresponding kind of protocol error is returned.
     */
    Retrieval::Outcome::ProtocolErrorKind MapDecoderError(Retrieval::ChunkDecoder::Error error) {
        switch (error) {
            case Retrieval::ChunkDecoder::Error::Truncated: {
            } return Retrieval::Outcome::ProtocolErrorKind::Truncated;

            case Retrieval::ChunkDecoder::Error::SizeExceeded: {
            } return Retrieval::Outcome::ProtocolErrorKind::SizeExceeded;

            case Retrieval::ChunkDecoder::Error::Malformed:
            case Retrieval::ChunkDecoder::Error::None:
            default: {
            } return Retrieval::Outcome::ProtocolErrorKind::Malformed;
        }
    }

}

namespace Retrieval {

    /**
     * This contains the private properties of a Pipeline instance.
     */
    struct Pipeline::Impl {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This holds everything that shapes how the body is processed.
         */
        Parameters parameters;

        /**
         * This decodes the chunked transfer coding of the body.
         */
        ChunkDecoder decoder;

        /**
         * If a content coding applies, this removes it.
         */
        std::unique_ptr< Inflater > inflater;

        /**
         * This computes and checks the digest of the content.
         */
        IntegrityVerifier verifier;

        /**
         * If set, this is the delegate to call with content bytes
         * once they have been hashed.
         */
        ContentDelegate contentDelegate;

        /**
         * If set, this is the delegate to call before each update
         * of the digest.
         */
        CancellationCheck cancellationCheck;

        /**
         * This is the number of content bytes produced so far.
         */
        uint64_t contentSize = 0;

        /**
         * This flag indicates whether or not the outcome is known.
         */
        bool complete = false;

        /**
         * This is the outcome of processing the body, once known.
         */
        Outcome outcome;

        // Methods

        /**
         * This is the constructor for the structure.
         *
         * @param[in] newParameters
         *     This holds everything that shapes how the body is processed.
         */
        explicit Impl(const Parameters& newParameters)
            : diagnosticsSender("Retrieval::Pipeline")
            , parameters(newParameters)
            , decoder(newParameters.limits)
            , verifier(newParameters.expected)
        {
            if (parameters.maxContentSize == 0) {
                parameters.maxContentSize = parameters.limits.maxDecodedSize;
            }
            switch (parameters.contentCoding) {
                case ContentCoding::Gzip: {
                    inflater.reset(new Inflater(InflateMode::Ungzip));
                } break;

                case ContentCoding::Deflate: {
                    inflater.reset(new Inflater(InflateMode::Inflate));
                } break;

                case ContentCoding::Identity:
                default: {
                } break;
            }
            if (!verifier.IsSupported()) {
                Complete(
                    Outcome::InvalidRequest(
                        SystemAbstractions::sprintf(
                            "unsupported digest algorithm 0x%" PRIx32,
                            (uint32_t)parameters.expected.algorithm
                        )
                    )
                );
            }
        }

        /**
         * This method records the outcome of processing the body.
         * The call has no effect if the outcome is already known.
         *
         * @param[in] newOutcome
         *     This is the outcome of processing the body.
         */
        void Complete(Outcome&& newOutcome) {
            if (complete) {
                return;
            }
            complete = true;
            outcome = std::move(newOutcome);
            diagnosticsSender.SendDiagnosticInformationString(
                (outcome.kind == Outcome::Kind::Verified) ? 3 : 5,
                outcome.Describe()
            );
        }

        /**
         * This method takes payload bytes decoded from the chunked body
         * through the rest of the pipeline.
         *
         * @param[in] payload
         *     These are the payload bytes decoded from the chunked body.
         */
        void ProcessPayload(const std::string& payload) {
            std::string inflated;
            if (inflater != nullptr) {
                if (!inflater->Inflate(payload, inflated)) {
                    Complete(
                        Outcome::ProtocolError(
                            Outcome::ProtocolErrorKind::BadContentCoding,
                            decoder.GetStreamOffset(),
                            "content coding could not be removed"
                        )
                    );
                    return;
                }
            }
            const auto& content = (
                (inflater == nullptr)
                ? payload
                : inflated
            );
            if (content.empty()) {
                return;
            }
            if (content.length() > parameters.maxContentSize - contentSize) {
                Complete(
                    Outcome::ProtocolError(
                        Outcome::ProtocolErrorKind::SizeExceeded,
                        decoder.GetStreamOffset(),
                        "content is larger than allowed"
                    )
                );
                return;
            }
            if (
                (cancellationCheck != nullptr)
                && cancellationCheck()
            ) {
                Complete(Outcome::Cancelled());
                return;
            }
            verifier.Update(content);
            contentSize += content.length();
            diagnosticsSender.SendDiagnosticInformationFormatted(
                0,
                "%zu content bytes hashed (%" PRIu64 " total)",
                content.length(),
                contentSize
            );
            if (contentDelegate != nullptr) {
                contentDelegate(content);
            }
        }

        /**
         * This method is called once the end of the chunked body is
         * found, to finish verification of the content.
         */
        void FinishVerification() {
            if (
                (inflater != nullptr)
                && !inflater->IsFinished()
            ) {
                Complete(
                    Outcome::ProtocolError(
                        Outcome::ProtocolErrorKind::BadContentCoding,
                        decoder.GetStreamOffset(),
                        "content coding ended early"
                    )
                );
                return;
            }
            if (
                parameters.hasLengthHint
                && (parameters.lengthHint != contentSize)
            ) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    5,
                    "expected %" PRIu64 " content bytes, received %" PRIu64,
                    parameters.lengthHint,
                    contentSize
                );
            }
            if (verifier.Finish()) {
                Complete(
                    Outcome::Verified(
                        contentSize,
                        verifier.GetActual()
                    )
                );
            } else {
                Complete(
                    Outcome::Mismatch(
                        contentSize,
                        verifier.GetExpected(),
                        verifier.GetActual()
                    )
                );
            }
        }

        /**
         * This method checks the state of the chunked body decoder,
         * completing the pipeline if the decoder is finished.
         */
        void CheckDecoder() {
            switch (decoder.GetState()) {
                case ChunkDecoder::State::Done: {
                    FinishVerification();
                } break;

                case ChunkDecoder::State::Failed: {
                    Complete(
                        Outcome::ProtocolError(
                            MapDecoderError(decoder.GetError()),
                            decoder.GetErrorOffset()
                        )
                    );
                } break;

                case ChunkDecoder::State::AwaitingSizeLine:
                case ChunkDecoder::State::AwaitingChunkData:
                case ChunkDecoder::State::AwaitingChunkTerminator:
                case ChunkDecoder::State::AwaitingTrailerHeaders:
                default: {
                } break;
            }
        }
    };

    Pipeline::~Pipeline() noexcept = default;

    Pipeline::Pipeline(const Parameters& parameters)
        : impl_(new Impl(parameters))
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Pipeline::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    void Pipeline::SetContentDelegate(ContentDelegate contentDelegate) {
        impl_->contentDelegate = contentDelegate;
    }

    void Pipeline::SetCancellationCheck(CancellationCheck cancellationCheck) {
        impl_->cancellationCheck = cancellationCheck;
    }

    size_t Pipeline::Feed(const std::string& data) {
        if (impl_->complete) {
            return 0;
        }
        std::string payload;
        const auto accepted = impl_->decoder.Decode(data, payload);
        if (!payload.empty()) {
            impl_->ProcessPayload(payload);
        }
        if (!impl_->complete) {
            impl_->CheckDecoder();
        }
        return accepted;
    }

    void Pipeline::EndOfStream() {
        if (impl_->complete) {
            return;
        }
        impl_->decoder.Finish();
        impl_->CheckDecoder();
    }

    bool Pipeline::IsComplete() const {
        return impl_->complete;
    }

    const Outcome& Pipeline::GetOutcome() const {
        return impl_->outcome;
    }

    uint64_t Pipeline::GetBodyBytesAccepted() const {
        return impl_->decoder.GetStreamOffset();
    }

    uint64_t Pipeline::GetContentBytesHashed() const {
        return impl_->contentSize;
    }

    Outcome DecodeAndVerify(
        const std::string& encodedBody,
        const Digest& expected,
        const ChunkDecoder::Limits& limits,
        size_t readSize,
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate diagnosticMessageDelegate,
        size_t minLevel
    ) {
        Pipeline::Parameters parameters;
        parameters.limits = limits;
        parameters.expected = expected;
        Pipeline pipeline(parameters);
        if (diagnosticMessageDelegate != nullptr) {
            (void)pipeline.SubscribeToDiagnostics(diagnosticMessageDelegate, minLevel);
        }
        if (readSize == 0) {
            readSize = std::max(encodedBody.length(), (size_t)1);
        }
        for (
            size_t offset = 0;
            (offset < encodedBody.length()) && !pipeline.IsComplete();
            offset += readSize
        ) {
            (void)pipeline.Feed(encodedBody.substr(offset, readSize));
        }
        pipeline.EndOfStream();
        return pipeline.GetOutcome();
    }

    void PrintTo(
        const Pipeline::ContentCoding& contentCoding,
        std::ostream* os
    ) {
        switch (contentCoding) {
            case Pipeline::ContentCoding::Identity: {
                *os << "identity";
            } break;
            case Pipeline::ContentCoding::Gzip: {
                *os << "gzip";
            } break;
            case Pipeline::ContentCoding::Deflate: {
                *os << "deflate";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
