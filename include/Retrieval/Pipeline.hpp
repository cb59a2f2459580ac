#ifndef RETRIEVAL_PIPELINE_HPP
#define RETRIEVAL_PIPELINE_HPP

/**
 * @file Pipeline.hpp
 *
 * This module declares the Retrieval::Pipeline class.
 *
 * © 2018 by Richard Walters
 */

#include "ChunkDecoder.hpp"
#include "Digest.hpp"
#include "Outcome.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Retrieval {

    /**
     * This class carries the body of a response from the raw bytes
     * received to a verification outcome.  Each byte is first decoded
     * from the chunked transfer coding, then optionally decompressed,
     * then hashed and handed to the content delegate, if any.
     *
     * An instance handles exactly one body.
     */
    class Pipeline {
        // Types
    public:
        /**
         * These are the content codings which the pipeline can remove.
         */
        enum class ContentCoding {
            /**
             * The content is not encoded.
             */
            Identity,

            /**
             * The content is in the "gzip" format.
             */
            Gzip,

            /**
             * The content is in the "zlib" format, which HTTP
             * calls "deflate".
             */
            Deflate,
        };

        /**
         * This holds everything that shapes how a body is processed.
         */
        struct Parameters {
            /**
             * These are the size limits for the chunked transfer coding.
             */
            ChunkDecoder::Limits limits;

            /**
             * This is the digest the content is expected to have.
             */
            Digest expected;

            /**
             * This is the content coding to remove before hashing.
             */
            ContentCoding contentCoding = ContentCoding::Identity;

            /**
             * This is the largest number of content bytes accepted after
             * the content coding is removed.  If zero, the largest total
             * of chunk data accepted is used.
             */
            uint64_t maxContentSize = 0;

            /**
             * This flag indicates whether or not the number of content
             * bytes is known in advance.
             */
            bool hasLengthHint = false;

            /**
             * If hasLengthHint is set, this is the number of content
             * bytes expected.
             */
            uint64_t lengthHint = 0;
        };

        /**
         * This is the type of delegate used to hand content bytes
         * to the user, after they have been hashed.
         *
         * @param[in] content
         *     These are the next content bytes.
         */
        typedef std::function< void(const std::string& content) > ContentDelegate;

        /**
         * This is the type of delegate used to ask the user whether
         * or not processing should be abandoned.
         *
         * @return
         *     An indication of whether or not processing should be
         *     abandoned is returned.
         */
        typedef std::function< bool() > CancellationCheck;

        // Lifecycle management
    public:
        ~Pipeline() noexcept;
        Pipeline(const Pipeline&) = delete;
        Pipeline(Pipeline&&) noexcept = delete;
        Pipeline& operator=(const Pipeline&) = delete;
        Pipeline& operator=(Pipeline&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs the pipeline.
         *
         * @param[in] parameters
         *     This holds everything that shapes how the body is processed.
         */
        explicit Pipeline(const Parameters& parameters);

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the pipeline.
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
         * once they have been hashed.
         *
         * @param[in] contentDelegate
         *     This is the delegate to call with content bytes
         *     once they have been hashed.
         */
        void SetContentDelegate(ContentDelegate contentDelegate);

        /**
         * This method sets the delegate to call before each update
         * of the digest, to find out whether or not processing
         * should be abandoned.
         *
         * @param[in] cancellationCheck
         *     This is the delegate to call before each update
         *     of the digest.
         */
        void SetCancellationCheck(CancellationCheck cancellationCheck);

        /**
         * This method processes the next bytes of the body.
         *
         * @param[in] data
         *     These are the next bytes of the body.
         *
         * @return
         *     The number of bytes accepted is returned.  Bytes which
         *     follow the end of the body are not accepted.
         */
        size_t Feed(const std::string& data);

        /**
         * This method tells the pipeline that no more bytes of the
         * body will come.  If the body was not complete, the outcome
         * is a truncation error.
         */
        void EndOfStream();

        /**
         * This method indicates whether or not the outcome is known.
         *
         * @return
         *     An indication of whether or not the outcome
         *     is known is returned.
         */
        bool IsComplete() const;

        /**
         * This method returns the outcome of processing the body.
         *
         * @return
         *     The outcome of processing the body is returned.
         *     It is only meaningful once IsComplete returns true.
         */
        const Outcome& GetOutcome() const;

        /**
         * This method returns the number of body bytes accepted so far.
         *
         * @return
         *     The number of body bytes accepted so far is returned.
         */
        uint64_t GetBodyBytesAccepted() const;

        /**
         * This method returns the number of content bytes given
         * to the digest so far.
         *
         * @return
         *     The number of content bytes given to the digest
         *     so far is returned.
         */
        uint64_t GetContentBytesHashed() const;

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
     * This function decodes and verifies a complete chunked body held
     * in memory, feeding it to a pipeline in pieces of the given size,
     * as if it had arrived from the network that way.
     *
     * @param[in] encodedBody
     *     This is the complete chunked body.
     *
     * @param[in] expected
     *     This is the digest the content is expected to have.
     *
     * @param[in] limits
     *     These are the size limits for the chunked transfer coding.
     *
     * @param[in] readSize
     *     This is the number of bytes to feed to the pipeline at a time.
     *     If zero, the whole body is fed at once.
     *
     * @param[in] diagnosticMessageDelegate
     *     If not nullptr, this is the function to call to deliver
     *     diagnostic messages published by the pipeline.
     *
     * @param[in] minLevel
     *     This is the minimum level of diagnostic message to deliver.
     *
     * @return
     *     The outcome of processing the body is returned.
     */
    Outcome DecodeAndVerify(
        const std::string& encodedBody,
        const Digest& expected,
        const ChunkDecoder::Limits& limits = ChunkDecoder::Limits(),
        size_t readSize = 0,
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate diagnosticMessageDelegate = nullptr,
        size_t minLevel = 0
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Pipeline::ContentCoding class.
     *
     * @param[in] contentCoding
     *     This is the content coding value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     content coding value.
     */
    void PrintTo(
        const Pipeline::ContentCoding& contentCoding,
        std::ostream* os
    );

}

#endif /* RETRIEVAL_PIPELINE_HPP */
