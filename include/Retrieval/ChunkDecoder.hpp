#ifndef RETRIEVAL_CHUNK_DECODER_HPP
#define RETRIEVAL_CHUNK_DECODER_HPP

/**
 * @file ChunkDecoder.hpp
 *
 * This module declares the Retrieval::ChunkDecoder class.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <ostream>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace Retrieval {

    /**
     * This describes the chunk-size line of the chunk most recently
     * decoded.
     */
    struct ChunkFrame {
        /**
         * This is the declared size of the chunk, in bytes.
         */
        size_t size = 0;

        /**
         * These are the raw chunk extensions, if any, including the
         * leading semicolon.  They carry no meaning to the decoder.
         */
        std::string extensions;
    };

    /**
     * This class is used to decode a message body which is using
     * Chunked Transfer Encoding, as described by section 4.1 of
     * [RFC 7230](https://tools.ietf.org/html/rfc7230).
     *
     * Raw body bytes are pushed in as they arrive from the network, and
     * decoded payload bytes are handed back to the caller from each call.
     * Framing errors are classified so that a peer which violated the
     * protocol can be told apart from a connection which simply ended early.
     *
     * An instance decodes exactly one body; it cannot be restarted.
     */
    class ChunkDecoder {
        // Types
    public:
        /**
         * These are the different states that the decoder can have.
         */
        enum class State {
            /**
             * End of chunks not yet found, decoding next chunk-size line.
             */
            AwaitingSizeLine,

            /**
             * End of chunks not yet found, reading next chunk data.
             */
            AwaitingChunkData,

            /**
             * End of chunks not yet found, reading the line terminator
             * which follows the chunk data.
             */
            AwaitingChunkTerminator,

            /**
             * Last chunk found; consuming trailer lines until the
             * empty line which ends the body.
             */
            AwaitingTrailerHeaders,

            /**
             * End of chunked body and trailer found.
             */
            Done,

            /**
             * Unrecoverable error; reject input.  Call GetError to find
             * out why.
             */
            Failed,
        };

        /**
         * These are the reasons why decoding can fail.
         */
        enum class Error {
            /**
             * Decoding has not failed.
             */
            None,

            /**
             * The input violates the chunked framing.
             */
            Malformed,

            /**
             * The input ended before the last chunk and trailer
             * were complete.
             */
            Truncated,

            /**
             * A size limit given to the decoder was exceeded.
             */
            SizeExceeded,
        };

        /**
         * These are the size limits which the decoder enforces.
         */
        struct Limits {
            /**
             * This is the largest chunk size accepted.
             */
            uint64_t maxChunkSize = 16 * 1024 * 1024;

            /**
             * This is the largest total of chunk data accepted.
             */
            uint64_t maxDecodedSize = 1024 * 1024 * 1024;

            /**
             * This is the longest chunk-size line accepted, not counting
             * its line terminator, but including any chunk extensions.
             */
            size_t maxSizeLineLength = 4096;

            /**
             * This is the largest number of trailer bytes accepted,
             * not counting line terminators.
             */
            size_t maxTrailerSize = 8192;
        };

        // Lifecycle management
    public:
        ~ChunkDecoder() noexcept;
        ChunkDecoder(const ChunkDecoder&) = delete;
        ChunkDecoder(ChunkDecoder&&) noexcept = delete;
        ChunkDecoder& operator=(const ChunkDecoder&) = delete;
        ChunkDecoder& operator=(ChunkDecoder&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs a decoder which uses the default limits.
         */
        ChunkDecoder();

        /**
         * This constructs a decoder which uses the given limits.
         *
         * @param[in] limits
         *     These are the size limits to enforce.
         */
        explicit ChunkDecoder(const Limits& limits);

        /**
         * This method continues the decoding of the chunked body,
         * passing more characters into the decoding process.
         *
         * @note
         *     Call GetState afterwards to determine whether or not
         *     the decoding process encountered an error or if the body
         *     decoding is complete.
         *
         * @param[in] input
         *     This contains the characters to input into the
         *     decoding process.
         *
         * @param[in,out] payload
         *     Any payload bytes decoded from the input are appended here.
         *
         * @param[in] offset
         *     This is the position of the first character in the given
         *     input string which should be input into the decoding process.
         *
         * @param[in] length
         *     This is the number of characters to input into the
         *     decoding process.  If zero, all characters in the given string
         *     from the offset to the end of the string are input.
         *
         * @return
         *     The number of characters accepted into the decoding process
         *     is returned.  Characters which follow the end of the body
         *     are not accepted.
         */
        size_t Decode(
            const std::string& input,
            std::string& payload,
            size_t offset = 0,
            size_t length = 0
        );

        /**
         * This method tells the decoder that no more input will come.
         * If the body was not complete, the decoder fails with
         * Error::Truncated.
         */
        void Finish();

        /**
         * This method returns the current state of the decoding process.
         *
         * @return
         *     The current state of the decoding process is returned.
         */
        State GetState() const;

        /**
         * This method returns the reason decoding failed.
         *
         * @return
         *     The reason decoding failed is returned, or Error::None
         *     if it has not failed.
         */
        Error GetError() const;

        /**
         * This method returns the position in the encoded stream
         * at which decoding failed.
         *
         * @return
         *     The offset of the byte which caused the failure is returned,
         *     or for Error::Truncated, the total number of bytes input.
         */
        uint64_t GetErrorOffset() const;

        /**
         * This method returns the number of encoded bytes accepted so far.
         *
         * @return
         *     The number of encoded bytes accepted so far is returned.
         */
        uint64_t GetStreamOffset() const;

        /**
         * This method returns the number of payload bytes produced so far.
         *
         * @return
         *     The number of payload bytes produced so far is returned.
         */
        uint64_t GetDecodedSize() const;

        /**
         * This method returns the chunk-size line most recently decoded.
         *
         * @return
         *     The chunk-size line most recently decoded is returned.
         */
        const ChunkFrame& GetLastFrame() const;

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
     * values of the Retrieval::ChunkDecoder::State class.
     *
     * @param[in] state
     *     This is the chunk decoding state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     chunk decoding state value.
     */
    void PrintTo(
        const ChunkDecoder::State& state,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::ChunkDecoder::Error class.
     *
     * @param[in] error
     *     This is the chunk decoding error value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     chunk decoding error value.
     */
    void PrintTo(
        const ChunkDecoder::Error& error,
        std::ostream* os
    );

}

#endif /* RETRIEVAL_CHUNK_DECODER_HPP */
