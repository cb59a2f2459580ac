#ifndef RETRIEVAL_INFLATE_HPP
#define RETRIEVAL_INFLATE_HPP

/**
 * @file Inflate.hpp
 *
 * This module declares the Retrieval::Inflater class.
 *
 * © 2018 by Richard Walters
 */

#include <memory>
#include <string>

namespace Retrieval {

    /**
     * This is used to pick a decompression mode for the Inflater class.
     */
    enum class InflateMode {
        /**
         * This selects the "zlib" data format
         * [RFC1950](https://tools.ietf.org/html/rfc1950) containing a
         * "deflate" compressed data stream
         * [RFC1951](https://tools.ietf.org/html/rfc1951) that uses a
         * combination of the Lempel-Ziv (LZ77) compression algorithm and
         * Huffman coding.
         */
        Inflate,

        /**
         * This selects the "gzip" data format, which is an LZ77 coding with a
         * 32-bit Cyclic Redundancy Check (CRC) that is commonly produced by
         * the gzip file compression program
         * [RFC1952](https://tools.ietf.org/html/rfc1952).
         */
        Ungzip,
    };

    /**
     * This class decompresses a stream of bytes delivered in pieces,
     * producing decompressed bytes as soon as they are available.
     */
    class Inflater {
        // Lifecycle management
    public:
        ~Inflater() noexcept;
        Inflater(const Inflater&) = delete;
        Inflater(Inflater&&) noexcept = delete;
        Inflater& operator=(const Inflater&) = delete;
        Inflater& operator=(Inflater&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs the inflater.
         *
         * @param[in] mode
         *     This identifies the decompression scheme to use.
         */
        explicit Inflater(InflateMode mode);

        /**
         * This method decompresses the next piece of the stream.
         *
         * @param[in] input
         *     These are the next bytes of the compressed stream.
         *
         * @param[in,out] output
         *     Decompressed bytes are appended here.
         *
         * @return
         *     An indication of whether or not the bytes were successfully
         *     decompressed is returned.  Bytes which follow the end of the
         *     compressed stream are an error.
         */
        bool Inflate(
            const std::string& input,
            std::string& output
        );

        /**
         * This method indicates whether or not the end of the
         * compressed stream has been reached.
         *
         * @return
         *     An indication of whether or not the end of the
         *     compressed stream has been reached is returned.
         */
        bool IsFinished() const;

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

#endif /* RETRIEVAL_INFLATE_HPP */
