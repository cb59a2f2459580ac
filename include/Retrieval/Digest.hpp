#ifndef RETRIEVAL_DIGEST_HPP
#define RETRIEVAL_DIGEST_HPP

/**
 * @file Digest.hpp
 *
 * This module declares the Retrieval::Digest structure.
 *
 * © 2018 by Richard Walters
 */

#include <ostream>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace Retrieval {

    /**
     * This represents the content identity of a resource: the output of
     * a cryptographic hash function applied to the content, tagged with
     * the function used.
     */
    struct Digest {
        // Types

        /**
         * These are the hash functions which can produce a digest.
         * The values are the multihash codes of the functions.
         */
        enum class Algorithm : uint32_t {
            Sha2_256 = 0x12,
            Sha2_512 = 0x13,
            Sha3_512 = 0x14,
            Sha3_256 = 0x16,
        };

        // Properties

        /**
         * This identifies the hash function which produced the digest.
         */
        Algorithm algorithm = Algorithm::Sha2_256;

        /**
         * This is the output of the hash function.
         */
        std::vector< uint8_t > bytes;

        // Methods

        /**
         * This is the equality comparison operator.  Digests are equal
         * only if they have the same algorithm and exactly the same bytes.
         *
         * @param[in] other
         *     This is the other digest to compare with this one.
         *
         * @return
         *     An indication of whether or not the two digests
         *     are equal is returned.
         */
        bool operator==(const Digest& other) const;

        /**
         * This is the inequality comparison operator.
         *
         * @param[in] other
         *     This is the other digest to compare with this one.
         *
         * @return
         *     An indication of whether or not the two digests
         *     are different is returned.
         */
        bool operator!=(const Digest& other) const;

        /**
         * This method renders the digest bytes as lowercase hexadecimal.
         *
         * @return
         *     The digest bytes as lowercase hexadecimal are returned.
         */
        std::string ToHex() const;

        /**
         * This function constructs a digest from its hexadecimal form.
         *
         * @param[in] algorithm
         *     This identifies the hash function which produced the digest.
         *
         * @param[in] hex
         *     This is the hexadecimal form of the digest bytes.
         *
         * @param[out] digest
         *     This is where to store the digest.
         *
         * @return
         *     An indication of whether or not the hexadecimal string
         *     could be decoded is returned.
         */
        static bool FromHex(
            Algorithm algorithm,
            const std::string& hex,
            Digest& digest
        );

        /**
         * This function returns the number of bytes produced by
         * the given hash function.
         *
         * @param[in] algorithm
         *     This identifies the hash function.
         *
         * @return
         *     The number of bytes produced by the given hash function
         *     is returned, or zero if the function is not known.
         */
        static size_t SizeOf(Algorithm algorithm);
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Retrieval::Digest structure.
     *
     * @param[in] digest
     *     This is the digest value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the digest value.
     */
    void PrintTo(
        const Digest& digest,
        std::ostream* os
    );

}

#endif /* RETRIEVAL_DIGEST_HPP */
