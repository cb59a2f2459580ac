#ifndef RETRIEVAL_INTEGRITY_VERIFIER_HPP
#define RETRIEVAL_INTEGRITY_VERIFIER_HPP

/**
 * @file IntegrityVerifier.hpp
 *
 * This module declares the Retrieval::IntegrityVerifier class.
 *
 * © 2018 by Richard Walters
 */

#include "Digest.hpp"

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>

namespace Retrieval {

    /**
     * This class hashes content incrementally, as it arrives, and then
     * compares the result with the digest the content is expected to have.
     */
    class IntegrityVerifier {
        // Lifecycle management
    public:
        ~IntegrityVerifier() noexcept;
        IntegrityVerifier(const IntegrityVerifier&) = delete;
        IntegrityVerifier(IntegrityVerifier&&) noexcept = delete;
        IntegrityVerifier& operator=(const IntegrityVerifier&) = delete;
        IntegrityVerifier& operator=(IntegrityVerifier&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs the verifier.
         *
         * @param[in] expected
         *     This is the digest the content is expected to have.
         *     Its algorithm selects the hash function to use.
         */
        explicit IntegrityVerifier(const Digest& expected);

        /**
         * This method indicates whether or not the hash function
         * selected by the expected digest is available.
         *
         * @return
         *     An indication of whether or not the hash function
         *     is available is returned.
         */
        bool IsSupported() const;

        /**
         * This method adds more content to the digest computation.
         *
         * @param[in] data
         *     This points to the content to add.
         *
         * @param[in] size
         *     This is the number of bytes of content to add.
         */
        void Update(const void* data, size_t size);

        /**
         * This method adds more content to the digest computation.
         *
         * @param[in] data
         *     This is the content to add.
         */
        void Update(const std::string& data);

        /**
         * This method completes the digest computation and compares
         * the result with the expected digest.  Further calls have no effect.
         *
         * @return
         *     An indication of whether or not the computed digest
         *     is exactly the expected digest is returned.
         */
        bool Finish();

        /**
         * This method returns the digest the content is expected to have.
         *
         * @return
         *     The digest the content is expected to have is returned.
         */
        const Digest& GetExpected() const;

        /**
         * This method returns the digest computed from the content.
         *
         * @return
         *     The digest computed from the content is returned.
         *     It is empty until Finish is called.
         */
        const Digest& GetActual() const;

        /**
         * This method returns the number of content bytes hashed so far.
         *
         * @return
         *     The number of content bytes hashed so far is returned.
         */
        uint64_t GetByteCount() const;

        /**
         * This function computes the digest of the given content in one go.
         *
         * @param[in] algorithm
         *     This identifies the hash function to use.
         *
         * @param[in] content
         *     This is the content to hash.
         *
         * @return
         *     The digest of the content is returned.  If the hash function
         *     is not available, the digest bytes are empty.
         */
        static Digest Compute(
            Digest::Algorithm algorithm,
            const std::string& content
        );

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

#endif /* RETRIEVAL_INTEGRITY_VERIFIER_HPP */
