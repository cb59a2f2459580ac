/**
 * @file IntegrityVerifier.cpp
 *
 * This module contains the implementation of the
 * Retrieval::IntegrityVerifier class.
 *
 * © 2018 by Richard Walters
 */

#include <openssl/evp.h>
#include <Retrieval/IntegrityVerifier.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace {

    /**
     * This owns an OpenSSL message digest context.
     */
    struct EvpMdCtx {
        EVP_MD_CTX* ctx = nullptr;

        EvpMdCtx()
            : ctx(EVP_MD_CTX_new())
        {
        }

        ~EvpMdCtx() {
            if (ctx != nullptr) {
                EVP_MD_CTX_free(ctx);
            }
        }

        EvpMdCtx(const EvpMdCtx&) = delete;
        EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    };

    /**
     * This function looks up the OpenSSL message digest implementing
     * the given hash function.
     *
     * @param[in] algorithm
     *     This identifies the hash function.
     *
     * @return
     *     The OpenSSL message digest implementing the hash function
     *     is returned, or nullptr if there isn't one.
     */
    const EVP_MD* LookUpMessageDigest(Retrieval::Digest::Algorithm algorithm) {
        switch (algorithm) {
            case Retrieval::Digest::Algorithm::Sha2_256: return EVP_sha256();
            case Retrieval::Digest::Algorithm::Sha2_512: return EVP_sha512();
            case Retrieval::Digest::Algorithm::Sha3_512: return EVP_sha3_512();
            case Retrieval::Digest::Algorithm::Sha3_256: return EVP_sha3_256();
            default: return nullptr;
        }
    }

}

namespace Retrieval {

    /**
     * This contains the private properties of an IntegrityVerifier instance.
     */
    struct IntegrityVerifier::Impl {
        /**
         * This is the digest the content is expected to have.
         */
        Digest expected;

        /**
         * This is the digest computed from the content, once finished.
         */
        Digest actual;

        /**
         * This is the OpenSSL context used to compute the digest.
         */
        EvpMdCtx context;

        /**
         * This indicates whether or not the context was set up
         * successfully for the expected digest's hash function.
         */
        bool supported = false;

        /**
         * This indicates whether or not the computation was finished.
         */
        bool finished = false;

        /**
         * This is the outcome of the comparison, once finished.
         */
        bool matched = false;

        /**
         * This is the number of content bytes hashed so far.
         */
        uint64_t byteCount = 0;
    };

    IntegrityVerifier::~IntegrityVerifier() noexcept = default;

    IntegrityVerifier::IntegrityVerifier(const Digest& expected)
        : impl_(new Impl)
    {
        impl_->expected = expected;
        impl_->actual.algorithm = expected.algorithm;
        const auto messageDigest = LookUpMessageDigest(expected.algorithm);
        impl_->supported = (
            (messageDigest != nullptr)
            && (impl_->context.ctx != nullptr)
            && (EVP_DigestInit_ex(impl_->context.ctx, messageDigest, nullptr) == 1)
        );
    }

    bool IntegrityVerifier::IsSupported() const {
        return impl_->supported;
    }

    void IntegrityVerifier::Update(const void* data, size_t size) {
        if (
            !impl_->supported
            || impl_->finished
            || (size == 0)
        ) {
            return;
        }
        if (EVP_DigestUpdate(impl_->context.ctx, data, size) != 1) {
            impl_->supported = false;
            return;
        }
        impl_->byteCount += size;
    }

    void IntegrityVerifier::Update(const std::string& data) {
        Update(data.data(), data.length());
    }

    bool IntegrityVerifier::Finish() {
        if (impl_->finished) {
            return impl_->matched;
        }
        impl_->finished = true;
        if (!impl_->supported) {
            return false;
        }
        unsigned char buffer[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(impl_->context.ctx, buffer, &length) != 1) {
            return false;
        }
        impl_->actual.bytes.assign(buffer, buffer + length);
        impl_->matched = (impl_->actual == impl_->expected);
        return impl_->matched;
    }

    const Digest& IntegrityVerifier::GetExpected() const {
        return impl_->expected;
    }

    const Digest& IntegrityVerifier::GetActual() const {
        return impl_->actual;
    }

    uint64_t IntegrityVerifier::GetByteCount() const {
        return impl_->byteCount;
    }

    Digest IntegrityVerifier::Compute(
        Digest::Algorithm algorithm,
        const std::string& content
    ) {
        Digest expected;
        expected.algorithm = algorithm;
        IntegrityVerifier verifier(expected);
        verifier.Update(content);
        (void)verifier.Finish();
        return verifier.GetActual();
    }

}
