/**
 * @file Inflate.cpp
 *
 * This module contains the implementation of the Retrieval::Inflater class.
 *
 * © 2018 by Richard Walters
 */

#include "Inflate.hpp"

#include <stddef.h>
#include <string>
#include <zlib.h>

namespace {

    /**
     * This is the number of bytes that we will allocate at a time while
     * inflating data.
     */
    constexpr size_t INFLATE_BUFFER_INCREMENT = 65536;

}

namespace Retrieval {

    /**
     * This contains the private properties of an Inflater instance.
     */
    struct Inflater::Impl {
        /**
         * This is the zlib decompression stream.
         */
        z_stream inflateStream;

        /**
         * This indicates whether or not the stream was initialized.
         */
        bool initialized = false;

        /**
         * This indicates whether or not the end of the compressed
         * stream has been reached.
         */
        bool finished = false;

        /**
         * This indicates whether or not the compressed stream
         * was found to be invalid.
         */
        bool failed = false;
    };

    Inflater::~Inflater() noexcept {
        if (impl_->initialized) {
            (void)inflateEnd(&impl_->inflateStream);
        }
    }

    Inflater::Inflater(InflateMode mode)
        : impl_(new Impl)
    {
        impl_->inflateStream.zalloc = Z_NULL;
        impl_->inflateStream.zfree = Z_NULL;
        impl_->inflateStream.opaque = Z_NULL;
        impl_->inflateStream.next_in = Z_NULL;
        impl_->inflateStream.avail_in = 0;
        if (mode == InflateMode::Ungzip) {
            impl_->initialized = (
                inflateInit2(
                    &impl_->inflateStream,
                    16 + MAX_WBITS
                ) == Z_OK
            );
        } else {
            impl_->initialized = (inflateInit(&impl_->inflateStream) == Z_OK);
        }
        impl_->failed = !impl_->initialized;
    }

    bool Inflater::Inflate(
        const std::string& input,
        std::string& output
    ) {
        if (impl_->failed) {
            return false;
        }
        if (input.empty()) {
            return true;
        }
        if (impl_->finished) {
            impl_->failed = true;
            return false;
        }
        impl_->inflateStream.next_in = (Bytef*)input.data();
        impl_->inflateStream.avail_in = (uInt)input.size();
        while (impl_->inflateStream.avail_in > 0) {
            const size_t totalInflatedPreviously = output.size();
            output.resize(totalInflatedPreviously + INFLATE_BUFFER_INCREMENT);
            impl_->inflateStream.next_out = (Bytef*)&output[totalInflatedPreviously];
            impl_->inflateStream.avail_out = INFLATE_BUFFER_INCREMENT;
            const auto inputAvailablePreviously = impl_->inflateStream.avail_in;
            const auto result = inflate(&impl_->inflateStream, Z_NO_FLUSH);
            output.resize(
                totalInflatedPreviously
                + INFLATE_BUFFER_INCREMENT
                - impl_->inflateStream.avail_out
            );
            if (result == Z_STREAM_END) {
                impl_->finished = true;
                if (impl_->inflateStream.avail_in > 0) {
                    impl_->failed = true;
                    return false;
                }
                break;
            } else if (
                (
                    (result == Z_BUF_ERROR)
                    && (impl_->inflateStream.avail_in == inputAvailablePreviously)
                    && (impl_->inflateStream.avail_out == INFLATE_BUFFER_INCREMENT)
                )
                || (
                    (result != Z_OK)
                    && (result != Z_BUF_ERROR)
                )
            ) {
                impl_->failed = true;
                return false;
            }
        }
        return true;
    }

    bool Inflater::IsFinished() const {
        return impl_->finished;
    }

}
