/**
 * @file ChunkDecoder.cpp
 *
 * This module contains the implementation of the Retrieval::ChunkDecoder
 * class.
 *
 * © 2018 by Richard Walters
 */

#include <algorithm>
#include <Retrieval/ChunkDecoder.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <utility>

namespace {

    /**
     * These are the characters which are valid for use in tokens.
     */
    const std::string TCHAR = "!#$%&'*+-.^_`|~0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

    /**
     * These are the positions within a chunk-size line, including
     * the chunk-ext grammar of section 4.1.1 of RFC 7230.
     */
    enum class SizeLineState {
        /**
         * chunk-size (first character)
         */
        FirstDigit,

        /**
         * chunk-size (not first character)
         */
        Digits,

        /**
         * chunk-ext: chunk-ext-name (first character)
         */
        ExtensionNameFirst,

        /**
         * chunk-ext: chunk-ext-name (not first character)
         */
        ExtensionName,

        /**
         * chunk-ext: chunk-ext-val (first character)
         */
        ExtensionValueFirst,

        /**
         * chunk-ext: chunk-ext-val (token, not first character)
         */
        ExtensionValueToken,

        /**
         * chunk-ext: chunk-ext-val (quoted-string, not first character)
         */
        ExtensionValueQuoted,

        /**
         * chunk-ext: chunk-ext-val (quoted-string, second character
         * of quoted-pair)
         */
        ExtensionValueQuotedPair,

        /**
         * chunk-ext: next character after a quoted-string value
         */
        AfterQuotedValue,

        /**
         * carriage return seen; line feed must follow
         */
        LineFeed,
    };

    /**
     * This function determines whether or not the given character
     * may be used in a token.
     *
     * @param[in] c
     *     This is the character to check.
     *
     * @return
     *     An indication of whether or not the given character
     *     may be used in a token is returned.
     */
    bool IsTokenCharacter(char c) {
        return (
            (c != 0)
            && (TCHAR.find(c) != std::string::npos)
        );
    }

    /**
     * This function determines whether or not the given character
     * may appear unescaped in a quoted-string.
     *
     * @param[in] c
     *     This is the character to check.
     *
     * @return
     *     An indication of whether or not the given character
     *     may appear unescaped in a quoted-string is returned.
     */
    bool IsQuotedTextCharacter(char c) {
        const auto uc = (unsigned char)c;
        return (
            (uc == '\t')
            || (uc == ' ')
            || (uc == 0x21)
            || ((uc >= 0x23) && (uc <= 0x5B))
            || ((uc >= 0x5D) && (uc <= 0x7E))
            || (uc >= 0x80)
        );
    }

    /**
     * This function determines whether or not the given character
     * may follow a backslash in a quoted-string.
     *
     * @param[in] c
     *     This is the character to check.
     *
     * @return
     *     An indication of whether or not the given character
     *     may follow a backslash in a quoted-string is returned.
     */
    bool IsQuotedPairCharacter(char c) {
        const auto uc = (unsigned char)c;
        return (
            (uc == '\t')
            || (uc == ' ')
            || ((uc >= 0x21) && (uc <= 0x7E))
            || (uc >= 0x80)
        );
    }

    /**
     * This function decodes the given character as a hexadecimal digit.
     *
     * @param[in] c
     *     This is the character to decode.
     *
     * @param[out] value
     *     This is where to store the value of the digit.
     *
     * @return
     *     An indication of whether or not the character is
     *     a hexadecimal digit is returned.
     */
    bool DecodeHexDigit(char c, uint64_t& value) {
        if ((c >= '0') && (c <= '9')) {
            value = (uint64_t)(c - '0');
        } else if ((c >= 'A') && (c <= 'F')) {
            value = (uint64_t)(c - 'A') + 10;
        } else if ((c >= 'a') && (c <= 'f')) {
            value = (uint64_t)(c - 'a') + 10;
        } else {
            return false;
        }
        return true;
    }

}

namespace Retrieval {

    /**
     * This contains the private properties of a ChunkDecoder instance.
     */
    struct ChunkDecoder::Impl {
        // Properties

        /**
         * These are the size limits to enforce.
         */
        Limits limits;

        /**
         * This is the current state of the decoding of the chunked body.
         */
        State state = State::AwaitingSizeLine;

        /**
         * If the state is State::Failed, this is the reason.
         */
        Error error = Error::None;

        /**
         * If the state is State::Failed, this is where in the
         * encoded stream the failure happened.
         */
        uint64_t errorOffset = 0;

        /**
         * This is the number of encoded bytes accepted so far.
         */
        uint64_t streamOffset = 0;

        /**
         * This is the number of payload bytes produced so far.
         */
        uint64_t decodedSize = 0;

        /**
         * This is where we are within the current chunk-size line.
         */
        SizeLineState sizeLineState = SizeLineState::FirstDigit;

        /**
         * This is the chunk size decoded so far from the current
         * chunk-size line.
         */
        uint64_t chunkSize = 0;

        /**
         * This is the number of characters of the current chunk-size
         * line seen so far, not counting the line terminator.
         */
        size_t sizeLineLength = 0;

        /**
         * These are the chunk extensions of the current chunk-size line.
         */
        std::string extensions;

        /**
         * If we're in the AwaitingChunkData state, this is the number of
         * bytes that still need to be input.
         */
        uint64_t chunkBytesMissing = 0;

        /**
         * This flag indicates whether or not the carriage return
         * following the chunk data has been seen.
         */
        bool terminatorCarriageReturnSeen = false;

        /**
         * This is the number of characters of the current trailer line
         * seen so far.
         */
        size_t trailerLineLength = 0;

        /**
         * This is the total number of trailer characters seen so far.
         */
        size_t trailerSize = 0;

        /**
         * This flag indicates whether or not the carriage return
         * ending the current trailer line has been seen.
         */
        bool trailerCarriageReturnSeen = false;

        /**
         * This describes the chunk-size line most recently decoded.
         */
        ChunkFrame lastFrame;

        // Methods

        /**
         * This method puts the decoder into the failed state.
         *
         * @param[in] newError
         *     This is the reason decoding failed.
         */
        void Fail(Error newError) {
            state = State::Failed;
            error = newError;
            errorOffset = streamOffset;
        }

        /**
         * This method is called once the line terminator of a chunk-size
         * line has been seen.
         */
        void CompleteSizeLine() {
            lastFrame.size = (size_t)chunkSize;
            lastFrame.extensions = std::move(extensions);
            extensions.clear();
            sizeLineState = SizeLineState::FirstDigit;
            sizeLineLength = 0;
            if (chunkSize > limits.maxDecodedSize - decodedSize) {
                Fail(Error::SizeExceeded);
                return;
            }
            if (chunkSize == 0) {
                trailerLineLength = 0;
                trailerSize = 0;
                trailerCarriageReturnSeen = false;
                state = State::AwaitingTrailerHeaders;
            } else {
                chunkBytesMissing = chunkSize;
                state = State::AwaitingChunkData;
            }
            chunkSize = 0;
        }

        /**
         * This method decodes the next character of a chunk-size line.
         *
         * @param[in] c
         *     This is the character to decode.
         */
        void DecodeSizeLineCharacter(char c) {
            if (
                (sizeLineState != SizeLineState::LineFeed)
                && (c != '\r')
                && (++sizeLineLength > limits.maxSizeLineLength)
            ) {
                Fail(Error::SizeExceeded);
                return;
            }
            const bool inExtensions = (
                (sizeLineState != SizeLineState::FirstDigit)
                && (sizeLineState != SizeLineState::Digits)
                && (sizeLineState != SizeLineState::LineFeed)
            );
            switch (sizeLineState) {
                case SizeLineState::FirstDigit:
                case SizeLineState::Digits: {
                    uint64_t nextDigit = 0;
                    if (DecodeHexDigit(c, nextDigit)) {
                        if (
                            (chunkSize > limits.maxChunkSize / 16)
                            || (nextDigit > limits.maxChunkSize - chunkSize * 16)
                        ) {
                            Fail(Error::SizeExceeded);
                            return;
                        }
                        chunkSize = chunkSize * 16 + nextDigit;
                        sizeLineState = SizeLineState::Digits;
                    } else if (sizeLineState == SizeLineState::FirstDigit) {
                        Fail(Error::Malformed);
                        return;
                    } else if (c == ';') {
                        sizeLineState = SizeLineState::ExtensionNameFirst;
                    } else if (c == '\r') {
                        sizeLineState = SizeLineState::LineFeed;
                    } else {
                        Fail(Error::Malformed);
                        return;
                    }
                } break;

                case SizeLineState::ExtensionNameFirst: {
                    if (!IsTokenCharacter(c)) {
                        Fail(Error::Malformed);
                        return;
                    }
                    sizeLineState = SizeLineState::ExtensionName;
                } break;

                case SizeLineState::ExtensionName: {
                    if (c == '=') {
                        sizeLineState = SizeLineState::ExtensionValueFirst;
                    } else if (c == ';') {
                        sizeLineState = SizeLineState::ExtensionNameFirst;
                    } else if (c == '\r') {
                        sizeLineState = SizeLineState::LineFeed;
                    } else if (!IsTokenCharacter(c)) {
                        Fail(Error::Malformed);
                        return;
                    }
                } break;

                case SizeLineState::ExtensionValueFirst: {
                    if (c == '"') {
                        sizeLineState = SizeLineState::ExtensionValueQuoted;
                    } else if (IsTokenCharacter(c)) {
                        sizeLineState = SizeLineState::ExtensionValueToken;
                    } else {
                        Fail(Error::Malformed);
                        return;
                    }
                } break;

                case SizeLineState::ExtensionValueToken: {
                    if (c == ';') {
                        sizeLineState = SizeLineState::ExtensionNameFirst;
                    } else if (c == '\r') {
                        sizeLineState = SizeLineState::LineFeed;
                    } else if (!IsTokenCharacter(c)) {
                        Fail(Error::Malformed);
                        return;
                    }
                } break;

                case SizeLineState::ExtensionValueQuoted: {
                    if (c == '"') {
                        sizeLineState = SizeLineState::AfterQuotedValue;
                    } else if (c == '\\') {
                        sizeLineState = SizeLineState::ExtensionValueQuotedPair;
                    } else if (!IsQuotedTextCharacter(c)) {
                        Fail(Error::Malformed);
                        return;
                    }
                } break;

                case SizeLineState::ExtensionValueQuotedPair: {
                    if (!IsQuotedPairCharacter(c)) {
                        Fail(Error::Malformed);
                        return;
                    }
                    sizeLineState = SizeLineState::ExtensionValueQuoted;
                } break;

                case SizeLineState::AfterQuotedValue: {
                    if (c == ';') {
                        sizeLineState = SizeLineState::ExtensionNameFirst;
                    } else if (c == '\r') {
                        sizeLineState = SizeLineState::LineFeed;
                    } else {
                        Fail(Error::Malformed);
                        return;
                    }
                } break;

                case SizeLineState::LineFeed: {
                    if (c != '\n') {
                        Fail(Error::Malformed);
                        return;
                    }
                    CompleteSizeLine();
                } return;
            }
            if (
                (c != '\r')
                && (inExtensions || (c == ';'))
            ) {
                extensions.push_back(c);
            }
        }

        /**
         * This method decodes the next character of the line terminator
         * which follows chunk data.
         *
         * @param[in] c
         *     This is the character to decode.
         */
        void DecodeTerminatorCharacter(char c) {
            if (!terminatorCarriageReturnSeen) {
                if (c != '\r') {
                    Fail(Error::Malformed);
                    return;
                }
                terminatorCarriageReturnSeen = true;
            } else {
                if (c != '\n') {
                    Fail(Error::Malformed);
                    return;
                }
                terminatorCarriageReturnSeen = false;
                state = State::AwaitingSizeLine;
            }
        }

        /**
         * This method decodes the next character of the trailer.
         * Trailer fields are not interpreted; only their line
         * framing is checked.
         *
         * @param[in] c
         *     This is the character to decode.
         */
        void DecodeTrailerCharacter(char c) {
            if (trailerCarriageReturnSeen) {
                if (c != '\n') {
                    Fail(Error::Malformed);
                    return;
                }
                trailerCarriageReturnSeen = false;
                if (trailerLineLength == 0) {
                    state = State::Done;
                } else {
                    trailerLineLength = 0;
                }
            } else if (c == '\r') {
                trailerCarriageReturnSeen = true;
            } else if (c == '\n') {
                Fail(Error::Malformed);
            } else {
                ++trailerLineLength;
                if (++trailerSize > limits.maxTrailerSize) {
                    Fail(Error::SizeExceeded);
                }
            }
        }
    };

    ChunkDecoder::~ChunkDecoder() noexcept = default;

    ChunkDecoder::ChunkDecoder()
        : impl_(new Impl)
    {
    }

    ChunkDecoder::ChunkDecoder(const Limits& limits)
        : impl_(new Impl)
    {
        impl_->limits = limits;
    }

    size_t ChunkDecoder::Decode(
        const std::string& input,
        std::string& payload,
        size_t offset,
        size_t length
    ) {
        if (offset >= input.length()) {
            return 0;
        }
        if (
            (length == 0)
            || (length > input.length() - offset)
        ) {
            length = input.length() - offset;
        }
        size_t charactersAccepted = 0;
        while (
            (charactersAccepted < length)
            && (impl_->state != State::Done)
            && (impl_->state != State::Failed)
        ) {
            if (impl_->state == State::AwaitingChunkData) {
                const auto chunkDataToCopyFromInput = (size_t)std::min(
                    (uint64_t)(length - charactersAccepted),
                    impl_->chunkBytesMissing
                );
                payload.append(input, offset + charactersAccepted, chunkDataToCopyFromInput);
                charactersAccepted += chunkDataToCopyFromInput;
                impl_->streamOffset += chunkDataToCopyFromInput;
                impl_->decodedSize += chunkDataToCopyFromInput;
                impl_->chunkBytesMissing -= chunkDataToCopyFromInput;
                if (impl_->chunkBytesMissing == 0) {
                    impl_->state = State::AwaitingChunkTerminator;
                }
                continue;
            }
            const auto c = input[offset + charactersAccepted];
            switch (impl_->state) {
                case State::AwaitingSizeLine: {
                    impl_->DecodeSizeLineCharacter(c);
                } break;

                case State::AwaitingChunkTerminator: {
                    impl_->DecodeTerminatorCharacter(c);
                } break;

                case State::AwaitingTrailerHeaders: {
                    impl_->DecodeTrailerCharacter(c);
                } break;

                case State::AwaitingChunkData:
                case State::Done:
                case State::Failed:
                default: {
                } break;
            }
            ++charactersAccepted;
            ++impl_->streamOffset;
        }
        return charactersAccepted;
    }

    void ChunkDecoder::Finish() {
        if (
            (impl_->state != State::Done)
            && (impl_->state != State::Failed)
        ) {
            impl_->Fail(Error::Truncated);
        }
    }

    auto ChunkDecoder::GetState() const -> State {
        return impl_->state;
    }

    auto ChunkDecoder::GetError() const -> Error {
        return impl_->error;
    }

    uint64_t ChunkDecoder::GetErrorOffset() const {
        return impl_->errorOffset;
    }

    uint64_t ChunkDecoder::GetStreamOffset() const {
        return impl_->streamOffset;
    }

    uint64_t ChunkDecoder::GetDecodedSize() const {
        return impl_->decodedSize;
    }

    const ChunkFrame& ChunkDecoder::GetLastFrame() const {
        return impl_->lastFrame;
    }

    void PrintTo(
        const ChunkDecoder::State& state,
        std::ostream* os
    ) {
        switch (state) {
            case ChunkDecoder::State::AwaitingSizeLine: {
                *os << "Awaiting size line";
            } break;
            case ChunkDecoder::State::AwaitingChunkData: {
                *os << "Awaiting chunk data";
            } break;
            case ChunkDecoder::State::AwaitingChunkTerminator: {
                *os << "Awaiting chunk terminator";
            } break;
            case ChunkDecoder::State::AwaitingTrailerHeaders: {
                *os << "Awaiting trailer headers";
            } break;
            case ChunkDecoder::State::Done: {
                *os << "DONE";
            } break;
            case ChunkDecoder::State::Failed: {
                *os << "FAILED";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    void PrintTo(
        const ChunkDecoder::Error& error,
        std::ostream* os
    ) {
        switch (error) {
            case ChunkDecoder::Error::None: {
                *os << "None";
            } break;
            case ChunkDecoder::Error::Malformed: {
                *os << "MALFORMED";
            } break;
            case ChunkDecoder::Error::Truncated: {
                *os << "TRUNCATED";
            } break;
            case ChunkDecoder::Error::SizeExceeded: {
                *os << "SIZE EXCEEDED";
            } break;
            default: {
                *os << "???";
            };
        }
    }

}
