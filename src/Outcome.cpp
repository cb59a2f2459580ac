/**
 * @file Outcome.cpp
 *
 * This module contains the implementation of the Retrieval::Outcome
 * structure.
 *
 * © 2018 by Richard Walters
 */

#include <inttypes.h>
#include <Retrieval/Outcome.hpp>
#include <sstream>
#include <string>
#include <SystemAbstractions/StringExtensions.hpp>

namespace Retrieval {

    Outcome Outcome::Verified(
        uint64_t byteCount,
        const Digest& digest
    ) {
        Outcome outcome;
        outcome.kind = Kind::Verified;
        outcome.byteCount = byteCount;
        outcome.expected = digest;
        outcome.actual = digest;
        return outcome;
    }

    Outcome Outcome::Mismatch(
        uint64_t byteCount,
        const Digest& expected,
        const Digest& actual
    ) {
        Outcome outcome;
        outcome.kind = Kind::Mismatch;
        outcome.byteCount = byteCount;
        outcome.expected = expected;
        outcome.actual = actual;
        return outcome;
    }

    Outcome Outcome::ProtocolError(
        ProtocolErrorKind protocolError,
        uint64_t offset,
        const std::string& reason
    ) {
        Outcome outcome;
        outcome.kind = Kind::ProtocolError;
        outcome.protocolError = protocolError;
        outcome.offset = offset;
        outcome.reason = reason;
        return outcome;
    }

    Outcome Outcome::ConnectionError(
        ConnectionErrorKind connectionError,
        const std::string& reason,
        unsigned int statusCode
    ) {
        Outcome outcome;
        outcome.kind = Kind::ConnectionError;
        outcome.connectionError = connectionError;
        outcome.reason = reason;
        outcome.statusCode = statusCode;
        return outcome;
    }

    Outcome Outcome::TimedOut() {
        Outcome outcome;
        outcome.kind = Kind::TimedOut;
        return outcome;
    }

    Outcome Outcome::Cancelled() {
        Outcome outcome;
        outcome.kind = Kind::Cancelled;
        return outcome;
    }

    Outcome Outcome::InvalidRequest(const std::string& reason) {
        Outcome outcome;
        outcome.kind = Kind::InvalidRequest;
        outcome.reason = reason;
        return outcome;
    }

    std::string Outcome::Describe() const {
        std::ostringstream builder;
        PrintTo(*this, &builder);
        return builder.str();
    }

    void PrintTo(
        const Outcome::Kind& kind,
        std::ostream* os
    ) {
        switch (kind) {
            case Outcome::Kind::Verified: {
                *os << "Verified";
            } break;
            case Outcome::Kind::Mismatch: {
                *os << "MISMATCH";
            } break;
            case Outcome::Kind::ProtocolError: {
                *os << "PROTOCOL ERROR";
            } break;
            case Outcome::Kind::ConnectionError: {
                *os << "CONNECTION ERROR";
            } break;
            case Outcome::Kind::TimedOut: {
                *os << "TIMED OUT";
            } break;
            case Outcome::Kind::Cancelled: {
                *os << "CANCELLED";
            } break;
            case Outcome::Kind::InvalidRequest: {
                *os << "INVALID REQUEST";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    void PrintTo(
        const Outcome::ProtocolErrorKind& kind,
        std::ostream* os
    ) {
        switch (kind) {
            case Outcome::ProtocolErrorKind::Malformed: {
                *os << "malformed";
            } break;
            case Outcome::ProtocolErrorKind::Truncated: {
                *os << "truncated";
            } break;
            case Outcome::ProtocolErrorKind::SizeExceeded: {
                *os << "size exceeded";
            } break;
            case Outcome::ProtocolErrorKind::UnsupportedEncoding: {
                *os << "unsupported encoding";
            } break;
            case Outcome::ProtocolErrorKind::BadContentCoding: {
                *os << "bad content coding";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    void PrintTo(
        const Outcome::ConnectionErrorKind& kind,
        std::ostream* os
    ) {
        switch (kind) {
            case Outcome::ConnectionErrorKind::UnableToConnect: {
                *os << "unable to connect";
            } break;
            case Outcome::ConnectionErrorKind::Disconnected: {
                *os << "disconnected";
            } break;
            case Outcome::ConnectionErrorKind::BadResponse: {
                *os << "bad response";
            } break;
            case Outcome::ConnectionErrorKind::HttpStatus: {
                *os << "HTTP status";
            } break;
            default: {
                *os << "???";
            };
        }
    }

    void PrintTo(
        const Outcome& outcome,
        std::ostream* os
    ) {
        PrintTo(outcome.kind, os);
        switch (outcome.kind) {
            case Outcome::Kind::Verified: {
                *os << SystemAbstractions::sprintf(" (%" PRIu64 " bytes)", outcome.byteCount);
            } break;
            case Outcome::Kind::Mismatch: {
                *os << SystemAbstractions::sprintf(
                    " (%" PRIu64 " bytes, expected %s, actual %s)",
                    outcome.byteCount,
                    outcome.expected.ToHex().c_str(),
                    outcome.actual.ToHex().c_str()
                );
            } break;
            case Outcome::Kind::ProtocolError: {
                *os << " (";
                PrintTo(outcome.protocolError, os);
                *os << SystemAbstractions::sprintf(" at offset %" PRIu64 ")", outcome.offset);
            } break;
            case Outcome::Kind::ConnectionError: {
                *os << " (";
                PrintTo(outcome.connectionError, os);
                if (outcome.connectionError == Outcome::ConnectionErrorKind::HttpStatus) {
                    *os << ' ' << outcome.statusCode;
                }
                *os << ')';
            } break;
            default: {
            } break;
        }
        if (!outcome.reason.empty()) {
            *os << ": " << outcome.reason;
        }
    }

}
