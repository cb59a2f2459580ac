#ifndef RETRIEVAL_BOUNDARY_HPP
#define RETRIEVAL_BOUNDARY_HPP

/**
 * @file Boundary.hpp
 *
 * This module declares the functions which translate between the
 * C interface of the library and its C++ types.
 *
 * © 2018 by Richard Walters
 */

#include "Configuration.hpp"
#include "Digest.hpp"
#include "Outcome.hpp"
#include "Request.hpp"
#include "retrieval.h"

#include <stddef.h>
#include <string>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Retrieval {

    namespace Boundary {

        /**
         * This function translates a digest from its C layout.
         *
         * @param[in] in
         *     This is the digest in its C layout.
         *
         * @param[out] out
         *     This is where to store the translated digest.
         *
         * @return
         *     RETRIEVAL_OK or a negative status code is returned.
         */
        int ToDigest(
            const retrieval_digest_t& in,
            Digest& out
        );

        /**
         * This function translates a digest into its C layout.
         *
         * @param[in] in
         *     This is the digest to translate.
         *
         * @param[out] out
         *     This is where to store the digest in its C layout.
         *     Bytes beyond the largest digest size are dropped.
         */
        void FromDigest(
            const Digest& in,
            retrieval_digest_t& out
        );

        /**
         * This function translates settings from their C layout.
         *
         * @param[in] in
         *     These are the settings in their C layout,
         *     or null for the defaults.
         *
         * @param[out] out
         *     This is where to store the translated settings.
         *
         * @return
         *     RETRIEVAL_OK or a negative status code is returned.
         */
        int ToConfiguration(
            const retrieval_config_t* in,
            Configuration& out
        );

        /**
         * This function translates a request from its C layout.
         *
         * @param[in] in
         *     This is the request in its C layout.
         *
         * @param[out] out
         *     This is where to store the translated request.
         *
         * @return
         *     RETRIEVAL_OK or a negative status code is returned.
         */
        int ToRequest(
            const retrieval_request_t* in,
            Request& out
        );

        /**
         * This function translates an outcome into its C layout.
         *
         * @param[in] outcome
         *     This is the outcome to translate.
         *
         * @param[in] content
         *     If not null, and the outcome is Outcome::Kind::Verified,
         *     this is the content to copy into the result.
         *
         * @param[out] out
         *     This is where to store the outcome in its C layout.
         *
         * @return
         *     RETRIEVAL_OK or a negative status code is returned.
         */
        int ToResult(
            const Outcome& outcome,
            const std::string* content,
            retrieval_result_t* out
        );

        /**
         * This function makes a delegate which forwards diagnostic
         * messages to the host's log callback, if it has one.
         *
         * @param[in] config
         *     These are the settings of the host, or null.
         *
         * @return
         *     A delegate which forwards diagnostic messages to the
         *     host's log callback is returned, or nullptr if the host
         *     has no log callback.
         */
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate MakeLogForwarder(
            const retrieval_config_t* config
        );

    }

}

#endif /* RETRIEVAL_BOUNDARY_HPP */
