#ifndef RETRIEVAL_RETRIEVAL_H
#define RETRIEVAL_RETRIEVAL_H

/**
 * @file retrieval.h
 *
 * This module declares the C interface of the Retrieval library,
 * through which a host process retrieves and verifies content.
 *
 * Every structure begins with the version of this interface it was
 * laid out for.  Every function is total: it reports failure through
 * its return value, and nothing is ever thrown across it.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * This is the version of the structure layouts declared here.
 */
#define RETRIEVAL_ABI_VERSION 2

/* Function status codes */
#define RETRIEVAL_OK 0
#define RETRIEVAL_ERROR_INVALID_ARGUMENT (-1)
#define RETRIEVAL_ERROR_ABI_VERSION (-2)
#define RETRIEVAL_ERROR_OUT_OF_MEMORY (-3)
#define RETRIEVAL_ERROR_INTERNAL (-4)

/* Result tags */
#define RETRIEVAL_RESULT_VERIFIED 0
#define RETRIEVAL_RESULT_MISMATCH 1
#define RETRIEVAL_RESULT_PROTOCOL_ERROR 2
#define RETRIEVAL_RESULT_CONNECTION_ERROR 3
#define RETRIEVAL_RESULT_TIMED_OUT 4
#define RETRIEVAL_RESULT_CANCELLED 5
#define RETRIEVAL_RESULT_INVALID_REQUEST 6

/* Error kinds for RETRIEVAL_RESULT_PROTOCOL_ERROR */
#define RETRIEVAL_PROTOCOL_MALFORMED 1
#define RETRIEVAL_PROTOCOL_TRUNCATED 2
#define RETRIEVAL_PROTOCOL_SIZE_EXCEEDED 3
#define RETRIEVAL_PROTOCOL_UNSUPPORTED_ENCODING 4
#define RETRIEVAL_PROTOCOL_BAD_CONTENT_CODING 5

/* Error kinds for RETRIEVAL_RESULT_CONNECTION_ERROR */
#define RETRIEVAL_CONNECTION_UNABLE_TO_CONNECT 1
#define RETRIEVAL_CONNECTION_DISCONNECTED 2
#define RETRIEVAL_CONNECTION_BAD_RESPONSE 3
#define RETRIEVAL_CONNECTION_HTTP_STATUS 4

/* Digest algorithms (multihash codes) */
#define RETRIEVAL_DIGEST_SHA2_256 0x12
#define RETRIEVAL_DIGEST_SHA2_512 0x13
#define RETRIEVAL_DIGEST_SHA3_512 0x14
#define RETRIEVAL_DIGEST_SHA3_256 0x16

/**
 * This is the largest digest which can be passed across the interface.
 */
#define RETRIEVAL_DIGEST_MAX_SIZE 64

/**
 * This is the size of the human-readable message in a result,
 * including its terminating null.
 */
#define RETRIEVAL_MESSAGE_SIZE 256

/* Request flags */
#define RETRIEVAL_FLAG_RETAIN_CONTENT 0x1u
#define RETRIEVAL_FLAG_LENGTH_HINT 0x2u

/**
 * This is a digest: the output of a hash function, tagged
 * with the function used.
 */
typedef struct retrieval_digest {
    uint32_t algorithm;
    uint32_t size;
    uint8_t bytes[RETRIEVAL_DIGEST_MAX_SIZE];
} retrieval_digest_t;

/**
 * This is the type of function the host provides to receive
 * diagnostic messages.
 */
typedef void (*retrieval_log_callback_t)(
    void* context,
    const char* sender,
    size_t level,
    const char* message
);

/**
 * These are the settings for retrievals.  Zero or null members
 * select the defaults.
 */
typedef struct retrieval_config {
    uint32_t abi_version;
    uint64_t max_chunk_size;
    uint64_t max_decoded_size;
    int64_t default_timeout_ns;
    int64_t default_inactivity_timeout_ns;
    uint32_t accept_content_codings;
    const char* user_agent;
    uint32_t log_level;
    retrieval_log_callback_t log_callback;
    void* log_context;
} retrieval_config_t;

/**
 * This describes a single piece of content to retrieve and verify.
 */
typedef struct retrieval_request {
    uint32_t abi_version;
    const char* url;
    retrieval_digest_t expected;
    uint64_t max_decoded_size;
    int64_t timeout_ns;
    int64_t inactivity_timeout_ns;
    uint64_t length_hint;
    uint32_t flags;
} retrieval_request_t;

/**
 * This is the outcome of a retrieval.  Any content it holds
 * must be given back with retrieval_result_release.
 */
typedef struct retrieval_result {
    uint32_t abi_version;
    int32_t tag;
    int32_t error_kind;
    uint32_t status_code;
    uint64_t byte_count;
    uint64_t offset;
    retrieval_digest_t expected;
    retrieval_digest_t actual;
    uint8_t* content;
    size_t content_size;
    char message[RETRIEVAL_MESSAGE_SIZE];
} retrieval_result_t;

/**
 * This is a retrieval which may be run, and cancelled from
 * another thread while it runs.
 */
typedef struct retrieval_session retrieval_session_t;

/**
 * This function creates a retrieval session.
 *
 * @param[in] config
 *     These are the settings to use, or null for the defaults.
 *
 * @param[in] request
 *     This describes the content to retrieve and verify.
 *
 * @param[out] session
 *     This is where to store the new session.
 *
 * @return
 *     RETRIEVAL_OK or a negative status code is returned.
 */
int retrieval_session_new(
    const retrieval_config_t* config,
    const retrieval_request_t* request,
    retrieval_session_t** session
);

/**
 * This function runs a retrieval session to its end.
 *
 * @param[in] session
 *     This is the session to run.
 *
 * @param[out] result
 *     This is where to store the outcome.
 *
 * @return
 *     RETRIEVAL_OK or a negative status code is returned.
 */
int retrieval_session_run(
    retrieval_session_t* session,
    retrieval_result_t* result
);

/**
 * This function asks a retrieval session to stop.  It may be called
 * from any thread while the session runs.
 *
 * @param[in] session
 *     This is the session to stop.
 *
 * @return
 *     RETRIEVAL_OK or a negative status code is returned.
 */
int retrieval_session_cancel(retrieval_session_t* session);

/**
 * This function destroys a retrieval session.
 *
 * @param[in] session
 *     This is the session to destroy.  Null is ignored.
 */
void retrieval_session_free(retrieval_session_t* session);

/**
 * This function retrieves and verifies content in one call.
 *
 * @param[in] config
 *     These are the settings to use, or null for the defaults.
 *
 * @param[in] request
 *     This describes the content to retrieve and verify.
 *
 * @param[out] result
 *     This is where to store the outcome.
 *
 * @return
 *     RETRIEVAL_OK or a negative status code is returned.
 */
int retrieval_fetch(
    const retrieval_config_t* config,
    const retrieval_request_t* request,
    retrieval_result_t* result
);

/**
 * This function decodes and verifies a chunked body already in memory.
 *
 * @param[in] config
 *     These are the settings to use, or null for the defaults.
 *
 * @param[in] body
 *     This points to the chunked body.
 *
 * @param[in] body_size
 *     This is the number of bytes in the chunked body.
 *
 * @param[in] read_size
 *     This is the number of bytes to decode at a time,
 *     or zero to decode the whole body at once.
 *
 * @param[in] expected
 *     This is the digest the content is expected to have.
 *
 * @param[in] max_decoded_size
 *     This is the largest number of content bytes accepted,
 *     or zero for the configured limit.
 *
 * @param[out] result
 *     This is where to store the outcome.
 *
 * @return
 *     RETRIEVAL_OK or a negative status code is returned.
 */
int retrieval_verify_body(
    const retrieval_config_t* config,
    const uint8_t* body,
    size_t body_size,
    size_t read_size,
    const retrieval_digest_t* expected,
    uint64_t max_decoded_size,
    retrieval_result_t* result
);

/**
 * This function gives back any memory held by a result.
 *
 * @param[in,out] result
 *     This is the result whose memory to give back.  Null is ignored.
 */
void retrieval_result_release(retrieval_result_t* result);

/**
 * This function returns the version of the structure layouts
 * the library was built with.
 *
 * @return
 *     RETRIEVAL_ABI_VERSION, as the library was built, is returned.
 */
uint32_t retrieval_version(void);

#ifdef __cplusplus
}
#endif

#endif /* RETRIEVAL_RETRIEVAL_H */
