#pragma once

#include <cstdint>

enum eAuthError : uint8_t {
    // request
    AUTH_ERROR_INVALID_ADDRESS = 0,
    AUTH_ERROR_UNSUPPORTED_NETWORK,

    // challenge, recoverable by requesting a new one
    AUTH_ERROR_NOT_FOUND,
    AUTH_ERROR_ALREADY_USED,
    AUTH_ERROR_EXPIRED,

    // verification, never retried with the same nonce
    AUTH_ERROR_MALFORMED_MESSAGE,
    AUTH_ERROR_TAMPERED_MESSAGE,
    AUTH_ERROR_MALFORMED_SIGNATURE,
    AUTH_ERROR_INVALID_SIGNATURE,

    // dependency, retryable
    AUTH_ERROR_STORE_UNAVAILABLE,
    AUTH_ERROR_DEPENDENCY_UNAVAILABLE,
};

enum eAuthErrorKind : uint8_t {
    AUTH_ERROR_KIND_REQUEST = 0,
    AUTH_ERROR_KIND_CHALLENGE,
    AUTH_ERROR_KIND_VERIFICATION,
    AUTH_ERROR_KIND_DEPENDENCY,
};

enum eTokenError : uint8_t {
    TOKEN_ERROR_CORRUPT = 0,
    TOKEN_ERROR_EXPIRED,
    TOKEN_ERROR_REVOKED,
};

// stable wire codes, e.g. "AlreadyUsed"
const char*    authErrorName(eAuthError e);
const char*    tokenErrorName(eTokenError e);
eAuthErrorKind authErrorKind(eAuthError e);
bool           authErrorRetryable(eAuthError e);
