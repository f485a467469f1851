#include "Errors.hpp"

const char* authErrorName(eAuthError e) {
    switch (e) {
        case AUTH_ERROR_INVALID_ADDRESS: return "InvalidAddress";
        case AUTH_ERROR_UNSUPPORTED_NETWORK: return "UnsupportedNetwork";
        case AUTH_ERROR_NOT_FOUND: return "NotFound";
        case AUTH_ERROR_ALREADY_USED: return "AlreadyUsed";
        case AUTH_ERROR_EXPIRED: return "Expired";
        case AUTH_ERROR_MALFORMED_MESSAGE: return "MalformedMessage";
        case AUTH_ERROR_TAMPERED_MESSAGE: return "TamperedMessage";
        case AUTH_ERROR_MALFORMED_SIGNATURE: return "MalformedSignature";
        case AUTH_ERROR_INVALID_SIGNATURE: return "InvalidSignature";
        case AUTH_ERROR_STORE_UNAVAILABLE: return "StoreUnavailable";
        case AUTH_ERROR_DEPENDENCY_UNAVAILABLE: return "DependencyUnavailable";
    }

    return "Unknown";
}

const char* tokenErrorName(eTokenError e) {
    switch (e) {
        case TOKEN_ERROR_CORRUPT: return "Corrupt";
        case TOKEN_ERROR_EXPIRED: return "Expired";
        case TOKEN_ERROR_REVOKED: return "Revoked";
    }

    return "Unknown";
}

eAuthErrorKind authErrorKind(eAuthError e) {
    switch (e) {
        case AUTH_ERROR_INVALID_ADDRESS:
        case AUTH_ERROR_UNSUPPORTED_NETWORK: return AUTH_ERROR_KIND_REQUEST;
        case AUTH_ERROR_NOT_FOUND:
        case AUTH_ERROR_ALREADY_USED:
        case AUTH_ERROR_EXPIRED: return AUTH_ERROR_KIND_CHALLENGE;
        case AUTH_ERROR_MALFORMED_MESSAGE:
        case AUTH_ERROR_TAMPERED_MESSAGE:
        case AUTH_ERROR_MALFORMED_SIGNATURE:
        case AUTH_ERROR_INVALID_SIGNATURE: return AUTH_ERROR_KIND_VERIFICATION;
        case AUTH_ERROR_STORE_UNAVAILABLE:
        case AUTH_ERROR_DEPENDENCY_UNAVAILABLE: return AUTH_ERROR_KIND_DEPENDENCY;
    }

    return AUTH_ERROR_KIND_REQUEST;
}

bool authErrorRetryable(eAuthError e) {
    return authErrorKind(e) == AUTH_ERROR_KIND_DEPENDENCY;
}
