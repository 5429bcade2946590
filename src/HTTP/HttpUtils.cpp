#include "HttpUtils.h"

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string {
    // Header names are case insensitive
    auto headerItem = headers.find(header);
    if (headerItem != headers.end()) {
        return headerItem->second;
    }

    // Return an empty string
    return {};
}

auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> std::string {
    auto ptr = query_fields.find(what);
    std::string result;
    if (ptr != query_fields.end()) {
        result = ptr->second;
    }
    return result;
}

auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> bool {
    auto ptr = query_fields.find(what);
    return ptr != query_fields.end();
}

auto statusCodeFor(const eRelayError& error) -> SimpleWeb::StatusCode {
    if (dynamic_cast<const eNotFoundError*>(&error) != nullptr) {
        return SimpleWeb::StatusCode::client_error_not_found;
    }

    if (dynamic_cast<const eConflictError*>(&error) != nullptr) {
        return SimpleWeb::StatusCode::client_error_conflict;
    }

    if (dynamic_cast<const eTimeoutError*>(&error) != nullptr) {
        return SimpleWeb::StatusCode::client_error_request_timeout;
    }

    // Validation errors, and transfers that broke off half way
    return SimpleWeb::StatusCode::client_error_bad_request;
}
