//
// Request helpers shared by the http handlers
//

#ifndef TRANSIT_RELAY_HTTPUTILS_H
#define TRANSIT_RELAY_HTTPUTILS_H

#include "../Lib/RelayErrors.h"
#include "HttpServer.h"
#include <nlohmann/json.hpp>

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string;
auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;
auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> bool;

// The status code a relay error is reported with
auto statusCodeFor(const eRelayError& error) -> SimpleWeb::StatusCode;

#endif //TRANSIT_RELAY_HTTPUTILS_H
