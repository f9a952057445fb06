/*

http_routes.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping of HTTP requests onto the mail service.

*/

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <mailstage/detail/result.hpp>
#include <mailstage/service/mail_service.hpp>
#include <mailstage/store/records.hpp>

namespace mailstage::server
{

namespace http = boost::beast::http;

using request = http::request<http::string_body>;
using response = http::response<http::string_body>;

/**
Handling one request.

    OPTIONS *                 -> 200, CORS headers only
    POST /upload/chunk        -> raw body, query uploadId (or fileId), fileName, chunkIndex, totalChunks
    POST /upload/complete     -> JSON {uploadId|fileId, fileName, totalChunks, mimeType}
    POST /upload/file         -> raw body, query fileName
    POST /send                -> JSON {sender, recipients, subject, body, attachmentPaths}
    GET  /emails              -> records, most recent first
    GET  /emails/{id}         -> one record or 404

Every response is JSON and carries permissive CORS headers.
**/
[[nodiscard]] response handle_request(service::mail_service& svc, const request& req);

/// Response for a failure the service reported; `failure` names the operation for 5xx errors.
[[nodiscard]] response error_response(const request& req, const error& err, std::string_view failure);

[[nodiscard]] http::status status_for(const error& err) noexcept;

/// Decoded parameters of the query part of a target; the last occurrence of a key wins.
[[nodiscard]] result<std::map<std::string, std::string>> parse_query(std::string_view query);

[[nodiscard]] nlohmann::json to_json(const store::email_record& rec);

/// UTC timestamp like `2025-01-31T12:00:00.000Z`.
[[nodiscard]] std::string iso8601(std::chrono::system_clock::time_point tp);

} // namespace mailstage::server
