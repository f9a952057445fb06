/*

http_routes.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include "http_routes.hpp"

#include <charconv>
#include <cstdint>
#include <ctime>
#include <format>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>
#include <mailstage/codec/percent.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/pipeline/send_pipeline.hpp>

using json = nlohmann::json;

namespace mailstage::server
{

namespace
{

constexpr std::string_view MISSING_PARAMETERS = "Missing required parameters";
constexpr std::string_view MISSING_SEND_FIELDS = "Missing required fields: sender, recipients, subject, body";

void add_cors(response& res)
{
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_headers, "Origin, X-Requested-With, Content-Type, Accept");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
}

response json_response(const request& req, http::status status, const json& body)
{
    response res{status, req.version()};
    res.set(http::field::server, "mailstage");
    res.set(http::field::content_type, "application/json");
    add_cors(res);
    res.keep_alive(req.keep_alive());
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

response bad_request(const request& req, std::string_view message)
{
    return json_response(req, http::status::bad_request, json{{"error", std::string(message)}});
}

std::optional<std::int64_t> parse_int(std::string_view text)
{
    std::int64_t value = 0;
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last)
        return std::nullopt;
    return value;
}

/// Integer member given as a JSON number or as a numeric string.
std::optional<std::int64_t> int_member(const json& doc, const char* key)
{
    const auto it = doc.find(key);
    if (it == doc.end())
        return std::nullopt;
    if (it->is_number_integer())
        return it->get<std::int64_t>();
    if (it->is_string())
        return parse_int(it->get_ref<const std::string&>());
    return std::nullopt;
}

std::string string_member(const json& doc, const char* key)
{
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

/// Member given either as one string or as an array of strings; false on any other shape.
bool strings_member(const json& doc, const char* key, std::vector<std::string>& out)
{
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null())
        return true;
    if (it->is_string())
    {
        out.push_back(it->get<std::string>());
        return true;
    }
    if (!it->is_array())
        return false;
    for (const auto& item : *it)
    {
        if (!item.is_string())
            return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

std::string_view to_sv(boost::beast::string_view text) noexcept
{
    return {text.data(), text.size()};
}

std::string param(const std::map<std::string, std::string>& params, const std::string& key)
{
    const auto it = params.find(key);
    return it != params.end() ? it->second : std::string{};
}

response upload_chunk(service::mail_service& svc, const request& req, std::string_view query)
{
    auto params = parse_query(query);
    if (!params)
        return error_response(req, params.error(), "Failed to save chunk");

    service::chunk_request chunk;
    chunk.upload_id = param(*params, "uploadId");
    if (chunk.upload_id.empty())
        chunk.upload_id = param(*params, "fileId");
    chunk.file_name = param(*params, "fileName");
    const auto index = parse_int(param(*params, "chunkIndex"));
    const auto total = parse_int(param(*params, "totalChunks"));
    if (chunk.upload_id.empty() || chunk.file_name.empty() || !index || !total)
        return bad_request(req, MISSING_PARAMETERS);
    chunk.chunk_index = *index;
    chunk.total_chunks = *total;
    chunk.bytes = req.body();

    auto receipt = svc.receive_chunk(chunk);
    if (!receipt)
        return error_response(req, receipt.error(), "Failed to save chunk");

    return json_response(req, http::status::ok, json{
        {"success", true},
        {"message", "Chunk " + std::to_string(receipt->chunk_index + 1) + " of "
            + std::to_string(receipt->total_chunks) + " received"}});
}

response upload_complete(service::mail_service& svc, const request& req)
{
    const json doc = json::parse(req.body(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return bad_request(req, MISSING_PARAMETERS);

    service::complete_request complete;
    complete.upload_id = string_member(doc, "uploadId");
    if (complete.upload_id.empty())
        complete.upload_id = string_member(doc, "fileId");
    complete.file_name = string_member(doc, "fileName");
    complete.mime_type = string_member(doc, "mimeType");
    const auto total = int_member(doc, "totalChunks");
    if (complete.upload_id.empty() || complete.file_name.empty() || !total)
        return bad_request(req, MISSING_PARAMETERS);
    complete.total_chunks = *total;

    auto staged = svc.complete_upload(complete);
    if (!staged)
        return error_response(req, staged.error(), "Failed to combine chunks");

    return json_response(req, http::status::ok, json{
        {"success", true},
        {"message", "File upload complete"},
        {"filePath", staged->file_path.string()},
        {"fileName", staged->file_name},
        {"mimeType", staged->mime_type}});
}

response upload_file(service::mail_service& svc, const request& req, std::string_view query)
{
    auto params = parse_query(query);
    if (!params)
        return error_response(req, params.error(), "Failed to store file");
    const std::string file_name = param(*params, "fileName");
    if (file_name.empty())
        return bad_request(req, MISSING_PARAMETERS);

    auto staged = svc.store_direct_upload(file_name, req.body());
    if (!staged)
        return error_response(req, staged.error(), "Failed to store file");

    return json_response(req, http::status::ok, json{
        {"success", true},
        {"filePath", staged->file_path.string()},
        {"fileName", staged->file_name},
        {"mimeType", staged->mime_type}});
}

response send_email(service::mail_service& svc, const request& req)
{
    const json doc = json::parse(req.body(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return bad_request(req, MISSING_SEND_FIELDS);

    pipeline::send_request send;
    send.sender = string_member(doc, "sender");
    send.subject = string_member(doc, "subject");
    send.body = string_member(doc, "body");
    if (!strings_member(doc, "recipients", send.recipients))
        return bad_request(req, MISSING_SEND_FIELDS);
    if (send.sender.empty() || send.recipients.empty() || send.subject.empty() || send.body.empty())
        return bad_request(req, MISSING_SEND_FIELDS);

    std::vector<std::string> paths;
    if (!strings_member(doc, "attachmentPaths", paths))
        return bad_request(req, "attachmentPaths must be a string or an array of strings");
    for (auto& path : paths)
        send.attachments.emplace_back(std::move(path));

    auto email_id = svc.send(send);
    if (!email_id)
        return error_response(req, email_id.error(), "Failed to send email");

    return json_response(req, http::status::ok, json{
        {"message", "Email sent successfully"},
        {"emailId", *email_id}});
}

response list_emails(service::mail_service& svc, const request& req)
{
    auto records = svc.list_emails();
    if (!records)
        return error_response(req, records.error(), "Failed to retrieve emails");

    json out = json::array();
    for (const auto& rec : *records)
        out.push_back(to_json(rec));
    return json_response(req, http::status::ok, out);
}

response get_email(service::mail_service& svc, const request& req, std::string_view id_text)
{
    const auto id = parse_int(id_text);
    if (!id)
        return json_response(req, http::status::not_found, json{{"error", "Email not found"}});

    auto rec = svc.get_email(*id);
    if (!rec)
    {
        if (rec.error().is(error_code::record_not_found))
            return json_response(req, http::status::not_found, json{{"error", "Email not found"}});
        return error_response(req, rec.error(), "Failed to retrieve email");
    }
    return json_response(req, http::status::ok, to_json(*rec));
}

} // namespace


http::status status_for(const error& err) noexcept
{
    if (err.is_validation_error())
        return http::status::bad_request;
    if (err.is(error_code::payload_too_large))
        return http::status::payload_too_large;
    if (err.is(error_code::record_not_found))
        return http::status::not_found;
    if (err.is_incomplete_upload() || err.is(error_code::upload_busy))
        return http::status::conflict;
    return http::status::internal_server_error;
}


response error_response(const request& req, const error& err, std::string_view failure)
{
    const http::status status = status_for(err);
    json body;
    if (status == http::status::internal_server_error)
    {
        body["error"] = std::string(failure);
        std::string details;
        if (err.message() != failure)
            details = err.message();
        if (!err.detail().empty())
        {
            if (!details.empty())
                details += ": ";
            details += err.detail();
        }
        body["details"] = details;
        MAILSTAGE_ERROR(std::string(to_sv(req.method_string())) + " " + std::string(to_sv(req.target())) + ": "
            + err.to_string());
    }
    else
    {
        body["error"] = err.message();
        if (!err.detail().empty())
            body["details"] = err.detail();
    }
    body["code"] = static_cast<int>(err.code());
    return json_response(req, status, body);
}


result<std::map<std::string, std::string>> parse_query(std::string_view query)
{
    std::map<std::string, std::string> out;
    while (!query.empty())
    {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty())
            continue;

        const auto eq = pair.find('=');
        auto key = percent::decode(pair.substr(0, eq));
        if (!key)
            return fail<std::map<std::string, std::string>>(std::move(key).error());
        auto value = percent::decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        if (!value)
            return fail<std::map<std::string, std::string>>(std::move(value).error());
        out[std::move(*key)] = std::move(*value);
    }
    return out;
}


std::string iso8601(std::chrono::system_clock::time_point tp)
{
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms < 0 ? ms + 1000 : ms);
}


json to_json(const store::email_record& rec)
{
    json out{
        {"id", rec.id},
        {"sender", rec.sender},
        {"recipients", rec.recipients},
        {"subject", rec.subject},
        {"body", rec.body},
        {"status", std::string(store::status_to_string(rec.status))},
        {"createdAt", iso8601(rec.created_at)}};
    out["sentAt"] = rec.sent_at ? json(iso8601(*rec.sent_at)) : json(nullptr);
    return out;
}


response handle_request(service::mail_service& svc, const request& req)
{
    const std::string_view target = to_sv(req.target());
    const auto question = target.find('?');
    const std::string_view path = target.substr(0, question);
    const std::string_view query = question == std::string_view::npos ? std::string_view{} : target.substr(question + 1);

    if (req.method() == http::verb::options)
        return json_response(req, http::status::ok, json::object());

    if (req.method() == http::verb::post)
    {
        if (path == "/upload/chunk")
            return upload_chunk(svc, req, query);
        if (path == "/upload/complete")
            return upload_complete(svc, req);
        if (path == "/upload/file")
            return upload_file(svc, req, query);
        if (path == "/send")
            return send_email(svc, req);
    }
    else if (req.method() == http::verb::get)
    {
        constexpr std::string_view EMAILS = "/emails";
        if (path == EMAILS || path == "/emails/")
            return list_emails(svc, req);
        if (path.size() > EMAILS.size() + 1 && path.substr(0, EMAILS.size() + 1) == "/emails/")
            return get_email(svc, req, path.substr(EMAILS.size() + 1));
    }

    return json_response(req, http::status::not_found, json{{"error", "Not found"}});
}

} // namespace mailstage::server
