/*

test_mail_service.cpp
---------------------

Upload, assembly and send flows through the service facade, and configuration checks.

*/

#define BOOST_TEST_MODULE mail_service_test

#include <filesystem>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailstage/delivery/maildir_delivery.hpp>
#include <mailstage/service/config.hpp>
#include <mailstage/service/mail_service.hpp>
#include <mailstage/store/memory_record_store.hpp>
#include "test_util.hpp"

using mailstage::error_code;
using mailstage::pipeline::send_request;
using mailstage::service::chunk_request;
using mailstage::service::complete_request;
using mailstage::service::config;
using mailstage::service::delivery_mode;
using mailstage::service::mail_service;
using mailstage::store::email_status;
using mailstage::store::memory_record_store;
using mailstage::upload::chunk_store;

namespace
{

struct service_fixture
{
    service_fixture()
        : tmp(test_util::make_temp_dir("service")),
          chunks(tmp / "staging"),
          service(chunks, records, delivery)
    {
    }

    ~service_fixture()
    {
        std::error_code ec;
        std::filesystem::remove_all(tmp, ec);
    }

    chunk_request chunk(const std::string& id, std::int64_t index, std::int64_t total, std::string_view bytes)
    {
        chunk_request req;
        req.upload_id = id;
        req.file_name = "x.txt";
        req.chunk_index = index;
        req.total_chunks = total;
        req.bytes = bytes;
        return req;
    }

    std::filesystem::path tmp;
    chunk_store chunks;
    memory_record_store records;
    test_util::fake_delivery delivery;
    mail_service service;
};

send_request make_request()
{
    send_request req;
    req.sender = "sender@example.com";
    req.recipients = {"rcpt@example.com"};
    req.subject = "Report";
    req.body = "Attached.";
    return req;
}

} // namespace


BOOST_FIXTURE_TEST_CASE(chunked_upload_then_send, service_fixture)
{
    const std::string a(10, 'a');
    const std::string b(10, 'b');
    const std::string c(10, 'c');

    // Arrival order does not matter.
    auto r2 = service.receive_chunk(chunk("u1", 2, 3, c));
    BOOST_REQUIRE(r2);
    BOOST_TEST(r2->chunk_index == 2u);
    BOOST_TEST(r2->total_chunks == 3u);
    BOOST_REQUIRE(service.receive_chunk(chunk("u1", 0, 3, a)));
    BOOST_REQUIRE(service.receive_chunk(chunk("u1", 1, 3, b)));

    complete_request done;
    done.upload_id = "u1";
    done.file_name = "x.txt";
    done.total_chunks = 3;
    auto staged = service.complete_upload(done);
    BOOST_REQUIRE(staged);
    BOOST_TEST(staged->file_name == "x.txt");
    BOOST_TEST(staged->mime_type == "text/plain");
    BOOST_TEST(std::filesystem::file_size(staged->file_path) == 30u);
    BOOST_TEST(test_util::read_file(staged->file_path) == a + b + c);

    auto req = make_request();
    req.attachments.push_back(staged->file_path);
    auto id = service.send(req);
    BOOST_REQUIRE(id);

    BOOST_REQUIRE_EQUAL(delivery.sent.size(), 1u);
    BOOST_REQUIRE_EQUAL(delivery.sent[0].attachments.size(), 1u);
    BOOST_TEST(delivery.sent[0].attachments[0].filename == "x.txt");

    auto rec = service.get_email(*id);
    BOOST_REQUIRE(rec);
    BOOST_TEST(rec->status == email_status::sent);
    BOOST_TEST(records.attachment_count() == 0u);
    BOOST_TEST(!std::filesystem::exists(staged->file_path));
}

BOOST_FIXTURE_TEST_CASE(chunk_index_checks, service_fixture)
{
    auto past_end = service.receive_chunk(chunk("u1", 3, 3, "x"));
    BOOST_REQUIRE(!past_end);
    BOOST_TEST(past_end.error().code() == error_code::validation_failed);

    auto negative = service.receive_chunk(chunk("u1", -1, 3, "x"));
    BOOST_REQUIRE(!negative);
    BOOST_TEST(negative.error().code() == error_code::validation_failed);

    auto no_total = service.receive_chunk(chunk("u1", 0, 0, "x"));
    BOOST_REQUIRE(!no_total);
    BOOST_TEST(no_total.error().code() == error_code::validation_failed);

    auto bad_id = service.receive_chunk(chunk("../u1", 0, 1, "x"));
    BOOST_REQUIRE(!bad_id);
    BOOST_TEST(bad_id.error().code() == error_code::validation_failed);

    BOOST_TEST(!chunks.has_chunk("u1", 0));
}

BOOST_FIXTURE_TEST_CASE(incomplete_upload_reports_gaps, service_fixture)
{
    BOOST_REQUIRE(service.receive_chunk(chunk("u2", 1, 3, "b")));

    complete_request done;
    done.upload_id = "u2";
    done.file_name = "x.txt";
    done.total_chunks = 3;
    done.mime_type = "text/csv";
    auto staged = service.complete_upload(done);
    BOOST_REQUIRE(!staged);
    BOOST_TEST(staged.error().code() == error_code::incomplete_upload);
    BOOST_TEST(staged.error().detail() == "missing=0,2");

    BOOST_REQUIRE(service.receive_chunk(chunk("u2", 0, 3, "a")));
    BOOST_REQUIRE(service.receive_chunk(chunk("u2", 2, 3, "c")));
    staged = service.complete_upload(done);
    BOOST_REQUIRE(staged);
    BOOST_TEST(staged->mime_type == "text/csv");
}

BOOST_FIXTURE_TEST_CASE(direct_upload, service_fixture)
{
    auto staged = service.store_direct_upload("photo.png", "png bytes");
    BOOST_REQUIRE(staged);
    BOOST_TEST(staged->file_name == "photo.png");
    BOOST_TEST(staged->mime_type == "image/png");
    BOOST_TEST(staged->file_path.parent_path() == chunks.root());
}

BOOST_FIXTURE_TEST_CASE(attachment_outside_staging_refused, service_fixture)
{
    const auto outside = tmp / "secret.txt";
    test_util::write_file(outside, "do not send");

    auto req = make_request();
    req.attachments.push_back(outside);
    auto id = service.send(req);
    BOOST_REQUIRE(!id);
    BOOST_TEST(id.error().code() == error_code::validation_failed);
    BOOST_TEST(std::filesystem::exists(outside));
    BOOST_TEST(service.list_emails()->empty());

    req.attachments = {chunks.root() / ".." / "secret.txt"};
    BOOST_TEST(!service.send(req));
    BOOST_TEST(std::filesystem::exists(outside));
}

BOOST_FIXTURE_TEST_CASE(chunks_of_open_sessions_refused, service_fixture)
{
    BOOST_REQUIRE(service.receive_chunk(chunk("other", 0, 2, "half")));
    const auto chunk_file = chunks.chunk_path("other", 0);

    auto req = make_request();
    req.attachments.push_back(chunk_file);
    auto id = service.send(req);
    BOOST_REQUIRE(!id);
    BOOST_TEST(id.error().code() == error_code::validation_failed);
    BOOST_TEST(test_util::read_file(chunk_file) == "half");
    BOOST_TEST(delivery.sent.empty());
    BOOST_TEST(service.list_emails()->empty());

    req.attachments = {chunks.session_dir("other")};
    BOOST_TEST(!service.send(req));

    const auto partial = chunks.root() / "u7--x.txt.partial";
    test_util::write_file(partial, "in progress");
    req.attachments = {partial};
    BOOST_TEST(!service.send(req));
    BOOST_TEST(std::filesystem::exists(partial));

    const auto unprefixed = chunks.root() / "loose.txt";
    test_util::write_file(unprefixed, "no prefix");
    req.attachments = {unprefixed};
    BOOST_TEST(!service.send(req));

    BOOST_TEST(chunks.has_chunk("other", 0));
    BOOST_TEST(delivery.sent.empty());
}

BOOST_FIXTURE_TEST_CASE(unknown_email, service_fixture)
{
    auto rec = service.get_email(4242);
    BOOST_REQUIRE(!rec);
    BOOST_TEST(rec.error().code() == error_code::record_not_found);
    BOOST_TEST(rec.error().message() == "Email not found");
}

BOOST_FIXTURE_TEST_CASE(history_newest_first, service_fixture)
{
    BOOST_REQUIRE(service.send(make_request()));
    delivery.outcome = mailstage::fail(error_code::delivery_rejected, "Mail recipient rejection.");
    BOOST_TEST(!service.send(make_request()));

    auto all = service.list_emails();
    BOOST_REQUIRE(all);
    BOOST_REQUIRE_EQUAL(all->size(), 2u);
    BOOST_TEST((*all)[0].status == email_status::failed);
    BOOST_TEST((*all)[1].status == email_status::sent);
}

BOOST_AUTO_TEST_CASE(config_validation)
{
    config cfg;
    cfg.smtp.host = "smtp.example.com";
    BOOST_TEST(mailstage::service::validate(cfg).has_value());

    auto no_host = cfg;
    no_host.smtp.host.clear();
    auto res = mailstage::service::validate(no_host);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code() == error_code::validation_failed);
    BOOST_TEST(res.error().detail().find("SMTP_HOST") != std::string::npos);

    // A local Maildir does not need a relay.
    no_host.delivery = delivery_mode::maildir;
    BOOST_TEST(mailstage::service::validate(no_host).has_value());

    auto no_workers = cfg;
    no_workers.server.worker_threads = 0;
    BOOST_TEST(!mailstage::service::validate(no_workers));

    auto no_limit = cfg;
    no_limit.limits.max_chunk_bytes = 0;
    BOOST_TEST(!mailstage::service::validate(no_limit));
}

BOOST_AUTO_TEST_CASE(delivery_mode_names)
{
    BOOST_TEST(mailstage::service::delivery_mode_from_string("maildir").value() == delivery_mode::maildir);
    BOOST_TEST(mailstage::service::delivery_mode_from_string("smtp").value() == delivery_mode::smtp);
    BOOST_TEST(!mailstage::service::delivery_mode_from_string("pigeon").has_value());
    BOOST_TEST(mailstage::service::to_string(delivery_mode::maildir) == "maildir");
}

BOOST_AUTO_TEST_CASE(configured_maildir_delivery)
{
    auto tmp = test_util::make_temp_dir("service");
    config cfg;
    cfg.delivery = delivery_mode::maildir;
    cfg.maildir = tmp / "box";
    auto client = mailstage::service::make_delivery(cfg);
    BOOST_REQUIRE(client);
    auto* box = dynamic_cast<mailstage::delivery::maildir_delivery*>(client.get());
    BOOST_REQUIRE(box != nullptr);
    BOOST_TEST(box->root() == tmp / "box");
    std::filesystem::remove_all(tmp);
}
