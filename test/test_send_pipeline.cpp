/*

test_send_pipeline.cpp
----------------------

Send attempts against a recording delivery: terminal statuses, cleanup and surfaced errors.

*/

#define BOOST_TEST_MODULE send_pipeline_test

#include <filesystem>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailstage/codec/base64.hpp>
#include <mailstage/pipeline/send_pipeline.hpp>
#include <mailstage/store/memory_record_store.hpp>
#include "test_util.hpp"

using mailstage::base64;
using mailstage::error_code;
using mailstage::fail;
using mailstage::pipeline::send_pipeline;
using mailstage::pipeline::send_request;
using mailstage::store::email_status;
using mailstage::store::memory_record_store;

namespace
{

/// Memory store whose attachment cleanup always fails.
class stuck_attachments_store : public memory_record_store
{
public:
    mailstage::result<std::size_t> delete_attachments(mailstage::store::record_id) override
    {
        ++delete_calls;
        return fail<std::size_t>(error_code::record_store_failed, "database is locked");
    }

    int delete_calls = 0;
};

send_request make_request()
{
    send_request req;
    req.sender = "sender@example.com";
    req.recipients = {"rcpt@example.com"};
    req.subject = "Hello";
    req.body = "Plain body";
    return req;
}

} // namespace


BOOST_AUTO_TEST_CASE(delivered_attempt_is_sent_and_cleaned)
{
    auto tmp = test_util::make_temp_dir("pipeline");
    const auto staged = tmp / "u1--x.txt";
    test_util::write_file(staged, "attachment bytes");

    memory_record_store records;
    test_util::fake_delivery delivery;
    send_pipeline pipeline(records, delivery);

    auto req = make_request();
    req.attachments.push_back(staged);
    auto id = pipeline.send(req);
    BOOST_REQUIRE(id);

    BOOST_REQUIRE_EQUAL(delivery.sent.size(), 1u);
    const auto& msg = delivery.sent.front();
    BOOST_TEST(msg.from == "sender@example.com");
    BOOST_TEST(msg.text == "Plain body");
    BOOST_TEST(msg.html == "Plain body");
    BOOST_REQUIRE_EQUAL(msg.attachments.size(), 1u);
    BOOST_TEST(msg.attachments[0].filename == "x.txt");
    BOOST_TEST(msg.attachments[0].type == "text/plain");
    BOOST_TEST(msg.attachments[0].content == base64::encode_flat("attachment bytes"));

    auto rec = records.find_email(*id);
    BOOST_REQUIRE(rec && rec->has_value());
    BOOST_TEST((*rec)->status == email_status::sent);
    BOOST_TEST((*rec)->sent_at.has_value());
    BOOST_TEST(records.attachment_count() == 0u);
    BOOST_TEST(!std::filesystem::exists(staged));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(refused_delivery_marks_failed)
{
    auto tmp = test_util::make_temp_dir("pipeline");
    const auto staged = tmp / "u2--report.pdf";
    test_util::write_file(staged, "%PDF");

    memory_record_store records;
    test_util::fake_delivery delivery;
    delivery.outcome = fail(error_code::delivery_rejected, "Mail recipient rejection.", "reply.code=550");
    send_pipeline pipeline(records, delivery);

    auto req = make_request();
    req.attachments.push_back(staged);
    auto id = pipeline.send(req);
    BOOST_REQUIRE(!id);
    BOOST_TEST(id.error().code() == error_code::delivery_rejected);
    BOOST_TEST(id.error().message() == "Failed to send email");
    BOOST_TEST(id.error().detail().find("Mail recipient rejection.") != std::string::npos);
    BOOST_TEST(id.error().detail().find("reply.code=550") != std::string::npos);

    auto all = records.list_emails();
    BOOST_REQUIRE(all);
    BOOST_REQUIRE_EQUAL(all->size(), 1u);
    BOOST_TEST(all->front().status == email_status::failed);
    BOOST_TEST(!all->front().sent_at.has_value());
    BOOST_TEST(records.attachment_count() == 0u);
    BOOST_TEST(!std::filesystem::exists(staged));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(non_delivery_error_becomes_delivery_failed)
{
    memory_record_store records;
    test_util::fake_delivery delivery;
    delivery.outcome = fail(error_code::validation_failed, "Header contains CR/LF.");
    send_pipeline pipeline(records, delivery);

    auto id = pipeline.send(make_request());
    BOOST_REQUIRE(!id);
    BOOST_TEST(id.error().code() == error_code::delivery_failed);
    BOOST_TEST(id.error().detail() == "Header contains CR/LF.");
}

BOOST_AUTO_TEST_CASE(invalid_request_records_nothing)
{
    memory_record_store records;
    test_util::fake_delivery delivery;
    send_pipeline pipeline(records, delivery);

    auto no_rcpt = make_request();
    no_rcpt.recipients.clear();
    auto res = pipeline.send(no_rcpt);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code() == error_code::validation_failed);

    auto no_sender = make_request();
    no_sender.sender.clear();
    BOOST_TEST(!pipeline.send(no_sender));

    auto injected = make_request();
    injected.subject = "hi\r\nBcc: x@example.com";
    BOOST_TEST(!pipeline.send(injected));

    BOOST_TEST(records.list_emails()->empty());
    BOOST_TEST(delivery.sent.empty());
}

BOOST_AUTO_TEST_CASE(unreadable_attachment_fails_the_record)
{
    auto tmp = test_util::make_temp_dir("pipeline");
    const auto present = tmp / "u3--a.txt";
    test_util::write_file(present, "a");

    memory_record_store records;
    test_util::fake_delivery delivery;
    send_pipeline pipeline(records, delivery);

    auto req = make_request();
    req.attachments = {present, tmp / "u3--gone.txt"};
    auto id = pipeline.send(req);
    BOOST_REQUIRE(!id);
    BOOST_TEST(id.error().code() == error_code::storage_failed);
    BOOST_TEST(delivery.sent.empty());

    auto all = records.list_emails();
    BOOST_REQUIRE(all);
    BOOST_REQUIRE_EQUAL(all->size(), 1u);
    BOOST_TEST(all->front().status == email_status::failed);
    BOOST_TEST(records.attachment_count() == 0u);
    BOOST_TEST(!std::filesystem::exists(present));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(attempt_logged)
{
    test_util::log_capture capture(mailstage::log::level::info);
    memory_record_store records;
    test_util::fake_delivery delivery;
    send_pipeline pipeline(records, delivery);

    auto id = pipeline.send(make_request());
    BOOST_REQUIRE(id);
    BOOST_TEST(capture.contains("recorded as pending"));
    BOOST_TEST(capture.contains("email " + std::to_string(*id) + " sent"));
}

BOOST_AUTO_TEST_CASE(cleanup_failure_keeps_sent_outcome)
{
    auto tmp = test_util::make_temp_dir("pipeline");
    const auto staged = tmp / "u4--x.txt";
    test_util::write_file(staged, "bytes");

    test_util::log_capture capture;
    stuck_attachments_store records;
    test_util::fake_delivery delivery;
    send_pipeline pipeline(records, delivery);

    auto req = make_request();
    req.attachments.push_back(staged);
    auto id = pipeline.send(req);
    BOOST_REQUIRE(id);
    BOOST_TEST(records.delete_calls == 1);
    BOOST_TEST(capture.contains("cannot remove attachment records of email " + std::to_string(*id)));
    BOOST_TEST(capture.contains("database is locked"));

    auto rec = records.find_email(*id);
    BOOST_REQUIRE(rec && rec->has_value());
    BOOST_TEST((*rec)->status == email_status::sent);
    BOOST_TEST(!std::filesystem::exists(staged));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(cleanup_failure_keeps_delivery_error)
{
    test_util::log_capture capture;
    stuck_attachments_store records;
    test_util::fake_delivery delivery;
    delivery.outcome = fail(error_code::delivery_rejected, "Mail recipient rejection.", "reply.code=550");
    send_pipeline pipeline(records, delivery);

    auto id = pipeline.send(make_request());
    BOOST_REQUIRE(!id);
    BOOST_TEST(id.error().code() == error_code::delivery_rejected);
    BOOST_TEST(id.error().message() == "Failed to send email");
    BOOST_TEST(records.delete_calls == 1);
    BOOST_TEST(capture.contains("cannot remove attachment records"));

    auto all = records.list_emails();
    BOOST_REQUIRE(all);
    BOOST_REQUIRE_EQUAL(all->size(), 1u);
    BOOST_TEST(all->front().status == email_status::failed);
}
