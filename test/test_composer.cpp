/*

test_composer.cpp
-----------------

MIME rendering of outbound messages.

*/

#define BOOST_TEST_MODULE composer_test

#include <chrono>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailstage/codec/base64.hpp>
#include <mailstage/mime/composer.hpp>

using mailstage::base64;
using mailstage::error_code;
using mailstage::mime::compose;
using mailstage::mime::compose_options;
using mailstage::mime::outbound_attachment;
using mailstage::mime::outbound_message;

namespace
{

outbound_message make_message()
{
    outbound_message msg;
    msg.from = "sender@example.com";
    msg.to = {"a@example.com", "b@example.com"};
    msg.subject = "Quarterly report";
    msg.text = "See attached.";
    msg.html = "See attached.";
    return msg;
}

compose_options fixed_date()
{
    compose_options opts;
    opts.domain = "test.local";
    opts.date = std::chrono::system_clock::time_point(std::chrono::seconds(0));
    return opts;
}

} // namespace


BOOST_AUTO_TEST_CASE(headers)
{
    auto doc = compose(make_message(), fixed_date());
    BOOST_REQUIRE(doc);
    BOOST_TEST(doc->find("From: sender@example.com\r\n") != std::string::npos);
    BOOST_TEST(doc->find("To: a@example.com,\r\n b@example.com\r\n") != std::string::npos);
    BOOST_TEST(doc->find("Subject: Quarterly report\r\n") != std::string::npos);
    BOOST_TEST(doc->find("Date: Thu, 01 Jan 1970 00:00:00 +0000\r\n") != std::string::npos);
    BOOST_TEST(doc->find("@test.local>\r\n") != std::string::npos);
    BOOST_TEST(doc->find("MIME-Version: 1.0\r\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(text_and_html_alternative)
{
    auto doc = compose(make_message(), fixed_date());
    BOOST_REQUIRE(doc);
    BOOST_TEST(doc->find("Content-Type: multipart/alternative; boundary=\"=_alt_") != std::string::npos);
    BOOST_TEST(doc->find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
    BOOST_TEST(doc->find("Content-Type: text/html; charset=utf-8\r\n") != std::string::npos);
    BOOST_TEST(doc->find(base64::encode_flat("See attached.")) != std::string::npos);
    BOOST_TEST(doc->find("multipart/mixed") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(single_text_part)
{
    auto msg = make_message();
    msg.html.clear();
    auto doc = compose(msg, fixed_date());
    BOOST_REQUIRE(doc);
    BOOST_TEST(doc->find("multipart/") == std::string::npos);
    BOOST_TEST(doc->find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(attachments_in_mixed_part)
{
    auto msg = make_message();
    const std::string payload(200, 'x');
    outbound_attachment att;
    att.content = base64::encode_flat(payload);
    att.filename = "x.txt";
    att.type = "text/plain";
    msg.attachments.push_back(att);

    auto doc = compose(msg, fixed_date());
    BOOST_REQUIRE(doc);
    BOOST_TEST(doc->find("Content-Type: multipart/mixed; boundary=\"=_mixed_") != std::string::npos);
    BOOST_TEST(doc->find("Content-Type: text/plain; name=\"x.txt\"\r\n") != std::string::npos);
    BOOST_TEST(doc->find("Content-Disposition: attachment; filename=\"x.txt\"\r\n") != std::string::npos);

    // Lines of the attachment body stay within 76 columns.
    const auto first_line = att.content.substr(0, 76);
    BOOST_TEST(doc->find(first_line + "\r\n") != std::string::npos);
    BOOST_TEST(doc->find(att.content) == std::string::npos);
}

BOOST_AUTO_TEST_CASE(non_ascii_subject_encoded)
{
    auto msg = make_message();
    msg.subject = "Rapport trimestriel \xc3\xa9t\xc3\xa9";
    auto doc = compose(msg, fixed_date());
    BOOST_REQUIRE(doc);
    BOOST_TEST(doc->find("Subject: =?UTF-8?B?") != std::string::npos);
    BOOST_TEST(doc->find("\xc3\xa9") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(rejects_header_injection)
{
    auto msg = make_message();
    msg.subject = "hello\r\nBcc: victim@example.com";
    auto doc = compose(msg, fixed_date());
    BOOST_REQUIRE(!doc);
    BOOST_TEST(doc.error().code() == error_code::validation_failed);

    auto no_rcpt = make_message();
    no_rcpt.to.clear();
    BOOST_TEST(!compose(no_rcpt, fixed_date()));
}

BOOST_AUTO_TEST_CASE(rejects_non_base64_attachment)
{
    auto msg = make_message();
    outbound_attachment att;
    att.content = "not base64 at all!";
    att.filename = "x.bin";
    msg.attachments.push_back(att);
    auto doc = compose(msg, fixed_date());
    BOOST_REQUIRE(!doc);
    BOOST_TEST(doc.error().code() == error_code::validation_failed);
}

BOOST_AUTO_TEST_CASE(date_header_in_utc)
{
    const std::chrono::system_clock::time_point tp{std::chrono::seconds(880'106'106)};
    BOOST_TEST(mailstage::mime::detail::format_date(tp) == "Fri, 21 Nov 1997 09:55:06 +0000");
}
