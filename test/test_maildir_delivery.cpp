/*

test_maildir_delivery.cpp
-------------------------

Local Maildir delivery used by development setups.

*/

#define BOOST_TEST_MODULE maildir_delivery_test

#include <filesystem>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailstage/delivery/maildir_delivery.hpp>
#include "test_util.hpp"

using mailstage::error_code;
using mailstage::delivery::maildir_delivery;
using mailstage::mime::outbound_message;


BOOST_AUTO_TEST_CASE(message_lands_in_new)
{
    auto tmp = test_util::make_temp_dir("maildir");
    maildir_delivery box(tmp / "box");

    outbound_message msg;
    msg.from = "sender@example.com";
    msg.to = {"rcpt@example.com"};
    msg.subject = "Local copy";
    msg.text = "Hello";
    BOOST_REQUIRE(box.send(msg));
    BOOST_REQUIRE(box.send(msg));

    const auto delivered = box.list_new();
    BOOST_REQUIRE_EQUAL(delivered.size(), 2u);
    BOOST_TEST(delivered[0] != delivered[1]);
    BOOST_TEST(std::filesystem::is_empty(tmp / "box" / "tmp"));

    const auto document = test_util::read_file(delivered[0]);
    BOOST_TEST(document.find("From: sender@example.com\r\n") != std::string::npos);
    BOOST_TEST(document.find("Subject: Local copy\r\n") != std::string::npos);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(unrenderable_message_is_refused)
{
    auto tmp = test_util::make_temp_dir("maildir");
    maildir_delivery box(tmp / "box");

    outbound_message msg;
    msg.from = "sender@example.com";
    msg.subject = "No recipients";
    msg.text = "Hello";
    auto res = box.send(msg);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code() == error_code::validation_failed);
    BOOST_TEST(box.list_new().empty());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(list_new_of_missing_folder)
{
    auto tmp = test_util::make_temp_dir("maildir");
    maildir_delivery box(tmp / "never_created");
    BOOST_TEST(box.list_new().empty());
    BOOST_TEST(box.root() == tmp / "never_created");
    std::filesystem::remove_all(tmp);
}
