/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mailstage/detail/error_detail.hpp>
#include <mailstage/detail/result.hpp>


BOOST_AUTO_TEST_CASE(error_detail_add_lines)
{
    mailstage::detail::error_detail detail;
    std::vector<std::string> lines = {"alpha", "beta"};
    detail.add_lines("line", lines);
    BOOST_TEST(detail.str() == "line0=alpha\nline1=beta\n");
}

BOOST_AUTO_TEST_CASE(error_detail_keys_and_ints)
{
    mailstage::detail::error_detail detail;
    detail.add("host", "mx.example.com").add_int("reply.code", 550);
    BOOST_TEST(detail.str() == "host=mx.example.com\nreply.code=550\n");
}

BOOST_AUTO_TEST_CASE(error_kinds_follow_code_ranges)
{
    using mailstage::error;
    using mailstage::error_code;

    BOOST_TEST(error(error_code::upload_busy).is_storage_error());
    BOOST_TEST(error(error_code::incomplete_upload).is_incomplete_upload());
    BOOST_TEST(error(error_code::validation_failed).is_validation_error());
    BOOST_TEST(error(error_code::delivery_rejected).is_delivery_error());
    BOOST_TEST(error(error_code::invalid_transition).is_record_error());
    BOOST_TEST(!error(error_code::internal_error).is_delivery_error());
}

BOOST_AUTO_TEST_CASE(error_to_string_carries_detail)
{
    const mailstage::error err(mailstage::error_code::delivery_failed, "Failed to send email", "550 rejected");
    BOOST_TEST(err.to_string() == "[400] Failed to send email: 550 rejected");
}
