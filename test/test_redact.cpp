/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailstage/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_auth_plain)
{
    BOOST_TEST(mailstage::detail::redact_line("AUTH PLAIN AHVzZXIAcGFzcw==") == "AUTH PLAIN <redacted>");
}

BOOST_AUTO_TEST_CASE(redact_keeps_line_ending)
{
    BOOST_TEST(mailstage::detail::redact_line("auth plain AHVzZXIAcGFzcw==\r\n") == "auth plain <redacted>\r\n");
}

BOOST_AUTO_TEST_CASE(redact_login_continuation)
{
    BOOST_TEST(mailstage::detail::redact_line("c2VjcmV0") == "<redacted>");
}

BOOST_AUTO_TEST_CASE(redact_leaves_commands)
{
    BOOST_TEST(mailstage::detail::redact_line("AUTH LOGIN") == "AUTH LOGIN");
    BOOST_TEST(mailstage::detail::redact_line("MAIL FROM:<a@example.com>") == "MAIL FROM:<a@example.com>");
    BOOST_TEST(mailstage::detail::redact_line("DATA") == "DATA");
}
