/*

test_chunk_store.cpp
--------------------

Staging of chunks and of directly uploaded files.

*/

#define BOOST_TEST_MODULE chunk_store_test

#include <filesystem>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailstage/mime/attachment_resolver.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include "test_util.hpp"

using mailstage::error_code;
using mailstage::upload::chunk_store;
using mailstage::upload::upload_limits;

BOOST_TEST_DONT_PRINT_LOG_VALUE(mailstage::result_void)


BOOST_AUTO_TEST_CASE(put_chunk_creates_session)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    chunk_store store(tmp / "staging");

    BOOST_REQUIRE(store.put_chunk("u1", 0, "0123456789"));
    BOOST_TEST(std::filesystem::is_directory(tmp / "staging" / "u1"));
    BOOST_TEST(store.has_chunk("u1", 0));
    BOOST_TEST(!store.has_chunk("u1", 1));
    BOOST_TEST(test_util::read_file(store.chunk_path("u1", 0)) == "0123456789");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(rewrite_keeps_latest_bytes)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    chunk_store store(tmp);

    BOOST_REQUIRE(store.put_chunk("u1", 2, "first"));
    BOOST_REQUIRE(store.put_chunk("u1", 2, "second"));
    BOOST_TEST(test_util::read_file(store.chunk_path("u1", 2)) == "second");

    const auto received = store.received_chunks("u1");
    BOOST_REQUIRE_EQUAL(received.size(), 1u);
    BOOST_TEST(received.front() == 2u);

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(received_chunks_sorted)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    chunk_store store(tmp);

    BOOST_REQUIRE(store.put_chunk("u2", 10, "c"));
    BOOST_REQUIRE(store.put_chunk("u2", 2, "b"));
    BOOST_REQUIRE(store.put_chunk("u2", 0, "a"));
    const auto received = store.received_chunks("u2");
    BOOST_REQUIRE_EQUAL(received.size(), 3u);
    BOOST_TEST(received[0] == 0u);
    BOOST_TEST(received[1] == 2u);
    BOOST_TEST(received[2] == 10u);
    BOOST_TEST(store.received_chunks("unknown").empty());

    BOOST_REQUIRE(store.discard("u2"));
    BOOST_TEST(!std::filesystem::exists(store.session_dir("u2")));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(rejects_unsafe_upload_ids)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    chunk_store store(tmp);

    for (const char* id : {"", "..", "../escape", "a/b", "with--separator", ".hidden", "sp ace"})
    {
        auto res = store.put_chunk(id, 0, "x");
        BOOST_REQUIRE(!res);
        BOOST_TEST(res.error().code() == error_code::validation_failed);
    }
    BOOST_TEST(std::filesystem::is_empty(tmp));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(chunk_size_limit)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    upload_limits limits;
    limits.max_chunk_bytes = 4;
    chunk_store store(tmp, limits);

    BOOST_TEST(store.put_chunk("u1", 0, "1234"));
    auto res = store.put_chunk("u1", 1, "12345");
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code() == error_code::payload_too_large);
    BOOST_TEST(!store.has_chunk("u1", 1));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(store_file_unique_names)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    chunk_store store(tmp);

    auto first = store.store_file("report-v2.pdf", "pdf bytes");
    auto second = store.store_file("report-v2.pdf", "other bytes");
    BOOST_REQUIRE(first);
    BOOST_REQUIRE(second);
    BOOST_TEST(*first != *second);
    BOOST_TEST(first->filename().string().rfind("attachment-", 0) == 0);
    BOOST_TEST(test_util::read_file(*first) == "pdf bytes");

    const auto resolved = mailstage::mime::resolve(*first);
    BOOST_TEST(resolved.display_filename == "report-v2.pdf");
    BOOST_TEST(resolved.content_type == "application/pdf");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(store_file_limits_and_names)
{
    auto tmp = test_util::make_temp_dir("chunk_store");
    upload_limits limits;
    limits.max_file_bytes = 3;
    chunk_store store(tmp, limits);

    auto too_big = store.store_file("a.txt", "abcd");
    BOOST_REQUIRE(!too_big);
    BOOST_TEST(too_big.error().code() == error_code::payload_too_large);

    auto escaping = store.store_file("../a.txt", "abc");
    BOOST_REQUIRE(!escaping);
    BOOST_TEST(escaping.error().code() == error_code::validation_failed);

    std::filesystem::remove_all(tmp);
}
