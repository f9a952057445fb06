/*

test_chunk_assembler.cpp
------------------------

Reassembly of staged chunks: ordering, completeness and at-most-once assembly.

*/

#define BOOST_TEST_MODULE chunk_assembler_test

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailstage/upload/chunk_assembler.hpp>
#include <mailstage/upload/chunk_store.hpp>
#include "test_util.hpp"

using mailstage::error_code;
using mailstage::upload::chunk_assembler;
using mailstage::upload::chunk_store;


BOOST_AUTO_TEST_CASE(any_arrival_order_gives_ascending_concatenation)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    std::vector<std::string> payloads;
    std::string expected;
    for (int i = 0; i < 7; ++i)
    {
        payloads.push_back("chunk" + std::to_string(i) + std::string(static_cast<std::size_t>(i) * 3, 'a' + i));
        expected += payloads.back();
    }

    std::mt19937 rng(42);
    for (int round = 0; round < 5; ++round)
    {
        const std::string id = "order" + std::to_string(round);
        std::vector<std::size_t> order(payloads.size());
        for (std::size_t i = 0; i < order.size(); ++i)
            order[i] = i;
        std::shuffle(order.begin(), order.end(), rng);
        for (auto i : order)
            BOOST_REQUIRE(store.put_chunk(id, i, payloads[i]));

        auto artifact = assembler.assemble(id, "data.bin", payloads.size());
        BOOST_REQUIRE(artifact);
        BOOST_TEST(artifact->filename().string() == id + "--data.bin");
        BOOST_TEST(test_util::read_file(*artifact) == expected);
    }

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(missing_chunk_leaves_no_artifact)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    BOOST_REQUIRE(store.put_chunk("u1", 0, "aaaaaaaaaa"));
    BOOST_REQUIRE(store.put_chunk("u1", 2, "cccccccccc"));

    auto artifact = assembler.assemble("u1", "x.txt", 4);
    BOOST_REQUIRE(!artifact);
    BOOST_TEST(artifact.error().code() == error_code::incomplete_upload);
    BOOST_TEST(artifact.error().detail() == "missing=1,3");
    BOOST_TEST(!std::filesystem::exists(tmp / "u1--x.txt"));
    BOOST_TEST(!std::filesystem::exists(tmp / "u1--x.txt.partial"));

    // The session survives, so the client can supply the gaps and retry.
    BOOST_TEST(store.has_chunk("u1", 0));
    BOOST_REQUIRE(store.put_chunk("u1", 1, "bbbbbbbbbb"));
    BOOST_REQUIRE(store.put_chunk("u1", 3, "dd"));
    auto retried = assembler.assemble("u1", "x.txt", 4);
    BOOST_REQUIRE(retried);
    BOOST_TEST(test_util::read_file(*retried) == "aaaaaaaaaabbbbbbbbbbccccccccccdd");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(huge_announced_count_is_bounded)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    BOOST_REQUIRE(store.put_chunk("u1", 0, "a"));
    BOOST_REQUIRE(store.put_chunk("u1", 2, "c"));

    const std::size_t total = 9'000'000'000'000'000'000u;
    auto artifact = assembler.assemble("u1", "x.txt", total);
    BOOST_REQUIRE(!artifact);
    BOOST_TEST(artifact.error().code() == error_code::incomplete_upload);
    const auto& detail = artifact.error().detail();
    BOOST_TEST(detail.starts_with("missing=1,3,4,5,6,7,8,9,10,11,12,13,14,15,16,17,+"));
    BOOST_TEST(detail.ends_with(std::to_string(total - 2 - 16) + " more"));
    BOOST_TEST(detail.size() < 128u);
    BOOST_TEST(store.has_chunk("u1", 0));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(chunks_removed_after_success)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    BOOST_REQUIRE(store.put_chunk("u1", 0, "ab"));
    BOOST_REQUIRE(store.put_chunk("u1", 1, "cd"));
    auto artifact = assembler.assemble("u1", "x.txt", 2);
    BOOST_REQUIRE(artifact);
    BOOST_TEST(!std::filesystem::exists(store.session_dir("u1")));

    // Nothing is left to assemble a second time.
    auto again = assembler.assemble("u1", "x.txt", 2);
    BOOST_REQUIRE(!again);
    BOOST_TEST(again.error().code() == error_code::incomplete_upload);
    BOOST_TEST(test_util::read_file(*artifact) == "abcd");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(later_rewrite_wins)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    BOOST_REQUIRE(store.put_chunk("u1", 0, "old"));
    BOOST_REQUIRE(store.put_chunk("u1", 1, "-tail"));
    BOOST_REQUIRE(store.put_chunk("u1", 0, "new"));
    auto artifact = assembler.assemble("u1", "x.txt", 2);
    BOOST_REQUIRE(artifact);
    BOOST_TEST(test_util::read_file(*artifact) == "new-tail");

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(concurrent_completion_assembles_once)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    const std::string chunk(64 * 1024, 'z');
    for (std::size_t i = 0; i < 16; ++i)
        BOOST_REQUIRE(store.put_chunk("shared", i, chunk));

    std::atomic<int> succeeded{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&]
        {
            auto res = assembler.assemble("shared", "big.bin", 16);
            if (res)
                ++succeeded;
            else if (res.error().is(error_code::upload_busy) || res.error().is(error_code::incomplete_upload))
                ++refused;
        });
    }
    for (auto& th : threads)
        th.join();

    BOOST_TEST(succeeded.load() == 1);
    BOOST_TEST(refused.load() == 3);
    BOOST_TEST(std::filesystem::file_size(tmp / "shared--big.bin") == 16u * chunk.size());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(rejects_bad_arguments)
{
    auto tmp = test_util::make_temp_dir("assembler");
    chunk_store store(tmp);
    chunk_assembler assembler(store);

    auto zero = assembler.assemble("u1", "x.txt", 0);
    BOOST_REQUIRE(!zero);
    BOOST_TEST(zero.error().code() == error_code::validation_failed);

    auto bad_name = assembler.assemble("u1", "../x.txt", 1);
    BOOST_REQUIRE(!bad_name);
    BOOST_TEST(bad_name.error().code() == error_code::validation_failed);

    std::filesystem::remove_all(tmp);
}
