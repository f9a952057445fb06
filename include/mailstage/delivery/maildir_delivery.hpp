/*

maildir_delivery.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Delivery into a local Maildir, for development setups without a mail relay.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <mailstage/delivery/delivery_client.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/mime/composer.hpp>

namespace mailstage::delivery
{

class maildir_delivery : public delivery_client
{
public:
    explicit maildir_delivery(std::filesystem::path root)
        : root_(std::move(root)),
          tmp_dir_(root_ / "tmp"),
          new_dir_(root_ / "new"),
          cur_dir_(root_ / "cur")
    {
    }

    /**
    Composing the message and dropping it into `new/`.

    The document is written to `tmp/` and renamed, so Maildir readers never see a partial file.
    **/
    result_void send(const mime::outbound_message& msg) override
    {
        auto document = mime::compose(msg);
        if (!document)
            return fail(std::move(document).error());

        std::error_code ec;
        for (const auto* dir : {&tmp_dir_, &new_dir_, &cur_dir_})
        {
            std::filesystem::create_directories(*dir, ec);
            if (ec)
                return fail(error_code::delivery_failed, "Cannot create Maildir folder.", dir->string() + ": " + ec.message());
        }

        const auto base = unique_name();
        const auto tmp_path = tmp_dir_ / base;
        {
            std::ofstream ofs(tmp_path, std::ios::binary);
            ofs.write(document->data(), static_cast<std::streamsize>(document->size()));
            ofs.flush();
            if (!ofs)
            {
                ofs.close();
                std::filesystem::remove(tmp_path, ec);
                return fail(error_code::delivery_failed, "Cannot write message into Maildir.", tmp_path.string());
            }
        }

        const auto dest_path = new_dir_ / base;
        std::filesystem::rename(tmp_path, dest_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return fail(error_code::delivery_failed, "Cannot move message into Maildir.", ec.message());
        }
        MAILSTAGE_INFO("message delivered to " + dest_path.string());
        return ok();
    }

    /// Paths of the messages waiting in `new/`.
    [[nodiscard]] std::vector<std::filesystem::path> list_new() const
    {
        std::vector<std::filesystem::path> out;
        std::error_code ec;
        std::filesystem::directory_iterator it(new_dir_, ec);
        if (ec)
            return out;
        for (const auto& de : it)
        {
            std::error_code type_ec;
            if (de.is_regular_file(type_ec))
                out.push_back(de.path());
        }
        return out;
    }

    [[nodiscard]] const std::filesystem::path& root() const noexcept
    {
        return root_;
    }

private:
    static std::string unique_name()
    {
        static std::mutex rng_mutex;
        static std::mt19937_64 rng(std::random_device{}());
        static std::atomic<std::uint64_t> counter{0};

        std::uint64_t rnd = 0;
        {
            std::lock_guard lock(rng_mutex);
            rnd = rng();
        }
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
        return std::to_string(ns) + "." + std::to_string(rnd) + "." + std::to_string(++counter) + ".mailstage";
    }

    std::filesystem::path root_;
    std::filesystem::path tmp_dir_;
    std::filesystem::path new_dir_;
    std::filesystem::path cur_dir_;
};

} // namespace mailstage::delivery
