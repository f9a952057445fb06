#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <mailstage/delivery/delivery_client.hpp>
#include <mailstage/detail/log.hpp>
#include <mailstage/detail/result.hpp>

namespace test_util
{

/// Fresh directory under the system temporary directory.
inline std::filesystem::path make_temp_dir(std::string_view area)
{
    static std::atomic<unsigned> counter{0};
    auto dir = std::filesystem::temp_directory_path() / ("mailstage_" + std::string(area) + "_test")
        / (std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_"
            + std::to_string(++counter));
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& path, std::string_view bytes)
{
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/// Delivery that records every message and answers with a preset outcome.
class fake_delivery : public mailstage::delivery::delivery_client
{
public:
    mailstage::result_void send(const mailstage::mime::outbound_message& msg) override
    {
        sent.push_back(msg);
        return outcome;
    }

    mailstage::result_void outcome = mailstage::ok();
    std::vector<mailstage::mime::outbound_message> sent;
};

/// Captures log entries of the given level and above while in scope.
class log_capture
{
public:
    explicit log_capture(mailstage::log::level min = mailstage::log::level::warn)
    {
        auto& logger = mailstage::log::logger::instance();
        previous_ = logger.get_level();
        logger.set_level(min);
        logger.set_callback([this](const mailstage::log::entry& e)
        {
            std::lock_guard lock(mutex_);
            messages_.push_back(e.message);
        });
    }

    ~log_capture()
    {
        auto& logger = mailstage::log::logger::instance();
        logger.clear_callback();
        logger.set_level(previous_);
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    [[nodiscard]] bool contains(std::string_view needle) const
    {
        std::lock_guard lock(mutex_);
        for (const auto& m : messages_)
        {
            if (m.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

private:
    mailstage::log::level previous_;
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

} // namespace test_util
