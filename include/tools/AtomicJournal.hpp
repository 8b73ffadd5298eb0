#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace repomap {
namespace fs = std::filesystem;

// Whole-file replacement: readers see either the previous content or the
// new one, never a torn write. Concurrent writers race last-writer-wins.
class AtomicJournal {
public:
    static bool write(const fs::path& target, const std::string& content, std::error_code& ec) {
        fs::path staging = staging_path(target);
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out) {
                ec = std::make_error_code(std::errc::io_error);
                return false;
            }
            out.write(content.data(), (std::streamsize)content.size());
            out.flush();
            if (!out) {
                out.close();
                std::error_code ignored;
                fs::remove(staging, ignored);
                ec = std::make_error_code(std::errc::io_error);
                return false;
            }
        }

        fs::rename(staging, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(staging, ignored);
            return false;
        }
        return true;
    }

private:
    // Unique per process and thread so parallel writers never share a
    // staging file.
    static fs::path staging_path(const fs::path& target) {
        static std::atomic<unsigned long> counter{0};
        std::string suffix = ".tmp." + std::to_string(::getpid()) + "." +
                             std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "." +
                             std::to_string(counter.fetch_add(1));
        return fs::path(target.string() + suffix);
    }
};

}
