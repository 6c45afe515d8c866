#include "platform.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path make_temp_dir(const std::string& prefix) {
    static std::atomic<unsigned> counter{0};
    for (;;) {
        fs::path p = temp_dir() / (prefix + "_" + std::to_string(::getpid()) + "_" +
                                   std::to_string(counter.fetch_add(1)));
        // create_directory returns false if it already existed
        if (fs::create_directory(p)) return p;
    }
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
