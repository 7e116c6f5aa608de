#include "platform.hpp"
#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : dir;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
