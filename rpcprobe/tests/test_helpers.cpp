#include "test_helpers.hpp"

#include "logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include <unistd.h>

std::string fake_server_path() {
    return RPCPROBE_FAKE_SERVER;
}

ScopedFakeMode::ScopedFakeMode(const std::string& mode) {
    ::setenv("RPCPROBE_FAKE_MODE", mode.c_str(), 1);
}

ScopedFakeMode::~ScopedFakeMode() {
    ::unsetenv("RPCPROBE_FAKE_MODE");
}

std::string write_temp_file(const std::string& name, const std::string& content, bool executable) {
    namespace fs = std::filesystem;

    fs::path dir = fs::temp_directory_path() / ("rpcprobe_tests_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    fs::path path = dir / name;

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("cannot create " + path.string());
    }
    output << content;
    output.close();

    fs::perms perms = fs::perms::owner_read | fs::perms::owner_write;
    if (executable) {
        perms |= fs::perms::owner_exec;
    }
    fs::permissions(path, perms, fs::perm_options::replace);
    return path.string();
}

void init_test_logging() {
    static std::once_flag once;
    std::call_once(once, []() { init_logging(RPCPROBE_LOG_CONFIG); });
}
