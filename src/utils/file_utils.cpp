#include "file_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace gitstack::utils {

std::string FileUtils::readFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool FileUtils::writeFile(const std::string& filePath, const std::string& content) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

void FileUtils::writeFileAtomic(const std::string& filePath, const std::string& content) {
    const std::string tempPath = filePath + ".tmp";

    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Failed to create " + tempPath + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const std::string reason = std::strerror(errno);
            ::close(fd);
            ::unlink(tempPath.c_str());
            throw std::runtime_error("Failed to write " + tempPath + ": " + reason);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        ::unlink(tempPath.c_str());
        throw std::runtime_error("Failed to flush " + tempPath + ": " + reason);
    }
    ::close(fd);

    if (std::rename(tempPath.c_str(), filePath.c_str()) != 0) {
        const std::string reason = std::strerror(errno);
        ::unlink(tempPath.c_str());
        throw std::runtime_error("Failed to replace " + filePath + ": " + reason);
    }
}

bool FileUtils::fileExists(const std::string& filePath) {
    return std::filesystem::exists(filePath) && std::filesystem::is_regular_file(filePath);
}

void FileUtils::ensureDirectory(const std::string& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + directory + ": " + ec.message());
    }
}

std::string FileUtils::getEnvVar(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

std::string FileUtils::xdgDirectory(const std::string& envName, const std::string& homeFallback) {
    std::string base = getEnvVar(envName);
    if (base.empty()) {
        base = getEnvVar("HOME") + "/" + homeFallback;
    }
    return base + "/git-stack";
}

}
