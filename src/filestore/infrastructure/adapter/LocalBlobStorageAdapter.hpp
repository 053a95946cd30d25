/**
 * @file LocalBlobStorageAdapter.hpp
 * @brief Local filesystem adapter for blob storage
 */

#pragma once

#include "../../domain/port/IBlobStoragePort.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/UuidUtil.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <vector>

namespace filestore::infrastructure::adapter {

using namespace filestore::domain::port;
namespace fs = std::filesystem;

/**
 * @brief Local filesystem implementation of blob storage
 *
 * Keys have the form "uploads/<uuid>[.<ext>]" relative to the base path.
 * Content is written to a temporary file and renamed into place, so a key
 * never names a partially written blob.
 */
class LocalBlobStorageAdapter : public IBlobStoragePort {
private:
    static constexpr const char* KEY_PREFIX = "uploads";
    static constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

    fs::path basePath_;

    void ensureDirectoryExists(const fs::path& path) {
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec || !fs::is_directory(path)) {
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR",
                "Failed to create directory: " + path.string()
            );
        }
    }

    /**
     * @brief Resolve a key below the base path, rejecting anything that escapes it
     */
    fs::path resolve(const std::string& key) const {
        fs::path relative(key);
        if (key.empty() || relative.is_absolute()) {
            throw shared::exception::InfrastructureException("STORAGE_ERROR", "Invalid blob key: " + key);
        }
        for (const auto& part : relative) {
            if (part == "..") {
                throw shared::exception::InfrastructureException("STORAGE_ERROR", "Invalid blob key: " + key);
            }
        }
        return basePath_ / relative;
    }

    static std::string makeKey(const std::string& extension) {
        std::string key = std::string(KEY_PREFIX) + "/" + shared::util::UuidUtil::generate();
        if (!extension.empty()) {
            key += "." + extension;
        }
        return key;
    }

public:
    explicit LocalBlobStorageAdapter(const std::string& basePath)
        : basePath_(basePath) {
        ensureDirectoryExists(basePath_ / KEY_PREFIX);
    }

    std::string put(std::istream& content, const std::string& extension) override {
        if (extension.find('/') != std::string::npos || extension.find('\\') != std::string::npos) {
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Invalid extension: " + extension);
        }

        std::string key = makeKey(extension);
        fs::path target = resolve(key);
        fs::path temp = target;
        temp += ".part";

        // Caller's position and state are put back once the copy is done
        const auto state = content.rdstate();
        content.clear();
        auto position = content.tellg();
        if (position == std::streampos(-1)) {
            content.clear(state);
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Content stream is not seekable");
        }
        content.seekg(0, std::ios::beg);

        bool written = false;
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (file) {
                std::vector<char> buffer(COPY_BUFFER_SIZE);
                while (content.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
                       content.gcount() > 0) {
                    file.write(buffer.data(), content.gcount());
                    if (!file) {
                        break;
                    }
                }
                written = file && !content.bad();
                file.close();
                written = written && !file.fail();
            }
        }

        content.clear();
        content.seekg(position);
        content.clear(state);

        std::error_code ec;
        if (!written) {
            fs::remove(temp, ec);
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Failed to write blob: " + target.string());
        }

        fs::rename(temp, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Failed to move blob into place: " + ec.message());
        }

        spdlog::debug("[LocalBlobStorageAdapter] Stored {}", key);
        return key;
    }

    bool remove(const std::string& key) override {
        std::error_code ec;
        bool removed = fs::remove(resolve(key), ec);
        if (ec) {
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Failed to remove blob " + key + ": " + ec.message());
        }
        return removed;
    }

    std::unique_ptr<std::istream> openStream(const std::string& key) override {
        auto stream = std::make_unique<std::ifstream>(resolve(key), std::ios::binary);
        if (!*stream) {
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Failed to open blob: " + key);
        }
        return stream;
    }

    bool exists(const std::string& key) override {
        std::error_code ec;
        return fs::is_regular_file(resolve(key), ec);
    }

    const fs::path& getBasePath() const {
        return basePath_;
    }
};

} // namespace filestore::infrastructure::adapter
