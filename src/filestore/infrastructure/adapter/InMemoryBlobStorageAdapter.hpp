/**
 * @file InMemoryBlobStorageAdapter.hpp
 * @brief Process-local blob storage
 */

#pragma once

#include "../../domain/port/IBlobStoragePort.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/UuidUtil.hpp"
#include <iterator>
#include <map>
#include <mutex>
#include <sstream>

namespace filestore::infrastructure::adapter {

using namespace filestore::domain::port;

/**
 * @brief Blob storage kept in a map, for the memory backend and tests
 */
class InMemoryBlobStorageAdapter : public IBlobStoragePort {
private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> blobs_;

public:
    std::string put(std::istream& content, const std::string& extension) override {
        const auto state = content.rdstate();
        content.clear();
        auto position = content.tellg();
        if (position == std::streampos(-1)) {
            content.clear(state);
            throw shared::exception::InfrastructureException(
                "STORAGE_ERROR", "Content stream is not seekable");
        }
        content.seekg(0, std::ios::beg);
        std::string bytes{std::istreambuf_iterator<char>(content), std::istreambuf_iterator<char>()};
        bool failed = content.bad();
        content.clear();
        content.seekg(position);
        content.clear(state);

        if (failed) {
            throw shared::exception::InfrastructureException("STORAGE_ERROR", "Failed to read content");
        }

        std::string key = "uploads/" + shared::util::UuidUtil::generate();
        if (!extension.empty()) {
            key += "." + extension;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        blobs_[key] = std::move(bytes);
        return key;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_.erase(key) > 0;
    }

    std::unique_ptr<std::istream> openStream(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blobs_.find(key);
        if (it == blobs_.end()) {
            throw shared::exception::InfrastructureException("STORAGE_ERROR", "Blob not found: " + key);
        }
        return std::make_unique<std::istringstream>(it->second, std::ios::binary);
    }

    bool exists(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_.count(key) > 0;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_.size();
    }

    /**
     * @brief Seed a blob under a chosen key (legacy rows without a hash)
     */
    void putWithKey(const std::string& key, std::string bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        blobs_[key] = std::move(bytes);
    }
};

} // namespace filestore::infrastructure::adapter
