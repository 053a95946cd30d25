/**
 * @file IBlobStoragePort.hpp
 * @brief Port interface for raw content storage
 */

#pragma once

#include <istream>
#include <memory>
#include <string>

namespace filestore::domain::port {

/**
 * @brief Port interface for the blob store
 *
 * Stores raw bytes under an opaque generated key. Failures are reported as
 * shared::exception::InfrastructureException.
 */
class IBlobStoragePort {
public:
    virtual ~IBlobStoragePort() = default;

    /**
     * @brief Store the whole content of a stream
     *
     * Reads from offset 0 and restores the stream's position afterwards.
     *
     * @param content Seekable content stream
     * @param extension File extension without dot (may be empty)
     * @return Generated key
     */
    virtual std::string put(std::istream& content, const std::string& extension) = 0;

    /**
     * @brief Release a key
     * @return true if content was removed
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Open a readable stream over stored content
     */
    virtual std::unique_ptr<std::istream> openStream(const std::string& key) = 0;

    virtual bool exists(const std::string& key) = 0;
};

} // namespace filestore::domain::port
