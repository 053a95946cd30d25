#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/rand.h>

namespace shared::util {

/**
 * UUID generation utility.
 *
 * Random bits come from OpenSSL's CSPRNG, which is safe to call from
 * several threads at once.
 */
class UuidUtil {
public:
    /**
     * Generate a UUID v4 (random), lowercase.
     */
    static std::string generate() {
        std::array<unsigned char, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed while generating UUID");
        }

        // Set version to 4 (random) and variant to RFC 4122
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    /**
     * Validate canonical UUID v4 format (case-insensitive).
     */
    static bool isValidV4(const std::string& uuid) {
        if (uuid.length() != 36) {
            return false;
        }

        for (size_t i = 0; i < uuid.length(); ++i) {
            char c = uuid[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') {
                    return false;
                }
            } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }

        char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(uuid[19])));
        return uuid[14] == '4' &&
               (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
    }

    /**
     * Lowercase copy of a UUID string.
     */
    static std::string normalize(const std::string& uuid) {
        std::string out = uuid;
        for (char& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }
};

} // namespace shared::util
