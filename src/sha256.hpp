// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace capkern {

/**
 * Incremental SHA-256 (FIPS 180-4).
 *
 * Used for the audit hash chain; the kernel never depends on it for
 * token generation.
 */
class Sha256 {
  public:
    static constexpr size_t kDigestSize = 32;
    using Digest = std::array<uint8_t, kDigestSize>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& data);
    Digest finish();

    static Digest hash(const std::string& data);
    static std::string hash_hex(const std::string& data);
    static std::string to_hex(const Digest& digest);

  private:
    void transform(const uint8_t* block);

    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> buffer_;
    size_t buffer_len_ = 0;
    uint64_t total_len_ = 0;
    bool finished_ = false;
};

bool sha256_file_hex(const std::string& path, std::string& out_hex);

} // namespace capkern
