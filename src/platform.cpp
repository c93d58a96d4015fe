// cppcheck-suppress-file missingIncludeSystem
#include "platform.hpp"

#include <sys/random.h>

#include <cerrno>
#include <cstring>
#include <ctime>

namespace capkern {

uint64_t system_monotonic_ms(void*)
{
    struct timespec ts {};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1000000ULL;
}

Result<void> system_random_bytes(void*, uint8_t* out, size_t len)
{
    size_t off = 0;
    while (off < len) {
        ssize_t got = ::getrandom(out + off, len - off, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error::system(errno, "getrandom failed");
        }
        off += static_cast<size_t>(got);
    }
    return {};
}

Platform::Platform() : Platform(PlatformDeps{}) {}

Platform::Platform(const PlatformDeps& deps) : deps_(deps)
{
    if (deps_.now_ms == nullptr) {
        deps_.now_ms = system_monotonic_ms;
    }
    if (deps_.random_bytes == nullptr) {
        deps_.random_bytes = system_random_bytes;
    }
}

uint64_t Platform::now_ms() const
{
    return deps_.now_ms(deps_.user_ctx);
}

Result<void> Platform::random_bytes(uint8_t* out, size_t len) const
{
    return deps_.random_bytes(deps_.user_ctx, out, len);
}

Result<CapToken> Platform::make_token() const
{
    CapToken token;
    TRY(random_bytes(token.bytes.data(), token.bytes.size()));
    return token;
}

Result<ObjectId> Platform::make_object_id() const
{
    uint8_t raw[16];
    ObjectId id;
    // An all-zero id is reserved as "invalid"; redraw in the (2^-128) case.
    while (!id.valid()) {
        TRY(random_bytes(raw, sizeof(raw)));
        std::memcpy(&id.hi, raw, sizeof(id.hi));
        std::memcpy(&id.lo, raw + 8, sizeof(id.lo));
    }
    return id;
}

} // namespace capkern
