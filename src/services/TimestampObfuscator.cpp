#include "services/ITimestampObfuscator.hpp"

#include "util/SecureRandom.hpp"

#ifdef _WIN32
#include "services/WindowsTimestampObfuscator.hpp"
#else
#include "services/PosixTimestampObfuscator.hpp"
#endif

#include <chrono>

namespace timestamps {

auto random_past_time() -> int64_t {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    return static_cast<int64_t>(now) -
           static_cast<int64_t>(
               util::SecureRandom::uniform(static_cast<uint64_t>(MAX_AGE_SECONDS)));
}

auto make_platform_obfuscator(std::shared_ptr<util::ILogger> logger)
    -> std::unique_ptr<ITimestampObfuscator> {
#ifdef _WIN32
    return std::make_unique<WindowsTimestampObfuscator>(std::move(logger));
#else
    return std::make_unique<PosixTimestampObfuscator>(std::move(logger));
#endif
}

}  // namespace timestamps
