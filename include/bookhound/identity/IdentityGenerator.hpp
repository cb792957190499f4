#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace bookhound::identity {

constexpr std::size_t kMaxNicknameLength = 16;

// Produces handles of the form <Adjective><Noun><100-999>[_]<xx], truncated to
// kMaxNicknameLength. A fixed seed yields a reproducible sequence.
class IdentityGenerator {
public:
    explicit IdentityGenerator(std::optional<std::uint32_t> seed = std::nullopt);

    std::string next();

    // RFC 2812 nickname grammar, bounded to kMaxNicknameLength.
    static bool is_valid_nickname(std::string_view nickname);

private:
    std::mt19937 rng_;
};

}  // namespace bookhound::identity
