#include "bookhound/identity/IdentityGenerator.hpp"

#include <array>
#include <cctype>

namespace bookhound::identity {

namespace {

constexpr std::array<std::string_view, 8> kAdjectives{
    "Dark", "Web", "Quick", "Silent", "Swift", "Digital", "Cyber", "Net"};
constexpr std::array<std::string_view, 8> kNouns{
    "Horse", "Wolf", "Eagle", "Lion", "Hawk", "Fox", "Bear", "Tiger"};

bool is_special(char ch) {
    switch (ch) {
        case '[':
        case ']':
        case '\\':
        case '`':
        case '_':
        case '^':
        case '{':
        case '|':
        case '}':
            return true;
        default:
            return false;
    }
}

std::mt19937 make_engine(std::optional<std::uint32_t> seed) {
    if (seed.has_value()) {
        return std::mt19937(*seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}

}  // namespace

IdentityGenerator::IdentityGenerator(std::optional<std::uint32_t> seed)
    : rng_(make_engine(seed)) {}

std::string IdentityGenerator::next() {
    std::uniform_int_distribution<std::size_t> adjective(0, kAdjectives.size() - 1);
    std::uniform_int_distribution<std::size_t> noun(0, kNouns.size() - 1);
    std::uniform_int_distribution<int> number(100, 999);
    std::uniform_int_distribution<int> coin(0, 1);
    std::uniform_int_distribution<int> letter('a', 'z');

    std::string nickname;
    nickname.append(kAdjectives[adjective(rng_)]);
    nickname.append(kNouns[noun(rng_)]);
    nickname.append(std::to_string(number(rng_)));

    if (coin(rng_) == 1) {
        if (coin(rng_) == 1) {
            nickname.push_back('_');
        }
        nickname.push_back(static_cast<char>(letter(rng_)));
        nickname.push_back(static_cast<char>(letter(rng_)));
    }

    if (nickname.size() > kMaxNicknameLength) {
        nickname.resize(kMaxNicknameLength);
    }
    return nickname;
}

bool IdentityGenerator::is_valid_nickname(std::string_view nickname) {
    if (nickname.empty() || nickname.size() > kMaxNicknameLength) {
        return false;
    }
    const auto first = static_cast<unsigned char>(nickname.front());
    if (!std::isalpha(first) && !is_special(nickname.front())) {
        return false;
    }
    for (const char ch : nickname.substr(1)) {
        const auto uch = static_cast<unsigned char>(ch);
        if (!std::isalnum(uch) && !is_special(ch) && ch != '-') {
            return false;
        }
    }
    return true;
}

}  // namespace bookhound::identity
