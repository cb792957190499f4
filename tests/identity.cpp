#include "bookhound/identity/IdentityGenerator.hpp"

#include <cassert>
#include <set>
#include <string>

using bookhound::identity::IdentityGenerator;

int main() {
    IdentityGenerator first(0x1234u);
    IdentityGenerator second(0x1234u);
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const auto nickname = first.next();
        assert(nickname == second.next());
        assert(IdentityGenerator::is_valid_nickname(nickname));
        assert(nickname.size() <= bookhound::identity::kMaxNicknameLength);
        seen.insert(nickname);
    }
    assert(seen.size() > 100);

    IdentityGenerator unseeded;
    assert(IdentityGenerator::is_valid_nickname(unseeded.next()));

    assert(IdentityGenerator::is_valid_nickname("SwiftFox123_ab"));
    assert(IdentityGenerator::is_valid_nickname("[away]"));
    assert(!IdentityGenerator::is_valid_nickname(""));
    assert(!IdentityGenerator::is_valid_nickname("1stReader"));
    assert(!IdentityGenerator::is_valid_nickname("has space"));
    assert(!IdentityGenerator::is_valid_nickname("WayTooLongNickname42"));

    return 0;
}
