#include "bookhound/text/Encoding.hpp"

#include <cassert>
#include <string>

using namespace bookhound::text;

int main() {
    assert(is_valid_utf8("plain ascii"));
    assert(is_valid_utf8("caf\xC3\xA9"));
    assert(is_valid_utf8("\xE2\x82\xAC 5"));
    assert(is_valid_utf8("\xF0\x9F\x93\x9A"));
    assert(!is_valid_utf8("caf\xE9"));
    assert(!is_valid_utf8("\xC3"));
    assert(!is_valid_utf8("\xC0\xAF"));
    assert(!is_valid_utf8("\xED\xA0\x80"));

    const auto utf8 = decode_to_utf8("Jos\xC3\xA9 Saramago");
    assert(utf8.has_value());
    assert(utf8->encoding == "UTF-8");
    assert(utf8->utf8 == "Jos\xC3\xA9 Saramago");

    // 0x80 is the euro sign in CP1252.
    const auto cp1252 = decode_to_utf8("Price \x80" "5");
    assert(cp1252.has_value());
    assert(cp1252->encoding == "CP1252");
    assert(cp1252->utf8 == "Price \xE2\x82\xAC" "5");

    const auto latin1 = decode_to_utf8("Gabriel Garc\xED" "a M\xE1rquez", {"UTF-8", "ISO-8859-1"});
    assert(latin1.has_value());
    assert(latin1->encoding == "ISO-8859-1");
    assert(latin1->utf8 == "Gabriel Garc\xC3\xAD" "a M\xC3\xA1rquez");

    const auto strict = decode_to_utf8("caf\xE9", {"UTF-8"});
    assert(!strict.has_value());

    assert(convert_to_utf8("caf\xE9", "ISO-8859-1") == std::optional<std::string>("caf\xC3\xA9"));
    assert(!convert_to_utf8("text", "NO-SUCH-CHARSET").has_value());
    assert(default_encodings().front() == "UTF-8");

    return 0;
}
