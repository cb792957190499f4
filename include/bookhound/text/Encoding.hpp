#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bookhound::text {

struct DecodedText {
    std::string utf8;
    std::string encoding;
};

bool is_valid_utf8(std::string_view bytes);

// Strict conversion through iconv; nullopt when `bytes` is not valid in `from_encoding`.
std::optional<std::string> convert_to_utf8(std::string_view bytes, const std::string& from_encoding);

// Catalog listings carry no charset declaration. Tries each encoding in order
// ("UTF-8", "CP1252", "ISO-8859-1" by default) and returns the first clean decode.
std::optional<DecodedText> decode_to_utf8(std::string_view bytes,
                                          const std::vector<std::string>& encodings = {});

const std::vector<std::string>& default_encodings();

}  // namespace bookhound::text
