#include "bookhound/transfer/OfferCodec.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <regex>
#include <system_error>

namespace bookhound::transfer {

namespace {

const std::regex& offer_pattern() {
    static const std::regex pattern(R"re(DCC SEND "?(.+[^"])"?\s+(\d+)\s+(\d+)\s+(\d+)\s*)re");
    return pattern;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
    T value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

bool looks_like_offer(std::string_view line) {
    return line.find("DCC SEND") != std::string_view::npos;
}

std::optional<TransferOffer> parse_offer(std::string_view line) {
    if (!looks_like_offer(line)) {
        return std::nullopt;
    }

    const std::string text(line);
    std::smatch match;
    if (!std::regex_search(text, match, offer_pattern())) {
        return std::nullopt;
    }

    const auto port = parse_unsigned<std::uint32_t>(match.str(3));
    const auto size = parse_unsigned<std::uint64_t>(match.str(4));
    if (!port.has_value() || *port == 0 || *port > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    if (!size.has_value()) {
        return std::nullopt;
    }

    TransferOffer offer{};
    offer.filename = match.str(1);
    offer.peer_address = decode_address(match.str(2));
    offer.peer_port = static_cast<std::uint16_t>(*port);
    offer.declared_size = *size;
    offer.source_text = text;
    return offer;
}

std::string decode_address(std::uint32_t value) {
    return std::to_string((value >> 24) & 0xFFu) + '.' +
           std::to_string((value >> 16) & 0xFFu) + '.' +
           std::to_string((value >> 8) & 0xFFu) + '.' +
           std::to_string(value & 0xFFu);
}

std::string decode_address(std::string_view digits) {
    const auto value = parse_unsigned<std::uint32_t>(digits);
    if (!value.has_value()) {
        return "0.0.0.0";
    }
    return decode_address(*value);
}

std::uint32_t encode_address(std::string_view dotted_quad) {
    if (std::count(dotted_quad.begin(), dotted_quad.end(), '.') != 3) {
        return 0;
    }
    std::uint32_t value = 0;
    std::size_t octets = 0;
    std::size_t start = 0;
    while (start <= dotted_quad.size() && octets < 4) {
        const auto dot = dotted_quad.find('.', start);
        const auto end = dot == std::string_view::npos ? dotted_quad.size() : dot;
        const auto octet = parse_unsigned<std::uint32_t>(dotted_quad.substr(start, end - start));
        if (!octet.has_value() || *octet > 0xFFu) {
            return 0;
        }
        value = (value << 8) | *octet;
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return octets == 4 ? value : 0;
}

}  // namespace bookhound::transfer
