#pragma once

#include "bookhound/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bookhound::transfer {

// Parses the first `DCC SEND <file> <ip> <port> <size>` announcement found in
// `line`. The filename may be quoted. Never throws.
std::optional<TransferOffer> parse_offer(std::string_view line);

// Cheap pre-check used by the session reader before running the full pattern.
bool looks_like_offer(std::string_view line);

// Renders a 32-bit big-endian address as dotted quad.
std::string decode_address(std::uint32_t value);

// Textual variant: anything that is not an unsigned 32-bit decimal decodes to 0.0.0.0.
std::string decode_address(std::string_view digits);

std::uint32_t encode_address(std::string_view dotted_quad);

}  // namespace bookhound::transfer
