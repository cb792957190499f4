#include "bookhound/text/Encoding.hpp"

#include <cerrno>
#include <cstdint>
#include <iconv.h>

namespace bookhound::text {

namespace {

class IconvHandle {
public:
    IconvHandle(const char* to, const char* from)
        : handle_(::iconv_open(to, from)) {}
    ~IconvHandle() {
        if (valid()) {
            ::iconv_close(handle_);
        }
    }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return handle_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return handle_; }

private:
    iconv_t handle_;
};

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
    std::size_t index = 0;
    while (index < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[index]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++index;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (index + extra >= bytes.size()) {
            return false;
        }
        for (std::size_t i = 1; i <= extra; ++i) {
            const auto next = static_cast<unsigned char>(bytes[index + i]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        index += extra + 1;
    }
    return true;
}

std::optional<std::string> convert_to_utf8(std::string_view bytes, const std::string& from_encoding) {
    IconvHandle converter("UTF-8", from_encoding.c_str());
    if (!converter.valid()) {
        return std::nullopt;
    }

    std::string output;
    output.resize(bytes.size() * 4 + 16);
    char* in = const_cast<char*>(bytes.data());
    std::size_t in_left = bytes.size();
    char* out = output.data();
    std::size_t out_left = output.size();

    while (in_left > 0) {
        const auto result = ::iconv(converter.get(), &in, &in_left, &out, &out_left);
        if (result == static_cast<std::size_t>(-1)) {
            if (errno == E2BIG) {
                const auto used = output.size() - out_left;
                output.resize(output.size() * 2);
                out = output.data() + used;
                out_left = output.size() - used;
                continue;
            }
            return std::nullopt;
        }
    }
    output.resize(output.size() - out_left);
    return output;
}

const std::vector<std::string>& default_encodings() {
    static const std::vector<std::string> encodings{"UTF-8", "CP1252", "ISO-8859-1"};
    return encodings;
}

std::optional<DecodedText> decode_to_utf8(std::string_view bytes, const std::vector<std::string>& encodings) {
    const auto& chain = encodings.empty() ? default_encodings() : encodings;
    for (const auto& encoding : chain) {
        if (encoding == "UTF-8") {
            if (is_valid_utf8(bytes)) {
                return DecodedText{std::string(bytes), encoding};
            }
            continue;
        }
        if (auto converted = convert_to_utf8(bytes, encoding)) {
            return DecodedText{std::move(*converted), encoding};
        }
    }
    return std::nullopt;
}

}  // namespace bookhound::text
