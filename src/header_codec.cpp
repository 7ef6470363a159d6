#include "header_codec.hpp"
#include "stomp/types.hpp"

namespace stomp {
namespace internal {

std::string HeaderCodec::Escape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '\r': result += "\\r"; break;
            case '\n': result += "\\n"; break;
            case ':':  result += "\\c"; break;
            default:   result += c; break;
        }
    }

    return result;
}

std::string HeaderCodec::Unescape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            result += text[i];
            continue;
        }

        if (i + 1 >= text.size()) {
            throw ProtocolError(error_code::INVALID_HEADER_ESCAPE,
                                "Truncated escape sequence in header '" + std::string(text) + "'");
        }

        char next = text[++i];
        switch (next) {
            case '\\': result += '\\'; break;
            case 'r':  result += '\r'; break;
            case 'n':  result += '\n'; break;
            case 'c':  result += ':'; break;
            default:
                throw ProtocolError(error_code::INVALID_HEADER_ESCAPE,
                                    std::string("Invalid escape sequence '\\") + next +
                                    "' in header '" + std::string(text) + "'");
        }
    }

    return result;
}

HeaderMap HeaderCodec::EncodeHeaders(const HeaderMap& headers) {
    HeaderMap result;
    for (const auto& [name, value] : headers) {
        result.Add(Escape(name), Escape(value));
    }
    return result;
}

HeaderMap HeaderCodec::DecodeHeaders(const HeaderMap& headers) {
    HeaderMap result;
    for (const auto& [name, value] : headers) {
        result.Add(Unescape(name), Unescape(value));
    }
    return result;
}

std::string HeaderCodec::ToString(const HeaderMap& headers) {
    std::string result;
    for (const auto& [name, value] : headers) {
        if (!result.empty()) {
            result += protocol::EOL;
        }
        result += name;
        result += ':';
        result += value;
    }
    return result;
}

HeaderMap HeaderCodec::FromString(std::string_view block) {
    HeaderMap result;

    while (!block.empty()) {
        size_t eol = block.find('\n');
        std::string_view line = block.substr(0, eol);
        block = (eol == std::string_view::npos) ? std::string_view{} : block.substr(eol + 1);

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        // The value is everything after the first colon
        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            continue;
        }

        result.Add(std::string(line.substr(0, colon)), std::string(line.substr(colon + 1)));
    }

    return result;
}

} // namespace internal
} // namespace stomp
