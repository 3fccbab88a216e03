/**
 * @file redaction.cpp
 * @brief Implementation of connection string credential redaction
 */

#include "migrator/core/redaction.hpp"

namespace migrator {

namespace {

constexpr std::string_view scheme_separator = "://";

/// Characters that terminate the authority part of a URI embedded in text
[[nodiscard]] bool ends_authority(char c) noexcept {
    switch (c) {
        case '/':
        case '?':
        case '#':
        case ' ':
        case '\t':
        case '\n':
        case '\r':
        case '"':
        case '\'':
        case ',':
            return true;
        default:
            return false;
    }
}

struct password_span {
    std::size_t begin{0};
    std::size_t end{0};
};

/// Locate the password of the URI whose "://" starts at sep_pos
[[nodiscard]] bool find_password(std::string_view text, std::size_t sep_pos,
                                 password_span& span, std::size_t& authority_end) {
    const auto authority_begin = sep_pos + scheme_separator.size();
    authority_end = authority_begin;
    while (authority_end < text.size() && !ends_authority(text[authority_end])) {
        ++authority_end;
    }

    auto authority = text.substr(authority_begin, authority_end - authority_begin);
    auto at = authority.rfind('@');
    if (at == std::string_view::npos) {
        return false;
    }

    auto colon = authority.substr(0, at).find(':');
    if (colon == std::string_view::npos) {
        return false;
    }

    span.begin = authority_begin + colon + 1;
    span.end = authority_begin + at;
    return true;
}

}  // namespace

auto redact_credentials(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto sep = text.find(scheme_separator, pos);
        if (sep == std::string_view::npos) {
            break;
        }

        password_span span;
        std::size_t authority_end = 0;
        if (find_password(text, sep, span, authority_end) && span.end > span.begin) {
            out.append(text.substr(pos, span.begin - pos));
            out.append(redacted_password);
            out.append(text.substr(span.end, authority_end - span.end));
        } else {
            out.append(text.substr(pos, authority_end - pos));
        }
        pos = authority_end;
    }

    if (pos < text.size()) {
        out.append(text.substr(pos));
    }
    return out;
}

auto contains_credentials(std::string_view text) -> bool {
    std::size_t pos = 0;
    while ((pos = text.find(scheme_separator, pos)) != std::string_view::npos) {
        password_span span;
        std::size_t authority_end = 0;
        if (find_password(text, pos, span, authority_end) &&
            text.substr(span.begin, span.end - span.begin) != redacted_password &&
            span.end > span.begin) {
            return true;
        }
        pos = authority_end;
    }
    return false;
}

}  // namespace migrator
