#include <quill/url/percent_encoding.h>
#include <cctype>

namespace quill::url {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool starts_with_ignore_case(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string percent_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += input[i];
    }

    return result;
}

std::optional<std::string> file_url_to_path(std::string_view location) {
    if (!starts_with_ignore_case(location, "file:")) {
        return std::nullopt;
    }
    std::string_view rest = location.substr(5);

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        // Authority: empty or localhost
        size_t slash = rest.find('/');
        std::string_view host = rest.substr(0, slash);
        if (!host.empty() &&
            !(host.size() == 9 && starts_with_ignore_case(host, "localhost"))) {
            return std::nullopt;
        }
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        rest.remove_prefix(slash);
    }

    // Query and fragment are not part of the path
    size_t end = rest.find_first_of("?#");
    if (end != std::string_view::npos) {
        rest = rest.substr(0, end);
    }
    if (rest.empty()) {
        return std::nullopt;
    }
    return percent_decode(rest);
}

} // namespace quill::url
