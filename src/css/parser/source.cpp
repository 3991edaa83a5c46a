#include <quill/css/parser/source.h>
#include <quill/url/percent_encoding.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace quill::css {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the valid UTF-8 sequence starting at i, or 0 if it is invalid.
size_t valid_sequence_length(std::string_view bytes, size_t i) {
    unsigned char lead = static_cast<unsigned char>(bytes[i]);
    size_t length = 0;
    unsigned long min_code = 0;
    unsigned long code = 0;

    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; min_code = 0x80; code = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; min_code = 0x800; code = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; min_code = 0x10000; code = lead & 0x07;
    } else {
        return 0;
    }

    if (i + length > bytes.size()) return 0;
    for (size_t k = 1; k < length; ++k) {
        unsigned char c = static_cast<unsigned char>(bytes[i + k]);
        if (!is_continuation(c)) return 0;
        code = (code << 6) | (c & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF
    if (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        return 0;
    }
    return length;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw SourceError("Unable to open file: " + path.string());
    }
    return read_source(file);
}

} // namespace

std::string decode_utf8(std::string_view bytes) {
    if (bytes.substr(0, 3) == "\xEF\xBB\xBF") {
        bytes.remove_prefix(3);
    }

    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t length = valid_sequence_length(bytes, i);
        if (length == 0) {
            out += kReplacement;
            ++i;
            // A broken sequence is replaced once, not once per trailing byte
            while (i < bytes.size() && is_continuation(static_cast<unsigned char>(bytes[i]))) {
                ++i;
            }
            continue;
        }
        out.append(bytes.substr(i, length));
        i += length;
    }
    return out;
}

std::string read_source(std::istream& in) {
    std::ostringstream stream;
    stream << in.rdbuf();
    if (in.bad()) {
        throw SourceError("Failed to read stylesheet source");
    }
    return decode_utf8(stream.str());
}

std::string load_source(const std::string& location) {
    if (location.empty()) {
        throw SourceError("Empty stylesheet location");
    }

    if (auto path = url::file_url_to_path(location)) {
        return read_file(*path);
    }

    // Any other scheme ("http:", "data:", ...) is not a local source
    size_t colon = location.find(':');
    if (colon != std::string::npos && colon > 1 &&
        location.find('/') > colon && location.find('\\') > colon) {
        throw SourceError("Unsupported stylesheet location: " + location);
    }
    return read_file(location);
}

StyleSheetParseResult parse_stylesheet(std::istream& in, const ParserOptions& options) {
    const std::string css = read_source(in);
    return CSSParser(options).parse_stylesheet(css);
}

StyleSheetParseResult load_stylesheet(const std::string& location, const ParserOptions& options) {
    const std::string css = load_source(location);
    return CSSParser(options).parse_stylesheet(css);
}

} // namespace quill::css
