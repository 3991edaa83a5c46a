#include <quill/css/parser/tokenizer.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace quill::css {

namespace {

bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_name_start_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           (static_cast<unsigned char>(c) >= 0x80);
}

bool is_name_char(char c) {
    return is_name_start_char(c) || is_digit(c) || c == '-';
}

void append_utf8(std::string& out, unsigned long code) {
    if (code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        code = 0xFFFD;
    }
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

void append_hex_escape(std::string& out, char c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\%x ", static_cast<unsigned char>(c));
    out += buf;
}

bool is_non_printable(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F;
}

// Escapes a name so that it tokenizes back to the same name. With
// as_identifier the result must also start an identifier.
std::string escape_name(const std::string& name, bool as_identifier) {
    std::string out;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (as_identifier) {
            if (i == 0 && is_digit(c)) {
                append_hex_escape(out, c);
                continue;
            }
            if (i == 1 && name[0] == '-' && is_digit(c)) {
                append_hex_escape(out, c);
                continue;
            }
            if (i == 0 && c == '-' && name.size() == 1) {
                out += "\\-";
                continue;
            }
        }
        if (is_name_char(c)) {
            out += c;
        } else if (is_non_printable(c) || is_whitespace(c)) {
            append_hex_escape(out, c);
        } else {
            out += '\\';
            out += c;
        }
    }
    return out;
}

std::string escape_string(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n' || c == '\r' || c == '\f') {
            append_hex_escape(out, c);
        } else {
            out += c;
        }
    }
    return out;
}

std::string escape_url(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (is_whitespace(c) || is_non_printable(c)) {
            append_hex_escape(out, c);
        } else if (c == '"' || c == '\'' || c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

// A unit such as "e3" would read back as an exponent.
std::string escape_unit(const std::string& unit) {
    std::string out = escape_name(unit, true);
    if (unit.size() > 1 && (unit[0] == 'e' || unit[0] == 'E')) {
        bool exponent_like = is_digit(unit[1]) ||
            ((unit[1] == '+' || unit[1] == '-') && unit.size() > 2 && is_digit(unit[2]));
        if (exponent_like) {
            std::string escaped;
            append_hex_escape(escaped, unit[0]);
            return escaped + out.substr(1);
        }
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// CSSToken
// ---------------------------------------------------------------------------

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit &&
           is_integer == other.is_integer;
}

bool CSSToken::is_delim(char c) const {
    return type == Delim && value.size() == 1 && value[0] == c;
}

std::string CSSToken::to_css() const {
    switch (type) {
        case Ident:          return escape_name(value, true);
        case Function:       return escape_name(value, true) + "(";
        case AtKeyword:      return "@" + escape_name(value, true);
        case Hash:           return "#" + escape_name(value, false);
        case String:         return "\"" + escape_string(value) + "\"";
        case BadString:      return "\"" + escape_string(value);
        case Url:            return "url(" + escape_url(value) + ")";
        case BadUrl:         return value;
        case Number:
        case Percentage:     return value;
        case Dimension:
            return value.substr(0, value.size() - unit.size()) + escape_unit(unit);
        case Whitespace:     return value;
        case Comment:        return "/*" + value + "*/";
        case Colon:          return ":";
        case Semicolon:      return ";";
        case Comma:          return ",";
        case LeftBrace:      return "{";
        case RightBrace:     return "}";
        case LeftParen:      return "(";
        case RightParen:     return ")";
        case LeftBracket:    return "[";
        case RightBracket:   return "]";
        case IncludeMatch:   return "~=";
        case DashMatch:      return "|=";
        case PrefixMatch:    return "^=";
        case SuffixMatch:    return "$=";
        case SubstringMatch: return "*=";
        case Delim:          return value;
        case CDC:            return "-->";
        case CDO:            return "<!--";
        case EndOfFile:      return "";
    }
    return value;
}

const char* token_type_name(CSSToken::Type type) {
    switch (type) {
        case CSSToken::Ident:          return "ident";
        case CSSToken::Function:       return "function";
        case CSSToken::AtKeyword:      return "at-keyword";
        case CSSToken::Hash:           return "hash";
        case CSSToken::String:         return "string";
        case CSSToken::BadString:      return "bad-string";
        case CSSToken::Url:            return "url";
        case CSSToken::BadUrl:         return "bad-url";
        case CSSToken::Number:         return "number";
        case CSSToken::Percentage:     return "percentage";
        case CSSToken::Dimension:      return "dimension";
        case CSSToken::Whitespace:     return "whitespace";
        case CSSToken::Comment:        return "comment";
        case CSSToken::Colon:          return "colon";
        case CSSToken::Semicolon:      return "semicolon";
        case CSSToken::Comma:          return "comma";
        case CSSToken::LeftBrace:      return "left-brace";
        case CSSToken::RightBrace:     return "right-brace";
        case CSSToken::LeftParen:      return "left-paren";
        case CSSToken::RightParen:     return "right-paren";
        case CSSToken::LeftBracket:    return "left-bracket";
        case CSSToken::RightBracket:   return "right-bracket";
        case CSSToken::IncludeMatch:   return "include-match";
        case CSSToken::DashMatch:      return "dash-match";
        case CSSToken::PrefixMatch:    return "prefix-match";
        case CSSToken::SuffixMatch:    return "suffix-match";
        case CSSToken::SubstringMatch: return "substring-match";
        case CSSToken::Delim:          return "delim";
        case CSSToken::CDC:            return "cdc";
        case CSSToken::CDO:            return "cdo";
        case CSSToken::EndOfFile:      return "end of input";
    }
    return "unknown";
}

std::string describe_token(const CSSToken& token) {
    switch (token.type) {
        case CSSToken::EndOfFile:
            return "end of input";
        case CSSToken::Whitespace:
            return "whitespace";
        case CSSToken::Ident:
        case CSSToken::Function:
        case CSSToken::AtKeyword:
        case CSSToken::Hash:
        case CSSToken::String:
        case CSSToken::BadString:
        case CSSToken::Url:
        case CSSToken::BadUrl:
        case CSSToken::Number:
        case CSSToken::Percentage:
        case CSSToken::Dimension:
        case CSSToken::Comment:
            return std::string(token_type_name(token.type)) + " \"" + token.value + "\"";
        default:
            return "'" + token.to_css() + "'";
    }
}

std::string serialize_tokens(const std::vector<CSSToken>& tokens) {
    std::string out;
    for (const auto& token : tokens) {
        out += token.to_css();
    }
    return out;
}

// ---------------------------------------------------------------------------
// CSSTokenizer
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input), pos_(0) {}

CSSToken CSSTokenizer::next_token() {
    while (true) {
        CSSToken token = next_token_no_skip();
        if (token.type != CSSToken::Whitespace && token.type != CSSToken::Comment) {
            return token;
        }
    }
}

CSSToken CSSTokenizer::next_token_no_skip() {
    if (pushed_back_) {
        current_ = std::move(*pushed_back_);
        pushed_back_.reset();
        return current_;
    }

    token_start_ = pos_;
    size_t start_line = line_;
    CSSToken token = scan_token();
    token.line = start_line;
    token.start_offset = token_start_;
    token.end_offset = pos_;

    current_ = token;
    has_current_ = true;
    return token;
}

void CSSTokenizer::push_back() {
    if (!has_current_ || pushed_back_) {
        return;
    }
    pushed_back_ = current_;
}

size_t CSSTokenizer::offset() const {
    return pushed_back_ ? pushed_back_->start_offset : pos_;
}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) {
        char c = input_[pos_++];
        if (c == '\n') ++line_;
        return c;
    }
    return '\0';
}

char CSSTokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    if (idx < input_.size()) {
        return input_[idx];
    }
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
        if (input_[pos_] == '\n') --line_;
    }
}

CSSToken CSSTokenizer::make(CSSToken::Type type, std::string value) const {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    return token;
}

std::string CSSTokenizer::consume_whitespace() {
    std::string run;
    while (!at_end() && is_whitespace(peek())) {
        run += consume();
    }
    return run;
}

CSSToken CSSTokenizer::consume_comment() {
    // We've already consumed '/' and '*'
    std::string text;
    while (!at_end()) {
        char c = consume();
        if (c == '*' && peek() == '/') {
            consume(); // consume '/'
            return make(CSSToken::Comment, std::move(text));
        }
        text += c;
    }
    // Unterminated comment runs to the end of input
    return make(CSSToken::Comment, std::move(text));
}

bool CSSTokenizer::valid_escape_at(size_t offset) const {
    if (peek(offset) != '\\') return false;
    char next = peek(offset + 1);
    return next != '\n' && next != '\0';
}

bool CSSTokenizer::starts_identifier_at(size_t offset) const {
    char c = peek(offset);
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(offset + 1);
        return is_name_start_char(next) || next == '-' || valid_escape_at(offset + 1);
    }
    if (c == '\\') {
        return valid_escape_at(offset);
    }
    return false;
}

bool CSSTokenizer::starts_identifier() const {
    return starts_identifier_at(0);
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (is_digit(c)) return true;
    if (c == '.') {
        return is_digit(peek(1));
    }
    if (c == '+' || c == '-') {
        char next = peek(1);
        if (is_digit(next)) return true;
        if (next == '.' && is_digit(peek(2)))
            return true;
    }
    return false;
}

void CSSTokenizer::consume_escape(std::string& out) {
    // The backslash has already been consumed
    if (at_end()) {
        append_utf8(out, 0xFFFD);
        return;
    }
    char escaped = consume();
    if (std::isxdigit(static_cast<unsigned char>(escaped))) {
        // Hex escape - up to 6 hex digits and one optional whitespace
        std::string hex(1, escaped);
        for (int i = 0; i < 5 && !at_end() &&
             std::isxdigit(static_cast<unsigned char>(peek())); ++i) {
            hex += consume();
        }
        if (!at_end() && is_whitespace(peek())) {
            consume();
        }
        append_utf8(out, std::strtoul(hex.c_str(), nullptr, 16));
    } else {
        out += escaped;
    }
}

std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
        } else if (valid_escape_at(0)) {
            consume(); // consume backslash
            consume_escape(result);
        } else {
            break;
        }
    }
    return result;
}

double CSSTokenizer::consume_number_value() {
    std::string repr;

    // Optional sign
    if (peek() == '+' || peek() == '-') {
        repr += consume();
    }

    // Digits before decimal point
    while (!at_end() && is_digit(peek())) {
        repr += consume();
    }

    // Decimal point and digits after
    if (peek() == '.' && is_digit(peek(1))) {
        repr += consume(); // '.'
        while (!at_end() && is_digit(peek())) {
            repr += consume();
        }
    }

    // Scientific notation: 'e' must be followed by a digit, optionally signed
    if (peek() == 'e' || peek() == 'E') {
        char after_e = peek(1);
        bool signed_exponent = (after_e == '+' || after_e == '-') && is_digit(peek(2));
        if (is_digit(after_e) || signed_exponent) {
            repr += consume(); // 'e' or 'E'
            if (peek() == '+' || peek() == '-') {
                repr += consume();
            }
            while (!at_end() && is_digit(peek())) {
                repr += consume();
            }
        }
    }

    return std::strtod(repr.c_str(), nullptr);
}

CSSToken CSSTokenizer::consume_string(char ending) {
    std::string result;

    while (!at_end()) {
        char c = consume();
        if (c == ending) {
            return make(CSSToken::String, std::move(result));
        }
        if (c == '\\') {
            if (at_end()) {
                break;
            }
            if (peek() == '\n') {
                // Escaped newline: line continuation
                consume();
            } else {
                consume_escape(result);
            }
        } else if (c == '\n') {
            // Unescaped newline ends the string; the newline is not part of it
            reconsume();
            return make(CSSToken::BadString, std::move(result));
        } else {
            result += c;
        }
    }

    return make(CSSToken::BadString, std::move(result));
}

CSSToken CSSTokenizer::consume_numeric() {
    CSSToken token;

    size_t start = pos_;
    double value = consume_number_value();
    size_t after_num = pos_;

    bool is_int = true;
    std::string_view num_str = input_.substr(start, after_num - start);
    for (char c : num_str) {
        if (c == '.' || c == 'e' || c == 'E') {
            is_int = false;
            break;
        }
    }

    token.numeric_value = value;
    token.is_integer = is_int;

    if (starts_identifier()) {
        token.type = CSSToken::Dimension;
        token.unit = consume_name();
        token.value = std::string(num_str) + token.unit;
        return token;
    }

    if (peek() == '%') {
        consume();
        token.type = CSSToken::Percentage;
        token.value = std::string(num_str) + "%";
        return token;
    }

    token.type = CSSToken::Number;
    token.value = std::string(num_str);
    return token;
}

CSSToken CSSTokenizer::consume_ident_like() {
    std::string name = consume_name();

    if (peek() == '(') {
        consume(); // consume '('
        bool is_url = name.size() == 3 &&
                      std::tolower(static_cast<unsigned char>(name[0])) == 'u' &&
                      std::tolower(static_cast<unsigned char>(name[1])) == 'r' &&
                      std::tolower(static_cast<unsigned char>(name[2])) == 'l';
        if (is_url) {
            size_t ahead = 0;
            while (is_whitespace(peek(ahead))) ++ahead;
            char first = peek(ahead);
            if (first != '"' && first != '\'') {
                return consume_url();
            }
        }
        return make(CSSToken::Function, std::move(name));
    }

    return make(CSSToken::Ident, std::move(name));
}

CSSToken CSSTokenizer::consume_url() {
    // "url(" has been consumed and the contents are not quoted
    std::string url;
    consume_whitespace();

    while (true) {
        if (at_end()) {
            return consume_bad_url_remnants();
        }
        char c = consume();
        if (c == ')') {
            return make(CSSToken::Url, std::move(url));
        }
        if (is_whitespace(c)) {
            consume_whitespace();
            if (peek() == ')') {
                consume();
                return make(CSSToken::Url, std::move(url));
            }
            return consume_bad_url_remnants();
        }
        if (c == '"' || c == '\'' || c == '(' || is_non_printable(c)) {
            return consume_bad_url_remnants();
        }
        if (c == '\\') {
            if (at_end() || peek() == '\n') {
                return consume_bad_url_remnants();
            }
            consume_escape(url);
            continue;
        }
        url += c;
    }
}

CSSToken CSSTokenizer::consume_bad_url_remnants() {
    while (!at_end()) {
        char c = consume();
        if (c == ')') {
            break;
        }
        if (c == '\\' && !at_end() && peek() != '\n') {
            consume(); // escaped character, e.g. "\)"
        }
    }
    return make(CSSToken::BadUrl,
                std::string(input_.substr(token_start_, pos_ - token_start_)));
}

CSSToken CSSTokenizer::consume_hash() {
    // '#' has already been consumed
    if (!at_end() && (is_name_char(peek()) || valid_escape_at(0))) {
        return make(CSSToken::Hash, consume_name());
    }
    return make(CSSToken::Delim, "#");
}

CSSToken CSSTokenizer::scan_token() {
    if (at_end()) {
        return make(CSSToken::EndOfFile, "");
    }

    char c = consume();

    if (is_whitespace(c)) {
        return make(CSSToken::Whitespace, std::string(1, c) + consume_whitespace());
    }

    if (c == '/' && peek() == '*') {
        consume(); // '*'
        return consume_comment();
    }

    if (c == '"' || c == '\'') {
        return consume_string(c);
    }

    if (c == '#') {
        return consume_hash();
    }

    switch (c) {
        case '(': return make(CSSToken::LeftParen, "(");
        case ')': return make(CSSToken::RightParen, ")");
        case ',': return make(CSSToken::Comma, ",");
        case ':': return make(CSSToken::Colon, ":");
        case ';': return make(CSSToken::Semicolon, ";");
        case '[': return make(CSSToken::LeftBracket, "[");
        case ']': return make(CSSToken::RightBracket, "]");
        case '{': return make(CSSToken::LeftBrace, "{");
        case '}': return make(CSSToken::RightBrace, "}");
        default: break;
    }

    // Attribute match operators
    if (peek() == '=') {
        CSSToken::Type match = CSSToken::Delim;
        switch (c) {
            case '~': match = CSSToken::IncludeMatch; break;
            case '|': match = CSSToken::DashMatch; break;
            case '^': match = CSSToken::PrefixMatch; break;
            case '$': match = CSSToken::SuffixMatch; break;
            case '*': match = CSSToken::SubstringMatch; break;
            default: break;
        }
        if (match != CSSToken::Delim) {
            consume(); // '='
            return make(match, std::string(1, c) + "=");
        }
    }

    // Plus sign: could start a number
    if (c == '+') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        consume(); // re-consume '+'
        return make(CSSToken::Delim, "+");
    }

    // Hyphen-minus: could start a number, ident, or CDC
    if (c == '-') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        if (peek(1) == '-' && peek(2) == '>') {
            consume();
            consume();
            consume();
            return make(CSSToken::CDC, "-->");
        }
        if (starts_identifier()) {
            return consume_ident_like();
        }
        consume(); // re-consume '-'
        return make(CSSToken::Delim, "-");
    }

    // Period: could start a number
    if (c == '.') {
        reconsume();
        if (starts_number()) {
            return consume_numeric();
        }
        consume(); // re-consume '.'
        return make(CSSToken::Delim, ".");
    }

    // Less-than: check for CDO (<!--)
    if (c == '<') {
        if (peek() == '!' && peek(1) == '-' && peek(2) == '-') {
            consume(); // '!'
            consume(); // '-'
            consume(); // '-'
            return make(CSSToken::CDO, "<!--");
        }
        return make(CSSToken::Delim, "<");
    }

    if (c == '@') {
        if (starts_identifier()) {
            return make(CSSToken::AtKeyword, consume_name());
        }
        return make(CSSToken::Delim, "@");
    }

    // Backslash: could start an escaped ident
    if (c == '\\') {
        reconsume();
        if (valid_escape_at(0)) {
            return consume_ident_like();
        }
        consume();
        return make(CSSToken::Delim, "\\");
    }

    if (is_digit(c)) {
        reconsume();
        return consume_numeric();
    }

    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like();
    }

    return make(CSSToken::Delim, std::string(1, c));
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;

    while (true) {
        CSSToken token = tokenizer.next_token_no_skip();
        tokens.push_back(token);
        if (token.type == CSSToken::EndOfFile) {
            break;
        }
    }

    return tokens;
}

} // namespace quill::css
