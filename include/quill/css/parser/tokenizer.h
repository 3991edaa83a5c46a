#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill::css {

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, BadString, Url, BadUrl,
        Number, Percentage, Dimension, Whitespace, Comment,
        Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        IncludeMatch, DashMatch, PrefixMatch, SuffixMatch, SubstringMatch,
        Delim, CDC, CDO, EndOfFile
    };
    Type type = EndOfFile;
    std::string value;
    double numeric_value = 0;
    std::string unit;
    bool is_integer = false;  // for Number tokens

    // Source position: 1-based line, byte offsets [start_offset, end_offset)
    size_t line = 1;
    size_t start_offset = 0;
    size_t end_offset = 0;

    bool is_delim(char c) const;
    std::string to_css() const;

    // Positions are not part of token identity.
    bool operator==(const CSSToken& other) const;
    bool operator!=(const CSSToken& other) const { return !(*this == other); }
};

const char* token_type_name(CSSToken::Type type);

// Describes a token for diagnostics, e.g. `ident "color"` or `'{'`.
std::string describe_token(const CSSToken& token);

std::string serialize_tokens(const std::vector<CSSToken>& tokens);

class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);

    // Next token, skipping Whitespace and Comment tokens.
    CSSToken next_token();
    // Next token including Whitespace and Comment tokens.
    CSSToken next_token_no_skip();
    // Un-consumes the last returned token. Only one token can be pushed back.
    void push_back();

    const CSSToken& current() const { return current_; }
    size_t offset() const;

    // Tokenize all at once (whitespace and comments included, ends with EOF)
    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t token_start_ = 0;
    bool has_current_ = false;
    CSSToken current_;
    std::optional<CSSToken> pushed_back_;

    CSSToken scan_token();

    char consume();
    char peek() const;
    char peek(size_t offset) const;
    bool at_end() const;
    void reconsume();

    std::string consume_whitespace();
    CSSToken consume_comment();
    CSSToken consume_string(char ending);
    CSSToken consume_numeric();
    CSSToken consume_ident_like();
    CSSToken consume_url();
    CSSToken consume_bad_url_remnants();
    CSSToken consume_hash();
    double consume_number_value();
    std::string consume_name();
    void consume_escape(std::string& out);
    bool starts_identifier() const;
    bool starts_identifier_at(size_t offset) const;
    bool starts_number() const;
    bool valid_escape_at(size_t offset) const;

    CSSToken make(CSSToken::Type type, std::string value) const;
};

} // namespace quill::css
