#include <quill/css/parser/stylesheet.h>
#include <ostream>

namespace quill::css {

std::string Declaration::to_string() const {
    return property + ": " + value_text();
}

bool Declaration::operator==(const Declaration& other) const {
    return property == other.property && terms == other.terms;
}

std::string StyleRule::to_string() const {
    std::string out = selectors.to_string() + " {";
    for (const auto& decl : declarations) {
        out += "\n  " + decl.to_string() + ";";
    }
    if (!declarations.empty()) out += "\n";
    return out + "}";
}

std::string AtRule::to_string() const {
    std::string out = "@" + keyword;
    if (!header.empty()) {
        out += " " + serialize_tokens(header);
    }
    if (!has_block) {
        return out + ";";
    }
    out += " {";
    if (!body.empty()) {
        out += " " + serialize_tokens(body) + " ";
    }
    return out + "}";
}

std::vector<const StyleRule*> StyleSheet::style_rules() const {
    std::vector<const StyleRule*> result;
    for (const auto& rule : rules) {
        if (auto* style = std::get_if<StyleRule>(&rule)) {
            result.push_back(style);
        }
    }
    return result;
}

std::vector<const AtRule*> StyleSheet::at_rules() const {
    std::vector<const AtRule*> result;
    for (const auto& rule : rules) {
        if (auto* at = std::get_if<AtRule>(&rule)) {
            result.push_back(at);
        }
    }
    return result;
}

std::string StyleSheet::to_string() const {
    std::string out;
    for (const auto& rule : rules) {
        if (!out.empty()) out += "\n";
        out += std::visit([](const auto& r) { return r.to_string(); }, rule);
        out += "\n";
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Declaration& declaration) {
    return os << declaration.to_string();
}

} // namespace quill::css
