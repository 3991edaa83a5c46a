#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace quill::url {

// Decodes %XX escapes. Malformed escapes are kept literally.
std::string percent_decode(std::string_view input);

// Returns the decoded filesystem path of a `file:` URL, or nullopt when the
// location is not a file URL. Accepts `file:///path`, `file://localhost/path`
// and `file:/path`.
std::optional<std::string> file_url_to_path(std::string_view location);

} // namespace quill::url
