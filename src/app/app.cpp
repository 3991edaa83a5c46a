#include "quill/app/app.h"

#include "quill/core/config.h"
#include "quill/core/diagnostics.h"
#include "quill/css/parser/parser.h"
#include "quill/css/parser/source.h"

#include <string_view>

namespace quill::app {

namespace {

void print_usage(std::ostream& stream) {
  stream << "usage: " << core::config::kProgramName
         << " [--declarations] [--quiet] <file|file-URL|->\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

struct Options {
  bool declarations_only = false;
  bool quiet = false;
  std::string location;
};

std::string read_input(const std::string& location, std::istream& in) {
  if (location == "-") {
    return css::read_source(in);
  }
  return css::load_source(location);
}

void print_declarations(const std::vector<css::Declaration>& declarations, std::ostream& out) {
  for (const auto& declaration : declarations) {
    out << declaration << ";\n";
  }
}

}  // namespace

int run(const std::vector<std::string>& arguments, std::istream& in, std::ostream& out,
        std::ostream& err) {
  if (arguments.size() == 1 && is_help_flag(arguments[0])) {
    print_usage(out);
    return kExitOk;
  }
  if (arguments.size() == 1 && is_version_flag(arguments[0])) {
    out << core::config::kVersionString << "\n";
    return kExitOk;
  }

  Options options;
  bool has_location = false;
  for (const std::string& argument : arguments) {
    if (argument == "--declarations") {
      options.declarations_only = true;
      continue;
    }
    if (argument == "--quiet") {
      options.quiet = true;
      continue;
    }
    if (argument.size() > 1 && argument[0] == '-') {
      err << "Unknown option: '" << argument << "'\n";
      print_usage(err);
      return kExitUsage;
    }
    if (has_location) {
      print_usage(err);
      return kExitUsage;
    }
    options.location = argument;
    has_location = true;
  }

  if (!has_location) {
    print_usage(err);
    return kExitUsage;
  }

  core::DiagnosticEmitter diagnostics;
  diagnostics.set_source(options.location == "-" ? "<stdin>" : options.location);
  diagnostics.set_min_severity(options.quiet ? core::Severity::Error : core::Severity::Info);
  diagnostics.add_observer([&err](const core::DiagnosticEvent& event) {
    err << core::format_diagnostic(event) << "\n";
  });

  std::string source;
  try {
    source = read_input(options.location, in);
  } catch (const css::SourceError& e) {
    diagnostics.emit(core::Severity::Error, "source", "load", e.what());
    return kExitSourceError;
  }

  const css::CSSParser parser{};
  if (options.declarations_only) {
    const css::DeclarationListParseResult result = parser.parse_declaration_list(source);
    print_declarations(result.declarations, out);
    css::report_parse_errors(result.errors, diagnostics, "declarations");
  } else {
    const css::StyleSheetParseResult result = parser.parse_stylesheet(source);
    out << result.stylesheet.to_string();
    css::report_parse_errors(result.errors, diagnostics, "stylesheet");
  }

  diagnostics.emit(core::Severity::Info, core::config::kDiagnosticsModule, "summary",
                   std::to_string(diagnostics.events_by_severity(core::Severity::Warning).size()) +
                       " parse error(s)");
  return kExitOk;
}

}  // namespace quill::app
