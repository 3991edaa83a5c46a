#include <gtest/gtest.h>
#include <quill/core/diagnostics.h>
#include <quill/css/parser/parser.h>
#include <quill/css/parser/stylesheet.h>
#include <string>

using namespace quill::css;

namespace {

std::vector<CSSToken> retokenize(const std::vector<CSSToken>& run) {
    auto tokens = CSSTokenizer::tokenize_all(serialize_tokens(run));
    tokens.pop_back();  // EndOfFile
    return tokens;
}

bool has_error_containing(const std::vector<ParseError>& errors, const std::string& text) {
    for (const auto& error : errors) {
        if (error.message.find(text) != std::string::npos) return true;
    }
    return false;
}

} // namespace

// =============================================================================
// Stylesheet Tests
// =============================================================================

class CSSStylesheetTest : public ::testing::Test {};

TEST_F(CSSStylesheetTest, SingleRuleWithClassSelector) {
    auto result = parse_stylesheet(".foo { color: red; }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->selectors.selectors.size(), 1u);
    EXPECT_EQ(*rules[0]->selectors.selectors[0], *Selector::class_name("foo"));
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    const auto& decl = rules[0]->declarations[0];
    EXPECT_EQ(decl.property, "color");
    ASSERT_EQ(decl.terms.size(), 1u);
    EXPECT_EQ(decl.terms[0].type, CSSToken::Ident);
    EXPECT_EQ(decl.terms[0].value, "red");
}

TEST_F(CSSStylesheetTest, WellFormedRulesProduceOneOfEach) {
    const char* inputs[] = {
        "rect { fill: blue; }",
        "#a { stroke-width: 2px; }",
        "g > rect { opacity: 50%; }",
        "[x] { font-family: \"Arial\"; }",
        "a:hover { fill: rgb(1, 2, 3); }",
    };
    for (const char* css : inputs) {
        auto result = parse_stylesheet(css);
        EXPECT_TRUE(result.errors.empty()) << css;
        auto rules = result.stylesheet.style_rules();
        ASSERT_EQ(rules.size(), 1u) << css;
        EXPECT_EQ(rules[0]->selectors.selectors.size(), 1u) << css;
        EXPECT_EQ(rules[0]->declarations.size(), 1u) << css;
    }
}

TEST_F(CSSStylesheetTest, ChildCombinatorWithEmptyBlock) {
    auto result = parse_stylesheet("#id1 > .bar {}");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    auto expected = Selector::combine(SelectorKind::Child, Selector::id("id1"),
                                      Selector::class_name("bar"));
    EXPECT_EQ(*rules[0]->selectors.selectors[0], *expected);
    EXPECT_TRUE(rules[0]->declarations.empty());
}

TEST_F(CSSStylesheetTest, CompoundSelector) {
    auto result = parse_stylesheet("a.b {}");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    auto expected = Selector::combine(SelectorKind::And, Selector::type("a"),
                                      Selector::class_name("b"));
    EXPECT_EQ(*rules[0]->selectors.selectors[0], *expected);
}

TEST_F(CSSStylesheetTest, ChainedChildCombinatorsLeanRight) {
    auto result = parse_stylesheet("a > b > c {}");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    const auto& sel = rules[0]->selectors.selectors[0];
    ASSERT_EQ(sel->kind, SelectorKind::Child);
    EXPECT_EQ(sel->left->kind, SelectorKind::Type);
    EXPECT_EQ(sel->left->name, "a");
    ASSERT_EQ(sel->right->kind, SelectorKind::Child);
    EXPECT_EQ(sel->right->left->name, "b");
    EXPECT_EQ(sel->right->right->name, "c");
}

TEST_F(CSSStylesheetTest, SelectorGroupInRule) {
    auto result = parse_stylesheet("h1, h2.x { margin: 0 }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0]->selectors.selectors.size(), 2u);
    EXPECT_EQ(rules[0]->selectors.to_string(), "h1, h2.x");
}

TEST_F(CSSStylesheetTest, BareBlockSelectsEverything) {
    auto result = parse_stylesheet("{ fill: red }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->selectors.selectors.size(), 1u);
    EXPECT_EQ(rules[0]->selectors.selectors[0]->kind, SelectorKind::Universal);
    EXPECT_EQ(rules[0]->declarations.size(), 1u);
}

TEST_F(CSSStylesheetTest, MultipleRulesKeepOrder) {
    auto result = parse_stylesheet("a { x: 1 } @import url(b.css); c { y: 2 }");
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.stylesheet.rules.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<StyleRule>(result.stylesheet.rules[0]));
    EXPECT_TRUE(std::holds_alternative<AtRule>(result.stylesheet.rules[1]));
    EXPECT_TRUE(std::holds_alternative<StyleRule>(result.stylesheet.rules[2]));
    EXPECT_EQ(result.stylesheet.style_rules().size(), 2u);
    EXPECT_EQ(result.stylesheet.at_rules().size(), 1u);
}

TEST_F(CSSStylesheetTest, CdoCdcAndCommentsAreIgnoredAtTopLevel) {
    auto result = parse_stylesheet("<!-- /* c */ a { b: c } -->");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.stylesheet.style_rules().size(), 1u);
}

TEST_F(CSSStylesheetTest, EmptyInput) {
    auto result = parse_stylesheet("");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.stylesheet.rules.empty());
}

// =============================================================================
// At-rule Tests
// =============================================================================

class CSSAtRuleTest : public ::testing::Test {};

TEST_F(CSSAtRuleTest, MediaBodyIsKeptRaw) {
    auto result = parse_stylesheet("@media screen { .x{color:blue;} }");
    EXPECT_TRUE(result.errors.empty());
    auto at_rules = result.stylesheet.at_rules();
    ASSERT_EQ(at_rules.size(), 1u);
    EXPECT_TRUE(result.stylesheet.style_rules().empty());
    const auto& rule = *at_rules[0];
    EXPECT_EQ(rule.keyword, "media");
    ASSERT_EQ(rule.header.size(), 1u);
    EXPECT_EQ(rule.header[0].type, CSSToken::Ident);
    EXPECT_EQ(rule.header[0].value, "screen");
    EXPECT_TRUE(rule.has_block);
    EXPECT_EQ(serialize_tokens(rule.body), ".x{color:blue;}");
}

TEST_F(CSSAtRuleTest, StatementAtRuleHasNoBlock) {
    auto result = parse_stylesheet("@import url(theme.css);");
    EXPECT_TRUE(result.errors.empty());
    auto at_rules = result.stylesheet.at_rules();
    ASSERT_EQ(at_rules.size(), 1u);
    EXPECT_EQ(at_rules[0]->keyword, "import");
    ASSERT_EQ(at_rules[0]->header.size(), 1u);
    EXPECT_EQ(at_rules[0]->header[0].type, CSSToken::Url);
    EXPECT_FALSE(at_rules[0]->has_block);
    EXPECT_TRUE(at_rules[0]->body.empty());
    EXPECT_EQ(at_rules[0]->to_string(), "@import url(theme.css);");
}

TEST_F(CSSAtRuleTest, HeaderKeepsBracketedRuns) {
    auto result = parse_stylesheet("@media screen and (min-width: 100px) {}");
    EXPECT_TRUE(result.errors.empty());
    auto at_rules = result.stylesheet.at_rules();
    ASSERT_EQ(at_rules.size(), 1u);
    EXPECT_EQ(serialize_tokens(at_rules[0]->header), "screen and (min-width: 100px)");
    EXPECT_TRUE(at_rules[0]->body.empty());
}

TEST_F(CSSAtRuleTest, UnterminatedAtRuleIsAnError) {
    auto result = parse_stylesheet("@media screen");
    EXPECT_TRUE(result.stylesheet.rules.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "'{' or ';' expected"));
}

TEST_F(CSSAtRuleTest, UnclosedAtRuleBlockIsAnError) {
    auto result = parse_stylesheet("@font-face { src: url(a.woff)");
    EXPECT_TRUE(result.stylesheet.rules.empty());
    EXPECT_TRUE(has_error_containing(result.errors, "'}' expected"));
}

TEST_F(CSSAtRuleTest, RuleAfterAtRuleStillParses) {
    auto result = parse_stylesheet("@page { margin: 1cm } p { color: red }");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.stylesheet.at_rules().size(), 1u);
    EXPECT_EQ(result.stylesheet.style_rules().size(), 1u);
}

// =============================================================================
// Declaration Tests
// =============================================================================

class CSSDeclarationTest : public ::testing::Test {};

TEST_F(CSSDeclarationTest, ValueKeepsInteriorWhitespace) {
    auto result = parse_stylesheet("a { border: 1px  solid red ; }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].value_text(), "1px  solid red");
}

TEST_F(CSSDeclarationTest, FunctionValuesStayBalanced) {
    auto result = parse_stylesheet("a { fill: rgb(1, 2, 3) url(x.png) }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    const auto& terms = rules[0]->declarations[0].terms;
    ASSERT_FALSE(terms.empty());
    EXPECT_EQ(terms.front().type, CSSToken::Function);
    EXPECT_EQ(terms.back().type, CSSToken::Url);
    EXPECT_EQ(rules[0]->declarations[0].value_text(), "rgb(1, 2, 3) url(x.png)");
}

TEST_F(CSSDeclarationTest, SemicolonInsideBracketsDoesNotEndValue) {
    auto result = parse_stylesheet("a { x: [a; b] (c; d); y: 1 }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 2u);
    EXPECT_EQ(rules[0]->declarations[0].value_text(), "[a; b] (c; d)");
    EXPECT_EQ(rules[0]->declarations[1].property, "y");
}

TEST_F(CSSDeclarationTest, CommentsAreDroppedFromValues) {
    auto result = parse_stylesheet("a { x: 1px/* c */solid /* d */ red }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    const auto& terms = rules[0]->declarations[0].terms;
    for (const auto& term : terms) {
        EXPECT_NE(term.type, CSSToken::Comment);
    }
    EXPECT_EQ(rules[0]->declarations[0].value_text(), "1px solid  red");
}

TEST_F(CSSDeclarationTest, EmptyValueIsAllowed) {
    auto result = parse_stylesheet("a { x: ; y: 2 }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 2u);
    EXPECT_TRUE(rules[0]->declarations[0].terms.empty());
}

TEST_F(CSSDeclarationTest, ExtraSemicolonsAreSkipped) {
    auto result = parse_stylesheet("a { ;; x: 1;; y: 2; }");
    EXPECT_TRUE(result.errors.empty());
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0]->declarations.size(), 2u);
}

TEST_F(CSSDeclarationTest, DeclarationOffsets) {
    auto result = parse_stylesheet("a { color: red; }");
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].start_offset, 4u);
    EXPECT_EQ(rules[0]->declarations[0].end_offset, 14u);
}

TEST_F(CSSDeclarationTest, InlineDeclarationList) {
    auto result = parse_declaration_list("fill: red; stroke: blue");
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.declarations.size(), 2u);
    EXPECT_EQ(result.declarations[0].property, "fill");
    EXPECT_EQ(result.declarations[1].property, "stroke");
    EXPECT_EQ(result.declarations[1].value_text(), "blue");
}

TEST_F(CSSDeclarationTest, InlineDeclarationListRejectsBrace) {
    auto result = parse_declaration_list("fill: red; } stroke: blue");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.declarations.size(), 2u);
}

TEST_F(CSSDeclarationTest, DeclarationToString) {
    auto result = parse_declaration_list("stroke-width :2px");
    ASSERT_EQ(result.declarations.size(), 1u);
    EXPECT_EQ(result.declarations[0].to_string(), "stroke-width: 2px");
}

// =============================================================================
// Recovery Tests
// =============================================================================

class CSSRecoveryTest : public ::testing::Test {};

TEST_F(CSSRecoveryTest, MalformedAttributeSelector) {
    auto result = parse_stylesheet("a[ { } b { color: red }");
    ASSERT_FALSE(result.errors.empty());
    EXPECT_TRUE(has_error_containing(result.errors, "AttributeSelector"));

    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 2u);
    const auto& broken = rules[0]->selectors.selectors[0];
    ASSERT_EQ(broken->kind, SelectorKind::And);
    EXPECT_EQ(broken->right->kind, SelectorKind::SelectNothing);

    EXPECT_EQ(*rules[1]->selectors.selectors[0], *Selector::type("b"));
    ASSERT_EQ(rules[1]->declarations.size(), 1u);
    EXPECT_EQ(rules[1]->declarations[0].property, "color");
}

TEST_F(CSSRecoveryTest, UnterminatedStringSkipsOnlyItsDeclaration) {
    auto result = parse_stylesheet("a { font-family: \"Arial\n; color: red; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "bad-string"));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "color");
}

TEST_F(CSSRecoveryTest, BadUrlSkipsDeclaration) {
    auto result = parse_stylesheet("a { background: url(a b); fill: red }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "bad-url"));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "fill");
}

TEST_F(CSSRecoveryTest, MissingColon) {
    auto result = parse_stylesheet("a { color red; fill: blue }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "Declaration: ':' expected, found ident \"red\""));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "fill");
}

TEST_F(CSSRecoveryTest, MissingColonBeforeClosingBrace) {
    auto result = parse_stylesheet("a { fill: blue; color } b { x: 1 }");
    ASSERT_EQ(result.errors.size(), 1u);
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[1]->declarations.size(), 1u);
}

TEST_F(CSSRecoveryTest, UnmatchedClosingParenInValue) {
    auto result = parse_stylesheet("a { x: 1 ); y: 2 }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "unmatched"));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "y");
}

TEST_F(CSSRecoveryTest, BraceInsideOpenParenEndsRule) {
    auto result = parse_stylesheet("a { x: rgb(1, 2 } b { y: 2 }");
    ASSERT_EQ(result.errors.size(), 1u);
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_TRUE(rules[0]->declarations.empty());
    ASSERT_EQ(rules[1]->declarations.size(), 1u);
    EXPECT_EQ(rules[1]->declarations[0].property, "y");
}

TEST_F(CSSRecoveryTest, MismatchedCloserKeepsFollowingRule) {
    auto result = parse_stylesheet("x { a: [ ( ]; b: c } y { d: e }");
    ASSERT_EQ(result.errors.size(), 1u);
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(*rules[0]->selectors.selectors[0], *Selector::type("x"));
    EXPECT_TRUE(rules[0]->declarations.empty());
    EXPECT_EQ(*rules[1]->selectors.selectors[0], *Selector::type("y"));
    ASSERT_EQ(rules[1]->declarations.size(), 1u);
    EXPECT_EQ(rules[1]->declarations[0].property, "d");
}

TEST_F(CSSRecoveryTest, BraceClosesOpenCurlyRunInValue) {
    auto result = parse_stylesheet("a { x: { ( } ; y: 1 } b { z: 2 }");
    ASSERT_EQ(result.errors.size(), 1u);
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 2u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "y");
    ASSERT_EQ(rules[1]->declarations.size(), 1u);
    EXPECT_EQ(rules[1]->declarations[0].property, "z");
}

TEST_F(CSSRecoveryTest, NonIdentifierDeclarationStart) {
    auto result = parse_stylesheet("a { 12: x; y: 2 }");
    ASSERT_EQ(result.errors.size(), 1u);
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "y");
}

TEST_F(CSSRecoveryTest, UnclosedRuleAtEndOfInput) {
    auto result = parse_stylesheet("a { color: red");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "StyleRule: '}' expected, found end of input"));
}

TEST_F(CSSRecoveryTest, SelectorWithoutBlock) {
    auto result = parse_stylesheet("a b");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(result.stylesheet.rules.empty());
}

TEST_F(CSSRecoveryTest, StrayClosingBraceAtTopLevel) {
    auto result = parse_stylesheet("} a { b: c }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "unexpected '}'"));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(*rules[0]->selectors.selectors[0], *Selector::type("a"));
}

TEST_F(CSSRecoveryTest, ErrorPositionPointsAtOffendingToken) {
    auto result = parse_stylesheet("a {\n  color red;\n}");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].line, 2u);
    EXPECT_EQ(result.errors[0].position, 12u);
    EXPECT_EQ(result.errors[0].to_string().rfind("line 2, offset 12: ", 0), 0u);
}

TEST_F(CSSRecoveryTest, GarbageAlwaysTerminates) {
    const char* inputs[] = {
        "}}}}", "{{{{", "((((", "a { b: ((( }", "@", "@x {", ":::", "a > > b {}",
        "[[[", "a { : ; : }", "\"", "url(", "a, , b {}", "<!--", "-->", "a:not( {}",
    };
    for (const char* css : inputs) {
        auto result = parse_stylesheet(css);
        (void)result;
        auto decls = parse_declaration_list(css);
        (void)decls;
        auto selectors = parse_selector_group(css);
        (void)selectors;
    }
    SUCCEED();
}

// =============================================================================
// Nesting limit Tests
// =============================================================================

class CSSNestingLimitTest : public ::testing::Test {};

TEST_F(CSSNestingLimitTest, DeepValueNestingIsAnError) {
    std::string css = "a { x: " + std::string(300, '(') + std::string(300, ')') + "; y: 1; }";
    auto result = parse_stylesheet(css);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(has_error_containing(result.errors, "nesting deeper than 256"));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "y");
}

TEST_F(CSSNestingLimitTest, ConfiguredLimit) {
    ParserOptions options;
    options.max_nesting_depth = 4;
    CSSParser parser(options);

    auto shallow = parser.parse_stylesheet("a { x: ((1)) }");
    EXPECT_TRUE(shallow.errors.empty());

    auto deep = parser.parse_stylesheet("a { x: ((((((1)))))) }");
    EXPECT_FALSE(deep.errors.empty());
    EXPECT_EQ(deep.stylesheet.style_rules().size(), 1u);
}

TEST_F(CSSNestingLimitTest, DeepAtRuleBodyIsAnError) {
    std::string css = "@x " + std::string(400, '{') + std::string(400, '}') + " a { b: c }";
    auto result = parse_stylesheet(css);
    EXPECT_TRUE(has_error_containing(result.errors, "nesting deeper than"));
}

TEST_F(CSSNestingLimitTest, LongSelectorChainIsBounded) {
    ParserOptions options;
    options.max_nesting_depth = 3;
    auto result = CSSParser(options).parse_stylesheet("a b c d e f g {}");
    EXPECT_FALSE(result.errors.empty());
}

TEST_F(CSSNestingLimitTest, NestedNegationIsBounded) {
    ParserOptions options;
    options.max_nesting_depth = 4;
    auto result = CSSParser(options).parse_stylesheet(":not(:not(:not(:not(:not(a))))) {}");
    EXPECT_TRUE(has_error_containing(result.errors, "nesting deeper than 4"));
}

TEST_F(CSSNestingLimitTest, DeepNegationNestingKeepsLaterRules) {
    std::string css;
    for (int i = 0; i < 100000; ++i) {
        css += ":not(";
    }
    css += "a { x: y } b { c: d }";
    auto result = parse_stylesheet(css);
    EXPECT_TRUE(has_error_containing(result.errors, "nesting deeper than 256"));
    auto rules = result.stylesheet.style_rules();
    ASSERT_EQ(rules.size(), 2u);
    ASSERT_EQ(rules[0]->declarations.size(), 1u);
    EXPECT_EQ(rules[0]->declarations[0].property, "x");
    EXPECT_EQ(*rules[1]->selectors.selectors[0], *Selector::type("b"));
    ASSERT_EQ(rules[1]->declarations.size(), 1u);
    EXPECT_EQ(rules[1]->declarations[0].property, "c");
}

TEST_F(CSSNestingLimitTest, DeepNegationInSelectorGroup) {
    std::string css;
    for (int i = 0; i < 100000; ++i) {
        css += ":not(";
    }
    auto result = parse_selector_group(css);
    EXPECT_TRUE(has_error_containing(result.errors, "nesting deeper than 256"));
}

// =============================================================================
// Parser reuse and reporting
// =============================================================================

class CSSParserTest : public ::testing::Test {};

TEST_F(CSSParserTest, ParserIsReusable) {
    CSSParser parser;
    auto first = parser.parse_stylesheet("a[ {}");
    EXPECT_FALSE(first.errors.empty());
    auto second = parser.parse_stylesheet("a {}");
    EXPECT_TRUE(second.errors.empty());
    EXPECT_EQ(second.stylesheet.style_rules().size(), 1u);
}

TEST_F(CSSParserTest, DefaultOptions) {
    CSSParser parser;
    EXPECT_EQ(parser.options().max_nesting_depth, quill::core::config::kDefaultMaxNestingDepth);
}

TEST_F(CSSParserTest, ReportParseErrorsEmitsWarnings) {
    auto result = parse_stylesheet("a {\n color red }");
    ASSERT_EQ(result.errors.size(), 1u);

    quill::core::DiagnosticEmitter emitter;
    emitter.set_source("test.css");
    report_parse_errors(result.errors, emitter, "stylesheet");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.severity, quill::core::Severity::Warning);
    EXPECT_EQ(event.module, "css");
    EXPECT_EQ(event.stage, "stylesheet");
    EXPECT_EQ(event.line, 2u);
    EXPECT_EQ(event.message, result.errors[0].message);
    EXPECT_EQ(quill::core::format_diagnostic(event).rfind("test.css:2: [warning] css/stylesheet: ", 0), 0u);
}

// =============================================================================
// Serialization and round trip Tests
// =============================================================================

class CSSRoundTripTest : public ::testing::Test {};

TEST_F(CSSRoundTripTest, StyleSheetToString) {
    auto result = parse_stylesheet("a.b{color:red;fill : blue}@import url(x.css);");
    EXPECT_EQ(result.stylesheet.to_string(),
              "a.b {\n  color: red;\n  fill: blue;\n}\n\n@import url(x.css);\n");
}

TEST_F(CSSRoundTripTest, SerializedStyleSheetReparsesToSameTree) {
    auto first = parse_stylesheet(
        "g > rect.x, #a [y|=\"z\"] { stroke: rgb(1, 2, 3); width: 10px }"
        "@media print { a { b: c } }");
    ASSERT_TRUE(first.errors.empty());
    auto second = parse_stylesheet(first.stylesheet.to_string());
    ASSERT_TRUE(second.errors.empty());
    EXPECT_EQ(second.stylesheet.to_string(), first.stylesheet.to_string());

    auto a = first.stylesheet.style_rules();
    auto b = second.stylesheet.style_rules();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i]->selectors, b[i]->selectors);
        EXPECT_EQ(a[i]->declarations, b[i]->declarations);
    }
}

TEST_F(CSSRoundTripTest, AtRuleBodyRetokenizesIdentically) {
    auto result = parse_stylesheet(
        "@media screen and (max-width: 600px) { .x { color: blue; /* keep */ } p{margin:0 auto} }");
    ASSERT_TRUE(result.errors.empty());
    auto at_rules = result.stylesheet.at_rules();
    ASSERT_EQ(at_rules.size(), 1u);
    EXPECT_EQ(retokenize(at_rules[0]->body), at_rules[0]->body);
    EXPECT_EQ(retokenize(at_rules[0]->header), at_rules[0]->header);
}

TEST_F(CSSRoundTripTest, DeclarationTermsRetokenizeIdentically) {
    auto result = parse_declaration_list(
        "font: italic 12px/1.5 \"Helvetica Neue\", sans-serif;"
        "background: url(a\\ b.png) no-repeat, linear-gradient(to right, #fff 0%, #000 100%);"
        "margin: -1e3px +.5em 1/**/2");
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.declarations.size(), 3u);
    for (const auto& decl : result.declarations) {
        EXPECT_EQ(retokenize(decl.terms), decl.terms) << decl.to_string();
    }
}
