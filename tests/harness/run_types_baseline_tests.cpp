#include <tsbase/baseline/TypesBaseline.hpp>
#include <tsbase/text/Utf8.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using tsbase::baseline::TypeBaselineFile;
    using tsbase::baseline::TypesBaseline;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static constexpr std::string_view k_path = "tests/baselines/reference/unit1.types";

    static std::optional<TypesBaseline> parse_(std::string_view data, tsbase::diag::Bag& bag) {
        auto out = tsbase::baseline::parse_types_baseline(k_path, data, bag);
        if (!out.has_value()) std::cerr << bag.render_text();
        return out;
    }

    static void dump_(const TypesBaseline& b) {
        for (std::size_t i = 0; i < b.files.size(); ++i) {
            std::cerr << "    file " << b.names[i] << "\n";
            const auto& f = b.files[i];
            for (std::size_t s = 0; s < f.statements.size(); ++s) {
                std::cerr << "      stmt [" << f.statements[s] << "]\n";
                for (const auto& a : f.assertions[s]) {
                    std::cerr << "        [" << a.expr << "] : [" << a.expected_type << "]\n";
                }
            }
        }
    }

    static bool same_(const std::optional<TypesBaseline>& got, const TypesBaseline& want) {
        if (!got.has_value()) return require_(false, "baseline must parse");
        if (*got == want) return true;
        std::cerr << "  got:\n";
        dump_(*got);
        std::cerr << "  want:\n";
        dump_(want);
        return require_(false, "parsed baseline differs");
    }

    static std::size_t utf16_width_(std::string_view s) {
        std::size_t n = 0;
        for (const char ch : s) {
            const unsigned char c = static_cast<unsigned char>(ch);
            if ((c & 0xC0) == 0x80) continue;
            n += tsbase::text::utf16_len(c);
        }
        return n;
    }

    // assertion line plus its underline, with columns counted in UTF-16 units
    static std::string assertion_(std::string_view expr, std::string_view type) {
        std::string out = ">" + std::string(expr) + " : " + std::string(type) + "\n";
        out += ">" + std::string(utf16_width_(expr), ' ') + " : " + std::string(utf16_width_(type), '^') + "\n";
        return out;
    }

    static bool test_single_file_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
// type parameter type is not a valid operand of addition operator
enum E { a, b }
>E : E
>  : ^
>a : E.a
>  : ^^^
>b : E.b
>  : ^^^

function foo<T, U>(t: T, u: U) {
>foo : <T, U>(t: T, u: U) => void
>    : ^ ^^ ^^ ^^ ^^ ^^ ^^^^^^^^^
>t : T
>  : ^
>u : U
>  : ^
)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{
            {"// type parameter type is not a valid operand of addition operator\nenum E { a, b }",
             "function foo<T, U>(t: T, u: U) {"},
            {{{"E", "E"}, {"a", "E.a"}, {"b", "E.b"}},
             {{"foo", "<T, U>(t: T, u: U) => void"}, {"t", "T"}, {"u", "U"}}},
        });
        return same_(got, want);
    }

    static bool test_multiple_files_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
const a = 5;
>a : number
>  : ^^^^^^
>5 : 5
>  : ^

=== b.ts ===
const b = 123;
>b : number
>  : ^^^^^^
>123 : 123
>    : ^^^

)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts", "b.ts"};
        want.files.push_back(TypeBaselineFile{{"const a = 5;"}, {{{"a", "number"}, {"5", "5"}}}});
        want.files.push_back(TypeBaselineFile{{"const b = 123;"}, {{{"b", "number"}, {"123", "123"}}}});

        bool ok = same_(got, want);
        if (got.has_value()) {
            const auto* b = got->find("b.ts");
            ok &= require_(b != nullptr && b->statements.size() == 1, "find must locate b.ts");
            ok &= require_(got->find("c.ts") == nullptr, "unknown file is absent");
        }
        return ok;
    }

    static bool test_empty_file_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===

=== b.ts ===
const b = 123;
>b : number
>  : ^^^^^^
>123 : 123
>    : ^^^

)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts", "b.ts"};
        want.files.push_back(TypeBaselineFile{{""}, {{}}});
        want.files.push_back(TypeBaselineFile{{"const b = 123;"}, {{{"b", "number"}, {"123", "123"}}}});
        return same_(got, want);
    }

    static bool test_end_of_scope_on_last_line_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
declare module 'demoModule' {
>'demoModule' : typeof import("demoModule")
>             : ^^^^^^^^^^^^^^^^^^^^^^^^^^^

    export = alias;
>alias : typeof alias
>      : ^^^^^^^^^^^^
}
=== b.ts ===
const a = 5;
>a : number
>  : ^^^^^^
>5 : 5
>  : ^
)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts", "b.ts"};
        want.files.push_back(TypeBaselineFile{
            {"declare module 'demoModule' {", "    export = alias;"},
            {{{"'demoModule'", "typeof import(\"demoModule\")"}}, {{"alias", "typeof alias"}}},
        });
        want.files.push_back(TypeBaselineFile{{"const a = 5;"}, {{{"a", "number"}, {"5", "5"}}}});
        return same_(got, want);
    }

    static bool test_assertion_without_underline_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
class C {
>C : C
>  : ^

    public x;
>x : any

    public a = '';
>a : string
>  : ^^^^^^
>'' : ""
}

const a = 5;
>a : number
>  : ^^^^^^
>5 : 5
>  : ^
)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{
            {"class C {", "    public x;", "    public a = '';", "}\n\nconst a = 5;"},
            {{{"C", "C"}},
             {{"x", "any"}},
             {{"a", "string"}, {"''", "\"\""}},
             {{"a", "number"}, {"5", "5"}}},
        });
        return same_(got, want);
    }

    static bool test_middle_assertion_without_underline_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
g.prototype.m = function () {
>g.prototype.m = function () {  this;} : () => void
>                                      : ^^^^^^^^^^
>g.prototype.m : any
>g.prototype : any
>            : ^^^
>g : () => void
>  : ^^^^^^^^^^
>prototype : any
>          : ^^^
>m : any
>  : ^^^
>function () {  this;} : () => void
>                      : ^^^^^^^^^^

  this;
>this : any

};
)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{
            {"g.prototype.m = function () {", "  this;"},
            {{{"g.prototype.m = function () {  this;}", "() => void"},
              {"g.prototype.m", "any"},
              {"g.prototype", "any"},
              {"g", "() => void"},
              {"prototype", "any"},
              {"m", "any"},
              {"function () {  this;}", "() => void"}},
             {{"this", "any"}}},
        });
        return same_(got, want);
    }

    static bool test_comment_on_last_line_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
const a = 5;
>a : number
>  : ^^^^^^
>5 : 5
>  : ^

// Separate file
=== b.ts ===
const b = 123;
>b : number
>  : ^^^^^^
>123 : 123
>    : ^^^

)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts", "b.ts"};
        want.files.push_back(TypeBaselineFile{{"const a = 5;", "// Separate file"}, {{{"a", "number"}, {"5", "5"}}, {}}});
        want.files.push_back(TypeBaselineFile{{"const b = 123;"}, {{{"b", "number"}, {"123", "123"}}}});
        return same_(got, want);
    }

    static bool test_code_line_starts_with_gt_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_(R"tsb(//// [tests/cases/compiler/unit1.ts] ////

=== a.ts ===
type GenericStructure<
>GenericStructure : GenericStructure<AcceptableKeyType>
>                 : ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^

  AcceptableKeyType extends string = string
> = Record<AcceptableKeyType, number>;

const a = 5;
>a : number
>  : ^^^^^^
>5 : 5
>  : ^

=== b.ts ===
    any
>
    ? { children?: React.ReactNode }
>children : React.ReactNode
>         : ^^^^^^^^^^^^^^^
>React : any
>      : ^^^
)tsb",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts", "b.ts"};
        want.files.push_back(TypeBaselineFile{
            {"type GenericStructure<",
             "  AcceptableKeyType extends string = string\n> = Record<AcceptableKeyType, number>;\n\nconst a = 5;"},
            {{{"GenericStructure", "GenericStructure<AcceptableKeyType>"}}, {{"a", "number"}, {"5", "5"}}},
        });
        want.files.push_back(TypeBaselineFile{
            {"    any\n>\n    ? { children?: React.ReactNode }"},
            {{{"children", "React.ReactNode"}, {"React", "any"}}},
        });
        return same_(got, want);
    }

    static bool test_non_ascii_() {
        const std::string hello = "𝓱𝓮𝓵𝓵𝓸";
        const std::string world = "\"𝔀𝓸𝓻𝓵𝓭\"";
        const std::string ident = "äöüßAbcd123";
        const std::string regex = "/(?𝘴𝘪-𝘮:^𝘧𝘰𝘰.)/𝘨𝘮𝘶";

        std::string data = "//// [tests/cases/compiler/unit1.ts] ////\n\n=== a.ts ===\n";
        data += "module " + ident + " {\n";
        data += assertion_(ident, "typeof globalThis." + ident);
        data += "\nconst " + hello + " = " + world + ";\n";
        data += assertion_(hello, world);
        data += assertion_(world, world);
        data += "\nconst r = " + regex + ";\n";
        data += assertion_("r", "RegExp");
        data += assertion_(regex, "RegExp");

        const std::string stmt0 = "module " + ident + " {";
        const std::string stmt1 = "const " + hello + " = " + world + ";";
        const std::string stmt2 = "const r = " + regex + ";";
        const std::string global = "typeof globalThis." + ident;

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{
            {stmt0, stmt1, stmt2},
            {{{ident, global}}, {{hello, world}, {world, world}}, {{"r", "RegExp"}, {regex, "RegExp"}}},
        });

        tsbase::diag::Bag bag{};
        return same_(parse_(data, bag), want);
    }

    static bool test_non_ascii_without_underline_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_("//// [tests/cases/compiler/unit1.ts] ////\n\n=== a.ts ===\n"
                                "let ä = 1;\n"
                                ">ä : number\n",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{{"let ä = 1;"}, {{{"ä", "number"}}}});
        return same_(got, want);
    }

    static bool test_crlf_line_endings_() {
        tsbase::diag::Bag bag{};
        const auto got = parse_("//// [tests/cases/compiler/unit1.ts] ////\r\n\r\n=== a.ts ===\r\n"
                                "const a = 5;\r\n"
                                ">a : number\r\n"
                                ">  : ^^^^^^\r\n",
                                bag);

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{{"const a = 5;"}, {{{"a", "number"}}}});
        return same_(got, want);
    }

    static bool test_assertion_block_at_end_of_input_() {
        const std::string head = "//// [tests/cases/compiler/unit1.ts] ////\n\n=== a.ts ===\nlet a = 1;\n";

        tsbase::diag::Bag bag{};
        const auto bare = parse_(head + ">a : number", bag);
        const auto underlined = parse_(head + ">a : number\n>  : ^^^^^^", bag);

        TypesBaseline want{};
        want.names = {"a.ts"};
        want.files.push_back(TypeBaselineFile{{"let a = 1;"}, {{{"a", "number"}}}});

        bool ok = true;
        ok &= same_(bare, want);
        ok &= same_(underlined, want);
        ok &= require_(!bag.has_error(), "an unterminated last line closes the block");
        return ok;
    }

    static bool test_missing_unit_header_() {
        tsbase::diag::Bag bag{};
        const auto got = tsbase::baseline::parse_types_baseline(k_path, "=== a.ts ===\nlet a;\n", bag);

        bool ok = true;
        ok &= require_(!got.has_value(), "baseline without unit header must fail");
        ok &= require_(bag.has_code(tsbase::diag::Code::Y_MISSING_UNIT_HEADER), "Y_MISSING_UNIT_HEADER");

        tsbase::diag::Bag empty_bag{};
        ok &= require_(!tsbase::baseline::parse_types_baseline(k_path, "", empty_bag).has_value(),
                       "empty baseline must fail");
        ok &= require_(empty_bag.has_code(tsbase::diag::Code::Y_MISSING_UNIT_HEADER), "empty: Y_MISSING_UNIT_HEADER");
        return ok;
    }

    static bool test_malformed_file_header_() {
        tsbase::diag::Bag bag{};
        const auto got = tsbase::baseline::parse_types_baseline(
            k_path, "//// [tests/cases/compiler/unit1.ts] ////\n\n=== a.ts\nlet a;\n", bag);

        bool ok = true;
        ok &= require_(!got.has_value(), "unterminated file header must fail");
        ok &= require_(bag.has_code(tsbase::diag::Code::Y_MALFORMED_FILE_HEADER), "Y_MALFORMED_FILE_HEADER");
        if (!bag.all().empty()) ok &= require_(bag.all()[0].line == 3, "diagnostic must point at line 3");
        return ok;
    }

    static bool test_assertion_outside_file_() {
        tsbase::diag::Bag bag{};
        const auto got = tsbase::baseline::parse_types_baseline(
            k_path, "//// [tests/cases/compiler/unit1.ts] ////\n\nlet a;\n>a : any\n", bag);

        bool ok = true;
        ok &= require_(!got.has_value(), "assertion before any file must fail");
        ok &= require_(bag.has_code(tsbase::diag::Code::Y_ASSERTION_OUTSIDE_FILE), "Y_ASSERTION_OUTSIDE_FILE");
        return ok;
    }

    static bool test_assertion_without_delimiter_() {
        tsbase::diag::Bag bag{};
        const auto got = tsbase::baseline::parse_types_baseline(
            k_path, "//// [tests/cases/compiler/unit1.ts] ////\n\n=== a.ts ===\nlet a;\n>a any\n", bag);

        bool ok = true;
        ok &= require_(!got.has_value(), "assertion without delimiter must fail");
        ok &= require_(bag.has_code(tsbase::diag::Code::Y_MALFORMED_ASSERTION), "Y_MALFORMED_ASSERTION");
        if (!bag.all().empty()) ok &= require_(bag.all()[0].line == 5, "diagnostic must point at the assertion");
        return ok;
    }

    static bool test_assertion_lead_bytes_() {
        bool ok = true;
        ok &= require_(tsbase::baseline::is_assertion_lead('a'), "letters open assertions");
        ok &= require_(tsbase::baseline::is_assertion_lead('$'), "dollar opens assertions");
        ok &= require_(tsbase::baseline::is_assertion_lead('\''), "quote opens assertions");
        ok &= require_(tsbase::baseline::is_assertion_lead(0xF0), "non-ASCII opens assertions");
        ok &= require_(!tsbase::baseline::is_assertion_lead(' '), "space is source text");
        ok &= require_(!tsbase::baseline::is_assertion_lead('='), "operator is source text");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"single_file", test_single_file_},
        {"multiple_files", test_multiple_files_},
        {"empty_file", test_empty_file_},
        {"end_of_scope_on_last_line", test_end_of_scope_on_last_line_},
        {"assertion_without_underline", test_assertion_without_underline_},
        {"middle_assertion_without_underline", test_middle_assertion_without_underline_},
        {"comment_on_last_line", test_comment_on_last_line_},
        {"code_line_starts_with_gt", test_code_line_starts_with_gt_},
        {"non_ascii", test_non_ascii_},
        {"non_ascii_without_underline", test_non_ascii_without_underline_},
        {"crlf_line_endings", test_crlf_line_endings_},
        {"assertion_block_at_end_of_input", test_assertion_block_at_end_of_input_},
        {"missing_unit_header", test_missing_unit_header_},
        {"malformed_file_header", test_malformed_file_header_},
        {"assertion_outside_file", test_assertion_outside_file_},
        {"assertion_without_delimiter", test_assertion_without_delimiter_},
        {"assertion_lead_bytes", test_assertion_lead_bytes_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
