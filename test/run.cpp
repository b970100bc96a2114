#include "nlohmann/json.hpp"

#include "lex/Lexer.h"
#include "parse/Parser.h"
#include "TranslationUnitContext.h"

using json = nlohmann::json;

enum class TestType {
    LEX,
    EXPRESSION,
    ARGUMENTS,
    DECLARATION,
    STATEMENT,
    PARSE,

    NUM
};

struct Test {
    const char* const name;
    const TestType type;
};

enum Section {
    INITIAL,

    EXPECT_AST,
    EXPECT_MESSAGE,
    EXPECT_TEXT,
    EXPECT_TYPE,
    INPUT,
    NONE,

    NUM_SECTIONS,
};

static const Test tests[] = {
    { "lex/token",                  TestType::LEX },
    { "lex/literal",                TestType::LEX },

    { "parse/expr",                 TestType::EXPRESSION },
    { "parse/arguments",            TestType::ARGUMENTS },
    { "parse/sema",                 TestType::EXPRESSION },
    { "parse/sema",                 TestType::DECLARATION },

    { "parse/declaration",          TestType::DECLARATION },
    { "parse/declaration",          TestType::PARSE },

    { "parse/statement",            TestType::STATEMENT },

    { "parse/translation_unit",     TestType::PARSE },
    { "parse/depth",                TestType::EXPRESSION },
    { "parse/depth",                TestType::PARSE },
};

static ostream& print_error(const string& name, const string& file, int line) {
    cerr << file << '(' << line << "): " << name << "\n";
    return cerr;
}

static void print_tokens(ostream& stream, const vector<Token>& tokens) {
    stream << '[';
    auto separator = false;
    for (auto& token : tokens) {
        if (separator) stream << ", ";
        separator = true;
        stream << token;
    }
    stream << ']';
}

static unique_ptr<ParseNode> parse_input(TestType test_type, const vector<Token>& tokens, string_view label, const ParseOptions& options) {
    Parser parser(tokens, options);
    switch (test_type) {
      case TestType::EXPRESSION:
        return parser.parse_standalone_expr(label);
      case TestType::ARGUMENTS:
        return parser.parse_standalone_arguments(label);
      case TestType::DECLARATION:
        return parser.parse_standalone_declaration(label);
      case TestType::STATEMENT:
        return parser.parse_standalone_statement(label);
      default:
        return parser.parse(label);
    }
}

static bool test_case(TestType test_type, const string sections[NUM_SECTIONS], const ParseOptions& options,
                      const string& name, const string& file, int line) {
    stringstream message_stream;

    TranslationUnitContext context(message_stream);
    auto label = context.intern_filename("input");

    auto tokens = lex(sections[INPUT], label);

    stringstream output_stream;
    unique_ptr<ParseNode> tree;
    if (test_type == TestType::LEX) {
        print_tokens(output_stream, tokens);
    } else {
        tree = parse_input(test_type, tokens, label, options);
        if (tree) output_stream << tree.get();

        // Parsing is a pure function of the tokens, so a second run must print the same tree and report the
        // same message.
        stringstream first_messages(message_stream.str());
        message_stream.str("");

        auto again = parse_input(test_type, tokens, label, options);
        stringstream again_stream;
        if (again) again_stream << again.get();

        if (again_stream.str() != output_stream.str() || message_stream.str() != first_messages.str()) {
            print_error(name, file, line) << "Second parse differs:\n" << again_stream.str() << '\n' << message_stream.str() << '\n';
            return false;
        }
    }

    if (message_stream.str() != sections[EXPECT_MESSAGE]) {
        print_error(name, file, line) << "Expected message:\n" << sections[EXPECT_MESSAGE] << "\n  Actual message:\n" << message_stream.str() << '\n';
        return false;
    }

    if (!sections[EXPECT_AST].empty()) {
        if (output_stream.str().empty()) {
            print_error(name, file, line) << "Expected AST: " << sections[EXPECT_AST] << "\n  Actual AST: none\n";
            return false;
        }

        auto parsed_output = json::parse(output_stream.str());
        auto parsed_expected = json::parse(sections[EXPECT_AST]);

        if (parsed_output != parsed_expected) {
            print_error(name, file, line) << "Expected AST: " << parsed_expected << "\n  Actual AST: " << parsed_output << "\n";
            return false;
        }
    }

    if (!sections[EXPECT_TYPE].empty()) {
        if (!tree) {
            print_error(name, file, line) << "Expected type: " << sections[EXPECT_TYPE] << "\n  Actual type: none\n";
            return false;
        }

        stringstream type_stream;
        type_stream << tree->type;

        auto parsed_type = json::parse(type_stream.str());
        auto parsed_expected = json::parse(sections[EXPECT_TYPE]);

        if (parsed_type != parsed_expected) {
            print_error(name, file, line) << "Expected type: " << parsed_expected << "\n  Actual type: " << parsed_type << "\n";
            return false;
        }
    }

    if (!sections[EXPECT_TEXT].empty()) {
        if (output_stream.str() != sections[EXPECT_TEXT]) {
            print_error(name, file, line) << "Expected text:\n" << sections[EXPECT_TEXT] << "\n  Actual text:\n" << output_stream.str() << "\n";
            return false;
        }
    }

    return true;
}

bool run_parser_tests() {
    string test_dir = __FILE__;
    auto slash_idx = test_dir.find_last_of("/\\");
    test_dir  = test_dir.substr(0, slash_idx + 1);

    auto num_tests = 0;
    auto num_failures = 0;
    for (auto& test: tests) {
        string test_name;
        auto test_file_name = test_dir + test.name + ".test";
        fstream file_stream(test_file_name, ios_base::in);
        if (!file_stream.is_open()) {
            cerr << "Could not open file " << test.name << ".test\n";
            ++num_failures;
            continue;
        }

        string sections[NUM_SECTIONS];
        ParseOptions options;

        auto test_line_num = 0;
        auto section = INITIAL;
        bool enabled_types[unsigned(TestType::NUM)] = {};
        int num_enabled_types = 0;

        for (auto line_num = 1; !file_stream.fail(); ++line_num) {
            string line;
            getline(file_stream, line);

            if ((line.empty() && file_stream.eof()) || line.substr(0, 5) == "BEGIN") {
                if (section != INITIAL) {
                    if (num_enabled_types == 0 || enabled_types[unsigned(test.type)]) {
                        if (!test_case(test.type, sections, options, test_name, test_file_name, test_line_num)) {
                            ++num_failures;
                        }

                        ++num_tests;
                    }

                    for (auto i = 0; i < NUM_SECTIONS; ++i) sections[i].clear();
                }

                section = Section::INPUT;
                for (unsigned i = 0; i < unsigned(TestType::NUM); ++i) enabled_types[i] = false;
                num_enabled_types = 0;
                options = ParseOptions();
                test_line_num = line_num;
                if (line.length() >= 6) test_name = line.substr(6);
            } else if (line == "END") {
                section = Section::NONE;
            } else if (line == "EXPECT_AST") {
                section = Section::EXPECT_AST;
            } else if (line == "EXPECT_MESSAGE") {
                section = Section::EXPECT_MESSAGE;
            } else if (line == "EXPECT_TEXT") {
                section = Section::EXPECT_TEXT;
            } else if (line == "EXPECT_TYPE") {
                section = Section::EXPECT_TYPE;
            } else if (line == "LEX") {
                enabled_types[unsigned(TestType::LEX)] = true;
                ++num_enabled_types;
            } else if (line == "EXPRESSION") {
                enabled_types[unsigned(TestType::EXPRESSION)] = true;
                ++num_enabled_types;
            } else if (line == "ARGUMENTS") {
                enabled_types[unsigned(TestType::ARGUMENTS)] = true;
                ++num_enabled_types;
            } else if (line == "DECLARATION") {
                enabled_types[unsigned(TestType::DECLARATION)] = true;
                ++num_enabled_types;
            } else if (line == "STATEMENT") {
                enabled_types[unsigned(TestType::STATEMENT)] = true;
                ++num_enabled_types;
            } else if (line == "PARSE") {
                enabled_types[unsigned(TestType::PARSE)] = true;
                ++num_enabled_types;
            } else if (line.substr(0, 17) == "MAX_NESTING_DEPTH") {
                options.max_nesting_depth = stoul(line.substr(18));
            } else if (line.substr(0, 3) == "REM") {
            } else {
                if (section == EXPECT_TYPE) {
                    if (line.length()) sections[section] += line;
                } else {
                    sections[section] += line + "\n";
                }
            }

            if (line.empty() && file_stream.eof()) break;
        }

        if (file_stream.fail() && !file_stream.eof()) {
            cerr << "Error processing file " << test.name << ".test\n";
            ++num_failures;
        }
    }

    cerr << "Ran " << num_tests << " parser tests of which " << num_failures << " failed.\n";

    return num_failures == 0;
}
