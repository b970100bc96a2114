#include "FileCache.h"
#include "lex/Lexer.h"
#include "Message.h"
#include "parse/Parser.h"
#include "TranslationUnitContext.h"

static void print_usage() {
    cerr << "usage: typc [--max-nesting-depth=N] [--tokens] file...\n";
}

static bool parse_option(string_view arg, ParseOptions& options, bool& print_tokens) {
    static const string_view depth_option = "--max-nesting-depth=";

    if (arg == "--tokens") {
        print_tokens = true;
        return true;
    }

    if (arg.substr(0, depth_option.size()) == depth_option) {
        auto value = arg.substr(depth_option.size());
        size_t depth{};
        auto result = from_chars(value.data(), value.data() + value.size(), depth);
        if (result.ec != errc() || result.ptr != value.data() + value.size() || depth == 0) return false;

        options.max_nesting_depth = depth;
        return true;
    }

    return false;
}

static void print_token_list(ostream& stream, const vector<Token>& tokens) {
    stream << '[';
    auto separator = false;
    for (auto& token : tokens) {
        if (separator) stream << ", ";
        separator = true;
        stream << token;
    }
    stream << "]\n";
}

int main(int argc, const char* argv[]) {
    FileCache file_cache;
    ParseOptions options;
    bool print_tokens{};

    vector<string> paths;
    for (auto i = 1; i < argc; ++i) {
        string_view arg(argv[i]);
        if (arg.substr(0, 2) == "--") {
            if (!parse_option(arg, options, print_tokens)) {
                cerr << "unrecognized option '" << arg << "'\n";
                print_usage();
                return EXIT_FAILURE;
            }
        } else {
            paths.push_back(argv[i]);
        }
    }

    if (paths.empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    Severity highest_severity{};

    for (auto& path : paths) {
        TranslationUnitContext context(cerr);
        auto filename = context.intern_filename(path);

        auto& in_file = file_cache.read(path);
        if (!in_file.exists) {
            message(Severity::ERROR, Location{1, 1, filename}) << "could not open input file\n";
        } else {
            auto tokens = lex(in_file.text, filename);

            if (print_tokens) {
                print_token_list(cout, tokens);
            } else if (context.highest_severity < Severity::CONTEXTUAL_ERROR) {
                auto tree = parse(tokens, filename, options);
                if (tree) cout << tree.get() << '\n';
            }
        }

        highest_severity = max(highest_severity, context.highest_severity);
    }

    return highest_severity == Severity::INFO ? EXIT_SUCCESS : EXIT_FAILURE;
}
