#include "Parser.h"

#include "Message.h"
#include "Sema.h"
#include "TranslationUnitContext.h"

Parser::DepthGuard::DepthGuard(Parser& parser): parser(parser) {
    ++parser.depth;
}

Parser::DepthGuard::~DepthGuard() {
    --parser.depth;
}

bool Parser::DepthGuard::exceeded() const {
    return parser.depth > parser.options.max_nesting_depth;
}

Parser::Parser(const vector<Token>& tokens, const ParseOptions& options): tokens(tokens), options(options) {
}

bool Parser::at_end(size_t pos) const {
    return pos >= tokens.size();
}

TokenKind Parser::kind_at(size_t pos) const {
    if (at_end(pos)) return TOK_EOF;
    return tokens[pos].kind;
}

static string describe_kind(int kind) {
    switch (kind) {
      case TOK_IDENTIFIER:
        return "identifier";
      case TOK_STRING_LITERAL:
        return "string literal";
      default:
        return '\'' + token_spelling(TokenKind(kind)) + '\'';
    }
}

optional<ParseError> Parser::expect(size_t pos, int kind) const {
    if (at_end(pos)) {
        return ParseError{ParseErrorKind::POSITION_OUT_OF_RANGE, pos, "expected " + describe_kind(kind) + " but reached end of file"};
    }

    if (tokens[pos].kind == kind) return nullopt;

    return ParseError{ParseErrorKind::UNEXPECTED_TOKEN, pos, "expected " + describe_kind(kind) + " but got " + describe_token(tokens[pos])};
}

ParseResult Parser::unexpected(size_t pos, const char* what) const {
    if (at_end(pos)) {
        return ParseResult::failure(ParseErrorKind::POSITION_OUT_OF_RANGE, pos, string("expected ") + what + " but reached end of file");
    }

    return ParseResult::failure(ParseErrorKind::NO_VIABLE_ALTERNATIVE, pos, string("expected ") + what + " but got " + describe_token(tokens[pos]));
}

ParseResult Parser::unsupported(size_t pos, const string& feature) const {
    return ParseResult::failure(ParseErrorKind::UNSUPPORTED_FEATURE, pos, feature + " is not supported");
}

ParseResult Parser::nesting_too_deep(size_t pos) const {
    stringstream message;
    message << "maximum nesting depth of " << options.max_nesting_depth << " exceeded";
    return ParseResult::failure(ParseErrorKind::NESTING_TOO_DEEP, pos, message.str());
}

// A type error means its alternative matched the input, so it is kept over any syntax error. Among errors of
// the same sort, the one furthest into the input is kept and, of those, the one tried last.
static bool supersedes(const ParseError& error, const ParseError& kept) {
    auto syntax = error.is_syntax();
    if (syntax != kept.is_syntax()) return !syntax;
    return error.position >= kept.position;
}

ParseResult Parser::first_of(size_t pos, initializer_list<Production> alternatives, const char* what) {
    optional<ParseError> kept;
    for (auto alternative : alternatives) {
        auto result = (this->*alternative)(pos);
        if (result || result.error->is_fatal()) return result;

        if (!kept || supersedes(*result.error, *kept)) kept = move(result.error);
    }

    assert(kept);
    if (kept->is_syntax() && kept->position == pos) return unexpected(pos, what);

    return ParseResult::failure(move(*kept));
}

ParseResult Parser::parse_list(size_t pos, NodeKind kind, Production item, int separator) {
    auto result = (this->*item)(pos);
    if (!result) return result;

    auto list = make_unique<ParseNode>(kind);
    list->add(move(result.node));
    pos = result.position;

    while (kind_at(pos) == separator) {
        result = (this->*item)(pos + 1);
        if (!result) {
            if (!result.error->is_syntax()) return result;

            // The separator is left for the caller.
            break;
        }

        list->add(move(result.node));
        pos = result.position;
    }

    list->type = list_type(*list);
    return ParseResult::success(move(list), pos);
}

ParseResult Parser::parse_repetition(size_t pos, NodeKind kind, Production item, size_t min_count, int terminator) {
    auto list = make_unique<ParseNode>(kind);

    for (;;) {
        if (terminator != TOK_EOF && list->children.size() >= min_count && kind_at(pos) == terminator) break;

        auto result = (this->*item)(pos);
        if (!result) {
            // Inside a terminated sequence, every item up to the terminator must parse.
            if (terminator != TOK_EOF || !result.error->is_syntax() || list->children.size() < min_count) return result;
            break;
        }

        list->add(move(result.node));
        pos = result.position;
    }

    list->type = list_type(*list);
    return ParseResult::success(move(list), pos);
}

ParseResult Parser::parse_binary_level(size_t pos, NodeKind kind, OperatorPrec prec, Production operand) {
    auto result = (this->*operand)(pos);
    if (!result) return result;

    auto left = move(result.node);
    pos = result.position;

    while (!at_end(pos) && assoc_prec(tokens[pos].kind).prec == prec) {
        auto op = tokens[pos].kind;

        auto right = (this->*operand)(pos + 1);
        if (!right) return right;

        auto combined = combine_types(left->type, right.node->type, op);
        if (!combined.accepted) {
            return ParseResult::failure(ParseErrorKind::ILLEGAL_TYPE_COMBINATION, pos,
                                        "invalid operands to binary '" + token_spelling(op) + "' (have '" + left->type.message_text() +
                                        "' and '" + right.node->type.message_text() + "')");
        }

        auto node = make_unique<OperatorNode>(NodeKind::BINARY_EXPRESSION, op);
        node->type = move(combined.type);
        node->add(move(left));
        node->add(move(right.node));
        left = move(node);
        pos = right.position;
    }

    return wrap(kind, ParseResult::success(move(left), pos));
}

void Parser::report(const ParseError& error, string_view source_label) const {
    Location location;
    if (error.position < tokens.size()) {
        location = tokens[error.position].location;
    } else if (tokens.size()) {
        location = tokens.back().location;
    } else {
        location.line = 1;
        location.column = 1;
        location.filename = TranslationUnitContext::it->intern_filename(source_label);
    }

    message(Severity::ERROR, location) << error.message << '\n';
}

unique_ptr<ParseNode> Parser::parse(string_view source_label) {
    auto result = parse_translation_unit(0);
    if (!result) {
        report(*result.error, source_label);
        return nullptr;
    }

    if (!at_end(result.position)) {
        report(ParseError{ParseErrorKind::INCOMPLETE_PARSE, result.position, "did not consume all tokens of '" + string(source_label) + "'"},
               source_label);
        return nullptr;
    }

    return move(result.node);
}

unique_ptr<ParseNode> Parser::parse_standalone(Production production, string_view source_label) {
    auto result = (this->*production)(0);
    if (!result) {
        report(*result.error, source_label);
        return nullptr;
    }

    if (!at_end(result.position)) {
        report(ParseError{ParseErrorKind::UNEXPECTED_TOKEN, result.position, "expected end of file"}, source_label);
    }

    return move(result.node);
}

unique_ptr<ParseNode> Parser::parse_standalone_expr(string_view source_label) {
    return parse_standalone(&Parser::parse_expression, source_label);
}

unique_ptr<ParseNode> Parser::parse_standalone_arguments(string_view source_label) {
    return parse_standalone(&Parser::parse_argument_expression_list, source_label);
}

unique_ptr<ParseNode> Parser::parse_standalone_declaration(string_view source_label) {
    return parse_standalone(&Parser::parse_declaration, source_label);
}

unique_ptr<ParseNode> Parser::parse_standalone_statement(string_view source_label) {
    return parse_standalone(&Parser::parse_statement, source_label);
}

ParseResult Parser::parse_translation_unit(size_t pos) {
    if (at_end(pos)) return ParseResult::failure(ParseErrorKind::UNEXPECTED_TOKEN, pos, "unexpected end of file");

    auto node = make_unique<ParseNode>(NodeKind::TRANSLATION_UNIT);
    while (!at_end(pos)) {
        auto result = parse_external_declaration(pos);
        if (!result) {
            // Tokens that cannot begin an external declaration are left over for parse() to report. An error
            // further in belongs to a declaration that did begin here.
            if (node->children.size() && result.error->is_syntax() && result.error->position == pos) break;
            return result;
        }

        node->add(move(result.node));
        pos = result.position;
    }

    node->type = list_type(*node);
    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_external_declaration(size_t pos) {
    return wrap(NodeKind::EXTERNAL_DECLARATION,
                first_of(pos, { &Parser::parse_function_definition, &Parser::parse_declaration }, "declaration"));
}

ParseResult Parser::parse_function_definition(size_t pos) {
    auto specifiers = parse_declaration_specifiers(pos);
    if (!specifiers) return specifiers;

    auto declarator = parse_declarator(specifiers.position);
    if (!declarator) return declarator;
    pos = declarator.position;

    auto node = make_unique<ParseNode>(NodeKind::FUNCTION_DEFINITION);
    node->type = TypeExpression(BaseKind::FUNCTION);
    node->type.children.push_back(specifiers.node->type);
    node->type.children.push_back(declarator.node->type);
    node->add(move(specifiers.node));
    node->add(move(declarator.node));

    // Old style parameter declarations.
    if (kind_at(pos) != '{') {
        auto declarations = parse_declaration_list(pos);
        if (!declarations) return declarations;

        node->type.children.push_back(declarations.node->type);
        node->add(move(declarations.node));
        pos = declarations.position;
    }

    auto body = parse_compound_statement(pos);
    if (!body) return body;

    node->add(move(body.node));
    return ParseResult::success(move(node), body.position);
}

ParseResult Parser::parse_declaration_list(size_t pos) {
    return parse_repetition(pos, NodeKind::DECLARATION_LIST, &Parser::parse_declaration, 1, '{');
}

unique_ptr<ParseNode> parse(const vector<Token>& tokens, string_view source_label, const ParseOptions& options) {
    Parser parser(tokens, options);
    return parser.parse(source_label);
}
