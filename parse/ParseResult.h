#ifndef PARSE_PARSE_RESULT_H
#define PARSE_PARSE_RESULT_H

#include "ParseNode.h"

enum class ParseErrorKind {
    POSITION_OUT_OF_RANGE,
    UNEXPECTED_TOKEN,
    NO_VIABLE_ALTERNATIVE,
    ILLEGAL_TYPE_COMBINATION,
    ILLEGAL_CAST,
    ILLEGAL_ASSIGNMENT,
    UNSUPPORTED_FEATURE,
    NESTING_TOO_DEEP,
    INCOMPLETE_PARSE,
};

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::UNEXPECTED_TOKEN;

    // Index of the offending token; may equal the token count.
    size_t position{};

    string message;

    // Fatal errors end the parse even when other alternatives remain untried.
    bool is_fatal() const {
        return kind == ParseErrorKind::UNSUPPORTED_FEATURE || kind == ParseErrorKind::NESTING_TOO_DEEP;
    }

    // The input did not match the production, as opposed to matching it with operands of the wrong types.
    bool is_syntax() const {
        switch (kind) {
          case ParseErrorKind::POSITION_OUT_OF_RANGE:
          case ParseErrorKind::UNEXPECTED_TOKEN:
          case ParseErrorKind::NO_VIABLE_ALTERNATIVE:
          case ParseErrorKind::INCOMPLETE_PARSE:
            return true;
          default:
            return false;
        }
    }
};

// Either a node and the position following it or an error. A failed result never carries a node.
struct ParseResult {
    unique_ptr<ParseNode> node;
    size_t position{};
    optional<ParseError> error;

    static ParseResult success(unique_ptr<ParseNode> node, size_t position) {
        ParseResult result;
        result.node = move(node);
        result.position = position;
        return result;
    }

    static ParseResult failure(ParseErrorKind kind, size_t position, string message) {
        ParseResult result;
        result.position = position;
        result.error = ParseError{kind, position, move(message)};
        return result;
    }

    static ParseResult failure(ParseError error) {
        ParseResult result;
        result.position = error.position;
        result.error = move(error);
        return result;
    }

    explicit operator bool() const { return !error; }
};

// Puts a successful result's node under a new node of the given kind, which takes the same type.
inline ParseResult wrap(NodeKind kind, ParseResult result) {
    if (!result) return result;

    auto node = make_unique<ParseNode>(kind);
    node->type = result.node->type;
    node->add(move(result.node));
    return ParseResult::success(move(node), result.position);
}

// A list of one element has that element's type; longer lists have a composite type.
inline TypeExpression list_type(const ParseNode& list) {
    if (list.children.empty()) return TypeExpression::hole();
    if (list.children.size() == 1) return list.children[0]->type;

    vector<TypeExpression> types;
    for (auto& child : list.children) types.push_back(child->type);
    return TypeExpression::composite(move(types));
}

#endif
