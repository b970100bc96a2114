#include "Parser.h"

ParseResult Parser::parse_statement(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    return wrap(NodeKind::STATEMENT, first_of(pos, {
        &Parser::parse_labeled_statement,
        &Parser::parse_compound_statement,
        &Parser::parse_expression_statement,
        &Parser::parse_selection_statement,
        &Parser::parse_iteration_statement,
        &Parser::parse_jump_statement,
    }, "statement"));
}

ParseResult Parser::parse_labeled_statement(size_t pos) {
    unique_ptr<OperatorNode> node;

    switch (kind_at(pos)) {
      case TOK_IDENTIFIER: {
        if (auto error = expect(pos + 1, ':')) return ParseResult::failure(move(*error));

        auto label = parse_identifier(pos);
        node = make_unique<OperatorNode>(NodeKind::LABELED_STATEMENT, TokenKind(':'));
        node->add(move(label.node));
        pos += 2;
        break;
      }
      case TOK_CASE: {
        auto value = parse_constant_expression(pos + 1);
        if (!value) return value;

        if (auto error = expect(value.position, ':')) return ParseResult::failure(move(*error));

        node = make_unique<OperatorNode>(NodeKind::LABELED_STATEMENT, TOK_CASE);
        node->add(move(value.node));
        pos = value.position + 1;
        break;
      }
      case TOK_DEFAULT:
        if (auto error = expect(pos + 1, ':')) return ParseResult::failure(move(*error));

        node = make_unique<OperatorNode>(NodeKind::LABELED_STATEMENT, TOK_DEFAULT);
        pos += 2;
        break;
      default:
        return unexpected(pos, "statement");
    }

    auto statement = parse_statement(pos);
    if (!statement) return statement;

    node->type = TypeExpression::hole();
    node->add(move(statement.node));
    return ParseResult::success(move(node), statement.position);
}

ParseResult Parser::parse_compound_statement(size_t pos) {
    if (auto error = expect(pos, '{')) return ParseResult::failure(move(*error));
    ++pos;

    auto node = make_unique<ParseNode>(NodeKind::COMPOUND_STATEMENT);
    node->type = TypeExpression::hole();

    if (kind_at(pos) != '}') {
        auto items = parse_repetition(pos, NodeKind::BLOCK_ITEM_LIST, &Parser::parse_block_item, 1, '}');
        if (!items) return items;

        node->add(move(items.node));
        pos = items.position;
    }

    return ParseResult::success(move(node), pos + 1);
}

ParseResult Parser::parse_block_item(size_t pos) {
    return wrap(NodeKind::BLOCK_ITEM, first_of(pos, { &Parser::parse_declaration, &Parser::parse_statement }, "declaration or statement"));
}

ParseResult Parser::parse_expression_statement(size_t pos) {
    auto node = make_unique<ParseNode>(NodeKind::EXPRESSION_STATEMENT);
    node->type = TypeExpression::hole();

    if (kind_at(pos) != ';') {
        auto expr = parse_expression(pos);
        if (!expr) return expr;

        node->add(move(expr.node));
        pos = expr.position;
    }

    if (auto error = expect(pos, ';')) return ParseResult::failure(move(*error));

    return ParseResult::success(move(node), pos + 1);
}

ParseResult Parser::parse_selection_statement(size_t pos) {
    auto keyword = kind_at(pos);
    if (keyword != TOK_IF && keyword != TOK_SWITCH) return unexpected(pos, "statement");

    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto condition = parse_expression(pos + 2);
    if (!condition) return condition;

    if (auto error = expect(condition.position, ')')) return ParseResult::failure(move(*error));

    auto body = parse_statement(condition.position + 1);
    if (!body) return body;
    pos = body.position;

    auto node = make_unique<OperatorNode>(NodeKind::SELECTION_STATEMENT, keyword);
    node->type = TypeExpression::hole();
    node->add(move(condition.node));
    node->add(move(body.node));

    if (keyword == TOK_IF && kind_at(pos) == TOK_ELSE) {
        auto else_body = parse_statement(pos + 1);
        if (!else_body) return else_body;

        node->add(move(else_body.node));
        pos = else_body.position;
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_iteration_statement(size_t pos) {
    auto keyword = kind_at(pos);
    auto node = make_unique<OperatorNode>(NodeKind::ITERATION_STATEMENT, keyword);
    node->type = TypeExpression::hole();

    switch (keyword) {
      case TOK_WHILE: {
        if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

        auto condition = parse_expression(pos + 2);
        if (!condition) return condition;

        if (auto error = expect(condition.position, ')')) return ParseResult::failure(move(*error));

        auto body = parse_statement(condition.position + 1);
        if (!body) return body;

        node->add(move(condition.node));
        node->add(move(body.node));
        return ParseResult::success(move(node), body.position);
      }
      case TOK_DO: {
        auto body = parse_statement(pos + 1);
        if (!body) return body;
        pos = body.position;

        if (auto error = expect(pos, TOK_WHILE)) return ParseResult::failure(move(*error));
        if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

        auto condition = parse_expression(pos + 2);
        if (!condition) return condition;
        pos = condition.position;

        if (auto error = expect(pos, ')')) return ParseResult::failure(move(*error));
        if (auto error = expect(pos + 1, ';')) return ParseResult::failure(move(*error));

        node->add(move(body.node));
        node->add(move(condition.node));
        return ParseResult::success(move(node), pos + 2);
      }
      case TOK_FOR:
        return parse_for_statement(pos);
      default:
        return unexpected(pos, "statement");
    }
}

ParseResult Parser::parse_for_statement(size_t pos) {
    if (auto error = expect(pos, TOK_FOR)) return ParseResult::failure(move(*error));
    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto node = make_unique<OperatorNode>(NodeKind::ITERATION_STATEMENT, TOK_FOR);
    node->type = TypeExpression::hole();

    // Both the expression statement and the declaration consume the first ';'.
    auto initialization = first_of(pos + 2, { &Parser::parse_expression_statement, &Parser::parse_declaration }, "expression or declaration");
    if (!initialization) return initialization;

    auto condition = parse_expression_statement(initialization.position);
    if (!condition) return condition;
    pos = condition.position;

    node->add(move(initialization.node));
    node->add(move(condition.node));

    if (kind_at(pos) != ')') {
        auto step = parse_expression(pos);
        if (!step) return step;

        node->add(move(step.node));
        pos = step.position;
    }

    if (auto error = expect(pos, ')')) return ParseResult::failure(move(*error));

    auto body = parse_statement(pos + 1);
    if (!body) return body;

    node->add(move(body.node));
    return ParseResult::success(move(node), body.position);
}

ParseResult Parser::parse_jump_statement(size_t pos) {
    auto keyword = kind_at(pos);
    auto node = make_unique<OperatorNode>(NodeKind::JUMP_STATEMENT, keyword);
    node->type = TypeExpression::hole();

    switch (keyword) {
      case TOK_GOTO: {
        auto label = parse_identifier(pos + 1);
        if (!label) return label;

        node->add(move(label.node));
        pos = label.position;
        break;
      }
      case TOK_CONTINUE:
      case TOK_BREAK:
        ++pos;
        break;
      case TOK_RETURN:
        ++pos;
        if (kind_at(pos) != ';') {
            auto value = parse_expression(pos);
            if (!value) return value;

            node->type = value.node->type;
            node->add(move(value.node));
            pos = value.position;
        }
        break;
      default:
        return unexpected(pos, "statement");
    }

    if (auto error = expect(pos, ';')) return ParseResult::failure(move(*error));

    return ParseResult::success(move(node), pos + 1);
}
