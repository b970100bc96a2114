#include "Parser.h"

#include "Sema.h"

static TypeExpression basic_type(initializer_list<BaseKind> kinds) {
    TypeExpression result;
    for (auto kind : kinds) {
        BaseType value;
        value.kind = kind;
        result.values.push_back(value);
    }
    return result;
}

// Array of the encoded length, in bytes and without the terminating null, of the string's element type.
static TypeExpression string_type(const string& value, StringEncoding encoding) {
    TypeExpression element;
    switch (encoding) {
      case StringEncoding::UTF16:
        element = basic_type({ BaseKind::UNSIGNED, BaseKind::SHORT });
        break;
      case StringEncoding::UTF32:
        element = basic_type({ BaseKind::UNSIGNED, BaseKind::INT });
        break;
      case StringEncoding::WIDE:
        element = basic_type({ BaseKind::INT });
        break;
      default:
        element = basic_type({ BaseKind::CHAR });
        break;
    }

    BaseType array;
    array.kind = BaseKind::ARRAY;
    array.length = value.size();
    return TypeExpression::wrap(array, element);
}

ParseResult Parser::parse_identifier(size_t pos) {
    if (auto error = expect(pos, TOK_IDENTIFIER)) return ParseResult::failure(move(*error));

    auto node = make_unique<NameNode>(NodeKind::IDENTIFIER, tokens[pos].text);
    node->type = TypeExpression::identifier(tokens[pos].text);
    return ParseResult::success(move(node), pos + 1);
}

ParseResult Parser::parse_constant(size_t pos) {
    unique_ptr<ParseNode> node;
    switch (kind_at(pos)) {
      case TOK_INT_CONSTANT:
        // Integer constants are long whatever their value or suffix.
        node = make_unique<IntegerConstantNode>(tokens[pos].int_value);
        node->type = TypeExpression(BaseKind::LONG);
        break;
      case TOK_FLOAT_CONSTANT:
        node = make_unique<FloatingConstantNode>(tokens[pos].float_value);
        node->type = TypeExpression(BaseKind::DOUBLE);
        break;
      default:
        return unexpected(pos, "constant");
    }

    return ParseResult::success(move(node), pos + 1);
}

ParseResult Parser::parse_string(size_t pos) {
    unique_ptr<StringLiteralNode> node;
    switch (kind_at(pos)) {
      case TOK_STRING_LITERAL:
        node = make_unique<StringLiteralNode>(tokens[pos].text, tokens[pos].encoding);
        break;
      case TOK_FUNC_NAME:
        // Stands in for the name of the enclosing function, which is not tracked.
        node = make_unique<StringLiteralNode>("__func_name__", StringEncoding::NONE);
        break;
      default:
        return unexpected(pos, "string literal");
    }

    node->type = string_type(node->value, node->encoding);
    return ParseResult::success(move(node), pos + 1);
}

ParseResult Parser::parse_parenthesized_expression(size_t pos) {
    if (auto error = expect(pos, '(')) return ParseResult::failure(move(*error));

    auto expr = parse_expression(pos + 1);
    if (!expr) return expr;

    if (auto error = expect(expr.position, ')')) return ParseResult::failure(move(*error));
    ++expr.position;

    return wrap(NodeKind::PRIMARY_EXPRESSION, move(expr));
}

ParseResult Parser::parse_generic_selection(size_t pos) {
    if (auto error = expect(pos, TOK_GENERIC)) return ParseResult::failure(move(*error));
    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto controlling = parse_assignment_expression(pos + 2);
    if (!controlling) return controlling;

    if (auto error = expect(controlling.position, ',')) return ParseResult::failure(move(*error));

    auto associations = parse_list(controlling.position + 1, NodeKind::GENERIC_ASSOC_LIST, &Parser::parse_generic_association, ',');
    if (!associations) return associations;

    if (auto error = expect(associations.position, ')')) return ParseResult::failure(move(*error));

    const ParseNode* selected{};
    const ParseNode* fallback{};
    for (auto& child : associations.node->children) {
        auto association = static_cast<const OperatorNode*>(child.get());
        if (association->op == TOK_DEFAULT) {
            if (!fallback) fallback = association;
        } else if (!selected && types_equal(association->children[0]->type, controlling.node->type)) {
            selected = association;
        }
    }

    if (!selected) selected = fallback;
    if (!selected) {
        return ParseResult::failure(ParseErrorKind::ILLEGAL_TYPE_COMBINATION, pos,
                                    "no association of generic selection matches type '" + controlling.node->type.message_text() + "'");
    }

    auto node = make_unique<ParseNode>(NodeKind::GENERIC_SELECTION);
    node->type = selected->type;
    node->add(move(controlling.node));
    node->add(move(associations.node));
    return ParseResult::success(move(node), associations.position + 1);
}

ParseResult Parser::parse_generic_association(size_t pos) {
    unique_ptr<OperatorNode> node;
    if (kind_at(pos) == TOK_DEFAULT) {
        node = make_unique<OperatorNode>(NodeKind::GENERIC_ASSOCIATION, TOK_DEFAULT);
        ++pos;
    } else {
        auto type_name = parse_type_name(pos);
        if (!type_name) return type_name;

        node = make_unique<OperatorNode>(NodeKind::GENERIC_ASSOCIATION, TOK_EOF);
        node->add(move(type_name.node));
        pos = type_name.position;
    }

    if (auto error = expect(pos, ':')) return ParseResult::failure(move(*error));

    auto expr = parse_assignment_expression(pos + 1);
    if (!expr) return expr;

    node->type = expr.node->type;
    node->add(move(expr.node));
    return ParseResult::success(move(node), expr.position);
}

ParseResult Parser::parse_primary_expression(size_t pos) {
    return first_of(pos, {
        &Parser::parse_identifier,
        &Parser::parse_constant,
        &Parser::parse_string,
        &Parser::parse_parenthesized_expression,
        &Parser::parse_generic_selection,
    }, "expression");
}

ParseResult Parser::parse_compound_literal(size_t pos) {
    if (auto error = expect(pos, '(')) return ParseResult::failure(move(*error));

    auto type_name = parse_type_name(pos + 1);
    if (!type_name) return type_name;

    if (auto error = expect(type_name.position, ')')) return ParseResult::failure(move(*error));

    auto initializers = parse_braced_initializer(type_name.position + 1);
    if (!initializers) return initializers;

    auto node = make_unique<ParseNode>(NodeKind::COMPOUND_LITERAL);
    node->type = type_name.node->type;
    node->add(move(type_name.node));
    node->add(move(initializers.node));
    return ParseResult::success(move(node), initializers.position);
}

ParseResult Parser::parse_postfix_expression(size_t pos) {
    auto result = first_of(pos, { &Parser::parse_primary_expression, &Parser::parse_compound_literal }, "expression");
    if (!result) return result;

    auto node = make_unique<ParseNode>(NodeKind::POSTFIX_EXPRESSION);
    node->type = result.node->type;
    node->add(move(result.node));
    pos = result.position;

    for (;;) {
        auto op = kind_at(pos);
        auto suffix = make_unique<OperatorNode>(NodeKind::POSTFIX_SUFFIX, op);

        switch (op) {
          case '[': {
            auto index = parse_expression(pos + 1);
            if (!index) return index;

            if (auto error = expect(index.position, ']')) return ParseResult::failure(move(*error));

            auto element = element_type(node->type);
            suffix->type = element ? *element : node->type;
            suffix->add(move(index.node));
            pos = index.position + 1;
            break;
          }
          case '(': {
            ++pos;
            if (kind_at(pos) != ')') {
                auto arguments = parse_argument_expression_list(pos);
                if (!arguments) return arguments;

                suffix->add(move(arguments.node));
                pos = arguments.position;
            }

            if (auto error = expect(pos, ')')) return ParseResult::failure(move(*error));
            ++pos;

            auto result_type = call_result_type(node->type);
            suffix->type = result_type ? *result_type : node->type;
            break;
          }
          case '.':
          case TOK_PTR_OP: {
            auto member = parse_identifier(pos + 1);
            if (!member) return member;

            suffix->type = member.node->type;
            suffix->add(move(member.node));
            pos = member.position;
            break;
          }
          case TOK_INC_OP:
          case TOK_DEC_OP:
            suffix->type = node->type;
            ++pos;
            break;
          default:
            return ParseResult::success(move(node), pos);
        }

        node->type = suffix->type;
        node->add(move(suffix));
    }
}

ParseResult Parser::parse_argument_expression_list(size_t pos) {
    return parse_list(pos, NodeKind::ARGUMENT_EXPRESSION_LIST, &Parser::parse_assignment_expression, ',');
}

ParseResult Parser::parse_unary_expression(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    switch (kind_at(pos)) {
      case TOK_SIZEOF:
        if (kind_at(pos + 1) == '(') {
            auto result = parse_sizeof_type_expression(pos);
            if (result || !result.error->is_syntax()) return result;
        }
        return parse_unary_operator_expression(pos);
      case TOK_ALIGNOF:
        return parse_sizeof_type_expression(pos);
      case TOK_INC_OP:
      case TOK_DEC_OP:
      case '&':
      case '*':
      case '+':
      case '-':
      case '~':
      case '!':
        return parse_unary_operator_expression(pos);
      default:
        return parse_postfix_expression(pos);
    }
}

ParseResult Parser::parse_unary_operator_expression(size_t pos) {
    auto op = kind_at(pos);

    ParseResult operand;
    if (op == TOK_INC_OP || op == TOK_DEC_OP || op == TOK_SIZEOF) {
        operand = parse_unary_expression(pos + 1);
    } else {
        operand = parse_cast_expression(pos + 1);
    }
    if (!operand) return operand;

    auto node = make_unique<OperatorNode>(NodeKind::UNARY_EXPRESSION, op);
    switch (op) {
      case '&':
        node->type = TypeExpression::pointer_to(operand.node->type);
        break;
      case '*':
        // The pointee is not resolved; using it requires a cast.
        node->type = TypeExpression::pointer_to(TypeExpression(BaseKind::VOID_POINTER));
        break;
      case TOK_SIZEOF:
        node->type = TypeExpression(BaseKind::SIZE_T);
        break;
      default:
        node->type = operand.node->type;
        break;
    }

    node->add(move(operand.node));
    return ParseResult::success(move(node), operand.position);
}

// sizeof ( type-name ) or _Alignof ( type-name )
ParseResult Parser::parse_sizeof_type_expression(size_t pos) {
    auto op = kind_at(pos);
    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto type_name = parse_type_name(pos + 2);
    if (!type_name) return type_name;

    if (auto error = expect(type_name.position, ')')) return ParseResult::failure(move(*error));

    auto node = make_unique<OperatorNode>(NodeKind::UNARY_EXPRESSION, op);
    node->type = TypeExpression(BaseKind::SIZE_T);
    node->add(move(type_name.node));
    return ParseResult::success(move(node), type_name.position + 1);
}

ParseResult Parser::parse_cast_expression(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    return first_of(pos, { &Parser::parse_unary_expression, &Parser::parse_type_cast }, "expression");
}

ParseResult Parser::parse_type_cast(size_t pos) {
    if (auto error = expect(pos, '(')) return ParseResult::failure(move(*error));

    auto type_name = parse_type_name(pos + 1);
    if (!type_name) return type_name;

    if (auto error = expect(type_name.position, ')')) return ParseResult::failure(move(*error));

    auto operand = parse_cast_expression(type_name.position + 1);
    if (!operand) return operand;

    if (!cast_is_legal(type_name.node->type, operand.node->type)) {
        return ParseResult::failure(ParseErrorKind::ILLEGAL_CAST, pos,
                                    "cannot cast from type '" + operand.node->type.message_text() + "' to type '" +
                                    type_name.node->type.message_text() + "'");
    }

    auto node = make_unique<ParseNode>(NodeKind::CAST_EXPRESSION);
    node->type = type_name.node->type;
    node->add(move(type_name.node));
    node->add(move(operand.node));
    return ParseResult::success(move(node), operand.position);
}

ParseResult Parser::parse_multiplicative_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::MULTIPLICATIVE_EXPRESSION, MULTIPLICATIVE_PRECEDENCE, &Parser::parse_cast_expression);
}

ParseResult Parser::parse_additive_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::ADDITIVE_EXPRESSION, ADDITIVE_PRECEDENCE, &Parser::parse_multiplicative_expression);
}

ParseResult Parser::parse_shift_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::SHIFT_EXPRESSION, SHIFT_PRECEDENCE, &Parser::parse_additive_expression);
}

ParseResult Parser::parse_relational_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::RELATIONAL_EXPRESSION, RELATIONAL_PRECEDENCE, &Parser::parse_shift_expression);
}

ParseResult Parser::parse_equality_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::EQUALITY_EXPRESSION, EQUALITY_PRECEDENCE, &Parser::parse_relational_expression);
}

ParseResult Parser::parse_and_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::AND_EXPRESSION, AND_PRECEDENCE, &Parser::parse_equality_expression);
}

ParseResult Parser::parse_exclusive_or_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::EXCLUSIVE_OR_EXPRESSION, EXCLUSIVE_OR_PRECEDENCE, &Parser::parse_and_expression);
}

ParseResult Parser::parse_inclusive_or_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::INCLUSIVE_OR_EXPRESSION, OR_PRECEDENCE, &Parser::parse_exclusive_or_expression);
}

ParseResult Parser::parse_logical_and_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::LOGICAL_AND_EXPRESSION, LOGICAL_AND_PRECEDENCE, &Parser::parse_inclusive_or_expression);
}

ParseResult Parser::parse_logical_or_expression(size_t pos) {
    return parse_binary_level(pos, NodeKind::LOGICAL_OR_EXPRESSION, LOGICAL_OR_PRECEDENCE, &Parser::parse_logical_and_expression);
}

ParseResult Parser::parse_conditional_expression(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    auto condition = parse_logical_or_expression(pos);
    if (!condition) return condition;

    pos = condition.position;
    if (kind_at(pos) != '?') return wrap(NodeKind::CONDITIONAL_EXPRESSION, move(condition));

    if (!is_integer_value_type(condition.node->type)) {
        return ParseResult::failure(ParseErrorKind::ILLEGAL_TYPE_COMBINATION, pos,
                                    "invalid condition of type '" + condition.node->type.message_text() + "' in conditional expression");
    }

    auto if_true = parse_expression(pos + 1);
    if (!if_true) return if_true;

    auto colon_pos = if_true.position;
    if (auto error = expect(colon_pos, ':')) return ParseResult::failure(move(*error));

    auto if_false = parse_conditional_expression(colon_pos + 1);
    if (!if_false) return if_false;

    if (!types_equal(if_true.node->type, if_false.node->type)) {
        return ParseResult::failure(ParseErrorKind::ILLEGAL_TYPE_COMBINATION, colon_pos,
                                    "conditional expression branches have different types '" + if_true.node->type.message_text() +
                                    "' and '" + if_false.node->type.message_text() + "'");
    }

    auto node = make_unique<ParseNode>(NodeKind::CONDITIONAL_EXPRESSION);
    node->type = if_false.node->type;
    node->add(move(condition.node));
    node->add(move(if_true.node));
    node->add(move(if_false.node));
    return ParseResult::success(move(node), if_false.position);
}

// Only a unary expression may be assigned to. A parenthesized expression is a primary expression, whatever it
// contains.
static bool is_unary_expression(const ParseNode* node) {
    while (node->kind != NodeKind::PRIMARY_EXPRESSION && node->transparent()) node = node->children[0].get();

    switch (node->kind) {
      case NodeKind::PRIMARY_EXPRESSION:
      case NodeKind::IDENTIFIER:
      case NodeKind::INTEGER_CONSTANT:
      case NodeKind::FLOATING_CONSTANT:
      case NodeKind::STRING_LITERAL:
      case NodeKind::GENERIC_SELECTION:
      case NodeKind::COMPOUND_LITERAL:
      case NodeKind::POSTFIX_EXPRESSION:
      case NodeKind::UNARY_EXPRESSION:
        return true;
      default:
        return false;
    }
}

ParseResult Parser::parse_assignment_expression(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    // The target is parsed once, as a conditional expression, which the operator then requires to be unary.
    auto target = parse_conditional_expression(pos);
    if (!target) return target;

    auto op_pos = target.position;
    if (!(operator_flags(kind_at(op_pos)) & OP_ASSIGN) || !is_unary_expression(target.node.get())) return target;

    // The assignment is committed to from here.
    auto op = tokens[op_pos].kind;

    auto value = parse_assignment_expression(op_pos + 1);
    if (!value) return value;

    auto type = resolve_implicit_conversion(target.node->type, value.node->type);
    if (!type) {
        return ParseResult::failure(ParseErrorKind::ILLEGAL_ASSIGNMENT, op_pos,
                                    "cannot convert from type '" + value.node->type.message_text() + "' to type '" +
                                    target.node->type.message_text() + "'");
    }

    auto node = make_unique<OperatorNode>(NodeKind::ASSIGNMENT_EXPRESSION, op);
    node->type = move(*type);
    node->add(move(target.node));
    node->add(move(value.node));
    return ParseResult::success(move(node), value.position);
}

ParseResult Parser::parse_expression(size_t pos) {
    auto result = parse_list(pos, NodeKind::EXPRESSION, &Parser::parse_assignment_expression, ',');
    if (result) result.node->type = result.node->children.back()->type;
    return result;
}

ParseResult Parser::parse_constant_expression(size_t pos) {
    return wrap(NodeKind::CONSTANT_EXPRESSION, parse_conditional_expression(pos));
}
