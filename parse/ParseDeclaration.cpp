#include "Parser.h"

#include "Sema.h"

static ParseResult keyword_node(NodeKind kind, const Token& token, BaseKind type, size_t pos) {
    auto node = make_unique<OperatorNode>(kind, token.kind);
    node->type = TypeExpression(type);
    return ParseResult::success(move(node), pos + 1);
}

static TypeExpression specifier_type(const ParseNode& list) {
    vector<const TypeExpression*> elements;
    for (auto& child : list.children) elements.push_back(&child->type);
    return TypeExpression::specifiers(elements);
}

// The identifier or nested declarator is innermost. A pointer applies to it before any array or function suffix
// and the suffixes apply left to right. Abstract declarators have a hole where the identifier would be.
static TypeExpression declarator_type(const ParseNode* pointer, const ParseNode* direct) {
    auto type = TypeExpression::hole();

    size_t suffix_idx = 0;
    if (direct && direct->children.size() && direct->children[0]->kind != NodeKind::DECLARATOR_SUFFIX) {
        type = direct->children[0]->type;
        suffix_idx = 1;
    }

    if (pointer) type = pointer->type.fill_hole(type);

    if (direct) {
        for (; suffix_idx < direct->children.size(); ++suffix_idx) {
            type = direct->children[suffix_idx]->type.fill_hole(type);
        }
    }

    return type;
}

static bool is_type_qualifier(TokenKind kind) {
    switch (kind) {
      case TOK_CONST:
      case TOK_RESTRICT:
      case TOK_VOLATILE:
      case TOK_ATOMIC:
        return true;
      default:
        return false;
    }
}

ParseResult Parser::parse_declaration(size_t pos) {
    return first_of(pos, { &Parser::parse_plain_declaration, &Parser::parse_static_assert_declaration }, "declaration");
}

ParseResult Parser::parse_plain_declaration(size_t pos) {
    auto specifiers = parse_declaration_specifiers(pos);
    if (!specifiers) return specifiers;
    pos = specifiers.position;

    auto node = make_unique<ParseNode>(NodeKind::DECLARATION);
    if (kind_at(pos) == ';') {
        node->type = specifiers.node->type;
        node->add(move(specifiers.node));
        return ParseResult::success(move(node), pos + 1);
    }

    auto declarators = parse_init_declarator_list(pos);
    if (!declarators) return declarators;

    if (auto error = expect(declarators.position, ';')) return ParseResult::failure(move(*error));

    node->type = TypeExpression::composite({ specifiers.node->type, declarators.node->type });
    node->add(move(specifiers.node));
    node->add(move(declarators.node));
    return ParseResult::success(move(node), declarators.position + 1);
}

ParseResult Parser::parse_declaration_specifiers(size_t pos) {
    auto result = parse_repetition(pos, NodeKind::DECLARATION_SPECIFIERS, &Parser::parse_declaration_specifier, 1);
    if (result) result.node->type = specifier_type(*result.node);
    return result;
}

ParseResult Parser::parse_declaration_specifier(size_t pos) {
    return first_of(pos, {
        &Parser::parse_storage_class_specifier,
        &Parser::parse_type_specifier,
        &Parser::parse_type_qualifier,
        &Parser::parse_function_specifier,
        &Parser::parse_alignment_specifier,
    }, "declaration specifier");
}

ParseResult Parser::parse_init_declarator_list(size_t pos) {
    return parse_list(pos, NodeKind::INIT_DECLARATOR_LIST, &Parser::parse_init_declarator, ',');
}

ParseResult Parser::parse_init_declarator(size_t pos) {
    auto declarator = parse_declarator(pos);
    if (!declarator) return declarator;
    pos = declarator.position;

    auto node = make_unique<ParseNode>(NodeKind::INIT_DECLARATOR);
    node->type = declarator.node->type;
    node->add(move(declarator.node));

    if (kind_at(pos) == '=') {
        auto initializer = parse_initializer(pos + 1);
        if (!initializer) return initializer;

        // Brace enclosed initializers are not checked against the declarator.
        if (initializer.node->unwrap()->kind != NodeKind::INITIALIZER_LIST &&
            !resolve_implicit_conversion(node->type, initializer.node->type)) {
            return ParseResult::failure(ParseErrorKind::ILLEGAL_ASSIGNMENT, pos,
                                        "cannot convert from type '" + initializer.node->type.message_text() + "' to type '" +
                                        node->type.message_text() + "'");
        }

        node->add(move(initializer.node));
        pos = initializer.position;
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_storage_class_specifier(size_t pos) {
    BaseKind type;
    switch (kind_at(pos)) {
      case TOK_TYPEDEF:
        return unsupported(pos, "typedef");
      case TOK_EXTERN:
        type = BaseKind::EXTERN;
        break;
      case TOK_STATIC:
        type = BaseKind::STATIC;
        break;
      case TOK_THREAD_LOCAL:
        type = BaseKind::THREAD_LOCAL;
        break;
      case TOK_AUTO:
        type = BaseKind::AUTO;
        break;
      case TOK_REGISTER:
        type = BaseKind::REGISTER;
        break;
      default:
        return unexpected(pos, "storage class specifier");
    }

    return keyword_node(NodeKind::STORAGE_CLASS_SPECIFIER, tokens[pos], type, pos);
}

ParseResult Parser::parse_type_specifier(size_t pos) {
    return first_of(pos, {
        &Parser::parse_type_keyword,
        &Parser::parse_atomic_type_specifier,
        &Parser::parse_struct_or_union_specifier,
        &Parser::parse_enum_specifier,
    }, "type specifier");
}

ParseResult Parser::parse_type_keyword(size_t pos) {
    BaseKind type;
    switch (kind_at(pos)) {
      case TOK_VOID:
        type = BaseKind::VOID;
        break;
      case TOK_CHAR:
        type = BaseKind::CHAR;
        break;
      case TOK_SHORT:
        type = BaseKind::SHORT;
        break;
      case TOK_INT:
        type = BaseKind::INT;
        break;
      case TOK_LONG:
        type = BaseKind::LONG;
        break;
      case TOK_FLOAT:
        type = BaseKind::FLOAT;
        break;
      case TOK_DOUBLE:
        type = BaseKind::DOUBLE;
        break;
      case TOK_SIGNED:
        type = BaseKind::SIGNED;
        break;
      case TOK_UNSIGNED:
        type = BaseKind::UNSIGNED;
        break;
      case TOK_BOOL:
        type = BaseKind::BOOL;
        break;
      case TOK_COMPLEX:
        type = BaseKind::COMPLEX;
        break;
      case TOK_IMAGINARY:
        type = BaseKind::IMAGINARY;
        break;
      default:
        return unexpected(pos, "type specifier");
    }

    return keyword_node(NodeKind::TYPE_SPECIFIER, tokens[pos], type, pos);
}

ParseResult Parser::parse_struct_or_union_specifier(size_t pos) {
    auto keyword = kind_at(pos);
    if (keyword != TOK_STRUCT && keyword != TOK_UNION) return unexpected(pos, "struct or union");
    ++pos;

    auto node = make_unique<OperatorNode>(NodeKind::STRUCT_OR_UNION_SPECIFIER, keyword);
    node->type = TypeExpression(keyword == TOK_STRUCT ? BaseKind::STRUCT : BaseKind::UNION);

    if (kind_at(pos) == TOK_IDENTIFIER) {
        auto tag = parse_identifier(pos);
        node->type.children.push_back(tag.node->type);
        node->add(move(tag.node));
        pos = tag.position;
    }

    if (kind_at(pos) == '{') {
        auto members = parse_repetition(pos + 1, NodeKind::STRUCT_DECLARATION_LIST, &Parser::parse_struct_declaration, 1, '}');
        if (!members) return members;

        node->type.children.push_back(members.node->type);
        node->add(move(members.node));
        pos = members.position + 1;
    } else if (node->children.empty()) {
        return unexpected(pos, "identifier or '{'");
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_struct_declaration(size_t pos) {
    return first_of(pos, { &Parser::parse_member_declaration, &Parser::parse_static_assert_declaration }, "member declaration");
}

ParseResult Parser::parse_member_declaration(size_t pos) {
    auto specifiers = parse_specifier_qualifier_list(pos);
    if (!specifiers) return specifiers;
    pos = specifiers.position;

    auto node = make_unique<ParseNode>(NodeKind::STRUCT_DECLARATION);
    node->type = specifiers.node->type;

    // Without declarators, this is an anonymous struct or union member.
    unique_ptr<ParseNode> declarators;
    if (kind_at(pos) != ';') {
        auto result = parse_list(pos, NodeKind::STRUCT_DECLARATOR_LIST, &Parser::parse_struct_declarator, ',');
        if (!result) return result;

        node->type = TypeExpression::composite({ specifiers.node->type, result.node->type });
        declarators = move(result.node);
        pos = result.position;
    }

    if (auto error = expect(pos, ';')) return ParseResult::failure(move(*error));

    node->add(move(specifiers.node));
    if (declarators) node->add(move(declarators));
    return ParseResult::success(move(node), pos + 1);
}

ParseResult Parser::parse_specifier_qualifier_list(size_t pos) {
    auto result = parse_repetition(pos, NodeKind::SPECIFIER_QUALIFIER_LIST, &Parser::parse_specifier_qualifier, 1);
    if (result) result.node->type = specifier_type(*result.node);
    return result;
}

ParseResult Parser::parse_specifier_qualifier(size_t pos) {
    return first_of(pos, { &Parser::parse_type_specifier, &Parser::parse_type_qualifier }, "type specifier");
}

ParseResult Parser::parse_struct_declarator(size_t pos) {
    return first_of(pos, { &Parser::parse_bit_field, &Parser::parse_member_declarator }, "member declarator");
}

// Unnamed bit-field.
ParseResult Parser::parse_bit_field(size_t pos) {
    if (auto error = expect(pos, ':')) return ParseResult::failure(move(*error));

    auto width = parse_constant_expression(pos + 1);
    if (!width) return width;

    auto node = make_unique<ParseNode>(NodeKind::STRUCT_DECLARATOR);
    node->type = TypeExpression::hole();
    node->add(move(width.node));
    return ParseResult::success(move(node), width.position);
}

ParseResult Parser::parse_member_declarator(size_t pos) {
    auto declarator = parse_declarator(pos);
    if (!declarator || kind_at(declarator.position) != ':') return declarator;

    auto width = parse_constant_expression(declarator.position + 1);
    if (!width) return width;

    auto node = make_unique<ParseNode>(NodeKind::STRUCT_DECLARATOR);
    node->type = declarator.node->type;
    node->add(move(declarator.node));
    node->add(move(width.node));
    return ParseResult::success(move(node), width.position);
}

ParseResult Parser::parse_enum_specifier(size_t pos) {
    if (auto error = expect(pos, TOK_ENUM)) return ParseResult::failure(move(*error));
    ++pos;

    string tag;
    if (kind_at(pos) == TOK_IDENTIFIER) {
        tag = tokens[pos].text;
        ++pos;
    }

    auto node = make_unique<NameNode>(NodeKind::ENUM_SPECIFIER, tag);
    node->type = TypeExpression(BaseKind::INT);
    if (!tag.empty()) node->type.children.push_back(TypeExpression::identifier(tag));

    if (kind_at(pos) == '{') {
        auto enumerators = parse_list(pos + 1, NodeKind::ENUMERATOR_LIST, &Parser::parse_enumerator, ',');
        if (!enumerators) return enumerators;
        pos = enumerators.position;

        if (kind_at(pos) == ',') ++pos;
        if (auto error = expect(pos, '}')) return ParseResult::failure(move(*error));

        node->add(move(enumerators.node));
        ++pos;
    } else if (tag.empty()) {
        return unexpected(pos, "identifier or '{'");
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_enumerator(size_t pos) {
    if (auto error = expect(pos, TOK_IDENTIFIER)) return ParseResult::failure(move(*error));

    auto node = make_unique<NameNode>(NodeKind::ENUMERATOR, tokens[pos].text);
    node->type = TypeExpression(BaseKind::LONG);
    ++pos;

    if (kind_at(pos) == '=') {
        auto value = parse_constant_expression(pos + 1);
        if (!value) return value;

        if (!is_integer_value_type(value.node->type)) {
            return ParseResult::failure(ParseErrorKind::ILLEGAL_TYPE_COMBINATION, pos + 1,
                                        "enumerator value has non-integer type '" + value.node->type.message_text() + "'");
        }

        node->add(move(value.node));
        pos = value.position;
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_atomic_type_specifier(size_t pos) {
    if (auto error = expect(pos, TOK_ATOMIC)) return ParseResult::failure(move(*error));
    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto type_name = parse_type_name(pos + 2);
    if (!type_name) return type_name;

    if (auto error = expect(type_name.position, ')')) return ParseResult::failure(move(*error));

    BaseType atomic;
    atomic.kind = BaseKind::ATOMIC;

    auto node = make_unique<ParseNode>(NodeKind::ATOMIC_TYPE_SPECIFIER);
    node->type = TypeExpression::wrap(atomic, type_name.node->type);
    node->add(move(type_name.node));
    return ParseResult::success(move(node), type_name.position + 1);
}

ParseResult Parser::parse_type_qualifier(size_t pos) {
    BaseKind type;
    switch (kind_at(pos)) {
      case TOK_CONST:
        type = BaseKind::CONST;
        break;
      case TOK_RESTRICT:
        type = BaseKind::RESTRICT;
        break;
      case TOK_VOLATILE:
        type = BaseKind::VOLATILE;
        break;
      case TOK_ATOMIC:
        type = BaseKind::ATOMIC;
        break;
      default:
        return unexpected(pos, "type qualifier");
    }

    return keyword_node(NodeKind::TYPE_QUALIFIER, tokens[pos], type, pos);
}

ParseResult Parser::parse_function_specifier(size_t pos) {
    BaseKind type;
    switch (kind_at(pos)) {
      case TOK_INLINE:
        type = BaseKind::INLINE;
        break;
      case TOK_NORETURN:
        type = BaseKind::NORETURN;
        break;
      default:
        return unexpected(pos, "function specifier");
    }

    return keyword_node(NodeKind::FUNCTION_SPECIFIER, tokens[pos], type, pos);
}

ParseResult Parser::parse_alignment_specifier(size_t pos) {
    if (auto error = expect(pos, TOK_ALIGNAS)) return ParseResult::failure(move(*error));
    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto alignment = first_of(pos + 2, { &Parser::parse_type_name, &Parser::parse_constant_expression }, "type name or expression");
    if (!alignment) return alignment;

    if (auto error = expect(alignment.position, ')')) return ParseResult::failure(move(*error));

    // Alignment does not contribute to the declared type.
    auto node = make_unique<ParseNode>(NodeKind::ALIGNMENT_SPECIFIER);
    node->type = TypeExpression::hole();
    node->add(move(alignment.node));
    return ParseResult::success(move(node), alignment.position + 1);
}

ParseResult Parser::parse_declarator(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    auto node = make_unique<ParseNode>(NodeKind::DECLARATOR);

    const ParseNode* pointer{};
    if (kind_at(pos) == '*') {
        auto result = parse_pointer(pos);
        if (!result) return result;

        pointer = node->add(move(result.node));
        pos = result.position;
    }

    auto direct = parse_direct_declarator(pos);
    if (!direct) return direct;

    node->type = declarator_type(pointer, direct.node.get());
    node->add(move(direct.node));
    return ParseResult::success(move(node), direct.position);
}

ParseResult Parser::parse_direct_declarator(size_t pos) {
    auto base = first_of(pos, { &Parser::parse_identifier, &Parser::parse_nested_declarator }, "declarator");
    if (!base) return base;

    auto node = make_unique<ParseNode>(NodeKind::DIRECT_DECLARATOR);
    node->add(move(base.node));
    pos = base.position;

    while (kind_at(pos) == '[' || kind_at(pos) == '(') {
        auto suffix = parse_declarator_suffix(pos);
        if (!suffix) return suffix;

        node->add(move(suffix.node));
        pos = suffix.position;
    }

    node->type = declarator_type(nullptr, node.get());
    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_nested_declarator(size_t pos) {
    if (auto error = expect(pos, '(')) return ParseResult::failure(move(*error));

    auto declarator = parse_declarator(pos + 1);
    if (!declarator) return declarator;

    if (auto error = expect(declarator.position, ')')) return ParseResult::failure(move(*error));
    ++declarator.position;

    return declarator;
}

ParseResult Parser::parse_declarator_suffix(size_t pos) {
    auto op = kind_at(pos);
    auto node = make_unique<OperatorNode>(NodeKind::DECLARATOR_SUFFIX, op);

    if (op == '[') {
        ++pos;
        auto next = kind_at(pos);
        if (next == TOK_STATIC) return unsupported(pos, "'static' in an array declarator");
        if (is_type_qualifier(next)) return unsupported(pos, "type qualifier in an array declarator");
        if (next == '*' && kind_at(pos + 1) == ']') return unsupported(pos, "variable length array declarator '[*]'");

        BaseType array;
        array.kind = BaseKind::ARRAY;

        if (next != ']') {
            auto size = parse_assignment_expression(pos);
            if (!size) return size;

            // Only a literal size gives the array a length.
            auto constant = node_cast<IntegerConstantNode>(size.node->unwrap());
            if (constant) array.length = constant->value;

            node->add(move(size.node));
            pos = size.position;
        }

        if (auto error = expect(pos, ']')) return ParseResult::failure(move(*error));

        node->type = TypeExpression::wrap(array, TypeExpression::hole());
        return ParseResult::success(move(node), pos + 1);
    }

    if (op == '(') {
        ++pos;

        BaseType function;
        function.kind = BaseKind::FUNCTION;
        node->type = TypeExpression::wrap(function, TypeExpression::hole());

        if (kind_at(pos) != ')') {
            auto parameters = first_of(pos, { &Parser::parse_parameter_type_list, &Parser::parse_identifier_list }, "parameter declaration");
            if (!parameters) return parameters;

            const ParseNode* list = parameters.node.get();
            auto type_list = node_cast<ParameterTypeListNode>(list);
            if (type_list) {
                if (type_list->variadic) node->type.values.push_back(BaseType{BaseKind::VA_LIST});
                list = type_list->children[0].get();
            }

            for (auto& parameter : list->children) {
                node->type.children.push_back(parameter->type);
            }

            node->add(move(parameters.node));
            pos = parameters.position;
        }

        if (auto error = expect(pos, ')')) return ParseResult::failure(move(*error));

        return ParseResult::success(move(node), pos + 1);
    }

    return unexpected(pos, "'[' or '('");
}

ParseResult Parser::parse_pointer(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    if (auto error = expect(pos, '*')) return ParseResult::failure(move(*error));
    ++pos;

    auto node = make_unique<ParseNode>(NodeKind::POINTER);
    TypeExpression star(BaseKind::POINTER);

    auto qualifiers = parse_type_qualifier_list(pos);
    if (qualifiers) {
        for (auto& value : qualifiers.node->type.values) star.values.push_back(value);
        node->add(move(qualifiers.node));
        pos = qualifiers.position;
    } else if (!qualifiers.error->is_syntax()) {
        return qualifiers;
    }

    star.children.push_back(TypeExpression::hole());
    node->type = star;

    if (kind_at(pos) == '*') {
        auto inner = parse_pointer(pos);
        if (!inner) return inner;

        node->type = inner.node->type.fill_hole(star);
        node->add(move(inner.node));
        pos = inner.position;
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_type_qualifier_list(size_t pos) {
    auto result = parse_repetition(pos, NodeKind::TYPE_QUALIFIER_LIST, &Parser::parse_type_qualifier, 1);
    if (result) result.node->type = specifier_type(*result.node);
    return result;
}

ParseResult Parser::parse_parameter_type_list(size_t pos) {
    auto parameters = parse_list(pos, NodeKind::PARAMETER_LIST, &Parser::parse_parameter_declaration, ',');
    if (!parameters) return parameters;
    pos = parameters.position;

    auto variadic = kind_at(pos) == ',' && kind_at(pos + 1) == TOK_ELLIPSIS;
    if (variadic) pos += 2;

    auto node = make_unique<ParameterTypeListNode>(variadic);
    node->type = parameters.node->type;
    node->add(move(parameters.node));
    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_parameter_declaration(size_t pos) {
    auto specifiers = parse_declaration_specifiers(pos);
    if (!specifiers) return specifiers;
    pos = specifiers.position;

    auto node = make_unique<ParseNode>(NodeKind::PARAMETER_DECLARATION);
    node->type = specifiers.node->type;
    node->add(move(specifiers.node));

    auto declarator = parse_declarator(pos);
    if (declarator) {
        node->type = TypeExpression::composite({ node->type, declarator.node->type });
        node->add(move(declarator.node));
        return ParseResult::success(move(node), declarator.position);
    }
    if (!declarator.error->is_syntax()) return declarator;

    auto abstract = parse_abstract_declarator(pos);
    if (abstract) {
        node->type = abstract.node->type.fill_hole(node->type);
        node->add(move(abstract.node));
        return ParseResult::success(move(node), abstract.position);
    }
    if (!abstract.error->is_syntax()) return abstract;

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_identifier_list(size_t pos) {
    return parse_list(pos, NodeKind::IDENTIFIER_LIST, &Parser::parse_identifier, ',');
}

ParseResult Parser::parse_type_name(size_t pos) {
    auto specifiers = parse_specifier_qualifier_list(pos);
    if (!specifiers) return specifiers;
    pos = specifiers.position;

    auto node = make_unique<ParseNode>(NodeKind::TYPE_NAME);
    node->type = specifiers.node->type;
    node->add(move(specifiers.node));

    auto abstract = parse_abstract_declarator(pos);
    if (abstract) {
        node->type = abstract.node->type.fill_hole(node->type);
        node->add(move(abstract.node));
        pos = abstract.position;
    } else if (!abstract.error->is_syntax()) {
        return abstract;
    }

    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_abstract_declarator(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    auto node = make_unique<ParseNode>(NodeKind::ABSTRACT_DECLARATOR);

    const ParseNode* pointer{};
    if (kind_at(pos) == '*') {
        auto result = parse_pointer(pos);
        if (!result) return result;

        pointer = node->add(move(result.node));
        pos = result.position;
    }

    const ParseNode* direct{};
    if (kind_at(pos) == '(' || kind_at(pos) == '[') {
        auto result = parse_direct_abstract_declarator(pos);
        if (result) {
            direct = node->add(move(result.node));
            pos = result.position;
        } else if (!pointer || !result.error->is_syntax()) {
            return result;
        }
    } else if (!pointer) {
        return unexpected(pos, "abstract declarator");
    }

    node->type = declarator_type(pointer, direct);
    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_direct_abstract_declarator(size_t pos) {
    auto node = make_unique<ParseNode>(NodeKind::DIRECT_ABSTRACT_DECLARATOR);

    // A parenthesis either nests an abstract declarator or begins a function suffix.
    if (kind_at(pos) == '(') {
        auto nested = parse_nested_abstract_declarator(pos);
        if (nested) {
            node->add(move(nested.node));
            pos = nested.position;
        } else if (!nested.error->is_syntax()) {
            return nested;
        }
    }

    while (kind_at(pos) == '[' || kind_at(pos) == '(') {
        auto suffix = parse_declarator_suffix(pos);
        if (!suffix) return suffix;

        node->add(move(suffix.node));
        pos = suffix.position;
    }

    if (node->children.empty()) return unexpected(pos, "abstract declarator");

    node->type = declarator_type(nullptr, node.get());
    return ParseResult::success(move(node), pos);
}

ParseResult Parser::parse_nested_abstract_declarator(size_t pos) {
    if (auto error = expect(pos, '(')) return ParseResult::failure(move(*error));

    auto declarator = parse_abstract_declarator(pos + 1);
    if (!declarator) return declarator;

    if (auto error = expect(declarator.position, ')')) return ParseResult::failure(move(*error));
    ++declarator.position;

    return declarator;
}

ParseResult Parser::parse_initializer(size_t pos) {
    DepthGuard guard(*this);
    if (guard.exceeded()) return nesting_too_deep(pos);

    return wrap(NodeKind::INITIALIZER,
                first_of(pos, { &Parser::parse_braced_initializer, &Parser::parse_assignment_expression }, "initializer"));
}

ParseResult Parser::parse_braced_initializer(size_t pos) {
    if (auto error = expect(pos, '{')) return ParseResult::failure(move(*error));

    auto initializers = parse_initializer_list(pos + 1);
    if (!initializers) return initializers;
    pos = initializers.position;

    if (kind_at(pos) == ',') ++pos;
    if (auto error = expect(pos, '}')) return ParseResult::failure(move(*error));

    initializers.position = pos + 1;
    return initializers;
}

ParseResult Parser::parse_initializer_list(size_t pos) {
    return parse_list(pos, NodeKind::INITIALIZER_LIST, &Parser::parse_initializer_list_item, ',');
}

ParseResult Parser::parse_initializer_list_item(size_t pos) {
    return first_of(pos, { &Parser::parse_designation, &Parser::parse_initializer }, "initializer");
}

ParseResult Parser::parse_designation(size_t pos) {
    auto designators = parse_repetition(pos, NodeKind::DESIGNATOR_LIST, &Parser::parse_designator, 1);
    if (!designators) return designators;

    if (auto error = expect(designators.position, '=')) return ParseResult::failure(move(*error));

    auto initializer = parse_initializer(designators.position + 1);
    if (!initializer) return initializer;

    auto node = make_unique<ParseNode>(NodeKind::DESIGNATION);
    node->type = initializer.node->type;
    node->add(move(designators.node));
    node->add(move(initializer.node));
    return ParseResult::success(move(node), initializer.position);
}

ParseResult Parser::parse_designator(size_t pos) {
    auto op = kind_at(pos);
    auto node = make_unique<OperatorNode>(NodeKind::DESIGNATOR, op);

    if (op == '[') {
        auto index = parse_constant_expression(pos + 1);
        if (!index) return index;

        if (auto error = expect(index.position, ']')) return ParseResult::failure(move(*error));

        node->type = index.node->type;
        node->add(move(index.node));
        return ParseResult::success(move(node), index.position + 1);
    }

    if (op == '.') {
        auto member = parse_identifier(pos + 1);
        if (!member) return member;

        node->type = member.node->type;
        node->add(move(member.node));
        return ParseResult::success(move(node), member.position);
    }

    return unexpected(pos, "designator");
}

ParseResult Parser::parse_static_assert_declaration(size_t pos) {
    if (auto error = expect(pos, TOK_STATIC_ASSERT)) return ParseResult::failure(move(*error));
    if (auto error = expect(pos + 1, '(')) return ParseResult::failure(move(*error));

    auto condition = parse_constant_expression(pos + 2);
    if (!condition) return condition;
    pos = condition.position;

    if (auto error = expect(pos, ',')) return ParseResult::failure(move(*error));

    auto text = parse_string(pos + 1);
    if (!text) return text;
    pos = text.position;

    if (auto error = expect(pos, ')')) return ParseResult::failure(move(*error));
    if (auto error = expect(pos + 1, ';')) return ParseResult::failure(move(*error));

    auto node = make_unique<ParseNode>(NodeKind::STATIC_ASSERT_DECLARATION);
    node->type = TypeExpression::hole();
    node->add(move(condition.node));
    node->add(move(text.node));
    return ParseResult::success(move(node), pos + 2);
}
