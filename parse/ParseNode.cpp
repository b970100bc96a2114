#include "ParseNode.h"

#include "nlohmann/json.hpp"

using json = nlohmann::json;

static const char* const node_kind_names[] = {
    "translation_unit",
    "external_declaration",
    "function_definition",
    "declaration_list",

    "declaration",
    "declaration_specifiers",
    "init_declarator_list",
    "init_declarator",
    "storage_class_specifier",
    "type_specifier",
    "type_qualifier",
    "function_specifier",
    "alignment_specifier",
    "struct_or_union_specifier",
    "struct_declaration_list",
    "struct_declaration",
    "specifier_qualifier_list",
    "struct_declarator_list",
    "struct_declarator",
    "enum_specifier",
    "enumerator_list",
    "enumerator",
    "atomic_type_specifier",
    "static_assert_declaration",

    "declarator",
    "direct_declarator",
    "declarator_suffix",
    "pointer",
    "type_qualifier_list",
    "parameter_type_list",
    "parameter_list",
    "parameter_declaration",
    "identifier_list",
    "type_name",
    "abstract_declarator",
    "direct_abstract_declarator",

    "initializer",
    "initializer_list",
    "designation",
    "designator_list",
    "designator",

    "statement",
    "labeled_statement",
    "compound_statement",
    "block_item_list",
    "block_item",
    "expression_statement",
    "selection_statement",
    "iteration_statement",
    "jump_statement",

    "identifier",
    "integer_constant",
    "floating_constant",
    "string_literal",
    "primary_expression",
    "generic_selection",
    "generic_assoc_list",
    "generic_association",
    "postfix_expression",
    "postfix_suffix",
    "compound_literal",
    "argument_expression_list",
    "unary_expression",
    "cast_expression",
    "multiplicative_expression",
    "additive_expression",
    "shift_expression",
    "relational_expression",
    "equality_expression",
    "and_expression",
    "exclusive_or_expression",
    "inclusive_or_expression",
    "logical_and_expression",
    "logical_or_expression",
    "binary_expression",
    "conditional_expression",
    "assignment_expression",
    "expression",
    "constant_expression",
};

static_assert(sizeof(node_kind_names) / sizeof(node_kind_names[0]) == size_t(NodeKind::NUM), "missing node kind name");

const char* node_kind_name(NodeKind kind) {
    return node_kind_names[unsigned(kind)];
}

ParseNode::ParseNode(NodeKind kind): kind(kind) {
}

ParseNode* ParseNode::add(unique_ptr<ParseNode> child) {
    auto result = child.get();
    children.push_back(move(child));
    return result;
}

bool ParseNode::transparent() const {
    if (children.size() != 1) return false;

    switch (kind) {
      case NodeKind::EXTERNAL_DECLARATION:
      case NodeKind::INIT_DECLARATOR:
      case NodeKind::DECLARATOR:
      case NodeKind::DIRECT_DECLARATOR:
      case NodeKind::TYPE_NAME:
      case NodeKind::ABSTRACT_DECLARATOR:
      case NodeKind::DIRECT_ABSTRACT_DECLARATOR:
      case NodeKind::INITIALIZER:
      case NodeKind::STATEMENT:
      case NodeKind::BLOCK_ITEM:
      case NodeKind::PRIMARY_EXPRESSION:
      case NodeKind::POSTFIX_EXPRESSION:
      case NodeKind::CAST_EXPRESSION:
      case NodeKind::MULTIPLICATIVE_EXPRESSION:
      case NodeKind::ADDITIVE_EXPRESSION:
      case NodeKind::SHIFT_EXPRESSION:
      case NodeKind::RELATIONAL_EXPRESSION:
      case NodeKind::EQUALITY_EXPRESSION:
      case NodeKind::AND_EXPRESSION:
      case NodeKind::EXCLUSIVE_OR_EXPRESSION:
      case NodeKind::INCLUSIVE_OR_EXPRESSION:
      case NodeKind::LOGICAL_AND_EXPRESSION:
      case NodeKind::LOGICAL_OR_EXPRESSION:
      case NodeKind::CONDITIONAL_EXPRESSION:
      case NodeKind::EXPRESSION:
      case NodeKind::CONSTANT_EXPRESSION:
        return true;
      default:
        return false;
    }
}

const ParseNode* ParseNode::unwrap() const {
    auto node = this;
    while (node->transparent()) node = node->children[0].get();
    return node;
}

void ParseNode::print(ostream& stream) const {
    if (transparent()) {
        children[0]->print(stream);
        return;
    }

    stream << "[\"" << node_kind_name(kind) << '"';
    print_payload(stream);
    for (auto& child : children) {
        stream << ", " << child.get();
    }
    stream << ']';
}

void ParseNode::print_payload(ostream& stream) const {
}

OperatorNode::OperatorNode(NodeKind kind, TokenKind op): ParseNode(kind), op(op) {
}

bool OperatorNode::transparent() const {
    return op == TOK_EOF && children.size() == 1;
}

void OperatorNode::print_payload(ostream& stream) const {
    if (op != TOK_EOF) stream << ", " << json_quote(token_spelling(op));
}

NameNode::NameNode(NodeKind kind, string name): ParseNode(kind), name(move(name)) {
}

void NameNode::print_payload(ostream& stream) const {
    if (!name.empty()) stream << ", " << json_quote(name);
}

IntegerConstantNode::IntegerConstantNode(unsigned long long value): ParseNode(NodeKind::INTEGER_CONSTANT), value(value) {
}

void IntegerConstantNode::print_payload(ostream& stream) const {
    stream << ", " << value;
}

FloatingConstantNode::FloatingConstantNode(double value): ParseNode(NodeKind::FLOATING_CONSTANT), value(value) {
}

void FloatingConstantNode::print_payload(ostream& stream) const {
    stream << ", " << json(value);
}

StringLiteralNode::StringLiteralNode(string value, StringEncoding encoding)
    : ParseNode(NodeKind::STRING_LITERAL), value(move(value)), encoding(encoding) {
}

void StringLiteralNode::print_payload(ostream& stream) const {
    stream << ", " << json_quote(value);
    switch (encoding) {
      case StringEncoding::UTF8:
        stream << ", \"u8\"";
        break;
      case StringEncoding::UTF16:
        stream << ", \"u\"";
        break;
      case StringEncoding::UTF32:
        stream << ", \"U\"";
        break;
      case StringEncoding::WIDE:
        stream << ", \"L\"";
        break;
      default:
        break;
    }
}

ParameterTypeListNode::ParameterTypeListNode(bool variadic): ParseNode(NodeKind::PARAMETER_TYPE_LIST), variadic(variadic) {
}

void ParameterTypeListNode::print_payload(ostream& stream) const {
    if (variadic) stream << ", \"...\"";
}
