#ifndef PARSE_PARSE_NODE_H
#define PARSE_PARSE_NODE_H

#include "lex/Token.h"
#include "Printable.h"
#include "TypeExpression.h"

enum class NodeKind {
    TRANSLATION_UNIT,
    EXTERNAL_DECLARATION,
    FUNCTION_DEFINITION,
    DECLARATION_LIST,

    DECLARATION,
    DECLARATION_SPECIFIERS,
    INIT_DECLARATOR_LIST,
    INIT_DECLARATOR,
    STORAGE_CLASS_SPECIFIER,
    TYPE_SPECIFIER,
    TYPE_QUALIFIER,
    FUNCTION_SPECIFIER,
    ALIGNMENT_SPECIFIER,
    STRUCT_OR_UNION_SPECIFIER,
    STRUCT_DECLARATION_LIST,
    STRUCT_DECLARATION,
    SPECIFIER_QUALIFIER_LIST,
    STRUCT_DECLARATOR_LIST,
    STRUCT_DECLARATOR,
    ENUM_SPECIFIER,
    ENUMERATOR_LIST,
    ENUMERATOR,
    ATOMIC_TYPE_SPECIFIER,
    STATIC_ASSERT_DECLARATION,

    DECLARATOR,
    DIRECT_DECLARATOR,
    DECLARATOR_SUFFIX,
    POINTER,
    TYPE_QUALIFIER_LIST,
    PARAMETER_TYPE_LIST,
    PARAMETER_LIST,
    PARAMETER_DECLARATION,
    IDENTIFIER_LIST,
    TYPE_NAME,
    ABSTRACT_DECLARATOR,
    DIRECT_ABSTRACT_DECLARATOR,

    INITIALIZER,
    INITIALIZER_LIST,
    DESIGNATION,
    DESIGNATOR_LIST,
    DESIGNATOR,

    STATEMENT,
    LABELED_STATEMENT,
    COMPOUND_STATEMENT,
    BLOCK_ITEM_LIST,
    BLOCK_ITEM,
    EXPRESSION_STATEMENT,
    SELECTION_STATEMENT,
    ITERATION_STATEMENT,
    JUMP_STATEMENT,

    IDENTIFIER,
    INTEGER_CONSTANT,
    FLOATING_CONSTANT,
    STRING_LITERAL,
    PRIMARY_EXPRESSION,
    GENERIC_SELECTION,
    GENERIC_ASSOC_LIST,
    GENERIC_ASSOCIATION,
    POSTFIX_EXPRESSION,
    POSTFIX_SUFFIX,
    COMPOUND_LITERAL,
    ARGUMENT_EXPRESSION_LIST,
    UNARY_EXPRESSION,
    CAST_EXPRESSION,
    MULTIPLICATIVE_EXPRESSION,
    ADDITIVE_EXPRESSION,
    SHIFT_EXPRESSION,
    RELATIONAL_EXPRESSION,
    EQUALITY_EXPRESSION,
    AND_EXPRESSION,
    EXCLUSIVE_OR_EXPRESSION,
    INCLUSIVE_OR_EXPRESSION,
    LOGICAL_AND_EXPRESSION,
    LOGICAL_OR_EXPRESSION,
    BINARY_EXPRESSION,
    CONDITIONAL_EXPRESSION,
    ASSIGNMENT_EXPRESSION,
    EXPRESSION,
    CONSTANT_EXPRESSION,

    NUM
};

const char* node_kind_name(NodeKind kind);

struct ParseNode: Printable {
    explicit ParseNode(NodeKind kind);
    void operator=(const ParseNode&) = delete;

    NodeKind kind;
    TypeExpression type;
    vector<unique_ptr<ParseNode>> children;

    ParseNode* add(unique_ptr<ParseNode> child);

    // Pass-through nodes print as their only child.
    virtual bool transparent() const;

    // Follows pass-through nodes down to the first node that does something.
    const ParseNode* unwrap() const;

    void print(ostream& stream) const override;
    virtual void print_payload(ostream& stream) const;
};

// Carries the operator or keyword that selected the production, e.g. '+' for a binary expression, TOK_WHILE
// for an iteration statement or TOK_INT for a type specifier. TOK_EOF if there is none.
struct OperatorNode: ParseNode {
    OperatorNode(NodeKind kind, TokenKind op);

    TokenKind op;

    bool transparent() const override;
    void print_payload(ostream& stream) const override;
};

struct NameNode: ParseNode {
    NameNode(NodeKind kind, string name);

    string name;

    void print_payload(ostream& stream) const override;
};

struct IntegerConstantNode: ParseNode {
    explicit IntegerConstantNode(unsigned long long value);

    unsigned long long value;

    void print_payload(ostream& stream) const override;
};

struct FloatingConstantNode: ParseNode {
    explicit FloatingConstantNode(double value);

    double value;

    void print_payload(ostream& stream) const override;
};

struct StringLiteralNode: ParseNode {
    StringLiteralNode(string value, StringEncoding encoding);

    string value;
    StringEncoding encoding;

    void print_payload(ostream& stream) const override;
};

struct ParameterTypeListNode: ParseNode {
    explicit ParameterTypeListNode(bool variadic);

    bool variadic;

    void print_payload(ostream& stream) const override;
};

template <typename T>
const T* node_cast(const ParseNode* node) {
    return dynamic_cast<const T*>(node);
}

#endif
