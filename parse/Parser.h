#ifndef PARSE_PARSER_H
#define PARSE_PARSER_H

#include "AssocPrec.h"
#include "ParseResult.h"

struct ParseOptions {
    size_t max_nesting_depth = 1024;
};

// Recursive descent parser over an immutable token sequence. Every production takes the position of its first
// token and returns either a typed node with the position following it or an error; no production moves a
// shared cursor, so trying another alternative after a failure needs no rollback.
struct Parser {
    const vector<Token>& tokens;
    const ParseOptions options;

    Parser(const vector<Token>& tokens, const ParseOptions& options = {});
    void operator=(const Parser&) = delete;

    unique_ptr<ParseNode> parse(string_view source_label);

    unique_ptr<ParseNode> parse_standalone_expr(string_view source_label);  // for testing
    unique_ptr<ParseNode> parse_standalone_arguments(string_view source_label);  // for testing
    unique_ptr<ParseNode> parse_standalone_declaration(string_view source_label);  // for testing
    unique_ptr<ParseNode> parse_standalone_statement(string_view source_label);  // for testing

private:
    typedef ParseResult (Parser::*Production)(size_t);

    struct DepthGuard {
        explicit DepthGuard(Parser& parser);
        ~DepthGuard();
        void operator=(const DepthGuard&) = delete;

        bool exceeded() const;

        Parser& parser;
    };

    size_t depth{};

    bool at_end(size_t pos) const;
    TokenKind kind_at(size_t pos) const;
    optional<ParseError> expect(size_t pos, int kind) const;
    ParseResult unexpected(size_t pos, const char* what) const;
    ParseResult unsupported(size_t pos, const string& feature) const;
    ParseResult nesting_too_deep(size_t pos) const;

    ParseResult first_of(size_t pos, initializer_list<Production> alternatives, const char* what);
    ParseResult parse_list(size_t pos, NodeKind kind, Production item, int separator);
    ParseResult parse_repetition(size_t pos, NodeKind kind, Production item, size_t min_count, int terminator = TOK_EOF);
    ParseResult parse_binary_level(size_t pos, NodeKind kind, OperatorPrec prec, Production operand);

    unique_ptr<ParseNode> parse_standalone(Production production, string_view source_label);
    void report(const ParseError& error, string_view source_label) const;

    ParseResult parse_translation_unit(size_t pos);
    ParseResult parse_external_declaration(size_t pos);
    ParseResult parse_function_definition(size_t pos);
    ParseResult parse_declaration_list(size_t pos);

    // Expressions
    ParseResult parse_identifier(size_t pos);
    ParseResult parse_constant(size_t pos);
    ParseResult parse_string(size_t pos);
    ParseResult parse_parenthesized_expression(size_t pos);
    ParseResult parse_generic_selection(size_t pos);
    ParseResult parse_generic_association(size_t pos);
    ParseResult parse_primary_expression(size_t pos);
    ParseResult parse_compound_literal(size_t pos);
    ParseResult parse_postfix_expression(size_t pos);
    ParseResult parse_argument_expression_list(size_t pos);
    ParseResult parse_unary_expression(size_t pos);
    ParseResult parse_unary_operator_expression(size_t pos);
    ParseResult parse_sizeof_type_expression(size_t pos);
    ParseResult parse_cast_expression(size_t pos);
    ParseResult parse_type_cast(size_t pos);
    ParseResult parse_multiplicative_expression(size_t pos);
    ParseResult parse_additive_expression(size_t pos);
    ParseResult parse_shift_expression(size_t pos);
    ParseResult parse_relational_expression(size_t pos);
    ParseResult parse_equality_expression(size_t pos);
    ParseResult parse_and_expression(size_t pos);
    ParseResult parse_exclusive_or_expression(size_t pos);
    ParseResult parse_inclusive_or_expression(size_t pos);
    ParseResult parse_logical_and_expression(size_t pos);
    ParseResult parse_logical_or_expression(size_t pos);
    ParseResult parse_conditional_expression(size_t pos);
    ParseResult parse_assignment_expression(size_t pos);
    ParseResult parse_expression(size_t pos);
    ParseResult parse_constant_expression(size_t pos);

    // Declarations
    ParseResult parse_declaration(size_t pos);
    ParseResult parse_plain_declaration(size_t pos);
    ParseResult parse_declaration_specifiers(size_t pos);
    ParseResult parse_declaration_specifier(size_t pos);
    ParseResult parse_init_declarator_list(size_t pos);
    ParseResult parse_init_declarator(size_t pos);
    ParseResult parse_storage_class_specifier(size_t pos);
    ParseResult parse_type_specifier(size_t pos);
    ParseResult parse_type_keyword(size_t pos);
    ParseResult parse_struct_or_union_specifier(size_t pos);
    ParseResult parse_struct_declaration(size_t pos);
    ParseResult parse_member_declaration(size_t pos);
    ParseResult parse_specifier_qualifier_list(size_t pos);
    ParseResult parse_specifier_qualifier(size_t pos);
    ParseResult parse_struct_declarator(size_t pos);
    ParseResult parse_bit_field(size_t pos);
    ParseResult parse_member_declarator(size_t pos);
    ParseResult parse_enum_specifier(size_t pos);
    ParseResult parse_enumerator(size_t pos);
    ParseResult parse_atomic_type_specifier(size_t pos);
    ParseResult parse_type_qualifier(size_t pos);
    ParseResult parse_function_specifier(size_t pos);
    ParseResult parse_alignment_specifier(size_t pos);
    ParseResult parse_declarator(size_t pos);
    ParseResult parse_direct_declarator(size_t pos);
    ParseResult parse_nested_declarator(size_t pos);
    ParseResult parse_declarator_suffix(size_t pos);
    ParseResult parse_pointer(size_t pos);
    ParseResult parse_type_qualifier_list(size_t pos);
    ParseResult parse_parameter_type_list(size_t pos);
    ParseResult parse_parameter_declaration(size_t pos);
    ParseResult parse_identifier_list(size_t pos);
    ParseResult parse_type_name(size_t pos);
    ParseResult parse_abstract_declarator(size_t pos);
    ParseResult parse_direct_abstract_declarator(size_t pos);
    ParseResult parse_nested_abstract_declarator(size_t pos);
    ParseResult parse_initializer(size_t pos);
    ParseResult parse_braced_initializer(size_t pos);
    ParseResult parse_initializer_list(size_t pos);
    ParseResult parse_initializer_list_item(size_t pos);
    ParseResult parse_designation(size_t pos);
    ParseResult parse_designator(size_t pos);
    ParseResult parse_static_assert_declaration(size_t pos);

    // Statements
    ParseResult parse_statement(size_t pos);
    ParseResult parse_labeled_statement(size_t pos);
    ParseResult parse_compound_statement(size_t pos);
    ParseResult parse_block_item(size_t pos);
    ParseResult parse_expression_statement(size_t pos);
    ParseResult parse_selection_statement(size_t pos);
    ParseResult parse_iteration_statement(size_t pos);
    ParseResult parse_for_statement(size_t pos);
    ParseResult parse_jump_statement(size_t pos);
};

// Parses a whole translation unit. On failure, reports one error through message() and returns null.
unique_ptr<ParseNode> parse(const vector<Token>& tokens, string_view source_label, const ParseOptions& options = {});

#endif
