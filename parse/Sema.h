#ifndef PARSE_SEMA_H
#define PARSE_SEMA_H

#include "lex/Token.h"
#include "TypeExpression.h"

// Type rules consulted by the parser while it builds the tree. Identifier placeholders stand for types that
// cannot be known without a symbol table; every query accepts them.

struct CombineResult {
    bool accepted{};
    TypeExpression type;
};

bool cast_is_legal(const TypeExpression& target, const TypeExpression& source);

CombineResult combine_types(const TypeExpression& left, const TypeExpression& right, TokenKind op);

// Type of an assignment or initialization of left from right; nullopt if right does not implicitly convert.
optional<TypeExpression> resolve_implicit_conversion(const TypeExpression& left, const TypeExpression& right);

bool types_equal(const TypeExpression& a, const TypeExpression& b);

bool types_equal_any(const TypeExpression& type, const vector<BaseKind>& candidates);

// Types accepted as the condition of a conditional expression and as an enumerator value.
bool is_integer_value_type(const TypeExpression& type);

// Element type of a subscripted array or pointer, if known.
optional<TypeExpression> element_type(const TypeExpression& type);

// Type wrapped by a called function or pointer to function, if known.
optional<TypeExpression> call_result_type(const TypeExpression& type);

#endif
