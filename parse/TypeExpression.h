#ifndef PARSE_TYPE_EXPRESSION_H
#define PARSE_TYPE_EXPRESSION_H

enum class BaseKind {
    VOID,
    BOOL,
    CHAR,
    SHORT,
    INT,
    LONG,
    FLOAT,
    DOUBLE,
    SIGNED,
    UNSIGNED,
    COMPLEX,
    IMAGINARY,

    POINTER,
    VOID_POINTER,
    ARRAY,
    STRUCT,
    UNION,
    FUNCTION,

    EXTERN,
    STATIC,
    THREAD_LOCAL,
    AUTO,
    REGISTER,

    CONST,
    RESTRICT,
    VOLATILE,
    ATOMIC,

    INLINE,
    NORETURN,

    SIZE_T,
    VA_LIST,
    IDENTIFIER,
    NONE,
};

struct BaseType {
    BaseKind kind = BaseKind::NONE;
    unsigned long long length{};  // ARRAY only; zero if unspecified
    string name;                  // IDENTIFIER only

    bool operator==(const BaseType& other) const;
    bool operator!=(const BaseType& other) const { return !(*this == other); }
};

ostream& operator<<(ostream& stream, const BaseType& type);

// Wrapping types (pointer, array, function, _Atomic) keep the type they wrap as their first child. Composite
// list types have no values and one child per element. A type with neither is the default type.
struct TypeExpression {
    vector<BaseType> values;
    vector<TypeExpression> children;

    TypeExpression() = default;
    explicit TypeExpression(BaseKind kind);
    explicit TypeExpression(BaseType value);

    static TypeExpression identifier(string_view name);
    static TypeExpression hole();
    static TypeExpression pointer_to(TypeExpression pointee);
    static TypeExpression wrap(BaseType value, TypeExpression wrapped);
    static TypeExpression composite(vector<TypeExpression> children);

    // Flattens a declaration specifier or specifier-qualifier sequence: single tag types contribute to the value
    // list and the others become children. A sequence of one keeps that element's type.
    static TypeExpression specifiers(const vector<const TypeExpression*>& elements);

    bool is_default() const { return values.empty() && children.empty(); }
    bool is(BaseKind kind) const;
    bool is_hole() const { return is(BaseKind::NONE); }
    bool has(BaseKind kind) const;

    // Returns a copy with the innermost hole, found by following first children, replaced.
    TypeExpression fill_hole(const TypeExpression& replacement) const;

    bool operator==(const TypeExpression& other) const;
    bool operator!=(const TypeExpression& other) const { return !(*this == other); }

    void print(ostream& stream) const;

    // Compact text used in diagnostics, e.g. "unsigned long" or "* (const char)".
    string message_text() const;
};

ostream& operator<<(ostream& stream, const TypeExpression& type);

#endif
