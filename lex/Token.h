#ifndef LEX_TOKEN_H
#define LEX_TOKEN_H

#include "Location.h"

enum TokenKind {
    TOK_EOF,
    TOK_IDENTIFIER,

    // The [32,127] range is reserved for single character punctuators.

    TOK_PTR_OP = 128,
    TOK_INC_OP,
    TOK_DEC_OP,
    TOK_LEFT_OP,
    TOK_RIGHT_OP,
    TOK_LE_OP,
    TOK_GE_OP,
    TOK_EQ_OP,
    TOK_NE_OP,

    TOK_AND_OP,
    TOK_OR_OP,
    TOK_MUL_ASSIGN,
    TOK_DIV_ASSIGN,
    TOK_MOD_ASSIGN,
    TOK_ADD_ASSIGN,
    TOK_SUB_ASSIGN,
    TOK_LEFT_ASSIGN,
    TOK_RIGHT_ASSIGN,
    TOK_AND_ASSIGN,
    TOK_XOR_ASSIGN,
    TOK_OR_ASSIGN,

    TOK_ELLIPSIS,

    TOK_AUTO,
    TOK_BREAK,
    TOK_CASE,
    TOK_CHAR,
    TOK_CONST,
    TOK_CONTINUE,
    TOK_DEFAULT,
    TOK_DO,
    TOK_DOUBLE,
    TOK_ELSE,
    TOK_ENUM,
    TOK_EXTERN,
    TOK_FLOAT,
    TOK_FOR,
    TOK_GOTO,
    TOK_IF,
    TOK_INLINE,
    TOK_INT,
    TOK_LONG,
    TOK_REGISTER,
    TOK_RESTRICT,
    TOK_RETURN,
    TOK_SHORT,
    TOK_SIGNED,
    TOK_SIZEOF,
    TOK_STATIC,
    TOK_STRUCT,
    TOK_SWITCH,
    TOK_TYPEDEF,
    TOK_UNION,
    TOK_UNSIGNED,
    TOK_VOID,
    TOK_VOLATILE,
    TOK_WHILE,
    TOK_ALIGNAS,
    TOK_ALIGNOF,
    TOK_ATOMIC,
    TOK_BOOL,
    TOK_COMPLEX,
    TOK_GENERIC,
    TOK_IMAGINARY,
    TOK_NORETURN,
    TOK_STATIC_ASSERT,
    TOK_THREAD_LOCAL,
    TOK_FUNC_NAME,

    TOK_INT_CONSTANT,
    TOK_FLOAT_CONSTANT,
    TOK_STRING_LITERAL,

    TOK_UNRECOGNIZED,
    TOK_UNTERMINATED_COMMENT,

    TOK_NUM
};

enum class StringEncoding {
    NONE,
    UTF8,
    UTF16,
    UTF32,
    WIDE,
};

struct Token {
    TokenKind kind = TOK_EOF;

    // Identifier name, unescaped string literal contents or, for other tokens, the source spelling.
    string text;

    unsigned long long int_value{};
    double float_value{};
    StringEncoding encoding = StringEncoding::NONE;

    Location location;
};

// Source spelling of punctuators and keywords; a descriptive name for other kinds.
string token_spelling(TokenKind kind);

// How a token is quoted in diagnostics, e.g. "';'" or "identifier 'x'".
string describe_token(const Token& token);

ostream& operator<<(ostream& stream, const Token& token);

#endif
