#include "Token.h"

#include "nlohmann/json.hpp"

#include "Printable.h"

using json = nlohmann::json;

string token_spelling(TokenKind kind) {
    if (kind >= 32 && kind < 128) return string(1, char(kind));

    switch (kind) {
      case TOK_EOF:                 return "end of file";
      case TOK_IDENTIFIER:          return "identifier";

      case TOK_PTR_OP:              return "->";
      case TOK_INC_OP:              return "++";
      case TOK_DEC_OP:              return "--";
      case TOK_LEFT_OP:             return "<<";
      case TOK_RIGHT_OP:            return ">>";
      case TOK_LE_OP:               return "<=";
      case TOK_GE_OP:               return ">=";
      case TOK_EQ_OP:               return "==";
      case TOK_NE_OP:               return "!=";
      case TOK_AND_OP:              return "&&";
      case TOK_OR_OP:               return "||";
      case TOK_MUL_ASSIGN:          return "*=";
      case TOK_DIV_ASSIGN:          return "/=";
      case TOK_MOD_ASSIGN:          return "%=";
      case TOK_ADD_ASSIGN:          return "+=";
      case TOK_SUB_ASSIGN:          return "-=";
      case TOK_LEFT_ASSIGN:         return "<<=";
      case TOK_RIGHT_ASSIGN:        return ">>=";
      case TOK_AND_ASSIGN:          return "&=";
      case TOK_XOR_ASSIGN:          return "^=";
      case TOK_OR_ASSIGN:           return "|=";
      case TOK_ELLIPSIS:            return "...";

      case TOK_AUTO:                return "auto";
      case TOK_BREAK:               return "break";
      case TOK_CASE:                return "case";
      case TOK_CHAR:                return "char";
      case TOK_CONST:               return "const";
      case TOK_CONTINUE:            return "continue";
      case TOK_DEFAULT:             return "default";
      case TOK_DO:                  return "do";
      case TOK_DOUBLE:              return "double";
      case TOK_ELSE:                return "else";
      case TOK_ENUM:                return "enum";
      case TOK_EXTERN:              return "extern";
      case TOK_FLOAT:               return "float";
      case TOK_FOR:                 return "for";
      case TOK_GOTO:                return "goto";
      case TOK_IF:                  return "if";
      case TOK_INLINE:              return "inline";
      case TOK_INT:                 return "int";
      case TOK_LONG:                return "long";
      case TOK_REGISTER:            return "register";
      case TOK_RESTRICT:            return "restrict";
      case TOK_RETURN:              return "return";
      case TOK_SHORT:               return "short";
      case TOK_SIGNED:              return "signed";
      case TOK_SIZEOF:              return "sizeof";
      case TOK_STATIC:              return "static";
      case TOK_STRUCT:              return "struct";
      case TOK_SWITCH:              return "switch";
      case TOK_TYPEDEF:             return "typedef";
      case TOK_UNION:               return "union";
      case TOK_UNSIGNED:            return "unsigned";
      case TOK_VOID:                return "void";
      case TOK_VOLATILE:            return "volatile";
      case TOK_WHILE:               return "while";
      case TOK_ALIGNAS:             return "_Alignas";
      case TOK_ALIGNOF:             return "_Alignof";
      case TOK_ATOMIC:              return "_Atomic";
      case TOK_BOOL:                return "_Bool";
      case TOK_COMPLEX:             return "_Complex";
      case TOK_GENERIC:             return "_Generic";
      case TOK_IMAGINARY:           return "_Imaginary";
      case TOK_NORETURN:            return "_Noreturn";
      case TOK_STATIC_ASSERT:       return "_Static_assert";
      case TOK_THREAD_LOCAL:        return "_Thread_local";
      case TOK_FUNC_NAME:           return "__func__";

      case TOK_INT_CONSTANT:        return "int_constant";
      case TOK_FLOAT_CONSTANT:      return "float_constant";
      case TOK_STRING_LITERAL:      return "string_literal";

      default:                      return "unrecognized";
    }
}

string describe_token(const Token& token) {
    if (token.kind == TOK_EOF) return "end of file";

    switch (token.kind) {
      case TOK_IDENTIFIER:
      case TOK_INT_CONSTANT:
      case TOK_FLOAT_CONSTANT:
        return '\'' + token.text + '\'';
      case TOK_STRING_LITERAL:
        return "string literal";
      default:
        return '\'' + token_spelling(token.kind) + '\'';
    }
}

static const char* encoding_prefix(StringEncoding encoding) {
    switch (encoding) {
      case StringEncoding::UTF8:    return "u8";
      case StringEncoding::UTF16:   return "u";
      case StringEncoding::UTF32:   return "U";
      case StringEncoding::WIDE:    return "L";
      default:                      return "";
    }
}

ostream& operator<<(ostream& stream, const Token& token) {
    switch (token.kind) {
      case TOK_IDENTIFIER:
        return stream << "[\"identifier\", " << json_quote(token.text) << ']';
      case TOK_INT_CONSTANT:
        return stream << "[\"int_constant\", " << json(token.int_value) << ']';
      case TOK_FLOAT_CONSTANT:
        return stream << "[\"float_constant\", " << json(token.float_value) << ']';
      case TOK_STRING_LITERAL:
        stream << "[\"string_literal\", " << json_quote(token.text);
        if (token.encoding != StringEncoding::NONE) stream << ", \"" << encoding_prefix(token.encoding) << '"';
        return stream << ']';
      default:
        return stream << json(token_spelling(token.kind));
    }
}
