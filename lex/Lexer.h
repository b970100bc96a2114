#ifndef LEX_LEXER_H
#define LEX_LEXER_H

#include "Token.h"

// Converts source text into tokens. Lexical errors are reported through message() and the offending text is
// skipped, so callers should check TranslationUnitContext::highest_severity before parsing.
vector<Token> lex(const Input& input, string_view filename);

#endif
