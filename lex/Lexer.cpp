#include "Lexer.h"

#include "generated/TokenLexer.yy.h"
#include "Message.h"
#include "Unescape.h"

static unsigned long long parse_integer_literal(string_view text, const Location& location) {
    while (text.size()) {
        char c = toupper(text.back());
        if (c != 'U' && c != 'L') break;
        text.remove_suffix(1);
    }

    int radix = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        radix = 16;
        text.remove_prefix(2);
    } else if (text.size() > 1 && text[0] == '0') {
        radix = 8;
        text.remove_prefix(1);
    }

    unsigned long long value{};
    auto result = from_chars(text.data(), text.data() + text.size(), value, radix);
    if (result.ec == errc::result_out_of_range) {
        message(Severity::ERROR, location) << "integer literal is too large\n";
        return 0;
    }

    return value;
}

static unsigned long long parse_char_literal(string_view text, const Location& location) {
    bool is_wide = false;
    if (text[0] != '\'') {
        is_wide = true;
        text.remove_prefix(1);
    }

    assert(text[0] == '\'');
    text.remove_prefix(1);

    uint32_t c = unescape_char(text, is_wide, location).code;
    if (text[0] != '\'') {
        message(Severity::ERROR, location) << "character literal may only have one character\n";
    }

    return c;
}

static double parse_float_literal(string_view text, const Location& location) {
    char c = toupper(text.back());
    if (c == 'F' || c == 'L') text.remove_suffix(1);

    auto format = chars_format::general;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        format = chars_format::hex;
        text.remove_prefix(2);
    }

    double value{};
    auto result = from_chars(text.data(), text.data() + text.size(), value, format);
    if (result.ec == errc::result_out_of_range) {
        message(Severity::ERROR, location) << "floating point literal is out of range\n";
    }

    return value;
}

static StringEncoding string_encoding(string_view& text) {
    if (text.substr(0, 2) == "u8") {
        text.remove_prefix(2);
        return StringEncoding::UTF8;
    }

    switch (text[0]) {
      case 'u':
        text.remove_prefix(1);
        return StringEncoding::UTF16;
      case 'U':
        text.remove_prefix(1);
        return StringEncoding::UTF32;
      case 'L':
        text.remove_prefix(1);
        return StringEncoding::WIDE;
      default:
        return StringEncoding::NONE;
    }
}

vector<Token> lex(const Input& input, string_view filename) {
    TokenLexer lexer(input);
    vector<Token> tokens;

    for (;;) {
        auto kind = TokenKind(lexer.next_token());
        if (kind == TOK_EOF) break;

        Location location { lexer.lineno(), lexer.columno() + 1, filename };
        auto spelling = lexer.str();

        switch (kind) {
          default: {
              break;
          } case TOK_UNRECOGNIZED: {
              message(Severity::ERROR, location) << "unexpected character '" << spelling << "'\n";
              continue;
          } case TOK_UNTERMINATED_COMMENT: {
              message(Severity::ERROR, location) << "unterminated comment\n";
              continue;
          } case TOK_STRING_LITERAL: {
              string_view text(spelling);
              auto encoding = string_encoding(text);
              auto chars = unescape_string(text, encoding != StringEncoding::NONE, location);

              // Adjacent string literals are concatenated; a prefixed literal determines the encoding of the whole.
              if (tokens.size() && tokens.back().kind == TOK_STRING_LITERAL) {
                  auto& previous = tokens.back();
                  if (previous.encoding != encoding && previous.encoding != StringEncoding::NONE && encoding != StringEncoding::NONE) {
                      message(Severity::ERROR, location) << "concatenation of string literals with different encodings\n";
                  }
                  if (previous.encoding == StringEncoding::NONE) previous.encoding = encoding;
                  previous.text += chars;
                  continue;
              }

              Token token;
              token.kind = kind;
              token.text = move(chars);
              token.encoding = encoding;
              token.location = location;
              tokens.push_back(move(token));
              continue;
          }
        }

        Token token;
        token.kind = kind;
        token.location = location;
        if (kind == TOK_INT_CONSTANT) {
            if (spelling.back() == '\'') {
                token.int_value = parse_char_literal(spelling, location);
            } else {
                token.int_value = parse_integer_literal(spelling, location);
            }
        } else if (kind == TOK_FLOAT_CONSTANT) {
            token.float_value = parse_float_literal(spelling, location);
        }
        token.text = move(spelling);
        tokens.push_back(move(token));
    }

    return tokens;
}
