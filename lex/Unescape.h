#ifndef LEX_UNESCAPE_H
#define LEX_UNESCAPE_H

struct Location;

struct CharValue {
    uint32_t code{};
    bool multi_byte{};
};

// Consumes one possibly escaped character from the front of source.
CharValue unescape_char(string_view& source, bool decode_multi_byte, const Location& location);

// Source includes the surrounding double quotes but no encoding prefix. Multi-byte characters are re-encoded as UTF-8.
string unescape_string(string_view source, bool decode_multi_byte, const Location& location);

#endif
