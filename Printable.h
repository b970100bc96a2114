#ifndef PRINTABLE_H
#define PRINTABLE_H

// Implemented by parse tree nodes, which print themselves as JSON.
struct Printable {
    virtual void print(ostream& stream) const = 0;
    virtual ~Printable();
};

ostream& operator<<(ostream& stream, const Printable* p);

// JSON string literal; bytes that are not valid UTF-8 are replaced.
string json_quote(const string& text);

#endif
