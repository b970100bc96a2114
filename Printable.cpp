#include "Printable.h"

#include "nlohmann/json.hpp"

using json = nlohmann::json;

Printable::~Printable() {
}

ostream& operator<<(ostream& stream, const Printable* p) {
    if (p) {
        p->print(stream);
    } else {
        stream << "null";
    }

    return stream;
}

string json_quote(const string& text) {
    return json(text).dump(-1, ' ', false, json::error_handler_t::replace);
}
