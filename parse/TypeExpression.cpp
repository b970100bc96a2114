#include "TypeExpression.h"

bool BaseType::operator==(const BaseType& other) const {
    return kind == other.kind && length == other.length && name == other.name;
}

static const char* const base_kind_names[] = {
    "void",
    "_Bool",
    "char",
    "short",
    "int",
    "long",
    "float",
    "double",
    "signed",
    "unsigned",
    "_Complex",
    "_Imaginary",
    "*",
    "void*",
    "[]",
    "struct",
    "union",
    "()",
    "extern",
    "static",
    "_Thread_local",
    "auto",
    "register",
    "const",
    "restrict",
    "volatile",
    "_Atomic",
    "inline",
    "_Noreturn",
    "size_t",
    "...",
    "$",
    "none",
};

ostream& operator<<(ostream& stream, const BaseType& type) {
    switch (type.kind) {
      case BaseKind::ARRAY:
        if (type.length) return stream << '[' << type.length << ']';
        break;
      case BaseKind::IDENTIFIER:
        return stream << '$' << type.name;
      default:
        break;
    }

    return stream << base_kind_names[unsigned(type.kind)];
}

TypeExpression::TypeExpression(BaseKind kind) {
    BaseType value;
    value.kind = kind;
    values.push_back(value);
}

TypeExpression::TypeExpression(BaseType value) {
    values.push_back(move(value));
}

TypeExpression TypeExpression::identifier(string_view name) {
    BaseType value;
    value.kind = BaseKind::IDENTIFIER;
    value.name = name;
    return TypeExpression(move(value));
}

TypeExpression TypeExpression::hole() {
    return TypeExpression(BaseKind::NONE);
}

TypeExpression TypeExpression::pointer_to(TypeExpression pointee) {
    BaseType value;
    value.kind = BaseKind::POINTER;
    return wrap(value, move(pointee));
}

TypeExpression TypeExpression::wrap(BaseType value, TypeExpression wrapped) {
    TypeExpression result(move(value));
    result.children.push_back(move(wrapped));
    return result;
}

TypeExpression TypeExpression::composite(vector<TypeExpression> children) {
    TypeExpression result;
    result.children = move(children);
    return result;
}

TypeExpression TypeExpression::specifiers(const vector<const TypeExpression*>& elements) {
    if (elements.size() == 1) return *elements[0];

    TypeExpression result;
    for (auto element : elements) {
        if (element->values.size() == 1 && element->children.empty()) {
            if (!element->is_hole()) result.values.push_back(element->values[0]);
        } else {
            result.children.push_back(*element);
        }
    }

    // Every element was a placeholder, e.g. a lone alignment specifier.
    if (result.is_default()) return hole();

    return result;
}

bool TypeExpression::is(BaseKind kind) const {
    return values.size() == 1 && children.empty() && values[0].kind == kind;
}

bool TypeExpression::has(BaseKind kind) const {
    for (auto& value : values) {
        if (value.kind == kind) return true;
    }
    return false;
}

TypeExpression TypeExpression::fill_hole(const TypeExpression& replacement) const {
    if (is_hole()) return replacement;

    TypeExpression result(*this);
    if (result.children.size()) {
        result.children[0] = result.children[0].fill_hole(replacement);
    }
    return result;
}

bool TypeExpression::operator==(const TypeExpression& other) const {
    return values == other.values && children == other.children;
}

void TypeExpression::print(ostream& stream) const {
    if (values.size() == 1 && children.empty()) {
        stream << '"' << values[0] << '"';
        return;
    }

    stream << "[\"";
    auto separator = false;
    for (auto& value : values) {
        if (separator) stream << ' ';
        separator = true;
        stream << value;
    }
    stream << '"';

    for (auto& child : children) {
        stream << ", ";
        child.print(stream);
    }

    stream << ']';
}

string TypeExpression::message_text() const {
    stringstream stream;

    auto separator = false;
    for (auto& value : values) {
        if (separator) stream << ' ';
        separator = true;
        stream << value;
    }

    for (auto& child : children) {
        if (separator) stream << ' ';
        separator = true;

        if (child.values.size() == 1 && child.children.empty()) {
            stream << child.values[0];
        } else {
            stream << '(' << child.message_text() << ')';
        }
    }

    return stream.str();
}

ostream& operator<<(ostream& stream, const TypeExpression& type) {
    type.print(stream);
    return stream;
}
