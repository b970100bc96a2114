#include "Sema.h"

#include "AssocPrec.h"

enum class TypeCategory {
    UNRESOLVED,
    VOID,
    INTEGER,
    FLOATING,
    POINTER,
    ARRAY,
    FUNCTION,
    STRUCTURED,
    OTHER,
};

enum class IntegerSignedness {
    SIGNED,
    UNSIGNED,
};

enum class IntegerSize {
    BOOL,
    CHAR,
    SHORT,
    INT,
    LONG,
    LONG_LONG,
};

enum class FloatingPointSize {
    FLOAT,
    DOUBLE,
    LONG_DOUBLE,
};

struct TypeClass {
    TypeCategory category = TypeCategory::OTHER;
    IntegerSignedness signedness = IntegerSignedness::SIGNED;
    IntegerSize size = IntegerSize::INT;
    FloatingPointSize float_size = FloatingPointSize::DOUBLE;

    // Pointee, array element or wrapped function type, when the type expression carries one.
    const TypeExpression* element{};
    unsigned long long length{};

    BaseKind aggregate = BaseKind::STRUCT;
    string tag;

    bool is_arithmetic() const { return category == TypeCategory::INTEGER || category == TypeCategory::FLOATING; }
    bool is_scalar() const { return is_arithmetic() || category == TypeCategory::POINTER; }
};

static bool is_transparent_tag(BaseKind kind) {
    switch (kind) {
      case BaseKind::EXTERN:
      case BaseKind::STATIC:
      case BaseKind::THREAD_LOCAL:
      case BaseKind::AUTO:
      case BaseKind::REGISTER:
      case BaseKind::CONST:
      case BaseKind::RESTRICT:
      case BaseKind::VOLATILE:
      case BaseKind::ATOMIC:
      case BaseKind::INLINE:
      case BaseKind::NORETURN:
      case BaseKind::NONE:
        return true;
      default:
        return false;
    }
}

static TypeClass classify_arithmetic(const vector<BaseKind>& tags) {
    TypeClass result;

    int longs = 0;
    bool is_bool{}, is_char{}, is_short{}, is_integer{}, is_float{}, is_double{};
    for (auto tag : tags) {
        switch (tag) {
          case BaseKind::BOOL:
            is_bool = true;
            break;
          case BaseKind::CHAR:
            is_char = true;
            break;
          case BaseKind::SHORT:
            is_short = true;
            break;
          case BaseKind::LONG:
            ++longs;
            break;
          case BaseKind::INT:
          case BaseKind::SIGNED:
            is_integer = true;
            break;
          case BaseKind::UNSIGNED:
            is_integer = true;
            result.signedness = IntegerSignedness::UNSIGNED;
            break;
          case BaseKind::FLOAT:
            is_float = true;
            break;
          case BaseKind::DOUBLE:
          case BaseKind::COMPLEX:
          case BaseKind::IMAGINARY:
            is_double = true;
            break;
          default:
            return TypeClass();
        }
    }

    if (is_float || is_double) {
        result.category = TypeCategory::FLOATING;
        if (is_double && longs) {
            result.float_size = FloatingPointSize::LONG_DOUBLE;
        } else if (is_float && !is_double) {
            result.float_size = FloatingPointSize::FLOAT;
        }
        return result;
    }

    if (!is_bool && !is_char && !is_short && !is_integer && !longs) return TypeClass();

    result.category = TypeCategory::INTEGER;
    if (is_bool) {
        result.size = IntegerSize::BOOL;
        result.signedness = IntegerSignedness::UNSIGNED;
    } else if (is_char) {
        result.size = IntegerSize::CHAR;
    } else if (is_short) {
        result.size = IntegerSize::SHORT;
    } else if (longs >= 2) {
        result.size = IntegerSize::LONG_LONG;
    } else if (longs == 1) {
        result.size = IntegerSize::LONG;
    }

    return result;
}

static TypeClass classify(const TypeExpression& type) {
    TypeClass result;

    vector<BaseKind> tags;
    for (auto& value : type.values) {
        if (!is_transparent_tag(value.kind)) tags.push_back(value.kind);
    }

    if (tags.empty()) {
        if (type.children.size() == 1) return classify(type.children[0]);
        if (type.values.size() && type.children.empty() && type.has(BaseKind::NONE)) {
            result.category = TypeCategory::VOID;
        }
        return result;
    }

    const TypeExpression* first_child = type.children.size() ? &type.children[0] : nullptr;

    for (size_t i = 0; i < tags.size(); ++i) {
        switch (tags[i]) {
          case BaseKind::POINTER:
            result.category = TypeCategory::POINTER;
            result.element = first_child;
            return result;
          case BaseKind::VOID_POINTER:
            result.category = TypeCategory::POINTER;
            return result;
          case BaseKind::ARRAY:
            result.category = TypeCategory::ARRAY;
            result.element = first_child;
            for (auto& value : type.values) {
                if (value.kind == BaseKind::ARRAY) result.length = value.length;
            }
            return result;
          case BaseKind::FUNCTION:
            result.category = TypeCategory::FUNCTION;
            result.element = first_child;
            return result;
          case BaseKind::IDENTIFIER:
            result.category = TypeCategory::UNRESOLVED;
            return result;
          case BaseKind::STRUCT:
          case BaseKind::UNION:
            result.category = TypeCategory::STRUCTURED;
            result.aggregate = tags[i];
            for (auto& child : type.children) {
                if (child.is(BaseKind::IDENTIFIER)) {
                    result.tag = child.values[0].name;
                    break;
                }
            }
            return result;
          case BaseKind::VOID:
            result.category = TypeCategory::VOID;
            return result;
          case BaseKind::SIZE_T:
            result.category = TypeCategory::INTEGER;
            result.size = IntegerSize::LONG;
            result.signedness = IntegerSignedness::UNSIGNED;
            return result;
          case BaseKind::VA_LIST:
            return result;
          default:
            break;
        }
    }

    return classify_arithmetic(tags);
}

// Arrays and functions used as operands become pointers.
static TypeClass decay(TypeClass type) {
    if (type.category == TypeCategory::ARRAY || type.category == TypeCategory::FUNCTION) {
        if (type.category == TypeCategory::FUNCTION) type.element = nullptr;
        type.category = TypeCategory::POINTER;
    }
    return type;
}

static TypeExpression to_type_expression(const TypeClass& type) {
    TypeExpression result;
    auto add = [&](BaseKind kind) {
        BaseType value;
        value.kind = kind;
        result.values.push_back(value);
    };

    if (type.category == TypeCategory::FLOATING) {
        switch (type.float_size) {
          case FloatingPointSize::FLOAT:
            add(BaseKind::FLOAT);
            break;
          case FloatingPointSize::DOUBLE:
            add(BaseKind::DOUBLE);
            break;
          case FloatingPointSize::LONG_DOUBLE:
            add(BaseKind::LONG);
            add(BaseKind::DOUBLE);
            break;
        }
        return result;
    }

    assert(type.category == TypeCategory::INTEGER);

    if (type.size == IntegerSize::BOOL) {
        add(BaseKind::BOOL);
        return result;
    }

    if (type.signedness == IntegerSignedness::UNSIGNED) add(BaseKind::UNSIGNED);

    switch (type.size) {
      case IntegerSize::CHAR:
        add(BaseKind::CHAR);
        break;
      case IntegerSize::SHORT:
        add(BaseKind::SHORT);
        break;
      case IntegerSize::LONG_LONG:
        add(BaseKind::LONG);
        add(BaseKind::LONG);
        break;
      case IntegerSize::LONG:
        add(BaseKind::LONG);
        break;
      default:
        add(BaseKind::INT);
        break;
    }

    return result;
}

static TypeClass promote_integer(TypeClass type) {
    // Integer types smaller than int are promoted when an operation is performed on them.
    if (type.category == TypeCategory::INTEGER && type.size < IntegerSize::INT) {
        type.size = IntegerSize::INT;
        type.signedness = IntegerSignedness::SIGNED;
    }
    return type;
}

// This is applied to the operands of arithmetic binary expressions.
static TypeClass usual_arithmetic_conversions(TypeClass left, TypeClass right) {
    left = promote_integer(left);
    right = promote_integer(right);

    if (left.category == TypeCategory::FLOATING) {
        if (right.category == TypeCategory::FLOATING) {
            left.float_size = max(left.float_size, right.float_size);
        }
        return left;
    }
    if (right.category == TypeCategory::FLOATING) return right;

    // If both operands are of the same integer type (signed or unsigned), the operand with the type of lesser integer conversion rank is converted to the type of the operand with greater rank.
    if (left.signedness == right.signedness) {
        left.size = max(left.size, right.size);
        return left;
    }

    // If the operand that has unsigned integer type has rank greater than or equal to the rank of the type of the other operand, the operand with signed integer type is converted to the type of the operand with unsigned integer type.
    auto unsigned_int = left.signedness == IntegerSignedness::UNSIGNED ? left : right;
    auto signed_int = left.signedness == IntegerSignedness::SIGNED ? left : right;
    if (unsigned_int.size >= signed_int.size) {
        return unsigned_int;
    }

    // If the type of the operand with signed integer type can represent all of the values of the type of the operand with unsigned integer type, the operand with unsigned integer type is converted to the type of the operand with signed integer type.
    if (signed_int.size > unsigned_int.size) {
        return signed_int;
    }

    // Otherwise, both operands are converted to the unsigned integer type corresponding to the type of the operand with signed integer type.
    signed_int.signedness = IntegerSignedness::UNSIGNED;
    return signed_int;
}

bool cast_is_legal(const TypeExpression& target, const TypeExpression& source) {
    auto to = classify(target);
    auto from = decay(classify(source));

    if (to.category == TypeCategory::VOID) return true;
    if (to.category == TypeCategory::UNRESOLVED || from.category == TypeCategory::UNRESOLVED) return true;

    if (!to.is_scalar() || !from.is_scalar()) return false;

    if (to.category == TypeCategory::POINTER && from.category == TypeCategory::FLOATING) return false;
    if (to.category == TypeCategory::FLOATING && from.category == TypeCategory::POINTER) return false;

    return true;
}

CombineResult combine_types(const TypeExpression& left, const TypeExpression& right, TokenKind op) {
    auto left_class = decay(classify(left));
    auto right_class = decay(classify(right));
    auto op_flags = operator_flags(op);

    CombineResult result;

    if (left_class.category == TypeCategory::UNRESOLVED || right_class.category == TypeCategory::UNRESOLVED) {
        auto& other = left_class.category == TypeCategory::UNRESOLVED ? right_class : left_class;
        if (other.category != TypeCategory::UNRESOLVED && !other.is_scalar()) return result;

        result.accepted = true;
        if (op_flags & OP_BOOL_RESULT) {
            result.type = TypeExpression(BaseKind::INT);
        } else {
            result.type = left_class.category == TypeCategory::UNRESOLVED && right_class.category != TypeCategory::UNRESOLVED ? right : left;
        }
        return result;
    }

    if (!left_class.is_scalar() || !right_class.is_scalar()) return result;

    auto left_pointer = left_class.category == TypeCategory::POINTER;
    auto right_pointer = right_class.category == TypeCategory::POINTER;

    if (op_flags & OP_BOOL_RESULT) {
        if ((left_pointer && right_class.category == TypeCategory::FLOATING) ||
            (right_pointer && left_class.category == TypeCategory::FLOATING)) {
            return result;
        }
        result.accepted = true;
        result.type = TypeExpression(BaseKind::INT);
        return result;
    }

    if (left_pointer || right_pointer) {
        if (op == '+') {
            if (left_pointer && right_class.category == TypeCategory::INTEGER) {
                result = { true, left };
            } else if (right_pointer && left_class.category == TypeCategory::INTEGER) {
                result = { true, right };
            }
        } else if (op == '-') {
            if (left_pointer && right_class.category == TypeCategory::INTEGER) {
                result = { true, left };
            } else if (left_pointer && right_pointer) {
                result = { true, TypeExpression(BaseKind::LONG) };
            }
        }
        return result;
    }

    if (op_flags & OP_INTEGER_OPERANDS) {
        if (left_class.category != TypeCategory::INTEGER || right_class.category != TypeCategory::INTEGER) return result;
    }

    result.accepted = true;
    if (op_flags & OP_AS_LEFT_RESULT) {
        result.type = to_type_expression(promote_integer(left_class));
    } else {
        result.type = to_type_expression(usual_arithmetic_conversions(left_class, right_class));
    }
    return result;
}

optional<TypeExpression> resolve_implicit_conversion(const TypeExpression& left, const TypeExpression& right) {
    auto left_class = classify(left);
    auto right_undecayed = classify(right);
    auto right_class = decay(right_undecayed);

    if (left_class.category == TypeCategory::UNRESOLVED) {
        if (right_class.category == TypeCategory::VOID) return nullopt;
        return right;
    }
    if (right_class.category == TypeCategory::UNRESOLVED) return left;

    switch (left_class.category) {
      case TypeCategory::INTEGER:
        if (right_class.is_scalar()) return left;
        break;
      case TypeCategory::FLOATING:
        if (right_class.is_arithmetic()) return left;
        break;
      case TypeCategory::POINTER:
        if (right_class.category == TypeCategory::POINTER || right_class.category == TypeCategory::INTEGER) return left;
        break;
      case TypeCategory::ARRAY:
        // Initialization of a character array from a string literal.
        if (right_undecayed.category == TypeCategory::ARRAY) return left;
        break;
      case TypeCategory::STRUCTURED:
        if (types_equal(left, right)) return left;
        break;
      default:
        break;
    }

    return nullopt;
}

bool types_equal(const TypeExpression& a, const TypeExpression& b) {
    auto left = classify(a);
    auto right = classify(b);

    if (left.category == TypeCategory::UNRESOLVED || right.category == TypeCategory::UNRESOLVED) return true;
    if (left.category != right.category) return false;

    switch (left.category) {
      case TypeCategory::INTEGER:
        return left.size == right.size && left.signedness == right.signedness;
      case TypeCategory::FLOATING:
        return left.float_size == right.float_size;
      case TypeCategory::ARRAY:
        if (left.length && right.length && left.length != right.length) return false;
        // fallthrough
      case TypeCategory::POINTER:
      case TypeCategory::FUNCTION:
        if (left.element && right.element) return types_equal(*left.element, *right.element);
        return true;
      case TypeCategory::STRUCTURED:
        if (left.aggregate != right.aggregate) return false;
        if (left.tag.empty() || right.tag.empty()) return a == b;
        return left.tag == right.tag;
      case TypeCategory::VOID:
        return true;
      default:
        return a == b;
    }
}

bool types_equal_any(const TypeExpression& type, const vector<BaseKind>& candidates) {
    for (auto candidate : candidates) {
        if (types_equal(type, TypeExpression(candidate))) return true;
    }
    return false;
}

static const vector<BaseKind> integer_value_kinds = {
    BaseKind::INT, BaseKind::BOOL, BaseKind::LONG, BaseKind::SIGNED, BaseKind::UNSIGNED, BaseKind::CHAR,
};

bool is_integer_value_type(const TypeExpression& type) {
    return types_equal_any(type, integer_value_kinds);
}

optional<TypeExpression> element_type(const TypeExpression& type) {
    auto type_class = classify(type);
    if ((type_class.category == TypeCategory::ARRAY || type_class.category == TypeCategory::POINTER) && type_class.element) {
        return *type_class.element;
    }
    return nullopt;
}

optional<TypeExpression> call_result_type(const TypeExpression& type) {
    auto type_class = classify(type);
    if (type_class.category == TypeCategory::POINTER && type_class.element) {
        type_class = classify(*type_class.element);
    }
    if (type_class.category == TypeCategory::FUNCTION && type_class.element) {
        return *type_class.element;
    }
    return nullopt;
}
