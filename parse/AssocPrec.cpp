#include "AssocPrec.h"

#include "lex/Token.h"

static vector<AssocPrec> build_assoc_prec_table() {
    vector<AssocPrec> table(TOK_NUM);

    auto set = [&](int token, OperatorAssoc assoc, OperatorPrec prec, unsigned op_flags) {
        table[token] = AssocPrec { assoc, prec, op_flags };
    };

    set(',',                LEFT_ASSOCIATIVE,   SEQUENCE_PRECEDENCE,        0);

    set('=',                RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_MUL_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_DIV_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_MOD_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_ADD_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_SUB_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_LEFT_ASSIGN,    RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_RIGHT_ASSIGN,   RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_AND_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_XOR_ASSIGN,     RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);
    set(TOK_OR_ASSIGN,      RIGHT_ASSOCIATIVE,  ASSIGN_PRECEDENCE,          OP_ASSIGN);

    set('?',                RIGHT_ASSOCIATIVE,  CONDITIONAL_PRECEDENCE,     0);

    set(TOK_OR_OP,          LEFT_ASSOCIATIVE,   LOGICAL_OR_PRECEDENCE,      OP_BOOL_RESULT);
    set(TOK_AND_OP,         LEFT_ASSOCIATIVE,   LOGICAL_AND_PRECEDENCE,     OP_BOOL_RESULT);
    set('|',                LEFT_ASSOCIATIVE,   OR_PRECEDENCE,              OP_INTEGER_OPERANDS | OP_COMMUTATIVE);
    set('^',                LEFT_ASSOCIATIVE,   EXCLUSIVE_OR_PRECEDENCE,    OP_INTEGER_OPERANDS | OP_COMMUTATIVE);
    set('&',                LEFT_ASSOCIATIVE,   AND_PRECEDENCE,             OP_INTEGER_OPERANDS | OP_COMMUTATIVE);

    set(TOK_EQ_OP,          LEFT_ASSOCIATIVE,   EQUALITY_PRECEDENCE,        OP_COMPARISON | OP_BOOL_RESULT | OP_COMMUTATIVE);
    set(TOK_NE_OP,          LEFT_ASSOCIATIVE,   EQUALITY_PRECEDENCE,        OP_COMPARISON | OP_BOOL_RESULT | OP_COMMUTATIVE);

    set('<',                LEFT_ASSOCIATIVE,   RELATIONAL_PRECEDENCE,      OP_COMPARISON | OP_BOOL_RESULT);
    set('>',                LEFT_ASSOCIATIVE,   RELATIONAL_PRECEDENCE,      OP_COMPARISON | OP_BOOL_RESULT);
    set(TOK_LE_OP,          LEFT_ASSOCIATIVE,   RELATIONAL_PRECEDENCE,      OP_COMPARISON | OP_BOOL_RESULT);
    set(TOK_GE_OP,          LEFT_ASSOCIATIVE,   RELATIONAL_PRECEDENCE,      OP_COMPARISON | OP_BOOL_RESULT);

    set(TOK_LEFT_OP,        LEFT_ASSOCIATIVE,   SHIFT_PRECEDENCE,           OP_INTEGER_OPERANDS | OP_AS_LEFT_RESULT);
    set(TOK_RIGHT_OP,       LEFT_ASSOCIATIVE,   SHIFT_PRECEDENCE,           OP_INTEGER_OPERANDS | OP_AS_LEFT_RESULT);

    set('+',                LEFT_ASSOCIATIVE,   ADDITIVE_PRECEDENCE,        OP_COMMUTATIVE);
    set('-',                LEFT_ASSOCIATIVE,   ADDITIVE_PRECEDENCE,        0);

    set('*',                LEFT_ASSOCIATIVE,   MULTIPLICATIVE_PRECEDENCE,  OP_COMMUTATIVE);
    set('/',                LEFT_ASSOCIATIVE,   MULTIPLICATIVE_PRECEDENCE,  0);
    set('%',                LEFT_ASSOCIATIVE,   MULTIPLICATIVE_PRECEDENCE,  OP_INTEGER_OPERANDS);

    return table;
}

const AssocPrec& assoc_prec(int token) {
    static const vector<AssocPrec> table = build_assoc_prec_table();
    static const AssocPrec none;

    if (token < 0 || token >= int(table.size())) return none;
    return table[token];
}

unsigned operator_flags(int token) {
    return assoc_prec(token).op_flags;
}
