#ifndef PARSE_ASSOC_PREC_H
#define PARSE_ASSOC_PREC_H

enum OperatorFlags {
    OP_ASSIGN             = 0x01,
    OP_COMPARISON         = 0x02,
    OP_BOOL_RESULT        = 0x04,
    OP_AS_LEFT_RESULT     = 0x08,
    OP_INTEGER_OPERANDS   = 0x10,
    OP_COMMUTATIVE        = 0x100,
};

enum OperatorAssoc {
    LEFT_ASSOCIATIVE,
    RIGHT_ASSOCIATIVE,
};

enum OperatorPrec {
    END_PRECEDENCE = 1,
    SEQUENCE_PRECEDENCE,
    ASSIGN_PRECEDENCE,
    CONDITIONAL_PRECEDENCE,
    LOGICAL_OR_PRECEDENCE,
    LOGICAL_AND_PRECEDENCE,
    OR_PRECEDENCE,
    EXCLUSIVE_OR_PRECEDENCE,
    AND_PRECEDENCE,
    EQUALITY_PRECEDENCE,
    RELATIONAL_PRECEDENCE,
    SHIFT_PRECEDENCE,
    ADDITIVE_PRECEDENCE,
    MULTIPLICATIVE_PRECEDENCE,
};

struct AssocPrec {
    OperatorAssoc assoc = LEFT_ASSOCIATIVE;
    OperatorPrec prec = END_PRECEDENCE;
    unsigned op_flags{};
};

// Binary, assignment, conditional and comma operators; END_PRECEDENCE for every other token.
const AssocPrec& assoc_prec(int token);

unsigned operator_flags(int token);

#endif
