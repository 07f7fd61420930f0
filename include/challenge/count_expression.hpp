#pragma once

#include <string>

// Threshold such as ">0", ">=2", "==1", "<3", "<=5" or a bare "4" (equality).
class CountExpression {
public:
    enum class Op {
        Greater,
        GreaterEqual,
        Equal,
        Less,
        LessEqual
    };

    CountExpression();

    static bool parse(const std::string& text, CountExpression& expression, std::string& error);

    bool matches(long count) const;
    std::string toString() const;

private:
    Op op_;
    long value_;
};
