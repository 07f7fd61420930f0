#include "challenge/count_expression.hpp"
#include "common/utils.hpp"
#include <cctype>

CountExpression::CountExpression()
    : op_(Op::Greater)
    , value_(0) {
}

bool CountExpression::parse(const std::string& text, CountExpression& expression, std::string& error) {
    std::string input = utils::trim(text);

    // Two-character operators must be tried first so ">=" is not read as ">".
    static const std::pair<const char*, Op> operators[] = {
        {">=", Op::GreaterEqual},
        {"<=", Op::LessEqual},
        {"==", Op::Equal},
        {">", Op::Greater},
        {"<", Op::Less},
    };

    Op op = Op::Equal;
    std::string number = input;
    for (const auto& candidate : operators) {
        std::string symbol(candidate.first);
        if (input.compare(0, symbol.size(), symbol) == 0) {
            op = candidate.second;
            number = utils::trim(input.substr(symbol.size()));
            break;
        }
    }

    if (number.empty()) {
        error = "count expression '" + text + "' has no number";
        return false;
    }
    for (char c : number) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            error = "count expression '" + text + "' is not a non-negative integer comparison";
            return false;
        }
    }

    try {
        expression.value_ = std::stol(number);
    } catch (const std::exception&) {
        error = "count expression '" + text + "' is out of range";
        return false;
    }
    expression.op_ = op;
    return true;
}

bool CountExpression::matches(long count) const {
    switch (op_) {
        case Op::Greater:      return count > value_;
        case Op::GreaterEqual: return count >= value_;
        case Op::Equal:        return count == value_;
        case Op::Less:         return count < value_;
        case Op::LessEqual:    return count <= value_;
    }
    return false;
}

std::string CountExpression::toString() const {
    const char* symbol = "==";
    switch (op_) {
        case Op::Greater:      symbol = ">"; break;
        case Op::GreaterEqual: symbol = ">="; break;
        case Op::Equal:        symbol = "=="; break;
        case Op::Less:         symbol = "<"; break;
        case Op::LessEqual:    symbol = "<="; break;
    }
    return std::string(symbol) + std::to_string(value_);
}
