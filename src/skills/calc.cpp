#include "skills/calc.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace voxgate::skills {

namespace {

class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    double parse() {
        double value = parse_sum();
        skip_spaces();
        if (pos_ != text_.size()) {
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& why) const {
        throw core::InvalidRequest("invalid expression: " + why);
    }

    void skip_spaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(const char* token) {
        skip_spaces();
        size_t len = std::char_traits<char>::length(token);
        if (text_.compare(pos_, len, token) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    bool peek(const char* token) {
        skip_spaces();
        size_t len = std::char_traits<char>::length(token);
        return text_.compare(pos_, len, token) == 0;
    }

    double parse_sum() {
        double value = parse_product();
        while (true) {
            if (consume("+")) value += parse_product();
            else if (consume("-")) value -= parse_product();
            else return value;
        }
    }

    double parse_product() {
        double value = parse_unary();
        while (true) {
            if (peek("**")) return value;
            if (consume("//")) {
                double rhs = parse_unary();
                if (rhs == 0.0) fail("division by zero");
                value = std::floor(value / rhs);
            } else if (consume("*")) {
                value *= parse_unary();
            } else if (consume("/")) {
                double rhs = parse_unary();
                if (rhs == 0.0) fail("division by zero");
                value /= rhs;
            } else if (consume("%")) {
                double rhs = parse_unary();
                if (rhs == 0.0) fail("division by zero");
                // Result takes the sign of the divisor.
                value = value - rhs * std::floor(value / rhs);
            } else {
                return value;
            }
        }
    }

    double parse_unary() {
        if (consume("-")) return -parse_unary();
        if (consume("+")) return parse_unary();
        return parse_power();
    }

    double parse_power() {
        double base = parse_primary();
        if (consume("**") || consume("^")) {
            double exponent = parse_unary();
            double value = std::pow(base, exponent);
            if (std::isnan(value) || std::isinf(value)) fail("result out of range");
            return value;
        }
        return base;
    }

    double parse_primary() {
        if (consume("(")) {
            double value = parse_sum();
            if (!consume(")")) fail("missing ')'");
            return value;
        }

        skip_spaces();
        size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
            ++pos_;
        }
        if (start == pos_) {
            fail(pos_ < text_.size() ? "unexpected '" + std::string(1, text_[pos_]) + "'"
                                     : "unexpected end of input");
        }

        std::string number = text_.substr(start, pos_ - start);
        char* end = nullptr;
        double value = std::strtod(number.c_str(), &end);
        if (end == number.c_str() || *end != '\0') {
            fail("bad number '" + number + "'");
        }
        return value;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace

double evaluate_expression(const std::string& expression) {
    return ExpressionParser(expression).parse();
}

bool is_arithmetic_text(const std::string& text) {
    static const std::string allowed = "0123456789+-*/().%^";
    bool any_char = false;
    bool has_operator = false;
    for (char c : text) {
        if (c == ' ') continue;
        if (allowed.find(c) == std::string::npos) return false;
        any_char = true;
        if (c == '+' || c == '-' || c == '*' || c == '/') has_operator = true;
    }
    return any_char && has_operator;
}

} // namespace voxgate::skills
