#pragma once
#include <string>

namespace voxgate::skills {

// Arithmetic over + - * / // % ** ^ with parentheses and unary signs.
// ** and ^ are both exponentiation and bind tighter than unary minus.
// Throws core::InvalidRequest on syntax errors or division by zero.
double evaluate_expression(const std::string& expression);

// Characters accepted by the calc skill's routing predicate.
bool is_arithmetic_text(const std::string& text);

} // namespace voxgate::skills
