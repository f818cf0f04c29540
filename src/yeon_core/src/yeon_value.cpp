#include "yeon_value.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace Yeon {

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.type != rhs.type) return false;
    switch (lhs.type) {
        case Value::NONE:   return true;
        case Value::BOOL:   return lhs.b == rhs.b;
        case Value::INT:    return lhs.i == rhs.i;
        case Value::FLOAT:  return lhs.f == rhs.f;
        case Value::STRING: return lhs.s == rhs.s;
    }
    return false;
}

// --- VariableType ---
const char* variableTypeName(VariableType type) {
    switch (type) {
        case VariableType::String: return "String";
        case VariableType::Float:  return "Float";
        case VariableType::Int:    return "Int";
        case VariableType::Bool:   return "Bool";
    }
    return "String";
}

bool parseVariableType(const std::string& text, VariableType& out) {
    if (text == "String") { out = VariableType::String; return true; }
    if (text == "Float")  { out = VariableType::Float;  return true; }
    if (text == "Int")    { out = VariableType::Int;    return true; }
    if (text == "Bool")   { out = VariableType::Bool;   return true; }
    return false;
}

Value::Type valueTypeFor(VariableType type) {
    switch (type) {
        case VariableType::String: return Value::STRING;
        case VariableType::Float:  return Value::FLOAT;
        case VariableType::Int:    return Value::INT;
        case VariableType::Bool:   return Value::BOOL;
    }
    return Value::STRING;
}

Value defaultValueFor(VariableType type) {
    switch (type) {
        case VariableType::String: return Value::String("");
        case VariableType::Float:  return Value::Float(0.0f);
        case VariableType::Int:    return Value::Int(0);
        case VariableType::Bool:   return Value::Bool(false);
    }
    return Value::String("");
}

// --- ConditionOperator ---
static const char* const OPERATOR_NAMES[] = {
    "Equals", "NotEquals", "GreaterThan", "LessThan",
    "GreaterOrEqual", "LessOrEqual", "Contains", "IsTrue", "IsFalse"
};

const char* conditionOperatorName(ConditionOperator op) {
    size_t i = static_cast<size_t>(op);
    return i < sizeof(OPERATOR_NAMES) / sizeof(OPERATOR_NAMES[0]) ? OPERATOR_NAMES[i] : "";
}

bool parseConditionOperator(const std::string& text, ConditionOperator& out) {
    for (int i = 0; i < 9; ++i) {
        if (text == OPERATOR_NAMES[i]) {
            out = static_cast<ConditionOperator>(i);
            return true;
        }
    }
    return false;
}

// --- 문자열 헬퍼 ---
static std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) ++start;
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(start, end - start);
}

static bool equalsIgnoreCase(const std::string& a, const char* b) {
    size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return i == a.size() && b[i] == '\0';
}

static bool parseBoolText(const std::string& text, bool& out) {
    std::string t = trim(text);
    if (equalsIgnoreCase(t, "true"))  { out = true;  return true; }
    if (equalsIgnoreCase(t, "false")) { out = false; return true; }
    return false;
}

static bool parseIntText(const std::string& text, int32_t& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    out = static_cast<int32_t>(v);
    return true;
}

static bool parseDoubleText(const std::string& text, double& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(t.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

// --- 변환 ---
bool toNumber(const Value& v, double& out) {
    switch (v.type) {
        case Value::BOOL:   out = v.b ? 1.0 : 0.0; return true;
        case Value::INT:    out = static_cast<double>(v.i); return true;
        case Value::FLOAT:  out = static_cast<double>(v.f); return true;
        case Value::STRING: return parseDoubleText(v.s, out);
        case Value::NONE:   return false;
    }
    return false;
}

bool toBool(const Value& v, bool& out) {
    switch (v.type) {
        case Value::BOOL:   out = v.b; return true;
        case Value::INT:    out = v.i != 0; return true;
        case Value::FLOAT:  out = v.f != 0.0f; return true;
        case Value::STRING: return parseBoolText(v.s, out);
        case Value::NONE:   return false;
    }
    return false;
}

bool coerceValue(const Value& v, Value::Type target, Value& out) {
    if (target == Value::NONE) {
        out = v;
        return true;
    }
    if (v.type == Value::NONE) return false;
    if (v.type == target) {
        out = v;
        return true;
    }

    switch (target) {
        case Value::STRING:
            out = Value::String(valueToString(v));
            return true;
        case Value::BOOL: {
            bool b = false;
            if (!toBool(v, b)) return false;
            out = Value::Bool(b);
            return true;
        }
        case Value::INT: {
            if (v.type == Value::BOOL) {
                out = Value::Int(v.b ? 1 : 0);
                return true;
            }
            if (v.type == Value::FLOAT) {
                // 가장 가까운 짝수로 반올림
                double r = std::nearbyint(static_cast<double>(v.f));
                if (!std::isfinite(r) ||
                    r < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
                    r > static_cast<double>(std::numeric_limits<int32_t>::max())) {
                    return false;
                }
                out = Value::Int(static_cast<int32_t>(r));
                return true;
            }
            int32_t i = 0;
            if (!parseIntText(v.s, i)) return false;
            out = Value::Int(i);
            return true;
        }
        case Value::FLOAT: {
            double d = 0.0;
            if (!toNumber(v, d)) return false;
            out = Value::Float(static_cast<float>(d));
            return true;
        }
        case Value::NONE:
            break;
    }
    return false;
}

std::string valueToString(const Value& v) {
    switch (v.type) {
        case Value::BOOL:   return v.b ? "true" : "false";
        case Value::INT:    return std::to_string(v.i);
        case Value::FLOAT: {
            // 다시 읽었을 때 같은 값이 되는 가장 짧은 표현
            std::string text;
            for (int precision = 6; precision <= std::numeric_limits<float>::max_digits10; ++precision) {
                std::ostringstream oss;
                oss << std::setprecision(precision) << v.f;
                text = oss.str();
                if (std::strtof(text.c_str(), nullptr) == v.f) break;
            }
            return text;
        }
        case Value::STRING: return v.s;
        case Value::NONE:   return "";
    }
    return "";
}

Value parseLiteral(const std::string& text) {
    bool b = false;
    if (parseBoolText(text, b)) return Value::Bool(b);
    int32_t i = 0;
    if (parseIntText(text, i)) return Value::Int(i);
    double d = 0.0;
    if (parseDoubleText(text, d)) return Value::Float(static_cast<float>(d));
    return Value::String(text);
}

// --- 조건 평가 ---
static const double FLOAT_EPSILON = 0.0001;

// 비교값을 저장된 값의 타입 기준으로 맞춰 비교. 변환 불가면 false 반환.
static bool compareEquality(const Value& stored, const Value& compareValue, bool& equal) {
    if (compareValue.type == Value::NONE) return false;

    switch (stored.type) {
        case Value::STRING:
            equal = stored.s == valueToString(compareValue);
            return true;
        case Value::BOOL: {
            bool c = false;
            if (!toBool(compareValue, c)) return false;
            equal = stored.b == c;
            return true;
        }
        case Value::INT:
        case Value::FLOAT: {
            double a = 0.0;
            double c = 0.0;
            toNumber(stored, a);
            if (!toNumber(compareValue, c)) return false;
            if (stored.type == Value::FLOAT || compareValue.type == Value::FLOAT) {
                equal = std::fabs(a - c) < FLOAT_EPSILON;
            } else {
                equal = a == c;
            }
            return true;
        }
        case Value::NONE:
            break;
    }
    return false;
}

bool evaluateValueCondition(const Value& stored, ConditionOperator op, const Value& compareValue) {
    if (stored.type == Value::NONE) return false;

    switch (op) {
        case ConditionOperator::Equals:
        case ConditionOperator::NotEquals: {
            bool equal = false;
            if (!compareEquality(stored, compareValue, equal)) return false;
            return (op == ConditionOperator::Equals) ? equal : !equal;
        }
        case ConditionOperator::GreaterThan:
        case ConditionOperator::LessThan:
        case ConditionOperator::GreaterOrEqual:
        case ConditionOperator::LessOrEqual: {
            double a = 0.0;
            double c = 0.0;
            if (!toNumber(stored, a) || !toNumber(compareValue, c)) return false;
            switch (op) {
                case ConditionOperator::GreaterThan:    return a > c;
                case ConditionOperator::LessThan:       return a < c;
                case ConditionOperator::GreaterOrEqual: return a >= c;
                default:                                return a <= c;
            }
        }
        case ConditionOperator::Contains:
            if (compareValue.type == Value::NONE) return false;
            return valueToString(stored).find(valueToString(compareValue)) != std::string::npos;
        case ConditionOperator::IsTrue:
        case ConditionOperator::IsFalse: {
            bool b = false;
            if (!toBool(stored, b)) return false;
            return (op == ConditionOperator::IsTrue) ? b : !b;
        }
    }
    return false;
}

} // namespace Yeon
