#pragma once
#include <string>
#include <cstdint>

namespace Yeon {

// --- 변수 값 타입 (tagged union) ---
struct Value {
    enum Type { NONE, BOOL, INT, FLOAT, STRING };
    Type type = NONE;
    union {
        bool b;
        int32_t i = 0;
        float f;
    };
    std::string s;

    static Value None() { return Value(); }
    static Value Bool(bool v) { Value r; r.type = BOOL; r.b = v; return r; }
    static Value Int(int32_t v) { Value r; r.type = INT; r.i = v; return r; }
    static Value Float(float v) { Value r; r.type = FLOAT; r.f = v; return r; }
    static Value String(const std::string& v) { Value r; r.type = STRING; r.s = v; return r; }

    bool isNone() const { return type == NONE; }
};

// 타입과 페이로드가 모두 같을 때만 true
bool operator==(const Value& lhs, const Value& rhs);
inline bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

// --- 그래프에 선언되는 변수 타입 ---
enum class VariableType { String, Float, Int, Bool };

const char* variableTypeName(VariableType type);
bool parseVariableType(const std::string& text, VariableType& out);
Value::Type valueTypeFor(VariableType type);
Value defaultValueFor(VariableType type);

// --- 조건 연산자 ---
enum class ConditionOperator {
    Equals,
    NotEquals,
    GreaterThan,
    LessThan,
    GreaterOrEqual,
    LessOrEqual,
    Contains,
    IsTrue,
    IsFalse
};

const char* conditionOperatorName(ConditionOperator op);
bool parseConditionOperator(const std::string& text, ConditionOperator& out);

// --- 변환 (실패 시 false, out은 건드리지 않음) ---
bool toNumber(const Value& v, double& out);
bool toBool(const Value& v, bool& out);
bool coerceValue(const Value& v, Value::Type target, Value& out);

std::string valueToString(const Value& v);

// "true"/"false" → Bool, 정수 → Int, 실수 → Float, 그 외 → String
Value parseLiteral(const std::string& text);

// 저장된 값과 비교값으로 조건 평가. 변환 실패는 false.
bool evaluateValueCondition(const Value& stored, ConditionOperator op, const Value& compareValue);

} // namespace Yeon
