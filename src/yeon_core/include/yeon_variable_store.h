#pragma once
#include "yeon_value.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace Yeon {

enum class StoreKind { Map, Columnar };

// --- 변수 저장소 인터페이스 ---
class VariableStore {
public:
    virtual ~VariableStore() = default;

    virtual bool get(const std::string& name, Value& out) const = 0;
    virtual void set(const std::string& name, const Value& value) = 0;
    virtual bool has(const std::string& name) const = 0;
    virtual bool remove(const std::string& name) = 0;
    virtual void clear() = 0;
    virtual std::vector<std::string> names() const = 0;
    virtual size_t size() const = 0;
};

// 이름 → Value 연관 컨테이너
class MapVariableStore : public VariableStore {
public:
    bool get(const std::string& name, Value& out) const override;
    void set(const std::string& name, const Value& value) override;
    bool has(const std::string& name) const override;
    bool remove(const std::string& name) override;
    void clear() override;
    std::vector<std::string> names() const override;
    size_t size() const override { return values_.size(); }

private:
    std::unordered_map<std::string, Value> values_;
};

// 타입별 컬럼, 이름의 FNV-1a 해시로 접근.
// 서로 다른 이름이 같은 해시를 가지면 같은 슬롯을 공유한다.
class ColumnarVariableStore : public VariableStore {
public:
    static uint32_t hashName(const std::string& name);

    bool get(const std::string& name, Value& out) const override;
    void set(const std::string& name, const Value& value) override;
    bool has(const std::string& name) const override;
    bool remove(const std::string& name) override;
    void clear() override;
    std::vector<std::string> names() const override;
    size_t size() const override { return types_.size(); }

    // 해시 직접 접근 (이름 해시를 미리 계산해 둔 호출자용)
    bool getFloat(uint32_t hash, float& out) const;
    bool getInt(uint32_t hash, int32_t& out) const;
    bool getBool(uint32_t hash, bool& out) const;
    bool getString(uint32_t hash, std::string& out) const;

private:
    void eraseFromColumn(uint32_t hash, Value::Type type);

    std::unordered_map<uint32_t, float> floats_;
    std::unordered_map<uint32_t, int32_t> ints_;
    std::unordered_map<uint32_t, bool> bools_;
    std::unordered_map<uint32_t, std::string> strings_;

    std::unordered_map<uint32_t, Value::Type> types_;  // 슬롯이 현재 속한 컬럼 (NONE은 값 없음)
    std::unordered_map<uint32_t, std::string> names_;  // 스냅샷용 이름 테이블
};

} // namespace Yeon
