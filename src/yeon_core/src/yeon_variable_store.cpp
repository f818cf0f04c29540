#include "yeon_variable_store.h"

namespace Yeon {

// --- MapVariableStore ---
bool MapVariableStore::get(const std::string& name, Value& out) const {
    auto it = values_.find(name);
    if (it == values_.end()) return false;
    out = it->second;
    return true;
}

void MapVariableStore::set(const std::string& name, const Value& value) {
    values_[name] = value;
}

bool MapVariableStore::has(const std::string& name) const {
    return values_.find(name) != values_.end();
}

bool MapVariableStore::remove(const std::string& name) {
    return values_.erase(name) > 0;
}

void MapVariableStore::clear() {
    values_.clear();
}

std::vector<std::string> MapVariableStore::names() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& pair : values_) {
        result.push_back(pair.first);
    }
    return result;
}

// --- ColumnarVariableStore ---
uint32_t ColumnarVariableStore::hashName(const std::string& name) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : name) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

bool ColumnarVariableStore::get(const std::string& name, Value& out) const {
    uint32_t hash = hashName(name);
    auto it = types_.find(hash);
    if (it == types_.end()) return false;

    switch (it->second) {
        case Value::FLOAT: {
            float f = 0.0f;
            if (!getFloat(hash, f)) return false;
            out = Value::Float(f);
            return true;
        }
        case Value::INT: {
            int32_t i = 0;
            if (!getInt(hash, i)) return false;
            out = Value::Int(i);
            return true;
        }
        case Value::BOOL: {
            bool b = false;
            if (!getBool(hash, b)) return false;
            out = Value::Bool(b);
            return true;
        }
        case Value::STRING: {
            std::string s;
            if (!getString(hash, s)) return false;
            out = Value::String(s);
            return true;
        }
        case Value::NONE:
            out = Value::None();
            return true;
    }
    return false;
}

void ColumnarVariableStore::set(const std::string& name, const Value& value) {
    uint32_t hash = hashName(name);

    // 타입이 바뀌면 이전 컬럼에서 제거 (키 공간은 하나)
    auto it = types_.find(hash);
    if (it != types_.end() && it->second != value.type) {
        eraseFromColumn(hash, it->second);
    }

    switch (value.type) {
        case Value::FLOAT:  floats_[hash] = value.f; break;
        case Value::INT:    ints_[hash] = value.i; break;
        case Value::BOOL:   bools_[hash] = value.b; break;
        case Value::STRING: strings_[hash] = value.s; break;
        case Value::NONE:   break;
    }
    types_[hash] = value.type;
    names_[hash] = name;
}

bool ColumnarVariableStore::has(const std::string& name) const {
    return types_.find(hashName(name)) != types_.end();
}

bool ColumnarVariableStore::remove(const std::string& name) {
    uint32_t hash = hashName(name);
    auto it = types_.find(hash);
    if (it == types_.end()) return false;
    eraseFromColumn(hash, it->second);
    types_.erase(it);
    names_.erase(hash);
    return true;
}

void ColumnarVariableStore::clear() {
    floats_.clear();
    ints_.clear();
    bools_.clear();
    strings_.clear();
    types_.clear();
    names_.clear();
}

std::vector<std::string> ColumnarVariableStore::names() const {
    std::vector<std::string> result;
    result.reserve(names_.size());
    for (const auto& pair : names_) {
        result.push_back(pair.second);
    }
    return result;
}

bool ColumnarVariableStore::getFloat(uint32_t hash, float& out) const {
    auto it = floats_.find(hash);
    if (it == floats_.end()) return false;
    out = it->second;
    return true;
}

bool ColumnarVariableStore::getInt(uint32_t hash, int32_t& out) const {
    auto it = ints_.find(hash);
    if (it == ints_.end()) return false;
    out = it->second;
    return true;
}

bool ColumnarVariableStore::getBool(uint32_t hash, bool& out) const {
    auto it = bools_.find(hash);
    if (it == bools_.end()) return false;
    out = it->second;
    return true;
}

bool ColumnarVariableStore::getString(uint32_t hash, std::string& out) const {
    auto it = strings_.find(hash);
    if (it == strings_.end()) return false;
    out = it->second;
    return true;
}

void ColumnarVariableStore::eraseFromColumn(uint32_t hash, Value::Type type) {
    switch (type) {
        case Value::FLOAT:  floats_.erase(hash); break;
        case Value::INT:    ints_.erase(hash); break;
        case Value::BOOL:   bools_.erase(hash); break;
        case Value::STRING: strings_.erase(hash); break;
        case Value::NONE:   break;
    }
}

} // namespace Yeon
