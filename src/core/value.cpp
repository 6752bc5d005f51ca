#include "value.hpp"
#include <sstream>
#include <stdexcept>

namespace sqlbridge::core {

std::string Value::to_string() const {
    switch (type()) {
        case Type::NUL: return "NULL";
        case Type::BOOLEAN: return as_bool() ? "true" : "false";
        case Type::INTEGER: return std::to_string(as_integer());
        case Type::REAL: {
            std::ostringstream oss;
            oss << as_real();
            return oss.str();
        }
        case Type::TEXT: return as_text();
        default: return {};
    }
}

const char* value_type_to_string(Value::Type type) {
    switch (type) {
        case Value::Type::NUL: return "null";
        case Value::Type::BOOLEAN: return "boolean";
        case Value::Type::INTEGER: return "integer";
        case Value::Type::REAL: return "real";
        case Value::Type::TEXT: return "text";
        default: return "unknown";
    }
}

Row::Row(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void Row::set(std::string column, Value value) {
    for (auto& entry : entries_) {
        if (entry.first == column) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(column), std::move(value));
}

const Value* Row::find(std::string_view column) const {
    for (const auto& entry : entries_) {
        if (entry.first == column) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Value& Row::at(std::string_view column) const {
    if (const Value* value = find(column)) {
        return *value;
    }
    throw std::out_of_range("No column '" + std::string(column) + "' in row");
}

std::vector<std::string> Row::columns() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace sqlbridge::core
