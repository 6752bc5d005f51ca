#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sqlbridge::core {

// A scalar cell or statement parameter: null, boolean, integer, double or text
class Value {
public:
    enum class Type { NUL, BOOLEAN, INTEGER, REAL, TEXT };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}
    Value(int v) : data_(static_cast<std::int64_t>(v)) {}
    Value(long v) : data_(static_cast<std::int64_t>(v)) {}
    Value(long long v) : data_(static_cast<std::int64_t>(v)) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(std::string_view v) : data_(std::string(v)) {}

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::NUL; }
    bool is_bool() const noexcept { return type() == Type::BOOLEAN; }
    bool is_integer() const noexcept { return type() == Type::INTEGER; }
    bool is_real() const noexcept { return type() == Type::REAL; }
    bool is_text() const noexcept { return type() == Type::TEXT; }

    // Throw std::bad_variant_access on a type mismatch
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    double as_real() const { return std::get<double>(data_); }
    const std::string& as_text() const { return std::get<std::string>(data_); }

    // Display form; NULL renders as "NULL"
    std::string to_string() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string> data_;
};

const char* value_type_to_string(Value::Type type);

// Ordered column-name -> value mapping; the canonical row shape for every driver
class Row {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Entry> entries);

    // Replaces the value when the column already exists, keeping its position
    void set(std::string column, Value value);

    const Value* find(std::string_view column) const;
    bool contains(std::string_view column) const { return find(column) != nullptr; }

    // Throws std::out_of_range for an unknown column
    const Value& at(std::string_view column) const;
    const Value& at(std::size_t index) const { return entries_.at(index).second; }

    std::vector<std::string> columns() const;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const Row& other) const { return entries_ == other.entries_; }
    bool operator!=(const Row& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

} // namespace sqlbridge::core
