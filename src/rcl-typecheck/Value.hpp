#pragma once
#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rcl::typecheck::runtime
{
    struct Value;
    struct Builtin;
    using ValuePtr = std::shared_ptr<const Value>;

    // A runtime value, as produced by the evaluator.
    struct Value {
        enum class Kind { Null, Bool, Int, String, List, Set, Dict, Builtin };
        using Entry = std::pair<ValuePtr, ValuePtr>;

        Kind kind;
        bool boolean = false;
        int64_t integer = 0;
        std::string string;
        // List and set elements
        std::vector<ValuePtr> elements;
        // Dict entries, in key order
        std::vector<Entry> entries;
        std::shared_ptr<const Builtin> builtin;

        explicit Value(Kind k) : kind(k) { }

        static ValuePtr null();
        static ValuePtr from_bool(bool b);
        static ValuePtr from_int(int64_t i);
        static ValuePtr from_string(std::string s);
        static ValuePtr list(std::vector<ValuePtr> elements);
        // Sorts the elements and drops duplicates.
        static ValuePtr set(std::vector<ValuePtr> elements);
        // Sorts the entries by key; for duplicate keys the last one wins.
        static ValuePtr dict(std::vector<Entry> entries);
        static ValuePtr from_builtin(std::shared_ptr<const Builtin> builtin);

        bool is_null() const { return kind == Kind::Null; }
        bool is_bool() const { return kind == Kind::Bool; }
        bool is_int() const { return kind == Kind::Int; }
        bool is_string() const { return kind == Kind::String; }

        const std::string &as_string() const { return string; }
        ValuePtr lookup(const Value &key) const;

        std::string to_string() const;

        bool operator==(const Value &other) const { return (*this <=> other) == 0; }
        std::strong_ordering operator<=>(const Value &other) const;
    };

}
