#include "Value.hpp"
#include "Format.hpp"
#include "Stdlib.hpp"

#include <algorithm>

using namespace rcl::typecheck;
using namespace rcl::typecheck::runtime;

static bool value_less(const ValuePtr &a, const ValuePtr &b) { return (*a <=> *b) < 0; }
static bool value_same(const ValuePtr &a, const ValuePtr &b) { return *a == *b; }

ValuePtr Value::null()
{
    static const ValuePtr s_null = std::make_shared<Value>(Kind::Null);
    return s_null;
}
ValuePtr Value::from_bool(bool b)
{
    auto v = std::make_shared<Value>(Kind::Bool);
    v->boolean = b;
    return v;
}
ValuePtr Value::from_int(int64_t i)
{
    auto v = std::make_shared<Value>(Kind::Int);
    v->integer = i;
    return v;
}
ValuePtr Value::from_string(std::string s)
{
    auto v = std::make_shared<Value>(Kind::String);
    v->string = std::move(s);
    return v;
}
ValuePtr Value::list(std::vector<ValuePtr> elements)
{
    auto v = std::make_shared<Value>(Kind::List);
    v->elements = std::move(elements);
    return v;
}
ValuePtr Value::set(std::vector<ValuePtr> elements)
{
    std::stable_sort(elements.begin(), elements.end(), value_less);
    elements.erase(std::unique(elements.begin(), elements.end(), value_same), elements.end());
    auto v = std::make_shared<Value>(Kind::Set);
    v->elements = std::move(elements);
    return v;
}
ValuePtr Value::dict(std::vector<Entry> entries)
{
    std::stable_sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b) { return value_less(a.first, b.first); });
    std::vector<Entry> unique;
    unique.reserve(entries.size());
    for (auto &entry : entries) {
        if (not unique.empty() and *unique.back().first == *entry.first) {
            unique.back().second = std::move(entry.second);
        } else {
            unique.push_back(std::move(entry));
        }
    }
    auto v = std::make_shared<Value>(Kind::Dict);
    v->entries = std::move(unique);
    return v;
}
ValuePtr Value::from_builtin(std::shared_ptr<const Builtin> builtin)
{
    auto v = std::make_shared<Value>(Kind::Builtin);
    v->builtin = std::move(builtin);
    return v;
}

ValuePtr Value::lookup(const Value &key) const
{
    if (kind != Kind::Dict) return nullptr;
    auto it = std::lower_bound(entries.begin(), entries.end(), key, [](const Entry &e, const Value &k) { return (*e.first <=> k) < 0; });
    if (it != entries.end() and *it->first == key) return it->second;
    return nullptr;
}

std::string Value::to_string() const { return format_value(*this).to_string(); }

static std::strong_ordering compare_elements(const std::vector<ValuePtr> &a, const std::vector<ValuePtr> &b)
{
    for (size_t i = 0; i < a.size() and i < b.size(); ++i) {
        if (auto c = *a[i] <=> *b[i]; c != 0) return c;
    }
    return a.size() <=> b.size();
}

std::strong_ordering Value::operator<=>(const Value &other) const
{
    if (kind != other.kind) return kind <=> other.kind;
    switch (kind) {
    case Kind::Null:
        return std::strong_ordering::equal;
    case Kind::Bool:
        return boolean <=> other.boolean;
    case Kind::Int:
        return integer <=> other.integer;
    case Kind::String:
        return string <=> other.string;
    case Kind::List:
    case Kind::Set:
        return compare_elements(elements, other.elements);
    case Kind::Dict:
        for (size_t i = 0; i < entries.size() and i < other.entries.size(); ++i) {
            if (auto c = *entries[i].first <=> *other.entries[i].first; c != 0) return c;
            if (auto c = *entries[i].second <=> *other.entries[i].second; c != 0) return c;
        }
        return entries.size() <=> other.entries.size();
    case Kind::Builtin:
        return builtin->name <=> other.builtin->name;
    }
    return std::strong_ordering::equal;
}
