#include "Format.hpp"
#include "Stdlib.hpp"

#include <format>

using namespace rcl::typecheck;
using namespace rcl::typecheck::pprint;
using namespace rcl::typecheck::runtime;

Doc rcl::typecheck::format_type(const Type &type)
{
    switch (type.kind) {
    case Type::Kind::Null: return "Null";
    case Type::Kind::Bool: return "Bool";
    case Type::Kind::Int: return "Int";
    case Type::Kind::String: return "String";
    case Type::Kind::Dynamic: return "Dynamic";
    case Type::Kind::List: return "List[" + format_type(*type.element) + "]";
    case Type::Kind::Set: return "Set[" + format_type(*type.element) + "]";
    case Type::Kind::Dict: return "Dict[" + format_type(*type.key) + ", " + format_type(*type.value) + "]";
    case Type::Kind::Function: {
        Doc doc = "(";
        auto &args = type.function->args;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) doc += ", ";
            doc += format_type(*args[i]);
        }
        return doc + ") -> " + format_type(*type.function->result);
    }
    }
    return "?";
}

std::string rcl::typecheck::quote_string(std::string_view s)
{
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += std::format("\\u{{{:x}}}", static_cast<unsigned>(c));
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

static Doc format_elements(const char *open, const std::vector<ValuePtr> &elements, const char *close)
{
    Doc doc = open;
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) doc += ", ";
        doc += format_value(*elements[i]);
    }
    doc += close;
    return doc;
}

Doc rcl::typecheck::format_value(const Value &value)
{
    switch (value.kind) {
    case Value::Kind::Null: return "null";
    case Value::Kind::Bool: return value.boolean ? "true" : "false";
    case Value::Kind::Int: return std::to_string(value.integer);
    case Value::Kind::String: return quote_string(value.string);
    case Value::Kind::List: return format_elements("[", value.elements, "]");
    case Value::Kind::Set:
        // `{}` is the empty dict, the empty set has no literal.
        if (value.elements.empty()) return "std.empty_set";
        return format_elements("{", value.elements, "}");
    case Value::Kind::Dict: {
        Doc doc = "{";
        for (size_t i = 0; i < value.entries.size(); ++i) {
            if (i > 0) doc += ", ";
            doc += format_value(*value.entries[i].first) + ": " + format_value(*value.entries[i].second);
        }
        doc += "}";
        return doc;
    }
    case Value::Kind::Builtin: return value.builtin->name;
    }
    return "?";
}
