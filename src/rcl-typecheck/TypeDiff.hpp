#pragma once
#include <memory>
#include <variant>
#include <vector>

#include "TypeReq.hpp"

namespace rcl::typecheck
{
    namespace diff
    {
        // No error. The actual type matches the expected type.
        struct Ok {
            TypePtr type;
        };

        // The check could not be performed statically, a runtime check is needed.
        struct Defer {
            TypePtr type;
        };

        // A mismatch that cannot be broken down further. The requirement holds the
        // expected type and the reason for expecting it.
        struct Error {
            TypeReq requirement;
            TypePtr actual;
        };

        // The element type of a list mismatches.
        struct List {
            std::unique_ptr<TypeDiff> element;
        };

        // The element type of a set mismatches.
        struct Set {
            std::unique_ptr<TypeDiff> element;
        };

        // The key or value type of a dict mismatches. Both sides are kept, also
        // the one that is fine, to show where in the pair the error is.
        struct Dict {
            std::unique_ptr<TypeDiff> key;
            std::unique_ptr<TypeDiff> value;
        };

        // An argument or the result of a function type mismatches.
        struct Function {
            std::vector<TypeDiff> args;
            std::unique_ptr<TypeDiff> result;
        };
    }

    using TypeDiffData = std::variant<diff::Ok, diff::Defer, diff::Error, diff::List, diff::Set, diff::Dict, diff::Function>;

    // The result of a static typecheck: no error, a deferred check, a flat type
    // error, or an error nested somewhere inside a compound type.
    struct TypeDiff : public TypeDiffData {
        using TypeDiffData::variant;

        bool is_ok() const { return std::holds_alternative<diff::Ok>(*this); }
        bool is_defer() const { return std::holds_alternative<diff::Defer>(*this); }
        bool is_error() const { return std::holds_alternative<diff::Error>(*this); }
        bool is_nested() const { return not is_ok() and not is_defer() and not is_error(); }

        // The type this diff resolved to, for `Ok` and `Defer`. Null otherwise.
        TypePtr resolved_type() const;
    };

    // Render a diff that contains nested errors. The actual type is printed with
    // every mismatching part replaced by a marker `E1`, `E2`, ..., and each marker
    // is then explained. Returns the errors in marker order.
    pprint::Doc report_nested_mismatch(const TypeDiff &type_diff, std::vector<const diff::Error *> &errors);

}
