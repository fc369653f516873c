#pragma once
#include <compare>
#include <memory>
#include <variant>
#include <vector>

#include "Error.hpp"
#include "Source.hpp"
#include "Type.hpp"
#include "Value.hpp"

namespace rcl::typecheck
{
    struct ReqType;
    struct TypeReq;
    struct TypeDiff;
    struct Typed;
    using ReqTypePtr = std::shared_ptr<const ReqType>;

    // The type parameter requirements for the `Dict` type.
    struct DictReq {
        ReqTypePtr key;
        ReqTypePtr value;

        bool operator==(const DictReq &other) const { return (*this <=> other) == 0; }
        std::strong_ordering operator<=>(const DictReq &other) const;
    };

    // A function type requirement.
    struct FunctionReq {
        std::vector<ReqTypePtr> args;
        ReqTypePtr result;

        bool operator==(const FunctionReq &other) const { return (*this <=> other) == 0; }
        std::strong_ordering operator<=>(const FunctionReq &other) const;
    };

    // The types that can occur in type requirements. Unlike `Type`, a requirement
    // is always fully known, it never contains `Dynamic`.
    struct ReqType {
        enum class Kind { Bool, Int, Null, String, List, Set, Dict, Function };
        Kind kind;
        // List and set element requirement
        ReqTypePtr element;
        std::shared_ptr<const DictReq> dict;
        std::shared_ptr<const FunctionReq> function;

        explicit ReqType(Kind k) : kind(k) { }
        static ReqTypePtr make_bool();
        static ReqTypePtr make_int();
        static ReqTypePtr make_null();
        static ReqTypePtr make_string();
        static ReqTypePtr make_list(ReqTypePtr element);
        static ReqTypePtr make_set(ReqTypePtr element);
        static ReqTypePtr make_dict(ReqTypePtr key, ReqTypePtr value);
        static ReqTypePtr make_function(std::vector<ReqTypePtr> args, ReqTypePtr result);

        // Returns null if the type is not fully known, i.e. it contains `Dynamic`.
        static ReqTypePtr from_type(const Type &type);

        // The most specific type that any value satisfying this requirement has.
        TypePtr to_type() const;
        bool is_atom() const;

        // Statically check `type` against this shape. `req` is the requirement that
        // this shape belongs to, it is what mismatches get reported against.
        TypeDiff check_type(const TypeReq &req, const TypePtr &type) const;

        // Dynamically check that the value fits this shape.
        Result<void> check_value(Span at, const runtime::Value &value) const;

        std::string to_string() const;

        bool operator==(const ReqType &other) const { return (*this <=> other) == 0; }
        std::strong_ordering operator<=>(const ReqType &other) const;
    };

    // Decides whether an actual function argument type is acceptable where
    // `required` is the argument type of the required function type.
    //
    // TODO: Arguments are contravariant, accept any actual argument type that is a
    // supertype of the required one. For now this demands equality.
    bool accepts_argument(const ReqType &required, const Type &actual);

    // Why a type is required.
    namespace req
    {
        // We have no requirement on the type, any value is allowed.
        struct None { };

        // The type was required due to a type annotation.
        struct Annotation {
            Span at;
            ReqTypePtr type;
        };

        // A boolean was required because it's used as a condition.
        struct Condition { };

        // The type was required due to an operator.
        struct Operator {
            Span at;
            ReqTypePtr type;
        };

        // An integer is required due to indexing into a list.
        struct IndexList { };
    }

    using TypeReqData = std::variant<req::None, req::Annotation, req::Condition, req::Operator, req::IndexList>;

    // A type requirement.
    //
    // A `Type` is what the typechecker inferred. A `TypeReq` is a requirement that
    // the typechecker needs to fulfill: a `ReqType` plus the reason why that type
    // is expected at a particular location, so errors can explain themselves.
    // Requirements are fulfilled by subtypes of the required type.
    struct TypeReq : public TypeReqData {
        using TypeReqData::variant;

        TypeReq() : TypeReqData(req::None {}) { }

        bool is_none() const { return std::holds_alternative<req::None>(*this); }

        // The required shape, or null for `None`.
        const ReqType *req_type() const;

        // The same requirement, for the same reason, but of a different shape.
        // Used to point into a compound requirement.
        TypeReq with_shape(ReqTypePtr shape) const;

        // The most precise type that describes any value that satisfies this
        // requirement. `Dynamic` for `None`.
        TypePtr to_type() const;

        // Compare against an inferred type without reporting anything.
        TypeDiff diff(const TypePtr &type) const;

        // Explain why the type error is caused.
        Error add_context(Error error) const;

        // Statically check that the given type is a subtype of the required type.
        Result<Typed> check_type(Span at, const TypePtr &type) const;

        // Dynamically check that the given value fits the required type.
        Result<void> check_value(Span at, const runtime::Value &value) const;

        bool operator==(const TypeReq &other) const { return (*this <=> other) == 0; }
        std::strong_ordering operator<=>(const TypeReq &other) const;
    };

    namespace typed
    {
        // The type is known statically, this is the most specific type we infer.
        struct Type {
            TypePtr type;
        };

        // We can't check this statically, a runtime check is needed. If it
        // passes, the value fits the type.
        struct Defer {
            TypePtr type;
        };
    }

    // The result of a static typecheck, after errors have been reported.
    struct Typed : public std::variant<typed::Type, typed::Defer> {
        using variant::variant;

        bool is_deferred() const { return std::holds_alternative<typed::Defer>(*this); }
        const TypePtr &type() const;
    };

    // "Expected this type: ... But found this type: ..."
    pprint::Doc report_type_mismatch(const Type &expected, const Type &actual);

}
