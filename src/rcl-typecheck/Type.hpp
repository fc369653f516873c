#pragma once
#include <memory>
#include <string>
#include <vector>

namespace rcl::typecheck
{
    struct Type;
    using TypePtr = std::shared_ptr<const Type>;

    // A type inferred by the typechecker. Types are immutable once built, and
    // subtrees are shared between the types that contain them.
    struct Type {
        enum class Kind {
            Null,
            Bool,
            Int,
            String,

            List,
            Set,
            Dict,
            Function,

            // Not known statically, only at runtime.
            Dynamic
        };
        Kind kind;
        // List and set element type
        TypePtr element;
        // Dict type
        TypePtr key;
        TypePtr value;
        // Function type signature
        struct FunctionSignature {
            std::vector<TypePtr> args;
            TypePtr result;
        };
        std::shared_ptr<const FunctionSignature> function;

        explicit Type(Kind k) : kind(k) { }
        static TypePtr make_null();
        static TypePtr make_bool();
        static TypePtr make_int();
        static TypePtr make_string();
        static TypePtr make_dynamic();
        static TypePtr make_list(TypePtr element_type);
        static TypePtr make_set(TypePtr element_type);
        static TypePtr make_dict(TypePtr key_type, TypePtr value_type);
        static TypePtr make_function(std::vector<TypePtr> args, TypePtr result);

        bool equals(const Type &other) const;
        bool equals(const TypePtr &other) const { return other and equals(*other); }
        bool is_atom() const;
        bool contains_dynamic() const;
        std::string to_string() const;
    };

}
