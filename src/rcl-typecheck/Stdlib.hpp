#pragma once
#include <functional>
#include <memory>
#include <span>
#include <string>

#include "Error.hpp"
#include "TypeReq.hpp"
#include "Value.hpp"

namespace rcl::typecheck::runtime
{
    // A function implemented natively. Its signature is a requirement, so the
    // arguments and the result are checked like any other value.
    struct Builtin {
        using Impl = std::function<Result<ValuePtr>(Span at, std::span<const ValuePtr> args)>;

        std::string name;
        // Always of kind `Function`.
        ReqTypePtr signature;
        Impl impl;

        TypePtr type() const { return signature->to_type(); }
    };

    // Check the arguments against the signature, call, and check the result.
    Result<ValuePtr> call_builtin(const Builtin &builtin, Span at, std::span<const ValuePtr> args);

    namespace stdlib
    {
        // `std.read_file_utf8(path: String) -> String`
        std::shared_ptr<const Builtin> read_file_utf8();

        // The `std` dict, mapping names to builtins.
        ValuePtr initialize();
    }

}
