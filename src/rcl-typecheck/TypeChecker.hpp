#pragma once
#include <optional>

#include "ErrorReporter.hpp"
#include "TypeReq.hpp"

namespace rcl::typecheck
{
    // A check that could not be decided statically. It is attached to the
    // expression and runs once the evaluator has produced the value.
    struct RuntimeCheck {
        TypeReq requirement;
        Span at;
        // The type the value has once the check passes.
        TypePtr type;

        Result<void> verify(const runtime::Value &value) const { return requirement.check_value(at, value); }
    };

    struct Checked {
        TypePtr type;
        std::optional<RuntimeCheck> runtime_check;
    };

    // Front end for call sites: runs static checks, records the failures, and hands
    // out runtime checks for the ones that had to be deferred.
    class TypeChecker {
    public:
        TypeChecker() = default;

        // On a mismatch the failure is recorded and the result is `Dynamic`, so
        // checking can continue.
        Checked check(const TypeReq &requirement, Span at, const TypePtr &type);

        // Returns whether the value passed. Failures are recorded.
        bool verify(const RuntimeCheck &check, const runtime::Value &value);

        const ErrorReporter &get_error_reporter() const { return errors; }
        size_t deferred_count() const { return deferred; }

    private:
        ErrorReporter errors;
        size_t deferred = 0;
    };

}
