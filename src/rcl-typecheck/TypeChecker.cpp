#include "TypeChecker.hpp"

using namespace rcl::typecheck;

Checked TypeChecker::check(const TypeReq &requirement, Span at, const TypePtr &type)
{
    Result<Typed> result = requirement.check_type(at, type);
    if (not result) {
        errors.add_error(std::move(result.error()));
        return Checked { Type::make_dynamic(), std::nullopt };
    }
    if (result->is_deferred()) {
        deferred++;
        return Checked { result->type(), RuntimeCheck { requirement, at, result->type() } };
    }
    return Checked { result->type(), std::nullopt };
}

bool TypeChecker::verify(const RuntimeCheck &check, const runtime::Value &value)
{
    if (auto checked = check.verify(value); not checked) {
        errors.add_error(std::move(checked.error()));
        return false;
    }
    return true;
}
