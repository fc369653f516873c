#include "TypeReq.hpp"
#include "Format.hpp"
#include "TypeDiff.hpp"

using namespace rcl::typecheck;
using namespace rcl::typecheck::pprint;

const ReqType *TypeReq::req_type() const
{
    return typematch(*this)(
        [](const req::None &) -> const ReqType * { return nullptr; },
        [](const req::Annotation &a) -> const ReqType * { return a.type.get(); },
        [](const req::Condition &) -> const ReqType * { return ReqType::make_bool().get(); },
        [](const req::Operator &o) -> const ReqType * { return o.type.get(); },
        [](const req::IndexList &) -> const ReqType * { return ReqType::make_int().get(); }
    );
}

TypeReq TypeReq::with_shape(ReqTypePtr shape) const
{
    return typematch(*this)(
        [](const req::None &) -> TypeReq { return req::None {}; },
        [&](const req::Annotation &a) -> TypeReq { return req::Annotation { a.at, std::move(shape) }; },
        [&](const req::Operator &o) -> TypeReq { return req::Operator { o.at, std::move(shape) }; },
        [](const auto &) -> TypeReq { panic("Conditions and list indices have an atomic type, they have no inner requirements."); }
    );
}

TypePtr TypeReq::to_type() const
{
    const ReqType *t = req_type();
    return t ? t->to_type() : Type::make_dynamic();
}

TypeDiff TypeReq::diff(const TypePtr &type) const
{
    const ReqType *t = req_type();
    if (not t) return diff::Ok { type };
    return t->check_type(*this, type);
}

Error TypeReq::add_context(Error error) const
{
    return typematch(*this)(
        [](const req::None &) -> Error { panic("If no type was expected, it wouldn't cause an error."); },
        [&](const req::Annotation &a) -> Error { return std::move(error).with_note(a.at, "The expected type is specified here."); },
        [&](const req::Condition &) -> Error {
            return std::move(error).with_help("There is no implicit conversion, conditions must be boolean.");
        },
        [&](const req::Operator &o) -> Error {
            TypePtr t = o.type->to_type();
            if (not t->is_atom()) panic("We don't have operators with non-atomic types.");
            return std::move(error).with_note(o.at, "Expected " + format_type(*t) + " due to this operator.");
        },
        [&](const req::IndexList &) -> Error { return std::move(error).with_help("List indices must be integers."); }
    );
}

Result<Typed> TypeReq::check_type(Span at, const TypePtr &type) const
{
    if (is_none()) return Typed(typed::Type { type });

    TypeDiff type_diff = diff(type);
    return typematch(type_diff)(
        [](diff::Ok &ok) -> Result<Typed> { return Typed(typed::Type { ok.type }); },
        [](diff::Defer &defer) -> Result<Typed> { return Typed(typed::Defer { defer.type }); },
        [&](diff::Error &error) -> Result<Typed> {
            // A top-level type error, we can report with a simple message.
            auto err = at.error("Type mismatch.").with_body(report_type_mismatch(*error.requirement.to_type(), *error.actual));
            return add_context(std::move(err)).err();
        },
        [&](auto &) -> Result<Typed> {
            // The error is nested somewhere inside the type. Print the type with
            // the wrong parts replaced by markers, then explain each marker.
            std::vector<const diff::Error *> errors;
            Doc body = report_nested_mismatch(type_diff, errors);
            auto err = at.error("Type mismatch in type.").with_body(std::move(body));
            if (errors.empty()) return std::move(err).err();
            return errors.front()->requirement.add_context(std::move(err)).err();
        }
    );
}

Result<void> TypeReq::check_value(Span at, const runtime::Value &value) const
{
    const ReqType *t = req_type();
    if (not t) return {};
    return t->check_value(at, value);
}

std::strong_ordering TypeReq::operator<=>(const TypeReq &other) const
{
    if (index() != other.index()) return index() <=> other.index();
    auto compare_shape = [](const Span &a_at, const ReqTypePtr &a, const Span &b_at, const ReqTypePtr &b) {
        if (auto c = a_at <=> b_at; c != 0) return c;
        return *a <=> *b;
    };
    if (auto a = std::get_if<req::Annotation>(this)) {
        auto &b = std::get<req::Annotation>(other);
        return compare_shape(a->at, a->type, b.at, b.type);
    }
    if (auto o = std::get_if<req::Operator>(this)) {
        auto &b = std::get<req::Operator>(other);
        return compare_shape(o->at, o->type, b.at, b.type);
    }
    return std::strong_ordering::equal;
}

const TypePtr &Typed::type() const
{
    return typematch(*this)([](const typed::Type &t) -> const TypePtr & { return t.type; }, [](const typed::Defer &d) -> const TypePtr & { return d.type; });
}

Doc rcl::typecheck::report_type_mismatch(const Type &expected, const Type &actual)
{
    return Doc::concat({
        "Expected this type:",
        Doc::hard_break(),
        Doc::hard_break(),
        Doc::indent(format_type(expected)),
        Doc::hard_break(),
        Doc::hard_break(),
        "But found this type:",
        Doc::hard_break(),
        Doc::hard_break(),
        Doc::indent(format_type(actual)),
    });
}
