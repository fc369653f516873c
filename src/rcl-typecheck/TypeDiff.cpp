#include "TypeDiff.hpp"
#include "Format.hpp"

using namespace rcl::typecheck;
using namespace rcl::typecheck::pprint;

TypePtr TypeDiff::resolved_type() const
{
    if (auto ok = std::get_if<diff::Ok>(this)) return ok->type;
    if (auto defer = std::get_if<diff::Defer>(this)) return defer->type;
    return nullptr;
}

static Doc render_marked(const TypeDiff &type_diff, std::vector<const diff::Error *> &errors)
{
    return typematch(type_diff)(
        [](const diff::Ok &ok) -> Doc { return format_type(*ok.type); },
        [](const diff::Defer &defer) -> Doc { return format_type(*defer.type); },
        [&](const diff::Error &error) -> Doc {
            errors.push_back(&error);
            return std::format("E{}", errors.size());
        },
        [&](const diff::List &list) -> Doc { return "List[" + render_marked(*list.element, errors) + "]"; },
        [&](const diff::Set &set) -> Doc { return "Set[" + render_marked(*set.element, errors) + "]"; },
        [&](const diff::Dict &dict) -> Doc {
            Doc key = render_marked(*dict.key, errors);
            Doc value = render_marked(*dict.value, errors);
            return "Dict[" + std::move(key) + ", " + std::move(value) + "]";
        },
        [&](const diff::Function &fn) -> Doc {
            Doc doc = "(";
            for (size_t i = 0; i < fn.args.size(); ++i) {
                if (i > 0) doc += ", ";
                doc += render_marked(fn.args[i], errors);
            }
            return doc + ") -> " + render_marked(*fn.result, errors);
        }
    );
}

Doc rcl::typecheck::report_nested_mismatch(const TypeDiff &type_diff, std::vector<const diff::Error *> &errors)
{
    Doc marked = render_marked(type_diff, errors);
    Doc body = Doc::concat({
        "Found this type, with the mismatching parts marked:",
        Doc::hard_break(),
        Doc::hard_break(),
        Doc::indent(std::move(marked)),
    });
    for (size_t i = 0; i < errors.size(); ++i) {
        body += Doc::concat({
            Doc::hard_break(),
            Doc::hard_break(),
            std::format("E{}: expected this type:", i + 1),
            Doc::hard_break(),
            Doc::hard_break(),
            Doc::indent(format_type(*errors[i]->requirement.to_type())),
            Doc::hard_break(),
            Doc::hard_break(),
            "but found this type:",
            Doc::hard_break(),
            Doc::hard_break(),
            Doc::indent(format_type(*errors[i]->actual)),
        });
    }
    return body;
}
