#pragma once
#include "Doc.hpp"
#include "Type.hpp"
#include "Value.hpp"

namespace rcl::typecheck
{
    // Render a type in RCL type syntax, e.g. `Dict[String, List[Int]]`.
    pprint::Doc format_type(const Type &type);

    // Render a value in RCL syntax, e.g. `{"a": [1, 2]}`.
    pprint::Doc format_value(const runtime::Value &value);

    std::string quote_string(std::string_view s);

}
