#pragma once
#include <doctest/doctest.h>
#include <rcl-typecheck/Parser.hpp>
#include <rcl-typecheck/TypeDiff.hpp>
#include <rcl-typecheck/TypeReq.hpp>

namespace rcl::typecheck::test
{
    inline TypePtr ty(std::string_view src)
    {
        auto t = read_type(src);
        INFO(src);
        REQUIRE(t.has_value());
        return *t;
    }

    inline runtime::ValuePtr val(std::string_view src)
    {
        auto v = read_value(src);
        INFO(src);
        REQUIRE(v.has_value());
        return *v;
    }

    // An annotation requirement, spanning the whole source.
    inline TypeReq ann(std::string_view src)
    {
        auto r = read_annotation(src);
        INFO(src);
        REQUIRE(r.has_value());
        return *r;
    }

    inline ReqTypePtr shape(std::string_view src)
    {
        auto r = ReqType::from_type(*ty(src));
        REQUIRE(r != nullptr);
        return r;
    }

    inline const Span AT = Span(7, 100, 110);

}
