#include "helpers.hpp"

#include <rcl-typecheck/Stdlib.hpp>

using namespace rcl::typecheck;
using namespace rcl::typecheck::runtime;
using namespace rcl::typecheck::test;

static Error check_fails(const TypeReq &req, std::string_view value)
{
    auto checked = req.check_value(AT, *val(value));
    INFO(value);
    REQUIRE(not checked);
    return checked.error();
}

static size_t index_of(const PathElement &element)
{
    auto *i = std::get_if<PathElement::Index>(&element.element);
    REQUIRE(i != nullptr);
    return i->index;
}

static const Value &key_of(const PathElement &element)
{
    auto *k = std::get_if<PathElement::Key>(&element.element);
    REQUIRE(k != nullptr);
    return *k->key;
}

TEST_CASE("values that fit pass") {
    CHECK(ann("Null").check_value(AT, *val("null")));
    CHECK(ann("Bool").check_value(AT, *val("false")));
    CHECK(ann("Int").check_value(AT, *val("-3")));
    CHECK(ann("String").check_value(AT, *val("\"\"")));
    CHECK(ann("List[Int]").check_value(AT, *val("[]")));
    CHECK(ann("List[Int]").check_value(AT, *val("[1, 2, 3]")));
    CHECK(ann("Set[String]").check_value(AT, *val("{\"a\", \"b\"}")));
    CHECK(ann("Set[String]").check_value(AT, *val("std.empty_set")));
    CHECK(ann("Dict[String, List[Bool]]").check_value(AT, *val("{\"a\": [true], \"b\": []}")));
    CHECK(ann("Dict[Int, Int]").check_value(AT, *val("{}")));
}

TEST_CASE("without a requirement every value passes") {
    CHECK(TypeReq().check_value(AT, *val("[1, \"mixed\", null]")));
}

TEST_CASE("atoms that do not fit") {
    Error err = check_fails(ann("Int"), "\"1\"");
    CHECK(err.origin() == AT);
    CHECK(err.message() == "Type mismatch.");
    CHECK(err.path().empty());
    REQUIRE(err.body());
    CHECK(err.body()->to_string() == "Expected a value that fits this type:\n\n  Int\n\nBut got this value:\n\n  \"1\"");

    check_fails(TypeReq(req::Condition {}), "1");
    check_fails(TypeReq(req::IndexList {}), "true");
    check_fails(ann("List[Int]"), "{1}");
    check_fails(ann("Dict[String, Int]"), "[]");
    check_fails(ann("Null"), "false");
}

TEST_CASE("list errors are located by index") {
    Error err = check_fails(ann("List[Int]"), "[1, 2, \"x\"]");
    REQUIRE(err.path().size() == 1);
    CHECK(index_of(err.path()[0]) == 2);
    CHECK(err.format_path() == "[2]");
    CHECK(err.body()->to_string().find("  \"x\"") != std::string::npos);
}

TEST_CASE("set errors are located by position in the set") {
    // Sets are ordered by kind first, so the string comes after the integers.
    Error err = check_fails(ann("Set[Int]"), "{\"a\", 1, 2}");
    REQUIRE(err.path().size() == 1);
    CHECK(index_of(err.path()[0]) == 2);
}

TEST_CASE("dict errors are located by key") {
    Error err = check_fails(ann("Dict[String, Int]"), "{\"a\": true}");
    REQUIRE(err.path().size() == 1);
    CHECK(key_of(err.path()[0]) == *Value::from_string("a"));
    CHECK(err.format_path() == "[\"a\"]");
}

TEST_CASE("dict key errors are located by the key itself") {
    Error err = check_fails(ann("Dict[String, Int]"), "{\"a\": 1, 2: 3}");
    REQUIRE(err.path().size() == 1);
    CHECK(key_of(err.path()[0]) == *Value::from_int(2));
    CHECK(err.body()->to_string().find("But got this value:\n\n  2") != std::string::npos);
}

TEST_CASE("paths through nested collections") {
    Error err = check_fails(ann("List[Dict[String, List[Int]]]"), "[{\"a\": []}, {\"b\": [1, null]}]");
    // Innermost first.
    REQUIRE(err.path().size() == 3);
    CHECK(index_of(err.path()[0]) == 1);
    CHECK(key_of(err.path()[1]) == *Value::from_string("b"));
    CHECK(index_of(err.path()[2]) == 1);
    CHECK(err.format_path() == "[1][\"b\"][1]");
    CHECK(err.to_string().find("in value at [1][\"b\"][1]") != std::string::npos);
}

TEST_CASE("the first failing element is reported") {
    Error err = check_fails(ann("List[Int]"), "[true, \"x\"]");
    REQUIRE(err.path().size() == 1);
    CHECK(index_of(err.path()[0]) == 0);
}

TEST_CASE("function values cannot be checked at runtime") {
    TypeReq req = ann("(String) -> String");
    auto checked = req.check_value(AT, *Value::from_builtin(stdlib::read_file_utf8()));
    REQUIRE(not checked);
    CHECK(checked.error().message() == "Type mismatch.");
    REQUIRE(checked.error().help());
    CHECK(*checked.error().help() == "Function values cannot be checked against a function type at runtime.");

    Error err = check_fails(req, "42");
    CHECK(not err.help());
}

TEST_CASE("function values do not fit other types") {
    auto builtin = Value::from_builtin(stdlib::read_file_utf8());
    auto checked = ann("String").check_value(AT, *builtin);
    REQUIRE(not checked);
    CHECK(checked.error().body()->to_string().find("std.read_file_utf8") != std::string::npos);
}
