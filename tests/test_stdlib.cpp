#include "helpers.hpp"

#include <filesystem>
#include <fstream>
#include <rcl-typecheck/Stdlib.hpp>

using namespace rcl::typecheck;
using namespace rcl::typecheck::runtime;
using namespace rcl::typecheck::test;

static std::filesystem::path write_temp_file(std::string_view name, std::string_view contents)
{
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << contents;
    return path;
}

TEST_CASE("the std dict exposes the builtins") {
    ValuePtr std_dict = stdlib::initialize();
    REQUIRE(std_dict->kind == Value::Kind::Dict);
    ValuePtr read = std_dict->lookup(*Value::from_string("read_file_utf8"));
    REQUIRE(read != nullptr);
    REQUIRE(read->kind == Value::Kind::Builtin);
    CHECK(read->builtin->name == "std.read_file_utf8");
    CHECK(read->builtin == stdlib::read_file_utf8());
}

TEST_CASE("builtin signatures satisfy matching requirements statically") {
    TypePtr type = stdlib::read_file_utf8()->type();
    CHECK(type->to_string() == "(String) -> String");
    CHECK(ann("(String) -> String").diff(type).is_ok());
    CHECK(std::holds_alternative<diff::Function>(ann("(Int) -> String").diff(type)));
}

TEST_CASE("read_file_utf8 reads a file") {
    auto path = write_temp_file("rcl-typecheck-read.txt", "héllo\nworld\n");
    std::vector<ValuePtr> args = { Value::from_string(path.string()) };
    auto result = call_builtin(*stdlib::read_file_utf8(), AT, args);
    std::filesystem::remove(path);
    REQUIRE(result.has_value());
    CHECK((*result)->as_string() == "héllo\nworld\n");
}

TEST_CASE("read_file_utf8 rejects invalid UTF-8") {
    auto path = write_temp_file("rcl-typecheck-binary.bin", "bad \xff\xfe bytes");
    std::vector<ValuePtr> args = { Value::from_string(path.string()) };
    auto result = call_builtin(*stdlib::read_file_utf8(), AT, args);
    std::filesystem::remove(path);
    REQUIRE(not result);
    CHECK(result.error().message().find("not valid UTF-8") != std::string::npos);
    CHECK(result.error().help());
}

static bool reads_as_utf8(std::string_view bytes)
{
    auto path = write_temp_file("rcl-typecheck-utf8.bin", bytes);
    std::vector<ValuePtr> args = { Value::from_string(path.string()) };
    auto result = call_builtin(*stdlib::read_file_utf8(), AT, args);
    std::filesystem::remove(path);
    if (not result) {
        CHECK(result.error().message().find("not valid UTF-8") != std::string::npos);
    }
    return result.has_value();
}

TEST_CASE("read_file_utf8 accepts every well-formed sequence length") {
    CHECK(reads_as_utf8("plain ascii"));
    CHECK(reads_as_utf8("\xC2\x80"));
    CHECK(reads_as_utf8("\xE0\xA0\x80"));
    CHECK(reads_as_utf8("\xED\x9F\xBF"));
    CHECK(reads_as_utf8("\xF0\x9F\x98\x80"));
    CHECK(reads_as_utf8("\xF4\x8F\xBF\xBF"));
}

TEST_CASE("read_file_utf8 rejects overlong encodings") {
    CHECK(not reads_as_utf8("\xC0\x80"));
    CHECK(not reads_as_utf8("\xC1\xBF"));
    CHECK(not reads_as_utf8("\xE0\x80\x80"));
    CHECK(not reads_as_utf8("\xE0\x9F\xBF"));
    CHECK(not reads_as_utf8("\xF0\x80\x80\x80"));
}

TEST_CASE("read_file_utf8 rejects surrogates") {
    CHECK(not reads_as_utf8("\xED\xA0\x80"));
    CHECK(not reads_as_utf8("\xED\xBF\xBF"));
}

TEST_CASE("read_file_utf8 rejects code points above U+10FFFF") {
    CHECK(not reads_as_utf8("\xF4\x90\x80\x80"));
    CHECK(not reads_as_utf8("\xF5\x80\x80\x80"));
    CHECK(not reads_as_utf8("\xF7\xBF\xBF\xBF"));
    CHECK(not reads_as_utf8("\xFF"));
}

TEST_CASE("read_file_utf8 rejects truncated sequences") {
    CHECK(not reads_as_utf8("\xE2\x82"));
    CHECK(not reads_as_utf8("\xC3"));
}

TEST_CASE("read_file_utf8 reports missing files") {
    std::vector<ValuePtr> args = { Value::from_string("/nonexistent/rcl-typecheck/missing.txt") };
    auto result = call_builtin(*stdlib::read_file_utf8(), AT, args);
    REQUIRE(not result);
    CHECK(result.error().origin() == AT);
    CHECK(result.error().message() == "Failed to open file \"/nonexistent/rcl-typecheck/missing.txt\".");
}

TEST_CASE("builtin arguments are checked against the signature") {
    SUBCASE("wrong number of arguments") {
        std::vector<ValuePtr> args = { Value::from_string("a"), Value::from_string("b") };
        auto result = call_builtin(*stdlib::read_file_utf8(), AT, args);
        REQUIRE(not result);
        CHECK(result.error().message() == "std.read_file_utf8 takes 1 argument, but 2 were given.");
        REQUIRE(result.error().help());
        CHECK(*result.error().help() == "The signature is (String) -> String.");
    }
    SUBCASE("wrong argument type") {
        std::vector<ValuePtr> args = { Value::from_int(42) };
        auto result = call_builtin(*stdlib::read_file_utf8(), AT, args);
        REQUIRE(not result);
        CHECK(result.error().message() == "Type mismatch.");
        CHECK(result.error().path().empty());
        REQUIRE(result.error().notes().size() == 1);
        CHECK(result.error().notes()[0].at == AT);
        CHECK(result.error().notes()[0].message.to_string() == "In argument 1 of std.read_file_utf8, which must be String.");
        CHECK(result.error().to_string().find("in value at") == std::string::npos);
    }
}

TEST_CASE("paths inside an argument are relative to that argument") {
    Builtin sum {
        "test.sum",
        ReqType::make_function({ ReqType::make_string(), ReqType::make_list(ReqType::make_int()) }, ReqType::make_int()),
        [](Span, std::span<const ValuePtr>) -> Result<ValuePtr> { return Value::from_int(0); },
    };
    std::vector<ValuePtr> args = { Value::from_string("label"), val("[1, \"two\"]") };
    auto result = call_builtin(sum, AT, args);
    REQUIRE(not result);
    CHECK(result.error().format_path() == "[1]");
    REQUIRE(result.error().notes().size() == 1);
    CHECK(result.error().notes()[0].message.to_string() == "In argument 2 of test.sum, which must be List[Int].");
}

TEST_CASE("builtin results are checked against the signature") {
    Builtin liar {
        "test.liar",
        ReqType::make_function({}, ReqType::make_int()),
        [](Span, std::span<const ValuePtr>) -> Result<ValuePtr> { return Value::from_string("not an int"); },
    };
    auto result = call_builtin(liar, AT, {});
    REQUIRE(not result);
    CHECK(result.error().message() == "Type mismatch.");
    CHECK(result.error().path().empty());
}
