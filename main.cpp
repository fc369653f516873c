#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string_view>
#include <vector>

#include <rcl-typecheck/Format.hpp>
#include <rcl-typecheck/Parser.hpp>
#include <rcl-typecheck/TypeChecker.hpp>

using namespace rcl::typecheck;

template <typename TClock = std::chrono::steady_clock>
struct Stopwatch {
    TClock::time_point start = TClock::now();

    auto elapsed() const -> decltype(auto) { return TClock::now() - start; }

    TClock::time_point reset() { return start = TClock::now(); }
};

constexpr int EXIT_TYPE_ERROR = 1;
constexpr int EXIT_USAGE = 2;

static void print_usage(const char *argv0)
{
    std::cerr << std::format("Usage: {} [--time] [--reason annotation|condition|operator|index] <requirement> <inferred-type> [value]\n", argv0);
    std::cerr << "\n";
    std::cerr << "Checks an inferred type against a required type. When the check can only\n";
    std::cerr << "be decided at runtime and a value is given, the value is checked too.\n";
    std::cerr << "\n";
    std::cerr << std::format("Example: {} 'List[Int]' 'List[Dynamic]' '[1, 2, \"three\"]'\n", argv0);
}

// Builds the requirement for the given reason. Spans point into the requirement argument,
// which is document 0; the inferred type is document 1 and the value document 2.
static std::expected<TypeReq, std::string> make_requirement(std::string_view reason, std::string_view source)
{
    auto annotation = read_annotation(source, 0);
    if (not annotation or reason == "annotation") return annotation;

    const ReqType *shape = annotation->req_type();
    if (reason == "condition") {
        if (not shape or shape->kind != ReqType::Kind::Bool) return std::unexpected<std::string>("Conditions require `Bool`.");
        return TypeReq(req::Condition {});
    }
    if (reason == "index") {
        if (not shape or shape->kind != ReqType::Kind::Int) return std::unexpected<std::string>("List indices require `Int`.");
        return TypeReq(req::IndexList {});
    }
    if (reason == "operator") {
        if (not shape or not shape->is_atom()) return std::unexpected<std::string>("Operators require an atomic type.");
        auto &a = std::get<req::Annotation>(*annotation);
        return TypeReq(req::Operator { a.at, a.type });
    }
    return std::unexpected<std::string>(std::format("Unknown reason `{}`.", reason));
}

int main(int argc, char *argv[])
{
    bool time = false;
    std::string_view reason = "annotation";
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help" or arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (arg == "--time") {
            time = true;
        } else if (arg == "--reason") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return EXIT_USAGE;
            }
            reason = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 2 or positional.size() > 3) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    auto requirement = make_requirement(reason, positional[0]);
    if (not requirement) {
        std::cerr << std::format("Invalid requirement: {}\n", requirement.error());
        return EXIT_USAGE;
    }
    auto inferred = read_type(positional[1]);
    if (not inferred) {
        std::cerr << std::format("Invalid inferred type: {}\n", inferred.error());
        return EXIT_USAGE;
    }
    runtime::ValuePtr value;
    if (positional.size() == 3) {
        auto parsed = read_value(positional[2]);
        if (not parsed) {
            std::cerr << std::format("Invalid value: {}\n", parsed.error());
            return EXIT_USAGE;
        }
        value = *parsed;
    }

    constexpr auto to_us = [](std::chrono::steady_clock::duration d) constexpr { return std::chrono::duration_cast<std::chrono::microseconds>(d); };

    TypeChecker checker;
    Span expr_span(1, 0, static_cast<uint32_t>(positional[1].size()));
    Stopwatch stopwatch;
    Checked checked = checker.check(*requirement, expr_span, *inferred);
    if (time) std::cout << std::format("Static check took {}\n", to_us(stopwatch.elapsed()));

    if (not checker.get_error_reporter().empty()) {
        std::cerr << checker.get_error_reporter().format_errors();
        return EXIT_TYPE_ERROR;
    }
    if (not checked.runtime_check) {
        std::cout << std::format("Resolved statically: {}\n", checked.type->to_string());
        if (value) std::cout << "The value is not checked, the static check was conclusive.\n";
        return EXIT_SUCCESS;
    }

    std::cout << std::format("Deferred to runtime: {}\n", checked.type->to_string());
    if (not value) {
        std::cout << "Pass a value to run the runtime check.\n";
        return EXIT_SUCCESS;
    }

    RuntimeCheck runtime_check = *checked.runtime_check;
    runtime_check.at = Span(2, 0, static_cast<uint32_t>(positional[2].size()));
    stopwatch.reset();
    bool passed = checker.verify(runtime_check, *value);
    if (time) std::cout << std::format("Runtime check took {}\n", to_us(stopwatch.elapsed()));

    if (not passed) {
        std::cerr << checker.get_error_reporter().format_errors();
        return EXIT_TYPE_ERROR;
    }
    std::cout << std::format("Runtime check passed: {}\n", format_value(*value).to_string());
    return EXIT_SUCCESS;
}
