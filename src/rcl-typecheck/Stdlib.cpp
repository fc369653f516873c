#include "Stdlib.hpp"
#include "Format.hpp"

#include <fstream>
#include <sstream>

using namespace rcl::typecheck;
using namespace rcl::typecheck::runtime;

Result<ValuePtr> rcl::typecheck::runtime::call_builtin(const Builtin &builtin, Span at, std::span<const ValuePtr> args)
{
    const FunctionReq &sig = *builtin.signature->function;
    if (args.size() != sig.args.size()) {
        return at
            .error(std::format("{} takes {} argument{}, but {} were given.", builtin.name, sig.args.size(), sig.args.size() == 1 ? "" : "s", args.size()))
            .with_help(std::format("The signature is {}.", builtin.signature->to_string()))
            .err();
    }
    for (size_t i = 0; i < args.size(); ++i) {
        if (auto checked = sig.args[i]->check_value(at, *args[i]); not checked) {
            auto note = std::format("In argument {} of {}, which must be {}.", i + 1, builtin.name, sig.args[i]->to_string());
            return std::move(checked.error()).with_note(at, std::move(note)).err();
        }
    }
    auto result = builtin.impl(at, args);
    if (not result) return result;
    if (auto checked = sig.result->check_value(at, **result); not checked) return std::unexpected(std::move(checked.error()));
    return result;
}

// Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
static bool is_valid_utf8(std::string_view s)
{
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = byte(i);
        if (c < 0x80) {
            i++;
            continue;
        }
        size_t n;
        unsigned char lo = 0x80, hi = 0xbf;
        if (c >= 0xc2 and c <= 0xdf) {
            n = 2;
        } else if (c >= 0xe0 and c <= 0xef) {
            n = 3;
            if (c == 0xe0) lo = 0xa0;
            if (c == 0xed) hi = 0x9f;
        } else if (c >= 0xf0 and c <= 0xf4) {
            n = 4;
            if (c == 0xf0) lo = 0x90;
            if (c == 0xf4) hi = 0x8f;
        } else {
            return false;
        }
        if (i + n > s.size()) return false;
        if (byte(i + 1) < lo or byte(i + 1) > hi) return false;
        for (size_t j = 2; j < n; ++j) {
            if ((byte(i + j) >> 6) != 0x2) return false;
        }
        i += n;
    }
    return true;
}

static Result<ValuePtr> builtin_std_read_file_utf8(Span at, std::span<const ValuePtr> args)
{
    const std::string &path = args[0]->as_string();
    std::ifstream file(path, std::ios::binary);
    if (not file) return at.error(std::format("Failed to open file {}.", quote_string(path))).err();

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) return at.error(std::format("Failed to read file {}.", quote_string(path))).err();

    std::string data = std::move(contents).str();
    if (not is_valid_utf8(data)) {
        return at.error(std::format("File {} is not valid UTF-8.", quote_string(path))).with_help("Only UTF-8 text files can be read as strings.").err();
    }
    return Value::from_string(std::move(data));
}

std::shared_ptr<const Builtin> stdlib::read_file_utf8()
{
    static const std::shared_ptr<const Builtin> s_builtin = std::make_shared<Builtin>(Builtin {
        "std.read_file_utf8",
        ReqType::make_function({ ReqType::make_string() }, ReqType::make_string()),
        builtin_std_read_file_utf8,
    });
    return s_builtin;
}

ValuePtr stdlib::initialize()
{
    std::vector<Value::Entry> builtins;
    builtins.emplace_back(Value::from_string("read_file_utf8"), Value::from_builtin(read_file_utf8()));
    return Value::dict(std::move(builtins));
}
