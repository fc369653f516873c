#include "Error.hpp"
#include "Format.hpp"

#include <sstream>

using namespace rcl::typecheck;

Error Span::error(std::string message, [[maybe_unused]] std::source_location location) const
{
    return Error(*this, std::move(message) $on_debug(, location));
}

std::string Span::to_string() const { return std::format("{}:{}..{}", doc, start, end); }

std::string PathElement::to_string() const
{
    return typematch(element)(
        [](const Index &i) { return std::format("[{}]", i.index); },
        [](const Key &k) { return std::format("[{}]", format_value(*k.key).to_string()); }
    );
}

Error Error::with_body(pprint::Doc body) &&
{
    _body = std::move(body);
    return std::move(*this);
}

Error Error::with_note(Span at, pprint::Doc message) &&
{
    _notes.push_back(Note { at, std::move(message) });
    return std::move(*this);
}

Error Error::with_help(std::string help) &&
{
    _help = std::move(help);
    return std::move(*this);
}

Error Error::with_path_element(PathElement element) &&
{
    _path.push_back(std::move(element));
    return std::move(*this);
}

std::string Error::format_path() const
{
    std::string out;
    for (auto it = _path.rbegin(); it != _path.rend(); ++it) out += it->to_string();
    return out;
}

std::string Error::to_string() const
{
    std::ostringstream oss;
    oss << "Error at " << _origin.to_string() << ": " << _message << "\n";
    if (not _path.empty()) oss << "  in value at " << format_path() << "\n";
    if (_body and not _body->empty()) {
        auto doc = pprint::Doc::indent(*_body);
        oss << "\n" << doc.to_string() << "\n";
    }
    for (auto &note : _notes) oss << "\nNote at " << note.at.to_string() << ": " << note.message.to_string() << "\n";
    if (_help) oss << "\nHelp: " << *_help << "\n";
    $on_debug(oss << "(reported from " << _location.file_name() << ":" << _location.line() << ")\n");
    return oss.str();
}
