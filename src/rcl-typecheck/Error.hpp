#pragma once
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <variant>
#include <vector>

#include "Common.hpp"
#include "Doc.hpp"
#include "Source.hpp"
#include "Value.hpp"

namespace rcl::typecheck
{
    // One step into a collection, used to locate an error inside a value.
    struct PathElement {
        struct Index {
            size_t index;
        };
        struct Key {
            runtime::ValuePtr key;
        };
        std::variant<Index, Key> element;

        static PathElement index(size_t i) { return PathElement { Index { i } }; }
        static PathElement key(runtime::ValuePtr k) { return PathElement { Key { std::move(k) } }; }

        std::string to_string() const;
    };

    // A user-facing failure. Built fluently from a span:
    //
    //     return at.error("Type mismatch.").with_body(doc).with_help("...").err();
    class Error {
    public:
        struct Note {
            Span at;
            pprint::Doc message;
        };

        Error(Span origin, std::string message $on_debug(, std::source_location location = std::source_location::current())) :
            _origin(origin), _message(std::move(message)) $on_debug(, _location(location))
        {
        }

        Error with_body(pprint::Doc body) &&;
        Error with_note(Span at, pprint::Doc message) &&;
        Error with_help(std::string help) &&;
        // Paths are built while unwinding, so the innermost element is added first.
        Error with_path_element(PathElement element) &&;

        std::unexpected<Error> err() && { return std::unexpected<Error>(std::move(*this)); }

        const Span &origin() const { return _origin; }
        const std::string &message() const { return _message; }
        const std::optional<pprint::Doc> &body() const { return _body; }
        const std::vector<Note> &notes() const { return _notes; }
        const std::optional<std::string> &help() const { return _help; }
        // Innermost element first.
        const std::vector<PathElement> &path() const { return _path; }

        std::string format_path() const;
        std::string to_string() const;

    private:
        Span _origin;
        std::string _message;
        std::optional<pprint::Doc> _body;
        std::vector<Note> _notes;
        std::optional<std::string> _help;
        std::vector<PathElement> _path;
        $on_debug(std::source_location _location);
    };

    template <typename T>
    using Result = std::expected<T, Error>;

}
