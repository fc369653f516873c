#pragma once
#include <compare>
#include <cstdint>
#include <source_location>
#include <string>

namespace rcl::typecheck
{
    class Error;

    using DocId = uint32_t;

    // A byte range in one of the loaded documents. The loader owns the documents,
    // a span only identifies a range in one of them.
    struct Span {
        DocId doc = 0;
        uint32_t start = 0;
        uint32_t end = 0;

        constexpr Span() = default;
        constexpr Span(DocId doc, uint32_t start, uint32_t end) : doc(doc), start(start), end(end) { }


        // Start building an error anchored at this span.
        Error error(std::string message, std::source_location location = std::source_location::current()) const;

        std::string to_string() const;

        constexpr auto operator<=>(const Span &) const = default;
    };

}
