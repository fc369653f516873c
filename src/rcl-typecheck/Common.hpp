// Copyright (C) 2025 Amrit Bhogal
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as
// published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <cstdlib>
#include <format>
#include <iostream>
#include <source_location>
#include <string_view>
#include <typeinfo>
#include <variant>

namespace rcl::typecheck
{
#ifndef NDEBUG
#define $on_debug(...) __VA_ARGS__
#define $on_release(...)
#else
#define $on_debug(...)
#define $on_release(...) __VA_ARGS__
#endif

    // For std::visit overloads
    template <typename... T>
    struct Overload : T... {
        using T::operator()...;
    };

    template <typename... T>
    Overload(T...) -> Overload<T...>;

    template <typename TVariant>
    static constexpr inline auto typematch(TVariant &&v) -> decltype(auto)
    {
        return [&v]<typename... TFn>(TFn &&...fn) constexpr -> decltype(auto) {
            return std::visit(Overload { std::forward<TFn>(fn)... }, std::forward<TVariant>(v));
        };
    }

    // Internal invariant violations. These are defects in the caller, never user errors.
    [[noreturn]] inline void panic(std::string_view message, std::source_location location = std::source_location::current())
    {
        std::cerr << std::format("[{}:{}] internal error: {}\n", location.file_name(), location.line(), message);
        std::abort();
    }

    // Reader errors: a closed set of error kinds, each rendering itself with to_string().
    template <typename... T> // requires Stringable<T>
    struct SyntaxError {
        using Kind_t = std::variant<T...>;
        Kind_t kind;
        size_t line, column;
        $on_debug(std::source_location location);

        SyntaxError(Kind_t kind, size_t line, size_t column $on_debug(, std::source_location location = std::source_location::current())) :
            kind(kind), line(line), column(column) $on_debug(, location(location))
        {
        }

        inline std::string to_string() const
        {
            return std::visit(
                [this](const auto &e) -> std::string {
                    if constexpr (requires { e.to_string(); }) {
                        return std::format("Error at {}:{} - {}", line, column, e.to_string());
                    } else {
                        return std::format("Error at {}:{} - {}", line, column, typeid(e).name());
                    }
                },
                kind
            );
        }
    };

}
