#pragma once
#include <string>
#include <vector>

#include "Error.hpp"

namespace rcl::typecheck
{
    // Collects the failures of many checks, for callers that keep going after one.
    class ErrorReporter {
    public:
        void add_error(Error error);
        bool empty() const;
        size_t size() const { return errors.size(); }
        const std::vector<Error> &get_errors() const;
        std::string format_errors() const;

    private:
        std::vector<Error> errors;
    };

}
