#include "ErrorReporter.hpp"
#include <sstream>

using namespace rcl::typecheck;

void ErrorReporter::add_error(Error error) { errors.push_back(std::move(error)); }
bool ErrorReporter::empty() const { return errors.empty(); }
const std::vector<Error> &ErrorReporter::get_errors() const { return errors; }
std::string ErrorReporter::format_errors() const
{
    std::ostringstream oss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) oss << "\n";
        oss << errors[i].to_string();
    }
    return oss.str();
}
