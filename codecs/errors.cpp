#include "errors.hpp"

Format_error::Format_error(const std::string & msg, std::size_t available):
    std::runtime_error{msg},
    available_{available}
{}
