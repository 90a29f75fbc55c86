#include "finegeo/log.hpp"

#include <iostream>

namespace finegeo {

Logger::Logger(std::string_view component)
    : Logger(component, std::cout, std::cerr)
{
}

Logger::Logger(std::string_view component, std::ostream& out, std::ostream& err)
    : component_(component)
    , out_(&out)
    , err_(&err)
{
}

void Logger::log(std::string_view message) const {
    *out_ << "[" << component_ << "] " << message << "\n";
}

void Logger::warn(std::string_view message) const {
    *err_ << "[" << component_ << "] WARNING: " << message << "\n";
}

void Logger::error(std::string_view message) const {
    *err_ << "[" << component_ << "] ERROR: " << message << "\n";
}

void Logger::debug(std::string_view message) const {
    if (!debugEnabled_) return;
    *err_ << "[" << component_ << "] DEBUG: " << message << "\n";
}

}  // namespace finegeo
