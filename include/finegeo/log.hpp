#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace finegeo {

// Component-prefixed console logger
//
//   [component] message             -> stdout
//   [component] WARNING: message    -> stderr
//   [component] ERROR: message      -> stderr
//
// debug() messages are dropped unless debug output is enabled.
//
class Logger {
public:
    explicit Logger(std::string_view component);

    // Redirect output (for tests); streams must outlive the logger
    Logger(std::string_view component, std::ostream& out, std::ostream& err);

    void log(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;
    void debug(std::string_view message) const;

    void setDebugEnabled(bool enabled) { debugEnabled_ = enabled; }
    [[nodiscard]] bool debugEnabled() const { return debugEnabled_; }

    [[nodiscard]] const std::string& component() const { return component_; }

private:
    std::string component_;
    std::ostream* out_;
    std::ostream* err_;
    bool debugEnabled_ = false;
};

}  // namespace finegeo
