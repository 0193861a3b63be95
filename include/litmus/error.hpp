#pragma once

#include <stdexcept>
#include <string>

namespace litmus {

    // Failure surfaced to transcript code. `kind` is the qualified error name reported in
    // transcript output once its namespace qualification is stripped.
    class error : public std::runtime_error {
      public:
        error(std::string kind, std::string message)
                : std::runtime_error{kind + ": " + message}, kind_{std::move(kind)}, message_{std::move(message)} {}

        const std::string& kind() const { return kind_; }
        const std::string& message() const { return message_; }

      private:
        std::string kind_{};
        std::string message_{};
    };

    class transcript_not_found : public error {
      public:
        explicit transcript_not_found(std::string name)
                : error{"litmus::transcript_not_found", "no transcript named " + name}, name_{std::move(name)} {}

        const std::string& name() const { return name_; }

      private:
        std::string name_{};
    };

}  // namespace litmus
