#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace fsmkit::core {

    enum class ErrorKind {
        DuplicateTransition, // (state, event) already has a target
        NoEventInScope,      // transitionTo() without a preceding on()/onMut()
        BuilderConsumed,     // builder used after build() or after a construction error
        AlreadyStarted,
        NotStarted,
        Stopped,             // active machine no longer accepts events
        ActionFailed         // a registered callback threw, original is nested
    };

    const char *toString(ErrorKind kind);

    class Error : public std::runtime_error {
      public:
        Error(ErrorKind kind, const std::string &message);

        ErrorKind kind() const { return kind_; }

      private:
        ErrorKind kind_;
    };

    // Flatten a nested exception chain into "outer <- inner <- ..."
    std::string describe(const std::exception &error);
    std::string describe(std::exception_ptr error);

} // namespace fsmkit::core
