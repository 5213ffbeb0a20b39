#include "fsmkit/core/error.hpp"

namespace fsmkit::core {

    const char *toString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::DuplicateTransition:
            return "DuplicateTransition";
        case ErrorKind::NoEventInScope:
            return "NoEventInScope";
        case ErrorKind::BuilderConsumed:
            return "BuilderConsumed";
        case ErrorKind::AlreadyStarted:
            return "AlreadyStarted";
        case ErrorKind::NotStarted:
            return "NotStarted";
        case ErrorKind::Stopped:
            return "Stopped";
        case ErrorKind::ActionFailed:
            return "ActionFailed";
        }
        return "Unknown";
    }

    Error::Error(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

    std::string describe(const std::exception &error) {
        std::string out = error.what();
        try {
            std::rethrow_if_nested(error);
        } catch (const std::exception &inner) {
            out += " <- " + describe(inner);
        } catch (...) {
            out += " <- non-standard exception";
        }
        return out;
    }

    std::string describe(std::exception_ptr error) {
        if (!error) {
            return "";
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return describe(e);
        } catch (...) {
            return "non-standard exception";
        }
    }

} // namespace fsmkit::core
