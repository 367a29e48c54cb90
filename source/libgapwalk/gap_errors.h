#ifndef GAPWALK_GAP_ERRORS_H
#define GAPWALK_GAP_ERRORS_H

#include <stdexcept>
#include <string>

namespace gapwalk {

// Missing or invalid required input
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A required external tool is not installed
class CollaboratorUnavailable : public std::runtime_error {
public:
    explicit CollaboratorUnavailable(const std::string& msg) : std::runtime_error(msg) {}
};

// An external tool ran but failed; never retried
class CollaboratorFailure : public std::runtime_error {
public:
    explicit CollaboratorFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// The finished sequence still carries a gap whose anchors cannot be used
class UnresolvableGap : public std::runtime_error {
public:
    explicit UnresolvableGap(const std::string& msg) : std::runtime_error(msg) {}
};

// SequenceBuffer::replace target absent
class SequenceNotFound : public std::runtime_error {
public:
    explicit SequenceNotFound(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace gapwalk

#endif // GAPWALK_GAP_ERRORS_H
