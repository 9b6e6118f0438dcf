#pragma once

#include <stdexcept>
#include <string>

enum class AcquisitionErrorKind {
    UnavailableRadio,  // local adapter missing / remote radio offline
    NoMatch,           // scan finished, no adapter recognized a device
    Timeout,           // a bounded wait expired
    Disconnected,      // peer or remote radio dropped before completion
    MalformedMessage,  // undecodable payload from the proxy
    Transport,         // any other radio / bus failure
};

const char* error_kind_name(AcquisitionErrorKind kind);

class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(AcquisitionErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    AcquisitionErrorKind kind() const noexcept { return kind_; }

private:
    AcquisitionErrorKind kind_;
};
