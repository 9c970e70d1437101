#pragma once

#include <stdexcept>
#include <string>

namespace campfire {

/// Base error for Campfire client failures, including malformed links.
class CampfireError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// HTTP 429 from the backend.  Never retried.
class RateLimitError : public CampfireError {
public:
    using CampfireError::CampfireError;
};

/// The backend kept failing (network errors / HTTP 502) after all retries.
class RetryError : public CampfireError {
public:
    using CampfireError::CampfireError;
};

/// Meetup links that cannot be resolved (public meetups without location).
class UnsupportedMeetup : public CampfireError {
public:
    using CampfireError::CampfireError;
};

/// A referenced event could not be found.
class EventNotFound : public CampfireError {
public:
    explicit EventNotFound(const std::string& id)
        : CampfireError("Event not found: " + id)
        , mId(id) {}

    const std::string& id() const { return mId; }

private:
    std::string mId;
};

/// Raised by the HTTP layer for connection / timeout / I/O failures.
/// The data source turns these into retries.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace campfire
