#pragma once

#include <stdexcept>
#include <string>

namespace borestitch {

/* Caller contract violation: nothing to stitch, or a frame whose declared
   geometry does not match its buffer. Always fatal for the job. */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

/* Raised between frames when the caller requested a stop. */
class Cancelled : public std::runtime_error {
public:
    explicit Cancelled(const std::string& what) : std::runtime_error(what) {}
};

} // namespace borestitch
