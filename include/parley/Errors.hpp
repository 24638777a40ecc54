/**
 * Errors.hpp - Exception types raised by collaborators
 */

#pragma once

#include <stdexcept>
#include <string>

namespace parley {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Chat request or stream failed. Fatal for the current session.
class ChatError : public Error {
public:
    using Error::Error;
};

/// Speech-to-text engine failed (an empty transcript is not an error).
class TranscriptionError : public Error {
public:
    using Error::Error;
};

/// Text-to-speech synthesis or playback failed.
class SpeechError : public Error {
public:
    using Error::Error;
};

/// Invalid configuration value.
class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace parley
