#pragma once

// Error types raised by the LOD core.
// None of these are retryable: each one signals a configuration or
// scheduling defect in the host application.

#include <SDL3/SDL_log.h>
#include <stdexcept>
#include <string>

namespace PlanetLod {

class LodError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Storage pool exhausted while every cached tile is still referenced
class CacheCapacityError : public LodError {
public:
    using LodError::LodError;
};

// A producer needed another tile (its parent, or a tile of the producer
// it depends on) that was not created before it
class MissingTileError : public LodError {
public:
    using LodError::LodError;
};

// Mismatched tile sizes, borders or capacities detected at construction
class InvalidParameterError : public LodError {
public:
    using LodError::LodError;
};

// Log the message through SDL and throw it as E
template <typename E>
[[noreturn]] void raise(const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", message.c_str());
    throw E(message);
}

} // namespace PlanetLod
