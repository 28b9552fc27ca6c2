#pragma once

#include <stdexcept>
#include <string>

namespace casement
{

// The platform refused to create a window or a drawable surface. Recoverable
// for secondary viewports, fatal for the root at startup.
class SurfaceCreationError : public std::runtime_error
{
   public:
    explicit SurfaceCreationError(const std::string& what) : std::runtime_error(what) {}
};

// Making the shared context current (or releasing it) failed. Never recovered
// inside the core: the context would be left in an unknown binding state.
class ContextBindError : public std::runtime_error
{
   public:
    explicit ContextBindError(const std::string& what) : std::runtime_error(what) {}
};

}   // namespace casement
