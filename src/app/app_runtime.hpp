#pragma once

#include <casement/app.hpp>
#include <memory>
#include <unordered_set>

#include "render/context_cell.hpp"
#include "runtime/frame_driver.hpp"
#include "viewport/viewport_registry.hpp"

namespace casement
{

// Everything App creates on first resume.
// Declaration order matters: the driver goes first, the context cell last.
struct App::AppRuntime
{
    std::shared_ptr<ContextCell>      context;
    std::shared_ptr<ViewportRegistry> registry;
    std::shared_ptr<Painter>          painter;
    std::unique_ptr<FrameDriver>      driver;

    // Windows that have been handed to the scheduler at least once.
    std::unordered_set<WindowId> known_windows;
};

}   // namespace casement
