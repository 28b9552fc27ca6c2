#pragma once

#include <casement/platform.hpp>
#include <casement/ui.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace casement
{

class ContextCell;
class ViewportRegistry;

// Renders immediate viewports synchronously from inside another viewport's
// UI pass. Holds only weak handles: a nested call that outlives the runtime
// is skipped with a warning instead of touching freed state.
class ImmediateViewportRenderer : public ImmediateRenderer
{
   public:
    ImmediateViewportRenderer(std::weak_ptr<ViewportRegistry>       registry,
                              std::weak_ptr<ContextCell>            context,
                              std::weak_ptr<Painter>                painter,
                              UiLayer&                              ui,
                              std::chrono::steady_clock::time_point start_time);

    void render(ImmediateViewport viewport) override;

    uint64_t rendered_count() const { return rendered_; }
    uint64_t skipped_count() const { return skipped_; }
    uint32_t depth() const { return depth_; }

   private:
    void warn_stale(ViewportId id);

    std::weak_ptr<ViewportRegistry>       registry_;
    std::weak_ptr<ContextCell>            context_;
    std::weak_ptr<Painter>                painter_;
    UiLayer&                              ui_;
    std::chrono::steady_clock::time_point start_time_;

    uint64_t rendered_ = 0;
    uint64_t skipped_  = 0;
    uint32_t depth_    = 0;
};

}   // namespace casement
