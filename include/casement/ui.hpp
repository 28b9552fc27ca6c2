#pragma once

#include <casement/input.hpp>
#include <casement/math.hpp>
#include <casement/viewport.hpp>

namespace casement
{

// A nested viewport the UI wants drawn right now, inside the current pass.
struct ImmediateViewport
{
    ViewportId         id;
    ViewportId         parent = ROOT_VIEWPORT;
    ViewportAttributes attributes;
    ViewportUiCallback ui;
};

// Capability handed down the UI call stack for synchronous nested rendering.
class ImmediateRenderer
{
   public:
    virtual ~ImmediateRenderer() = default;

    virtual void render(ImmediateViewport viewport) = 0;
};

// The immediate-mode UI engine seen from the windowing layer.
class UiLayer
{
   public:
    virtual ~UiLayer() = default;

    // One pass for the viewport named by `input.viewport_id`. `viewport_ui` is
    // null for the root viewport, whose content is the application itself.
    // The returned viewport output must list every viewport that should exist.
    virtual FullOutput run(const RawInput&           input,
                           const ViewportUiCallback* viewport_ui,
                           ImmediateRenderer&        immediate) = 0;

    virtual Rgba clear_color(const ViewportInfo& /*info*/) const { return Rgba::transparent(); }
};

}   // namespace casement
