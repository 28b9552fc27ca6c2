#pragma once

#include <casement/input.hpp>
#include <casement/platform.hpp>
#include <optional>

namespace casement
{

struct EventResponse
{
    bool consumed = false;
    bool repaint  = false;
};

// Translates platform events for one window into UI input. Lives exactly as
// long as the window it was created for.
class InputAdapter
{
   public:
    InputAdapter(ViewportId viewport, float pixels_per_point, Platform* platform = nullptr);

    EventResponse on_window_event(const WindowEvent& event);
    void          on_mouse_motion(Vec2 delta);

    // Queue an event produced by the core itself (screenshots, clipboard actions).
    void push_event(InputEvent event);

    // Hands over everything gathered since the previous call.
    RawInput take_input(const NativeWindow& window);

    bool has_pending_events() const { return !pending_.events.empty(); }

    void handle_platform_output(NativeWindow& window, const PlatformOutput& output);

    float pixels_per_point() const { return pixels_per_point_; }
    void  set_pixels_per_point(float ppp) { pixels_per_point_ = ppp; }

   private:
    void on_keyboard(const WindowEvent& event);

    ViewportId          viewport_;
    float               pixels_per_point_;
    Platform*           platform_;
    RawInput            pending_;
    std::optional<Vec2> pointer_pos_;
    CursorIcon          current_cursor_ = CursorIcon::Default;
};

}   // namespace casement
