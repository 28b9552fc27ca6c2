#pragma once

#include <casement/platform.hpp>
#include <chrono>

namespace casement
{

// What the event loop should do after handling one event or pass.
struct EventResult
{
    enum class Kind
    {
        Wait,
        RepaintNow,
        RepaintNext,
        Exit,
    };

    Kind     kind   = Kind::Wait;
    WindowId window = INVALID_WINDOW_ID;

    // RepaintNext only: earliest time the pass may run, relative to now.
    std::chrono::milliseconds delay{0};

    static EventResult wait() { return {}; }
    static EventResult repaint_now(WindowId w) { return {Kind::RepaintNow, w}; }
    static EventResult repaint_next(WindowId w) { return {Kind::RepaintNext, w}; }
    static EventResult repaint_after(WindowId w, std::chrono::milliseconds d)
    {
        return {Kind::RepaintNext, w, d};
    }
    static EventResult exit() { return {Kind::Exit, INVALID_WINDOW_ID}; }

    bool operator==(const EventResult&) const = default;
};

const char* event_result_name(EventResult::Kind kind);

}   // namespace casement
