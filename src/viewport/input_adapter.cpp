#include "input_adapter.hpp"

#include <casement/logger.hpp>

namespace casement
{

namespace
{

constexpr float POINTS_PER_SCROLL_LINE = 50.0f;

std::string encode_utf8(uint32_t cp)
{
    std::string out;
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x110000)
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

bool is_printable(uint32_t cp)
{
    // Control characters and the private-use area (function keys on macOS).
    if (cp < 0x20 || cp == 0x7F)
        return false;
    if (cp >= 0xE000 && cp <= 0xF8FF)
        return false;
    return true;
}

}   // namespace

InputAdapter::InputAdapter(ViewportId viewport, float pixels_per_point, Platform* platform)
    : viewport_(viewport), pixels_per_point_(pixels_per_point > 0.0f ? pixels_per_point : 1.0f),
      platform_(platform)
{
    pending_.viewport_id = viewport_;
}

EventResponse InputAdapter::on_window_event(const WindowEvent& event)
{
    using K = WindowEvent::Kind;
    switch (event.kind)
    {
        case K::Resized:
        case K::CloseRequested:
        case K::Minimized:
        case K::Maximized:
        case K::RedrawRequested:
            return {.repaint = true};

        case K::Moved:
            return {};

        case K::ScaleFactorChanged:
            if (event.scale > 0.0f)
                pixels_per_point_ = event.scale;
            return {.repaint = true};

        case K::Focused:
            if (!event.flag)
                pending_.modifiers = {};
            pending_.events.push_back({.kind = InputEvent::Kind::WindowFocused, .pressed = event.flag});
            return {.repaint = true};

        case K::CursorMoved:
        {
            Vec2 pos     = event.position / pixels_per_point_;
            pointer_pos_ = pos;
            pending_.events.push_back({.kind = InputEvent::Kind::PointerMoved, .pos = pos});
            return {.repaint = true};
        }

        case K::CursorLeft:
            pointer_pos_.reset();
            pending_.events.push_back({.kind = InputEvent::Kind::PointerGone});
            return {.repaint = true};

        case K::MouseButton:
            if (!pointer_pos_)
                return {};
            pending_.events.push_back({.kind      = InputEvent::Kind::PointerButton,
                                       .pos       = *pointer_pos_,
                                       .button    = event.button,
                                       .pressed   = event.flag,
                                       .modifiers = pending_.modifiers});
            return {.consumed = true, .repaint = true};

        case K::MouseWheel:
            pending_.events.push_back({.kind  = InputEvent::Kind::Scroll,
                                       .delta = event.delta * POINTS_PER_SCROLL_LINE});
            return {.repaint = true};

        case K::Keyboard:
            on_keyboard(event);
            return {.repaint = true};

        case K::Text:
            if (!is_printable(event.codepoint) || pending_.modifiers.ctrl
                || pending_.modifiers.command)
                return {};
            pending_.events.push_back(
                {.kind = InputEvent::Kind::Text, .text = encode_utf8(event.codepoint)});
            return {.consumed = true, .repaint = true};
    }
    return {};
}

void InputAdapter::on_keyboard(const WindowEvent& event)
{
    pending_.modifiers = event.modifiers;

    if (event.flag && event.modifiers.command)
    {
        switch (event.key)
        {
            case Key::C:
                pending_.events.push_back({.kind = InputEvent::Kind::Copy});
                return;
            case Key::X:
                pending_.events.push_back({.kind = InputEvent::Kind::Cut});
                return;
            case Key::V:
                if (platform_)
                {
                    if (auto text = platform_->clipboard_text(); text && !text->empty())
                        pending_.events.push_back({.kind = InputEvent::Kind::Paste, .text = *text});
                }
                return;
            default:
                break;
        }
    }

    if (event.key == Key::Unknown)
        return;

    pending_.events.push_back({.kind      = InputEvent::Kind::Key,
                               .pressed   = event.flag,
                               .repeat    = event.repeat,
                               .key       = event.key,
                               .modifiers = event.modifiers});
}

void InputAdapter::on_mouse_motion(Vec2 delta)
{
    pending_.events.push_back({.kind = InputEvent::Kind::MouseMoved, .delta = delta});
}

void InputAdapter::push_event(InputEvent event)
{
    pending_.events.push_back(std::move(event));
}

RawInput InputAdapter::take_input(const NativeWindow& window)
{
    pending_.viewport_id = viewport_;
    pending_.focused     = window.has_focus();

    SizePx size = window.inner_size_px();
    if (size.is_empty())
        pending_.screen_rect.reset();
    else
        pending_.screen_rect = Rect::from_min_size({0.0f, 0.0f}, to_points(size, pixels_per_point_));

    RawInput taken       = std::move(pending_);
    pending_             = RawInput{};
    pending_.viewport_id = viewport_;
    pending_.modifiers   = taken.modifiers;
    return taken;
}

void InputAdapter::handle_platform_output(NativeWindow& window, const PlatformOutput& output)
{
    if (output.cursor_icon != current_cursor_)
    {
        current_cursor_ = output.cursor_icon;
        if (current_cursor_ == CursorIcon::None)
        {
            window.set_cursor_visible(false);
        }
        else
        {
            window.set_cursor_visible(true);
            window.set_cursor_icon(current_cursor_);
        }
    }

    if (output.copied_text && platform_)
    {
        platform_->set_clipboard_text(*output.copied_text);
        CASEMENT_LOG_TRACE("input", "Copied {} bytes to clipboard", output.copied_text->size());
    }
}

}   // namespace casement
