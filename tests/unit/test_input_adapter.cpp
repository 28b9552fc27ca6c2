#include <gtest/gtest.h>
#include <memory>

#include "platform/headless/headless_platform.hpp"
#include "viewport/input_adapter.hpp"

using namespace casement;

// ═══════════════════════════════════════════════════════════════════════════════
// InputAdapter: platform window events in pixels become UI input in points.
// ═══════════════════════════════════════════════════════════════════════════════

namespace
{

const ViewportId VIEWPORT = ViewportId::from_name("adapter-test");

}   // namespace

class InputAdapterTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        window_  = platform_.create_window(ViewportAttributes{}.with_inner_size({400.0f, 300.0f}));
        adapter_ = std::make_unique<InputAdapter>(VIEWPORT, 2.0f, &platform_);
    }

    RawInput take() { return adapter_->take_input(*window_); }

    HeadlessPlatform              platform_;
    std::unique_ptr<NativeWindow> window_;
    std::unique_ptr<InputAdapter> adapter_;
};

TEST_F(InputAdapterTest, CursorPositionIsConvertedToPoints)
{
    auto response = adapter_->on_window_event(WindowEvent::cursor_moved({100.0f, 50.0f}));
    EXPECT_TRUE(response.repaint);

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 1u);
    EXPECT_EQ(input.events[0].kind, InputEvent::Kind::PointerMoved);
    EXPECT_EQ(input.events[0].pos, (Vec2{50.0f, 25.0f}));
}

TEST_F(InputAdapterTest, ButtonWithoutKnownPointerIsDropped)
{
    auto response = adapter_->on_window_event(WindowEvent::mouse_button(PointerButton::Primary, true));
    EXPECT_FALSE(response.consumed);
    EXPECT_FALSE(adapter_->has_pending_events());
}

TEST_F(InputAdapterTest, ButtonUsesLastPointerPosition)
{
    adapter_->on_window_event(WindowEvent::cursor_moved({20.0f, 40.0f}));
    auto response = adapter_->on_window_event(WindowEvent::mouse_button(PointerButton::Secondary, true));
    EXPECT_TRUE(response.consumed);

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 2u);
    EXPECT_EQ(input.events[1].kind, InputEvent::Kind::PointerButton);
    EXPECT_EQ(input.events[1].button, PointerButton::Secondary);
    EXPECT_TRUE(input.events[1].pressed);
    EXPECT_EQ(input.events[1].pos, (Vec2{10.0f, 20.0f}));
}

TEST_F(InputAdapterTest, CursorLeftForgetsPointer)
{
    adapter_->on_window_event(WindowEvent::cursor_moved({20.0f, 40.0f}));
    adapter_->on_window_event(WindowEvent::cursor_left());
    adapter_->on_window_event(WindowEvent::mouse_button(PointerButton::Primary, true));

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 2u);
    EXPECT_EQ(input.events[1].kind, InputEvent::Kind::PointerGone);
}

TEST_F(InputAdapterTest, WheelLinesBecomePoints)
{
    adapter_->on_window_event(WindowEvent::mouse_wheel({0.0f, -2.0f}));

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 1u);
    EXPECT_EQ(input.events[0].kind, InputEvent::Kind::Scroll);
    EXPECT_EQ(input.events[0].delta, (Vec2{0.0f, -100.0f}));
}

TEST_F(InputAdapterTest, TextIsEncodedAsUtf8)
{
    adapter_->on_window_event(WindowEvent::text('a'));
    adapter_->on_window_event(WindowEvent::text(0x20AC));
    adapter_->on_window_event(WindowEvent::text(0x1F600));

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 3u);
    EXPECT_EQ(input.events[0].text, "a");
    EXPECT_EQ(input.events[1].text, "\xE2\x82\xAC");
    EXPECT_EQ(input.events[2].text, "\xF0\x9F\x98\x80");
}

TEST_F(InputAdapterTest, ControlCharactersAndShortcutsProduceNoText)
{
    adapter_->on_window_event(WindowEvent::text('\t'));
    adapter_->on_window_event(WindowEvent::text(0xF700));
    EXPECT_FALSE(adapter_->has_pending_events());

    adapter_->on_window_event(WindowEvent::keyboard(Key::Unknown, true, {.ctrl = true, .command = true}));
    adapter_->on_window_event(WindowEvent::text('s'));
    EXPECT_FALSE(adapter_->has_pending_events());
}

TEST_F(InputAdapterTest, KeysCarryModifiersAndRepeat)
{
    adapter_->on_window_event(WindowEvent::keyboard(Key::Tab, true, {.shift = true}, true));

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 1u);
    EXPECT_EQ(input.events[0].kind, InputEvent::Kind::Key);
    EXPECT_EQ(input.events[0].key, Key::Tab);
    EXPECT_TRUE(input.events[0].repeat);
    EXPECT_TRUE(input.events[0].modifiers.shift);
    EXPECT_TRUE(input.modifiers.shift);
}

TEST_F(InputAdapterTest, CommandShortcutsBecomeClipboardEvents)
{
    Modifiers cmd{.ctrl = true, .command = true};
    platform_.set_clipboard_text("pasted");

    adapter_->on_window_event(WindowEvent::keyboard(Key::C, true, cmd));
    adapter_->on_window_event(WindowEvent::keyboard(Key::X, true, cmd));
    adapter_->on_window_event(WindowEvent::keyboard(Key::V, true, cmd));

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 3u);
    EXPECT_EQ(input.events[0].kind, InputEvent::Kind::Copy);
    EXPECT_EQ(input.events[1].kind, InputEvent::Kind::Cut);
    EXPECT_EQ(input.events[2].kind, InputEvent::Kind::Paste);
    EXPECT_EQ(input.events[2].text, "pasted");
}

TEST_F(InputAdapterTest, PasteWithEmptyClipboardIsDropped)
{
    adapter_->on_window_event(WindowEvent::keyboard(Key::V, true, {.ctrl = true, .command = true}));
    EXPECT_FALSE(adapter_->has_pending_events());
}

TEST_F(InputAdapterTest, LosingFocusResetsModifiers)
{
    adapter_->on_window_event(WindowEvent::keyboard(Key::Unknown, true, {.alt = true}));
    adapter_->on_window_event(WindowEvent::focused(false));

    RawInput input = take();
    EXPECT_FALSE(input.modifiers.alt);
    ASSERT_EQ(input.events.size(), 1u);
    EXPECT_EQ(input.events[0].kind, InputEvent::Kind::WindowFocused);
    EXPECT_FALSE(input.events[0].pressed);
}

TEST_F(InputAdapterTest, TakeInputDrainsEventsButKeepsModifiers)
{
    adapter_->on_window_event(WindowEvent::keyboard(Key::A, true, {.shift = true}));

    RawInput first = take();
    EXPECT_EQ(first.viewport_id, VIEWPORT);
    EXPECT_EQ(first.events.size(), 1u);

    RawInput second = take();
    EXPECT_TRUE(second.events.empty());
    EXPECT_TRUE(second.modifiers.shift);
    EXPECT_FALSE(adapter_->has_pending_events());
}

TEST_F(InputAdapterTest, ScreenRectIsInPoints)
{
    RawInput input = take();
    ASSERT_TRUE(input.screen_rect.has_value());
    EXPECT_EQ(input.screen_rect->size(), (Vec2{200.0f, 150.0f}));
}

TEST_F(InputAdapterTest, MinimizedWindowHasNoScreenRect)
{
    window_->set_minimized(true);
    RawInput input = take();
    EXPECT_FALSE(input.screen_rect.has_value());
}

TEST_F(InputAdapterTest, ScaleFactorChangeUpdatesConversion)
{
    adapter_->on_window_event(WindowEvent::scale_factor_changed(4.0f));
    EXPECT_FLOAT_EQ(adapter_->pixels_per_point(), 4.0f);

    adapter_->on_window_event(WindowEvent::cursor_moved({40.0f, 40.0f}));
    RawInput input = take();
    EXPECT_EQ(input.events.back().pos, (Vec2{10.0f, 10.0f}));
}

TEST_F(InputAdapterTest, MovedNeedsNoRepaint)
{
    EXPECT_FALSE(adapter_->on_window_event(WindowEvent::moved({5.0f, 5.0f})).repaint);
    EXPECT_TRUE(adapter_->on_window_event(WindowEvent::redraw_requested()).repaint);
}

TEST_F(InputAdapterTest, MouseMotionIsQueuedAsRawDelta)
{
    adapter_->on_mouse_motion({3.0f, -4.0f});

    RawInput input = take();
    ASSERT_EQ(input.events.size(), 1u);
    EXPECT_EQ(input.events[0].kind, InputEvent::Kind::MouseMoved);
    EXPECT_EQ(input.events[0].delta, (Vec2{3.0f, -4.0f}));
}

TEST_F(InputAdapterTest, PlatformOutputDrivesCursorAndClipboard)
{
    auto& window = static_cast<HeadlessWindow&>(*window_);

    adapter_->handle_platform_output(*window_, {.cursor_icon = CursorIcon::Text, .copied_text = "copied"});
    EXPECT_EQ(window.cursor(), CursorIcon::Text);
    EXPECT_TRUE(window.cursor_visible());
    EXPECT_EQ(platform_.clipboard_text(), "copied");

    adapter_->handle_platform_output(*window_, {.cursor_icon = CursorIcon::None});
    EXPECT_FALSE(window.cursor_visible());
}
