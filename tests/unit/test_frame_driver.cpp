#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "util/runtime_fixture.hpp"

using namespace casement;
using namespace casement::test;

// ═══════════════════════════════════════════════════════════════════════════════
// FrameDriver: one pass per viewport (input, UI, paint, present, reconcile)
// and the window-event routing that schedules those passes.
// ═══════════════════════════════════════════════════════════════════════════════

namespace
{

const ViewportId CHILD = ViewportId::from_name("child");
const ViewportId POPUP = ViewportId::from_name("popup");

using Op = HeadlessDrawCall::Op;

std::vector<Op> ops(const std::vector<HeadlessDrawCall>& log)
{
    std::vector<Op> out;
    for (const auto& call : log)
        out.push_back(call.op);
    return out;
}

}   // namespace

class FrameDriverTest : public RuntimeFixture
{
};

// ─── Pass ───────────────────────────────────────────────────────────────────

TEST_F(FrameDriverTest, RootPassClearsPaintsAndPresents)
{
    start();
    clear_draw_log();

    EventResult result = pass();

    EXPECT_EQ(result, EventResult::wait());
    EXPECT_EQ(ops(draw_log()), (std::vector<Op>{Op::Clear, Op::Paint, Op::Present}));
    EXPECT_EQ(ui_.calls_for(ROOT_VIEWPORT), 1u);
    EXPECT_EQ(driver_->pass_count(), 1u);
    EXPECT_TRUE(context_->is_current_against(surface(ROOT_VIEWPORT)));
}

TEST_F(FrameDriverTest, RootPassHasNoStoredCallback)
{
    start();
    pass();
    ASSERT_EQ(ui_.calls().size(), 1u);
    EXPECT_FALSE(ui_.calls()[0].has_callback);
}

TEST_F(FrameDriverTest, InputCarriesEverySnapshotAndTime)
{
    start();
    ui_.declare_deferred(CHILD);
    pass();

    pass();
    const RawInput* input = ui_.last_input(ROOT_VIEWPORT);
    ASSERT_NE(input, nullptr);
    EXPECT_EQ(input->viewport_id, ROOT_VIEWPORT);
    EXPECT_EQ(input->viewports.size(), 2u);
    EXPECT_EQ(input->viewports.count(CHILD), 1u);
    ASSERT_TRUE(input->time.has_value());
    EXPECT_GE(*input->time, 0.0);
    ASSERT_TRUE(input->screen_rect.has_value());
}

TEST_F(FrameDriverTest, ClearColorComesFromUi)
{
    start();
    ui_.set_clear_color({1.0f, 0.0f, 0.0f, 1.0f});
    pass();

    const auto& pixels = surface(ROOT_VIEWPORT).front_buffer();
    ASSERT_GE(pixels.size(), 4u);
    EXPECT_EQ(pixels[0], 255);
    EXPECT_EQ(pixels[1], 0);
    EXPECT_EQ(pixels[3], 255);
}

// ─── Clear policy ───────────────────────────────────────────────────────────

TEST_F(FrameDriverTest, BeforeUiClearsBeforeTheUiRuns)
{
    start(ClearPolicy::BeforeUi);
    uint64_t clears_seen_by_ui = 0;
    ui_.on_pass(ROOT_VIEWPORT,
                [&](const RawInput&, ImmediateRenderer&, FullOutput&)
                { clears_seen_by_ui = platform_.stats().clears; });

    pass();

    EXPECT_EQ(clears_seen_by_ui, 1u);
    EXPECT_EQ(platform_.stats().clears, 1u);
}

TEST_F(FrameDriverTest, AfterUiClearsAfterTheUiRuns)
{
    start(ClearPolicy::AfterUi);
    uint64_t clears_seen_by_ui = 99;
    ui_.on_pass(ROOT_VIEWPORT,
                [&](const RawInput&, ImmediateRenderer&, FullOutput&)
                { clears_seen_by_ui = platform_.stats().clears; });

    pass();

    EXPECT_EQ(clears_seen_by_ui, 0u);
    EXPECT_EQ(platform_.stats().clears, 1u);
}

TEST_F(FrameDriverTest, AutoPolicyFollowsViewportCount)
{
    start(ClearPolicy::Auto);
    uint64_t clears_seen_by_ui = 0;
    ui_.on_pass(ROOT_VIEWPORT,
                [&](const RawInput&, ImmediateRenderer&, FullOutput&)
                { clears_seen_by_ui = platform_.stats().clears; });

    pass();
    EXPECT_EQ(clears_seen_by_ui, 1u);

    // Two live viewports from here on.
    ui_.declare_deferred(CHILD);
    pass();
    uint64_t before = platform_.stats().clears;
    pass();
    EXPECT_EQ(clears_seen_by_ui, before);
    EXPECT_EQ(platform_.stats().clears, before + 1);
}

TEST_F(FrameDriverTest, ClearPolicyCanChangeAtRuntime)
{
    start(ClearPolicy::BeforeUi);
    driver_->set_clear_policy(ClearPolicy::AfterUi);
    EXPECT_EQ(driver_->clear_policy(), ClearPolicy::AfterUi);
}

// ─── Deferred viewports ─────────────────────────────────────────────────────

TEST_F(FrameDriverTest, DeclaredChildGetsWindowAfterRootPass)
{
    start();
    ui_.declare_deferred(CHILD, ViewportAttributes{}.with_title("child"));

    pass();

    ASSERT_NE(window_of(CHILD), INVALID_WINDOW_ID);
    EXPECT_EQ(window(CHILD).title(), "child");
    EXPECT_EQ(ui_.deferred_runs(CHILD), 0u);
}

TEST_F(FrameDriverTest, DeferredPassRunsStoredCallback)
{
    start();
    ui_.declare_deferred(CHILD);
    pass();

    EventResult result = driver_->run_ui_and_paint_window(window_of(CHILD));

    EXPECT_EQ(result, EventResult::wait());
    EXPECT_EQ(ui_.deferred_runs(CHILD), 1u);
    EXPECT_TRUE(ui_.calls().back().has_callback);
    EXPECT_TRUE(context_->is_current_against(surface(CHILD)));
}

TEST_F(FrameDriverTest, ViewportUndeclaredByItsOwnPassIsRemoved)
{
    start();
    ui_.declare_deferred(CHILD);
    pass();
    ui_.on_pass(CHILD, [&](const RawInput&, ImmediateRenderer&, FullOutput&) { ui_.undeclare(CHILD); });

    EventResult result = pass(CHILD);

    EXPECT_EQ(result, EventResult::wait());
    EXPECT_FALSE(registry_->contains(CHILD));
    EXPECT_EQ(platform_.live_windows(), 1u);
}

TEST_F(FrameDriverTest, UnknownWindowOrViewportWaits)
{
    start();
    EXPECT_EQ(driver_->run_ui_and_paint_window(12345), EventResult::wait());
    EXPECT_EQ(pass(CHILD), EventResult::wait());
    EXPECT_EQ(driver_->on_window_event(12345, WindowEvent::redraw_requested()), EventResult::wait());
}

TEST_F(FrameDriverTest, ImmediateViewportForwardsToParentWindow)
{
    start();
    ui_.declare_immediate(POPUP);
    pass();
    ASSERT_TRUE(registry_->contains(POPUP));

    EventResult result = pass(POPUP);

    EXPECT_EQ(result, EventResult::repaint_next(window_of(ROOT_VIEWPORT)));
    EXPECT_EQ(ui_.calls_for(POPUP), 0u);
}

// ─── Scheduling verdicts ────────────────────────────────────────────────────

TEST_F(FrameDriverTest, RepaintDelayBecomesVerdict)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);

    ui_.set_repaint_delay(ROOT_VIEWPORT, std::chrono::milliseconds{0});
    EXPECT_EQ(pass(), EventResult::repaint_next(root));

    ui_.set_repaint_delay(ROOT_VIEWPORT, std::chrono::milliseconds{16});
    EXPECT_EQ(pass(), EventResult::repaint_after(root, std::chrono::milliseconds{16}));

    ui_.set_repaint_delay(ROOT_VIEWPORT, std::nullopt);
    EXPECT_EQ(pass(), EventResult::wait());
}

TEST_F(FrameDriverTest, PresentFailureDropsFrameAndContinues)
{
    start();
    surface(ROOT_VIEWPORT).set_lost(true);

    EventResult result = pass();

    EXPECT_EQ(result, EventResult::wait());
    EXPECT_EQ(driver_->dropped_frames(), 1u);
    EXPECT_EQ(platform_.stats().failed_presents, 1u);
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "frame dropped"));

    surface(ROOT_VIEWPORT).set_lost(false);
    pass();
    EXPECT_EQ(driver_->dropped_frames(), 1u);
}

// ─── Window events ──────────────────────────────────────────────────────────

TEST_F(FrameDriverTest, ResizeResizesSurfaceAndRepaintsNow)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);

    EventResult result = driver_->on_window_event(root, WindowEvent::resized(1024, 768));

    EXPECT_EQ(result, EventResult::repaint_now(root));
    EXPECT_EQ(surface(ROOT_VIEWPORT).size_px(), (SizePx{1024, 768}));
}

TEST_F(FrameDriverTest, ZeroResizeIsIgnored)
{
    start();
    WindowId root   = window_of(ROOT_VIEWPORT);
    SizePx   before = surface(ROOT_VIEWPORT).size_px();

    EventResult result = driver_->on_window_event(root, WindowEvent::resized(0, 0));

    EXPECT_NE(result.kind, EventResult::Kind::RepaintNow);
    EXPECT_EQ(surface(ROOT_VIEWPORT).size_px(), before);
    EXPECT_EQ(platform_.stats().resizes, 0u);
}

TEST_F(FrameDriverTest, ResizeWithOneZeroDimensionIsIgnored)
{
    start();
    WindowId root   = window_of(ROOT_VIEWPORT);
    SizePx   before = surface(ROOT_VIEWPORT).size_px();

    EXPECT_NE(driver_->on_window_event(root, WindowEvent::resized(0, 600)).kind, EventResult::Kind::RepaintNow);
    EXPECT_NE(driver_->on_window_event(root, WindowEvent::resized(800, 0)).kind, EventResult::Kind::RepaintNow);

    EXPECT_EQ(surface(ROOT_VIEWPORT).size_px(), before);
    EXPECT_EQ(platform_.stats().resizes, 0u);
}

TEST_F(FrameDriverTest, MovedNeedsNoPass)
{
    start();
    EXPECT_EQ(driver_->on_window_event(window_of(ROOT_VIEWPORT), WindowEvent::moved({5.0f, 5.0f})),
              EventResult::wait());
}

TEST_F(FrameDriverTest, InputEventsReachTheNextPass)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);

    EXPECT_EQ(driver_->on_window_event(root, WindowEvent::keyboard(Key::Escape, true)),
              EventResult::repaint_next(root));
    pass();

    const RawInput* input = ui_.last_input(ROOT_VIEWPORT);
    ASSERT_NE(input, nullptr);
    ASSERT_EQ(input->events.size(), 1u);
    EXPECT_EQ(input->events[0].key, Key::Escape);
}

TEST_F(FrameDriverTest, FocusRoutesDeviceEvents)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);
    DeviceEvent motion{.kind = DeviceEvent::Kind::MouseMotion, .delta = {3.0f, 4.0f}};

    EXPECT_EQ(driver_->on_device_event(motion), EventResult::wait());

    driver_->on_window_event(root, WindowEvent::focused(true));
    EXPECT_EQ(registry_->focused_viewport(), ROOT_VIEWPORT);
    EXPECT_EQ(driver_->on_device_event(motion), EventResult::repaint_next(root));

    pass();
    const RawInput* input = ui_.last_input(ROOT_VIEWPORT);
    ASSERT_NE(input, nullptr);
    EXPECT_EQ(input->events.back().kind, InputEvent::Kind::MouseMoved);
    EXPECT_EQ(input->events.back().delta, (Vec2{3.0f, 4.0f}));

    driver_->on_window_event(root, WindowEvent::focused(false));
    EXPECT_FALSE(registry_->focused_viewport().has_value());
}

TEST_F(FrameDriverTest, FocusLossOfOtherWindowKeepsFocus)
{
    start();
    ui_.declare_deferred(CHILD);
    pass();

    driver_->on_window_event(window_of(ROOT_VIEWPORT), WindowEvent::focused(true));
    driver_->on_window_event(window_of(CHILD), WindowEvent::focused(false));
    EXPECT_EQ(registry_->focused_viewport(), ROOT_VIEWPORT);
}

// ─── Close protocol ─────────────────────────────────────────────────────────

TEST_F(FrameDriverTest, RootCloseIsConfirmedByNextPass)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);

    EventResult on_close = driver_->on_window_event(root, WindowEvent::close_requested());
    EXPECT_EQ(on_close, EventResult::repaint_next(root));
    EXPECT_FALSE(driver_->close_acknowledged());

    EXPECT_EQ(pass(), EventResult::exit());
    EXPECT_TRUE(driver_->close_acknowledged());
    EXPECT_TRUE(ui_.last_input(ROOT_VIEWPORT)->viewport()->close_requested());
}

TEST_F(FrameDriverTest, CancelCloseKeepsRunning)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);

    driver_->on_window_event(root, WindowEvent::close_requested());
    ui_.queue_command(ROOT_VIEWPORT, ViewportCommand::cancel_close());

    EXPECT_EQ(pass(), EventResult::wait());
    EXPECT_FALSE(driver_->close_acknowledged());
    EXPECT_TRUE(log_.contains(LogLevel::Info, "cancelled"));

    // The next pass sees no stale close request.
    pass();
    EXPECT_FALSE(ui_.last_input(ROOT_VIEWPORT)->viewport()->close_requested());

    driver_->on_window_event(root, WindowEvent::close_requested());
    EXPECT_EQ(pass(), EventResult::exit());
}

TEST_F(FrameDriverTest, CloseAfterAgreementExitsImmediately)
{
    start();
    WindowId root = window_of(ROOT_VIEWPORT);
    driver_->on_window_event(root, WindowEvent::close_requested());
    pass();

    EXPECT_EQ(driver_->on_window_event(root, WindowEvent::close_requested()), EventResult::exit());
}

TEST_F(FrameDriverTest, CloseCommandFromUiClosesRoot)
{
    start();
    ui_.queue_command(ROOT_VIEWPORT, ViewportCommand::close());
    pass();

    EXPECT_EQ(pass(), EventResult::exit());
}

TEST_F(FrameDriverTest, ChildCloseGoesToChildAndWakesParent)
{
    start();
    ui_.declare_deferred(CHILD);
    pass();
    uint32_t redraws_before = window(ROOT_VIEWPORT).redraw_requests();

    EventResult result = driver_->on_window_event(window_of(CHILD), WindowEvent::close_requested());

    EXPECT_EQ(result, EventResult::repaint_next(window_of(CHILD)));
    EXPECT_EQ(window(ROOT_VIEWPORT).redraw_requests(), redraws_before + 1);
    EXPECT_TRUE(platform_.has_queued_events());
    EXPECT_TRUE(registry_->find(CHILD)->actual_info.close_requested());
    EXPECT_FALSE(driver_->close_acknowledged());
}

TEST_F(FrameDriverTest, ChildClosedByItsOwnUi)
{
    start();
    ui_.declare_deferred(CHILD);
    pass();
    ui_.on_pass(CHILD,
                [&](const RawInput& input, ImmediateRenderer&, FullOutput&)
                {
                    if (input.viewport() && input.viewport()->close_requested())
                        ui_.undeclare(CHILD);
                });

    driver_->on_window_event(window_of(CHILD), WindowEvent::close_requested());
    EXPECT_EQ(pass(CHILD), EventResult::wait());

    EXPECT_FALSE(registry_->contains(CHILD));
    EXPECT_FALSE(driver_->close_acknowledged());
    EXPECT_EQ(platform_.live_windows(), 1u);
}

// ─── Frame actions ──────────────────────────────────────────────────────────

TEST_F(FrameDriverTest, ScreenshotIsDeliveredOnALaterPass)
{
    start();
    ui_.set_clear_color({0.0f, 0.0f, 1.0f, 1.0f});
    WindowId root = window_of(ROOT_VIEWPORT);

    // The queued screenshot asks for a frame to capture.
    ui_.queue_command(ROOT_VIEWPORT, ViewportCommand::screenshot(42));
    EXPECT_EQ(pass(), EventResult::repaint_next(root));

    // Painted and read back in this pass; the result needs one more pass.
    EXPECT_EQ(pass(), EventResult::repaint_next(root));

    pass();
    const RawInput* input = ui_.last_input(ROOT_VIEWPORT);
    ASSERT_NE(input, nullptr);
    ASSERT_EQ(input->events.size(), 1u);
    const InputEvent& shot = input->events[0];
    EXPECT_EQ(shot.kind, InputEvent::Kind::Screenshot);
    EXPECT_EQ(shot.user_data, 42u);
    EXPECT_EQ(shot.viewport, ROOT_VIEWPORT);
    ASSERT_NE(shot.image, nullptr);
    EXPECT_EQ(shot.image->size, surface(ROOT_VIEWPORT).size_px());
    EXPECT_EQ(shot.image->rgba[2], 255);
    EXPECT_EQ(shot.image->rgba[3], 255);
}

TEST_F(FrameDriverTest, ScreenshotWaitsForAPresentedFrame)
{
    start();
    ui_.set_clear_color({0.0f, 0.0f, 1.0f, 1.0f});
    WindowId root = window_of(ROOT_VIEWPORT);

    ui_.queue_command(ROOT_VIEWPORT, ViewportCommand::screenshot(7));
    pass();

    surface(ROOT_VIEWPORT).set_lost(true);
    EXPECT_EQ(pass(), EventResult::repaint_next(root));
    EXPECT_EQ(driver_->dropped_frames(), 1u);
    ASSERT_EQ(registry_->find(ROOT_VIEWPORT)->actions_requested.size(), 1u);
    EXPECT_EQ(registry_->find(ROOT_VIEWPORT)->actions_requested[0].user_data, 7u);

    surface(ROOT_VIEWPORT).set_lost(false);
    EXPECT_EQ(pass(), EventResult::repaint_next(root));
    EXPECT_TRUE(ui_.last_input(ROOT_VIEWPORT)->events.empty());
    EXPECT_TRUE(registry_->find(ROOT_VIEWPORT)->actions_requested.empty());

    pass();
    const RawInput* input = ui_.last_input(ROOT_VIEWPORT);
    ASSERT_NE(input, nullptr);
    ASSERT_EQ(input->events.size(), 1u);
    EXPECT_EQ(input->events[0].kind, InputEvent::Kind::Screenshot);
    EXPECT_EQ(input->events[0].user_data, 7u);
    ASSERT_NE(input->events[0].image, nullptr);
    EXPECT_EQ(input->events[0].image->rgba[2], 255);
}

TEST_F(FrameDriverTest, ClipboardActionsBecomeInputEvents)
{
    start();
    platform_.set_clipboard_text("from clipboard");
    ui_.queue_command(ROOT_VIEWPORT, ViewportCommand::request_copy());
    ui_.queue_command(ROOT_VIEWPORT, ViewportCommand::request_paste());
    pass();
    pass();
    pass();

    const RawInput* input = ui_.last_input(ROOT_VIEWPORT);
    ASSERT_EQ(input->events.size(), 2u);
    EXPECT_EQ(input->events[0].kind, InputEvent::Kind::Copy);
    EXPECT_EQ(input->events[1].kind, InputEvent::Kind::Paste);
    EXPECT_EQ(input->events[1].text, "from clipboard");
}

TEST_F(FrameDriverTest, PlatformOutputReachesWindow)
{
    start();
    ui_.on_pass(ROOT_VIEWPORT,
                [](const RawInput&, ImmediateRenderer&, FullOutput& out)
                {
                    out.platform_output.cursor_icon = CursorIcon::PointingHand;
                    out.platform_output.copied_text = "hello";
                });

    pass();

    EXPECT_EQ(window(ROOT_VIEWPORT).cursor(), CursorIcon::PointingHand);
    EXPECT_EQ(platform_.clipboard_text(), "hello");
}

// ─── Paint callbacks ────────────────────────────────────────────────────────

namespace
{

class CountingCallback : public PaintCallback
{
   public:
    void prepare(const PaintCallbackInfo& info) override
    {
        prepared++;
        last_size = info.screen_size_px;
    }
    void paint(const PaintCallbackInfo& info) override
    {
        painted++;
        saw_encoder = info.native_encoder != nullptr;
    }

    int    prepared    = 0;
    int    painted     = 0;
    bool   saw_encoder = false;
    SizePx last_size;
};

}   // namespace

TEST_F(FrameDriverTest, PaintCallbacksArePreparedThenPainted)
{
    start();
    auto callback = std::make_shared<CountingCallback>();
    ui_.on_pass(ROOT_VIEWPORT,
                [&](const RawInput&, ImmediateRenderer&, FullOutput& out)
                {
                    out.primitives.push_back({.clip_rect = Rect{}, .primitive = callback});
                    out.primitives.push_back({.clip_rect = Rect{}, .primitive = Mesh{}});
                });

    pass();

    EXPECT_EQ(callback->prepared, 1);
    EXPECT_EQ(callback->painted, 1);
    EXPECT_TRUE(callback->saw_encoder);
    EXPECT_EQ(callback->last_size, surface(ROOT_VIEWPORT).size_px());
}
