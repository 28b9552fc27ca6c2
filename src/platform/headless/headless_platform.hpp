#pragma once

#include <casement/platform.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace casement
{

// Counters kept by the headless device. Exposed for diagnostics and tests.
struct HeadlessStats
{
    uint64_t windows_created        = 0;
    uint64_t windows_destroyed      = 0;
    uint64_t surfaces_created       = 0;
    uint64_t surfaces_destroyed     = 0;
    uint64_t make_current_calls     = 0;
    uint64_t make_not_current_calls = 0;
    uint64_t clears                 = 0;
    uint64_t paints                 = 0;
    uint64_t presents               = 0;
    uint64_t failed_presents        = 0;
    uint64_t resizes                = 0;
};

struct HeadlessDrawCall
{
    enum class Op
    {
        Clear,
        Paint,
        Present,
    };

    Op       op;
    uint64_t surface;   // HeadlessSurface::serial()
};

class HeadlessSurface;

struct HeadlessDevice
{
    static constexpr size_t DRAW_LOG_CAPACITY = 4096;

    HeadlessStats                stats;
    HeadlessSurface*             current = nullptr;
    std::deque<HeadlessDrawCall> draw_log;
    std::deque<PlatformEvent>    events;
    uint64_t                     next_window_id      = 1;
    uint64_t                     next_surface_serial = 1;

    void record(HeadlessDrawCall::Op op, uint64_t surface);
};

struct HeadlessOptions
{
    size_t max_windows  = 0;   // 0 = unlimited; beyond it window creation is refused
    float  scale_factor = 1.0f;
    SizePx default_size{800, 600};
    Vec2   monitor_size{1920.0f, 1080.0f};
};

// ─── Window ──────────────────────────────────────────────────────────────────

class HeadlessWindow : public NativeWindow
{
   public:
    HeadlessWindow(std::shared_ptr<HeadlessDevice> device,
                   const ViewportAttributes&       attributes,
                   const HeadlessOptions&          options);
    ~HeadlessWindow() override;

    WindowId id() const override { return id_; }

    SizePx              inner_size_px() const override;
    SizePx              outer_size_px() const override;
    std::optional<Vec2> inner_position_px() const override;
    std::optional<Vec2> outer_position_px() const override;
    float               scale_factor() const override { return scale_; }
    std::optional<Vec2> monitor_size_px() const override { return monitor_size_; }
    std::string         title() const override { return title_; }
    std::optional<bool> is_minimized() const override { return minimized_; }
    bool                is_maximized() const override { return maximized_; }
    bool                is_fullscreen() const override { return fullscreen_; }
    bool                has_focus() const override { return focused_; }

    void set_title(const std::string& title) override { title_ = title; }
    void set_inner_size(Vec2 size) override;
    void set_min_inner_size(std::optional<Vec2> size) override { min_size_ = size; }
    void set_max_inner_size(std::optional<Vec2> size) override { max_size_ = size; }
    void set_outer_position(Vec2 pos) override { position_ = pos * scale_; }
    void set_visible(bool visible) override { visible_ = visible; }
    void set_transparent(bool transparent) override { transparent_ = transparent; }
    void set_resizable(bool resizable) override { resizable_ = resizable; }
    void set_minimized(bool minimized) override { minimized_ = minimized; }
    void set_maximized(bool maximized) override { maximized_ = maximized; }
    void set_fullscreen(bool fullscreen) override { fullscreen_ = fullscreen; }
    void set_decorations(bool decorations) override { decorations_ = decorations; }
    void set_window_level(WindowLevel level) override { level_ = level; }
    void set_icon(const IconData* icon) override;
    void focus() override { focused_ = true; }
    void request_user_attention() override { attention_requests_++; }
    bool drag_window() override;
    void set_cursor_icon(CursorIcon icon) override { cursor_ = icon; }
    void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
    bool set_cursor_position(Vec2 pos) override;
    bool set_mouse_passthrough(bool passthrough) override;
    void request_redraw() override;

    void* native_handle() const override { return const_cast<HeadlessWindow*>(this); }

    // Simulated platform state changes.
    void set_focused(bool focused) { focused_ = focused; }
    void set_scale(float scale) { scale_ = scale; }

    bool                visible() const { return visible_; }
    bool                transparent() const { return transparent_; }
    bool                resizable() const { return resizable_; }
    bool                decorations() const { return decorations_; }
    WindowLevel         window_level() const { return level_; }
    WindowType          window_type() const { return type_; }
    CursorIcon          cursor() const { return cursor_; }
    bool                cursor_visible() const { return cursor_visible_; }
    bool                mouse_passthrough() const { return passthrough_; }
    std::optional<Vec2> min_inner_size() const { return min_size_; }
    std::optional<Vec2> max_inner_size() const { return max_size_; }
    std::optional<Vec2> cursor_position() const { return cursor_pos_; }
    uint32_t            icon_width() const { return icon_width_; }
    uint32_t            drag_count() const { return drags_; }
    uint32_t            redraw_requests() const { return redraw_requests_; }
    uint32_t            attention_requests() const { return attention_requests_; }

   private:
    std::shared_ptr<HeadlessDevice> device_;
    WindowId                        id_;
    std::string                     title_;
    SizePx                          size_;
    Vec2                            position_;
    float                           scale_;
    std::optional<Vec2>             monitor_size_;
    std::optional<Vec2>             min_size_;
    std::optional<Vec2>             max_size_;
    std::optional<Vec2>             cursor_pos_;
    WindowLevel                     level_  = WindowLevel::Normal;
    WindowType                      type_   = WindowType::Normal;
    CursorIcon                      cursor_ = CursorIcon::Default;

    bool minimized_      = false;
    bool maximized_      = false;
    bool fullscreen_     = false;
    bool focused_        = false;
    bool visible_        = true;
    bool transparent_    = false;
    bool resizable_      = true;
    bool decorations_    = true;
    bool cursor_visible_ = true;
    bool passthrough_    = false;

    uint32_t icon_width_         = 0;
    uint32_t drags_              = 0;
    uint32_t redraw_requests_    = 0;
    uint32_t attention_requests_ = 0;
};

// ─── Surface / context / painter ─────────────────────────────────────────────

// CPU-side RGBA8 double buffer.
class HeadlessSurface : public Surface
{
   public:
    HeadlessSurface(std::shared_ptr<HeadlessDevice> device, WindowId window, SizePx size);
    ~HeadlessSurface() override;

    SizePx size_px() const override { return size_; }
    void   resize(SizePx size) override;
    bool   present() override;

    void fill(Rgba color);

    // Makes every following present fail, as a lost surface would.
    void set_lost(bool lost) { lost_ = lost; }

    uint64_t                    serial() const { return serial_; }
    WindowId                    window() const { return window_; }
    bool                        vsync() const { return vsync_; }
    void                        set_vsync(bool vsync) { vsync_ = vsync; }
    const std::vector<uint8_t>& front_buffer() const { return front_; }

   private:
    std::shared_ptr<HeadlessDevice> device_;
    uint64_t                        serial_;
    WindowId                        window_;
    SizePx                          size_;
    std::vector<uint8_t>            back_;
    std::vector<uint8_t>            front_;
    bool                            lost_  = false;
    bool                            vsync_ = true;
};

class HeadlessContext : public GraphicsContext
{
   public:
    explicit HeadlessContext(std::shared_ptr<HeadlessDevice> device);

    std::unique_ptr<Surface> create_surface(NativeWindow& window, SizePx size) override;
    bool                     make_current(Surface& surface) override;
    bool                     make_not_current() override;
    bool                     set_swap_interval(Surface& surface, bool vsync) override;

   protected:
    std::shared_ptr<HeadlessDevice> device_;
};

class HeadlessPainter : public Painter
{
   public:
    explicit HeadlessPainter(std::shared_ptr<HeadlessDevice> device);

    void clear(SizePx size, Rgba color) override;
    void paint(SizePx                               size,
               float                                pixels_per_point,
               const std::vector<ClippedPrimitive>& primitives) override;
    std::optional<ColorImage> read_screen_rgba(SizePx size) override;

    uint64_t meshes_seen() const { return meshes_; }

   private:
    std::shared_ptr<HeadlessDevice> device_;
    uint64_t                        meshes_ = 0;
};

// ─── Platform ────────────────────────────────────────────────────────────────

// In-process platform with no display: windows are plain objects and events
// come from push_event(). Used for CI runs and the whole unit test suite.
class HeadlessPlatform : public Platform
{
   public:
    explicit HeadlessPlatform(HeadlessOptions options = {});

    const char* name() const override { return "headless"; }

    std::unique_ptr<NativeWindow>    create_window(const ViewportAttributes& attributes) override;
    std::unique_ptr<GraphicsContext> create_context(const ContextConfig& config) override;
    std::unique_ptr<Painter>         create_painter(GraphicsContext& context) override;

    std::optional<std::string> clipboard_text() override { return clipboard_; }
    void set_clipboard_text(const std::string& text) override { clipboard_ = text; }

    bool pump_events(std::chrono::milliseconds timeout, std::vector<PlatformEvent>& out) override;

    void push_event(PlatformEvent event) { device_->events.push_back(std::move(event)); }
    void push_window_event(WindowId window, WindowEvent event)
    {
        device_->events.push_back(PlatformEvent::for_window(window, event));
    }
    bool has_queued_events() const { return !device_->events.empty(); }

    void set_max_windows(size_t max) { options_.max_windows = max; }

    HeadlessDevice&      device() { return *device_; }
    const HeadlessStats& stats() const { return device_->stats; }
    size_t               live_windows() const;
    size_t               live_surfaces() const;

   protected:
    std::shared_ptr<HeadlessDevice> device_;

   private:
    HeadlessOptions            options_;
    std::optional<std::string> clipboard_;
    bool                       resumed_sent_ = false;
};

}   // namespace casement
