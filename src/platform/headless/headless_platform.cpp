#include "headless_platform.hpp"

#include <algorithm>
#include <casement/errors.hpp>
#include <casement/logger.hpp>
#include <cmath>

namespace casement
{

namespace
{

uint8_t to_byte(float v)
{
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

}   // namespace

void HeadlessDevice::record(HeadlessDrawCall::Op op, uint64_t surface)
{
    if (draw_log.size() >= DRAW_LOG_CAPACITY)
        draw_log.pop_front();
    draw_log.push_back({op, surface});
}

// ─── HeadlessWindow ──────────────────────────────────────────────────────────

HeadlessWindow::HeadlessWindow(std::shared_ptr<HeadlessDevice> device,
                               const ViewportAttributes&       attributes,
                               const HeadlessOptions&          options)
    : device_(std::move(device)), id_(device_->next_window_id++),
      title_(attributes.title.value_or("casement")), size_(options.default_size),
      scale_(options.scale_factor), monitor_size_(options.monitor_size * options.scale_factor)
{
    if (attributes.inner_size)
        size_ = to_pixels(*attributes.inner_size, scale_).at_least_one();
    if (attributes.position)
        position_ = *attributes.position * scale_;

    min_size_    = attributes.min_inner_size;
    max_size_    = attributes.max_inner_size;
    maximized_   = attributes.maximized.value_or(false);
    fullscreen_  = attributes.fullscreen.value_or(false);
    visible_     = attributes.visible.value_or(true);
    transparent_ = attributes.transparent.value_or(false);
    resizable_   = attributes.resizable.value_or(true);
    decorations_ = attributes.decorations.value_or(true);
    passthrough_ = attributes.mouse_passthrough.value_or(false);
    level_       = attributes.window_level.value_or(WindowLevel::Normal);
    type_        = attributes.window_type.value_or(WindowType::Normal);
    if (attributes.icon)
        icon_width_ = attributes.icon->width;

    device_->stats.windows_created++;
}

HeadlessWindow::~HeadlessWindow()
{
    device_->stats.windows_destroyed++;
}

SizePx HeadlessWindow::inner_size_px() const
{
    // Minimized windows report an empty client area.
    return minimized_ ? SizePx{0, 0} : size_;
}

SizePx HeadlessWindow::outer_size_px() const
{
    SizePx inner = inner_size_px();
    if (!decorations_ || inner.is_empty())
        return inner;
    return {inner.width, inner.height + static_cast<uint32_t>(30.0f * scale_)};
}

std::optional<Vec2> HeadlessWindow::inner_position_px() const
{
    if (!decorations_)
        return position_;
    return position_ + Vec2{0.0f, 30.0f * scale_};
}

std::optional<Vec2> HeadlessWindow::outer_position_px() const
{
    return position_;
}

void HeadlessWindow::set_inner_size(Vec2 size)
{
    SizePx px = to_pixels(size, scale_).at_least_one();
    if (min_size_)
    {
        SizePx lo = to_pixels(*min_size_, scale_);
        px        = {std::max(px.width, lo.width), std::max(px.height, lo.height)};
    }
    if (max_size_)
    {
        SizePx hi = to_pixels(*max_size_, scale_).at_least_one();
        px        = {std::min(px.width, hi.width), std::min(px.height, hi.height)};
    }
    size_ = px;
}

void HeadlessWindow::set_icon(const IconData* icon)
{
    icon_width_ = icon ? icon->width : 0;
}

bool HeadlessWindow::drag_window()
{
    if (!focused_)
        return false;
    drags_++;
    return true;
}

void HeadlessWindow::request_redraw()
{
    redraw_requests_++;
    device_->events.push_back(PlatformEvent::for_window(id_, WindowEvent::redraw_requested()));
}

bool HeadlessWindow::set_cursor_position(Vec2 pos)
{
    cursor_pos_ = pos;
    return true;
}

bool HeadlessWindow::set_mouse_passthrough(bool passthrough)
{
    passthrough_ = passthrough;
    return true;
}

// ─── HeadlessSurface ─────────────────────────────────────────────────────────

HeadlessSurface::HeadlessSurface(std::shared_ptr<HeadlessDevice> device, WindowId window, SizePx size)
    : device_(std::move(device)), serial_(device_->next_surface_serial++), window_(window), size_(size),
      back_(static_cast<size_t>(size.width) * size.height * 4, 0),
      front_(static_cast<size_t>(size.width) * size.height * 4, 0)
{
    device_->stats.surfaces_created++;
}

HeadlessSurface::~HeadlessSurface()
{
    if (device_->current == this)
    {
        CASEMENT_LOG_WARN("headless", "Surface {} destroyed while current", serial_);
        device_->current = nullptr;
    }
    device_->stats.surfaces_destroyed++;
}

void HeadlessSurface::resize(SizePx size)
{
    if (device_->current != this)
        CASEMENT_LOG_WARN("headless", "Resizing surface {} that is not current", serial_);

    size_ = size.at_least_one();
    back_.assign(static_cast<size_t>(size_.width) * size_.height * 4, 0);
    front_.assign(back_.size(), 0);
    device_->stats.resizes++;
}

bool HeadlessSurface::present()
{
    if (lost_ || device_->current != this)
    {
        device_->stats.failed_presents++;
        return false;
    }
    front_ = back_;
    device_->stats.presents++;
    device_->record(HeadlessDrawCall::Op::Present, serial_);
    return true;
}

void HeadlessSurface::fill(Rgba color)
{
    const uint8_t px[4] = {to_byte(color.r), to_byte(color.g), to_byte(color.b), to_byte(color.a)};
    for (size_t i = 0; i + 3 < back_.size(); i += 4)
    {
        back_[i + 0] = px[0];
        back_[i + 1] = px[1];
        back_[i + 2] = px[2];
        back_[i + 3] = px[3];
    }
}

// ─── HeadlessContext ─────────────────────────────────────────────────────────

HeadlessContext::HeadlessContext(std::shared_ptr<HeadlessDevice> device) : device_(std::move(device))
{
}

std::unique_ptr<Surface> HeadlessContext::create_surface(NativeWindow& window, SizePx size)
{
    if (size.is_empty())
        throw SurfaceCreationError("headless: zero-sized surface");
    return std::make_unique<HeadlessSurface>(device_, window.id(), size);
}

bool HeadlessContext::make_current(Surface& surface)
{
    device_->current = static_cast<HeadlessSurface*>(&surface);
    device_->stats.make_current_calls++;
    return true;
}

bool HeadlessContext::make_not_current()
{
    device_->current = nullptr;
    device_->stats.make_not_current_calls++;
    return true;
}

bool HeadlessContext::set_swap_interval(Surface& surface, bool vsync)
{
    static_cast<HeadlessSurface&>(surface).set_vsync(vsync);
    return true;
}

// ─── HeadlessPainter ─────────────────────────────────────────────────────────

HeadlessPainter::HeadlessPainter(std::shared_ptr<HeadlessDevice> device) : device_(std::move(device))
{
}

void HeadlessPainter::clear(SizePx /*size*/, Rgba color)
{
    HeadlessSurface* target = device_->current;
    if (!target)
    {
        CASEMENT_LOG_WARN("headless", "clear with no current surface");
        return;
    }
    target->fill(color);
    device_->stats.clears++;
    device_->record(HeadlessDrawCall::Op::Clear, target->serial());
}

void HeadlessPainter::paint(SizePx                               size,
                            float                                pixels_per_point,
                            const std::vector<ClippedPrimitive>& primitives)
{
    HeadlessSurface* target = device_->current;
    if (!target)
    {
        CASEMENT_LOG_WARN("headless", "paint with no current surface");
        return;
    }

    for (const auto& prim : primitives)
    {
        if (const auto* callback = std::get_if<std::shared_ptr<PaintCallback>>(&prim.primitive))
        {
            if (*callback)
            {
                (*callback)->paint({.clip_rect        = prim.clip_rect,
                                    .screen_size_px   = size,
                                    .pixels_per_point = pixels_per_point,
                                    .native_encoder   = target});
            }
        }
        else
        {
            meshes_++;
        }
    }

    device_->stats.paints++;
    device_->record(HeadlessDrawCall::Op::Paint, target->serial());
}

std::optional<ColorImage> HeadlessPainter::read_screen_rgba(SizePx /*size*/)
{
    HeadlessSurface* target = device_->current;
    if (!target)
        return std::nullopt;
    return ColorImage{target->size_px(), target->front_buffer()};
}

// ─── HeadlessPlatform ────────────────────────────────────────────────────────

HeadlessPlatform::HeadlessPlatform(HeadlessOptions options)
    : device_(std::make_shared<HeadlessDevice>()), options_(options)
{
}

std::unique_ptr<NativeWindow> HeadlessPlatform::create_window(const ViewportAttributes& attributes)
{
    if (options_.max_windows > 0 && live_windows() >= options_.max_windows)
    {
        throw SurfaceCreationError("headless: window limit of " + std::to_string(options_.max_windows)
                                   + " reached");
    }
    return std::make_unique<HeadlessWindow>(device_, attributes, options_);
}

std::unique_ptr<GraphicsContext> HeadlessPlatform::create_context(const ContextConfig& /*config*/)
{
    return std::make_unique<HeadlessContext>(device_);
}

std::unique_ptr<Painter> HeadlessPlatform::create_painter(GraphicsContext& /*context*/)
{
    return std::make_unique<HeadlessPainter>(device_);
}

bool HeadlessPlatform::pump_events(std::chrono::milliseconds /*timeout*/, std::vector<PlatformEvent>& out)
{
    size_t before = out.size();
    if (!resumed_sent_)
    {
        resumed_sent_ = true;
        out.push_back(PlatformEvent::resumed());
    }
    while (!device_->events.empty())
    {
        out.push_back(std::move(device_->events.front()));
        device_->events.pop_front();
    }
    return out.size() > before;
}

size_t HeadlessPlatform::live_windows() const
{
    return static_cast<size_t>(device_->stats.windows_created - device_->stats.windows_destroyed);
}

size_t HeadlessPlatform::live_surfaces() const
{
    return static_cast<size_t>(device_->stats.surfaces_created - device_->stats.surfaces_destroyed);
}

}   // namespace casement
