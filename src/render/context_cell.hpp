#pragma once

#include <casement/platform.hpp>
#include <cstdint>
#include <memory>
#include <variant>

namespace casement
{

// Sole owner of the shared graphics context. The context is either bound to
// exactly one surface or to none; the two shapes are distinct variant
// alternatives, so "current without a surface" cannot be represented.
class ContextCell
{
   public:
    explicit ContextCell(std::unique_ptr<GraphicsContext> context);
    ~ContextCell();

    ContextCell(const ContextCell&)            = delete;
    ContextCell& operator=(const ContextCell&) = delete;

    // Requires NotCurrent. Throws ContextBindError.
    void bind(Surface& surface);

    // unbind() + bind(surface). Skips both platform calls when already current
    // against `surface` and redundant rebinds are being skipped.
    void rebind(Surface& surface);

    // No-op when already NotCurrent. Throws ContextBindError.
    void unbind();

    void release_for_suspend();

    // Call before destroying `surface`; unbinds if it is the bound one.
    void forget_surface(const Surface& surface);

    std::unique_ptr<Surface> create_surface(NativeWindow& window, SizePx size);
    bool                     set_swap_interval(Surface& surface, bool vsync);

    bool           is_current() const;
    bool           is_current_against(const Surface& surface) const;
    const Surface* bound_surface() const;

    // The context itself, whichever state holds it. Not for binding.
    GraphicsContext& graphics();

    void set_skip_redundant_rebind(bool skip) { skip_redundant_rebind_ = skip; }

    uint64_t bind_count() const { return bind_count_; }
    uint64_t unbind_count() const { return unbind_count_; }

   private:
    struct NotCurrent
    {
        std::unique_ptr<GraphicsContext> context;
    };
    struct Current
    {
        std::unique_ptr<GraphicsContext> context;
        Surface*                         surface;
    };

    std::variant<NotCurrent, Current> state_;
    bool                              skip_redundant_rebind_ = true;
    uint64_t                          bind_count_            = 0;
    uint64_t                          unbind_count_          = 0;
};

}   // namespace casement
