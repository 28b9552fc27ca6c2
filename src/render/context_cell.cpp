#include "context_cell.hpp"

#include <casement/errors.hpp>
#include <casement/logger.hpp>

namespace casement
{

ContextCell::ContextCell(std::unique_ptr<GraphicsContext> context)
    : state_(NotCurrent{std::move(context)})
{
    if (!std::get<NotCurrent>(state_).context)
        throw ContextBindError("context cell constructed without a context");
}

ContextCell::~ContextCell()
{
    try
    {
        unbind();
    }
    catch (const ContextBindError& e)
    {
        CASEMENT_LOG_ERROR("context", "Releasing context at shutdown failed: {}", e.what());
    }
}

GraphicsContext& ContextCell::graphics()
{
    if (auto* current = std::get_if<Current>(&state_))
        return *current->context;
    return *std::get<NotCurrent>(state_).context;
}

void ContextCell::bind(Surface& surface)
{
    auto* not_current = std::get_if<NotCurrent>(&state_);
    if (!not_current)
        throw ContextBindError("bind: context is already current against another surface");

    if (!not_current->context->make_current(surface))
        throw ContextBindError("make_current failed");

    auto context = std::move(not_current->context);
    state_.emplace<Current>(Current{std::move(context), &surface});
    bind_count_++;
    CASEMENT_LOG_TRACE("context", "bound");
}

void ContextCell::rebind(Surface& surface)
{
    if (skip_redundant_rebind_ && is_current_against(surface))
        return;
    unbind();
    bind(surface);
}

void ContextCell::unbind()
{
    auto* current = std::get_if<Current>(&state_);
    if (!current)
        return;

    if (!current->context->make_not_current())
        throw ContextBindError("make_not_current failed");

    auto context = std::move(current->context);
    state_.emplace<NotCurrent>(NotCurrent{std::move(context)});
    unbind_count_++;
    CASEMENT_LOG_TRACE("context", "unbound");
}

void ContextCell::release_for_suspend()
{
    if (is_current())
        CASEMENT_LOG_DEBUG("context", "Releasing context for suspend");
    unbind();
}

void ContextCell::forget_surface(const Surface& surface)
{
    if (is_current_against(surface))
        unbind();
}

std::unique_ptr<Surface> ContextCell::create_surface(NativeWindow& window, SizePx size)
{
    return graphics().create_surface(window, size.at_least_one());
}

bool ContextCell::set_swap_interval(Surface& surface, bool vsync)
{
    return graphics().set_swap_interval(surface, vsync);
}

bool ContextCell::is_current() const
{
    return std::holds_alternative<Current>(state_);
}

bool ContextCell::is_current_against(const Surface& surface) const
{
    auto* current = std::get_if<Current>(&state_);
    return current && current->surface == &surface;
}

const Surface* ContextCell::bound_surface() const
{
    auto* current = std::get_if<Current>(&state_);
    return current ? current->surface : nullptr;
}

}   // namespace casement
