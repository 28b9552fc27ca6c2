#include "viewport_registry.hpp"

#include <casement/errors.hpp>
#include <casement/logger.hpp>
#include <set>

#include "render/context_cell.hpp"
#include "viewport_commands.hpp"

namespace casement
{

ViewportRegistry::ViewportRegistry(Platform&                    platform,
                                   std::shared_ptr<ContextCell> context,
                                   RegistryOptions              options)
    : platform_(platform), context_(std::move(context)), options_(options)
{
}

ViewportRegistry::~ViewportRegistry()
{
    try
    {
        release_all_windows();
    }
    catch (const ContextBindError& e)
    {
        CASEMENT_LOG_ERROR("registry", "Releasing windows at shutdown failed: {}", e.what());
    }
}

ViewportRecord& ViewportRegistry::insert_root(const ViewportAttributes& attributes)
{
    return initialize_or_update(ROOT_VIEWPORT, ROOT_VIEWPORT, ViewportClass::Root, attributes, nullptr);
}

// ─── Creation ────────────────────────────────────────────────────────────────

void ViewportRegistry::initialize(ViewportId id)
{
    ViewportRecord* record = find(id);
    if (!record)
    {
        CASEMENT_LOG_WARN("registry", "initialize: unknown viewport {}", id.value);
        return;
    }

    if (!record->window_handle)
    {
        record->window_handle = platform_.create_window(record->requested_attributes);
        update_viewport_info(record->actual_info, *record->window_handle);
        CASEMENT_LOG_INFO("registry",
                          "Created window {} for {} viewport {}",
                          record->window_handle->id(),
                          viewport_class_name(record->viewport_class),
                          id.value);
    }

    NativeWindow& window = *record->window_handle;

    if (!record->input_adapter)
    {
        record->input_adapter =
            std::make_unique<InputAdapter>(id, window.scale_factor(), &platform_);
    }

    if (!record->surface)
    {
        auto surface = context_->create_surface(window, window.inner_size_px().at_least_one());
        context_->rebind(*surface);
        if (!context_->set_swap_interval(*surface, options_.vsync))
        {
            CASEMENT_LOG_WARN("registry",
                              "Failed to set swap interval on viewport {}",
                              id.value);
        }
        record->surface = std::move(surface);
    }

    viewport_from_window_[window.id()] = id;
    window_from_viewport_[id]          = window.id();
}

size_t ViewportRegistry::initialize_all()
{
    size_t failures = 0;
    for (ViewportId id : ids())
    {
        try
        {
            initialize(id);
        }
        catch (const SurfaceCreationError& e)
        {
            failures++;
            CASEMENT_LOG_ERROR("registry",
                               "Failed to initialize viewport {}: {}",
                               id.value,
                               e.what());
        }
    }
    return failures;
}

ViewportRecord& ViewportRegistry::initialize_or_update(ViewportId                                id,
                                                       ViewportId                                parent,
                                                       ViewportClass                             viewport_class,
                                                       ViewportAttributes                        attributes,
                                                       std::shared_ptr<const ViewportUiCallback> ui)
{
    if (!attributes.icon)
    {
        if (const ViewportRecord* parent_record = find(parent); parent_record && parent != id)
            attributes.icon = parent_record->requested_attributes.icon;
    }

    if (id == ROOT_VIEWPORT)
    {
        viewport_class = ViewportClass::Root;
        parent         = ROOT_VIEWPORT;
    }

    auto it = viewports_.find(id);
    if (it == viewports_.end())
    {
        auto record                  = std::make_unique<ViewportRecord>();
        record->id                   = id;
        record->parent_id            = parent;
        record->viewport_class       = viewport_class;
        record->requested_attributes = std::move(attributes);
        record->actual_info.parent   = parent;
        record->render_callback      = std::move(ui);

        CASEMENT_LOG_DEBUG("registry",
                           "Declared {} viewport {} (parent {})",
                           viewport_class_name(viewport_class),
                           id.value,
                           parent.value);

        auto [inserted, ok] = viewports_.emplace(id, std::move(record));
        return *inserted->second;
    }

    ViewportRecord& record    = *it->second;
    record.parent_id          = parent;
    record.actual_info.parent = parent;

    auto delta = record.requested_attributes.patch(attributes);
    if (delta.recreate)
    {
        CASEMENT_LOG_DEBUG("registry", "Recreating window of viewport {}", id.value);
        release_window(record);
    }
    else if (record.window_handle)
    {
        record.deferred_commands.insert(record.deferred_commands.end(),
                                        delta.commands.begin(),
                                        delta.commands.end());
    }

    record.viewport_class  = viewport_class;
    record.render_callback = std::move(ui);
    return record;
}

// ─── Reconciliation ──────────────────────────────────────────────────────────

void ViewportRegistry::reconcile(const ViewportOutputMap& desired)
{
    for (const auto& [id, output] : desired)
    {
        ViewportId      parent = resolve_parent(id, output.parent, desired);
        ViewportRecord& record =
            initialize_or_update(id, parent, output.viewport_class, output.attributes, output.ui);

        record.deferred_commands.insert(record.deferred_commands.end(),
                                        output.commands.begin(),
                                        output.commands.end());
        apply_deferred_commands(record);
    }

    remove_viewports_not_in(desired);
}

void ViewportRegistry::apply_deferred_commands(ViewportRecord& record)
{
    if (!record.window_handle || record.deferred_commands.empty())
        return;

    NativeWindow& window  = *record.window_handle;
    SizePx        before  = window.inner_size_px();
    auto          pending = std::move(record.deferred_commands);
    record.deferred_commands.clear();

    process_viewport_commands(record.actual_info,
                              pending,
                              window,
                              focused_viewport_ == record.id,
                              record.actions_requested);

    // Some compositors never send a resize event for programmatic resizes.
    SizePx after = window.inner_size_px();
    if (after != before && !after.is_empty() && record.surface)
    {
        context_->rebind(*record.surface);
        record.surface->resize(after);
    }
}

void ViewportRegistry::remove_viewports_not_in(const ViewportOutputMap& desired)
{
    for (auto it = viewports_.begin(); it != viewports_.end();)
    {
        ViewportId id = it->first;
        if (id == ROOT_VIEWPORT || desired.count(id) > 0)
        {
            ++it;
            continue;
        }

        release_window(*it->second);
        if (focused_viewport_ == id)
            focused_viewport_.reset();
        CASEMENT_LOG_DEBUG("registry", "Removed viewport {}", id.value);
        it = viewports_.erase(it);
    }
}

ViewportId ViewportRegistry::resolve_parent(ViewportId               id,
                                            ViewportId               parent,
                                            const ViewportOutputMap& desired) const
{
    return walk_parent_chain(id,
                             parent,
                             [&desired](ViewportId cursor) -> std::optional<ViewportId>
                             {
                                 auto it = desired.find(cursor);
                                 if (it == desired.end())
                                     return std::nullopt;
                                 return it->second.parent;
                             });
}

ViewportId ViewportRegistry::resolve_stored_parent(ViewportId id, ViewportId parent) const
{
    return walk_parent_chain(id,
                             parent,
                             [this](ViewportId cursor) -> std::optional<ViewportId>
                             {
                                 const ViewportRecord* record = find(cursor);
                                 if (!record)
                                     return std::nullopt;
                                 return record->parent_id;
                             });
}

ViewportId ViewportRegistry::walk_parent_chain(ViewportId          id,
                                               ViewportId          parent,
                                               const ParentLookup& parent_of) const
{
    if (id == ROOT_VIEWPORT)
        return ROOT_VIEWPORT;

    std::set<ViewportId> visited{id};
    ViewportId           cursor = parent;
    while (cursor != ROOT_VIEWPORT)
    {
        if (!visited.insert(cursor).second)
        {
            CASEMENT_LOG_WARN("registry",
                              "Viewport {} has a cyclic parent chain, attaching it to the root",
                              id.value);
            return ROOT_VIEWPORT;
        }
        std::optional<ViewportId> next = parent_of(cursor);
        if (!next)
        {
            CASEMENT_LOG_WARN("registry",
                              "Viewport {} names undeclared parent {}, attaching it to the root",
                              id.value,
                              cursor.value);
            return ROOT_VIEWPORT;
        }
        cursor = *next;
    }
    return parent;
}

// ─── Teardown ────────────────────────────────────────────────────────────────

void ViewportRegistry::release_window(ViewportRecord& record)
{
    if (record.surface)
    {
        context_->forget_surface(*record.surface);
        record.surface.reset();
    }
    record.input_adapter.reset();

    if (record.window_handle)
    {
        WindowId window_id = record.window_handle->id();
        viewport_from_window_.erase(window_id);
        window_from_viewport_.erase(record.id);
        record.window_handle.reset();
        CASEMENT_LOG_DEBUG("registry",
                           "Released window {} of viewport {}",
                           window_id,
                           record.id.value);
    }
}

void ViewportRegistry::release_all_windows()
{
    for (auto& [id, record] : viewports_)
    {
        release_window(*record);
    }
    focused_viewport_.reset();
}

bool ViewportRegistry::resize(ViewportId id, SizePx size)
{
    ViewportRecord* record = find(id);
    if (!record || !record->surface || size.is_empty())
        return false;

    context_->rebind(*record->surface);
    record->surface->resize(size);
    return true;
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

ViewportRecord* ViewportRegistry::find(ViewportId id)
{
    auto it = viewports_.find(id);
    return it == viewports_.end() ? nullptr : it->second.get();
}

const ViewportRecord* ViewportRegistry::find(ViewportId id) const
{
    auto it = viewports_.find(id);
    return it == viewports_.end() ? nullptr : it->second.get();
}

ViewportRecord* ViewportRegistry::find_by_window(WindowId window_id)
{
    auto id = viewport_for_window(window_id);
    return id ? find(*id) : nullptr;
}

std::optional<ViewportId> ViewportRegistry::viewport_for_window(WindowId window_id) const
{
    auto it = viewport_from_window_.find(window_id);
    if (it == viewport_from_window_.end())
        return std::nullopt;
    return it->second;
}

std::optional<WindowId> ViewportRegistry::window_for_viewport(ViewportId id) const
{
    auto it = window_from_viewport_.find(id);
    if (it == window_from_viewport_.end())
        return std::nullopt;
    return it->second;
}

std::vector<ViewportId> ViewportRegistry::ids() const
{
    std::vector<ViewportId> out;
    out.reserve(viewports_.size());
    for (const auto& [id, record] : viewports_)
        out.push_back(id);
    return out;
}

ViewportInfoMap ViewportRegistry::info_snapshot() const
{
    ViewportInfoMap infos;
    for (const auto& [id, record] : viewports_)
        infos.emplace(id, record->actual_info);
    return infos;
}

}   // namespace casement
