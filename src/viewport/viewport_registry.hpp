#pragma once

#include <casement/platform.hpp>
#include <casement/viewport.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "viewport_record.hpp"

namespace casement
{

class ContextCell;

struct RegistryOptions
{
    bool vsync = true;
};

// Owns every viewport record and keeps the window-id <-> viewport-id maps in
// step with them. Reached reentrantly from nested immediate renders, so callers
// must re-resolve records by id after any call into the UI layer.
class ViewportRegistry
{
   public:
    ViewportRegistry(Platform& platform, std::shared_ptr<ContextCell> context, RegistryOptions options = {});
    ~ViewportRegistry();

    ViewportRegistry(const ViewportRegistry&)            = delete;
    ViewportRegistry& operator=(const ViewportRegistry&) = delete;

    ViewportRecord& insert_root(const ViewportAttributes& attributes);

    // Creates the window, input adapter and surface a record is missing.
    // Throws SurfaceCreationError; ContextBindError passes through.
    void initialize(ViewportId id);

    // initialize() for every record; failures are logged and counted.
    size_t initialize_all();

    // Insert-or-patch one record without touching the rest.
    ViewportRecord& initialize_or_update(ViewportId                                id,
                                         ViewportId                                parent,
                                         ViewportClass                             viewport_class,
                                         ViewportAttributes                        attributes,
                                         std::shared_ptr<const ViewportUiCallback> ui);

    // Bring the registry in line with the UI's declared viewports, then drop
    // every record the declaration no longer mentions.
    void reconcile(const ViewportOutputMap& desired);
    void remove_viewports_not_in(const ViewportOutputMap& desired);

    void release_window(ViewportRecord& record);
    void release_all_windows();

    bool resize(ViewportId id, SizePx size);

    ViewportRecord*       find(ViewportId id);
    const ViewportRecord* find(ViewportId id) const;
    ViewportRecord*       find_by_window(WindowId window_id);

    std::optional<ViewportId> viewport_for_window(WindowId window_id) const;
    std::optional<WindowId>   window_for_viewport(ViewportId id) const;

    bool                    contains(ViewportId id) const { return viewports_.count(id) > 0; }
    size_t                  size() const { return viewports_.size(); }
    std::vector<ViewportId> ids() const;
    size_t                  window_mapping_count() const { return viewport_from_window_.size(); }

    ViewportInfoMap info_snapshot() const;

    // Follows `parent` through the stored records. Returns ROOT_VIEWPORT with a
    // warning when the chain reaches an unknown viewport or loops back on
    // itself (including `parent == id`), otherwise `parent`.
    ViewportId resolve_stored_parent(ViewportId id, ViewportId parent) const;

    std::optional<ViewportId> focused_viewport() const { return focused_viewport_; }
    void set_focused_viewport(std::optional<ViewportId> id) { focused_viewport_ = id; }

    ContextCell& context() { return *context_; }
    Platform&    platform() { return platform_; }

   private:
    using ParentLookup = std::function<std::optional<ViewportId>(ViewportId)>;

    ViewportId resolve_parent(ViewportId id, ViewportId parent, const ViewportOutputMap& desired) const;
    ViewportId walk_parent_chain(ViewportId id, ViewportId parent, const ParentLookup& parent_of) const;
    void       apply_deferred_commands(ViewportRecord& record);

    Platform&                    platform_;
    std::shared_ptr<ContextCell> context_;
    RegistryOptions              options_;

    std::map<ViewportId, std::unique_ptr<ViewportRecord>> viewports_;
    std::unordered_map<WindowId, ViewportId>              viewport_from_window_;
    std::unordered_map<ViewportId, WindowId>              window_from_viewport_;
    std::optional<ViewportId>                             focused_viewport_;
};

}   // namespace casement
