#include <algorithm>
#include <casement/errors.hpp>
#include <casement/logger.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>

#include "render/context_cell.hpp"
#include "util/test_platform.hpp"
#include "viewport/viewport_registry.hpp"

using namespace casement;
using namespace casement::test;

// ═══════════════════════════════════════════════════════════════════════════════
// ViewportRegistry: reconcile keeps exactly the declared key set, windows are
// created lazily, and the window-id maps follow the records.
// ═══════════════════════════════════════════════════════════════════════════════

namespace
{

const ViewportId A = ViewportId::from_name("a");
const ViewportId B = ViewportId::from_name("b");
const ViewportId C = ViewportId::from_name("c");

ViewportOutput deferred(ViewportId parent = ROOT_VIEWPORT, ViewportAttributes attributes = {})
{
    return {.parent         = parent,
            .viewport_class = ViewportClass::Deferred,
            .attributes     = std::move(attributes),
            .ui             = std::make_shared<const ViewportUiCallback>([](ImmediateRenderer&) {})};
}

ViewportOutput root_output()
{
    return {.parent = ROOT_VIEWPORT, .viewport_class = ViewportClass::Root};
}

}   // namespace

class ViewportRegistryTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Debug);
        Logger::instance().add_sink(log_.sink());

        context_  = std::make_shared<ContextCell>(platform_.create_context({}));
        registry_ = std::make_unique<ViewportRegistry>(platform_, context_);
        registry_->insert_root(ViewportAttributes{}.with_title("root"));
        registry_->initialize(ROOT_VIEWPORT);
    }

    void TearDown() override
    {
        platform_.faults() = {};
        registry_.reset();
        context_.reset();
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    void reconcile(const ViewportOutputMap& desired)
    {
        registry_->reconcile(desired);
        registry_->initialize_all();
    }

    std::set<ViewportId> id_set() const
    {
        auto ids = registry_->ids();
        return {ids.begin(), ids.end()};
    }

    size_t live_window_records() const
    {
        size_t n = 0;
        for (ViewportId id : registry_->ids())
            n += registry_->find(id)->has_window() ? 1 : 0;
        return n;
    }

    FlakyPlatform                     platform_;
    std::shared_ptr<ContextCell>      context_;
    std::unique_ptr<ViewportRegistry> registry_;
    sinks::MemorySink                 log_{256};
};

// ─── Root ───────────────────────────────────────────────────────────────────

TEST_F(ViewportRegistryTest, RootIsInitialized)
{
    ViewportRecord* root = registry_->find(ROOT_VIEWPORT);
    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(root->is_initialized());
    EXPECT_EQ(root->viewport_class, ViewportClass::Root);
    EXPECT_EQ(registry_->viewport_for_window(root->window_handle->id()), ROOT_VIEWPORT);
    EXPECT_EQ(registry_->window_mapping_count(), 1u);
    EXPECT_EQ(root->actual_info.title, "root");
}

TEST_F(ViewportRegistryTest, InitializeIsIdempotent)
{
    registry_->initialize(ROOT_VIEWPORT);
    registry_->initialize(ROOT_VIEWPORT);

    EXPECT_EQ(platform_.stats().windows_created, 1u);
    EXPECT_EQ(platform_.stats().surfaces_created, 1u);
}

TEST_F(ViewportRegistryTest, InitializeUnknownViewportIsHarmless)
{
    registry_->initialize(A);
    EXPECT_FALSE(registry_->contains(A));
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "unknown viewport"));
}

TEST_F(ViewportRegistryTest, NewSurfaceGetsSwapInterval)
{
    EXPECT_TRUE(as_headless(*registry_->find(ROOT_VIEWPORT)->surface).vsync());

    platform_.faults().fail_swap_interval = true;
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "swap interval"));
    EXPECT_TRUE(registry_->find(A)->is_initialized());
}

// ─── Reconcile ──────────────────────────────────────────────────────────────

TEST_F(ViewportRegistryTest, ReconcileKeepsExactlyTheDeclaredKeys)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}, {B, deferred()}});
    EXPECT_EQ(id_set(), (std::set<ViewportId>{ROOT_VIEWPORT, A, B}));

    reconcile({{ROOT_VIEWPORT, root_output()}, {B, deferred()}, {C, deferred()}});
    EXPECT_EQ(id_set(), (std::set<ViewportId>{ROOT_VIEWPORT, B, C}));
    EXPECT_EQ(platform_.live_windows(), 3u);
    EXPECT_EQ(registry_->window_mapping_count(), live_window_records());
}

TEST_F(ViewportRegistryTest, RootSurvivesAnEmptyDeclaration)
{
    reconcile({{A, deferred()}});
    reconcile({});

    EXPECT_EQ(id_set(), (std::set<ViewportId>{ROOT_VIEWPORT}));
    EXPECT_TRUE(registry_->find(ROOT_VIEWPORT)->is_initialized());
    EXPECT_EQ(platform_.live_windows(), 1u);
}

TEST_F(ViewportRegistryTest, NewRecordExistsBeforeItsWindow)
{
    registry_->reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});

    ViewportRecord* a = registry_->find(A);
    ASSERT_NE(a, nullptr);
    EXPECT_FALSE(a->has_window());
    EXPECT_FALSE(registry_->window_for_viewport(A).has_value());

    EXPECT_EQ(registry_->initialize_all(), 0u);
    EXPECT_TRUE(a->is_initialized());
    EXPECT_TRUE(registry_->window_for_viewport(A).has_value());
}

TEST_F(ViewportRegistryTest, ReconcileIsIdempotent)
{
    ViewportOutputMap desired{{ROOT_VIEWPORT, root_output()},
                              {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_title("a"))}};
    reconcile(desired);
    WindowId window = *registry_->window_for_viewport(A);

    reconcile(desired);
    reconcile(desired);

    EXPECT_EQ(*registry_->window_for_viewport(A), window);
    EXPECT_EQ(platform_.stats().windows_created, 2u);
    EXPECT_TRUE(registry_->find(A)->deferred_commands.empty());
}

TEST_F(ViewportRegistryTest, GarbageCollectionDestroysWindowAndMappings)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    WindowId window = *registry_->window_for_viewport(A);

    reconcile({{ROOT_VIEWPORT, root_output()}});

    EXPECT_FALSE(registry_->contains(A));
    EXPECT_FALSE(registry_->viewport_for_window(window).has_value());
    EXPECT_EQ(platform_.live_windows(), 1u);
    EXPECT_EQ(platform_.live_surfaces(), 1u);
}

TEST_F(ViewportRegistryTest, RemovingBoundViewportReleasesContext)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    // Creating A's surface bound the context to it.
    ASSERT_TRUE(context_->is_current_against(*registry_->find(A)->surface));

    reconcile({{ROOT_VIEWPORT, root_output()}});
    EXPECT_FALSE(context_->is_current());
}

TEST_F(ViewportRegistryTest, RemovingFocusedViewportClearsFocus)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    registry_->set_focused_viewport(A);

    reconcile({{ROOT_VIEWPORT, root_output()}});
    EXPECT_FALSE(registry_->focused_viewport().has_value());
}

// ─── Patching ───────────────────────────────────────────────────────────────

TEST_F(ViewportRegistryTest, AttributeChangeIsAppliedToLiveWindow)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_title("one"))}});
    WindowId window = *registry_->window_for_viewport(A);

    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_title("two"))}});

    ViewportRecord* a = registry_->find(A);
    EXPECT_EQ(a->window_handle->id(), window);
    EXPECT_EQ(a->window_handle->title(), "two");
    EXPECT_EQ(a->actual_info.title, "two");
    EXPECT_EQ(a->requested_attributes.title, "two");
}

TEST_F(ViewportRegistryTest, ProgrammaticResizeResizesSurface)
{
    reconcile({{ROOT_VIEWPORT, root_output()},
               {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_inner_size({200.0f, 100.0f}))}});
    EXPECT_EQ(registry_->find(A)->surface->size_px(), (SizePx{200, 100}));

    reconcile({{ROOT_VIEWPORT, root_output()},
               {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_inner_size({400.0f, 300.0f}))}});
    EXPECT_EQ(registry_->find(A)->surface->size_px(), (SizePx{400, 300}));
}

TEST_F(ViewportRegistryTest, ConstructionOnlyChangeRecreatesWindow)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_app_id("x"))}});
    WindowId before = *registry_->window_for_viewport(A);

    registry_->reconcile(
        {{ROOT_VIEWPORT, root_output()}, {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_app_id("y"))}});
    EXPECT_FALSE(registry_->find(A)->has_window());
    EXPECT_FALSE(registry_->viewport_for_window(before).has_value());

    registry_->initialize_all();
    WindowId after = *registry_->window_for_viewport(A);
    EXPECT_NE(after, before);
    EXPECT_EQ(platform_.live_windows(), 2u);
}

TEST_F(ViewportRegistryTest, WindowTypeChangeRebuildsWindow)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    WindowId before = *registry_->window_for_viewport(A);
    EXPECT_EQ(as_headless(*registry_->find(A)->window_handle).window_type(), WindowType::Normal);

    reconcile({{ROOT_VIEWPORT, root_output()},
               {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_window_type(WindowType::Utility))}});

    EXPECT_NE(*registry_->window_for_viewport(A), before);
    EXPECT_EQ(as_headless(*registry_->find(A)->window_handle).window_type(), WindowType::Utility);
    EXPECT_EQ(platform_.live_windows(), 2u);
}

TEST_F(ViewportRegistryTest, CallbackIsReplacedWithoutAttributeChange)
{
    auto first  = deferred();
    auto second = deferred();
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, first}});
    EXPECT_EQ(registry_->find(A)->render_callback, first.ui);

    reconcile({{ROOT_VIEWPORT, root_output()}, {A, second}});
    EXPECT_EQ(registry_->find(A)->render_callback, second.ui);
}

TEST_F(ViewportRegistryTest, ClassIsUpdated)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});

    ViewportOutput immediate{.parent = ROOT_VIEWPORT, .viewport_class = ViewportClass::Immediate};
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, immediate}});

    EXPECT_EQ(registry_->find(A)->viewport_class, ViewportClass::Immediate);
    EXPECT_EQ(registry_->find(A)->render_callback, nullptr);
}

TEST_F(ViewportRegistryTest, CommandsWaitForAWindow)
{
    auto output = deferred();
    output.commands.push_back(ViewportCommand::title("queued"));
    registry_->reconcile({{ROOT_VIEWPORT, root_output()}, {A, output}});
    EXPECT_EQ(registry_->find(A)->deferred_commands.size(), 1u);

    registry_->initialize_all();
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    EXPECT_EQ(registry_->find(A)->window_handle->title(), "queued");
    EXPECT_TRUE(registry_->find(A)->deferred_commands.empty());
}

TEST_F(ViewportRegistryTest, NewChildComesUpRestoredThenGoesAway)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_title("child"))}});

    ViewportRecord* child = registry_->find(A);
    ASSERT_NE(child, nullptr);
    EXPECT_TRUE(child->is_initialized());
    EXPECT_EQ(child->actual_info.minimized, std::optional<bool>(false));
    EXPECT_EQ(child->actual_info.title, "child");
    EXPECT_TRUE(log_.contains(LogLevel::Info, "Created window"));

    reconcile({{ROOT_VIEWPORT, root_output()}});

    EXPECT_FALSE(registry_->contains(A));
    EXPECT_EQ(platform_.live_windows(), 1u);
    EXPECT_EQ(registry_->window_mapping_count(), 1u);
}

// ─── Parents & icons ────────────────────────────────────────────────────────

TEST_F(ViewportRegistryTest, ChildInheritsParentIcon)
{
    auto icon = std::make_shared<const IconData>(IconData{1, 1, {255, 0, 0, 255}});
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_icon(icon))}, {B, deferred(A)}});

    EXPECT_EQ(registry_->find(B)->requested_attributes.icon, icon);
    EXPECT_EQ(as_headless(*registry_->find(B)->window_handle).icon_width(), 1u);
}

TEST_F(ViewportRegistryTest, OwnIconIsKept)
{
    auto parent_icon = std::make_shared<const IconData>(IconData{1, 1, {0, 0, 0, 255}});
    auto own_icon    = std::make_shared<const IconData>(IconData{2, 2, std::vector<uint8_t>(16, 9)});
    reconcile({{ROOT_VIEWPORT, root_output()},
               {A, deferred(ROOT_VIEWPORT, ViewportAttributes{}.with_icon(parent_icon))},
               {B, deferred(A, ViewportAttributes{}.with_icon(own_icon))}});

    EXPECT_EQ(registry_->find(B)->requested_attributes.icon, own_icon);
}

TEST_F(ViewportRegistryTest, DanglingParentIsReplacedByRoot)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(ViewportId::from_name("ghost"))}});

    EXPECT_EQ(registry_->find(A)->parent_id, ROOT_VIEWPORT);
    EXPECT_EQ(registry_->find(A)->actual_info.parent, ROOT_VIEWPORT);
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "undeclared parent"));
}

TEST_F(ViewportRegistryTest, CyclicParentsAreReplacedByRoot)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred(B)}, {B, deferred(A)}});

    EXPECT_EQ(registry_->find(A)->parent_id, ROOT_VIEWPORT);
    EXPECT_EQ(registry_->find(B)->parent_id, ROOT_VIEWPORT);
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "cyclic"));
}

TEST_F(ViewportRegistryTest, StoredParentChainIsWalked)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}, {B, deferred(A)}});

    EXPECT_EQ(registry_->resolve_stored_parent(C, B), B);
    EXPECT_EQ(registry_->resolve_stored_parent(C, ROOT_VIEWPORT), ROOT_VIEWPORT);
    EXPECT_EQ(registry_->resolve_stored_parent(ROOT_VIEWPORT, A), ROOT_VIEWPORT);
    EXPECT_FALSE(log_.contains(LogLevel::Warning, "attaching it to the root"));

    EXPECT_EQ(registry_->resolve_stored_parent(A, A), ROOT_VIEWPORT);
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "cyclic"));

    // B is stored under A, so A under B would close a loop.
    EXPECT_EQ(registry_->resolve_stored_parent(A, B), ROOT_VIEWPORT);

    EXPECT_EQ(registry_->resolve_stored_parent(C, ViewportId::from_name("ghost")), ROOT_VIEWPORT);
    EXPECT_TRUE(log_.contains(LogLevel::Warning, "undeclared parent"));
}

TEST_F(ViewportRegistryTest, NestedParentChainIsKept)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}, {B, deferred(A)}, {C, deferred(B)}});
    EXPECT_EQ(registry_->find(C)->parent_id, B);
    EXPECT_EQ(registry_->find(B)->parent_id, A);
}

// ─── Failures ───────────────────────────────────────────────────────────────

TEST_F(ViewportRegistryTest, WindowFailureIsCountedAndRetried)
{
    platform_.faults().fail_windows = 1;
    registry_->reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});

    EXPECT_EQ(registry_->initialize_all(), 1u);
    EXPECT_FALSE(registry_->find(A)->has_window());
    EXPECT_TRUE(log_.contains(LogLevel::Error, "Failed to initialize viewport " + std::to_string(A.value)));
    EXPECT_TRUE(log_.contains(LogLevel::Error, "injected window failure"));

    EXPECT_EQ(registry_->initialize_all(), 0u);
    EXPECT_TRUE(registry_->find(A)->is_initialized());
}

TEST_F(ViewportRegistryTest, SurfaceFailureKeepsWindowForRetry)
{
    platform_.faults().fail_surfaces = true;
    registry_->reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});

    EXPECT_EQ(registry_->initialize_all(), 1u);
    EXPECT_TRUE(registry_->find(A)->has_window());
    EXPECT_EQ(registry_->find(A)->surface, nullptr);

    platform_.faults().fail_surfaces = false;
    EXPECT_EQ(registry_->initialize_all(), 0u);
    EXPECT_TRUE(registry_->find(A)->is_initialized());
    EXPECT_EQ(platform_.stats().windows_created, 2u);
}

TEST_F(ViewportRegistryTest, InitializeThrowsForCaller)
{
    platform_.faults().fail_windows = 1;
    registry_->reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    EXPECT_THROW(registry_->initialize(A), SurfaceCreationError);
}

TEST_F(ViewportRegistryTest, BindFailurePropagates)
{
    platform_.faults().fail_make_current = true;
    registry_->reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    EXPECT_THROW(registry_->initialize_all(), ContextBindError);
}

// ─── Teardown & lookup ──────────────────────────────────────────────────────

TEST_F(ViewportRegistryTest, ReleaseAllWindowsKeepsRecords)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    registry_->set_focused_viewport(A);

    registry_->release_all_windows();

    EXPECT_EQ(registry_->size(), 2u);
    EXPECT_EQ(registry_->window_mapping_count(), 0u);
    EXPECT_EQ(platform_.live_windows(), 0u);
    EXPECT_EQ(platform_.live_surfaces(), 0u);
    EXPECT_FALSE(context_->is_current());
    EXPECT_FALSE(registry_->focused_viewport().has_value());

    EXPECT_EQ(registry_->initialize_all(), 0u);
    EXPECT_EQ(platform_.live_windows(), 2u);
}

TEST_F(ViewportRegistryTest, ResizeIgnoresEmptySizes)
{
    EXPECT_FALSE(registry_->resize(ROOT_VIEWPORT, {0, 0}));
    EXPECT_FALSE(registry_->resize(A, {10, 10}));

    EXPECT_TRUE(registry_->resize(ROOT_VIEWPORT, {1024, 768}));
    EXPECT_EQ(registry_->find(ROOT_VIEWPORT)->surface->size_px(), (SizePx{1024, 768}));
}

TEST_F(ViewportRegistryTest, FindByWindow)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}});
    WindowId window = *registry_->window_for_viewport(A);

    EXPECT_EQ(registry_->find_by_window(window), registry_->find(A));
    EXPECT_EQ(registry_->find_by_window(9999), nullptr);
}

TEST_F(ViewportRegistryTest, InfoSnapshotCoversEveryRecord)
{
    reconcile({{ROOT_VIEWPORT, root_output()}, {A, deferred()}, {B, deferred(A)}});

    ViewportInfoMap infos = registry_->info_snapshot();
    ASSERT_EQ(infos.size(), 3u);
    EXPECT_EQ(infos.at(B).parent, A);
    EXPECT_TRUE(infos.at(A).inner_rect.has_value());
}
