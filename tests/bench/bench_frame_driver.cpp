#include <benchmark/benchmark.h>
#include <casement/logger.hpp>
#include <memory>
#include <string>

#include "render/context_cell.hpp"
#include "runtime/frame_driver.hpp"
#include "util/test_platform.hpp"
#include "util/test_ui.hpp"
#include "viewport/viewport_registry.hpp"

using namespace casement;
using namespace casement::test;

// ═══════════════════════════════════════════════════════════════════════════════
// Frame driver benchmarks on the headless platform: the windowing layer's own
// per-pass cost (input, rebind, reconcile, present) with a UI that does nothing.
// ═══════════════════════════════════════════════════════════════════════════════

// ─── Runtime Helper ──────────────────────────────────────────────────────────

namespace
{

struct BenchRuntime
{
    explicit BenchRuntime(ClearPolicy policy = ClearPolicy::Auto)
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Error);

        context  = std::make_shared<ContextCell>(platform.create_context({}));
        painter  = platform.create_painter(context->graphics());
        registry = std::make_shared<ViewportRegistry>(platform, context);
        registry->insert_root({});
        registry->initialize(ROOT_VIEWPORT);
        driver = std::make_unique<FrameDriver>(registry,
                                               context,
                                               painter,
                                               ui,
                                               platform,
                                               FrameDriverOptions{.clear_policy = policy});
    }

    ~BenchRuntime()
    {
        driver.reset();
        registry.reset();
        Logger::instance().set_level(LogLevel::Info);
    }

    FlakyPlatform                     platform{HeadlessOptions{.default_size = {64, 64}}};
    ScriptedUi                        ui;
    std::shared_ptr<ContextCell>      context;
    std::shared_ptr<Painter>          painter;
    std::shared_ptr<ViewportRegistry> registry;
    std::unique_ptr<FrameDriver>      driver;
};

ViewportId nth_viewport(int64_t i)
{
    return ViewportId::from_name("bench-" + std::to_string(i));
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Single Viewport
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_RootPass(benchmark::State& state)
{
    BenchRuntime rt;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(rt.driver->run_ui_and_paint(ROOT_VIEWPORT));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RootPass);

static void BM_WindowEventRouting(benchmark::State& state)
{
    BenchRuntime rt;
    WindowId     root = *rt.registry->window_for_viewport(ROOT_VIEWPORT);
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(
            rt.driver->on_window_event(root, WindowEvent::moved({10.0f, 10.0f})));
    }
}
BENCHMARK(BM_WindowEventRouting);

// ═══════════════════════════════════════════════════════════════════════════════
// Context Switching
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_NestedImmediate(benchmark::State& state)
{
    BenchRuntime rt(ClearPolicy::BeforeUi);
    ViewportId   popup = nth_viewport(0);
    rt.ui.declare_immediate(popup);
    rt.ui.on_pass(ROOT_VIEWPORT,
                  [popup](const RawInput&, ImmediateRenderer& immediate, FullOutput&)
                  { immediate.render({.id = popup, .ui = [](ImmediateRenderer&) {}}); });

    for (auto _ : state)
    {
        rt.driver->run_ui_and_paint(ROOT_VIEWPORT);
    }
    state.counters["rebinds"] = benchmark::Counter(static_cast<double>(rt.context->bind_count()),
                                                   benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_NestedImmediate);

static void BM_RebindRoundTrip(benchmark::State& state)
{
    BenchRuntime rt;
    ViewportId   child = nth_viewport(0);
    rt.ui.declare_deferred(child);
    rt.driver->run_ui_and_paint(ROOT_VIEWPORT);

    Surface& a = *rt.registry->find(ROOT_VIEWPORT)->surface;
    Surface& b = *rt.registry->find(child)->surface;
    for (auto _ : state)
    {
        rt.context->rebind(a);
        rt.context->rebind(b);
    }
}
BENCHMARK(BM_RebindRoundTrip);

// ═══════════════════════════════════════════════════════════════════════════════
// Reconcile Scaling
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ReconcileChildren(benchmark::State& state)
{
    BenchRuntime rt;
    for (int64_t i = 0; i < state.range(0); ++i)
        rt.ui.declare_deferred(nth_viewport(i));
    rt.driver->run_ui_and_paint(ROOT_VIEWPORT);

    for (auto _ : state)
    {
        rt.driver->run_ui_and_paint(ROOT_VIEWPORT);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_ReconcileChildren)->RangeMultiplier(4)->Range(1, 64)->Complexity();

static void BM_OpenCloseChild(benchmark::State& state)
{
    BenchRuntime rt;
    ViewportId   child = nth_viewport(0);
    for (auto _ : state)
    {
        rt.ui.declare_deferred(child);
        rt.driver->run_ui_and_paint(ROOT_VIEWPORT);
        rt.ui.undeclare(child);
        rt.driver->run_ui_and_paint(ROOT_VIEWPORT);
    }
}
BENCHMARK(BM_OpenCloseChild);

BENCHMARK_MAIN();
