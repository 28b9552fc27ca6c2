// Multi-viewport demo for casement.
//
// The root window owns a deferred "Inspector" viewport (its own OS window,
// drawn in its own pass) and draws an immediate "Preview" viewport inline from
// inside every root pass. Closing the root asks once for confirmation.
//
//   F1   toggle the inspector window
//   F11  toggle fullscreen on the root
//   Tab  take a screenshot of the root
//   Esc  close the root
//
// Flags: --headless  --passes N  --log-level LEVEL  --clear-policy POLICY
//        --icon PATH (GLFW builds only)

#include <casement/casement.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#ifdef CASEMENT_USE_GLFW
    #include "platform/glfw/glfw_utils.hpp"
#endif

using namespace casement;

namespace
{

const ViewportId INSPECTOR = ViewportId::from_name("inspector");
const ViewportId PREVIEW   = ViewportId::from_name("preview");

class DemoUi : public UiLayer
{
   public:
    FullOutput run(const RawInput&           input,
                   const ViewportUiCallback* viewport_ui,
                   ImmediateRenderer&        immediate) override
    {
        FullOutput out;
        if (const ViewportInfo* info = input.viewport())
            out.pixels_per_point = info->native_pixels_per_point.value_or(1.0f);

        std::vector<ViewportCommand> commands;
        if (viewport_ui)
        {
            // A deferred window closed from its own title bar goes away.
            if (const ViewportInfo* info = input.viewport(); info && info->close_requested())
            {
                declared_.erase(input.viewport_id);
                if (input.viewport_id == INSPECTOR)
                    show_inspector_ = false;
            }
            (*viewport_ui)(immediate);
        }
        else
        {
            root_pass(input, immediate, commands);
        }

        out.viewport_output = declared_;
        if (auto it = out.viewport_output.find(input.viewport_id); it != out.viewport_output.end())
        {
            it->second.commands = std::move(commands);
            if (animating_)
                it->second.repaint_delay = std::chrono::milliseconds{16};
        }
        return out;
    }

    Rgba clear_color(const ViewportInfo& info) const override
    {
        if (info.parent && *info.parent != ROOT_VIEWPORT)
            return {0.10f, 0.10f, 0.12f, 1.0f};
        return {0.16f, 0.18f, 0.22f, 1.0f};
    }

   private:
    void root_pass(const RawInput& input, ImmediateRenderer& immediate, std::vector<ViewportCommand>& commands)
    {
        root_frames_++;

        for (const auto& ev : input.events)
        {
            if (ev.kind == InputEvent::Kind::Screenshot && ev.image)
            {
                CASEMENT_LOG_INFO("demo", "Screenshot {}x{}", ev.image->size.width, ev.image->size.height);
                continue;
            }
            if (ev.kind != InputEvent::Kind::Key || !ev.pressed || ev.repeat)
                continue;
            switch (ev.key)
            {
                case Key::F1:
                    show_inspector_ = !show_inspector_;
                    break;
                case Key::F11:
                    fullscreen_ = !fullscreen_;
                    commands.push_back(ViewportCommand::fullscreen(fullscreen_));
                    break;
                case Key::Tab:
                    commands.push_back(ViewportCommand::screenshot(root_frames_));
                    break;
                case Key::Escape:
                    commands.push_back(ViewportCommand::close());
                    break;
                default:
                    break;
            }
        }

        if (const ViewportInfo* info = input.viewport(); info && info->close_requested())
        {
            if (!close_confirmed_)
            {
                CASEMENT_LOG_INFO("demo", "Close again to quit");
                commands.push_back(ViewportCommand::cancel_close());
                close_confirmed_ = true;
            }
        }

        declared_.clear();
        declared_[ROOT_VIEWPORT] = {.parent = ROOT_VIEWPORT, .viewport_class = ViewportClass::Root};

        if (show_inspector_)
        {
            auto ui = std::make_shared<const ViewportUiCallback>(
                [this](ImmediateRenderer&) { inspector_frames_++; });
            declared_[INSPECTOR] = {
                .parent         = ROOT_VIEWPORT,
                .viewport_class = ViewportClass::Deferred,
                .attributes     = ViewportAttributes{}.with_title("Inspector").with_inner_size({320.0f, 480.0f}),
                .ui             = std::move(ui)};
        }

        // Immediate viewports are listed too, or reconcile would drop the window.
        auto preview_attributes = ViewportAttributes{}.with_title("Preview").with_inner_size({240.0f, 160.0f});
        declared_[PREVIEW]      = {.parent         = ROOT_VIEWPORT,
                                   .viewport_class = ViewportClass::Immediate,
                                   .attributes     = preview_attributes};

        immediate.render({.id         = PREVIEW,
                          .parent     = ROOT_VIEWPORT,
                          .attributes = preview_attributes,
                          .ui         = [this](ImmediateRenderer&) { preview_frames_++; }});

        if (root_frames_ % 120 == 0)
        {
            CASEMENT_LOG_DEBUG("demo",
                               "root {} / inspector {} / preview {} passes",
                               root_frames_,
                               inspector_frames_,
                               preview_frames_);
        }
    }

    ViewportOutputMap declared_;
    bool              show_inspector_   = true;
    bool              fullscreen_       = false;
    bool              close_confirmed_  = false;
    bool              animating_        = true;
    uint64_t          root_frames_      = 0;
    uint64_t          inspector_frames_ = 0;
    uint64_t          preview_frames_   = 0;
};

void print_usage(const char* argv0)
{
    std::cout << "usage: " << argv0
              << " [--headless] [--passes N] [--log-level LEVEL] [--clear-policy POLICY] [--icon PATH]\n";
}

}   // namespace

int main(int argc, char** argv)
{
    AppConfig config;
    config.root_attributes.with_title("casement demo").with_inner_size({960.0f, 640.0f});
    config.apply_env();

    for (int i = 1; i < argc; ++i)
    {
        auto next = [&]() -> const char*
        {
            if (i + 1 >= argc)
            {
                print_usage(argv[0]);
                std::exit(2);
            }
            return argv[++i];
        };

        if (std::strcmp(argv[i], "--headless") == 0)
        {
            config.headless = true;
        }
        else if (std::strcmp(argv[i], "--passes") == 0)
        {
            config.max_passes = std::strtoull(next(), nullptr, 10);
        }
        else if (std::strcmp(argv[i], "--log-level") == 0)
        {
            const char* value = next();
            auto        level = Logger::level_from_string(value);
            if (!level)
            {
                std::cerr << "unknown log level: " << value << "\n";
                return 2;
            }
            config.log_level = *level;
        }
        else if (std::strcmp(argv[i], "--clear-policy") == 0)
        {
            const char* value  = next();
            auto        policy = clear_policy_from_string(value);
            if (!policy)
            {
                std::cerr << "unknown clear policy: " << value << "\n";
                return 2;
            }
            config.clear_policy = *policy;
        }
        else if (std::strcmp(argv[i], "--icon") == 0)
        {
            const char* path = next();
#ifdef CASEMENT_USE_GLFW
            if (auto icon = load_icon_file(path))
                config.root_attributes.with_icon(std::move(icon));
#else
            std::cerr << "--icon ignored: built without GLFW (" << path << ")\n";
#endif
        }
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "unknown argument: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    // A headless run has no one to close it.
    if (config.headless && config.max_passes == 0)
        config.max_passes = 600;

    App app(config, std::make_shared<DemoUi>());
    return app.run();
}
