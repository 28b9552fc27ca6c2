#pragma once

#ifdef CASEMENT_USE_GLFW

    #include <casement/platform.hpp>
    #include <deque>
    #include <memory>
    #include <optional>
    #include <string>
    #include <unordered_map>

struct GLFWwindow;
struct GLFWcursor;

namespace casement
{

class GlfwPlatform;

class GlfwWindow : public NativeWindow
{
   public:
    GlfwWindow(GlfwPlatform& platform, GLFWwindow* handle, WindowId id);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&)            = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    WindowId id() const override { return id_; }

    SizePx              inner_size_px() const override;
    SizePx              outer_size_px() const override;
    std::optional<Vec2> inner_position_px() const override;
    std::optional<Vec2> outer_position_px() const override;
    float               scale_factor() const override;
    std::optional<Vec2> monitor_size_px() const override;
    std::string         title() const override { return title_; }
    std::optional<bool> is_minimized() const override;
    bool                is_maximized() const override;
    bool                is_fullscreen() const override;
    bool                has_focus() const override;

    void set_title(const std::string& title) override;
    void set_inner_size(Vec2 size) override;
    void set_min_inner_size(std::optional<Vec2> size) override;
    void set_max_inner_size(std::optional<Vec2> size) override;
    void set_outer_position(Vec2 pos) override;
    void set_visible(bool visible) override;
    void set_transparent(bool transparent) override;
    void set_resizable(bool resizable) override;
    void set_minimized(bool minimized) override;
    void set_maximized(bool maximized) override;
    void set_fullscreen(bool fullscreen) override;
    void set_decorations(bool decorations) override;
    void set_window_level(WindowLevel level) override;
    void set_icon(const IconData* icon) override;
    void focus() override;
    void request_user_attention() override;
    bool drag_window() override;
    void set_cursor_icon(CursorIcon icon) override;
    void set_cursor_visible(bool visible) override;
    bool set_cursor_position(Vec2 pos) override;
    bool set_mouse_passthrough(bool passthrough) override;
    void request_redraw() override;

    void* native_handle() const override { return window_; }

    GLFWwindow* glfw_handle() const { return window_; }

    // Window coordinates to framebuffer pixels; differs from 1 on macOS.
    float pixels_per_screen_unit() const;

   private:
    void apply_size_limits();

    GlfwPlatform& platform_;
    GLFWwindow*   window_;
    WindowId      id_;
    std::string   title_;

    std::optional<Vec2> min_size_;
    std::optional<Vec2> max_size_;

    // Windowed geometry saved while fullscreen, in screen units.
    int saved_x_ = 0, saved_y_ = 0, saved_w_ = 0, saved_h_ = 0;
};

// Desktop platform on GLFW with a Vulkan graphics context.
class GlfwPlatform : public Platform
{
   public:
    // Throws SurfaceCreationError when GLFW cannot initialize (no display).
    GlfwPlatform();
    ~GlfwPlatform() override;

    GlfwPlatform(const GlfwPlatform&)            = delete;
    GlfwPlatform& operator=(const GlfwPlatform&) = delete;

    const char* name() const override { return "glfw"; }

    std::unique_ptr<NativeWindow>    create_window(const ViewportAttributes& attributes) override;
    std::unique_ptr<GraphicsContext> create_context(const ContextConfig& config) override;
    std::unique_ptr<Painter>         create_painter(GraphicsContext& context) override;

    std::optional<std::string> clipboard_text() override;
    void                       set_clipboard_text(const std::string& text) override;

    bool pump_events(std::chrono::milliseconds timeout, std::vector<PlatformEvent>& out) override;

    // Used by GlfwWindow.
    void        post(PlatformEvent event);
    void        forget_window(GLFWwindow* handle);
    GLFWcursor* standard_cursor(CursorIcon icon);

   private:
    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void window_pos_callback(GLFWwindow* window, int x, int y);
    static void window_close_callback(GLFWwindow* window);
    static void window_focus_callback(GLFWwindow* window, int focused);
    static void window_iconify_callback(GLFWwindow* window, int iconified);
    static void window_maximize_callback(GLFWwindow* window, int maximized);
    static void window_refresh_callback(GLFWwindow* window);
    static void content_scale_callback(GLFWwindow* window, float xscale, float yscale);
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void cursor_enter_callback(GLFWwindow* window, int entered);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void scroll_callback(GLFWwindow* window, double x_offset, double y_offset);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void char_callback(GLFWwindow* window, unsigned int codepoint);

    static GlfwPlatform* from(GLFWwindow* window);

    void install_callbacks(GLFWwindow* window);
    void post_window(GLFWwindow* window, WindowEvent event);

    std::unordered_map<GLFWwindow*, GlfwWindow*>  windows_;
    std::unordered_map<int, GLFWcursor*>          cursors_;
    std::deque<PlatformEvent>                     queue_;
    std::optional<Vec2>                           last_cursor_;
    WindowId                                      next_window_id_ = 1;
    bool                                          resumed_sent_   = false;
};

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
