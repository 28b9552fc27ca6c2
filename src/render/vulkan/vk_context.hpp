#pragma once

#ifdef CASEMENT_USE_GLFW

    #include <casement/platform.hpp>
    #include <vector>

    #include "vk_device.hpp"
    #include "vk_swapchain.hpp"

namespace casement
{

class VulkanContext;

// One window's swapchain plus the per-frame command and sync objects.
// "Frame active" means an image is acquired and its render pass is open;
// the first clear or paint opens it and present() closes it.
class VulkanSurface : public Surface
{
   public:
    VulkanSurface(VulkanContext& context, VkSurfaceKHR surface, SizePx size, bool transparent);
    ~VulkanSurface() override;

    VulkanSurface(const VulkanSurface&)            = delete;
    VulkanSurface& operator=(const VulkanSurface&) = delete;

    SizePx size_px() const override { return size_; }
    void   resize(SizePx size) override;
    bool   present() override;

    bool            begin_frame(Rgba clear);
    bool            frame_active() const { return frame_active_; }
    void            clear_attachment(Rgba color);
    VkCommandBuffer command_buffer() const { return command_buffers_[frame_]; }

    void set_vsync(bool vsync);

    void                      arm_capture();
    std::optional<ColorImage> take_capture();

   private:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    void build_swapchain(VkSwapchainKHR old_swapchain);
    void recreate_swapchain();
    void record_capture_copy();
    void destroy_readback();

    VulkanContext&       ctx_;
    VkSurfaceKHR         surface_ = VK_NULL_HANDLE;
    vk::SwapchainContext swapchain_;
    SizePx               size_;
    bool                 transparent_ = false;
    bool                 vsync_       = true;

    std::vector<VkCommandBuffer> command_buffers_;
    std::vector<VkSemaphore>     image_available_;
    std::vector<VkSemaphore>     render_finished_;   // one per swapchain image
    std::vector<VkFence>         in_flight_;
    uint32_t                     frame_        = 0;
    uint32_t                     image_index_  = 0;
    bool                         frame_active_ = false;

    bool           capture_armed_   = false;
    bool           capture_pending_ = false;
    uint32_t       capture_frame_   = 0;
    SizePx         capture_size_;
    VkBuffer       readback_        = VK_NULL_HANDLE;
    VkDeviceMemory readback_memory_ = VK_NULL_HANDLE;
    VkDeviceSize   readback_size_   = 0;
};

// Vulkan has no "current context"; binding selects which surface the painter
// records into. The logical device is created with the first surface, since
// GPU selection needs something to present to.
class VulkanContext : public GraphicsContext
{
   public:
    // Throws ContextBindError when no Vulkan instance can be created.
    explicit VulkanContext(const ContextConfig& config);
    ~VulkanContext() override;

    VulkanContext(const VulkanContext&)            = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    std::unique_ptr<Surface> create_surface(NativeWindow& window, SizePx size) override;
    bool                     make_current(Surface& surface) override;
    bool                     make_not_current() override;
    bool                     set_swap_interval(Surface& surface, bool vsync) override;

    VulkanSurface*           current() const { return current_; }
    const vk::DeviceContext& device() const { return dev_; }
    VkCommandPool            command_pool() const { return command_pool_; }
    bool                     vsync() const { return config_.vsync; }

   private:
    void ensure_device(VkSurfaceKHR surface);

    ContextConfig     config_;
    vk::DeviceContext dev_;
    VkCommandPool     command_pool_ = VK_NULL_HANDLE;
    VulkanSurface*    current_      = nullptr;
};

// Clears and runs paint callbacks (native_encoder is the VkCommandBuffer).
// Mesh rasterization belongs to the UI renderer registered as a callback.
class VulkanPainter : public Painter
{
   public:
    explicit VulkanPainter(VulkanContext& context);

    void clear(SizePx size, Rgba color) override;
    void paint(SizePx                               size,
               float                                pixels_per_point,
               const std::vector<ClippedPrimitive>& primitives) override;
    void capture_next_frame() override;
    std::optional<ColorImage> read_screen_rgba(SizePx size) override;

   private:
    VulkanContext& context_;
    bool           warned_meshes_ = false;
};

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
