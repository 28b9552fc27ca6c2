#ifdef CASEMENT_USE_GLFW

    #include "vk_context.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <casement/errors.hpp>
    #include <casement/logger.hpp>
    #include <cstring>
    #include <stdexcept>

namespace casement
{

namespace
{

VkClearColorValue to_clear_value(Rgba c)
{
    VkClearColorValue v{};
    v.float32[0] = c.r;
    v.float32[1] = c.g;
    v.float32[2] = c.b;
    v.float32[3] = c.a;
    return v;
}

void image_barrier(VkCommandBuffer cmd,
                   VkImage         image,
                   VkImageLayout   from,
                   VkImageLayout   to,
                   VkAccessFlags   src_access,
                   VkAccessFlags   dst_access)
{
    VkImageMemoryBarrier barrier{};
    barrier.sType                       = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.oldLayout                   = from;
    barrier.newLayout                   = to;
    barrier.srcQueueFamilyIndex         = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex         = VK_QUEUE_FAMILY_IGNORED;
    barrier.image                       = image;
    barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.layerCount = 1;
    barrier.srcAccessMask               = src_access;
    barrier.dstAccessMask               = dst_access;

    vkCmdPipelineBarrier(cmd,
                         VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
                         VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
                         0,
                         0,
                         nullptr,
                         0,
                         nullptr,
                         1,
                         &barrier);
}

}   // namespace

// ─── VulkanSurface ───────────────────────────────────────────────────────────

VulkanSurface::VulkanSurface(VulkanContext& context, VkSurfaceKHR surface, SizePx size, bool transparent)
    : ctx_(context), surface_(surface), size_(size.at_least_one()), transparent_(transparent),
      vsync_(context.vsync())
{
    const auto& dev = ctx_.device();

    build_swapchain(VK_NULL_HANDLE);

    command_buffers_.resize(MAX_FRAMES_IN_FLIGHT);
    VkCommandBufferAllocateInfo alloc{};
    alloc.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    alloc.commandPool        = ctx_.command_pool();
    alloc.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    alloc.commandBufferCount = MAX_FRAMES_IN_FLIGHT;
    if (vkAllocateCommandBuffers(dev.device, &alloc, command_buffers_.data()) != VK_SUCCESS)
        throw SurfaceCreationError("Failed to allocate command buffers");

    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    image_available_.resize(MAX_FRAMES_IN_FLIGHT);
    in_flight_.resize(MAX_FRAMES_IN_FLIGHT);
    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i)
    {
        if (vkCreateSemaphore(dev.device, &sem_info, nullptr, &image_available_[i]) != VK_SUCCESS
            || vkCreateFence(dev.device, &fence_info, nullptr, &in_flight_[i]) != VK_SUCCESS)
            throw SurfaceCreationError("Failed to create frame sync objects");
    }
}

VulkanSurface::~VulkanSurface()
{
    VkDevice device = ctx_.device().device;
    vkDeviceWaitIdle(device);

    destroy_readback();
    for (auto s : image_available_)
        vkDestroySemaphore(device, s, nullptr);
    for (auto s : render_finished_)
        vkDestroySemaphore(device, s, nullptr);
    for (auto f : in_flight_)
        vkDestroyFence(device, f, nullptr);
    if (!command_buffers_.empty())
    {
        vkFreeCommandBuffers(device,
                             ctx_.command_pool(),
                             static_cast<uint32_t>(command_buffers_.size()),
                             command_buffers_.data());
    }

    vk::destroy_swapchain(device, swapchain_);
    vkDestroySurfaceKHR(ctx_.device().instance, surface_, nullptr);
}

void VulkanSurface::build_swapchain(VkSwapchainKHR old_swapchain)
{
    const auto& dev = ctx_.device();
    try
    {
        swapchain_ = vk::create_swapchain(dev.device,
                                          dev.physical_device,
                                          surface_,
                                          size_.width,
                                          size_.height,
                                          dev.queue_families.graphics.value(),
                                          dev.queue_families.present.value(),
                                          vsync_,
                                          transparent_,
                                          old_swapchain,
                                          swapchain_.render_pass);
    }
    catch (const std::runtime_error& e)
    {
        throw SurfaceCreationError(e.what());
    }

    for (auto s : render_finished_)
        vkDestroySemaphore(dev.device, s, nullptr);
    render_finished_.assign(swapchain_.images.size(), VK_NULL_HANDLE);

    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    for (auto& s : render_finished_)
    {
        if (vkCreateSemaphore(dev.device, &sem_info, nullptr, &s) != VK_SUCCESS)
            throw SurfaceCreationError("Failed to create present semaphore");
    }

    CASEMENT_LOG_DEBUG("vulkan",
                       "Swapchain {}x{} with {} images",
                       swapchain_.extent.width,
                       swapchain_.extent.height,
                       swapchain_.images.size());
}

void VulkanSurface::recreate_swapchain()
{
    VkDevice device = ctx_.device().device;
    vkDeviceWaitIdle(device);

    frame_active_    = false;
    capture_pending_ = false;

    vk::SwapchainContext old = std::move(swapchain_);
    swapchain_               = {};
    swapchain_.render_pass   = old.render_pass;
    build_swapchain(old.swapchain);
    vk::destroy_swapchain(device, old, true);
}

void VulkanSurface::resize(SizePx size)
{
    size_ = size.at_least_one();
    recreate_swapchain();
}

void VulkanSurface::set_vsync(bool vsync)
{
    if (vsync == vsync_)
        return;
    vsync_ = vsync;
    recreate_swapchain();
}

bool VulkanSurface::begin_frame(Rgba clear)
{
    VkDevice device = ctx_.device().device;
    vkWaitForFences(device, 1, &in_flight_[frame_], VK_TRUE, UINT64_MAX);

    VkResult result = vkAcquireNextImageKHR(device,
                                            swapchain_.swapchain,
                                            UINT64_MAX,
                                            image_available_[frame_],
                                            VK_NULL_HANDLE,
                                            &image_index_);
    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        CASEMENT_LOG_DEBUG("vulkan", "Swapchain out of date on acquire, rebuilding");
        recreate_swapchain();
        return false;
    }
    if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR)
    {
        CASEMENT_LOG_WARN("vulkan", "vkAcquireNextImageKHR failed ({})", static_cast<int>(result));
        return false;
    }

    vkResetFences(device, 1, &in_flight_[frame_]);

    VkCommandBuffer cmd = command_buffers_[frame_];
    vkResetCommandBuffer(cmd, 0);

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vkBeginCommandBuffer(cmd, &begin);

    VkClearValue clear_value{};
    clear_value.color = to_clear_value(clear);

    VkRenderPassBeginInfo rp{};
    rp.sType             = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rp.renderPass        = swapchain_.render_pass;
    rp.framebuffer       = swapchain_.framebuffers[image_index_];
    rp.renderArea.extent = swapchain_.extent;
    rp.clearValueCount   = 1;
    rp.pClearValues      = &clear_value;
    vkCmdBeginRenderPass(cmd, &rp, VK_SUBPASS_CONTENTS_INLINE);

    frame_active_ = true;
    return true;
}

void VulkanSurface::clear_attachment(Rgba color)
{
    VkClearAttachment attachment{};
    attachment.aspectMask      = VK_IMAGE_ASPECT_COLOR_BIT;
    attachment.colorAttachment = 0;
    attachment.clearValue.color = to_clear_value(color);

    VkClearRect rect{};
    rect.rect.extent    = swapchain_.extent;
    rect.layerCount     = 1;
    vkCmdClearAttachments(command_buffers_[frame_], 1, &attachment, 1, &rect);
}

bool VulkanSurface::present()
{
    if (!frame_active_ && !begin_frame(Rgba::transparent()))
        return false;

    VkCommandBuffer cmd = command_buffers_[frame_];
    vkCmdEndRenderPass(cmd);
    if (capture_armed_)
        record_capture_copy();
    vkEndCommandBuffer(cmd);
    frame_active_ = false;

    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo         submit{};
    submit.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount   = 1;
    submit.pWaitSemaphores      = &image_available_[frame_];
    submit.pWaitDstStageMask    = &wait_stage;
    submit.commandBufferCount   = 1;
    submit.pCommandBuffers      = &cmd;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores    = &render_finished_[image_index_];

    const auto& dev = ctx_.device();
    if (vkQueueSubmit(dev.graphics_queue, 1, &submit, in_flight_[frame_]) != VK_SUCCESS)
    {
        CASEMENT_LOG_ERROR("vulkan", "vkQueueSubmit failed");
        return false;
    }

    VkPresentInfoKHR present{};
    present.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores    = &render_finished_[image_index_];
    present.swapchainCount     = 1;
    present.pSwapchains        = &swapchain_.swapchain;
    present.pImageIndices      = &image_index_;

    VkResult result = vkQueuePresentKHR(dev.present_queue, &present);
    frame_          = (frame_ + 1) % MAX_FRAMES_IN_FLIGHT;

    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
    {
        recreate_swapchain();
        return result == VK_SUBOPTIMAL_KHR;
    }
    return result == VK_SUCCESS;
}

// ─── Screenshot readback ─────────────────────────────────────────────────────

void VulkanSurface::arm_capture()
{
    capture_armed_ = true;
}

void VulkanSurface::destroy_readback()
{
    VkDevice device = ctx_.device().device;
    if (readback_ != VK_NULL_HANDLE)
        vkDestroyBuffer(device, readback_, nullptr);
    if (readback_memory_ != VK_NULL_HANDLE)
        vkFreeMemory(device, readback_memory_, nullptr);
    readback_        = VK_NULL_HANDLE;
    readback_memory_ = VK_NULL_HANDLE;
    readback_size_   = 0;
}

void VulkanSurface::record_capture_copy()
{
    capture_armed_ = false;

    const auto&  dev    = ctx_.device();
    VkExtent2D   extent = swapchain_.extent;
    VkDeviceSize needed = static_cast<VkDeviceSize>(extent.width) * extent.height * 4;

    if (needed != readback_size_)
    {
        destroy_readback();

        VkBufferCreateInfo info{};
        info.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        info.size        = needed;
        info.usage       = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        if (vkCreateBuffer(dev.device, &info, nullptr, &readback_) != VK_SUCCESS)
        {
            CASEMENT_LOG_WARN("vulkan", "Could not create screenshot buffer");
            return;
        }

        VkMemoryRequirements reqs;
        vkGetBufferMemoryRequirements(dev.device, readback_, &reqs);

        VkMemoryAllocateInfo alloc{};
        alloc.sType          = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        alloc.allocationSize = reqs.size;
        try
        {
            alloc.memoryTypeIndex =
                vk::find_memory_type(dev.physical_device,
                                     reqs.memoryTypeBits,
                                     VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT
                                         | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
        }
        catch (const std::runtime_error& e)
        {
            CASEMENT_LOG_WARN("vulkan", "Screenshot buffer: {}", e.what());
            destroy_readback();
            return;
        }
        if (vkAllocateMemory(dev.device, &alloc, nullptr, &readback_memory_) != VK_SUCCESS)
        {
            CASEMENT_LOG_WARN("vulkan", "Could not allocate screenshot memory");
            destroy_readback();
            return;
        }
        vkBindBufferMemory(dev.device, readback_, readback_memory_, 0);
        readback_size_ = needed;
    }

    VkCommandBuffer cmd   = command_buffers_[frame_];
    VkImage         image = swapchain_.images[image_index_];

    image_barrier(cmd,
                  image,
                  VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
                  VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                  VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT,
                  VK_ACCESS_TRANSFER_READ_BIT);

    VkBufferImageCopy region{};
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.layerCount = 1;
    region.imageExtent                 = {extent.width, extent.height, 1};
    vkCmdCopyImageToBuffer(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, readback_, 1, &region);

    image_barrier(cmd,
                  image,
                  VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                  VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
                  VK_ACCESS_TRANSFER_READ_BIT,
                  0);

    capture_pending_ = true;
    capture_frame_   = frame_;
    capture_size_    = {extent.width, extent.height};
}

std::optional<ColorImage> VulkanSurface::take_capture()
{
    if (!capture_pending_)
        return std::nullopt;
    capture_pending_ = false;

    VkDevice device = ctx_.device().device;
    vkWaitForFences(device, 1, &in_flight_[capture_frame_], VK_TRUE, UINT64_MAX);

    void* mapped = nullptr;
    if (vkMapMemory(device, readback_memory_, 0, readback_size_, 0, &mapped) != VK_SUCCESS)
        return std::nullopt;

    ColorImage image{capture_size_, std::vector<uint8_t>(static_cast<size_t>(readback_size_))};
    std::memcpy(image.rgba.data(), mapped, image.rgba.size());
    vkUnmapMemory(device, readback_memory_);

    if (swapchain_.image_format == VK_FORMAT_B8G8R8A8_UNORM
        || swapchain_.image_format == VK_FORMAT_B8G8R8A8_SRGB)
    {
        for (size_t i = 0; i + 3 < image.rgba.size(); i += 4)
            std::swap(image.rgba[i], image.rgba[i + 2]);
    }
    return image;
}

// ─── VulkanContext ───────────────────────────────────────────────────────────

VulkanContext::VulkanContext(const ContextConfig& config) : config_(config)
{
    try
    {
        dev_.instance = vk::create_instance(config_.validation);
    }
    catch (const std::runtime_error& e)
    {
        throw ContextBindError(e.what());
    }
    if (config_.validation)
        dev_.debug_messenger = vk::create_debug_messenger(dev_.instance);
}

VulkanContext::~VulkanContext()
{
    if (dev_.device != VK_NULL_HANDLE)
    {
        vkDeviceWaitIdle(dev_.device);
        if (command_pool_ != VK_NULL_HANDLE)
            vkDestroyCommandPool(dev_.device, command_pool_, nullptr);
        vkDestroyDevice(dev_.device, nullptr);
    }
    vk::destroy_debug_messenger(dev_.instance, dev_.debug_messenger);
    if (dev_.instance != VK_NULL_HANDLE)
        vkDestroyInstance(dev_.instance, nullptr);
}

void VulkanContext::ensure_device(VkSurfaceKHR surface)
{
    if (dev_.device != VK_NULL_HANDLE)
    {
        VkBool32 supported = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(dev_.physical_device,
                                             dev_.queue_families.present.value(),
                                             surface,
                                             &supported);
        if (!supported)
            throw SurfaceCreationError("Selected GPU cannot present to this window");
        return;
    }

    try
    {
        dev_.physical_device = vk::pick_physical_device(dev_.instance, surface);
        dev_.queue_families  = vk::find_queue_families(dev_.physical_device, surface);
        dev_.device =
            vk::create_logical_device(dev_.physical_device, dev_.queue_families, config_.validation);
    }
    catch (const std::runtime_error& e)
    {
        throw ContextBindError(e.what());
    }

    vkGetPhysicalDeviceProperties(dev_.physical_device, &dev_.properties);
    vkGetPhysicalDeviceMemoryProperties(dev_.physical_device, &dev_.memory_properties);
    vkGetDeviceQueue(dev_.device, dev_.queue_families.graphics.value(), 0, &dev_.graphics_queue);
    vkGetDeviceQueue(dev_.device, dev_.queue_families.present.value(), 0, &dev_.present_queue);

    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pool_info.queueFamilyIndex = dev_.queue_families.graphics.value();
    if (vkCreateCommandPool(dev_.device, &pool_info, nullptr, &command_pool_) != VK_SUCCESS)
        throw ContextBindError("Failed to create command pool");
}

std::unique_ptr<Surface> VulkanContext::create_surface(NativeWindow& window, SizePx size)
{
    auto*        glfw_window = static_cast<GLFWwindow*>(window.native_handle());
    VkSurfaceKHR surface     = VK_NULL_HANDLE;
    if (glfwCreateWindowSurface(dev_.instance, glfw_window, nullptr, &surface) != VK_SUCCESS)
        throw SurfaceCreationError("glfwCreateWindowSurface failed for window "
                                   + std::to_string(window.id()));

    try
    {
        ensure_device(surface);
        return std::make_unique<VulkanSurface>(*this, surface, size, config_.transparent);
    }
    catch (const SurfaceCreationError&)
    {
        vkDestroySurfaceKHR(dev_.instance, surface, nullptr);
        throw;
    }
}

bool VulkanContext::make_current(Surface& surface)
{
    current_ = static_cast<VulkanSurface*>(&surface);
    return true;
}

bool VulkanContext::make_not_current()
{
    current_ = nullptr;
    return true;
}

bool VulkanContext::set_swap_interval(Surface& surface, bool vsync)
{
    try
    {
        static_cast<VulkanSurface&>(surface).set_vsync(vsync);
    }
    catch (const SurfaceCreationError& e)
    {
        CASEMENT_LOG_WARN("vulkan", "Changing present mode failed: {}", e.what());
        return false;
    }
    return true;
}

// ─── VulkanPainter ───────────────────────────────────────────────────────────

VulkanPainter::VulkanPainter(VulkanContext& context) : context_(context) {}

void VulkanPainter::clear(SizePx /*size*/, Rgba color)
{
    VulkanSurface* target = context_.current();
    if (!target)
    {
        CASEMENT_LOG_WARN("vulkan", "clear with no current surface");
        return;
    }
    if (target->frame_active())
        target->clear_attachment(color);
    else
        target->begin_frame(color);
}

void VulkanPainter::paint(SizePx                               size,
                          float                                pixels_per_point,
                          const std::vector<ClippedPrimitive>& primitives)
{
    VulkanSurface* target = context_.current();
    if (!target)
    {
        CASEMENT_LOG_WARN("vulkan", "paint with no current surface");
        return;
    }
    if (!target->frame_active() && !target->begin_frame(Rgba::transparent()))
        return;

    for (const auto& prim : primitives)
    {
        if (const auto* callback = std::get_if<std::shared_ptr<PaintCallback>>(&prim.primitive))
        {
            if (*callback)
            {
                (*callback)->paint({.clip_rect        = prim.clip_rect,
                                    .screen_size_px   = size,
                                    .pixels_per_point = pixels_per_point,
                                    .native_encoder   = target->command_buffer()});
            }
        }
        else if (!warned_meshes_)
        {
            warned_meshes_ = true;
            CASEMENT_LOG_WARN("vulkan",
                              "Mesh primitives need a UI renderer paint callback; skipping them");
        }
    }
}

void VulkanPainter::capture_next_frame()
{
    if (VulkanSurface* target = context_.current())
        target->arm_capture();
}

std::optional<ColorImage> VulkanPainter::read_screen_rgba(SizePx /*size*/)
{
    VulkanSurface* target = context_.current();
    if (!target)
        return std::nullopt;
    return target->take_capture();
}

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
