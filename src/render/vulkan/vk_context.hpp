#pragma once

#ifdef PULSEPLOT_USE_GLFW

    #include <vulkan/vulkan.h>

    #include <cstdint>
    #include <optional>
    #include <vector>

struct GLFWwindow;

namespace pulseplot::vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool is_complete() const { return graphics.has_value() && present.has_value(); }
};

// Owns the instance, window surface, device and the descriptor pool the
// ImGui backend allocates from. Construction throws std::runtime_error.
class VkContext
{
   public:
    explicit VkContext(GLFWwindow* window);
    ~VkContext();

    VkContext(const VkContext&)            = delete;
    VkContext& operator=(const VkContext&) = delete;

    VkInstance       instance() const { return instance_; }
    VkPhysicalDevice physical_device() const { return physical_device_; }
    VkDevice         device() const { return device_; }
    VkSurfaceKHR     surface() const { return surface_; }
    VkQueue          queue() const { return queue_; }
    uint32_t         queue_family() const { return queue_family_; }
    VkDescriptorPool descriptor_pool() const { return descriptor_pool_; }

    void wait_idle() const;

   private:
    VkInstance       instance_        = VK_NULL_HANDLE;
    VkSurfaceKHR     surface_         = VK_NULL_HANDLE;
    VkPhysicalDevice physical_device_ = VK_NULL_HANDLE;
    VkDevice         device_          = VK_NULL_HANDLE;
    VkQueue          queue_           = VK_NULL_HANDLE;
    uint32_t         queue_family_    = 0;
    VkDescriptorPool descriptor_pool_ = VK_NULL_HANDLE;

    void destroy();
};

VkInstance         create_instance();
QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface);
VkPhysicalDevice   pick_physical_device(VkInstance instance, VkSurfaceKHR surface);

// Throws std::runtime_error naming the failed call
void check(VkResult result, const char* what);

}   // namespace pulseplot::vk

#endif   // PULSEPLOT_USE_GLFW
