#ifdef PULSEPLOT_USE_GLFW

    #include "vk_context.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <pulseplot/logger.hpp>
    #include <stdexcept>
    #include <string>

namespace pulseplot::vk
{

void check(VkResult result, const char* what)
{
    if (result != VK_SUCCESS)
        throw std::runtime_error(std::string(what) + " failed (VkResult "
                                 + std::to_string(static_cast<int>(result)) + ")");
}

VkInstance create_instance()
{
    VkApplicationInfo app_info{};
    app_info.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName   = "pulseplot";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName        = "pulseplot";
    app_info.engineVersion      = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion         = VK_API_VERSION_1_2;

    uint32_t     glfw_ext_count = 0;
    const char** glfw_exts      = glfwGetRequiredInstanceExtensions(&glfw_ext_count);
    if (!glfw_exts)
        throw std::runtime_error("GLFW reports no Vulkan surface extensions");

    VkInstanceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo        = &app_info;
    create_info.enabledExtensionCount   = glfw_ext_count;
    create_info.ppEnabledExtensionNames = glfw_exts;

    VkInstance instance = VK_NULL_HANDLE;
    check(vkCreateInstance(&create_info, nullptr, &instance), "vkCreateInstance");
    return instance;
}

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    QueueFamilyIndices indices;

    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    for (uint32_t i = 0; i < count; ++i)
    {
        VkBool32 present = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &present);

        // Prefer one family that does both
        if ((families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) && present)
        {
            indices.graphics = i;
            indices.present  = i;
            break;
        }
        if (!indices.graphics && (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT))
            indices.graphics = i;
        if (!indices.present && present)
            indices.present = i;
    }
    return indices;
}

VkPhysicalDevice pick_physical_device(VkInstance instance, VkSurfaceKHR surface)
{
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance, &count, nullptr);
    if (count == 0)
        throw std::runtime_error("No Vulkan-capable GPU found");

    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance, &count, devices.data());

    VkPhysicalDevice fallback = VK_NULL_HANDLE;
    for (auto dev : devices)
    {
        auto q = find_queue_families(dev, surface);
        if (!q.is_complete() || *q.graphics != *q.present)
            continue;

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(dev, &props);
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
            return dev;
        if (fallback == VK_NULL_HANDLE)
            fallback = dev;
    }

    if (fallback == VK_NULL_HANDLE)
        throw std::runtime_error("No GPU with a combined graphics/present queue");
    return fallback;
}

VkContext::VkContext(GLFWwindow* window)
{
    try
    {
        instance_ = create_instance();
        check(glfwCreateWindowSurface(instance_, window, nullptr, &surface_),
              "glfwCreateWindowSurface");

        physical_device_ = pick_physical_device(instance_, surface_);
        queue_family_    = *find_queue_families(physical_device_, surface_).graphics;

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(physical_device_, &props);
        PULSEPLOT_LOG_INFO("vulkan", "Using GPU: {}", props.deviceName);

        float                   priority = 1.0f;
        VkDeviceQueueCreateInfo queue_info{};
        queue_info.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queue_info.queueFamilyIndex = queue_family_;
        queue_info.queueCount       = 1;
        queue_info.pQueuePriorities = &priority;

        const char* extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

        VkDeviceCreateInfo device_info{};
        device_info.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        device_info.queueCreateInfoCount    = 1;
        device_info.pQueueCreateInfos       = &queue_info;
        device_info.enabledExtensionCount   = 1;
        device_info.ppEnabledExtensionNames = extensions;
        check(vkCreateDevice(physical_device_, &device_info, nullptr, &device_), "vkCreateDevice");
        vkGetDeviceQueue(device_, queue_family_, 0, &queue_);

        VkDescriptorPoolSize pool_size{VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16};

        VkDescriptorPoolCreateInfo pool_info{};
        pool_info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        pool_info.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        pool_info.maxSets       = 16;
        pool_info.poolSizeCount = 1;
        pool_info.pPoolSizes    = &pool_size;
        check(vkCreateDescriptorPool(device_, &pool_info, nullptr, &descriptor_pool_),
              "vkCreateDescriptorPool");
    }
    catch (...)
    {
        destroy();
        throw;
    }
}

VkContext::~VkContext()
{
    destroy();
}

void VkContext::wait_idle() const
{
    if (device_ != VK_NULL_HANDLE)
        vkDeviceWaitIdle(device_);
}

void VkContext::destroy()
{
    if (device_ != VK_NULL_HANDLE)
    {
        vkDeviceWaitIdle(device_);
        if (descriptor_pool_ != VK_NULL_HANDLE)
            vkDestroyDescriptorPool(device_, descriptor_pool_, nullptr);
        vkDestroyDevice(device_, nullptr);
    }
    if (surface_ != VK_NULL_HANDLE)
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
    if (instance_ != VK_NULL_HANDLE)
        vkDestroyInstance(instance_, nullptr);

    descriptor_pool_ = VK_NULL_HANDLE;
    device_          = VK_NULL_HANDLE;
    surface_         = VK_NULL_HANDLE;
    instance_        = VK_NULL_HANDLE;
}

}   // namespace pulseplot::vk

#endif   // PULSEPLOT_USE_GLFW
