#include "port_discovery.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <pulseplot/logger.hpp>
#include <string_view>
#include <system_error>

namespace pulseplot::acq
{

namespace fs = std::filesystem;

static constexpr std::array<std::string_view, 6> DESCRIPTION_IDS = {
    "arduino", "ch340", "usb serial", "usb2.0-serial", "usb2.0-s", "iobusbhostdevice"};

static constexpr std::array<std::string_view, 6> DEVICE_IDS = {
    "usbmodem", "usbserial", "tty.usbmodem", "tty.usbserial", "ttyusb", "ttyacm"};

static constexpr std::array<std::string_view, 6> DRIVER_IDS = {
    "ch341", "cdc_acm", "ftdi_sio", "cp210x", "pl2303", "usbserial"};

static std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <size_t N>
static bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& ids)
{
    return std::any_of(ids.begin(),
                       ids.end(),
                       [&](std::string_view id) { return haystack.find(id) != std::string::npos; });
}

static std::string read_attribute(const fs::path& file)
{
    std::ifstream in(file);
    std::string   value;
    if (in)
        std::getline(in, value);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.pop_back();
    return value;
}

// USB attributes sit on the interface's parent device; walk up a few levels.
static std::string usb_attribute(const fs::path& device_dir, const char* name)
{
    std::error_code ec;
    fs::path        dir = fs::canonical(device_dir, ec);
    if (ec)
        return {};
    for (int depth = 0; depth < 3 && !dir.empty(); ++depth)
    {
        fs::path candidate = dir / name;
        if (fs::exists(candidate, ec))
            return read_attribute(candidate);
        dir = dir.parent_path();
    }
    return {};
}

std::vector<PortInfo> enumerate_ports(const fs::path& sysfs_root, const fs::path& dev_root)
{
    std::vector<PortInfo> ports;
    std::error_code       ec;
    if (!fs::is_directory(sysfs_root, ec))
    {
        PULSEPLOT_LOG_WARN("serial", "Cannot list ports: {} is not readable", sysfs_root.string());
        return ports;
    }

    for (const auto& entry : fs::directory_iterator(sysfs_root, ec))
    {
        fs::path device_dir = entry.path() / "device";
        if (!fs::exists(device_dir, ec))
            continue;

        PortInfo info;
        info.device = (dev_root / entry.path().filename()).string();

        std::error_code link_ec;
        fs::path        driver = fs::read_symlink(device_dir / "driver", link_ec);
        if (!link_ec)
            info.driver = driver.filename().string();

        std::string manufacturer = usb_attribute(device_dir, "manufacturer");
        std::string product      = usb_attribute(device_dir, "product");
        std::string interface    = usb_attribute(device_dir, "interface");

        for (const std::string* part : {&manufacturer, &product, &interface})
        {
            if (part->empty())
                continue;
            if (!info.description.empty())
                info.description += ' ';
            info.description += *part;
        }
        if (info.description.empty())
            info.description = "n/a";

        ports.push_back(std::move(info));
    }

    std::sort(ports.begin(),
              ports.end(),
              [](const PortInfo& a, const PortInfo& b) { return a.device < b.device; });

    for (const auto& port : ports)
        PULSEPLOT_LOG_INFO("serial",
                           "Found port: {} - {} [{}]",
                           port.device,
                           port.description,
                           port.driver.empty() ? "no driver" : port.driver);
    return ports;
}

bool is_known_controller(const PortInfo& port)
{
    return contains_any(to_lower(port.description), DESCRIPTION_IDS)
           || contains_any(to_lower(port.device), DEVICE_IDS)
           || contains_any(to_lower(port.driver), DRIVER_IDS);
}

std::optional<PortInfo> find_controller_port(const std::vector<PortInfo>& ports)
{
    for (const auto& port : ports)
    {
        if (is_known_controller(port))
            return port;
    }
    return std::nullopt;
}

}   // namespace pulseplot::acq
