#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pulseplot::acq
{

struct PortInfo
{
    std::string device;        // "/dev/ttyACM0"
    std::string description;   // "Arduino (www.arduino.cc) Arduino Uno"
    std::string driver;        // kernel driver, e.g. "cdc_acm"
};

// Lists serial ports backed by real hardware.  `sysfs_root` is normally
// /sys/class/tty; entries without a `device` link (virtual consoles, ptys)
// are skipped.
std::vector<PortInfo> enumerate_ports(const std::filesystem::path& sysfs_root = "/sys/class/tty",
                                      const std::filesystem::path& dev_root   = "/dev");

// True when the port's metadata names a known microcontroller board,
// USB-serial chip, or USB-serial driver.
bool is_known_controller(const PortInfo& port);

// First port passing is_known_controller(), in enumeration order.
std::optional<PortInfo> find_controller_port(const std::vector<PortInfo>& ports);

}   // namespace pulseplot::acq
