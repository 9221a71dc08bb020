#ifndef LIBRAWUSB_USB_DETAIL_LINUX_USB_HOST_HPP
#define LIBRAWUSB_USB_DETAIL_LINUX_USB_HOST_HPP

#include "../usb_host.hpp"
#include "udev.hpp"
#include "../../utils/detail/scoped_unix_fd.hpp"
#include <string>
#include <utility>
#include <vector>

namespace rawusb {
namespace detail {

class linux_usb_host_handle
	: public usb_host_handle
{
public:
	linux_usb_host_handle(scoped_unix_fd && fd, uint8_t interface_number);
	~linux_usb_host_handle();

	int interrupt_transfer(usb_endpoint_t ep, uint8_t * buffer, size_t size, size_t & transferred) override;

private:
	scoped_unix_fd m_fd;
	uint8_t m_interface_number;
};

// A usbfs device node. The descriptors are read once while listing,
// the node is opened again for each handle.
class linux_usb_host_device
	: public usb_host_device
{
public:
	linux_usb_host_device(std::string const & devnode, uint8_t port, std::vector<uint8_t> & descriptors);

	int get_device_descriptor(std::vector<uint8_t> & desc) const override;
	int get_config_descriptor(uint8_t index, std::vector<uint8_t> & desc) const override;
	uint8_t port_number() const override;
	int open(uint8_t interface_number, uint8_t altsetting, std::unique_ptr<usb_host_handle> & handle) override;

private:
	std::string m_devnode;
	uint8_t m_port;

	// The device descriptor followed by the configuration descriptor
	// blocks; `m_configs` holds the offset and length of each block.
	std::vector<uint8_t> m_descriptors;
	std::vector<std::pair<size_t, size_t> > m_configs;
};

// The port is the last component of a sysfs device name,
// e.g. 4 for "1-1.4". Root hubs ("usb1") have none and get 0.
uint8_t parse_port_number(char const * sysname);

class linux_usb_host_session
	: public usb_host_session
{
public:
	int init();

	int get_device_list(std::vector<std::shared_ptr<usb_host_device> > & devices) override;

private:
	scoped_udev m_udev;
};

class linux_usb_host
	: public usb_host
{
public:
	int open_session(std::unique_ptr<usb_host_session> & session) override;
};

} // namespace detail
} // namespace rawusb

#endif // LIBRAWUSB_USB_DETAIL_LINUX_USB_HOST_HPP
