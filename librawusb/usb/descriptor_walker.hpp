#ifndef LIBRAWUSB_USB_DESCRIPTOR_WALKER_HPP
#define LIBRAWUSB_USB_DESCRIPTOR_WALKER_HPP

#include "usb_host.hpp"
#include "usb_descriptors.hpp"
#include <vector>
#include <memory>

namespace rawusb {

// A host session together with the device list acquired through it.
// Both are released when the list goes out of scope, the list first.
class usb_device_list
{
public:
	// Throws usb_init_error.
	explicit usb_device_list(usb_host & host);
	~usb_device_list();

	size_t size() const { return m_devices.size(); }

	std::shared_ptr<usb_host_device> const & operator[](size_t i) const { return m_devices[i]; }

private:
	std::unique_ptr<usb_host_session> m_session;
	std::vector<std::shared_ptr<usb_host_device> > m_devices;

	usb_device_list(usb_device_list const &);
	usb_device_list & operator=(usb_device_list const &);
};

// The indices are only used to tag errors.
// Both functions throw usb_descriptor_error.
usb_device_descriptor get_device_descriptor(usb_host_device const & dev, int device_index);
usb_config_descriptor get_config_descriptor(usb_host_device const & dev, int device_index, uint8_t config_index);

} // namespace rawusb

#endif // LIBRAWUSB_USB_DESCRIPTOR_WALKER_HPP
