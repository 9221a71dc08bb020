#ifndef LIBRAWUSB_USB_USB_HOST_HPP
#define LIBRAWUSB_USB_USB_HOST_HPP

#include "usb_descriptors.hpp"
#include <vector>
#include <memory>
#include <stdint.h>
#include <stddef.h>

namespace rawusb {

// The host USB stack, seen through the handful of primitives
// the raw device layer needs. All primitives report failures
// by returning an errno-style code, 0 means success.

// An open connection to a device with one claimed interface.
// Destroying the handle releases the interface and closes the connection.
class usb_host_handle
{
public:
	virtual ~usb_host_handle() {}

	// Blocks until the interrupt transfer completes, there is no timeout.
	// `transferred` receives the number of bytes actually moved,
	// which may be less than `size`.
	virtual int interrupt_transfer(usb_endpoint_t ep, uint8_t * buffer, size_t size, size_t & transferred) = 0;
};

// An entry of a host device list. Entries are reference-counted
// and remain valid for as long as someone holds a reference,
// even after the list they came from is gone.
class usb_host_device
{
public:
	virtual ~usb_host_device() {}

	// Raw standard device descriptor (18 bytes).
	virtual int get_device_descriptor(std::vector<uint8_t> & desc) const = 0;

	// Raw configuration descriptor block for the configuration with the given index.
	virtual int get_config_descriptor(uint8_t index, std::vector<uint8_t> & desc) const = 0;

	// Number of the port on the parent hub, 0 for root hubs.
	virtual uint8_t port_number() const = 0;

	// Opens the device, claims the interface and selects the alternate setting.
	virtual int open(uint8_t interface_number, uint8_t altsetting, std::unique_ptr<usb_host_handle> & handle) = 0;
};

// A session with the host stack; the device list is only
// available through a live session.
class usb_host_session
{
public:
	virtual ~usb_host_session() {}

	virtual int get_device_list(std::vector<std::shared_ptr<usb_host_device> > & devices) = 0;
};

class usb_host
{
public:
	virtual ~usb_host() {}

	virtual int open_session(std::unique_ptr<usb_host_session> & session) = 0;
};

// The host stack of the running system. The returned object
// holds no state of its own, every session is independent.
usb_host & system_usb_host();

} // namespace rawusb

#endif // LIBRAWUSB_USB_USB_HOST_HPP
