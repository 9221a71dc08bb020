#ifndef LIBRAWUSB_USB_DEVICE_HPP
#define LIBRAWUSB_USB_DEVICE_HPP

#include <string>
#include <vector>
#include <memory>
#include <stdint.h>
#include <stddef.h>

namespace rawusb {

class usb_host;

enum device_type
{
	device_type_generic = 0,
	device_type_hid = 1
};

// A live connection to a device, raw or HID.
class device
{
public:
	virtual ~device() {}

	virtual device_type type() const = 0;

	// Both block until the transfer completes and return the number
	// of bytes transferred, which may be less than `size`.
	virtual size_t read(uint8_t * buffer, size_t size) = 0;
	virtual size_t write(uint8_t const * buffer, size_t size) = 0;

	virtual void close() = 0;
};

// An enumerated device that can be opened.
class device_info
{
public:
	virtual ~device_info() {}

	virtual device_type type() const = 0;

	// Platform-specific device path.
	virtual std::string path() const = 0;

	virtual uint16_t vendor_id() const = 0;
	virtual uint16_t product_id() const = 0;
	virtual int interface_number() const = 0;

	// HID usage page, 0 for devices without one.
	virtual uint16_t usage_page() const = 0;

	virtual std::unique_ptr<device> open() const = 0;
};

// Source of HID devices, implemented on top of a HID access library.
class hid_enumerator
{
public:
	virtual ~hid_enumerator() {}

	virtual std::vector<std::shared_ptr<device_info> > enumerate(uint16_t vendor_id, uint16_t product_id) = 0;
};

// Lists all devices matching the vendor and product id (0 matches any).
// If `hid` is given, HID devices come from it and HID-class devices
// are left out of the raw results; the HID results are listed first.
// Without `hid`, all raw devices are returned.
std::vector<std::shared_ptr<device_info> > enumerate(usb_host & host,
	uint16_t vendor_id, uint16_t product_id, hid_enumerator * hid = 0);

std::vector<std::shared_ptr<device_info> > enumerate(uint16_t vendor_id, uint16_t product_id,
	hid_enumerator * hid = 0);

} // namespace rawusb

#endif // LIBRAWUSB_USB_DEVICE_HPP
