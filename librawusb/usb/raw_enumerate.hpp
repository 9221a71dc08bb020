#ifndef LIBRAWUSB_USB_RAW_ENUMERATE_HPP
#define LIBRAWUSB_USB_RAW_ENUMERATE_HPP

#include "raw_device.hpp"
#include "usb_host.hpp"
#include <vector>
#include <stdint.h>

namespace rawusb {

// Lists the raw interfaces of all devices matching the vendor and
// product id (0 matches any). Every configuration, interface and
// alternate setting with an interrupt IN/OUT endpoint pair yields
// an entry, in descriptor order. With `skip_hid`, devices of the HID
// device class are left out.
//
// Each call uses its own host session, so concurrent calls are safe.
// Throws usb_init_error if the session or device list can't be
// created and usb_enumeration_error if a descriptor can't be read;
// no partial results are returned.
std::vector<raw_device_info> enumerate_raw(usb_host & host,
	uint16_t vendor_id, uint16_t product_id, bool skip_hid = false);

std::vector<raw_device_info> enumerate_raw(uint16_t vendor_id, uint16_t product_id, bool skip_hid = false);

} // namespace rawusb

#endif // LIBRAWUSB_USB_RAW_ENUMERATE_HPP
