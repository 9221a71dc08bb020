#ifndef LIBRAWUSB_USB_ENDPOINT_MATCHER_HPP
#define LIBRAWUSB_USB_ENDPOINT_MATCHER_HPP

#include "usb_descriptors.hpp"

namespace rawusb {

struct usb_endpoint_pair
{
	usb_endpoint_t reader;
	usb_endpoint_t writer;
};

// Decides whether an alternate setting is a raw interface, that is
// whether it has both an interrupt IN and an interrupt OUT endpoint.
// On a match, `pair` receives their addresses; if more endpoints of
// the same direction qualify, the last one is used.
bool match_raw_endpoints(usb_interface_descriptor const & altsetting, usb_endpoint_pair & pair);

} // namespace rawusb

#endif // LIBRAWUSB_USB_ENDPOINT_MATCHER_HPP
