#ifndef LIBRAWUSB_USB_USB_DESCRIPTORS_HPP
#define LIBRAWUSB_USB_USB_DESCRIPTORS_HPP

#include "../buffer_ref.hpp"
#include <vector>
#include <stdint.h>
#include <stddef.h>

namespace rawusb {

typedef uint8_t usb_endpoint_t;

enum
{
	usb_dt_device = 1,
	usb_dt_config = 2,
	usb_dt_interface = 4,
	usb_dt_endpoint = 5
};

enum
{
	usb_class_hid = 0x03
};

enum
{
	usb_endpoint_dir_mask = 0x80,
	usb_endpoint_in = 0x80,
	usb_endpoint_out = 0x00
};

enum usb_transfer_type
{
	usb_transfer_control = 0,
	usb_transfer_isochronous = 1,
	usb_transfer_bulk = 2,
	usb_transfer_interrupt = 3
};

struct usb_device_descriptor
{
	static size_t const size = 18;

	uint8_t  bLength;
	uint8_t  bDescriptorType;
	uint16_t bcdUSB;
	uint8_t  bDeviceClass;
	uint8_t  bDeviceSubClass;
	uint8_t  bDeviceProtocol;
	uint8_t  bMaxPacketSize0;
	uint16_t idVendor;
	uint16_t idProduct;
	uint16_t bcdDevice;
	uint8_t  iManufacturer;
	uint8_t  iProduct;
	uint8_t  iSerialNumber;
	uint8_t  bNumConfigurations;
};

struct usb_endpoint_descriptor
{
	static size_t const size = 7;

	uint8_t  bLength;
	uint8_t  bDescriptorType;
	uint8_t  bEndpointAddress;
	uint8_t  bmAttributes;
	uint16_t wMaxPacketSize;
	uint8_t  bInterval;

	bool is_input() const
	{
		return (bEndpointAddress & usb_endpoint_dir_mask) == usb_endpoint_in;
	}

	bool is_output() const
	{
		return (bEndpointAddress & usb_endpoint_dir_mask) == usb_endpoint_out;
	}

	usb_transfer_type transfer_type() const
	{
		return static_cast<usb_transfer_type>(bmAttributes & 0x03);
	}
};

struct usb_raw_interface_descriptor
{
	static size_t const size = 9;

	uint8_t bLength;
	uint8_t bDescriptorType;
	uint8_t bInterfaceNumber;
	uint8_t bAlternateSetting;
	uint8_t bNumEndpoints;
	uint8_t bInterfaceClass;
	uint8_t bInterfaceSubClass;
	uint8_t bInterfaceProtocol;
	uint8_t iInterface;
};

struct usb_raw_config_descriptor
{
	static size_t const size = 9;

	uint8_t  bLength;
	uint8_t  bDescriptorType;
	uint16_t wTotalLength;
	uint8_t  bNumInterfaces;
	uint8_t  bConfigurationValue;
	uint8_t  iConfiguration;
	uint8_t  bmAttributes;
	uint8_t  MaxPower;
};

// An alternate setting of an interface together with its endpoints.
struct usb_interface_descriptor
	: usb_raw_interface_descriptor
{
	std::vector<usb_endpoint_descriptor> endpoints;
};

struct usb_interface
{
	std::vector<usb_interface_descriptor> altsettings;
};

struct usb_config_descriptor
	: usb_raw_config_descriptor
{
	std::vector<usb_interface> interfaces;
};

// Decodes the 18-byte standard device descriptor.
// Throws usb_descriptor_error if the data is malformed.
usb_device_descriptor parse_device_descriptor(buffer_ref d);

// Decodes a full configuration descriptor block (the configuration
// descriptor followed by its interface, endpoint and class-specific
// descriptors) into an owned tree. Every descriptor header is
// bounds-checked against the remaining data.
// Throws usb_descriptor_error if the data is malformed.
usb_config_descriptor parse_config_descriptor(buffer_ref d);

} // namespace rawusb

#endif // LIBRAWUSB_USB_USB_DESCRIPTORS_HPP
