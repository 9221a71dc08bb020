#include "usb_descriptors.hpp"
#include "usb_error.hpp"
#include <errno.h>
using namespace rawusb;

static void invalid_descriptor(char const * operation)
{
	throw usb_descriptor_error(operation, EINVAL);
}

usb_device_descriptor rawusb::parse_device_descriptor(buffer_ref d)
{
	if (d.size() < usb_device_descriptor::size
		|| d[0] < usb_device_descriptor::size
		|| d[1] != usb_dt_device)
	{
		invalid_descriptor("parse device descriptor");
	}

	usb_device_descriptor res;
	res.bLength = d[0];
	res.bDescriptorType = d[1];
	res.bcdUSB = d.le16(2);
	res.bDeviceClass = d[4];
	res.bDeviceSubClass = d[5];
	res.bDeviceProtocol = d[6];
	res.bMaxPacketSize0 = d[7];
	res.idVendor = d.le16(8);
	res.idProduct = d.le16(10);
	res.bcdDevice = d.le16(12);
	res.iManufacturer = d[14];
	res.iProduct = d[15];
	res.iSerialNumber = d[16];
	res.bNumConfigurations = d[17];
	return res;
}

static usb_interface & find_interface(usb_config_descriptor & config, uint8_t number)
{
	for (size_t i = 0; i < config.interfaces.size(); ++i)
	{
		if (config.interfaces[i].altsettings.front().bInterfaceNumber == number)
			return config.interfaces[i];
	}

	config.interfaces.push_back(usb_interface());
	return config.interfaces.back();
}

usb_config_descriptor rawusb::parse_config_descriptor(buffer_ref d)
{
	static char const op[] = "parse config descriptor";

	if (d.size() < usb_raw_config_descriptor::size
		|| d[0] < usb_raw_config_descriptor::size
		|| d[1] != usb_dt_config)
	{
		invalid_descriptor(op);
	}

	usb_config_descriptor res;
	res.bLength = d[0];
	res.bDescriptorType = d[1];
	res.wTotalLength = d.le16(2);
	res.bNumInterfaces = d[4];
	res.bConfigurationValue = d[5];
	res.iConfiguration = d[6];
	res.bmAttributes = d[7];
	res.MaxPower = d[8];

	if (res.wTotalLength < usb_raw_config_descriptor::size)
		invalid_descriptor(op);

	// Some devices report more data than the total length covers;
	// anything beyond it belongs to no descriptor.
	d = d.first(res.wTotalLength);
	d += res.bLength;

	// Interfaces are kept in the order of their first appearance, an index
	// into the vector is used instead of a pointer as the vector may grow.
	size_t current_intf = 0;
	bool have_altsetting = false;
	while (!d.empty())
	{
		if (d.size() < 2)
			invalid_descriptor(op);

		uint8_t desclen = d[0];
		if (desclen < 2 || desclen > d.size())
			invalid_descriptor(op);

		if (d[1] == usb_dt_interface)
		{
			if (desclen < usb_raw_interface_descriptor::size)
				invalid_descriptor(op);

			usb_interface_descriptor idesc;
			idesc.bLength = d[0];
			idesc.bDescriptorType = d[1];
			idesc.bInterfaceNumber = d[2];
			idesc.bAlternateSetting = d[3];
			idesc.bNumEndpoints = d[4];
			idesc.bInterfaceClass = d[5];
			idesc.bInterfaceSubClass = d[6];
			idesc.bInterfaceProtocol = d[7];
			idesc.iInterface = d[8];

			usb_interface & intf = find_interface(res, idesc.bInterfaceNumber);
			intf.altsettings.push_back(idesc);
			current_intf = &intf - res.interfaces.data();
			have_altsetting = true;
		}
		else if (d[1] == usb_dt_endpoint)
		{
			if (!have_altsetting || desclen < usb_endpoint_descriptor::size)
				invalid_descriptor(op);

			usb_endpoint_descriptor edesc;
			edesc.bLength = d[0];
			edesc.bDescriptorType = d[1];
			edesc.bEndpointAddress = d[2];
			edesc.bmAttributes = d[3];
			edesc.wMaxPacketSize = d.le16(4);
			edesc.bInterval = d[6];

			res.interfaces[current_intf].altsettings.back().endpoints.push_back(edesc);
		}

		d += desclen;
	}

	return res;
}
