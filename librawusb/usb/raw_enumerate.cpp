#include "raw_enumerate.hpp"
#include "descriptor_walker.hpp"
#include "usb_error.hpp"
#include <stdio.h>
using namespace rawusb;

static std::string make_path(usb_device_descriptor const & desc, uint8_t port)
{
	char buf[32];
	snprintf(buf, sizeof buf, "%x:%x:%u", desc.idVendor, desc.idProduct, port);
	return buf;
}

static void collect_raw_interfaces(std::vector<raw_device_info> & res,
	std::shared_ptr<usb_host_device> const & dev, usb_device_descriptor const & desc,
	usb_config_descriptor const & config)
{
	for (size_t i = 0; i < config.interfaces.size(); ++i)
	{
		usb_interface const & intf = config.interfaces[i];
		for (size_t j = 0; j < intf.altsettings.size(); ++j)
		{
			usb_interface_descriptor const & alt = intf.altsettings[j];

			usb_endpoint_pair endpoints;
			if (!match_raw_endpoints(alt, endpoints))
				continue;

			res.push_back(raw_device_info(make_path(desc, dev->port_number()),
				desc.idVendor, desc.idProduct, config.bConfigurationValue,
				alt.bInterfaceNumber, alt.bAlternateSetting, endpoints, dev));
		}
	}
}

std::vector<raw_device_info> rawusb::enumerate_raw(usb_host & host,
	uint16_t vendor_id, uint16_t product_id, bool skip_hid)
{
	usb_device_list devs(host);

	std::vector<raw_device_info> res;
	try
	{
		for (size_t devnum = 0; devnum < devs.size(); ++devnum)
		{
			std::shared_ptr<usb_host_device> const & dev = devs[devnum];

			usb_device_descriptor desc = get_device_descriptor(*dev, static_cast<int>(devnum));
			if ((vendor_id != 0 && desc.idVendor != vendor_id)
				|| (product_id != 0 && desc.idProduct != product_id))
			{
				continue;
			}

			// HID devices are left to the HID enumerator.
			if (skip_hid && desc.bDeviceClass == usb_class_hid)
				continue;

			for (uint8_t cfgnum = 0; cfgnum < desc.bNumConfigurations; ++cfgnum)
			{
				usb_config_descriptor config = get_config_descriptor(*dev, static_cast<int>(devnum), cfgnum);
				collect_raw_interfaces(res, dev, desc, config);
			}
		}
	}
	catch (usb_descriptor_error const & e)
	{
		throw usb_enumeration_error(e);
	}

	return res;
}

std::vector<raw_device_info> rawusb::enumerate_raw(uint16_t vendor_id, uint16_t product_id, bool skip_hid)
{
	return rawusb::enumerate_raw(system_usb_host(), vendor_id, product_id, skip_hid);
}
