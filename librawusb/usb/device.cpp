#include "device.hpp"
#include "raw_enumerate.hpp"
#include "usb_host.hpp"
using namespace rawusb;

std::vector<std::shared_ptr<device_info> > rawusb::enumerate(usb_host & host,
	uint16_t vendor_id, uint16_t product_id, hid_enumerator * hid)
{
	std::vector<std::shared_ptr<device_info> > res;
	if (hid)
		res = hid->enumerate(vendor_id, product_id);

	std::vector<raw_device_info> raw = enumerate_raw(host, vendor_id, product_id, hid != 0);

	res.reserve(res.size() + raw.size());
	for (size_t i = 0; i < raw.size(); ++i)
		res.push_back(std::make_shared<raw_device_info>(raw[i]));
	return res;
}

std::vector<std::shared_ptr<device_info> > rawusb::enumerate(uint16_t vendor_id, uint16_t product_id,
	hid_enumerator * hid)
{
	return rawusb::enumerate(system_usb_host(), vendor_id, product_id, hid);
}
