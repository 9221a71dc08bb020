#include "endpoint_matcher.hpp"
using namespace rawusb;

bool rawusb::match_raw_endpoints(usb_interface_descriptor const & altsetting, usb_endpoint_pair & pair)
{
	if (altsetting.endpoints.empty())
		return false;

	bool has_reader = false;
	bool has_writer = false;
	usb_endpoint_pair res = {};

	for (size_t i = 0; i < altsetting.endpoints.size(); ++i)
	{
		usb_endpoint_descriptor const & ep = altsetting.endpoints[i];
		if (ep.transfer_type() != usb_transfer_interrupt)
			continue;

		if (ep.is_output())
		{
			res.writer = ep.bEndpointAddress;
			has_writer = true;
		}
		else
		{
			res.reader = ep.bEndpointAddress;
			has_reader = true;
		}
	}

	if (!has_reader || !has_writer)
		return false;

	pair = res;
	return true;
}
