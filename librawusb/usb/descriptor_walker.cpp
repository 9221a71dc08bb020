#include "descriptor_walker.hpp"
#include "usb_error.hpp"
#include <errno.h>
using namespace rawusb;

usb_device_list::usb_device_list(usb_host & host)
{
	check_usb_error<usb_init_error>(host.open_session(m_session), "open host session");
	if (!m_session)
		throw usb_init_error("open host session", ENOMEM);

	check_usb_error<usb_init_error>(m_session->get_device_list(m_devices), "get device list");
}

usb_device_list::~usb_device_list()
{
	m_devices.clear();
	m_session.reset();
}

usb_device_descriptor rawusb::get_device_descriptor(usb_host_device const & dev, int device_index)
{
	std::vector<uint8_t> raw;
	if (int r = dev.get_device_descriptor(raw))
		throw usb_descriptor_error("get device descriptor", r, device_index);

	try
	{
		return parse_device_descriptor(raw);
	}
	catch (usb_descriptor_error const & e)
	{
		throw usb_descriptor_error(e.operation(), e.error_number(), device_index);
	}
}

usb_config_descriptor rawusb::get_config_descriptor(usb_host_device const & dev, int device_index, uint8_t config_index)
{
	std::vector<uint8_t> raw;
	if (int r = dev.get_config_descriptor(config_index, raw))
		throw usb_descriptor_error("get config descriptor", r, device_index, config_index);

	try
	{
		return parse_config_descriptor(raw);
	}
	catch (usb_descriptor_error const & e)
	{
		throw usb_descriptor_error(e.operation(), e.error_number(), device_index, config_index);
	}
}
