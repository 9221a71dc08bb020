#include "raw_device.hpp"
#include "usb_error.hpp"
#include <stdexcept>
#include <errno.h>
using namespace rawusb;

raw_device_info::raw_device_info()
	: m_vendor_id(0), m_product_id(0), m_config_value(0), m_interface_number(0), m_altsetting(0)
{
	m_endpoints.reader = 0;
	m_endpoints.writer = 0;
}

raw_device_info::raw_device_info(std::string const & path, uint16_t vendor_id, uint16_t product_id,
	uint8_t config_value, uint8_t interface_number, uint8_t altsetting,
	usb_endpoint_pair const & endpoints, std::shared_ptr<usb_host_device> const & dev)
	: m_path(path), m_vendor_id(vendor_id), m_product_id(product_id), m_config_value(config_value),
	m_interface_number(interface_number), m_altsetting(altsetting), m_endpoints(endpoints), m_dev(dev)
{
}

device_type raw_device_info::type() const
{
	return device_type_generic;
}

std::string raw_device_info::path() const
{
	return m_path;
}

uint16_t raw_device_info::vendor_id() const
{
	return m_vendor_id;
}

uint16_t raw_device_info::product_id() const
{
	return m_product_id;
}

int raw_device_info::interface_number() const
{
	return m_interface_number;
}

uint16_t raw_device_info::usage_page() const
{
	return 0;
}

std::unique_ptr<device> raw_device_info::open() const
{
	return open_raw(*this);
}

std::unique_ptr<raw_device> rawusb::open_raw(raw_device_info const & info)
{
	if (!info.host_device())
		throw usb_open_error("open device", ENODEV);

	std::unique_ptr<usb_host_handle> handle;
	check_usb_error<usb_open_error>(info.host_device()->open(
		static_cast<uint8_t>(info.interface_number()), info.altsetting(), handle), "open device");
	if (!handle)
		throw usb_open_error("open device", ENODEV);

	return std::unique_ptr<raw_device>(new raw_device(info, std::move(handle)));
}

raw_device::raw_device(raw_device_info const & info, std::unique_ptr<usb_host_handle> handle)
	: m_info(info), m_handle(std::move(handle))
{
}

raw_device::~raw_device()
{
	this->close();
}

device_type raw_device::type() const
{
	return device_type_generic;
}

size_t raw_device::read(uint8_t * buffer, size_t size)
{
	return this->transfer("read", m_info.reader(), buffer, size);
}

size_t raw_device::write(uint8_t const * buffer, size_t size)
{
	// The host stack never writes into the buffer of an OUT transfer.
	return this->transfer("write", m_info.writer(), const_cast<uint8_t *>(buffer), size);
}

size_t raw_device::transfer(char const * operation, usb_endpoint_t ep, uint8_t * buffer, size_t size)
{
	if (!buffer || size == 0)
		throw std::invalid_argument(std::string(operation) + ": empty buffer");

	detail::scoped_pthread_lock l(m_mutex);
	if (!m_handle)
		throw usb_closed_error(operation);

	size_t transferred = 0;
	check_usb_error<usb_transfer_error>(m_handle->interrupt_transfer(ep, buffer, size, transferred), operation);
	return transferred;
}

void raw_device::close()
{
	detail::scoped_pthread_lock l(m_mutex);
	m_handle.reset();
}

bool raw_device::is_closed() const
{
	detail::scoped_pthread_lock l(m_mutex);
	return !m_handle;
}
