#ifndef LIBRAWUSB_USB_RAW_DEVICE_HPP
#define LIBRAWUSB_USB_RAW_DEVICE_HPP

#include "device.hpp"
#include "endpoint_matcher.hpp"
#include "usb_host.hpp"
#include "../utils/detail/pthread_mutex.hpp"
#include <string>
#include <memory>

namespace rawusb {

class raw_device;

// A device interface with a matching pair of interrupt endpoints,
// as found by enumerate_raw. Keeps the host device entry alive,
// so it can be opened after the enumeration is over.
class raw_device_info
	: public device_info
{
public:
	raw_device_info();
	raw_device_info(std::string const & path, uint16_t vendor_id, uint16_t product_id,
		uint8_t config_value, uint8_t interface_number, uint8_t altsetting,
		usb_endpoint_pair const & endpoints, std::shared_ptr<usb_host_device> const & dev);

	device_type type() const override;
	std::string path() const override;
	uint16_t vendor_id() const override;
	uint16_t product_id() const override;
	int interface_number() const override;
	uint16_t usage_page() const override;

	// Throws usb_open_error.
	std::unique_ptr<device> open() const override;

	uint8_t config_value() const { return m_config_value; }
	uint8_t altsetting() const { return m_altsetting; }
	usb_endpoint_t reader() const { return m_endpoints.reader; }
	usb_endpoint_t writer() const { return m_endpoints.writer; }

	std::shared_ptr<usb_host_device> const & host_device() const { return m_dev; }

private:
	std::string m_path;
	uint16_t m_vendor_id;
	uint16_t m_product_id;
	uint8_t m_config_value;
	uint8_t m_interface_number;
	uint8_t m_altsetting;
	usb_endpoint_pair m_endpoints;
	std::shared_ptr<usb_host_device> m_dev;
};

// Opens the device referenced by `info` and claims its interface.
// Throws usb_open_error, also when the reference is empty or stale.
std::unique_ptr<raw_device> open_raw(raw_device_info const & info);

// An open raw device. Reads, writes and close are serialized, close
// waits for a transfer in progress to complete.
class raw_device
	: public device
{
public:
	raw_device(raw_device_info const & info, std::unique_ptr<usb_host_handle> handle);
	~raw_device();

	raw_device_info const & info() const { return m_info; }

	device_type type() const override;

	// Blocking interrupt transfers on the reader and writer endpoint.
	// Throw std::invalid_argument for an empty buffer, usb_closed_error
	// after close and usb_transfer_error if the host stack fails.
	size_t read(uint8_t * buffer, size_t size) override;
	size_t write(uint8_t const * buffer, size_t size) override;

	// Idempotent.
	void close() override;

	bool is_closed() const;

private:
	size_t transfer(char const * operation, usb_endpoint_t ep, uint8_t * buffer, size_t size);

	raw_device_info m_info;
	std::unique_ptr<usb_host_handle> m_handle;
	mutable detail::pthread_mutex m_mutex;
};

} // namespace rawusb

#endif // LIBRAWUSB_USB_RAW_DEVICE_HPP
