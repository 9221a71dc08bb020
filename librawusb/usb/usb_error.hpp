#ifndef LIBRAWUSB_USB_USB_ERROR_HPP
#define LIBRAWUSB_USB_USB_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rawusb {

// Returns a short symbolic name for an errno-style host stack error code.
// Negative codes are treated as their absolute value.
std::string usb_error_name(int error_number);

// Base of all errors reported by the host stack. Carries the name
// of the failed operation and the host error code.
class usb_error
	: public std::runtime_error
{
public:
	usb_error(std::string const & operation, int error_number);

	std::string const & operation() const { return m_operation; }
	int error_number() const { return m_error_number; }

protected:
	usb_error(std::string const & what, std::string const & operation, int error_number);

private:
	std::string m_operation;
	int m_error_number;
};

// The host stack session or its device list could not be created.
class usb_init_error
	: public usb_error
{
public:
	usb_init_error(std::string const & operation, int error_number)
		: usb_error(operation, error_number)
	{
	}
};

// A device or configuration descriptor could not be retrieved or decoded.
// The indices are -1 when not known.
class usb_descriptor_error
	: public usb_error
{
public:
	usb_descriptor_error(std::string const & operation, int error_number,
		int device_index = -1, int config_index = -1);

	int device_index() const { return m_device_index; }
	int config_index() const { return m_config_index; }

private:
	int m_device_index;
	int m_config_index;
};

// Enumeration was aborted by a descriptor failure; no partial result exists.
class usb_enumeration_error
	: public usb_error
{
public:
	explicit usb_enumeration_error(usb_descriptor_error const & cause);

	int device_index() const { return m_device_index; }
	int config_index() const { return m_config_index; }

private:
	int m_device_index;
	int m_config_index;
};

class usb_open_error
	: public usb_error
{
public:
	usb_open_error(std::string const & operation, int error_number)
		: usb_error(operation, error_number)
	{
	}
};

// A transfer failed on the host side. Short transfers are not errors.
class usb_transfer_error
	: public usb_error
{
public:
	usb_transfer_error(std::string const & operation, int error_number)
		: usb_error(operation, error_number)
	{
	}
};

// An operation was attempted on a closed device.
class usb_closed_error
	: public usb_error
{
public:
	explicit usb_closed_error(std::string const & operation);
};

template <typename E>
void check_usb_error(int error_number, char const * operation)
{
	if (error_number != 0)
		throw E(operation, error_number);
}

} // namespace rawusb

#endif // LIBRAWUSB_USB_USB_ERROR_HPP
