#include "usb_error.hpp"
#include <errno.h>
#include <stdio.h>
using namespace rawusb;

std::string rawusb::usb_error_name(int error_number)
{
	if (error_number < 0)
		error_number = -error_number;

	switch (error_number)
	{
	case 0:
		return "success";
	case ENODEV:
	case ENXIO:
	case ESHUTDOWN:
		return "no device";
	case EACCES:
	case EPERM:
		return "access denied";
	case EBUSY:
		return "busy";
	case ETIMEDOUT:
		return "timeout";
	case EPIPE:
		return "pipe error";
	case EOVERFLOW:
		return "overflow";
	case EINTR:
		return "interrupted";
	case ENOMEM:
		return "out of memory";
	case ENOENT:
		return "not found";
	case EIO:
	case EPROTO:
	case EILSEQ:
		return "I/O error";
	case EINVAL:
		return "invalid parameter";
	case ENOSYS:
	case ENOTTY:
	case EOPNOTSUPP:
		return "not supported";
	case EBADF:
		return "device closed";
	}

	char buf[32];
	snprintf(buf, sizeof buf, "error %d", error_number);
	return buf;
}

static std::string format_message(std::string const & operation, int error_number)
{
	char code[16];
	snprintf(code, sizeof code, "%d", error_number);
	return operation + " failed: " + usb_error_name(error_number) + " (" + code + ")";
}

static std::string format_descriptor_message(std::string const & operation, int error_number,
	int device_index, int config_index)
{
	if (device_index < 0)
		return format_message(operation, error_number);

	char where[64];
	if (config_index < 0)
		snprintf(where, sizeof where, "device %d descriptor", device_index);
	else
		snprintf(where, sizeof where, "device %d config %d", device_index, config_index);

	return std::string("failed to get ") + where + ": " + format_message(operation, error_number);
}

usb_error::usb_error(std::string const & operation, int error_number)
	: std::runtime_error(format_message(operation, error_number)),
	m_operation(operation), m_error_number(error_number)
{
}

usb_error::usb_error(std::string const & what, std::string const & operation, int error_number)
	: std::runtime_error(what), m_operation(operation), m_error_number(error_number)
{
}

usb_descriptor_error::usb_descriptor_error(std::string const & operation, int error_number,
	int device_index, int config_index)
	: usb_error(format_descriptor_message(operation, error_number, device_index, config_index), operation, error_number),
	m_device_index(device_index), m_config_index(config_index)
{
}

usb_enumeration_error::usb_enumeration_error(usb_descriptor_error const & cause)
	: usb_error(std::string("enumeration aborted, ") + cause.what(), cause.operation(), cause.error_number()),
	m_device_index(cause.device_index()), m_config_index(cause.config_index())
{
}

usb_closed_error::usb_closed_error(std::string const & operation)
	: usb_error(operation + " failed: device closed", operation, EBADF)
{
}
