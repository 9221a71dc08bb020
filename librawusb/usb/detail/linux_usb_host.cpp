#include "linux_usb_host.hpp"
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/usbdevice_fs.h>
using namespace rawusb;
using namespace rawusb::detail;

linux_usb_host_handle::linux_usb_host_handle(scoped_unix_fd && fd, uint8_t interface_number)
	: m_fd(std::move(fd)), m_interface_number(interface_number)
{
}

linux_usb_host_handle::~linux_usb_host_handle()
{
	int ioctl_arg = m_interface_number;
	ioctl(m_fd.get(), USBDEVFS_RELEASEINTERFACE, &ioctl_arg);
}

int linux_usb_host_handle::interrupt_transfer(usb_endpoint_t ep, uint8_t * buffer, size_t size, size_t & transferred)
{
	if (size > INT_MAX)
		return EINVAL;

	struct usbdevfs_urb urb;
	memset(&urb, 0, sizeof urb);
	urb.type = USBDEVFS_URB_TYPE_INTERRUPT;
	urb.endpoint = ep;
	urb.buffer = buffer;
	urb.buffer_length = static_cast<int>(size);

	if (ioctl(m_fd.get(), USBDEVFS_SUBMITURB, &urb) < 0)
		return errno;

	// The fd is blocking, so reaping waits for the transfer. Only one
	// URB is ever pending on a handle, the reaped one is ours.
	for (;;)
	{
		struct usbdevfs_urb * reaped = 0;
		if (ioctl(m_fd.get(), USBDEVFS_REAPURB, &reaped) == 0)
			break;

		if (errno != EINTR)
		{
			// The URB refers to this frame, take it back before failing.
			int err = errno;
			ioctl(m_fd.get(), USBDEVFS_DISCARDURB, &urb);
			while (ioctl(m_fd.get(), USBDEVFS_REAPURB, &reaped) < 0 && errno == EINTR)
			{
			}
			return err;
		}
	}

	if (urb.status < 0)
		return -urb.status;

	transferred = static_cast<size_t>(urb.actual_length);
	return 0;
}

static void store_le16(uint8_t * p, uint16_t v)
{
	p[0] = static_cast<uint8_t>(v);
	p[1] = static_cast<uint8_t>(v >> 8);
}

linux_usb_host_device::linux_usb_host_device(std::string const & devnode, uint8_t port, std::vector<uint8_t> & descriptors)
	: m_devnode(devnode), m_port(port)
{
	m_descriptors.swap(descriptors);
	if (m_descriptors.size() < usb_device_descriptor::size)
		return;

	// usbfs returns the device descriptor in host byte order,
	// put the 16-bit fields back into bus order.
	static size_t const le16_fields[] = { 2, 8, 10, 12 };
	for (size_t i = 0; i < sizeof le16_fields / sizeof le16_fields[0]; ++i)
	{
		uint16_t v;
		memcpy(&v, &m_descriptors[le16_fields[i]], sizeof v);
		store_le16(&m_descriptors[le16_fields[i]], v);
	}

	size_t offset = m_descriptors[0];
	while (offset + 4 <= m_descriptors.size())
	{
		size_t total_length = m_descriptors[offset + 2] | (m_descriptors[offset + 3] << 8);
		if (total_length < usb_raw_config_descriptor::size || offset + total_length > m_descriptors.size())
			break;

		m_configs.push_back(std::make_pair(offset, total_length));
		offset += total_length;
	}
}

int linux_usb_host_device::get_device_descriptor(std::vector<uint8_t> & desc) const
{
	if (m_descriptors.size() < usb_device_descriptor::size)
		return EIO;

	desc.assign(m_descriptors.begin(), m_descriptors.begin() + usb_device_descriptor::size);
	return 0;
}

int linux_usb_host_device::get_config_descriptor(uint8_t index, std::vector<uint8_t> & desc) const
{
	if (index >= m_configs.size())
		return ENOENT;

	std::vector<uint8_t>::const_iterator first = m_descriptors.begin() + m_configs[index].first;
	desc.assign(first, first + m_configs[index].second);
	return 0;
}

uint8_t linux_usb_host_device::port_number() const
{
	return m_port;
}

int linux_usb_host_device::open(uint8_t interface_number, uint8_t altsetting, std::unique_ptr<usb_host_handle> & handle)
{
	scoped_unix_fd fd(::open(m_devnode.c_str(), O_RDWR | O_CLOEXEC));
	if (fd.empty())
		return errno;

	int ioctl_arg = interface_number;
	if (ioctl(fd.get(), USBDEVFS_CLAIMINTERFACE, &ioctl_arg) < 0)
		return errno;

	// A previous user may have left the interface on another alternate setting.
	struct usbdevfs_setinterface setintf;
	setintf.interface = interface_number;
	setintf.altsetting = altsetting;
	if (ioctl(fd.get(), USBDEVFS_SETINTERFACE, &setintf) < 0)
	{
		int err = errno;
		ioctl(fd.get(), USBDEVFS_RELEASEINTERFACE, &ioctl_arg);
		return err;
	}

	handle.reset(new linux_usb_host_handle(std::move(fd), interface_number));
	return 0;
}

// Reads everything the usbfs node returns: the device descriptor
// followed by all the configuration descriptors.
static bool read_descriptors(char const * devnode, std::vector<uint8_t> & descriptors)
{
	scoped_unix_fd fd(::open(devnode, O_RDONLY | O_CLOEXEC));
	if (fd.empty())
		return false;

	uint8_t buf[4096];
	for (;;)
	{
		ssize_t r = ::read(fd.get(), buf, sizeof buf);
		if (r < 0)
		{
			if (errno == EINTR)
				continue;
			return false;
		}

		if (r == 0)
			break;

		descriptors.insert(descriptors.end(), buf, buf + r);
	}

	return descriptors.size() >= usb_device_descriptor::size;
}

uint8_t rawusb::detail::parse_port_number(char const * sysname)
{
	char const * sep = strrchr(sysname, '.');
	if (!sep)
		sep = strrchr(sysname, '-');
	if (!sep)
		return 0;

	return static_cast<uint8_t>(strtoul(sep + 1, 0, 10));
}

int linux_usb_host_session::init()
{
	m_udev.reset(udev_new());
	if (m_udev.empty())
		return errno? errno: ENOMEM;
	return 0;
}

int linux_usb_host_session::get_device_list(std::vector<std::shared_ptr<usb_host_device> > & devices)
{
	scoped_udev_enumerate e(udev_enumerate_new(m_udev.get()));
	if (e.empty())
		return ENOMEM;

	if (int r = udev_enumerate_add_match_subsystem(e.get(), "usb"))
		return -r;
	if (int r = udev_enumerate_add_match_property(e.get(), "DEVTYPE", "usb_device"))
		return -r;
	if (int r = udev_enumerate_scan_devices(e.get()))
		return -r;

	std::vector<std::shared_ptr<usb_host_device> > res;

	struct udev_list_entry * p;
	udev_list_entry_foreach(p, udev_enumerate_get_list_entry(e.get()))
	{
		char const * path = udev_list_entry_get_name(p);

		// Devices that went away or that we can't read are not listed.
		scoped_udev_device dev(udev_device_new_from_syspath(m_udev.get(), path));
		if (dev.empty())
			continue;

		char const * devnode = udev_device_get_devnode(dev.get());
		char const * sysname = udev_device_get_sysname(dev.get());
		if (!devnode || !sysname)
			continue;

		std::vector<uint8_t> descriptors;
		if (!read_descriptors(devnode, descriptors))
			continue;

		res.push_back(std::make_shared<linux_usb_host_device>(devnode, parse_port_number(sysname), descriptors));
	}

	devices.swap(res);
	return 0;
}

int linux_usb_host::open_session(std::unique_ptr<usb_host_session> & session)
{
	std::unique_ptr<linux_usb_host_session> s(new linux_usb_host_session());
	if (int r = s->init())
		return r;

	session = std::move(s);
	return 0;
}

usb_host & rawusb::system_usb_host()
{
	static linux_usb_host host;
	return host;
}
