#ifndef LIBRAWUSB_USB_DETAIL_UDEV_HPP
#define LIBRAWUSB_USB_DETAIL_UDEV_HPP

#include <libudev.h>

namespace rawusb {
namespace detail {

// Owns one reference to a libudev object and drops it on destruction.
template <typename T, T * (*Unref)(T *)>
class scoped_udev_object
{
public:
	explicit scoped_udev_object(T * obj = 0)
		: m_obj(obj)
	{
	}

	~scoped_udev_object()
	{
		this->reset();
	}

	bool empty() const
	{
		return m_obj == 0;
	}

	void reset(T * obj = 0)
	{
		if (m_obj)
			Unref(m_obj);
		m_obj = obj;
	}

	T * get() const
	{
		return m_obj;
	}

private:
	T * m_obj;

	scoped_udev_object(scoped_udev_object const &);
	scoped_udev_object & operator=(scoped_udev_object const &);
};

typedef scoped_udev_object<struct udev, &udev_unref> scoped_udev;
typedef scoped_udev_object<struct udev_enumerate, &udev_enumerate_unref> scoped_udev_enumerate;
typedef scoped_udev_object<struct udev_device, &udev_device_unref> scoped_udev_device;

} // namespace detail
} // namespace rawusb

#endif // LIBRAWUSB_USB_DETAIL_UDEV_HPP
