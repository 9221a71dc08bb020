#ifndef LIBRAWUSB_UTILS_DETAIL_SCOPED_UNIX_FD_HPP
#define LIBRAWUSB_UTILS_DETAIL_SCOPED_UNIX_FD_HPP

#include <unistd.h>

namespace rawusb {
namespace detail {

// Owns a file descriptor and closes it on destruction.
class scoped_unix_fd
{
public:
	explicit scoped_unix_fd(int fd = -1)
		: m_fd(fd)
	{
	}

	scoped_unix_fd(scoped_unix_fd && o)
		: m_fd(o.release())
	{
	}

	~scoped_unix_fd()
	{
		this->reset();
	}

	scoped_unix_fd & operator=(scoped_unix_fd && o)
	{
		this->reset(o.release());
		return *this;
	}

	bool empty() const
	{
		return m_fd < 0;
	}

	int get() const
	{
		return m_fd;
	}

	void reset(int fd = -1)
	{
		if (m_fd >= 0)
			::close(m_fd);
		m_fd = fd;
	}

	int release()
	{
		int fd = m_fd;
		m_fd = -1;
		return fd;
	}

private:
	int m_fd;

	scoped_unix_fd(scoped_unix_fd const &);
	scoped_unix_fd & operator=(scoped_unix_fd const &);
};

} // namespace detail
} // namespace rawusb

#endif // LIBRAWUSB_UTILS_DETAIL_SCOPED_UNIX_FD_HPP
