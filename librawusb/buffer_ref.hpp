#ifndef LIBRAWUSB_BUFFER_REF_HPP
#define LIBRAWUSB_BUFFER_REF_HPP

#include <vector>
#include <algorithm>
#include <stdint.h>
#include <stddef.h>

namespace rawusb {

// Non-owning view of a contiguous range of bytes.
class buffer_ref
{
public:
	buffer_ref(uint8_t const * first, uint8_t const * last)
		: m_first(first), m_last(last)
	{
	}

	buffer_ref(std::vector<uint8_t> const & v)
		: m_first(v.data()), m_last(v.data() + v.size())
	{
	}

	size_t size() const { return static_cast<size_t>(m_last - m_first); }
	bool empty() const { return m_first == m_last; }

	uint8_t operator[](size_t i) const { return m_first[i]; }

	// Little-endian 16-bit field at the given offset.
	uint16_t le16(size_t offset) const
	{
		return static_cast<uint16_t>(m_first[offset] | (m_first[offset + 1] << 8));
	}

	buffer_ref first(size_t size) const
	{
		return buffer_ref(m_first, m_first + (std::min)(this->size(), size));
	}

	buffer_ref & operator+=(size_t offset)
	{
		m_first += (std::min)(this->size(), offset);
		return *this;
	}

private:
	uint8_t const * m_first;
	uint8_t const * m_last;
};

} // namespace rawusb

#endif // LIBRAWUSB_BUFFER_REF_HPP
