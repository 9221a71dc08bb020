#include "test.h"
#include "fake_usb_host.hpp"
#include "memmock.h"
#include <librawusb/usb/raw_enumerate.hpp>
#include <librawusb/usb/device.hpp>
#include <librawusb/usb/usb_error.hpp>
#include <thread>
#include <vector>
#include <errno.h>

using namespace rawusb;

TEST_CASE(EnumerateFiltersVendorAndProduct, "enumerate")
{
	fake_usb_host host;
	host.add_raw_device(0x1209, 0x0001);
	host.add_raw_device(0x1209, 0x0002);
	host.add_raw_device(0x2341, 0x0001);

	std::vector<raw_device_info> res = enumerate_raw(host, 0x1209, 0);
	assert(res.size() == 2);
	for (size_t i = 0; i < res.size(); ++i)
		assert(res[i].vendor_id() == 0x1209);

	res = enumerate_raw(host, 0, 0x0001);
	assert(res.size() == 2);
	for (size_t i = 0; i < res.size(); ++i)
		assert(res[i].product_id() == 0x0001);

	res = enumerate_raw(host, 0x2341, 0x0001);
	assert(res.size() == 1);
	assert(res[0].vendor_id() == 0x2341);

	res = enumerate_raw(host, 0x2341, 0x0002);
	assert(res.empty());

	res = enumerate_raw(host, 0, 0);
	assert(res.size() == 3);
	assert(host.live_sessions() == 0);
}

TEST_CASE(EnumerateEveryMatchingAltsetting, "enumerate")
{
	fake_usb_host host;
	std::shared_ptr<fake_usb_device> dev = host.add_device(0x1209, 0x53c1, 0, 3);

	dev->add_config(config_builder(1)
		.interface(0)
		.endpoint(0x81, 0x02)
		.endpoint(0x01, 0x02)
		.interface(1, 0)
		.interface(1, 1)
		.endpoint(0x82, 0x03)
		.endpoint(0x02, 0x03)
		.interface(1, 2)
		.endpoint(0x83, 0x03)
		.endpoint(0x03, 0x03)
		.build());
	dev->add_config(config_builder(2)
		.interface(0)
		.endpoint(0x84, 0x03)
		.endpoint(0x04, 0x03)
		.build());

	std::vector<raw_device_info> res = enumerate_raw(host, 0, 0);
	assert(res.size() == 3);

	assert(res[0].config_value() == 1);
	assert(res[0].interface_number() == 1);
	assert(res[0].altsetting() == 1);
	assert(res[0].reader() == 0x82);
	assert(res[0].writer() == 0x02);

	assert(res[1].config_value() == 1);
	assert(res[1].interface_number() == 1);
	assert(res[1].altsetting() == 2);
	assert(res[1].reader() == 0x83);

	assert(res[2].config_value() == 2);
	assert(res[2].interface_number() == 0);
	assert(res[2].reader() == 0x84);
	assert(res[2].writer() == 0x04);

	for (size_t i = 0; i < res.size(); ++i)
	{
		assert(res[i].path() == "1209:53c1:3");
		assert(res[i].type() == device_type_generic);
		assert(res[i].usage_page() == 0);
		assert(res[i].host_device() == dev);
	}
}

TEST_CASE(EnumerateSkipsHidClass, "enumerate")
{
	fake_usb_host host;
	host.add_raw_device(0x1209, 0x0001, usb_class_hid);
	host.add_raw_device(0x1209, 0x0002, 0);
	host.add_raw_device(0x1209, 0x0003, 0xff);

	std::vector<raw_device_info> res = enumerate_raw(host, 0, 0, true);
	assert(res.size() == 2);
	for (size_t i = 0; i < res.size(); ++i)
		assert(res[i].product_id() != 0x0001);

	res = enumerate_raw(host, 0x1209, 0x0001, true);
	assert(res.empty());

	res = enumerate_raw(host, 0, 0, false);
	assert(res.size() == 3);
}

TEST_CASE(EnumerateAbortsOnDescriptorError, "enumerate")
{
	fake_usb_host host;
	host.add_raw_device(0x1209, 0x0001);
	std::shared_ptr<fake_usb_device> bad = host.add_raw_device(0x1209, 0x0002);

	bad->config_descriptor_error = EIO;
	try
	{
		enumerate_raw(host, 0, 0);
		assert(false);
	}
	catch (usb_enumeration_error const & e)
	{
		assert(e.device_index() == 1);
		assert(e.config_index() == 0);
		assert(e.error_number() == EIO);
	}
	assert(host.live_sessions() == 0);

	// A device left out by the filter is never asked for its configurations.
	std::vector<raw_device_info> res = enumerate_raw(host, 0x1209, 0x0001);
	assert(res.size() == 1);

	bad->config_descriptor_error = 0;
	bad->device_descriptor_error = ENODEV;
	try
	{
		enumerate_raw(host, 0x1209, 0x0001);
		assert(false);
	}
	catch (usb_enumeration_error const & e)
	{
		assert(e.device_index() == 1);
		assert(e.config_index() == -1);
		assert(e.error_number() == ENODEV);
	}
	assert(host.live_sessions() == 0);

	// Held by the test and by the host only.
	assert(bad.use_count() == 2);
}

TEST_CASE(EnumerateAbortsOnMalformedConfig, "enumerate")
{
	fake_usb_host host;
	std::shared_ptr<fake_usb_device> dev = host.add_device(0x1209, 0x0001);
	std::vector<uint8_t> config = config_builder().interface(0).endpoint(0x81, 0x03).build();
	config.resize(config.size() - 1);
	config[2] = static_cast<uint8_t>(config.size());
	dev->add_config(config);

	try
	{
		enumerate_raw(host, 0, 0);
		assert(false);
	}
	catch (usb_enumeration_error const & e)
	{
		assert(e.error_number() == EINVAL);
		assert(e.device_index() == 0);
		assert(e.config_index() == 0);
	}
	assert(host.live_sessions() == 0);
}

TEST_CASE(EnumerateSessionFailure, "enumerate")
{
	fake_usb_host host;
	host.add_raw_device(0x1209, 0x0001);

	host.session_error = EACCES;
	try
	{
		enumerate_raw(host, 0, 0);
		assert(false);
	}
	catch (usb_init_error const & e)
	{
		assert(e.error_number() == EACCES);
	}

	host.session_error = 0;
	host.list_error = ENOMEM;
	assert_throws(usb_init_error, enumerate_raw(host, 0, 0));
	assert(host.live_sessions() == 0);
}

TEST_CASE(EnumerateRetainsDevices, "enumerate")
{
	fake_usb_host host;
	std::shared_ptr<fake_usb_device> dev = host.add_raw_device(0x1209, 0x0001);

	{
		std::vector<raw_device_info> res = enumerate_raw(host, 0, 0);
		assert(host.live_sessions() == 0);
		assert(dev.use_count() == 3);

		std::unique_ptr<raw_device> d = open_raw(res[0]);
		assert(!d->is_closed());
	}

	assert(dev.use_count() == 2);
}

TEST_CASE(EnumerateReleasesOnAllocFailure, "enumerate alloc")
{
	fake_usb_host host;
	std::shared_ptr<fake_usb_device> dev = host.add_raw_device(0x1209, 0x0001);
	host.add_raw_device(0x1209, 0x0002, usb_class_hid);

	size_t failures = 0;
	alloc_mocker m;
	while (m.next())
	{
		try
		{
			std::vector<raw_device_info> res = enumerate_raw(host, 0, 0, true);
			assert(res.size() == 1);
		}
		catch (std::bad_alloc const &)
		{
			assert(!m.good());
			++failures;
		}

		assert(host.live_sessions() == 0);
		assert(dev.use_count() == 2);
	}

	assert(m.alloc_count() != 0);
	assert(failures != 0);
}

TEST_CASE(EnumerateConcurrently, "enumerate threads")
{
	fake_usb_host host;
	for (uint16_t pid = 1; pid <= 4; ++pid)
		host.add_raw_device(0x1209, pid, 0, static_cast<uint8_t>(pid));

	int const threads = 8;
	int const iterations = 256;

	std::vector<int> errors(threads, 0);
	std::vector<std::thread> workers;
	for (int i = 0; i < threads; ++i)
	{
		workers.push_back(std::thread([&host, &errors, i, iterations] {
			for (int j = 0; j < iterations; ++j)
			{
				try
				{
					std::vector<raw_device_info> res = enumerate_raw(host, 0x1209, static_cast<uint16_t>(i % 5));
					size_t expected = i % 5 == 0? 4: 1;
					if (res.size() != expected)
						++errors[i];
				}
				catch (std::exception const &)
				{
					++errors[i];
				}
			}
		}));
	}

	for (size_t i = 0; i < workers.size(); ++i)
		workers[i].join();

	for (int i = 0; i < threads; ++i)
		assert(errors[i] == 0);

	assert(host.stats.sessions_opened == threads * iterations);
	assert(host.live_sessions() == 0);
}

namespace {

class hid_info
	: public device_info
{
public:
	explicit hid_info(uint16_t product_id)
		: m_product_id(product_id)
	{
	}

	device_type type() const override { return device_type_hid; }
	std::string path() const override { return "hid"; }
	uint16_t vendor_id() const override { return 0x1209; }
	uint16_t product_id() const override { return m_product_id; }
	int interface_number() const override { return 0; }
	uint16_t usage_page() const override { return 0xff00; }

	std::unique_ptr<device> open() const override
	{
		throw usb_open_error("open hid device", ENOSYS);
	}

private:
	uint16_t m_product_id;
};

class fake_hid_enumerator
	: public hid_enumerator
{
public:
	fake_hid_enumerator()
		: calls(0)
	{
	}

	std::vector<std::shared_ptr<device_info> > enumerate(uint16_t vendor_id, uint16_t product_id) override
	{
		++calls;
		std::vector<std::shared_ptr<device_info> > res;
		if ((vendor_id == 0 || vendor_id == 0x1209) && (product_id == 0 || product_id == 0x0001))
			res.push_back(std::make_shared<hid_info>(0x0001));
		return res;
	}

	int calls;
};

}

TEST_CASE(EnumerateMergesHidDevices, "enumerate hid")
{
	fake_usb_host host;
	host.add_raw_device(0x1209, 0x0001, usb_class_hid);
	host.add_raw_device(0x1209, 0x0002);

	fake_hid_enumerator hid;
	std::vector<std::shared_ptr<device_info> > res = enumerate(host, 0, 0, &hid);
	assert(hid.calls == 1);
	assert(res.size() == 2);
	assert(res[0]->type() == device_type_hid);
	assert(res[0]->usage_page() == 0xff00);
	assert(res[1]->type() == device_type_generic);
	assert(res[1]->product_id() == 0x0002);

	res = enumerate(host, 0, 0);
	assert(res.size() == 2);
	assert(res[0]->type() == device_type_generic);
	assert(res[1]->type() == device_type_generic);

	res = enumerate(host, 0x1209, 0x0002, &hid);
	assert(res.size() == 1);
	assert(res[0]->path() == "1209:2:1");

	std::unique_ptr<device> d = res[0]->open();
	assert(d->type() == device_type_generic);
	d->close();
}

// Needs usbfs and udev; run with the "system" argument.
TEST_CASE(EnumerateSystemConcurrently, "+system")
{
	int const threads = 8;
	std::vector<int> errors(threads, 0);
	std::vector<std::thread> workers;
	for (int i = 0; i < threads; ++i)
	{
		workers.push_back(std::thread([&errors, i] {
			for (int j = 0; j < 64; ++j)
			{
				try
				{
					enumerate_raw(static_cast<uint16_t>(i), 0);
				}
				catch (usb_error const &)
				{
					++errors[i];
				}
			}
		}));
	}

	for (size_t i = 0; i < workers.size(); ++i)
		workers[i].join();

	for (int i = 0; i < threads; ++i)
		assert(errors[i] == 0);
}
