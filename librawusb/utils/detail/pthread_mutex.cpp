#include "pthread_mutex.hpp"
#include <stdexcept>
#include <string.h>
using namespace rawusb::detail;

pthread_mutex::pthread_mutex()
{
	int r = pthread_mutex_init(&m_mutex, 0);
	if (r != 0)
		throw std::runtime_error(std::string("cannot create mutex: ") + strerror(r));
}

pthread_mutex::~pthread_mutex()
{
	pthread_mutex_destroy(&m_mutex);
}

void pthread_mutex::lock()
{
	int r = pthread_mutex_lock(&m_mutex);
	if (r != 0)
		throw std::runtime_error(std::string("cannot lock mutex: ") + strerror(r));
}

void pthread_mutex::unlock()
{
	pthread_mutex_unlock(&m_mutex);
}
