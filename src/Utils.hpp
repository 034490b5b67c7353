/**@file Utils.hpp
 * @date 20261018 09:12:40 */

#ifndef __UTILS_HPP__
#define __UTILS_HPP__

#include <zmq.h>
#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <string>
#include <logging.hpp>
#include <pcmsink.h>

namespace pcmsink {

inline void*
createSock(void* ctx, int type, int hwm = 50)
{
	void* sock = zmq_socket(ctx, type);
	if (!sock)
	{
		VLOG(2) << _("Error creating socket.")
		        << _(" Message: ") << zmq_strerror(errno);
		return NULL;
	}
	const int zero = 0;
	if (zmq_setsockopt(sock, ZMQ_LINGER, &zero, sizeof(zero)) == -1)
	{
		VLOG(2) << _("Error setting LINGER on socket.")
		        << _(" Message: ") << zmq_strerror(errno);
		zmq_close(sock);
		return NULL;
	}
	if (zmq_setsockopt(sock, ZMQ_RCVHWM, &hwm, sizeof(hwm)) == -1)
	{
		VLOG(2) << _("Error setting high water mark on recv to socket.")
		        << _(" Message: ") << zmq_strerror(errno);
		zmq_close(sock);
		return NULL;
	}
	if (zmq_setsockopt(sock, ZMQ_SNDHWM, &hwm, sizeof(hwm)) == -1)
	{
		VLOG(2) << _("Error setting high water mark on send to socket.")
		        << _(" Message: ") << zmq_strerror(errno);
		zmq_close(sock);
		return NULL;
	}
	return sock;
}

inline void*
createBindSock(void* ctx, std::string path, int type, int hwm = 50)
{
	void* sock = createSock(ctx, type, hwm);
	if (!sock)
		return NULL;
	if (zmq_bind(sock, path.c_str()) == -1)
	{
		VLOG(2) << _("Error binding socket ") << path
		        << _(" Message: ") << zmq_strerror(errno);
		zmq_close(sock);
		return NULL;
	}
	return sock;
}

inline void*
createConnectSock(void* ctx, std::string path, int type, int hwm = 50)
{
	void* sock = createSock(ctx, type, hwm);
	if (!sock)
		return NULL;
	if (zmq_connect(sock, path.c_str()) == -1)
	{
		VLOG(2) << _("Error connecting socket ") << path
		        << _(" Message: ") << zmq_strerror(errno);
		zmq_close(sock);
		return NULL;
	}
	return sock;
}

template<typename T> inline void
add_to_buf(uint8_t*& buf, T val)
{
	memcpy(buf, &val, sizeof(T));
	buf += sizeof(T);
}

inline void
add_to_buf(uint8_t*& buf, const void* val, size_t valsz)
{
	if(!val || valsz == 0)
		return;
	memcpy(buf, val, valsz);
	buf += valsz;
}

template<typename T> inline void
get_from_buf(const uint8_t*& buf, T& val)
{
	memcpy(&val, buf, sizeof(T));
	buf += sizeof(T);
}

/**@brief Stat size of a regular file
 * @return false if path doesn't exist or is not a regular file*/
inline bool
file_size(const std::string& path, size_t& size)
{
	struct stat st;
	if (stat(path.c_str(), &st) == -1 || !S_ISREG(st.st_mode))
		return false;
	size = st.st_size;
	return true;
}

inline bool
file_exists(const std::string& path)
{
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

inline std::string
get_base_name(const std::string& path)
{
	std::string::size_type pos = path.find_last_of('/');
	if (pos == std::string::npos)
		return path;
	return path.substr(pos + 1);
}

/// poll timeout, ms
static const long TICK = 10;

} // namespace

#endif // __UTILS_HPP__
