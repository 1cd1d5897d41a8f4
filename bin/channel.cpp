/* $Id$
 *
 * Copyright (c) 2008-2016 Parallels IP Holdings GmbH
 *
 * This file is part of OpenVZ. OpenVZ is free software; you can redistribute
 * it and/or modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the License,
 * or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301, USA.
 *
 * Our contact details: Parallels IP Holdings GmbH, Vordergasse 59, 8200
 * Schaffhausen, Switzerland.
 *
 */
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>

#include "common.h"
#include "util.h"
#include "channel.h"

int recv_filter(char *buffer, int *code, char **msg)
{
	char *p, *ep;
	long l;

	if (buffer[0] != '|')
		return putErr(MIG_ERR_PROTOCOL, "%s : '%s'", MIG_MSG_PROTOCOL, buffer);

	if ((p = strchr(buffer + 1, '|')) == NULL)
		return putErr(MIG_ERR_PROTOCOL, "%s : '%s'", MIG_MSG_PROTOCOL, buffer);
	*p = '\0';

	errno = 0;
	l = strtol(buffer + 1, &ep, 10);
	if (errno || *ep != '\0' || ep == buffer + 1) {
		*p = '|';
		return putErr(MIG_ERR_PROTOCOL, "%s : '%s'", MIG_MSG_PROTOCOL, buffer);
	}

	*code = (int)l;
	*msg = p + 1;
	return 0;
}

int split_address(
		const char *addr,
		char *host,
		size_t hsize,
		char *service,
		size_t ssize)
{
	const char *p;
	size_t len;

	if (addr[0] == '[') {
		if ((p = strchr(addr, ']')) == NULL || p[1] != ':')
			return putErr(MIG_ERR_USAGE, "invalid address '%s'", addr);
		len = p - addr - 1;
		p += 1;
		addr += 1;
	} else {
		if ((p = strrchr(addr, ':')) == NULL)
			return putErr(MIG_ERR_USAGE, "invalid address '%s'", addr);
		len = p - addr;
	}

	if (len == 0 || len >= hsize || *(p + 1) == '\0')
		return putErr(MIG_ERR_USAGE, "invalid address '%s'", addr);

	memcpy(host, addr, len);
	host[len] = '\0';
	copy_cstr(p + 1, service, ssize);
	return 0;
}

static int connect_tmo(int sock, const struct sockaddr *addr, socklen_t len, long tmo)
{
	struct pollfd pfd;
	int err;
	socklen_t elen = sizeof(err);
	int rc;

	if (do_nonblock(sock))
		return -1;

	if (connect(sock, addr, len) == 0)
		return do_block(sock);
	if (errno != EINPROGRESS)
		return -1;

	pfd.fd = sock;
	pfd.events = POLLOUT;
	while ((rc = poll(&pfd, 1, tmo * 1000)) == -1 && errno == EINTR)
		;
	if (rc == 0) {
		errno = ETIMEDOUT;
		return -1;
	} else if (rc < 0) {
		return -1;
	}

	if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &elen))
		return -1;
	if (err) {
		errno = err;
		return -1;
	}
	return do_block(sock);
}

int sock_connect(const char *host, const char *service, long tmo, int *out_sock)
{
	int rc;
	int sock = -1;
	struct addrinfo hints, *res, *ressave;

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	if ((rc = getaddrinfo(host, service, &hints, &ressave)))
		return putErr(MIG_ERR_CANT_CONNECT, "getaddrinfo(%s:%s) : %s",
			host, service, gai_strerror(rc));

	for (res = ressave; res; res = res->ai_next) {
		sock = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
		if (sock < 0)
			continue;
		if (connect_tmo(sock, res->ai_addr, res->ai_addrlen, tmo) == 0)
			break;
		rc = errno;
		close(sock);
		sock = -1;
		errno = rc;
	}
	freeaddrinfo(ressave);

	if (sock < 0) {
		if (errno == ETIMEDOUT)
			return putErr(MIG_ERR_CONN_TIMEOUT,
				"connection to %s:%s timed out", host, service);
		return putErr(MIG_ERR_CANT_CONNECT,
			"can't connect to %s:%s : %m", host, service);
	}

	do_clo(sock);
	*out_sock = sock;
	return 0;
}

int sock_set_tmo(int sock, long tmo)
{
	struct timeval tv;

	tv.tv_sec = tmo;
	tv.tv_usec = 0;
	if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)))
		return putErr(MIG_ERR_SYSTEM, "setsockopt(SO_RCVTIMEO) : %m");
	if (setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)))
		return putErr(MIG_ERR_SYSTEM, "setsockopt(SO_SNDTIMEO) : %m");
	return 0;
}

int sock_write(int fd, const char *data, size_t size)
{
	ssize_t rc;

	while (size) {
		rc = send(fd, data, size, MSG_NOSIGNAL);
		if (rc < 0) {
			if (errno == EINTR)
				continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK)
				return putErr(MIG_ERR_CONN_TIMEOUT,
					"send() : timeout");
			return putErr(MIG_ERR_CONN_BROKEN, "send() : %m");
		}
		data += rc;
		size -= rc;
	}
	return 0;
}
