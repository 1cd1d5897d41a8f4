/* $Id$
 *
 * Copyright (c) 2006-2017, Parallels International GmbH
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
 * Our contact details: Parallels International GmbH, Vordergasse 59, 8200
 * Schaffhausen, Switzerland.
 *
 */
#include <unistd.h>
#include <fcntl.h>
#include <limits.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include <sstream>
#include <vector>

#include "migchannel.h"
#include "common.h"
#include "bincom.h"
#include "channel.h"
#include "util.h"

/* control packets carry driver headers, keep some room */
#define MAX_PKT_SIZE	(1 << 20)

int MigrateConn::sendBuf(const char *buf, size_t size)
{
	if (!isOpen())
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_SEND_BUF);

	return write(buf, size);
}

int MigrateConn::sendPkt(const char *str, ...)
{
	va_list ap;
	va_start(ap, str);
	int rc = sendPkt(PACKET_SEPARATOR, str, ap);
	va_end(ap);
	return rc;
}

int MigrateConn::sendPkt(char separator, const char *str, va_list ap)
{
	int rc;
	char buffer[BUFSIZ + 1];

	rc = vsnprintf(buffer, sizeof(buffer), str, ap);
	if (rc < 0)
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_SEND_PKT);
	else if (rc >= (int)sizeof(buffer) - 1)
		return putErr(MIG_ERR_CONN_TOOLONG,
			"can't send : too long message");
	buffer[rc] = separator;

	return sendBuf(buffer, rc + 1);
}

// function to send reply as |errcode|replymessage
int MigrateConn::sendReply(int code, const char *str, ...)
{
	char buffer[BUFSIZ + 1];
	int sz1, sz2;
	va_list ap;

	sz1 = snprintf(buffer, sizeof(buffer), "|%d|", code);
	if (sz1 < 0)
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_SEND_PKT);

	va_start(ap, str);
	sz2 = vsnprintf(buffer + sz1, sizeof(buffer) - sz1, str, ap);
	va_end(ap);
	if (sz2 < 0)
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_SEND_PKT);
	if (sz2 >= (int)(sizeof(buffer) - sz1))
		return putErr(MIG_ERR_CONN_TOOLONG,
			"can't send : too long message");

	return sendBuf(buffer, sz1 + sz2 + 1);
}

/*
 * Read byte by byte: channel data stream follows the packet
 * and must not be consumed here.
 */
int MigrateConn::readPkt(char separator, std::string &pkt)
{
	char c;
	ssize_t rc;

	pkt.clear();
	while (1) {
		rc = read(&c, 1);
		if (rc < 0)
			return (int)rc;
		if (rc == 0)
			return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_RECV_REPLY);
		if (c == separator)
			break;
		if (pkt.size() >= MAX_PKT_SIZE)
			return putErr(MIG_ERR_CONN_TOOLONG,
				"can't read : too long packet");
		pkt.push_back(c);
	}
	return 0;
}

int MigrateConn::readReply(int *code, std::string &msg)
{
	int rc;
	std::string pkt;
	char *text;

	if ((rc = readPkt(PACKET_SEPARATOR, pkt)))
		return rc;

	std::vector<char> buf(pkt.begin(), pkt.end());
	buf.push_back('\0');
	if ((rc = recv_filter(&buf[0], code, &text)))
		return rc;
	msg = text;
	return 0;
}

SockConn::SockConn(int sock)
	: m_sock(sock)
	, m_open(true)
{
}

SockConn::~SockConn()
{
	close();
	close_safe(&m_sock);
}

ssize_t SockConn::read(char *buf, size_t size)
{
	ssize_t rc;

	while ((rc = recv(m_sock, buf, size, 0)) < 0) {
		if (errno == EINTR)
			continue;
		if (errno == EAGAIN || errno == EWOULDBLOCK)
			return putErr(MIG_ERR_CONN_TIMEOUT, "recv() : timeout");
		return putErr(MIG_ERR_CONN_BROKEN, "recv() : %m");
	}
	return rc;
}

int SockConn::write(const char *buf, size_t size)
{
	if (!isOpen())
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_SEND_BUF);
	return sock_write(m_sock, buf, size);
}

int SockConn::close()
{
	boost::mutex::scoped_lock lock(m_lock);

	if (!m_open)
		return 0;
	m_open = false;

	/* descriptor is released in destructor, reader may still use it */
	if (shutdown(m_sock, SHUT_RDWR) && errno != ENOTCONN)
		return putErr(MIG_ERR_SYSTEM, "shutdown() : %m");
	return 0;
}

bool SockConn::isOpen() const
{
	boost::mutex::scoped_lock lock(m_lock);
	return m_open;
}

int SockConn::setTimeout(long tmo)
{
	return sock_set_tmo(m_sock, tmo);
}

int send_control(MigrateConn *conn, const MigrateControl &msg)
{
	std::ostringstream os;

	if (conn == NULL)
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_SEND_BUF);

	os << "|" << msg.code << "|" << msg.message << PACKET_SEPARATOR;
	std::string pkt = os.str();
	if (pkt.size() > MAX_PKT_SIZE)
		return putErr(MIG_ERR_CONN_TOOLONG, "can't send : too long message");

	return conn->sendBuf(pkt.data(), pkt.size());
}

int recv_control(MigrateConn *conn, MigrateControl &msg)
{
	if (conn == NULL)
		return putErr(MIG_ERR_CONN_BROKEN, MIG_MSG_RECV_REPLY);

	return conn->readReply(&msg.code, msg.message);
}

int send_channel_secret(MigrateConn *conn, const std::string &secret)
{
	int rc;
	int code;
	std::string reply;

	if ((rc = conn->sendPkt(CMD_SECRET " %s", secret.c_str())))
		return rc;

	if ((rc = conn->readReply(&code, reply)))
		return putErr(rc, MIG_MSG_REPLY);
	if (code)
		return putErr(code, "%s", reply.c_str());
	return 0;
}

int recv_channel_secret(MigrateConn *conn, std::string &secret)
{
	int rc;
	std::string pkt;
	const size_t len = strlen(CMD_SECRET " ");

	if ((rc = conn->readPkt(PACKET_SEPARATOR, pkt)))
		return rc;

	if (pkt.compare(0, len, CMD_SECRET " ") != 0 || pkt.size() == len)
		return putErr(MIG_ERR_PROTOCOL, "%s : bad channel request",
			MIG_MSG_PROTOCOL);

	secret = pkt.substr(len);
	return 0;
}

SockDialer::SockDialer(long tmo)
	: m_tmo(tmo)
{
}

int SockDialer::dial(const std::string &url, const std::string &secret,
		MigrateConnPtr &conn)
{
	int rc;
	int sock;
	char host[NI_MAXHOST];
	char service[NI_MAXSERV];
	long tmo = m_tmo ? m_tmo : MIGoptions.tmo.val;

	if ((rc = split_address(url.c_str(), host, sizeof(host),
			service, sizeof(service))))
		return rc;

	logger(LOG_DEBUG, "connect to %s:%s", host, service);
	if ((rc = sock_connect(host, service, tmo, &sock)))
		return rc;

	boost::shared_ptr<SockConn> sc(new SockConn(sock));

	/* handshake is bounded, transfer is not */
	if ((rc = sc->setTimeout(tmo)))
		return rc;
	if ((rc = send_channel_secret(sc.get(), secret)))
		return rc;
	if ((rc = sc->setTimeout(0)))
		return rc;

	conn = sc;
	return 0;
}
