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
#ifndef __MIGCHANNEL_H_
#define __MIGCHANNEL_H_

#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>

#define PACKET_SEPARATOR '\0'

#define CMD_SECRET	"secret"

/*
 * One migration channel: bidirectional byte stream used for exactly
 * one migration.
 */
class MigrateConn : private boost::noncopyable
{
public:
	virtual ~MigrateConn() {}

	/* return number of bytes read, 0 on EOF, negative error code */
	virtual ssize_t read(char *buf, size_t size) = 0;
	virtual int write(const char *buf, size_t size) = 0;
	/* may be called from any thread, wakes up blocked reader */
	virtual int close() = 0;
	virtual bool isOpen() const = 0;

	int sendBuf(const char *buf, size_t size);
	int sendPkt(const char *str, ...);
	int sendPkt(char separator, const char *str, va_list ap);
	int sendReply(int code, const char *str, ...);
	/* read packet till <separator> */
	int readPkt(char separator, std::string &pkt);
	/* read |code|message reply, return transport error or 0 */
	int readReply(int *code, std::string &msg);
};

typedef boost::shared_ptr<MigrateConn> MigrateConnPtr;

/*
 * Channel over connected stream socket.
 */
class SockConn : public MigrateConn
{
public:
	explicit SockConn(int sock);
	~SockConn();

	ssize_t read(char *buf, size_t size);
	int write(const char *buf, size_t size);
	int close();
	bool isOpen() const;

	int getFd() const { return m_sock; }
	int setTimeout(long tmo);

private:
	int m_sock;
	mutable boost::mutex m_lock;
	bool m_open;
};

/*
 * Control channel message. code == 0 carries ordinary payload,
 * negative code notifies the peer about failure.
 */
struct MigrateControl
{
	int code;
	std::string message;

	MigrateControl() : code(0) {}
	MigrateControl(int c, const std::string &m) : code(c), message(m) {}
	bool success() const { return code == 0; }
};

int send_control(MigrateConn *conn, const MigrateControl &msg);
int recv_control(MigrateConn *conn, MigrateControl &msg);

/*
 * Channel authentication. Dialing side presents the secret,
 * accepting side answers with result code.
 */
int send_channel_secret(MigrateConn *conn, const std::string &secret);
int recv_channel_secret(MigrateConn *conn, std::string &secret);

/*
 * Outbound channel factory used by pull mode.
 */
class MigrateDialer
{
public:
	virtual ~MigrateDialer() {}
	virtual int dial(const std::string &url, const std::string &secret,
			MigrateConnPtr &conn) = 0;
};

/*
 * Dial "host:port" over TCP and pass channel authentication.
 */
class SockDialer : public MigrateDialer
{
public:
	/* tmo == 0 means MIGoptions.tmo */
	explicit SockDialer(long tmo = 0);
	int dial(const std::string &url, const std::string &secret,
			MigrateConnPtr &conn);

private:
	long m_tmo;
};

#endif
