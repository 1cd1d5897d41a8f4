/*
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
 * Test doubles: channels, instance driver, dialer
 */

#ifndef __TESTS_FAKES_H__
#define __TESTS_FAKES_H__

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <string>
#include <vector>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include "common.h"
#include "bincom.h"
#include "instance.h"
#include "migchannel.h"
#include "secret.h"

#define NO_SUCH_CRIU	"migtransport-no-such-criu"

/*
 * In-memory channel: written data is kept, reads return EOF.
 */
class FakeConn : public MigrateConn
{
public:
	FakeConn() : m_closes(0), m_open(true) {}

	ssize_t read(char *, size_t)
	{
		if (!isOpen())
			return putErr(MIG_ERR_CONN_BROKEN, "fake conn closed");
		return 0;
	}

	int write(const char *buf, size_t size)
	{
		boost::mutex::scoped_lock lock(m_lock);

		if (!m_open)
			return putErr(MIG_ERR_CONN_BROKEN, "fake conn closed");
		m_data.append(buf, size);
		return 0;
	}

	int close()
	{
		boost::mutex::scoped_lock lock(m_lock);

		m_closes++;
		m_open = false;
		return 0;
	}

	bool isOpen() const
	{
		boost::mutex::scoped_lock lock(m_lock);
		return m_open;
	}

	int closes() const
	{
		boost::mutex::scoped_lock lock(m_lock);
		return m_closes;
	}

	std::string data() const
	{
		boost::mutex::scoped_lock lock(m_lock);
		return m_data;
	}

private:
	mutable boost::mutex m_lock;
	int m_closes;
	bool m_open;
	std::string m_data;
};

typedef boost::shared_ptr<FakeConn> FakeConnPtr;

/*
 * Instance with recording driver. Override onSend()/onReceive() to
 * drive the channels.
 */
class FakeInstance : public InstanceObj
{
public:
	FakeInstance(int type = INSTANCE_TYPE_CONTAINER, bool running = true)
		: m_type(type)
		, m_running(running)
		, rc(0)
		, sendCalls(0)
		, receiveCalls(0)
		, hadFilesystem(false)
		, hadState(false)
	{
	}

	std::string project() const { return "default"; }
	std::string name() const { return "c1"; }
	int type() const { return m_type; }
	bool isRunning() const { return m_running; }

	int migrateSend(const MigrateSendArgs &args)
	{
		sendCalls++;
		sendArgs = args;
		record(args);
		return onSend(args);
	}

	int migrateReceive(const MigrateReceiveArgs &args)
	{
		receiveCalls++;
		receiveArgs = args;
		record(args);
		return onReceive(args);
	}

	virtual int onSend(const MigrateSendArgs &)
	{
		return rc ? putErr(rc, "driver failure") : 0;
	}

	virtual int onReceive(const MigrateReceiveArgs &)
	{
		return rc ? putErr(rc, "driver failure") : 0;
	}

private:
	void record(const MigrateArgs &args)
	{
		hadFilesystem = args.channels->filesystemConn() != NULL;
		hadState = args.channels->stateConn() != NULL;
	}

	int m_type;
	bool m_running;

public:
	int rc;
	int sendCalls;
	int receiveCalls;
	bool hadFilesystem;
	bool hadState;
	MigrateSendArgs sendArgs;
	MigrateReceiveArgs receiveArgs;
};

/*
 * Records dialed channels in order, fails dial number <failAt> (0-based).
 */
class FakeDialer : public MigrateDialer
{
public:
	FakeDialer(const MigrateSecrets &secrets, int failAt = -1)
		: m_secrets(secrets)
		, m_failAt(failAt)
	{
	}

	int dial(const std::string &, const std::string &secret,
			MigrateConnPtr &conn)
	{
		int role = -1;

		for (int i = 0; i < CHANNEL_MAX; i++)
			if (m_secrets.has(i) && m_secrets.get(i) == secret)
				role = i;
		order.push_back(role);

		if ((int)order.size() - 1 == m_failAt)
			return putErr(MIG_ERR_CANT_CONNECT, "connection refused");

		FakeConnPtr c(new FakeConn());
		conns.push_back(c);
		conn = c;
		return 0;
	}

	std::vector<int> order;
	std::vector<FakeConnPtr> conns;

private:
	MigrateSecrets m_secrets;
	int m_failAt;
};

/* point checkpoint tool to <bin> for the scope */
struct CriuGuard
{
	explicit CriuGuard(const char *bin) : m_saved(MIGoptions.criu_bin)
	{
		MIGoptions.criu_bin = bin;
	}
	~CriuGuard()
	{
		MIGoptions.criu_bin = m_saved;
	}

private:
	std::string m_saved;
};

/* listening socket on 127.0.0.1, ephemeral port */
static inline int listen_loopback(int *sock, int *port)
{
	struct sockaddr_in addr;
	socklen_t len = sizeof(addr);

	if ((*sock = socket(AF_INET, SOCK_STREAM, 0)) < 0)
		return -1;

	memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	addr.sin_port = 0;

	if (bind(*sock, (struct sockaddr *)&addr, sizeof(addr)) ||
			listen(*sock, 8) ||
			getsockname(*sock, (struct sockaddr *)&addr, &len))
	{
		close(*sock);
		return -1;
	}
	*port = ntohs(addr.sin_port);
	return 0;
}

#endif
