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
 */
#include <assert.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "migratecom.h"
#include "common.h"
#include "bincom.h"

const char *instance_type_name(int type)
{
	switch (type) {
	case INSTANCE_TYPE_CONTAINER:
		return "container";
	case INSTANCE_TYPE_VM:
		return "virtual-machine";
	}
	return "unknown";
}

int instance_type_by_name(const char *name)
{
	if (strcmp(name, "ct") == 0 || strcmp(name, "container") == 0)
		return INSTANCE_TYPE_CONTAINER;
	if (strcmp(name, "vm") == 0 || strcmp(name, "virtual-machine") == 0)
		return INSTANCE_TYPE_VM;
	return -1;
}

const char *session_state_name(int state)
{
	switch (state) {
	case SESSION_CONSTRUCTED:
		return "constructed";
	case SESSION_AWAITING_CHANNELS:
		return "awaiting channels";
	case SESSION_TRANSFERRING:
		return "transferring";
	case SESSION_CLOSED_SUCCESS:
		return "closed (success)";
	case SESSION_CLOSED_FAILED:
		return "closed (failed)";
	}
	return "unknown";
}

void ctx_logger(MigrateLogCtx ctx, int level, const char *fmt, ...)
{
	char buf[BUFSIZ];
	va_list ap;

	if (debug_level < level)
		return;

	va_start(ap, fmt);
	vsnprintf(buf, sizeof(buf), fmt, ap);
	va_end(ap);

	if (ctx.clusterMoveSourceName.empty())
		print_log(level, "%s (project=%s instance=%s live=%s push=%s)",
			buf, ctx.project.c_str(), ctx.instance.c_str(),
			ctx.live ? "true" : "false",
			ctx.push ? "true" : "false");
	else
		print_log(level, "%s (project=%s instance=%s live=%s push=%s "
			"clusterMoveSourceName=%s)",
			buf, ctx.project.c_str(), ctx.instance.c_str(),
			ctx.live ? "true" : "false",
			ctx.push ? "true" : "false",
			ctx.clusterMoveSourceName.c_str());
}

MigrateSessionCommon::MigrateSessionCommon(
		InstanceObj *instance,
		bool instanceOnly,
		const std::string &clusterMoveSourceName,
		bool push)
	: m_instance(instance)
	, m_instanceOnly(instanceOnly)
	, m_live(false)
	, m_push(push)
	, m_clusterMoveSourceName(clusterMoveSourceName)
	, m_disconnected(false)
	, m_state(SESSION_CONSTRUCTED)
	, m_rc(0)
{
	for (int i = 0; i < CHANNEL_MAX; i++)
		m_closed[i] = false;
}

MigrateSessionCommon::~MigrateSessionCommon()
{
	doCleaning(ANY_CLEANER);
	disconnect();
}

void MigrateSessionCommon::addCleaner(MigrateCleanFunc _func, const void * _arg1,
                                    const void * _arg2, int type)
{
	CleanActions & cl = GETCLEANER(type);
	MCleanEntry entry;

	entry.func = _func;
	entry.arg1 = _arg1;
	entry.arg2 = _arg2;
	cl.push(entry);
}

void MigrateSessionCommon::delLastCleaner(int type)
{
	CleanActions & cl = GETCLEANER(type);
	assert(!cl.empty());
	cl.pop();
}

int MigrateSessionCommon::doCleaning(int type)
{
	CleanActions & cl = GETCLEANER(type);
	while (!cl.empty())
	{
		const MCleanEntry it = cl.top();
		cl.pop();

		int rc = it.func(it.arg1, it.arg2);
		if (rc)
		{
			/* will ignore errors on cleaning */
			logger(LOG_WARNING, "Can't do correct cleaning: %s",
			       getError());
		}
	}
	return 0;
}

int MigrateSessionCommon::clean_disconnect(const void * arg, const void *)
{
	MigrateSessionCommon *session = (MigrateSessionCommon *)arg;

	logger(LOG_DEBUG, "disconnect migration channels");
	session->disconnect();
	return 0;
}

int MigrateSessionCommon::clean_notifyPeer(const void * arg, const void *)
{
	MigrateSessionCommon *session = (MigrateSessionCommon *)arg;

	session->sendControl(session->m_rc, getError());
	return 0;
}

int MigrateSessionCommon::mintSecret(int role, const char *fmt)
{
	int rc;
	std::string secret;

	if ((rc = gen_secret(secret))) {
		std::string err = getError();
		return putErr(rc, fmt, channel_name(role), err.c_str());
	}
	m_secrets.set(role, secret);
	return 0;
}

bool MigrateSessionCommon::hasStateChannel() const
{
	return m_live && m_instance->type() == INSTANCE_TYPE_CONTAINER;
}

unsigned MigrateSessionCommon::getRequired() const
{
	unsigned mask = CHANNEL_MASK(CHANNEL_CONTROL) |
		CHANNEL_MASK(CHANNEL_FILESYSTEM);

	if (hasStateChannel())
		mask |= CHANNEL_MASK(CHANNEL_STATE);
	return mask;
}

MigrateLogCtx MigrateSessionCommon::logCtx() const
{
	MigrateLogCtx ctx;

	ctx.project = m_instance->project();
	ctx.instance = m_instance->name();
	ctx.clusterMoveSourceName = m_clusterMoveSourceName;
	ctx.live = m_live;
	ctx.push = m_push;
	return ctx;
}

void MigrateSessionCommon::createBarrier()
{
	m_barrier.reset(new ChannelBarrier(getRequired()));
}

int MigrateSessionCommon::connect(const std::string &secret, const MigrateConnPtr &conn)
{
	int role = -1;

	for (int i = 0; i < CHANNEL_MAX; i++) {
		if (m_secrets.has(i) && secret_equal(secret, m_secrets.get(i))) {
			role = i;
			break;
		}
	}
	if (role < 0)
		return putErr(MIG_ERR_PERM, MIG_MSG_UNKNOWN_SECRET);

	if (!m_barrier)
		return putErr(MIG_ERR_INVALID_ARG,
			"migration session does not accept inbound channels");

	return m_barrier->bind(role, conn);
}

int MigrateSessionCommon::acceptConn(const MigrateConnPtr &conn)
{
	int rc;
	std::string secret;

	if ((rc = recv_channel_secret(conn.get(), secret))) {
		conn->close();
		return rc;
	}

	if ((rc = connect(secret, conn))) {
		std::string err = getError();
		if (conn->sendReply(rc, "%s", err.c_str()))
			logger(LOG_DEBUG, "can't send channel reply: %s", getError());
		conn->close();
		return putErr(rc, "%s", err.c_str());
	}

	/* bound channel is closed by disconnect() */
	return conn->sendReply(0, "");
}

MigrateConn *MigrateSessionCommon::getConn(int role)
{
	boost::mutex::scoped_lock lock(m_lock);

	if (m_closed[role] || !m_conns[role])
		return NULL;
	return m_conns[role].get();
}

int MigrateSessionCommon::setConn(int role, const MigrateConnPtr &conn)
{
	{
		boost::mutex::scoped_lock lock(m_lock);

		if (m_conns[role])
			return putErr(MIG_ERR_EXISTS, MIG_MSG_CONN_BOUND,
				channel_name(role));
		if (!m_disconnected) {
			m_conns[role] = conn;
			return 0;
		}
	}

	conn->close();
	return putErr(MIG_ERR_CONN_BROKEN, "migration session is disconnected");
}

void MigrateSessionCommon::adoptChannels()
{
	boost::mutex::scoped_lock lock(m_lock);

	if (!m_barrier)
		return;

	for (int i = 0; i < CHANNEL_MAX; i++) {
		if (!m_conns[i])
			m_conns[i] = m_barrier->get(i);
	}
}

int MigrateSessionCommon::waitChannels()
{
	int rc;

	rc = m_barrier->wait(MIG_CHANNEL_TMO);
	m_barrier->cancel();
	adoptChannels();
	return rc;
}

int MigrateSessionCommon::controlSend(const MigrateControl &msg)
{
	boost::mutex::scoped_lock lock(m_sendLock);
	MigrateConn *conn = getConn(CHANNEL_CONTROL);

	if (conn == NULL)
		return putErr(MIG_ERR_CONN_BROKEN,
			"migration control channel is not connected");
	return send_control(conn, msg);
}

int MigrateSessionCommon::controlRecv(MigrateControl &msg)
{
	boost::mutex::scoped_lock lock(m_recvLock);
	MigrateConn *conn = getConn(CHANNEL_CONTROL);

	if (conn == NULL)
		return putErr(MIG_ERR_CONN_BROKEN,
			"migration control channel is not connected");
	return recv_control(conn, msg);
}

MigrateConn *MigrateSessionCommon::filesystemConn()
{
	return getConn(CHANNEL_FILESYSTEM);
}

MigrateConn *MigrateSessionCommon::stateConn()
{
	return getConn(CHANNEL_STATE);
}

void MigrateSessionCommon::disconnect()
{
	if (m_barrier) {
		m_barrier->cancel();
		adoptChannels();
	}

	boost::mutex::scoped_lock lock(m_lock);

	m_disconnected = true;
	for (int i = 0; i < CHANNEL_MAX; i++) {
		if (!m_conns[i] || m_closed[i])
			continue;
		m_closed[i] = true;
		if (m_conns[i]->close())
			logger(LOG_WARNING, "can't close migration %s channel: %s",
				channel_name(i), getError());
	}
}

void MigrateSessionCommon::sendControl(int rc, const char *msg)
{
	std::string saved = getError();
	MigrateControl ctl(rc, msg ? msg : "");

	if (controlSend(ctl))
		logger(LOG_WARNING, "can't send error to migration peer: %s",
			getError());
	putErr(rc, "%s", saved.c_str());
}

int MigrateSessionCommon::getState() const
{
	boost::mutex::scoped_lock lock(m_lock);
	return m_state;
}

void MigrateSessionCommon::setState(int state)
{
	boost::mutex::scoped_lock lock(m_lock);

	logger(LOG_DEBUG, "migration session state : %s -> %s",
		session_state_name(m_state), session_state_name(state));
	m_state = state;
}

int MigrateSessionCommon::finish(int rc)
{
	std::string err;

	if (rc)
		err = getError();
	m_rc = rc;

	doCleaning(rc ? ERROR_CLEANER : SUCCESS_CLEANER);
	doCleaning(ANY_CLEANER);
	setState(rc ? SESSION_CLOSED_FAILED : SESSION_CLOSED_SUCCESS);

	if (rc)
		putErr(rc, "%s", err.c_str());
	return rc;
}
