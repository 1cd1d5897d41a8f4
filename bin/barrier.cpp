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
#include <boost/thread/thread_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include "common.h"
#include "barrier.h"

ChannelBarrier::ChannelBarrier(unsigned required)
	: m_required(required)
	, m_bound(0)
	, m_done(false)
	, m_cancelled(false)
{
}

int ChannelBarrier::bind(int role, const MigrateConnPtr &conn)
{
	boost::mutex::scoped_lock lock(m_lock);

	if (role < 0 || role >= CHANNEL_MAX || !conn)
		return putErr(MIG_ERR_INVALID_ARG, "invalid channel bind request");
	if (m_cancelled)
		return putErr(MIG_ERR_CONN_TIMEOUT, MIG_MSG_CONN_CANCELLED);
	if (m_conns[role])
		return putErr(MIG_ERR_EXISTS, MIG_MSG_CONN_BOUND, channel_name(role));

	m_conns[role] = conn;
	m_bound |= CHANNEL_MASK(role);
	logger(LOG_DEBUG, "migration %s channel connected", channel_name(role));

	if (!m_done && (m_bound & m_required) == m_required) {
		m_done = true;
		m_cond.notify_all();
	}
	return 0;
}

int ChannelBarrier::wait(long tmo)
{
	boost::mutex::scoped_lock lock(m_lock);
	boost::system_time deadline = boost::get_system_time() +
		boost::posix_time::seconds(tmo);

	while (!m_done && !m_cancelled) {
		if (!m_cond.timed_wait(lock, deadline)) {
			if (m_done)
				break;
			m_cancelled = true;
			m_cond.notify_all();
			return putErr(MIG_ERR_CONN_TIMEOUT, MIG_MSG_CONN_TIMEOUT);
		}
	}
	if (!m_done)
		return putErr(MIG_ERR_CONN_TIMEOUT, MIG_MSG_CONN_CANCELLED);
	return 0;
}

void ChannelBarrier::cancel()
{
	boost::mutex::scoped_lock lock(m_lock);

	/* seals the barrier after success too */
	if (m_cancelled)
		return;
	m_cancelled = true;
	m_cond.notify_all();
}

bool ChannelBarrier::isDone() const
{
	boost::mutex::scoped_lock lock(m_lock);
	return m_done;
}

bool ChannelBarrier::isCancelled() const
{
	boost::mutex::scoped_lock lock(m_lock);
	return m_cancelled;
}

unsigned ChannelBarrier::getBound() const
{
	boost::mutex::scoped_lock lock(m_lock);
	return m_bound;
}

MigrateConnPtr ChannelBarrier::get(int role) const
{
	boost::mutex::scoped_lock lock(m_lock);

	if (role < 0 || role >= CHANNEL_MAX)
		return MigrateConnPtr();
	return m_conns[role];
}
