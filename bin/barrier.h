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
#ifndef __BARRIER_H__
#define __BARRIER_H__

#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>

#include "secret.h"
#include "migchannel.h"

/*
 * Collects inbound channel connections. Released once every role from
 * the required mask is bound; cancelled on wait timeout, after that
 * no connection can be bound anymore.
 */
class ChannelBarrier : private boost::noncopyable
{
public:
	explicit ChannelBarrier(unsigned required);

	/* called from inbound connection handlers, any thread */
	int bind(int role, const MigrateConnPtr &conn);
	/* wait up to <tmo> seconds, cancel on timeout */
	int wait(long tmo);
	/* reject all further binds */
	void cancel();

	bool isDone() const;
	bool isCancelled() const;
	unsigned getRequired() const { return m_required; }
	unsigned getBound() const;
	MigrateConnPtr get(int role) const;

private:
	const unsigned m_required;
	unsigned m_bound;
	bool m_done;
	bool m_cancelled;
	MigrateConnPtr m_conns[CHANNEL_MAX];
	mutable boost::mutex m_lock;
	boost::condition_variable m_cond;
};

#endif
