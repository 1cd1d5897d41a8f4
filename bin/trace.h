/*
* Copyright (c) 2017, Parallels International GmbH
*
* This file is part of Virtuozzo Core. Virtuozzo Core is free
* software; you can redistribute it and/or modify it under the terms
* of the GNU General Public License as published by the Free Software
* Foundation; either version 2 of the License, or (at your option) any
* later version.
* 
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
* 
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
* 02110-1301, USA.
*
* Our contact details: Parallels International GmbH, Vordergasse 59, 8200
* Schaffhausen, Switzerland.
*/

#ifndef __TRACE_H__
#define __TRACE_H__

#include "common.h"
#include "migratecom.h"

#include <syslog.h>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

/*
 * Start/finish records of migration session written to syslog as JSON.
 */
struct Trace
{
	Trace(const char *name, const char *action, const MigrateLogCtx &ctx) :
		m_name(name), m_action(action), m_ctx(ctx)
	{
	}

	void start()
	{
		boost::property_tree::ptree t;
		fill(t, "start");
		report(t);
	}

	void finish(int code)
	{
		boost::property_tree::ptree t;
		fill(t, "finish");
		t.put("result", code);
		report(t);
	}

private:
	void fill(boost::property_tree::ptree &t, const char *op)
	{
		t.put("action", m_action);
		t.put("op", op);
		t.put("project", m_ctx.project);
		t.put("instance", m_ctx.instance);
		t.put("live", m_ctx.live);
		t.put("push", m_ctx.push);
		if (!m_ctx.clusterMoveSourceName.empty())
			t.put("clusterMoveSourceName", m_ctx.clusterMoveSourceName);
	}

	void report(const boost::property_tree::ptree &progress_)
	{
		int opened = is_syslog_opened();
		std::stringstream s;

		boost::property_tree::json_parser::write_json(s, progress_, false);

		closelog();
		openlog(m_name, LOG_PID, LOG_USER);
		syslog(LOG_INFO, "%s", s.str().c_str());
		closelog();
		if (opened)
			open_logger(NULL);
	}

	const char * m_name;
	std::string m_action;
	MigrateLogCtx m_ctx;
};

#endif // __TRACE_H__
