/* $Id$
 *
 * Copyright (c) 2006-2016 Parallels IP Holdings GmbH
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
#ifndef __MIGRATEDST_H__
#define __MIGRATEDST_H__

#include <string>

#include "migratecom.h"

struct MigrateSinkArgs
{
	InstanceObj *instance;
	bool instanceOnly;
	bool live;
	bool push;
	bool refresh;
	/* pull mode: remote endpoint, dialer and secrets of the source */
	std::string url;
	MigrateDialer *dialer;
	MigrateSecrets secrets;
	std::string clusterMoveSourceName;

	MigrateSinkArgs()
		: instance(NULL)
		, instanceOnly(false)
		, live(false)
		, push(false)
		, refresh(false)
		, dialer(NULL)
	{
	}
};

class MigrateSessionSink : public MigrateSessionCommon
{
public:
	/* get channels and run driver migrate-receive */
	int Do(InstanceOperation *instOp);

	bool isPush() const { return m_push; }
	bool isRefresh() const { return m_refresh; }

private:
	friend int new_migration_sink(const MigrateSinkArgs &, MigrateSessionSink **);

	explicit MigrateSessionSink(const MigrateSinkArgs &args);
	int init(const MigrateSinkArgs &args);
	/* pull mode: control, filesystem, state in this order */
	int dialChannels();

	bool m_refresh;
	std::string m_url;
	MigrateDialer *m_dialer;
};

/*
 * Create sink session. Push mode mints own secrets, pull mode uses
 * the ones from <args>. On error *out is not touched.
 */
int new_migration_sink(const MigrateSinkArgs &args, MigrateSessionSink **out);

#endif
