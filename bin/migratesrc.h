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
#ifndef __MIGRATESRC_H__
#define __MIGRATESRC_H__

#include <string>

#include "migratecom.h"

class MigrateSessionSrc : public MigrateSessionCommon
{
public:
	/* wait for channels and run driver migrate-send */
	int Do();

	/*
	 * Dial the target at <url> with target's <secrets> and bind
	 * the channels instead of waiting for inbound connections.
	 * Every supplied secret is dialed, required ones must be present.
	 */
	int connectTarget(MigrateDialer *dialer, const std::string &url,
			const MigrateSecrets &secrets);

	bool getAllowInconsistent() const { return m_allowInconsistent; }

private:
	friend int new_migration_source(InstanceObj *, bool, bool, bool,
			const std::string &, MigrateSessionSrc **);

	MigrateSessionSrc(
		InstanceObj *instance,
		bool instanceOnly,
		bool allowInconsistent,
		const std::string &clusterMoveSourceName);
	int init(bool stateful);

	bool m_allowInconsistent;
};

/*
 * Create source session. Live transfer is used if <stateful> and
 * instance is running; containers need checkpoint/restore tool then.
 * On error *out is not touched.
 */
int new_migration_source(
		InstanceObj *instance,
		bool stateful,
		bool instanceOnly,
		bool allowInconsistent,
		const std::string &clusterMoveSourceName,
		MigrateSessionSrc **out);

#endif
