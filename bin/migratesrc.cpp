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
#include <string>

#include "migratesrc.h"
#include "common.h"
#include "bincom.h"
#include "caps.h"
#include "trace.h"

MigrateSessionSrc::MigrateSessionSrc(
		InstanceObj *instance,
		bool instanceOnly,
		bool allowInconsistent,
		const std::string &clusterMoveSourceName)
	: MigrateSessionCommon(instance, instanceOnly, clusterMoveSourceName, false)
	, m_allowInconsistent(allowInconsistent)
{
}

int MigrateSessionSrc::init(bool stateful)
{
	int rc;

	if ((rc = mintSecret(CHANNEL_CONTROL, MIG_MSG_SECRET_SRC)))
		return rc;
	if ((rc = mintSecret(CHANNEL_FILESYSTEM, MIG_MSG_SECRET_SRC)))
		return rc;

	if (stateful && m_instance->isRunning()) {
		m_live = true;

		/* live VM channels are provided by the driver itself */
		if (m_instance->type() == INSTANCE_TYPE_CONTAINER) {
			if (!check_live_migration_caps())
				return putErr(MIG_ERR_NO_LIVE_SOURCE,
					MIG_MSG_NO_LIVE_SOURCE,
					MIGoptions.criu_bin.c_str());
			if ((rc = mintSecret(CHANNEL_STATE, MIG_MSG_SECRET_SRC)))
				return rc;
		}
	}

	createBarrier();
	return 0;
}

int new_migration_source(
		InstanceObj *instance,
		bool stateful,
		bool instanceOnly,
		bool allowInconsistent,
		const std::string &clusterMoveSourceName,
		MigrateSessionSrc **out)
{
	int rc;
	MigrateSessionSrc *session;

	if (instance == NULL || out == NULL)
		return putErr(MIG_ERR_INVALID_ARG, "invalid migration source arguments");

	session = new MigrateSessionSrc(instance, instanceOnly,
			allowInconsistent, clusterMoveSourceName);
	if ((rc = session->init(stateful))) {
		delete session;
		return rc;
	}

	*out = session;
	return 0;
}

int MigrateSessionSrc::connectTarget(
		MigrateDialer *dialer,
		const std::string &url,
		const MigrateSecrets &secrets)
{
	int rc;
	unsigned required = getRequired();

	START_STAGE();

	if (dialer == NULL)
		return putErr(MIG_ERR_INVALID_ARG, "migration dialer is not set");

	for (int i = 0; i < CHANNEL_MAX; i++) {
		if (!secrets.has(i) && (required & CHANNEL_MASK(i)))
			return putErr(MIG_ERR_USAGE, MIG_MSG_NO_SECRET,
				channel_name(i));
	}

	/* optional channels (live VM state) are dialed and bound as well */
	for (int i = 0; i < CHANNEL_MAX; i++) {
		MigrateConnPtr conn;

		if (!secrets.has(i))
			continue;

		if ((rc = dialer->dial(url, secrets.get(i), conn))) {
			std::string err = getError();
			return putErr(rc, MIG_MSG_CONN_SRC, channel_name(i),
				err.c_str());
		}
		if ((rc = m_barrier->bind(i, conn))) {
			conn->close();
			return rc;
		}
	}

	END_STAGE();
	return 0;
}

int MigrateSessionSrc::Do()
{
	int rc;
	MigrateSendArgs args;
	MigrateLogCtx ctx = logCtx();
	Trace trace(MIG_COMPONENT_NAME, "migrate-send", ctx);

	if (getState() != SESSION_CONSTRUCTED)
		return putErr(MIG_ERR_INVALID_ARG,
			"migration source session is already used");

	trace.start();
	addCleaner(clean_disconnect, this, NULL, ANY_CLEANER);
	setState(SESSION_AWAITING_CHANNELS);

	ctx_logger(ctx, LOG_INFO, MIG_INFO_WAIT_SRC);
	if ((rc = waitChannels())) {
		ctx_logger(ctx, LOG_ERR, "%s", getError());
		rc = finish(rc);
		trace.finish(rc);
		return rc;
	}
	ctx_logger(ctx, LOG_INFO, MIG_INFO_CONN_SRC);

	args.channels = this;
	args.snapshots = !m_instanceOnly;
	args.live = m_live;
	args.clusterMoveSourceName = m_clusterMoveSourceName;
	args.allowInconsistent = m_allowInconsistent;

	setState(SESSION_TRANSFERRING);
	if ((rc = m_instance->migrateSend(args))) {
		std::string err = getError();
		rc = putErr(rc, MIG_MSG_FAILED_SRC, err.c_str());
		ctx_logger(ctx, LOG_ERR, "%s", getError());
	}

	rc = finish(rc);
	ctx_logger(ctx, LOG_INFO, MIG_INFO_DISCONN_SRC);
	trace.finish(rc);
	return rc;
}
