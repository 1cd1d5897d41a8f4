/*
 * Copyright (c) 2006-2017, Parallels International GmbH
 * Copyright (c) 2017-2019 Virtuozzo International GmbH. All rights reserved.
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
 * Our contact details: Virtuozzo International GmbH, Vordergasse 59, 8200
 * Schaffhausen, Switzerland.
 *
 */
#include <string>

#include "migratedst.h"
#include "common.h"
#include "bincom.h"
#include "caps.h"
#include "trace.h"

MigrateSessionSink::MigrateSessionSink(const MigrateSinkArgs &args)
	: MigrateSessionCommon(args.instance, args.instanceOnly,
		args.clusterMoveSourceName, args.push)
	, m_refresh(args.refresh)
	, m_url(args.url)
	, m_dialer(args.dialer)
{
}

int MigrateSessionSink::init(const MigrateSinkArgs &args)
{
	int rc;

	if (m_push) {
		if ((rc = mintSecret(CHANNEL_CONTROL, MIG_MSG_SECRET_DST)))
			return rc;
		if ((rc = mintSecret(CHANNEL_FILESYSTEM, MIG_MSG_SECRET_DST)))
			return rc;
		if (args.live) {
			if ((rc = mintSecret(CHANNEL_STATE, MIG_MSG_SECRET_DST)))
				return rc;
		}
		m_live = args.live;
	} else {
		if (!args.secrets.has(CHANNEL_CONTROL))
			return putErr(MIG_ERR_USAGE, MIG_MSG_NO_SECRET,
				channel_name(CHANNEL_CONTROL));
		if (!args.secrets.has(CHANNEL_FILESYSTEM))
			return putErr(MIG_ERR_USAGE, MIG_MSG_NO_SECRET,
				channel_name(CHANNEL_FILESYSTEM));
		if (m_dialer == NULL)
			return putErr(MIG_ERR_INVALID_ARG,
				"migration dialer is not set");

		m_secrets = args.secrets;
		m_live = args.secrets.has(CHANNEL_STATE) || args.live;
	}

	if (m_instance->type() == INSTANCE_TYPE_CONTAINER && m_live &&
			!check_live_migration_caps())
		return putErr(MIG_ERR_NO_LIVE_TARGET, MIG_MSG_NO_LIVE_TARGET,
			MIGoptions.criu_bin.c_str());

	if (m_push)
		createBarrier();
	return 0;
}

int new_migration_sink(const MigrateSinkArgs &args, MigrateSessionSink **out)
{
	int rc;
	MigrateSessionSink *session;

	if (args.instance == NULL || out == NULL)
		return putErr(MIG_ERR_INVALID_ARG, "invalid migration sink arguments");

	session = new MigrateSessionSink(args);
	if ((rc = session->init(args))) {
		delete session;
		return rc;
	}

	*out = session;
	return 0;
}

int MigrateSessionSink::dialChannels()
{
	int rc;
	int roles[CHANNEL_MAX];
	int n = 0;

	START_STAGE();

	roles[n++] = CHANNEL_CONTROL;
	roles[n++] = CHANNEL_FILESYSTEM;
	if (hasStateChannel())
		roles[n++] = CHANNEL_STATE;

	for (int i = 0; i < n; i++) {
		MigrateConnPtr conn;

		if ((rc = m_dialer->dial(m_url, m_secrets.get(roles[i]), conn))) {
			std::string err = getError();
			return putErr(rc, MIG_MSG_CONN_SINK,
				channel_name(roles[i]), err.c_str());
		}
		if ((rc = setConn(roles[i], conn)))
			return rc;

		/* peer learns about failures of the next channels */
		if (roles[i] == CHANNEL_CONTROL)
			addCleaner(clean_notifyPeer, this, NULL, ERROR_CLEANER);
	}
	delLastCleaner(ERROR_CLEANER);

	END_STAGE();
	return 0;
}

int MigrateSessionSink::Do(InstanceOperation *instOp)
{
	int rc;
	MigrateReceiveArgs args;
	MigrateLogCtx ctx = logCtx();
	Trace trace(MIG_COMPONENT_NAME, "migrate-receive", ctx);

	if (getState() != SESSION_CONSTRUCTED)
		return putErr(MIG_ERR_INVALID_ARG,
			"migration sink session is already used");

	trace.start();
	addCleaner(clean_disconnect, this, NULL, ANY_CLEANER);
	setState(SESSION_AWAITING_CHANNELS);

	if (m_push) {
		ctx_logger(ctx, LOG_INFO, MIG_INFO_WAIT_DST);
		rc = waitChannels();
	} else {
		rc = dialChannels();
	}
	if (rc) {
		ctx_logger(ctx, LOG_ERR, "%s", getError());
		rc = finish(rc);
		trace.finish(rc);
		return rc;
	}
	ctx_logger(ctx, LOG_INFO, MIG_INFO_CONN_DST);

	args.channels = this;
	args.snapshots = !m_instanceOnly;
	args.live = m_live;
	args.clusterMoveSourceName = m_clusterMoveSourceName;
	args.instOp = instOp;
	args.refresh = m_refresh;

	setState(SESSION_TRANSFERRING);
	if ((rc = m_instance->migrateReceive(args))) {
		std::string err = getError();
		rc = putErr(rc, MIG_MSG_FAILED_DST, err.c_str());
		ctx_logger(ctx, LOG_ERR, "%s", getError());
	}

	rc = finish(rc);
	ctx_logger(ctx, LOG_INFO, MIG_INFO_DISCONN_DST);
	trace.finish(rc);
	return rc;
}
