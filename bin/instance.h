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
#ifndef __INSTANCE_H__
#define __INSTANCE_H__

#include <string>

#include "migchannel.h"

enum {
	INSTANCE_TYPE_CONTAINER = 0,
	INSTANCE_TYPE_VM,
};

const char *instance_type_name(int type);
/* -1 if unknown, accepts "ct"/"container" and "vm"/"virtual-machine" */
int instance_type_by_name(const char *name);

/*
 * Operation lock handle of the caller. Passed through to the driver
 * as is, never locked or released here.
 */
class InstanceOperation
{
public:
	virtual ~InstanceOperation() {}
};

/*
 * Channels of one migration as seen by the driver.
 * Accessors return NULL if channel does not apply or is closed.
 */
class MigrateChannels
{
public:
	virtual ~MigrateChannels() {}

	virtual int controlSend(const MigrateControl &msg) = 0;
	virtual int controlRecv(MigrateControl &msg) = 0;
	virtual MigrateConn *filesystemConn() = 0;
	virtual MigrateConn *stateConn() = 0;
	/* force close of all channels, aborts running transfer */
	virtual void disconnect() = 0;
};

struct MigrateArgs
{
	MigrateChannels *channels;
	bool snapshots;
	bool live;
	std::string clusterMoveSourceName;

	MigrateArgs() : channels(NULL), snapshots(true), live(false) {}
};

struct MigrateSendArgs : public MigrateArgs
{
	bool allowInconsistent;

	MigrateSendArgs() : allowInconsistent(false) {}
};

struct MigrateReceiveArgs : public MigrateArgs
{
	InstanceOperation *instOp;
	bool refresh;

	MigrateReceiveArgs() : instOp(NULL), refresh(false) {}
};

/*
 * Migrated workload. Transfer itself is done by the driver behind
 * migrateSend()/migrateReceive(): they return 0 or error code and set
 * error message with putErr().
 */
class InstanceObj
{
public:
	virtual ~InstanceObj() {}

	virtual std::string project() const = 0;
	virtual std::string name() const = 0;
	virtual int type() const = 0;
	virtual bool isRunning() const = 0;

	virtual int migrateSend(const MigrateSendArgs &args) = 0;
	virtual int migrateReceive(const MigrateReceiveArgs &args) = 0;
};

#endif
