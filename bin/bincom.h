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
#ifndef _BINCOM_H_
#define _BINCOM_H_

#include <stdarg.h>

#include <string>

#include "common.h"

#define BNAME_CHECK		"migcheck"

#define MIG_COMPONENT_NAME	"migtransport"

#define INIT_BIN(debuglevel, logname) do {	\
	debug_level = debuglevel;		\
	open_logger(logname);			\
} while (0)

/* config file keys */
#define MIG_CONF_LOGFILE	"LOGFILE"
#define MIG_CONF_DEBUG		"DEBUG_LEVEL"
#define MIG_CONF_TIMEOUT	"TIMEOUT"
#define MIG_CONF_CRIU		"CRIU"

/*
 * Channel connect and handshake timeout in seconds. Does not limit
 * the transfer itself: drivers may keep channels busy for hours.
 */
#define IO_TIMEOUT	30

/*
 * All migration channels must be connected within this interval
 * (seconds), otherwise the migration fails.
 */
#define MIG_CHANNEL_TMO	10

#define BIN_CRIU	"criu"

struct timeout {
	long val;
	char str[100];
	int customized;
};

struct CMigOptions
{
	struct timeout tmo;
	std::string criu_bin;
	std::string logfile;
	std::string config;

	CMigOptions();
};

extern CMigOptions MIGoptions;

/*
 * Read config file <path> into MIGoptions. Lines are KEY=VALUE pairs,
 * value may be quoted, lines starting with '#' or ';' are comments.
 * Missing file is not an error unless <must_exist> is set.
 */
int mig_conf_load(const char *path, int must_exist);

/* apply MIGoptions to logger: open log file if configured */
int mig_conf_apply();

#endif
