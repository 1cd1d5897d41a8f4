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
#include <limits.h>

#include "common.h"
#include "util.h"
#include "bincom.h"
#include "caps.h"

int check_live_migration_caps(std::string *path)
{
	char buf[PATH_MAX + 1];
	const char *bin = MIGoptions.criu_bin.c_str();

	if (find_in_path(bin, buf, sizeof(buf))) {
		logger(LOG_DEBUG, "%s not found, live migration is unavailable", bin);
		return 0;
	}

	logger(LOG_DEBUG, "live migration capability: %s", buf);
	if (path)
		*path = buf;
	return 1;
}
