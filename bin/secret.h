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
#ifndef __SECRET_H__
#define __SECRET_H__

#include <string>

/* random bytes per secret, hex encoded on the wire */
#define MIG_SECRET_BYTES	32

/*
 * Channel roles. Each role is authenticated by its own secret.
 */
enum {
	CHANNEL_CONTROL = 0,
	CHANNEL_FILESYSTEM,
	CHANNEL_STATE,
	CHANNEL_MAX
};

#define CHANNEL_MASK(role)	(1U << (role))

#define SECRET_NAME_CONTROL	"control"
#define SECRET_NAME_FILESYSTEM	"filesystem"
#define SECRET_NAME_STATE	"state"

const char *channel_name(int role);
/* role by secret name, -1 if unknown */
int channel_by_name(const char *name);

/*
 * Set of per-role secrets. Empty string means the slot is not set,
 * an empty token never authenticates anyway.
 */
struct MigrateSecrets
{
	std::string control;
	std::string filesystem;
	std::string state;

	const std::string &get(int role) const;
	void set(int role, const std::string &secret);
	bool has(int role) const { return !get(role).empty(); }
};

/* mint new random secret, OpenSSL RNG is used */
int gen_secret(std::string &secret);

/* constant time compare */
bool secret_equal(const std::string &a, const std::string &b);

#endif
