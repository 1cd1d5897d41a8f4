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
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

#include "common.h"
#include "util.h"
#include "secret.h"

/* see ERR_error_string man page */
#define SSL_ERR_STRING_MAXLEN 121

static const char *channel_names[CHANNEL_MAX] = {
	SECRET_NAME_CONTROL,
	SECRET_NAME_FILESYSTEM,
	SECRET_NAME_STATE,
};

const char *channel_name(int role)
{
	if (role < 0 || role >= CHANNEL_MAX)
		return "unknown";
	return channel_names[role];
}

int channel_by_name(const char *name)
{
	for (int i = 0; i < CHANNEL_MAX; i++)
		if (strcmp(name, channel_names[i]) == 0)
			return i;
	return -1;
}

const std::string &MigrateSecrets::get(int role) const
{
	switch (role) {
	case CHANNEL_CONTROL:
		return control;
	case CHANNEL_FILESYSTEM:
		return filesystem;
	default:
		return state;
	}
}

void MigrateSecrets::set(int role, const std::string &secret)
{
	switch (role) {
	case CHANNEL_CONTROL:
		control = secret;
		break;
	case CHANNEL_FILESYSTEM:
		filesystem = secret;
		break;
	case CHANNEL_STATE:
		state = secret;
		break;
	}
}

int gen_secret(std::string &secret)
{
	unsigned char buf[MIG_SECRET_BYTES];
	char str[2 * MIG_SECRET_BYTES + 1];
	char err[SSL_ERR_STRING_MAXLEN];

	if (RAND_bytes(buf, sizeof(buf)) != 1) {
		ERR_error_string_n(ERR_get_error(), err, sizeof(err));
		return putErr(MIG_ERR_SECRET, "RAND_bytes() : %s", err);
	}

	hex_encode(buf, sizeof(buf), str);
	OPENSSL_cleanse(buf, sizeof(buf));
	secret = str;
	return 0;
}

bool secret_equal(const std::string &a, const std::string &b)
{
	if (a.empty() || a.size() != b.size())
		return false;
	return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
