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
#include <sys/stat.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>

#include "common.h"
#include "util.h"

static int is_executable(const char *path)
{
	struct stat st;

	if (stat(path, &st))
		return 0;
	if (!S_ISREG(st.st_mode))
		return 0;
	return access(path, X_OK) == 0;
}

int find_in_path(const char *bin, char *path, size_t size)
{
	const char *env;
	const char *p, *end;
	char buf[PATH_MAX + 1];
	size_t len;

	if (bin == NULL || *bin == '\0')
		return -1;

	if (strchr(bin, '/')) {
		if (!is_executable(bin))
			return -1;
		copy_cstr(bin, path, size);
		return 0;
	}

	if ((env = getenv("PATH")) == NULL)
		env = "/usr/local/bin:/usr/bin:/bin";

	for (p = env; ; p = end + 1) {
		if ((end = strchr(p, ':')) == NULL)
			end = p + strlen(p);
		len = end - p;
		/* empty entry means current directory */
		if (len == 0)
			snprintf(buf, sizeof(buf), "./%s", bin);
		else
			snprintf(buf, sizeof(buf), "%.*s/%s", (int)len, p, bin);

		if (is_executable(buf)) {
			copy_cstr(buf, path, size);
			return 0;
		}
		if (*end == '\0')
			break;
	}
	return -1;
}

void close_safe(int *fd)
{
	if (*fd >= 0) {
		close(*fd);
		*fd = -1;
	}
}

void copy_cstr(const char *str, char *buf, size_t buf_size)
{
	if (buf_size == 0)
		return;
	strncpy(buf, str, buf_size - 1);
	buf[buf_size - 1] = '\0';
}

void hex_encode(const unsigned char *data, size_t size, char *out)
{
	static const char digits[] = "0123456789abcdef";
	size_t i;

	for (i = 0; i < size; i++) {
		out[2 * i] = digits[data[i] >> 4];
		out[2 * i + 1] = digits[data[i] & 0x0f];
	}
	out[2 * size] = '\0';
}
