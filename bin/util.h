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

#ifndef __UTIL_H__
#define __UTIL_H__

#include <sys/types.h>
#include <unistd.h>
#include <string.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Look for executable <bin> the way execvp() does: as is if it contains
 * a slash, otherwise in every $PATH directory. Found path is written
 * into <path>. Return 0 if found.
 */
int find_in_path(const char *bin, char *path, size_t size);

void close_safe(int *fd);

void copy_cstr(const char *str, char *buf, size_t buf_size);

/* hex representation of <size> bytes of <data>, <out> gets 2*size+1 bytes */
void hex_encode(const unsigned char *data, size_t size, char *out);

#ifdef __cplusplus
}
#endif

#endif
