/* $Id$
 *
 * Copyright (c) 2008-2016 Parallels IP Holdings GmbH
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
 * Our contact details: Parallels IP Holdings GmbH, Vordergasse 59, 8200
 * Schaffhausen, Switzerland.
 *
 */

#ifndef __CHANNEL_H__
#define __CHANNEL_H__

#include <sys/types.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 Parse reply packet |errcode|replymessage. On success *code gets errcode
 and *msg points into <buffer> at the message text.
*/
int recv_filter(char *buffer, int *code, char **msg);

/* split "host:service" or "[host]:service" */
int split_address(
		const char *addr,
		char *host,
		size_t hsize,
		char *service,
		size_t ssize);

/* connect to "host:service" during timeout "tmo" */
int sock_connect(const char *host, const char *service, long tmo, int *out_sock);

/* set send/receive timeout on socket, tmo == 0 - wait forever */
int sock_set_tmo(int sock, long tmo);

/* write whole buffer, restart on EINTR */
int sock_write(int fd, const char *data, size_t size);

#ifdef __cplusplus
}
#endif

#endif
