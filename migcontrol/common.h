/*
 *
 * Copyright (c) 2001-2017, Parallels International GmbH
 *
 * Common programm undependent routines.
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

#ifndef __COMMON_H__
#define __COMMON_H__

#include <unistd.h>
#include <errno.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stdarg.h>

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/param.h>

#include <sys/syslog.h>

#ifdef __cplusplus
extern "C" {
#endif

#define MIG_CONF_FILE		"/etc/migtransport/migtransport.conf"

extern int debug_level;

void print_log(int level, const char* oformat, ...);
void vprint_log(int level, const char* oformat, va_list pvar);
void quiet_log(int quiet);
void open_logger(const char * name);
int is_syslog_opened(void);
int set_log_file(const char * path);
void close_logger(void);

#define logger(level, fmt, args...) do {	\
	if (debug_level >= (level))		\
		print_log(level, fmt, ##args);	\
} while (0)

typedef void (*printFunc) (int level, const char *);
extern printFunc print_func;

#define do_block(fd) set_block(fd, 1)
#define do_nonblock(fd) set_block(fd, 0)
int set_block(int fd, int state);

#define do_clo(fd) set_clo(fd, 1)
int set_clo(int fd, int state);

/*
 * Last error message is kept per thread: inbound channels are bound
 * from their own threads while Do() runs.
 */
extern int putErr(int rc, const char * fm, ...);
extern const char * getError();

#ifdef __cplusplus
}
#endif

// Errors
#define MIG_ERR_USAGE		-1
#define MIG_ERR_SYSTEM		-2
#define MIG_ERR_CANT_CONNECT	-4
#define MIG_ERR_EXISTS		-9

#define MIG_ERR_CONN_BROKEN	-21
#define MIG_ERR_CONN_TIMEOUT	-22
#define MIG_ERR_PROTOCOL	-26
#define MIG_ERR_CONN_TOOLONG	-49

#define MIG_ERR_NO_LIVE_SOURCE	-80
#define MIG_ERR_NO_LIVE_TARGET	-81
#define MIG_ERR_SECRET		-82
#define MIG_ERR_PERM		-83

// internal error codes
#define MIG_ERR_INVALID_ARG	-105
#define MIG_ERR_TRANSMISSION_FAILED	-106

// Info messages

#define MIG_INFO_WAIT_SRC	"Waiting for migration channel connections on source"
#define MIG_INFO_CONN_SRC	"Migration channels connected on source"
#define MIG_INFO_DISCONN_SRC	"Migration channels disconnected on source"
#define MIG_INFO_WAIT_DST	"Waiting for migration channel connections on target"
#define MIG_INFO_CONN_DST	"Migration channels connected on target"
#define MIG_INFO_DISCONN_DST	"Migration channels disconnected on target"

// Errors message

#define MIG_MSG_SEND_PKT	"can't send packet : %m"
#define MIG_MSG_SEND_BUF	"connection broken, can't send buffer"
#define MIG_MSG_RECV_REPLY	"connection broken, can't receive reply"
#define MIG_MSG_REPLY		"can not read reply from remote node"
#define MIG_MSG_PROTOCOL	"migrate protocol error"

#define MIG_MSG_NO_LIVE_SOURCE	"Unable to perform live container migration. "\
				"Migration source has no live migration capability (%s not found)"
#define MIG_MSG_NO_LIVE_TARGET	"Unable to perform live container migration. "\
				"Migration target has no live migration capability (%s not found)"
#define MIG_MSG_SECRET_SRC	"Failed creating migration source secret for %s channel: %s"
#define MIG_MSG_SECRET_DST	"Failed creating migration sink secret for %s channel: %s"
#define MIG_MSG_NO_SECRET	"Missing migration sink secret for %s channel"
#define MIG_MSG_UNKNOWN_SECRET	"Unknown secret provided"
#define MIG_MSG_CONN_TIMEOUT	"Timed out waiting for migration connections"
#define MIG_MSG_CONN_BOUND	"Migration %s channel already connected"
#define MIG_MSG_CONN_CANCELLED	"Migration channel wait cancelled"
#define MIG_MSG_CONN_SINK	"Failed connecting migration %s sink socket: %s"
#define MIG_MSG_CONN_SRC	"Failed connecting migration %s source socket: %s"
#define MIG_MSG_FAILED_SRC	"Failed migration on source: %s"
#define MIG_MSG_FAILED_DST	"Failed migration on target: %s"

#endif
