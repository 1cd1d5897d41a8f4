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
#include <fcntl.h>
#include <time.h>
#include <syslog.h>
#include <pthread.h>
#include <limits.h>

#include "common.h"

int debug_level = LOG_INFO;
printFunc print_func = NULL;

static int log_quiet = 0;
static int log_syslog = 0;
static FILE *log_file = NULL;
static char log_name[NAME_MAX + 1] = "migtransport";
static pthread_mutex_t log_mutex = PTHREAD_MUTEX_INITIALIZER;

static __thread char err_msg[BUFSIZ];

static const char *level_name(int level)
{
	switch (level) {
	case LOG_EMERG:
	case LOG_ALERT:
	case LOG_CRIT:
	case LOG_ERR:
		return "Error";
	case LOG_WARNING:
		return "Warning";
	case LOG_DEBUG:
		return "Debug";
	default:
		return NULL;
	}
}

void vprint_log(int level, const char* oformat, va_list pvar)
{
	char buf[BUFSIZ];
	char tbuf[64];
	const char *lname;
	struct tm tm;
	time_t t;
	int rc;

	rc = vsnprintf(buf, sizeof(buf), oformat, pvar);
	if (rc < 0)
		return;

	lname = level_name(level);

	pthread_mutex_lock(&log_mutex);
	if (!log_quiet) {
		if (lname)
			fprintf(stderr, "%s: %s\n", lname, buf);
		else
			fprintf(stderr, "%s\n", buf);
		fflush(stderr);
	}
	if (log_file) {
		t = time(NULL);
		localtime_r(&t, &tm);
		strftime(tbuf, sizeof(tbuf), "%Y-%m-%dT%H:%M:%S%z", &tm);
		fprintf(log_file, "%s %s[%d]: %s%s%s\n", tbuf, log_name,
			getpid(), lname ? lname : "", lname ? ": " : "", buf);
		fflush(log_file);
	}
	pthread_mutex_unlock(&log_mutex);

	if (log_syslog)
		syslog(level, "%s", buf);

	if (print_func)
		print_func(level, buf);
}

void print_log(int level, const char* oformat, ...)
{
	va_list ap;

	va_start(ap, oformat);
	vprint_log(level, oformat, ap);
	va_end(ap);
}

void quiet_log(int quiet)
{
	log_quiet = quiet;
}

void open_logger(const char * name)
{
	if (name)
		snprintf(log_name, sizeof(log_name), "%s", name);

	closelog();
	openlog(log_name, LOG_PID, LOG_USER);
	log_syslog = 1;
}

int is_syslog_opened(void)
{
	return log_syslog;
}

int set_log_file(const char * path)
{
	FILE *fp;

	if (path == NULL || *path == '\0')
		return 0;

	if ((fp = fopen(path, "a")) == NULL)
		return putErr(MIG_ERR_SYSTEM, "fopen('%s') : %m", path);
	do_clo(fileno(fp));

	pthread_mutex_lock(&log_mutex);
	if (log_file)
		fclose(log_file);
	log_file = fp;
	pthread_mutex_unlock(&log_mutex);

	return 0;
}

void close_logger(void)
{
	pthread_mutex_lock(&log_mutex);
	if (log_file) {
		fclose(log_file);
		log_file = NULL;
	}
	pthread_mutex_unlock(&log_mutex);

	if (log_syslog) {
		closelog();
		log_syslog = 0;
	}
}

int putErr(int rc, const char * fm, ...)
{
	va_list ap;

	va_start(ap, fm);
	vsnprintf(err_msg, sizeof(err_msg), fm, ap);
	va_end(ap);

	logger(LOG_DEBUG, "[%d] %s", rc, err_msg);
	return rc;
}

const char * getError()
{
	return err_msg;
}

int set_block(int fd, int state)
{
	int flags;

	if ((flags = fcntl(fd, F_GETFL)) == -1)
		return putErr(MIG_ERR_SYSTEM, "fcntl(F_GETFL) : %m");

	if (state)
		flags &= ~O_NONBLOCK;
	else
		flags |= O_NONBLOCK;

	if (fcntl(fd, F_SETFL, flags) == -1)
		return putErr(MIG_ERR_SYSTEM, "fcntl(F_SETFL) : %m");
	return 0;
}

int set_clo(int fd, int state)
{
	int flags;

	if ((flags = fcntl(fd, F_GETFD)) == -1)
		return putErr(MIG_ERR_SYSTEM, "fcntl(F_GETFD) : %m");

	if (state)
		flags |= FD_CLOEXEC;
	else
		flags &= ~FD_CLOEXEC;

	if (fcntl(fd, F_SETFD, flags) == -1)
		return putErr(MIG_ERR_SYSTEM, "fcntl(F_SETFD) : %m");
	return 0;
}
