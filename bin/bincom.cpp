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
#include <errno.h>
#include <limits.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/lexical_cast.hpp>

#include "common.h"
#include "util.h"
#include "bincom.h"

CMigOptions MIGoptions;

CMigOptions::CMigOptions()
	: criu_bin(BIN_CRIU)
	, config(MIG_CONF_FILE)
{
	tmo.val = IO_TIMEOUT;
	snprintf(tmo.str, sizeof(tmo.str), "%ld", tmo.val);
	tmo.customized = 0;
}

/* remove surrounding quotes */
static std::string unquote(const std::string &str)
{
	size_t len = str.size();

	if (len >= 2 && (str[0] == '"' || str[0] == '\'') && str[len - 1] == str[0])
		return str.substr(1, len - 2);
	return str;
}

static int conf_long(const char *path, const std::string &key,
		const std::string &val, long min, long max, long *out)
{
	try {
		*out = boost::lexical_cast<long>(val);
	} catch (const boost::bad_lexical_cast &) {
		return putErr(MIG_ERR_USAGE, "%s: invalid %s value '%s'",
			path, key.c_str(), val.c_str());
	}
	if (*out < min || *out > max)
		return putErr(MIG_ERR_USAGE, "%s: invalid %s value '%s'",
			path, key.c_str(), val.c_str());
	return 0;
}

static int conf_set(const char *path, const std::string &key, const std::string &val)
{
	int rc;
	long l;

	if (key == MIG_CONF_LOGFILE) {
		MIGoptions.logfile = val;
	} else if (key == MIG_CONF_DEBUG) {
		if ((rc = conf_long(path, key, val, LOG_EMERG, LOG_DEBUG, &l)))
			return rc;
		debug_level = (int)l;
	} else if (key == MIG_CONF_TIMEOUT) {
		if ((rc = conf_long(path, key, val, 1, LONG_MAX, &l)))
			return rc;
		MIGoptions.tmo.val = l;
		snprintf(MIGoptions.tmo.str, sizeof(MIGoptions.tmo.str), "%ld", l);
		MIGoptions.tmo.customized = 1;
	} else if (key == MIG_CONF_CRIU) {
		if (val.empty())
			return putErr(MIG_ERR_USAGE, "%s: empty %s value",
				path, key.c_str());
		MIGoptions.criu_bin = val;
	} else {
		logger(LOG_DEBUG, "%s: unknown parameter %s, ignored",
			path, key.c_str());
	}
	return 0;
}

int mig_conf_load(const char *path, int must_exist)
{
	int rc;
	boost::property_tree::ptree conf;

	if (access(path, F_OK)) {
		if (errno == ENOENT && !must_exist) {
			logger(LOG_DEBUG, "config %s not found, use defaults", path);
			return 0;
		}
		return putErr(MIG_ERR_SYSTEM, "access('%s') : %m", path);
	}

	std::ifstream is(path);
	if (!is)
		return putErr(MIG_ERR_SYSTEM, "can't open %s : %m", path);

	try {
		boost::property_tree::ini_parser::read_ini(is, conf);
	} catch (const boost::property_tree::ini_parser_error &e) {
		return putErr(MIG_ERR_USAGE, "%s:%lu: %s", path,
			e.line(), e.message().c_str());
	}

	for (boost::property_tree::ptree::const_iterator it = conf.begin();
			it != conf.end(); ++it)
	{
		if (!it->second.empty()) {
			logger(LOG_DEBUG, "%s: section [%s] ignored",
				path, it->first.c_str());
			continue;
		}
		if ((rc = conf_set(path, it->first, unquote(it->second.data()))))
			return rc;
	}

	MIGoptions.config = path;
	return 0;
}

int mig_conf_apply()
{
	return set_log_file(MIGoptions.logfile.c_str());
}
