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
 * local migration capability check
 */
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <getopt.h>
#include <libgen.h>
#include <limits.h>

#include <iostream>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "common.h"
#include "bincom.h"
#include "caps.h"
#include "secret.h"
#include "instance.h"

static char progname[NAME_MAX];
static const char *config = MIG_CONF_FILE;
static int config_set = 0;
static int live = 0;
static int inst_type = INSTANCE_TYPE_CONTAINER;

static void usage()
{
	fprintf(stderr, "Migration channels check\n");
	fprintf(stderr, "Usage:\n");
	fprintf(stderr, "%s [-v] [-c config] [-l] [-t ct|vm]\n", progname);
	fprintf(stderr, "%s -h\n", progname);
	fprintf(stderr,"  Options:\n");
	fprintf(stderr,"    -h/--help           show usage and exit\n");
	fprintf(stderr,"    -v/--verbose        be verbose\n");
	fprintf(stderr,"    -c/--config <file>  config file (default %s)\n", MIG_CONF_FILE);
	fprintf(stderr,"    -l/--live           check live migration\n");
	fprintf(stderr,"    -t/--type <type>    instance type : ct or vm (default ct)\n");
}

static int parse_cmd_line(int argc, char *argv[])
{
	int c;
	struct option options[] =
	{
		{"verbose", no_argument, NULL, 'v'},
		{"config", required_argument, NULL, 'c'},
		{"live", no_argument, NULL, 'l'},
		{"type", required_argument, NULL, 't'},
		{"help", no_argument, NULL, 'h'},
		{ NULL, 0, NULL, 0 }
	};

	while (1)
	{
		c = getopt_long(argc, argv, "vc:lt:h", options, NULL);
		if (c == -1)
			break;
		switch (c)
		{
		case 'v':
			debug_level = LOG_DEBUG;
			break;
		case 'c':
			config = optarg;
			config_set = 1;
			break;
		case 'l':
			live = 1;
			break;
		case 't':
			if ((inst_type = instance_type_by_name(optarg)) < 0) {
				fprintf(stderr, "invalid instance type : %s\n", optarg);
				usage();
				exit(-MIG_ERR_USAGE);
			}
			break;
		case 'h':
			usage();
			exit(0);
		default:
			usage();
			exit(-MIG_ERR_USAGE);
		}
	}
	if (optind != argc) {
		usage();
		exit(-MIG_ERR_USAGE);
	}
	return 0;
}

int main(int argc, char *argv[])
{
	int rc;
	int level;
	int capable;
	std::string criu;
	std::string secret;
	boost::property_tree::ptree t, secrets;

	strncpy(progname, basename(argv[0]), sizeof(progname) - 1);
	INIT_BIN(LOG_INFO, BNAME_CHECK);

	parse_cmd_line(argc, argv);
	level = debug_level;

	if ((rc = mig_conf_load(config, config_set)))
		goto cleanup;
	/* command line wins */
	if (level == LOG_DEBUG)
		debug_level = level;
	if ((rc = mig_conf_apply()))
		goto cleanup;

	capable = check_live_migration_caps(&criu);
	t.put("type", instance_type_name(inst_type));
	t.put("live_capable", capable ? true : false);
	t.put("criu", criu);

	if (live && inst_type == INSTANCE_TYPE_CONTAINER && !capable) {
		rc = putErr(MIG_ERR_NO_LIVE_SOURCE, MIG_MSG_NO_LIVE_SOURCE,
			MIGoptions.criu_bin.c_str());
		goto cleanup;
	}

	for (int i = 0; i < CHANNEL_MAX; i++) {
		if (i == CHANNEL_STATE &&
				!(live && inst_type == INSTANCE_TYPE_CONTAINER))
			continue;
		if ((rc = gen_secret(secret))) {
			std::string err = getError();
			rc = putErr(rc, MIG_MSG_SECRET_SRC, channel_name(i),
				err.c_str());
			goto cleanup;
		}
		secrets.put(channel_name(i), secret);
	}
	t.put_child("secrets", secrets);

	boost::property_tree::json_parser::write_json(std::cout, t);

cleanup:
	if (rc)
		logger(LOG_ERR, "%s", getError());
	close_logger();
	return -rc;
}
