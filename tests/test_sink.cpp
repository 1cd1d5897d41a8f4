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
#include <catch2/catch.hpp>

#include <sys/socket.h>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/thread.hpp>
#include <boost/bind.hpp>

#include "migratesrc.h"
#include "migratedst.h"
#include "fakes.h"

static MigrateSinkArgs push_args(InstanceObj *inst, bool live)
{
	MigrateSinkArgs args;

	args.instance = inst;
	args.push = true;
	args.live = live;
	return args;
}

static MigrateSinkArgs pull_args(InstanceObj *inst, MigrateDialer *dialer,
		const MigrateSecrets &secrets, bool live)
{
	MigrateSinkArgs args;

	args.instance = inst;
	args.push = false;
	args.live = live;
	args.url = "10.0.0.1:8443";
	args.dialer = dialer;
	args.secrets = secrets;
	return args;
}

static MigrateSecrets make_secrets(const char *c, const char *f, const char *s)
{
	MigrateSecrets secrets;

	secrets.control = c;
	secrets.filesystem = f;
	secrets.state = s;
	return secrets;
}

TEST_CASE("push sink mints fresh secrets", "[sink]")
{
	CriuGuard guard("sh");
	FakeInstance inst(INSTANCE_TYPE_CONTAINER, false);
	MigrateSessionSink *p = NULL;

	REQUIRE(new_migration_sink(push_args(&inst, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> s1(p);
	REQUIRE(s1->getSecrets().has(CHANNEL_CONTROL));
	REQUIRE(s1->getSecrets().has(CHANNEL_FILESYSTEM));
	REQUIRE_FALSE(s1->getSecrets().has(CHANNEL_STATE));
	REQUIRE(s1->getSecrets().control != s1->getSecrets().filesystem);

	REQUIRE(new_migration_sink(push_args(&inst, true), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> s2(p);
	REQUIRE(s2->getSecrets().has(CHANNEL_STATE));
	REQUIRE(s2->getSecrets().control != s1->getSecrets().control);
	REQUIRE(s2->getSecrets().state != s2->getSecrets().control);
	REQUIRE(s2->getSecrets().state != s2->getSecrets().filesystem);
	REQUIRE(s2->isLive());
}

TEST_CASE("pull sink needs control and filesystem secrets", "[sink]")
{
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	MigrateSecrets none;
	FakeDialer dialer(none);

	REQUIRE(new_migration_sink(pull_args(&inst, &dialer,
		make_secrets("", "f1", ""), false), &p) == MIG_ERR_USAGE);
	REQUIRE(std::string(getError()) == "Missing migration sink secret for control channel");
	REQUIRE(new_migration_sink(pull_args(&inst, &dialer,
		make_secrets("c1", "", ""), false), &p) == MIG_ERR_USAGE);
	REQUIRE(std::string(getError()) == "Missing migration sink secret for filesystem channel");
	REQUIRE(p == NULL);
}

TEST_CASE("live container sink without checkpoint tool", "[sink]")
{
	CriuGuard guard(NO_SUCH_CRIU);
	FakeInstance inst(INSTANCE_TYPE_CONTAINER, false);
	MigrateSessionSink *p = NULL;
	MigrateSecrets secrets = make_secrets("c1", "f1", "s1");
	FakeDialer dialer(secrets);

	REQUIRE(new_migration_sink(push_args(&inst, true), &p) == MIG_ERR_NO_LIVE_TARGET);
	/* state secret alone makes pull sink live */
	REQUIRE(new_migration_sink(pull_args(&inst, &dialer, secrets, false), &p) ==
		MIG_ERR_NO_LIVE_TARGET);
	REQUIRE(p == NULL);

	FakeInstance vm(INSTANCE_TYPE_VM, false);
	REQUIRE(new_migration_sink(push_args(&vm, true), &p) == 0);
	delete p;
}

TEST_CASE("pull sink without live transfer", "[sink]")
{
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	MigrateSecrets secrets = make_secrets("c1", "f1", "");
	FakeDialer dialer(secrets);
	InstanceOperation op;

	MigrateSinkArgs args = pull_args(&inst, &dialer, secrets, false);
	args.refresh = true;
	REQUIRE(new_migration_sink(args, &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);
	REQUIRE_FALSE(sink->isLive());

	REQUIRE(sink->Do(&op) == 0);
	REQUIRE(dialer.order.size() == 2);
	REQUIRE(dialer.order[0] == CHANNEL_CONTROL);
	REQUIRE(dialer.order[1] == CHANNEL_FILESYSTEM);
	REQUIRE(inst.receiveCalls == 1);
	REQUIRE(inst.hadFilesystem);
	REQUIRE_FALSE(inst.hadState);
	REQUIRE(inst.receiveArgs.instOp == &op);
	REQUIRE(inst.receiveArgs.refresh);
	REQUIRE_FALSE(inst.receiveArgs.live);
	REQUIRE(dialer.conns[0]->closes() == 1);
	REQUIRE(dialer.conns[1]->closes() == 1);
	REQUIRE(dialer.conns[0]->data().empty());
}

TEST_CASE("pull sink dials state channel last", "[sink]")
{
	CriuGuard guard("sh");
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	MigrateSecrets secrets = make_secrets("c1", "f1", "s1");
	FakeDialer dialer(secrets);

	REQUIRE(new_migration_sink(pull_args(&inst, &dialer, secrets, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);
	REQUIRE(sink->isLive());

	REQUIRE(sink->Do(NULL) == 0);
	REQUIRE(dialer.order.size() == 3);
	REQUIRE(dialer.order[0] == CHANNEL_CONTROL);
	REQUIRE(dialer.order[1] == CHANNEL_FILESYSTEM);
	REQUIRE(dialer.order[2] == CHANNEL_STATE);
	REQUIRE(inst.hadState);
	REQUIRE(inst.receiveArgs.live);
}

TEST_CASE("pull sink of live VM does not dial state channel", "[sink]")
{
	FakeInstance vm(INSTANCE_TYPE_VM, false);
	MigrateSessionSink *p = NULL;
	MigrateSecrets secrets = make_secrets("c1", "f1", "");
	FakeDialer dialer(secrets);

	REQUIRE(new_migration_sink(pull_args(&vm, &dialer, secrets, true), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);

	REQUIRE(sink->Do(NULL) == 0);
	REQUIRE(dialer.order.size() == 2);
	REQUIRE(vm.receiveArgs.live);
	REQUIRE_FALSE(vm.hadState);
}

TEST_CASE("pull sink control dial failure", "[sink]")
{
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	MigrateSecrets secrets = make_secrets("c1", "f1", "");
	FakeDialer dialer(secrets, 0);

	REQUIRE(new_migration_sink(pull_args(&inst, &dialer, secrets, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);

	REQUIRE(sink->Do(NULL) == MIG_ERR_CANT_CONNECT);
	REQUIRE(std::string(getError()) ==
		"Failed connecting migration control sink socket: connection refused");
	REQUIRE(dialer.order.size() == 1);
	REQUIRE(dialer.conns.empty());
	REQUIRE(inst.receiveCalls == 0);
	REQUIRE(sink->getState() == SESSION_CLOSED_FAILED);
}

TEST_CASE("pull sink later dial failure notifies peer", "[sink]")
{
	CriuGuard guard("sh");
	MigrateSecrets secrets = make_secrets("c1", "f1", "s1");
	int failAt = GENERATE(1, 2);
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	FakeDialer dialer(secrets, failAt);

	REQUIRE(new_migration_sink(pull_args(&inst, &dialer, secrets, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);

	REQUIRE(sink->Do(NULL) == MIG_ERR_CANT_CONNECT);
	REQUIRE(dialer.order.size() == (size_t)failAt + 1);
	REQUIRE(dialer.conns.size() == (size_t)failAt);
	REQUIRE(inst.receiveCalls == 0);

	/* error went over control, original error is kept */
	std::string sent = dialer.conns[0]->data();
	REQUIRE(sent.find("|-4|Failed connecting migration") == 0);
	REQUIRE(std::string(getError()).find("Failed connecting migration") == 0);

	for (size_t i = 0; i < dialer.conns.size(); i++)
		REQUIRE(dialer.conns[i]->closes() == 1);
}

TEST_CASE("pull sink does not accept inbound channels", "[sink]")
{
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	MigrateSecrets secrets = make_secrets("c1", "f1", "");
	FakeDialer dialer(secrets);

	REQUIRE(new_migration_sink(pull_args(&inst, &dialer, secrets, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);
	REQUIRE(sink->connect("c1", MigrateConnPtr(new FakeConn())) == MIG_ERR_INVALID_ARG);
}

TEST_CASE("push sink receives with bound channels", "[sink]")
{
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	FakeConnPtr c(new FakeConn()), f(new FakeConn());

	REQUIRE(new_migration_sink(push_args(&inst, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);

	REQUIRE(sink->connect(sink->getSecrets().control, c) == 0);
	REQUIRE(sink->connect(sink->getSecrets().filesystem, f) == 0);

	inst.rc = MIG_ERR_TRANSMISSION_FAILED;
	REQUIRE(sink->Do(NULL) == MIG_ERR_TRANSMISSION_FAILED);
	REQUIRE(std::string(getError()) == "Failed migration on target: driver failure");
	REQUIRE(inst.receiveCalls == 1);
	REQUIRE(c->closes() == 1);
	REQUIRE(f->closes() == 1);
}

TEST_CASE("push sink times out and closes bound channel", "[sink][timeout]")
{
	FakeInstance inst;
	MigrateSessionSink *p = NULL;
	FakeConnPtr c(new FakeConn());

	REQUIRE(new_migration_sink(push_args(&inst, false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);
	REQUIRE(sink->connect(sink->getSecrets().control, c) == 0);

	REQUIRE(sink->Do(NULL) == MIG_ERR_CONN_TIMEOUT);
	REQUIRE(std::string(getError()) == MIG_MSG_CONN_TIMEOUT);
	REQUIRE(inst.receiveCalls == 0);
	REQUIRE(c->closes() == 1);

	sink->disconnect();
	REQUIRE(c->closes() == 1);
}

TEST_CASE("scenario without live transfer: source secrets feed pull sink", "[sink]")
{
	FakeInstance srcInst(INSTANCE_TYPE_CONTAINER, false);
	FakeInstance dstInst(INSTANCE_TYPE_CONTAINER, false);
	MigrateSessionSrc *src = NULL;
	MigrateSessionSink *p = NULL;

	REQUIRE(new_migration_source(&srcInst, false, false, false, "", &src) == 0);
	boost::scoped_ptr<MigrateSessionSrc> source(src);
	REQUIRE_FALSE(source->getSecrets().has(CHANNEL_STATE));

	FakeDialer dialer(source->getSecrets());
	REQUIRE(new_migration_sink(pull_args(&dstInst, &dialer,
		source->getSecrets(), false), &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);
	REQUIRE_FALSE(sink->isLive());

	REQUIRE(sink->Do(NULL) == 0);
	REQUIRE(dstInst.receiveCalls == 1);
	REQUIRE_FALSE(dstInst.hadState);
}

/*
 * Both ends over loopback TCP: source accepts, sink dials.
 */
class PingInstance : public FakeInstance
{
public:
	int onSend(const MigrateSendArgs &args)
	{
		MigrateControl msg;
		int rc;

		if ((rc = args.channels->controlSend(MigrateControl(0, "ping"))))
			return rc;
		if ((rc = args.channels->controlRecv(msg)))
			return rc;
		reply = msg.message;
		return 0;
	}

	int onReceive(const MigrateReceiveArgs &args)
	{
		MigrateControl msg;
		int rc;

		if ((rc = args.channels->controlRecv(msg)))
			return rc;
		reply = msg.message;
		return args.channels->controlSend(MigrateControl(0, "pong"));
	}

	std::string reply;
};

static void accept_channels(MigrateSessionSrc *src, int lsock, int count, int *rc)
{
	*rc = 0;
	for (int i = 0; i < count && *rc == 0; i++) {
		int sock = accept(lsock, NULL, NULL);

		if (sock < 0) {
			*rc = MIG_ERR_SYSTEM;
			break;
		}
		*rc = src->acceptConn(MigrateConnPtr(new SockConn(sock)));
	}
}

static void run_source(MigrateSessionSrc *src, int *rc)
{
	*rc = src->Do();
}

TEST_CASE("migration over loopback sockets", "[sink][socket]")
{
	PingInstance srcInst, dstInst;
	MigrateSessionSrc *src = NULL;
	MigrateSessionSink *p = NULL;
	int lsock, port;
	int acceptRc = -1, srcRc = -1;
	char url[64];

	REQUIRE(listen_loopback(&lsock, &port) == 0);
	snprintf(url, sizeof(url), "127.0.0.1:%d", port);

	REQUIRE(new_migration_source(&srcInst, false, false, false, "", &src) == 0);
	boost::scoped_ptr<MigrateSessionSrc> source(src);

	SockDialer dialer(5);
	MigrateSinkArgs args = pull_args(&dstInst, &dialer, source->getSecrets(), false);
	args.url = url;
	REQUIRE(new_migration_sink(args, &p) == 0);
	boost::scoped_ptr<MigrateSessionSink> sink(p);

	boost::thread acceptor(boost::bind(accept_channels, src, lsock, 2, &acceptRc));
	boost::thread sender(boost::bind(run_source, src, &srcRc));

	int rc = sink->Do(NULL);
	acceptor.join();
	sender.join();
	close(lsock);

	REQUIRE(acceptRc == 0);
	REQUIRE(rc == 0);
	REQUIRE(srcRc == 0);
	REQUIRE(dstInst.reply == "ping");
	REQUIRE(srcInst.reply == "pong");
}
