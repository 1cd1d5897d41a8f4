/* $Id$
 *
 * Copyright (c) SWsoft, 2006-2007
 *
 */
#ifndef __MIGRATECOM_H__
#define __MIGRATECOM_H__

#include <string>
#include <stack>
#include <boost/noncopyable.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include "instance.h"
#include "secret.h"
#include "barrier.h"
#include "migchannel.h"

#define START_STAGE() logger(LOG_DEBUG, "begin stage : %s", __FUNCTION__)
#define END_STAGE() logger(LOG_DEBUG, "end stage : %s", __FUNCTION__)

enum {
	SESSION_CONSTRUCTED = 0,
	SESSION_AWAITING_CHANNELS,
	SESSION_TRANSFERRING,
	SESSION_CLOSED_SUCCESS,
	SESSION_CLOSED_FAILED,
};

const char *session_state_name(int state);

/*
 * Log record of one session, built per session and passed by value
 * into every ctx_logger() call.
 */
struct MigrateLogCtx
{
	std::string project;
	std::string instance;
	std::string clusterMoveSourceName;
	bool live;
	bool push;

	MigrateLogCtx() : live(false), push(false) {}
};

void ctx_logger(MigrateLogCtx ctx, int level, const char *fmt, ...)
	__attribute__ ((format (printf, 3, 4)));

class MigrateSessionCommon : public MigrateChannels, private boost::noncopyable
{
public:
	// Cleaning functionality
	typedef int (*MigrateCleanFunc) (const void *, const void *);
	struct MCleanEntry
	{
		MigrateCleanFunc func;
		const void * arg1;
		const void * arg2;
	};
	typedef std::stack<MCleanEntry> CleanActions;
	// Actions on case of failure
	CleanActions CleanerErr;
	// Actions on case of success
	CleanActions CleanerSuccess;
	// Actions on any case
	CleanActions CleanerAny;

#define ERROR_CLEANER	0
#define SUCCESS_CLEANER	1
#define ANY_CLEANER	2

#define GETCLEANER(type) (((type) == ANY_CLEANER) ? CleanerAny : \
	(((type) == SUCCESS_CLEANER) ? CleanerSuccess : CleanerErr))

	int doCleaning(int type = ERROR_CLEANER);
	void delLastCleaner(int type = ERROR_CLEANER);
	void addCleaner(MigrateCleanFunc _func, const void * _arg1 = NULL,
	                const void * _arg2 = NULL, int type = ERROR_CLEANER);

	static int clean_disconnect(const void * arg, const void *);
	static int clean_notifyPeer(const void * arg, const void *);

public:
	virtual ~MigrateSessionCommon();

	/* secrets to hand over to the peer */
	const MigrateSecrets &getSecrets() const { return m_secrets; }

	/* bind inbound channel authenticated by <secret> */
	int connect(const std::string &secret, const MigrateConnPtr &conn);
	/* read channel secret from <conn>, bind and reply to the peer */
	int acceptConn(const MigrateConnPtr &conn);

	int controlSend(const MigrateControl &msg);
	int controlRecv(MigrateControl &msg);
	MigrateConn *filesystemConn();
	MigrateConn *stateConn();
	void disconnect();

	/* notify peer about failure, errors are ignored */
	void sendControl(int rc, const char *msg);

	int getState() const;
	bool isLive() const { return m_live; }
	bool hasStateChannel() const;
	/* mask of channels needed for transfer */
	unsigned getRequired() const;
	MigrateLogCtx logCtx() const;

protected:
	MigrateSessionCommon(
		InstanceObj *instance,
		bool instanceOnly,
		const std::string &clusterMoveSourceName,
		bool push);

	/* <fmt> takes channel name and error message */
	int mintSecret(int role, const char *fmt);
	/* for sessions waiting on inbound channels */
	void createBarrier();
	int waitChannels();
	/* bind outbound channel */
	int setConn(int role, const MigrateConnPtr &conn);
	MigrateConn *getConn(int role);
	void setState(int state);
	/* terminal transition: run cleaners, keep <rc> and its message */
	int finish(int rc);

protected:
	InstanceObj *m_instance;
	bool m_instanceOnly;
	bool m_live;
	bool m_push;
	std::string m_clusterMoveSourceName;
	MigrateSecrets m_secrets;
	boost::scoped_ptr<ChannelBarrier> m_barrier;

private:
	void adoptChannels();

	MigrateConnPtr m_conns[CHANNEL_MAX];
	bool m_closed[CHANNEL_MAX];
	bool m_disconnected;
	int m_state;
	int m_rc;
	mutable boost::mutex m_lock;
	boost::mutex m_sendLock;
	boost::mutex m_recvLock;
};

#endif
