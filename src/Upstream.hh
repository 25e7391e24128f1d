//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_UPSTREAM_HH
#define _RECURSED_UPSTREAM_HH 1

#include <netinet/in.h>
#include <sys/select.h>
#include "SockServer.hh"
#include "Message.hh"

using vos::SockServer;
using vos::SockAddr;

namespace recursed {

/**
 * @class	: Upstream
 * @desc	: transport used by resolver to send a query to an upstream
 * name server and wait for its answer.
 *
 * `ask()` will send `query` to server at IPv4 `address` and decode the reply
 * into `answer`. It will return 0 on success, or RECURSED_E_TRANSPORT or
 * RECURSED_E_FORMAT on failure.
 */
class Upstream {
public:
	Upstream() {}
	virtual ~Upstream() {}

	virtual int ask(const char* address, Message* query
			, Message* answer) = 0;
private:
	Upstream(const Upstream&);
	void operator=(const Upstream&);
};

/**
 * @class	: UpstreamUDP
 * @attr	:
 *	- _port		: port of upstream server.
 *	- _timeout	: number of seconds to wait for reply.
 *	- _sock		: unbound UDP socket used to send and receive.
 *	- _fd_read	: descriptor set used by select().
 * @desc	: Upstream over UDP.
 */
class UpstreamUDP : public Upstream {
public:
	UpstreamUDP(const uint16_t port = RECURSED_DNS_PORT
		, const uint8_t timeout = RECURSED_DEF_TIMEOUT);
	~UpstreamUDP();

	int init();
	int ask(const char* address, Message* query, Message* answer);

	uint16_t	_port;
	uint8_t		_timeout;
	SockServer	_sock;
	fd_set		_fd_read;

	static const char* __cname;
private:
	UpstreamUDP(const UpstreamUDP&);
	void operator=(const UpstreamUDP&);

	int		_is_ready;

	int wait_answer(struct sockaddr_in* to, Message* query
			, Message* answer);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
