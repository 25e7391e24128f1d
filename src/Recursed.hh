//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#ifndef _RECURSED_RECURSED_HH
#define _RECURSED_RECURSED_HH 1

#include "Config.hh"
#include "File.hh"
#include "Recursor.hh"

using vos::Config;
using vos::File;

namespace recursed {

#define	RECURSED_CONF		"recursed.cfg"
#define	RECURSED_CONF_HEAD	"RECURSED"
#define	RECURSED_CONF_LOG	"LOG"
#define	RECURSED_LOG		"recursed.log"
#define	RECURSED_PID		"recursed.pid"

#define	RECURSED_DEF_LISTEN	"127.0.0.1:53"
#define	RECURSED_DEF_PREFETCH	"com, org, net, edu, gov, mil"
#define	RECURSED_DEF_DEBUG	0

#define	RECURSED_DEF_LOG_SHOW_TS	0
#define	RECURSED_DEF_LOG_SHOW_STAMP	0
#define	RECURSED_DEF_STAMP		"[recursed] "

/**
 * @class		: Recursed
 * @attr		:
 *	- _flog		: path to log file.
 *	- _fpid		: path to PID file.
 *	- _fhints	: path to root hints file, empty for built-in hints.
 *	- _listen_addr	: address where server listen for query.
 *	- _listen_port	: port where server listen for query.
 *	- _prefetch	: list of TLD, separated by comma, to be resolved at
 *			  start.
 *	- _timeout	: select() tick and upstream timeout, in seconds.
 *	- _cache	: zone cache.
 *	- _upstream	: UDP transport to upstream servers.
 *	- _recursor	: resolver engine, use `_cache` and `_upstream`.
 *	- _srvr_udp	: listening socket.
 * @desc		: recursive DNS server.
 */
class Recursed : public Object {
public:
	Recursed();
	~Recursed();

	int init(const char* fconf);
	int config_parse_server_listen(Config* cfg);
	int load_config(const char* fconf);
	int load_hints();
	void prefetch();
	int bind();

	int run();
	int process(const char* bfr, const int len, Buffer* reply);

	void exit();

	Buffer		_flog;
	Buffer		_fpid;
	Buffer		_fhints;
	Buffer		_listen_addr;
	uint16_t	_listen_port;
	Buffer		_prefetch;
	uint8_t		_timeout;

	ZoneCache	_cache;
	UpstreamUDP	_upstream;
	Recursor	_recursor;

	SockServer	_srvr_udp;
	fd_set		_fd_all;
	fd_set		_fd_read;

	int		_show_timestamp;
	int		_show_appstamp;

	static const char* __cname;
private:
	Recursed(const Recursed&);
	void operator=(const Recursed&);
};

} /* namespace::recursed */

#endif
// vi: ts=8 sw=8 tw=78:
