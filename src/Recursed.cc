//
// Copyright 2009-2017 M. Shulhan (ms@kilabit.info). All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include "Recursed.hh"

namespace recursed {

const char* Recursed::__cname = "Recursed";

Recursed::Recursed()
: Object()
, _flog()
, _fpid()
, _fhints()
, _listen_addr()
, _listen_port(RECURSED_DNS_PORT)
, _prefetch()
, _timeout(RECURSED_DEF_TIMEOUT)
, _cache()
, _upstream()
, _recursor(&_cache, &_upstream)
, _srvr_udp()
, _fd_all()
, _fd_read()
, _show_timestamp(RECURSED_DEF_LOG_SHOW_TS)
, _show_appstamp(RECURSED_DEF_LOG_SHOW_STAMP)
{
	FD_ZERO(&_fd_all);
	FD_ZERO(&_fd_read);
}

Recursed::~Recursed()
{}

/**
 * @method	: Recursed::init()
 * @param	:
 *	> fconf : config file to read.
 * @return	:
 *	< 0	: success.
 *	< -1	: fail.
 * @desc	: initialize Recursed object: load configuration, open log,
 * write PID file, load root hints, create listening socket, and prefetch
 * the top level domains.
 */
int Recursed::init(const char* fconf)
{
	int s = load_config(fconf);
	if (s != 0) {
		return -1;
	}

	// Open log file with maximum size to 2MB
	s = dlog.open(_flog.v(), 2048000
		, _show_appstamp ? RECURSED_DEF_STAMP : ""
		, _show_timestamp);
	if (s != 0) {
		return -1;
	}

	s = File::WRITE_PID(_fpid.chars());
	if (s != 0) {
		dlog.er("%s: PID file exist"
			", recursed process may already running.\n"
			, __cname);
		_fpid.reset();
		return -1;
	}

	srandom((unsigned int) time(NULL) ^ (unsigned int) getpid());

	s = load_hints();
	if (s != 0) {
		return -1;
	}

	s = bind();
	if (s != 0) {
		return -1;
	}

	prefetch();

	return 0;
}

//
// `config_parse_server_listen()` will get "server.listen" from user
// configuration and parse their value to get listen address and port.
//
// (1) If no port is set, then default port will be used.
//
int Recursed::config_parse_server_listen(Config* cfg)
{
	int s;
	long int li_port = 0;
	List* addr_port = NULL;
	Buffer* addr = NULL;
	Buffer* port = NULL;

	const char* v = cfg->get(RECURSED_CONF_HEAD, "server.listen"
				, RECURSED_DEF_LISTEN);
	s = _listen_addr.copy_raw(v);
	if (s != 0) {
		return -1;
	}

	addr_port = _listen_addr.split_by_char(':', 1);
	if (!addr_port) {
		return -1;
	}

	// (1)
	if (addr_port->size() == 1) {
		_listen_port = RECURSED_DNS_PORT;
		goto out;
	}

	addr = (Buffer*) addr_port->at(0);
	port = (Buffer*) addr_port->at(1);

	_listen_addr.copy(addr);
	s = port->to_lint(&li_port);
	if (s != 0 || li_port <= 0 || li_port > 65535) {
		_listen_port = RECURSED_DNS_PORT;
	} else {
		_listen_port = (uint16_t) li_port;
	}

out:
	delete addr_port;

	return 0;
}

/**
 * @method	: Recursed::load_config
 * @param	:
 *	> fconf : config file to read.
 * @return	:
 *	< 0	: success.
 *	< -1	: fail.
 * @desc	: get user configuration from file.
 */
int Recursed::load_config(const char* fconf)
{
	int		s	= 0;
	long int	hops	= 0;
	long int	timeout	= 0;
	Config		cfg;
	const char*	v	= NULL;

	_running = 1;

	if (!fconf) {
		fconf = RECURSED_CONF;
	}

	dlog.out("%s: loading config '%s'\n", __cname, fconf);

	s = cfg.load(fconf);
	if (s < 0) {
		dlog.er("%s: cannot open config file '%s'!", __cname, fconf);
		return -1;
	}

	v = cfg.get(RECURSED_CONF_HEAD, "file.log", RECURSED_LOG);
	s = _flog.copy_raw(v);
	if (s != 0) {
		return -1;
	}

	v = cfg.get(RECURSED_CONF_HEAD, "file.pid", RECURSED_PID);
	s = _fpid.copy_raw(v);
	if (s != 0) {
		return -1;
	}

	v = cfg.get(RECURSED_CONF_HEAD, "file.hints", "");
	_fhints.reset();
	if (v && v[0]) {
		s = _fhints.copy_raw(v);
		if (s != 0) {
			return -1;
		}
	}

	s = config_parse_server_listen(&cfg);
	if (s != 0) {
		return -1;
	}

	timeout = cfg.get_number(RECURSED_CONF_HEAD, "server.timeout"
				, RECURSED_DEF_TIMEOUT);
	if (timeout <= 0 || timeout > 255) {
		timeout = RECURSED_DEF_TIMEOUT;
	}
	_timeout = (uint8_t) timeout;
	_upstream._timeout = _timeout;

	v = cfg.get(RECURSED_CONF_HEAD, "server.prefetch"
			, RECURSED_DEF_PREFETCH);
	_prefetch.reset();
	if (v && v[0]) {
		s = _prefetch.copy_raw(v);
		if (s != 0) {
			return -1;
		}
	}

	hops = cfg.get_number(RECURSED_CONF_HEAD, "resolver.max_hops"
				, RECURSED_DEF_MAX_HOPS);
	if (hops <= 0) {
		hops = RECURSED_DEF_MAX_HOPS;
	}
	_recursor._max_hops = (int) hops;

	_dbg = (int) cfg.get_number(RECURSED_CONF_HEAD, "debug"
					, RECURSED_DEF_DEBUG);
	if (_dbg < 0) {
		_dbg = RECURSED_DEF_DEBUG;
	}

	_show_timestamp = (int) cfg.get_number(RECURSED_CONF_LOG
						, "show_timestamp"
						, RECURSED_DEF_LOG_SHOW_TS);

	_show_appstamp = (int) cfg.get_number(RECURSED_CONF_LOG
					, "show_appstamp"
					, RECURSED_DEF_LOG_SHOW_STAMP);

	/* environment variable replace value in config file */
	v	= getenv("RECURSED_DEBUG");
	_dbg	= (!v) ? _dbg : atoi(v);

	if (DBG_LVL_IS_1) {
		dlog.er("%s: pid file          : %s\n", __cname, _fpid.v());
		dlog.er("%s: log file          : %s\n", __cname, _flog.v());
		dlog.er("%s: hints file        : %s\n", __cname
			, _fhints.is_empty() ? "(built-in)" : _fhints.v());
		dlog.er("%s: listening on      : %s:%d\n", __cname
			, _listen_addr.v(), _listen_port);
		dlog.er("%s: timeout           : %d seconds\n", __cname
			, _timeout);
		dlog.er("%s: prefetch          : %s\n", __cname
			, _prefetch.is_empty() ? "" : _prefetch.v());
		dlog.er("%s: maximum hops      : %d\n", __cname
			, _recursor._max_hops);
		dlog.er("%s: debug level       : %d\n", __cname, _dbg);
		dlog.er("%s: show timestamp    : %d\n", __cname, _show_timestamp);
		dlog.er("%s: show stamp        : %d\n", __cname, _show_appstamp);
	}

	return 0;
}

/**
 * `load_hints()` will load root hints from `file.hints` or, if it is not
 * set or can not be loaded, from built-in root hints.
 */
int Recursed::load_hints()
{
	int s = -1;

	if (!_fhints.is_empty()) {
		s = _cache.load_hints(_fhints.v());
	}
	if (s != 0) {
		s = _cache.load_default_hints();
	}

	if (DBG_LVL_IS_3) {
		_cache.dump();
	}

	return s;
}

/**
 * `prefetch()` will resolve the NS records of each top level domain in
 * `server.prefetch`, so the delegation of common domains is cached before
 * the first query. Failure is logged and ignored.
 */
void Recursed::prefetch()
{
	int s = 0;
	Buffer tld;
	Buffer* c = NULL;
	List* tlds = NULL;
	List answers;
	List additional;

	if (_prefetch.is_empty()) {
		return;
	}

	tlds = _prefetch.split_by_char(',', 1);
	if (!tlds) {
		return;
	}

	for (int x = 0; x < tlds->size() && _running; x++) {
		c = (Buffer*) tlds->at(x);

		RR::NORMALIZE_NAME(&tld, c->chars());
		if (tld.is_empty()) {
			continue;
		}

		s = _recursor.query(RR_T_NS, tld.v(), 1, &answers
					, &additional);

		if (s == RECURSOR_OK) {
			if (DBG_LVL_IS_1) {
				dlog.out("%8s: %s (%d records)\n", TAG_PREFETCH
					, tld.v(), answers.size());
			}
		} else {
			dlog.er("%s: fail to prefetch '%s'\n", __cname
				, tld.v());
		}

		list_clear(&answers);
		list_clear(&additional);
	}

	delete tlds;

	if (DBG_LVL_IS_3) {
		_cache.dump();
	}
}

/**
 * @method	: Recursed::bind
 * @return	:
 *	< 0	: success.
 *	< -1	: fail.
 * @desc	: create the upstream socket and start listening for client
 * queries.
 */
int Recursed::bind()
{
	if (!_running) {
		return 0;
	}

	int s = _upstream.init();
	if (s != 0) {
		return -1;
	}

	s = _srvr_udp.create_udp();
	if (s != 0) {
		return -1;
	}

	s = _srvr_udp.bind(_listen_addr.v(), _listen_port);
	if (s != 0) {
		dlog.er("%s: cannot bind to %s:%d!\n", __cname
			, _listen_addr.v(), _listen_port);
		return -1;
	}

	FD_ZERO(&_fd_all);
	FD_ZERO(&_fd_read);

	FD_SET(_srvr_udp._d, &_fd_all);

	dlog.out("%s: listening on %s:%d.\n", __cname, _listen_addr.v()
		, _listen_port);

	return 0;
}

/**
 * @method	: Recursed::run
 * @return	:
 *	< 0	: success.
 *	< -1	: fail.
 * @desc	: run Recursed service. Each query is resolved completely
 * before the next one is read.
 */
int Recursed::run()
{
	int			s	= 0;
	ssize_t			len	= 0;
	struct timeval		timeout;
	struct sockaddr_in	addr;
	Buffer			reply;

	while (_running) {
		_fd_read	= _fd_all;
		timeout.tv_sec	= _timeout;
		timeout.tv_usec	= 0;

		s = select(FD_SETSIZE, &_fd_read, NULL, NULL, &timeout);
		if (s <= 0) {
			if (EINTR == errno) {
				s = 0;
				break;
			}
			continue;
		}

		if (!FD_ISSET(_srvr_udp._d, &_fd_read)) {
			continue;
		}

		if (DBG_LVL_IS_2) {
			dlog.out("%s: read server udp.\n", __cname);
		}

		memset(&addr, 0, sizeof(addr));

		len = _srvr_udp.recv_udp(&addr);
		if (len <= 0) {
			dlog.er("%s: error at receiving UDP packet!\n"
				, __cname);
			continue;
		}

		reply.reset();

		s = process(_srvr_udp.v(), (int) _srvr_udp.len(), &reply);
		if (s != 0) {
			continue;
		}

		if (_srvr_udp.send_udp(&addr, &reply) < 0) {
			dlog.er("%s: error at sending UDP packet!\n"
				, __cname);
		}
	}

	if (DBG_LVL_IS_1) {
		dlog.er("%s: service stopped ...\n", __cname);
	}

	return s;
}

/**
 * @method	: Recursed::process
 * @param	:
 *	> bfr	: query in wire format.
 *	> len	: length of `bfr`.
 *	> reply	: return value, the reply in wire format.
 * @return	:
 *	< 0	: success, `reply` should be sent to client.
 *	< -1	: datagram is dropped.
 * @desc	: resolve all questions in query and create the reply.
 *
 * (1) Datagram that can not be decoded but has complete header is replied
 * with FORMERR.
 * (2) Records in query, e.g. EDNS OPT, is not echoed back.
 * (3) Any failure make the reply SERVFAIL without any answer.
 */
int Recursed::process(const char* bfr, const int len, Buffer* reply)
{
	int s = 0;
	uint16_t id = 0;
	RR* q = NULL;
	const char* name = NULL;
	Message msg;

	reply->reset();

	s = msg.unpack(bfr, len);
	if (s != 0) {
		if (len < RECURSED_HEADER_SIZE) {
			return -1;
		}

		// (1)
		id = (uint16_t) ((((unsigned char) bfr[0]) << 8)
				| ((unsigned char) bfr[1]));

		if (DBG_LVL_IS_1) {
			dlog.out("%8s: id %d, %d bytes\n", TAG_FORMERR, id
				, len);
		}

		return Message::PACK_HEADER_ERROR(reply, id, RCODE_FORMERR);
	}

	if (msg._is_response) {
		return -1;
	}

	// (2)
	list_clear(&msg._answ);
	list_clear(&msg._auth);
	list_clear(&msg._addt);

	msg._is_response = 1;
	msg._ra = 1;
	msg._rcode = RCODE_NOERROR;

	for (int x = 0; x < msg._qstn.size(); x++) {
		q = (RR*) msg._qstn.at(x);
		name = q->_name.is_empty() ? "" : q->_name.v();

		if (DBG_LVL_IS_1) {
			dlog.out("%8s: %3d %s\n", TAG_QUERY, q->_type, name);
		}

		s = _recursor.query(q->_type, name, msg._rd, &msg._answ
					, &msg._addt);

		// (3)
		if (s == RECURSOR_FAIL) {
			msg._rcode = RCODE_SERVFAIL;
			list_clear(&msg._answ);
			list_clear(&msg._addt);
			break;
		}
	}

	s = msg.pack(reply);
	if (s != 0) {
		dlog.er("%s: fail to pack reply for id %d\n", __cname
			, msg._id);

		if (DBG_LVL_IS_1) {
			dlog.out("%8s: id %d, reply too large or invalid\n"
				, TAG_SERVFAIL, msg._id);
		}

		return Message::PACK_HEADER_ERROR(reply, msg._id
						, RCODE_SERVFAIL);
	}

	return 0;
}

/**
 * @method	: Recursed::exit
 * @desc	: stop the service and remove the PID file.
 */
void Recursed::exit()
{
	_running = 0;

	if (!_fpid.is_empty()) {
		unlink(_fpid.v());
	}
}

} /* namespace::recursed */
// vi: ts=8 sw=8 tw=78:
